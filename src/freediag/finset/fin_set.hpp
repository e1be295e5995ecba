/**
 * @file fin_set.hpp
 * @brief The category of finite sets and functions.
 */
#pragma once
#include "freediag/common/common.hpp"

#include <ostream>

namespace freediag
{

/**
 * @brief A finite set {0, ..., n-1}, identified by its size.
 */
struct FinSet
{
    size_t n{0};

    FinSet() = default;

    explicit FinSet(size_t size)
        : n(size)
    {
    }

    size_t size() const noexcept
    {
        return n;
    }

    friend bool operator==(const FinSet& a, const FinSet& b) noexcept
    {
        return a.n == b.n;
    }

    friend bool operator!=(const FinSet& a, const FinSet& b) noexcept
    {
        return a.n != b.n;
    }
};

std::ostream& operator<<(std::ostream& os, const FinSet& set);

/**
 * @brief A function between finite sets, stored as its table of values.
 *
 * @par Invariants
 * - `values().size() == dom().size()`
 * - every value is `< codom().size()`
 */
class FinFunction
{
public:
    /**
     * @brief Construct from a value table and codomain; the domain is the table size.
     * @throw DiagramError with `InvalidMorphism` if a value is out of the codomain.
     */
    FinFunction(const std::vector<size_t>& values, FinSet codom);

    /**
     * @brief Construct with an explicit domain.
     * @throw DiagramError with `InvalidMorphism` if the table size differs from
     *        the domain size or a value is out of the codomain.
     */
    FinFunction(FinSet dom, FinSet codom, std::vector<size_t> values);

    /**
     * @brief The identity function on a set.
     */
    static FinFunction identity(FinSet set);

    const FinSet& dom() const noexcept
    {
        return m_dom;
    }

    const FinSet& codom() const noexcept
    {
        return m_codom;
    }

    const std::vector<size_t>& values() const noexcept
    {
        return m_values;
    }

    /**
     * @brief Evaluate at an element of the domain.
     * @throw DiagramError with `IndexOutOfRange` if `i >= dom().size()`.
     */
    size_t operator()(size_t i) const;

    friend bool operator==(const FinFunction& a, const FinFunction& b) noexcept
    {
        return a.m_dom == b.m_dom && a.m_codom == b.m_codom && a.m_values == b.m_values;
    }

    friend bool operator!=(const FinFunction& a, const FinFunction& b) noexcept
    {
        return !(a == b);
    }

private:
    FinSet m_dom;
    FinSet m_codom;
    std::vector<size_t> m_values;
};

/**
 * @brief Composite in diagrammatic order: first `f`, then `g`.
 * @throw DiagramError with `ShapeMismatch` if `codom(f) != dom(g)`.
 */
FinFunction compose(const FinFunction& f, const FinFunction& g);

std::ostream& operator<<(std::ostream& os, const FinFunction& f);

} // namespace freediag
