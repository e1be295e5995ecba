/**
 * @file parallel_morphisms.hpp
 * @brief Families of parallel morphisms.
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/category_traits.hpp"
#include "freediag/common/diagram_enums.hpp"
#include "freediag/common/diagram_exceptions.hpp"

namespace freediag
{

/**
 * @brief Morphisms sharing both domain and codomain.
 *
 * @details
 * A limit of this shape is an equalizer, a colimit a coequalizer. The common
 * two-morphism case is the `ParallelPair` alias, built with
 * `make_parallel_pair()`.
 *
 * @par Invariants
 * - `homs()` is non-empty.
 * - Every hom has domain `dom()` and codomain `codom()`, when built from homs
 *   alone or via `make_parallel_pair()`.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
class ParallelMorphisms
{
public:
    using Ob = typename Traits::Ob;
    using value_type = Hom;
    using const_iterator = typename std::vector<Hom>::const_iterator;

    /**
     * @brief Construct from explicit endpoints and homs, without checking them.
     * @throw DiagramError with `ShapeMismatch` if `homs` is empty.
     */
    ParallelMorphisms(Ob dom, Ob codom, std::vector<Hom> homs)
        : m_homs(require_nonempty(std::move(homs)))
        , m_dom(std::move(dom))
        , m_codom(std::move(codom))
    {
    }

    /**
     * @brief Construct from homs alone, deriving the common domain and codomain.
     * @throw DiagramError with `ShapeMismatch` if `homs` is empty, or if the
     *        domains or the codomains disagree. The message says which, and
     *        lists the disagreeing positions.
     */
    explicit ParallelMorphisms(std::vector<Hom> homs)
        : m_homs(require_parallel(std::move(homs)))
        , m_dom(Traits::dom(m_homs.front()))
        , m_codom(Traits::codom(m_homs.front()))
    {
    }

    const Ob& dom() const noexcept
    {
        return m_dom;
    }

    const Ob& codom() const noexcept
    {
        return m_codom;
    }

    const std::vector<Hom>& homs() const noexcept
    {
        return m_homs;
    }

    /// Same as `homs()`.
    const std::vector<Hom>& hom() const noexcept
    {
        return m_homs;
    }

    /**
     * @brief Get a hom by position.
     * @throw DiagramError with `IndexOutOfRange` if `idx >= size()`.
     */
    const Hom& at(LegIdx idx) const
    {
        if (idx >= m_homs.size())
        {
            throw DiagramError(
                DiagramErrorCode::IndexOutOfRange,
                "Hom index " + std::to_string(idx) + " out of range [0, " +
                    std::to_string(m_homs.size()) + ")");
        }
        return m_homs[idx];
    }

    /// Bounds-checked, same as `at()`.
    const Hom& operator[](LegIdx idx) const
    {
        return at(idx);
    }

    LegIdx first_index() const noexcept
    {
        return 0;
    }

    LegIdx last_index() const noexcept
    {
        return m_homs.size() - 1;
    }

    size_t size() const noexcept
    {
        return m_homs.size();
    }

    bool is_pair() const noexcept
    {
        return m_homs.size() == 2;
    }

    const_iterator begin() const noexcept
    {
        return m_homs.begin();
    }

    const_iterator end() const noexcept
    {
        return m_homs.end();
    }

    friend bool operator==(const ParallelMorphisms& a, const ParallelMorphisms& b)
    {
        return a.m_dom == b.m_dom && a.m_codom == b.m_codom && a.m_homs == b.m_homs;
    }

    friend bool operator!=(const ParallelMorphisms& a, const ParallelMorphisms& b)
    {
        return !(a == b);
    }

private:
    static std::vector<Hom> require_nonempty(std::vector<Hom> homs)
    {
        if (homs.empty())
        {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "Parallel morphisms must have at least one hom");
        }
        return homs;
    }

    static std::vector<Hom> require_parallel(std::vector<Hom> homs)
    {
        homs = require_nonempty(std::move(homs));
        auto bad_dom = detail::mismatched_positions(
            homs, [](const Hom& f) { return Traits::dom(f); });
        auto bad_codom = detail::mismatched_positions(
            homs, [](const Hom& f) { return Traits::codom(f); });
        if (bad_dom.empty() && bad_codom.empty())
        {
            return homs;
        }

        std::string message = "Parallel morphisms do not match:";
        if (!bad_dom.empty())
        {
            message += " domains of hom(s) " + detail::join_indices(bad_dom) +
                       " differ from hom 0;";
        }
        if (!bad_codom.empty())
        {
            message += " codomains of hom(s) " + detail::join_indices(bad_codom) +
                       " differ from hom 0;";
        }
        message.pop_back();
        throw DiagramError(DiagramErrorCode::ShapeMismatch, message);
    }

    std::vector<Hom> m_homs;
    Ob m_dom;
    Ob m_codom;
};

template <typename Hom, typename Traits = CategoryTraits<Hom>>
using ParallelPair = ParallelMorphisms<Hom, Traits>;

/**
 * @brief Build a parallel pair, checking domains and codomains separately.
 * @throw DiagramError with `ShapeMismatch` naming the domains, the codomains,
 *        or both, whichever disagree.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
ParallelPair<Hom, Traits> make_parallel_pair(const Hom& first, const Hom& last)
{
    const bool dom_ok = Traits::dom(first) == Traits::dom(last);
    const bool codom_ok = Traits::codom(first) == Traits::codom(last);
    if (!dom_ok && !codom_ok)
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Domains and codomains of parallel pair do not match");
    }
    if (!dom_ok)
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Domains of parallel pair do not match");
    }
    if (!codom_ok)
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Codomains of parallel pair do not match");
    }
    return ParallelPair<Hom, Traits>(
        Traits::dom(first), Traits::codom(first), std::vector<Hom>{first, last});
}

} // namespace freediag
