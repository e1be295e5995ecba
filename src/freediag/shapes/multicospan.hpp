/**
 * @file multicospan.hpp
 * @brief Multicospans and cospans of morphisms.
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/category_traits.hpp"
#include "freediag/common/diagram_enums.hpp"
#include "freediag/common/diagram_exceptions.hpp"

namespace freediag
{

/**
 * @brief A family of morphisms into a common base.
 *
 * @details
 * Dual of `Multispan`. A limit of this shape is a pullback. The two-legged
 * case is the `Cospan` alias, built with `make_cospan()`.
 *
 * @par Invariants
 * - `legs()` is non-empty.
 * - `Traits::codom(leg) == base()` for every leg, when built from legs alone
 *   or via `make_cospan()`. The `(base, legs)` constructor trusts its input.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
class Multicospan
{
public:
    using Ob = typename Traits::Ob;
    using value_type = Hom;
    using const_iterator = typename std::vector<Hom>::const_iterator;

    /**
     * @brief Construct from an explicit base and legs, without checking codomains.
     * @throw DiagramError with `ShapeMismatch` if `legs` is empty.
     */
    Multicospan(Ob base, std::vector<Hom> legs)
        : m_legs(require_nonempty(std::move(legs)))
        , m_base(std::move(base))
    {
    }

    /**
     * @brief Construct from legs alone; the base is their common codomain.
     * @throw DiagramError with `ShapeMismatch` if `legs` is empty or the
     *        codomains disagree.
     */
    explicit Multicospan(std::vector<Hom> legs)
        : m_legs(require_common_codomain(std::move(legs)))
        , m_base(Traits::codom(m_legs.front()))
    {
    }

    const Ob& base() const noexcept
    {
        return m_base;
    }

    const std::vector<Hom>& legs() const noexcept
    {
        return m_legs;
    }

    /**
     * @brief Get a leg by position.
     * @throw DiagramError with `IndexOutOfRange` if `idx >= size()`.
     */
    const Hom& leg(LegIdx idx) const
    {
        if (idx >= m_legs.size())
        {
            throw DiagramError(
                DiagramErrorCode::IndexOutOfRange,
                "Leg index " + std::to_string(idx) + " out of range [0, " +
                    std::to_string(m_legs.size()) + ")");
        }
        return m_legs[idx];
    }

    const Hom& left() const
    {
        return leg(0);
    }

    const Hom& right() const
    {
        return leg(1);
    }

    size_t size() const noexcept
    {
        return m_legs.size();
    }

    bool is_cospan() const noexcept
    {
        return m_legs.size() == 2;
    }

    const_iterator begin() const noexcept
    {
        return m_legs.begin();
    }

    const_iterator end() const noexcept
    {
        return m_legs.end();
    }

    friend bool operator==(const Multicospan& a, const Multicospan& b)
    {
        return a.m_base == b.m_base && a.m_legs == b.m_legs;
    }

    friend bool operator!=(const Multicospan& a, const Multicospan& b)
    {
        return !(a == b);
    }

private:
    static std::vector<Hom> require_nonempty(std::vector<Hom> legs)
    {
        if (legs.empty())
        {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "Multicospan must have at least one leg");
        }
        return legs;
    }

    static std::vector<Hom> require_common_codomain(std::vector<Hom> legs)
    {
        legs = require_nonempty(std::move(legs));
        auto mismatched = detail::mismatched_positions(
            legs, [](const Hom& f) { return Traits::codom(f); });
        if (!mismatched.empty())
        {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "Codomains of legs of multicospan do not match: leg(s) " +
                    detail::join_indices(mismatched) + " differ from leg 0");
        }
        return legs;
    }

    std::vector<Hom> m_legs;
    Ob m_base;
};

template <typename Hom, typename Traits = CategoryTraits<Hom>>
using Cospan = Multicospan<Hom, Traits>;

/**
 * @brief Build a cospan from two morphisms with a common codomain.
 * @throw DiagramError with `ShapeMismatch` if the codomains differ.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
Cospan<Hom, Traits> make_cospan(const Hom& left, const Hom& right)
{
    if (!(Traits::codom(left) == Traits::codom(right)))
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Codomains of legs of cospan do not match: left (leg 0) vs right (leg 1)");
    }
    return Cospan<Hom, Traits>(Traits::codom(left), std::vector<Hom>{left, right});
}

} // namespace freediag
