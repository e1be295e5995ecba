/**
 * @file multispan.hpp
 * @brief Multispans and spans of morphisms.
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/category_traits.hpp"
#include "freediag/common/diagram_enums.hpp"
#include "freediag/common/diagram_exceptions.hpp"

namespace freediag
{

/**
 * @brief A family of morphisms out of a common apex.
 *
 * @details
 * A multispan is like a span except that it may have any positive number of
 * legs. A colimit of this shape is a pushout. The two-legged case is the
 * `Span` alias, built with `make_span()` and read through `left()` and
 * `right()`.
 *
 * @par Invariants
 * - `legs()` is non-empty.
 * - `Traits::dom(leg) == apex()` for every leg, when built from legs alone or
 *   via `make_span()`. The `(apex, legs)` constructor trusts its input.
 *
 * @par Lifecycle
 * Immutable once constructed. Copies are independent values.
 *
 * @tparam Hom Morphism type.
 * @tparam Traits Morphism capability, see `CategoryTraits`.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
class Multispan
{
public:
    using Ob = typename Traits::Ob;
    using value_type = Hom;
    using const_iterator = typename std::vector<Hom>::const_iterator;

    /**
     * @brief Construct from an explicit apex and legs, without checking domains.
     * @throw DiagramError with `ShapeMismatch` if `legs` is empty.
     */
    Multispan(Ob apex, std::vector<Hom> legs)
        : m_legs(require_nonempty(std::move(legs)))
        , m_apex(std::move(apex))
    {
    }

    /**
     * @brief Construct from legs alone; the apex is their common domain.
     * @throw DiagramError with `ShapeMismatch` if `legs` is empty or if any
     *        leg's domain differs from that of leg 0. The message lists every
     *        disagreeing leg.
     */
    explicit Multispan(std::vector<Hom> legs)
        : m_legs(require_common_domain(std::move(legs)))
        , m_apex(Traits::dom(m_legs.front()))
    {
    }

    const Ob& apex() const noexcept
    {
        return m_apex;
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

    /// First leg.
    const Hom& left() const
    {
        return leg(0);
    }

    /// Second leg.
    const Hom& right() const
    {
        return leg(1);
    }

    size_t size() const noexcept
    {
        return m_legs.size();
    }

    /**
     * @brief Whether this multispan has exactly two legs.
     */
    bool is_span() const noexcept
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

    friend bool operator==(const Multispan& a, const Multispan& b)
    {
        return a.m_apex == b.m_apex && a.m_legs == b.m_legs;
    }

    friend bool operator!=(const Multispan& a, const Multispan& b)
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
                "Multispan must have at least one leg");
        }
        return legs;
    }

    static std::vector<Hom> require_common_domain(std::vector<Hom> legs)
    {
        legs = require_nonempty(std::move(legs));
        auto mismatched = detail::mismatched_positions(
            legs, [](const Hom& f) { return Traits::dom(f); });
        if (!mismatched.empty())
        {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "Domains of legs of multispan do not match: leg(s) " +
                    detail::join_indices(mismatched) + " differ from leg 0");
        }
        return legs;
    }

    // m_legs is declared first: the apex is derived from it.
    std::vector<Hom> m_legs;
    Ob m_apex;
};

/**
 * @brief A multispan with exactly two legs.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
using Span = Multispan<Hom, Traits>;

/**
 * @brief Build a span from two morphisms with a common domain.
 * @throw DiagramError with `ShapeMismatch` if the domains differ.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
Span<Hom, Traits> make_span(const Hom& left, const Hom& right)
{
    if (!(Traits::dom(left) == Traits::dom(right)))
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Domains of legs of span do not match: left (leg 0) vs right (leg 1)");
    }
    return Span<Hom, Traits>(Traits::dom(left), std::vector<Hom>{left, right});
}

} // namespace freediag
