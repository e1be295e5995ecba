/**
 * @file decorated_cospan.hpp
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/diagram_exceptions.hpp"
#include "freediag/decorated/functor.hpp"
#include "freediag/shapes/multicospan.hpp"

namespace freediag
{

/**
 * @brief A cospan annotated with a decoration and the functor that decorates it.
 *
 * @details
 * Used to represent open networks: the cospan's legs are the network's
 * boundary, the decoration its interior. Composition of decorated cospans
 * belongs to the caller; this type only carries the three parts. No
 * compatibility between decorator and decoration is checked here; only the
 * leg count of the cospan is.
 *
 * @par Ownership
 * - Owns its cospan and decoration.
 * - Shares its decorator.
 */
template <typename Hom, typename Decoration, typename Traits = CategoryTraits<Hom>>
class DecoratedCospan
{
public:
    using Ob = typename Traits::Ob;

    /**
     * @throw DiagramError with `ShapeMismatch` if `cospan` does not have
     *        exactly two legs.
     */
    DecoratedCospan(Cospan<Hom, Traits> cospan, FunctorPtr decorator, Decoration decoration)
        : m_cospan(require_two_legs(std::move(cospan)))
        , m_decorator(std::move(decorator))
        , m_decoration(std::move(decoration))
    {
    }

    const FunctorPtr& decorator() const noexcept
    {
        return m_decorator;
    }

    const Decoration& decoration() const noexcept
    {
        return m_decoration;
    }

    /**
     * @brief The cospan without its decoration.
     */
    const Cospan<Hom, Traits>& undecorate() const noexcept
    {
        return m_cospan;
    }

    const Ob& base() const noexcept
    {
        return m_cospan.base();
    }

    const Hom& left() const
    {
        return m_cospan.left();
    }

    const Hom& right() const
    {
        return m_cospan.right();
    }

private:
    static Cospan<Hom, Traits> require_two_legs(Cospan<Hom, Traits> cospan)
    {
        if (!cospan.is_cospan())
        {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "Decorated cospan needs exactly 2 legs, got " + std::to_string(cospan.size()));
        }
        return cospan;
    }

    Cospan<Hom, Traits> m_cospan;
    FunctorPtr m_decorator;
    Decoration m_decoration;
};

} // namespace freediag
