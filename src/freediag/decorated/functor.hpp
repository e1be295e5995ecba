/**
 * @file functor.hpp
 * @brief Opaque functor and laxator interfaces carried by decorated cospans.
 */
#pragma once
#include "freediag/common/common.hpp"

namespace freediag
{

/**
 * @brief Interface for a functor supplied by an open-network composition layer.
 *
 * @details
 * Diagram code never calls into a functor; it only carries one so that a
 * composition layer can combine decorations. Implementations define their
 * own operations on top of this interface.
 *
 * @par Lifecycle
 * - Shared by every decorated cospan it decorates, via shared_ptr.
 */
class AbstractFunctor
{
public:
    virtual ~AbstractFunctor() = 0;

    /**
     * @brief Get a display name for this functor.
     */
    virtual std::string name() const = 0;

protected:
    AbstractFunctor() = default;

private:
    AbstractFunctor(const AbstractFunctor&) = delete;
    AbstractFunctor(AbstractFunctor&&) = delete;
    AbstractFunctor& operator=(const AbstractFunctor&) = delete;
    AbstractFunctor& operator=(AbstractFunctor&&) = delete;
};

/**
 * @brief Interface for the laxator (coherence map) of a lax monoidal functor.
 */
class AbstractLaxator
{
public:
    virtual ~AbstractLaxator() = 0;

    virtual std::string name() const = 0;

protected:
    AbstractLaxator() = default;

private:
    AbstractLaxator(const AbstractLaxator&) = delete;
    AbstractLaxator(AbstractLaxator&&) = delete;
    AbstractLaxator& operator=(const AbstractLaxator&) = delete;
    AbstractLaxator& operator=(AbstractLaxator&&) = delete;
};

using FunctorPtr = std::shared_ptr<const AbstractFunctor>;
using LaxatorPtr = std::shared_ptr<const AbstractLaxator>;

inline AbstractFunctor::~AbstractFunctor() = default;
inline AbstractLaxator::~AbstractLaxator() = default;

/**
 * @brief A functor paired with its laxator.
 */
class LaxMonoidalFunctor : public AbstractFunctor
{
public:
    LaxMonoidalFunctor(FunctorPtr functor, LaxatorPtr laxator)
        : m_functor(std::move(functor))
        , m_laxator(std::move(laxator))
    {
    }

    const FunctorPtr& functor() const noexcept
    {
        return m_functor;
    }

    const LaxatorPtr& laxator() const noexcept
    {
        return m_laxator;
    }

    std::string name() const override
    {
        return "LaxMonoidalFunctor(" + (m_functor ? m_functor->name() : std::string("null")) + ", " +
               (m_laxator ? m_laxator->name() : std::string("null")) + ")";
    }

private:
    FunctorPtr m_functor;
    LaxatorPtr m_laxator;
};

} // namespace freediag
