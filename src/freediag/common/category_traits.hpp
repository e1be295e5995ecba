/**
 * @file category_traits.hpp
 * @brief The morphism capability consumed by every diagram shape.
 */
#pragma once
#include "freediag/common/common.hpp"

namespace freediag
{

/**
 * @brief Access to the domain and codomain of a morphism type.
 *
 * @details
 * The primary template forwards to member functions `dom()` and `codom()` on
 * `Hom`. A category whose morphisms do not have such members specializes
 * this template instead:
 *
 * @code
 * template <>
 * struct CategoryTraits<MyArrow>
 * {
 *     using Ob = MyObject;
 *     static Ob dom(const MyArrow& f) { return f.source; }
 *     static Ob codom(const MyArrow& f) { return f.target; }
 * };
 * @endcode
 *
 * Objects and morphisms must both be equality-comparable with `operator==`.
 * Nothing else about the category is assumed: composition and identities are
 * never used by the diagram types.
 */
template <typename Hom>
struct CategoryTraits
{
    using Ob = std::decay_t<decltype(std::declval<const Hom&>().dom())>;

    static Ob dom(const Hom& f)
    {
        return f.dom();
    }

    static Ob codom(const Hom& f)
    {
        return f.codom();
    }
};

namespace detail
{

/**
 * @brief Positions whose projected value differs from the value at position 0.
 * @details Empty input yields an empty result.
 */
template <typename T, typename Proj>
std::vector<size_t> mismatched_positions(const std::vector<T>& items, Proj proj)
{
    std::vector<size_t> result;
    if (items.empty())
    {
        return result;
    }
    const auto reference = proj(items.front());
    for (size_t i = 1; i < items.size(); ++i)
    {
        if (!(proj(items[i]) == reference))
        {
            result.push_back(i);
        }
    }
    return result;
}

/**
 * @brief Join indices as "1, 2, 5" for error messages.
 */
inline std::string join_indices(const std::vector<size_t>& indices)
{
    std::string result;
    for (size_t i = 0; i < indices.size(); ++i)
    {
        if (i > 0)
        {
            result += ", ";
        }
        result += std::to_string(indices[i]);
    }
    return result;
}

} // namespace detail

} // namespace freediag
