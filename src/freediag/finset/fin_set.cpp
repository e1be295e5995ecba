/**
 * @file fin_set.cpp
 */
#include "freediag/finset/fin_set.hpp"
#include "freediag/common/diagram_exceptions.hpp"

namespace freediag
{

std::ostream& operator<<(std::ostream& os, const FinSet& set)
{
    return os << "FinSet(" << set.n << ")";
}

FinFunction::FinFunction(const std::vector<size_t>& values, FinSet codom)
    : FinFunction(FinSet(values.size()), codom, values)
{
}

FinFunction::FinFunction(FinSet dom, FinSet codom, std::vector<size_t> values)
    : m_dom(dom)
    , m_codom(codom)
    , m_values(std::move(values))
{
    if (m_values.size() != m_dom.n)
    {
        throw DiagramError(
            DiagramErrorCode::InvalidMorphism,
            "FinFunction has " + std::to_string(m_values.size()) +
                " value(s) but domain of size " + std::to_string(m_dom.n));
    }
    for (size_t i = 0; i < m_values.size(); ++i)
    {
        if (m_values[i] >= m_codom.n)
        {
            throw DiagramError(
                DiagramErrorCode::InvalidMorphism,
                "FinFunction maps " + std::to_string(i) + " to " + std::to_string(m_values[i]) +
                    ", outside codomain of size " + std::to_string(m_codom.n));
        }
    }
}

FinFunction FinFunction::identity(FinSet set)
{
    std::vector<size_t> values(set.n);
    for (size_t i = 0; i < set.n; ++i)
    {
        values[i] = i;
    }
    return FinFunction(set, set, std::move(values));
}

size_t FinFunction::operator()(size_t i) const
{
    if (i >= m_values.size())
    {
        throw DiagramError(
            DiagramErrorCode::IndexOutOfRange,
            "Element " + std::to_string(i) + " out of range [0, " +
                std::to_string(m_values.size()) + ")");
    }
    return m_values[i];
}

FinFunction compose(const FinFunction& f, const FinFunction& g)
{
    if (f.codom() != g.dom())
    {
        throw DiagramError(
            DiagramErrorCode::ShapeMismatch,
            "Cannot compose: codomain of size " + std::to_string(f.codom().n) +
                " vs domain of size " + std::to_string(g.dom().n));
    }
    std::vector<size_t> values;
    values.reserve(f.values().size());
    for (size_t x : f.values())
    {
        values.push_back(g.values()[x]);
    }
    return FinFunction(f.dom(), g.codom(), std::move(values));
}

std::ostream& operator<<(std::ostream& os, const FinFunction& f)
{
    os << "FinFunction(" << f.dom().n << " -> " << f.codom().n << ": [";
    for (size_t i = 0; i < f.values().size(); ++i)
    {
        if (i > 0)
        {
            os << ", ";
        }
        os << f.values()[i];
    }
    return os << "])";
}

} // namespace freediag
