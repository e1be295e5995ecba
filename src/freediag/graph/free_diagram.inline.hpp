/**
 * @file free_diagram.inline.hpp
 * @brief Implementations for FreeDiagram member methods.
 */
#pragma once
#include "freediag/graph/free_diagram.hpp"
#include "freediag/common/logging.hpp"

namespace freediag
{

// ============================================================================
// Constructors
// ============================================================================

template <typename Hom, typename Traits>
FreeDiagram<Hom, Traits>::FreeDiagram(DiagramConfig config)
    : m_config(config)
{
}

template <typename Hom, typename Traits>
FreeDiagram<Hom, Traits>::FreeDiagram(std::vector<Ob> obs,
                                      std::vector<Triple> triples,
                                      DiagramConfig config)
    : m_config(config)
{
    auto diagnostics = check_triples(obs, triples);
    if (diagnostics->has_errors())
    {
        const auto& first = diagnostics->errors().front();
        std::string message = "Invalid free diagram: " + first.message;
        if (diagnostics->errors().size() > 1)
        {
            message += " (and " + std::to_string(diagnostics->errors().size() - 1) +
                       " more violation(s))";
        }
        get_logger()->warn("Rejected free diagram: {}", diagnostics->summary());
        throw ShapeValidationError(message, diagnostics);
    }

    std::vector<VertexIdx> srcs;
    std::vector<VertexIdx> tgts;
    std::vector<Hom> homs;
    srcs.reserve(triples.size());
    tgts.reserve(triples.size());
    homs.reserve(triples.size());
    for (auto& [s, t, f] : triples)
    {
        srcs.push_back(s);
        tgts.push_back(t);
        homs.push_back(std::move(f));
    }

    m_graph.add_vertices(std::move(obs));
    m_graph.add_edges(srcs, tgts, std::move(homs));
}

template <typename Hom, typename Traits>
std::shared_ptr<DiagramDiagnostics> FreeDiagram<Hom, Traits>::check_triples(
    const std::vector<Ob>& obs, const std::vector<Triple>& triples)
{
    // Endpoint indices first: the object checks below read obs[s] and obs[t].
    for (size_t k = 0; k < triples.size(); ++k)
    {
        const VertexIdx s = std::get<0>(triples[k]);
        const VertexIdx t = std::get<1>(triples[k]);
        if (s >= obs.size() || t >= obs.size())
        {
            get_logger()->warn("Rejected free diagram: triple {} has endpoints ({}, {}) but only {} object(s)",
                               k, s, t, obs.size());
            throw DiagramError(
                DiagramErrorCode::IndexOutOfRange,
                "Triple " + std::to_string(k) + " refers to vertex " +
                    std::to_string(s >= obs.size() ? s : t) + " out of range [0, " +
                    std::to_string(obs.size()) + ")");
        }
    }

    auto diagnostics = std::make_shared<DiagramDiagnostics>();
    for (size_t k = 0; k < triples.size(); ++k)
    {
        const auto& [s, t, f] = triples[k];
        check_edge(*diagnostics, "Triple", k, s, t, &obs[s], &obs[t], f);
    }
    return diagnostics;
}

// ============================================================================
// Queries
// ============================================================================

template <typename Hom, typename Traits>
std::vector<VertexIdx> FreeDiagram<Hom, Traits>::vertices() const
{
    std::vector<VertexIdx> result(m_graph.vertex_count());
    for (VertexIdx v = 0; v < result.size(); ++v)
    {
        result[v] = v;
    }
    return result;
}

template <typename Hom, typename Traits>
std::vector<EdgeIdx> FreeDiagram<Hom, Traits>::edges() const
{
    std::vector<EdgeIdx> result(m_graph.edge_count());
    for (EdgeIdx e = 0; e < result.size(); ++e)
    {
        result[e] = e;
    }
    return result;
}

template <typename Hom, typename Traits>
std::vector<typename FreeDiagram<Hom, Traits>::Ob> FreeDiagram<Hom, Traits>::obs() const
{
    std::vector<Ob> result;
    result.reserve(m_graph.vertex_count());
    for (VertexIdx v = 0; v < m_graph.vertex_count(); ++v)
    {
        result.push_back(m_graph.vertex_attr(v));
    }
    return result;
}

template <typename Hom, typename Traits>
std::vector<Hom> FreeDiagram<Hom, Traits>::homs() const
{
    std::vector<Hom> result;
    result.reserve(m_graph.edge_count());
    for (EdgeIdx e = 0; e < m_graph.edge_count(); ++e)
    {
        result.push_back(m_graph.edge_attr(e));
    }
    return result;
}

// ============================================================================
// Incremental construction
// ============================================================================

template <typename Hom, typename Traits>
VertexIdx FreeDiagram<Hom, Traits>::add_vertex()
{
    return m_graph.add_vertex();
}

template <typename Hom, typename Traits>
VertexIdx FreeDiagram<Hom, Traits>::add_vertex(Ob ob)
{
    return m_graph.add_vertex(std::move(ob));
}

template <typename Hom, typename Traits>
std::vector<VertexIdx> FreeDiagram<Hom, Traits>::add_vertices(std::vector<Ob> obs)
{
    return m_graph.add_vertices(std::move(obs));
}

template <typename Hom, typename Traits>
EdgeIdx FreeDiagram<Hom, Traits>::add_edge(VertexIdx s, VertexIdx t)
{
    return m_graph.add_edge(s, t);
}

template <typename Hom, typename Traits>
EdgeIdx FreeDiagram<Hom, Traits>::add_edge(VertexIdx s, VertexIdx t, Hom hom)
{
    if (m_config.eager_validation && has_vertex(s) && has_vertex(t))
    {
        DiagramDiagnostics diagnostics;
        check_edge(diagnostics, "Edge", m_graph.edge_count(), s, t, find_ob(s), find_ob(t), hom);
        raise_if_invalid(diagnostics, "add_edge");
    }
    return m_graph.add_edge(s, t, std::move(hom));
}

template <typename Hom, typename Traits>
std::vector<EdgeIdx> FreeDiagram<Hom, Traits>::add_edges(const std::vector<VertexIdx>& srcs,
                                                         const std::vector<VertexIdx>& tgts,
                                                         std::vector<Hom> homs)
{
    // Length and index errors are reported by the graph before any insertion.
    if (m_config.eager_validation && srcs.size() == tgts.size() && srcs.size() == homs.size())
    {
        DiagramDiagnostics diagnostics;
        for (size_t i = 0; i < srcs.size(); ++i)
        {
            if (has_vertex(srcs[i]) && has_vertex(tgts[i]))
            {
                check_edge(diagnostics, "Edge", m_graph.edge_count() + i, srcs[i], tgts[i],
                           find_ob(srcs[i]), find_ob(tgts[i]), homs[i]);
            }
        }
        raise_if_invalid(diagnostics, "add_edges");
    }
    return m_graph.add_edges(srcs, tgts, std::move(homs));
}

// ============================================================================
// Validation
// ============================================================================

template <typename Hom, typename Traits>
std::shared_ptr<DiagramDiagnostics> FreeDiagram<Hom, Traits>::get_diagnostics() const
{
    auto diagnostics = std::make_shared<DiagramDiagnostics>();

    for (VertexIdx v = 0; v < m_graph.vertex_count(); ++v)
    {
        if (!m_graph.has_vertex_attr(v))
        {
            DiagnosticItem item;
            item.category = DiagnosticCategory::MissingObject;
            item.message = "Vertex " + std::to_string(v) + " has no object";
            item.involved_vertices.push_back(v);
            diagnostics->add_error(std::move(item));
        }
    }

    for (EdgeIdx e = 0; e < m_graph.edge_count(); ++e)
    {
        const VertexIdx s = m_graph.src(e);
        const VertexIdx t = m_graph.tgt(e);
        if (!m_graph.has_edge_attr(e))
        {
            DiagnosticItem item;
            item.category = DiagnosticCategory::MissingMorphism;
            item.message = "Edge " + std::to_string(e) + " has no morphism";
            item.involved_vertices = {s, t};
            item.involved_edges.push_back(e);
            diagnostics->add_error(std::move(item));
            continue;
        }
        check_edge(*diagnostics, "Edge", e, s, t, find_ob(s), find_ob(t), m_graph.edge_attr(e));
    }

    return diagnostics;
}

// ============================================================================
// Private helpers
// ============================================================================

template <typename Hom, typename Traits>
void FreeDiagram<Hom, Traits>::check_edge(DiagramDiagnostics& diagnostics,
                                          const char* label,
                                          size_t position,
                                          VertexIdx s,
                                          VertexIdx t,
                                          const Ob* src_ob,
                                          const Ob* tgt_ob,
                                          const Hom& hom)
{
    const std::string where = std::string(label) + " " + std::to_string(position) + " (" +
                              std::to_string(s) + " -> " + std::to_string(t) + ")";

    if (src_ob != nullptr && !(Traits::dom(hom) == *src_ob))
    {
        DiagnosticItem item;
        item.category = DiagnosticCategory::DomainMismatch;
        item.message = where + ": morphism domain differs from object at vertex " + std::to_string(s);
        item.involved_vertices.push_back(s);
        item.involved_edges.push_back(position);
        diagnostics.add_error(std::move(item));
    }
    if (tgt_ob != nullptr && !(Traits::codom(hom) == *tgt_ob))
    {
        DiagnosticItem item;
        item.category = DiagnosticCategory::CodomainMismatch;
        item.message = where + ": morphism codomain differs from object at vertex " + std::to_string(t);
        item.involved_vertices.push_back(t);
        item.involved_edges.push_back(position);
        diagnostics.add_error(std::move(item));
    }
}

template <typename Hom, typename Traits>
const typename FreeDiagram<Hom, Traits>::Ob* FreeDiagram<Hom, Traits>::find_ob(VertexIdx v) const
{
    return m_graph.has_vertex_attr(v) ? &m_graph.vertex_attr(v) : nullptr;
}

template <typename Hom, typename Traits>
void FreeDiagram<Hom, Traits>::raise_if_invalid(const DiagramDiagnostics& diagnostics, const char* context)
{
    if (diagnostics.is_valid())
    {
        return;
    }
    get_logger()->warn("Rejected {}: {}", context, diagnostics.summary());
    throw DiagramError(
        DiagramErrorCode::ShapeMismatch,
        std::string(context) + ": " + diagnostics.errors().front().message);
}

} // namespace freediag
