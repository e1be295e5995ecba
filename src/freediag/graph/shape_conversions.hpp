/**
 * @file shape_conversions.hpp
 * @brief Canonical embeddings of fixed shapes into FreeDiagram.
 *
 * @details
 * Each conversion builds a fresh diagram and leaves its input untouched. The
 * vertex and edge orderings below are part of the contract: limit and colimit
 * code finds legs by position in the result.
 *
 * | Shape              | Vertices                         | Edges (in leg order)    |
 * |--------------------|----------------------------------|-------------------------|
 * | Multispan (n legs) | 0 = apex, 1..n = leg codomains   | 0 -> i+1                |
 * | Multicospan        | 0..n-1 = leg domains, n = base   | i -> n                  |
 * | ParallelMorphisms  | 0 = dom, 1 = codom               | 0 -> 1                  |
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/logging.hpp"
#include "freediag/graph/free_diagram.hpp"
#include "freediag/graph/free_diagram.inline.hpp"
#include "freediag/shapes/multicospan.hpp"
#include "freediag/shapes/multispan.hpp"
#include "freediag/shapes/parallel_morphisms.hpp"

namespace freediag
{

/**
 * @brief Embed a multispan: apex first, then one vertex per leg codomain.
 * @return A diagram with `1 + size()` vertices and `size()` edges, all out of vertex 0.
 */
template <typename Hom, typename Traits>
FreeDiagram<Hom, Traits> to_free_diagram(const Multispan<Hom, Traits>& span, DiagramConfig config = {})
{
    FreeDiagram<Hom, Traits> diagram(config);
    const VertexIdx apex = diagram.add_vertex(span.apex());

    std::vector<typename Traits::Ob> feet;
    feet.reserve(span.size());
    for (const auto& leg : span)
    {
        feet.push_back(Traits::codom(leg));
    }
    const auto feet_ids = diagram.add_vertices(std::move(feet));

    diagram.add_edges(std::vector<VertexIdx>(span.size(), apex), feet_ids, span.legs());

    get_logger()->debug("Converted {} with {} leg(s) to free diagram ({} vertices, {} edges)",
                        to_string(ShapeKind::Multispan), span.size(),
                        diagram.vertex_count(), diagram.edge_count());
    return diagram;
}

/**
 * @brief Embed a multicospan: one vertex per leg domain, then the base last.
 * @return A diagram with `size() + 1` vertices and `size()` edges, all into the last vertex.
 */
template <typename Hom, typename Traits>
FreeDiagram<Hom, Traits> to_free_diagram(const Multicospan<Hom, Traits>& cospan, DiagramConfig config = {})
{
    FreeDiagram<Hom, Traits> diagram(config);

    std::vector<typename Traits::Ob> feet;
    feet.reserve(cospan.size());
    for (const auto& leg : cospan)
    {
        feet.push_back(Traits::dom(leg));
    }
    const auto feet_ids = diagram.add_vertices(std::move(feet));
    const VertexIdx base = diagram.add_vertex(cospan.base());

    diagram.add_edges(feet_ids, std::vector<VertexIdx>(cospan.size(), base), cospan.legs());

    get_logger()->debug("Converted {} with {} leg(s) to free diagram ({} vertices, {} edges)",
                        to_string(ShapeKind::Multicospan), cospan.size(),
                        diagram.vertex_count(), diagram.edge_count());
    return diagram;
}

/**
 * @brief Embed parallel morphisms: vertices `dom`, `codom`; every edge 0 -> 1.
 */
template <typename Hom, typename Traits>
FreeDiagram<Hom, Traits> to_free_diagram(const ParallelMorphisms<Hom, Traits>& para, DiagramConfig config = {})
{
    FreeDiagram<Hom, Traits> diagram(config);
    const auto ids = diagram.add_vertices({para.dom(), para.codom()});

    diagram.add_edges(std::vector<VertexIdx>(para.size(), ids[0]),
                      std::vector<VertexIdx>(para.size(), ids[1]),
                      para.homs());

    get_logger()->debug("Converted {} with {} hom(s) to free diagram ({} vertices, {} edges)",
                        to_string(ShapeKind::ParallelMorphisms), para.size(),
                        diagram.vertex_count(), diagram.edge_count());
    return diagram;
}

} // namespace freediag
