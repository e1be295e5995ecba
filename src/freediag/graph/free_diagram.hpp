/**
 * @file free_diagram.hpp
 * @brief Definition of the general free diagram type.
 * @see free_diagram.inline.hpp for member implementations.
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/category_traits.hpp"
#include "freediag/common/diagram_config.hpp"
#include "freediag/common/diagram_diagnostics.hpp"
#include "freediag/common/diagram_enums.hpp"
#include "freediag/common/diagram_exceptions.hpp"
#include "freediag/graph/attributed_graph.hpp"

namespace freediag
{

/**
 * @brief A diagram of arbitrary shape: a directed multigraph whose vertices
 *        carry objects and whose edges carry morphisms.
 *
 * @details
 * `FreeDiagram` is the uniform input shape of limit and colimit algorithms.
 * It is backed by an `AttributedGraph<Ob, Hom>`: vertex and edge ids are
 * dense, start at 0, and follow insertion order, which downstream code relies
 * on to find legs by position.
 *
 * @par Invariant
 * For every edge `e`: `Traits::dom(hom(e)) == ob(src(e))` and
 * `Traits::codom(hom(e)) == ob(tgt(e))`.
 *
 * @par Construction
 * - Bulk: `FreeDiagram(obs, triples)` checks every triple before inserting
 *   anything and throws `ShapeValidationError` listing all violations.
 * - Incremental: `add_vertex()`, `add_vertices()`, `add_edge()`,
 *   `add_edges()`. With `DiagramConfig::eager_validation` (the default),
 *   an edge whose morphism disagrees with its endpoint objects is rejected
 *   and the diagram is unchanged. Otherwise violations are only reported by
 *   `get_diagnostics()`.
 * - The unattributed `add_vertex()` and `add_edge(s, t)` create structure
 *   only; reading `ob()` or `hom()` there throws `MissingAttribute`.
 *
 * There is no removal. Diagrams are built once and then read.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Build on one thread, then share read-only. Concurrent const calls are
 *   safe only while no insertion can happen.
 *
 * @tparam Hom Morphism type.
 * @tparam Traits Morphism capability, see `CategoryTraits`.
 */
template <typename Hom, typename Traits = CategoryTraits<Hom>>
class FreeDiagram
{
public:
    using Ob = typename Traits::Ob;

    /// An edge declared by (source index, target index, morphism).
    using Triple = std::tuple<VertexIdx, VertexIdx, Hom>;

    using Graph = AttributedGraph<Ob, Hom>;

    /**
     * @brief Construct an empty diagram.
     */
    explicit FreeDiagram(DiagramConfig config = {});

    /**
     * @brief Construct a diagram from objects and edge triples.
     *
     * @details
     * Vertex `i` carries `obs[i]`; triple `k` becomes edge `k`. All triples
     * are validated before any insertion.
     *
     * @throw DiagramError with `IndexOutOfRange` if a triple refers to a
     *        vertex index `>= obs.size()`.
     * @throw ShapeValidationError (code `ShapeMismatch`) if a triple's source
     *        or target object differs from its morphism's domain or codomain.
     *        The message names the first offending triple; `diagnostics()`
     *        lists all of them.
     */
    FreeDiagram(std::vector<Ob> obs, std::vector<Triple> triples, DiagramConfig config = {});

    /**
     * @brief Check triples against objects without building anything.
     * @return Diagnostics whose items refer to triple positions.
     * @throw DiagramError with `IndexOutOfRange` if a triple refers to a
     *        vertex index `>= obs.size()`.
     */
    static std::shared_ptr<DiagramDiagnostics> check_triples(const std::vector<Ob>& obs,
                                                             const std::vector<Triple>& triples);

    const DiagramConfig& config() const noexcept
    {
        return m_config;
    }

    // -------------------------------------------------------------------------
    // Structure
    // -------------------------------------------------------------------------

    size_t vertex_count() const noexcept
    {
        return m_graph.vertex_count();
    }

    size_t edge_count() const noexcept
    {
        return m_graph.edge_count();
    }

    /// All vertex ids, ascending.
    std::vector<VertexIdx> vertices() const;

    /// All edge ids, ascending.
    std::vector<EdgeIdx> edges() const;

    bool has_vertex(VertexIdx v) const noexcept
    {
        return m_graph.has_vertex(v);
    }

    bool has_edge(EdgeIdx e) const noexcept
    {
        return m_graph.has_edge(e);
    }

    VertexIdx src(EdgeIdx e) const
    {
        return m_graph.src(e);
    }

    VertexIdx tgt(EdgeIdx e) const
    {
        return m_graph.tgt(e);
    }

    const std::vector<EdgeIdx>& out_edges(VertexIdx v) const
    {
        return m_graph.out_edges(v);
    }

    const std::vector<EdgeIdx>& in_edges(VertexIdx v) const
    {
        return m_graph.in_edges(v);
    }

    const Graph& graph() const noexcept
    {
        return m_graph;
    }

    // -------------------------------------------------------------------------
    // Incremental construction
    // -------------------------------------------------------------------------

    /**
     * @brief Add a vertex with no object bound.
     */
    VertexIdx add_vertex();

    /**
     * @brief Add a vertex carrying an object.
     * @return The new vertex id, equal to the previous `vertex_count()`.
     */
    VertexIdx add_vertex(Ob ob);

    /**
     * @brief Add one vertex per object, in order.
     * @return The assigned ids, contiguous and ascending.
     */
    std::vector<VertexIdx> add_vertices(std::vector<Ob> obs);

    /**
     * @brief Add an edge with no morphism bound.
     * @throw DiagramError with `IndexOutOfRange` for an unknown endpoint.
     */
    EdgeIdx add_edge(VertexIdx s, VertexIdx t);

    /**
     * @brief Add an edge carrying a morphism.
     * @throw DiagramError with `IndexOutOfRange` for an unknown endpoint.
     * @throw DiagramError with `ShapeMismatch` under eager validation if the
     *        morphism disagrees with a bound endpoint object.
     */
    EdgeIdx add_edge(VertexIdx s, VertexIdx t, Hom hom);

    /**
     * @brief Add one edge per position of three parallel sequences.
     * @throw DiagramError with `ShapeMismatch` if the lengths differ, or under
     *        eager validation if any morphism disagrees with its endpoints.
     *        Nothing is inserted on failure.
     * @throw DiagramError with `IndexOutOfRange` for an unknown endpoint.
     */
    std::vector<EdgeIdx> add_edges(const std::vector<VertexIdx>& srcs,
                                   const std::vector<VertexIdx>& tgts,
                                   std::vector<Hom> homs);

    // -------------------------------------------------------------------------
    // Attributes
    // -------------------------------------------------------------------------

    /**
     * @brief Object at a vertex.
     * @throw DiagramError with `IndexOutOfRange` or `MissingAttribute`.
     */
    const Ob& ob(VertexIdx v) const
    {
        return m_graph.vertex_attr(v);
    }

    /**
     * @brief Morphism at an edge.
     * @throw DiagramError with `IndexOutOfRange` or `MissingAttribute`.
     */
    const Hom& hom(EdgeIdx e) const
    {
        return m_graph.edge_attr(e);
    }

    /// Objects of all vertices in id order. Throws like `ob()`.
    std::vector<Ob> obs() const;

    /// Morphisms of all edges in id order. Throws like `hom()`.
    std::vector<Hom> homs() const;

    // -------------------------------------------------------------------------
    // Validation
    // -------------------------------------------------------------------------

    /**
     * @brief Re-check the whole diagram.
     * @return Diagnostics listing unbound attributes and edges whose morphism
     *         disagrees with its endpoint objects, in id order.
     */
    std::shared_ptr<DiagramDiagnostics> get_diagnostics() const;

    /**
     * @brief Structural equality. The configuration is not compared.
     */
    friend bool operator==(const FreeDiagram& a, const FreeDiagram& b)
    {
        return a.m_graph == b.m_graph;
    }

    friend bool operator!=(const FreeDiagram& a, const FreeDiagram& b)
    {
        return !(a == b);
    }

private:
    /// Append domain/codomain items for one edge. Null objects are skipped.
    static void check_edge(DiagramDiagnostics& diagnostics,
                           const char* label,
                           size_t position,
                           VertexIdx s,
                           VertexIdx t,
                           const Ob* src_ob,
                           const Ob* tgt_ob,
                           const Hom& hom);

    /// Object at v, or nullptr if unbound.
    const Ob* find_ob(VertexIdx v) const;

    /// Throw ShapeMismatch if any item was recorded.
    static void raise_if_invalid(const DiagramDiagnostics& diagnostics, const char* context);

    DiagramConfig m_config;
    Graph m_graph;
};

/**
 * @brief Object at a vertex of a diagram.
 */
template <typename Hom, typename Traits>
const typename Traits::Ob& ob(const FreeDiagram<Hom, Traits>& diagram, VertexIdx v)
{
    return diagram.ob(v);
}

/**
 * @brief Morphism at an edge of a diagram.
 */
template <typename Hom, typename Traits>
const Hom& hom(const FreeDiagram<Hom, Traits>& diagram, EdgeIdx e)
{
    return diagram.hom(e);
}

} // namespace freediag
