#ifndef FREEDIAG_GRAPH_ATTRIBUTED_GRAPH_HPP
#define FREEDIAG_GRAPH_ATTRIBUTED_GRAPH_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

#include "freediag/common/diagram_enums.hpp"
#include "freediag/common/diagram_exceptions.hpp"

namespace freediag {

/**
 * @brief An append-only directed multigraph with one attribute column per
 *        vertex and per edge.
 *
 * This class stores:
 * - **Vertex arena**: dense ids from 0, each with an optional attribute
 * - **Edge arena**: dense ids from 0, each with source, target and an optional attribute
 * - **Incidence indexes**: outgoing and incoming edge lists per vertex, in edge id order
 *
 * Ids are assigned contiguously in insertion order and never reused. There is
 * no removal and no rebinding of attributes.
 *
 * @tparam VAttr Vertex attribute type
 * @tparam EAttr Edge attribute type
 *
 * @par Thread Safety
 * Externally synchronized. Concurrent const operations are safe only if no
 * insertion occurs concurrently.
 *
 * @par Index Validation
 * All id-taking operations validate the id and throw DiagramError with
 * IndexOutOfRange. Reading an unbound attribute throws DiagramError with
 * MissingAttribute.
 */
template <typename VAttr, typename EAttr>
class AttributedGraph {
public:
    AttributedGraph() = default;

    // =========================================================================
    // Vertex Insertion
    // =========================================================================

    /**
     * @brief Adds a vertex with no attribute bound.
     * @return The id of the new vertex
     */
    VertexIdx add_vertex() {
        return push_vertex(std::nullopt);
    }

    /**
     * @brief Adds a vertex carrying an attribute.
     * @return The id of the new vertex
     */
    VertexIdx add_vertex(VAttr attr) {
        return push_vertex(std::optional<VAttr>(std::move(attr)));
    }

    /**
     * @brief Adds one vertex per attribute, in order.
     * @return The assigned ids, contiguous and ascending
     */
    std::vector<VertexIdx> add_vertices(std::vector<VAttr> attrs) {
        std::vector<VertexIdx> ids;
        ids.reserve(attrs.size());
        m_vertex_attrs.reserve(m_vertex_attrs.size() + attrs.size());
        for (auto& attr : attrs) {
            ids.push_back(add_vertex(std::move(attr)));
        }
        return ids;
    }

    // =========================================================================
    // Edge Insertion
    // =========================================================================

    /**
     * @brief Adds an edge with no attribute bound.
     * @throw DiagramError (IndexOutOfRange) if either endpoint does not exist
     */
    EdgeIdx add_edge(VertexIdx s, VertexIdx t) {
        validate_vertex(s);
        validate_vertex(t);
        return push_edge(s, t, std::nullopt);
    }

    /**
     * @brief Adds an edge carrying an attribute.
     * @throw DiagramError (IndexOutOfRange) if either endpoint does not exist
     */
    EdgeIdx add_edge(VertexIdx s, VertexIdx t, EAttr attr) {
        validate_vertex(s);
        validate_vertex(t);
        return push_edge(s, t, std::optional<EAttr>(std::move(attr)));
    }

    /**
     * @brief Adds one edge per position of three parallel sequences.
     *
     * All endpoints are validated before anything is inserted.
     *
     * @return The assigned ids, contiguous and ascending
     * @throw DiagramError (ShapeMismatch) if the sequences differ in length
     * @throw DiagramError (IndexOutOfRange) if any endpoint does not exist
     */
    std::vector<EdgeIdx> add_edges(const std::vector<VertexIdx>& srcs,
                                   const std::vector<VertexIdx>& tgts,
                                   std::vector<EAttr> attrs) {
        if (srcs.size() != tgts.size() || srcs.size() != attrs.size()) {
            throw DiagramError(
                DiagramErrorCode::ShapeMismatch,
                "add_edges: sequence lengths differ (sources " + std::to_string(srcs.size()) +
                ", targets " + std::to_string(tgts.size()) +
                ", attributes " + std::to_string(attrs.size()) + ")");
        }
        for (size_t i = 0; i < srcs.size(); ++i) {
            validate_vertex(srcs[i]);
            validate_vertex(tgts[i]);
        }
        std::vector<EdgeIdx> ids;
        ids.reserve(srcs.size());
        for (size_t i = 0; i < srcs.size(); ++i) {
            ids.push_back(push_edge(srcs[i], tgts[i], std::optional<EAttr>(std::move(attrs[i]))));
        }
        return ids;
    }

    // =========================================================================
    // Queries
    // =========================================================================

    [[nodiscard]] size_t vertex_count() const noexcept {
        return m_vertex_attrs.size();
    }

    [[nodiscard]] size_t edge_count() const noexcept {
        return m_edge_attrs.size();
    }

    [[nodiscard]] bool has_vertex(VertexIdx v) const noexcept {
        return v < m_vertex_attrs.size();
    }

    [[nodiscard]] bool has_edge(EdgeIdx e) const noexcept {
        return e < m_edge_attrs.size();
    }

    /**
     * @brief Source vertex of an edge.
     * @throw DiagramError (IndexOutOfRange) if e does not exist
     */
    [[nodiscard]] VertexIdx src(EdgeIdx e) const {
        validate_edge(e);
        return m_src[e];
    }

    /**
     * @brief Target vertex of an edge.
     * @throw DiagramError (IndexOutOfRange) if e does not exist
     */
    [[nodiscard]] VertexIdx tgt(EdgeIdx e) const {
        validate_edge(e);
        return m_tgt[e];
    }

    /**
     * @brief Edges whose source is v, in ascending id order.
     * @throw DiagramError (IndexOutOfRange) if v does not exist
     */
    [[nodiscard]] const std::vector<EdgeIdx>& out_edges(VertexIdx v) const {
        validate_vertex(v);
        return m_out[v];
    }

    /**
     * @brief Edges whose target is v, in ascending id order.
     * @throw DiagramError (IndexOutOfRange) if v does not exist
     */
    [[nodiscard]] const std::vector<EdgeIdx>& in_edges(VertexIdx v) const {
        validate_vertex(v);
        return m_in[v];
    }

    [[nodiscard]] bool has_vertex_attr(VertexIdx v) const {
        validate_vertex(v);
        return m_vertex_attrs[v].has_value();
    }

    [[nodiscard]] bool has_edge_attr(EdgeIdx e) const {
        validate_edge(e);
        return m_edge_attrs[e].has_value();
    }

    /**
     * @brief Attribute bound to a vertex.
     * @throw DiagramError (IndexOutOfRange) if v does not exist
     * @throw DiagramError (MissingAttribute) if v has no attribute
     */
    [[nodiscard]] const VAttr& vertex_attr(VertexIdx v) const {
        validate_vertex(v);
        if (!m_vertex_attrs[v].has_value()) {
            throw DiagramError(
                DiagramErrorCode::MissingAttribute,
                "Vertex " + std::to_string(v) + " has no attribute bound");
        }
        return *m_vertex_attrs[v];
    }

    /**
     * @brief Attribute bound to an edge.
     * @throw DiagramError (IndexOutOfRange) if e does not exist
     * @throw DiagramError (MissingAttribute) if e has no attribute
     */
    [[nodiscard]] const EAttr& edge_attr(EdgeIdx e) const {
        validate_edge(e);
        if (!m_edge_attrs[e].has_value()) {
            throw DiagramError(
                DiagramErrorCode::MissingAttribute,
                "Edge " + std::to_string(e) + " has no attribute bound");
        }
        return *m_edge_attrs[e];
    }

    /**
     * @brief Structural equality: same endpoints and same attributes at every id.
     */
    friend bool operator==(const AttributedGraph& a, const AttributedGraph& b) {
        return a.m_vertex_attrs == b.m_vertex_attrs && a.m_src == b.m_src &&
               a.m_tgt == b.m_tgt && a.m_edge_attrs == b.m_edge_attrs;
    }

    friend bool operator!=(const AttributedGraph& a, const AttributedGraph& b) {
        return !(a == b);
    }

private:
    VertexIdx push_vertex(std::optional<VAttr> attr) {
        VertexIdx v = m_vertex_attrs.size();
        m_vertex_attrs.push_back(std::move(attr));
        m_out.emplace_back();
        m_in.emplace_back();
        return v;
    }

    EdgeIdx push_edge(VertexIdx s, VertexIdx t, std::optional<EAttr> attr) {
        EdgeIdx e = m_edge_attrs.size();
        m_src.push_back(s);
        m_tgt.push_back(t);
        m_edge_attrs.push_back(std::move(attr));
        m_out[s].push_back(e);
        m_in[t].push_back(e);
        return e;
    }

    void validate_vertex(VertexIdx v) const {
        if (v >= m_vertex_attrs.size()) {
            throw DiagramError(
                DiagramErrorCode::IndexOutOfRange,
                "Vertex index " + std::to_string(v) +
                " out of range [0, " + std::to_string(m_vertex_attrs.size()) + ")");
        }
    }

    void validate_edge(EdgeIdx e) const {
        if (e >= m_edge_attrs.size()) {
            throw DiagramError(
                DiagramErrorCode::IndexOutOfRange,
                "Edge index " + std::to_string(e) +
                " out of range [0, " + std::to_string(m_edge_attrs.size()) + ")");
        }
    }

    std::vector<std::optional<VAttr>> m_vertex_attrs;   // Object column, one per vertex
    std::vector<std::vector<EdgeIdx>> m_out;            // Outgoing edges per vertex
    std::vector<std::vector<EdgeIdx>> m_in;             // Incoming edges per vertex
    std::vector<VertexIdx> m_src;                       // Source per edge
    std::vector<VertexIdx> m_tgt;                       // Target per edge
    std::vector<std::optional<EAttr>> m_edge_attrs;     // Morphism column, one per edge
};

} // namespace freediag

#endif // FREEDIAG_GRAPH_ATTRIBUTED_GRAPH_HPP
