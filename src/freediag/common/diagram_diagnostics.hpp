/**
 * @file diagram_diagnostics.hpp
 */
#pragma once
#include "freediag/common/common.hpp"
#include "freediag/common/diagram_enums.hpp"

namespace freediag
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Category of diagnostic issue.
 */
enum class DiagnosticCategory
{
    DomainMismatch,     ///< An edge's morphism domain differs from its source object.
    CodomainMismatch,   ///< An edge's morphism codomain differs from its target object.
    MissingObject,      ///< A vertex has no object bound.
    MissingMorphism     ///< An edge has no morphism bound.
};

/**
 * @brief Get a display name for a diagnostic category.
 */
const char* to_string(DiagnosticCategory category) noexcept;

/**
 * @brief A single diagnostic item.
 *
 * @details
 * For a constructed diagram, `involved_edges` holds edge ids. For bulk
 * validation before construction, it holds positions in the triple list
 * instead, and `involved_vertices` holds the declared endpoint indices.
 */
struct DiagnosticItem
{
    DiagnosticCategory category;
    std::string message;

    /// Vertex indices involved in this issue (if applicable).
    std::vector<VertexIdx> involved_vertices;

    /// Edge indices (or triple positions) involved in this issue.
    std::vector<EdgeIdx> involved_edges;
};

// ============================================================================
// DiagramDiagnostics
// ============================================================================

/**
 * @brief Violations of the free-diagram invariant found by a validation pass.
 *
 * @details
 * Produced by `FreeDiagram::get_diagnostics()` and by bulk construction, where
 * it is attached to the thrown `ShapeValidationError`. Items appear in edge
 * (or triple) order; a single edge may contribute both a domain and a
 * codomain item.
 *
 * @par Thread safety
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class DiagramDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    /**
     * @brief Record a violation.
     */
    void add_error(DiagnosticItem item)
    {
        m_errors.push_back(std::move(item));
    }

    /**
     * @brief Render all items, one per line, for exception messages and logs.
     */
    std::string summary() const;

private:
    std::vector<DiagnosticItem> m_errors;
};

} // namespace freediag
