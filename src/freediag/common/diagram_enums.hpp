/**
 * @file diagram_enums.hpp
 */
#pragma once
#include "freediag/common/common.hpp"

namespace freediag
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for vertex indices.
 *
 * @details
 * `VertexIdx` is a type alias for `size_t` used to identify vertices in a
 * diagram. Vertices are numbered contiguously from 0 in insertion order.
 * This alias exists for clarity in API signatures and documentation, not for
 * compile-time type safety.
 */
using VertexIdx = size_t;

/**
 * @brief Type alias for edge indices.
 *
 * @details
 * `EdgeIdx` is a type alias for `size_t` used to identify edges in a diagram.
 * Edges are numbered contiguously from 0 in insertion order.
 */
using EdgeIdx = size_t;

/**
 * @brief Type alias for positions within a fixed-shape diagram (leg or hom).
 */
using LegIdx = size_t;

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief The fixed shapes that have a canonical embedding into a FreeDiagram.
 *
 * @details
 * - `Multispan`: legs radiating out of a common apex (colimit: pushout).
 * - `Multicospan`: legs converging into a common base (limit: pullback).
 * - `ParallelMorphisms`: morphisms sharing domain and codomain
 *   (limit: equalizer, colimit: coequalizer).
 */
enum class ShapeKind
{
    Multispan,
    Multicospan,
    ParallelMorphisms
};

/**
 * @brief Get a display name for a shape kind.
 */
inline const char* to_string(ShapeKind kind) noexcept
{
    switch (kind)
    {
    case ShapeKind::Multispan:
        return "Multispan";
    case ShapeKind::Multicospan:
        return "Multicospan";
    case ShapeKind::ParallelMorphisms:
        return "ParallelMorphisms";
    }
    return "Unknown";
}

} // namespace freediag
