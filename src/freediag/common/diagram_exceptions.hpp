/**
 * @file diagram_exceptions.hpp
 */
#pragma once
#include "freediag/common/common.hpp"

namespace freediag
{

class DiagramDiagnostics;

/**
 * @brief Error codes for diagram construction and access.
 *
 * @details
 * - `ShapeMismatch`: a structural invariant (domain/codomain agreement across
 *   legs, homs, or edge endpoints) is violated. Raised at construction time.
 * - `IndexOutOfRange`: a positional access or vertex/edge id is beyond the
 *   valid range.
 * - `MissingAttribute`: an object or morphism attribute was read for a vertex
 *   or edge that exists but has none bound.
 * - `InvalidMorphism`: a concrete morphism value is malformed (for example a
 *   finite function whose values fall outside its codomain).
 */
enum class DiagramErrorCode
{
    ShapeMismatch,
    IndexOutOfRange,
    MissingAttribute,
    InvalidMorphism
};

/**
 * @brief Get a display name for an error code.
 */
inline const char* to_string(DiagramErrorCode code) noexcept
{
    switch (code)
    {
    case DiagramErrorCode::ShapeMismatch:
        return "ShapeMismatch";
    case DiagramErrorCode::IndexOutOfRange:
        return "IndexOutOfRange";
    case DiagramErrorCode::MissingAttribute:
        return "MissingAttribute";
    case DiagramErrorCode::InvalidMorphism:
        return "InvalidMorphism";
    }
    return "Unknown";
}

/**
 * @brief Exception class for diagram errors.
 *
 * @details
 * `DiagramError` is thrown by shape constructors, `FreeDiagram` and
 * `AttributedGraph` when preconditions are violated, indices are invalid, or
 * diagram invariants would be broken by an operation. Each exception carries
 * an error code and a descriptive message. These are programming errors at
 * the call site; they are never retried or replaced by default values.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class DiagramError : public std::exception
{
public:
    /**
     * @brief Construct a DiagramError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    DiagramError(DiagramErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    /**
     * @brief Get the error code.
     */
    DiagramErrorCode code() const noexcept
    {
        return m_code;
    }

    /**
     * @brief Get the error message.
     */
    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    DiagramErrorCode m_code;
    std::string m_message;
};

/**
 * @brief Exception thrown when bulk diagram validation fails.
 *
 * @details
 * Always carries `DiagramErrorCode::ShapeMismatch`. The message names the
 * first violation; the attached diagnostics list every violation found.
 */
class ShapeValidationError : public DiagramError
{
public:
    ShapeValidationError(std::string message, std::shared_ptr<DiagramDiagnostics> diagnostics)
        : DiagramError(DiagramErrorCode::ShapeMismatch, std::move(message))
        , m_diagnostics(std::move(diagnostics))
    {
    }

    /**
     * @brief Get the diagnostics that caused the validation failure.
     */
    const std::shared_ptr<DiagramDiagnostics>& diagnostics() const noexcept
    {
        return m_diagnostics;
    }

private:
    std::shared_ptr<DiagramDiagnostics> m_diagnostics;
};

} // namespace freediag
