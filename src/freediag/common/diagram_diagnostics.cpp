/**
 * @file diagram_diagnostics.cpp
 */
#include "freediag/common/diagram_diagnostics.hpp"

#include <sstream>

namespace freediag
{

const char* to_string(DiagnosticCategory category) noexcept
{
    switch (category)
    {
    case DiagnosticCategory::DomainMismatch:
        return "DomainMismatch";
    case DiagnosticCategory::CodomainMismatch:
        return "CodomainMismatch";
    case DiagnosticCategory::MissingObject:
        return "MissingObject";
    case DiagnosticCategory::MissingMorphism:
        return "MissingMorphism";
    }
    return "Unknown";
}

std::string DiagramDiagnostics::summary() const
{
    std::ostringstream oss;
    oss << m_errors.size() << " error(s)";
    for (const auto& item : m_errors)
    {
        oss << "\n  - [" << to_string(item.category) << "] " << item.message;
    }
    return oss.str();
}

} // namespace freediag
