/**
 * @file diagram_config.hpp
 */
#pragma once
#include "freediag/common/common.hpp"

namespace freediag
{

/**
 * @brief Configuration for FreeDiagram construction.
 */
struct DiagramConfig
{
    /**
     * @brief Whether incremental edge insertion checks endpoint objects.
     * @details If true, `add_edge()` rejects a morphism whose domain or
     *          codomain differs from its endpoint objects, and the diagram is
     *          left unchanged. If false, such edges are accepted and reported
     *          later by `get_diagnostics()`. Bulk construction always
     *          validates, regardless of this flag.
     */
    bool eager_validation{true};
};

} // namespace freediag
