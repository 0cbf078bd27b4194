/**
 * @file graph_enums.hpp
 */
#pragma once
#include "stategraph/common/common.hpp"

namespace stategraph
{

// ============================================================================
// Index type aliases
// ============================================================================

/**
 * @brief Type alias for node indices.
 *
 * @details
 * `NodeIdx` is a type alias for `size_t` used to identify nodes in a built
 * graph. Nodes are numbered in registration order. This alias exists for
 * clarity in API signatures and documentation, not for compile-time type safety.
 */
using NodeIdx = size_t;

// ============================================================================
// Markers
// ============================================================================

/**
 * @brief Default name of the terminal marker.
 *
 * @details
 * Edges into the terminal marker declare that a node finishes a path. The marker
 * is never registered as a node and never invoked.
 */
inline const std::string END{"__end__"};

// ============================================================================
// Enumerations
// ============================================================================

/**
 * @brief Execution state of a node within one run.
 *
 * @details
 * `Pending -> Ready -> Running -> {Completed, Failed}`. The entry node starts
 * Ready; all others start Pending and become Ready once every predecessor has
 * completed and merged its delta. A node still Pending or Ready when the run
 * ends was never launched.
 */
enum class NodeState
{
    Pending,
    Ready,
    Running,
    Completed,
    Failed
};

inline const char* to_string(NodeState state) noexcept
{
    switch (state)
    {
    case NodeState::Pending:
        return "Pending";
    case NodeState::Ready:
        return "Ready";
    case NodeState::Running:
        return "Running";
    case NodeState::Completed:
        return "Completed";
    case NodeState::Failed:
        return "Failed";
    }
    return "Unknown";
}

} // namespace stategraph
