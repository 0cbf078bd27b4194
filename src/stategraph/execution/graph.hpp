/**
 * @file graph.hpp
 * @brief Definition of the immutable Graph produced by NodeRegistry::build().
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_diagnostics.hpp"
#include "stategraph/common/graph_enums.hpp"
#include "stategraph/common/node.hpp"
#include "stategraph/common/state_schema.hpp"

namespace stategraph
{

/**
 * @brief Immutable, validated workflow graph.
 *
 * @details
 * Graph contains all information needed to run a validated workflow:
 * - Node names, functions and declared outputs, indexed by NodeIdx
 * - Predecessor counts for ready-set tracking
 * - Successor lists for completion notification
 * - Which nodes have an edge into the terminal marker
 * - For each node, the set of its transitive dependencies, which decides whose
 *   deltas appear in the node's launch snapshot
 *
 * @par Thread Safety
 * - Once constructed, the structure is immutable.
 * - Concurrent reads are safe; one Graph may back any number of concurrent runs.
 * - Execution state is tracked per run (in NodeTask and StateStore).
 *
 * @par Ownership
 * - Shared via shared_ptr<const Graph>; nodes' functions are copied in at build().
 */
struct Graph
{
    /**
     * @brief Node names indexed by NodeIdx (registration order).
     */
    std::vector<std::string> node_names;

    /**
     * @brief Node functions indexed by NodeIdx.
     */
    std::vector<NodeFunction> functions;

    /**
     * @brief Declared output fields indexed by NodeIdx; empty means undeclared.
     */
    std::vector<std::vector<std::string>> declared_outputs;

    /**
     * @brief Number of distinct predecessors for each node.
     *
     * @details
     * predecessor_counts[n] is the number of nodes that must complete and merge
     * before node n becomes ready. Only the entry node has count 0.
     */
    std::vector<size_t> predecessor_counts;

    /**
     * @brief Successor lists for each node, without duplicates.
     */
    std::vector<std::vector<NodeIdx>> successors;

    /**
     * @brief Transitive dependencies of each node.
     *
     * @details
     * visible_producers[n][p] is true if p is an ancestor of n. A node's launch
     * snapshot contains the initial state plus the deltas of exactly these nodes.
     */
    std::vector<std::vector<bool>> visible_producers;

    /**
     * @brief terminal_predecessors[n] is true if n has an edge to the terminal marker.
     */
    std::vector<bool> terminal_predecessors;

    /**
     * @brief A topological order of all nodes.
     */
    std::vector<NodeIdx> topological_order;

    NodeIdx entry{0};

    std::string terminal_name{END};

    /**
     * @brief Schema checked against the initial state and every delta; may be null.
     */
    std::shared_ptr<const StateSchema> schema;

    /**
     * @brief Validation result the graph was built from (errors empty, warnings kept).
     */
    std::shared_ptr<const GraphDiagnostics> diagnostics;

    /**
     * @brief Name to index lookup.
     */
    std::unordered_map<std::string, NodeIdx> node_indices;

    size_t node_count() const noexcept
    {
        return node_names.size();
    }

    /**
     * @brief Look up a node by name.
     * @return The node index, or nullopt if no such node.
     */
    std::optional<NodeIdx> find_node(const std::string& name) const
    {
        auto it = node_indices.find(name);
        if (it == node_indices.end())
        {
            return std::nullopt;
        }
        return it->second;
    }

    /**
     * @brief Get indices of nodes with no predecessors.
     */
    std::vector<NodeIdx> get_initial_ready_nodes() const
    {
        std::vector<NodeIdx> result;
        for (size_t i = 0; i < predecessor_counts.size(); ++i)
        {
            if (predecessor_counts[i] == 0)
            {
                result.push_back(i);
            }
        }
        return result;
    }
};

using GraphPtr = std::shared_ptr<const Graph>;

} // namespace stategraph
