/**
 * @file graph_validator.hpp
 * @brief GraphValidator checks a NodeRegistry before it is built.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_diagnostics.hpp"

namespace stategraph
{

class NodeRegistry;

/**
 * @brief Configuration for graph validation.
 */
struct ValidatorConfig
{
    /**
     * @brief Whether to report output fields declared by more than one node.
     * @details Nodes that declare no outputs are not checked and produce an
     *          UndeclaredOutputs warning instead.
     */
    bool check_field_ownership{true};
};

/**
 * @brief Validates the structure of a registered workflow graph.
 *
 * @details
 * Checks, in order:
 * 1. An entry node is set.
 * 2. The edges contain no cycle (Kahn's algorithm; the nodes left over are
 *    peeled from the sink side so only nodes on or between cycles are reported).
 * 3. Every node has a path to the terminal marker (reverse reachability from it).
 * 4. Every node is reachable from the entry node.
 * 5. Optionally, declared output fields are pairwise disjoint across nodes.
 *
 * Validation is a pure read of the registry; all checks run even when an
 * earlier one fails.
 */
class GraphValidator
{
public:
    explicit GraphValidator(ValidatorConfig config = {});

    std::shared_ptr<GraphDiagnostics> validate(const NodeRegistry& registry) const;

private:
    void check_entry(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const;
    void check_cycles(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const;
    void check_terminal_reachability(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const;
    void check_entry_reachability(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const;
    void check_field_ownership(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const;

    ValidatorConfig m_config;
};

} // namespace stategraph
