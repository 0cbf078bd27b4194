/**
 * @file node_registry.hpp
 * @brief NodeRegistry records nodes and dependency edges and builds a Graph.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_diagnostics.hpp"
#include "stategraph/common/graph_enums.hpp"
#include "stategraph/common/graph_exceptions.hpp"
#include "stategraph/common/graph_validator.hpp"
#include "stategraph/common/node.hpp"
#include "stategraph/common/state_schema.hpp"
#include "stategraph/execution/graph.hpp"

namespace stategraph
{

/**
 * @brief Mutable registry of named nodes and their dependency edges.
 *
 * @details
 * NodeRegistry is the construction side of a workflow. Nodes are registered by
 * name, edges are declared between names, one node is designated the entry,
 * and build() validates the result and produces an immutable Graph.
 *
 * @par Usage
 * 1. register_node() each node, optionally listing nodes it depends on.
 * 2. add_edge() any further dependencies, including edges into the terminal marker.
 * 3. set_entry() the node that starts the workflow.
 * 4. Optionally set_schema() to type-check state fields.
 * 5. build() to validate and produce a Graph.
 *
 * @par Validation caching
 * validate() caches its diagnostics until the next mutation, so repeated
 * validation of an unchanged registry returns the same result object.
 *
 * @par Thread Safety
 * - No internal synchronization.
 * - Mutation must finish before build(); the built Graph is independent of
 *   the registry and safe to share.
 */
class NodeRegistry
{
public:
    /**
     * @brief Construct a NodeRegistry.
     * @param terminal_name Name of the terminal marker; edges to it end a path.
     */
    explicit NodeRegistry(std::string terminal_name = END);

    /**
     * @brief Register a node.
     * @param name Unique node name.
     * @param fn The node's work.
     * @param depends_on Already-registered nodes this node depends on.
     * @param outputs Fields the node produces; empty leaves them undeclared.
     * @throw DuplicateNodeError if name is already registered.
     * @throw UnknownNodeError if a dependency is not registered.
     * @throw GraphError with `ReservedName` if name is empty or the terminal
     *        marker, or `InvariantViolation` if fn is empty.
     */
    void register_node(const std::string& name,
                       NodeFunction fn,
                       const std::vector<std::string>& depends_on = {},
                       std::vector<std::string> outputs = {});

    /**
     * @brief Register a class-based node under its own name.
     * @note The registry keeps a reference to the node for the lifetime of any
     *       Graph built from it.
     */
    void register_node(const NodePtr& node, const std::vector<std::string>& depends_on = {});

    /**
     * @brief Declare that `to` depends on `from`.
     * @param from Producer node name.
     * @param to Consumer node name, or the terminal marker.
     * @throw UnknownNodeError if either endpoint is not registered.
     * @note Duplicate edges are recorded once.
     */
    void add_edge(const std::string& from, const std::string& to);

    /**
     * @brief Set the entry node.
     * @throw UnknownNodeError if name is not registered.
     */
    void set_entry(const std::string& name);

    /**
     * @brief Attach a schema checked against the initial state and every delta.
     */
    void set_schema(StateSchema schema);

    /**
     * @brief Validate the registered graph.
     * @return Diagnostics; cached until the registry is mutated or the config changes.
     */
    std::shared_ptr<const GraphDiagnostics> validate(ValidatorConfig config = {}) const;

    /**
     * @brief Validate and produce an immutable Graph.
     * @throw MissingEntryError, CycleError, UnreachableTerminalError,
     *        UnreachableNodeError or FieldOwnershipConflictError for the first
     *        validation error.
     */
    std::shared_ptr<const Graph> build(ValidatorConfig config = {}) const;

    size_t node_count() const noexcept
    {
        return m_names.size();
    }

    bool contains(const std::string& name) const
    {
        return m_indices.count(name) > 0;
    }

    const std::string& node_name(NodeIdx idx) const
    {
        return m_names.at(idx);
    }

    const std::vector<NodeIdx>& successors(NodeIdx idx) const
    {
        return m_successors.at(idx);
    }

    bool has_terminal_edge(NodeIdx idx) const
    {
        return m_terminal_edges.at(idx);
    }

    const std::vector<std::string>& declared_outputs(NodeIdx idx) const
    {
        return m_outputs.at(idx);
    }

    std::optional<NodeIdx> entry() const noexcept
    {
        return m_entry;
    }

    const std::string& terminal_name() const noexcept
    {
        return m_terminal_name;
    }

private:
    NodeIdx index_of(const std::string& name) const;
    void invalidate() noexcept;

    std::string m_terminal_name;
    std::vector<std::string> m_names{};
    std::vector<NodeFunction> m_functions{};
    std::vector<std::vector<std::string>> m_outputs{};
    std::vector<std::vector<NodeIdx>> m_successors{};
    std::vector<bool> m_terminal_edges{};
    std::unordered_map<std::string, NodeIdx> m_indices{};
    std::optional<NodeIdx> m_entry{};
    std::shared_ptr<const StateSchema> m_schema{};

    mutable std::shared_ptr<const GraphDiagnostics> m_cached_diagnostics{};
    mutable ValidatorConfig m_cached_config{};
};

} // namespace stategraph
