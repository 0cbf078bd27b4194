#include "stategraph/common/node_registry.hpp"

#include <queue>
#include <spdlog/spdlog.h>

namespace stategraph
{

NodeRegistry::NodeRegistry(std::string terminal_name)
    : m_terminal_name{std::move(terminal_name)}
{
    if (m_terminal_name.empty())
    {
        throw GraphError(GraphErrorCode::ReservedName, "Terminal marker name must not be empty");
    }
}

void NodeRegistry::register_node(const std::string& name,
                                 NodeFunction fn,
                                 const std::vector<std::string>& depends_on,
                                 std::vector<std::string> outputs)
{
    if (name.empty())
    {
        throw GraphError(GraphErrorCode::ReservedName, "Node name must not be empty");
    }
    if (name == m_terminal_name)
    {
        throw GraphError(GraphErrorCode::ReservedName,
                         "Node name '" + name + "' is reserved for the terminal marker");
    }
    if (contains(name))
    {
        throw DuplicateNodeError(name);
    }
    if (!fn)
    {
        throw GraphError(GraphErrorCode::InvariantViolation,
                         "Node '" + name + "' has no function");
    }

    // Resolve every dependency before touching any bookkeeping
    std::vector<NodeIdx> dependency_indices;
    dependency_indices.reserve(depends_on.size());
    for (const auto& dependency : depends_on)
    {
        dependency_indices.push_back(index_of(dependency));
    }

    invalidate();
    const NodeIdx idx = m_names.size();
    m_names.push_back(name);
    m_functions.push_back(std::move(fn));
    m_outputs.push_back(std::move(outputs));
    m_successors.emplace_back();
    m_terminal_edges.push_back(false);
    m_indices.emplace(name, idx);

    for (NodeIdx dependency : dependency_indices)
    {
        auto& succs = m_successors[dependency];
        if (std::find(succs.begin(), succs.end(), idx) == succs.end())
        {
            succs.push_back(idx);
        }
    }
}

void NodeRegistry::register_node(const NodePtr& node, const std::vector<std::string>& depends_on)
{
    if (!node)
    {
        throw GraphError(GraphErrorCode::InvariantViolation, "Cannot register a null node");
    }
    NodeFunction fn = [node](const StateSnapshot& state) {
        return node->execute(state);
    };
    register_node(node->name(), std::move(fn), depends_on, node->outputs());
}

void NodeRegistry::add_edge(const std::string& from, const std::string& to)
{
    NodeIdx from_idx = index_of(from);
    if (to == m_terminal_name)
    {
        invalidate();
        m_terminal_edges[from_idx] = true;
        return;
    }
    NodeIdx to_idx = index_of(to);

    auto& succs = m_successors[from_idx];
    if (std::find(succs.begin(), succs.end(), to_idx) == succs.end())
    {
        invalidate();
        succs.push_back(to_idx);
    }
}

void NodeRegistry::set_entry(const std::string& name)
{
    NodeIdx idx = index_of(name);
    invalidate();
    m_entry = idx;
}

void NodeRegistry::set_schema(StateSchema schema)
{
    m_schema = std::make_shared<StateSchema>(std::move(schema));
}

std::shared_ptr<const GraphDiagnostics> NodeRegistry::validate(ValidatorConfig config) const
{
    if (m_cached_diagnostics &&
        m_cached_config.check_field_ownership == config.check_field_ownership)
    {
        return m_cached_diagnostics;
    }
    GraphValidator validator(config);
    m_cached_diagnostics = validator.validate(*this);
    m_cached_config = config;
    return m_cached_diagnostics;
}

std::shared_ptr<const Graph> NodeRegistry::build(ValidatorConfig config) const
{
    // Step 1: validate
    auto diagnostics = validate(config);
    for (const auto& warning : diagnostics->warnings())
    {
        SPDLOG_DEBUG("Graph validation warning: {}", warning.message);
    }
    if (diagnostics->has_errors())
    {
        for (const auto& error : diagnostics->errors())
        {
            SPDLOG_ERROR("Graph validation error: {}", error.message);
        }
        diagnostics->throw_if_invalid();
    }

    const size_t num_nodes = m_names.size();
    auto graph = std::make_shared<Graph>();

    // Step 2: copy node metadata
    graph->node_names = m_names;
    graph->functions = m_functions;
    graph->declared_outputs = m_outputs;
    graph->node_indices = m_indices;
    graph->successors = m_successors;
    graph->terminal_predecessors = m_terminal_edges;
    graph->entry = *m_entry;
    graph->terminal_name = m_terminal_name;
    graph->schema = m_schema;
    graph->diagnostics = diagnostics;

    // Step 3: predecessor counts and lists (successor lists hold no duplicates)
    graph->predecessor_counts.assign(num_nodes, 0);
    std::vector<std::vector<NodeIdx>> predecessors(num_nodes);
    for (NodeIdx n = 0; n < num_nodes; ++n)
    {
        for (NodeIdx succ : m_successors[n])
        {
            ++graph->predecessor_counts[succ];
            predecessors[succ].push_back(n);
        }
    }

    // Step 4: topological order (the graph is known to be acyclic here)
    std::vector<size_t> in_degree = graph->predecessor_counts;
    std::queue<NodeIdx> ready;
    for (NodeIdx n = 0; n < num_nodes; ++n)
    {
        if (in_degree[n] == 0)
        {
            ready.push(n);
        }
    }
    graph->topological_order.reserve(num_nodes);
    while (!ready.empty())
    {
        NodeIdx n = ready.front();
        ready.pop();
        graph->topological_order.push_back(n);
        for (NodeIdx succ : m_successors[n])
        {
            if (--in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    // Step 5: transitive dependencies, accumulated in topological order
    graph->visible_producers.assign(num_nodes, std::vector<bool>(num_nodes, false));
    for (NodeIdx n : graph->topological_order)
    {
        auto& visible = graph->visible_producers[n];
        for (NodeIdx pred : predecessors[n])
        {
            visible[pred] = true;
            const auto& inherited = graph->visible_producers[pred];
            for (NodeIdx p = 0; p < num_nodes; ++p)
            {
                if (inherited[p])
                {
                    visible[p] = true;
                }
            }
        }
    }

    SPDLOG_DEBUG("Built graph with {} nodes, entry '{}', terminal '{}'",
                 num_nodes, m_names[graph->entry], m_terminal_name);
    return graph;
}

NodeIdx NodeRegistry::index_of(const std::string& name) const
{
    auto it = m_indices.find(name);
    if (it == m_indices.end())
    {
        throw UnknownNodeError(name);
    }
    return it->second;
}

void NodeRegistry::invalidate() noexcept
{
    m_cached_diagnostics.reset();
}

} // namespace stategraph
