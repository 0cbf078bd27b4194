/**
 * @file graph_validator.cpp
 */
#include "stategraph/common/graph_validator.hpp"
#include "stategraph/common/node_registry.hpp"

#include <queue>

namespace stategraph
{

GraphValidator::GraphValidator(ValidatorConfig config)
    : m_config{config}
{
}

std::shared_ptr<GraphDiagnostics> GraphValidator::validate(const NodeRegistry& registry) const
{
    auto diagnostics = std::make_shared<GraphDiagnostics>();
    diagnostics->m_terminal = registry.terminal_name();
    if (auto entry = registry.entry())
    {
        diagnostics->m_entry = registry.node_name(*entry);
    }

    check_entry(registry, *diagnostics);
    check_cycles(registry, *diagnostics);
    check_terminal_reachability(registry, *diagnostics);
    check_entry_reachability(registry, *diagnostics);
    if (m_config.check_field_ownership)
    {
        check_field_ownership(registry, *diagnostics);
    }
    return diagnostics;
}

// ============================================================================
// Phase 1: entry
// ============================================================================

void GraphValidator::check_entry(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const
{
    auto entry = registry.entry();
    if (!entry || *entry >= registry.node_count())
    {
        DiagnosticItem item;
        item.severity = DiagnosticSeverity::Error;
        item.category = DiagnosticCategory::MissingEntry;
        item.message = "Graph has no entry node";
        diagnostics.m_errors.push_back(std::move(item));
    }
}

// ============================================================================
// Phase 2: cycle detection using Kahn's algorithm
// ============================================================================

void GraphValidator::check_cycles(const NodeRegistry& registry, GraphDiagnostics& diagnostics) const
{
    const size_t node_count = registry.node_count();
    if (node_count == 0)
    {
        return;
    }

    std::vector<size_t> in_degree(node_count, 0);
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        for (NodeIdx succ : registry.successors(n))
        {
            ++in_degree[succ];
        }
    }

    std::queue<NodeIdx> ready;
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (in_degree[n] == 0)
        {
            ready.push(n);
        }
    }

    size_t processed = 0;
    while (!ready.empty())
    {
        NodeIdx n = ready.front();
        ready.pop();
        ++processed;

        for (NodeIdx succ : registry.successors(n))
        {
            --in_degree[succ];
            if (in_degree[succ] == 0)
            {
                ready.push(succ);
            }
        }
    }

    if (processed == node_count)
    {
        return;
    }

    // Nodes left with in-degree > 0 are on a cycle or downstream of one.
    // Peel the downstream ones: repeatedly drop remaining nodes with no
    // remaining successor.
    std::vector<bool> remaining(node_count, false);
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        remaining[n] = in_degree[n] > 0;
    }

    std::vector<size_t> out_degree(node_count, 0);
    std::vector<std::vector<NodeIdx>> predecessors(node_count);
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (!remaining[n])
        {
            continue;
        }
        for (NodeIdx succ : registry.successors(n))
        {
            if (remaining[succ])
            {
                ++out_degree[n];
                predecessors[succ].push_back(n);
            }
        }
    }

    std::queue<NodeIdx> sinks;
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (remaining[n] && out_degree[n] == 0)
        {
            sinks.push(n);
        }
    }
    while (!sinks.empty())
    {
        NodeIdx n = sinks.front();
        sinks.pop();
        remaining[n] = false;
        for (NodeIdx pred : predecessors[n])
        {
            if (remaining[pred] && --out_degree[pred] == 0)
            {
                sinks.push(pred);
            }
        }
    }

    DiagnosticItem item;
    item.severity = DiagnosticSeverity::Error;
    item.category = DiagnosticCategory::Cycle;
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (remaining[n])
        {
            item.involved_nodes.push_back(registry.node_name(n));
        }
    }
    item.message = CycleError(item.involved_nodes).what();
    diagnostics.m_errors.push_back(std::move(item));
}

// ============================================================================
// Phase 3: every node reaches the terminal marker
// ============================================================================

void GraphValidator::check_terminal_reachability(const NodeRegistry& registry,
                                                 GraphDiagnostics& diagnostics) const
{
    const size_t node_count = registry.node_count();

    std::vector<std::vector<NodeIdx>> predecessors(node_count);
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        for (NodeIdx succ : registry.successors(n))
        {
            predecessors[succ].push_back(n);
        }
    }

    std::vector<bool> reaches_terminal(node_count, false);
    std::queue<NodeIdx> frontier;
    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (registry.has_terminal_edge(n))
        {
            reaches_terminal[n] = true;
            frontier.push(n);
        }
    }
    while (!frontier.empty())
    {
        NodeIdx n = frontier.front();
        frontier.pop();
        for (NodeIdx pred : predecessors[n])
        {
            if (!reaches_terminal[pred])
            {
                reaches_terminal[pred] = true;
                frontier.push(pred);
            }
        }
    }

    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (!reaches_terminal[n])
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::UnreachableTerminal;
            item.involved_nodes.push_back(registry.node_name(n));
            item.message = UnreachableTerminalError(registry.node_name(n),
                                                    registry.terminal_name()).what();
            diagnostics.m_errors.push_back(std::move(item));
        }
    }
}

// ============================================================================
// Phase 4: every node is reachable from the entry
// ============================================================================

void GraphValidator::check_entry_reachability(const NodeRegistry& registry,
                                              GraphDiagnostics& diagnostics) const
{
    auto entry = registry.entry();
    const size_t node_count = registry.node_count();
    if (!entry || *entry >= node_count)
    {
        return;
    }

    std::vector<bool> reached(node_count, false);
    std::queue<NodeIdx> frontier;
    reached[*entry] = true;
    frontier.push(*entry);
    while (!frontier.empty())
    {
        NodeIdx n = frontier.front();
        frontier.pop();
        for (NodeIdx succ : registry.successors(n))
        {
            if (!reached[succ])
            {
                reached[succ] = true;
                frontier.push(succ);
            }
        }
    }

    for (NodeIdx n = 0; n < node_count; ++n)
    {
        if (!reached[n])
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::UnreachableNode;
            item.involved_nodes.push_back(registry.node_name(n));
            item.message = UnreachableNodeError(registry.node_name(n),
                                                registry.node_name(*entry)).what();
            diagnostics.m_errors.push_back(std::move(item));
        }
    }
}

// ============================================================================
// Phase 5: single producer per declared output field
// ============================================================================

void GraphValidator::check_field_ownership(const NodeRegistry& registry,
                                           GraphDiagnostics& diagnostics) const
{
    std::map<std::string, std::vector<std::string>> producers;
    for (NodeIdx n = 0; n < registry.node_count(); ++n)
    {
        const auto& outputs = registry.declared_outputs(n);
        if (outputs.empty())
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Warning;
            item.category = DiagnosticCategory::UndeclaredOutputs;
            item.involved_nodes.push_back(registry.node_name(n));
            item.message = "Node '" + registry.node_name(n) +
                           "' declares no outputs; its field ownership is not checked";
            diagnostics.m_warnings.push_back(std::move(item));
            continue;
        }
        for (const auto& field : outputs)
        {
            auto& owners = producers[field];
            if (std::find(owners.begin(), owners.end(), registry.node_name(n)) == owners.end())
            {
                owners.push_back(registry.node_name(n));
            }
        }
    }

    for (const auto& [field, owners] : producers)
    {
        if (owners.size() > 1)
        {
            DiagnosticItem item;
            item.severity = DiagnosticSeverity::Error;
            item.category = DiagnosticCategory::FieldOwnershipConflict;
            item.field = field;
            item.involved_nodes = owners;
            item.message = FieldOwnershipConflictError(field, owners).what();
            diagnostics.m_errors.push_back(std::move(item));
        }
    }
}

} // namespace stategraph
