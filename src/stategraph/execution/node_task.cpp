#include "stategraph/execution/node_task.hpp"
#include "stategraph/execution/executor.hpp"
#include "stategraph/execution/workflow_error.hpp"

#include <spdlog/spdlog.h>

namespace stategraph
{

NodeTask::NodeTask(GraphPtr graph, NodeIdx node_idx, std::weak_ptr<Executor> executor)
    : m_graph{std::move(graph)}
    , m_node_idx{node_idx}
    , m_executor{std::move(executor)}
    , m_predecessors_remaining{m_graph->predecessor_counts[node_idx]}
{
    // The entry node has no predecessors and starts Ready
    if (m_predecessors_remaining.load(std::memory_order_relaxed) == 0)
    {
        m_state.store(NodeState::Ready, std::memory_order_release);
    }
}

void NodeTask::add_successor(NodeTaskWeakPtr successor)
{
    m_successors.push_back(std::move(successor));
}

void NodeTask::run()
{
    auto executor = m_executor.lock();
    if (!executor)
    {
        // Executor gone, abort silently
        return;
    }

    // No new launches after a failure, a stop request or a timeout
    if (!executor->launch_allowed())
    {
        executor->notify_completion(this);
        return;
    }

    NodeState expected = NodeState::Ready;
    if (!m_state.compare_exchange_strong(expected, NodeState::Running,
                                         std::memory_order_acq_rel))
    {
        executor->notify_completion(this);
        return;
    }

    SPDLOG_DEBUG("Launching node '{}'", name());
    auto start_time = std::chrono::steady_clock::now();

    try
    {
        StateSnapshot snapshot = executor->launch_snapshot(m_node_idx);
        StateDelta delta = m_graph->functions[m_node_idx](snapshot);
        check_outputs(delta);
        executor->merge_delta(m_node_idx, delta);
        m_state.store(NodeState::Completed, std::memory_order_release);
    }
    catch (...)
    {
        // Stop further launches before any bookkeeping
        executor->halt();
        m_exception = std::current_exception();
        m_state.store(NodeState::Failed, std::memory_order_release);
    }

    auto end_time = std::chrono::steady_clock::now();
    m_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(end_time - start_time);

    executor->record_completion(this);
    if (state() == NodeState::Completed)
    {
        SPDLOG_DEBUG("Node '{}' completed", name());
        notify_successors(*executor);
    }

    executor->notify_completion(this);
}

bool NodeTask::decrement_predecessor_count()
{
    size_t prev = m_predecessors_remaining.fetch_sub(1, std::memory_order_acq_rel);
    if (prev == 1)
    {
        // We were the last predecessor - task is now ready
        m_state.store(NodeState::Ready, std::memory_order_release);
        return true;
    }
    return false;
}

void NodeTask::check_outputs(const StateDelta& delta) const
{
    const auto& declared = m_graph->declared_outputs[m_node_idx];
    if (declared.empty())
    {
        return;
    }
    for (const auto& [field, value] : delta)
    {
        if (std::find(declared.begin(), declared.end(), field) == declared.end())
        {
            throw OutputContractError(name(), field);
        }
    }
}

void NodeTask::notify_successors(Executor& executor)
{
    for (auto& weak_succ : m_successors)
    {
        if (auto succ = weak_succ.lock())
        {
            if (succ->decrement_predecessor_count())
            {
                executor.enqueue(succ);
            }
        }
    }
}

} // namespace stategraph
