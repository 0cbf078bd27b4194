#include "stategraph/execution/executor.hpp"
#include "stategraph/execution/node_task.hpp"

#include <spdlog/spdlog.h>

namespace stategraph
{

namespace
{

std::string describe_exception(const std::exception_ptr& error)
{
    if (!error)
    {
        return "Unknown error";
    }
    try
    {
        std::rethrow_exception(error);
    }
    catch (const std::exception& e)
    {
        return e.what();
    }
    catch (...)
    {
        return "Unknown exception";
    }
}

} // namespace

Executor::Executor(ExecutorConfig config)
    : m_config{std::move(config)}
{}

void Executor::request_stop()
{
    m_stop_requested.store(true, std::memory_order_release);
}

bool Executor::stop_requested() const noexcept
{
    return m_stop_requested.load(std::memory_order_acquire);
}

bool Executor::launch_allowed() const noexcept
{
    return !m_stop_requested.load(std::memory_order_acquire) &&
           !m_halted.load(std::memory_order_acquire) &&
           !m_timed_out.load(std::memory_order_acquire);
}

void Executor::halt() noexcept
{
    m_halted.store(true, std::memory_order_release);
}

StateSnapshot Executor::launch_snapshot(NodeIdx node_idx) const
{
    return m_store->snapshot_visible_to(m_graph->visible_producers[node_idx]);
}

void Executor::merge_delta(NodeIdx node_idx, const StateDelta& delta)
{
    m_store->merge(delta, node_idx);
}

void Executor::begin_run(GraphPtr graph, const StateDelta& initial_state)
{
    // Reset per-run state (but not the stop flag - that's set externally)
    m_halted.store(false, std::memory_order_release);
    m_timed_out.store(false, std::memory_order_release);
    {
        std::lock_guard<std::mutex> lock(m_record_mutex);
        m_completion_order.clear();
        m_failure_order.clear();
    }

    m_store = std::make_unique<StateStore>(initial_state, graph->schema);
    m_graph = std::move(graph);

    // Create one task per node, then wire successor relationships
    m_tasks.clear();
    m_tasks.reserve(m_graph->node_count());
    auto self = shared_from_this();
    for (NodeIdx n = 0; n < m_graph->node_count(); ++n)
    {
        m_tasks.push_back(std::make_shared<NodeTask>(m_graph, n, self));
    }
    for (NodeIdx n = 0; n < m_graph->node_count(); ++n)
    {
        for (NodeIdx succ : m_graph->successors[n])
        {
            m_tasks[n]->add_successor(m_tasks[succ]);
        }
    }

    SPDLOG_DEBUG("Starting run of {} nodes from entry '{}'",
                 m_graph->node_count(), m_graph->node_names[m_graph->entry]);
}

void Executor::record_completion(NodeTask* task)
{
    NodeState state = task->state();
    if (state == NodeState::Failed)
    {
        halt();
    }
    std::lock_guard<std::mutex> lock(m_record_mutex);
    if (state == NodeState::Completed)
    {
        m_completion_order.push_back(task->node_idx());
    }
    else if (state == NodeState::Failed)
    {
        if (m_failure_order.empty())
        {
            SPDLOG_ERROR("Node '{}' failed, no further nodes will be launched: {}",
                         task->name(), describe_exception(task->exception()));
        }
        else
        {
            SPDLOG_ERROR("Node '{}' failed: {}", task->name(), describe_exception(task->exception()));
        }
        m_failure_order.push_back(task->node_idx());
    }
}

void Executor::mark_timed_out()
{
    if (!m_timed_out.exchange(true, std::memory_order_acq_rel))
    {
        SPDLOG_WARN("Run exceeded timeout of {} ms, no further nodes will be launched",
                    m_config.timeout.count());
    }
}

ExecutionResult Executor::finish_run(std::chrono::steady_clock::time_point start_time)
{
    ExecutionResult result;
    result.state = m_store->snapshot();
    result.stopped = stop_requested() || m_timed_out.load(std::memory_order_acquire);
    result.timed_out = m_timed_out.load(std::memory_order_acquire);

    std::lock_guard<std::mutex> lock(m_record_mutex);
    for (NodeIdx n : m_completion_order)
    {
        result.completed_nodes.push_back(m_graph->node_names[n]);
    }
    for (NodeIdx n : m_failure_order)
    {
        result.failed_nodes.push_back(m_graph->node_names[n]);
        result.errors.push_back(m_tasks[n]->exception());
        result.error_messages.push_back(describe_exception(m_tasks[n]->exception()));
    }

    // The terminal marker is reached once all of its predecessors completed
    bool terminal_reached = true;
    for (const auto& task : m_tasks)
    {
        if (!task->was_launched())
        {
            result.skipped_nodes.push_back(task->name());
        }
        else if (m_config.collect_timing)
        {
            result.node_durations[task->name()] = task->duration();
        }
        if (m_graph->terminal_predecessors[task->node_idx()] &&
            task->state() != NodeState::Completed)
        {
            terminal_reached = false;
        }
    }
    result.success = result.failed_nodes.empty() && terminal_reached;

    auto end_time = std::chrono::steady_clock::now();
    result.total_duration = std::chrono::duration_cast<std::chrono::nanoseconds>(
        end_time - start_time);

    if (result.success)
    {
        SPDLOG_INFO("{}", result.summary());
    }
    else
    {
        SPDLOG_WARN("{}", result.summary());
    }

    // Clear task references
    m_tasks.clear();
    m_store.reset();
    m_graph.reset();

    return result;
}

} // namespace stategraph
