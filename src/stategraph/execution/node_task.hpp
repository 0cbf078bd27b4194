/**
 * @file node_task.hpp
 * @brief NodeTask wraps one graph node for execution within a run.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_enums.hpp"
#include "stategraph/execution/graph.hpp"

namespace stategraph
{

// Forward declarations
class Executor;
class NodeTask;

using NodeTaskPtr = std::shared_ptr<NodeTask>;
using NodeTaskWeakPtr = std::weak_ptr<NodeTask>;

/**
 * @brief Wraps a graph node for execution with pre/post orchestration.
 *
 * @details
 * NodeTask is the unit of work sent to workers. It handles:
 * - Pre-execution: launch check, state transition, launch snapshot, timing start
 * - User code execution: calling the node function
 * - Post-execution: output contract check, merge into the StateStore, state
 *   transition, timing, successor notification
 *
 * The delta is merged before successors are notified, so a successor never
 * launches before its predecessor's fields are visible. A failed node does not
 * notify its successors; they stay Pending for the rest of the run.
 *
 * @par Ownership Model
 * - Executor owns all NodeTask instances via shared_ptr for the duration of a run.
 * - NodeTasks hold weak_ptr to each other (successors).
 * - NodeTasks hold weak_ptr to Executor (for queue and store access).
 *
 * @par Thread Safety
 * - State and predecessor count use atomics (lock-free).
 * - Successor list is immutable after setup.
 * - Multiple threads may call decrement_predecessor_count() concurrently.
 */
class NodeTask : public std::enable_shared_from_this<NodeTask>
{
public:
    /**
     * @brief Construct a NodeTask.
     * @param graph The graph the node belongs to.
     * @param node_idx Index of this node in the graph.
     * @param executor Weak reference to the owning executor.
     */
    NodeTask(GraphPtr graph, NodeIdx node_idx, std::weak_ptr<Executor> executor);

    // Non-copyable, non-movable
    NodeTask(const NodeTask&) = delete;
    NodeTask(NodeTask&&) = delete;
    NodeTask& operator=(const NodeTask&) = delete;
    NodeTask& operator=(NodeTask&&) = delete;

    /**
     * @brief Add a successor that depends on this task.
     * @note Must be called during setup, before execution starts.
     */
    void add_successor(NodeTaskWeakPtr successor);

    /**
     * @brief Execute this task (called by a worker).
     *
     * @details
     * 1. If the executor no longer allows launches, leave the node Ready
     * 2. Transition Ready -> Running
     * 3. Call the node function with the launch snapshot
     * 4. Check declared outputs and merge the delta
     * 5. Transition to Completed, or to Failed capturing the exception
     * 6. On success, notify successors and enqueue the ready ones
     * 7. Notify the executor of completion
     */
    void run();

    NodeState state() const noexcept
    {
        return m_state.load(std::memory_order_acquire);
    }

    bool is_ready() const noexcept
    {
        return m_predecessors_remaining.load(std::memory_order_acquire) == 0;
    }

    /**
     * @brief Decrement predecessor count (called by a predecessor's run()).
     * @return True if this call made the task ready (count reached 0).
     */
    bool decrement_predecessor_count();

    /**
     * @brief True if run() executed the node function (Completed or Failed).
     */
    bool was_launched() const noexcept
    {
        NodeState s = state();
        return s == NodeState::Completed || s == NodeState::Failed || s == NodeState::Running;
    }

    std::exception_ptr exception() const noexcept
    {
        return m_exception;
    }

    /**
     * @brief Duration of the node function call and merge, or zero if not launched.
     */
    std::chrono::nanoseconds duration() const noexcept
    {
        return m_duration;
    }

    NodeIdx node_idx() const noexcept
    {
        return m_node_idx;
    }

    const std::string& name() const
    {
        return m_graph->node_names[m_node_idx];
    }

private:
    /**
     * @brief Reject deltas writing fields outside the declared outputs.
     * @throws OutputContractError
     */
    void check_outputs(const StateDelta& delta) const;

    void notify_successors(Executor& executor);

    // Configuration (immutable after construction)
    GraphPtr m_graph;
    NodeIdx m_node_idx;
    std::weak_ptr<Executor> m_executor;
    std::vector<NodeTaskWeakPtr> m_successors;

    // Execution state (atomic)
    std::atomic<NodeState> m_state{NodeState::Pending};
    std::atomic<size_t> m_predecessors_remaining;

    // Results (written once after execution)
    std::exception_ptr m_exception{};
    std::chrono::nanoseconds m_duration{0};
};

} // namespace stategraph
