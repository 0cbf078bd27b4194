/**
 * @file executor.hpp
 * @brief IExecutor interface and ExecutorConfig.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_store.hpp"
#include "stategraph/execution/execution_result.hpp"
#include "stategraph/execution/graph.hpp"

namespace stategraph
{

// Forward declaration
class NodeTask;
using NodeTaskPtr = std::shared_ptr<NodeTask>;

/**
 * @brief Configuration for executor behavior.
 */
struct ExecutorConfig
{
    /**
     * @brief Number of worker threads.
     * @details 0 means use std::thread::hardware_concurrency().
     *          1 means single-threaded execution.
     */
    size_t thread_count{0};

    /**
     * @brief Whether to collect per-node timing.
     */
    bool collect_timing{false};

    /**
     * @brief Whole-run timeout; zero means none.
     * @details When it expires no new nodes are launched; nodes already
     *          running are allowed to finish.
     */
    std::chrono::milliseconds timeout{0};
};

/**
 * @brief Interface for workflow executors.
 *
 * @details
 * IExecutor defines the contract for running a Graph against an initial state.
 * Implementations may be single-threaded or multi-threaded.
 *
 * @par Thread Safety
 * - execute() may be called from any thread, but not concurrently on the same
 *   executor; use one executor per concurrent run.
 * - request_stop() may be called from any thread during execution.
 * - stop_requested() may be called from any thread.
 */
class IExecutor
{
public:
    virtual ~IExecutor() = default;

    /**
     * @brief Run a workflow graph.
     * @param graph The validated graph to run.
     * @param initial_state Fields present before the entry node runs.
     * @return ExecutionResult with outcome details and the merged state.
     * @throws StateSchemaError if the initial state violates the graph's schema.
     */
    virtual ExecutionResult execute(GraphPtr graph, const StateDelta& initial_state) = 0;

    /**
     * @brief Request graceful stop of execution.
     *
     * @details
     * Sets a flag that workers check. Running nodes complete normally and
     * their deltas are merged; nodes not yet launched are skipped. This is
     * cooperative, not preemptive. The flag is not cleared by execute().
     */
    virtual void request_stop() = 0;

    virtual bool stop_requested() const noexcept = 0;
};

/**
 * @brief Base class for Executor implementations.
 *
 * @details
 * Provides common functionality for executors including:
 * - Stop request handling and failure halting
 * - Per-run StateStore ownership, launch snapshots and merges
 * - NodeTask creation and successor linkage
 * - Result assembly
 *
 * Derived classes implement the actual scheduling and worker management.
 */
class Executor : public IExecutor, public std::enable_shared_from_this<Executor>
{
public:
    explicit Executor(ExecutorConfig config);
    virtual ~Executor() = default;

    void request_stop() override;
    bool stop_requested() const noexcept override;

    /**
     * @brief Whether new nodes may still be launched in the current run.
     * @return False after a stop request, a node failure, or a timeout.
     */
    bool launch_allowed() const noexcept;

    /**
     * @brief Enqueue a ready task for execution.
     * @note Called by NodeTask when a successor becomes ready.
     */
    virtual void enqueue(NodeTaskPtr task) = 0;

    /**
     * @brief Notify that a task has finished (or declined to launch).
     * @note Called by NodeTask at the end of run(), after record_completion()
     *       and after its successors were enqueued.
     */
    virtual void notify_completion(NodeTask* task) = 0;

    /**
     * @brief Stop launching new nodes for the rest of the current run.
     * @note Called by NodeTask as soon as its node function fails.
     */
    void halt() noexcept;

    /**
     * @brief Record a node that completed or failed.
     * @note Thread-safe. Called by NodeTask before its successors are
     *       enqueued, so completed_nodes lists a node ahead of its dependents.
     */
    void record_completion(NodeTask* task);

    /**
     * @brief Snapshot visible to a node at launch: the initial state plus the
     *        deltas of its transitive dependencies.
     */
    StateSnapshot launch_snapshot(NodeIdx node_idx) const;

    /**
     * @brief Merge a node's delta into the run's StateStore.
     * @throws StateSchemaError if the delta violates the graph's schema.
     */
    void merge_delta(NodeIdx node_idx, const StateDelta& delta);

    const ExecutorConfig& config() const noexcept
    {
        return m_config;
    }

protected:
    /**
     * @brief Prepare per-run state: StateStore, NodeTasks and successor links.
     * @throws StateSchemaError if the initial state violates the graph's schema.
     */
    void begin_run(GraphPtr graph, const StateDelta& initial_state);

    /**
     * @brief Assemble the result of the current run and release per-run state.
     */
    ExecutionResult finish_run(std::chrono::steady_clock::time_point start_time);

    /**
     * @brief Stop launching because the configured timeout expired.
     */
    void mark_timed_out();

    ExecutorConfig m_config;
    std::atomic<bool> m_stop_requested{false};
    std::atomic<bool> m_halted{false};
    std::atomic<bool> m_timed_out{false};

    // Per-run state
    GraphPtr m_graph;
    std::unique_ptr<StateStore> m_store;
    std::vector<NodeTaskPtr> m_tasks;

private:
    std::mutex m_record_mutex;
    std::vector<NodeIdx> m_completion_order;
    std::vector<NodeIdx> m_failure_order;
};

} // namespace stategraph
