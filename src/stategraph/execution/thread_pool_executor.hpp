/**
 * @file thread_pool_executor.hpp
 * @brief ThreadPoolExecutor runs independent ready nodes concurrently.
 */
#pragma once
#include "stategraph/execution/executor.hpp"
#include <condition_variable>
#include <deque>
#include <thread>

namespace stategraph
{

/**
 * @brief Executor that runs ready nodes on a bounded pool of worker threads.
 *
 * @details
 * Workers are started for each execute() call and joined before it returns.
 * Every node whose dependencies have all completed and merged is queued as
 * soon as the last dependency finishes, so fan-out branches run concurrently
 * up to the pool size.
 *
 * The run is complete when no task is queued or running. After a node failure,
 * a stop request or a timeout, queued tasks decline to launch, running nodes
 * finish, and their deltas are merged.
 *
 * @par Thread Safety
 * - execute() must not be called concurrently on the same executor.
 * - request_stop() can be called from any thread.
 */
class ThreadPoolExecutor : public Executor
{
public:
    /**
     * @brief Construct a thread pool executor.
     * @param config Configuration; thread_count 0 uses hardware concurrency.
     */
    explicit ThreadPoolExecutor(ExecutorConfig config = {});

    ExecutionResult execute(GraphPtr graph, const StateDelta& initial_state) override;

    void enqueue(NodeTaskPtr task) override;

    void notify_completion(NodeTask* task) override;

    /**
     * @brief Number of worker threads execute() starts.
     */
    size_t worker_count() const noexcept;

private:
    void worker_loop();
    void shutdown_workers(std::vector<std::thread>& workers);

    std::mutex m_mutex;
    std::condition_variable m_work_cv;
    std::condition_variable m_done_cv;
    std::deque<NodeTaskPtr> m_ready_queue;
    size_t m_outstanding{0};
    bool m_shutdown{false};
};

/**
 * @brief Factory function to create a ThreadPoolExecutor.
 */
inline std::shared_ptr<ThreadPoolExecutor> make_thread_pool_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<ThreadPoolExecutor>(std::move(config));
}

} // namespace stategraph
