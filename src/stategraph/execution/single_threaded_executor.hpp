/**
 * @file single_threaded_executor.hpp
 * @brief SingleThreadedExecutor for sequential workflow execution.
 */
#pragma once
#include "stategraph/execution/executor.hpp"
#include <queue>

namespace stategraph
{

/**
 * @brief Single-threaded executor for debugging and testing.
 *
 * @details
 * Runs nodes one at a time on the calling thread, in FIFO order of becoming
 * ready. Useful for:
 * - Debugging node functions without thread complexity
 * - Deterministic completion order in tests
 * - Reference behavior for verifying the thread pool executor
 *
 * @par Thread Safety
 * - execute() is not thread-safe; call from one thread only.
 * - request_stop() can be called from any thread, including from inside a node.
 */
class SingleThreadedExecutor : public Executor
{
public:
    /**
     * @brief Construct a single-threaded executor.
     * @param config Configuration (thread_count ignored, always 1).
     */
    explicit SingleThreadedExecutor(ExecutorConfig config = {});

    ExecutionResult execute(GraphPtr graph, const StateDelta& initial_state) override;

    void enqueue(NodeTaskPtr task) override;

    void notify_completion(NodeTask* task) override;

private:
    // Ready queue (FIFO for fairness)
    std::queue<NodeTaskPtr> m_ready_queue;
};

/**
 * @brief Factory function to create a SingleThreadedExecutor.
 */
inline std::shared_ptr<SingleThreadedExecutor> make_single_threaded_executor(
    ExecutorConfig config = {})
{
    return std::make_shared<SingleThreadedExecutor>(std::move(config));
}

} // namespace stategraph
