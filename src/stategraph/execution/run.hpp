/**
 * @file run.hpp
 * @brief run(), the single entry point for executing a workflow.
 */
#pragma once
#include "stategraph/execution/executor.hpp"
#include "stategraph/execution/workflow_error.hpp"

namespace stategraph
{

/**
 * @brief Create the executor matching a configuration.
 * @return A SingleThreadedExecutor when thread_count is 1, otherwise a
 *         ThreadPoolExecutor.
 */
std::shared_ptr<Executor> make_executor(ExecutorConfig config = {});

/**
 * @brief Run a workflow graph to completion.
 *
 * @param graph The validated graph to run.
 * @param initial_state Fields present before the entry node runs.
 * @param config Executor configuration.
 * @return The final state once every predecessor of the terminal marker completed.
 * @throws WorkflowError if a node failed, or the run was stopped or timed out;
 *         it carries the state merged up to that point.
 * @throws StateSchemaError if the initial state violates the graph's schema.
 */
StateSnapshot run(const GraphPtr& graph,
                  const StateDelta& initial_state = {},
                  ExecutorConfig config = {});

/**
 * @brief Run a workflow graph with a caller-owned executor.
 * @details Allows the caller to keep the executor for request_stop().
 * @pre The executor is owned by a std::shared_ptr, as returned by
 *      make_single_threaded_executor(), make_thread_pool_executor() or
 *      make_executor(); otherwise execution throws std::bad_weak_ptr.
 */
StateSnapshot run(IExecutor& executor, const GraphPtr& graph, const StateDelta& initial_state = {});

/**
 * @brief Convert an unsuccessful ExecutionResult into a WorkflowError.
 * @pre !result.success
 */
WorkflowError to_workflow_error(const ExecutionResult& result);

} // namespace stategraph
