#include "stategraph/execution/run.hpp"
#include "stategraph/execution/single_threaded_executor.hpp"
#include "stategraph/execution/thread_pool_executor.hpp"

namespace stategraph
{

std::shared_ptr<Executor> make_executor(ExecutorConfig config)
{
    if (config.thread_count == 1)
    {
        return make_single_threaded_executor(std::move(config));
    }
    return make_thread_pool_executor(std::move(config));
}

StateSnapshot run(const GraphPtr& graph, const StateDelta& initial_state, ExecutorConfig config)
{
    auto executor = make_executor(std::move(config));
    return run(*executor, graph, initial_state);
}

StateSnapshot run(IExecutor& executor, const GraphPtr& graph, const StateDelta& initial_state)
{
    if (!graph)
    {
        throw std::invalid_argument("run() requires a graph");
    }
    ExecutionResult result = executor.execute(graph, initial_state);
    if (!result.success)
    {
        throw to_workflow_error(result);
    }
    return result.state;
}

WorkflowError to_workflow_error(const ExecutionResult& result)
{
    if (!result.failed_nodes.empty())
    {
        return WorkflowError(WorkflowErrorKind::NodeFailed,
                             result.failed_nodes.front(),
                             result.errors.front(),
                             result.state,
                             "Workflow failed at node '" + result.failed_nodes.front() +
                                 "': " + result.error_messages.front());
    }
    if (result.timed_out)
    {
        return WorkflowError(WorkflowErrorKind::TimedOut, {}, nullptr, result.state,
                             "Workflow timed out: " + result.summary());
    }
    return WorkflowError(WorkflowErrorKind::Stopped, {}, nullptr, result.state,
                         "Workflow stopped: " + result.summary());
}

} // namespace stategraph
