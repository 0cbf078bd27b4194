#include "stategraph/execution/single_threaded_executor.hpp"
#include "stategraph/execution/node_task.hpp"

namespace stategraph
{

SingleThreadedExecutor::SingleThreadedExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

ExecutionResult SingleThreadedExecutor::execute(GraphPtr graph, const StateDelta& initial_state)
{
    auto start_time = std::chrono::steady_clock::now();
    const bool has_deadline = m_config.timeout.count() > 0;
    const auto deadline = start_time + m_config.timeout;

    while (!m_ready_queue.empty()) m_ready_queue.pop();

    begin_run(std::move(graph), initial_state);

    // Seed the ready queue with the entry node
    enqueue(m_tasks[m_graph->entry]);

    // Process queue until empty; tasks dequeued after a stop decline to launch
    while (!m_ready_queue.empty())
    {
        if (has_deadline && std::chrono::steady_clock::now() >= deadline)
        {
            mark_timed_out();
        }

        auto task = m_ready_queue.front();
        m_ready_queue.pop();
        task->run();
    }

    return finish_run(start_time);
}

void SingleThreadedExecutor::enqueue(NodeTaskPtr task)
{
    m_ready_queue.push(std::move(task));
}

void SingleThreadedExecutor::notify_completion(NodeTask*)
{
    // The run loop drains the queue; there is no outstanding count to track
}

} // namespace stategraph
