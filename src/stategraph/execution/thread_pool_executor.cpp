#include "stategraph/execution/thread_pool_executor.hpp"
#include "stategraph/execution/node_task.hpp"

#include <spdlog/spdlog.h>

namespace stategraph
{

ThreadPoolExecutor::ThreadPoolExecutor(ExecutorConfig config)
    : Executor(std::move(config))
{}

size_t ThreadPoolExecutor::worker_count() const noexcept
{
    if (m_config.thread_count > 0)
    {
        return m_config.thread_count;
    }
    size_t hw = std::thread::hardware_concurrency();
    return hw > 0 ? hw : 2;
}

ExecutionResult ThreadPoolExecutor::execute(GraphPtr graph, const StateDelta& initial_state)
{
    auto start_time = std::chrono::steady_clock::now();

    begin_run(std::move(graph), initial_state);
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_ready_queue.clear();
        m_outstanding = 0;
        m_shutdown = false;
    }

    const size_t num_workers = std::min(worker_count(), std::max<size_t>(m_graph->node_count(), 1));
    SPDLOG_DEBUG("Starting {} worker threads", num_workers);

    std::vector<std::thread> workers;
    workers.reserve(num_workers);
    try
    {
        for (size_t i = 0; i < num_workers; ++i)
        {
            workers.emplace_back([this] { worker_loop(); });
        }

        // Seed the ready queue with the entry node
        enqueue(m_tasks[m_graph->entry]);

        std::unique_lock<std::mutex> lock(m_mutex);
        auto all_done = [this] { return m_outstanding == 0; };
        if (m_config.timeout.count() > 0)
        {
            if (!m_done_cv.wait_until(lock, start_time + m_config.timeout, all_done))
            {
                mark_timed_out();
                // Running nodes are not interrupted; wait for them to finish
                m_done_cv.wait(lock, all_done);
            }
        }
        else
        {
            m_done_cv.wait(lock, all_done);
        }
    }
    catch (...)
    {
        shutdown_workers(workers);
        throw;
    }

    shutdown_workers(workers);
    return finish_run(start_time);
}

void ThreadPoolExecutor::enqueue(NodeTaskPtr task)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        ++m_outstanding;
        m_ready_queue.push_back(std::move(task));
    }
    m_work_cv.notify_one();
}

void ThreadPoolExecutor::notify_completion(NodeTask*)
{
    bool done = false;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        --m_outstanding;
        done = m_outstanding == 0;
    }
    if (done)
    {
        m_done_cv.notify_all();
    }
}

void ThreadPoolExecutor::worker_loop()
{
    for (;;)
    {
        NodeTaskPtr task;
        {
            std::unique_lock<std::mutex> lock(m_mutex);
            m_work_cv.wait(lock, [this] { return m_shutdown || !m_ready_queue.empty(); });
            if (m_ready_queue.empty())
            {
                return;
            }
            task = std::move(m_ready_queue.front());
            m_ready_queue.pop_front();
        }
        task->run();
    }
}

void ThreadPoolExecutor::shutdown_workers(std::vector<std::thread>& workers)
{
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        m_shutdown = true;
    }
    m_work_cv.notify_all();
    for (auto& worker : workers)
    {
        if (worker.joinable())
        {
            worker.join();
        }
    }
    workers.clear();
}

} // namespace stategraph
