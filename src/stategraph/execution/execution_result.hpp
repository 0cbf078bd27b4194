/**
 * @file execution_result.hpp
 * @brief Definition of ExecutionResult returned by Executor::execute().
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_snapshot.hpp"

namespace stategraph
{

/**
 * @brief Result of running a workflow graph.
 *
 * @details
 * ExecutionResult captures the outcome of one run:
 * - Success/failure status and whether the run was stopped or timed out
 * - The state as merged by the end of the run (final or partial)
 * - Which nodes completed, failed, or were never launched
 * - Timing information (if collected)
 */
struct ExecutionResult
{
    /**
     * @brief Overall success status.
     * @details True if every predecessor of the terminal marker completed.
     */
    bool success{true};

    /**
     * @brief True if the run was stopped by request or timeout.
     */
    bool stopped{false};

    /**
     * @brief True if the stop was caused by ExecutorConfig::timeout.
     */
    bool timed_out{false};

    /**
     * @brief State merged by the end of the run.
     */
    StateSnapshot state;

    /**
     * @brief Names of nodes that completed, in completion order.
     */
    std::vector<std::string> completed_nodes;

    /**
     * @brief Names of nodes that failed, in failure order.
     */
    std::vector<std::string> failed_nodes;

    /**
     * @brief Captured exceptions, parallel to failed_nodes.
     */
    std::vector<std::exception_ptr> errors;

    /**
     * @brief Error messages, parallel to failed_nodes.
     */
    std::vector<std::string> error_messages;

    /**
     * @brief Names of nodes that were never launched, in registration order.
     */
    std::vector<std::string> skipped_nodes;

    /**
     * @brief Total execution duration (wall-clock time).
     */
    std::chrono::nanoseconds total_duration{0};

    /**
     * @brief Per-node durations of launched nodes, by name.
     * @details Only populated if timing collection is enabled.
     */
    std::map<std::string, std::chrono::nanoseconds> node_durations;

    /**
     * @brief Get a summary string for logging.
     */
    std::string summary() const
    {
        std::string result;
        if (success)
        {
            result = "Execution succeeded";
        }
        else if (!failed_nodes.empty())
        {
            result = "Execution failed at node '" + failed_nodes.front() + "'";
        }
        else if (timed_out)
        {
            result = "Execution timed out";
        }
        else if (stopped)
        {
            result = "Execution stopped by request";
        }
        else
        {
            result = "Execution failed";
        }
        result += " (completed=" + std::to_string(completed_nodes.size());
        result += ", failed=" + std::to_string(failed_nodes.size());
        result += ", skipped=" + std::to_string(skipped_nodes.size()) + ")";
        return result;
    }
};

} // namespace stategraph
