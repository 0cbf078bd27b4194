/**
 * @file workflow_error.hpp
 * @brief Run-time errors reported by run().
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_snapshot.hpp"

namespace stategraph
{

/**
 * @brief Why a run did not reach the terminal marker.
 */
enum class WorkflowErrorKind
{
    NodeFailed,
    Stopped,
    TimedOut
};

/**
 * @brief Exception thrown by run() when a workflow does not complete.
 *
 * @details
 * Carries the first node that failed (empty when the run was stopped or timed
 * out), the captured exception of that node, and the state as merged up to the
 * moment the run ended, so the caller can inspect partial progress.
 */
class WorkflowError : public std::runtime_error
{
public:
    WorkflowError(WorkflowErrorKind kind,
                  std::string failed_node,
                  std::exception_ptr cause,
                  StateSnapshot partial_state,
                  const std::string& message)
        : std::runtime_error(message)
        , m_kind(kind)
        , m_failed_node(std::move(failed_node))
        , m_cause(std::move(cause))
        , m_partial_state(std::move(partial_state))
    {}

    WorkflowErrorKind kind() const noexcept
    {
        return m_kind;
    }

    const std::string& failed_node() const noexcept
    {
        return m_failed_node;
    }

    /**
     * @brief The exception thrown by the failed node, or nullptr.
     */
    std::exception_ptr cause() const noexcept
    {
        return m_cause;
    }

    const StateSnapshot& partial_state() const noexcept
    {
        return m_partial_state;
    }

private:
    WorkflowErrorKind m_kind;
    std::string m_failed_node;
    std::exception_ptr m_cause;
    StateSnapshot m_partial_state;
};

/**
 * @brief A node's delta wrote a field the node does not declare as output.
 */
class OutputContractError : public std::runtime_error
{
public:
    OutputContractError(const std::string& node, const std::string& field)
        : std::runtime_error("Node '" + node + "' produced undeclared field '" + field + "'")
        , m_node(node)
        , m_field(field)
    {}

    const std::string& node() const noexcept
    {
        return m_node;
    }

    const std::string& field() const noexcept
    {
        return m_field;
    }

private:
    std::string m_node;
    std::string m_field;
};

} // namespace stategraph
