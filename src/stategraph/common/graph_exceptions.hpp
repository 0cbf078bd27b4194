/**
 * @file graph_exceptions.hpp
 */
#pragma once
#include "stategraph/common/common.hpp"

namespace stategraph
{

/**
 * @brief Error codes for graph construction and validation.
 */
enum class GraphErrorCode
{
    DuplicateNode,
    UnknownNode,
    ReservedName,
    MissingEntry,
    CycleDetected,
    UnreachableTerminal,
    UnreachableNode,
    FieldOwnershipConflict,
    InvariantViolation
};

/**
 * @brief Exception class for graph errors.
 *
 * @details
 * `GraphError` is thrown by NodeRegistry methods when a registration or edge
 * is rejected, and by NodeRegistry::build() when validation fails. Each
 * exception carries an error code and a descriptive message; the subclasses
 * below add the node or field names involved.
 *
 * @par Thread safety
 * - The exception object itself follows standard exception semantics.
 * - Safe to copy and rethrow across threads.
 */
class GraphError : public std::exception
{
public:
    /**
     * @brief Construct a GraphError.
     * @param code The error code indicating the type of error.
     * @param message A descriptive message explaining the error.
     */
    GraphError(GraphErrorCode code, std::string message)
        : m_code(code)
        , m_message(std::move(message))
    {
    }

    GraphErrorCode code() const noexcept
    {
        return m_code;
    }

    const char* what() const noexcept override
    {
        return m_message.c_str();
    }

private:
    GraphErrorCode m_code;
    std::string m_message;
};

/**
 * @brief A node name was registered twice.
 */
class DuplicateNodeError : public GraphError
{
public:
    explicit DuplicateNodeError(const std::string& node)
        : GraphError(GraphErrorCode::DuplicateNode, "Node '" + node + "' is already registered")
        , m_node(node)
    {}

    const std::string& node() const noexcept
    {
        return m_node;
    }

private:
    std::string m_node;
};

/**
 * @brief An edge, dependency or entry referred to an unregistered node.
 */
class UnknownNodeError : public GraphError
{
public:
    explicit UnknownNodeError(const std::string& node)
        : GraphError(GraphErrorCode::UnknownNode, "Node '" + node + "' is not registered")
        , m_node(node)
    {}

    const std::string& node() const noexcept
    {
        return m_node;
    }

private:
    std::string m_node;
};

/**
 * @brief The graph has no entry node.
 */
class MissingEntryError : public GraphError
{
public:
    MissingEntryError()
        : GraphError(GraphErrorCode::MissingEntry, "Graph has no entry node")
    {}
};

/**
 * @brief The dependency edges contain a cycle.
 */
class CycleError : public GraphError
{
public:
    explicit CycleError(std::vector<std::string> involved_nodes)
        : GraphError(GraphErrorCode::CycleDetected, make_message(involved_nodes))
        , m_involved_nodes(std::move(involved_nodes))
    {}

    /**
     * @brief Nodes on or between cycles, in registration order.
     */
    const std::vector<std::string>& involved_nodes() const noexcept
    {
        return m_involved_nodes;
    }

private:
    static std::string make_message(const std::vector<std::string>& nodes)
    {
        std::string msg = "Cycle detected involving nodes:";
        for (const auto& node : nodes)
        {
            msg += " '" + node + "'";
        }
        return msg;
    }

    std::vector<std::string> m_involved_nodes;
};

/**
 * @brief A node has no path to the terminal marker.
 */
class UnreachableTerminalError : public GraphError
{
public:
    UnreachableTerminalError(const std::string& node, const std::string& terminal)
        : GraphError(GraphErrorCode::UnreachableTerminal,
                     "Node '" + node + "' has no path to terminal '" + terminal + "'")
        , m_node(node)
    {}

    const std::string& node() const noexcept
    {
        return m_node;
    }

private:
    std::string m_node;
};

/**
 * @brief A node cannot be reached from the entry node.
 */
class UnreachableNodeError : public GraphError
{
public:
    UnreachableNodeError(const std::string& node, const std::string& entry)
        : GraphError(GraphErrorCode::UnreachableNode,
                     "Node '" + node + "' is not reachable from entry '" + entry + "'")
        , m_node(node)
    {}

    const std::string& node() const noexcept
    {
        return m_node;
    }

private:
    std::string m_node;
};

/**
 * @brief Two or more nodes declare the same output field.
 */
class FieldOwnershipConflictError : public GraphError
{
public:
    FieldOwnershipConflictError(const std::string& field, std::vector<std::string> nodes)
        : GraphError(GraphErrorCode::FieldOwnershipConflict, make_message(field, nodes))
        , m_field(field)
        , m_nodes(std::move(nodes))
    {}

    const std::string& field() const noexcept
    {
        return m_field;
    }

    const std::vector<std::string>& nodes() const noexcept
    {
        return m_nodes;
    }

private:
    static std::string make_message(const std::string& field, const std::vector<std::string>& nodes)
    {
        std::string msg = "Field '" + field + "' is declared as output by more than one node:";
        for (const auto& node : nodes)
        {
            msg += " '" + node + "'";
        }
        return msg;
    }

    std::string m_field;
    std::vector<std::string> m_nodes;
};

} // namespace stategraph
