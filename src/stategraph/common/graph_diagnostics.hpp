/**
 * @file graph_diagnostics.hpp
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_exceptions.hpp"

namespace stategraph
{

// ============================================================================
// Diagnostic item types
// ============================================================================

/**
 * @brief Severity level for diagnostic items.
 */
enum class DiagnosticSeverity
{
    Warning,  ///< Non-blocking issue that may indicate a problem.
    Error     ///< Blocking issue that prevents the graph from being built.
};

/**
 * @brief Category of diagnostic issue.
 *
 * @details
 * Error categories are listed in the order the validator checks them.
 */
enum class DiagnosticCategory
{
    MissingEntry,           ///< No entry node was set.
    Cycle,                  ///< The dependency edges contain a cycle.
    UnreachableTerminal,    ///< A node has no path to the terminal marker.
    UnreachableNode,        ///< A node cannot be reached from the entry node.
    FieldOwnershipConflict, ///< Two nodes declare the same output field.
    UndeclaredOutputs       ///< A node declares no outputs, so ownership is unchecked.
};

/**
 * @brief A single diagnostic item (error or warning).
 */
struct DiagnosticItem
{
    DiagnosticSeverity severity;
    DiagnosticCategory category;
    std::string message;

    /// Node names involved in this issue, in registration order.
    std::vector<std::string> involved_nodes;

    /// Field involved in this issue (FieldOwnershipConflict only).
    std::string field;
};

// ============================================================================
// GraphDiagnostics
// ============================================================================

/**
 * @brief Diagnostic information collected by GraphValidator.
 *
 * @details
 * `GraphDiagnostics` contains all errors and warnings detected while
 * validating a NodeRegistry. Validation reports every problem it finds rather
 * than stopping at the first, so a caller can fix a graph in one pass;
 * throw_if_invalid() raises the first error in check order as its typed
 * exception.
 *
 * @par Thread safety
 * - No internal synchronization.
 * - Once constructed, the data is immutable.
 * - Concurrent reads are safe.
 */
class GraphDiagnostics
{
public:
    bool has_errors() const noexcept
    {
        return !m_errors.empty();
    }

    bool has_warnings() const noexcept
    {
        return !m_warnings.empty();
    }

    /**
     * @brief Check if the graph is valid for building.
     * @return True if there are no errors (warnings are allowed).
     */
    bool is_valid() const noexcept
    {
        return m_errors.empty();
    }

    const std::vector<DiagnosticItem>& errors() const noexcept
    {
        return m_errors;
    }

    const std::vector<DiagnosticItem>& warnings() const noexcept
    {
        return m_warnings;
    }

    /**
     * @brief Throw the typed exception matching the first error, if any.
     * @throws MissingEntryError, CycleError, UnreachableTerminalError,
     *         UnreachableNodeError or FieldOwnershipConflictError.
     */
    void throw_if_invalid() const;

    /**
     * @brief Name of the entry node at validation time (empty if unset).
     */
    const std::string& entry() const noexcept
    {
        return m_entry;
    }

    /**
     * @brief Name of the terminal marker at validation time.
     */
    const std::string& terminal() const noexcept
    {
        return m_terminal;
    }

    // Allow GraphValidator to populate diagnostics
    friend class GraphValidator;

private:
    std::vector<DiagnosticItem> m_errors;
    std::vector<DiagnosticItem> m_warnings;
    std::string m_entry;
    std::string m_terminal;
};

inline void GraphDiagnostics::throw_if_invalid() const
{
    if (m_errors.empty())
    {
        return;
    }
    const DiagnosticItem& first = m_errors.front();
    const std::string node = first.involved_nodes.empty() ? std::string{} : first.involved_nodes.front();
    switch (first.category)
    {
    case DiagnosticCategory::MissingEntry:
        throw MissingEntryError();
    case DiagnosticCategory::Cycle:
        throw CycleError(first.involved_nodes);
    case DiagnosticCategory::UnreachableTerminal:
        throw UnreachableTerminalError(node, m_terminal);
    case DiagnosticCategory::UnreachableNode:
        throw UnreachableNodeError(node, m_entry);
    case DiagnosticCategory::FieldOwnershipConflict:
        throw FieldOwnershipConflictError(first.field, first.involved_nodes);
    case DiagnosticCategory::UndeclaredOutputs:
        break;
    }
    throw GraphError(GraphErrorCode::InvariantViolation, first.message);
}

} // namespace stategraph
