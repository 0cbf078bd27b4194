/**
 * @file node.hpp
 * @brief The node contract: INode and NodeFunction.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_snapshot.hpp"

namespace stategraph
{

/**
 * @brief A node's work as a callable: snapshot in, delta out.
 *
 * @details
 * The function receives the snapshot visible to the node at launch and returns
 * the fields it produces. Throwing any exception marks the node Failed; the
 * exception is captured and reported in the run's WorkflowError.
 */
using NodeFunction = std::function<StateDelta(const StateSnapshot&)>;

/**
 * @brief Interface for workflow nodes implemented as classes.
 *
 * @details
 * INode is the class form of NodeFunction, for nodes that carry collaborators
 * (a data source, a model client) or declare the fields they produce.
 *
 * @par Contract
 * - execute() must not keep references into the snapshot beyond its return,
 *   must not access the StateStore, and must only produce fields it is the
 *   sole declared producer of.
 * - Recoverable problems (a malformed input record that can be skipped) are
 *   handled inside execute() and never surface as exceptions.
 *
 * @par Thread Safety
 * - execute() may be called from any worker thread, and from several runs of
 *   the same graph concurrently.
 */
class INode
{
public:
    virtual ~INode() = 0;

    /**
     * @brief Unique name of this node within its graph.
     */
    virtual const std::string& name() const = 0;

    /**
     * @brief Fields this node produces.
     * @return Declared output field names; empty means undeclared.
     */
    virtual std::vector<std::string> outputs() const
    {
        return {};
    }

    /**
     * @brief Execute this node's work.
     * @param state The snapshot visible to this node.
     * @return The delta to merge into the state.
     * @throws Any exception to indicate failure.
     */
    virtual StateDelta execute(const StateSnapshot& state) = 0;

protected:
    INode() = default;

private:
    INode(const INode&) = delete;
    INode& operator=(const INode&) = delete;
};

using NodePtr = std::shared_ptr<INode>;

inline INode::~INode() = default;

} // namespace stategraph
