/**
 * @file state_store.hpp
 * @brief StateStore holds the evolving workflow state of one run.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/graph_enums.hpp"
#include "stategraph/common/state_schema.hpp"
#include "stategraph/common/state_snapshot.hpp"

namespace stategraph
{

/**
 * @brief Copy-on-write store for the shared state of a single workflow run.
 *
 * @details
 * The current state is an immutable FieldMap behind a shared_ptr. merge() builds
 * a new map with the delta applied and swaps the pointer under the mutex, so a
 * reader either sees the whole delta or none of it. snapshot() only copies the
 * pointer, holding the mutex for that copy alone.
 *
 * Every merge is also recorded in a merge log together with the node that
 * produced it. snapshot_visible_to() replays the initial state plus the logged
 * deltas of a chosen set of producers, in merge order, which gives a node a view
 * containing exactly what its transitive dependencies wrote.
 *
 * @par Thread Safety
 * - snapshot(), snapshot_visible_to() and merge() may be called concurrently.
 * - merge() calls are serialized with respect to each other.
 * - A snapshot taken after merge() returns includes that delta's fields.
 *
 * @par Lifecycle
 * - Created fresh for each run; discarded or handed back to the caller at the end.
 */
class StateStore
{
public:
    /**
     * @brief Construct a store seeded with initial fields.
     * @param initial_state Fields present before any node runs.
     * @param schema Optional schema to check the initial state and every delta against.
     * @throws StateSchemaError if the initial state violates the schema.
     */
    explicit StateStore(const StateDelta& initial_state = {},
                        std::shared_ptr<const StateSchema> schema = nullptr);

    StateStore(const StateStore&) = delete;
    StateStore& operator=(const StateStore&) = delete;

    /**
     * @brief Get a point-in-time view of every merged field.
     */
    StateSnapshot snapshot() const;

    /**
     * @brief Get the initial fields plus the deltas of the given producers.
     * @param visible_producers visible_producers[i] is true if deltas merged by
     *        node i are to be included. Deltas merged without a producer are
     *        always included.
     */
    StateSnapshot snapshot_visible_to(const std::vector<bool>& visible_producers) const;

    /**
     * @brief Atomically apply all fields of a delta.
     * @param delta The fields to add or overwrite.
     * @param producer The node that produced the delta, if any.
     * @return Sequence number of this merge (1 for the first merge).
     * @throws StateSchemaError if the delta violates the schema; nothing is applied.
     */
    size_t merge(const StateDelta& delta, std::optional<NodeIdx> producer = std::nullopt);

    /**
     * @brief Number of merges applied so far.
     */
    size_t merge_count() const;

    const std::shared_ptr<const StateSchema>& schema() const noexcept
    {
        return m_schema;
    }

private:
    struct MergeRecord
    {
        std::optional<NodeIdx> producer;
        std::shared_ptr<const FieldMap> fields;
    };

    std::shared_ptr<const StateSchema> m_schema;
    std::shared_ptr<const FieldMap> m_initial;

    mutable std::mutex m_mutex;
    std::shared_ptr<const FieldMap> m_current;
    std::vector<MergeRecord> m_merge_log;
};

} // namespace stategraph
