#include "stategraph/common/state_store.hpp"

namespace stategraph
{

StateStore::StateStore(const StateDelta& initial_state,
                       std::shared_ptr<const StateSchema> schema)
    : m_schema{std::move(schema)}
{
    if (m_schema)
    {
        m_schema->check(initial_state.fields());
    }
    m_initial = std::make_shared<FieldMap>(initial_state.fields());
    m_current = m_initial;
}

StateSnapshot StateStore::snapshot() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return StateSnapshot{m_current};
}

StateSnapshot StateStore::snapshot_visible_to(const std::vector<bool>& visible_producers) const
{
    std::vector<MergeRecord> log;
    {
        std::lock_guard<std::mutex> lock(m_mutex);
        log = m_merge_log;
    }

    auto fields = std::make_shared<FieldMap>(*m_initial);
    for (const auto& record : log)
    {
        if (record.producer)
        {
            NodeIdx producer = *record.producer;
            if (producer >= visible_producers.size() || !visible_producers[producer])
            {
                continue;
            }
        }
        for (const auto& [name, value] : *record.fields)
        {
            (*fields)[name] = value;
        }
    }
    return StateSnapshot{std::move(fields)};
}

size_t StateStore::merge(const StateDelta& delta, std::optional<NodeIdx> producer)
{
    if (m_schema)
    {
        m_schema->check(delta.fields());
    }
    auto delta_fields = std::make_shared<FieldMap>(delta.fields());

    std::lock_guard<std::mutex> lock(m_mutex);
    auto next = std::make_shared<FieldMap>(*m_current);
    for (const auto& [name, value] : *delta_fields)
    {
        (*next)[name] = value;
    }
    m_current = std::move(next);
    m_merge_log.push_back(MergeRecord{producer, std::move(delta_fields)});
    return m_merge_log.size();
}

size_t StateStore::merge_count() const
{
    std::lock_guard<std::mutex> lock(m_mutex);
    return m_merge_log.size();
}

} // namespace stategraph
