#include "stategraph/common/state_snapshot.hpp"

namespace stategraph
{

StateDelta& StateDelta::set_value(const std::string& name, StateValue value)
{
    if (!value.has_value())
    {
        throw StateValueEmptyError{};
    }
    m_fields[name] = std::move(value);
    return *this;
}

StateSnapshot::StateSnapshot()
    : m_fields{std::make_shared<FieldMap>()}
{}

StateSnapshot::StateSnapshot(std::shared_ptr<const FieldMap> fields)
    : m_fields{std::move(fields)}
{
    if (!m_fields)
    {
        m_fields = std::make_shared<FieldMap>();
    }
}

StateSnapshot StateSnapshot::from_delta(const StateDelta& delta)
{
    return StateSnapshot{std::make_shared<FieldMap>(delta.fields())};
}

const StateValue* StateSnapshot::find(const std::string& name) const
{
    auto it = m_fields->find(name);
    if (it == m_fields->end())
    {
        return nullptr;
    }
    return &it->second;
}

const StateValue& StateSnapshot::at(const std::string& name) const
{
    const StateValue* value = find(name);
    if (!value)
    {
        throw MissingFieldError(name);
    }
    return *value;
}

std::vector<std::string> StateSnapshot::field_names() const
{
    std::vector<std::string> result;
    result.reserve(m_fields->size());
    for (const auto& [name, value] : *m_fields)
    {
        result.push_back(name);
    }
    return result;
}

} // namespace stategraph
