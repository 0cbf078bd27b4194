#include "stategraph/common/state_schema.hpp"

namespace stategraph
{

StateSchema& StateSchema::declare(const std::string& name, std::type_index ti)
{
    if (name.empty())
    {
        throw StateSchemaError(name, "State field name must not be empty");
    }
    if (!m_fields.emplace(name, ti).second)
    {
        throw StateSchemaError(name, "State field '" + name + "' is already declared");
    }
    return *this;
}

bool StateSchema::contains(const std::string& name) const
{
    return m_fields.count(name) > 0;
}

std::optional<std::type_index> StateSchema::field_type(const std::string& name) const
{
    auto it = m_fields.find(name);
    if (it == m_fields.end())
    {
        return std::nullopt;
    }
    return it->second;
}

void StateSchema::check(const std::string& name, const StateValue& value) const
{
    auto it = m_fields.find(name);
    if (it == m_fields.end())
    {
        throw UnknownFieldError(name);
    }
    if (value.type() != it->second)
    {
        throw FieldTypeMismatchError(name, it->second.name(), value.type().name());
    }
}

void StateSchema::check(const FieldMap& fields) const
{
    for (const auto& [name, value] : fields)
    {
        check(name, value);
    }
}

std::vector<std::string> StateSchema::field_names() const
{
    std::vector<std::string> result;
    result.reserve(m_fields.size());
    for (const auto& [name, ti] : m_fields)
    {
        result.push_back(name);
    }
    return result;
}

} // namespace stategraph
