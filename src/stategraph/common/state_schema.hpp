/**
 * @file state_schema.hpp
 * @brief StateSchema declares the named, typed fields a workflow state may hold.
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_value.hpp"

namespace stategraph
{

/**
 * @brief Declares the fields of a workflow state and their types.
 *
 * @details
 * A schema turns the state into a set of named, typed fields. When a graph
 * carries a schema, the StateStore checks the initial state and every merged
 * delta against it, so a node writing an undeclared field or a value of the
 * wrong type fails at merge time instead of surfacing later in a consumer.
 *
 * @par Thread Safety
 * - Mutation (declare) is not synchronized.
 * - Once shared with a graph the schema is immutable; concurrent check() calls are safe.
 */
class StateSchema
{
public:
    StateSchema() = default;

    /**
     * @brief Declare a field of type T.
     * @throws StateSchemaError if the field is already declared.
     */
    template <typename T>
    StateSchema& declare(const std::string& name)
    {
        return declare(name, std::type_index{typeid(std::decay_t<T>)});
    }

    /**
     * @brief Declare a field by type_index.
     * @throws StateSchemaError if the field is already declared.
     */
    StateSchema& declare(const std::string& name, std::type_index ti);

    bool contains(const std::string& name) const;

    /**
     * @brief Get the declared type of a field.
     * @return The declared type, or nullopt if the field is not declared.
     */
    std::optional<std::type_index> field_type(const std::string& name) const;

    /**
     * @brief Check one field value against the schema.
     * @throws UnknownFieldError if the field is not declared.
     * @throws FieldTypeMismatchError if the value has another type.
     */
    void check(const std::string& name, const StateValue& value) const;

    /**
     * @brief Check every field of a mapping against the schema.
     */
    void check(const FieldMap& fields) const;

    std::vector<std::string> field_names() const;

    size_t size() const noexcept
    {
        return m_fields.size();
    }

    bool empty() const noexcept
    {
        return m_fields.empty();
    }

private:
    std::map<std::string, std::type_index> m_fields;
};

} // namespace stategraph
