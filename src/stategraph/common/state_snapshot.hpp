/**
 * @file state_snapshot.hpp
 * @brief StateSnapshot (immutable view of the state) and StateDelta (a node's output).
 */
#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_value.hpp"
#include "stategraph/common/state_value.inline.hpp"

namespace stategraph
{

/**
 * @brief The fields produced by one node execution.
 *
 * @details
 * A delta only adds or overwrites fields by name; there is no way to delete a
 * field. Setting the same name twice within one delta keeps the last value.
 */
class StateDelta
{
public:
    StateDelta() = default;

    /**
     * @brief Set a field to a value of type T.
     * @return *this, for chaining.
     */
    template <typename T>
    StateDelta& set(const std::string& name, T&& value)
    {
        m_fields[name] = StateValue::make(std::forward<T>(value));
        return *this;
    }

    /**
     * @brief Set a field to an existing StateValue.
     * @throws StateValueEmptyError if value is empty.
     */
    StateDelta& set_value(const std::string& name, StateValue value);

    bool contains(const std::string& name) const
    {
        return m_fields.count(name) > 0;
    }

    bool empty() const noexcept
    {
        return m_fields.empty();
    }

    size_t size() const noexcept
    {
        return m_fields.size();
    }

    const FieldMap& fields() const noexcept
    {
        return m_fields;
    }

    FieldMap::const_iterator begin() const noexcept
    {
        return m_fields.begin();
    }

    FieldMap::const_iterator end() const noexcept
    {
        return m_fields.end();
    }

private:
    FieldMap m_fields;
};

/**
 * @brief An immutable point-in-time view of the workflow state.
 *
 * @details
 * A snapshot shares an immutable FieldMap; copying a snapshot is cheap and
 * later merges into the StateStore never change an existing snapshot.
 *
 * @par Thread Safety
 * - Immutable; safe for concurrent reads from any number of threads.
 */
class StateSnapshot
{
public:
    /**
     * @brief Construct an empty snapshot.
     */
    StateSnapshot();

    explicit StateSnapshot(std::shared_ptr<const FieldMap> fields);

    /**
     * @brief Construct a snapshot holding the fields of a delta.
     */
    static StateSnapshot from_delta(const StateDelta& delta);

    bool contains(const std::string& name) const
    {
        return m_fields->count(name) > 0;
    }

    bool empty() const noexcept
    {
        return m_fields->empty();
    }

    size_t size() const noexcept
    {
        return m_fields->size();
    }

    /**
     * @brief Find a field.
     * @return Pointer to the value, or nullptr if absent.
     */
    const StateValue* find(const std::string& name) const;

    /**
     * @brief Get a field.
     * @throws MissingFieldError if absent.
     */
    const StateValue& at(const std::string& name) const;

    /**
     * @brief Get a field's value as T.
     * @throws MissingFieldError if absent.
     * @throws StateValueTypeError if the field holds another type.
     */
    template <typename T>
    const T& get(const std::string& name) const
    {
        const StateValue& value = at(name);
        if (const T* typed = value.try_as<T>())
        {
            return *typed;
        }
        throw StateValueTypeError(
            "State field '" + name + "' type mismatch: expected " +
            std::string{typeid(std::decay_t<T>).name()} + ", got " +
            std::string{value.type().name()});
    }

    /**
     * @brief Get a field's value as T, if present with that type.
     * @return Pointer to the value, or nullptr.
     */
    template <typename T>
    const T* try_get(const std::string& name) const noexcept
    {
        auto it = m_fields->find(name);
        if (it == m_fields->end())
        {
            return nullptr;
        }
        return it->second.try_as<T>();
    }

    std::vector<std::string> field_names() const;

    const FieldMap& fields() const noexcept
    {
        return *m_fields;
    }

    FieldMap::const_iterator begin() const noexcept
    {
        return m_fields->begin();
    }

    FieldMap::const_iterator end() const noexcept
    {
        return m_fields->end();
    }

private:
    std::shared_ptr<const FieldMap> m_fields;
};

} // namespace stategraph
