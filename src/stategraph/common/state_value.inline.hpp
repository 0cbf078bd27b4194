/**
 * @file state_value.inline.hpp
 * @brief Implementations for type-parameterized member methods in the StateValue class.
 */
#pragma once
#include "stategraph/common/state_value.hpp"

namespace stategraph
{

namespace detail
{

/**
 * @brief Helper to get the decayed storage type.
 */
template <typename T>
using storage_type_t = std::decay_t<T>;

template <typename T>
inline constexpr bool is_storable_v =
    !std::is_void_v<storage_type_t<T>> &&
    !std::is_array_v<storage_type_t<T>>;

[[noreturn]] inline void throw_type_mismatch(const std::type_info& expected, std::type_index actual)
{
    throw StateValueTypeError{
        "StateValue type mismatch: expected " + std::string{expected.name()} +
        ", got " + std::string{actual.name()}
    };
}

} // namespace detail

template <typename T>
StateValue StateValue::make(T&& value)
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(detail::is_storable_v<T>, "StateValue: T cannot be void or an array type");

    std::shared_ptr<const StorageT> payload = std::make_shared<StorageT>(std::forward<T>(value));
    return StateValue{std::move(payload), std::type_index{typeid(StorageT)}};
}

template <typename T, typename... Args>
StateValue StateValue::emplace(Args&&... args)
{
    using StorageT = detail::storage_type_t<T>;
    static_assert(detail::is_storable_v<T>, "StateValue: T cannot be void or an array type");

    std::shared_ptr<const StorageT> payload = std::make_shared<StorageT>(std::forward<Args>(args)...);
    return StateValue{std::move(payload), std::type_index{typeid(StorageT)}};
}

template <typename T>
bool StateValue::has_type() const noexcept
{
    using StorageT = detail::storage_type_t<T>;
    return m_payload && m_ti == std::type_index{typeid(StorageT)};
}

template <typename T>
const T& StateValue::as() const
{
    using StorageT = detail::storage_type_t<T>;

    if (!m_payload)
    {
        throw StateValueEmptyError{};
    }
    if (m_ti != std::type_index{typeid(StorageT)})
    {
        detail::throw_type_mismatch(typeid(StorageT), m_ti);
    }
    return *static_cast<const StorageT*>(m_payload.get());
}

template <typename T>
const T* StateValue::try_as() const noexcept
{
    using StorageT = detail::storage_type_t<T>;

    if (!m_payload || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return static_cast<const StorageT*>(m_payload.get());
}

template <typename T>
std::shared_ptr<const T> StateValue::get() const noexcept
{
    using StorageT = detail::storage_type_t<T>;

    if (!m_payload || m_ti != std::type_index{typeid(StorageT)})
    {
        return nullptr;
    }
    return std::static_pointer_cast<const StorageT>(m_payload);
}

} // namespace stategraph
