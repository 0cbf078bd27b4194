/**
 * @file state_value.hpp
 * @brief Definition of StateValue, the immutable type-erased value of a state field.
 * @see state_value.inline.hpp for implementations of type-parameterized methods.
 */

#pragma once
#include "stategraph/common/common.hpp"
#include "stategraph/common/state_exceptions.hpp"

namespace stategraph
{

/**
 * @brief An immutable, type-erased value stored in a state field.
 *
 * @details
 * StateValue owns its payload through `shared_ptr<const void>` and remembers the
 * `type_index` of the stored type. Once made, the payload can no longer be
 * modified: copying a StateValue shares the payload, so snapshots handed to
 * nodes are cheap and can never observe a later write.
 *
 * @par Invariants
 * - `(m_ti == typeid(void))` if and only if `m_payload == nullptr`
 * - The stored type is always decayed (no references, no cv-qualifiers).
 *
 * @par Thread Safety
 * - All member functions are const after construction; concurrent reads are safe.
 */
class StateValue
{
public:
    /**
     * @brief Default constructor creates an empty StateValue.
     */
    StateValue() = default;

    /**
     * @brief Make a StateValue holding a copy (or move) of value.
     * @tparam T The value type (will be decayed).
     */
    template <typename T>
    [[nodiscard]] static StateValue make(T&& value);

    /**
     * @brief Make a StateValue by constructing T in place.
     * @tparam T The type to construct.
     * @tparam Args Constructor argument types.
     */
    template <typename T, typename... Args>
    [[nodiscard]] static StateValue emplace(Args&&... args);

    [[nodiscard]] bool has_value() const noexcept
    {
        return m_payload != nullptr;
    }

    /**
     * @brief Check if the stored type is T.
     */
    template <typename T>
    [[nodiscard]] bool has_type() const noexcept;

    /**
     * @brief Get the type_index of the stored value.
     * @return type_index of stored type, or typeid(void) if empty.
     */
    [[nodiscard]] std::type_index type() const noexcept
    {
        return m_ti;
    }

    /**
     * @brief Access the stored value.
     * @tparam T The expected type.
     * @throws StateValueEmptyError if empty.
     * @throws StateValueTypeError if the stored type is not T.
     */
    template <typename T>
    [[nodiscard]] const T& as() const;

    /**
     * @brief Try to access the stored value.
     * @return Pointer to the value, or nullptr if empty or of another type.
     */
    template <typename T>
    [[nodiscard]] const T* try_as() const noexcept;

    /**
     * @brief Get a shared_ptr to the stored value.
     * @return shared_ptr<const T> if the type matches, nullptr otherwise.
     */
    template <typename T>
    [[nodiscard]] std::shared_ptr<const T> get() const noexcept;

    /**
     * @brief Check whether two values share the same payload.
     */
    [[nodiscard]] bool same_payload(const StateValue& other) const noexcept
    {
        return m_payload == other.m_payload;
    }

private:
    StateValue(std::shared_ptr<const void> payload, std::type_index ti)
        : m_payload{std::move(payload)}
        , m_ti{ti}
    {}

    std::shared_ptr<const void> m_payload{};
    std::type_index m_ti{typeid(void)};
};

/**
 * @brief Ordered mapping from field name to value.
 */
using FieldMap = std::map<std::string, StateValue>;

} // namespace stategraph
