/**
 * @file state_exceptions.hpp
 * @brief Exceptions raised when reading, writing or checking state fields.
 */
#pragma once
#include "stategraph/common/common.hpp"

namespace stategraph
{

/**
 * @brief Exception thrown when a StateValue holds a different type than requested.
 */
class StateValueTypeError : public std::runtime_error
{
public:
    explicit StateValueTypeError(const std::string& msg)
        : std::runtime_error(msg)
    {}
};

/**
 * @brief Exception thrown when accessing an empty StateValue.
 */
class StateValueEmptyError : public std::runtime_error
{
public:
    StateValueEmptyError()
        : std::runtime_error("StateValue is empty")
    {}
};

/**
 * @brief Exception thrown when a snapshot does not contain a requested field.
 */
class MissingFieldError : public std::runtime_error
{
public:
    explicit MissingFieldError(const std::string& field)
        : std::runtime_error("State field '" + field + "' is not present")
        , m_field(field)
    {}

    const std::string& field() const noexcept
    {
        return m_field;
    }

private:
    std::string m_field;
};

/**
 * @brief Base class for violations of a StateSchema.
 */
class StateSchemaError : public std::runtime_error
{
public:
    StateSchemaError(const std::string& field, const std::string& msg)
        : std::runtime_error(msg)
        , m_field(field)
    {}

    /**
     * @brief Name of the field that violated the schema.
     */
    const std::string& field() const noexcept
    {
        return m_field;
    }

private:
    std::string m_field;
};

/**
 * @brief A field was written that the schema does not declare.
 */
class UnknownFieldError : public StateSchemaError
{
public:
    explicit UnknownFieldError(const std::string& field)
        : StateSchemaError(field, "State field '" + field + "' is not declared in the schema")
    {}
};

/**
 * @brief A field was written with a type other than the declared one.
 */
class FieldTypeMismatchError : public StateSchemaError
{
public:
    FieldTypeMismatchError(const std::string& field,
                           const std::string& expected,
                           const std::string& actual)
        : StateSchemaError(field,
                           "State field '" + field + "' type mismatch: expected " +
                               expected + ", got " + actual)
    {}
};

} // namespace stategraph
