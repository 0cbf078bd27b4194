#include <gtest/gtest.h>
#include "stategraph/common/state_schema.hpp"
#include "stategraph/common/state_snapshot.hpp"
#include <string>
#include <vector>

using namespace stategraph;

// =============================================================================
// StateValue Tests
// =============================================================================

class StateValueTests : public ::testing::Test
{
protected:
    StateValue value;
};

TEST_F(StateValueTests, DefaultConstructed_IsEmpty)
{
    EXPECT_FALSE(value.has_value());
    EXPECT_EQ(value.type(), std::type_index{typeid(void)});
}

TEST_F(StateValueTests, Make_StoresValueAndType)
{
    value = StateValue::make(42);
    EXPECT_TRUE(value.has_value());
    EXPECT_TRUE(value.has_type<int>());
    EXPECT_FALSE(value.has_type<double>());
    EXPECT_EQ(value.as<int>(), 42);
}

TEST_F(StateValueTests, Emplace_ConstructsInPlace)
{
    value = StateValue::emplace<std::string>(3, 'a');
    EXPECT_EQ(value.as<std::string>(), "aaa");
}

TEST_F(StateValueTests, As_Empty_Throws)
{
    EXPECT_THROW(value.as<int>(), StateValueEmptyError);
}

TEST_F(StateValueTests, As_WrongType_Throws)
{
    value = StateValue::make(42);
    EXPECT_THROW(value.as<std::string>(), StateValueTypeError);
}

TEST_F(StateValueTests, TryAs_WrongType_ReturnsNull)
{
    value = StateValue::make(std::string{"hello"});
    EXPECT_EQ(value.try_as<int>(), nullptr);
    ASSERT_NE(value.try_as<std::string>(), nullptr);
    EXPECT_EQ(*value.try_as<std::string>(), "hello");
}

TEST_F(StateValueTests, Copy_SharesPayload)
{
    value = StateValue::make(std::vector<int>{1, 2, 3});
    StateValue copy = value;
    EXPECT_TRUE(copy.same_payload(value));
    EXPECT_EQ(copy.get<std::vector<int>>().get(), value.get<std::vector<int>>().get());
}

TEST_F(StateValueTests, Get_ReturnsNullForWrongType)
{
    value = StateValue::make(1.5);
    EXPECT_EQ(value.get<int>(), nullptr);
    ASSERT_NE(value.get<double>(), nullptr);
    EXPECT_DOUBLE_EQ(*value.get<double>(), 1.5);
}

// =============================================================================
// StateSchema Tests
// =============================================================================

class StateSchemaTests : public ::testing::Test
{
protected:
    void SetUp() override
    {
        schema.declare<int>("count").declare<std::string>("label");
    }

    StateSchema schema;
};

TEST_F(StateSchemaTests, Declare_RecordsFields)
{
    EXPECT_EQ(schema.size(), 2u);
    EXPECT_TRUE(schema.contains("count"));
    EXPECT_FALSE(schema.contains("missing"));
    EXPECT_EQ(schema.field_type("label"), std::type_index{typeid(std::string)});
    EXPECT_FALSE(schema.field_type("missing").has_value());
    EXPECT_EQ(schema.field_names(), (std::vector<std::string>{"count", "label"}));
}

TEST_F(StateSchemaTests, Declare_Duplicate_Throws)
{
    EXPECT_THROW(schema.declare<double>("count"), StateSchemaError);
}

TEST_F(StateSchemaTests, Declare_EmptyName_Throws)
{
    EXPECT_THROW(schema.declare<int>(""), StateSchemaError);
}

TEST_F(StateSchemaTests, Check_UnknownField_Throws)
{
    try
    {
        schema.check("other", StateValue::make(1));
        FAIL() << "Expected UnknownFieldError";
    }
    catch (const UnknownFieldError& e)
    {
        EXPECT_EQ(e.field(), "other");
    }
}

TEST_F(StateSchemaTests, Check_TypeMismatch_Throws)
{
    EXPECT_THROW(schema.check("count", StateValue::make(std::string{"x"})), FieldTypeMismatchError);
    EXPECT_NO_THROW(schema.check("count", StateValue::make(7)));
}

// =============================================================================
// StateDelta / StateSnapshot Tests
// =============================================================================

class StateSnapshotTests : public ::testing::Test
{
};

TEST_F(StateSnapshotTests, Delta_SetOverwritesField)
{
    StateDelta delta;
    delta.set("x", 1).set("x", 2);
    EXPECT_EQ(delta.size(), 1u);
    EXPECT_EQ(delta.fields().at("x").as<int>(), 2);
}

TEST_F(StateSnapshotTests, Delta_SetEmptyValue_Throws)
{
    StateDelta delta;
    EXPECT_THROW(delta.set_value("x", StateValue{}), StateValueEmptyError);
}

TEST_F(StateSnapshotTests, DefaultSnapshot_IsEmpty)
{
    StateSnapshot snapshot;
    EXPECT_TRUE(snapshot.empty());
    EXPECT_EQ(snapshot.find("x"), nullptr);
}

TEST_F(StateSnapshotTests, Get_MissingField_ThrowsWithName)
{
    StateSnapshot snapshot;
    try
    {
        snapshot.get<int>("absent");
        FAIL() << "Expected MissingFieldError";
    }
    catch (const MissingFieldError& e)
    {
        EXPECT_EQ(e.field(), "absent");
    }
}

TEST_F(StateSnapshotTests, Get_WrongType_Throws)
{
    StateDelta delta;
    delta.set("x", 1);
    auto snapshot = StateSnapshot::from_delta(delta);
    EXPECT_THROW(snapshot.get<std::string>("x"), StateValueTypeError);
    EXPECT_EQ(snapshot.try_get<std::string>("x"), nullptr);
    EXPECT_EQ(snapshot.get<int>("x"), 1);
}

TEST_F(StateSnapshotTests, FromDelta_IsIndependentOfLaterChanges)
{
    StateDelta delta;
    delta.set("x", 1);
    auto snapshot = StateSnapshot::from_delta(delta);
    delta.set("x", 2).set("y", 3);

    EXPECT_EQ(snapshot.size(), 1u);
    EXPECT_EQ(snapshot.get<int>("x"), 1);
    EXPECT_EQ(snapshot.field_names(), (std::vector<std::string>{"x"}));
}
