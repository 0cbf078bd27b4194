#include <gtest/gtest.h>
#include "stategraph/common/graph_validator.hpp"
#include "stategraph/common/node_registry.hpp"
#include <algorithm>
#include <string>
#include <vector>

using namespace stategraph;

// =============================================================================
// Test Fixture
// =============================================================================

class GraphValidatorTests : public ::testing::Test
{
protected:
    static StateDelta noop(const StateSnapshot&)
    {
        return StateDelta{};
    }

    void add(const std::string& name,
             const std::vector<std::string>& depends_on = {},
             std::vector<std::string> outputs = {})
    {
        registry.register_node(name, noop, depends_on, std::move(outputs));
    }

    static bool has_category(const std::vector<DiagnosticItem>& items, DiagnosticCategory category)
    {
        return std::any_of(items.begin(), items.end(), [category](const DiagnosticItem& item) {
            return item.category == category;
        });
    }

    NodeRegistry registry;
};

// =============================================================================
// Valid Graphs
// =============================================================================

TEST_F(GraphValidatorTests, SingleNodeToTerminal_IsValid)
{
    add("A", {}, {"x"});
    registry.set_entry("A");
    registry.add_edge("A", END);

    auto diagnostics = registry.validate();
    EXPECT_TRUE(diagnostics->is_valid());
    EXPECT_FALSE(diagnostics->has_warnings());
    EXPECT_EQ(diagnostics->entry(), "A");
    EXPECT_EQ(diagnostics->terminal(), END);
    EXPECT_NO_THROW(diagnostics->throw_if_invalid());
}

TEST_F(GraphValidatorTests, Diamond_IsValid)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    add("C", {"A"}, {"z"});
    add("D", {"B", "C"}, {"sum"});
    registry.set_entry("A");
    registry.add_edge("D", END);

    EXPECT_TRUE(registry.validate()->is_valid());
}

TEST_F(GraphValidatorTests, Validate_IsIdempotent)
{
    add("A", {}, {"x"});
    registry.set_entry("A");
    registry.add_edge("A", END);

    auto first = registry.validate();
    auto second = registry.validate();
    EXPECT_EQ(first, second);

    GraphValidator validator;
    auto fresh = validator.validate(registry);
    EXPECT_EQ(fresh->errors().size(), first->errors().size());
    EXPECT_EQ(fresh->warnings().size(), first->warnings().size());
}

TEST_F(GraphValidatorTests, Validate_RerunsAfterMutation)
{
    add("A", {}, {"x"});
    registry.set_entry("A");
    EXPECT_FALSE(registry.validate()->is_valid());

    registry.add_edge("A", END);
    EXPECT_TRUE(registry.validate()->is_valid());
}

// =============================================================================
// Entry
// =============================================================================

TEST_F(GraphValidatorTests, MissingEntry_IsReported)
{
    add("A", {}, {"x"});
    registry.add_edge("A", END);

    auto diagnostics = registry.validate();
    ASSERT_TRUE(diagnostics->has_errors());
    EXPECT_EQ(diagnostics->errors().front().category, DiagnosticCategory::MissingEntry);
    EXPECT_THROW(diagnostics->throw_if_invalid(), MissingEntryError);
}

TEST_F(GraphValidatorTests, EmptyRegistry_MissingEntry)
{
    EXPECT_THROW(registry.build(), MissingEntryError);
}

TEST_F(GraphValidatorTests, NodeUnreachableFromEntry_IsReported)
{
    add("A", {}, {"x"});
    add("B", {}, {"y"});
    registry.set_entry("A");
    registry.add_edge("A", END);
    registry.add_edge("B", END);

    try
    {
        registry.build();
        FAIL() << "Expected UnreachableNodeError";
    }
    catch (const UnreachableNodeError& e)
    {
        EXPECT_EQ(e.node(), "B");
        EXPECT_EQ(e.code(), GraphErrorCode::UnreachableNode);
    }
}

// =============================================================================
// Cycles
// =============================================================================

TEST_F(GraphValidatorTests, TwoNodeCycle_IsReported)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    registry.add_edge("B", "A");
    registry.set_entry("A");
    registry.add_edge("B", END);

    auto diagnostics = registry.validate();
    ASSERT_TRUE(has_category(diagnostics->errors(), DiagnosticCategory::Cycle));
    try
    {
        diagnostics->throw_if_invalid();
        FAIL() << "Expected CycleError";
    }
    catch (const CycleError& e)
    {
        EXPECT_EQ(e.involved_nodes(), (std::vector<std::string>{"A", "B"}));
    }
}

TEST_F(GraphValidatorTests, SelfLoop_IsReported)
{
    add("A", {}, {"x"});
    registry.add_edge("A", "A");
    registry.set_entry("A");
    registry.add_edge("A", END);

    EXPECT_THROW(registry.build(), CycleError);
}

TEST_F(GraphValidatorTests, Cycle_ExcludesDownstreamNodes)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    add("C", {"B"}, {"z"});
    registry.add_edge("B", "A");
    registry.set_entry("A");
    registry.add_edge("C", END);

    auto diagnostics = registry.validate();
    auto it = std::find_if(diagnostics->errors().begin(), diagnostics->errors().end(),
                           [](const DiagnosticItem& item) {
                               return item.category == DiagnosticCategory::Cycle;
                           });
    ASSERT_NE(it, diagnostics->errors().end());
    EXPECT_EQ(it->involved_nodes, (std::vector<std::string>{"A", "B"}));
}

// =============================================================================
// Terminal Reachability
// =============================================================================

TEST_F(GraphValidatorTests, DeadEndNode_IsReported)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    add("C", {"A"}, {"z"});
    registry.set_entry("A");
    registry.add_edge("B", END);

    try
    {
        registry.build();
        FAIL() << "Expected UnreachableTerminalError";
    }
    catch (const UnreachableTerminalError& e)
    {
        EXPECT_EQ(e.node(), "C");
        EXPECT_EQ(e.code(), GraphErrorCode::UnreachableTerminal);
    }
}

TEST_F(GraphValidatorTests, NoTerminalEdge_ReportsEveryNode)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    registry.set_entry("A");

    auto diagnostics = registry.validate();
    size_t count = std::count_if(diagnostics->errors().begin(), diagnostics->errors().end(),
                                 [](const DiagnosticItem& item) {
                                     return item.category == DiagnosticCategory::UnreachableTerminal;
                                 });
    EXPECT_EQ(count, 2u);
}

// =============================================================================
// Field Ownership
// =============================================================================

TEST_F(GraphValidatorTests, TwoProducersOfSameField_IsReported)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"y"});
    add("C", {"A"}, {"y"});
    add("D", {"B", "C"}, {"sum"});
    registry.set_entry("A");
    registry.add_edge("D", END);

    try
    {
        registry.build();
        FAIL() << "Expected FieldOwnershipConflictError";
    }
    catch (const FieldOwnershipConflictError& e)
    {
        EXPECT_EQ(e.field(), "y");
        EXPECT_EQ(e.nodes(), (std::vector<std::string>{"B", "C"}));
    }
}

TEST_F(GraphValidatorTests, OwnershipCheckDisabled_AllowsSharedField)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"x"});
    registry.set_entry("A");
    registry.add_edge("B", END);

    ValidatorConfig config;
    config.check_field_ownership = false;
    EXPECT_TRUE(registry.validate(config)->is_valid());
    EXPECT_NO_THROW(registry.build(config));
    EXPECT_FALSE(registry.validate()->is_valid());
}

TEST_F(GraphValidatorTests, UndeclaredOutputs_IsWarningOnly)
{
    add("A");
    registry.set_entry("A");
    registry.add_edge("A", END);

    auto diagnostics = registry.validate();
    EXPECT_TRUE(diagnostics->is_valid());
    ASSERT_TRUE(diagnostics->has_warnings());
    EXPECT_EQ(diagnostics->warnings().front().category, DiagnosticCategory::UndeclaredOutputs);
    EXPECT_NO_THROW(registry.build());
}

// =============================================================================
// Multiple Problems
// =============================================================================

TEST_F(GraphValidatorTests, AllProblemsAreCollected)
{
    add("A", {}, {"x"});
    add("B", {"A"}, {"x"});
    add("C", {}, {"z"});
    registry.set_entry("A");
    registry.add_edge("B", END);

    auto errors = registry.validate()->errors();
    EXPECT_TRUE(has_category(errors, DiagnosticCategory::UnreachableTerminal));
    EXPECT_TRUE(has_category(errors, DiagnosticCategory::UnreachableNode));
    EXPECT_TRUE(has_category(errors, DiagnosticCategory::FieldOwnershipConflict));
    EXPECT_FALSE(has_category(errors, DiagnosticCategory::Cycle));
}
