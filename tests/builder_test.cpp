#include <gtest/gtest.h>
#include <string>
#include "conduit/builder.hpp"
#include "conduit/helpers.hpp"

using namespace conduit;

// =============================================================================
// WorkflowCommandBuilder Tests
// =============================================================================

class WorkflowCommandBuilderTest : public ::testing::Test {
protected:
    // 550e8400-e29b-41d4-a716-446655440000
    UUID test_workflow_id() {
        UUID id;
        id.set_value(std::string("\x55\x0e\x84\x00\xe2\x9b\x41\xd4\xa7\x16\x44\x66\x55\x44\x00\x00", 16));
        return id;
    }
};

TEST_F(WorkflowCommandBuilderTest, Build_WithExplicitTracing_ShouldSetEnvelope) {
    // When I build a command with explicit tracing values
    WorkflowCommandBuilder builder(test_workflow_id());
    builder.with_correlation_id("corr-123")
           .with_causation_id("cause-9")
           .with_metadata("tenant", "acme");

    auto command = builder.validate("alice");

    // Then the envelope and target carry them
    EXPECT_EQ(helpers::uuid_to_string(command.workflow_id()), "550e8400-e29b-41d4-a716-446655440000");
    EXPECT_EQ(command.envelope().correlation_id(), "corr-123");
    EXPECT_EQ(command.envelope().causation_id(), "cause-9");
    EXPECT_EQ(command.envelope().metadata().at("tenant"), "acme");
    EXPECT_TRUE(command.envelope().has_timestamp());
    EXPECT_EQ(command.validate().validated_by(), "alice");
}

TEST_F(WorkflowCommandBuilderTest, Build_WithoutCorrelationId_ShouldAutoGenerateOne) {
    WorkflowCommandBuilder builder(test_workflow_id());

    auto command = builder.pause("bob", "lunch");

    // Should be in UUID format (36 chars with dashes)
    EXPECT_EQ(command.envelope().correlation_id().length(), 36u);
    EXPECT_EQ(command.envelope().id().length(), 36u);
    EXPECT_TRUE(command.envelope().causation_id().empty());
}

TEST_F(WorkflowCommandBuilderTest, Build_TwoCommands_ShouldGetDistinctIds) {
    WorkflowCommandBuilder builder(test_workflow_id());
    builder.with_correlation_id("shared");

    auto first = builder.resume();
    auto second = builder.resume();

    EXPECT_NE(first.envelope().id(), second.envelope().id());
    EXPECT_EQ(first.envelope().correlation_id(), second.envelope().correlation_id());
}

TEST_F(WorkflowCommandBuilderTest, Create_ShouldSetAllFields) {
    WorkflowCommandBuilder builder(test_workflow_id());

    auto command = builder.create("Review", "Two steps", "alice", {"docs"});

    ASSERT_TRUE(command.has_create());
    EXPECT_EQ(command.create().name(), "Review");
    EXPECT_EQ(command.create().description(), "Two steps");
    EXPECT_EQ(command.create().created_by(), "alice");
    ASSERT_EQ(command.create().tags_size(), 1);
    EXPECT_EQ(command.create().tags(0), "docs");
}

TEST_F(WorkflowCommandBuilderTest, ConnectSteps_WithoutEdgeId_ShouldGenerateOne) {
    WorkflowCommandBuilder builder(test_workflow_id());

    auto command = builder.connect_steps("A", "B");

    EXPECT_FALSE(command.connect_steps().edge_id().empty());
    EXPECT_FALSE(command.connect_steps().has_condition());
}

TEST_F(WorkflowCommandBuilderTest, CompleteStep_ShouldOnlySetNextStepWhenGiven) {
    WorkflowCommandBuilder builder(test_workflow_id());

    auto last = builder.complete_step("B", std::nullopt, {{"approved", "yes"}});
    auto middle = builder.complete_step("A", std::string("B"));

    EXPECT_FALSE(last.complete_step().has_next_step());
    EXPECT_EQ(last.complete_step().outputs().at("approved"), "yes");
    EXPECT_EQ(middle.complete_step().next_step(), "B");
}

TEST_F(WorkflowCommandBuilderTest, Fail_ShouldCarryRecoveryPoint) {
    WorkflowCommandBuilder builder(test_workflow_id());

    auto command = builder.fail("timeout", std::string("A"));

    EXPECT_EQ(command.fail().error(), "timeout");
    EXPECT_EQ(command.fail().recovery_point(), "A");
}

// =============================================================================
// Step Factories
// =============================================================================

TEST(StepFactoryTest, EachFactory_ShouldSetItsType) {
    EXPECT_TRUE(steps::user_task("a", "A").has_user_task());
    EXPECT_TRUE(steps::service_task("b", "B", "billing", "charge").has_service_task());
    EXPECT_TRUE(steps::decision("c", "C", {{"approved", "d"}}).has_decision());
    EXPECT_TRUE(steps::parallel_gateway("d", "D", {}).has_parallel_gateway());
    EXPECT_TRUE(steps::event_wait("e", "E", "PaymentReceived", 5000).has_event_wait());
    EXPECT_TRUE(steps::script("f", "F", "lua", "return 1").has_script());
}

TEST(StepFactoryTest, Decision_ShouldKeepConditionOrder) {
    auto step = steps::decision("route", "Route", {{"amount > 100", "review"}, {"true", "approve"}});

    ASSERT_EQ(step.decision().conditions_size(), 2);
    EXPECT_EQ(step.decision().conditions(0).target_step(), "review");
    EXPECT_EQ(step.decision().conditions(1).expression(), "true");
}
