#include <gtest/gtest.h>
#include <functional>
#include <set>
#include <string>
#include <vector>
#include <google/protobuf/util/message_differencer.h>
#include "conduit/builder.hpp"
#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/workflow.hpp"

using namespace conduit;
using google::protobuf::util::MessageDifferencer;

// =============================================================================
// Test Fixture
// =============================================================================

class WorkflowTest : public ::testing::Test {
protected:
    WorkflowTest() : id(helpers::new_uuid()), cmd(id) {}

    /// A (start, script) -> B (end, user task), not yet validated.
    Workflow designed() {
        Workflow wf;
        record(wf, cmd.create("Document review", "Review then approve", "alice"));
        record(wf, cmd.add_step(steps::script("A", "Prepare", "lua", "return 1"), true));
        record(wf, cmd.add_step(steps::user_task("B", "Approve"), false, true));
        record(wf, cmd.connect_steps("A", "B", "edge-a-b"));
        return wf;
    }

    Workflow ready() {
        auto wf = designed();
        record(wf, cmd.validate("alice"));
        return wf;
    }

    Workflow running() {
        auto wf = ready();
        record(wf, cmd.start("alice", {{"document", "spec.pdf"}}));
        return wf;
    }

    Workflow paused() {
        auto wf = running();
        record(wf, cmd.complete_step("A", std::string("B")));
        record(wf, cmd.pause("bob", "lunch"));
        return wf;
    }

    Workflow completed() {
        auto wf = running();
        record(wf, cmd.complete_step("A", std::string("B")));
        record(wf, cmd.complete_step("B"));
        return wf;
    }

    Workflow failed() {
        auto wf = running();
        record(wf, cmd.fail("service unavailable", std::string("A")));
        return wf;
    }

    void record(Workflow& wf, const WorkflowCommand& command) {
        auto events = wf.execute(command);
        log.insert(log.end(), events.begin(), events.end());
    }

    UUID id;
    WorkflowCommandBuilder cmd;
    std::vector<DomainEvent> log;
};

// =============================================================================
// End-to-end Scenario
// =============================================================================

TEST_F(WorkflowTest, Scenario_TwoStepWorkflow_ShouldRunToCompletion) {
    // Given a workflow with A (start) and B (end, user task) connected A -> B
    Workflow wf;
    wf.execute(cmd.create("Document review"));
    wf.execute(cmd.add_step(steps::script("A", "Prepare", "lua", "return 1"), true));
    wf.execute(cmd.add_step(steps::user_task("B", "Approve"), false, true));
    wf.execute(cmd.connect_steps("A", "B", "edge-a-b"));

    // When validated
    wf.execute(cmd.validate());
    // Then it is Ready
    EXPECT_EQ(wf.status(), WorkflowStatus::Ready);

    // When started
    wf.execute(cmd.start());
    // Then it is Running at A
    EXPECT_EQ(wf.status(), WorkflowStatus::Running);
    EXPECT_EQ(wf.current_step(), "A");

    // When A completes with next step B
    auto events = wf.execute(cmd.complete_step("A", std::string("B")));
    // Then it keeps running and has not completed
    EXPECT_EQ(events.size(), 1u);
    EXPECT_EQ(wf.status(), WorkflowStatus::Running);
    EXPECT_EQ(wf.current_step(), "B");

    // When B completes with no next step
    events = wf.execute(cmd.complete_step("B"));
    // Then the workflow completes
    ASSERT_EQ(events.size(), 2u);
    EXPECT_TRUE(events[0].workflow().has_step_completed());
    EXPECT_TRUE(events[1].workflow().has_completed());
    EXPECT_EQ(wf.status(), WorkflowStatus::Completed);
    EXPECT_FALSE(wf.execution_context().has_value());
}

// =============================================================================
// Transition Completeness
// =============================================================================

TEST_F(WorkflowTest, EveryIllegalStateCommandPair_ShouldFailWithInvalidState) {
    using Factory = std::function<Workflow()>;
    struct StateCase {
        const char* name;
        Factory make;
        std::set<std::string> legal;
    };

    std::vector<std::pair<std::string, WorkflowCommand>> commands = {
        {"create", cmd.create("Another")},
        {"add_step", cmd.add_step(steps::user_task("Z", "Extra"))},
        {"connect_steps", cmd.connect_steps("B", "A", "edge-b-a")},
        {"validate", cmd.validate()},
        {"start", cmd.start()},
        {"complete_step", cmd.complete_step("A", std::string("B"))},
        {"pause", cmd.pause()},
        {"resume", cmd.resume()},
        {"fail", cmd.fail("boom")},
    };

    std::vector<StateCase> states = {
        {"new", [] { return Workflow(); }, {"create"}},
        {"designed", [this] { return designed(); }, {"add_step", "connect_steps", "validate"}},
        {"ready", [this] { return ready(); }, {"start"}},
        {"running", [this] { return running(); }, {"complete_step", "pause", "fail"}},
        {"paused", [this] { return paused(); }, {"resume", "fail"}},
        {"completed", [this] { return completed(); }, {}},
        {"failed", [this] { return failed(); }, {}},
    };

    for (const auto& state : states) {
        for (const auto& [name, command] : commands) {
            auto wf = state.make();
            auto before = wf.snapshot();
            if (state.legal.count(name) > 0) {
                EXPECT_NO_THROW(wf.handle_command(command)) << state.name << " + " << name;
                continue;
            }
            EXPECT_THROW(wf.handle_command(command), InvalidStateError) << state.name << " + " << name;
            EXPECT_TRUE(MessageDifferencer::Equals(before, wf.snapshot())) << state.name << " + " << name;
        }
    }
}

TEST_F(WorkflowTest, CanTransition_ShouldFollowStateRelation) {
    EXPECT_TRUE(designed().can_transition(WorkflowStatus::Ready));
    EXPECT_FALSE(designed().can_transition(WorkflowStatus::Running));

    EXPECT_TRUE(ready().can_transition(WorkflowStatus::Running));
    EXPECT_TRUE(ready().can_transition(WorkflowStatus::Designed));

    auto run = running();
    EXPECT_TRUE(run.can_transition(WorkflowStatus::Paused));
    EXPECT_TRUE(run.can_transition(WorkflowStatus::Completed));
    EXPECT_TRUE(run.can_transition(WorkflowStatus::Failed));
    EXPECT_FALSE(run.can_transition(WorkflowStatus::Ready));

    EXPECT_TRUE(paused().can_transition(WorkflowStatus::Running));
    EXPECT_FALSE(paused().can_transition(WorkflowStatus::Completed));

    EXPECT_FALSE(completed().can_transition(WorkflowStatus::Running));
    EXPECT_TRUE(failed().can_transition(WorkflowStatus::Running));
}

TEST_F(WorkflowTest, CanTransition_FailedWithoutRecoveryPoint_ShouldNotRestart) {
    auto wf = running();
    wf.execute(cmd.fail("fatal"));
    EXPECT_FALSE(wf.can_transition(WorkflowStatus::Running));
}

// =============================================================================
// Replay
// =============================================================================

TEST_F(WorkflowTest, Rehydrate_ShouldReproduceAggregateByValue) {
    // Given an aggregate driven through its whole lifecycle
    auto original = paused();
    record(original, cmd.resume("bob"));
    record(original, cmd.complete_step("B", std::nullopt, {{"approved", "yes"}}));

    // When it is rebuilt from its events, twice
    auto first = Workflow::rehydrate(log);
    auto second = Workflow::rehydrate(log);

    // Then all three are equal by value
    EXPECT_TRUE(MessageDifferencer::Equals(original.snapshot(), first.snapshot()));
    EXPECT_TRUE(MessageDifferencer::Equals(first.snapshot(), second.snapshot()));
    EXPECT_EQ(first.version(), log.size());
}

TEST_F(WorkflowTest, Rehydrate_EveryPrefix_ShouldMatchStepwiseState) {
    Workflow stepwise;
    auto wf = completed();
    for (size_t n = 1; n <= log.size(); ++n) {
        stepwise.apply_event(log[n - 1]);
        std::vector<DomainEvent> prefix(log.begin(), log.begin() + n);
        EXPECT_TRUE(MessageDifferencer::Equals(stepwise.snapshot(), Workflow::rehydrate(prefix).snapshot()))
            << "prefix of " << n << " events";
    }
    EXPECT_TRUE(MessageDifferencer::Equals(stepwise.snapshot(), wf.snapshot()));
}

TEST_F(WorkflowTest, ApplyEvent_ShouldIgnoreOtherFamilies) {
    auto wf = designed();
    auto version = wf.version();

    DomainEvent node_event;
    *node_event.mutable_node()->mutable_added()->mutable_graph_id() = helpers::new_uuid();
    wf.apply_event(node_event);

    EXPECT_EQ(wf.version(), version);
}

TEST_F(WorkflowTest, ApplyEvent_ForAnotherWorkflow_ShouldThrowInvalidArgument) {
    auto wf = designed();
    WorkflowCommandBuilder other(helpers::new_uuid());
    auto stranger = Workflow().handle_command(other.create("Other"));

    EXPECT_THROW(wf.apply_event(stranger[0]), InvalidArgumentError);
}

TEST_F(WorkflowTest, ApplyEvent_OutOfStateOrder_ShouldThrowInvalidState) {
    auto wf = designed();
    auto resumed = paused().handle_command(cmd.resume());

    EXPECT_THROW(wf.apply_event(resumed[0]), InvalidStateError);
}

// =============================================================================
// Command Handling Is Pure
// =============================================================================

TEST_F(WorkflowTest, HandleCommand_ShouldNotMutateAggregate) {
    auto wf = running();
    auto before = wf.snapshot();

    auto events = wf.handle_command(cmd.complete_step("A", std::string("B")));

    EXPECT_EQ(events.size(), 1u);
    EXPECT_TRUE(MessageDifferencer::Equals(before, wf.snapshot()));
}

TEST_F(WorkflowTest, HandleCommand_ForAnotherWorkflow_ShouldThrowInvalidArgument) {
    auto wf = designed();
    WorkflowCommandBuilder other(helpers::new_uuid());

    EXPECT_THROW(wf.handle_command(other.validate()), InvalidArgumentError);
}

TEST_F(WorkflowTest, HandleCommand_WithoutCommand_ShouldThrowInvalidArgument) {
    WorkflowCommand empty;
    *empty.mutable_workflow_id() = id;
    EXPECT_THROW(Workflow().handle_command(empty), InvalidArgumentError);
}

TEST_F(WorkflowTest, Events_ShouldCarryCommandTracing) {
    auto command = WorkflowCommandBuilder(id).with_correlation_id("corr-1").create("Traced");

    auto events = Workflow().handle_command(command);

    ASSERT_EQ(events.size(), 1u);
    EXPECT_EQ(events[0].envelope().correlation_id(), "corr-1");
    EXPECT_EQ(events[0].envelope().causation_id(), command.envelope().id());
    EXPECT_FALSE(events[0].envelope().id().empty());
    EXPECT_NE(events[0].envelope().id(), command.envelope().id());
}

// =============================================================================
// Create
// =============================================================================

TEST_F(WorkflowTest, Create_WithEmptyName_ShouldThrowValidationError) {
    EXPECT_THROW(Workflow().handle_command(cmd.create("")), ValidationError);
}

TEST_F(WorkflowTest, Create_ShouldRecordMetadata) {
    Workflow wf;
    wf.execute(cmd.create("Review", "Two step review", "alice", {"docs", "legal"}));

    EXPECT_TRUE(wf.exists());
    EXPECT_TRUE(helpers::same_uuid(wf.id(), id));
    EXPECT_EQ(wf.name(), "Review");
    EXPECT_EQ(wf.description(), "Two step review");
    EXPECT_EQ(wf.status(), WorkflowStatus::Designed);
    EXPECT_EQ(wf.snapshot().tags_size(), 2);
    EXPECT_EQ(wf.version(), 1u);
}

// =============================================================================
// Steps And Transitions
// =============================================================================

TEST_F(WorkflowTest, AddStep_DuplicateId_ShouldThrowAndLeaveStepsUnchanged) {
    // Given a workflow with steps A and B
    auto wf = designed();
    auto before = wf.steps();

    // When A is added again with a different definition
    auto again = cmd.add_step(steps::user_task("A", "Replacement"));

    // Then it is rejected and nothing changes
    EXPECT_THROW(wf.execute(again), DuplicateEntityError);
    ASSERT_EQ(wf.steps().size(), before.size());
    EXPECT_EQ(wf.step("A")->name(), "Prepare");
    EXPECT_TRUE(wf.step("A")->has_script());
}

TEST_F(WorkflowTest, AddStep_WithoutIdOrType_ShouldThrowValidationError) {
    auto wf = designed();

    StepDefinition untyped;
    untyped.set_id("C");
    EXPECT_THROW(wf.handle_command(cmd.add_step(untyped)), ValidationError);
    EXPECT_THROW(wf.handle_command(cmd.add_step(steps::user_task("", "Nameless"))), ValidationError);
}

TEST_F(WorkflowTest, AddStep_FirstStep_ShouldBecomeStartByDefault) {
    Workflow wf;
    wf.execute(cmd.create("Defaults"));
    wf.execute(cmd.add_step(steps::user_task("first", "First")));
    wf.execute(cmd.add_step(steps::user_task("second", "Second")));

    EXPECT_EQ(wf.start_step(), "first");
}

TEST_F(WorkflowTest, AddStep_FlaggedStart_ShouldOverrideDefault) {
    Workflow wf;
    wf.execute(cmd.create("Override"));
    wf.execute(cmd.add_step(steps::user_task("first", "First")));
    wf.execute(cmd.add_step(steps::service_task("entry", "Entry", "billing", "charge"), true));
    wf.execute(cmd.add_step(steps::user_task("later", "Later")));

    EXPECT_EQ(wf.start_step(), "entry");
}

TEST_F(WorkflowTest, AddStep_EndFlags_ShouldAccumulate) {
    Workflow wf;
    wf.execute(cmd.create("Ends"));
    wf.execute(cmd.add_step(steps::user_task("a", "A"), true));
    wf.execute(cmd.add_step(steps::user_task("b", "B"), false, true));
    wf.execute(cmd.add_step(steps::user_task("c", "C"), false, true));

    EXPECT_EQ(wf.end_steps(), (std::set<std::string>{"b", "c"}));
}

TEST_F(WorkflowTest, ConnectSteps_UnknownStep_ShouldThrowEntityNotFound) {
    auto wf = designed();
    EXPECT_THROW(wf.handle_command(cmd.connect_steps("A", "missing", "edge-x")), EntityNotFoundError);
    EXPECT_THROW(wf.handle_command(cmd.connect_steps("missing", "B", "edge-y")), EntityNotFoundError);
}

TEST_F(WorkflowTest, ConnectSteps_Duplicate_ShouldThrowDuplicateEntity) {
    auto wf = designed();
    EXPECT_THROW(wf.handle_command(cmd.connect_steps("A", "B", "edge-other")), DuplicateEntityError);
    EXPECT_THROW(wf.handle_command(cmd.connect_steps("B", "A", "edge-a-b")), DuplicateEntityError);
}

TEST_F(WorkflowTest, ConnectSteps_WithCondition_ShouldKeepIt) {
    auto wf = designed();
    wf.execute(cmd.connect_steps("B", "A", "edge-retry", std::string("rejected")));

    ASSERT_EQ(wf.transitions().size(), 2u);
    EXPECT_EQ(wf.transitions()[1].condition(), "rejected");
}

// =============================================================================
// Validate
// =============================================================================

TEST_F(WorkflowTest, Validate_WithoutSteps_ShouldThrowValidationError) {
    Workflow wf;
    wf.execute(cmd.create("Empty"));
    EXPECT_THROW(wf.handle_command(cmd.validate()), ValidationError);
}

TEST_F(WorkflowTest, Validate_WithoutEndStep_ShouldThrowValidationError) {
    Workflow wf;
    wf.execute(cmd.create("Endless"));
    wf.execute(cmd.add_step(steps::user_task("a", "A"), true));

    try {
        wf.handle_command(cmd.validate());
        FAIL() << "Expected ValidationError";
    } catch (const ValidationError& e) {
        EXPECT_NE(std::string(e.what()).find("no end step"), std::string::npos);
    }
}

TEST_F(WorkflowTest, Validate_UnreachableStep_ShouldWarn) {
    auto wf = designed();
    wf.execute(cmd.add_step(steps::user_task("orphan", "Orphan")));

    auto events = wf.execute(cmd.validate());

    const auto& result = events[0].workflow().validated().result();
    EXPECT_TRUE(result.is_valid());
    ASSERT_EQ(result.warnings_size(), 1);
    EXPECT_NE(result.warnings(0).find("orphan"), std::string::npos);
}

// =============================================================================
// Execution
// =============================================================================

TEST_F(WorkflowTest, Start_ShouldCreateExecutionContext) {
    auto wf = running();

    ASSERT_TRUE(wf.execution_context().has_value());
    const auto& context = *wf.execution_context();
    EXPECT_FALSE(context.instance_id().empty());
    EXPECT_EQ(context.inputs().at("document"), "spec.pdf");
    EXPECT_EQ(context.variables().at("document"), "spec.pdf");
}

TEST_F(WorkflowTest, CompleteStep_ShouldRecordOutputs) {
    auto wf = running();

    wf.execute(cmd.complete_step("A", std::string("B"), {{"pages", "12"}}));

    const auto& context = *wf.execution_context();
    EXPECT_EQ(context.step_outputs().at("A").values().at("pages"), "12");
    EXPECT_EQ(context.variables().at("pages"), "12");
    EXPECT_EQ(wf.completed_steps(), std::vector<std::string>{"A"});
}

TEST_F(WorkflowTest, CompleteStep_UnknownSteps_ShouldThrowEntityNotFound) {
    auto wf = running();
    EXPECT_THROW(wf.handle_command(cmd.complete_step("missing")), EntityNotFoundError);
    EXPECT_THROW(wf.handle_command(cmd.complete_step("A", std::string("missing"))), EntityNotFoundError);
}

TEST_F(WorkflowTest, CompleteStep_NonEndStepWithoutNext_ShouldKeepRunning) {
    auto wf = running();

    auto events = wf.execute(cmd.complete_step("A"));

    EXPECT_EQ(events.size(), 1u);
    EXPECT_EQ(wf.status(), WorkflowStatus::Running);
    EXPECT_FALSE(wf.current_step().has_value());
}

TEST_F(WorkflowTest, Completion_ShouldCarryResultAndMetrics) {
    auto wf = running();
    wf.execute(cmd.complete_step("A", std::string("B"), {{"pages", "12"}}));
    wf.execute(cmd.complete_step("B", std::nullopt, {{"approved", "yes"}}));

    const auto& done = std::get<CompletedState>(wf.state());
    EXPECT_EQ(done.result().outputs().at("document"), "spec.pdf");
    EXPECT_EQ(done.result().outputs().at("pages"), "12");
    EXPECT_EQ(done.result().outputs().at("approved"), "yes");
    EXPECT_EQ(done.result().metrics().steps_executed(), 2u);
}

TEST_F(WorkflowTest, PauseResume_ShouldRestoreRunningExactly) {
    // Given a running workflow at B with A completed
    auto wf = running();
    wf.execute(cmd.complete_step("A", std::string("B")));
    auto before = std::get<RunningState>(wf.state());

    // When paused and resumed
    wf.execute(cmd.pause("bob", "lunch"));
    EXPECT_EQ(wf.status(), WorkflowStatus::Paused);
    EXPECT_EQ(std::get<PausedState>(wf.state()).resume_point(), "B");
    wf.execute(cmd.resume("bob"));

    // Then the running state is as it was
    EXPECT_TRUE(MessageDifferencer::Equals(before, std::get<RunningState>(wf.state())));
}

TEST_F(WorkflowTest, Fail_FromPaused_ShouldRecordResumePoint) {
    auto wf = paused();

    wf.execute(cmd.fail("operator abort", std::string("A")));

    const auto& failure = std::get<FailedState>(wf.state());
    EXPECT_EQ(failure.error(), "operator abort");
    EXPECT_EQ(failure.failed_step(), "B");
    EXPECT_EQ(failure.recovery_point(), "A");
    EXPECT_FALSE(wf.execution_context().has_value());
}

TEST_F(WorkflowTest, Fail_WithUnknownRecoveryPoint_ShouldThrowEntityNotFound) {
    auto wf = running();
    EXPECT_THROW(wf.handle_command(cmd.fail("boom", std::string("nowhere"))), EntityNotFoundError);
}

TEST_F(WorkflowTest, Fail_WithoutMessage_ShouldThrowValidationError) {
    auto wf = running();
    EXPECT_THROW(wf.handle_command(cmd.fail("")), ValidationError);
}

// =============================================================================
// Snapshot
// =============================================================================

TEST_F(WorkflowTest, Snapshot_ShouldListStepsById) {
    Workflow wf;
    wf.execute(cmd.create("Sorted"));
    wf.execute(cmd.add_step(steps::user_task("zeta", "Z")));
    wf.execute(cmd.add_step(steps::user_task("alpha", "A")));

    auto snap = wf.snapshot();

    ASSERT_EQ(snap.steps_size(), 2);
    EXPECT_EQ(snap.steps(0).id(), "alpha");
    EXPECT_EQ(snap.steps(1).id(), "zeta");
    EXPECT_TRUE(snap.has_designed());
    EXPECT_EQ(snap.start_step(), "zeta");
}
