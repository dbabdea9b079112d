#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <set>
#include <string>
#include <vector>
#include "conduit/events.pb.h"
#include "conduit/types.pb.h"
#include "conduit/workflow.pb.h"
#include "conduit/workflow_state.hpp"

namespace conduit {

/**
 * Event-sourced workflow aggregate.
 *
 * Commands are checked against the current state by handle_command(),
 * which never mutates the aggregate. The returned events are then applied
 * in order with apply_event(), the only operation that changes state.
 * Replaying the same ordered events on a fresh instance always yields an
 * equal aggregate.
 *
 * Transitions:
 *   (new)    --Create-------> Designed
 *   Designed --AddStep/ConnectSteps--> Designed
 *   Designed --Validate-----> Ready
 *   Ready    --Start--------> Running
 *   Running  --CompleteStep-> Running | Completed
 *   Running  --Pause--------> Paused --Resume--> Running
 *   Running | Paused --Fail-> Failed
 */
class Workflow {
public:
    Workflow() = default;

    /**
     * Rebuild an aggregate from its ordered event stream.
     */
    static Workflow rehydrate(const std::vector<DomainEvent>& events);

    /**
     * Validate a command against the current state and return the events
     * it produces.
     *
     * @throws InvalidStateError if the command is not legal in the current state
     * @throws ValidationError if a structural rule fails
     * @throws DuplicateEntityError if a step or transition already exists
     * @throws EntityNotFoundError if a referenced step does not exist
     * @throws InvalidArgumentError if the command is malformed
     */
    std::vector<DomainEvent> handle_command(const WorkflowCommand& command) const;

    /**
     * Apply one event. Events of other aggregate families are ignored.
     *
     * @throws InvalidArgumentError if the event targets another workflow
     * @throws InvalidStateError if the event cannot follow the current state
     */
    void apply_event(const DomainEvent& event);

    /**
     * Handle a command and apply the resulting events.
     */
    std::vector<DomainEvent> execute(const WorkflowCommand& command);

    /**
     * Whether the state machine allows moving from the current status to `to`.
     */
    bool can_transition(WorkflowStatus to) const;

    /**
     * Value form of the whole aggregate. Two aggregates are equal iff their
     * snapshots are.
     */
    WorkflowSnapshot snapshot() const;

    bool exists() const { return exists_; }
    const UUID& id() const { return id_; }
    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    uint64_t version() const { return version_; }

    const WorkflowState& state() const { return state_; }
    WorkflowStatus status() const { return status_of(state_); }

    const std::map<std::string, StepDefinition>& steps() const { return steps_; }
    const StepDefinition* step(const std::string& step_id) const;
    const std::vector<Transition>& transitions() const { return transitions_; }
    const std::optional<std::string>& start_step() const { return start_step_; }
    const std::set<std::string>& end_steps() const { return end_steps_; }

    /// Step being executed, when running or paused.
    std::optional<std::string> current_step() const;
    std::vector<std::string> completed_steps() const;

    /// Present only while the workflow is executing.
    const std::optional<ExecutionContext>& execution_context() const { return context_; }

private:
    std::vector<DomainEvent> handle_create(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_add_step(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_connect_steps(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_validate(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_start(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_complete_step(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_pause(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_resume(const WorkflowCommand& cmd) const;
    std::vector<DomainEvent> handle_fail(const WorkflowCommand& cmd) const;

    void apply_created(const WorkflowCreated& e);
    void apply_step_added(const StepAdded& e);
    void apply_steps_connected(const StepsConnected& e);
    void apply_validated(const WorkflowValidated& e);
    void apply_started(const WorkflowStarted& e);
    void apply_step_completed(const StepCompleted& e);
    void apply_paused(const WorkflowPaused& e);
    void apply_resumed(const WorkflowResumed& e);
    void apply_failed(const WorkflowFailed& e);
    void apply_completed(const WorkflowCompleted& e);

    bool has_transition(const std::string& from, const std::string& to,
                        const std::string& edge_id) const;
    ValidationResult structural_check() const;

    bool exists_ = false;
    UUID id_;
    std::string name_;
    std::string description_;
    std::string created_by_;
    google::protobuf::Timestamp created_at_;
    std::vector<std::string> tags_;

    std::map<std::string, StepDefinition> steps_;
    std::vector<Transition> transitions_;
    std::optional<std::string> start_step_;
    std::set<std::string> end_steps_;

    WorkflowState state_ = DesignedState{};
    std::optional<ExecutionContext> context_;
    uint64_t version_ = 0;
};

} // namespace conduit
