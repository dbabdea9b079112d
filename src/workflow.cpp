#include "conduit/workflow.hpp"

#include <deque>
#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/subjects.hpp"
#include "conduit/validation.hpp"

namespace conduit {

namespace {

DomainEvent caused_by(const WorkflowCommand& cmd) {
    DomainEvent event;
    *event.mutable_envelope() = helpers::caused_by(cmd.envelope());
    return event;
}

std::string in_state(WorkflowStatus status) {
    return std::string(" (workflow is ") + to_string(status) + ")";
}

template<typename S>
S& expect_state(WorkflowState& state, const char* event_name) {
    if (auto* current = std::get_if<S>(&state)) {
        return *current;
    }
    throw InvalidStateError(std::string("Cannot apply ") + event_name + in_state(status_of(state)));
}

std::string join(const google::protobuf::RepeatedPtrField<std::string>& parts) {
    std::string result;
    for (const auto& part : parts) {
        if (!result.empty()) result += "; ";
        result += part;
    }
    return result;
}

} // anonymous namespace

// ============================================================================
// Commands
// ============================================================================

std::vector<DomainEvent> Workflow::handle_command(const WorkflowCommand& command) const {
    if (command.workflow_id().value().empty()) {
        throw InvalidArgumentError("workflow_id is required");
    }
    if (exists_ && !helpers::same_uuid(command.workflow_id(), id_)) {
        throw InvalidArgumentError("Command for workflow " + helpers::uuid_to_string(command.workflow_id())
                                   + " sent to workflow " + helpers::uuid_to_string(id_));
    }

    switch (command.command_case()) {
        case WorkflowCommand::kCreate: return handle_create(command);
        case WorkflowCommand::kAddStep: return handle_add_step(command);
        case WorkflowCommand::kConnectSteps: return handle_connect_steps(command);
        case WorkflowCommand::kValidate: return handle_validate(command);
        case WorkflowCommand::kStart: return handle_start(command);
        case WorkflowCommand::kCompleteStep: return handle_complete_step(command);
        case WorkflowCommand::kPause: return handle_pause(command);
        case WorkflowCommand::kResume: return handle_resume(command);
        case WorkflowCommand::kFail: return handle_fail(command);
        case WorkflowCommand::COMMAND_NOT_SET: break;
    }
    throw InvalidArgumentError("Workflow command has no command set");
}

std::vector<DomainEvent> Workflow::execute(const WorkflowCommand& command) {
    auto events = handle_command(command);
    for (const auto& event : events) {
        apply_event(event);
    }
    return events;
}

std::vector<DomainEvent> Workflow::handle_create(const WorkflowCommand& cmd) const {
    const auto& create = cmd.create();

    // Guard
    validation::require_not_exists(exists_, "Workflow already exists");

    // Validate
    validation::require_not_empty(create.name(), "name");

    // Compute
    auto event = caused_by(cmd);
    auto* created = event.mutable_workflow()->mutable_created();
    *created->mutable_workflow_id() = cmd.workflow_id();
    created->set_name(create.name());
    created->set_description(create.description());
    created->set_created_by(create.created_by());
    *created->mutable_created_at() = event.envelope().timestamp();
    *created->mutable_tags() = create.tags();
    return {event};
}

std::vector<DomainEvent> Workflow::handle_add_step(const WorkflowCommand& cmd) const {
    const auto& add = cmd.add_step();
    const auto& step_id = add.step().id();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Designed,
                               "Steps can only be added while designing" + in_state(status()));

    // Validate
    validation::require_not_empty(step_id, "step id");
    if (add.step().type_case() == StepDefinition::TYPE_NOT_SET) {
        throw ValidationError("Step " + step_id + " has no type");
    }
    validation::require_unique(steps_.count(step_id) > 0, "Step " + step_id + " already exists");

    // Compute
    auto event = caused_by(cmd);
    auto* added = event.mutable_workflow()->mutable_step_added();
    *added->mutable_workflow_id() = cmd.workflow_id();
    *added->mutable_step() = add.step();
    added->set_start_step(add.start_step());
    added->set_end_step(add.end_step());
    return {event};
}

std::vector<DomainEvent> Workflow::handle_connect_steps(const WorkflowCommand& cmd) const {
    const auto& connect = cmd.connect_steps();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Designed,
                               "Steps can only be connected while designing" + in_state(status()));

    // Validate
    validation::require_not_empty(connect.from_step(), "from_step");
    validation::require_not_empty(connect.to_step(), "to_step");
    validation::require_not_empty(connect.edge_id(), "edge_id");
    validation::require_found(steps_.count(connect.from_step()) > 0,
                              "Step " + connect.from_step() + " not found");
    validation::require_found(steps_.count(connect.to_step()) > 0,
                              "Step " + connect.to_step() + " not found");
    validation::require_unique(has_transition(connect.from_step(), connect.to_step(), connect.edge_id()),
                               "Transition " + connect.from_step() + " -> " + connect.to_step()
                               + " already exists");

    // Compute
    auto event = caused_by(cmd);
    auto* connected = event.mutable_workflow()->mutable_steps_connected();
    *connected->mutable_workflow_id() = cmd.workflow_id();
    auto* transition = connected->mutable_transition();
    transition->set_from_step(connect.from_step());
    transition->set_to_step(connect.to_step());
    transition->set_edge_id(connect.edge_id());
    if (connect.has_condition()) {
        transition->set_condition(connect.condition());
    }
    return {event};
}

std::vector<DomainEvent> Workflow::handle_validate(const WorkflowCommand& cmd) const {
    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Designed,
                               "Only a designed workflow can be validated" + in_state(status()));

    // Validate
    auto result = structural_check();
    if (!result.is_valid()) {
        throw ValidationError("Workflow is invalid: " + join(result.errors()));
    }

    // Compute
    auto event = caused_by(cmd);
    auto* validated = event.mutable_workflow()->mutable_validated();
    *validated->mutable_workflow_id() = cmd.workflow_id();
    validated->set_validated_by(cmd.validate().validated_by());
    *validated->mutable_validated_at() = event.envelope().timestamp();
    *validated->mutable_result() = std::move(result);
    return {event};
}

std::vector<DomainEvent> Workflow::handle_start(const WorkflowCommand& cmd) const {
    const auto& start = cmd.start();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Ready,
                               "Workflow must be Ready to start" + in_state(status()));
    if (!start_step_) {
        throw ValidationError("Workflow has no start step");
    }

    // Compute
    auto event = caused_by(cmd);
    auto* started = event.mutable_workflow()->mutable_started();
    *started->mutable_workflow_id() = cmd.workflow_id();
    started->set_instance_id(start.instance_id().empty() ? helpers::new_id() : start.instance_id());
    started->set_started_by(start.started_by());
    *started->mutable_started_at() = event.envelope().timestamp();
    *started->mutable_inputs() = start.inputs();
    started->set_start_step(*start_step_);
    return {event};
}

std::vector<DomainEvent> Workflow::handle_complete_step(const WorkflowCommand& cmd) const {
    const auto& complete = cmd.complete_step();
    const auto& step_id = complete.step_id();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Running,
                               "Steps can only be completed while running" + in_state(status()));

    // Validate
    validation::require_not_empty(step_id, "step_id");
    validation::require_found(steps_.count(step_id) > 0, "Step " + step_id + " not found");
    if (complete.has_next_step()) {
        validation::require_found(steps_.count(complete.next_step()) > 0,
                                  "Next step " + complete.next_step() + " not found");
    }

    // Compute
    std::vector<DomainEvent> events;

    auto event = caused_by(cmd);
    auto* completed = event.mutable_workflow()->mutable_step_completed();
    *completed->mutable_workflow_id() = cmd.workflow_id();
    completed->set_step_id(step_id);
    *completed->mutable_completed_at() = event.envelope().timestamp();
    *completed->mutable_outputs() = complete.outputs();
    if (complete.has_next_step()) {
        completed->set_next_step(complete.next_step());
    }
    events.push_back(std::move(event));

    if (complete.has_next_step() || end_steps_.count(step_id) == 0) {
        return events;
    }

    const auto& running = std::get<RunningState>(state_);
    uint32_t executed = running.completed_steps_size();
    bool repeat = false;
    for (const auto& done : running.completed_steps()) {
        if (done == step_id) repeat = true;
    }
    if (!repeat) ++executed;

    auto finish = caused_by(cmd);
    auto* finished = finish.mutable_workflow()->mutable_completed();
    *finished->mutable_workflow_id() = cmd.workflow_id();
    *finished->mutable_completed_at() = finish.envelope().timestamp();
    auto* result = finished->mutable_result();
    if (context_) {
        *result->mutable_outputs() = context_->variables();
    }
    for (const auto& [key, value] : complete.outputs()) {
        (*result->mutable_outputs())[key] = value;
    }
    auto* metrics = result->mutable_metrics();
    metrics->set_steps_executed(executed);
    metrics->set_total_duration_ms(helpers::elapsed_ms(running.started_at(), finished->completed_at()));
    events.push_back(std::move(finish));
    return events;
}

std::vector<DomainEvent> Workflow::handle_pause(const WorkflowCommand& cmd) const {
    const auto& pause = cmd.pause();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Running,
                               "Only a running workflow can be paused" + in_state(status()));

    // Compute
    auto event = caused_by(cmd);
    auto* paused = event.mutable_workflow()->mutable_paused();
    *paused->mutable_workflow_id() = cmd.workflow_id();
    paused->set_paused_by(pause.paused_by());
    paused->set_reason(pause.reason());
    *paused->mutable_paused_at() = event.envelope().timestamp();
    paused->set_resume_point(std::get<RunningState>(state_).current_step());
    return {event};
}

std::vector<DomainEvent> Workflow::handle_resume(const WorkflowCommand& cmd) const {
    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status(status(), WorkflowStatus::Paused,
                               "Only a paused workflow can be resumed" + in_state(status()));

    // Compute
    auto event = caused_by(cmd);
    auto* resumed = event.mutable_workflow()->mutable_resumed();
    *resumed->mutable_workflow_id() = cmd.workflow_id();
    resumed->set_resumed_by(cmd.resume().resumed_by());
    *resumed->mutable_resumed_at() = event.envelope().timestamp();
    resumed->set_resume_point(std::get<PausedState>(state_).resume_point());
    return {event};
}

std::vector<DomainEvent> Workflow::handle_fail(const WorkflowCommand& cmd) const {
    const auto& fail = cmd.fail();

    // Guard
    validation::require_exists(exists_, "Workflow does not exist");
    validation::require_status_in(status(), {WorkflowStatus::Running, WorkflowStatus::Paused},
                                  "Only a running or paused workflow can fail" + in_state(status()));

    // Validate
    validation::require_not_empty(fail.error(), "error");
    if (fail.has_recovery_point()) {
        validation::require_found(steps_.count(fail.recovery_point()) > 0,
                                  "Recovery point " + fail.recovery_point() + " not found");
    }

    // Compute
    auto event = caused_by(cmd);
    auto* failed = event.mutable_workflow()->mutable_failed();
    *failed->mutable_workflow_id() = cmd.workflow_id();
    failed->set_error(fail.error());
    failed->set_failed_step(current_step().value_or(""));
    if (fail.has_recovery_point()) {
        failed->set_recovery_point(fail.recovery_point());
    }
    *failed->mutable_failed_at() = event.envelope().timestamp();
    return {event};
}

// ============================================================================
// Events
// ============================================================================

void Workflow::apply_event(const DomainEvent& event) {
    if (event.event_case() != DomainEvent::kWorkflow) {
        return;
    }

    const auto& target = subjects::aggregate_id_of(event);
    if (exists_ && !helpers::same_uuid(target, id_)) {
        throw InvalidArgumentError("Event for workflow " + helpers::uuid_to_string(target)
                                   + " applied to workflow " + helpers::uuid_to_string(id_));
    }

    const auto& wf = event.workflow();
    if (wf.event_case() == WorkflowEvent::kCreated) {
        validation::require_not_exists(exists_, "Workflow already exists");
    } else {
        validation::require_exists(exists_, "Cannot apply event to a workflow that does not exist");
    }

    switch (wf.event_case()) {
        case WorkflowEvent::kCreated: apply_created(wf.created()); break;
        case WorkflowEvent::kStepAdded: apply_step_added(wf.step_added()); break;
        case WorkflowEvent::kStepsConnected: apply_steps_connected(wf.steps_connected()); break;
        case WorkflowEvent::kValidated: apply_validated(wf.validated()); break;
        case WorkflowEvent::kStarted: apply_started(wf.started()); break;
        case WorkflowEvent::kStepCompleted: apply_step_completed(wf.step_completed()); break;
        case WorkflowEvent::kPaused: apply_paused(wf.paused()); break;
        case WorkflowEvent::kResumed: apply_resumed(wf.resumed()); break;
        case WorkflowEvent::kFailed: apply_failed(wf.failed()); break;
        case WorkflowEvent::kCompleted: apply_completed(wf.completed()); break;
        case WorkflowEvent::EVENT_NOT_SET: break;
    }
    ++version_;
}

void Workflow::apply_created(const WorkflowCreated& e) {
    exists_ = true;
    id_ = e.workflow_id();
    name_ = e.name();
    description_ = e.description();
    created_by_ = e.created_by();
    created_at_ = e.created_at();
    tags_.assign(e.tags().begin(), e.tags().end());
    state_ = DesignedState{};
}

void Workflow::apply_step_added(const StepAdded& e) {
    expect_state<DesignedState>(state_, "StepAdded");
    const auto& step_id = e.step().id();
    steps_[step_id] = e.step();
    if (e.start_step() || !start_step_) {
        start_step_ = step_id;
    }
    if (e.end_step()) {
        end_steps_.insert(step_id);
    }
}

void Workflow::apply_steps_connected(const StepsConnected& e) {
    expect_state<DesignedState>(state_, "StepsConnected");
    transitions_.push_back(e.transition());
}

void Workflow::apply_validated(const WorkflowValidated& e) {
    expect_state<DesignedState>(state_, "WorkflowValidated");
    ReadyState ready;
    *ready.mutable_validated_at() = e.validated_at();
    ready.set_validated_by(e.validated_by());
    state_ = std::move(ready);
}

void Workflow::apply_started(const WorkflowStarted& e) {
    expect_state<ReadyState>(state_, "WorkflowStarted");
    RunningState running;
    *running.mutable_started_at() = e.started_at();
    running.set_current_step(e.start_step());
    state_ = std::move(running);

    ExecutionContext context;
    context.set_instance_id(e.instance_id());
    *context.mutable_inputs() = e.inputs();
    *context.mutable_variables() = e.inputs();
    context_ = std::move(context);
}

void Workflow::apply_step_completed(const StepCompleted& e) {
    auto& running = expect_state<RunningState>(state_, "StepCompleted");

    bool repeat = false;
    for (const auto& done : running.completed_steps()) {
        if (done == e.step_id()) repeat = true;
    }
    if (!repeat) {
        running.add_completed_steps(e.step_id());
    }
    running.set_current_step(e.has_next_step() ? e.next_step() : "");

    if (context_) {
        auto& outputs = (*context_->mutable_step_outputs())[e.step_id()];
        *outputs.mutable_values() = e.outputs();
        for (const auto& [key, value] : e.outputs()) {
            (*context_->mutable_variables())[key] = value;
        }
    }
}

void Workflow::apply_paused(const WorkflowPaused& e) {
    const auto& running = expect_state<RunningState>(state_, "WorkflowPaused");
    PausedState paused;
    *paused.mutable_paused_at() = e.paused_at();
    paused.set_paused_by(e.paused_by());
    paused.set_resume_point(e.resume_point());
    *paused.mutable_started_at() = running.started_at();
    *paused.mutable_completed_steps() = running.completed_steps();
    state_ = std::move(paused);
}

void Workflow::apply_resumed(const WorkflowResumed& e) {
    const auto& paused = expect_state<PausedState>(state_, "WorkflowResumed");
    RunningState running;
    *running.mutable_started_at() = paused.started_at();
    running.set_current_step(e.resume_point());
    *running.mutable_completed_steps() = paused.completed_steps();
    state_ = std::move(running);
}

void Workflow::apply_failed(const WorkflowFailed& e) {
    if (!std::holds_alternative<RunningState>(state_) && !std::holds_alternative<PausedState>(state_)) {
        throw InvalidStateError("Cannot apply WorkflowFailed" + in_state(status()));
    }
    FailedState failed;
    *failed.mutable_failed_at() = e.failed_at();
    failed.set_error(e.error());
    failed.set_failed_step(e.failed_step());
    if (e.has_recovery_point()) {
        failed.set_recovery_point(e.recovery_point());
    }
    state_ = std::move(failed);
    context_.reset();
}

void Workflow::apply_completed(const WorkflowCompleted& e) {
    expect_state<RunningState>(state_, "WorkflowCompleted");
    CompletedState completed;
    *completed.mutable_completed_at() = e.completed_at();
    *completed.mutable_result() = e.result();
    state_ = std::move(completed);
    context_.reset();
}

// ============================================================================
// Queries
// ============================================================================

Workflow Workflow::rehydrate(const std::vector<DomainEvent>& events) {
    Workflow workflow;
    for (const auto& event : events) {
        workflow.apply_event(event);
    }
    return workflow;
}

bool Workflow::can_transition(WorkflowStatus to) const {
    switch (status()) {
        case WorkflowStatus::Designed:
            return to == WorkflowStatus::Ready;
        case WorkflowStatus::Ready:
            return to == WorkflowStatus::Running || to == WorkflowStatus::Designed;
        case WorkflowStatus::Running:
            return to == WorkflowStatus::Paused || to == WorkflowStatus::Completed
                || to == WorkflowStatus::Failed;
        case WorkflowStatus::Paused:
            return to == WorkflowStatus::Running || to == WorkflowStatus::Failed;
        case WorkflowStatus::Completed:
            return false;
        case WorkflowStatus::Failed:
            return to == WorkflowStatus::Running
                && std::get<FailedState>(state_).has_recovery_point();
    }
    return false;
}

const StepDefinition* Workflow::step(const std::string& step_id) const {
    auto it = steps_.find(step_id);
    return it == steps_.end() ? nullptr : &it->second;
}

std::optional<std::string> Workflow::current_step() const {
    if (const auto* running = std::get_if<RunningState>(&state_)) {
        if (!running->current_step().empty()) return running->current_step();
    } else if (const auto* paused = std::get_if<PausedState>(&state_)) {
        if (!paused->resume_point().empty()) return paused->resume_point();
    }
    return std::nullopt;
}

std::vector<std::string> Workflow::completed_steps() const {
    if (const auto* running = std::get_if<RunningState>(&state_)) {
        return {running->completed_steps().begin(), running->completed_steps().end()};
    }
    if (const auto* paused = std::get_if<PausedState>(&state_)) {
        return {paused->completed_steps().begin(), paused->completed_steps().end()};
    }
    return {};
}

bool Workflow::has_transition(const std::string& from, const std::string& to,
                              const std::string& edge_id) const {
    for (const auto& t : transitions_) {
        if (t.edge_id() == edge_id) return true;
        if (t.from_step() == from && t.to_step() == to) return true;
    }
    return false;
}

ValidationResult Workflow::structural_check() const {
    ValidationResult result;
    if (steps_.empty()) {
        result.add_errors("Workflow has no steps");
    }
    if (!start_step_) {
        result.add_errors("Workflow has no start step");
    }
    if (end_steps_.empty()) {
        result.add_errors("Workflow has no end step");
    }
    result.set_is_valid(result.errors_size() == 0);
    if (!result.is_valid()) {
        return result;
    }

    // Reachability from the start step
    std::set<std::string> reached{*start_step_};
    std::deque<std::string> frontier{*start_step_};
    while (!frontier.empty()) {
        auto current = frontier.front();
        frontier.pop_front();
        for (const auto& t : transitions_) {
            if (t.from_step() == current && reached.insert(t.to_step()).second) {
                frontier.push_back(t.to_step());
            }
        }
    }
    for (const auto& [step_id, _] : steps_) {
        if (reached.count(step_id) == 0) {
            result.add_warnings("Step " + step_id + " is not reachable from the start step");
        }
    }
    return result;
}

WorkflowSnapshot Workflow::snapshot() const {
    WorkflowSnapshot snap;
    *snap.mutable_workflow_id() = id_;
    snap.set_name(name_);
    snap.set_description(description_);
    snap.set_created_by(created_by_);
    *snap.mutable_created_at() = created_at_;
    for (const auto& tag : tags_) {
        snap.add_tags(tag);
    }
    for (const auto& [_, def] : steps_) {
        *snap.add_steps() = def;
    }
    for (const auto& t : transitions_) {
        *snap.add_transitions() = t;
    }
    if (start_step_) {
        snap.set_start_step(*start_step_);
    }
    for (const auto& end : end_steps_) {
        snap.add_end_steps(end);
    }
    snap.set_version(version_);

    switch (status()) {
        case WorkflowStatus::Designed: *snap.mutable_designed() = std::get<DesignedState>(state_); break;
        case WorkflowStatus::Ready: *snap.mutable_ready() = std::get<ReadyState>(state_); break;
        case WorkflowStatus::Running: *snap.mutable_running() = std::get<RunningState>(state_); break;
        case WorkflowStatus::Paused: *snap.mutable_paused() = std::get<PausedState>(state_); break;
        case WorkflowStatus::Completed: *snap.mutable_completed() = std::get<CompletedState>(state_); break;
        case WorkflowStatus::Failed: *snap.mutable_failed() = std::get<FailedState>(state_); break;
    }
    if (context_) {
        *snap.mutable_execution_context() = *context_;
    }
    return snap;
}

} // namespace conduit
