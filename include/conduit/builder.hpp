#pragma once

#include <map>
#include <optional>
#include <string>
#include <utility>
#include <vector>
#include "conduit/helpers.hpp"
#include "conduit/types.pb.h"
#include "conduit/workflow.pb.h"

namespace conduit {

/**
 * Fluent builder for workflow commands.
 *
 * Fills the envelope of every command it builds: a fresh id, the
 * timestamp, metadata, and a correlation id that is generated when none
 * was supplied.
 *
 * Example:
 *   WorkflowCommandBuilder builder(workflow_id);
 *   auto cmd = builder
 *       .with_correlation_id("corr-123")
 *       .add_step(steps::user_task("review", "Review"), false, true);
 */
class WorkflowCommandBuilder {
public:
    explicit WorkflowCommandBuilder(UUID workflow_id)
        : workflow_id_(std::move(workflow_id)) {}

    /**
     * Set the correlation ID for request tracing.
     *
     * If not set, each built command starts a new correlation.
     */
    WorkflowCommandBuilder& with_correlation_id(const std::string& id) {
        correlation_id_ = id;
        return *this;
    }

    /**
     * Name the command or event that caused this command.
     */
    WorkflowCommandBuilder& with_causation_id(const std::string& id) {
        causation_id_ = id;
        return *this;
    }

    WorkflowCommandBuilder& with_metadata(const std::string& key, const std::string& value) {
        metadata_[key] = value;
        return *this;
    }

    const UUID& workflow_id() const { return workflow_id_; }

    WorkflowCommand create(const std::string& name, const std::string& description = "",
                           const std::string& created_by = "",
                           const std::vector<std::string>& tags = {}) const {
        auto cmd = base();
        auto* create = cmd.mutable_create();
        create->set_name(name);
        create->set_description(description);
        create->set_created_by(created_by);
        for (const auto& tag : tags) {
            create->add_tags(tag);
        }
        return cmd;
    }

    WorkflowCommand add_step(const StepDefinition& step, bool start_step = false,
                             bool end_step = false) const {
        auto cmd = base();
        auto* add = cmd.mutable_add_step();
        *add->mutable_step() = step;
        add->set_start_step(start_step);
        add->set_end_step(end_step);
        return cmd;
    }

    /**
     * Connect two steps. An empty edge id is replaced by a generated one.
     */
    WorkflowCommand connect_steps(const std::string& from_step, const std::string& to_step,
                                  const std::string& edge_id = "",
                                  const std::optional<std::string>& condition = std::nullopt) const {
        auto cmd = base();
        auto* connect = cmd.mutable_connect_steps();
        connect->set_from_step(from_step);
        connect->set_to_step(to_step);
        connect->set_edge_id(edge_id.empty() ? helpers::new_id() : edge_id);
        if (condition) {
            connect->set_condition(*condition);
        }
        return cmd;
    }

    WorkflowCommand validate(const std::string& validated_by = "") const {
        auto cmd = base();
        cmd.mutable_validate()->set_validated_by(validated_by);
        return cmd;
    }

    WorkflowCommand start(const std::string& started_by = "",
                          const std::map<std::string, std::string>& inputs = {},
                          const std::string& instance_id = "") const {
        auto cmd = base();
        auto* start = cmd.mutable_start();
        start->set_instance_id(instance_id);
        start->set_started_by(started_by);
        for (const auto& [key, value] : inputs) {
            (*start->mutable_inputs())[key] = value;
        }
        return cmd;
    }

    WorkflowCommand complete_step(const std::string& step_id,
                                  const std::optional<std::string>& next_step = std::nullopt,
                                  const std::map<std::string, std::string>& outputs = {}) const {
        auto cmd = base();
        auto* complete = cmd.mutable_complete_step();
        complete->set_step_id(step_id);
        if (next_step) {
            complete->set_next_step(*next_step);
        }
        for (const auto& [key, value] : outputs) {
            (*complete->mutable_outputs())[key] = value;
        }
        return cmd;
    }

    WorkflowCommand pause(const std::string& paused_by = "", const std::string& reason = "") const {
        auto cmd = base();
        cmd.mutable_pause()->set_paused_by(paused_by);
        cmd.mutable_pause()->set_reason(reason);
        return cmd;
    }

    WorkflowCommand resume(const std::string& resumed_by = "") const {
        auto cmd = base();
        cmd.mutable_resume()->set_resumed_by(resumed_by);
        return cmd;
    }

    WorkflowCommand fail(const std::string& error,
                         const std::optional<std::string>& recovery_point = std::nullopt) const {
        auto cmd = base();
        cmd.mutable_fail()->set_error(error);
        if (recovery_point) {
            cmd.mutable_fail()->set_recovery_point(*recovery_point);
        }
        return cmd;
    }

private:
    WorkflowCommand base() const {
        WorkflowCommand cmd;
        *cmd.mutable_workflow_id() = workflow_id_;

        auto* envelope = cmd.mutable_envelope();
        envelope->set_id(helpers::new_id());
        envelope->set_correlation_id(correlation_id_.value_or(helpers::new_id()));
        if (causation_id_) {
            envelope->set_causation_id(*causation_id_);
        }
        *envelope->mutable_timestamp() = helpers::now();
        for (const auto& [key, value] : metadata_) {
            (*envelope->mutable_metadata())[key] = value;
        }
        return cmd;
    }

    UUID workflow_id_;
    std::optional<std::string> correlation_id_;
    std::optional<std::string> causation_id_;
    std::map<std::string, std::string> metadata_;
};

/**
 * Factories for step definitions of each type.
 */
namespace steps {

inline StepDefinition user_task(const std::string& id, const std::string& name) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    step.mutable_user_task();
    return step;
}

inline StepDefinition service_task(const std::string& id, const std::string& name,
                                   const std::string& service, const std::string& operation) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    step.mutable_service_task()->set_service(service);
    step.mutable_service_task()->set_operation(operation);
    return step;
}

inline StepDefinition decision(const std::string& id, const std::string& name,
                               const std::vector<std::pair<std::string, std::string>>& conditions) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    auto* decision = step.mutable_decision();
    for (const auto& [expression, target] : conditions) {
        auto* condition = decision->add_conditions();
        condition->set_expression(expression);
        condition->set_target_step(target);
    }
    return step;
}

inline StepDefinition parallel_gateway(const std::string& id, const std::string& name,
                                       const std::vector<std::string>& branches) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    auto* gateway = step.mutable_parallel_gateway();
    for (const auto& branch : branches) {
        gateway->add_branches(branch);
    }
    return step;
}

inline StepDefinition event_wait(const std::string& id, const std::string& name,
                                 const std::string& event_type, uint64_t timeout_ms) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    step.mutable_event_wait()->set_event_type(event_type);
    step.mutable_event_wait()->set_timeout_ms(timeout_ms);
    return step;
}

inline StepDefinition script(const std::string& id, const std::string& name,
                             const std::string& language, const std::string& code) {
    StepDefinition step;
    step.set_id(id);
    step.set_name(name);
    step.mutable_script()->set_language(language);
    step.mutable_script()->set_code(code);
    return step;
}

} // namespace steps
} // namespace conduit
