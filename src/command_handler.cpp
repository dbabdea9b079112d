#include "conduit/command_handler.hpp"

#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/logging.hpp"
#include "conduit/subjects.hpp"

namespace conduit {

namespace {
constexpr const char* COMPONENT = "workflow_handler";
}

std::vector<DomainEvent> WorkflowCommandHandler::handle(const WorkflowCommand& command) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto workflow = load(command.workflow_id());

    std::vector<DomainEvent> events;
    try {
        events = workflow.handle_command(command);
    } catch (const ConduitError& e) {
        log_warn(COMPONENT, "command rejected", {
            {"workflow_id", helpers::uuid_to_string(command.workflow_id())},
            {"correlation_id", command.envelope().correlation_id()},
            {"error", e.what()},
            {"code", static_cast<int>(e.status_code())}
        });
        throw;
    }

    store_.append(command.workflow_id(), events);

    for (const auto& event : events) {
        auto delivered = router_.route_event(event);
        log_info(COMPONENT, "event routed", {
            {"workflow_id", helpers::uuid_to_string(command.workflow_id())},
            {"event_type", subjects::event_type_of(event)},
            {"subject", subjects::subject_for(event)},
            {"correlation_id", event.envelope().correlation_id()},
            {"delivered_to", delivered}
        });
    }
    return events;
}

Workflow WorkflowCommandHandler::load(const UUID& workflow_id) const {
    return Workflow::rehydrate(store_.read(workflow_id));
}

} // namespace conduit
