#pragma once

#include <mutex>
#include <vector>
#include "conduit/event_store.hpp"
#include "conduit/subject_router.hpp"
#include "conduit/workflow.hpp"

namespace conduit {

/**
 * Drives a workflow command end to end: load the aggregate from the
 * store, handle the command, persist the produced events, then route
 * them in the order they were produced.
 *
 * A rejected command leaves both the store and the router untouched.
 * Commands are handled one at a time so that store order and routing
 * order agree.
 */
class WorkflowCommandHandler {
public:
    WorkflowCommandHandler(EventStore& store, SubjectRouter& router)
        : store_(store), router_(router) {}

    /**
     * @return the events produced by the command
     * @throws ConduitError subclasses from the aggregate, the store or the router
     */
    std::vector<DomainEvent> handle(const WorkflowCommand& command);

    /**
     * Rehydrate a workflow from the store.
     */
    Workflow load(const UUID& workflow_id) const;

private:
    EventStore& store_;
    SubjectRouter& router_;
    std::mutex mutex_;
};

} // namespace conduit
