#pragma once

#include <string>
#include <variant>
#include "conduit/workflow.pb.h"

namespace conduit {

/**
 * Current state of a workflow. Exactly one alternative is held at any
 * time; each carries only the data relevant to that state.
 */
using WorkflowState = std::variant<
    DesignedState,
    ReadyState,
    RunningState,
    PausedState,
    CompletedState,
    FailedState>;

// Enumerators follow the WorkflowState alternative order.
enum class WorkflowStatus {
    Designed,
    Ready,
    Running,
    Paused,
    Completed,
    Failed,
};

inline WorkflowStatus status_of(const WorkflowState& state) {
    return static_cast<WorkflowStatus>(state.index());
}

inline const char* to_string(WorkflowStatus status) {
    switch (status) {
        case WorkflowStatus::Designed: return "Designed";
        case WorkflowStatus::Ready: return "Ready";
        case WorkflowStatus::Running: return "Running";
        case WorkflowStatus::Paused: return "Paused";
        case WorkflowStatus::Completed: return "Completed";
        case WorkflowStatus::Failed: return "Failed";
    }
    return "Unknown";
}

inline bool is_terminal(WorkflowStatus status) {
    return status == WorkflowStatus::Completed || status == WorkflowStatus::Failed;
}

} // namespace conduit
