#pragma once

#include <string>
#include <vector>
#include "conduit/events.pb.h"
#include "conduit/types.pb.h"

namespace conduit {

/**
 * Subject helpers for routing domain events.
 *
 * Subjects are dot-separated lowercase tokens: `event.<category>.<fact>`,
 * e.g. `event.workflow.step_added` or `event.graph.node.added`.
 * Patterns use the NATS wildcards `*` (exactly one token) and `>`
 * (one or more trailing tokens, final position only).
 */
namespace subjects {

constexpr const char* ROOT = "event";

/**
 * Map a domain event to its subject.
 *
 * @throws InvalidArgumentError if the event has no variant set
 */
std::string subject_for(const DomainEvent& event);

/**
 * Get the id of the aggregate the event belongs to
 * (the graph id for graph-family events, the workflow id otherwise).
 *
 * @throws InvalidArgumentError if the event has no variant set
 */
const UUID& aggregate_id_of(const DomainEvent& event);

/**
 * Get the event's type name, e.g. "NodeAdded" or "WorkflowCreated".
 *
 * @throws InvalidArgumentError if the event has no variant set
 */
std::string event_type_of(const DomainEvent& event);

/**
 * Split a subject or pattern on '.'.
 */
std::vector<std::string> tokenize(const std::string& subject);

/**
 * Check whether a subject matches a pattern.
 *
 * Wildcards only occupy whole tokens; `ab*` is a literal token.
 * `event.graph.>` matches `event.graph.node` but not `event.graph`.
 */
bool matches(const std::string& subject, const std::string& pattern);

} // namespace subjects
} // namespace conduit
