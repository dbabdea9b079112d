#pragma once

#include <map>
#include <mutex>
#include <string>
#include <vector>
#include "conduit/events.pb.h"
#include "conduit/types.pb.h"

namespace conduit {

/**
 * Durability boundary for domain events.
 *
 * Implementations must return an aggregate's events in the order they
 * were appended.
 */
class EventStore {
public:
    virtual ~EventStore() = default;

    virtual void append(const UUID& aggregate_id, const std::vector<DomainEvent>& events) = 0;

    virtual std::vector<DomainEvent> read(const UUID& aggregate_id) const = 0;
};

/**
 * In-process event store.
 */
class InMemoryEventStore : public EventStore {
public:
    void append(const UUID& aggregate_id, const std::vector<DomainEvent>& events) override;

    std::vector<DomainEvent> read(const UUID& aggregate_id) const override;

    /// Total number of events across all aggregates.
    size_t size() const;

private:
    mutable std::mutex mutex_;
    std::map<std::string, std::vector<DomainEvent>> streams_;
};

} // namespace conduit
