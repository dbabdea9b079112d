#include "conduit/event_store.hpp"

#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/subjects.hpp"

namespace conduit {

void InMemoryEventStore::append(const UUID& aggregate_id, const std::vector<DomainEvent>& events) {
    for (const auto& event : events) {
        if (!helpers::same_uuid(subjects::aggregate_id_of(event), aggregate_id)) {
            throw InvalidArgumentError("Event does not belong to aggregate "
                                       + helpers::uuid_to_string(aggregate_id));
        }
    }

    std::lock_guard<std::mutex> lock(mutex_);
    auto& stream = streams_[helpers::uuid_hex(aggregate_id)];
    stream.insert(stream.end(), events.begin(), events.end());
}

std::vector<DomainEvent> InMemoryEventStore::read(const UUID& aggregate_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = streams_.find(helpers::uuid_hex(aggregate_id));
    if (it == streams_.end()) {
        return {};
    }
    return it->second;
}

size_t InMemoryEventStore::size() const {
    std::lock_guard<std::mutex> lock(mutex_);
    size_t total = 0;
    for (const auto& [_, stream] : streams_) {
        total += stream.size();
    }
    return total;
}

} // namespace conduit
