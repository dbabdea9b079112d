#include "conduit/sequence_tracker.hpp"

#include <limits>
#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "locking.hpp"

namespace conduit {

namespace {

uint64_t increment(uint64_t& counter, const std::string& what) {
    if (counter == std::numeric_limits<uint64_t>::max()) {
        throw SequenceOverflowError(what + " sequence exhausted");
    }
    return ++counter;
}

} // anonymous namespace

uint64_t SequenceTracker::next_global() {
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(global_mutex_, "global sequence");
    return increment(global_, "Global");
}

uint64_t SequenceTracker::next_for(const UUID& aggregate_id) {
    auto key = helpers::uuid_hex(aggregate_id);
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(aggregate_mutex_, "aggregate sequence");
    return increment(aggregates_[key], "Aggregate " + key);
}

void SequenceTracker::restore(const UUID& aggregate_id, uint64_t last_sequence) {
    auto key = helpers::uuid_hex(aggregate_id);
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(aggregate_mutex_, "aggregate sequence");
    aggregates_[key] = last_sequence;
}

uint64_t SequenceTracker::current_global() const {
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(global_mutex_, "global sequence");
    return global_;
}

uint64_t SequenceTracker::current_for(const UUID& aggregate_id) const {
    auto key = helpers::uuid_hex(aggregate_id);
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(aggregate_mutex_, "aggregate sequence");
    auto it = aggregates_.find(key);
    return it == aggregates_.end() ? 0 : it->second;
}

size_t SequenceTracker::tracked_aggregates() const {
    auto lock = detail::acquire<std::lock_guard<std::mutex>>(aggregate_mutex_, "aggregate sequence");
    return aggregates_.size();
}

} // namespace conduit
