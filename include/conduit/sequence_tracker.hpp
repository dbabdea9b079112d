#pragma once

#include <cstdint>
#include <mutex>
#include <string>
#include <unordered_map>
#include "conduit/types.pb.h"

namespace conduit {

/**
 * Hands out the two sequence numbers stamped on every routed event.
 *
 * The global counter is shared by all aggregates; per-aggregate counters
 * are created lazily at zero. Each is guarded by its own mutex, held only
 * for the increment. The first value handed out is 1.
 */
class SequenceTracker {
public:
    SequenceTracker() = default;

    /// Resume the global counter after the last value previously handed out.
    explicit SequenceTracker(uint64_t last_global) : global_(last_global) {}

    /**
     * Resume an aggregate's counter after the last value previously handed
     * out, e.g. the aggregate's event count in the store.
     *
     * @throws RoutingError if the lock cannot be acquired
     */
    void restore(const UUID& aggregate_id, uint64_t last_sequence);

    /**
     * @throws SequenceOverflowError if the counter would wrap
     * @throws RoutingError if the lock cannot be acquired
     */
    uint64_t next_global();

    /**
     * @throws SequenceOverflowError if the counter would wrap
     * @throws RoutingError if the lock cannot be acquired
     */
    uint64_t next_for(const UUID& aggregate_id);

    uint64_t current_global() const;

    /// Last value handed out for the aggregate, or 0 if none.
    uint64_t current_for(const UUID& aggregate_id) const;

    size_t tracked_aggregates() const;

private:
    mutable std::mutex global_mutex_;
    uint64_t global_ = 0;

    mutable std::mutex aggregate_mutex_;
    std::unordered_map<std::string, uint64_t> aggregates_;
};

} // namespace conduit
