#pragma once

#include <chrono>
#include <cstdint>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>
#include "conduit/events.pb.h"

namespace conduit {

struct SequencerConfig {
    /// Events buffered per aggregate before a gap is treated as fatal.
    size_t max_buffer_size = 1000;
    /// Largest tolerated distance between expected and received sequence.
    uint64_t max_sequence_gap = 100;
    std::chrono::milliseconds sequence_timeout{30000};

    /**
     * Load from CONDUIT_SEQUENCER_MAX_BUFFER, CONDUIT_SEQUENCER_MAX_GAP
     * and CONDUIT_SEQUENCER_TIMEOUT_MS.
     */
    static SequencerConfig from_env();
};

struct AggregateSequenceStats {
    uint64_t next_expected = 1;
    size_t pending = 0;
    std::optional<uint64_t> oldest_pending;
};

/**
 * Consumer-side reorder buffer.
 *
 * Releases routed events in aggregate_sequence order per aggregate.
 * Out-of-order events are held until their predecessors arrive or until
 * check_timeouts() gives up on the missing ones. Events without an
 * aggregate sequence pass straight through.
 */
class EventSequencer {
public:
    using Clock = std::chrono::steady_clock;

    explicit EventSequencer(SequencerConfig config = {});

    /**
     * Accept one event and return whatever became releasable, in order.
     *
     * @throws SequenceGapError if the gap or the aggregate's buffer is too large
     */
    std::vector<RoutedEvent> process(const RoutedEvent& routed, Clock::time_point now = Clock::now());

    /**
     * Force progression for aggregates whose oldest buffered event has
     * waited longer than the configured timeout.
     */
    std::vector<RoutedEvent> check_timeouts(Clock::time_point now = Clock::now());

    /// Keyed by aggregate id hex.
    std::map<std::string, AggregateSequenceStats> stats() const;

    const SequencerConfig& config() const { return config_; }

private:
    struct Buffered {
        RoutedEvent event;
        Clock::time_point received_at;
    };

    struct AggregateBuffer {
        uint64_t next_sequence = 1;
        std::map<uint64_t, Buffered> pending;
    };

    static void release_contiguous(AggregateBuffer& buffer, std::vector<RoutedEvent>& out);

    SequencerConfig config_;
    mutable std::mutex mutex_;
    std::unordered_map<std::string, AggregateBuffer> buffers_;
};

} // namespace conduit
