#include "conduit/event_sequencer.hpp"

#include "conduit/env.hpp"
#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/logging.hpp"
#include "conduit/subjects.hpp"

namespace conduit {

namespace {
constexpr const char* COMPONENT = "event_sequencer";
}

SequencerConfig SequencerConfig::from_env() {
    SequencerConfig config;
    config.max_buffer_size = env::get_uint("CONDUIT_SEQUENCER_MAX_BUFFER", config.max_buffer_size);
    config.max_sequence_gap = env::get_uint("CONDUIT_SEQUENCER_MAX_GAP", config.max_sequence_gap);
    config.sequence_timeout = std::chrono::milliseconds(
        env::get_uint("CONDUIT_SEQUENCER_TIMEOUT_MS", config.sequence_timeout.count()));
    return config;
}

EventSequencer::EventSequencer(SequencerConfig config) : config_(std::move(config)) {}

void EventSequencer::release_contiguous(AggregateBuffer& buffer, std::vector<RoutedEvent>& out) {
    auto it = buffer.pending.begin();
    while (it != buffer.pending.end() && it->first == buffer.next_sequence) {
        out.push_back(std::move(it->second.event));
        ++buffer.next_sequence;
        it = buffer.pending.erase(it);
    }
}

std::vector<RoutedEvent> EventSequencer::process(const RoutedEvent& routed, Clock::time_point now) {
    std::vector<RoutedEvent> ready;
    uint64_t sequence = routed.aggregate_sequence();
    if (sequence == 0) {
        ready.push_back(routed);
        return ready;
    }

    auto key = helpers::uuid_hex(subjects::aggregate_id_of(routed.event()));

    std::lock_guard<std::mutex> lock(mutex_);
    auto& buffer = buffers_[key];

    if (sequence < buffer.next_sequence || buffer.pending.count(sequence) > 0) {
        log_warn(COMPONENT, "duplicate sequence dropped", {
            {"aggregate_id", key},
            {"sequence", sequence},
            {"expected", buffer.next_sequence}
        });
        return ready;
    }

    if (sequence == buffer.next_sequence) {
        ready.push_back(routed);
        ++buffer.next_sequence;
        release_contiguous(buffer, ready);
        return ready;
    }

    uint64_t gap = sequence - buffer.next_sequence;
    if (gap > config_.max_sequence_gap) {
        log_error(COMPONENT, "sequence gap too large", {
            {"aggregate_id", key},
            {"sequence", sequence},
            {"expected", buffer.next_sequence},
            {"max_gap", config_.max_sequence_gap}
        });
        throw SequenceGapError("Sequence gap of " + std::to_string(gap) + " for aggregate " + key
                               + " exceeds " + std::to_string(config_.max_sequence_gap));
    }
    if (buffer.pending.size() >= config_.max_buffer_size) {
        throw SequenceGapError("Reorder buffer full for aggregate " + key);
    }

    buffer.pending.emplace(sequence, Buffered{routed, now});
    log_debug(COMPONENT, "event buffered", {
        {"aggregate_id", key},
        {"sequence", sequence},
        {"expected", buffer.next_sequence}
    });
    return ready;
}

std::vector<RoutedEvent> EventSequencer::check_timeouts(Clock::time_point now) {
    std::vector<RoutedEvent> forced;
    std::lock_guard<std::mutex> lock(mutex_);

    for (auto& [key, buffer] : buffers_) {
        if (buffer.pending.empty()) continue;

        auto oldest = buffer.pending.begin()->second.received_at;
        for (const auto& [_, buffered] : buffer.pending) {
            if (buffered.received_at < oldest) oldest = buffered.received_at;
        }
        if (now - oldest <= config_.sequence_timeout) continue;

        uint64_t skip_to = buffer.pending.begin()->first;
        log_warn(COMPONENT, "forcing sequence progression", {
            {"aggregate_id", key},
            {"from", buffer.next_sequence},
            {"to", skip_to}
        });
        buffer.next_sequence = skip_to;
        release_contiguous(buffer, forced);
    }
    return forced;
}

std::map<std::string, AggregateSequenceStats> EventSequencer::stats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    std::map<std::string, AggregateSequenceStats> result;
    for (const auto& [key, buffer] : buffers_) {
        AggregateSequenceStats s;
        s.next_expected = buffer.next_sequence;
        s.pending = buffer.pending.size();
        if (!buffer.pending.empty()) {
            s.oldest_pending = buffer.pending.begin()->first;
        }
        result.emplace(key, s);
    }
    return result;
}

} // namespace conduit
