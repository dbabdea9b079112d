#pragma once

#include <cstdint>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <vector>
#include "conduit/channel.hpp"
#include "conduit/events.pb.h"
#include "conduit/sequence_tracker.hpp"

namespace conduit {

/**
 * Router configuration. Defaults suit an in-process desktop workload.
 */
struct RouterConfig {
    size_t channel_capacity = 10000;
    bool track_sequences = true;
    bool enable_dlq = false;
    uint32_t max_retries = 3;
    size_t dlq_capacity = 10000;

    /**
     * Load from CONDUIT_CHANNEL_CAPACITY, CONDUIT_TRACK_SEQUENCES,
     * CONDUIT_ENABLE_DLQ, CONDUIT_MAX_RETRIES and CONDUIT_DLQ_CAPACITY,
     * falling back to the defaults above.
     *
     * @throws InvalidArgumentError on malformed or zero capacities
     */
    static RouterConfig from_env();
};

/**
 * Cumulative delivery statistics of one registered pattern.
 */
struct ChannelStats {
    uint64_t messages_sent = 0;
    uint64_t messages_received = 0;
    uint64_t messages_dropped = 0;
    size_t subscriber_count = 0;
    std::optional<std::string> last_error;
};

/**
 * A delivery that failed while the dead letter queue was enabled.
 */
struct DeadLetter {
    std::string pattern;
    std::string reason;
    RoutedEvent event;
};

/**
 * Routes domain events to every registered subject pattern that matches.
 *
 * Delivery is fire-and-forget per pattern: a full or abandoned channel
 * drops the event for that pattern only, bumps its drop counter and logs
 * a warning. Routing to the other patterns continues.
 *
 * Usage:
 *   SubjectRouter router;
 *   auto nodes = router.register_subject("event.graph.node.*");
 *   router.route_event(event);
 *   while (auto routed = nodes.try_recv()) { ... }
 */
class SubjectRouter {
public:
    /// @throws InvalidArgumentError if either capacity is zero
    explicit SubjectRouter(RouterConfig config = {});

    SubjectRouter(const SubjectRouter&) = delete;
    SubjectRouter& operator=(const SubjectRouter&) = delete;

    /**
     * Subscribe to a pattern.
     *
     * Registering a pattern that already exists bumps its subscriber count
     * and returns a receiver on the existing channel.
     *
     * @throws InvalidArgumentError if the pattern is empty
     * @throws RoutingError if the registry lock cannot be acquired
     */
    Receiver<RoutedEvent> register_subject(const std::string& pattern);

    /**
     * Remove a pattern and its channel.
     *
     * @return false if the pattern was not registered
     */
    bool deregister_subject(const std::string& pattern);

    /**
     * Stamp and deliver an event.
     *
     * @return the patterns the event was delivered to, in pattern order
     * @throws InvalidArgumentError if the event has no variant set
     * @throws RoutingError if a lock cannot be acquired
     * @throws SequenceOverflowError if a sequence counter is exhausted
     */
    std::vector<std::string> route_event(const DomainEvent& event);

    std::map<std::string, ChannelStats> get_stats() const;

    std::vector<std::string> patterns() const;

    /**
     * Re-attempt every dead letter against its pattern.
     *
     * Each attempt increments the letter's retry count. Letters that still
     * fail are kept until their retry count reaches max_retries, after
     * which they are discarded.
     *
     * @return the number of letters delivered
     */
    size_t retry_dead_letters();

    size_t dead_letter_count() const;

    std::vector<DeadLetter> dead_letters() const;

    const RouterConfig& config() const { return config_; }

    const SequenceTracker& sequences() const { return sequences_; }

private:
    struct SubjectChannel {
        SubjectChannel(std::string p, size_t capacity)
            : pattern(std::move(p)), channel(capacity) {}

        std::string pattern;
        Channel<RoutedEvent> channel;
        mutable std::mutex stats_mutex;
        ChannelStats stats;
    };

    SendResult deliver(SubjectChannel& target, const RoutedEvent& routed);
    void push_dead_letter(DeadLetter letter);

    RouterConfig config_;
    SequenceTracker sequences_;

    mutable std::shared_mutex registry_mutex_;
    std::map<std::string, std::unique_ptr<SubjectChannel>> channels_;

    mutable std::mutex dlq_mutex_;
    std::deque<DeadLetter> dead_letters_;
};

} // namespace conduit
