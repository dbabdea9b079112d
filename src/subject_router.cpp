#include "conduit/subject_router.hpp"

#include "conduit/env.hpp"
#include "conduit/errors.hpp"
#include "conduit/helpers.hpp"
#include "conduit/logging.hpp"
#include "conduit/subjects.hpp"
#include "locking.hpp"

namespace conduit {

namespace {

constexpr const char* COMPONENT = "subject_router";

using ReadLock = std::shared_lock<std::shared_mutex>;
using WriteLock = std::unique_lock<std::shared_mutex>;
using Guard = std::lock_guard<std::mutex>;

const char* describe(SendResult result) {
    switch (result) {
        case SendResult::Sent: return "sent";
        case SendResult::Full: return "channel full";
        case SendResult::Disconnected: return "no live receiver";
    }
    return "unknown";
}

} // anonymous namespace

RouterConfig RouterConfig::from_env() {
    RouterConfig config;
    config.channel_capacity = env::get_uint("CONDUIT_CHANNEL_CAPACITY", config.channel_capacity);
    config.track_sequences = env::get_bool("CONDUIT_TRACK_SEQUENCES", config.track_sequences);
    config.enable_dlq = env::get_bool("CONDUIT_ENABLE_DLQ", config.enable_dlq);
    auto retries = env::get_uint("CONDUIT_MAX_RETRIES", config.max_retries);
    if (retries > UINT32_MAX) {
        throw InvalidArgumentError("CONDUIT_MAX_RETRIES is out of range");
    }
    config.max_retries = static_cast<uint32_t>(retries);
    config.dlq_capacity = env::get_uint("CONDUIT_DLQ_CAPACITY", config.dlq_capacity);

    if (config.channel_capacity == 0) {
        throw InvalidArgumentError("CONDUIT_CHANNEL_CAPACITY must be positive");
    }
    if (config.dlq_capacity == 0) {
        throw InvalidArgumentError("CONDUIT_DLQ_CAPACITY must be positive");
    }
    return config;
}

SubjectRouter::SubjectRouter(RouterConfig config) : config_(std::move(config)) {
    if (config_.channel_capacity == 0) {
        throw InvalidArgumentError("channel_capacity must be positive");
    }
    if (config_.dlq_capacity == 0) {
        throw InvalidArgumentError("dlq_capacity must be positive");
    }
}

Receiver<RoutedEvent> SubjectRouter::register_subject(const std::string& pattern) {
    if (pattern.empty()) {
        throw InvalidArgumentError("Subject pattern must not be empty");
    }

    auto lock = detail::acquire<WriteLock>(registry_mutex_, "registry");

    auto it = channels_.find(pattern);
    if (it != channels_.end()) {
        auto& existing = *it->second;
        size_t subscribers;
        {
            auto stats_lock = detail::acquire<Guard>(existing.stats_mutex, "channel stats");
            subscribers = ++existing.stats.subscriber_count;
        }
        log_debug(COMPONENT, "subscriber added", {
            {"pattern", pattern},
            {"subscribers", subscribers}
        });
        return existing.channel.subscribe();
    }

    auto created = std::make_unique<SubjectChannel>(pattern, config_.channel_capacity);
    created->stats.subscriber_count = 1;
    auto receiver = created->channel.subscribe();
    channels_.emplace(pattern, std::move(created));

    log_info(COMPONENT, "subject registered", {
        {"pattern", pattern},
        {"capacity", config_.channel_capacity}
    });
    return receiver;
}

bool SubjectRouter::deregister_subject(const std::string& pattern) {
    auto lock = detail::acquire<WriteLock>(registry_mutex_, "registry");
    if (channels_.erase(pattern) == 0) {
        return false;
    }
    log_info(COMPONENT, "subject deregistered", {{"pattern", pattern}});
    return true;
}

std::vector<std::string> SubjectRouter::route_event(const DomainEvent& event) {
    RoutedEvent routed;
    routed.set_subject(subjects::subject_for(event));

    if (config_.track_sequences) {
        const auto& aggregate_id = subjects::aggregate_id_of(event);
        routed.set_global_sequence(sequences_.next_global());
        routed.set_aggregate_sequence(sequences_.next_for(aggregate_id));
    }
    *routed.mutable_routed_at() = helpers::now();
    *routed.mutable_event() = event;

    std::vector<std::string> delivered;
    std::vector<DeadLetter> failed;
    bool matched = false;
    {
        auto lock = detail::acquire<ReadLock>(registry_mutex_, "registry");
        for (auto& [pattern, target] : channels_) {
            if (!subjects::matches(routed.subject(), pattern)) {
                continue;
            }
            matched = true;
            auto result = deliver(*target, routed);
            if (result == SendResult::Sent) {
                delivered.push_back(pattern);
            } else if (config_.enable_dlq) {
                failed.push_back({pattern, describe(result), routed});
            }
        }
    }

    for (auto& letter : failed) {
        push_dead_letter(std::move(letter));
    }

    if (!matched) {
        log_debug(COMPONENT, "no subscribers", {
            {"subject", routed.subject()},
            {"global_sequence", routed.global_sequence()}
        });
    }
    return delivered;
}

SendResult SubjectRouter::deliver(SubjectChannel& target, const RoutedEvent& routed) {
    auto result = target.channel.sender().try_send(routed);

    auto stats_lock = detail::acquire<Guard>(target.stats_mutex, "channel stats");
    if (result == SendResult::Sent) {
        ++target.stats.messages_sent;
        return result;
    }

    ++target.stats.messages_dropped;
    target.stats.last_error = std::string(describe(result));
    log_warn(COMPONENT, "event dropped", {
        {"pattern", target.pattern},
        {"subject", routed.subject()},
        {"reason", describe(result)},
        {"dropped", target.stats.messages_dropped}
    });
    return result;
}

void SubjectRouter::push_dead_letter(DeadLetter letter) {
    auto lock = detail::acquire<Guard>(dlq_mutex_, "dead letter");
    if (dead_letters_.size() >= config_.dlq_capacity) {
        const auto& oldest = dead_letters_.front();
        log_error(COMPONENT, "dead letter queue full, discarding oldest", {
            {"pattern", oldest.pattern},
            {"subject", oldest.event.subject()},
            {"global_sequence", oldest.event.global_sequence()}
        });
        dead_letters_.pop_front();
    }
    dead_letters_.push_back(std::move(letter));
}

std::map<std::string, ChannelStats> SubjectRouter::get_stats() const {
    auto lock = detail::acquire<ReadLock>(registry_mutex_, "registry");
    std::map<std::string, ChannelStats> result;
    for (const auto& [pattern, target] : channels_) {
        ChannelStats stats;
        {
            auto stats_lock = detail::acquire<Guard>(target->stats_mutex, "channel stats");
            stats = target->stats;
        }
        stats.messages_received = target->channel.sender().received_count();
        result.emplace(pattern, std::move(stats));
    }
    return result;
}

std::vector<std::string> SubjectRouter::patterns() const {
    auto lock = detail::acquire<ReadLock>(registry_mutex_, "registry");
    std::vector<std::string> result;
    result.reserve(channels_.size());
    for (const auto& [pattern, _] : channels_) {
        result.push_back(pattern);
    }
    return result;
}

size_t SubjectRouter::retry_dead_letters() {
    std::deque<DeadLetter> pending;
    {
        auto lock = detail::acquire<Guard>(dlq_mutex_, "dead letter");
        pending.swap(dead_letters_);
    }

    size_t delivered = 0;
    std::vector<DeadLetter> still_failing;
    {
        auto lock = detail::acquire<ReadLock>(registry_mutex_, "registry");
        for (auto& letter : pending) {
            letter.event.set_retry_count(letter.event.retry_count() + 1);

            auto it = channels_.find(letter.pattern);
            if (it == channels_.end()) {
                letter.reason = "pattern deregistered";
            } else {
                auto result = deliver(*it->second, letter.event);
                if (result == SendResult::Sent) {
                    ++delivered;
                    continue;
                }
                letter.reason = describe(result);
            }

            if (letter.event.retry_count() >= config_.max_retries) {
                log_error(COMPONENT, "dead letter discarded after retries", {
                    {"pattern", letter.pattern},
                    {"subject", letter.event.subject()},
                    {"global_sequence", letter.event.global_sequence()},
                    {"retry_count", letter.event.retry_count()},
                    {"reason", letter.reason}
                });
                continue;
            }
            still_failing.push_back(std::move(letter));
        }
    }

    for (auto& letter : still_failing) {
        push_dead_letter(std::move(letter));
    }

    if (delivered > 0) {
        log_info(COMPONENT, "dead letters redelivered", {{"count", delivered}});
    }
    return delivered;
}

size_t SubjectRouter::dead_letter_count() const {
    auto lock = detail::acquire<Guard>(dlq_mutex_, "dead letter");
    return dead_letters_.size();
}

std::vector<DeadLetter> SubjectRouter::dead_letters() const {
    auto lock = detail::acquire<Guard>(dlq_mutex_, "dead letter");
    return std::vector<DeadLetter>(dead_letters_.begin(), dead_letters_.end());
}

} // namespace conduit
