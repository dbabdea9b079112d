#include "conduit/subject_consumer.hpp"

#include <algorithm>
#include <unordered_set>
#include "conduit/errors.hpp"
#include "conduit/subject_router.hpp"

namespace conduit {

SubjectConsumer::SubjectConsumer(SubjectRouter& router, std::vector<std::string> patterns)
    : patterns_(std::move(patterns)) {
    if (patterns_.empty()) {
        throw InvalidArgumentError("Consumer needs at least one pattern");
    }
    receivers_.reserve(patterns_.size());
    for (const auto& pattern : patterns_) {
        receivers_.push_back(router.register_subject(pattern));
    }
}

std::vector<RoutedEvent> SubjectConsumer::poll_events() {
    std::vector<RoutedEvent> batch;
    std::unordered_set<uint64_t> seen;

    for (auto& receiver : receivers_) {
        for (auto& routed : receiver.drain()) {
            // Unsequenced events (tracking disabled) cannot be told apart
            if (routed.global_sequence() != 0 && !seen.insert(routed.global_sequence()).second) {
                continue;
            }
            batch.push_back(std::move(routed));
        }
    }

    std::stable_sort(batch.begin(), batch.end(),
        [](const RoutedEvent& a, const RoutedEvent& b) {
            return a.global_sequence() < b.global_sequence();
        });
    return batch;
}

} // namespace conduit
