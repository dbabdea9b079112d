#pragma once

#include <string>
#include <vector>
#include "conduit/channel.hpp"
#include "conduit/events.pb.h"

namespace conduit {

class SubjectRouter;

/**
 * Client-side handle over one receiver per subscribed pattern.
 *
 * poll_events() drains every receiver without blocking and returns the
 * batch ordered by global sequence. An event matched by more than one of
 * the consumer's patterns is returned once.
 */
class SubjectConsumer {
public:
    /**
     * Register every pattern with the router.
     *
     * @throws InvalidArgumentError if no patterns are given
     * @throws RoutingError if the router registry is unavailable
     */
    SubjectConsumer(SubjectRouter& router, std::vector<std::string> patterns);

    std::vector<RoutedEvent> poll_events();

    const std::vector<std::string>& patterns() const { return patterns_; }

private:
    std::vector<std::string> patterns_;
    std::vector<Receiver<RoutedEvent>> receivers_;
};

} // namespace conduit
