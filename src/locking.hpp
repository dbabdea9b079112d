#pragma once

#include <string>
#include <system_error>
#include "conduit/errors.hpp"

namespace conduit {
namespace detail {

/**
 * Lock a mutex, reporting failure as a RoutingError instead of letting
 * std::system_error escape.
 */
template<typename Lock, typename Mutex>
Lock acquire(Mutex& mutex, const std::string& what) {
    try {
        return Lock(mutex);
    } catch (const std::system_error& e) {
        throw RoutingError("Failed to acquire " + what + " lock: " + e.what());
    }
}

} // namespace detail
} // namespace conduit
