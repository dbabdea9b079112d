#pragma once

#include <initializer_list>
#include <string>
#include "conduit/errors.hpp"

namespace conduit {
namespace validation {

/**
 * Require that an aggregate exists (has prior events).
 */
inline void require_exists(bool exists, const std::string& message = "Aggregate does not exist") {
    if (!exists) {
        throw InvalidStateError(message);
    }
}

/**
 * Require that an aggregate does not exist yet.
 */
inline void require_not_exists(bool exists, const std::string& message = "Aggregate already exists") {
    if (exists) {
        throw InvalidStateError(message);
    }
}

/**
 * Require that a string is not empty.
 */
inline void require_not_empty(const std::string& value, const std::string& field_name = "value") {
    if (value.empty()) {
        throw ValidationError(field_name + " must not be empty");
    }
}

/**
 * Require that a status matches an expected value.
 */
template<typename T>
void require_status(T actual, T expected, const std::string& message = "Invalid status") {
    if (actual != expected) {
        throw InvalidStateError(message);
    }
}

/**
 * Require that a status is one of the allowed values.
 */
template<typename T>
void require_status_in(T actual, std::initializer_list<T> allowed,
                       const std::string& message = "Invalid status") {
    for (const auto& candidate : allowed) {
        if (actual == candidate) return;
    }
    throw InvalidStateError(message);
}

/**
 * Require that a referenced child entity exists.
 */
inline void require_found(bool found, const std::string& message) {
    if (!found) {
        throw EntityNotFoundError(message);
    }
}

/**
 * Require that a child entity identity is not taken.
 */
inline void require_unique(bool taken, const std::string& message) {
    if (taken) {
        throw DuplicateEntityError(message);
    }
}

} // namespace validation
} // namespace conduit
