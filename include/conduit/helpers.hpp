#pragma once

#include <chrono>
#include <string>
#include <google/protobuf/timestamp.pb.h>
#include "conduit/types.pb.h"

namespace conduit {

/**
 * Helper functions for working with conduit wire types.
 */
namespace helpers {

/**
 * Generate a random (version 4) UUID.
 */
UUID new_uuid();

/**
 * Get the UUID as a 32 character lowercase hex string.
 *
 * Used as the map key for per-aggregate bookkeeping.
 */
std::string uuid_hex(const UUID& id);

/**
 * Get the UUID in canonical 8-4-4-4-12 form.
 */
std::string uuid_to_string(const UUID& id);

/**
 * Generate a fresh identifier in canonical UUID form.
 */
inline std::string new_id() {
    return uuid_to_string(new_uuid());
}

/**
 * Check whether two UUIDs hold the same bytes.
 */
inline bool same_uuid(const UUID& a, const UUID& b) {
    return a.value() == b.value();
}

/**
 * Get the current timestamp as a protobuf Timestamp.
 */
google::protobuf::Timestamp now();

/**
 * Milliseconds elapsed from `from` to `to`, clamped at zero.
 */
uint64_t elapsed_ms(const google::protobuf::Timestamp& from,
                    const google::protobuf::Timestamp& to);

/**
 * Build the envelope of an event caused by a command.
 *
 * The event gets a fresh id and timestamp, inherits the command's
 * correlation id and metadata, and names the command as its cause.
 * A command without a correlation id starts a new correlation.
 */
Envelope caused_by(const Envelope& command_envelope);

} // namespace helpers
} // namespace conduit
