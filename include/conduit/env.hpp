#pragma once

#include <cstdint>
#include <string>

namespace conduit {

/**
 * Typed environment variable lookups for configuration loaders.
 *
 * Unset variables yield the fallback. Set but malformed values throw
 * InvalidArgumentError naming the variable.
 */
namespace env {

std::string get_string(const std::string& name, const std::string& fallback);

uint64_t get_uint(const std::string& name, uint64_t fallback);

/// Accepts 1/0, true/false, yes/no, on/off.
bool get_bool(const std::string& name, bool fallback);

} // namespace env
} // namespace conduit
