#include "conduit/env.hpp"

#include <algorithm>
#include <cctype>
#include <cstdlib>
#include "conduit/errors.hpp"

namespace conduit {
namespace env {

namespace {

std::string lowercase(std::string value) {
    std::transform(value.begin(), value.end(), value.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return value;
}

} // anonymous namespace

std::string get_string(const std::string& name, const std::string& fallback) {
    const char* value = std::getenv(name.c_str());
    return value ? value : fallback;
}

uint64_t get_uint(const std::string& name, uint64_t fallback) {
    const char* value = std::getenv(name.c_str());
    if (!value) return fallback;

    std::string text(value);
    if (text.empty() || !std::all_of(text.begin(), text.end(),
                                     [](unsigned char c) { return std::isdigit(c); })) {
        throw InvalidArgumentError(name + " must be a non-negative integer, got '" + text + "'");
    }
    try {
        return std::stoull(text);
    } catch (const std::out_of_range&) {
        throw InvalidArgumentError(name + " is out of range: " + text);
    }
}

bool get_bool(const std::string& name, bool fallback) {
    const char* value = std::getenv(name.c_str());
    if (!value) return fallback;

    auto text = lowercase(value);
    if (text == "1" || text == "true" || text == "yes" || text == "on") return true;
    if (text == "0" || text == "false" || text == "no" || text == "off") return false;
    throw InvalidArgumentError(name + " must be a boolean, got '" + std::string(value) + "'");
}

} // namespace env
} // namespace conduit
