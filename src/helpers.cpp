#include "conduit/helpers.hpp"

#include <random>
#include <google/protobuf/util/time_util.h>

namespace conduit {
namespace helpers {

namespace {

constexpr char kHexChars[] = "0123456789abcdef";

std::mt19937_64& rng() {
    thread_local std::mt19937_64 engine{std::random_device{}()};
    return engine;
}

} // anonymous namespace

UUID new_uuid() {
    std::string bytes(16, '\0');
    auto& engine = rng();
    for (size_t i = 0; i < bytes.size(); i += 8) {
        uint64_t word = engine();
        for (size_t j = 0; j < 8; ++j) {
            bytes[i + j] = static_cast<char>((word >> (j * 8)) & 0xff);
        }
    }
    // Set version (4) and variant (10xx)
    bytes[6] = static_cast<char>((bytes[6] & 0x0f) | 0x40);
    bytes[8] = static_cast<char>((bytes[8] & 0x3f) | 0x80);

    UUID id;
    id.set_value(bytes);
    return id;
}

std::string uuid_hex(const UUID& id) {
    const std::string& value = id.value();
    std::string hex;
    hex.reserve(value.size() * 2);

    for (unsigned char c : value) {
        hex.push_back(kHexChars[c >> 4]);
        hex.push_back(kHexChars[c & 0x0f]);
    }
    return hex;
}

std::string uuid_to_string(const UUID& id) {
    std::string hex = uuid_hex(id);
    if (hex.size() != 32) return hex;
    return hex.substr(0, 8) + "-" + hex.substr(8, 4) + "-" + hex.substr(12, 4) + "-" +
           hex.substr(16, 4) + "-" + hex.substr(20);
}

google::protobuf::Timestamp now() {
    auto time_point = std::chrono::system_clock::now();
    auto duration = time_point.time_since_epoch();
    auto seconds = std::chrono::duration_cast<std::chrono::seconds>(duration);
    auto nanos = std::chrono::duration_cast<std::chrono::nanoseconds>(duration - seconds);

    google::protobuf::Timestamp ts;
    ts.set_seconds(seconds.count());
    ts.set_nanos(static_cast<int32_t>(nanos.count()));
    return ts;
}

uint64_t elapsed_ms(const google::protobuf::Timestamp& from,
                    const google::protobuf::Timestamp& to) {
    using google::protobuf::util::TimeUtil;
    int64_t ms = TimeUtil::DurationToMilliseconds(to - from);
    return ms > 0 ? static_cast<uint64_t>(ms) : 0;
}

Envelope caused_by(const Envelope& command_envelope) {
    Envelope envelope;
    envelope.set_id(new_id());
    envelope.set_correlation_id(command_envelope.correlation_id().empty()
                                    ? new_id()
                                    : command_envelope.correlation_id());
    envelope.set_causation_id(command_envelope.id());
    *envelope.mutable_timestamp() = now();
    *envelope.mutable_metadata() = command_envelope.metadata();
    return envelope;
}

} // namespace helpers
} // namespace conduit
