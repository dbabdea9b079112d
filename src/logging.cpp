#include "conduit/logging.hpp"

#include <atomic>
#include <chrono>
#include <cstdlib>
#include <iomanip>
#include <iostream>
#include <mutex>
#include <sstream>

namespace conduit {

namespace {

const char* level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
    }
    return "info";
}

LogLevel level_from_env() {
    const char* value = std::getenv("CONDUIT_LOG_LEVEL");
    return value ? parse_log_level(value) : LogLevel::Info;
}

std::atomic<LogLevel>& min_level() {
    static std::atomic<LogLevel> level{level_from_env()};
    return level;
}

std::mutex& output_mutex() {
    static std::mutex mutex;
    return mutex;
}

}  // anonymous namespace

void set_log_level(LogLevel level) {
    min_level().store(level);
}

LogLevel log_level() {
    return min_level().load();
}

LogLevel parse_log_level(const std::string& name) {
    if (name == "debug") return LogLevel::Debug;
    if (name == "warn" || name == "warning") return LogLevel::Warn;
    if (name == "error") return LogLevel::Error;
    return LogLevel::Info;
}

std::string now_iso8601() {
    auto now = std::chrono::system_clock::now();
    auto time_t = std::chrono::system_clock::to_time_t(now);
    std::tm utc{};
    gmtime_r(&time_t, &utc);
    std::stringstream ss;
    ss << std::put_time(&utc, "%FT%TZ");
    return ss.str();
}

void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields) {
    if (level < log_level()) return;

    nlohmann::json log_entry = {
        {"level", level_name(level)},
        {"message", message},
        {"component", component},
        {"timestamp", now_iso8601()}
    };
    for (auto& [key, value] : fields.items()) {
        log_entry[key] = value;
    }

    std::lock_guard<std::mutex> lock(output_mutex());
    std::cout << log_entry.dump() << std::endl;
}

}  // namespace conduit
