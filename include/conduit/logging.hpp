#pragma once

#include <string>
#include <nlohmann/json.hpp>

namespace conduit {

enum class LogLevel { Debug = 0, Info = 1, Warn = 2, Error = 3 };

/// Set the minimum level that is written. Defaults to CONDUIT_LOG_LEVEL, else info.
void set_log_level(LogLevel level);
LogLevel log_level();

/// Parse "debug", "info", "warn" or "error". Unknown names map to info.
LogLevel parse_log_level(const std::string& name);

std::string now_iso8601();

/// Write one JSON log line to stdout.
void log(LogLevel level, const std::string& component, const std::string& message,
         const nlohmann::json& fields = {});

inline void log_debug(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Debug, component, message, fields);
}

inline void log_info(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Info, component, message, fields);
}

inline void log_warn(const std::string& component, const std::string& message,
                     const nlohmann::json& fields = {}) {
    log(LogLevel::Warn, component, message, fields);
}

inline void log_error(const std::string& component, const std::string& message,
                      const nlohmann::json& fields = {}) {
    log(LogLevel::Error, component, message, fields);
}

}  // namespace conduit
