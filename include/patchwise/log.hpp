#pragma once

#include <string>
#include <string_view>

namespace patchwise {

enum class LogLevel {
    Debug,
    Info,
    Warn,
    Error
};

std::string timestamp_now();

LogLevel parse_log_level(std::string_view name);

// Threshold defaults to PATCHWISE_LOG_LEVEL, or Warn when unset.
LogLevel log_threshold();
void set_log_threshold(LogLevel level);

// Writes `[component timestamp] message` to std::clog when `level` passes the threshold.
void log(LogLevel level, std::string_view component, std::string_view message);

inline void log_debug(std::string_view component, std::string_view message) { log(LogLevel::Debug, component, message); }
inline void log_info(std::string_view component, std::string_view message) { log(LogLevel::Info, component, message); }
inline void log_warn(std::string_view component, std::string_view message) { log(LogLevel::Warn, component, message); }
inline void log_error(std::string_view component, std::string_view message) { log(LogLevel::Error, component, message); }

} // namespace patchwise
