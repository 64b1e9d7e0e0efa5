#include "../include/patchwise/log.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <optional>
#include <sstream>

namespace patchwise {

namespace {

std::optional<LogLevel>& threshold_override() {
    static std::optional<LogLevel> level;
    return level;
}

const char* level_tag(LogLevel level) {
    switch (level) {
    case LogLevel::Debug: return "debug";
    case LogLevel::Info: return "info";
    case LogLevel::Warn: return "warn";
    case LogLevel::Error: return "error";
    }
    return "?";
}

} // namespace

std::string timestamp_now() {
    using clock = std::chrono::system_clock;
    const auto now = clock::now();
    const auto time = clock::to_time_t(now);
    std::tm tm {};
#if defined(_WIN32)
    localtime_s(&tm, &time);
#else
    localtime_r(&time, &tm);
#endif
    auto milliseconds = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()) % 1000;
    std::ostringstream oss;
    oss << std::put_time(&tm, "%Y-%m-%d %H:%M:%S") << '.' << std::setw(3) << std::setfill('0') << milliseconds.count();
    return oss.str();
}

LogLevel parse_log_level(std::string_view name) {
    std::string lowered(name);
    std::transform(lowered.begin(), lowered.end(), lowered.begin(), [](unsigned char c) {
        return static_cast<char>(std::tolower(c));
    });
    if (lowered == "debug") return LogLevel::Debug;
    if (lowered == "info") return LogLevel::Info;
    if (lowered == "error") return LogLevel::Error;
    return LogLevel::Warn;
}

LogLevel log_threshold() {
    if (threshold_override()) {
        return *threshold_override();
    }
    if (const char* raw = std::getenv("PATCHWISE_LOG_LEVEL")) {
        return parse_log_level(raw);
    }
    return LogLevel::Warn;
}

void set_log_threshold(LogLevel level) {
    threshold_override() = level;
}

void log(LogLevel level, std::string_view component, std::string_view message) {
    if (static_cast<int>(level) < static_cast<int>(log_threshold())) {
        return;
    }
    std::clog << "[" << component << " " << timestamp_now() << "] " << level_tag(level) << ": " << message << std::endl;
}

} // namespace patchwise
