#pragma once
// Log: timestamped stderr lines, one per event
//
//   [14:02:11.347][WARN][sacred_core] Tamper attempt 2/5: ...
//
// Level is process-global. KAVACHA_LOG_LEVEL (debug|info|warn|error|off)
// sets it on first use; set_log_level() overrides.

#include <string>

namespace kavacha {

enum class LogLevel : int {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3,
    Off = 4,
};

void set_log_level(LogLevel level);
LogLevel log_level();

// "debug", "info", "warn"/"warning", "error", "off". Unknown -> fallback.
LogLevel parse_log_level(const std::string& name, LogLevel fallback = LogLevel::Warn);
const char* log_level_name(LogLevel level);

// printf-style
void log_message(LogLevel level, const char* component, const char* fmt, ...);

#define KAVACHA_LOG_DEBUG(component, ...) ::kavacha::log_message(::kavacha::LogLevel::Debug, component, __VA_ARGS__)
#define KAVACHA_LOG_INFO(component, ...)  ::kavacha::log_message(::kavacha::LogLevel::Info, component, __VA_ARGS__)
#define KAVACHA_LOG_WARN(component, ...)  ::kavacha::log_message(::kavacha::LogLevel::Warn, component, __VA_ARGS__)
#define KAVACHA_LOG_ERROR(component, ...) ::kavacha::log_message(::kavacha::LogLevel::Error, component, __VA_ARGS__)

} // namespace kavacha
