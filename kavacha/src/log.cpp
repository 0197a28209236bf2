#include <kavacha/log.hpp>
#include <kavacha/types.hpp>

#include <atomic>
#include <chrono>
#include <cstdarg>
#include <cstdio>
#include <cstdlib>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <mutex>

namespace kavacha {

namespace {

std::atomic<int> current_level{-1};  // -1 = not yet read from environment
std::mutex write_mutex;

int effective_level() {
    int level = current_level.load(std::memory_order_relaxed);
    if (level >= 0) return level;

    LogLevel from_env = LogLevel::Warn;
    if (const char* env = std::getenv("KAVACHA_LOG_LEVEL")) {
        from_env = parse_log_level(env, LogLevel::Warn);
    }
    int expected = -1;
    current_level.compare_exchange_strong(expected, static_cast<int>(from_env));
    return current_level.load(std::memory_order_relaxed);
}

} // namespace

void set_log_level(LogLevel level) {
    current_level.store(static_cast<int>(level), std::memory_order_relaxed);
}

LogLevel log_level() {
    return static_cast<LogLevel>(effective_level());
}

LogLevel parse_log_level(const std::string& name, LogLevel fallback) {
    std::string n = text::to_lower(text::trim(name));
    if (n == "debug") return LogLevel::Debug;
    if (n == "info") return LogLevel::Info;
    if (n == "warn" || n == "warning") return LogLevel::Warn;
    if (n == "error") return LogLevel::Error;
    if (n == "off" || n == "none") return LogLevel::Off;
    return fallback;
}

const char* log_level_name(LogLevel level) {
    switch (level) {
        case LogLevel::Debug: return "debug";
        case LogLevel::Info: return "info";
        case LogLevel::Warn: return "warn";
        case LogLevel::Error: return "error";
        default: return "off";
    }
}

void log_message(LogLevel level, const char* component, const char* fmt, ...) {
    if (level == LogLevel::Off || static_cast<int>(level) < effective_level()) return;

    // Get timestamp with milliseconds
    auto now_tp = std::chrono::system_clock::now();
    auto now_time_t = std::chrono::system_clock::to_time_t(now_tp);
    auto now_ms = std::chrono::duration_cast<std::chrono::milliseconds>(
        now_tp.time_since_epoch()) % 1000;

    std::tm local_tm{};
    localtime_r(&now_time_t, &local_tm);
    char time_buf[32];
    std::strftime(time_buf, sizeof(time_buf), "%H:%M:%S", &local_tm);

    char msg_buf[1024];
    va_list args;
    va_start(args, fmt);
    vsnprintf(msg_buf, sizeof(msg_buf), fmt, args);
    va_end(args);

    static const char* const tags[] = {"DEBUG", "INFO", "WARN", "ERROR"};

    std::lock_guard<std::mutex> lock(write_mutex);
    std::cerr << "[" << time_buf << "." << std::setfill('0') << std::setw(3) << now_ms.count()
              << "][" << tags[static_cast<int>(level)] << "][" << component << "] "
              << msg_buf << "\n";
}

} // namespace kavacha
