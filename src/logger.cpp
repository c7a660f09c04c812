#include "common/logger.hpp"
#include "common/errors.hpp"
#include "common/types.hpp"
#include "common/utils.hpp"
#include <cstdarg>
#include <cstdio>
#include <chrono>
#include <string>

namespace exchange {

Logger& Logger::instance() {
    static Logger logger;
    return logger;
}

Logger::Logger() = default;

Logger::~Logger() {
    stop();
}

void Logger::start() {
    if (running_.exchange(true)) return; // Already running
    drain_thread_ = std::thread(&Logger::drain_loop, this);
}

void Logger::stop() {
    if (!running_.exchange(false)) return; // Already stopped
    if (drain_thread_.joinable()) {
        drain_thread_.join();
    }
    // Drain remaining entries
    LogEntry entry;
    while (queue_.try_pop(entry)) {
        write_entry(entry);
    }
    fflush(output_);
}

void Logger::log(LogLevel level, const char* msg) {
    if (level < min_level_) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();
    strncpy(entry.message, msg, sizeof(entry.message) - 1);
    entry.message[sizeof(entry.message) - 1] = '\0';

    queue_.try_push(entry); // Drop if queue full (acceptable for logging)
}

void Logger::logf(LogLevel level, const char* fmt, ...) {
    if (level < min_level_) return;

    LogEntry entry;
    entry.level = level;
    entry.timestamp_ns = now_ns();

    va_list args;
    va_start(args, fmt);
    vsnprintf(entry.message, sizeof(entry.message), fmt, args); // Truncates long messages
    va_end(args);

    queue_.try_push(entry);
}

void Logger::write_entry(const LogEntry& entry) {
    fprintf(output_, "[%s] [%llu] %s\n", log_level_name(entry.level),
            static_cast<unsigned long long>(entry.timestamp_ns), entry.message);
}

void Logger::drain_loop() {
    LogEntry entry;

    while (running_.load(std::memory_order_relaxed)) {
        if (queue_.try_pop(entry)) {
            write_entry(entry);
        } else {
            fflush(output_);
            // Yield to avoid busy-spinning on the log drain thread
            std::this_thread::sleep_for(std::chrono::microseconds(100));
        }
    }
}

const char* log_level_name(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO ";
        case LogLevel::Warn:  return "WARN ";
        case LogLevel::Error: return "ERROR";
    }
    return "INFO ";
}

LogLevel parse_log_level(std::string_view text) {
    const std::string level = to_upper_ascii(trim(text));
    if (level == "DEBUG") return LogLevel::Debug;
    if (level == "INFO") return LogLevel::Info;
    if (level == "WARN" || level == "WARNING") return LogLevel::Warn;
    if (level == "ERROR") return LogLevel::Error;
    throw ParseError("unknown log level '" + std::string(text) + "'");
}

} // namespace exchange
