#pragma once

#include "containers/lock_free_queue.hpp"
#include <cstdio>
#include <cstring>
#include <atomic>
#include <string_view>
#include <thread>

namespace exchange {

enum class LogLevel : uint8_t {
    Debug = 0,
    Info = 1,
    Warn = 2,
    Error = 3
};

struct LogEntry {
    char message[240];
    LogLevel level;
    uint64_t timestamp_ns;
};

/// Asynchronous logger. Callers format into a fixed-size entry and push it
/// onto an SPSC ring; a drain thread writes entries to the output stream.
/// Entries are dropped when the ring is full. Only one thread may log.
class Logger {
public:
    static Logger& instance();

    void start();
    void stop();

    void log(LogLevel level, const char* msg);
    void logf(LogLevel level, const char* fmt, ...) __attribute__((format(printf, 3, 4)));

    void set_level(LogLevel level) { min_level_ = level; }
    LogLevel level() const { return min_level_; }

    /// Not owned; must outlive the logger or be replaced before it is closed.
    /// Only change while the logger is stopped.
    void set_output(FILE* output) { output_ = output ? output : stderr; }
    FILE* output() const { return output_; }

    bool running() const { return running_.load(std::memory_order_acquire); }

private:
    Logger();
    ~Logger();

    void drain_loop();
    void write_entry(const LogEntry& entry);

    LockFreeRingBuffer<LogEntry, 8192> queue_;
    std::atomic<bool> running_{false};
    std::thread drain_thread_;
    LogLevel min_level_ = LogLevel::Info;
    FILE* output_ = stderr;
};

const char* log_level_name(LogLevel level) noexcept;

/// "debug", "INFO", "warn", "error". Throws ParseError otherwise.
LogLevel parse_log_level(std::string_view text);

// Macros for convenience
#ifdef NDEBUG
#define LOG_DEBUG(...) ((void)0)
#else
#define LOG_DEBUG(...) do { \
    if (::exchange::Logger::instance().level() <= ::exchange::LogLevel::Debug) \
        ::exchange::Logger::instance().logf(::exchange::LogLevel::Debug, __VA_ARGS__); \
} while(0)
#endif

#define LOG_INFO(...)  do { ::exchange::Logger::instance().logf(::exchange::LogLevel::Info, __VA_ARGS__); } while(0)
#define LOG_WARN(...)  do { ::exchange::Logger::instance().logf(::exchange::LogLevel::Warn, __VA_ARGS__); } while(0)
#define LOG_ERROR(...) do { ::exchange::Logger::instance().logf(::exchange::LogLevel::Error, __VA_ARGS__); } while(0)

} // namespace exchange
