#pragma once

#include <fmt/format.h>

#include <chrono>
#include <cstdint>
#include <memory>
#include <source_location>
#include <string>
#include <string_view>
#include <utility>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Log Levels
// ─────────────────────────────────────────────────────────────────────────────

enum class LogLevel : std::uint8_t {
    Trace = 0,  // Very detailed debugging
    Debug = 1,  // Debugging information
    Info  = 2,  // State transitions, lease events
    Warn  = 3,  // Degraded dependency (KV error, sink failure)
    Error = 4,  // Operation failed
    Fatal = 5,  // Unrecoverable
    Off   = 6   // Disable all logging
};

[[nodiscard]] constexpr std::string_view to_string(LogLevel level) noexcept {
    switch (level) {
        case LogLevel::Trace: return "TRACE";
        case LogLevel::Debug: return "DEBUG";
        case LogLevel::Info:  return "INFO";
        case LogLevel::Warn:  return "WARN";
        case LogLevel::Error: return "ERROR";
        case LogLevel::Fatal: return "FATAL";
        case LogLevel::Off:   return "OFF";
    }
    return "UNKNOWN";
}

// ─────────────────────────────────────────────────────────────────────────────
// Log Record - Immutable snapshot of a log event
// ─────────────────────────────────────────────────────────────────────────────

struct LogRecord {
    LogLevel level;
    std::string message;
    std::chrono::system_clock::time_point timestamp;
    std::source_location location;

    LogRecord(
        LogLevel lvl,
        std::string msg,
        std::source_location loc = std::source_location::current()
    )
        : level(lvl)
        , message(std::move(msg))
        , timestamp(std::chrono::system_clock::now())
        , location(loc)
    {}
};

// ─────────────────────────────────────────────────────────────────────────────
// ILogger Interface - Swappable logging backend
// ─────────────────────────────────────────────────────────────────────────────
// The breaker and the lease lock accept a std::shared_ptr<ILogger>; when none
// is supplied they fall back to the process-wide logger (get_logger()).

class ILogger {
public:
    virtual ~ILogger() = default;

    virtual void log(const LogRecord& record) = 0;

    // Check if a level would be logged (for avoiding expensive formatting)
    [[nodiscard]] virtual bool should_log(LogLevel level) const noexcept = 0;

    void trace(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Trace)) {
            log(LogRecord(LogLevel::Trace, std::string(msg), loc));
        }
    }

    void debug(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, std::string(msg), loc));
        }
    }

    void info(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, std::string(msg), loc));
        }
    }

    void warn(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, std::string(msg), loc));
        }
    }

    void error(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, std::string(msg), loc));
        }
    }

    void fatal(std::string_view msg, std::source_location loc = std::source_location::current()) {
        if (should_log(LogLevel::Fatal)) {
            log(LogRecord(LogLevel::Fatal, std::string(msg), loc));
        }
    }

    // Formatting helpers ({fmt} syntax). Arguments are only formatted when
    // the level is enabled.
    template<typename... Args>
    void debug_fmt(fmt::format_string<Args...> format_str, Args&&... args) {
        if (should_log(LogLevel::Debug)) {
            log(LogRecord(LogLevel::Debug, fmt::format(format_str, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void info_fmt(fmt::format_string<Args...> format_str, Args&&... args) {
        if (should_log(LogLevel::Info)) {
            log(LogRecord(LogLevel::Info, fmt::format(format_str, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void warn_fmt(fmt::format_string<Args...> format_str, Args&&... args) {
        if (should_log(LogLevel::Warn)) {
            log(LogRecord(LogLevel::Warn, fmt::format(format_str, std::forward<Args>(args)...)));
        }
    }

    template<typename... Args>
    void error_fmt(fmt::format_string<Args...> format_str, Args&&... args) {
        if (should_log(LogLevel::Error)) {
            log(LogRecord(LogLevel::Error, fmt::format(format_str, std::forward<Args>(args)...)));
        }
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// NullLogger - Discards all logs (zero overhead when disabled)
// ─────────────────────────────────────────────────────────────────────────────

class NullLogger final : public ILogger {
public:
    void log(const LogRecord& /*record*/) override {}

    [[nodiscard]] bool should_log(LogLevel /*level*/) const noexcept override {
        return false;
    }
};

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger Access
// ─────────────────────────────────────────────────────────────────────────────

// Get the global logger instance (defaults to NullLogger)
[[nodiscard]] ILogger& get_logger() noexcept;

// Set a new global logger (takes ownership); nullptr restores NullLogger
void set_logger(std::unique_ptr<ILogger> logger) noexcept;

// Resolve an injected logger, falling back to the global one
[[nodiscard]] inline ILogger& logger_or_global(const std::shared_ptr<ILogger>& logger) noexcept {
    if (logger != nullptr) {
        return *logger;
    }
    return get_logger();
}

#define FAILSAFE_LOG_TRACE(msg) \
    do { if (::failsafe::get_logger().should_log(::failsafe::LogLevel::Trace)) \
         ::failsafe::get_logger().trace(msg); } while(false)

#define FAILSAFE_LOG_DEBUG(msg) \
    do { if (::failsafe::get_logger().should_log(::failsafe::LogLevel::Debug)) \
         ::failsafe::get_logger().debug(msg); } while(false)

#define FAILSAFE_LOG_INFO(msg) \
    do { if (::failsafe::get_logger().should_log(::failsafe::LogLevel::Info)) \
         ::failsafe::get_logger().info(msg); } while(false)

#define FAILSAFE_LOG_WARN(msg) \
    do { if (::failsafe::get_logger().should_log(::failsafe::LogLevel::Warn)) \
         ::failsafe::get_logger().warn(msg); } while(false)

#define FAILSAFE_LOG_ERROR(msg) \
    do { if (::failsafe::get_logger().should_log(::failsafe::LogLevel::Error)) \
         ::failsafe::get_logger().error(msg); } while(false)

}  // namespace failsafe
