#pragma once

#include "failsafe/log/logger.hpp"

#include <memory>
#include <string>
#include <vector>

#include <spdlog/logger.h>
#include <spdlog/spdlog.h>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// SpdlogLogger - ILogger backed by spdlog
// ─────────────────────────────────────────────────────────────────────────────
// Loggers created here are never registered in spdlog's global registry, so
// several breakers or lease locks can each own one without name clashes.

class SpdlogLogger final : public ILogger {
public:
    /// Console sink with the default pattern
    explicit SpdlogLogger(LogLevel min_level = LogLevel::Info);

    /// Wrap an existing spdlog logger
    explicit SpdlogLogger(std::shared_ptr<spdlog::logger> logger);

    /// Multiple sinks
    SpdlogLogger(std::vector<spdlog::sink_ptr> sinks, LogLevel min_level = LogLevel::Info);

    ~SpdlogLogger() override = default;

    SpdlogLogger(const SpdlogLogger&) = delete;
    SpdlogLogger& operator=(const SpdlogLogger&) = delete;
    SpdlogLogger(SpdlogLogger&&) noexcept = default;
    SpdlogLogger& operator=(SpdlogLogger&&) noexcept = default;

    void log(const LogRecord& record) override;

    [[nodiscard]] bool should_log(LogLevel level) const noexcept override;

    [[nodiscard]] std::shared_ptr<spdlog::logger> get_spdlog_logger() const noexcept {
        return logger_;
    }

    void set_level(LogLevel level) noexcept;

    /// spdlog pattern syntax; "%v" prints the bare event line
    void set_pattern(const std::string& pattern);

    void flush();

    [[nodiscard]] static spdlog::level::level_enum to_spdlog_level(LogLevel level) noexcept;
    [[nodiscard]] static LogLevel from_spdlog_level(spdlog::level::level_enum level) noexcept;

private:
    std::shared_ptr<spdlog::logger> logger_;
    LogLevel min_level_;
};

// ─────────────────────────────────────────────────────────────────────────────
// Factory Functions
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_console_logger(
    LogLevel min_level = LogLevel::Info
);

/// stdout logger printing only the message, for key=value event streams
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_event_logger(
    LogLevel min_level = LogLevel::Info
);

/// stderr logger for diagnostics, keeping stdout free for program output
[[nodiscard]] std::unique_ptr<SpdlogLogger> make_spdlog_stderr_logger(
    LogLevel min_level = LogLevel::Info
);

}  // namespace failsafe
