#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Resilience Configuration
// ═══════════════════════════════════════════════════════════════════════════
// JSON configuration for one breaker and one lease lock:
//
//   {
//     "circuit": {"max_err_rate": 0.15, "window_sec": 300,
//                 "min_closed_sec": 180, "half_open_probe": 5},
//     "breaker": {"thread_safe": false, "events_maxlen": null,
//                 "events_per_sec_hint": 1, "max_log_lines_per_sec": 10},
//     "lease":   {"key": "failsafe:leader", "ttl_ms": 3000, "renew_ms": 1500,
//                 "env": "dev", "service": "default"}
//   }
//
// Every section and key is optional; missing ones keep their defaults. A key
// of the wrong JSON type is an error. A value of the right type but outside
// its valid range is clamped and logged at Warn.

#include "failsafe/ha/lease_lock.hpp"
#include "failsafe/resilience/circuit_breaker.hpp"

#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace failsafe {

using Json = nlohmann::json;

// ─────────────────────────────────────────────────────────────────────────────
// Config Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct ConfigError {
    enum class Code {
        IoError,      // File could not be read
        ParseError,   // Not valid JSON
        InvalidType   // A section or key has the wrong JSON type
    };

    Code code{Code::ParseError};
    std::string message;

    static ConfigError io_error(std::string msg) {
        return {Code::IoError, std::move(msg)};
    }

    static ConfigError parse_error(std::string msg) {
        return {Code::ParseError, std::move(msg)};
    }

    static ConfigError invalid_type(std::string msg) {
        return {Code::InvalidType, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(ConfigError::Code code) noexcept {
    switch (code) {
        case ConfigError::Code::IoError:     return "IoError";
        case ConfigError::Code::ParseError:  return "ParseError";
        case ConfigError::Code::InvalidType: return "InvalidType";
    }
    return "Unknown";
}

template <typename T>
using ConfigResult = tl::expected<T, ConfigError>;

// ─────────────────────────────────────────────────────────────────────────────
// Config Sections
// ─────────────────────────────────────────────────────────────────────────────

/// Breaker construction options that can be expressed in a file
struct BreakerSettings {
    bool thread_safe{false};
    std::optional<std::size_t> events_maxlen;
    int events_per_sec_hint{1};
    int max_log_lines_per_sec{10};
};

struct LeaseSettings {
    std::string key{"failsafe:leader"};
    std::int64_t ttl_ms{3000};
    std::int64_t renew_ms{1500};
    std::string env{"dev"};
    std::string service{"default"};
};

struct ResilienceConfig {
    CircuitParams circuit;
    BreakerSettings breaker;
    LeaseSettings lease;

    /// Breaker options from the file; clock, logger and sinks left unset
    [[nodiscard]] CircuitBreakerOptions breaker_options() const;

    /// Lease options from the file; logger and metrics left unset
    [[nodiscard]] LeaseOptions lease_options() const;
};

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

[[nodiscard]] ConfigResult<ResilienceConfig> parse_resilience_config(const Json& document);

/// Same as above, from JSON text
[[nodiscard]] ConfigResult<ResilienceConfig> parse_resilience_config_text(std::string_view text);

[[nodiscard]] ConfigResult<ResilienceConfig> load_resilience_config(const std::filesystem::path& path);

}  // namespace failsafe
