#include "failsafe/config/resilience_config.hpp"

#include "failsafe/log/logger.hpp"

#include <fmt/format.h>

#include <fstream>
#include <limits>
#include <sstream>

namespace failsafe {

namespace {

// ─────────────────────────────────────────────────────────────────────────────
// Field Readers
// ─────────────────────────────────────────────────────────────────────────────
// Each reader leaves `out` untouched when the key is absent.

ConfigError wrong_type(std::string_view section, std::string_view key, std::string_view expected) {
    return ConfigError::invalid_type(fmt::format("{}.{} must be {}", section, key, expected));
}

ConfigResult<void> read_double(const Json& node, std::string_view section, const char* key, double& out) {
    if (!node.contains(key)) {
        return {};
    }
    const Json& value = node.at(key);
    if (!value.is_number()) {
        return tl::unexpected(wrong_type(section, key, "a number"));
    }
    out = value.get<double>();
    return {};
}

ConfigResult<void> read_int64(const Json& node, std::string_view section, const char* key, std::int64_t& out) {
    if (!node.contains(key)) {
        return {};
    }
    const Json& value = node.at(key);
    if (!value.is_number_integer()) {
        return tl::unexpected(wrong_type(section, key, "an integer"));
    }
    out = value.get<std::int64_t>();
    return {};
}

ConfigResult<void> read_int(const Json& node, std::string_view section, const char* key, int& out) {
    std::int64_t wide = out;
    auto result = read_int64(node, section, key, wide);
    if (!result) {
        return result;
    }
    constexpr auto lo = static_cast<std::int64_t>(std::numeric_limits<int>::min());
    constexpr auto hi = static_cast<std::int64_t>(std::numeric_limits<int>::max());
    if (wide < lo || wide > hi) {
        return tl::unexpected(wrong_type(section, key, "a 32-bit integer"));
    }
    out = static_cast<int>(wide);
    return {};
}

ConfigResult<void> read_bool(const Json& node, std::string_view section, const char* key, bool& out) {
    if (!node.contains(key)) {
        return {};
    }
    const Json& value = node.at(key);
    if (!value.is_boolean()) {
        return tl::unexpected(wrong_type(section, key, "a boolean"));
    }
    out = value.get<bool>();
    return {};
}

ConfigResult<void> read_string(const Json& node, std::string_view section, const char* key, std::string& out) {
    if (!node.contains(key)) {
        return {};
    }
    const Json& value = node.at(key);
    if (!value.is_string()) {
        return tl::unexpected(wrong_type(section, key, "a string"));
    }
    out = value.get<std::string>();
    return {};
}

template <typename T>
void clamp_at_least(std::string_view section, std::string_view key, T& value, T minimum) {
    if (value >= minimum) {
        return;
    }
    FAILSAFE_LOG_WARN(fmt::format(
        "event=config_clamped field={}.{} value={} clamped_to={}", section, key, value, minimum
    ));
    value = minimum;
}

// Absent sections read as an empty object
ConfigResult<const Json*> find_section(const Json& document, const char* name) {
    static const Json empty = Json::object();
    if (!document.contains(name)) {
        return &empty;
    }
    const Json& node = document.at(name);
    if (!node.is_object()) {
        return tl::unexpected(ConfigError::invalid_type(fmt::format("{} must be an object", name)));
    }
    return &node;
}

// ─────────────────────────────────────────────────────────────────────────────
// Sections
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<void> parse_circuit(const Json& node, CircuitParams& out) {
    constexpr std::string_view section = "circuit";
    if (auto r = read_double(node, section, "max_err_rate", out.max_err_rate); !r) return r;
    if (auto r = read_int(node, section, "window_sec", out.window_sec); !r) return r;
    if (auto r = read_int(node, section, "min_closed_sec", out.min_closed_sec); !r) return r;
    if (auto r = read_int(node, section, "half_open_probe", out.half_open_probe); !r) return r;

    clamp_at_least(section, "window_sec", out.window_sec, 0);
    clamp_at_least(section, "min_closed_sec", out.min_closed_sec, 0);
    clamp_at_least(section, "half_open_probe", out.half_open_probe, 0);
    return {};
}

ConfigResult<void> parse_breaker(const Json& node, BreakerSettings& out) {
    constexpr std::string_view section = "breaker";
    if (auto r = read_bool(node, section, "thread_safe", out.thread_safe); !r) return r;
    if (auto r = read_int(node, section, "events_per_sec_hint", out.events_per_sec_hint); !r) return r;
    if (auto r = read_int(node, section, "max_log_lines_per_sec", out.max_log_lines_per_sec); !r) return r;

    if (node.contains("events_maxlen") && !node.at("events_maxlen").is_null()) {
        std::int64_t maxlen = 0;
        if (auto r = read_int64(node, section, "events_maxlen", maxlen); !r) return r;
        clamp_at_least<std::int64_t>(section, "events_maxlen", maxlen, 1);
        out.events_maxlen = static_cast<std::size_t>(maxlen);
    }

    clamp_at_least(section, "events_per_sec_hint", out.events_per_sec_hint, 1);
    clamp_at_least(section, "max_log_lines_per_sec", out.max_log_lines_per_sec, 0);
    return {};
}

ConfigResult<void> parse_lease(const Json& node, LeaseSettings& out) {
    constexpr std::string_view section = "lease";
    if (auto r = read_string(node, section, "key", out.key); !r) return r;
    if (auto r = read_int64(node, section, "ttl_ms", out.ttl_ms); !r) return r;
    if (auto r = read_int64(node, section, "renew_ms", out.renew_ms); !r) return r;
    if (auto r = read_string(node, section, "env", out.env); !r) return r;
    if (auto r = read_string(node, section, "service", out.service); !r) return r;

    clamp_at_least<std::int64_t>(section, "ttl_ms", out.ttl_ms, 1);
    clamp_at_least<std::int64_t>(section, "renew_ms", out.renew_ms, 1);
    return {};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// ResilienceConfig
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreakerOptions ResilienceConfig::breaker_options() const {
    CircuitBreakerOptions options;
    options.with_thread_safe(breaker.thread_safe)
           .with_events_per_sec_hint(breaker.events_per_sec_hint)
           .with_max_log_lines_per_sec(breaker.max_log_lines_per_sec);
    if (breaker.events_maxlen.has_value()) {
        options.with_events_maxlen(*breaker.events_maxlen);
    }
    return options;
}

LeaseOptions ResilienceConfig::lease_options() const {
    LeaseOptions options;
    options.with_ttl_ms(lease.ttl_ms)
           .with_renew_ms(lease.renew_ms)
           .with_env(lease.env)
           .with_service(lease.service);
    return options;
}

// ─────────────────────────────────────────────────────────────────────────────
// Loading
// ─────────────────────────────────────────────────────────────────────────────

ConfigResult<ResilienceConfig> parse_resilience_config(const Json& document) {
    if (!document.is_object()) {
        return tl::unexpected(ConfigError::invalid_type("configuration must be a JSON object"));
    }

    ResilienceConfig config;

    const auto circuit = find_section(document, "circuit");
    if (!circuit) {
        return tl::unexpected(circuit.error());
    }
    if (auto r = parse_circuit(**circuit, config.circuit); !r) {
        return tl::unexpected(r.error());
    }

    const auto breaker = find_section(document, "breaker");
    if (!breaker) {
        return tl::unexpected(breaker.error());
    }
    if (auto r = parse_breaker(**breaker, config.breaker); !r) {
        return tl::unexpected(r.error());
    }

    const auto lease = find_section(document, "lease");
    if (!lease) {
        return tl::unexpected(lease.error());
    }
    if (auto r = parse_lease(**lease, config.lease); !r) {
        return tl::unexpected(r.error());
    }

    return config;
}

ConfigResult<ResilienceConfig> parse_resilience_config_text(std::string_view text) {
    try {
        return parse_resilience_config(Json::parse(text));
    } catch (const Json::parse_error& err) {
        return tl::unexpected(ConfigError::parse_error(std::string("invalid JSON: ") + err.what()));
    }
}

ConfigResult<ResilienceConfig> load_resilience_config(const std::filesystem::path& path) {
    std::ifstream input(path);
    if (!input) {
        return tl::unexpected(ConfigError::io_error("cannot open " + path.string()));
    }
    std::ostringstream buffer;
    buffer << input.rdbuf();
    if (input.bad()) {
        return tl::unexpected(ConfigError::io_error("failed reading " + path.string()));
    }
    return parse_resilience_config_text(buffer.str());
}

}  // namespace failsafe
