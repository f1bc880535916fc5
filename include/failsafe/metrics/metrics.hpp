#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Metrics Sinks
// ═══════════════════════════════════════════════════════════════════════════
// failsafe never owns a metrics backend. Components publish through optional
// sinks supplied by the caller:
//
//   - MetricsCallback: one callback receiving (name, fields) for every metric.
//   - CircuitMetricHooks: the older per-metric callbacks of the breaker.
//   - ILeaderMetrics: leader-state gauge and election / renew-fail counters.
//
// Both breaker sinks are independent; when both are configured both fire.
// Every sink call is made through try_invoke_sink() so a failing sink never
// reaches the caller of record() / tick().

#include <cstdint>
#include <exception>
#include <functional>
#include <map>
#include <string>
#include <string_view>
#include <utility>
#include <variant>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Unified Callback
// ─────────────────────────────────────────────────────────────────────────────

using MetricValue = std::variant<std::int64_t, double, std::string>;
using MetricFields = std::map<std::string, MetricValue, std::less<>>;

/// Metric names emitted by the circuit breaker through MetricsCallback
namespace metric_names {
inline constexpr std::string_view CIRCUIT_STATE      = "circuit_state";          // {value: int}
inline constexpr std::string_view ERR_RATE_WINDOW    = "err_rate_window";        // {value: double}
inline constexpr std::string_view TRANSITIONS_TOTAL  = "transitions_total";      // {from, to}
inline constexpr std::string_view PER_SEC_EVENT_RATE = "per_sec_event_rate";     // {value: int}
inline constexpr std::string_view FLOOD_COALESCED    = "flood_coalesced_total";  // {add: int}
}  // namespace metric_names

using MetricsCallback = std::function<void(std::string_view name, const MetricFields& fields)>;

// ─────────────────────────────────────────────────────────────────────────────
// Per-Metric Callbacks
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitMetricHooks {
    /// State gauge, receives the stable integer code
    std::function<void(int)> set_state;

    /// Error rate over the trailing window
    std::function<void(double)> set_err_rate;

    /// Transition counter, receives state names
    std::function<void(std::string_view from, std::string_view to)> inc_transition;
};

// ─────────────────────────────────────────────────────────────────────────────
// Leader Metrics
// ─────────────────────────────────────────────────────────────────────────────

struct LeaderLabels {
    std::string env;
    std::string service;
    std::string instance;
};

class ILeaderMetrics {
public:
    virtual ~ILeaderMetrics() = default;

    /// 1.0 = leader, 0.0 = follower
    virtual void set_leader_state(const LeaderLabels& labels, double state) = 0;

    virtual void inc_leader_elections(std::string_view env, std::string_view service) = 0;

    virtual void inc_leader_renew_fail(std::string_view env, std::string_view service) = 0;
};

class NullLeaderMetrics final : public ILeaderMetrics {
public:
    void set_leader_state(const LeaderLabels& /*labels*/, double /*state*/) override {}
    void inc_leader_elections(std::string_view /*env*/, std::string_view /*service*/) override {}
    void inc_leader_renew_fail(std::string_view /*env*/, std::string_view /*service*/) override {}
};

// ─────────────────────────────────────────────────────────────────────────────
// Sink Invocation
// ─────────────────────────────────────────────────────────────────────────────

/// Run a best-effort sink call. Returns false if the sink threw; the caller
/// decides how to account for the failure.
template <typename Fn>
[[nodiscard]] bool try_invoke_sink(Fn&& fn) noexcept {
    try {
        std::forward<Fn>(fn)();
        return true;
    } catch (const std::exception&) {
        return false;
    } catch (...) {
        return false;
    }
}

}  // namespace failsafe
