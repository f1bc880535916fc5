#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Circuit Breaker
// ═══════════════════════════════════════════════════════════════════════════
// Gates traffic to one resource using the error rate over a trailing window
// of per-second bins, with bounded recovery probing.
//
// Every outcome goes through record(), which is also the only place time-based
// transitions happen. There is no timer: a TRIPPED breaker that sees no more
// outcomes stays TRIPPED.
//
// Usage:
//   CircuitBreaker breaker(CircuitParams{
//       .max_err_rate = 0.15,
//       .window_sec = 300,
//       .min_closed_sec = 180,
//       .half_open_probe = 5
//   });
//
//   if (allows_traffic(breaker.state())) {
//       const bool failed = !send_order();
//       breaker.record(failed);
//   }

#include "failsafe/log/log_budget.hpp"
#include "failsafe/log/logger.hpp"
#include "failsafe/metrics/metrics.hpp"
#include "failsafe/resilience/circuit_state.hpp"
#include "failsafe/resilience/event_window.hpp"
#include "failsafe/resilience/state_guard.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Parameters
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitParams {
    /// Trip when the window error rate is strictly above this fraction
    double max_err_rate{0.15};

    /// Trailing window length in seconds
    int window_sec{300};

    /// Minimum time spent TRIPPED before probing starts
    int min_closed_sec{180};

    /// Consecutive successes needed in HALF_OPEN to return to OPEN
    int half_open_probe{5};

    /// Copy with negative durations and counts clamped to 0
    [[nodiscard]] CircuitParams sanitized() const noexcept;
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker Options
// ─────────────────────────────────────────────────────────────────────────────

/// Seconds on a monotonic scale; fractional part allowed
using TimeFn = std::function<double()>;

/// Default time source (steady clock, seconds)
[[nodiscard]] double monotonic_seconds() noexcept;

struct CircuitBreakerOptions {
    /// Clock; null means monotonic_seconds()
    TimeFn time_fn;

    /// Guard state and bins with a mutex
    bool thread_safe{false};

    /// Explicit bin capacity; overrides the hint-based computation
    std::optional<std::size_t> events_maxlen;

    /// Expected distinct seconds per window second, used to size the window
    int events_per_sec_hint{1};

    /// Transition log lines allowed per second
    int max_log_lines_per_sec{10};

    /// Receives the transition lines; null means the global logger
    std::shared_ptr<ILogger> logger;

    CircuitMetricHooks hooks;
    MetricsCallback metrics_cb;

    CircuitBreakerOptions& with_time_fn(TimeFn fn);
    CircuitBreakerOptions& with_thread_safe(bool enabled);
    CircuitBreakerOptions& with_events_maxlen(std::size_t maxlen);
    CircuitBreakerOptions& with_events_per_sec_hint(int hint);
    CircuitBreakerOptions& with_max_log_lines_per_sec(int lines);
    CircuitBreakerOptions& with_logger(std::shared_ptr<ILogger> sink);
    CircuitBreakerOptions& with_hooks(CircuitMetricHooks metric_hooks);
    CircuitBreakerOptions& with_metrics_callback(MetricsCallback callback);
};

// ─────────────────────────────────────────────────────────────────────────────
// Snapshot
// ─────────────────────────────────────────────────────────────────────────────

struct CircuitSnapshot {
    CircuitState state{CircuitState::Open};
    double err_rate{0.0};
    std::size_t window_len{0};
    std::int64_t last_transition_ts{0};
};

// ─────────────────────────────────────────────────────────────────────────────
// Circuit Breaker
// ─────────────────────────────────────────────────────────────────────────────

class CircuitBreaker {
public:
    explicit CircuitBreaker(CircuitParams params, CircuitBreakerOptions options = {});

    CircuitBreaker(const CircuitBreaker&) = delete;
    CircuitBreaker& operator=(const CircuitBreaker&) = delete;
    CircuitBreaker(CircuitBreaker&&) = delete;
    CircuitBreaker& operator=(CircuitBreaker&&) = delete;

    ~CircuitBreaker() = default;

    // ─────────────────────────────────────────────────────────────────────────
    // Recording
    // ─────────────────────────────────────────────────────────────────────────

    /// Fold one outcome into the window and run the transition table.
    /// Must not be called from inside one of this breaker's sinks.
    CircuitState record(bool is_error);

    CircuitState on_ok() { return record(false); }
    CircuitState on_error() { return record(true); }

    // ─────────────────────────────────────────────────────────────────────────
    // Queries
    // ─────────────────────────────────────────────────────────────────────────

    [[nodiscard]] CircuitState state() const;
    [[nodiscard]] std::string_view state_name() const;

    /// Prunes the window to the current time, then reads it
    [[nodiscard]] CircuitSnapshot snapshot();

    [[nodiscard]] const CircuitParams& params() const noexcept { return params_; }
    [[nodiscard]] std::size_t window_capacity() const noexcept { return window_.capacity(); }

    /// Outcomes that landed in an already existing bin
    [[nodiscard]] std::uint64_t flood_coalesced() const;

    /// Sink calls (log or metrics) that threw
    [[nodiscard]] std::uint64_t sink_failures() const;

    /// Transition lines dropped by the per-second budget
    [[nodiscard]] std::uint64_t suppressed_log_lines() const;

private:
    [[nodiscard]] double now() const;

    void transition_to(CircuitState next, std::string_view reason, double rate, double now_ts);
    void emit_transition(CircuitState from, CircuitState to, std::string_view reason, double rate, double now_ts);
    void emit_gauges(double rate);
    void emit_metric(std::string_view name, const MetricFields& fields);

    template <typename Fn>
    void call_sink(Fn&& fn) {
        if (!try_invoke_sink(std::forward<Fn>(fn))) {
            ++sink_failures_;
        }
    }

    const CircuitParams params_;
    CircuitBreakerOptions options_;
    std::unique_ptr<StateGuard> guard_;

    CircuitState state_{CircuitState::Open};
    EventWindow window_;
    double tripped_at_{0.0};
    int half_open_remaining_{0};
    double last_transition_ts_{0.0};

    LogBudget log_budget_;
    std::uint64_t flood_coalesced_{0};
    std::uint64_t sink_failures_{0};
};

}  // namespace failsafe
