#include "failsafe/resilience/circuit_breaker.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>

namespace failsafe {

namespace {

std::int64_t to_epoch_second(double ts) noexcept {
    return static_cast<std::int64_t>(std::floor(ts));
}

std::size_t window_capacity_for(const CircuitParams& params, const CircuitBreakerOptions& options) {
    if (options.events_maxlen.has_value()) {
        return std::max<std::size_t>(1, *options.events_maxlen);
    }
    return EventWindow::capacity_for(params.window_sec, options.events_per_sec_hint);
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Parameters & Options
// ─────────────────────────────────────────────────────────────────────────────

CircuitParams CircuitParams::sanitized() const noexcept {
    CircuitParams out = *this;
    out.window_sec = std::max(0, window_sec);
    out.min_closed_sec = std::max(0, min_closed_sec);
    out.half_open_probe = std::max(0, half_open_probe);
    return out;
}

double monotonic_seconds() noexcept {
    const auto since_start = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(since_start).count();
}

CircuitBreakerOptions& CircuitBreakerOptions::with_time_fn(TimeFn fn) {
    time_fn = std::move(fn);
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_thread_safe(bool enabled) {
    thread_safe = enabled;
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_events_maxlen(std::size_t maxlen) {
    events_maxlen = maxlen;
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_events_per_sec_hint(int hint) {
    events_per_sec_hint = hint;
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_max_log_lines_per_sec(int lines) {
    max_log_lines_per_sec = lines;
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_logger(std::shared_ptr<ILogger> sink) {
    logger = std::move(sink);
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_hooks(CircuitMetricHooks metric_hooks) {
    hooks = std::move(metric_hooks);
    return *this;
}

CircuitBreakerOptions& CircuitBreakerOptions::with_metrics_callback(MetricsCallback callback) {
    metrics_cb = std::move(callback);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

CircuitBreaker::CircuitBreaker(CircuitParams params, CircuitBreakerOptions options)
    : params_(params.sanitized())
    , options_(std::move(options))
    , guard_(make_state_guard(options_.thread_safe))
    , window_(params_.window_sec, window_capacity_for(params_, options_))
    , log_budget_(options_.max_log_lines_per_sec)
{
    if (!options_.time_fn) {
        options_.time_fn = monotonic_seconds;
    }
    // Publish the initial OPEN state and an empty-window rate
    emit_gauges(0.0);
}

// ─────────────────────────────────────────────────────────────────────────────
// Recording
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::record(bool is_error) {
    std::lock_guard<StateGuard> lock(*guard_);

    const double now_ts = now();
    const std::int64_t now_sec = to_epoch_second(now_ts);

    const bool coalesced = window_.add(now_sec, is_error);
    if (coalesced) {
        ++flood_coalesced_;
        emit_metric(metric_names::FLOOD_COALESCED, MetricFields{{"add", std::int64_t{1}}});
    }
    window_.prune(now_sec);

    const double rate = window_.error_rate();
    emit_gauges(rate);
    if (!window_.empty()) {
        const auto per_sec = static_cast<std::int64_t>(window_.newest().total());
        emit_metric(metric_names::PER_SEC_EVENT_RATE, MetricFields{{"value", per_sec}});
    }

    switch (state_) {
        case CircuitState::Open:
            if (rate > params_.max_err_rate) {
                tripped_at_ = now_ts;
                half_open_remaining_ = 0;
                transition_to(CircuitState::Tripped, "trip", rate, now_ts);
            }
            break;

        case CircuitState::Tripped:
            // This call's outcome only opens probing; it is not itself a probe
            if ((now_ts - tripped_at_) >= static_cast<double>(params_.min_closed_sec)) {
                half_open_remaining_ = params_.half_open_probe;
                transition_to(CircuitState::HalfOpen, "probe_start", rate, now_ts);
            }
            break;

        case CircuitState::HalfOpen:
            if (is_error) {
                tripped_at_ = now_ts;
                half_open_remaining_ = 0;
                transition_to(CircuitState::Tripped, "probe_fail", rate, now_ts);
            } else {
                if (half_open_remaining_ > 0) {
                    --half_open_remaining_;
                }
                if (half_open_remaining_ <= 0) {
                    transition_to(CircuitState::Open, "probe_success", rate, now_ts);
                }
            }
            break;
    }

    return state_;
}

// ─────────────────────────────────────────────────────────────────────────────
// Queries
// ─────────────────────────────────────────────────────────────────────────────

CircuitState CircuitBreaker::state() const {
    std::lock_guard<StateGuard> lock(*guard_);
    return state_;
}

std::string_view CircuitBreaker::state_name() const {
    return to_string(state());
}

CircuitSnapshot CircuitBreaker::snapshot() {
    std::lock_guard<StateGuard> lock(*guard_);
    window_.prune(to_epoch_second(now()));
    return CircuitSnapshot{
        .state = state_,
        .err_rate = window_.error_rate(),
        .window_len = window_.size(),
        .last_transition_ts = static_cast<std::int64_t>(last_transition_ts_)
    };
}

std::uint64_t CircuitBreaker::flood_coalesced() const {
    std::lock_guard<StateGuard> lock(*guard_);
    return flood_coalesced_;
}

std::uint64_t CircuitBreaker::sink_failures() const {
    std::lock_guard<StateGuard> lock(*guard_);
    return sink_failures_;
}

std::uint64_t CircuitBreaker::suppressed_log_lines() const {
    std::lock_guard<StateGuard> lock(*guard_);
    return log_budget_.suppressed();
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers (caller holds guard_)
// ─────────────────────────────────────────────────────────────────────────────

double CircuitBreaker::now() const {
    return options_.time_fn();
}

void CircuitBreaker::transition_to(CircuitState next, std::string_view reason, double rate, double now_ts) {
    if (next == state_) {
        return;
    }
    const CircuitState from = state_;
    state_ = next;
    last_transition_ts_ = now_ts;
    emit_transition(from, next, reason, rate, now_ts);
    emit_gauges(rate);
}

void CircuitBreaker::emit_transition(
    CircuitState from,
    CircuitState to,
    std::string_view reason,
    double rate,
    double now_ts
) {
    const std::int64_t now_sec = to_epoch_second(now_ts);

    if (log_budget_.try_consume(now_sec)) {
        // Field order is fixed; dashboards parse these lines
        const std::string line = fmt::format(
            "event=circuit_transition state_from={} state_to={} err_rate={:.6f} "
            "window_len={} now={} reason={}",
            to_string(from), to_string(to), rate, window_.size(), now_sec, reason
        );
        call_sink([&] { logger_or_global(options_.logger).info(line); });
    }

    if (options_.hooks.inc_transition) {
        call_sink([&] { options_.hooks.inc_transition(to_string(from), to_string(to)); });
    }
    emit_metric(
        metric_names::TRANSITIONS_TOTAL,
        MetricFields{{"from", std::string(to_string(from))}, {"to", std::string(to_string(to))}}
    );
}

void CircuitBreaker::emit_gauges(double rate) {
    if (options_.hooks.set_state) {
        call_sink([&] { options_.hooks.set_state(state_code(state_)); });
    }
    if (options_.hooks.set_err_rate) {
        call_sink([&] { options_.hooks.set_err_rate(rate); });
    }
    emit_metric(metric_names::CIRCUIT_STATE, MetricFields{{"value", std::int64_t{state_code(state_)}}});
    emit_metric(metric_names::ERR_RATE_WINDOW, MetricFields{{"value", rate}});
}

void CircuitBreaker::emit_metric(std::string_view name, const MetricFields& fields) {
    if (!options_.metrics_cb) {
        return;
    }
    call_sink([&] { options_.metrics_cb(name, fields); });
}

}  // namespace failsafe
