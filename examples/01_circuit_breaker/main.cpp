// Example 01: Circuit Breaker
//
// Feeds a simulated dependency through a breaker on a hand-driven clock and
// shows it tripping, waiting out min_closed_sec, probing and closing again.

#include <failsafe/log/spdlog_logger.hpp>
#include <failsafe/resilience/circuit_breaker.hpp>

#include <iostream>
#include <memory>
#include <string>

using namespace failsafe;

int main() {
    std::cout << "=== Circuit Breaker Example ===\n\n";

    // 1. Small parameters so the demo is short
    CircuitParams params{
        .max_err_rate = 0.5,
        .window_sec = 10,
        .min_closed_sec = 5,
        .half_open_probe = 2
    };

    std::cout << "Circuit Breaker Configuration:\n";
    std::cout << "  Max error rate:  " << params.max_err_rate << "\n";
    std::cout << "  Window:          " << params.window_sec << " seconds\n";
    std::cout << "  Min closed time: " << params.min_closed_sec << " seconds\n";
    std::cout << "  Probes to close: " << params.half_open_probe << "\n\n";

    // 2. Manual clock, transition lines on stdout
    double now = 0.0;
    CircuitBreakerOptions options;
    options.with_time_fn([&now] { return now; })
           .with_logger(std::shared_ptr<ILogger>(make_spdlog_event_logger()));

    CircuitBreaker breaker(params, std::move(options));

    // 3. One outcome per second: healthy, then failing, then healthy again
    const std::string script = "oooxxxxoooooooo";
    for (char outcome : script) {
        const bool is_error = outcome == 'x';
        if (!allows_traffic(breaker.state())) {
            std::cout << "t=" << now << "  request would be rejected (TRIPPED), recording anyway\n";
        }
        const CircuitState state = breaker.record(is_error);
        std::cout << "t=" << now << "  " << (is_error ? "error  " : "success")
                  << "  -> " << to_string(state) << "\n";
        now += 1.0;
    }

    // 4. Final view
    const CircuitSnapshot snap = breaker.snapshot();
    std::cout << "\nFinal snapshot:\n";
    std::cout << "  State:           " << to_string(snap.state) << "\n";
    std::cout << "  Error rate:      " << snap.err_rate << "\n";
    std::cout << "  Bins in window:  " << snap.window_len << "\n";
    std::cout << "  Last transition: t=" << snap.last_transition_ts << "\n";

    return 0;
}
