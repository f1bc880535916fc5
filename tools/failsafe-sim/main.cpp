// ─────────────────────────────────────────────────────────────────────────────
// failsafe-sim - Deterministic failover and breaker drills
// ─────────────────────────────────────────────────────────────────────────────
// Replays failure scenarios against the real breaker and lease lock, driven by
// a manual clock, so a run takes milliseconds and always prints the same lines.
//
// Usage:
//   # Two holders share one in-memory KV; A goes silent and B must take over
//   failsafe-sim --mode failover --ttl-ms 3000 --renew-ms 1500 --outage-ms 3000
//
//   # Error burst through a breaker, printing every transition
//   failsafe-sim --mode breaker --burst-sec 20
//
//   # Parameters from a config file, summary as JSON
//   failsafe-sim --mode failover --config resilience.json --json
//
// Exit status of failover mode is 0 only if no tick saw two leaders.

#include <cxxopts.hpp>
#include <nlohmann/json.hpp>

#include "failsafe/config/resilience_config.hpp"
#include "failsafe/ha/failover_coordinator.hpp"
#include "failsafe/ha/lease_lock.hpp"
#include "failsafe/kv/memory_kv_store.hpp"
#include "failsafe/log/spdlog_logger.hpp"
#include "failsafe/resilience/circuit_breaker.hpp"

#include <cstdint>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <variant>

using namespace failsafe;

namespace {

void print_error(const std::string& msg) {
    std::cerr << "error: " << msg << "\n";
}

// ═══════════════════════════════════════════════════════════════════════════
// Failover Drill
// ═══════════════════════════════════════════════════════════════════════════

struct FailoverDrill {
    LeaseSettings lease;
    std::int64_t tick_ms{100};
    std::int64_t duration_ms{8000};
    std::int64_t outage_start_ms{1600};
    std::int64_t outage_ms{3000};
};

int cmd_failover(const FailoverDrill& drill, bool json_output) {
    std::int64_t now_ms = 0;
    auto kv = std::make_shared<InMemoryKvStore>([&now_ms] { return now_ms; });

    LeaseOptions options;
    options.with_ttl_ms(drill.lease.ttl_ms)
           .with_renew_ms(drill.lease.renew_ms)
           .with_env(drill.lease.env)
           .with_service(drill.lease.service);

    LeaseLock lock_a(kv, drill.lease.key, "A", options);
    LeaseLock lock_b(kv, drill.lease.key, "B", options);
    FailoverCoordinator node_a(lock_a);
    FailoverCoordinator node_b(lock_b);

    const std::int64_t outage_end_ms = drill.outage_start_ms + drill.outage_ms;
    std::optional<std::int64_t> takeover_at;
    std::uint64_t dual_leader_ticks = 0;
    auto ticks = nlohmann::json::array();

    const auto report = [&](std::string_view role, FailoverRole state) {
        if (json_output) {
            ticks.push_back({{"t", now_ms}, {"role", std::string(role)}, {"state", std::string(to_string(state))}});
        } else {
            std::cout << "CHAOS t=" << now_ms << " role=" << role << " state=" << to_string(state) << "\n";
        }
    };

    for (now_ms = 0; now_ms <= drill.duration_ms; now_ms += drill.tick_ms) {
        const bool a_down = now_ms >= drill.outage_start_ms && now_ms < outage_end_ms;

        std::optional<FailoverRole> role_a;
        if (!a_down) {
            role_a = node_a.tick(now_ms);
            report("A", *role_a);
        }
        const FailoverRole role_b = node_b.tick(now_ms);
        report("B", role_b);

        if (role_a == FailoverRole::Leader && role_b == FailoverRole::Leader) {
            ++dual_leader_ticks;
        }
        if (!takeover_at.has_value() && role_b == FailoverRole::Leader && now_ms >= drill.outage_start_ms) {
            takeover_at = now_ms - drill.outage_start_ms;
        }
    }

    lock_a.release();
    lock_b.release();

    const std::int64_t takeover_ms = takeover_at.value_or(-1);
    if (json_output) {
        nlohmann::json summary = {
            {"ttl_ms", lock_a.options().ttl_ms},
            {"renew_ms", lock_a.options().renew_ms},
            {"outage_start_ms", drill.outage_start_ms},
            {"outage_ms", drill.outage_ms},
            {"takeover_ms", takeover_ms},
            {"dual_leader_ticks", dual_leader_ticks},
            {"elections", {{"A", lock_a.elections()}, {"B", lock_b.elections()}}},
            {"ticks", ticks}
        };
        std::cout << summary.dump(2) << "\n";
    } else {
        std::cout << "CHAOS_SUMMARY takeover_ms=" << takeover_ms
                  << " dual_leader_ticks=" << dual_leader_ticks << "\n";
    }
    return dual_leader_ticks == 0 ? 0 : 1;
}

// ═══════════════════════════════════════════════════════════════════════════
// Breaker Drill
// ═══════════════════════════════════════════════════════════════════════════

struct BreakerDrill {
    CircuitParams params;
    BreakerSettings settings;
    int events_per_sec{10};
    int healthy_sec{60};
    int burst_sec{20};
    int duration_sec{300};
};

int cmd_breaker(const BreakerDrill& drill, bool json_output) {
    double now = 0.0;

    ResilienceConfig config;
    config.circuit = drill.params;
    config.breaker = drill.settings;

    CircuitBreakerOptions options = config.breaker_options();
    options.with_time_fn([&now] { return now; });
    if (!json_output) {
        options.with_logger(std::shared_ptr<ILogger>(make_spdlog_event_logger()));
    }

    auto transitions = nlohmann::json::array();
    options.with_metrics_callback([&](std::string_view name, const MetricFields& fields) {
        if (name != metric_names::TRANSITIONS_TOTAL) {
            return;
        }
        transitions.push_back({
            {"t", now},
            {"from", std::get<std::string>(fields.at("from"))},
            {"to", std::get<std::string>(fields.at("to"))}
        });
    });

    CircuitBreaker breaker(drill.params, std::move(options));

    const int burst_end = drill.healthy_sec + drill.burst_sec;
    for (int second = 0; second < drill.duration_sec; ++second) {
        const bool failing = second >= drill.healthy_sec && second < burst_end;
        for (int i = 0; i < drill.events_per_sec; ++i) {
            now = second + static_cast<double>(i) / drill.events_per_sec;
            breaker.record(failing);
        }
    }

    const CircuitSnapshot snap = breaker.snapshot();
    if (json_output) {
        nlohmann::json summary = {
            {"transitions", transitions},
            {"state", std::string(to_string(snap.state))},
            {"err_rate", snap.err_rate},
            {"window_len", snap.window_len},
            {"last_transition_ts", snap.last_transition_ts},
            {"flood_coalesced", breaker.flood_coalesced()}
        };
        std::cout << summary.dump(2) << "\n";
    } else {
        std::cout << "SNAPSHOT state=" << to_string(snap.state)
                  << " err_rate=" << snap.err_rate
                  << " window_len=" << snap.window_len
                  << " last_transition_ts=" << snap.last_transition_ts
                  << " flood_coalesced=" << breaker.flood_coalesced() << "\n";
    }
    return 0;
}

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Main
// ═══════════════════════════════════════════════════════════════════════════

int main(int argc, char* argv[]) {
    cxxopts::Options options("failsafe-sim", "Deterministic failover and circuit breaker drills");

    options.add_options()
        ("m,mode", "Drill to run: failover or breaker", cxxopts::value<std::string>()->default_value("failover"))
        ("c,config", "Resilience config JSON (flags override it)", cxxopts::value<std::string>())

        // Failover drill
        ("ttl-ms", "Lease TTL", cxxopts::value<std::int64_t>())
        ("renew-ms", "Lease renewal pacing", cxxopts::value<std::int64_t>())
        ("tick-ms", "Coordinator tick interval", cxxopts::value<std::int64_t>()->default_value("100"))
        ("duration-ms", "Failover drill length", cxxopts::value<std::int64_t>()->default_value("8000"))
        ("outage-start-ms", "When holder A goes silent", cxxopts::value<std::int64_t>()->default_value("1600"))
        ("outage-ms", "How long holder A stays silent", cxxopts::value<std::int64_t>()->default_value("3000"))

        // Breaker drill
        ("max-err-rate", "Trip threshold", cxxopts::value<double>())
        ("window-sec", "Error-rate window", cxxopts::value<int>())
        ("min-closed-sec", "Minimum time tripped before probing", cxxopts::value<int>())
        ("half-open-probe", "Successes needed to close", cxxopts::value<int>())
        ("events-per-sec", "Outcomes recorded per simulated second", cxxopts::value<int>()->default_value("10"))
        ("healthy-sec", "Healthy seconds before the burst", cxxopts::value<int>()->default_value("60"))
        ("burst-sec", "Seconds of errors", cxxopts::value<int>()->default_value("20"))
        ("duration-sec", "Breaker drill length", cxxopts::value<int>()->default_value("300"))

        // Output options
        ("j,json", "Output results as JSON")
        ("v,verbose", "Log lease and breaker internals to stderr")
        ("h,help", "Print usage");

    try {
        auto result = options.parse(argc, argv);

        if (result.count("help")) {
            std::cout << options.help() << "\n";
            std::cout << "Examples:\n";
            std::cout << "    failsafe-sim --mode failover --ttl-ms 3000 --renew-ms 1500 --outage-ms 3000\n";
            std::cout << "    failsafe-sim --mode breaker --burst-sec 20 --json\n";
            return 0;
        }

        const bool json_output = result.count("json") > 0;
        if (result.count("verbose")) {
            set_logger(make_spdlog_stderr_logger(LogLevel::Debug));
        }

        ResilienceConfig config;
        if (result.count("config")) {
            auto loaded = load_resilience_config(result["config"].as<std::string>());
            if (!loaded) {
                print_error(std::string(to_string(loaded.error().code)) + ": " + loaded.error().message);
                return 1;
            }
            config = std::move(*loaded);
        }

        const std::string mode = result["mode"].as<std::string>();

        if (mode == "failover") {
            FailoverDrill drill;
            drill.lease = config.lease;
            if (result.count("ttl-ms")) {
                drill.lease.ttl_ms = result["ttl-ms"].as<std::int64_t>();
            }
            if (result.count("renew-ms")) {
                drill.lease.renew_ms = result["renew-ms"].as<std::int64_t>();
            }
            drill.tick_ms = result["tick-ms"].as<std::int64_t>();
            drill.duration_ms = result["duration-ms"].as<std::int64_t>();
            drill.outage_start_ms = result["outage-start-ms"].as<std::int64_t>();
            drill.outage_ms = result["outage-ms"].as<std::int64_t>();

            if (drill.tick_ms <= 0) {
                print_error("--tick-ms must be positive");
                return 1;
            }
            return cmd_failover(drill, json_output);
        }

        if (mode == "breaker") {
            BreakerDrill drill;
            drill.params = config.circuit;
            drill.settings = config.breaker;
            if (result.count("max-err-rate")) {
                drill.params.max_err_rate = result["max-err-rate"].as<double>();
            }
            if (result.count("window-sec")) {
                drill.params.window_sec = result["window-sec"].as<int>();
            }
            if (result.count("min-closed-sec")) {
                drill.params.min_closed_sec = result["min-closed-sec"].as<int>();
            }
            if (result.count("half-open-probe")) {
                drill.params.half_open_probe = result["half-open-probe"].as<int>();
            }
            drill.events_per_sec = result["events-per-sec"].as<int>();
            drill.healthy_sec = result["healthy-sec"].as<int>();
            drill.burst_sec = result["burst-sec"].as<int>();
            drill.duration_sec = result["duration-sec"].as<int>();

            if (drill.events_per_sec <= 0) {
                print_error("--events-per-sec must be positive");
                return 1;
            }
            return cmd_breaker(drill, json_output);
        }

        print_error("unknown mode '" + mode + "' (expected failover or breaker)");
        std::cout << "\n" << options.help() << "\n";
        return 1;

    } catch (const cxxopts::exceptions::exception& e) {
        print_error(e.what());
        return 1;
    }
}
