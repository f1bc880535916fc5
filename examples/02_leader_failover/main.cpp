// Example 02: Leader Failover
//
// Two workers compete for one lease in a shared in-memory KV. Worker A leads,
// goes quiet, and worker B takes over once A's lease expires.

#include <failsafe/ha/failover_coordinator.hpp>
#include <failsafe/ha/lease_lock.hpp>
#include <failsafe/kv/memory_kv_store.hpp>
#include <failsafe/log/spdlog_logger.hpp>

#include <cstdint>
#include <iostream>
#include <memory>

using namespace failsafe;

int main() {
    std::cout << "=== Leader Failover Example ===\n\n";

    // 1. Lease events go to the console
    set_logger(make_spdlog_console_logger(LogLevel::Info));

    // 2. Shared store on a manual millisecond clock
    std::int64_t now_ms = 0;
    auto kv = std::make_shared<InMemoryKvStore>([&now_ms] { return now_ms; });

    LeaseOptions options;
    options.with_ttl_ms(3000).with_renew_ms(1500).with_service("order-router");

    LeaseLock lock_a(kv, "order-router:leader", "worker-a", options);
    LeaseLock lock_b(kv, "order-router:leader", "worker-b", options);
    FailoverCoordinator worker_a(lock_a);
    FailoverCoordinator worker_b(lock_b);

    // 3. Both tick every 500ms; A stops ticking at t=2000
    for (now_ms = 0; now_ms <= 6000; now_ms += 500) {
        const bool a_alive = now_ms < 2000;

        std::cout << "t=" << now_ms;
        if (a_alive) {
            std::cout << "  A=" << to_string(worker_a.tick(now_ms));
        } else {
            std::cout << "  A=(silent)";
        }
        std::cout << "  B=" << to_string(worker_b.tick(now_ms));
        std::cout << "  holder=" << lock_b.holder().value_or("<none>") << "\n";
    }

    // 4. Clean shutdown hands the lease back immediately
    lock_b.release();
    std::cout << "\nAfter release: holder=" << lock_a.holder().value_or("<none>")
              << "  elections A=" << lock_a.elections()
              << " B=" << lock_b.elections() << "\n";

    set_logger(nullptr);
    return 0;
}
