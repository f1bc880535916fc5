// ─────────────────────────────────────────────────────────────────────────────
// Lease Lock Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "failsafe/ha/lease_lock.hpp"
#include "failsafe/kv/memory_kv_store.hpp"
#include "mocks/faulty_kv_store.hpp"
#include "mocks/manual_clock.hpp"
#include "mocks/recording_metrics.hpp"
#include "mocks/test_logger.hpp"

#include <memory>
#include <stdexcept>
#include <string>

using namespace failsafe;
using namespace failsafe::testing;

namespace {

constexpr const char* KEY = "orders:leader";

// One shared store on a manual clock, as two processes would see it
struct LeaseFixture {
    ManualClock clock;
    std::shared_ptr<InMemoryKvStore> store = std::make_shared<InMemoryKvStore>(clock.clock_ms());
    std::shared_ptr<FaultyKvStore> kv = std::make_shared<FaultyKvStore>(store);
    std::shared_ptr<TestLogger> logger = std::make_shared<TestLogger>();
    std::shared_ptr<RecordingMetrics> metrics = std::make_shared<RecordingMetrics>();

    [[nodiscard]] LeaseOptions options() const {
        LeaseOptions opts;
        opts.with_ttl_ms(3000)
            .with_renew_ms(1500)
            .with_env("prod")
            .with_service("router")
            .with_logger(logger)
            .with_metrics(metrics);
        return opts;
    }

    [[nodiscard]] std::unique_ptr<LeaseLock> make_lock(const std::string& holder) const {
        return std::make_unique<LeaseLock>(kv, KEY, holder, options());
    }

    void at(std::int64_t ms) { clock.set_ms(ms); }
};

}  // namespace

// ═══════════════════════════════════════════════════════════════════════════
// Options
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("LeaseOptions clamps durations to at least 1ms", "[ha][lease]") {
    LeaseOptions options;
    options.with_ttl_ms(0).with_renew_ms(-20);

    const auto clamped = options.sanitized();
    REQUIRE(clamped.ttl_ms == 1);
    REQUIRE(clamped.renew_ms == 1);

    LeaseLock lock(std::make_shared<InMemoryKvStore>(), KEY, "A", options);
    REQUIRE(lock.options().ttl_ms == 1);
    REQUIRE(lock.options().renew_ms == 1);
}

TEST_CASE("LeaseLock requires a store", "[ha][lease]") {
    REQUIRE_THROWS_AS(LeaseLock(nullptr, KEY, "A"), std::invalid_argument);
}

TEST_CASE("LeaseLock exposes its identity", "[ha][lease]") {
    LeaseFixture f;
    auto lock = f.make_lock("A");

    REQUIRE(lock->key() == KEY);
    REQUIRE(lock->holder_id() == "A");
    REQUIRE(lock->options().env == "prod");
    REQUIRE(lock->options().service == "router");
    REQUIRE_FALSE(lock->believes_leader());
}

// ═══════════════════════════════════════════════════════════════════════════
// Acquisition
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("try_acquire claims a free key", "[ha][lease]") {
    LeaseFixture f;
    f.at(1000);
    auto a = f.make_lock("A");

    REQUIRE(a->try_acquire(1000));
    REQUIRE(a->believes_leader());
    REQUIRE(a->is_leader());
    REQUIRE(a->holder() == std::optional<std::string>{"A"});
    REQUIRE(a->last_renew_ms() == 1000);
    REQUIRE(a->elections() == 1);
    REQUIRE(f.store->expiry_ms(KEY) == std::optional<std::int64_t>{4000});
}

TEST_CASE("try_acquire fails while another holder's lease is live", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");

    REQUIRE(a->try_acquire(0));
    f.at(2999);
    REQUIRE_FALSE(b->try_acquire(2999));
    REQUIRE_FALSE(b->is_leader());
    REQUIRE(b->holder() == std::optional<std::string>{"A"});
    REQUIRE(b->elections() == 0);
}

TEST_CASE("try_acquire by the current holder keeps leadership", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.at(100);
    REQUIRE(a->try_acquire(100));
    REQUIRE(a->is_leader());
    REQUIRE(a->elections() == 1);

    // A second instance with the same holder id adopts the lease
    auto a_restarted = f.make_lock("A");
    REQUIRE(a_restarted->try_acquire(200));
    REQUIRE(a_restarted->is_leader());
}

TEST_CASE("try_acquire treats KV failures as not acquired", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");

    SECTION("error result") {
        f.kv->arm(KvOp::Setnx, KvFault::ReturnError);
    }
    SECTION("std::exception") {
        f.kv->arm(KvOp::Setnx, KvFault::Throw);
    }
    SECTION("non-standard exception") {
        f.kv->arm(KvOp::Setnx, KvFault::ThrowNonStandard);
    }

    bool acquired = true;
    REQUIRE_NOTHROW(acquired = a->try_acquire(0));
    REQUIRE_FALSE(acquired);
    REQUIRE_FALSE(a->believes_leader());
    REQUIRE(f.logger->count_containing("event=lease_kv_error op=setnx") == 1);
}

TEST_CASE("try_acquire does not assume leadership when the holder read fails", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");
    REQUIRE(a->try_acquire(0));

    f.kv->arm(KvOp::Get, KvFault::Throw);
    REQUIRE_FALSE(b->try_acquire(10));
    REQUIRE_FALSE(b->believes_leader());
}

TEST_CASE("A silent holder is replaced once its TTL elapses", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");
    REQUIRE(a->try_acquire(0));

    f.at(3000);
    REQUIRE(b->try_acquire(3000));
    REQUIRE(b->is_leader());

    // A still believes it leads until it asks the KV
    REQUIRE(a->believes_leader());
    REQUIRE_FALSE(a->is_leader());
    REQUIRE_FALSE(a->believes_leader());
    REQUIRE_FALSE(a->try_acquire(3000));
}

// ═══════════════════════════════════════════════════════════════════════════
// Renewal
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("renew is refused when not leader", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");

    REQUIRE_FALSE(a->renew(5000));
    REQUIRE(f.kv->calls(KvOp::Pexpire) == 0);
}

TEST_CASE("renew is paced by renew_ms", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.at(500);
    REQUIRE(a->renew(500));
    f.at(1499);
    REQUIRE(a->renew(1499));
    REQUIRE(f.kv->calls(KvOp::Pexpire) == 0);

    f.at(1500);
    REQUIRE(a->renew(1500));
    REQUIRE(f.kv->calls(KvOp::Pexpire) == 1);
    REQUIRE(a->last_renew_ms() == 1500);
}

TEST_CASE("renew before expiry extends the lease by renew_ms", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.at(2999);
    REQUIRE(a->renew(2999));
    REQUIRE(f.store->expiry_ms(KEY) == std::optional<std::int64_t>{2999 + 1500});
    REQUIRE(a->renew_failures() == 0);
}

TEST_CASE("renew after expiry fails and drops leadership", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.at(3000);
    REQUIRE_FALSE(a->renew(3000));
    REQUIRE_FALSE(a->believes_leader());
    REQUIRE(a->renew_failures() == 1);
    REQUIRE(f.metrics->renew_fails() == 1);
    REQUIRE(f.logger->count_containing("event=lease_renew_fail") == 1);
}

TEST_CASE("renew failure keeps leadership if the KV still names us", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.kv->arm(KvOp::Pexpire, KvFault::ReturnError);
    f.at(1500);
    REQUIRE_FALSE(a->renew(1500));
    REQUIRE(a->believes_leader());
    REQUIRE(a->renew_failures() == 1);

    // The next attempt goes back to the KV
    f.kv->clear();
    f.at(1600);
    REQUIRE(a->renew(1600));
    REQUIRE(a->last_renew_ms() == 1600);
}

TEST_CASE("renew failure with an unreadable KV drops leadership", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.kv->arm(KvOp::Pexpire, KvFault::Throw);
    f.kv->arm(KvOp::Get, KvFault::Throw);
    f.at(1500);

    bool renewed = true;
    REQUIRE_NOTHROW(renewed = a->renew(1500));
    REQUIRE_FALSE(renewed);
    REQUIRE_FALSE(a->believes_leader());
}

// ═══════════════════════════════════════════════════════════════════════════
// Release
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("release frees the key for the next holder", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");
    REQUIRE(a->try_acquire(0));

    f.at(100);
    a->release();
    REQUIRE_FALSE(a->is_leader());
    REQUIRE_FALSE(a->holder().has_value());
    REQUIRE(b->try_acquire(100));
    REQUIRE(f.logger->count_containing("event=lease_release key=orders:leader holder=A") == 1);
}

TEST_CASE("release without leadership does not touch the KV", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");

    a->release();
    REQUIRE(f.kv->calls(KvOp::Delkey) == 0);
}

TEST_CASE("release clears leadership even if the delete throws", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    f.kv->arm(KvOp::Delkey, KvFault::Throw);
    REQUIRE_NOTHROW(a->release());

    REQUIRE_FALSE(a->believes_leader());
    REQUIRE_FALSE(a->is_leader());
    REQUIRE(f.logger->count_containing("event=lease_kv_error op=delkey") == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Diagnostics
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("holder and kv_time_ms degrade to nullopt on KV failure", "[ha][lease]") {
    LeaseFixture f;
    f.at(1234);
    auto a = f.make_lock("A");

    REQUIRE(a->kv_time_ms() == std::optional<std::int64_t>{1234});

    f.kv->arm(KvOp::Get, KvFault::ReturnError);
    f.kv->arm(KvOp::TimeMs, KvFault::Throw);
    REQUIRE_FALSE(a->holder().has_value());
    REQUIRE_FALSE(a->kv_time_ms().has_value());
}

TEST_CASE("Lease events are logged as single lines", "[ha][lease][log]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));

    const auto records = f.logger->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].level == LogLevel::Info);
    REQUIRE(records[0].message == "event=lease_acquire key=orders:leader holder=A ttl_ms=3000 now=0");

    f.at(1500);
    REQUIRE(a->renew(1500));
    REQUIRE(f.logger->count_containing("event=lease_renew key=orders:leader holder=A renew_ms=1500 now=1500") == 1);
}

TEST_CASE("Leader metrics follow leadership changes", "[ha][lease][metrics]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    REQUIRE(a->try_acquire(0));
    a->release();

    const auto states = f.metrics->leader_states();
    REQUIRE(states.size() == 3);
    REQUIRE(states[0].state == 0.0);
    REQUIRE(states[1].state == 1.0);
    REQUIRE(states[2].state == 0.0);
    REQUIRE(states[1].labels.env == "prod");
    REQUIRE(states[1].labels.service == "router");
    REQUIRE(states[1].labels.instance == "A");

    REQUIRE(f.metrics->elections() == 1);
    REQUIRE(f.metrics->last_env() == "prod");
    REQUIRE(f.metrics->last_service() == "router");
}

TEST_CASE("Throwing metrics and log sinks do not affect leadership", "[ha][lease][metrics]") {
    LeaseFixture f;
    f.metrics->set_throw(true);
    f.logger->set_throw_on_log(true);

    std::unique_ptr<LeaseLock> a;
    REQUIRE_NOTHROW(a = f.make_lock("A"));

    bool acquired = false;
    REQUIRE_NOTHROW(acquired = a->try_acquire(0));
    REQUIRE(acquired);
    REQUIRE(a->is_leader());
    REQUIRE(a->sink_failures() > 0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Mutual Exclusion
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("At most one holder is leader at any instant", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");

    // A works for a while, goes quiet, comes back; B keeps trying throughout
    for (std::int64_t t = 0; t <= 12'000; t += 250) {
        f.at(t);
        const bool a_alive = t < 2000 || t >= 6000;
        if (a_alive) {
            if (!a->is_leader()) {
                a->try_acquire(t);
            } else {
                a->renew(t);
            }
        }
        if (!b->is_leader()) {
            b->try_acquire(t);
        } else {
            b->renew(t);
        }

        const bool a_leads = a->is_leader();
        const bool b_leads = b->is_leader();
        REQUIRE_FALSE((a_leads && b_leads));
    }
}

TEST_CASE("Two-holder failover trace never shows two leaders", "[ha][lease]") {
    LeaseFixture f;
    auto a = f.make_lock("A");
    auto b = f.make_lock("B");

    const auto no_split_brain = [&] {
        const bool a_leads = a->is_leader();
        const bool b_leads = b->is_leader();
        REQUIRE_FALSE((a_leads && b_leads));
    };

    f.at(0);
    REQUIRE(a->try_acquire(0));
    no_split_brain();

    f.at(500);
    REQUIRE(a->renew(500));
    no_split_brain();

    f.at(1500);
    REQUIRE(a->renew(1500));
    no_split_brain();

    // A is not renewed again; its lease runs out at 3000
    f.at(3000);
    REQUIRE(b->try_acquire(3000));
    no_split_brain();

    f.at(3300);
    REQUIRE(b->renew(3300));
    no_split_brain();

    f.at(4000);
    REQUIRE(b->renew(4000));
    no_split_brain();

    for (std::int64_t t : {4100, 4400}) {
        f.at(t);
        REQUIRE_FALSE(a->try_acquire(t));
        REQUIRE(b->renew(t));
        no_split_brain();
    }

    REQUIRE(b->is_leader());
    REQUIRE_FALSE(a->is_leader());
}
