// ─────────────────────────────────────────────────────────────────────────────
// InMemoryKvStore Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_test_macros.hpp>

#include "failsafe/kv/memory_kv_store.hpp"
#include "mocks/manual_clock.hpp"

#include <cstdint>
#include <limits>
#include <optional>
#include <string>

using namespace failsafe;
using namespace failsafe::testing;

TEST_CASE("setnx creates a key only once", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    auto first = kv.setnx("lock", "A", 1000);
    REQUIRE(first.has_value());
    REQUIRE(*first);

    auto second = kv.setnx("lock", "B", 1000);
    REQUIRE(second.has_value());
    REQUIRE_FALSE(*second);

    auto value = kv.get("lock");
    REQUIRE(value.has_value());
    REQUIRE(*value == std::optional<std::string>{"A"});
}

TEST_CASE("Keys expire when now reaches the expiry", "[kv]") {
    ManualClock clock;
    clock.set_ms(1000);
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("lock", "A", 500));
    REQUIRE(kv.expiry_ms("lock") == std::optional<std::int64_t>{1500});

    clock.set_ms(1499);
    REQUIRE(kv.get("lock")->has_value());

    clock.set_ms(1500);
    REQUIRE_FALSE(kv.get("lock")->has_value());
    REQUIRE(*kv.setnx("lock", "B", 500));
}

TEST_CASE("A zero TTL expires immediately", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("lock", "A", 0));
    REQUIRE_FALSE(kv.get("lock")->has_value());
    REQUIRE(kv.size() == 0);
}

TEST_CASE("pexpire only extends live keys", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE_FALSE(*kv.pexpire("missing", 1000));

    REQUIRE(*kv.setnx("lock", "A", 1000));
    clock.set_ms(800);
    REQUIRE(*kv.pexpire("lock", 1000));
    REQUIRE(kv.expiry_ms("lock") == std::optional<std::int64_t>{1800});

    clock.set_ms(1800);
    REQUIRE_FALSE(*kv.pexpire("lock", 1000));
}

TEST_CASE("delkey is idempotent", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("lock", "A", 1000));
    REQUIRE(kv.delkey("lock").has_value());
    REQUIRE(kv.delkey("lock").has_value());
    REQUIRE_FALSE(kv.get("lock")->has_value());
}

TEST_CASE("time_ms reports the injected clock", "[kv]") {
    ManualClock clock;
    clock.set_ms(42'000);
    InMemoryKvStore kv(clock.clock_ms());

    const auto now = kv.time_ms();
    REQUIRE(now.has_value());
    REQUIRE(*now == 42'000);
}

TEST_CASE("size counts only live keys", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("a", "1", 100));
    REQUIRE(*kv.setnx("b", "1", 200));
    REQUIRE(kv.size() == 2);

    clock.set_ms(150);
    REQUIRE(kv.size() == 1);
}

TEST_CASE("Default store runs on the system clock", "[kv]") {
    InMemoryKvStore kv;

    const auto now = kv.time_ms();
    REQUIRE(now.has_value());
    REQUIRE(*now > 0);
    REQUIRE(*kv.setnx("lock", "A", 60'000));
    REQUIRE(kv.get("lock")->value() == "A");
}

TEST_CASE("Very long TTLs saturate instead of overflowing", "[kv]") {
    constexpr std::int64_t max_ms = std::numeric_limits<std::int64_t>::max();
    ManualClock clock;
    clock.set_ms(1000);
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("lock", "A", max_ms));
    REQUIRE(kv.expiry_ms("lock") == std::optional<std::int64_t>{max_ms});
    REQUIRE(kv.get("lock")->has_value());

    clock.set_ms(5000);
    REQUIRE(*kv.pexpire("lock", max_ms - 1));
    REQUIRE(kv.expiry_ms("lock") == std::optional<std::int64_t>{max_ms});
    REQUIRE(kv.get("lock")->value() == "A");
}

TEST_CASE("Expired keys that are never read again are swept", "[kv]") {
    ManualClock clock;
    InMemoryKvStore kv(clock.clock_ms());

    REQUIRE(*kv.setnx("a", "1", 100));
    REQUIRE(*kv.setnx("b", "1", 100));
    REQUIRE(*kv.setnx("c", "1", 1000));
    REQUIRE(kv.stored_entries() == 3);

    clock.set_ms(500);
    REQUIRE(kv.stored_entries() == 3);

    SECTION("by the next key creation") {
        REQUIRE(*kv.setnx("d", "1", 100));
        REQUIRE(kv.stored_entries() == 2);
    }

    SECTION("by size()") {
        REQUIRE(kv.size() == 1);
        REQUIRE(kv.stored_entries() == 1);
    }
}
