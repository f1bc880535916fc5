#include <catch2/catch_test_macros.hpp>

#include "failsafe/log/logger.hpp"
#include "mocks/test_logger.hpp"

#include <chrono>
#include <memory>
#include <string>
#include <string_view>

using namespace failsafe;
using failsafe::testing::TestLogger;

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogLevel to_string returns correct names", "[log]") {
    REQUIRE(to_string(LogLevel::Trace) == "TRACE");
    REQUIRE(to_string(LogLevel::Debug) == "DEBUG");
    REQUIRE(to_string(LogLevel::Info) == "INFO");
    REQUIRE(to_string(LogLevel::Warn) == "WARN");
    REQUIRE(to_string(LogLevel::Error) == "ERROR");
    REQUIRE(to_string(LogLevel::Fatal) == "FATAL");
    REQUIRE(to_string(LogLevel::Off) == "OFF");
}

TEST_CASE("NullLogger discards all messages", "[log]") {
    NullLogger logger;

    REQUIRE_FALSE(logger.should_log(LogLevel::Trace));
    REQUIRE_FALSE(logger.should_log(LogLevel::Fatal));

    logger.info("dropped");
    logger.info_fmt("event=dropped n={}", 1);
}

TEST_CASE("Records below the minimum level are filtered", "[log]") {
    TestLogger logger(LogLevel::Warn);

    logger.trace("trace message");
    logger.debug("debug message");
    logger.info("info message");
    logger.warn("warn message");
    logger.error("error message");

    const auto records = logger.records();
    REQUIRE(records.size() == 2);
    REQUIRE(records[0].level == LogLevel::Warn);
    REQUIRE(records[0].message == "warn message");
    REQUIRE(records[1].level == LogLevel::Error);
    REQUIRE(records[1].message == "error message");
}

// ─────────────────────────────────────────────────────────────────────────────
// Records
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("LogRecord captures source location", "[log]") {
    TestLogger logger;
    logger.info("test message");

    const auto records = logger.records();
    REQUIRE(records.size() == 1);

    std::string_view filename(records[0].location.file_name());
    REQUIRE(filename.find("logger_test") != std::string_view::npos);
    REQUIRE(records[0].location.line() > 0);
}

TEST_CASE("LogRecord captures timestamp", "[log]") {
    TestLogger logger;

    const auto before = std::chrono::system_clock::now();
    logger.info("test message");
    const auto after = std::chrono::system_clock::now();

    const auto records = logger.records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].timestamp >= before);
    REQUIRE(records[0].timestamp <= after);
}

TEST_CASE("Formatted helpers build key=value lines", "[log]") {
    TestLogger logger(LogLevel::Debug);

    logger.debug_fmt("event=lease_renew key={} renew_ms={}", "orders:leader", 1500);
    logger.info_fmt("event=circuit_transition err_rate={:.6f}", 0.5);
    logger.warn_fmt("event=config_clamped value={}", -3);
    logger.error_fmt("event=lease_kv_error op={}", "get");

    const auto records = logger.records();
    REQUIRE(records.size() == 4);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[0].message == "event=lease_renew key=orders:leader renew_ms=1500");
    REQUIRE(records[1].message == "event=circuit_transition err_rate=0.500000");
    REQUIRE(records[2].level == LogLevel::Warn);
    REQUIRE(records[2].message == "event=config_clamped value=-3");
    REQUIRE(records[3].level == LogLevel::Error);
}

TEST_CASE("Formatted helpers skip filtered levels", "[log]") {
    TestLogger logger(LogLevel::Error);

    logger.debug_fmt("a={}", 1);
    logger.info_fmt("b={}", 2);
    logger.warn_fmt("c={}", 3);

    REQUIRE(logger.records().empty());
}

// ─────────────────────────────────────────────────────────────────────────────
// Global Logger
// ─────────────────────────────────────────────────────────────────────────────

TEST_CASE("Global logger defaults to NullLogger", "[log]") {
    set_logger(nullptr);

    REQUIRE_FALSE(get_logger().should_log(LogLevel::Fatal));
}

TEST_CASE("Global logger can be swapped", "[log]") {
    auto test_logger = std::make_unique<TestLogger>();
    auto* raw_ptr = test_logger.get();

    set_logger(std::move(test_logger));
    get_logger().info("test message");

    const auto records = raw_ptr->records();
    REQUIRE(records.size() == 1);
    REQUIRE(records[0].message == "test message");

    set_logger(nullptr);
}

TEST_CASE("logger_or_global prefers the injected logger", "[log]") {
    auto global = std::make_unique<TestLogger>();
    auto* global_ptr = global.get();
    set_logger(std::move(global));

    auto injected = std::make_shared<TestLogger>();

    SECTION("injected logger receives the record") {
        logger_or_global(injected).info("to injected");
        REQUIRE(injected->records().size() == 1);
        REQUIRE(global_ptr->records().empty());
    }

    SECTION("null falls back to the global logger") {
        logger_or_global(nullptr).info("to global");
        REQUIRE(global_ptr->records().size() == 1);
        REQUIRE(injected->records().empty());
    }

    set_logger(nullptr);
}

TEST_CASE("FAILSAFE_LOG macros write to the global logger", "[log]") {
    auto test_logger = std::make_unique<TestLogger>(LogLevel::Debug);
    auto* raw_ptr = test_logger.get();

    set_logger(std::move(test_logger));

    FAILSAFE_LOG_TRACE("trace");
    FAILSAFE_LOG_DEBUG("debug");
    FAILSAFE_LOG_INFO("info");
    FAILSAFE_LOG_WARN("warn");
    FAILSAFE_LOG_ERROR("error");

    const auto records = raw_ptr->records();
    REQUIRE(records.size() == 4);
    REQUIRE(records[0].level == LogLevel::Debug);
    REQUIRE(records[1].level == LogLevel::Info);
    REQUIRE(records[2].level == LogLevel::Warn);
    REQUIRE(records[3].level == LogLevel::Error);

    set_logger(nullptr);
}
