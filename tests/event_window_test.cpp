// ─────────────────────────────────────────────────────────────────────────────
// Event Window Tests
// ─────────────────────────────────────────────────────────────────────────────

#include <catch2/catch_approx.hpp>
#include <catch2/catch_test_macros.hpp>

#include "failsafe/log/log_budget.hpp"
#include "failsafe/resilience/event_window.hpp"

using namespace failsafe;
using Catch::Approx;

// ═══════════════════════════════════════════════════════════════════════════
// Capacity
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventWindow capacity follows window and hint", "[resilience][window]") {
    REQUIRE(EventWindow::capacity_for(300, 1) == 300);
    REQUIRE(EventWindow::capacity_for(300, 10) == 3000);
    REQUIRE(EventWindow::capacity_for(300, 1000) == MAX_WINDOW_BINS);
    REQUIRE(EventWindow::capacity_for(0, 1) == 1);
    REQUIRE(EventWindow::capacity_for(60, 0) == 60);
    REQUIRE(EventWindow::capacity_for(-10, 5) == 1);
}

TEST_CASE("EventWindow evicts the oldest bin when full", "[resilience][window]") {
    EventWindow window(100, 2);

    REQUIRE_FALSE(window.add(1, true));
    REQUIRE_FALSE(window.add(2, false));
    REQUIRE_FALSE(window.add(3, false));

    REQUIRE(window.size() == 2);
    REQUIRE(window.bins().front().epoch_second == 2);
    REQUIRE(window.error_rate() == 0.0);
}

// ═══════════════════════════════════════════════════════════════════════════
// Binning
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("EventWindow coalesces outcomes of the same second", "[resilience][window]") {
    EventWindow window(10, 10);

    REQUIRE_FALSE(window.add(50, false));
    REQUIRE(window.add(50, true));
    REQUIRE(window.add(50, true));

    REQUIRE(window.size() == 1);
    REQUIRE(window.newest().ok_count == 1);
    REQUIRE(window.newest().err_count == 2);
    REQUIRE(window.newest().total() == 3);
    REQUIRE(window.error_rate() == Approx(2.0 / 3.0));
}

TEST_CASE("EventWindow folds earlier seconds into the newest bin", "[resilience][window]") {
    EventWindow window(10, 10);
    window.add(50, false);

    REQUIRE(window.add(45, true));
    REQUIRE(window.size() == 1);
    REQUIRE(window.newest().epoch_second == 50);
    REQUIRE(window.newest().err_count == 1);
}

TEST_CASE("EventWindow prune keeps the inclusive boundary", "[resilience][window]") {
    EventWindow window(10, 100);
    window.add(100, true);
    window.add(105, false);
    window.add(110, false);

    window.prune(110);
    REQUIRE(window.size() == 3);

    window.prune(111);
    REQUIRE(window.size() == 2);
    REQUIRE(window.bins().front().epoch_second == 105);

    window.prune(200);
    REQUIRE(window.empty());
    REQUIRE(window.error_rate() == 0.0);
}

TEST_CASE("EventWindow clamps its arguments", "[resilience][window]") {
    EventWindow window(-3, 0);
    REQUIRE(window.window_sec() == 0);
    REQUIRE(window.capacity() == 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Log Budget
// ═══════════════════════════════════════════════════════════════════════════

TEST_CASE("LogBudget allows a fixed number of lines per second", "[log][budget]") {
    LogBudget budget(3);

    REQUIRE(budget.try_consume(10));
    REQUIRE(budget.try_consume(10));
    REQUIRE(budget.try_consume(10));
    REQUIRE_FALSE(budget.try_consume(10));
    REQUIRE_FALSE(budget.try_consume(10));
    REQUIRE(budget.suppressed() == 2);

    REQUIRE(budget.try_consume(11));
}

TEST_CASE("LogBudget treats negative budgets as zero", "[log][budget]") {
    LogBudget budget(-5);

    REQUIRE(budget.max_lines_per_sec() == 0);
    REQUIRE_FALSE(budget.try_consume(0));
    REQUIRE_FALSE(budget.try_consume(1));
    REQUIRE(budget.suppressed() == 2);
}
