#pragma once

#include <cstdint>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// LogBudget - per-second line allowance
// ─────────────────────────────────────────────────────────────────────────────
// Caps how many lines a component may emit within one epoch second, no matter
// how many events it sees. The allowance refills when the second changes.
//
//   LogBudget budget(10);
//   if (budget.try_consume(now_sec)) {
//       logger.info(line);
//   }

class LogBudget {
public:
    explicit LogBudget(int max_lines_per_sec) noexcept
        : max_lines_per_sec_(max_lines_per_sec < 0 ? 0 : max_lines_per_sec)
        , remaining_(max_lines_per_sec_)
    {}

    /// Take one line from the allowance of `epoch_second`
    [[nodiscard]] bool try_consume(std::int64_t epoch_second) noexcept {
        if (epoch_second != current_second_) {
            current_second_ = epoch_second;
            remaining_ = max_lines_per_sec_;
        }
        if (remaining_ <= 0) {
            ++suppressed_;
            return false;
        }
        --remaining_;
        return true;
    }

    [[nodiscard]] int max_lines_per_sec() const noexcept { return max_lines_per_sec_; }

    /// Lines refused since construction
    [[nodiscard]] std::uint64_t suppressed() const noexcept { return suppressed_; }

private:
    int max_lines_per_sec_;
    int remaining_;
    std::int64_t current_second_{-1};
    std::uint64_t suppressed_{0};
};

}  // namespace failsafe
