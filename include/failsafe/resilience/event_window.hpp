#pragma once

#include <cstddef>
#include <cstdint>
#include <deque>

namespace failsafe {

/// Hard cap on the number of per-second bins a window may hold
inline constexpr std::size_t MAX_WINDOW_BINS = 10'000;

// ─────────────────────────────────────────────────────────────────────────────
// Event Bin
// ─────────────────────────────────────────────────────────────────────────────

struct EventBin {
    std::int64_t epoch_second{0};
    std::uint64_t ok_count{0};
    std::uint64_t err_count{0};

    [[nodiscard]] std::uint64_t total() const noexcept { return ok_count + err_count; }
};

// ─────────────────────────────────────────────────────────────────────────────
// EventWindow - trailing window of per-second outcome bins
// ─────────────────────────────────────────────────────────────────────────────
// Outcomes recorded in the same integer second share one bin, so memory is
// bounded by the number of distinct seconds, not by call volume. Seconds with
// no outcome have no bin at all. Bins stay ordered by time; an outcome stamped
// earlier than the newest bin (clock stepped backwards) is folded into the
// newest bin. When the window is at capacity the oldest bin is evicted.

class EventWindow {
public:
    EventWindow(int window_sec, std::size_t capacity);

    /// min(MAX_WINDOW_BINS, max(1, window_sec * events_per_sec_hint))
    [[nodiscard]] static std::size_t capacity_for(int window_sec, int events_per_sec_hint) noexcept;

    /// Add one outcome. Returns true if it was coalesced into an existing bin.
    bool add(std::int64_t epoch_second, bool is_error);

    /// Drop bins with epoch_second < now_second - window_sec
    void prune(std::int64_t now_second);

    /// Σerr / (Σok + Σerr) over the bins currently held; 0 when empty
    [[nodiscard]] double error_rate() const noexcept;

    [[nodiscard]] std::size_t size() const noexcept { return bins_.size(); }
    [[nodiscard]] bool empty() const noexcept { return bins_.empty(); }
    [[nodiscard]] std::size_t capacity() const noexcept { return capacity_; }
    [[nodiscard]] int window_sec() const noexcept { return window_sec_; }

    /// Newest bin; window must not be empty
    [[nodiscard]] const EventBin& newest() const { return bins_.back(); }

    [[nodiscard]] const std::deque<EventBin>& bins() const noexcept { return bins_; }

private:
    int window_sec_;
    std::size_t capacity_;
    std::deque<EventBin> bins_;
};

}  // namespace failsafe
