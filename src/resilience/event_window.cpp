#include "failsafe/resilience/event_window.hpp"

#include <algorithm>

namespace failsafe {

EventWindow::EventWindow(int window_sec, std::size_t capacity)
    : window_sec_(std::max(0, window_sec))
    , capacity_(std::max<std::size_t>(1, capacity))
{}

std::size_t EventWindow::capacity_for(int window_sec, int events_per_sec_hint) noexcept {
    const std::int64_t hint = std::max(1, events_per_sec_hint);
    const std::int64_t wanted = static_cast<std::int64_t>(std::max(0, window_sec)) * hint;
    const std::int64_t at_least_one = std::max<std::int64_t>(1, wanted);
    return static_cast<std::size_t>(
        std::min<std::int64_t>(static_cast<std::int64_t>(MAX_WINDOW_BINS), at_least_one)
    );
}

bool EventWindow::add(std::int64_t epoch_second, bool is_error) {
    const std::uint64_t add_err = is_error ? 1 : 0;
    const std::uint64_t add_ok = is_error ? 0 : 1;

    if (!bins_.empty() && epoch_second <= bins_.back().epoch_second) {
        EventBin& bin = bins_.back();
        bin.ok_count += add_ok;
        bin.err_count += add_err;
        return true;
    }

    if (bins_.size() >= capacity_) {
        bins_.pop_front();
    }
    bins_.push_back(EventBin{epoch_second, add_ok, add_err});
    return false;
}

void EventWindow::prune(std::int64_t now_second) {
    const std::int64_t cutoff = now_second - window_sec_;
    while (!bins_.empty() && bins_.front().epoch_second < cutoff) {
        bins_.pop_front();
    }
}

double EventWindow::error_rate() const noexcept {
    std::uint64_t ok = 0;
    std::uint64_t err = 0;
    for (const EventBin& bin : bins_) {
        ok += bin.ok_count;
        err += bin.err_count;
    }
    const std::uint64_t total = ok + err;
    if (total == 0) {
        return 0.0;
    }
    return static_cast<double>(err) / static_cast<double>(total);
}

}  // namespace failsafe
