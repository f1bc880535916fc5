#pragma once

#include "failsafe/ha/lease_lock.hpp"
#include "failsafe/log/logger.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string_view>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Failover Role
// ─────────────────────────────────────────────────────────────────────────────

enum class FailoverRole : std::uint8_t {
    Follower,
    Leader
};

[[nodiscard]] constexpr std::string_view to_string(FailoverRole role) noexcept {
    switch (role) {
        case FailoverRole::Follower: return "follower";
        case FailoverRole::Leader:   return "leader";
    }
    return "follower";
}

// ─────────────────────────────────────────────────────────────────────────────
// Failover Coordinator
// ─────────────────────────────────────────────────────────────────────────────
// Drives one LeaseLock once per external tick: followers try to acquire,
// leaders renew. The returned role is always the KV's answer after the
// attempt, so a failed renewal shows up on the same tick.
//
// The coordinator does not own the lock; the lock must outlive it.

class FailoverCoordinator {
public:
    explicit FailoverCoordinator(LeaseLock& lock, std::shared_ptr<ILogger> logger = nullptr);

    /// One acquire-or-renew step at `now_ms`
    FailoverRole tick(std::int64_t now_ms);

    /// Same, timed by the KV's clock. Follower if the clock cannot be read;
    /// that role change is logged with now=unknown.
    FailoverRole tick();

    /// Role returned by the most recent tick, nullopt before the first one
    [[nodiscard]] std::optional<FailoverRole> last_role() const noexcept { return last_role_; }

    [[nodiscard]] std::uint64_t ticks() const noexcept { return ticks_; }

    /// Role-change log lines whose sink threw
    [[nodiscard]] std::uint64_t sink_failures() const noexcept { return sink_failures_; }

    [[nodiscard]] LeaseLock& lock() noexcept { return lock_; }

private:
    // Logs an event=failover_role line when `role` differs from the last one
    void record_role(FailoverRole role, std::optional<std::int64_t> now_ms);

    LeaseLock& lock_;
    std::shared_ptr<ILogger> logger_;
    std::optional<FailoverRole> last_role_;
    std::uint64_t ticks_{0};
    std::uint64_t sink_failures_{0};
};

}  // namespace failsafe
