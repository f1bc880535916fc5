#include "failsafe/ha/failover_coordinator.hpp"

#include <string>
#include <utility>

namespace failsafe {

FailoverCoordinator::FailoverCoordinator(LeaseLock& lock, std::shared_ptr<ILogger> logger)
    : lock_(lock)
    , logger_(std::move(logger))
{}

FailoverRole FailoverCoordinator::tick(std::int64_t now_ms) {
    ++ticks_;

    if (!lock_.is_leader()) {
        lock_.try_acquire(now_ms);
    } else {
        // A failed renewal is reflected by the is_leader() below
        lock_.renew(now_ms);
    }

    const FailoverRole role = lock_.is_leader() ? FailoverRole::Leader : FailoverRole::Follower;
    record_role(role, now_ms);
    return role;
}

FailoverRole FailoverCoordinator::tick() {
    const auto now = lock_.kv_time_ms();
    if (!now.has_value()) {
        ++ticks_;
        record_role(FailoverRole::Follower, std::nullopt);
        return FailoverRole::Follower;
    }
    return tick(*now);
}

void FailoverCoordinator::record_role(FailoverRole role, std::optional<std::int64_t> now_ms) {
    if (last_role_ != role) {
        const auto from = last_role_.has_value() ? to_string(*last_role_) : std::string_view{"none"};
        const std::string now_text = now_ms.has_value() ? std::to_string(*now_ms) : std::string("unknown");
        const bool logged = try_invoke_sink([&] {
            logger_or_global(logger_).info_fmt(
                "event=failover_role key={} holder={} role_from={} role_to={} now={}",
                lock_.key(), lock_.holder_id(), from, to_string(role), now_text
            );
        });
        if (!logged) {
            ++sink_failures_;
        }
    }
    last_role_ = role;
}

}  // namespace failsafe
