#pragma once

// ═══════════════════════════════════════════════════════════════════════════
// Lease Lock
// ═══════════════════════════════════════════════════════════════════════════
// Leadership over one key among competing processes, held as a TTL lease in
// an IKvStore. Each process constructs one LeaseLock with its own holder id.
//
//   NoLeader ──A.try_acquire()──▶ A leads ──A keeps renewing──▶ A leads
//       ▲                                        │
//       │                           A goes quiet │ TTL elapses in the KV
//       └────────────────────────────────────────┘
//   NoLeader ──B.try_acquire()──▶ B leads;  A.try_acquire() now fails
//
// The local leadership flag is a hint. The KV is the only authority and
// is_leader() confirms the flag against it, because a lease can expire with no
// local call noticing. Leadership is only ever taken by try_acquire(); a lease
// that still names this holder after release() is not re-adopted by a query.
// Every KV call is isolated: an error result or a thrown exception is logged
// and treated as "not leader" / "operation failed".
//
// Not thread-safe; one coordinator drives one LeaseLock.

#include "failsafe/kv/kv_store.hpp"
#include "failsafe/log/logger.hpp"
#include "failsafe/metrics/metrics.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// Lease Options
// ─────────────────────────────────────────────────────────────────────────────

struct LeaseOptions {
    /// Lease length written by a successful acquisition
    std::int64_t ttl_ms{3000};

    /// Minimum spacing between renewals; also the span each renewal extends
    /// the lease by
    std::int64_t renew_ms{1500};

    /// Metric labels
    std::string env{"dev"};
    std::string service{"default"};

    /// Null means the global logger
    std::shared_ptr<ILogger> logger;

    /// Null means no leader metrics
    std::shared_ptr<ILeaderMetrics> metrics;

    /// Copy with ttl_ms and renew_ms clamped to at least 1
    [[nodiscard]] LeaseOptions sanitized() const;

    LeaseOptions& with_ttl_ms(std::int64_t ttl);
    LeaseOptions& with_renew_ms(std::int64_t renew);
    LeaseOptions& with_env(std::string environment);
    LeaseOptions& with_service(std::string service_name);
    LeaseOptions& with_logger(std::shared_ptr<ILogger> sink);
    LeaseOptions& with_metrics(std::shared_ptr<ILeaderMetrics> sink);
};

// ─────────────────────────────────────────────────────────────────────────────
// Lease Lock
// ─────────────────────────────────────────────────────────────────────────────

class LeaseLock {
public:
    /// Throws std::invalid_argument if `kv` is null
    LeaseLock(
        std::shared_ptr<IKvStore> kv,
        std::string key,
        std::string holder_id,
        LeaseOptions options = {}
    );

    LeaseLock(const LeaseLock&) = delete;
    LeaseLock& operator=(const LeaseLock&) = delete;

    // The lease is left to expire if release() was never called
    ~LeaseLock() = default;

    /// Claim the lease. On conflict, succeeds only if the KV already names
    /// this holder.
    bool try_acquire(std::int64_t now_ms);

    /// Extend the lease by renew_ms, at most once per renew_ms. Returns true
    /// without a KV call while the last renewal is recent enough.
    bool renew(std::int64_t now_ms);

    /// Delete the lease if held; leadership is cleared even if the delete fails
    void release();

    /// Authoritative: true only while the local flag is set and the KV still
    /// names this holder. Clears the flag when the KV disagrees or fails.
    [[nodiscard]] bool is_leader();

    /// Current holder according to the KV; nullopt if none or unreadable
    [[nodiscard]] std::optional<std::string> holder();

    /// The store's clock; nullopt if it cannot be read
    [[nodiscard]] std::optional<std::int64_t> kv_time_ms();

    // ─────────────────────────────────────────────────────────────────────────
    // Diagnostics
    // ─────────────────────────────────────────────────────────────────────────

    /// Local, possibly stale, leadership flag
    [[nodiscard]] bool believes_leader() const noexcept { return leader_; }

    [[nodiscard]] const std::string& key() const noexcept { return key_; }
    [[nodiscard]] const std::string& holder_id() const noexcept { return holder_id_; }
    [[nodiscard]] const LeaseOptions& options() const noexcept { return options_; }
    [[nodiscard]] std::int64_t last_renew_ms() const noexcept { return last_renew_ms_; }

    /// Successful setnx() acquisitions by this instance
    [[nodiscard]] std::uint64_t elections() const noexcept { return elections_; }

    /// Renewals that reached the KV and failed
    [[nodiscard]] std::uint64_t renew_failures() const noexcept { return renew_failures_; }

    /// Metrics or log sink calls that threw
    [[nodiscard]] std::uint64_t sink_failures() const noexcept { return sink_failures_; }

private:
    [[nodiscard]] bool holder_matches(const KvResult<std::optional<std::string>>& current) const;
    void set_leader(bool leader);
    void log_kv_error(std::string_view op, const KvError& error);
    [[nodiscard]] LeaderLabels labels() const;

    template <typename Fn>
    void call_sink(Fn&& fn) {
        if (!try_invoke_sink(std::forward<Fn>(fn))) {
            ++sink_failures_;
        }
    }

    std::shared_ptr<IKvStore> kv_;
    std::string key_;
    std::string holder_id_;
    LeaseOptions options_;

    bool leader_{false};
    std::int64_t last_renew_ms_{0};

    std::uint64_t elections_{0};
    std::uint64_t renew_failures_{0};
    std::uint64_t sink_failures_{0};
};

}  // namespace failsafe
