#include "failsafe/ha/lease_lock.hpp"

#include <algorithm>
#include <exception>
#include <stdexcept>
#include <utility>

namespace failsafe {

namespace {

// Runs one KV call and folds a thrown exception into the error channel, so
// callers only ever inspect a KvResult.
template <typename Fn>
auto guarded_kv_call(Fn&& fn) -> decltype(fn()) {
    try {
        return std::forward<Fn>(fn)();
    } catch (const std::exception& e) {
        return tl::make_unexpected(KvError::backend(e.what()));
    } catch (...) {
        return tl::make_unexpected(KvError::backend("non-standard exception"));
    }
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Lease Options
// ─────────────────────────────────────────────────────────────────────────────

LeaseOptions LeaseOptions::sanitized() const {
    LeaseOptions out = *this;
    out.ttl_ms = std::max<std::int64_t>(1, ttl_ms);
    out.renew_ms = std::max<std::int64_t>(1, renew_ms);
    return out;
}

LeaseOptions& LeaseOptions::with_ttl_ms(std::int64_t ttl) {
    ttl_ms = ttl;
    return *this;
}

LeaseOptions& LeaseOptions::with_renew_ms(std::int64_t renew) {
    renew_ms = renew;
    return *this;
}

LeaseOptions& LeaseOptions::with_env(std::string environment) {
    env = std::move(environment);
    return *this;
}

LeaseOptions& LeaseOptions::with_service(std::string service_name) {
    service = std::move(service_name);
    return *this;
}

LeaseOptions& LeaseOptions::with_logger(std::shared_ptr<ILogger> sink) {
    logger = std::move(sink);
    return *this;
}

LeaseOptions& LeaseOptions::with_metrics(std::shared_ptr<ILeaderMetrics> sink) {
    metrics = std::move(sink);
    return *this;
}

// ─────────────────────────────────────────────────────────────────────────────
// Construction
// ─────────────────────────────────────────────────────────────────────────────

LeaseLock::LeaseLock(
    std::shared_ptr<IKvStore> kv,
    std::string key,
    std::string holder_id,
    LeaseOptions options
)
    : kv_(std::move(kv))
    , key_(std::move(key))
    , holder_id_(std::move(holder_id))
    , options_(options.sanitized())
{
    if (kv_ == nullptr) {
        throw std::invalid_argument("LeaseLock requires a key-value store");
    }
    if (options_.metrics != nullptr) {
        call_sink([&] { options_.metrics->set_leader_state(labels(), 0.0); });
    }
}

// ─────────────────────────────────────────────────────────────────────────────
// Lease Operations
// ─────────────────────────────────────────────────────────────────────────────

bool LeaseLock::try_acquire(std::int64_t now_ms) {
    const auto created = guarded_kv_call([&] { return kv_->setnx(key_, holder_id_, options_.ttl_ms); });
    if (!created) {
        log_kv_error("setnx", created.error());
        set_leader(false);
        return false;
    }

    if (*created) {
        last_renew_ms_ = now_ms;
        ++elections_;
        set_leader(true);
        if (options_.metrics != nullptr) {
            call_sink([&] { options_.metrics->inc_leader_elections(options_.env, options_.service); });
        }
        call_sink([&] {
            logger_or_global(options_.logger).info_fmt(
                "event=lease_acquire key={} holder={} ttl_ms={} now={}",
                key_, holder_id_, options_.ttl_ms, now_ms
            );
        });
        return true;
    }

    // Someone holds it; that someone may be us from an earlier call
    const auto current = guarded_kv_call([&] { return kv_->get(key_); });
    if (!current) {
        log_kv_error("get", current.error());
    }
    const bool ours = holder_matches(current);
    set_leader(ours);
    return ours;
}

bool LeaseLock::renew(std::int64_t now_ms) {
    if (!leader_) {
        return false;
    }
    if (now_ms - last_renew_ms_ < options_.renew_ms) {
        return true;
    }

    // Extends by renew_ms from now, not by ttl_ms
    const auto extended = guarded_kv_call([&] { return kv_->pexpire(key_, options_.renew_ms); });
    if (extended && *extended) {
        last_renew_ms_ = now_ms;
        call_sink([&] {
            logger_or_global(options_.logger).debug_fmt(
                "event=lease_renew key={} holder={} renew_ms={} now={}",
                key_, holder_id_, options_.renew_ms, now_ms
            );
        });
        return true;
    }
    if (!extended) {
        log_kv_error("pexpire", extended.error());
    }

    ++renew_failures_;
    if (options_.metrics != nullptr) {
        call_sink([&] { options_.metrics->inc_leader_renew_fail(options_.env, options_.service); });
    }

    // The lease may still be ours (e.g. a transient backend error)
    const auto current = guarded_kv_call([&] { return kv_->get(key_); });
    if (!current) {
        log_kv_error("get", current.error());
    }
    set_leader(holder_matches(current));

    call_sink([&] {
        logger_or_global(options_.logger).warn_fmt(
            "event=lease_renew_fail key={} holder={} now={} still_leader={}",
            key_, holder_id_, now_ms, leader_
        );
    });
    return false;
}

void LeaseLock::release() {
    if (leader_) {
        const auto deleted = guarded_kv_call([&] { return kv_->delkey(key_); });
        if (deleted) {
            call_sink([&] {
                logger_or_global(options_.logger).info_fmt(
                    "event=lease_release key={} holder={}", key_, holder_id_
                );
            });
        } else {
            log_kv_error("delkey", deleted.error());
        }
    }
    set_leader(false);
}

bool LeaseLock::is_leader() {
    if (!leader_) {
        return false;
    }
    const auto current = guarded_kv_call([&] { return kv_->get(key_); });
    if (!current) {
        log_kv_error("get", current.error());
    }
    if (!holder_matches(current)) {
        set_leader(false);
    }
    return leader_;
}

std::optional<std::string> LeaseLock::holder() {
    auto current = guarded_kv_call([&] { return kv_->get(key_); });
    if (!current) {
        log_kv_error("get", current.error());
        return std::nullopt;
    }
    return std::move(*current);
}

std::optional<std::int64_t> LeaseLock::kv_time_ms() {
    const auto now = guarded_kv_call([&] { return kv_->time_ms(); });
    if (!now) {
        log_kv_error("time_ms", now.error());
        return std::nullopt;
    }
    return *now;
}

// ─────────────────────────────────────────────────────────────────────────────
// Internal Helpers
// ─────────────────────────────────────────────────────────────────────────────

bool LeaseLock::holder_matches(const KvResult<std::optional<std::string>>& current) const {
    return current.has_value() && current->has_value() && **current == holder_id_;
}

void LeaseLock::set_leader(bool leader) {
    if (leader == leader_) {
        return;
    }
    leader_ = leader;
    if (options_.metrics != nullptr) {
        call_sink([&] { options_.metrics->set_leader_state(labels(), leader_ ? 1.0 : 0.0); });
    }
}

void LeaseLock::log_kv_error(std::string_view op, const KvError& error) {
    call_sink([&] {
        logger_or_global(options_.logger).warn_fmt(
            "event=lease_kv_error op={} key={} holder={} code={} message={}",
            op, key_, holder_id_, to_string(error.code), error.message
        );
    });
}

LeaderLabels LeaseLock::labels() const {
    return LeaderLabels{options_.env, options_.service, holder_id_};
}

}  // namespace failsafe
