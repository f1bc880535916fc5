#ifndef FAILSAFE_KV_MEMORY_KV_STORE_HPP
#define FAILSAFE_KV_MEMORY_KV_STORE_HPP

#include "failsafe/kv/kv_store.hpp"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace failsafe {

/// Milliseconds; the in-memory store evaluates every expiry against it
using ClockMs = std::function<std::int64_t()>;

/// Wall clock in milliseconds since the epoch
[[nodiscard]] std::int64_t system_time_ms() noexcept;

// ─────────────────────────────────────────────────────────────────────────────
// InMemoryKvStore
// ─────────────────────────────────────────────────────────────────────────────
// Process-local IKvStore with exact TTL semantics. A key written with expiry
// E is live while now < E, so px = 0 expires immediately. Expiries saturate
// at INT64_MAX. Expired entries are dropped when their key is accessed, and
// all of them are swept whenever setnx() creates a key or size() is called.
//
// Several lease locks (one per simulated process) may share one store, also
// from different threads: every operation runs under one mutex, which is what
// makes setnx() atomic.

class InMemoryKvStore final : public IKvStore {
public:
    /// Uses system_time_ms() when `clock` is null
    explicit InMemoryKvStore(ClockMs clock = nullptr);

    [[nodiscard]] KvResult<bool> setnx(
        const std::string& key,
        const std::string& value,
        std::int64_t px_ms
    ) override;

    [[nodiscard]] KvResult<bool> pexpire(const std::string& key, std::int64_t px_ms) override;

    [[nodiscard]] KvResult<std::optional<std::string>> get(const std::string& key) override;

    [[nodiscard]] KvResult<void> delkey(const std::string& key) override;

    [[nodiscard]] KvResult<std::int64_t> time_ms() override;

    /// Absolute expiry of a live key (diagnostics, tests)
    [[nodiscard]] std::optional<std::int64_t> expiry_ms(const std::string& key);

    /// Number of live keys; sweeps expired entries first
    [[nodiscard]] std::size_t size();

    /// Entries held right now, including expired ones not yet swept
    [[nodiscard]] std::size_t stored_entries();

private:
    struct Entry {
        std::string value;
        std::int64_t expiry_ms;
    };

    // Caller holds mutex_. Returns the live entry or nullptr, erasing it if expired.
    Entry* find_live(const std::string& key, std::int64_t now);

    // Caller holds mutex_
    void sweep_expired(std::int64_t now);

    ClockMs clock_;
    std::mutex mutex_;
    std::unordered_map<std::string, Entry> entries_;
};

}  // namespace failsafe

#endif  // FAILSAFE_KV_MEMORY_KV_STORE_HPP
