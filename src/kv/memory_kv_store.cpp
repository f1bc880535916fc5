#include "failsafe/kv/memory_kv_store.hpp"

#include "failsafe/log/logger.hpp"

#include <chrono>
#include <limits>

namespace failsafe {

namespace {

// now + px_ms, saturating at the largest representable expiry
std::int64_t expiry_after(std::int64_t now, std::int64_t px_ms) noexcept {
    if (px_ms <= 0) {
        return now;
    }
    constexpr std::int64_t max_expiry = std::numeric_limits<std::int64_t>::max();
    if (now > max_expiry - px_ms) {
        return max_expiry;
    }
    return now + px_ms;
}

}  // namespace

std::int64_t system_time_ms() noexcept {
    const auto since_epoch = std::chrono::system_clock::now().time_since_epoch();
    return std::chrono::duration_cast<std::chrono::milliseconds>(since_epoch).count();
}

InMemoryKvStore::InMemoryKvStore(ClockMs clock)
    : clock_(clock ? std::move(clock) : ClockMs(system_time_ms))
{}

// ─────────────────────────────────────────────────────────────────────────────
// IKvStore
// ─────────────────────────────────────────────────────────────────────────────

KvResult<bool> InMemoryKvStore::setnx(
    const std::string& key,
    const std::string& value,
    std::int64_t px_ms
) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t now = clock_();

    if (find_live(key, now) != nullptr) {
        return false;
    }
    sweep_expired(now);
    entries_[key] = Entry{value, expiry_after(now, px_ms)};
    FAILSAFE_LOG_TRACE("kv setnx created " + key);
    return true;
}

KvResult<bool> InMemoryKvStore::pexpire(const std::string& key, std::int64_t px_ms) {
    std::lock_guard<std::mutex> lock(mutex_);
    const std::int64_t now = clock_();

    Entry* entry = find_live(key, now);
    if (entry == nullptr) {
        return false;
    }
    entry->expiry_ms = expiry_after(now, px_ms);
    return true;
}

KvResult<std::optional<std::string>> InMemoryKvStore::get(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Entry* entry = find_live(key, clock_());
    if (entry == nullptr) {
        return std::optional<std::string>{};
    }
    return std::optional<std::string>{entry->value};
}

KvResult<void> InMemoryKvStore::delkey(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.erase(key);
    return {};
}

KvResult<std::int64_t> InMemoryKvStore::time_ms() {
    return clock_();
}

// ─────────────────────────────────────────────────────────────────────────────
// Diagnostics
// ─────────────────────────────────────────────────────────────────────────────

std::optional<std::int64_t> InMemoryKvStore::expiry_ms(const std::string& key) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Entry* entry = find_live(key, clock_());
    if (entry == nullptr) {
        return std::nullopt;
    }
    return entry->expiry_ms;
}

std::size_t InMemoryKvStore::size() {
    std::lock_guard<std::mutex> lock(mutex_);
    sweep_expired(clock_());
    return entries_.size();
}

std::size_t InMemoryKvStore::stored_entries() {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_.size();
}

InMemoryKvStore::Entry* InMemoryKvStore::find_live(const std::string& key, std::int64_t now) {
    const auto it = entries_.find(key);
    if (it == entries_.end()) {
        return nullptr;
    }
    if (now >= it->second.expiry_ms) {
        entries_.erase(it);
        return nullptr;
    }
    return &it->second;
}

void InMemoryKvStore::sweep_expired(std::int64_t now) {
    for (auto it = entries_.begin(); it != entries_.end();) {
        if (now >= it->second.expiry_ms) {
            it = entries_.erase(it);
        } else {
            ++it;
        }
    }
}

}  // namespace failsafe
