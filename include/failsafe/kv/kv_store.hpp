#ifndef FAILSAFE_KV_KV_STORE_HPP
#define FAILSAFE_KV_KV_STORE_HPP

#include <tl/expected.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// KV Error Types
// ─────────────────────────────────────────────────────────────────────────────

struct KvError {
    enum class Code {
        Unavailable,   // Backend unreachable
        Timeout,       // Backend did not answer in time
        Rejected,      // Backend refused the command
        Backend        // Backend threw or returned something unexpected
    };

    Code code;
    std::string message;

    static KvError unavailable(std::string msg) {
        return {Code::Unavailable, std::move(msg)};
    }

    static KvError timeout(std::string msg) {
        return {Code::Timeout, std::move(msg)};
    }

    static KvError rejected(std::string msg) {
        return {Code::Rejected, std::move(msg)};
    }

    static KvError backend(std::string msg) {
        return {Code::Backend, std::move(msg)};
    }
};

[[nodiscard]] constexpr std::string_view to_string(KvError::Code code) noexcept {
    switch (code) {
        case KvError::Code::Unavailable: return "Unavailable";
        case KvError::Code::Timeout:     return "Timeout";
        case KvError::Code::Rejected:    return "Rejected";
        case KvError::Code::Backend:     return "Backend";
    }
    return "Unknown";
}

template <typename T>
using KvResult = tl::expected<T, KvError>;

// ─────────────────────────────────────────────────────────────────────────────
// IKvStore Interface
// ─────────────────────────────────────────────────────────────────────────────
// The capability a lease lock needs from a TTL-capable key-value store. The
// mutual-exclusion guarantee rests entirely on setnx() being atomic.
//
// Implementations report failures through KvResult; callers must still be
// prepared for a backend that throws.

class IKvStore {
public:
    virtual ~IKvStore() = default;

    /// Create `key` = `value` expiring in `px_ms`, only if no live value exists.
    /// Returns true if this call created it.
    [[nodiscard]] virtual KvResult<bool> setnx(
        const std::string& key,
        const std::string& value,
        std::int64_t px_ms
    ) = 0;

    /// Reset the expiry of a live key to now + `px_ms`. False if no live key.
    [[nodiscard]] virtual KvResult<bool> pexpire(const std::string& key, std::int64_t px_ms) = 0;

    /// Current live value, or nullopt if absent or expired
    [[nodiscard]] virtual KvResult<std::optional<std::string>> get(const std::string& key) = 0;

    /// Remove `key`; removing an absent key is not an error
    [[nodiscard]] virtual KvResult<void> delkey(const std::string& key) = 0;

    /// The store's clock, milliseconds
    [[nodiscard]] virtual KvResult<std::int64_t> time_ms() = 0;
};

}  // namespace failsafe

#endif  // FAILSAFE_KV_KV_STORE_HPP
