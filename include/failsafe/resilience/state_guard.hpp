#pragma once

#include <memory>
#include <mutex>

namespace failsafe {

// ─────────────────────────────────────────────────────────────────────────────
// StateGuard - scoped acquisition selected once at construction
// ─────────────────────────────────────────────────────────────────────────────
// Satisfies BasicLockable, so callers always write
//
//   std::lock_guard<StateGuard> lock(*guard_);
//
// and the choice between a real mutex and a no-op is made when the owning
// object is built, not in every method. The mutex variant is not reentrant.

class StateGuard {
public:
    virtual ~StateGuard() = default;
    virtual void lock() = 0;
    virtual void unlock() = 0;
};

class MutexStateGuard final : public StateGuard {
public:
    void lock() override { mutex_.lock(); }
    void unlock() override { mutex_.unlock(); }

private:
    std::mutex mutex_;
};

class NullStateGuard final : public StateGuard {
public:
    void lock() override {}
    void unlock() override {}
};

[[nodiscard]] inline std::unique_ptr<StateGuard> make_state_guard(bool thread_safe) {
    if (thread_safe) {
        return std::make_unique<MutexStateGuard>();
    }
    return std::make_unique<NullStateGuard>();
}

}  // namespace failsafe
