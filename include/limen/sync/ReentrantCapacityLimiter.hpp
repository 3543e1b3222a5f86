#pragma once

#include "CapacityLimiter.hpp"

#include <concepts>

namespace limen {

/// Capacity limiter that a task may acquire several times.
/// A task occupies at most one slot no matter how many times it acquired, and the slot is freed
/// once every acquired unit has been released.
///
/// Acquiring while already holding a token doesn't wait for a slot, but when blocking it still
/// passes a checkpoint of the caller's model before the count is raised.
/// This also holds when the limiter is used through a `CapacityLimiter&`, where every call acquires one unit.
class ReentrantCapacityLimiter : public CapacityLimiter {
public:
    explicit ReentrantCapacityLimiter(std::optional<int64_t> totalTokens = std::nullopt);

    /// Throws std::invalid_argument if `count` is 0.
    Future<bool> asyncAcquire(size_t count = 1, bool blocking = true);
    /// Throws OverReleaseError if the task holds fewer than `count` units.
    void asyncRelease(size_t count = 1);
    Future<LimiterGuard> asyncScoped(size_t count = 1);
    /// Units held by the current async task, 0 if none.
    size_t asyncCount() const;

    // `blocking` comes after `count` here, `acquire(false)` would silently mean a count of 0
    template <std::same_as<bool> B>
    Future<bool> asyncAcquire(B blocking) = delete;

    bool greenAcquire(size_t count = 1, bool blocking = true, std::optional<asp::time::Duration> timeout = std::nullopt);
    void greenRelease(size_t count = 1);
    LimiterGuard greenScoped(size_t count = 1);
    size_t greenCount() const;

    template <std::same_as<bool> B>
    bool greenAcquire(B blocking, std::optional<asp::time::Duration> timeout = std::nullopt) = delete;

protected:
    Future<bool> acquireFor(TaskIdent task, size_t count, bool blocking) override;
    bool acquireBlockingFor(TaskIdent task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout) override;

private:
    Future<bool> acquireCurrent(size_t count, bool blocking);
    Future<LimiterGuard> scopedFor(size_t count);
};

}
