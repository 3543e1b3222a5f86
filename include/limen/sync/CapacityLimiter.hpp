#pragma once

#include "BorrowerLedger.hpp"
#include "LimiterError.hpp"
#include "Semaphore.hpp"
#include <limen/future/Future.hpp>
#include <limen/task/Identity.hpp>
#include <limen/util/Config.hpp>

#include <asp/time/Duration.hpp>
#include <fmt/format.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <type_traits>

namespace limen {

class CapacityLimiter;

/// Token held for the task it was acquired by, releases it when destroyed.
class LIMEN_NODISCARD LimiterGuard {
public:
    LimiterGuard(CapacityLimiter* limiter, TaskIdent task, size_t count) noexcept
        : m_limiter(limiter), m_task(task), m_count(count) {}

    LimiterGuard(const LimiterGuard&) = delete;
    LimiterGuard& operator=(const LimiterGuard&) = delete;
    LimiterGuard(LimiterGuard&& other) noexcept;
    LimiterGuard& operator=(LimiterGuard&& other) noexcept;
    ~LimiterGuard();

    const TaskIdent& task() const noexcept {
        return m_task;
    }

    size_t count() const noexcept {
        return m_count;
    }

    /// Releases the token early. Does nothing if already released.
    void release();

private:
    void releaseQuietly() noexcept;

    CapacityLimiter* m_limiter;
    TaskIdent m_task;
    size_t m_count;
};

/// Limits how many tasks may hold a token at once, where every token is owned by the task that acquired it.
/// Async tasks and green (blocking) tasks can compete for the same limiter, each family of methods
/// resolves the identity of the caller in its own scheduling model.
///
/// Acquiring is not reentrant: a task that already holds a token gets a `ReentrancyError`.
/// Waiters are served in FIFO order regardless of their model.
class CapacityLimiter {
public:
    /// Creates a limiter with `totalTokens` tokens, 1 if not given.
    /// Throws std::invalid_argument if `totalTokens` is negative.
    explicit CapacityLimiter(std::optional<int64_t> totalTokens = std::nullopt);
    virtual ~CapacityLimiter() = default;

    CapacityLimiter(const CapacityLimiter&) = delete;
    CapacityLimiter& operator=(const CapacityLimiter&) = delete;
    CapacityLimiter(CapacityLimiter&&) = delete;
    CapacityLimiter& operator=(CapacityLimiter&&) = delete;

    // Async family, must be awaited inside a task.

    /// Acquires a token for the current async task. Returns false only if `blocking` is false
    /// and no token is available. Dropping the future while it waits leaves the limiter untouched.
    Future<bool> asyncAcquire(bool blocking = true);
    void asyncRelease();
    bool asyncBorrowed() const;
    Future<LimiterGuard> asyncScoped();

    // Green family, blocks the calling thread.

    /// Acquires a token for the current green task. Returns false if `blocking` is false and no token
    /// is available, or if `timeout` elapses first.
    bool greenAcquire(bool blocking = true, std::optional<asp::time::Duration> timeout = std::nullopt);
    void greenRelease();
    bool greenBorrowed() const;
    LimiterGuard greenScoped();

    size_t totalTokens() const noexcept {
        return m_totalTokens;
    }

    size_t availableTokens() const noexcept;
    /// Number of tasks currently holding a token.
    size_t borrowedTokens() const;
    /// Number of tasks waiting for a token.
    size_t waiting() const;

    /// Snapshot of every holder and its held count.
    BorrowerLedger::Snapshot borrowers() const;

    explicit operator bool() const;

    std::string toString() const;

protected:
    friend class LimiterGuard;

    CapacityLimiter(std::optional<int64_t> totalTokens, std::string_view typeName);

    size_t m_totalTokens;
    std::string_view m_typeName;
    std::unique_ptr<Semaphore> m_slots;
    BorrowerLedger m_ledger;

    /// Acquires `count` units for `task`. Every acquire goes through these two,
    /// a variant that allows holders to acquire again overrides them.
    virtual Future<bool> acquireFor(TaskIdent task, size_t count, bool blocking);
    virtual bool acquireBlockingFor(TaskIdent task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout);

    /// Takes a free slot for a task that holds none, then records it.
    Future<bool> acquireSlotFor(TaskIdent task, size_t count, bool blocking);
    bool acquireSlotBlocking(const TaskIdent& task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout);

    /// Drops `count` units held by the task, freeing its slot once nothing is left.
    void releaseFor(const TaskIdent& task, size_t count);

    template <typename Model>
    bool borrowedAs() const {
        return m_ledger.contains(Model::current());
    }
};

}

template <typename T>
struct fmt::formatter<T, char, std::enable_if_t<std::is_base_of_v<limen::CapacityLimiter, T>>> : fmt::formatter<std::string_view> {
    auto format(const limen::CapacityLimiter& limiter, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(limiter.toString(), ctx);
    }
};
