#pragma once

#include <limen/future/Pollable.hpp>
#include <limen/task/WaitList.hpp>
#include <asp/sync/Mutex.hpp>
#include <asp/time/Duration.hpp>

#include <atomic>
#include <cstddef>
#include <limits>
#include <optional>

namespace limen {

/// Counting semaphore usable from async tasks and from blocking (green) code at the same time.
/// Waiters of both kinds share one FIFO queue, and a release hands permits directly to the
/// oldest waiters, so a newcomer can never overtake a parked acquirer.
class Semaphore {
public:
    static constexpr size_t UNBOUNDED = std::numeric_limits<size_t>::max();

    explicit Semaphore(size_t initialValue, size_t maxValue = UNBOUNDED);
    virtual ~Semaphore() = default;

    Semaphore(const Semaphore&) = delete;
    Semaphore& operator=(const Semaphore&) = delete;

    struct LIMEN_NODISCARD AcquireAwaiter : PollableBase<AcquireAwaiter> {
        explicit AcquireAwaiter(Semaphore& sem) noexcept : m_sem(&sem) {}

        AcquireAwaiter(AcquireAwaiter&&) noexcept;
        AcquireAwaiter& operator=(AcquireAwaiter&&) noexcept = delete;
        ~AcquireAwaiter();

        bool poll();

    private:
        friend class Semaphore;

        enum class State : uint8_t {
            Init,
            Waiting,
            Granted,
            Done,
        };

        Semaphore* m_sem;
        std::atomic<State> m_state{State::Init};

        bool pollWith(const Waker& waker);
        /// Gives up waiting. Returns true if a permit was granted in the meantime, in which case it's kept.
        bool cancel();
    };

    /// Waits for a permit, suspending the current async task.
    AcquireAwaiter acquire() noexcept;

    /// Takes a permit if one is available right now. Never registers as a waiter.
    bool tryAcquire() noexcept;

    /// Waits for a permit, blocking the calling thread. Returns false if the timeout elapsed first.
    bool acquireBlocking(std::optional<asp::time::Duration> timeout = std::nullopt);

    /// Releases `n` permits, waking up to `n` waiters.
    /// Throws std::logic_error if this would push the value above the maximum.
    void release(size_t n = 1);

    size_t initialValue() const noexcept;
    size_t maxValue() const noexcept;
    /// Amount of permits available right now.
    size_t value() const noexcept;
    /// Amount of acquirers currently parked.
    size_t waiting() const;

private:
    using WaiterList = WaitList<AcquireAwaiter>;

    const size_t m_initialValue;
    const size_t m_maxValue;
    std::atomic<size_t> m_permits;
    mutable asp::Mutex<WaiterList> m_waiters;

    bool tryAcquireOrRegister(AcquireAwaiter* awaiter, const Waker& waker);
};

/// Semaphore holding at most a single permit.
class BinarySemaphore : public Semaphore {
public:
    explicit BinarySemaphore(size_t initialValue = 1);
};

}
