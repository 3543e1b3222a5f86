#include <limen/sync/Semaphore.hpp>
#include <limen/task/CondvarWaker.hpp>
#include <limen/task/Context.hpp>
#include <limen/util/Assert.hpp>
#include <limen/util/Trace.hpp>

#include <algorithm>
#include <stdexcept>

using namespace asp::time;
using enum std::memory_order;

namespace limen {

using AcquireAwaiter = Semaphore::AcquireAwaiter;

Semaphore::Semaphore(size_t initialValue, size_t maxValue)
    : m_initialValue(initialValue), m_maxValue(maxValue), m_permits(initialValue) {}

AcquireAwaiter Semaphore::acquire() noexcept {
    return AcquireAwaiter{*this};
}

bool Semaphore::tryAcquire() noexcept {
    size_t current = m_permits.load(::acquire);

    while (true) {
        if (current == 0) {
            return false;
        }

        if (m_permits.compare_exchange_weak(current, current - 1, ::acq_rel, ::acquire)) {
            return true;
        }
    }
}

bool Semaphore::acquireBlocking(std::optional<Duration> timeout) {
    CondvarWaker cvw;
    auto waker = cvw.waker();
    AcquireAwaiter awaiter{*this};

    if (awaiter.pollWith(waker)) {
        return true;
    }

    trace("[Semaphore] parking thread, {} waiting", this->waiting());

    std::optional<Instant> deadline;
    if (timeout) {
        deadline = Instant::now() + *timeout;
    }

    while (true) {
        if (deadline) {
            if (!cvw.waitUntil(*deadline)) {
                // a permit may have been handed to us right as the deadline passed
                bool granted = awaiter.cancel();
                trace("[Semaphore] blocking acquire timed out, granted: {}", granted);
                return granted;
            }
        } else {
            cvw.wait();
        }

        if (awaiter.pollWith(waker)) {
            return true;
        }
    }
}

bool Semaphore::tryAcquireOrRegister(AcquireAwaiter* awaiter, const Waker& waker) {
    auto waiters = m_waiters.lock();

    if (this->tryAcquire()) {
        return true;
    }

    // permits are only added with the lock held, so none can appear before we are in the queue
    waiters->add(waker.clone(), awaiter);
    awaiter->m_state.store(AcquireAwaiter::State::Waiting, ::release);
    return false;
}

void Semaphore::release(size_t n) {
    if (n == 0) return;

    auto waiters = m_waiters.lock();

    size_t served = std::min(n, waiters->size());
    size_t leftover = n - served;

    if (leftover > 0 && m_permits.load(::acquire) + leftover > m_maxValue) {
        throw std::logic_error("semaphore released too many times");
    }

    for (size_t i = 0; i < served; i++) {
        auto waiter = waiters->takeFirst();
        waiter->awaiter->m_state.store(AcquireAwaiter::State::Granted, ::release);

        // woken with the lock held, a blocking waiter may destroy its waker as soon as it sees the grant
        waiter->waker.wake();
    }

    if (leftover > 0) {
        m_permits.fetch_add(leftover, ::release);
    }
}

size_t Semaphore::initialValue() const noexcept {
    return m_initialValue;
}

size_t Semaphore::maxValue() const noexcept {
    return m_maxValue;
}

size_t Semaphore::value() const noexcept {
    return m_permits.load(::acquire);
}

size_t Semaphore::waiting() const {
    return m_waiters.lock()->size();
}

AcquireAwaiter::AcquireAwaiter(AcquireAwaiter&& other) noexcept
    : PollableBase<AcquireAwaiter>(std::move(other)), m_sem(other.m_sem)
{
    LIMEN_ASSERT(other.m_state.load(::acquire) == State::Init, "cannot move an AcquireAwaiter that was already polled");
}

AcquireAwaiter::~AcquireAwaiter() {
    auto state = m_state.load(::acquire);
    if (state == State::Init || state == State::Done) {
        return;
    }

    bool granted = false;
    {
        auto waiters = m_sem->m_waiters.lock();
        state = m_state.load(::acquire);

        if (state == State::Waiting) {
            waiters->remove(this);
        } else if (state == State::Granted) {
            granted = true;
        }

        m_state.store(State::Done, ::release);
    }

    // the permit was handed to us but never consumed, pass it on
    if (granted) {
        m_sem->release(1);
    }
}

bool AcquireAwaiter::poll() {
    auto waker = ctx().m_waker;
    LIMEN_ASSERT(waker, "semaphore acquire polled outside of a task");

    return this->pollWith(*waker);
}

bool AcquireAwaiter::pollWith(const Waker& waker) {
    switch (m_state.load(::acquire)) {
        case State::Init: {
            if (m_sem->tryAcquireOrRegister(this, waker)) {
                m_state.store(State::Done, ::release);
                return true;
            }

            return false;
        }

        case State::Waiting: return false;

        case State::Granted: {
            m_state.store(State::Done, ::release);
            return true;
        }

        case State::Done: return true;
    }

    return false;
}

bool AcquireAwaiter::cancel() {
    auto waiters = m_sem->m_waiters.lock();

    auto state = m_state.load(::acquire);
    m_state.store(State::Done, ::release);

    switch (state) {
        case State::Waiting: {
            waiters->remove(this);
            return false;
        }

        case State::Granted:
        case State::Done: return true;

        case State::Init: return false;
    }

    return false;
}

static size_t checkBinaryValue(size_t initialValue) {
    if (initialValue > 1) {
        throw std::invalid_argument("binary semaphore initial value must be 0 or 1");
    }

    return initialValue;
}

BinarySemaphore::BinarySemaphore(size_t initialValue) : Semaphore(checkBinaryValue(initialValue), 1) {}

}
