#pragma once

#include <limen/future/Pollable.hpp>
#include <limen/future/Future.hpp>
#include <limen/runtime/Runtime.hpp>
#include <limen/util/Assert.hpp>
#include <limen/util/Result.hpp>

#include <asp/time/Instant.hpp>
#include <cstdint>
#include <type_traits>
#include <variant>

namespace limen {

struct TimedOut {};

template <typename T>
using TimeoutResult = Result<T, TimedOut>;

/// Polls the inner future until it completes or the deadline passes.
/// On expiry the inner future is left unpolled, it is cancelled when the Timeout is dropped.
template <
    Pollable Fut,
    typename FutOut = typename Fut::Output,
    bool IsVoid = std::is_void_v<FutOut>,
    typename Output = TimeoutResult<std::conditional_t<IsVoid, std::monostate, FutOut>>
>
struct LIMEN_NODISCARD Timeout : PollableBase<Timeout<Fut>, Output> {
    explicit Timeout(Fut fut, asp::time::Instant expiry)
        : m_future(std::move(fut)), m_expiry(expiry) {}

    ~Timeout() {
        this->unregister();
    }

    Timeout(Timeout&& other) noexcept
        : PollableBase<Timeout<Fut>, Output>(std::move(other)),
          m_future(std::move(other.m_future)),
          m_expiry(other.m_expiry),
          m_driver(std::exchange(other.m_driver, nullptr)),
          m_id(std::exchange(other.m_id, 0)) {}

    Timeout& operator=(Timeout&&) = delete;

    std::optional<Output> poll() {
        if (asp::time::Instant::now() >= m_expiry) {
            this->unregister();
            return Err(TimedOut{});
        }

        // poll the future, if completed cancel timer and return ready
        if (m_future.vPoll()) {
            this->unregister();

            if constexpr (IsVoid) {
                m_future.await_resume();
                return Ok(std::monostate{});
            } else {
                return Ok(m_future.await_resume());
            }
        }

        // register timer if we aren't already registered
        if (m_id == 0) {
            auto rt = ctx().runtime();
            LIMEN_ASSERT(rt, "timeout polled outside of a runtime");

            m_driver = &rt->timeDriver();
            m_id = m_driver->addEntry(m_expiry, ctx().cloneWaker());
        }

        return std::nullopt;
    }

private:
    Fut m_future;
    asp::time::Instant m_expiry;
    TimeDriver* m_driver = nullptr;
    uint64_t m_id = 0;

    void unregister() noexcept {
        if (m_id != 0) {
            m_driver->removeEntry(m_expiry, m_id);
            m_id = 0;
        }
    }
};

template <Pollable Fut>
auto timeoutAt(asp::time::Instant expiry, Fut fut) {
    return Timeout<Fut>{std::move(fut), expiry};
}

template <Pollable Fut>
auto timeout(asp::time::Duration dur, Fut fut) {
    return timeoutAt(asp::time::Instant::now() + dur, std::move(fut));
}

}
