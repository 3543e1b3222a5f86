#pragma once

#include "Waker.hpp"
#include <deque>
#include <optional>
#include <cstddef>

namespace limen {

/// FIFO queue of parked waiters, not synchronized on its own.
template <typename T>
struct WaitList {
    struct Waiter {
        Waker waker;
        T* awaiter;
    };

    void add(Waker waker, T* awaiter) noexcept {
        m_waiters.push_back({
            std::move(waker),
            awaiter,
        });
    }

    bool remove(T* awaiter) noexcept {
        for (auto it = m_waiters.begin(); it != m_waiters.end(); ++it) {
            if (it->awaiter == awaiter) {
                m_waiters.erase(it);
                return true;
            }
        }

        return false;
    }

    std::optional<Waiter> takeFirst() {
        if (m_waiters.empty()) {
            return std::nullopt;
        }

        auto waiter = std::move(m_waiters.front());
        m_waiters.pop_front();
        return waiter;
    }

    size_t size() const noexcept {
        return m_waiters.size();
    }

    bool empty() const noexcept {
        return m_waiters.empty();
    }

private:
    std::deque<Waiter> m_waiters;
};

}
