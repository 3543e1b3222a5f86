#pragma once
#include <condition_variable>
#include <mutex>
#include <asp/time/Instant.hpp>
#include "Waker.hpp"

namespace limen {

/// A condition variable exposed as a waker, lets a plain OS thread park
/// until some pollable machinery decides to wake it.
/// The CondvarWaker must outlive every waker cloned from it.
struct CondvarWaker {
public:
    CondvarWaker() = default;
    CondvarWaker(const CondvarWaker&) = delete;
    CondvarWaker& operator=(const CondvarWaker&) = delete;
    CondvarWaker(CondvarWaker&&) = delete;
    CondvarWaker& operator=(CondvarWaker&&) = delete;

    Waker waker() noexcept;

    /// Blocks until notified, consuming the notification.
    void wait() noexcept;

    /// Blocks until notified or until the deadline passes.
    /// Returns false if the deadline passed without a notification.
    bool waitUntil(asp::time::Instant deadline) noexcept;

    void notify() noexcept;

private:
    std::condition_variable m_cv;
    std::mutex m_mtx;
    bool m_notified = false;
};

}
