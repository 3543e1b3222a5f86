#pragma once

#include <limen/sync/CapacityLimiter.hpp>
#include <limen/sync/ReentrantCapacityLimiter.hpp>

#include <future>
#include <optional>
#include <thread>

namespace limen::test {

// Holds a token of a limiter from its own thread until told to let go.
template <typename Limiter>
class GreenHolder {
public:
    explicit GreenHolder(Limiter& limiter) : m_limiter(limiter) {
        auto acquired = m_acquired.get_future();
        auto release = m_release.get_future();

        m_thread = std::thread([this, release = std::move(release)] {
            m_ident = currentGreenTask();
            m_acquired.set_value(m_limiter.greenAcquire());
            release.wait();
            m_limiter.greenRelease();
        });

        m_holding = acquired.get();
    }

    ~GreenHolder() {
        this->release();
    }

    GreenHolder(const GreenHolder&) = delete;
    GreenHolder& operator=(const GreenHolder&) = delete;

    void release() {
        if (m_thread.joinable()) {
            m_release.set_value();
            m_thread.join();
        }
    }

    bool holding() const {
        return m_holding;
    }

    const TaskIdent& ident() const {
        return *m_ident;
    }

private:
    Limiter& m_limiter;
    std::promise<bool> m_acquired;
    std::promise<void> m_release;
    std::optional<TaskIdent> m_ident;
    std::thread m_thread;
    bool m_holding = false;
};

inline void waitForWaiters(const CapacityLimiter& limiter, size_t count) {
    while (limiter.waiting() < count) {
        std::this_thread::yield();
    }
}

}
