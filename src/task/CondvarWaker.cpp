#include <limen/task/CondvarWaker.hpp>
#include <chrono>

using namespace asp::time;

namespace limen {

static const RawWakerVtable g_condvarWakerVtable = {
    .wake = [](void* data) {
        static_cast<CondvarWaker*>(data)->notify();
    },
    .wakeByRef = [](void* data) {
        static_cast<CondvarWaker*>(data)->notify();
    },
    .clone = [](void* data) -> RawWaker {
        return RawWaker{data, &g_condvarWakerVtable};
    },
    .destroy = [](void*) {},
};

Waker CondvarWaker::waker() noexcept {
    return Waker{this, &g_condvarWakerVtable};
}

void CondvarWaker::wait() noexcept {
    std::unique_lock lock(m_mtx);
    m_cv.wait(lock, [this] { return m_notified; });
    m_notified = false;
}

bool CondvarWaker::waitUntil(Instant deadline) noexcept {
    std::unique_lock lock(m_mtx);

    while (!m_notified) {
        auto now = Instant::now();
        if (now >= deadline) {
            return false;
        }

        auto left = deadline.durationSince(now);
        m_cv.wait_for(lock, std::chrono::microseconds{left.micros()});
    }

    m_notified = false;
    return true;
}

void CondvarWaker::notify() noexcept {
    // notifying under the lock lets the waiting thread destroy this object as soon as it wakes up
    std::lock_guard lock(m_mtx);
    m_notified = true;
    m_cv.notify_one();
}

}
