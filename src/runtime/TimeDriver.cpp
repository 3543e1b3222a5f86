#include <limen/runtime/TimeDriver.hpp>
#include <limen/util/Trace.hpp>
#include <optional>
#include <vector>

using namespace asp::time;

namespace limen {

uint64_t TimeDriver::addEntry(Instant expiry, Waker waker) {
    auto id = m_nextTimerId.fetch_add(1, std::memory_order::relaxed);
    m_timers.lock()->emplace(TimerEntryKey{expiry, id}, std::move(waker));
    return id;
}

void TimeDriver::removeEntry(Instant expiry, uint64_t id) {
    // the waker is destroyed outside of the lock
    std::optional<Waker> waker;
    {
        auto timers = m_timers.lock();
        auto it = timers->find(TimerEntryKey{expiry, id});
        if (it != timers->end()) {
            waker = std::move(it->second);
            timers->erase(it);
        }
    }
}

size_t TimeDriver::doWork() {
    std::vector<Waker> ready;
    auto now = Instant::now();

    {
        auto timers = m_timers.lock();
        while (!timers->empty()) {
            auto it = timers->begin();
            if (it->first.expiry > now) {
                break;
            }

            ready.push_back(std::move(it->second));
            timers->erase(it);
        }
    }

    for (auto& waker : ready) {
        waker.wake();
    }

    if (!ready.empty()) {
        trace("[TimeDriver] woke {} timers", ready.size());
    }

    return ready.size();
}

size_t TimeDriver::pending() const {
    return m_timers.lock()->size();
}

}
