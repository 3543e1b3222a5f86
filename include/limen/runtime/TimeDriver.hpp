#pragma once

#include <limen/task/Waker.hpp>
#include <asp/time/Instant.hpp>
#include <asp/sync/SpinLock.hpp>
#include <atomic>
#include <cstdint>
#include <map>

namespace limen {

class Runtime;

struct TimerEntryKey {
    asp::time::Instant expiry;
    uint64_t id;

    bool operator<(const TimerEntryKey& other) const {
        if (expiry < other.expiry) return true;
        if (other.expiry < expiry) return false;
        return id < other.id;
    }
};

using TimerQueue = std::map<TimerEntryKey, Waker>;

class TimeDriver {
public:
    TimeDriver() = default;
    TimeDriver(const TimeDriver&) = delete;
    TimeDriver& operator=(const TimeDriver&) = delete;

    /// Registers a waker to be woken once `expiry` has passed, returns the entry id.
    uint64_t addEntry(asp::time::Instant expiry, Waker waker);
    void removeEntry(asp::time::Instant expiry, uint64_t id);

    /// Wakes every expired entry, returns the amount of wakers woken.
    size_t doWork();

    size_t pending() const;

private:
    std::atomic<uint64_t> m_nextTimerId{1};
    mutable asp::SpinLock<TimerQueue> m_timers;
};

}
