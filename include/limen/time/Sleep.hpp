#pragma once

#include <limen/future/Pollable.hpp>
#include <asp/time/Duration.hpp>
#include <asp/time/Instant.hpp>
#include <cstdint>

namespace limen {

class TimeDriver;

struct LIMEN_NODISCARD Sleep : PollableBase<Sleep> {
    explicit Sleep(asp::time::Instant expiry) : m_expiry(expiry) {}
    ~Sleep();

    Sleep(Sleep&& other) noexcept;
    Sleep& operator=(Sleep&& other) noexcept;

    bool poll();

private:
    asp::time::Instant m_expiry;
    TimeDriver* m_driver = nullptr;
    uint64_t m_id = 0;

    void unregister() noexcept;
};

Sleep sleep(asp::time::Duration duration);
Sleep sleepUntil(asp::time::Instant expiry);

}
