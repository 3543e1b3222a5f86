#include <limen/time/Sleep.hpp>
#include <limen/runtime/Runtime.hpp>
#include <limen/util/Assert.hpp>

using namespace asp::time;

namespace limen {

bool Sleep::poll() {
    auto now = Instant::now();
    if (now >= m_expiry) {
        this->unregister();
        return true;
    }

    // only register if we aren't already registered
    if (m_id == 0) {
        auto rt = ctx().runtime();
        LIMEN_ASSERT(rt, "sleep polled outside of a runtime");

        m_driver = &rt->timeDriver();
        m_id = m_driver->addEntry(m_expiry, ctx().cloneWaker());
    }

    return false;
}

Sleep::~Sleep() {
    this->unregister();
}

Sleep::Sleep(Sleep&& other) noexcept
    : PollableBase<Sleep>(std::move(other)),
      m_expiry(other.m_expiry),
      m_driver(std::exchange(other.m_driver, nullptr)),
      m_id(std::exchange(other.m_id, 0)) {}

Sleep& Sleep::operator=(Sleep&& other) noexcept {
    if (this != &other) {
        this->unregister();
        m_expiry = other.m_expiry;
        m_driver = std::exchange(other.m_driver, nullptr);
        m_id = std::exchange(other.m_id, 0);
    }
    return *this;
}

void Sleep::unregister() noexcept {
    if (m_id != 0) {
        m_driver->removeEntry(m_expiry, m_id);
        m_id = 0;
    }
}

Sleep sleep(Duration duration) {
    return Sleep(Instant::now() + duration);
}

Sleep sleepUntil(Instant expiry) {
    return Sleep(expiry);
}

}
