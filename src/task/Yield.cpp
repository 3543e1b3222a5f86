#include <limen/task/Yield.hpp>
#include <limen/task/Context.hpp>

namespace limen {

bool Yield::poll() {
    if (m_yielded) {
        return true;
    }

    m_yielded = true;
    ctx().wake();
    return false;
}

Yield yield() noexcept {
    return Yield{};
}

bool Never::poll() {
    return false;
}

Never never() noexcept {
    return Never{};
}

}
