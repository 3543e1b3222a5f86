#pragma once

#include <limen/future/Pollable.hpp>

namespace limen {

/// Wakes the current task and reports pending once, letting other ready tasks run.
struct LIMEN_NODISCARD Yield : PollableBase<Yield> {
    bool poll();

private:
    bool m_yielded = false;
};

Yield yield() noexcept;

struct LIMEN_NODISCARD Never : PollableBase<Never> {
    bool poll();
};

Never never() noexcept;

}
