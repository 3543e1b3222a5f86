#pragma once
#include <cstdint>

namespace limen {

struct Waker;
class Runtime;
struct TaskBase;

/// Per-thread state describing what is currently executing on this thread.
struct TaskContext {
    Waker* m_waker = nullptr;
    Runtime* m_runtime = nullptr;
    TaskBase* m_task = nullptr;
    // id of the blocking task running on this thread, 0 if none
    uint64_t m_blockingTask = 0;

    TaskBase* currentTask() noexcept;
    Runtime* runtime() noexcept;
    void wake();
    Waker cloneWaker();
};

inline TaskContext& ctx() {
    static thread_local TaskContext context;
    return context;
}

}
