#include <limen/task/Context.hpp>
#include <limen/task/Task.hpp>
#include <limen/util/Assert.hpp>

namespace limen {

TaskBase* TaskContext::currentTask() noexcept {
    return m_task;
}

Runtime* TaskContext::runtime() noexcept {
    if (m_runtime) {
        return m_runtime;
    }

    return m_task ? m_task->runtime() : nullptr;
}

void TaskContext::wake() {
    LIMEN_ASSERT(m_waker, "no waker in the current context");
    m_waker->wakeByRef();
}

Waker TaskContext::cloneWaker() {
    LIMEN_ASSERT(m_waker, "no waker in the current context");
    return m_waker->clone();
}

}
