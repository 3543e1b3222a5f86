#include <limen/task/BlockingTask.hpp>
#include <limen/task/Identity.hpp>

namespace limen {

BlockingTaskBase::BlockingTaskBase(Runtime* runtime, const BlockingTaskVtable* vtable) noexcept
    : m_runtime(runtime), m_vtable(vtable), m_id(nextTaskId()) {}

void BlockingTaskBase::execute() {
    auto& cx = ctx();
    auto prevTask = std::exchange(cx.m_blockingTask, m_id);
    auto prevRuntime = std::exchange(cx.m_runtime, m_runtime);

    m_vtable->execute(this);

    cx.m_blockingTask = prevTask;
    cx.m_runtime = prevRuntime;
}

void BlockingTaskBase::cancel() {
    m_vtable->cancel(this);
}

}
