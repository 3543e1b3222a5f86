#include <limen/task/Identity.hpp>
#include <limen/task/Context.hpp>
#include <limen/task/Task.hpp>

#include <atomic>
#include <stdexcept>
#include <thread>

namespace limen {

static std::atomic<uint64_t> g_nextTaskId{1};

std::string TaskIdent::toString() const {
    return fmt::format("{}#{}", model == TaskModel::Async ? "async" : "green", id);
}

uint64_t nextTaskId() noexcept {
    return g_nextTaskId.fetch_add(1, std::memory_order::relaxed);
}

TaskIdent currentAsyncTask() {
    auto task = ctx().currentTask();
    if (!task) {
        throw std::runtime_error("current thread is not running an async task");
    }

    return TaskIdent{TaskModel::Async, task->id()};
}

TaskIdent currentGreenTask() noexcept {
    auto& cx = ctx();
    if (cx.m_blockingTask != 0) {
        return TaskIdent{TaskModel::Green, cx.m_blockingTask};
    }

    // a plain thread is its own green task, it gets an id on first use
    static thread_local uint64_t threadTaskId = nextTaskId();
    return TaskIdent{TaskModel::Green, threadTaskId};
}

Yield asyncCheckpoint() noexcept {
    return yield();
}

void greenCheckpoint() noexcept {
    std::this_thread::yield();
}

}
