#pragma once
#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <thread>
#include <vector>

#include <limen/task/Task.hpp>
#include <limen/task/BlockingTask.hpp>
#include <limen/util/Function.hpp>
#include "TimeDriver.hpp"

namespace limen {

/// Multi-threaded executor for async tasks, with a separate pool of threads for blocking (green) tasks.
/// Tasks that are still pending when the runtime is destroyed are never polled again.
class Runtime {
public:
    explicit Runtime(size_t workers = std::thread::hardware_concurrency());
    ~Runtime();

    /// Get the thread-local runtime context, returns nullptr if not inside a runtime.
    static Runtime* current();

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;
    Runtime(Runtime&&) = delete;
    Runtime& operator=(Runtime&&) = delete;

    inline TimeDriver& timeDriver() noexcept {
        return m_timeDriver;
    }

    size_t workerCount() const noexcept {
        return m_workers.size();
    }

    /// Pushes a scheduled task to the back of the run queue, taking over one reference.
    void enqueueTask(TaskBase* task);

    template <Pollable F, typename T = typename F::Output>
    TaskHandle<T> spawn(F fut) {
        auto* task = Task<F>::create(this, std::move(fut));
        task->incref(); // reference owned by the run queue
        this->enqueueTask(task);

        return TaskHandle<T>{task};
    }

    template <typename T>
    BlockingTaskHandle<T> spawnBlocking(MoveOnlyFunction<T()> func) {
        auto task = BlockingTask<T>::create(this, std::move(func));
        this->enqueueBlocking(task);

        return BlockingTaskHandle<T>{std::move(task)};
    }

    template <Pollable F, typename T = typename F::Output>
    T blockOn(F fut) {
        auto handle = this->spawn(std::move(fut));
        return handle.blockOn();
    }

private:
    struct WorkerData {
        std::thread thread;
        size_t id;
    };

    std::atomic<bool> m_stopFlag{false};
    TimeDriver m_timeDriver;

    std::mutex m_mtx;
    std::deque<TaskBase*> m_runQueue; // protected by m_mtx
    std::vector<WorkerData> m_workers;
    std::condition_variable m_cv;

    std::mutex m_blockingMtx;
    std::deque<std::shared_ptr<BlockingTaskBase>> m_blockingTasks; // protected by m_blockingMtx
    std::vector<std::thread> m_blockingThreads; // protected by m_blockingMtx
    size_t m_freeBlockingWorkers = 0; // protected by m_blockingMtx
    std::condition_variable m_blockingCv;

    void shutdown();

    void workerLoop(WorkerData& data);
    void workerLoopWrapper(WorkerData& data);
    void blockingWorkerLoop(size_t id);

    void enqueueBlocking(std::shared_ptr<BlockingTaskBase> task);
};

template <Pollable F>
auto spawn(F t) {
    if (auto rt = ctx().runtime()) {
        return rt->spawn(std::move(t));
    } else {
        throw std::runtime_error("No runtime available");
    }
}

/// Spawns a blocking function onto the runtime's blocking thread pool.
/// Inside the function, the calling code is a green task with its own identity.
/// The returned handle can be awaited to get the result of the function.
template <typename T>
auto spawnBlocking(MoveOnlyFunction<T()> f) {
    if (auto rt = ctx().runtime()) {
        return rt->spawnBlocking<T>(std::move(f));
    } else {
        throw std::runtime_error("No runtime available");
    }
}

}
