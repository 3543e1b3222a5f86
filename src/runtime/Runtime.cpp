#include <limen/runtime/Runtime.hpp>
#include <limen/util/Trace.hpp>
#include <asp/thread/Thread.hpp>

#include <algorithm>
#include <cmath>
#include <utility>

using namespace asp::time;
using enum std::memory_order;

static constexpr size_t MAX_WORKERS = 128;
static constexpr size_t MAX_BLOCKING_WORKERS = 128;

namespace limen {

Runtime::Runtime(size_t workers) {
    workers = std::clamp<size_t>(workers, 1, MAX_WORKERS);

    m_workers.reserve(workers);
    for (size_t i = 0; i < workers; ++i) {
        m_workers.emplace_back(WorkerData{
            .id = i,
        });
    }

    for (size_t i = 0; i < workers; ++i) {
        auto& worker = m_workers[i];
        worker.thread = std::thread([this, &worker] {
            asp::_setThreadName(fmt::format("limen-worker-{}", worker.id));

            this->workerLoopWrapper(worker);
        });
    }
}

Runtime::~Runtime() {
    this->shutdown();
}

Runtime* Runtime::current() {
    return ctx().runtime();
}

void Runtime::enqueueTask(TaskBase* task) {
    trace("[Runtime] enqueuing task {}", task->id());
    {
        std::lock_guard lock(m_mtx);
        m_runQueue.push_back(task);
    }
    m_cv.notify_one();
}

void Runtime::enqueueBlocking(std::shared_ptr<BlockingTaskBase> task) {
    trace("[Runtime] enqueuing blocking task {}", task->id());

    {
        std::lock_guard lock(m_blockingMtx);

        // blocking threads are being joined, nothing would pick the task up
        if (m_stopFlag.load(::acquire)) {
            task->cancel();
            return;
        }

        m_blockingTasks.push_back(std::move(task));

        // spawn a new thread if every existing one is busy
        if (m_freeBlockingWorkers < m_blockingTasks.size() && m_blockingThreads.size() < MAX_BLOCKING_WORKERS) {
            size_t id = m_blockingThreads.size();
            m_freeBlockingWorkers++;

            m_blockingThreads.emplace_back([this, id] {
                asp::_setThreadName(fmt::format("limen-blocking-{}", id));
                this->blockingWorkerLoop(id);
            });
        }
    }

    m_blockingCv.notify_one();
}

void Runtime::workerLoopWrapper(WorkerData& data) {
    // Wrap around and catch exceptions to get better traces

    try {
        this->workerLoop(data);
    } catch (const std::exception& e) {
        printError("[Worker {}] terminating due to uncaught exception: {}", data.id, e.what());
        std::terminate();
    }
}

void Runtime::workerLoop(WorkerData& data) {
    ctx().m_runtime = this;

    float mult = std::pow(static_cast<float>(m_workers.size()), 0.9f);
    auto timerIncrement = Duration::fromMicros(500.f * mult);
    auto timerOffset = (timerIncrement * data.id) / m_workers.size();

    auto start = Instant::now();
    auto nextTimerTask = start + timerOffset;
    uint64_t timerTick = 0;

    while (true) {
        auto now = Instant::now();

        // every once in a while, run the timer driver
        if (now >= nextTimerTask) {
            m_timeDriver.doWork();

            do {
                timerTick++;
                nextTimerTask = start + timerOffset + timerTick * timerIncrement;
            } while (now >= nextTimerTask);
        }

        auto maxWait = nextTimerTask.durationSince(now);

        TaskBase* task = nullptr;
        {
            std::unique_lock lock(m_mtx);
            bool success;

            if (maxWait.isZero()) {
                // don't wait
                success = m_stopFlag.load(::acquire) || !m_runQueue.empty();
            } else {
                success = m_cv.wait_for(lock, std::chrono::microseconds{maxWait.micros()}, [this] {
                    return m_stopFlag.load(::acquire) || !m_runQueue.empty();
                });
            }

            if (!success) {
                continue; // timeout
            }

            if (m_stopFlag.load(::acquire)) {
                break;
            }

            if (!m_runQueue.empty()) {
                task = m_runQueue.front();
                m_runQueue.pop_front();
            }
        }

        if (!task) {
            continue;
        }

        trace("[Worker {}] driving task {}", data.id, task->id());
        task->run();
    }

    ctx().m_runtime = nullptr;
}

void Runtime::blockingWorkerLoop(size_t id) {
    ctx().m_runtime = this;

    while (true) {
        std::shared_ptr<BlockingTaskBase> task;
        {
            std::unique_lock lock(m_blockingMtx);

            m_blockingCv.wait(lock, [this] {
                return m_stopFlag.load(::acquire) || !m_blockingTasks.empty();
            });

            if (m_stopFlag.load(::acquire)) {
                break;
            }

            task = std::move(m_blockingTasks.front());
            m_blockingTasks.pop_front();
            m_freeBlockingWorkers--;
        }

        trace("[Blocking {}] executing blocking task {}", id, task->id());
        task->execute();
        trace("[Blocking {}] finished blocking task {}", id, task->id());

        std::lock_guard lock(m_blockingMtx);
        m_freeBlockingWorkers++;
    }

    ctx().m_runtime = nullptr;
}

void Runtime::shutdown() {
    trace("[Runtime] shutting down");
    m_stopFlag.store(true, ::release);
    m_cv.notify_all();
    m_blockingCv.notify_all();

    for (auto& worker : m_workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }

    std::vector<std::thread> blockingThreads;
    {
        std::lock_guard lock(m_blockingMtx);
        blockingThreads = std::move(m_blockingThreads);
    }

    for (auto& thread : blockingThreads) {
        if (thread.joinable()) {
            thread.join();
        }
    }

    m_workers.clear();

    // blocking tasks that no thread picked up fail instead of leaving their waiters parked
    std::deque<std::shared_ptr<BlockingTaskBase>> leftover;
    {
        std::lock_guard lock(m_blockingMtx);
        leftover = std::exchange(m_blockingTasks, {});
    }

    for (auto& task : leftover) {
        trace("[Runtime] cancelling blocking task {}", task->id());
        task->cancel();
    }

    // tasks left in the queue are closed and their futures dropped, without being polled again.
    // dropping a future can wake other tasks, so drain until nothing is left
    while (true) {
        TaskBase* task;
        {
            std::lock_guard lock(m_mtx);
            if (m_runQueue.empty()) {
                break;
            }

            task = m_runQueue.front();
            m_runQueue.pop_front();
        }

        task->abort();
        task->run();
    }
}

}
