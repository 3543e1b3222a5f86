#pragma once

#include "Waker.hpp"
#include "CondvarWaker.hpp"
#include "Context.hpp"
#include <limen/future/Future.hpp>
#include <limen/util/ManuallyDrop.hpp>

#include <asp/sync/SpinLock.hpp>

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <exception>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace limen {

static constexpr uint32_t TASK_SCHEDULED = 1 << 0;
static constexpr uint32_t TASK_RUNNING   = 1 << 1;
static constexpr uint32_t TASK_COMPLETED = 1 << 2;
static constexpr uint32_t TASK_CLOSED    = 1 << 3;

struct TaskBase;

struct TaskVtable {
    using PollFn = bool(*)(TaskBase*);
    using Fn = void(*)(TaskBase*);

    PollFn poll;
    Fn dropFuture;
    Fn destroy;
};

/// Type-erased, reference counted task. References are held by the task handle,
/// by the run queue while the task is scheduled and by every waker cloned from it.
struct TaskBase {
    TaskBase(Runtime* runtime, const TaskVtable* vtable) noexcept;
    TaskBase(const TaskBase&) = delete;
    TaskBase& operator=(const TaskBase&) = delete;

    uint64_t id() const noexcept {
        return m_id;
    }

    Runtime* runtime() const noexcept {
        return m_runtime;
    }

    /// Polls the task once. Called by a runtime worker that owns one reference.
    void run();

    /// Schedules the task unless it's already scheduled, finished or closed.
    /// If the task is currently running, it will be polled again after the current poll.
    void wakeByRef() noexcept;

    void incref() noexcept;
    void decref() noexcept;
    Waker makeWaker() noexcept;

    /// Returns true once the task has finished, either with output, an exception, or by being aborted.
    /// Otherwise registers the given waker to be woken on completion.
    bool pollCompletion(const Waker& waker);

    /// Closes the task. Its future is dropped by the runtime the next time the task runs.
    void abort() noexcept;

    std::exception_ptr exception() const noexcept {
        return m_exception;
    }

protected:
    struct AwaiterSlot {
        std::optional<Waker> waker;
    };

    std::atomic<uint32_t> m_state{TASK_SCHEDULED};
    std::atomic<size_t> m_refs{1};
    Runtime* m_runtime;
    const TaskVtable* m_vtable;
    uint64_t m_id;
    bool m_futureDropped = false;
    std::exception_ptr m_exception;
    asp::SpinLock<AwaiterSlot> m_awaiter;

    static const RawWakerVtable s_wakerVtable;

    bool exchangeState(uint32_t& expected, uint32_t desired) noexcept;
    void dropFuture() noexcept;
    void complete() noexcept;
};

template <typename T>
struct TaskTypedBase : TaskBase {
    using Output = T;
    using NVOutput = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    using TaskBase::TaskBase;

    std::optional<NVOutput> m_value;
};

template <Pollable P>
struct Task : TaskTypedBase<typename P::Output> {
    using Output = typename P::Output;

    ManuallyDrop<P> m_future;

    static Task* create(Runtime* runtime, P&& fut) {
        return new Task(runtime, std::move(fut));
    }

    Task(Runtime* runtime, P&& fut)
        : TaskTypedBase<Output>(runtime, &vtable), m_future(std::move(fut)) {}

    ~Task() {
        if (!this->m_futureDropped) {
            m_future.drop();
        }
    }

private:
    static bool vPoll(TaskBase* base) {
        auto self = static_cast<Task*>(base);

        if (!self->m_future->vPoll()) {
            return false;
        }

        if constexpr (std::is_void_v<Output>) {
            self->m_future->await_resume();
            self->m_value.emplace();
        } else {
            self->m_value.emplace(self->m_future->await_resume());
        }

        return true;
    }

    static void vDropFuture(TaskBase* base) {
        static_cast<Task*>(base)->m_future.drop();
    }

    static void vDestroy(TaskBase* base) {
        delete static_cast<Task*>(base);
    }

    static constexpr TaskVtable vtable = {
        .poll = &Task::vPoll,
        .dropFuture = &Task::vDropFuture,
        .destroy = &Task::vDestroy,
    };
};

/// Owning handle to a spawned task. Dropping the handle detaches the task, it keeps running.
/// Awaiting the handle yields the task's output, or rethrows the exception it failed with.
template <typename T>
struct TaskHandle : PollableBase<TaskHandle<T>, T> {
    using NVOutput = typename TaskTypedBase<T>::NVOutput;

    explicit TaskHandle(TaskTypedBase<T>* task) noexcept : m_task(task) {}

    TaskHandle(const TaskHandle&) = delete;
    TaskHandle& operator=(const TaskHandle&) = delete;

    TaskHandle(TaskHandle&& other) noexcept
        : PollableBase<TaskHandle<T>, T>(std::move(other)), m_task(std::exchange(other.m_task, nullptr)) {}

    TaskHandle& operator=(TaskHandle&& other) noexcept {
        if (this != &other) {
            if (m_task) m_task->decref();
            m_task = std::exchange(other.m_task, nullptr);
        }
        return *this;
    }

    ~TaskHandle() {
        if (m_task) m_task->decref();
    }

    auto poll() {
        std::optional<NVOutput> out;
        if (m_task->pollCompletion(*ctx().m_waker)) {
            out = this->takeOutput();
        }

        if constexpr (std::is_void_v<T>) {
            return out.has_value();
        } else {
            return out;
        }
    }

    /// Blocks the calling thread until the task is completed.
    /// Do not use this inside async code.
    T blockOn() {
        CondvarWaker cvw;
        auto waker = cvw.waker();

        while (!m_task->pollCompletion(waker)) {
            cvw.wait();
        }

        if constexpr (std::is_void_v<T>) {
            this->takeOutput();
        } else {
            return std::move(*this->takeOutput());
        }
    }

    void abort() noexcept {
        m_task->abort();
    }

    uint64_t id() const noexcept {
        return m_task->id();
    }

private:
    TaskTypedBase<T>* m_task;

    std::optional<NVOutput> takeOutput() {
        if (auto exc = m_task->exception()) {
            std::rethrow_exception(exc);
        }

        if (!m_task->m_value) {
            throw std::runtime_error("Task was aborted before completion");
        }

        return std::exchange(m_task->m_value, std::nullopt);
    }
};

}
