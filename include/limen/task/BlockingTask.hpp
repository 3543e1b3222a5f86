#pragma once
#include <limen/future/Pollable.hpp>
#include <limen/task/CondvarWaker.hpp>
#include <limen/task/Context.hpp>
#include <limen/task/Waker.hpp>
#include <limen/util/Function.hpp>

#include <asp/sync/SpinLock.hpp>

#include <cstdint>
#include <exception>
#include <memory>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace limen {

struct BlockingTaskBase;

struct BlockingTaskVtable {
    using ExecuteFn = void(*)(BlockingTaskBase*);
    using CancelFn = void(*)(BlockingTaskBase*);

    ExecuteFn execute = nullptr;
    CancelFn cancel = nullptr;
};

/// A synchronous function executed on one of the runtime's blocking threads.
/// While it runs, it is the current green task of that thread.
struct BlockingTaskBase {
    BlockingTaskBase(Runtime* runtime, const BlockingTaskVtable* vtable) noexcept;

    void execute();
    /// Completes a task that never started with an exception, waking anyone waiting on it.
    void cancel();

    uint64_t id() const noexcept {
        return m_id;
    }

protected:
    Runtime* m_runtime;
    const BlockingTaskVtable* m_vtable;
    uint64_t m_id;
};

template <typename T>
struct BlockingTask : BlockingTaskBase {
    using NVOutput = std::conditional_t<std::is_void_v<T>, std::monostate, T>;

    static std::shared_ptr<BlockingTask> create(Runtime* runtime, MoveOnlyFunction<T()> func) {
        return std::make_shared<BlockingTask>(runtime, std::move(func));
    }

    BlockingTask(Runtime* runtime, MoveOnlyFunction<T()> func)
        : BlockingTaskBase(runtime, &vtable), m_func(std::move(func)) {}

    /// Returns the output once the function has returned, rethrowing anything it threw.
    /// Otherwise registers the waker to be woken on completion.
    std::optional<NVOutput> pollTask(const Waker& waker) {
        auto data = m_data.lock();

        if (data->completed) {
            if (data->exception) {
                std::rethrow_exception(data->exception);
            }

            return std::exchange(data->result, std::nullopt);
        }

        if (!data->awaiter || !data->awaiter->equals(waker)) {
            data->awaiter = waker.clone();
        }

        return std::nullopt;
    }

private:
    struct Data {
        bool completed = false;
        std::optional<NVOutput> result;
        std::exception_ptr exception;
        std::optional<Waker> awaiter;
    };

    MoveOnlyFunction<T()> m_func;
    asp::SpinLock<Data> m_data;

    static void vExecute(BlockingTaskBase* base) {
        auto task = static_cast<BlockingTask*>(base);

        std::optional<NVOutput> result;
        std::exception_ptr exception;

        try {
            if constexpr (std::is_void_v<T>) {
                task->m_func();
                result.emplace();
            } else {
                result.emplace(task->m_func());
            }
        } catch (...) {
            exception = std::current_exception();
        }

        task->finish(std::move(result), std::move(exception));
    }

    static void vCancel(BlockingTaskBase* base) {
        auto task = static_cast<BlockingTask*>(base);
        task->finish(std::nullopt, std::make_exception_ptr(
            std::runtime_error("Blocking task was cancelled by runtime shutdown")
        ));
    }

    void finish(std::optional<NVOutput> result, std::exception_ptr exception) {
        auto data = m_data.lock();
        if (data->completed) return;

        data->completed = true;
        data->result = std::move(result);
        data->exception = std::move(exception);

        if (data->awaiter) {
            data->awaiter->wake();
            data->awaiter.reset();
        }
    }

    static constexpr BlockingTaskVtable vtable = {
        .execute = &BlockingTask::vExecute,
        .cancel = &BlockingTask::vCancel,
    };
};

template <typename T>
struct BlockingTaskHandle : PollableBase<BlockingTaskHandle<T>, T> {
    explicit BlockingTaskHandle(std::shared_ptr<BlockingTask<T>> task) : m_task(std::move(task)) {}

    BlockingTaskHandle(BlockingTaskHandle&&) noexcept = default;
    BlockingTaskHandle& operator=(BlockingTaskHandle&&) noexcept = default;

    auto poll() {
        auto out = m_task->pollTask(*ctx().m_waker);

        if constexpr (std::is_void_v<T>) {
            return out.has_value();
        } else {
            return out;
        }
    }

    /// Blocks the calling thread until the function has returned.
    T blockOn() {
        CondvarWaker cvw;
        auto waker = cvw.waker();

        while (true) {
            if (auto out = m_task->pollTask(waker)) {
                if constexpr (std::is_void_v<T>) {
                    return;
                } else {
                    return std::move(*out);
                }
            }

            cvw.wait();
        }
    }

    uint64_t id() const noexcept {
        return m_task->id();
    }

private:
    friend class Runtime;
    std::shared_ptr<BlockingTask<T>> m_task;
};

}
