#pragma once
#include <coroutine>
#include <exception>
#include <optional>
#include <type_traits>
#include <utility>

#include "Pollable.hpp"

namespace limen {

template <typename T>
struct Promise;

/// Lazily started coroutine. Nothing runs until the future is polled, usually by a task.
template <typename T = void>
struct LIMEN_NODISCARD Future : PollableUniBase {
    using Output = T;
    using promise_type = Promise<T>;
    using handle_type = std::coroutine_handle<promise_type>;

    explicit Future(handle_type handle) noexcept : m_handle(handle) {
        static const PollableVtable vtable = {
            .poll = [](void* self) -> bool {
                return static_cast<Future*>(static_cast<PollableUniBase*>(self))->poll();
            },
        };

        this->m_vtable = &vtable;
    }

    Future(Future&& other) noexcept
        : PollableUniBase(std::move(other)), m_handle(std::exchange(other.m_handle, {})) {}

    Future& operator=(Future&& other) noexcept {
        if (this != &other) {
            this->destroy();
            this->m_vtable = other.m_vtable;
            m_handle = std::exchange(other.m_handle, {});
        }
        return *this;
    }

    ~Future() {
        this->destroy();
    }

    /// Resumes the coroutine if its current child (if any) is ready.
    /// Exceptions thrown by the coroutine body are not rethrown here, but from `await_resume`.
    bool poll() {
        if (!m_handle || m_handle.done()) {
            return true;
        }

        auto& promise = m_handle.promise();

        if (auto child = promise.m_child) {
            if (!child->vPoll()) {
                return false;
            }

            promise.m_child = nullptr;
        }

        m_handle.resume();
        return m_handle.done();
    }

    T await_resume() {
        auto& promise = m_handle.promise();
        promise.rethrowIfFailed();

        if constexpr (!std::is_void_v<T>) {
            return std::move(*promise.m_value);
        }
    }

private:
    handle_type m_handle;

    void destroy() noexcept {
        if (m_handle) {
            m_handle.destroy();
            m_handle = {};
        }
    }
};

struct PromiseUniBase {
    PollableUniBase* m_child = nullptr;
    std::exception_ptr m_exception;

    std::suspend_always initial_suspend() noexcept { return {}; }
    std::suspend_always final_suspend() noexcept { return {}; }

    void unhandled_exception() noexcept {
        m_exception = std::current_exception();
    }

    void rethrowIfFailed() {
        if (m_exception) {
            std::rethrow_exception(m_exception);
        }
    }
};

template <typename T>
struct Promise : PromiseUniBase {
    std::optional<T> m_value;

    Future<T> get_return_object() noexcept {
        return Future<T>{ Future<T>::handle_type::from_promise(*this) };
    }

    template <std::convertible_to<T> From>
    void return_value(From&& from) {
        m_value.emplace(std::forward<From>(from));
    }
};

template <>
struct Promise<void> : PromiseUniBase {
    Future<void> get_return_object() noexcept {
        return Future<void>{ Future<void>::handle_type::from_promise(*this) };
    }

    void return_void() noexcept {}
};

}
