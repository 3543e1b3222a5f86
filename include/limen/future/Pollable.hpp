#pragma once
#include <concepts>
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>
#include <limen/util/Config.hpp>

namespace limen {

// A pollable is something that can be polled for completion, similar to the `Future` trait in Rust.
// Polling never blocks, a pollable that is not ready must arrange for the current waker to be woken.
// An exception thrown by `poll()` counts as ready and is rethrown from `await_resume()`.

struct PollableVtable {
    using PollFn = bool(*)(void*);

    PollFn poll = nullptr;
};

struct PollableUniBase {
    const PollableVtable* m_vtable = nullptr;

    PollableUniBase() = default;
    PollableUniBase(const PollableUniBase&) = delete;
    PollableUniBase& operator=(const PollableUniBase&) = delete;
    PollableUniBase(PollableUniBase&&) = default;
    PollableUniBase& operator=(PollableUniBase&&) = default;
    ~PollableUniBase() = default;

    bool vPoll() {
        return m_vtable->poll(static_cast<void*>(this));
    }

    bool await_ready() const noexcept { return false; }

    // The awaiting coroutine's promise records this pollable as its child,
    // so the enclosing future polls it until it's ready.
    template <typename P>
    bool await_suspend(std::coroutine_handle<P> h) {
        auto& promise = h.promise();
        promise.m_child = this;

        if (this->vPoll()) {
            promise.m_child = nullptr;
            return false;
        }

        return true;
    }
};

template <typename Derived, typename T = void>
struct PollableBase : PollableUniBase {
    using Output = T;

    PollableBase() {
        static const PollableVtable vtable = {
            .poll = [](void* self) -> bool {
                auto me = static_cast<Derived*>(static_cast<PollableUniBase*>(self));
                auto base = static_cast<PollableBase*>(me);

                try {
                    base->m_output = me->poll();
                    return base->m_output.has_value();
                } catch (...) {
                    base->m_exception = std::current_exception();
                    return true;
                }
            },
        };

        this->m_vtable = &vtable;
    }

    T await_resume() {
        if (m_exception) {
            std::rethrow_exception(std::exchange(m_exception, nullptr));
        }

        auto out = std::move(*m_output);
        m_output.reset();
        return out;
    }

protected:
    std::optional<Output> m_output;
    std::exception_ptr m_exception;
};

template <typename Derived>
struct PollableBase<Derived, void> : PollableUniBase {
    using Output = void;

    PollableBase() {
        static const PollableVtable vtable = {
            .poll = [](void* self) -> bool {
                auto me = static_cast<Derived*>(static_cast<PollableUniBase*>(self));

                try {
                    return me->poll();
                } catch (...) {
                    static_cast<PollableBase*>(me)->m_exception = std::current_exception();
                    return true;
                }
            },
        };

        this->m_vtable = &vtable;
    }

    void await_resume() {
        if (m_exception) {
            std::rethrow_exception(std::exchange(m_exception, nullptr));
        }
    }

protected:
    std::exception_ptr m_exception;
};

template <typename T>
concept Pollable = std::derived_from<T, PollableUniBase>;

}
