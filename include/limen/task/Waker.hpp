#pragma once

namespace limen {

struct RawWaker;

struct RawWakerVtable {
    using WakeFn = void(*)(void*);
    using WakeByRefFn = void(*)(void*);
    using CloneFn = RawWaker(*)(void*);
    using DestroyFn = void(*)(void*);

    WakeFn wake = +[](void*){};
    WakeByRefFn wakeByRef = +[](void*){};
    CloneFn clone;
    DestroyFn destroy = +[](void*){};
};

struct RawWaker {
    void* m_data;
    const RawWakerVtable* m_vtable;

    bool equals(const RawWaker& other) const noexcept;
    static RawWaker noop() noexcept;
};

/// Owning handle used to reschedule whoever is waiting on a resource.
/// Wakers are move-only, use `clone()` to obtain another reference.
struct Waker : RawWaker {
    Waker(void* data, const RawWakerVtable* vtable) noexcept;
    Waker(RawWaker raw) noexcept;
    Waker(const Waker&) = delete;
    Waker& operator=(const Waker&) = delete;
    Waker(Waker&& other) noexcept;
    Waker& operator=(Waker&& other) noexcept;

    ~Waker();

    static Waker noop() noexcept;

    /// Wakes the target and consumes this waker.
    void wake() noexcept;
    void wakeByRef() noexcept;
    Waker clone() const noexcept;

    bool valid() const noexcept {
        return m_vtable != nullptr;
    }

private:
    void reset() noexcept;
    void destroy() noexcept;
};

}
