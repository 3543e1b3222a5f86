#pragma once
#include <utility>

namespace limen {

/// Storage whose destructor does not destroy the contained value, `drop()` must be called explicitly.
template <typename T>
struct ManuallyDrop {
    union {
        T value;
        char _dummy;
    };

    template <typename... Args>
    explicit ManuallyDrop(Args&&... args) : value(std::forward<Args>(args)...) {}

    ManuallyDrop(const ManuallyDrop&) = delete;
    ManuallyDrop& operator=(const ManuallyDrop&) = delete;

    ~ManuallyDrop() noexcept {}

    void drop() noexcept(noexcept(std::declval<T>().~T())) {
        value.~T();
    }

    T* operator->() noexcept {
        return &value;
    }

    T& operator*() noexcept {
        return value;
    }

    T& get() noexcept {
        return value;
    }
};

}
