#pragma once

#include <limen/task/Yield.hpp>
#include <fmt/format.h>

#include <compare>
#include <cstdint>
#include <functional>
#include <string>

namespace limen {

enum class TaskModel : uint8_t {
    Async,
    Green,
};

/// Identifies a logical task within one scheduling model.
/// Stable for the whole lifetime of the task and never reused by another task.
struct TaskIdent {
    TaskModel model;
    uint64_t id;

    bool operator==(const TaskIdent&) const = default;
    auto operator<=>(const TaskIdent&) const = default;

    std::string toString() const;
};

/// Allocates a new unique task id, shared by both scheduling models. Never returns 0.
uint64_t nextTaskId() noexcept;

/// Identity of the async task currently being polled on this thread.
/// Throws std::runtime_error if called outside of an async task.
TaskIdent currentAsyncTask();

/// Identity of the green task running on this thread: the current blocking task
/// if one is executing, otherwise the OS thread itself.
TaskIdent currentGreenTask() noexcept;

Yield asyncCheckpoint() noexcept;
void greenCheckpoint() noexcept;

// Suspension strategies, one per scheduling model.

struct AsyncModel {
    static constexpr TaskModel model = TaskModel::Async;

    static TaskIdent current() {
        return currentAsyncTask();
    }

    static Yield checkpoint() noexcept {
        return asyncCheckpoint();
    }
};

struct GreenModel {
    static constexpr TaskModel model = TaskModel::Green;

    static TaskIdent current() noexcept {
        return currentGreenTask();
    }

    static void checkpoint() noexcept {
        greenCheckpoint();
    }
};

}

template <>
struct std::hash<limen::TaskIdent> {
    size_t operator()(const limen::TaskIdent& ident) const noexcept {
        return std::hash<uint64_t>{}(ident.id) ^ (static_cast<size_t>(ident.model) << 1);
    }
};

template <>
struct fmt::formatter<limen::TaskIdent> : fmt::formatter<std::string_view> {
    auto format(const limen::TaskIdent& ident, fmt::format_context& ctx) const {
        return fmt::formatter<std::string_view>::format(ident.toString(), ctx);
    }
};
