#pragma once

#include <fmt/core.h>
#include <fmt/std.h>
#include <asp/time/Instant.hpp>
#include <limen/util/Function.hpp>

#include <string>
#include <utility>

namespace limen {

inline const asp::time::Instant& _traceEpoch() {
    static auto epoch = asp::time::Instant::now();
    return epoch;
}

enum LogLevel {
    Trace,
    Warn,
    Error,
};

void doLogMessage(std::string message, LogLevel level);
void setLogFunction(MoveOnlyFunction<void(std::string, LogLevel)> func);

template <class... Args>
void trace(fmt::format_string<Args...> fmt, Args&&... args) {
#ifdef LIMEN_TRACE
    auto elapsed = _traceEpoch().elapsed();
    auto message = fmt::format("[TRACE] [{:.4f}] {}", elapsed.seconds<float>(), fmt::format(fmt, std::forward<Args>(args)...));
    doLogMessage(std::move(message), LogLevel::Trace);
#endif
}

template <class... Args>
void printWarn(fmt::format_string<Args...> fmt, Args&&... args) {
    auto message = fmt::format("[WARN] {}", fmt::format(fmt, std::forward<Args>(args)...));
    doLogMessage(std::move(message), LogLevel::Warn);
}

template <class... Args>
void printError(fmt::format_string<Args...> fmt, Args&&... args) {
    auto message = fmt::format("[ERROR] {}", fmt::format(fmt, std::forward<Args>(args)...));
    doLogMessage(std::move(message), LogLevel::Error);
}

}
