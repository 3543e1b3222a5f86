#include <limen/util/Assert.hpp>
#include <limen/util/Trace.hpp>
#include <fmt/core.h>
#include <cstdio>
#include <stdexcept>

namespace limen {

[[noreturn]] void _assertionFail(std::string_view condition, std::string message, const std::source_location& loc) {
    throw std::runtime_error(fmt::format(
        "Assertion failed ({}) in {} at {}:{}: {}", condition, loc.function_name(), loc.file_name(), loc.line(), message
    ));
}

static MoveOnlyFunction<void(std::string, LogLevel)> g_logFunction;

void doLogMessage(std::string message, LogLevel level) {
    if (g_logFunction) {
        g_logFunction(std::move(message), level);
    } else {
        switch (level) {
            case LogLevel::Trace: {
                fmt::print("{}\n", message);
            } break;

            case LogLevel::Warn:
            case LogLevel::Error: {
                fmt::print(stderr, "{}\n", message);
            } break;
        }
    }
}

void setLogFunction(MoveOnlyFunction<void(std::string, LogLevel)> func) {
    g_logFunction = std::move(func);
}

}
