#pragma once
#include <fmt/format.h>

#include <source_location>
#include <string>
#include <string_view>

namespace limen {

[[noreturn]] void _assertionFail(std::string_view condition, std::string message, const std::source_location& loc);

}

/// Throws std::runtime_error if `condition` is false. The remaining arguments are a fmt format string and its arguments.
#define LIMEN_ASSERT(condition, ...) \
    do { \
        if (!(condition)) [[unlikely]] { \
            ::limen::_assertionFail(#condition, ::fmt::format(__VA_ARGS__), std::source_location::current()); \
        } \
    } while (false)

#ifdef LIMEN_DEBUG
# define LIMEN_DEBUG_ASSERT(condition, ...) LIMEN_ASSERT(condition, __VA_ARGS__)
#else
# define LIMEN_DEBUG_ASSERT(condition, ...) (void)0
#endif
