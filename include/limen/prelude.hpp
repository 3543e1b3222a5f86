#pragma once

#include "future/Future.hpp"
#include "future/Pollable.hpp"
#include "runtime/Runtime.hpp"
#include "sync/BorrowerLedger.hpp"
#include "sync/CapacityLimiter.hpp"
#include "sync/LimiterError.hpp"
#include "sync/ReentrantCapacityLimiter.hpp"
#include "sync/Semaphore.hpp"
#include "task/BlockingTask.hpp"
#include "task/CondvarWaker.hpp"
#include "task/Context.hpp"
#include "task/Identity.hpp"
#include "task/Task.hpp"
#include "task/Waker.hpp"
#include "task/Yield.hpp"
#include "time/Sleep.hpp"
#include "time/Timeout.hpp"
#include "util/Assert.hpp"
#include "util/Result.hpp"
#include "util/Trace.hpp"

#include <optional>
#include <thread>
#include <type_traits>

namespace limen {

inline int _mainWrapper(int argc, char** argv, auto mainFut, std::optional<size_t> numThreads) {
    limen::Runtime runtime{numThreads.value_or(std::thread::hardware_concurrency())};
    int ret = 0;

    if constexpr (requires { mainFut(argc, argv); }) {
        using MainOutput = typename decltype(mainFut(argc, argv))::Output;

        if constexpr (std::is_void_v<MainOutput>) {
            runtime.blockOn(mainFut(argc, argv));
        } else {
            ret = runtime.blockOn(mainFut(argc, argv));
        }
    } else {
        using MainOutput = typename decltype(mainFut())::Output;

        if constexpr (std::is_void_v<MainOutput>) {
            runtime.blockOn(mainFut());
        } else {
            ret = runtime.blockOn(mainFut());
        }
    }

    return ret;
}

}

#define LIMEN_DEFINE_MAIN(f) \
    int main(int argc, char** argv) { \
        return ::limen::_mainWrapper(argc, argv, f, std::nullopt); \
    }

#define LIMEN_DEFINE_MAIN_NT(f, nt) \
    int main(int argc, char** argv) { \
        return ::limen::_mainWrapper(argc, argv, f, nt); \
    }
