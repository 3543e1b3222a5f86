#include <limen/prelude.hpp>
#include <asp/time.hpp>
#include <fmt/format.h>

#include <vector>

using namespace asp::time;
using namespace limen;

// A handful of async tasks and blocking workers share two tokens.

static Future<> asyncWorker(CapacityLimiter& limiter, int n) {
    auto guard = co_await limiter.asyncScoped();
    fmt::print("async worker {} ({}) got a token: {}\n", n, guard.task(), limiter);

    co_await limen::sleep(Duration::fromMillis(50));
}

static void greenWorker(CapacityLimiter& limiter, int n) {
    if (!limiter.greenAcquire(true, Duration::fromMillis(20))) {
        fmt::print("green worker {} gave up waiting\n", n);
        limiter.greenAcquire();
    }

    fmt::print("green worker {} ({}) got a token: {}\n", n, currentGreenTask(), limiter);
    std::this_thread::sleep_for(std::chrono::milliseconds(50));
    limiter.greenRelease();
}

static Future<> asyncMain() {
    limen::setLogFunction([](std::string msg, LogLevel level) {
        fmt::print("{}\n", msg);
    });

    CapacityLimiter limiter{2};

    std::vector<TaskHandle<void>> tasks;
    std::vector<BlockingTaskHandle<void>> blocking;

    for (int i = 0; i < 4; i++) {
        tasks.push_back(limen::spawn(asyncWorker(limiter, i)));
        blocking.push_back(limen::spawnBlocking<void>([&limiter, i] {
            greenWorker(limiter, i);
        }));
    }

    for (auto& task : tasks) {
        co_await task;
    }

    for (auto& task : blocking) {
        co_await task;
    }

    fmt::print("done: {}\n", limiter);
}

LIMEN_DEFINE_MAIN_NT(asyncMain, 2);
