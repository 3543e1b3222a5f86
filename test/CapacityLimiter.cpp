#include <limen/prelude.hpp>
#include <gtest/gtest.h>

#include "LimiterHelpers.hpp"

#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace asp::time;
using namespace limen;
using limen::test::GreenHolder;
using limen::test::waitForWaiters;

TEST(CapacityLimiter, Construction) {
    CapacityLimiter binary;
    EXPECT_EQ(binary.totalTokens(), 1);
    EXPECT_EQ(binary.availableTokens(), 1);
    EXPECT_EQ(binary.borrowedTokens(), 0);
    EXPECT_FALSE(binary);

    CapacityLimiter counting{5};
    EXPECT_EQ(counting.totalTokens(), 5);
    EXPECT_EQ(counting.availableTokens(), 5);
    EXPECT_EQ(counting.waiting(), 0);
    EXPECT_TRUE(counting.borrowers().empty());

    try {
        CapacityLimiter negative{-1};
        FAIL() << "negative total_tokens was accepted";
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "total_tokens must be >= 0");
    }
}

TEST(CapacityLimiter, GreenAcquireRelease) {
    CapacityLimiter limiter{2};
    auto self = currentGreenTask();

    EXPECT_TRUE(limiter.greenAcquire());
    EXPECT_TRUE(limiter.greenBorrowed());
    EXPECT_TRUE(limiter);
    EXPECT_EQ(limiter.availableTokens(), 1);
    EXPECT_EQ(limiter.borrowedTokens(), 1);

    auto borrowers = limiter.borrowers();
    ASSERT_EQ(borrowers.size(), 1);
    EXPECT_EQ(borrowers.at(self), 1);

    limiter.greenRelease();
    EXPECT_FALSE(limiter.greenBorrowed());
    EXPECT_EQ(limiter.availableTokens(), 2);
    EXPECT_TRUE(limiter.borrowers().empty());
}

TEST(CapacityLimiter, ReentrancyError) {
    CapacityLimiter limiter{3};
    EXPECT_TRUE(limiter.greenAcquire());

    EXPECT_THROW((void) limiter.greenAcquire(), ReentrancyError);
    EXPECT_THROW((void) limiter.greenAcquire(false), ReentrancyError);

    // the failed calls changed nothing
    EXPECT_EQ(limiter.availableTokens(), 2);
    EXPECT_EQ(limiter.borrowers().size(), 1);
    EXPECT_EQ(limiter.borrowers().at(currentGreenTask()), 1);

    limiter.greenRelease();
}

TEST(CapacityLimiter, NotHoldingError) {
    CapacityLimiter limiter{2};

    try {
        limiter.greenRelease();
        FAIL() << "release without holding did not throw";
    } catch (const NotHoldingError& e) {
        EXPECT_STREQ(e.what(), "the current task is not holding any of this capacity limiter's tokens");
    }

    // a token held by another task cannot be released by us
    GreenHolder holder{limiter};
    ASSERT_TRUE(holder.holding());
    EXPECT_THROW(limiter.greenRelease(), NotHoldingError);
    EXPECT_EQ(limiter.availableTokens(), 1);
}

TEST(CapacityLimiter, ZeroCapacity) {
    CapacityLimiter limiter{0};
    EXPECT_EQ(limiter.availableTokens(), 0);

    EXPECT_FALSE(limiter.greenAcquire(false));
    EXPECT_EQ(limiter.waiting(), 0);

    EXPECT_FALSE(limiter.greenAcquire(true, Duration::fromMillis(10)));
    EXPECT_EQ(limiter.waiting(), 0);
    EXPECT_TRUE(limiter.borrowers().empty());
    EXPECT_EQ(limiter.availableTokens(), 0);
}

TEST(CapacityLimiter, GreenTimeout) {
    CapacityLimiter limiter;
    GreenHolder holder{limiter};

    auto start = Instant::now();
    EXPECT_FALSE(limiter.greenAcquire(true, Duration::fromMillis(20)));
    EXPECT_GE(start.elapsed().millis(), 19);

    EXPECT_FALSE(limiter.greenBorrowed());
    EXPECT_EQ(limiter.waiting(), 0);

    holder.release();
    EXPECT_TRUE(limiter.greenAcquire(true, Duration::fromMillis(20)));
    limiter.greenRelease();
}

TEST(CapacityLimiter, NonBlockingScenario) {
    CapacityLimiter limiter{2};

    GreenHolder a{limiter};
    EXPECT_EQ(limiter.availableTokens(), 1);

    GreenHolder b{limiter};
    EXPECT_EQ(limiter.availableTokens(), 0);

    auto borrowers = limiter.borrowers();
    EXPECT_EQ(borrowers.size(), 2);
    EXPECT_TRUE(borrowers.contains(a.ident()));
    EXPECT_TRUE(borrowers.contains(b.ident()));

    EXPECT_FALSE(limiter.greenAcquire(false));
    EXPECT_EQ(limiter.waiting(), 0);

    a.release();
    EXPECT_EQ(limiter.availableTokens(), 1);
    EXPECT_FALSE(limiter.borrowers().contains(a.ident()));

    EXPECT_TRUE(limiter.greenAcquire(false));
    EXPECT_EQ(limiter.availableTokens(), 0);
    EXPECT_EQ(limiter.availableTokens() + limiter.borrowedTokens(), limiter.totalTokens());

    limiter.greenRelease();
}

TEST(CapacityLimiter, GreenBlockingHandOff) {
    CapacityLimiter limiter;
    GreenHolder holder{limiter};

    std::promise<bool> acquired;
    auto result = acquired.get_future();
    std::thread waiter([&] {
        acquired.set_value(limiter.greenAcquire());
        limiter.greenRelease();
    });

    waitForWaiters(limiter, 1);
    holder.release();

    EXPECT_TRUE(result.get());
    waiter.join();
    EXPECT_EQ(limiter.availableTokens(), 1);
}

static Future<> asyncDoubleAcquire(CapacityLimiter& limiter) {
    bool acquired = co_await limiter.asyncAcquire();
    EXPECT_TRUE(acquired);
    EXPECT_TRUE(limiter.asyncBorrowed());

    bool threw = false;
    try {
        (void) co_await limiter.asyncAcquire();
    } catch (const ReentrancyError&) {
        threw = true;
    }

    EXPECT_TRUE(threw);
    EXPECT_EQ(limiter.borrowers().size(), 1);
    EXPECT_EQ(limiter.availableTokens(), 1);

    limiter.asyncRelease();
    EXPECT_FALSE(limiter.asyncBorrowed());
}

TEST(CapacityLimiter, AsyncAcquireRelease) {
    Runtime rt{2};
    CapacityLimiter limiter{2};

    rt.blockOn(asyncDoubleAcquire(limiter));

    EXPECT_EQ(limiter.availableTokens(), 2);
    EXPECT_FALSE(limiter.greenBorrowed());
}

static Future<> asyncReleaseWithoutHolding(CapacityLimiter& limiter) {
    limiter.asyncRelease();
    co_return;
}

TEST(CapacityLimiter, AsyncErrorsPropagate) {
    Runtime rt{1};
    CapacityLimiter limiter;

    EXPECT_THROW(rt.blockOn(asyncReleaseWithoutHolding(limiter)), NotHoldingError);

    // async methods cannot be used outside of a task
    EXPECT_THROW(limiter.asyncRelease(), std::runtime_error);
}

static Future<bool> asyncTryAcquire(CapacityLimiter& limiter) {
    bool acquired = co_await limiter.asyncAcquire(false);
    if (acquired) {
        limiter.asyncRelease();
    }

    co_return acquired;
}

TEST(CapacityLimiter, AsyncNonBlocking) {
    Runtime rt{1};
    CapacityLimiter limiter;

    EXPECT_TRUE(rt.blockOn(asyncTryAcquire(limiter)));

    GreenHolder holder{limiter};
    EXPECT_FALSE(rt.blockOn(asyncTryAcquire(limiter)));
    EXPECT_EQ(limiter.waiting(), 0);
}

static Future<bool> asyncAcquireWithTimeout(CapacityLimiter& limiter, Duration dur) {
    auto res = co_await limen::timeout(dur, limiter.asyncAcquire());

    // the abandoned acquire is no longer queued
    EXPECT_EQ(limiter.waiting(), 0);

    if (res.isErr()) {
        co_return false;
    }

    limiter.asyncRelease();
    co_return true;
}

TEST(CapacityLimiter, AsyncCancellation) {
    Runtime rt{1};
    CapacityLimiter limiter;
    GreenHolder holder{limiter};

    EXPECT_FALSE(rt.blockOn(asyncAcquireWithTimeout(limiter, Duration::fromMillis(20))));
    EXPECT_EQ(limiter.borrowers().size(), 1);
    EXPECT_EQ(limiter.availableTokens(), 0);

    holder.release();
    EXPECT_EQ(limiter.availableTokens(), 1);
    EXPECT_TRUE(limiter.borrowers().empty());

    EXPECT_TRUE(rt.blockOn(asyncAcquireWithTimeout(limiter, Duration::fromSecs(1))));
}

TEST(CapacityLimiter, ZeroCapacityAsync) {
    Runtime rt{1};
    CapacityLimiter limiter{0};

    EXPECT_FALSE(rt.blockOn(asyncTryAcquire(limiter)));
    EXPECT_FALSE(rt.blockOn(asyncAcquireWithTimeout(limiter, Duration::fromMillis(10))));
}

static Future<TaskIdent> asyncHoldBriefly(CapacityLimiter& limiter) {
    bool acquired = co_await limiter.asyncAcquire();
    EXPECT_TRUE(acquired);

    // the green waiter queued behind us is still parked
    EXPECT_EQ(limiter.waiting(), 1);
    co_await limen::sleep(Duration::fromMillis(5));

    limiter.asyncRelease();
    co_return currentAsyncTask();
}

TEST(CapacityLimiter, FifoAcrossModels) {
    Runtime rt{1};
    CapacityLimiter limiter;
    GreenHolder holder{limiter};

    // async task queues first
    auto handle = rt.spawn(asyncHoldBriefly(limiter));
    waitForWaiters(limiter, 1);

    // then a green task
    std::promise<bool> greenAcquired;
    auto greenResult = greenAcquired.get_future();
    std::thread green([&] {
        greenAcquired.set_value(limiter.greenAcquire());
        limiter.greenRelease();
    });
    waitForWaiters(limiter, 2);

    // a release by a green task wakes the async waiter, whose release wakes the green one
    holder.release();

    auto asyncTask = handle.blockOn();
    EXPECT_EQ(asyncTask.model, TaskModel::Async);
    EXPECT_TRUE(greenResult.get());
    green.join();

    EXPECT_EQ(limiter.availableTokens(), 1);
    EXPECT_EQ(limiter.waiting(), 0);
}

static Future<> asyncHoldFor(CapacityLimiter& limiter, Duration dur) {
    co_await limiter.asyncAcquire();
    co_await limen::sleep(dur);
    limiter.asyncRelease();
}

TEST(CapacityLimiter, AsyncReleaseWakesGreen) {
    Runtime rt{1};
    CapacityLimiter limiter;

    auto handle = rt.spawn(asyncHoldFor(limiter, Duration::fromMillis(20)));
    while (limiter.availableTokens() != 0) {
        std::this_thread::yield();
    }

    EXPECT_TRUE(limiter.greenAcquire());
    limiter.greenRelease();
    handle.blockOn();
}

TEST(CapacityLimiter, Representation) {
    CapacityLimiter limiter{2};

    EXPECT_EQ(limiter.toString(), fmt::format("<limen::CapacityLimiter(2) at {} [available_tokens=2]>", fmt::ptr(&limiter)));
    EXPECT_EQ(fmt::format("{}", limiter), limiter.toString());

    GreenHolder holder{limiter};
    EXPECT_TRUE(limiter.greenAcquire());
    EXPECT_EQ(
        limiter.toString(),
        fmt::format("<limen::CapacityLimiter(2) at {} [available_tokens=0, waiting=0]>", fmt::ptr(&limiter))
    );
    limiter.greenRelease();

    CapacityLimiter zero{0};
    EXPECT_EQ(zero.toString(), fmt::format("<limen::CapacityLimiter(0) at {} [available_tokens=0, waiting=0]>", fmt::ptr(&zero)));
}

TEST(CapacityLimiter, GreenScoped) {
    CapacityLimiter limiter;

    {
        auto guard = limiter.greenScoped();
        EXPECT_TRUE(limiter.greenBorrowed());
        EXPECT_EQ(guard.task(), currentGreenTask());
    }

    EXPECT_FALSE(limiter.greenBorrowed());

    try {
        auto guard = limiter.greenScoped();
        throw std::runtime_error("protected section failed");
    } catch (const std::runtime_error&) {}

    EXPECT_FALSE(limiter.greenBorrowed());
    EXPECT_EQ(limiter.availableTokens(), 1);

    // early release, the guard does nothing afterwards
    {
        auto guard = limiter.greenScoped();
        guard.release();
        EXPECT_FALSE(limiter.greenBorrowed());
        EXPECT_TRUE(limiter.greenAcquire());
        limiter.greenRelease();
    }

    EXPECT_EQ(limiter.availableTokens(), 1);
}

TEST(CapacityLimiter, GuardWarnsOnDoubleRelease) {
    CapacityLimiter limiter;
    std::vector<std::string> warnings;

    limen::setLogFunction([&warnings](std::string message, LogLevel level) {
        if (level == LogLevel::Warn) {
            warnings.push_back(std::move(message));
        }
    });

    {
        auto guard = limiter.greenScoped();
        limiter.greenRelease();
    }

    limen::setLogFunction(nullptr);

    ASSERT_EQ(warnings.size(), 1);
    EXPECT_NE(warnings[0].find("[WARN] [LimiterGuard]"), std::string::npos);
}

static Future<> asyncScopedThrows(CapacityLimiter& limiter) {
    auto guard = co_await limiter.asyncScoped();
    EXPECT_TRUE(limiter.asyncBorrowed());
    throw std::runtime_error("protected section failed");
}

static Future<> asyncScopedMoved(CapacityLimiter& limiter) {
    auto guard = co_await limiter.asyncScoped();
    auto moved = std::move(guard);
    EXPECT_TRUE(limiter.asyncBorrowed());
    EXPECT_EQ(moved.count(), 1);
}

TEST(CapacityLimiter, AsyncScoped) {
    Runtime rt{1};
    CapacityLimiter limiter;

    EXPECT_THROW(rt.blockOn(asyncScopedThrows(limiter)), std::runtime_error);
    EXPECT_EQ(limiter.availableTokens(), 1);
    EXPECT_TRUE(limiter.borrowers().empty());

    rt.blockOn(asyncScopedMoved(limiter));
    EXPECT_EQ(limiter.availableTokens(), 1);
}

namespace {

// Tracks how many tasks are inside the limited section at once.
struct Occupancy {
    size_t limit;
    std::atomic<size_t> inside{0};
    std::atomic<size_t> entered{0};
    std::atomic<bool> exceeded{false};

    void enter(const CapacityLimiter& limiter) {
        size_t now = inside.fetch_add(1) + 1;
        if (now > limit || limiter.borrowers().size() > limit) {
            exceeded = true;
        }

        entered++;
    }

    void leave() {
        inside--;
    }
};

}

static constexpr size_t CHURN_ROUNDS = 200;

static Future<> asyncChurn(CapacityLimiter& limiter, Occupancy& occupancy) {
    for (size_t i = 0; i < CHURN_ROUNDS; i++) {
        bool acquired = co_await limiter.asyncAcquire();
        EXPECT_TRUE(acquired);

        occupancy.enter(limiter);
        co_await limen::yield();
        occupancy.leave();

        limiter.asyncRelease();
    }
}

TEST(CapacityLimiter, ConcurrentMixedTasks) {
    Runtime rt{4};
    CapacityLimiter limiter{3};
    Occupancy occupancy{.limit = 3};

    std::vector<TaskHandle<void>> asyncTasks;
    for (size_t i = 0; i < 8; i++) {
        asyncTasks.push_back(rt.spawn(asyncChurn(limiter, occupancy)));
    }

    std::vector<std::thread> greenTasks;
    for (size_t i = 0; i < 8; i++) {
        greenTasks.emplace_back([&] {
            for (size_t j = 0; j < CHURN_ROUNDS; j++) {
                if (!limiter.greenAcquire()) {
                    occupancy.exceeded = true;
                    return;
                }

                occupancy.enter(limiter);
                std::this_thread::yield();
                occupancy.leave();

                limiter.greenRelease();
            }
        });
    }

    for (auto& thread : greenTasks) {
        thread.join();
    }

    for (auto& handle : asyncTasks) {
        handle.blockOn();
    }

    EXPECT_FALSE(occupancy.exceeded.load());
    EXPECT_EQ(occupancy.entered.load(), 16 * CHURN_ROUNDS);
    EXPECT_EQ(occupancy.inside.load(), 0);

    EXPECT_TRUE(limiter.borrowers().empty());
    EXPECT_EQ(limiter.availableTokens(), 3);
    EXPECT_EQ(limiter.borrowedTokens(), 0);
    EXPECT_EQ(limiter.waiting(), 0);
    EXPECT_FALSE(limiter);
}
