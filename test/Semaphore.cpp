#include <limen/sync/Semaphore.hpp>
#include <limen/task/Context.hpp>
#include <gtest/gtest.h>

#include <atomic>
#include <thread>

using namespace asp::time;
using namespace limen;

TEST(Semaphore, TryAcquire) {
    Semaphore sem{2};
    EXPECT_TRUE(sem.tryAcquire());
    EXPECT_TRUE(sem.tryAcquire());
    EXPECT_FALSE(sem.tryAcquire());
    EXPECT_EQ(sem.value(), 0);
    EXPECT_EQ(sem.waiting(), 0);

    sem.release();
    EXPECT_EQ(sem.value(), 1);
    EXPECT_EQ(sem.initialValue(), 2);
}

TEST(Semaphore, FifoHandOff) {
    Waker waker = Waker::noop();
    ctx().m_waker = &waker;

    Semaphore sem{1};

    auto w1 = sem.acquire();
    auto w2 = sem.acquire();
    auto w3 = sem.acquire();

    EXPECT_TRUE(w1.poll());
    EXPECT_FALSE(w2.poll());
    EXPECT_FALSE(w3.poll());
    EXPECT_EQ(sem.waiting(), 2);

    // a newcomer cannot take the released permit ahead of parked waiters
    sem.release();
    EXPECT_FALSE(sem.tryAcquire());
    EXPECT_EQ(sem.value(), 0);
    EXPECT_EQ(sem.waiting(), 1);

    EXPECT_FALSE(w3.poll());
    EXPECT_TRUE(w2.poll());

    sem.release();
    EXPECT_TRUE(w3.poll());
    EXPECT_EQ(sem.waiting(), 0);

    sem.release();
    EXPECT_EQ(sem.value(), 1);

    ctx().m_waker = nullptr;
}

TEST(Semaphore, DropWaitingAwaiter) {
    Waker waker = Waker::noop();
    ctx().m_waker = &waker;

    Semaphore sem{0};

    {
        auto w = sem.acquire();
        EXPECT_FALSE(w.poll());
        EXPECT_EQ(sem.waiting(), 1);
    }

    EXPECT_EQ(sem.waiting(), 0);

    sem.release();
    EXPECT_EQ(sem.value(), 1);

    ctx().m_waker = nullptr;
}

TEST(Semaphore, DropGrantedAwaiter) {
    Waker waker = Waker::noop();
    ctx().m_waker = &waker;

    Semaphore sem{0};

    {
        auto w1 = sem.acquire();
        EXPECT_FALSE(w1.poll());

        // granted, but never polled again
        sem.release();
        EXPECT_EQ(sem.value(), 0);
    }

    // the unconsumed permit went back to the semaphore
    EXPECT_EQ(sem.value(), 1);
    EXPECT_EQ(sem.waiting(), 0);

    ctx().m_waker = nullptr;
}

TEST(Semaphore, DropGrantedAwaiterPassesPermitOn) {
    Waker waker = Waker::noop();
    ctx().m_waker = &waker;

    Semaphore sem{0};
    auto w2 = sem.acquire();

    {
        auto w1 = sem.acquire();
        EXPECT_FALSE(w1.poll());
        EXPECT_FALSE(w2.poll());

        sem.release();
    }

    EXPECT_TRUE(w2.poll());
    EXPECT_EQ(sem.value(), 0);

    ctx().m_waker = nullptr;
}

TEST(Semaphore, OverRelease) {
    Semaphore bounded{2, 2};
    EXPECT_THROW(bounded.release(), std::logic_error);
    EXPECT_EQ(bounded.value(), 2);

    EXPECT_TRUE(bounded.tryAcquire());
    bounded.release();
    EXPECT_THROW(bounded.release(), std::logic_error);

    Semaphore unbounded{0};
    unbounded.release(5);
    EXPECT_EQ(unbounded.value(), 5);
}

TEST(Semaphore, Binary) {
    EXPECT_THROW(BinarySemaphore{2}, std::invalid_argument);

    BinarySemaphore sem{0};
    EXPECT_EQ(sem.maxValue(), 1);
    EXPECT_FALSE(sem.tryAcquire());

    sem.release();
    EXPECT_THROW(sem.release(), std::logic_error);
    EXPECT_TRUE(sem.tryAcquire());
}

TEST(Semaphore, BlockingTimeout) {
    Semaphore sem{0};

    auto start = Instant::now();
    EXPECT_FALSE(sem.acquireBlocking(Duration::fromMillis(20)));
    EXPECT_GE(start.elapsed().millis(), 19);
    EXPECT_EQ(sem.waiting(), 0);

    sem.release();
    EXPECT_TRUE(sem.acquireBlocking(Duration::zero()));
}

TEST(Semaphore, BlockingWakesAcrossThreads) {
    Semaphore sem{0};
    std::atomic<bool> acquired{false};

    std::thread th([&] {
        acquired = sem.acquireBlocking();
    });

    while (sem.waiting() == 0) {
        std::this_thread::yield();
    }

    EXPECT_FALSE(acquired);
    sem.release();
    th.join();

    EXPECT_TRUE(acquired);
    EXPECT_EQ(sem.value(), 0);
}

TEST(Semaphore, BlockingAndPolledShareQueue) {
    Waker waker = Waker::noop();
    ctx().m_waker = &waker;

    Semaphore sem{0};
    std::atomic<bool> acquired{false};

    std::thread th([&] {
        acquired = sem.acquireBlocking();
    });

    while (sem.waiting() == 0) {
        std::this_thread::yield();
    }

    // queued behind the blocking thread
    auto w = sem.acquire();
    EXPECT_FALSE(w.poll());
    EXPECT_EQ(sem.waiting(), 2);

    sem.release();
    th.join();
    EXPECT_TRUE(acquired);
    EXPECT_FALSE(w.poll());

    sem.release();
    EXPECT_TRUE(w.poll());

    ctx().m_waker = nullptr;
}
