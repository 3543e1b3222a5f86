#include <limen/sync/ReentrantCapacityLimiter.hpp>

#include <stdexcept>

namespace limen {

static void checkCount(size_t count) {
    if (count < 1) {
        throw std::invalid_argument("count must be >= 1");
    }
}

ReentrantCapacityLimiter::ReentrantCapacityLimiter(std::optional<int64_t> totalTokens)
    : CapacityLimiter(totalTokens, "limen::ReentrantCapacityLimiter") {}

Future<bool> ReentrantCapacityLimiter::asyncAcquire(size_t count, bool blocking) {
    checkCount(count);
    return this->acquireCurrent(count, blocking);
}

Future<bool> ReentrantCapacityLimiter::acquireCurrent(size_t count, bool blocking) {
    co_return co_await this->acquireFor(AsyncModel::current(), count, blocking);
}

Future<bool> ReentrantCapacityLimiter::acquireFor(TaskIdent task, size_t count, bool blocking) {
    if (m_ledger.contains(task)) {
        // a task that is dropped at the checkpoint records nothing
        if (blocking) {
            co_await AsyncModel::checkpoint();
        }

        if (m_ledger.tryAdd(task, count)) {
            co_return true;
        }
    }

    co_return co_await this->acquireSlotFor(task, count, blocking);
}

void ReentrantCapacityLimiter::asyncRelease(size_t count) {
    checkCount(count);
    this->releaseFor(AsyncModel::current(), count);
}

Future<LimiterGuard> ReentrantCapacityLimiter::asyncScoped(size_t count) {
    checkCount(count);
    return this->scopedFor(count);
}

Future<LimiterGuard> ReentrantCapacityLimiter::scopedFor(size_t count) {
    auto task = AsyncModel::current();
    co_await this->acquireFor(task, count, true);
    co_return LimiterGuard{this, task, count};
}

size_t ReentrantCapacityLimiter::asyncCount() const {
    return m_ledger.count(AsyncModel::current());
}

bool ReentrantCapacityLimiter::greenAcquire(size_t count, bool blocking, std::optional<asp::time::Duration> timeout) {
    checkCount(count);
    return this->acquireBlockingFor(GreenModel::current(), count, blocking, timeout);
}

bool ReentrantCapacityLimiter::acquireBlockingFor(
    TaskIdent task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout
) {
    if (m_ledger.contains(task)) {
        if (blocking) {
            GreenModel::checkpoint();
        }

        if (m_ledger.tryAdd(task, count)) {
            return true;
        }
    }

    return this->acquireSlotBlocking(task, count, blocking, timeout);
}

void ReentrantCapacityLimiter::greenRelease(size_t count) {
    checkCount(count);
    this->releaseFor(GreenModel::current(), count);
}

LimiterGuard ReentrantCapacityLimiter::greenScoped(size_t count) {
    checkCount(count);

    auto task = GreenModel::current();
    this->acquireBlockingFor(task, count, true, std::nullopt);
    return LimiterGuard{this, task, count};
}

size_t ReentrantCapacityLimiter::greenCount() const {
    return m_ledger.count(GreenModel::current());
}

}
