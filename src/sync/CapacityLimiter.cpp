#include <limen/sync/CapacityLimiter.hpp>
#include <limen/util/Trace.hpp>

#include <stdexcept>
#include <utility>

namespace limen {

static size_t checkTotalTokens(std::optional<int64_t> totalTokens) {
    int64_t total = totalTokens.value_or(1);
    if (total < 0) {
        throw std::invalid_argument("total_tokens must be >= 0");
    }

    return static_cast<size_t>(total);
}

static std::unique_ptr<Semaphore> makeSlots(size_t totalTokens) {
    if (totalTokens >= 2) {
        return std::make_unique<Semaphore>(totalTokens, totalTokens);
    }

    return std::make_unique<BinarySemaphore>(totalTokens);
}

CapacityLimiter::CapacityLimiter(std::optional<int64_t> totalTokens)
    : CapacityLimiter(totalTokens, "limen::CapacityLimiter") {}

CapacityLimiter::CapacityLimiter(std::optional<int64_t> totalTokens, std::string_view typeName)
    : m_totalTokens(checkTotalTokens(totalTokens)),
      m_typeName(typeName),
      m_slots(makeSlots(m_totalTokens)) {}

Future<bool> CapacityLimiter::acquireSlotFor(TaskIdent task, size_t count, bool blocking) {
    m_ledger.ensureAbsent(task);

    if (blocking) {
        // if this future is dropped while waiting, the awaiter gives back its place or its permit
        co_await m_slots->acquire();
    } else if (!m_slots->tryAcquire()) {
        co_return false;
    }

    m_ledger.insert(task, count);
    co_return true;
}

bool CapacityLimiter::acquireSlotBlocking(
    const TaskIdent& task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout
) {
    m_ledger.ensureAbsent(task);

    bool acquired = blocking ? m_slots->acquireBlocking(timeout) : m_slots->tryAcquire();
    if (!acquired) {
        return false;
    }

    m_ledger.insert(task, count);
    return true;
}

Future<bool> CapacityLimiter::acquireFor(TaskIdent task, size_t count, bool blocking) {
    return this->acquireSlotFor(task, count, blocking);
}

bool CapacityLimiter::acquireBlockingFor(
    TaskIdent task, size_t count, bool blocking, std::optional<asp::time::Duration> timeout
) {
    return this->acquireSlotBlocking(task, count, blocking, timeout);
}

void CapacityLimiter::releaseFor(const TaskIdent& task, size_t count) {
    if (m_ledger.release(task, count)) {
        m_slots->release();
    }
}

Future<bool> CapacityLimiter::asyncAcquire(bool blocking) {
    co_return co_await this->acquireFor(AsyncModel::current(), 1, blocking);
}

void CapacityLimiter::asyncRelease() {
    this->releaseFor(AsyncModel::current(), 1);
}

bool CapacityLimiter::asyncBorrowed() const {
    return this->borrowedAs<AsyncModel>();
}

Future<LimiterGuard> CapacityLimiter::asyncScoped() {
    auto task = AsyncModel::current();
    co_await this->acquireFor(task, 1, true);
    co_return LimiterGuard{this, task, 1};
}

bool CapacityLimiter::greenAcquire(bool blocking, std::optional<asp::time::Duration> timeout) {
    return this->acquireBlockingFor(GreenModel::current(), 1, blocking, timeout);
}

void CapacityLimiter::greenRelease() {
    this->releaseFor(GreenModel::current(), 1);
}

bool CapacityLimiter::greenBorrowed() const {
    return this->borrowedAs<GreenModel>();
}

LimiterGuard CapacityLimiter::greenScoped() {
    auto task = GreenModel::current();
    this->acquireBlockingFor(task, 1, true, std::nullopt);
    return LimiterGuard{this, task, 1};
}

size_t CapacityLimiter::availableTokens() const noexcept {
    return m_slots->value();
}

size_t CapacityLimiter::borrowedTokens() const {
    // one slot per holder, regardless of how many units a reentrant holder has
    return m_totalTokens - this->availableTokens();
}

size_t CapacityLimiter::waiting() const {
    return m_slots->waiting();
}

BorrowerLedger::Snapshot CapacityLimiter::borrowers() const {
    return m_ledger.snapshot();
}

CapacityLimiter::operator bool() const {
    return this->borrowedTokens() != 0;
}

std::string CapacityLimiter::toString() const {
    size_t available = this->availableTokens();

    if (available == 0) {
        return fmt::format(
            "<{}({}) at {} [available_tokens=0, waiting={}]>",
            m_typeName, m_totalTokens, fmt::ptr(this), this->waiting()
        );
    }

    return fmt::format(
        "<{}({}) at {} [available_tokens={}]>",
        m_typeName, m_totalTokens, fmt::ptr(this), available
    );
}

LimiterGuard::LimiterGuard(LimiterGuard&& other) noexcept
    : m_limiter(std::exchange(other.m_limiter, nullptr)), m_task(other.m_task), m_count(other.m_count) {}

LimiterGuard& LimiterGuard::operator=(LimiterGuard&& other) noexcept {
    if (this != &other) {
        this->releaseQuietly();

        m_limiter = std::exchange(other.m_limiter, nullptr);
        m_task = other.m_task;
        m_count = other.m_count;
    }

    return *this;
}

LimiterGuard::~LimiterGuard() {
    this->releaseQuietly();
}

void LimiterGuard::releaseQuietly() noexcept {
    if (!m_limiter) return;

    try {
        m_limiter->releaseFor(m_task, m_count);
    } catch (const LimiterError& e) {
        // the token was already released by hand
        printWarn("[LimiterGuard] failed to release token of {}: {}", m_task, e.what());
    }
}

void LimiterGuard::release() {
    if (auto limiter = std::exchange(m_limiter, nullptr)) {
        limiter->releaseFor(m_task, m_count);
    }
}

}
