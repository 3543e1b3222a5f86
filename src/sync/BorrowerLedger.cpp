#include <limen/sync/BorrowerLedger.hpp>
#include <limen/sync/LimiterError.hpp>
#include <limen/util/Assert.hpp>
#include <limen/util/Trace.hpp>

namespace limen {

void BorrowerLedger::ensureAbsent(const TaskIdent& task) const {
    if (m_entries.lock()->contains(task)) {
        throw ReentrancyError();
    }
}

void BorrowerLedger::insert(const TaskIdent& task, size_t count) {
    LIMEN_DEBUG_ASSERT(count > 0, "{} recorded with no units", task);

    auto entries = m_entries.lock();
    auto [_, inserted] = entries->emplace(task, count);
    LIMEN_ASSERT(inserted, "{} already has a ledger entry", task);

    trace("[Ledger] {} took a slot with {} units", task, count);
}

bool BorrowerLedger::tryAdd(const TaskIdent& task, size_t count) {
    auto entries = m_entries.lock();
    auto it = entries->find(task);
    if (it == entries->end()) {
        return false;
    }

    it->second += count;
    return true;
}

bool BorrowerLedger::release(const TaskIdent& task, size_t count) {
    auto entries = m_entries.lock();
    auto it = entries->find(task);

    if (it == entries->end()) {
        throw NotHoldingError();
    }

    if (count > it->second) {
        throw OverReleaseError();
    }

    it->second -= count;
    if (it->second != 0) {
        return false;
    }

    entries->erase(it);
    trace("[Ledger] {} gave up its slot", task);
    return true;
}

bool BorrowerLedger::contains(const TaskIdent& task) const {
    return m_entries.lock()->contains(task);
}

size_t BorrowerLedger::count(const TaskIdent& task) const {
    auto entries = m_entries.lock();
    auto it = entries->find(task);
    return it == entries->end() ? 0 : it->second;
}

size_t BorrowerLedger::size() const {
    return m_entries.lock()->size();
}

BorrowerLedger::Snapshot BorrowerLedger::snapshot() const {
    auto entries = m_entries.lock();
    return Snapshot(entries->begin(), entries->end());
}

}
