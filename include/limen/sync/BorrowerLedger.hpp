#pragma once

#include <limen/task/Identity.hpp>
#include <asp/sync/Mutex.hpp>

#include <cstddef>
#include <map>
#include <unordered_map>

namespace limen {

/// Records which tasks hold a slot of a capacity limiter and how many logical units each holds.
/// A task has an entry exactly while it occupies one slot, and its count is never zero.
///
/// All checks and mutations shared by both limiter variants and both scheduling models live here,
/// every method validates before mutating so a throwing call leaves the ledger untouched.
class BorrowerLedger {
public:
    using Snapshot = std::map<TaskIdent, size_t>;

    BorrowerLedger() = default;
    BorrowerLedger(const BorrowerLedger&) = delete;
    BorrowerLedger& operator=(const BorrowerLedger&) = delete;

    /// Throws ReentrancyError if the task already has an entry.
    void ensureAbsent(const TaskIdent& task) const;

    /// Records a freshly acquired slot with an initial count.
    void insert(const TaskIdent& task, size_t count);

    /// Adds `count` units to an existing entry, returns false if the task has none.
    bool tryAdd(const TaskIdent& task, size_t count);

    /// Removes `count` units from the task's entry.
    /// Returns true if the entry was exhausted and removed, meaning the slot must be freed.
    /// Throws NotHoldingError if there's no entry and OverReleaseError if `count` exceeds the held count.
    bool release(const TaskIdent& task, size_t count);

    bool contains(const TaskIdent& task) const;

    /// Units held by the task, 0 if it holds none.
    size_t count(const TaskIdent& task) const;

    /// Number of distinct holders.
    size_t size() const;

    Snapshot snapshot() const;

private:
    mutable asp::Mutex<std::unordered_map<TaskIdent, size_t>> m_entries;
};

}
