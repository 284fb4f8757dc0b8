// CURATOR - Operation Journal
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Records how to undo each step of a multi-step operation so that a
// failure part way through leaves no trace.

#ifndef CURATOR_LEDGER_JOURNAL_H
#define CURATOR_LEDGER_JOURNAL_H

#include <curator/core/result.h>

#include <functional>
#include <vector>

namespace curator {
namespace ledger {

/**
 * Undo log for one operation.
 *
 * Steps are undone in reverse order of recording. A journal that goes out
 * of scope without Commit() rolls back.
 *
 *   Journal journal;
 *   ... mutate, journal.Record(undo) ...
 *   if (!status) return status;   // rolled back here
 *   journal.Commit();
 */
class Journal {
public:
    /// Undo step; a failing step is logged and the remaining steps still run
    using UndoFn = std::function<Status()>;

    Journal() = default;
    ~Journal();

    Journal(const Journal&) = delete;
    Journal& operator=(const Journal&) = delete;

    void Record(UndoFn undo);

    /// Keep every recorded step
    void Commit();

    /// Undo every recorded step now
    void Rollback();

    bool IsCommitted() const { return committed_; }
    size_t Size() const { return steps_.size(); }

private:
    std::vector<UndoFn> steps_;
    bool committed_{false};
};

} // namespace ledger
} // namespace curator

#endif // CURATOR_LEDGER_JOURNAL_H
