// CURATOR - Operation Journal Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/ledger/journal.h>
#include <curator/util/logging.h>

namespace curator {
namespace ledger {

Journal::~Journal() {
    if (!committed_) {
        Rollback();
    }
}

void Journal::Record(UndoFn undo) {
    steps_.push_back(std::move(undo));
}

void Journal::Commit() {
    committed_ = true;
    steps_.clear();
}

void Journal::Rollback() {
    for (auto it = steps_.rbegin(); it != steps_.rend(); ++it) {
        Status status = (*it)();
        if (!status) {
            LOG_ERROR(util::LogCategory::LEDGER)
                << "Undo step failed: " << status.ToString();
        }
    }
    steps_.clear();
}

} // namespace ledger
} // namespace curator
