// CURATOR - In-Memory Token Ledger Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/ledger/memory_ledger.h>
#include <curator/core/amount.h>
#include <curator/util/logging.h>

namespace curator {
namespace ledger {

Amount MemoryLedger::BalanceOf(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.free;
}

Amount MemoryLedger::LockedBalanceOf(const AccountId& account) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = accounts_.find(account);
    return it == accounts_.end() ? 0 : it->second.locked;
}

Status MemoryLedger::Transfer(const AccountId& from, const AccountId& to,
                              Amount amount) {
    if (amount < 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    if (amount == 0) {
        return Status::Success();
    }

    auto fromIt = accounts_.find(from);
    if (fromIt == accounts_.end() || fromIt->second.free < amount) {
        LOG_DEBUG(util::LogCategory::LEDGER)
            << "Transfer of " << amount << " from " << from.ToShortHex()
            << " rejected: insufficient funds";
        return Status::Failure(ErrorCode::InsufficientFunds);
    }

    if (from == to) {
        return Status::Success();
    }

    Amount toFree = 0;
    auto toIt = accounts_.find(to);
    if (toIt != accounts_.end()) {
        toFree = toIt->second.free;
    }
    auto credited = CheckedAdd(toFree, amount);
    if (!credited) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    fromIt->second.free -= amount;
    accounts_[to].free = *credited;

    LOG_TRACE(util::LogCategory::LEDGER)
        << "Transfer " << FormatAmount(amount) << " "
        << from.ToShortHex() << " -> " << to.ToShortHex();
    return Status::Success();
}

Status MemoryLedger::Lock(const AccountId& account, Amount amount) {
    if (amount < 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        return Status::Success();
    }

    auto it = accounts_.find(account);
    if (it == accounts_.end() || it->second.free < amount) {
        return Status::Failure(ErrorCode::InsufficientFunds);
    }

    it->second.free -= amount;
    it->second.locked += amount;
    return Status::Success();
}

Status MemoryLedger::Unlock(const AccountId& account, Amount amount) {
    if (amount < 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);
    if (amount == 0) {
        return Status::Success();
    }

    auto it = accounts_.find(account);
    if (it == accounts_.end() || it->second.locked < amount) {
        return Status::Failure(ErrorCode::InsufficientLockedBalance);
    }

    it->second.locked -= amount;
    it->second.free += amount;
    return Status::Success();
}

Status MemoryLedger::Mint(const AccountId& account, Amount amount) {
    if (amount <= 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto supply = CheckedAdd(totalSupply_, amount);
    if (!supply || !MoneyRange(*supply)) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    accounts_[account].free += amount;
    totalSupply_ = *supply;

    LOG_DEBUG(util::LogCategory::LEDGER)
        << "Minted " << FormatAmount(amount) << " to " << account.ToShortHex();
    return Status::Success();
}

Amount MemoryLedger::TotalSupply() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return totalSupply_;
}

size_t MemoryLedger::AccountCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return accounts_.size();
}

} // namespace ledger
} // namespace curator
