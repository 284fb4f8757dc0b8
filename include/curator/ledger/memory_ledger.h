// CURATOR - In-Memory Token Ledger
// Copyright (c) 2024 CURATOR Developers
// MIT License

#ifndef CURATOR_LEDGER_MEMORY_LEDGER_H
#define CURATOR_LEDGER_MEMORY_LEDGER_H

#include <curator/ledger/ledger.h>

#include <map>
#include <mutex>

namespace curator {
namespace ledger {

/// Balances held by one account
struct AccountBalance {
    Amount free{0};
    Amount locked{0};

    Amount Total() const { return free + locked; }
};

/**
 * Thread-safe ledger kept in a map.
 *
 * Tokens enter through Mint; total supply never exceeds MAX_MONEY.
 */
class MemoryLedger : public ILedger {
public:
    MemoryLedger() = default;

    Amount BalanceOf(const AccountId& account) const override;
    Amount LockedBalanceOf(const AccountId& account) const override;

    Status Transfer(const AccountId& from, const AccountId& to,
                    Amount amount) override;
    Status Lock(const AccountId& account, Amount amount) override;
    Status Unlock(const AccountId& account, Amount amount) override;

    /// Create new tokens in an account
    Status Mint(const AccountId& account, Amount amount);

    /// Sum of all free and locked balances
    Amount TotalSupply() const;

    size_t AccountCount() const;

private:
    mutable std::mutex mutex_;
    std::map<AccountId, AccountBalance> accounts_;
    Amount totalSupply_{0};
};

} // namespace ledger
} // namespace curator

#endif // CURATOR_LEDGER_MEMORY_LEDGER_H
