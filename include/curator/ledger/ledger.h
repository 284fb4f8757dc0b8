// CURATOR - Token Ledger Interface
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// The fungible-token ledger the registry settles against. Each account has
// a free balance (spendable) and a locked balance (held as voting rights).

#ifndef CURATOR_LEDGER_LEDGER_H
#define CURATOR_LEDGER_LEDGER_H

#include <curator/core/result.h>
#include <curator/core/types.h>

namespace curator {
namespace ledger {

/**
 * Abstract token ledger.
 *
 * All amounts are non-negative base units. A failed call changes no
 * balance. A zero amount is accepted and changes nothing.
 */
class ILedger {
public:
    virtual ~ILedger() = default;

    /// Free (spendable) balance of an account
    virtual Amount BalanceOf(const AccountId& account) const = 0;

    /// Balance locked for voting
    virtual Amount LockedBalanceOf(const AccountId& account) const = 0;

    /**
     * Move free balance between accounts.
     * Fails with InvalidAmount, InsufficientFunds or AmountOverflow.
     */
    virtual Status Transfer(const AccountId& from, const AccountId& to,
                            Amount amount) = 0;

    /// Move free balance into the locked balance (InsufficientFunds)
    virtual Status Lock(const AccountId& account, Amount amount) = 0;

    /// Move locked balance back to free (InsufficientLockedBalance)
    virtual Status Unlock(const AccountId& account, Amount amount) = 0;
};

} // namespace ledger
} // namespace curator

#endif // CURATOR_LEDGER_LEDGER_H
