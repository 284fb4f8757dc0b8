// CURATOR - Token Escrow
// Copyright (c) 2024 CURATOR Developers
// MIT License

#ifndef CURATOR_LEDGER_ESCROW_H
#define CURATOR_LEDGER_ESCROW_H

#include <curator/ledger/journal.h>
#include <curator/ledger/ledger.h>

namespace curator {
namespace ledger {

/**
 * Registry-owned ledger account holding bonded deposits and stakes.
 *
 * Every movement registers its compensating transfer in the caller's
 * journal.
 */
class TokenEscrow {
public:
    TokenEscrow(ILedger& ledger, const AccountId& escrowAccount);

    const AccountId& GetAccount() const { return account_; }

    /// Tokens currently held in escrow
    Amount Balance() const;

    /// Move tokens from an account into escrow
    Status Bond(const AccountId& from, Amount amount, Journal& journal);

    /// Pay tokens out of escrow
    Status Release(const AccountId& to, Amount amount, Journal& journal);

private:
    Status Move(const AccountId& from, const AccountId& to, Amount amount,
                Journal& journal);

    ILedger& ledger_;
    AccountId account_;
};

} // namespace ledger
} // namespace curator

#endif // CURATOR_LEDGER_ESCROW_H
