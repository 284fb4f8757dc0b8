// CURATOR - Token Escrow Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/ledger/escrow.h>

namespace curator {
namespace ledger {

TokenEscrow::TokenEscrow(ILedger& ledger, const AccountId& escrowAccount)
    : ledger_(ledger), account_(escrowAccount) {}

Amount TokenEscrow::Balance() const {
    return ledger_.BalanceOf(account_);
}

Status TokenEscrow::Bond(const AccountId& from, Amount amount, Journal& journal) {
    return Move(from, account_, amount, journal);
}

Status TokenEscrow::Release(const AccountId& to, Amount amount, Journal& journal) {
    return Move(account_, to, amount, journal);
}

Status TokenEscrow::Move(const AccountId& from, const AccountId& to, Amount amount,
                         Journal& journal) {
    if (amount < 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }
    if (amount == 0) {
        return Status::Success();
    }

    Status status = ledger_.Transfer(from, to, amount);
    if (!status) {
        return status;
    }

    ILedger* ledger = &ledger_;
    journal.Record([ledger, from, to, amount]() {
        return ledger->Transfer(to, from, amount);
    });
    return Status::Success();
}

} // namespace ledger
} // namespace curator
