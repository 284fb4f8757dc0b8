// CURATOR - Error Codes Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/core/result.h>

namespace curator {

const char* ErrorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::Ok: return "Ok";
        case ErrorCode::NoSuchListing: return "NoSuchListing";
        case ErrorCode::ListingAlreadyActive: return "ListingAlreadyActive";
        case ErrorCode::InsufficientDeposit: return "InsufficientDeposit";
        case ErrorCode::AlreadyUnderChallenge: return "AlreadyUnderChallenge";
        case ErrorCode::InsufficientBond: return "InsufficientBond";
        case ErrorCode::NotListingOwner: return "NotListingOwner";
        case ErrorCode::ListingNotWhitelisted: return "ListingNotWhitelisted";
        case ErrorCode::ChallengeNotFound: return "ChallengeNotFound";
        case ErrorCode::RevealPeriodNotOver: return "RevealPeriodNotOver";
        case ErrorCode::AlreadyResolved: return "AlreadyResolved";
        case ErrorCode::ChallengeUnresolved: return "ChallengeUnresolved";
        case ErrorCode::AlreadyClaimed: return "AlreadyClaimed";
        case ErrorCode::VoteDidNotMatchWinner: return "VoteDidNotMatchWinner";
        case ErrorCode::PollNotFound: return "PollNotFound";
        case ErrorCode::RevealMismatch: return "RevealMismatch";
        case ErrorCode::CommitPeriodClosed: return "CommitPeriodClosed";
        case ErrorCode::RevealPeriodNotOpen: return "RevealPeriodNotOpen";
        case ErrorCode::NoCommitmentFound: return "NoCommitmentFound";
        case ErrorCode::AlreadyRevealed: return "AlreadyRevealed";
        case ErrorCode::InsufficientVotingTokens: return "InsufficientVotingTokens";
        case ErrorCode::InsufficientLockedBalance: return "InsufficientLockedBalance";
        case ErrorCode::UnknownParameter: return "UnknownParameter";
        case ErrorCode::InvalidParameterValue: return "InvalidParameterValue";
        case ErrorCode::InsufficientFunds: return "InsufficientFunds";
        case ErrorCode::InvalidAmount: return "InvalidAmount";
        case ErrorCode::AmountOverflow: return "AmountOverflow";
        case ErrorCode::TransferFailed: return "TransferFailed";
        default: return "Unknown";
    }
}

} // namespace curator
