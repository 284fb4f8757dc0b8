// CURATOR - Error Codes and Operation Results
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Every state-changing operation returns a Status or a Result<T>. A failed
// operation carries exactly one ErrorCode and has left all state untouched.

#ifndef CURATOR_CORE_RESULT_H
#define CURATOR_CORE_RESULT_H

#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

namespace curator {

// ============================================================================
// Error Codes
// ============================================================================

enum class ErrorCode {
    Ok = 0,

    // Listing lifecycle
    NoSuchListing,
    ListingAlreadyActive,
    InsufficientDeposit,
    AlreadyUnderChallenge,
    InsufficientBond,
    NotListingOwner,
    ListingNotWhitelisted,

    // Resolution and settlement
    ChallengeNotFound,
    RevealPeriodNotOver,
    AlreadyResolved,
    ChallengeUnresolved,
    AlreadyClaimed,
    VoteDidNotMatchWinner,

    // Voting
    PollNotFound,
    RevealMismatch,
    CommitPeriodClosed,
    RevealPeriodNotOpen,
    NoCommitmentFound,
    AlreadyRevealed,
    InsufficientVotingTokens,
    InsufficientLockedBalance,

    // Parameters
    UnknownParameter,
    InvalidParameterValue,

    // Ledger
    InsufficientFunds,
    InvalidAmount,
    AmountOverflow,
    TransferFailed,
};

/// Convert error code to string
const char* ErrorCodeToString(ErrorCode code);

// ============================================================================
// Status
// ============================================================================

/// Outcome of an operation that produces no value
class Status {
public:
    Status() = default;

    static Status Success() { return Status(); }

    static Status Failure(ErrorCode code) { return Status(code); }

    bool IsOk() const { return code_ == ErrorCode::Ok; }
    explicit operator bool() const { return IsOk(); }

    ErrorCode GetError() const { return code_; }

    std::string ToString() const { return ErrorCodeToString(code_); }

private:
    explicit Status(ErrorCode code) : code_(code) {}

    ErrorCode code_{ErrorCode::Ok};
};

// ============================================================================
// Result
// ============================================================================

/// Outcome of an operation that produces a value on success
template<typename T>
class Result {
public:
    static Result Success(T value) {
        Result r;
        r.value_ = std::move(value);
        return r;
    }

    static Result Failure(ErrorCode code) {
        Result r;
        r.code_ = code;
        return r;
    }

    /// Propagate the error of a failed Status
    static Result Failure(const Status& status) {
        return Failure(status.GetError());
    }

    bool IsOk() const { return code_ == ErrorCode::Ok; }
    explicit operator bool() const { return IsOk(); }

    ErrorCode GetError() const { return code_; }

    /// Access the value, throws std::logic_error on a failed result
    const T& Value() const {
        if (!value_) {
            throw std::logic_error(std::string("Result has no value: ") +
                                   ErrorCodeToString(code_));
        }
        return *value_;
    }

    const T& operator*() const { return Value(); }
    const T* operator->() const { return &Value(); }

    /// Value or fallback when failed
    T ValueOr(T fallback) const { return value_ ? *value_ : fallback; }

    /// Drop the value, keep the outcome
    Status ToStatus() const {
        return IsOk() ? Status::Success() : Status::Failure(code_);
    }

private:
    Result() = default;

    std::optional<T> value_;
    ErrorCode code_{ErrorCode::Ok};
};

} // namespace curator

#endif // CURATOR_CORE_RESULT_H
