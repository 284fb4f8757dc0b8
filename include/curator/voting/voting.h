// CURATOR - Commit-Reveal Voting Engine
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Token-weighted commit-reveal polls.
//
// Voters lock ledger tokens as voting rights. Committing a ballot reserves
// part of those rights for the poll; reservations across open polls add up
// and can never exceed the voter's rights. A revealed ballot's reservation
// lapses when its poll ends. An unrevealed ballot keeps its reservation
// until the voter rescues it after the reveal window.

#ifndef CURATOR_VOTING_VOTING_H
#define CURATOR_VOTING_VOTING_H

#include <curator/core/result.h>
#include <curator/ledger/ledger.h>
#include <curator/util/time.h>
#include <curator/voting/commitment.h>
#include <curator/voting/poll.h>

#include <map>
#include <mutex>
#include <optional>

namespace curator {
namespace voting {

/// Voting rights held by one voter
struct VoterAccount {
    /// Tokens locked in the ledger for voting
    Amount votingRights{0};

    /// Weight held per poll
    std::map<PollId, Amount> reservations;
};

/**
 * Poll store and vote tallying.
 *
 * Thread-safe. Holds its own mutex while calling the ledger; callers that
 * also hold a lock must take it before calling in.
 */
class VotingEngine {
public:
    VotingEngine(ledger::ILedger& ledger, const ICommitmentScheme& scheme,
                 const util::IClock& clock);

    VotingEngine(const VotingEngine&) = delete;
    VotingEngine& operator=(const VotingEngine&) = delete;

    // ========================================================================
    // Poll Lifecycle
    // ========================================================================

    /**
     * Open a poll whose commit window starts now.
     *
     * @param voteQuorum Percentage (0-100) of revealed tokens "For" to pass
     * @param commitDuration Seconds the commit window stays open
     * @param revealDuration Seconds the reveal window stays open
     * @return Sequential poll id, starting at 1
     */
    PollId StartPoll(int64_t voteQuorum, int64_t commitDuration, int64_t revealDuration);

    /// Remove a poll and drop reservations made against it (rollback)
    Status DiscardPoll(PollId pollId);

    // ========================================================================
    // Voting Rights
    // ========================================================================

    /// Lock free ledger tokens as voting rights
    Status RequestVotingRights(const AccountId& voter, Amount amount);

    /**
     * Unlock voting rights not reserved by any poll.
     * Fails with InvalidAmount or InsufficientLockedBalance.
     */
    Status WithdrawVotingRights(const AccountId& voter, Amount amount);

    // ========================================================================
    // Commit / Reveal
    // ========================================================================

    /**
     * Commit a hidden ballot, replacing any earlier commitment to the same
     * poll. Locks the shortfall from the voter's free balance when the
     * voter's unreserved rights are smaller than weight.
     *
     * Errors: PollNotFound, CommitPeriodClosed, InvalidAmount,
     *         InsufficientVotingTokens
     */
    Status CommitVote(PollId pollId, const AccountId& voter,
                      const Commitment& commitment, Amount weight);

    /**
     * Open a committed ballot and add its weight to the tally.
     *
     * Errors: PollNotFound, RevealPeriodNotOpen, NoCommitmentFound,
     *         AlreadyRevealed, RevealMismatch
     */
    Status RevealVote(PollId pollId, const AccountId& voter,
                      VoteChoice choice, Salt salt);

    /**
     * Release the reservation of a ballot that was never revealed.
     *
     * Errors: PollNotFound, RevealPeriodNotOver, NoCommitmentFound,
     *         AlreadyRevealed
     */
    Status RescueTokens(PollId pollId, const AccountId& voter);

    // ========================================================================
    // Settlement Hooks
    // ========================================================================

    /// Set the ballot's claimed flag (AlreadyClaimed if set)
    Status MarkClaimed(PollId pollId, const AccountId& voter);

    /// Clear the claimed flag during rollback
    Status RevertClaim(PollId pollId, const AccountId& voter);

    // ========================================================================
    // Queries
    // ========================================================================

    bool PollExists(PollId pollId) const;
    std::optional<Poll> GetPoll(PollId pollId) const;
    std::optional<Ballot> GetBallot(PollId pollId, const AccountId& voter) const;

    /// nullopt if the poll is unknown or has not ended
    std::optional<bool> IsPassed(PollId pollId) const;

    /**
     * Revealed weight of a ballot on the winning side.
     *
     * Errors: PollNotFound, RevealPeriodNotOver, VoteDidNotMatchWinner
     *         (no ballot, unrevealed, or losing side), RevealMismatch
     *         (salt does not reproduce the commitment)
     */
    Result<Amount> GetNumPassingTokens(PollId pollId, const AccountId& voter,
                                       Salt salt) const;

    /// Errors: PollNotFound, RevealPeriodNotOver
    Result<Amount> GetTotalNumberOfTokensForWinningOption(PollId pollId) const;

    Amount GetVotingRights(const AccountId& voter) const;

    /// Rights currently reserved by polls
    Amount GetLockedTokens(const AccountId& voter) const;

    bool HasClaimed(PollId pollId, const AccountId& voter) const;

    /// Polls the voter still has a reservation entry for
    size_t GetReservationCount(const AccountId& voter) const;

    size_t PollCount() const;

    /// Voters with an account (rights requested or a vote committed)
    size_t VoterCount() const;

private:
    /// Sum of live reservations, optionally ignoring one poll
    Amount ReservedLocked(const AccountId& voter, const VoterAccount& account,
                          Timestamp now,
                          std::optional<PollId> exclude = std::nullopt) const;

    /// Poll is gone, or the voter revealed and the poll has ended
    bool IsLapsedLocked(const AccountId& voter, PollId pollId, Timestamp now) const;

    /// Drop reservations that no longer hold any weight
    void PruneLapsedLocked(const AccountId& voter, VoterAccount& account, Timestamp now);

    const Poll* FindPollLocked(PollId pollId) const;
    Poll* FindPollLocked(PollId pollId);

    ledger::ILedger& ledger_;
    const ICommitmentScheme& scheme_;
    const util::IClock& clock_;

    mutable std::mutex mutex_;
    std::map<PollId, Poll> polls_;
    std::map<AccountId, VoterAccount> voters_;
    PollId nextPollId_{1};
};

} // namespace voting
} // namespace curator

#endif // CURATOR_VOTING_VOTING_H
