// CURATOR - Polls and Ballots
// Copyright (c) 2024 CURATOR Developers
// MIT License

#ifndef CURATOR_VOTING_POLL_H
#define CURATOR_VOTING_POLL_H

#include <curator/core/types.h>
#include <curator/voting/commitment.h>

#include <map>
#include <optional>
#include <string>

namespace curator {
namespace voting {

/// Poll stage relative to a point in time
enum class PollStage {
    Commit,     // now < commitEndTime
    Reveal,     // commitEndTime <= now < revealEndTime
    Ended,      // now >= revealEndTime
};

const char* PollStageToString(PollStage stage);

// ============================================================================
// Ballot
// ============================================================================

/// One voter's participation in one poll
struct Ballot {
    Commitment commitment;

    /// Tokens reserved at commit
    Amount weight{0};

    std::optional<VoteChoice> revealedChoice;
    std::optional<Amount> revealedWeight;

    /// Reward collected (set at most once)
    bool claimed{false};

    /// Unrevealed weight released after the reveal window
    bool rescued{false};

    bool IsRevealed() const { return revealedChoice.has_value(); }
};

// ============================================================================
// Poll
// ============================================================================

struct Poll {
    PollId id{0};

    /// Percentage of revealed tokens "For" needed to pass
    int64_t voteQuorum{50};

    Timestamp commitEndTime{0};
    Timestamp revealEndTime{0};

    Amount votesFor{0};
    Amount votesAgainst{0};

    std::map<AccountId, Ballot> ballots;

    PollStage GetStage(Timestamp now) const;

    bool IsCommitOpen(Timestamp now) const { return now < commitEndTime; }
    bool IsRevealOpen(Timestamp now) const {
        return now >= commitEndTime && now < revealEndTime;
    }
    bool HasEnded(Timestamp now) const { return now >= revealEndTime; }

    /**
     * votesFor > votesAgainst and
     * 100 * votesFor > voteQuorum * (votesFor + votesAgainst)
     *
     * A tie, including no revealed votes at all, does not pass at any quorum.
     */
    bool IsPassed() const;

    /// For if passed, else Against
    VoteChoice WinningChoice() const;

    /// Revealed weight on the winning side
    Amount TotalWinningTokens() const;

    std::string ToString() const;
};

} // namespace voting
} // namespace curator

#endif // CURATOR_VOTING_POLL_H
