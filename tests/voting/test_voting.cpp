// CURATOR - Voting Engine Tests
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <gtest/gtest.h>

#include <curator/crypto/hash.h>
#include <curator/ledger/memory_ledger.h>
#include <curator/util/time.h>
#include <curator/voting/voting.h>

namespace curator {
namespace voting {
namespace test {

constexpr int64_t COMMIT_LEN = 600;
constexpr int64_t REVEAL_LEN = 600;

class VotingTest : public ::testing::Test {
protected:
    void SetUp() override {
        alice_ = AccountIdFromName("alice");
        bob_ = AccountIdFromName("bob");
        ASSERT_TRUE(ledger_.Mint(alice_, 1000));
        ASSERT_TRUE(ledger_.Mint(bob_, 1000));
    }

    PollId Start(int64_t quorum = 50) {
        return engine_.StartPoll(quorum, COMMIT_LEN, REVEAL_LEN);
    }

    Status Commit(PollId pollId, const AccountId& voter, VoteChoice choice,
                  Amount weight, Salt salt) {
        return engine_.CommitVote(pollId, voter, scheme_.Compute(choice, weight, salt),
                                  weight);
    }

    void ToReveal() { clock_.Advance(COMMIT_LEN + 1); }
    void ToEnd() { clock_.Advance(REVEAL_LEN + 1); }

    ledger::MemoryLedger ledger_;
    Sha256CommitmentScheme scheme_;
    util::MockClock clock_{1000};
    VotingEngine engine_{ledger_, scheme_, clock_};
    AccountId alice_;
    AccountId bob_;
};

// ============================================================================
// Poll Lifecycle
// ============================================================================

TEST_F(VotingTest, StartPollAssignsSequentialIds) {
    EXPECT_EQ(Start(), 1u);
    EXPECT_EQ(Start(), 2u);
    EXPECT_EQ(engine_.PollCount(), 2u);

    auto poll = engine_.GetPoll(1);
    ASSERT_TRUE(poll.has_value());
    EXPECT_EQ(poll->commitEndTime, 1000 + COMMIT_LEN);
    EXPECT_EQ(poll->revealEndTime, 1000 + COMMIT_LEN + REVEAL_LEN);
    EXPECT_EQ(poll->voteQuorum, 50);
}

TEST_F(VotingTest, DiscardLastPollReusesId) {
    PollId first = Start();
    PollId second = Start();
    ASSERT_TRUE(engine_.DiscardPoll(second));
    EXPECT_FALSE(engine_.PollExists(second));
    EXPECT_EQ(Start(), second);

    EXPECT_EQ(engine_.DiscardPoll(99).GetError(), ErrorCode::PollNotFound);
    EXPECT_TRUE(engine_.PollExists(first));
}

// ============================================================================
// Voting Rights
// ============================================================================

TEST_F(VotingTest, RequestAndWithdrawRights) {
    ASSERT_TRUE(engine_.RequestVotingRights(alice_, 400));
    EXPECT_EQ(engine_.GetVotingRights(alice_), 400);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 600);
    EXPECT_EQ(ledger_.LockedBalanceOf(alice_), 400);

    ASSERT_TRUE(engine_.WithdrawVotingRights(alice_, 150));
    EXPECT_EQ(engine_.GetVotingRights(alice_), 250);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 750);
}

TEST_F(VotingTest, RequestRightsFailures) {
    EXPECT_EQ(engine_.RequestVotingRights(alice_, 0).GetError(), ErrorCode::InvalidAmount);
    EXPECT_EQ(engine_.RequestVotingRights(alice_, 1001).GetError(),
              ErrorCode::InsufficientFunds);
    EXPECT_EQ(engine_.GetVotingRights(alice_), 0);

    // A failed request leaves no account behind
    EXPECT_EQ(engine_.VoterCount(), 0u);

    EXPECT_EQ(engine_.WithdrawVotingRights(alice_, 1).GetError(),
              ErrorCode::InsufficientLockedBalance);
    EXPECT_EQ(engine_.WithdrawVotingRights(alice_, -1).GetError(),
              ErrorCode::InvalidAmount);
}

// ============================================================================
// Commit
// ============================================================================

TEST_F(VotingTest, CommitLocksShortfall) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 1));

    EXPECT_EQ(engine_.GetVotingRights(alice_), 500);
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 500);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 500);

    auto ballot = engine_.GetBallot(poll, alice_);
    ASSERT_TRUE(ballot.has_value());
    EXPECT_EQ(ballot->weight, 500);
    EXPECT_FALSE(ballot->IsRevealed());
}

TEST_F(VotingTest, CommitUsesExistingRightsFirst) {
    ASSERT_TRUE(engine_.RequestVotingRights(alice_, 300));
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 200, 1));

    EXPECT_EQ(engine_.GetVotingRights(alice_), 300);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 700);

    // Reserved weight cannot be withdrawn
    EXPECT_EQ(engine_.WithdrawVotingRights(alice_, 101).GetError(),
              ErrorCode::InsufficientLockedBalance);
    EXPECT_TRUE(engine_.WithdrawVotingRights(alice_, 100));
}

TEST_F(VotingTest, SameRightsBackSeveralPolls) {
    ASSERT_TRUE(engine_.RequestVotingRights(alice_, 300));
    PollId first = Start();
    PollId second = Start();
    ASSERT_TRUE(Commit(first, alice_, VoteChoice::For, 200, 1));
    ASSERT_TRUE(Commit(second, alice_, VoteChoice::For, 200, 2));

    // Reservations add up; 100 extra tokens had to be locked
    EXPECT_EQ(engine_.GetVotingRights(alice_), 400);
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 400);
}

TEST_F(VotingTest, RecommitReplacesReservation) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 1));
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::Against, 300, 2));

    EXPECT_EQ(engine_.GetLockedTokens(alice_), 300);
    EXPECT_EQ(engine_.GetVotingRights(alice_), 500);
    EXPECT_EQ(engine_.GetBallot(poll, alice_)->weight, 300);
}

TEST_F(VotingTest, CommitFailures) {
    PollId poll = Start();
    EXPECT_EQ(Commit(99, alice_, VoteChoice::For, 1, 1).GetError(),
              ErrorCode::PollNotFound);
    EXPECT_EQ(Commit(poll, alice_, VoteChoice::For, 0, 1).GetError(),
              ErrorCode::InvalidAmount);
    EXPECT_EQ(Commit(poll, alice_, VoteChoice::For, 1001, 1).GetError(),
              ErrorCode::InsufficientVotingTokens);
    EXPECT_EQ(ledger_.BalanceOf(alice_), 1000);

    ToReveal();
    EXPECT_EQ(Commit(poll, alice_, VoteChoice::For, 1, 1).GetError(),
              ErrorCode::CommitPeriodClosed);
}

// ============================================================================
// Reveal
// ============================================================================

TEST_F(VotingTest, RevealTalliesVotes) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 11));
    ASSERT_TRUE(Commit(poll, bob_, VoteChoice::Against, 200, 22));

    EXPECT_EQ(engine_.RevealVote(poll, alice_, VoteChoice::For, 11).GetError(),
              ErrorCode::RevealPeriodNotOpen);

    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(poll, alice_, VoteChoice::For, 11));
    ASSERT_TRUE(engine_.RevealVote(poll, bob_, VoteChoice::Against, 22));

    auto state = engine_.GetPoll(poll);
    EXPECT_EQ(state->votesFor, 500);
    EXPECT_EQ(state->votesAgainst, 200);

    // Result is unknown until the reveal window closes
    EXPECT_FALSE(engine_.IsPassed(poll).has_value());
    ToEnd();
    EXPECT_EQ(engine_.IsPassed(poll), true);
    EXPECT_EQ(*engine_.GetTotalNumberOfTokensForWinningOption(poll), 500);
}

TEST_F(VotingTest, RevealFailures) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 11));
    ToReveal();

    EXPECT_EQ(engine_.RevealVote(poll, bob_, VoteChoice::For, 11).GetError(),
              ErrorCode::NoCommitmentFound);
    EXPECT_EQ(engine_.RevealVote(poll, alice_, VoteChoice::Against, 11).GetError(),
              ErrorCode::RevealMismatch);
    EXPECT_EQ(engine_.RevealVote(poll, alice_, VoteChoice::For, 12).GetError(),
              ErrorCode::RevealMismatch);

    ASSERT_TRUE(engine_.RevealVote(poll, alice_, VoteChoice::For, 11));
    EXPECT_EQ(engine_.RevealVote(poll, alice_, VoteChoice::For, 11).GetError(),
              ErrorCode::AlreadyRevealed);

    ToEnd();
    EXPECT_EQ(engine_.RevealVote(poll, alice_, VoteChoice::For, 11).GetError(),
              ErrorCode::RevealPeriodNotOpen);
}

TEST_F(VotingTest, RevealedWeightReleasedAfterPoll) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 11));
    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(poll, alice_, VoteChoice::For, 11));
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 500);

    ToEnd();
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 0);
    ASSERT_TRUE(engine_.WithdrawVotingRights(alice_, 500));
    EXPECT_EQ(ledger_.BalanceOf(alice_), 1000);
}

TEST_F(VotingTest, LapsedReservationsArePruned) {
    PollId first = Start();
    ASSERT_TRUE(Commit(first, alice_, VoteChoice::For, 300, 1));
    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(first, alice_, VoteChoice::For, 1));
    ToEnd();
    EXPECT_EQ(engine_.GetReservationCount(alice_), 1u);

    // Committing elsewhere drops the revealed, ended poll
    PollId second = Start();
    ASSERT_TRUE(Commit(second, alice_, VoteChoice::Against, 200, 2));
    EXPECT_EQ(engine_.GetReservationCount(alice_), 1u);
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 200);

    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(second, alice_, VoteChoice::Against, 2));
    ToEnd();
    ASSERT_TRUE(engine_.WithdrawVotingRights(alice_, 100));
    EXPECT_EQ(engine_.GetReservationCount(alice_), 0u);
    EXPECT_EQ(engine_.GetVotingRights(alice_), 200);
}

TEST_F(VotingTest, UnrevealedReservationsAreKept) {
    PollId first = Start();
    ASSERT_TRUE(Commit(first, alice_, VoteChoice::For, 300, 1));
    ToReveal();
    ToEnd();

    PollId second = Start();
    ASSERT_TRUE(Commit(second, alice_, VoteChoice::For, 100, 2));
    EXPECT_EQ(engine_.GetReservationCount(alice_), 2u);
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 400);
}

// ============================================================================
// Rescue
// ============================================================================

TEST_F(VotingTest, RescueUnrevealedTokens) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 11));

    EXPECT_EQ(engine_.RescueTokens(poll, alice_).GetError(),
              ErrorCode::RevealPeriodNotOver);

    ToReveal();
    ToEnd();

    // Unrevealed weight stays reserved until rescued
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 500);
    ASSERT_TRUE(engine_.RescueTokens(poll, alice_));
    EXPECT_EQ(engine_.GetLockedTokens(alice_), 0);
    EXPECT_TRUE(engine_.GetBallot(poll, alice_)->rescued);

    EXPECT_EQ(engine_.RescueTokens(poll, alice_).GetError(),
              ErrorCode::NoCommitmentFound);
    EXPECT_EQ(engine_.RescueTokens(poll, bob_).GetError(),
              ErrorCode::NoCommitmentFound);
}

TEST_F(VotingTest, RescueRevealedFails) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 11));
    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(poll, alice_, VoteChoice::For, 11));
    ToEnd();
    EXPECT_EQ(engine_.RescueTokens(poll, alice_).GetError(), ErrorCode::AlreadyRevealed);
}

// ============================================================================
// Passing Tokens / Claims
// ============================================================================

TEST_F(VotingTest, NumPassingTokens) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::Against, 500, 420));
    ASSERT_TRUE(Commit(poll, bob_, VoteChoice::For, 100, 7));

    EXPECT_EQ(engine_.GetNumPassingTokens(poll, alice_, 420).GetError(),
              ErrorCode::RevealPeriodNotOver);

    ToReveal();
    ASSERT_TRUE(engine_.RevealVote(poll, alice_, VoteChoice::Against, 420));
    ASSERT_TRUE(engine_.RevealVote(poll, bob_, VoteChoice::For, 7));
    ToEnd();

    EXPECT_EQ(*engine_.GetNumPassingTokens(poll, alice_, 420), 500);
    EXPECT_EQ(engine_.GetNumPassingTokens(poll, alice_, 421).GetError(),
              ErrorCode::RevealMismatch);
    EXPECT_EQ(engine_.GetNumPassingTokens(poll, bob_, 7).GetError(),
              ErrorCode::VoteDidNotMatchWinner);
    EXPECT_EQ(engine_.GetNumPassingTokens(99, alice_, 420).GetError(),
              ErrorCode::PollNotFound);
}

TEST_F(VotingTest, MarkClaimedOnce) {
    PollId poll = Start();
    ASSERT_TRUE(Commit(poll, alice_, VoteChoice::For, 500, 1));

    EXPECT_FALSE(engine_.HasClaimed(poll, alice_));
    ASSERT_TRUE(engine_.MarkClaimed(poll, alice_));
    EXPECT_TRUE(engine_.HasClaimed(poll, alice_));
    EXPECT_EQ(engine_.MarkClaimed(poll, alice_).GetError(), ErrorCode::AlreadyClaimed);

    ASSERT_TRUE(engine_.RevertClaim(poll, alice_));
    EXPECT_FALSE(engine_.HasClaimed(poll, alice_));

    EXPECT_EQ(engine_.MarkClaimed(poll, bob_).GetError(), ErrorCode::NoCommitmentFound);
}

} // namespace test
} // namespace voting
} // namespace curator
