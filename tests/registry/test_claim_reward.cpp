// CURATOR - Reward Claim Tests
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include "registry_fixture.h"

namespace curator {
namespace registry {
namespace test {

using voting::VoteChoice;

// ============================================================================
// Test Fixtures
// ============================================================================

class ClaimRewardTest : public RegistryTestBase {
protected:
    static constexpr Amount ALICE_VOTES = 500 * COIN;
    static constexpr voting::Salt ALICE_SALT = 420;

    // Apply, challenge, and have Alice vote Against; returns the challenge id
    ChallengeId ChallengeWithAliceAgainst(const std::string& name) {
        ListingHash listing = ListingHashFromName(name);
        EXPECT_TRUE(registry_->Apply(listing, applicant_, MinDeposit()));

        auto id = registry_->CreateChallenge(listing, challenger_, MinDeposit());
        EXPECT_TRUE(id.IsOk());
        EXPECT_TRUE(Vote(*id, alice_, VoteChoice::Against, ALICE_VOTES, ALICE_SALT));
        return *id;
    }

    void RevealAndResolve(ChallengeId id, const std::string& name) {
        PassCommitStage();
        ASSERT_TRUE(voting_.RevealVote(id, alice_, VoteChoice::Against, ALICE_SALT));
        PassRevealStage();
        ASSERT_TRUE(registry_->UpdateStatus(ListingHashFromName(name), alice_));
    }
};

// ============================================================================
// Claiming
// ============================================================================

TEST_F(ClaimRewardTest, VoterClaimsRewardAndInflation) {
    ChallengeId id = ChallengeWithAliceAgainst("claimthis.net");

    EXPECT_EQ(ledger_.BalanceOf(applicant_), START_BALANCE - MinDeposit());
    EXPECT_EQ(ledger_.BalanceOf(alice_), START_BALANCE - ALICE_VOTES);

    RevealAndResolve(id, "claimthis.net");

    auto voterReward = registry_->VoterReward(id, alice_, ALICE_SALT);
    auto inflationReward = registry_->VoterInflationReward(id, alice_, ALICE_SALT);
    ASSERT_TRUE(voterReward.IsOk());
    ASSERT_TRUE(inflationReward.IsOk());
    EXPECT_EQ(*voterReward, MinDeposit() / 2);
    EXPECT_EQ(*inflationReward, 10 * COIN);

    auto paid = registry_->ClaimReward(id, alice_, ALICE_SALT);
    ASSERT_TRUE(paid.IsOk());
    EXPECT_EQ(*paid, *voterReward + *inflationReward);
    EXPECT_TRUE(registry_->TokenClaims(id, alice_));
    EXPECT_EQ(registry_->GetChallenge(id)->claimedAmount, *paid);

    ASSERT_TRUE(voting_.WithdrawVotingRights(alice_, ALICE_VOTES));
    EXPECT_EQ(ledger_.BalanceOf(alice_), START_BALANCE + *voterReward + *inflationReward);

    // Every token in escrow has been paid out
    EXPECT_EQ(registry_->GetEscrowBalance(), 0);
}

TEST_F(ClaimRewardTest, SupplyIsConserved) {
    ChallengeId id = ChallengeWithAliceAgainst("conserve.net");
    Amount supply = ledger_.TotalSupply();

    RevealAndResolve(id, "conserve.net");
    ASSERT_TRUE(registry_->ClaimReward(id, alice_, ALICE_SALT).IsOk());

    EXPECT_EQ(ledger_.TotalSupply(), supply);
    Amount total = 0;
    for (const AccountId* account :
         {&applicant_, &challenger_, &alice_, &bob_, &carol_, &escrow_, &reserve_}) {
        total += ledger_.BalanceOf(*account) + ledger_.LockedBalanceOf(*account);
    }
    EXPECT_EQ(total, supply);
}

TEST_F(ClaimRewardTest, RewardsSplitByWeight) {
    ListingHash listing = ListingHashFromName("split.net");
    Whitelist(listing);
    auto id = registry_->CreateChallenge(listing, challenger_, MinDeposit());
    ASSERT_TRUE(id.IsOk());

    ASSERT_TRUE(Vote(*id, alice_, VoteChoice::Against, 300 * COIN, 1));
    ASSERT_TRUE(Vote(*id, carol_, VoteChoice::Against, 100 * COIN, 2));
    ASSERT_TRUE(Vote(*id, bob_, VoteChoice::For, 100 * COIN, 3));
    PassCommitStage();
    ASSERT_TRUE(voting_.RevealVote(*id, alice_, VoteChoice::Against, 1));
    ASSERT_TRUE(voting_.RevealVote(*id, carol_, VoteChoice::Against, 2));
    ASSERT_TRUE(voting_.RevealVote(*id, bob_, VoteChoice::For, 3));
    PassRevealStage();
    ASSERT_TRUE(registry_->UpdateStatus(listing, bob_));

    auto challenge = registry_->GetChallenge(*id);
    EXPECT_EQ(challenge->totalWinningTokens, 400 * COIN);

    auto alicePaid = registry_->ClaimReward(*id, alice_, 1);
    auto carolPaid = registry_->ClaimReward(*id, carol_, 2);
    ASSERT_TRUE(alicePaid.IsOk());
    ASSERT_TRUE(carolPaid.IsOk());

    Amount pools = challenge->rewardPool + challenge->inflationPool;
    EXPECT_EQ(*alicePaid, pools * 3 / 4);
    EXPECT_EQ(*carolPaid, pools / 4);

    // The losing side has nothing to claim
    EXPECT_EQ(registry_->ClaimReward(*id, bob_, 3).GetError(),
              ErrorCode::VoteDidNotMatchWinner);
    EXPECT_EQ(registry_->GetEscrowBalance(), 0);
}

TEST_F(ClaimRewardTest, RoundingNeverOverpays) {
    ListingHash listing = ListingHashFromName("dust.net");
    Whitelist(listing);
    auto id = registry_->CreateChallenge(listing, challenger_, MinDeposit());
    ASSERT_TRUE(id.IsOk());

    const AccountId* voters[] = {&alice_, &bob_, &carol_};
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(Vote(*id, *voters[i], VoteChoice::For, 1, 10 + i));
    }
    PassCommitStage();
    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(voting_.RevealVote(*id, *voters[i], VoteChoice::For, 10 + i));
    }
    PassRevealStage();
    ASSERT_TRUE(registry_->UpdateStatus(listing, alice_));

    auto challenge = registry_->GetChallenge(*id);
    Amount paid = 0;
    for (int i = 0; i < 3; ++i) {
        auto result = registry_->ClaimReward(*id, *voters[i], 10 + i);
        ASSERT_TRUE(result.IsOk());
        EXPECT_EQ(*result, challenge->rewardPool / 3 + challenge->inflationPool / 3);
        paid += *result;
    }

    Amount pools = challenge->rewardPool + challenge->inflationPool;
    EXPECT_LE(paid, pools);
    EXPECT_EQ(registry_->GetChallenge(*id)->claimedAmount, paid);

    // Undivided dust stays in escrow next to the listing deposit
    EXPECT_EQ(registry_->GetEscrowBalance(),
              registry_->GetListing(listing)->deposit + pools - paid);
}

// ============================================================================
// Rejected Claims
// ============================================================================

TEST_F(ClaimRewardTest, UnknownChallenge) {
    ChallengeId id = ChallengeWithAliceAgainst("claimthis.net");
    RevealAndResolve(id, "claimthis.net");

    Amount before = ledger_.BalanceOf(alice_);
    EXPECT_EQ(registry_->ClaimReward(666, alice_, ALICE_SALT).GetError(),
              ErrorCode::ChallengeNotFound);
    EXPECT_EQ(registry_->VoterReward(666, alice_, ALICE_SALT).GetError(),
              ErrorCode::ChallengeNotFound);
    EXPECT_FALSE(registry_->TokenClaims(666, alice_));
    EXPECT_EQ(ledger_.BalanceOf(alice_), before);
}

TEST_F(ClaimRewardTest, WrongSalt) {
    ChallengeId id = ChallengeWithAliceAgainst("claimthis.net");
    RevealAndResolve(id, "claimthis.net");

    Amount before = ledger_.BalanceOf(alice_);
    EXPECT_EQ(registry_->ClaimReward(id, alice_, ALICE_SALT + 1).GetError(),
              ErrorCode::RevealMismatch);
    EXPECT_FALSE(registry_->TokenClaims(id, alice_));
    EXPECT_EQ(ledger_.BalanceOf(alice_), before);

    // The right salt still works afterwards
    EXPECT_TRUE(registry_->ClaimReward(id, alice_, ALICE_SALT).IsOk());
}

TEST_F(ClaimRewardTest, DoubleClaim) {
    ChallengeId id = ChallengeWithAliceAgainst("sugar.net");
    RevealAndResolve(id, "sugar.net");

    ASSERT_TRUE(registry_->ClaimReward(id, alice_, ALICE_SALT).IsOk());

    Amount aliceBefore = ledger_.BalanceOf(alice_);
    Amount escrowBefore = registry_->GetEscrowBalance();
    Amount claimedBefore = registry_->GetChallenge(id)->claimedAmount;

    EXPECT_EQ(registry_->ClaimReward(id, alice_, ALICE_SALT).GetError(),
              ErrorCode::AlreadyClaimed);
    EXPECT_EQ(ledger_.BalanceOf(alice_), aliceBefore);
    EXPECT_EQ(registry_->GetEscrowBalance(), escrowBefore);
    EXPECT_EQ(registry_->GetChallenge(id)->claimedAmount, claimedBefore);
}

TEST_F(ClaimRewardTest, UnresolvedChallenge) {
    ChallengeId id = ChallengeWithAliceAgainst("dontresolve.net");
    PassCommitStage();
    ASSERT_TRUE(voting_.RevealVote(id, alice_, VoteChoice::Against, ALICE_SALT));
    PassRevealStage();

    Amount before = ledger_.BalanceOf(alice_);
    EXPECT_EQ(registry_->ClaimReward(id, alice_, ALICE_SALT).GetError(),
              ErrorCode::ChallengeUnresolved);
    EXPECT_EQ(registry_->VoterInflationReward(id, alice_, ALICE_SALT).GetError(),
              ErrorCode::ChallengeUnresolved);
    EXPECT_EQ(ledger_.BalanceOf(alice_), before);
}

TEST_F(ClaimRewardTest, NonVoterCannotClaim) {
    ChallengeId id = ChallengeWithAliceAgainst("claimthis.net");
    RevealAndResolve(id, "claimthis.net");

    EXPECT_EQ(registry_->ClaimReward(id, bob_, ALICE_SALT).GetError(),
              ErrorCode::VoteDidNotMatchWinner);
    EXPECT_FALSE(registry_->TokenClaims(id, bob_));
}

TEST_F(ClaimRewardTest, NoReserveMeansNoInflation) {
    ASSERT_TRUE(ledger_.Transfer(reserve_, carol_, RESERVE_BALANCE));

    ChallengeId id = ChallengeWithAliceAgainst("lean.net");
    RevealAndResolve(id, "lean.net");

    EXPECT_EQ(*registry_->VoterInflationReward(id, alice_, ALICE_SALT), 0);
    auto paid = registry_->ClaimReward(id, alice_, ALICE_SALT);
    ASSERT_TRUE(paid.IsOk());
    EXPECT_EQ(*paid, MinDeposit() / 2);
}

} // namespace test
} // namespace registry
} // namespace curator
