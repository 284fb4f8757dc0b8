// CURATOR - Token-Curated Registry
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Listing lifecycle, challenges, resolution and reward settlement.
//
// Lifecycle:
//   Unlisted --Apply--> Applied --(apply stage passes)--> Whitelisted
//   Applied/Whitelisted --CreateChallenge--> under challenge
//   under challenge --UpdateStatus--> Whitelisted (applicant wins)
//                                  or Unlisted    (challenger wins)
//   Whitelisted --Exit--> Unlisted
//
// Each challenge opens a commit-reveal poll sharing its id. Once the poll
// ends, UpdateStatus settles the stakes and fixes the reward pools; voters
// on the winning side then claim their share exactly once.

#ifndef CURATOR_REGISTRY_REGISTRY_H
#define CURATOR_REGISTRY_REGISTRY_H

#include <curator/core/result.h>
#include <curator/core/types.h>
#include <curator/economics/inflation.h>
#include <curator/ledger/escrow.h>
#include <curator/ledger/ledger.h>
#include <curator/params/parameters.h>
#include <curator/util/time.h>
#include <curator/voting/voting.h>

#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <utility>

namespace curator {
namespace registry {

// ============================================================================
// Listing
// ============================================================================

enum class ListingStatus {
    /// Never applied, rejected or exited
    Unlisted,

    /// Application pending
    Applied,

    /// On the list
    Whitelisted,
};

const char* ListingStatusToString(ListingStatus status);

struct Listing {
    ListingHash id;
    AccountId owner;

    /// Bonded deposit not currently staked in a challenge
    Amount deposit{0};

    ListingStatus status{ListingStatus::Unlisted};
    Timestamp applicationExpiry{0};

    /// Set only while a challenge is open
    std::optional<ChallengeId> currentChallengeId;

    /// Most recent challenge, kept after it resolves
    std::optional<ChallengeId> lastChallengeId;

    std::string data;

    bool HasOpenChallenge() const { return currentChallengeId.has_value(); }

    std::string ToString() const;
};

// ============================================================================
// Challenge
// ============================================================================

enum class WinningSide {
    Unresolved,
    Applicant,
    Challenger,
};

const char* WinningSideToString(WinningSide side);

struct Challenge {
    /// Equal to the poll id
    ChallengeId id{0};
    ListingHash listingId;
    AccountId challenger;
    PollId pollId{0};

    /// Amount each side has at risk
    Amount stake{0};

    /// Paid out to winning voters; fixed at resolution
    Amount rewardPool{0};
    Amount inflationPool{0};
    Amount totalWinningTokens{0};

    /// Sum of voter payouts so far
    Amount claimedAmount{0};

    bool resolved{false};
    WinningSide winningSide{WinningSide::Unresolved};
    std::string data;

    std::string ToString() const;
};

// ============================================================================
// Registry
// ============================================================================

/**
 * The registry engine.
 *
 * Every operation is atomic: it either applies in full or returns an error
 * having changed nothing. Listing and challenge records are written before
 * any token moves, so a ledger transfer never observes a half-applied
 * operation. Lock order is registry, then voting engine, then ledger; a
 * ledger implementation must not call back into the registry.
 */
class Registry {
public:
    /**
     * @param ledger Token ledger
     * @param voting Poll engine (shares the ledger)
     * @param params Parameter store, read on every operation
     * @param clock Time source (should be the voting engine's clock)
     * @param escrowAccount Account holding deposits and stakes
     * @param inflationReserve Account funding the inflation pools
     */
    Registry(ledger::ILedger& ledger,
             voting::VotingEngine& voting,
             const params::IParameterStore& params,
             const util::IClock& clock,
             const AccountId& escrowAccount,
             const AccountId& inflationReserve);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // ========================================================================
    // Listing Lifecycle
    // ========================================================================

    /**
     * Apply for a listing, bonding the deposit into escrow.
     *
     * The listing must be Unlisted, or an unchallenged application past its
     * expiry. In the second case the previous owner's deposit is refunded
     * and the applicant takes the listing over.
     *
     * Errors: ListingAlreadyActive, InsufficientDeposit, plus ledger errors
     */
    Status Apply(const ListingHash& listingId, const AccountId& applicant,
                 Amount deposit, const std::string& data = "");

    /// Top up the unstaked deposit (NoSuchListing, NotListingOwner, InvalidAmount)
    Status Deposit(const ListingHash& listingId, const AccountId& owner, Amount amount);

    /**
     * Withdraw unstaked deposit, keeping at least minDeposit bonded.
     *
     * Errors: NoSuchListing, NotListingOwner, InvalidAmount,
     *         InsufficientDeposit
     */
    Status Withdraw(const ListingHash& listingId, const AccountId& owner, Amount amount);

    /**
     * Remove an unchallenged whitelisted listing and refund its deposit.
     *
     * Errors: NoSuchListing, NotListingOwner, ListingNotWhitelisted,
     *         AlreadyUnderChallenge
     */
    Status Exit(const ListingHash& listingId, const AccountId& owner);

    // ========================================================================
    // Challenges
    // ========================================================================

    /**
     * Challenge a listing.
     *
     * bond is the amount the challenger authorises; minDeposit of it is
     * staked, matched by minDeposit taken from the listing's deposit.
     *
     * @return Challenge id (equal to its poll id)
     *
     * Errors: NoSuchListing, AlreadyUnderChallenge, InsufficientBond,
     *         InsufficientDeposit, plus ledger errors
     */
    Result<ChallengeId> CreateChallenge(const ListingHash& listingId,
                                        const AccountId& challenger,
                                        Amount bond,
                                        const std::string& data = "");

    /**
     * Advance a listing: resolve its open challenge once the reveal window
     * has closed, or whitelist an application whose apply stage passed.
     *
     * Errors: NoSuchListing, RevealPeriodNotOver, AlreadyResolved,
     *         ChallengeNotFound
     */
    Status UpdateStatus(const ListingHash& listingId, const AccountId& caller);

    // ========================================================================
    // Reward Settlement
    // ========================================================================

    /**
     * Pay a winning voter's share of the reward and inflation pools.
     *
     * @return Amount paid
     *
     * Errors: ChallengeNotFound, ChallengeUnresolved, AlreadyClaimed,
     *         VoteDidNotMatchWinner, RevealMismatch
     */
    Result<Amount> ClaimReward(ChallengeId challengeId, const AccountId& voter, voting::Salt salt);

    /// Share of the reward pool a claim would pay
    Result<Amount> VoterReward(ChallengeId challengeId, const AccountId& voter,
                               voting::Salt salt) const;

    /// Share of the inflation pool a claim would pay
    Result<Amount> VoterInflationReward(ChallengeId challengeId, const AccountId& voter,
                                        voting::Salt salt) const;

    /// True once the voter has claimed for this challenge
    bool TokenClaims(ChallengeId challengeId, const AccountId& voter) const;

    // ========================================================================
    // Queries
    // ========================================================================

    bool IsWhitelisted(const ListingHash& listingId) const;

    /// Listing is Applied or Whitelisted
    bool AppWasMade(const ListingHash& listingId) const;

    /// Listing has an open challenge
    bool ChallengeExists(const ListingHash& listingId) const;

    /// Open challenge whose reveal window has closed
    bool ChallengeCanBeResolved(const ListingHash& listingId) const;

    /// Unchallenged application whose apply stage has passed
    bool CanBeWhitelisted(const ListingHash& listingId) const;

    std::optional<Listing> GetListing(const ListingHash& listingId) const;
    std::optional<Challenge> GetChallenge(ChallengeId challengeId) const;

    size_t ListingCount() const;
    size_t ChallengeCount() const;

    /// Challenges resolved so far (drives the inflation schedule)
    uint64_t GetResolvedCount() const;

    const AccountId& GetEscrowAccount() const { return escrow_.GetAccount(); }
    const AccountId& GetInflationReserve() const { return inflationReserve_; }
    Amount GetEscrowBalance() const { return escrow_.Balance(); }

    const economics::InflationSchedule& GetInflationSchedule() const { return schedule_; }

private:
    int64_t Param(params::RegistryParameter param) const;

    Listing* FindListingLocked(const ListingHash& listingId);
    const Listing* FindListingLocked(const ListingHash& listingId) const;

    /// Journal a step restoring the listing (or its absence) as it is now
    void RecordListingLocked(const ListingHash& listingId, ledger::Journal& journal);

    /// Settle an open challenge whose poll has ended
    Status ResolveChallengeLocked(Listing& listing, Challenge& challenge,
                                  ledger::Journal& journal);

    /// (reward share, inflation share) for a winning voter
    Result<std::pair<Amount, Amount>> ComputeVoterSharesLocked(
        const Challenge& challenge, const AccountId& voter, voting::Salt salt) const;

    ledger::ILedger& ledger_;
    voting::VotingEngine& voting_;
    const params::IParameterStore& params_;
    const util::IClock& clock_;
    ledger::TokenEscrow escrow_;
    AccountId inflationReserve_;
    economics::InflationSchedule schedule_;

    mutable std::mutex mutex_;
    std::map<ListingHash, Listing> listings_;
    std::map<ChallengeId, Challenge> challenges_;
    uint64_t resolvedCount_{0};
};

} // namespace registry
} // namespace curator

#endif // CURATOR_REGISTRY_REGISTRY_H
