// CURATOR - Token-Curated Registry Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/registry/registry.h>
#include <curator/core/amount.h>
#include <curator/util/logging.h>

#include <algorithm>
#include <sstream>

namespace curator {
namespace registry {

using params::RegistryParameter;

namespace {

Status Reject(ErrorCode code, const char* operation, const ListingHash& listingId) {
    LOG_DEBUG(util::LogCategory::REGISTRY)
        << operation << " " << listingId.ToShortHex() << " rejected: "
        << ErrorCodeToString(code);
    return Status::Failure(code);
}

} // namespace

// ============================================================================
// Listing / Challenge
// ============================================================================

const char* ListingStatusToString(ListingStatus status) {
    switch (status) {
        case ListingStatus::Unlisted: return "Unlisted";
        case ListingStatus::Applied: return "Applied";
        case ListingStatus::Whitelisted: return "Whitelisted";
        default: return "Unknown";
    }
}

const char* WinningSideToString(WinningSide side) {
    switch (side) {
        case WinningSide::Unresolved: return "Unresolved";
        case WinningSide::Applicant: return "Applicant";
        case WinningSide::Challenger: return "Challenger";
        default: return "Unknown";
    }
}

std::string Listing::ToString() const {
    std::ostringstream ss;
    ss << "Listing(" << id.ToShortHex()
       << ", owner=" << owner.ToShortHex()
       << ", status=" << ListingStatusToString(status)
       << ", deposit=" << FormatAmount(deposit);
    if (currentChallengeId) {
        ss << ", challenge=" << *currentChallengeId;
    }
    ss << ")";
    return ss.str();
}

std::string Challenge::ToString() const {
    std::ostringstream ss;
    ss << "Challenge(id=" << id
       << ", listing=" << listingId.ToShortHex()
       << ", stake=" << FormatAmount(stake)
       << ", resolved=" << (resolved ? "yes" : "no")
       << ", winner=" << WinningSideToString(winningSide)
       << ", rewardPool=" << FormatAmount(rewardPool)
       << ", inflationPool=" << FormatAmount(inflationPool)
       << ", winningTokens=" << totalWinningTokens << ")";
    return ss.str();
}

// ============================================================================
// Registry
// ============================================================================

Registry::Registry(ledger::ILedger& ledger,
                   voting::VotingEngine& voting,
                   const params::IParameterStore& params,
                   const util::IClock& clock,
                   const AccountId& escrowAccount,
                   const AccountId& inflationReserve)
    : ledger_(ledger)
    , voting_(voting)
    , params_(params)
    , clock_(clock)
    , escrow_(ledger, escrowAccount)
    , inflationReserve_(inflationReserve)
    , schedule_(economics::InflationSchedule::FromParameters(params)) {}

int64_t Registry::Param(RegistryParameter param) const {
    return params_.GetValue(param);
}

Listing* Registry::FindListingLocked(const ListingHash& listingId) {
    auto it = listings_.find(listingId);
    return it == listings_.end() ? nullptr : &it->second;
}

const Listing* Registry::FindListingLocked(const ListingHash& listingId) const {
    auto it = listings_.find(listingId);
    return it == listings_.end() ? nullptr : &it->second;
}

// ============================================================================
// Listing Lifecycle
// ============================================================================

Status Registry::Apply(const ListingHash& listingId, const AccountId& applicant,
                       Amount deposit, const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    const Timestamp now = clock_.Now();
    const Listing* existing = FindListingLocked(listingId);
    bool expired = existing && existing->status == ListingStatus::Applied &&
                   !existing->HasOpenChallenge() && now >= existing->applicationExpiry;
    if (existing && existing->status != ListingStatus::Unlisted && !expired) {
        return Reject(ErrorCode::ListingAlreadyActive, "Apply", listingId);
    }
    if (deposit < Param(RegistryParameter::MinDeposit)) {
        return Reject(ErrorCode::InsufficientDeposit, "Apply", listingId);
    }

    AccountId previousOwner;
    Amount refund = 0;
    if (expired) {
        previousOwner = existing->owner;
        refund = existing->deposit;
    }

    ledger::Journal journal;
    RecordListingLocked(listingId, journal);

    Listing& listing = listings_[listingId];
    listing.id = listingId;
    listing.owner = applicant;
    listing.deposit = deposit;
    listing.status = ListingStatus::Applied;
    listing.applicationExpiry = now + Param(RegistryParameter::ApplyStageLength);
    listing.currentChallengeId.reset();
    listing.data = data;

    Status status = escrow_.Release(previousOwner, refund, journal);
    if (!status) {
        return Reject(status.GetError(), "Apply", listingId);
    }
    status = escrow_.Bond(applicant, deposit, journal);
    if (!status) {
        return Reject(status.GetError(), "Apply", listingId);
    }

    journal.Commit();

    if (expired) {
        LOG_INFO(util::LogCategory::REGISTRY)
            << "Expired application " << listingId.ToShortHex() << " refunded "
            << FormatAmount(refund) << " to " << previousOwner.ToShortHex();
    }
    LOG_INFO(util::LogCategory::REGISTRY)
        << "Application " << listingId.ToShortHex() << " by " << applicant.ToShortHex()
        << " with deposit " << FormatAmount(deposit);
    return Status::Success();
}

Status Registry::Deposit(const ListingHash& listingId, const AccountId& owner, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing* listing = FindListingLocked(listingId);
    if (!listing || listing->status == ListingStatus::Unlisted) {
        return Reject(ErrorCode::NoSuchListing, "Deposit", listingId);
    }
    if (listing->owner != owner) {
        return Reject(ErrorCode::NotListingOwner, "Deposit", listingId);
    }
    if (amount <= 0) {
        return Reject(ErrorCode::InvalidAmount, "Deposit", listingId);
    }

    auto newDeposit = CheckedAdd(listing->deposit, amount);
    if (!newDeposit) {
        return Reject(ErrorCode::AmountOverflow, "Deposit", listingId);
    }

    ledger::Journal journal;
    RecordListingLocked(listingId, journal);
    listing->deposit = *newDeposit;

    Status status = escrow_.Bond(owner, amount, journal);
    if (!status) {
        return Reject(status.GetError(), "Deposit", listingId);
    }
    journal.Commit();

    LOG_INFO(util::LogCategory::REGISTRY)
        << "Deposit of " << FormatAmount(amount) << " to " << listingId.ToShortHex();
    return Status::Success();
}

Status Registry::Withdraw(const ListingHash& listingId, const AccountId& owner, Amount amount) {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing* listing = FindListingLocked(listingId);
    if (!listing || listing->status == ListingStatus::Unlisted) {
        return Reject(ErrorCode::NoSuchListing, "Withdraw", listingId);
    }
    if (listing->owner != owner) {
        return Reject(ErrorCode::NotListingOwner, "Withdraw", listingId);
    }
    if (amount <= 0 || amount > listing->deposit) {
        return Reject(ErrorCode::InvalidAmount, "Withdraw", listingId);
    }
    if (listing->deposit - amount < Param(RegistryParameter::MinDeposit)) {
        return Reject(ErrorCode::InsufficientDeposit, "Withdraw", listingId);
    }

    ledger::Journal journal;
    RecordListingLocked(listingId, journal);
    listing->deposit -= amount;

    Status status = escrow_.Release(owner, amount, journal);
    if (!status) {
        return Reject(status.GetError(), "Withdraw", listingId);
    }
    journal.Commit();

    LOG_INFO(util::LogCategory::REGISTRY)
        << "Withdrawal of " << FormatAmount(amount) << " from " << listingId.ToShortHex();
    return Status::Success();
}

Status Registry::Exit(const ListingHash& listingId, const AccountId& owner) {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing* listing = FindListingLocked(listingId);
    if (!listing || listing->status == ListingStatus::Unlisted) {
        return Reject(ErrorCode::NoSuchListing, "Exit", listingId);
    }
    if (listing->owner != owner) {
        return Reject(ErrorCode::NotListingOwner, "Exit", listingId);
    }
    if (listing->status != ListingStatus::Whitelisted) {
        return Reject(ErrorCode::ListingNotWhitelisted, "Exit", listingId);
    }
    if (listing->HasOpenChallenge()) {
        return Reject(ErrorCode::AlreadyUnderChallenge, "Exit", listingId);
    }

    ledger::Journal journal;
    RecordListingLocked(listingId, journal);

    Amount refunded = listing->deposit;
    listing->deposit = 0;
    listing->status = ListingStatus::Unlisted;

    Status status = escrow_.Release(owner, refunded, journal);
    if (!status) {
        return Reject(status.GetError(), "Exit", listingId);
    }
    journal.Commit();

    LOG_INFO(util::LogCategory::REGISTRY)
        << "Listing " << listingId.ToShortHex() << " exited, refunded "
        << FormatAmount(refunded);
    return Status::Success();
}

void Registry::RecordListingLocked(const ListingHash& listingId, ledger::Journal& journal) {
    std::optional<Listing> before;
    if (const Listing* listing = FindListingLocked(listingId)) {
        before = *listing;
    }
    journal.Record([this, listingId, before]() {
        if (before) {
            listings_[listingId] = *before;
        } else {
            listings_.erase(listingId);
        }
        return Status::Success();
    });
}

// ============================================================================
// Challenges
// ============================================================================

Result<ChallengeId> Registry::CreateChallenge(const ListingHash& listingId,
                                              const AccountId& challenger,
                                              Amount bond,
                                              const std::string& data) {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing* listing = FindListingLocked(listingId);
    if (!listing || listing->status == ListingStatus::Unlisted) {
        return Result<ChallengeId>::Failure(
            Reject(ErrorCode::NoSuchListing, "Challenge", listingId));
    }
    if (listing->HasOpenChallenge()) {
        return Result<ChallengeId>::Failure(
            Reject(ErrorCode::AlreadyUnderChallenge, "Challenge", listingId));
    }

    Amount stake = Param(RegistryParameter::MinDeposit);
    if (bond < stake) {
        return Result<ChallengeId>::Failure(
            Reject(ErrorCode::InsufficientBond, "Challenge", listingId));
    }
    if (listing->deposit < stake) {
        return Result<ChallengeId>::Failure(
            Reject(ErrorCode::InsufficientDeposit, "Challenge", listingId));
    }

    ledger::Journal journal;

    PollId pollId = voting_.StartPoll(Param(RegistryParameter::VoteQuorum),
                                      Param(RegistryParameter::CommitStageLength),
                                      Param(RegistryParameter::RevealStageLength));
    voting::VotingEngine* voting = &voting_;
    journal.Record([voting, pollId]() { return voting->DiscardPoll(pollId); });

    Challenge challenge;
    challenge.id = pollId;
    challenge.listingId = listingId;
    challenge.challenger = challenger;
    challenge.pollId = pollId;
    challenge.stake = stake;
    challenge.data = data;
    challenges_[challenge.id] = challenge;
    journal.Record([this, pollId]() {
        challenges_.erase(pollId);
        return Status::Success();
    });

    RecordListingLocked(listingId, journal);
    listing->deposit -= stake;
    listing->currentChallengeId = challenge.id;
    listing->lastChallengeId = challenge.id;

    Status status = escrow_.Bond(challenger, stake, journal);
    if (!status) {
        return Result<ChallengeId>::Failure(Reject(status.GetError(), "Challenge", listingId));
    }

    journal.Commit();

    LOG_INFO(util::LogCategory::REGISTRY)
        << "Challenge " << challenge.id << " against " << listingId.ToShortHex()
        << " by " << challenger.ToShortHex() << ", stake " << FormatAmount(stake);
    return Result<ChallengeId>::Success(challenge.id);
}

Status Registry::UpdateStatus(const ListingHash& listingId, const AccountId& caller) {
    std::lock_guard<std::mutex> lock(mutex_);

    Listing* listing = FindListingLocked(listingId);
    if (!listing) {
        return Reject(ErrorCode::NoSuchListing, "UpdateStatus", listingId);
    }

    if (listing->HasOpenChallenge()) {
        auto it = challenges_.find(*listing->currentChallengeId);
        if (it == challenges_.end()) {
            return Reject(ErrorCode::ChallengeNotFound, "UpdateStatus", listingId);
        }

        ledger::Journal journal;
        Status status = ResolveChallengeLocked(*listing, it->second, journal);
        if (!status) {
            return Reject(status.GetError(), "UpdateStatus", listingId);
        }
        journal.Commit();

        LOG_INFO(util::LogCategory::REGISTRY)
            << "Resolved " << it->second.ToString() << " (triggered by "
            << caller.ToShortHex() << "), listing now "
            << ListingStatusToString(listing->status);
        return Status::Success();
    }

    if (listing->status == ListingStatus::Applied &&
        clock_.Now() >= listing->applicationExpiry) {
        listing->status = ListingStatus::Whitelisted;
        LOG_INFO(util::LogCategory::REGISTRY)
            << "Listing " << listingId.ToShortHex() << " whitelisted";
        return Status::Success();
    }

    if (listing->lastChallengeId) {
        auto it = challenges_.find(*listing->lastChallengeId);
        if (it != challenges_.end() && it->second.resolved) {
            return Reject(ErrorCode::AlreadyResolved, "UpdateStatus", listingId);
        }
    }

    return Reject(ErrorCode::ChallengeNotFound, "UpdateStatus", listingId);
}

Status Registry::ResolveChallengeLocked(Listing& listing, Challenge& challenge,
                                        ledger::Journal& journal) {
    auto poll = voting_.GetPoll(challenge.pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }
    if (!poll->HasEnded(clock_.Now())) {
        return Status::Failure(ErrorCode::RevealPeriodNotOver);
    }

    const Amount stake = challenge.stake;
    auto bothStakes = CheckedAdd(stake, stake);
    if (!bothStakes) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    bool applicantWins = poll->IsPassed();
    Amount winningTokens = poll->TotalWinningTokens();

    // Winning voters split the undispensed part of the losing stake. With
    // nobody to pay, the winning party takes both stakes.
    Amount rewardPool = 0;
    Amount inflationPool = 0;
    if (winningTokens > 0) {
        auto pool = MulDiv(stake, 100 - Param(RegistryParameter::DispensationPct), 100);
        if (!pool) {
            return Status::Failure(ErrorCode::AmountOverflow);
        }
        rewardPool = *pool;

        Amount emission = schedule_.GetEmission(resolvedCount_);
        inflationPool = std::min(emission, ledger_.BalanceOf(inflationReserve_));
    }
    Amount winnerPayout = *bothStakes - rewardPool;

    // Record the prior state before touching it
    Listing listingBefore = listing;
    Challenge challengeBefore = challenge;
    uint64_t resolvedBefore = resolvedCount_;
    journal.Record([this, listingBefore, challengeBefore, resolvedBefore]() {
        listings_[listingBefore.id] = listingBefore;
        challenges_[challengeBefore.id] = challengeBefore;
        resolvedCount_ = resolvedBefore;
        return Status::Success();
    });

    challenge.resolved = true;
    challenge.winningSide = applicantWins ? WinningSide::Applicant : WinningSide::Challenger;
    challenge.rewardPool = rewardPool;
    challenge.inflationPool = inflationPool;
    challenge.totalWinningTokens = winningTokens;
    listing.currentChallengeId.reset();
    ++resolvedCount_;

    if (applicantWins) {
        auto credited = CheckedAdd(listing.deposit, winnerPayout);
        if (!credited) {
            return Status::Failure(ErrorCode::AmountOverflow);
        }
        listing.deposit = *credited;
        listing.status = ListingStatus::Whitelisted;
    } else {
        Amount refund = listing.deposit;
        listing.deposit = 0;
        listing.status = ListingStatus::Unlisted;

        Status status = escrow_.Release(listing.owner, refund, journal);
        if (!status) {
            return status;
        }
        status = escrow_.Release(challenge.challenger, winnerPayout, journal);
        if (!status) {
            return status;
        }
    }

    if (inflationPool > 0) {
        Status status = escrow_.Bond(inflationReserve_, inflationPool, journal);
        if (!status) {
            return status;
        }
    }

    return Status::Success();
}

// ============================================================================
// Reward Settlement
// ============================================================================

Result<std::pair<Amount, Amount>> Registry::ComputeVoterSharesLocked(
    const Challenge& challenge, const AccountId& voter, voting::Salt salt) const {
    using Shares = std::pair<Amount, Amount>;

    auto tokens = voting_.GetNumPassingTokens(challenge.pollId, voter, salt);
    if (!tokens) {
        return Result<Shares>::Failure(tokens.GetError());
    }
    if (challenge.totalWinningTokens <= 0) {
        return Result<Shares>::Failure(ErrorCode::VoteDidNotMatchWinner);
    }

    auto reward = MulDiv(challenge.rewardPool, *tokens, challenge.totalWinningTokens);
    auto inflation = MulDiv(challenge.inflationPool, *tokens, challenge.totalWinningTokens);
    if (!reward || !inflation) {
        return Result<Shares>::Failure(ErrorCode::AmountOverflow);
    }
    return Result<Shares>::Success(Shares(*reward, *inflation));
}

Result<Amount> Registry::ClaimReward(ChallengeId challengeId, const AccountId& voter,
                                     voting::Salt salt) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return Result<Amount>::Failure(ErrorCode::ChallengeNotFound);
    }
    Challenge& challenge = it->second;

    if (!challenge.resolved) {
        return Result<Amount>::Failure(ErrorCode::ChallengeUnresolved);
    }
    if (voting_.HasClaimed(challenge.pollId, voter)) {
        LOG_DEBUG(util::LogCategory::REGISTRY)
            << voter.ToShortHex() << " already claimed for challenge " << challengeId;
        return Result<Amount>::Failure(ErrorCode::AlreadyClaimed);
    }

    auto shares = ComputeVoterSharesLocked(challenge, voter, salt);
    if (!shares) {
        LOG_DEBUG(util::LogCategory::REGISTRY)
            << "Claim by " << voter.ToShortHex() << " for challenge " << challengeId
            << " rejected: " << ErrorCodeToString(shares.GetError());
        return Result<Amount>::Failure(shares.GetError());
    }

    Amount payout = shares->first + shares->second;
    auto claimed = CheckedAdd(challenge.claimedAmount, payout);
    if (!claimed || *claimed > challenge.rewardPool + challenge.inflationPool) {
        LOG_ERROR(util::LogCategory::REGISTRY)
            << "Claim of " << payout << " would exceed the pools of "
            << challenge.ToString();
        return Result<Amount>::Failure(ErrorCode::TransferFailed);
    }

    ledger::Journal journal;

    Status status = voting_.MarkClaimed(challenge.pollId, voter);
    if (!status) {
        return Result<Amount>::Failure(status);
    }
    voting::VotingEngine* voting = &voting_;
    PollId pollId = challenge.pollId;
    journal.Record([voting, pollId, voter]() { return voting->RevertClaim(pollId, voter); });

    Amount claimedBefore = challenge.claimedAmount;
    challenge.claimedAmount = *claimed;
    journal.Record([this, challengeId, claimedBefore]() {
        challenges_[challengeId].claimedAmount = claimedBefore;
        return Status::Success();
    });

    status = escrow_.Release(voter, payout, journal);
    if (!status) {
        return Result<Amount>::Failure(status);
    }

    journal.Commit();

    LOG_INFO(util::LogCategory::REGISTRY)
        << voter.ToShortHex() << " claimed " << FormatAmount(payout)
        << " (reward " << FormatAmount(shares->first)
        << ", inflation " << FormatAmount(shares->second)
        << ") for challenge " << challengeId;
    return Result<Amount>::Success(payout);
}

Result<Amount> Registry::VoterReward(ChallengeId challengeId, const AccountId& voter,
                                     voting::Salt salt) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return Result<Amount>::Failure(ErrorCode::ChallengeNotFound);
    }
    if (!it->second.resolved) {
        return Result<Amount>::Failure(ErrorCode::ChallengeUnresolved);
    }

    auto shares = ComputeVoterSharesLocked(it->second, voter, salt);
    if (!shares) {
        return Result<Amount>::Failure(shares.GetError());
    }
    return Result<Amount>::Success(shares->first);
}

Result<Amount> Registry::VoterInflationReward(ChallengeId challengeId, const AccountId& voter,
                                              voting::Salt salt) const {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return Result<Amount>::Failure(ErrorCode::ChallengeNotFound);
    }
    if (!it->second.resolved) {
        return Result<Amount>::Failure(ErrorCode::ChallengeUnresolved);
    }

    auto shares = ComputeVoterSharesLocked(it->second, voter, salt);
    if (!shares) {
        return Result<Amount>::Failure(shares.GetError());
    }
    return Result<Amount>::Success(shares->second);
}

bool Registry::TokenClaims(ChallengeId challengeId, const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return false;
    }
    return voting_.HasClaimed(it->second.pollId, voter);
}

// ============================================================================
// Queries
// ============================================================================

bool Registry::IsWhitelisted(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    return listing && listing->status == ListingStatus::Whitelisted;
}

bool Registry::AppWasMade(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    return listing && listing->status != ListingStatus::Unlisted;
}

bool Registry::ChallengeExists(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    return listing && listing->HasOpenChallenge();
}

bool Registry::ChallengeCanBeResolved(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    if (!listing || !listing->HasOpenChallenge()) {
        return false;
    }
    auto poll = voting_.GetPoll(*listing->currentChallengeId);
    return poll && poll->HasEnded(clock_.Now());
}

bool Registry::CanBeWhitelisted(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    return listing && listing->status == ListingStatus::Applied &&
           !listing->HasOpenChallenge() &&
           clock_.Now() >= listing->applicationExpiry;
}

std::optional<Listing> Registry::GetListing(const ListingHash& listingId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Listing* listing = FindListingLocked(listingId);
    if (!listing) {
        return std::nullopt;
    }
    return *listing;
}

std::optional<Challenge> Registry::GetChallenge(ChallengeId challengeId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = challenges_.find(challengeId);
    if (it == challenges_.end()) {
        return std::nullopt;
    }
    return it->second;
}

size_t Registry::ListingCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return listings_.size();
}

size_t Registry::ChallengeCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return challenges_.size();
}

uint64_t Registry::GetResolvedCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return resolvedCount_;
}

} // namespace registry
} // namespace curator
