// CURATOR - Commit-Reveal Voting Engine Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/voting/voting.h>
#include <curator/core/amount.h>
#include <curator/util/logging.h>

namespace curator {
namespace voting {

VotingEngine::VotingEngine(ledger::ILedger& ledger, const ICommitmentScheme& scheme,
                           const util::IClock& clock)
    : ledger_(ledger), scheme_(scheme), clock_(clock) {}

// ============================================================================
// Internal Helpers
// ============================================================================

const Poll* VotingEngine::FindPollLocked(PollId pollId) const {
    auto it = polls_.find(pollId);
    return it == polls_.end() ? nullptr : &it->second;
}

Poll* VotingEngine::FindPollLocked(PollId pollId) {
    auto it = polls_.find(pollId);
    return it == polls_.end() ? nullptr : &it->second;
}

bool VotingEngine::IsLapsedLocked(const AccountId& voter, PollId pollId,
                                  Timestamp now) const {
    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return true;
    }
    // Revealed weight lapses once the poll is over
    auto ballotIt = poll->ballots.find(voter);
    return ballotIt != poll->ballots.end() && ballotIt->second.IsRevealed() &&
           poll->HasEnded(now);
}

Amount VotingEngine::ReservedLocked(const AccountId& voter, const VoterAccount& account,
                                    Timestamp now, std::optional<PollId> exclude) const {
    Amount total = 0;
    for (const auto& [pollId, weight] : account.reservations) {
        if (exclude && *exclude == pollId) {
            continue;
        }
        if (IsLapsedLocked(voter, pollId, now)) {
            continue;
        }
        total += weight;
    }
    return total;
}

void VotingEngine::PruneLapsedLocked(const AccountId& voter, VoterAccount& account,
                                     Timestamp now) {
    for (auto it = account.reservations.begin(); it != account.reservations.end();) {
        if (IsLapsedLocked(voter, it->first, now)) {
            it = account.reservations.erase(it);
        } else {
            ++it;
        }
    }
}

// ============================================================================
// Poll Lifecycle
// ============================================================================

PollId VotingEngine::StartPoll(int64_t voteQuorum, int64_t commitDuration,
                               int64_t revealDuration) {
    std::lock_guard<std::mutex> lock(mutex_);

    Timestamp now = clock_.Now();

    Poll poll;
    poll.id = nextPollId_++;
    poll.voteQuorum = voteQuorum;
    poll.commitEndTime = now + commitDuration;
    poll.revealEndTime = poll.commitEndTime + revealDuration;

    LOG_DEBUG(util::LogCategory::VOTING) << "Started " << poll.ToString();

    PollId id = poll.id;
    polls_.emplace(id, std::move(poll));
    return id;
}

Status VotingEngine::DiscardPoll(PollId pollId) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto it = polls_.find(pollId);
    if (it == polls_.end()) {
        return Status::Failure(ErrorCode::PollNotFound);
    }

    for (const auto& [voter, ballot] : it->second.ballots) {
        auto accountIt = voters_.find(voter);
        if (accountIt != voters_.end()) {
            accountIt->second.reservations.erase(pollId);
        }
    }

    polls_.erase(it);
    if (pollId + 1 == nextPollId_) {
        --nextPollId_;
    }
    return Status::Success();
}

// ============================================================================
// Voting Rights
// ============================================================================

Status VotingEngine::RequestVotingRights(const AccountId& voter, Amount amount) {
    if (amount <= 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = voters_.find(voter);
    Amount current = (it == voters_.end()) ? 0 : it->second.votingRights;
    auto rights = CheckedAdd(current, amount);
    if (!rights) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    Status status = ledger_.Lock(voter, amount);
    if (!status) {
        LOG_DEBUG(util::LogCategory::VOTING)
            << "Voting rights request by " << voter.ToShortHex()
            << " failed: " << status.ToString();
        return status;
    }

    voters_[voter].votingRights = *rights;
    LOG_INFO(util::LogCategory::VOTING)
        << voter.ToShortHex() << " locked " << FormatAmount(amount)
        << " voting rights";
    return Status::Success();
}

Status VotingEngine::WithdrawVotingRights(const AccountId& voter, Amount amount) {
    if (amount <= 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    std::lock_guard<std::mutex> lock(mutex_);

    auto it = voters_.find(voter);
    if (it == voters_.end()) {
        return Status::Failure(ErrorCode::InsufficientLockedBalance);
    }
    VoterAccount& account = it->second;

    Amount available = account.votingRights -
                       ReservedLocked(voter, account, clock_.Now());
    if (amount > available) {
        LOG_DEBUG(util::LogCategory::VOTING)
            << "Withdraw of " << amount << " by " << voter.ToShortHex()
            << " exceeds unreserved rights " << available;
        return Status::Failure(ErrorCode::InsufficientLockedBalance);
    }

    Status status = ledger_.Unlock(voter, amount);
    if (!status) {
        return status;
    }

    account.votingRights -= amount;
    PruneLapsedLocked(voter, account, clock_.Now());
    LOG_INFO(util::LogCategory::VOTING)
        << voter.ToShortHex() << " withdrew " << FormatAmount(amount)
        << " voting rights";
    return Status::Success();
}

// ============================================================================
// Commit / Reveal
// ============================================================================

Status VotingEngine::CommitVote(PollId pollId, const AccountId& voter,
                                const Commitment& commitment, Amount weight) {
    std::lock_guard<std::mutex> lock(mutex_);

    Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }

    Timestamp now = clock_.Now();
    if (!poll->IsCommitOpen(now)) {
        LOG_DEBUG(util::LogCategory::VOTING)
            << "Commit to poll " << pollId << " after commit window";
        return Status::Failure(ErrorCode::CommitPeriodClosed);
    }
    if (weight <= 0) {
        return Status::Failure(ErrorCode::InvalidAmount);
    }

    VoterAccount current;
    auto accountIt = voters_.find(voter);
    if (accountIt != voters_.end()) {
        current = accountIt->second;
    }

    // A re-commit replaces this poll's reservation rather than adding to it
    auto required = CheckedAdd(ReservedLocked(voter, current, now, pollId), weight);
    if (!required) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    Amount rights = current.votingRights;
    if (*required > rights) {
        Amount shortfall = *required - rights;
        Status status = ledger_.Lock(voter, shortfall);
        if (!status) {
            LOG_DEBUG(util::LogCategory::VOTING)
                << "Commit by " << voter.ToShortHex() << " needs " << shortfall
                << " more tokens than available";
            return Status::Failure(ErrorCode::InsufficientVotingTokens);
        }
        rights += shortfall;
    }

    VoterAccount& account = voters_[voter];
    account.votingRights = rights;
    account.reservations[pollId] = weight;
    PruneLapsedLocked(voter, account, now);

    Ballot& ballot = poll->ballots[voter];
    ballot = Ballot();
    ballot.commitment = commitment;
    ballot.weight = weight;

    LOG_INFO(util::LogCategory::VOTING)
        << voter.ToShortHex() << " committed " << FormatAmount(weight)
        << " to poll " << pollId;
    return Status::Success();
}

Status VotingEngine::RevealVote(PollId pollId, const AccountId& voter,
                                VoteChoice choice, Salt salt) {
    std::lock_guard<std::mutex> lock(mutex_);

    Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }
    if (!poll->IsRevealOpen(clock_.Now())) {
        return Status::Failure(ErrorCode::RevealPeriodNotOpen);
    }

    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end()) {
        return Status::Failure(ErrorCode::NoCommitmentFound);
    }
    Ballot& ballot = it->second;
    if (ballot.IsRevealed()) {
        return Status::Failure(ErrorCode::AlreadyRevealed);
    }

    Commitment expected = scheme_.Compute(choice, ballot.weight, salt);
    if (!scheme_.Matches(expected, ballot.commitment)) {
        LOG_DEBUG(util::LogCategory::VOTING)
            << "Reveal by " << voter.ToShortHex() << " for poll " << pollId
            << " does not match commitment";
        return Status::Failure(ErrorCode::RevealMismatch);
    }

    Amount& tally = (choice == VoteChoice::For) ? poll->votesFor : poll->votesAgainst;
    auto updated = CheckedAdd(tally, ballot.weight);
    if (!updated) {
        return Status::Failure(ErrorCode::AmountOverflow);
    }

    tally = *updated;
    ballot.revealedChoice = choice;
    ballot.revealedWeight = ballot.weight;

    LOG_INFO(util::LogCategory::VOTING)
        << voter.ToShortHex() << " revealed " << VoteChoiceToString(choice)
        << " with " << FormatAmount(ballot.weight) << " on poll " << pollId;
    return Status::Success();
}

Status VotingEngine::RescueTokens(PollId pollId, const AccountId& voter) {
    std::lock_guard<std::mutex> lock(mutex_);

    Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }
    if (!poll->HasEnded(clock_.Now())) {
        return Status::Failure(ErrorCode::RevealPeriodNotOver);
    }

    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end() || it->second.rescued) {
        return Status::Failure(ErrorCode::NoCommitmentFound);
    }
    if (it->second.IsRevealed()) {
        return Status::Failure(ErrorCode::AlreadyRevealed);
    }

    auto accountIt = voters_.find(voter);
    if (accountIt != voters_.end()) {
        accountIt->second.reservations.erase(pollId);
    }
    it->second.rescued = true;

    LOG_INFO(util::LogCategory::VOTING)
        << voter.ToShortHex() << " rescued " << FormatAmount(it->second.weight)
        << " from poll " << pollId;
    return Status::Success();
}

// ============================================================================
// Settlement Hooks
// ============================================================================

Status VotingEngine::MarkClaimed(PollId pollId, const AccountId& voter) {
    std::lock_guard<std::mutex> lock(mutex_);

    Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }
    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end()) {
        return Status::Failure(ErrorCode::NoCommitmentFound);
    }
    if (it->second.claimed) {
        return Status::Failure(ErrorCode::AlreadyClaimed);
    }

    it->second.claimed = true;
    return Status::Success();
}

Status VotingEngine::RevertClaim(PollId pollId, const AccountId& voter) {
    std::lock_guard<std::mutex> lock(mutex_);

    Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Status::Failure(ErrorCode::PollNotFound);
    }
    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end()) {
        return Status::Failure(ErrorCode::NoCommitmentFound);
    }

    it->second.claimed = false;
    return Status::Success();
}

// ============================================================================
// Queries
// ============================================================================

bool VotingEngine::PollExists(PollId pollId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polls_.count(pollId) > 0;
}

std::optional<Poll> VotingEngine::GetPoll(PollId pollId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return std::nullopt;
    }
    return *poll;
}

std::optional<Ballot> VotingEngine::GetBallot(PollId pollId, const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return std::nullopt;
    }
    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end()) {
        return std::nullopt;
    }
    return it->second;
}

std::optional<bool> VotingEngine::IsPassed(PollId pollId) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Poll* poll = FindPollLocked(pollId);
    if (!poll || !poll->HasEnded(clock_.Now())) {
        return std::nullopt;
    }
    return poll->IsPassed();
}

Result<Amount> VotingEngine::GetNumPassingTokens(PollId pollId, const AccountId& voter,
                                                 Salt salt) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Result<Amount>::Failure(ErrorCode::PollNotFound);
    }
    if (!poll->HasEnded(clock_.Now())) {
        return Result<Amount>::Failure(ErrorCode::RevealPeriodNotOver);
    }

    auto it = poll->ballots.find(voter);
    if (it == poll->ballots.end() || !it->second.IsRevealed()) {
        return Result<Amount>::Failure(ErrorCode::VoteDidNotMatchWinner);
    }
    const Ballot& ballot = it->second;

    Commitment expected = scheme_.Compute(*ballot.revealedChoice,
                                          *ballot.revealedWeight, salt);
    if (!scheme_.Matches(expected, ballot.commitment)) {
        return Result<Amount>::Failure(ErrorCode::RevealMismatch);
    }
    if (*ballot.revealedChoice != poll->WinningChoice()) {
        return Result<Amount>::Failure(ErrorCode::VoteDidNotMatchWinner);
    }

    return Result<Amount>::Success(*ballot.revealedWeight);
}

Result<Amount> VotingEngine::GetTotalNumberOfTokensForWinningOption(PollId pollId) const {
    std::lock_guard<std::mutex> lock(mutex_);

    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return Result<Amount>::Failure(ErrorCode::PollNotFound);
    }
    if (!poll->HasEnded(clock_.Now())) {
        return Result<Amount>::Failure(ErrorCode::RevealPeriodNotOver);
    }
    return Result<Amount>::Success(poll->TotalWinningTokens());
}

Amount VotingEngine::GetVotingRights(const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voters_.find(voter);
    return it == voters_.end() ? 0 : it->second.votingRights;
}

Amount VotingEngine::GetLockedTokens(const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voters_.find(voter);
    if (it == voters_.end()) {
        return 0;
    }
    return ReservedLocked(voter, it->second, clock_.Now());
}

size_t VotingEngine::GetReservationCount(const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = voters_.find(voter);
    return it == voters_.end() ? 0 : it->second.reservations.size();
}

bool VotingEngine::HasClaimed(PollId pollId, const AccountId& voter) const {
    std::lock_guard<std::mutex> lock(mutex_);
    const Poll* poll = FindPollLocked(pollId);
    if (!poll) {
        return false;
    }
    auto it = poll->ballots.find(voter);
    return it != poll->ballots.end() && it->second.claimed;
}

size_t VotingEngine::PollCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return polls_.size();
}

size_t VotingEngine::VoterCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return voters_.size();
}

} // namespace voting
} // namespace curator
