// CURATOR - Polls and Ballots Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/voting/poll.h>
#include <curator/core/amount.h>

#include <sstream>

namespace curator {
namespace voting {

const char* PollStageToString(PollStage stage) {
    switch (stage) {
        case PollStage::Commit: return "Commit";
        case PollStage::Reveal: return "Reveal";
        case PollStage::Ended: return "Ended";
        default: return "Unknown";
    }
}

PollStage Poll::GetStage(Timestamp now) const {
    if (IsCommitOpen(now)) {
        return PollStage::Commit;
    }
    if (IsRevealOpen(now)) {
        return PollStage::Reveal;
    }
    return PollStage::Ended;
}

bool Poll::IsPassed() const {
    // Ties go to the challenger whatever the quorum
    if (votesFor <= votesAgainst) {
        return false;
    }
    uint64_t forVotes = static_cast<uint64_t>(votesFor);
    uint64_t total = forVotes + static_cast<uint64_t>(votesAgainst);
    return CompareProducts(100, forVotes, static_cast<uint64_t>(voteQuorum), total) > 0;
}

VoteChoice Poll::WinningChoice() const {
    return IsPassed() ? VoteChoice::For : VoteChoice::Against;
}

Amount Poll::TotalWinningTokens() const {
    return IsPassed() ? votesFor : votesAgainst;
}

std::string Poll::ToString() const {
    std::ostringstream oss;
    oss << "Poll(id=" << id
        << ", quorum=" << voteQuorum
        << ", commitEnd=" << commitEndTime
        << ", revealEnd=" << revealEndTime
        << ", for=" << votesFor
        << ", against=" << votesAgainst
        << ", ballots=" << ballots.size() << ")";
    return oss.str();
}

} // namespace voting
} // namespace curator
