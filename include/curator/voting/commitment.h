// CURATOR - Vote Commitments
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// A commitment binds a voter to (choice, weight, salt) without revealing
// them until the reveal window.

#ifndef CURATOR_VOTING_COMMITMENT_H
#define CURATOR_VOTING_COMMITMENT_H

#include <curator/core/types.h>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace curator {
namespace voting {

/// Ballot choice. For keeps the listing, Against sides with the challenger.
enum class VoteChoice : uint8_t {
    Against = 0,
    For = 1,
};

/// Convert choice to string
const char* VoteChoiceToString(VoteChoice choice);

/// Parse choice from "for"/"against" or "1"/"0"
std::optional<VoteChoice> ParseVoteChoice(const std::string& str);

/// Opaque commitment bytes
using Commitment = std::vector<Byte>;

/// Voter-chosen secret mixed into the commitment
using Salt = uint64_t;

// ============================================================================
// Commitment Scheme
// ============================================================================

/**
 * Hiding and binding commitment primitive.
 *
 * Compute must be deterministic: the same inputs always yield the same
 * bytes.
 */
class ICommitmentScheme {
public:
    virtual ~ICommitmentScheme() = default;

    virtual Commitment Compute(VoteChoice choice, Amount weight, Salt salt) const = 0;

    /// Byte-for-byte equality
    virtual bool Matches(const Commitment& a, const Commitment& b) const = 0;
};

/**
 * SHA256(choice || weight || salt)
 *
 * choice is one byte, weight and salt are 8-byte little-endian.
 */
class Sha256CommitmentScheme : public ICommitmentScheme {
public:
    static constexpr size_t PREIMAGE_SIZE = 1 + 8 + 8;

    Commitment Compute(VoteChoice choice, Amount weight, Salt salt) const override;
    bool Matches(const Commitment& a, const Commitment& b) const override;
};

} // namespace voting
} // namespace curator

#endif // CURATOR_VOTING_COMMITMENT_H
