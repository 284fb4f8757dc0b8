// CURATOR - Vote Commitments Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/voting/commitment.h>
#include <curator/crypto/hash.h>

#include <algorithm>
#include <array>
#include <cctype>

namespace curator {
namespace voting {

namespace {

void WriteLE64(Byte* out, uint64_t value) {
    for (int i = 0; i < 8; ++i) {
        out[i] = static_cast<Byte>(value >> (8 * i));
    }
}

} // namespace

const char* VoteChoiceToString(VoteChoice choice) {
    switch (choice) {
        case VoteChoice::Against: return "Against";
        case VoteChoice::For: return "For";
        default: return "Unknown";
    }
}

std::optional<VoteChoice> ParseVoteChoice(const std::string& str) {
    std::string lower = str;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "for" || lower == "1") return VoteChoice::For;
    if (lower == "against" || lower == "0") return VoteChoice::Against;
    return std::nullopt;
}

Commitment Sha256CommitmentScheme::Compute(VoteChoice choice, Amount weight,
                                           Salt salt) const {
    std::array<Byte, PREIMAGE_SIZE> preimage;
    preimage[0] = static_cast<Byte>(choice);
    WriteLE64(preimage.data() + 1, static_cast<uint64_t>(weight));
    WriteLE64(preimage.data() + 9, salt);

    Hash256 digest = SHA256Hash(preimage.data(), preimage.size());
    return Commitment(digest.begin(), digest.end());
}

bool Sha256CommitmentScheme::Matches(const Commitment& a, const Commitment& b) const {
    return ConstantTimeEqual(a, b);
}

} // namespace voting
} // namespace curator
