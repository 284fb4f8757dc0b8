// CURATOR - Core Types Header
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// This file defines fundamental types used throughout CURATOR.

#ifndef CURATOR_CORE_TYPES_H
#define CURATOR_CORE_TYPES_H

#include <array>
#include <cstddef>
#include <cstdint>
#include <cstring>
#include <string>
#include <vector>

namespace curator {

// ============================================================================
// Basic Types
// ============================================================================

/// Single byte type
using Byte = uint8_t;

/// Token amount in smallest indivisible units
using Amount = int64_t;

/// Timestamp (Unix epoch seconds)
using Timestamp = int64_t;

/// Constants
constexpr Amount COIN = 100000000LL;  // 1 token = 100 million base units
constexpr Amount MAX_MONEY = 21000000000LL * COIN;

/// Check if amount is in valid range
inline bool MoneyRange(Amount value) {
    return value >= 0 && value <= MAX_MONEY;
}

// ============================================================================
// Hash Templates
// ============================================================================

/// Fixed-size opaque identifier
template<size_t BITS>
class BaseHash {
public:
    static constexpr size_t SIZE = BITS / 8;

    /// Default constructor - creates null hash
    BaseHash() noexcept {
        data_.fill(0);
    }

    /// Construct from byte array
    explicit BaseHash(const std::array<Byte, SIZE>& data) noexcept
        : data_(data) {}

    /// Construct from raw bytes (short input is zero padded)
    BaseHash(const Byte* data, size_t len) noexcept {
        data_.fill(0);
        if (data && len > 0) {
            std::memcpy(data_.data(), data, len < SIZE ? len : SIZE);
        }
    }

    bool IsNull() const noexcept {
        for (auto b : data_) {
            if (b != 0) return false;
        }
        return true;
    }

    void SetNull() noexcept {
        data_.fill(0);
    }

    constexpr size_t size() const noexcept { return SIZE; }

    Byte& operator[](size_t idx) { return data_[idx]; }
    const Byte& operator[](size_t idx) const { return data_[idx]; }

    Byte* data() noexcept { return data_.data(); }
    const Byte* data() const noexcept { return data_.data(); }

    const Byte* begin() const noexcept { return data_.data(); }
    const Byte* end() const noexcept { return data_.data() + SIZE; }

    bool operator==(const BaseHash& other) const noexcept {
        return data_ == other.data_;
    }

    bool operator!=(const BaseHash& other) const noexcept {
        return !(*this == other);
    }

    bool operator<(const BaseHash& other) const noexcept {
        return data_ < other.data_;
    }

    /// Convert to lowercase hex string (storage order)
    std::string ToHex() const;

    /// Short form for log lines (first 8 hex chars)
    std::string ToShortHex() const { return ToHex().substr(0, 8); }

    /// Create from hex string, throws std::invalid_argument on bad input
    static BaseHash FromHex(const std::string& hex);

protected:
    std::array<Byte, SIZE> data_;
};

// ============================================================================
// Specific Hash Types
// ============================================================================

/// 256-bit hash (32 bytes)
class Hash256 : public BaseHash<256> {
public:
    using BaseHash<256>::BaseHash;
    Hash256() = default;
    Hash256(const BaseHash<256>& h) : BaseHash<256>(h) {}
};

/// 160-bit hash (20 bytes) - for account addresses
class Hash160 : public BaseHash<160> {
public:
    using BaseHash<160>::BaseHash;
    Hash160() = default;
    Hash160(const BaseHash<160>& h) : BaseHash<160>(h) {}
};

// ============================================================================
// Domain Identifiers
// ============================================================================

/// Listing identifier (content hash of the listed item)
class ListingHash : public Hash256 {
public:
    using Hash256::Hash256;
    ListingHash() = default;
    explicit ListingHash(const Hash256& h) : Hash256(h) {}
};

/// Ledger account / participant identity
using AccountId = Hash160;

/// Poll identifier (sequential, starting at 1)
using PollId = uint64_t;

/// Challenge identifier (shares the id of its poll)
using ChallengeId = uint64_t;

} // namespace curator

#endif // CURATOR_CORE_TYPES_H
