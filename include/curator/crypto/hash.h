// CURATOR - Hash Functions
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// SHA-256 via OpenSSL EVP, plus helpers deriving identifiers from names.

#ifndef CURATOR_CRYPTO_HASH_H
#define CURATOR_CRYPTO_HASH_H

#include <curator/core/types.h>

#include <string>
#include <vector>

namespace curator {

/// Output size in bytes
constexpr size_t SHA256_OUTPUT_SIZE = 32;

/// Compute SHA256 hash of data in a single call
/// @throws std::runtime_error if the OpenSSL digest context fails
Hash256 SHA256Hash(const Byte* data, size_t len);

/// Compute SHA256 hash of a vector
inline Hash256 SHA256Hash(const std::vector<Byte>& data) {
    return SHA256Hash(data.data(), data.size());
}

/// Compute SHA256 hash of a string
Hash256 SHA256Hash(const std::string& str);

/// Listing identifier for a name (e.g. a domain), SHA256(name)
ListingHash ListingHashFromName(const std::string& name);

/// Account identifier for a name, first 20 bytes of SHA256(name)
AccountId AccountIdFromName(const std::string& name);

/// Constant-time comparison of two byte sequences
bool ConstantTimeEqual(const std::vector<Byte>& a, const std::vector<Byte>& b);

} // namespace curator

#endif // CURATOR_CRYPTO_HASH_H
