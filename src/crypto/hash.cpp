// CURATOR - Hash Functions Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/crypto/hash.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <memory>
#include <stdexcept>

namespace curator {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { EVP_MD_CTX_free(ctx); }
};

} // namespace

Hash256 SHA256Hash(const Byte* data, size_t len) {
    std::unique_ptr<EVP_MD_CTX, MdCtxDeleter> ctx(EVP_MD_CTX_new());
    if (!ctx) {
        throw std::runtime_error("EVP_MD_CTX_new failed");
    }

    Byte out[EVP_MAX_MD_SIZE];
    unsigned int outLen = 0;
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data, len) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), out, &outLen) != 1 ||
        outLen != SHA256_OUTPUT_SIZE) {
        throw std::runtime_error("SHA256 digest failed");
    }

    return Hash256(out, outLen);
}

Hash256 SHA256Hash(const std::string& str) {
    return SHA256Hash(reinterpret_cast<const Byte*>(str.data()), str.size());
}

ListingHash ListingHashFromName(const std::string& name) {
    return ListingHash(SHA256Hash(name));
}

AccountId AccountIdFromName(const std::string& name) {
    Hash256 digest = SHA256Hash(name);
    return AccountId(digest.data(), AccountId::SIZE);
}

bool ConstantTimeEqual(const std::vector<Byte>& a, const std::vector<Byte>& b) {
    if (a.size() != b.size()) {
        return false;
    }
    if (a.empty()) {
        return true;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

} // namespace curator
