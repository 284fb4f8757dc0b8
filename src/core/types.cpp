// CURATOR - Core Types Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/core/types.h>

#include <stdexcept>

namespace curator {

template<size_t BITS>
std::string BaseHash<BITS>::ToHex() const {
    static const char hexChars[] = "0123456789abcdef";

    std::string result;
    result.reserve(SIZE * 2);
    for (size_t i = 0; i < SIZE; ++i) {
        result.push_back(hexChars[data_[i] >> 4]);
        result.push_back(hexChars[data_[i] & 0x0F]);
    }
    return result;
}

template<size_t BITS>
BaseHash<BITS> BaseHash<BITS>::FromHex(const std::string& hex) {
    if (hex.length() != SIZE * 2) {
        throw std::invalid_argument("Invalid hex string length for hash");
    }

    auto hexCharToNibble = [](char c) -> Byte {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        throw std::invalid_argument("Invalid hex character");
    };

    BaseHash result;
    for (size_t i = 0; i < SIZE; ++i) {
        Byte high = hexCharToNibble(hex[i * 2]);
        Byte low = hexCharToNibble(hex[i * 2 + 1]);
        result.data_[i] = static_cast<Byte>((high << 4) | low);
    }
    return result;
}

// Explicit instantiations
template class BaseHash<160>;
template class BaseHash<256>;

} // namespace curator
