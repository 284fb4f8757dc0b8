// CURATOR - Checked Amount Arithmetic Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/core/amount.h>

#include <iomanip>
#include <limits>
#include <sstream>

namespace curator {

namespace {

/// 128-bit unsigned value as two 64-bit limbs
struct Wide {
    uint64_t hi{0};
    uint64_t lo{0};
};

Wide WideMul(uint64_t a, uint64_t b) {
    const uint64_t mask = 0xFFFFFFFFULL;
    uint64_t aLo = a & mask, aHi = a >> 32;
    uint64_t bLo = b & mask, bHi = b >> 32;

    uint64_t p0 = aLo * bLo;
    uint64_t p1 = aLo * bHi;
    uint64_t p2 = aHi * bLo;
    uint64_t p3 = aHi * bHi;

    uint64_t middle = (p0 >> 32) + (p1 & mask) + (p2 & mask);

    Wide result;
    result.lo = (middle << 32) | (p0 & mask);
    result.hi = p3 + (p1 >> 32) + (p2 >> 32) + (middle >> 32);
    return result;
}

bool WideLess(const Wide& x, const Wide& y) {
    return x.hi < y.hi || (x.hi == y.hi && x.lo < y.lo);
}

/// Shift-subtract long division of a 128-bit value by a 64-bit divisor.
/// Returns false if the quotient exceeds 64 bits.
bool WideDiv(const Wide& n, uint64_t d, uint64_t& quotient) {
    if (n.hi >= d) {
        return false;
    }
    uint64_t rem = n.hi;
    uint64_t q = 0;
    for (int i = 63; i >= 0; --i) {
        bool carry = (rem >> 63) != 0;
        rem = (rem << 1) | ((n.lo >> i) & 1);
        if (carry || rem >= d) {
            rem -= d;
            q |= (1ULL << i);
        }
    }
    quotient = q;
    return true;
}

} // namespace

std::optional<Amount> CheckedAdd(Amount a, Amount b) {
    if (a < 0 || b < 0) {
        return std::nullopt;
    }
    if (a > std::numeric_limits<Amount>::max() - b) {
        return std::nullopt;
    }
    return a + b;
}

std::optional<Amount> CheckedSub(Amount a, Amount b) {
    if (a < 0 || b < 0 || b > a) {
        return std::nullopt;
    }
    return a - b;
}

std::optional<Amount> CheckedMul(Amount a, Amount b) {
    if (a < 0 || b < 0) {
        return std::nullopt;
    }
    Wide product = WideMul(static_cast<uint64_t>(a), static_cast<uint64_t>(b));
    if (product.hi != 0 ||
        product.lo > static_cast<uint64_t>(std::numeric_limits<Amount>::max())) {
        return std::nullopt;
    }
    return static_cast<Amount>(product.lo);
}

std::optional<Amount> MulDiv(Amount a, Amount b, Amount c) {
    if (a < 0 || b < 0 || c <= 0) {
        return std::nullopt;
    }
    Wide product = WideMul(static_cast<uint64_t>(a), static_cast<uint64_t>(b));
    uint64_t quotient = 0;
    if (!WideDiv(product, static_cast<uint64_t>(c), quotient)) {
        return std::nullopt;
    }
    if (quotient > static_cast<uint64_t>(std::numeric_limits<Amount>::max())) {
        return std::nullopt;
    }
    return static_cast<Amount>(quotient);
}

int CompareProducts(uint64_t a, uint64_t b, uint64_t c, uint64_t d) {
    Wide left = WideMul(a, b);
    Wide right = WideMul(c, d);
    if (WideLess(left, right)) return -1;
    if (WideLess(right, left)) return 1;
    return 0;
}

std::optional<Amount> PercentOf(Amount a, int64_t pct) {
    if (pct < 0 || pct > 100) {
        return std::nullopt;
    }
    return MulDiv(a, pct, 100);
}

std::string FormatAmount(Amount amount) {
    std::ostringstream ss;
    if (amount < 0) {
        ss << "-";
        amount = -amount;
    }
    ss << (amount / COIN) << "." << std::setfill('0') << std::setw(8)
       << (amount % COIN);
    return ss.str();
}

} // namespace curator
