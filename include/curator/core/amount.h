// CURATOR - Checked Amount Arithmetic
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Token amounts are non-negative 64-bit integers. Every arithmetic step on
// balances, pools and tallies goes through these helpers so that overflow
// is reported instead of wrapping.

#ifndef CURATOR_CORE_AMOUNT_H
#define CURATOR_CORE_AMOUNT_H

#include <curator/core/types.h>

#include <optional>
#include <string>

namespace curator {

/// a + b, nullopt on overflow or negative operands
std::optional<Amount> CheckedAdd(Amount a, Amount b);

/// a - b, nullopt if the result would be negative
std::optional<Amount> CheckedSub(Amount a, Amount b);

/// a * b, nullopt on overflow or negative operands
std::optional<Amount> CheckedMul(Amount a, Amount b);

/**
 * floor(a * b / c) computed with a 128-bit intermediate product.
 *
 * @return nullopt if c is zero, an operand is negative, or the quotient
 *         does not fit in an Amount
 */
std::optional<Amount> MulDiv(Amount a, Amount b, Amount c);

/// Compare a * b against c * d without overflow (-1, 0, 1)
int CompareProducts(uint64_t a, uint64_t b, uint64_t c, uint64_t d);

/// a * pct / 100, rounded down
std::optional<Amount> PercentOf(Amount a, int64_t pct);

/// Format an amount as "<whole>.<frac>" using COIN decimals
std::string FormatAmount(Amount amount);

} // namespace curator

#endif // CURATOR_CORE_AMOUNT_H
