// CURATOR - Amount Arithmetic Tests
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <gtest/gtest.h>

#include <curator/core/amount.h>

#include <limits>

namespace curator {
namespace {

constexpr Amount MAX_AMOUNT = std::numeric_limits<Amount>::max();

// ============================================================================
// Checked Add / Sub / Mul
// ============================================================================

TEST(AmountTest, CheckedAdd) {
    EXPECT_EQ(CheckedAdd(2, 3), 5);
    EXPECT_EQ(CheckedAdd(0, 0), 0);
    EXPECT_EQ(CheckedAdd(MAX_AMOUNT - 1, 1), MAX_AMOUNT);
    EXPECT_FALSE(CheckedAdd(MAX_AMOUNT, 1).has_value());
    EXPECT_FALSE(CheckedAdd(-1, 5).has_value());
}

TEST(AmountTest, CheckedSub) {
    EXPECT_EQ(CheckedSub(10, 4), 6);
    EXPECT_EQ(CheckedSub(4, 4), 0);
    EXPECT_FALSE(CheckedSub(4, 5).has_value());
    EXPECT_FALSE(CheckedSub(4, -1).has_value());
}

TEST(AmountTest, CheckedMul) {
    EXPECT_EQ(CheckedMul(6, 7), 42);
    EXPECT_EQ(CheckedMul(MAX_AMOUNT, 1), MAX_AMOUNT);
    EXPECT_EQ(CheckedMul(0, MAX_AMOUNT), 0);
    EXPECT_FALSE(CheckedMul(MAX_AMOUNT, 2).has_value());
    EXPECT_FALSE(CheckedMul(int64_t(1) << 32, int64_t(1) << 31).has_value());
}

// ============================================================================
// MulDiv
// ============================================================================

TEST(AmountTest, MulDivFloors) {
    EXPECT_EQ(MulDiv(10, 1, 3), 3);
    EXPECT_EQ(MulDiv(100, 2, 3), 66);
    EXPECT_EQ(MulDiv(7, 0, 3), 0);
}

TEST(AmountTest, MulDivUsesWideIntermediate) {
    // a * b overflows 64 bits but the quotient fits
    Amount a = MAX_MONEY;
    Amount b = 3 * COIN;
    EXPECT_EQ(MulDiv(a, b, b), a);
    EXPECT_EQ(MulDiv(a, 1000, 1000), a);
    EXPECT_EQ(MulDiv(a, 10, 20), a / 2);
}

TEST(AmountTest, MulDivRejectsBadInput) {
    EXPECT_FALSE(MulDiv(1, 1, 0).has_value());
    EXPECT_FALSE(MulDiv(-1, 1, 1).has_value());
    EXPECT_FALSE(MulDiv(MAX_AMOUNT, MAX_AMOUNT, 1).has_value());
}

TEST(AmountTest, MulDivShareSumNeverExceedsPool) {
    Amount pool = 999;
    Amount weights[] = {333, 333, 334};
    Amount paid = 0;
    for (Amount w : weights) {
        paid += *MulDiv(pool, w, 1000);
    }
    EXPECT_EQ(paid, 332 + 332 + 333);
    EXPECT_LE(paid, pool);
}

// ============================================================================
// CompareProducts / PercentOf
// ============================================================================

TEST(AmountTest, CompareProducts) {
    EXPECT_EQ(CompareProducts(100, 3, 50, 5), 1);   // 300 > 250
    EXPECT_EQ(CompareProducts(100, 2, 50, 4), 0);   // 200 == 200
    EXPECT_EQ(CompareProducts(100, 0, 50, 0), 0);
    EXPECT_EQ(CompareProducts(1, 1, 1, 2), -1);

    uint64_t big = std::numeric_limits<uint64_t>::max();
    EXPECT_EQ(CompareProducts(big, big, big, big - 1), 1);
}

TEST(AmountTest, PercentOf) {
    EXPECT_EQ(PercentOf(10 * COIN, 50), 5 * COIN);
    EXPECT_EQ(PercentOf(99, 50), 49);
    EXPECT_EQ(PercentOf(99, 100), 99);
    EXPECT_EQ(PercentOf(99, 0), 0);
    EXPECT_FALSE(PercentOf(99, 101).has_value());
}

TEST(AmountTest, FormatAmount) {
    EXPECT_EQ(FormatAmount(COIN), "1.00000000");
    EXPECT_EQ(FormatAmount(150000000), "1.50000000");
    EXPECT_EQ(FormatAmount(1), "0.00000001");
    EXPECT_EQ(FormatAmount(-COIN), "-1.00000000");
}

} // namespace
} // namespace curator
