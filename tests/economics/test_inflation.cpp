// CURATOR - Inflation Schedule Tests
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <gtest/gtest.h>

#include <curator/economics/inflation.h>
#include <curator/params/parameters.h>

#include <cstdint>

namespace curator {
namespace economics {
namespace test {

TEST(InflationTest, HalvesEachInterval) {
    InflationSchedule schedule(100, 10, 10);

    EXPECT_EQ(schedule.GetEmission(0), 100);
    EXPECT_EQ(schedule.GetEmission(9), 100);
    EXPECT_EQ(schedule.GetEmission(10), 50);
    EXPECT_EQ(schedule.GetEmission(20), 25);
    EXPECT_EQ(schedule.GetEmission(30), 12);

    // 100 >> 4 = 6, held at the floor
    EXPECT_EQ(schedule.GetEmission(40), 10);
    EXPECT_EQ(schedule.GetEmission(1000000), 10);
}

TEST(InflationTest, HalvingCounters) {
    InflationSchedule schedule(100, 10, 0);
    EXPECT_EQ(schedule.GetHalvingCount(0), 0u);
    EXPECT_EQ(schedule.GetHalvingCount(25), 2u);
    EXPECT_EQ(schedule.GetResolutionsUntilHalving(0), 10u);
    EXPECT_EQ(schedule.GetResolutionsUntilHalving(25), 5u);
}

TEST(InflationTest, ZeroRewardDisablesInflation) {
    InflationSchedule schedule(0, 10, 5);
    EXPECT_EQ(schedule.GetFloor(), 0);
    EXPECT_EQ(schedule.GetEmission(0), 0);
    EXPECT_EQ(schedule.GetCumulativeEmission(100), 0);
}

TEST(InflationTest, ConstructorClamps) {
    InflationSchedule schedule(100, 0, 500);
    EXPECT_EQ(schedule.GetHalvingInterval(), 1u);
    EXPECT_EQ(schedule.GetFloor(), 100);
    EXPECT_EQ(schedule.GetEmission(5), 100);
}

TEST(InflationTest, LargeHalvingCount) {
    InflationSchedule schedule(MAX_MONEY, 1, 0);
    EXPECT_EQ(schedule.GetEmission(62), MAX_MONEY >> 62);
    EXPECT_EQ(schedule.GetEmission(63), 0);
    EXPECT_EQ(schedule.GetEmission(UINT64_MAX), 0);
}

TEST(InflationTest, CumulativeEmission) {
    InflationSchedule schedule(100, 10, 10);
    EXPECT_EQ(schedule.GetCumulativeEmission(0), 0);
    EXPECT_EQ(schedule.GetCumulativeEmission(1), 100);
    EXPECT_EQ(schedule.GetCumulativeEmission(25), 10 * 100 + 10 * 50 + 5 * 25);
}

TEST(InflationTest, CumulativeEmissionAtFloor) {
    InflationSchedule schedule(100, 10, 30);
    EXPECT_EQ(schedule.GetCumulativeEmission(35), 1000 + 500 + 300 + 150);

    Amount sum = 0;
    for (uint64_t i = 0; i < 57; ++i) {
        sum += schedule.GetEmission(i);
    }
    EXPECT_EQ(schedule.GetCumulativeEmission(57), sum);
}

TEST(InflationTest, CumulativeEmissionCapped) {
    InflationSchedule schedule(MAX_MONEY, 1000000000, MAX_MONEY);
    EXPECT_EQ(schedule.GetCumulativeEmission(3), MAX_MONEY);
}

TEST(InflationTest, FromParameters) {
    auto params = params::Parameterizer::Create({
        {"inflationReward", 400}, {"inflationHalving", 4}, {"inflationFloor", 50}});
    ASSERT_TRUE(params.IsOk());

    InflationSchedule schedule = InflationSchedule::FromParameters(*params);
    EXPECT_EQ(schedule.GetInitialReward(), 400);
    EXPECT_EQ(schedule.GetHalvingInterval(), 4u);
    EXPECT_EQ(schedule.GetFloor(), 50);
    EXPECT_EQ(schedule.GetEmission(4), 200);
    EXPECT_EQ(schedule.GetEmission(12), 50);
}

} // namespace test
} // namespace economics
} // namespace curator
