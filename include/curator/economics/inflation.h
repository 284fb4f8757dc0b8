// CURATOR - Inflation Schedule
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Each resolved challenge funds its inflation pool with a fresh emission.
// The emission follows a halving model with a floor so that voting keeps
// paying after many halvings.

#ifndef CURATOR_ECONOMICS_INFLATION_H
#define CURATOR_ECONOMICS_INFLATION_H

#include <curator/core/types.h>

#include <cstdint>
#include <string>

namespace curator {

namespace params {
class IParameterStore;
}

namespace economics {

/**
 * Emission per resolved challenge.
 *
 * emission(n) = max(initialReward >> (n / halvingInterval), floor)
 * where n is the number of challenges resolved before this one. The floor
 * never exceeds initialReward; an initialReward of zero disables emission.
 */
class InflationSchedule {
public:
    InflationSchedule(Amount initialReward, uint64_t halvingInterval, Amount floor);

    /// Schedule from the inflation* parameters
    static InflationSchedule FromParameters(const params::IParameterStore& params);

    /// Emission for the n-th resolution (0-based)
    Amount GetEmission(uint64_t resolvedCount) const;

    /// Halvings applied at the n-th resolution
    uint64_t GetHalvingCount(uint64_t resolvedCount) const;

    /// Resolutions remaining until the next halving
    uint64_t GetResolutionsUntilHalving(uint64_t resolvedCount) const;

    /// Sum of emissions for resolutions [0, count)
    Amount GetCumulativeEmission(uint64_t count) const;

    Amount GetInitialReward() const { return initialReward_; }
    uint64_t GetHalvingInterval() const { return halvingInterval_; }
    Amount GetFloor() const { return floor_; }

    std::string ToString() const;

private:
    Amount initialReward_;
    uint64_t halvingInterval_;
    Amount floor_;
};

} // namespace economics
} // namespace curator

#endif // CURATOR_ECONOMICS_INFLATION_H
