// CURATOR - Inflation Schedule Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/economics/inflation.h>
#include <curator/core/amount.h>
#include <curator/params/parameters.h>

#include <algorithm>
#include <sstream>

namespace curator {
namespace economics {

InflationSchedule::InflationSchedule(Amount initialReward, uint64_t halvingInterval,
                                     Amount floor)
    : initialReward_(std::max<Amount>(initialReward, 0))
    , halvingInterval_(std::max<uint64_t>(halvingInterval, 1))
    , floor_(std::min(std::max<Amount>(floor, 0), std::max<Amount>(initialReward, 0))) {}

InflationSchedule InflationSchedule::FromParameters(const params::IParameterStore& params) {
    using params::RegistryParameter;
    return InflationSchedule(
        params.GetValue(RegistryParameter::InflationReward),
        static_cast<uint64_t>(params.GetValue(RegistryParameter::InflationHalving)),
        params.GetValue(RegistryParameter::InflationFloor));
}

uint64_t InflationSchedule::GetHalvingCount(uint64_t resolvedCount) const {
    return resolvedCount / halvingInterval_;
}

uint64_t InflationSchedule::GetResolutionsUntilHalving(uint64_t resolvedCount) const {
    return halvingInterval_ - (resolvedCount % halvingInterval_);
}

Amount InflationSchedule::GetEmission(uint64_t resolvedCount) const {
    if (initialReward_ == 0) {
        return 0;
    }

    uint64_t halvings = GetHalvingCount(resolvedCount);

    // Shifting a 64-bit value by 63 or more leaves nothing but the floor
    if (halvings >= 63) {
        return floor_;
    }

    Amount emission = initialReward_ >> halvings;
    return std::max(emission, floor_);
}

Amount InflationSchedule::GetCumulativeEmission(uint64_t count) const {
    Amount total = 0;
    uint64_t current = 0;

    while (current < count) {
        uint64_t eraEnd = (GetHalvingCount(current) + 1) * halvingInterval_;
        uint64_t inEra = std::min(eraEnd, count) - current;

        Amount emission = GetEmission(current);
        auto eraTotal = CheckedMul(emission, static_cast<Amount>(inEra));
        auto sum = eraTotal ? CheckedAdd(total, *eraTotal) : std::nullopt;
        if (!sum) {
            return MAX_MONEY;
        }
        total = std::min(*sum, MAX_MONEY);

        // Once at the floor every later era emits the same amount
        if (emission == floor_ && current + inEra < count) {
            auto rest = CheckedMul(floor_, static_cast<Amount>(count - current - inEra));
            auto capped = rest ? CheckedAdd(total, *rest) : std::nullopt;
            return capped ? std::min(*capped, MAX_MONEY) : MAX_MONEY;
        }
        current += inEra;
    }

    return total;
}

std::string InflationSchedule::ToString() const {
    std::ostringstream ss;
    ss << "InflationSchedule(initial=" << FormatAmount(initialReward_)
       << ", halving=" << halvingInterval_
       << ", floor=" << FormatAmount(floor_) << ")";
    return ss.str();
}

} // namespace economics
} // namespace curator
