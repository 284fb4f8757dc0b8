// CURATOR - Registry Parameters Implementation
// Copyright (c) 2024 CURATOR Developers
// MIT License

#include <curator/params/parameters.h>
#include <curator/util/config.h>
#include <curator/util/logging.h>

#include <sstream>

namespace curator {
namespace params {

namespace {
    constexpr int64_t SECONDS_PER_DAY = 86400;
    constexpr int64_t MAX_STAGE_LENGTH = 365 * SECONDS_PER_DAY;
}

// ============================================================================
// Parameter Metadata
// ============================================================================

const char* RegistryParameterToString(RegistryParameter param) {
    switch (param) {
        case RegistryParameter::MinDeposit: return "minDeposit";
        case RegistryParameter::ApplyStageLength: return "applyStageLen";
        case RegistryParameter::CommitStageLength: return "commitStageLen";
        case RegistryParameter::RevealStageLength: return "revealStageLen";
        case RegistryParameter::DispensationPct: return "dispensationPct";
        case RegistryParameter::VoteQuorum: return "voteQuorum";
        case RegistryParameter::InflationReward: return "inflationReward";
        case RegistryParameter::InflationHalving: return "inflationHalving";
        case RegistryParameter::InflationFloor: return "inflationFloor";
        default: return "Unknown";
    }
}

std::optional<RegistryParameter> ParseRegistryParameter(const std::string& str) {
    for (int i = 0; i < static_cast<int>(RegistryParameter::MaxParameterCount); ++i) {
        auto param = static_cast<RegistryParameter>(i);
        if (str == RegistryParameterToString(param)) {
            return param;
        }
    }
    return std::nullopt;
}

int64_t GetParameterDefault(RegistryParameter param) {
    switch (param) {
        case RegistryParameter::MinDeposit: return 10 * COIN;
        case RegistryParameter::ApplyStageLength: return 600;
        case RegistryParameter::CommitStageLength: return 600;
        case RegistryParameter::RevealStageLength: return 600;
        case RegistryParameter::DispensationPct: return 50;
        case RegistryParameter::VoteQuorum: return 50;
        case RegistryParameter::InflationReward: return 10 * COIN;
        case RegistryParameter::InflationHalving: return 100;
        case RegistryParameter::InflationFloor: return COIN;
        default: return 0;
    }
}

int64_t GetParameterMin(RegistryParameter param) {
    switch (param) {
        case RegistryParameter::MinDeposit: return 1;
        case RegistryParameter::CommitStageLength: return 1;
        case RegistryParameter::RevealStageLength: return 1;
        case RegistryParameter::InflationHalving: return 1;
        default: return 0;
    }
}

int64_t GetParameterMax(RegistryParameter param) {
    switch (param) {
        case RegistryParameter::MinDeposit: return MAX_MONEY;
        case RegistryParameter::ApplyStageLength: return MAX_STAGE_LENGTH;
        case RegistryParameter::CommitStageLength: return MAX_STAGE_LENGTH;
        case RegistryParameter::RevealStageLength: return MAX_STAGE_LENGTH;
        case RegistryParameter::DispensationPct: return 100;
        case RegistryParameter::VoteQuorum: return 100;
        case RegistryParameter::InflationReward: return MAX_MONEY;
        case RegistryParameter::InflationHalving: return 1000000000;
        case RegistryParameter::InflationFloor: return MAX_MONEY;
        default: return 0;
    }
}

// ============================================================================
// Parameterizer
// ============================================================================

Parameterizer::Parameterizer() {
    for (int i = 0; i < static_cast<int>(RegistryParameter::MaxParameterCount); ++i) {
        auto param = static_cast<RegistryParameter>(i);
        parameters_[param] = GetParameterDefault(param);
    }
}

bool Parameterizer::IsValid(RegistryParameter param, int64_t value) {
    return value >= GetParameterMin(param) && value <= GetParameterMax(param);
}

Result<Parameterizer> Parameterizer::Create(const std::map<std::string, int64_t>& overrides) {
    Parameterizer result;

    for (const auto& [key, value] : overrides) {
        auto param = ParseRegistryParameter(key);
        if (!param) {
            LOG_WARN(util::LogCategory::PARAMS) << "Unknown parameter '" << key << "'";
            return Result<Parameterizer>::Failure(ErrorCode::UnknownParameter);
        }
        if (!IsValid(*param, value)) {
            LOG_WARN(util::LogCategory::PARAMS)
                << "Parameter " << key << "=" << value << " outside ["
                << GetParameterMin(*param) << ", " << GetParameterMax(*param) << "]";
            return Result<Parameterizer>::Failure(ErrorCode::InvalidParameterValue);
        }
        result.parameters_[*param] = value;
    }

    return Result<Parameterizer>::Success(result);
}

Result<Parameterizer> Parameterizer::LoadFromConfig(const util::ConfigManager& config,
                                                    const std::string& section) {
    std::map<std::string, int64_t> overrides;

    for (const auto& key : config.GetKeys(section)) {
        auto value = config.TryGetInt(key, section);
        if (!value) {
            if (!ParseRegistryParameter(key)) {
                LOG_WARN(util::LogCategory::PARAMS) << "Unknown parameter '" << key << "'";
                return Result<Parameterizer>::Failure(ErrorCode::UnknownParameter);
            }
            LOG_WARN(util::LogCategory::PARAMS)
                << "Parameter " << key << " is not an integer: "
                << config.GetString(key, "", section);
            return Result<Parameterizer>::Failure(ErrorCode::InvalidParameterValue);
        }
        overrides[key] = *value;
    }

    auto result = Create(overrides);
    if (result) {
        LOG_INFO(util::LogCategory::PARAMS)
            << "Loaded " << overrides.size() << " parameter override(s) from ["
            << section << "]";
    }
    return result;
}

Result<int64_t> Parameterizer::Get(const std::string& key) const {
    auto param = ParseRegistryParameter(key);
    if (!param) {
        return Result<int64_t>::Failure(ErrorCode::UnknownParameter);
    }
    return Result<int64_t>::Success(GetValue(*param));
}

int64_t Parameterizer::GetValue(RegistryParameter param) const {
    auto it = parameters_.find(param);
    if (it != parameters_.end()) {
        return it->second;
    }
    return GetParameterDefault(param);
}

std::map<std::string, int64_t> Parameterizer::GetAllParameters() const {
    std::map<std::string, int64_t> out;
    for (const auto& [param, value] : parameters_) {
        out[RegistryParameterToString(param)] = value;
    }
    return out;
}

std::string Parameterizer::ToString() const {
    std::ostringstream ss;
    ss << "Parameterizer{";
    bool first = true;
    for (const auto& [key, value] : GetAllParameters()) {
        if (!first) ss << ", ";
        ss << key << "=" << value;
        first = false;
    }
    ss << "}";
    return ss.str();
}

} // namespace params
} // namespace curator
