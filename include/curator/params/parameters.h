// CURATOR - Registry Parameters
// Copyright (c) 2024 CURATOR Developers
// MIT License
//
// Read-only access to the governance parameters the registry consumes.
// Values are fixed at construction: built-in defaults, optionally
// overridden from the [registry] section of a configuration file.

#ifndef CURATOR_PARAMS_PARAMETERS_H
#define CURATOR_PARAMS_PARAMETERS_H

#include <curator/core/result.h>
#include <curator/core/types.h>

#include <cstdint>
#include <map>
#include <optional>
#include <string>

namespace curator {

namespace util {
class ConfigManager;
}

namespace params {

// ============================================================================
// Parameters
// ============================================================================

enum class RegistryParameter {
    /// Minimum application deposit and challenge stake (base units)
    MinDeposit,

    /// Seconds an unchallenged application waits before whitelisting
    ApplyStageLength,

    /// Commit window length (seconds)
    CommitStageLength,

    /// Reveal window length (seconds)
    RevealStageLength,

    /// Percentage of the losing stake paid to the winning party
    DispensationPct,

    /// Percentage of revealed tokens "For" needed to keep a listing
    VoteQuorum,

    /// Inflation emission for the first resolved challenges (base units)
    InflationReward,

    /// Resolved challenges between emission halvings
    InflationHalving,

    /// Lowest emission per resolved challenge (base units)
    InflationFloor,

    /// Parameter count (for iteration)
    MaxParameterCount
};

/// Configuration key of a parameter (e.g. "minDeposit")
const char* RegistryParameterToString(RegistryParameter param);

/// Parse a configuration key
std::optional<RegistryParameter> ParseRegistryParameter(const std::string& str);

int64_t GetParameterDefault(RegistryParameter param);
int64_t GetParameterMin(RegistryParameter param);
int64_t GetParameterMax(RegistryParameter param);

/// Default section read by Parameterizer::LoadFromConfig
constexpr const char* REGISTRY_CONFIG_SECTION = "registry";

// ============================================================================
// Parameter Store Interface
// ============================================================================

class IParameterStore {
public:
    virtual ~IParameterStore() = default;

    /// Look up by configuration key (UnknownParameter if not a key)
    virtual Result<int64_t> Get(const std::string& key) const = 0;

    /// Typed lookup
    virtual int64_t GetValue(RegistryParameter param) const = 0;
};

// ============================================================================
// Parameterizer
// ============================================================================

/**
 * Immutable parameter set.
 *
 * Every value lies within [GetParameterMin, GetParameterMax].
 */
class Parameterizer : public IParameterStore {
public:
    /// All defaults
    Parameterizer();

    /**
     * Defaults with overrides applied.
     *
     * Errors: UnknownParameter for a key that names no parameter,
     *         InvalidParameterValue for an out-of-range value
     */
    static Result<Parameterizer> Create(const std::map<std::string, int64_t>& overrides);

    /**
     * Defaults overridden by every key of a configuration section.
     *
     * Errors: UnknownParameter, InvalidParameterValue (also for values
     *         that are not whole numbers)
     */
    static Result<Parameterizer> LoadFromConfig(const util::ConfigManager& config,
                                                const std::string& section = REGISTRY_CONFIG_SECTION);

    Result<int64_t> Get(const std::string& key) const override;
    int64_t GetValue(RegistryParameter param) const override;

    /// All values keyed by configuration key
    std::map<std::string, int64_t> GetAllParameters() const;

    std::string ToString() const;

private:
    static bool IsValid(RegistryParameter param, int64_t value);

    std::map<RegistryParameter, int64_t> parameters_;
};

} // namespace params
} // namespace curator

#endif // CURATOR_PARAMS_PARAMETERS_H
