#pragma once

/// @file policy.h
/// @brief Named policy profiles and engine construction settings
///
/// A policy is a weight-override table resolved once when an engine is
/// built; it never branches at detection time.

#include <map>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detector/pattern_library.h"

namespace promptshield::detector {

/// @brief Policy tiers
enum class PolicyProfile {
    kStrict,      ///< Weights scaled up by 1.25, capped at 1.0
    kStandard,    ///< Built-in weights
    kPermissive   ///< Weights scaled down by 0.75
};

/// @brief "strict", "standard" or "permissive"
std::string PolicyToString(PolicyProfile policy);

/// @brief Parse a policy name (case-insensitive), InvalidArgument otherwise
absl::StatusOr<PolicyProfile> ParsePolicy(std::string_view name);

/// @brief Multiplier applied to every category weight
double PolicyWeightFactor(PolicyProfile policy);

/// @brief Scale every weight of @p library by the policy factor
absl::Status ApplyPolicy(PolicyProfile policy, PatternLibrary* library);

/// @brief Settings used to build one detection engine
struct EngineConfig {
    PolicyProfile policy = PolicyProfile::kStandard;

    /// Category name -> weight, applied after the policy
    std::map<std::string, double> weight_overrides;

    /// Category name -> extra rules appended after the built-in ones
    std::map<std::string, std::vector<std::string>> custom_patterns;
};

/// @brief Built-in category specs extended with @p config's custom rules
///
/// Fails with NotFound when a custom rule names an unknown category.
absl::StatusOr<std::vector<CategorySpec>> BuildCategorySpecs(const EngineConfig& config);

/// @brief Apply explicit per-category weights
absl::Status ApplyWeightOverrides(const std::map<std::string, double>& overrides,
                                  PatternLibrary* library);

}  // namespace promptshield::detector
