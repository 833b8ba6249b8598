/// @file policy.cpp
/// @brief Policy profile resolution

#include "detector/policy.h"

#include <algorithm>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptshield::detector {

namespace {

constexpr double kStrictFactor = 1.25;
constexpr double kPermissiveFactor = 0.75;

}  // namespace

std::string PolicyToString(PolicyProfile policy) {
    switch (policy) {
        case PolicyProfile::kStrict: return "strict";
        case PolicyProfile::kStandard: return "standard";
        case PolicyProfile::kPermissive: return "permissive";
    }
    return "unknown";
}

absl::StatusOr<PolicyProfile> ParsePolicy(std::string_view name) {
    const std::string lowered = absl::AsciiStrToLower(absl::string_view(name.data(), name.size()));
    if (lowered == "strict") return PolicyProfile::kStrict;
    if (lowered == "standard") return PolicyProfile::kStandard;
    if (lowered == "permissive") return PolicyProfile::kPermissive;
    return MakeError(ErrorCode::kUnknownPolicy,
                     absl::StrCat("Unknown policy: '", absl::string_view(name.data(), name.size()),
                                  "' (expected strict, standard or permissive)"));
}

double PolicyWeightFactor(PolicyProfile policy) {
    switch (policy) {
        case PolicyProfile::kStrict: return kStrictFactor;
        case PolicyProfile::kPermissive: return kPermissiveFactor;
        case PolicyProfile::kStandard: break;
    }
    return 1.0;
}

absl::Status ApplyPolicy(PolicyProfile policy, PatternLibrary* library) {
    const double factor = PolicyWeightFactor(policy);
    if (factor == 1.0) {
        return absl::OkStatus();
    }
    for (Category category : kAllCategories) {
        const double scaled = std::min(library->Weight(category) * factor, 1.0);
        PROMPTSHIELD_RETURN_IF_ERROR(library->SetWeight(category, scaled));
    }
    return absl::OkStatus();
}

absl::StatusOr<std::vector<CategorySpec>> BuildCategorySpecs(const EngineConfig& config) {
    std::vector<CategorySpec> specs = DefaultCategorySpecs();

    for (const auto& [name, patterns] : config.custom_patterns) {
        PROMPTSHIELD_ASSIGN_OR_RETURN(Category category, ParseCategory(name));
        auto it = std::find_if(specs.begin(), specs.end(), [category](const CategorySpec& spec) {
            return spec.category == category;
        });
        if (it == specs.end()) {
            return MakeError(ErrorCode::kConfigurationError,
                             absl::StrCat("No built-in spec for category ", name));
        }
        it->patterns.insert(it->patterns.end(), patterns.begin(), patterns.end());
    }

    return specs;
}

absl::Status ApplyWeightOverrides(const std::map<std::string, double>& overrides,
                                  PatternLibrary* library) {
    for (const auto& [name, weight] : overrides) {
        PROMPTSHIELD_RETURN_IF_ERROR(library->SetWeight(name, weight));
    }
    return absl::OkStatus();
}

}  // namespace promptshield::detector
