#pragma once

/// @file threat_level.h
/// @brief Graded threat levels produced by the classifier

#include <array>
#include <string>
#include <string_view>

#include <absl/status/statusor.h>

namespace promptshield::detector {

/// @brief Threat severity, totally ordered from kSafe to kCritical
///
/// Compare levels directly (`level >= ThreatLevel::kMedium`); the enumerator
/// order is the severity order.
enum class ThreatLevel {
    kSafe,      ///< No significant injection signal
    kLow,       ///< Suspicious but likely benign
    kMedium,    ///< Potential attack, validate further
    kHigh,      ///< Likely malicious
    kCritical   ///< Definite attack pattern
};

/// @brief All levels in ascending severity order
inline constexpr std::array<ThreatLevel, 5> kAllThreatLevels = {
    ThreatLevel::kSafe, ThreatLevel::kLow, ThreatLevel::kMedium,
    ThreatLevel::kHigh, ThreatLevel::kCritical};

/// @brief Wire name ("SAFE", "LOW", "MEDIUM", "HIGH", "CRITICAL")
std::string ThreatLevelToString(ThreatLevel level);

/// @brief Parse a wire name (case-insensitive)
absl::StatusOr<ThreatLevel> ParseThreatLevel(std::string_view name);

/// @brief True when the level warrants sanitization or rejection
inline bool IsActionable(ThreatLevel level) {
    return level >= ThreatLevel::kMedium;
}

}  // namespace promptshield::detector
