#include "detector/threat_level.h"

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace promptshield::detector {

std::string ThreatLevelToString(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::kSafe: return "SAFE";
        case ThreatLevel::kLow: return "LOW";
        case ThreatLevel::kMedium: return "MEDIUM";
        case ThreatLevel::kHigh: return "HIGH";
        case ThreatLevel::kCritical: return "CRITICAL";
    }
    return "UNKNOWN";
}

absl::StatusOr<ThreatLevel> ParseThreatLevel(std::string_view name) {
    const std::string upper = absl::AsciiStrToUpper(absl::string_view(name.data(), name.size()));
    for (ThreatLevel level : kAllThreatLevels) {
        if (ThreatLevelToString(level) == upper) {
            return level;
        }
    }
    return absl::InvalidArgumentError(absl::StrCat("Unknown threat level: ", absl::string_view(name.data(), name.size())));
}

}  // namespace promptshield::detector
