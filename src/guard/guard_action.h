#pragma once

/// @file guard_action.h
/// @brief What a caller should do with a prompt given its threat level

#include <string>

#include "detector/threat_level.h"

namespace promptshield::guard {

enum class GuardAction {
    kAllow,       ///< Pass the prompt through
    kSanitize,    ///< Forward the sanitized rewrite instead
    kBlock        ///< Reject the request
};

/// @brief Critical blocks, Medium and High sanitize, Safe and Low allow
GuardAction DecideAction(detector::ThreatLevel level);

/// @brief "allow", "sanitize" or "block"
std::string GuardActionToString(GuardAction action);

}  // namespace promptshield::guard
