#include "guard/guard_action.h"

namespace promptshield::guard {

GuardAction DecideAction(detector::ThreatLevel level) {
    if (level >= detector::ThreatLevel::kCritical) {
        return GuardAction::kBlock;
    }
    if (detector::IsActionable(level)) {
        return GuardAction::kSanitize;
    }
    return GuardAction::kAllow;
}

std::string GuardActionToString(GuardAction action) {
    switch (action) {
        case GuardAction::kAllow: return "allow";
        case GuardAction::kSanitize: return "sanitize";
        case GuardAction::kBlock: return "block";
    }
    return "unknown";
}

}  // namespace promptshield::guard
