/// @file guard_action_test.cpp
/// @brief Tests for action selection

#include <gtest/gtest.h>

#include "guard/guard_action.h"

namespace promptshield::guard {
namespace {

using detector::ThreatLevel;

TEST(GuardActionTest, DecideAction) {
    EXPECT_EQ(DecideAction(ThreatLevel::kSafe), GuardAction::kAllow);
    EXPECT_EQ(DecideAction(ThreatLevel::kLow), GuardAction::kAllow);
    EXPECT_EQ(DecideAction(ThreatLevel::kMedium), GuardAction::kSanitize);
    EXPECT_EQ(DecideAction(ThreatLevel::kHigh), GuardAction::kSanitize);
    EXPECT_EQ(DecideAction(ThreatLevel::kCritical), GuardAction::kBlock);
}

TEST(GuardActionTest, Names) {
    EXPECT_EQ(GuardActionToString(GuardAction::kAllow), "allow");
    EXPECT_EQ(GuardActionToString(GuardAction::kSanitize), "sanitize");
    EXPECT_EQ(GuardActionToString(GuardAction::kBlock), "block");
}

}  // namespace
}  // namespace promptshield::guard
