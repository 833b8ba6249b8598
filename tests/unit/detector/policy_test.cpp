/// @file policy_test.cpp
/// @brief Tests for policy profiles and engine configuration

#include <gtest/gtest.h>

#include "detector/detection_engine.h"
#include "detector/policy.h"

namespace promptshield::detector {
namespace {

TEST(PolicyTest, ParseNames) {
    EXPECT_EQ(*ParsePolicy("strict"), PolicyProfile::kStrict);
    EXPECT_EQ(*ParsePolicy("Standard"), PolicyProfile::kStandard);
    EXPECT_EQ(*ParsePolicy("PERMISSIVE"), PolicyProfile::kPermissive);

    auto unknown = ParsePolicy("paranoid");
    EXPECT_FALSE(unknown.ok());
    EXPECT_EQ(unknown.status().code(), absl::StatusCode::kInvalidArgument);
}

TEST(PolicyTest, NamesRoundTrip) {
    for (auto policy : {PolicyProfile::kStrict, PolicyProfile::kStandard,
                        PolicyProfile::kPermissive}) {
        EXPECT_EQ(*ParsePolicy(PolicyToString(policy)), policy);
    }
}

TEST(PolicyTest, StrictScalesUpAndCaps) {
    auto library = PatternLibrary::CreateDefault();
    ASSERT_TRUE(library.ok());
    ASSERT_TRUE(ApplyPolicy(PolicyProfile::kStrict, &*library).ok());

    EXPECT_DOUBLE_EQ(library->Weight(Category::kInstructionOverride), 1.0);
    EXPECT_DOUBLE_EQ(library->Weight(Category::kPromptLeakage), 0.875);
    EXPECT_DOUBLE_EQ(library->Weight(Category::kObfuscation), 0.75);
    EXPECT_DOUBLE_EQ(library->Weight(Category::kJailbreak), 1.0);
}

TEST(PolicyTest, PermissiveScalesDown) {
    auto library = PatternLibrary::CreateDefault();
    ASSERT_TRUE(library.ok());
    ASSERT_TRUE(ApplyPolicy(PolicyProfile::kPermissive, &*library).ok());

    EXPECT_DOUBLE_EQ(library->Weight(Category::kJailbreak), 0.75);
    EXPECT_DOUBLE_EQ(library->Weight(Category::kObfuscation), 0.45);
}

TEST(PolicyTest, StandardKeepsDefaults) {
    auto library = PatternLibrary::CreateDefault();
    ASSERT_TRUE(library.ok());
    const auto before = library->GetWeights();
    ASSERT_TRUE(ApplyPolicy(PolicyProfile::kStandard, &*library).ok());
    EXPECT_EQ(library->GetWeights(), before);
}

TEST(PolicyTest, CustomPatternsAppendToCategory) {
    EngineConfig config;
    config.custom_patterns["jailbreak"] = {R"(grandma\s+exploit)"};

    auto specs = BuildCategorySpecs(config);
    ASSERT_TRUE(specs.ok()) << specs.status().message();

    for (const auto& spec : *specs) {
        if (spec.category == Category::kJailbreak) {
            ASSERT_EQ(spec.patterns.size(), 7);
            EXPECT_EQ(spec.patterns.back(), R"(grandma\s+exploit)");
        }
    }
}

TEST(PolicyTest, CustomPatternForUnknownCategory) {
    EngineConfig config;
    config.custom_patterns["social_engineering"] = {"trust me"};

    auto specs = BuildCategorySpecs(config);
    EXPECT_EQ(specs.status().code(), absl::StatusCode::kNotFound);
}

// =============================================================================
// Engine construction
// =============================================================================

TEST(CreateDetectionEngineTest, DefaultConfig) {
    auto engine = CreateDetectionEngine();
    ASSERT_TRUE(engine.ok()) << engine.status().message();
    EXPECT_EQ((*engine)->TotalRuleCount(), 43);
    EXPECT_DOUBLE_EQ(*(*engine)->WeightFor("jailbreak"), 1.0);
}

TEST(CreateDetectionEngineTest, OverridesApplyAfterPolicy) {
    EngineConfig config;
    config.policy = PolicyProfile::kStrict;
    config.weight_overrides["jailbreak"] = 0.5;

    auto engine = CreateDetectionEngine(config);
    ASSERT_TRUE(engine.ok()) << engine.status().message();
    EXPECT_DOUBLE_EQ(*(*engine)->WeightFor("jailbreak"), 0.5);
    EXPECT_DOUBLE_EQ(*(*engine)->WeightFor("prompt_leakage"), 0.875);
}

TEST(CreateDetectionEngineTest, CustomPatternFires) {
    EngineConfig config;
    config.custom_patterns["jailbreak"] = {R"(grandma\s+exploit)"};

    auto engine = CreateDetectionEngine(config);
    ASSERT_TRUE(engine.ok()) << engine.status().message();
    EXPECT_EQ((*engine)->TotalRuleCount(), 44);

    auto result = (*engine)->Detect("please use the Grandma  Exploit");
    ASSERT_EQ(result.fired_patterns.size(), 1);
    EXPECT_EQ(result.fired_patterns[0].category, Category::kJailbreak);
    EXPECT_EQ(result.threat_level, ThreatLevel::kLow);
}

TEST(CreateDetectionEngineTest, InvalidConfiguration) {
    {
        EngineConfig config;
        config.custom_patterns["jailbreak"] = {"(unclosed"};
        EXPECT_EQ(CreateDetectionEngine(config).status().code(),
                  absl::StatusCode::kInvalidArgument);
    }
    {
        EngineConfig config;
        config.weight_overrides["social_engineering"] = 0.5;
        EXPECT_EQ(CreateDetectionEngine(config).status().code(), absl::StatusCode::kNotFound);
    }
    {
        EngineConfig config;
        config.weight_overrides["jailbreak"] = 1.5;
        EXPECT_EQ(CreateDetectionEngine(config).status().code(),
                  absl::StatusCode::kInvalidArgument);
    }
}

TEST(CreateDetectionEngineTest, PolicyChangesVerdict) {
    EngineConfig strict_config;
    strict_config.policy = PolicyProfile::kStrict;
    EngineConfig permissive_config;
    permissive_config.policy = PolicyProfile::kPermissive;

    auto strict = CreateDetectionEngine(strict_config);
    auto permissive = CreateDetectionEngine(permissive_config);
    ASSERT_TRUE(strict.ok());
    ASSERT_TRUE(permissive.ok());

    // Three obfuscation markers: 3 x 7.5 vs 3 x 4.5
    const std::string text = "base64: aGk= hex: 6869 rot13: uv";
    EXPECT_EQ((*strict)->Detect(text).threat_level, ThreatLevel::kLow);
    EXPECT_DOUBLE_EQ((*strict)->Detect(text).risk_score, 22.5);
    EXPECT_DOUBLE_EQ((*permissive)->Detect(text).risk_score, 13.5);
}

}  // namespace
}  // namespace promptshield::detector
