#pragma once

/// @file detection_engine.h
/// @brief Prompt injection detection facade
///
/// Runs the scoring passes, the classifier and the explainer for one input
/// and returns a single immutable result.

#include <memory>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

#include "detector/classifier.h"
#include "detector/pattern_library.h"
#include "detector/policy.h"
#include "detector/scorer.h"
#include "detector/threat_level.h"

namespace promptshield::detector {

/// @brief Verdict for one input
struct DetectionResult {
    ThreatLevel threat_level = ThreatLevel::kSafe;
    double confidence = kBaseConfidence;    ///< 0.0 - 1.0
    double risk_score = 0.0;                ///< 0.0 - 100.0

    /// Rules that fired, in evaluation order
    std::vector<FiredPattern> fired_patterns;

    /// Matched segments, parallel to fired_patterns
    std::vector<MatchSpan> flagged_segments;

    std::string explanation;

    /// Per-pass sub-scores before clamping
    ScoreBreakdown breakdown;

    bool IsSafe() const { return threat_level == ThreatLevel::kSafe; }

    /// @brief Fired patterns rendered as "category: description"
    std::vector<std::string> DetectedPatterns() const;

    bool operator==(const DetectionResult& other) const;
};

/// @brief Prompt injection detector
///
/// Detect() is total: it returns a result for every string, including
/// empty, binary-looking and mixed-script text. Weight updates may run
/// concurrently with detections; each detection scores against a snapshot
/// of the weights taken when it starts.
///
/// Example:
/// @code
///   auto engine = CreateDetectionEngine({.policy = PolicyProfile::kStrict});
///   if (!engine.ok()) {
///       return engine.status();
///   }
///   auto result = (*engine)->Detect(user_input);
///   if (result.threat_level >= ThreatLevel::kHigh) {
///       // Reject the request
///   }
/// @endcode
class DetectionEngine {
public:
    explicit DetectionEngine(PatternLibrary library);

    // Disable copy
    DetectionEngine(const DetectionEngine&) = delete;
    DetectionEngine& operator=(const DetectionEngine&) = delete;

    /// @brief Analyze one input
    DetectionResult Detect(std::string_view text) const;

    /// @brief Analyze several inputs, results in input order
    std::vector<DetectionResult> DetectBatch(const std::vector<std::string>& texts) const;

    /// @brief Override one category's weight
    /// @return NotFound for an unknown category, InvalidArgument outside [0, 1]
    absl::Status SetCategoryWeight(std::string_view category, double weight);

    /// @brief Current weight of a named category
    absl::StatusOr<double> WeightFor(std::string_view category) const;

    /// @brief Snapshot of all weights
    PatternLibrary::Weights GetWeights() const;

    /// @brief Rules of a named category
    absl::StatusOr<std::vector<PatternRule>> RulesFor(std::string_view category) const;

    /// @brief Number of rules across all categories
    size_t TotalRuleCount() const;

private:
    PatternLibrary library_;
    Scorer scorer_;
    mutable std::mutex weights_mutex_;
};

/// @brief Build an engine from configuration
///
/// Appends custom rules, applies the policy profile, then explicit weight
/// overrides. Any invalid category, weight or rule fails construction.
absl::StatusOr<std::unique_ptr<DetectionEngine>> CreateDetectionEngine(
    const EngineConfig& config = {});

}  // namespace promptshield::detector
