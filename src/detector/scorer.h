#pragma once

/// @file scorer.h
/// @brief Three-pass risk scoring: patterns, heuristics, structure
///
/// Each pass contributes an additive sub-score. The pattern pass also
/// reports what fired and where. When a weighted rule fired the sum is
/// raised to at least kRuleHitFloor; it is then clamped to [0, 100], so the
/// score is a saturating risk indicator, not a probability.

#include <cstddef>
#include <string>
#include <string_view>
#include <vector>

#include "detector/pattern_library.h"

namespace promptshield::detector {

/// @brief One rule occurrence in the input
///
/// Offsets are byte offsets into the UTF-8 input, half-open [start, end).
struct MatchSpan {
    std::string segment;
    Category category = Category::kInstructionOverride;
    size_t start = 0;
    size_t end = 0;

    /// @brief "start-end"
    std::string Position() const;

    bool operator==(const MatchSpan& other) const;
};

/// @brief A rule that fired, reported as "category: description"
struct FiredPattern {
    Category category = Category::kInstructionOverride;
    std::string description;

    std::string ToString() const;

    bool operator==(const FiredPattern& other) const;
};

/// @brief Sub-scores of the three passes
struct ScoreBreakdown {
    double pattern_score = 0.0;
    double heuristic_score = 0.0;
    double structural_score = 0.0;

    /// @brief Unclamped sum of all passes
    double Total() const { return pattern_score + heuristic_score + structural_score; }
};

/// @brief Output of a full scoring run
struct ScoreResult {
    ScoreBreakdown breakdown;
    double risk_score = 0.0;    ///< Clamped to [0, 100]
    std::vector<FiredPattern> fired_patterns;
    std::vector<MatchSpan> spans;
};

// Heuristic and structural penalties
inline constexpr double kSpecialCharRatioThreshold = 0.3;
inline constexpr double kSpecialCharPenalty = 5.0;
inline constexpr size_t kUppercaseRunLength = 10;
inline constexpr double kUppercaseRunPenalty = 3.0;
inline constexpr double kRepeatedInstructionFactor = 2.0;
inline constexpr double kDelimiterRunFactor = 2.0;
inline constexpr double kSystemKeywordFactor = 1.5;
inline constexpr double kNestedBracketPenalty = 5.0;
inline constexpr double kMixedScriptPenalty = 3.0;
inline constexpr double kCodeExecutionPenalty = 8.0;
inline constexpr size_t kLongPromptCodePoints = 1000;
inline constexpr double kLongPromptPenalty = 2.0;
inline constexpr double kMaxRiskScore = 100.0;

/// Lowest total once any weighted rule fired: a rule hit is never Safe
inline constexpr double kRuleHitFloor = 10.0;

/// @brief Scores text against a pattern library
///
/// The scorer borrows the library's compiled rules; weights are passed per
/// call so the caller decides which weight snapshot applies. Thread-safe.
class Scorer {
public:
    explicit Scorer(const PatternLibrary& library);

    /// @brief Run all three passes, apply the rule-hit floor and clamp
    ScoreResult Score(std::string_view text, const PatternLibrary::Weights& weights) const;

    /// @brief Pattern pass: weight x 10 per non-overlapping occurrence
    double ScorePatterns(std::string_view text,
                         const PatternLibrary::Weights& weights,
                         std::vector<FiredPattern>* fired,
                         std::vector<MatchSpan>* spans) const;

    /// @brief Heuristic pass over surface-level anomalies
    static double ScoreHeuristics(std::string_view text);

    /// @brief Structural pass: nesting, mixed scripts, code tokens, length
    static double ScoreStructure(std::string_view text);

private:
    const PatternLibrary& library_;
};

/// @brief Number of Unicode code points in UTF-8 text
size_t CountCodePoints(std::string_view text);

/// @brief Non-overlapping, ASCII case-insensitive occurrences of @p needle
size_t CountOccurrences(std::string_view lowered_text, std::string_view needle);

}  // namespace promptshield::detector
