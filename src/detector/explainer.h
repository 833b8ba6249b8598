#pragma once

/// @file explainer.h
/// @brief Human-readable rationale for a verdict

#include <string>
#include <vector>

#include "detector/scorer.h"
#include "detector/threat_level.h"

namespace promptshield::detector {

/// @brief Build the explanation text for a detection
///
/// Safe verdicts get a fixed message. Otherwise the text states the pattern
/// count and score, the distinct categories in first-seen order, and a
/// recommendation tiered by level.
std::string Explain(ThreatLevel level,
                    const std::vector<FiredPattern>& fired_patterns,
                    double risk_score);

/// @brief Tiered recommendation for a non-safe level
std::string RecommendationFor(ThreatLevel level);

/// @brief Distinct categories of @p fired_patterns in first-seen order
std::vector<Category> DistinctCategories(const std::vector<FiredPattern>& fired_patterns);

}  // namespace promptshield::detector
