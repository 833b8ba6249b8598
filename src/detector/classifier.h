#pragma once

/// @file classifier.h
/// @brief Maps a risk score and match count to a threat level

#include <cstddef>

#include "detector/threat_level.h"

namespace promptshield::detector {

/// Inclusive lower bounds of each non-safe level
inline constexpr double kCriticalThreshold = 70.0;
inline constexpr double kHighThreshold = 50.0;
inline constexpr double kMediumThreshold = 30.0;
inline constexpr double kLowThreshold = 10.0;

inline constexpr double kBaseConfidence = 0.5;
inline constexpr double kConfidencePerPattern = 0.1;

/// @brief Classifier output
struct Classification {
    ThreatLevel level = ThreatLevel::kSafe;
    double confidence = kBaseConfidence;
};

/// @brief Level for a clamped risk score
ThreatLevel LevelForScore(double risk_score);

/// @brief Confidence grows with corroborating rule hits, capped at 1.0
double ConfidenceForPatterns(size_t pattern_count);

/// @brief Pure classification of (score, fired pattern count)
Classification Classify(double risk_score, size_t pattern_count);

}  // namespace promptshield::detector
