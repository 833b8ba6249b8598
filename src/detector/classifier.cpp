#include "detector/classifier.h"

#include <algorithm>

namespace promptshield::detector {

ThreatLevel LevelForScore(double risk_score) {
    if (risk_score >= kCriticalThreshold) {
        return ThreatLevel::kCritical;
    } else if (risk_score >= kHighThreshold) {
        return ThreatLevel::kHigh;
    } else if (risk_score >= kMediumThreshold) {
        return ThreatLevel::kMedium;
    } else if (risk_score >= kLowThreshold) {
        return ThreatLevel::kLow;
    }
    return ThreatLevel::kSafe;
}

double ConfidenceForPatterns(size_t pattern_count) {
    return std::min(kBaseConfidence + kConfidencePerPattern * static_cast<double>(pattern_count),
                    1.0);
}

Classification Classify(double risk_score, size_t pattern_count) {
    return Classification{LevelForScore(risk_score), ConfidenceForPatterns(pattern_count)};
}

}  // namespace promptshield::detector
