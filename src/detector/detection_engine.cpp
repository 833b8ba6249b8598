/// @file detection_engine.cpp
/// @brief Detection facade implementation

#include "detector/detection_engine.h"

#include <chrono>

#include "common/error.h"
#include "common/logging.h"
#include "detector/explainer.h"

namespace promptshield::detector {

std::vector<std::string> DetectionResult::DetectedPatterns() const {
    std::vector<std::string> patterns;
    patterns.reserve(fired_patterns.size());
    for (const auto& fired : fired_patterns) {
        patterns.push_back(fired.ToString());
    }
    return patterns;
}

bool DetectionResult::operator==(const DetectionResult& other) const {
    return threat_level == other.threat_level && confidence == other.confidence &&
           risk_score == other.risk_score && fired_patterns == other.fired_patterns &&
           flagged_segments == other.flagged_segments && explanation == other.explanation;
}

DetectionEngine::DetectionEngine(PatternLibrary library)
    : library_(std::move(library)), scorer_(library_) {}

DetectionResult DetectionEngine::Detect(std::string_view text) const {
    const auto start = std::chrono::steady_clock::now();

    PatternLibrary::Weights weights;
    {
        std::lock_guard<std::mutex> lock(weights_mutex_);
        weights = library_.GetWeights();
    }

    ScoreResult scored = scorer_.Score(text, weights);
    const Classification classification =
        Classify(scored.risk_score, scored.fired_patterns.size());

    DetectionResult result;
    result.threat_level = classification.level;
    result.confidence = classification.confidence;
    result.risk_score = scored.risk_score;
    result.explanation = Explain(classification.level, scored.fired_patterns, scored.risk_score);
    result.fired_patterns = std::move(scored.fired_patterns);
    result.flagged_segments = std::move(scored.spans);
    result.breakdown = scored.breakdown;

    const auto elapsed = std::chrono::duration_cast<std::chrono::microseconds>(
        std::chrono::steady_clock::now() - start);
    PROMPTSHIELD_LOG_DEBUG("Detection: level={} score={:.1f} patterns={} elapsed={}us",
                           ThreatLevelToString(result.threat_level), result.risk_score,
                           result.fired_patterns.size(), elapsed.count());

    return result;
}

std::vector<DetectionResult> DetectionEngine::DetectBatch(
    const std::vector<std::string>& texts) const {
    std::vector<DetectionResult> results;
    results.reserve(texts.size());
    for (const auto& text : texts) {
        results.push_back(Detect(text));
    }
    return results;
}

absl::Status DetectionEngine::SetCategoryWeight(std::string_view category, double weight) {
    std::lock_guard<std::mutex> lock(weights_mutex_);
    PROMPTSHIELD_RETURN_IF_ERROR(library_.SetWeight(category, weight));
    PROMPTSHIELD_LOG_INFO("Category weight updated: {}={}", category, weight);
    return absl::OkStatus();
}

absl::StatusOr<double> DetectionEngine::WeightFor(std::string_view category) const {
    std::lock_guard<std::mutex> lock(weights_mutex_);
    return library_.WeightFor(category);
}

PatternLibrary::Weights DetectionEngine::GetWeights() const {
    std::lock_guard<std::mutex> lock(weights_mutex_);
    return library_.GetWeights();
}

absl::StatusOr<std::vector<PatternRule>> DetectionEngine::RulesFor(
    std::string_view category) const {
    // Rules are immutable after construction
    return library_.RulesFor(category);
}

size_t DetectionEngine::TotalRuleCount() const {
    return library_.TotalRuleCount();
}

absl::StatusOr<std::unique_ptr<DetectionEngine>> CreateDetectionEngine(
    const EngineConfig& config) {
    PROMPTSHIELD_ASSIGN_OR_RETURN(auto specs, BuildCategorySpecs(config));
    PROMPTSHIELD_ASSIGN_OR_RETURN(auto library, PatternLibrary::Create(specs));
    PROMPTSHIELD_RETURN_IF_ERROR(ApplyPolicy(config.policy, &library));
    PROMPTSHIELD_RETURN_IF_ERROR(ApplyWeightOverrides(config.weight_overrides, &library));

    PROMPTSHIELD_LOG_INFO("Detection engine ready: policy={} rules={} overrides={}",
                          PolicyToString(config.policy), library.TotalRuleCount(),
                          config.weight_overrides.size());

    return std::make_unique<DetectionEngine>(std::move(library));
}

}  // namespace promptshield::detector
