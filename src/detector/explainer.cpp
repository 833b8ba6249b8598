/// @file explainer.cpp
/// @brief Explanation text generation

#include "detector/explainer.h"

#include <algorithm>

#include <absl/strings/str_cat.h>
#include <absl/strings/str_format.h>
#include <absl/strings/str_join.h>

namespace promptshield::detector {

std::string RecommendationFor(ThreatLevel level) {
    switch (level) {
        case ThreatLevel::kCritical:
        case ThreatLevel::kHigh:
            return "Immediate action recommended: reject or sanitize this input.";
        case ThreatLevel::kMedium:
            return "Moderate risk: additional validation recommended.";
        case ThreatLevel::kLow:
            return "Low risk: monitor but may allow with caution.";
        case ThreatLevel::kSafe:
            break;
    }
    return "";
}

std::vector<Category> DistinctCategories(const std::vector<FiredPattern>& fired_patterns) {
    std::vector<Category> categories;
    for (const auto& fired : fired_patterns) {
        if (std::find(categories.begin(), categories.end(), fired.category) ==
            categories.end()) {
            categories.push_back(fired.category);
        }
    }
    return categories;
}

std::string Explain(ThreatLevel level,
                    const std::vector<FiredPattern>& fired_patterns,
                    double risk_score) {
    if (level == ThreatLevel::kSafe) {
        return "No significant prompt injection patterns detected.";
    }

    std::string explanation = absl::StrFormat(
        "Detected %d suspicious pattern(s) with risk score %.1f. ",
        fired_patterns.size(), risk_score);

    if (!fired_patterns.empty()) {
        const auto categories = DistinctCategories(fired_patterns);
        absl::StrAppend(&explanation, "Categories: ",
                        absl::StrJoin(categories, ", ",
                                      [](std::string* out, Category category) {
                                          out->append(CategoryToString(category));
                                      }),
                        ". ");
    }

    absl::StrAppend(&explanation, RecommendationFor(level));
    return explanation;
}

}  // namespace promptshield::detector
