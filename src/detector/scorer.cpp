/// @file scorer.cpp
/// @brief Scoring pass implementations

#include "detector/scorer.h"

#include <algorithm>
#include <array>
#include <cctype>

#include <re2/re2.h>

#include <absl/strings/ascii.h>
#include <absl/strings/str_cat.h>

namespace promptshield::detector {

namespace {

/// Fixed expressions used by the heuristic and structural passes
struct AnalysisPatterns {
    re2::RE2 delimiter_run{R"([`\[\]<>|#]{3,})"};
    re2::RE2 nested_brackets{R"(\[.*\[.*\].*\])"};
    re2::RE2 non_latin_letter{R"([^\P{L}\p{Latin}])"};
    std::array<re2::RE2, 4> code_execution{{
        re2::RE2(R"(eval\s*\()"),
        re2::RE2(R"(exec\s*\()"),
        re2::RE2(R"(__import__)"),
        re2::RE2(R"(system\s*\()"),
    }};
};

const AnalysisPatterns& GetAnalysisPatterns() {
    static const AnalysisPatterns* patterns = new AnalysisPatterns();
    return *patterns;
}

constexpr std::array<std::string_view, 5> kInstructionWords = {
    "ignore", "disregard", "forget", "override", "bypass"};

constexpr std::array<std::string_view, 5> kSystemKeywords = {
    "system", "admin", "root", "developer", "debug"};

bool IsContinuationByte(unsigned char c) {
    return (c & 0xC0) == 0x80;
}

bool HasUppercaseRun(std::string_view text) {
    size_t run = 0;
    for (char c : text) {
        if (c >= 'A' && c <= 'Z') {
            if (++run >= kUppercaseRunLength) {
                return true;
            }
        } else {
            run = 0;
        }
    }
    return false;
}

bool HasAsciiLetter(std::string_view text) {
    return std::any_of(text.begin(), text.end(), [](char c) {
        return absl::ascii_isalpha(static_cast<unsigned char>(c));
    });
}

/// Code points that are neither ASCII alphanumerics nor whitespace
size_t CountSpecialCodePoints(std::string_view text) {
    size_t count = 0;
    for (char ch : text) {
        const auto c = static_cast<unsigned char>(ch);
        if (IsContinuationByte(c)) {
            continue;
        }
        if (c >= 0x80) {
            ++count;
        } else if (!absl::ascii_isalnum(c) && !absl::ascii_isspace(c)) {
            ++count;
        }
    }
    return count;
}

size_t CountMatches(std::string_view text, const re2::RE2& regex) {
    re2::StringPiece input(text.data(), text.size());
    size_t count = 0;
    while (RE2::FindAndConsume(&input, regex)) {
        ++count;
    }
    return count;
}

}  // namespace

std::string MatchSpan::Position() const {
    return absl::StrCat(start, "-", end);
}

bool MatchSpan::operator==(const MatchSpan& other) const {
    return segment == other.segment && category == other.category &&
           start == other.start && end == other.end;
}

std::string FiredPattern::ToString() const {
    return absl::StrCat(CategoryToString(category), ": ", description);
}

bool FiredPattern::operator==(const FiredPattern& other) const {
    return category == other.category && description == other.description;
}

size_t CountCodePoints(std::string_view text) {
    return static_cast<size_t>(std::count_if(text.begin(), text.end(), [](char c) {
        return !IsContinuationByte(static_cast<unsigned char>(c));
    }));
}

size_t CountOccurrences(std::string_view lowered_text, std::string_view needle) {
    if (needle.empty()) {
        return 0;
    }
    size_t count = 0;
    size_t pos = lowered_text.find(needle);
    while (pos != std::string_view::npos) {
        ++count;
        pos = lowered_text.find(needle, pos + needle.size());
    }
    return count;
}

Scorer::Scorer(const PatternLibrary& library) : library_(library) {}

ScoreResult Scorer::Score(std::string_view text,
                          const PatternLibrary::Weights& weights) const {
    ScoreResult result;
    result.breakdown.pattern_score =
        ScorePatterns(text, weights, &result.fired_patterns, &result.spans);
    result.breakdown.heuristic_score = ScoreHeuristics(text);
    result.breakdown.structural_score = ScoreStructure(text);
    double total = result.breakdown.Total();
    if (result.breakdown.pattern_score > 0.0) {
        total = std::max(total, kRuleHitFloor);
    }
    result.risk_score = std::clamp(total, 0.0, kMaxRiskScore);
    return result;
}

double Scorer::ScorePatterns(std::string_view text,
                             const PatternLibrary::Weights& weights,
                             std::vector<FiredPattern>* fired,
                             std::vector<MatchSpan>* spans) const {
    double score = 0.0;
    const re2::StringPiece input(text.data(), text.size());

    for (Category category : kAllCategories) {
        const double contribution = weights[static_cast<size_t>(category)] * 10.0;

        for (const auto& rule : library_.Rules(category)) {
            size_t pos = 0;
            re2::StringPiece match;
            while (pos <= text.size() &&
                   rule.regex->Match(input, pos, text.size(), RE2::UNANCHORED, &match, 1)) {
                const size_t start = static_cast<size_t>(match.data() - text.data());
                const size_t end = start + match.size();

                fired->push_back(FiredPattern{category, rule.description});
                spans->push_back(MatchSpan{std::string(match.data(), match.size()),
                                           category, start, end});
                score += contribution;

                // Empty matches still have to make progress
                pos = end > start ? end : end + 1;
            }
        }
    }

    return score;
}

double Scorer::ScoreHeuristics(std::string_view text) {
    double score = 0.0;

    // Excessive special characters
    const size_t code_points = std::max<size_t>(CountCodePoints(text), 1);
    const double special_ratio =
        static_cast<double>(CountSpecialCodePoints(text)) / static_cast<double>(code_points);
    if (special_ratio > kSpecialCharRatioThreshold) {
        score += kSpecialCharPenalty;
    }

    // Shouting
    if (HasUppercaseRun(text)) {
        score += kUppercaseRunPenalty;
    }

    const std::string lowered = absl::AsciiStrToLower(absl::string_view(text.data(), text.size()));

    // Repeated instruction words
    for (std::string_view word : kInstructionWords) {
        const size_t count = CountOccurrences(lowered, word);
        if (count > 1) {
            score += static_cast<double>(count) * kRepeatedInstructionFactor;
        }
    }

    // Stacked delimiter runs
    const size_t delimiter_runs = CountMatches(text, GetAnalysisPatterns().delimiter_run);
    if (delimiter_runs > 2) {
        score += static_cast<double>(delimiter_runs) * kDelimiterRunFactor;
    }

    // System-related vocabulary
    size_t system_count = 0;
    for (std::string_view keyword : kSystemKeywords) {
        system_count += CountOccurrences(lowered, keyword);
    }
    if (system_count > 2) {
        score += static_cast<double>(system_count) * kSystemKeywordFactor;
    }

    return score;
}

double Scorer::ScoreStructure(std::string_view text) {
    const AnalysisPatterns& patterns = GetAnalysisPatterns();
    const re2::StringPiece input(text.data(), text.size());
    double score = 0.0;

    if (RE2::PartialMatch(input, patterns.nested_brackets)) {
        score += kNestedBracketPenalty;
    }

    if (HasAsciiLetter(text) && RE2::PartialMatch(input, patterns.non_latin_letter)) {
        score += kMixedScriptPenalty;
    }

    for (const auto& code_pattern : patterns.code_execution) {
        if (RE2::PartialMatch(input, code_pattern)) {
            score += kCodeExecutionPenalty;
        }
    }

    if (CountCodePoints(text) > kLongPromptCodePoints) {
        score += kLongPromptPenalty;
    }

    return score;
}

}  // namespace promptshield::detector
