/// @file pattern_library.cpp
/// @brief Pattern library implementation

#include "detector/pattern_library.h"

#include <re2/re2.h>

#include <absl/strings/str_cat.h>

#include "common/error.h"

namespace promptshield::detector {

namespace {

constexpr size_t kDescriptionLength = 50;

size_t IndexOf(Category category) {
    return static_cast<size_t>(category);
}

absl::StatusOr<PatternRule> CompileRule(Category category, const std::string& pattern) {
    RE2::Options options;
    options.set_case_sensitive(false);
    options.set_log_errors(false);

    auto regex = std::make_shared<const re2::RE2>(pattern, options);
    if (!regex->ok()) {
        return MakeError(ErrorCode::kInvalidPattern,
                         absl::StrCat("Invalid pattern for ", CategoryToString(category),
                                      " '", pattern, "': ", regex->error()));
    }

    PatternRule rule;
    rule.pattern = pattern;
    rule.description = pattern.substr(0, kDescriptionLength);
    rule.regex = std::move(regex);
    return rule;
}

}  // namespace

std::string CategoryToString(Category category) {
    switch (category) {
        case Category::kInstructionOverride: return "instruction_override";
        case Category::kRoleManipulation: return "role_manipulation";
        case Category::kPromptLeakage: return "prompt_leakage";
        case Category::kDelimiterInjection: return "delimiter_injection";
        case Category::kObfuscation: return "obfuscation";
        case Category::kJailbreak: return "jailbreak";
        case Category::kContextManipulation: return "context_manipulation";
        case Category::kGoalHijacking: return "goal_hijacking";
    }
    return "unknown";
}

absl::StatusOr<Category> ParseCategory(std::string_view name) {
    for (Category category : kAllCategories) {
        if (CategoryToString(category) == name) {
            return category;
        }
    }
    return MakeError(ErrorCode::kUnknownCategory,
                     absl::StrCat("Unknown category: ", absl::string_view(name.data(), name.size())));
}

absl::Status ValidateWeight(double weight) {
    // Written so that NaN fails as well
    if (!(weight >= 0.0 && weight <= 1.0)) {
        return MakeError(ErrorCode::kInvalidWeight,
                         absl::StrCat("Weight must be within [0, 1], got ", weight));
    }
    return absl::OkStatus();
}

std::vector<CategorySpec> DefaultCategorySpecs() {
    return {
        {Category::kInstructionOverride, 0.9, {
            R"(ignore\s+(all\s+)?(previous|above|prior)\s+(instructions?|prompts?|directions?))",
            R"(disregard\s+(previous|above|prior)\s+(instructions?|prompts?))",
            R"(forget\s+(all\s+)?(previous|above|prior)\s+(instructions?|prompts?))",
            R"(new\s+instructions?:)",
            R"(system\s*:\s*ignore)",
        }},
        {Category::kRoleManipulation, 0.8, {
            R"(you\s+are\s+now\s+(a|an)\s+[\pL\pN_]+)",
            R"(act\s+as\s+(a|an)\s+[\pL\pN_]+)",
            R"(pretend\s+(you\s+are|to\s+be))",
            R"(from\s+now\s+on,?\s+you)",
            R"(your\s+new\s+role\s+is)",
            R"(SYSTEM\s*:\s*You\s+are)",
        }},
        {Category::kPromptLeakage, 0.7, {
            R"(what\s+(are|were)\s+your\s+(original|initial|system)\s+(instructions?|prompts?))",
            R"(show\s+(me\s+)?(your\s+)?(system\s+)?(prompt|instructions?))",
            R"(print\s+(your\s+)?(system\s+)?(prompt|instructions?))",
            R"(reveal\s+(your\s+)?(system\s+)?(prompt|instructions?))",
            R"(what\s+are\s+you\s+programmed\s+to)",
        }},
        {Category::kDelimiterInjection, 0.95, {
            R"(```\s*(system|assistant|user))",
            R"(<\|system\|>)",
            R"(<\|assistant\|>)",
            R"(<\|end\|>)",
            R"(###\s*(Instruction|System))",
            R"(\[SYSTEM\])",
            R"(\[INST\])",
        }},
        {Category::kObfuscation, 0.6, {
            R"(base64\s*:)",
            R"(rot13\s*:)",
            R"(hex\s*:)",
            R"(unicode\s*:)",
            R"(\\x[0-9a-fA-F]{2})",
            R"(&#\d+;)",
        }},
        {Category::kJailbreak, 1.0, {
            R"(DAN\s+mode)",
            R"(developer\s+mode)",
            R"(evil\s+mode)",
            R"(jailbreak)",
            R"(unrestricted\s+mode)",
            R"(bypass\s+(safety|filter|restriction))",
        }},
        {Category::kContextManipulation, 0.75, {
            R"(end\s+of\s+(conversation|chat|session))",
            R"(start\s+new\s+(conversation|chat|session))",
            R"(reset\s+(conversation|context))",
            R"(clear\s+(all\s+)?(previous\s+)?(context|memory))",
        }},
        {Category::kGoalHijacking, 0.85, {
            R"(your\s+(real|actual|true)\s+goal\s+is)",
            R"(instead\s+of\s+.*?,\s+you\s+(should|must|will))",
            R"(do\s+not\s+(follow|obey|listen\s+to))",
            R"(prioritize\s+this\s+over)",
        }},
    };
}

absl::StatusOr<PatternLibrary> PatternLibrary::Create(const std::vector<CategorySpec>& specs) {
    PatternLibrary library;
    std::array<bool, kCategoryCount> seen{};

    for (const auto& spec : specs) {
        const size_t index = IndexOf(spec.category);
        if (seen[index]) {
            return MakeError(ErrorCode::kInvalidArgument,
                             absl::StrCat("Duplicate category: ", CategoryToString(spec.category)));
        }
        seen[index] = true;

        PROMPTSHIELD_RETURN_IF_ERROR(ValidateWeight(spec.weight));
        library.weights_[index] = spec.weight;

        auto& rules = library.rules_[index];
        rules.reserve(spec.patterns.size());
        for (const auto& pattern : spec.patterns) {
            PROMPTSHIELD_ASSIGN_OR_RETURN(PatternRule rule, CompileRule(spec.category, pattern));
            rules.push_back(std::move(rule));
        }
    }

    return library;
}

absl::StatusOr<PatternLibrary> PatternLibrary::CreateDefault() {
    return Create(DefaultCategorySpecs());
}

const std::vector<PatternRule>& PatternLibrary::Rules(Category category) const {
    return rules_[IndexOf(category)];
}

double PatternLibrary::Weight(Category category) const {
    return weights_[IndexOf(category)];
}

absl::Status PatternLibrary::SetWeight(Category category, double weight) {
    PROMPTSHIELD_RETURN_IF_ERROR(ValidateWeight(weight));
    weights_[IndexOf(category)] = weight;
    return absl::OkStatus();
}

absl::Status PatternLibrary::SetWeight(std::string_view category_name, double weight) {
    PROMPTSHIELD_ASSIGN_OR_RETURN(Category category, FindCategory(category_name));
    return SetWeight(category, weight);
}

absl::StatusOr<Category> PatternLibrary::FindCategory(std::string_view name) const {
    return ParseCategory(name);
}

absl::StatusOr<std::vector<PatternRule>> PatternLibrary::RulesFor(std::string_view name) const {
    PROMPTSHIELD_ASSIGN_OR_RETURN(Category category, FindCategory(name));
    return Rules(category);
}

absl::StatusOr<double> PatternLibrary::WeightFor(std::string_view name) const {
    PROMPTSHIELD_ASSIGN_OR_RETURN(Category category, FindCategory(name));
    return Weight(category);
}

size_t PatternLibrary::TotalRuleCount() const {
    size_t total = 0;
    for (const auto& rules : rules_) {
        total += rules.size();
    }
    return total;
}

}  // namespace promptshield::detector
