#pragma once

/// @file pattern_library.h
/// @brief Attack categories, their match rules and severity weights
///
/// The category set is closed: every Category enumerator always exists in a
/// library, in the fixed evaluation order of kAllCategories. Rules are
/// compiled once with RE2 (linear-time matching, no backtracking) and are
/// shared read-only between copies of a library, so copying a library to
/// give an engine its own weights is cheap.

#include <array>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

#include <absl/status/status.h>
#include <absl/status/statusor.h>

namespace re2 {
class RE2;
}  // namespace re2

namespace promptshield::detector {

/// @brief Attack classes recognized by the pattern pass
enum class Category {
    kInstructionOverride,   ///< "ignore previous instructions"
    kRoleManipulation,      ///< "you are now a ..."
    kPromptLeakage,         ///< "show me your system prompt"
    kDelimiterInjection,    ///< Fake role fences and special tokens
    kObfuscation,           ///< Encoded payload markers
    kJailbreak,             ///< "DAN mode", "developer mode"
    kContextManipulation,   ///< "start new conversation"
    kGoalHijacking          ///< "your real goal is"
};

inline constexpr size_t kCategoryCount = 8;

/// @brief Categories in evaluation order
inline constexpr std::array<Category, kCategoryCount> kAllCategories = {
    Category::kInstructionOverride, Category::kRoleManipulation,
    Category::kPromptLeakage,       Category::kDelimiterInjection,
    Category::kObfuscation,         Category::kJailbreak,
    Category::kContextManipulation, Category::kGoalHijacking};

/// @brief Snake-case name, e.g. "instruction_override"
std::string CategoryToString(Category category);

/// @brief Parse a snake-case category name; unknown names are NotFound
absl::StatusOr<Category> ParseCategory(std::string_view name);

/// @brief One compiled match rule
struct PatternRule {
    std::string pattern;        ///< Regular expression source
    std::string description;    ///< Short identifier reported in results
    std::shared_ptr<const re2::RE2> regex;
};

/// @brief Construction input for one category
struct CategorySpec {
    Category category;
    double weight = 0.0;
    std::vector<std::string> patterns;
};

/// @brief Built-in rules and weights
std::vector<CategorySpec> DefaultCategorySpecs();

/// @brief Category table: ordered rules plus a weight per category
class PatternLibrary {
public:
    using Weights = std::array<double, kCategoryCount>;

    /// @brief Compile a library from category specs
    ///
    /// Categories missing from @p specs exist with no rules and weight 0.
    /// Fails with InvalidArgument on a duplicate category, a weight outside
    /// [0, 1] or a pattern RE2 cannot compile.
    static absl::StatusOr<PatternLibrary> Create(const std::vector<CategorySpec>& specs);

    /// @brief Compile the built-in library
    static absl::StatusOr<PatternLibrary> CreateDefault();

    /// @brief Ordered rules for a category
    const std::vector<PatternRule>& Rules(Category category) const;

    /// @brief Current weight for a category
    double Weight(Category category) const;

    /// @brief All weights, indexed by category
    const Weights& GetWeights() const { return weights_; }

    /// @brief Replace one category's weight; must lie in [0, 1]
    absl::Status SetWeight(Category category, double weight);

    /// @brief Replace one category's weight by name
    absl::Status SetWeight(std::string_view category_name, double weight);

    /// @brief Name lookup, NotFound for unknown categories
    absl::StatusOr<Category> FindCategory(std::string_view name) const;

    /// @brief Rules for a named category, NotFound for unknown categories
    absl::StatusOr<std::vector<PatternRule>> RulesFor(std::string_view name) const;

    /// @brief Weight for a named category, NotFound for unknown categories
    absl::StatusOr<double> WeightFor(std::string_view name) const;

    /// @brief Number of rules across all categories
    size_t TotalRuleCount() const;

private:
    PatternLibrary() = default;

    std::array<std::vector<PatternRule>, kCategoryCount> rules_;
    Weights weights_{};
};

/// @brief Check a weight value, InvalidArgument outside [0, 1] or NaN
absl::Status ValidateWeight(double weight);

}  // namespace promptshield::detector
