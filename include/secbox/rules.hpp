#pragma once

/**
 * @file rules.hpp
 * @brief Security rule catalog, rule evaluation and risk scoring
 *
 * The catalog is static and versioned (kRuleCatalogVersion); it is built once
 * and shared read-only by every validator.
 */

#include "secbox/analyzer.hpp"
#include "secbox/ast.hpp"
#include "secbox/common.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <regex>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::rules {

/// Rule id attached to the single violation reported for unparsable code
inline constexpr std::string_view kParseFailureRuleId = "parse-failure";

enum class MatchKind {
    /// Call whose callee is `name` or `object.name`
    kCall,
    /// `new Name(...)` or `Name(...)`
    kConstruct,
    /// ES import / require() / import() / Python import of a module or submodule
    kModule,
    /// Member access on a named object (`process.exit`, `subprocess.run`)
    kMemberOf,
    /// Access to an attribute listed in `names` (dotted, string subscript or Python
    /// `from m import name`) or a dotted access starting with `attribute_prefix`
    kAttribute,
    /// Loop of the listed kinds that ast::is_infinite_loop accepts
    kInfiniteLoop,
    /// Regular expression over each source line
    kText
};

struct Matcher
{
    MatchKind kind = MatchKind::kCall;
    std::vector<std::string_view> names;
    std::vector<ast::NodeKind> loop_kinds;
    /// kCall / kConstruct: only fire when a numeric literal argument reaches this value
    std::optional<std::int64_t> min_numeric_argument;
    /// kText only
    std::shared_ptr<const std::regex> pattern;
    /// kAttribute only; empty matches no prefix
    std::string_view attribute_prefix;
};

struct SecurityRule
{
    std::string_view id;
    std::string_view name;
    std::string_view description;
    RuleCategory category = RuleCategory::kDangerousFunctions;
    Severity severity = Severity::kWarning;
    std::vector<Language> languages;
    /// A rule carries tree matchers or a single kText matcher, never both
    std::vector<Matcher> matchers;
    std::string_view educational_message;
    std::string_view example_safe;
    std::string_view example_unsafe;

    [[nodiscard]] bool applies_to(Language language) const;
    [[nodiscard]] bool is_text_rule() const;
};

/// Every rule of every language, in catalog order
[[nodiscard]] const std::vector<SecurityRule>& rule_catalog();

[[nodiscard]] const SecurityRule* find_rule(std::string_view id);

/**
 * Rules applying to a language.
 * @param enabled Category filter; empty keeps every category
 * @param critical_only Drop warning-severity rules (quick validation)
 */
[[nodiscard]] std::vector<const SecurityRule*> rules_for(Language language,
                                                         std::span<const RuleCategory> enabled = {},
                                                         bool critical_only = false);

[[nodiscard]] std::string_view category_title(RuleCategory category) noexcept;
[[nodiscard]] std::string_view category_description(RuleCategory category) noexcept;

/**
 * Evaluate rules: one pre-order pass over the tree (each rule fires at most
 * once per node) and one line-by-line pass for text rules.
 * @return Findings sorted by (line, column, rule id)
 */
[[nodiscard]] std::vector<Finding> evaluate(std::span<const SecurityRule* const> rules,
                                            const ast::Node& root,
                                            std::string_view code);

/// Finding reported instead of rule findings when analysis failed
[[nodiscard]] Finding parse_failure_finding(const AnalysisResult& analysis);

/**
 * Weighted sum of findings clamped to 0..100; 0 when the code has no
 * non-blank lines.
 */
[[nodiscard]] int risk_score(std::span<const Finding> violations,
                             std::span<const Finding> warnings,
                             const RiskPolicy& policy,
                             std::size_t lines_of_code) noexcept;

/**
 * One entry per triggered rule id (in finding order) followed by one summary
 * entry per triggered category.
 */
[[nodiscard]] std::vector<EducationalFeedback> build_feedback(std::span<const Finding> findings);

/**
 * @brief Runs the catalog against analyzed code and scores the outcome
 */
class SecurityValidator
{
public:
    SecurityValidator() = default;

    /**
     * Analyze and validate.
     * @return Result; UnsupportedLanguage for an unknown language tag
     */
    [[nodiscard]] secbox::Result<ValidationResult>
    validate(std::string_view code, std::string_view language, const ValidationOptions& options) const;

    [[nodiscard]] ValidationResult
    validate(std::string_view code, Language language, const ValidationOptions& options) const;

    /// Validate an analysis produced elsewhere (the analysis is moved into the result)
    [[nodiscard]] ValidationResult validate_analysis(std::string_view code,
                                                     Language language,
                                                     AnalysisResult analysis,
                                                     const ValidationOptions& options) const;

    /// Critical rules only, no metrics or feedback; risk = min(critical * 25, 100)
    [[nodiscard]] secbox::Result<QuickValidation> quick_validate(std::string_view code,
                                                                 std::string_view language) const;

    [[nodiscard]] QuickValidation quick_validate(std::string_view code, Language language) const;

private:
    analyzer::CodeAnalyzer m_analyzer;
};

}  // namespace secbox::rules
