/**
 * @file validator.cpp
 * @brief SecurityValidator: scoring, feedback and quick validation
 */

#include "secbox/rules.hpp"

#include "secbox/common.hpp"

#include <algorithm>
#include <chrono>
#include <iterator>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::rules {

namespace {

using Clock = std::chrono::steady_clock;

constexpr int kMaxRiskScore = 100;
constexpr int kQuickCriticalWeight = 25;

[[nodiscard]] double elapsed_ms(Clock::time_point since)
{
    return std::chrono::duration<double, std::milli>(Clock::now() - since).count();
}

}  // namespace

int risk_score(std::span<const Finding> violations,
               std::span<const Finding> warnings,
               const RiskPolicy& policy,
               std::size_t lines_of_code) noexcept
{
    if (lines_of_code == 0) {
        return 0;
    }
    const auto total = static_cast<long long>(violations.size()) * policy.critical_weight
                       + static_cast<long long>(warnings.size()) * policy.warning_weight;
    return static_cast<int>(std::clamp(total, 0LL, static_cast<long long>(kMaxRiskScore)));
}

std::vector<EducationalFeedback> build_feedback(std::span<const Finding> findings)
{
    std::vector<EducationalFeedback> feedback;
    std::vector<std::string_view> seen_rules;
    std::vector<EducationalFeedback> summaries;

    for (const auto& finding : findings) {
        if (std::ranges::find(seen_rules, finding.rule_id) != seen_rules.end()) {
            continue;
        }
        seen_rules.push_back(finding.rule_id);
        if (const SecurityRule* rule = find_rule(finding.rule_id)) {
            feedback.push_back(EducationalFeedback{.category = rule->category,
                                                   .title = std::string(rule->name),
                                                   .message = std::string(rule->educational_message),
                                                   .severity = rule->severity,
                                                   .example_safe = std::string(rule->example_safe),
                                                   .example_unsafe = std::string(rule->example_unsafe)});
        }

        auto summary = std::ranges::find(summaries, finding.category, &EducationalFeedback::category);
        if (summary == summaries.end()) {
            summaries.push_back(EducationalFeedback{.category = finding.category,
                                                    .title = std::string(category_title(finding.category)),
                                                    .message =
                                                        std::string(category_description(finding.category)),
                                                    .severity = finding.severity,
                                                    .example_safe = std::nullopt,
                                                    .example_unsafe = std::nullopt});
        } else if (finding.severity == Severity::kCritical) {
            summary->severity = Severity::kCritical;
        }
    }

    feedback.insert(feedback.end(), std::make_move_iterator(summaries.begin()),
                    std::make_move_iterator(summaries.end()));
    return feedback;
}

secbox::Result<ValidationResult> SecurityValidator::validate(std::string_view code,
                                                             std::string_view language,
                                                             const ValidationOptions& options) const
{
    auto parsed = parse_language(language);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return validate(code, *parsed, options);
}

ValidationResult SecurityValidator::validate(std::string_view code,
                                             Language language,
                                             const ValidationOptions& options) const
{
    const auto started = Clock::now();
    auto analysis = m_analyzer.analyze(code, language);
    const double analysis_ms = elapsed_ms(started);

    auto result = validate_analysis(code, language, std::move(analysis), options);
    result.performance.analysis_time_ms = analysis_ms;
    result.performance.total_time_ms = elapsed_ms(started);

    if (result.performance.total_time_ms > options.performance_target_ms) {
        spdlog::warn("{} validation took {:.1f} ms (target {:.1f} ms)",
                     display_name(language),
                     result.performance.total_time_ms,
                     options.performance_target_ms);
    }
    return result;
}

ValidationResult SecurityValidator::validate_analysis(std::string_view code,
                                                      Language language,
                                                      AnalysisResult analysis,
                                                      const ValidationOptions& options) const
{
    const auto started = Clock::now();
    ValidationResult result;
    const auto rules = rules_for(language, options.enabled_categories);
    result.performance.rules_checked = rules.size();
    result.performance.ast_node_count = analysis.node_count;

    if (!analysis.success || !analysis.ast) {
        result.violations.push_back(parse_failure_finding(analysis));
        result.risk_score = kMaxRiskScore;
        result.is_valid = false;
        result.analysis = std::move(analysis);
        result.performance.validation_time_ms = elapsed_ms(started);
        result.performance.total_time_ms = result.performance.validation_time_ms;
        spdlog::debug("{} validation: code did not parse", display_name(language));
        return result;
    }

    auto findings = evaluate(rules, *analysis.ast, code);
    for (auto& finding : findings) {
        if (finding.severity == Severity::kCritical) {
            result.violations.push_back(finding);
        } else {
            result.warnings.push_back(finding);
        }
    }
    result.risk_score =
        risk_score(result.violations, result.warnings, options.policy, analysis.metrics.lines_of_code);
    const bool blocked = options.policy.critical_blocks && !result.violations.empty();
    result.is_valid = !blocked && result.risk_score < options.policy.max_risk_score;
    if (options.educational_mode) {
        result.educational_feedback = build_feedback(findings);
    }
    result.analysis = std::move(analysis);
    result.performance.validation_time_ms = elapsed_ms(started);
    result.performance.total_time_ms = result.performance.validation_time_ms;

    spdlog::debug("{} validation: {} violation(s), {} warning(s), risk {}",
                  display_name(language),
                  result.violations.size(),
                  result.warnings.size(),
                  result.risk_score);
    return result;
}

secbox::Result<QuickValidation> SecurityValidator::quick_validate(std::string_view code,
                                                                  std::string_view language) const
{
    auto parsed = parse_language(language);
    if (!parsed) {
        return std::unexpected(parsed.error());
    }
    return quick_validate(code, *parsed);
}

QuickValidation SecurityValidator::quick_validate(std::string_view code, Language language) const
{
    const auto analysis = m_analyzer.analyze(code, language);
    if (!analysis.success || !analysis.ast) {
        return QuickValidation{.is_valid = false, .critical_issues = 1, .risk_score = kQuickCriticalWeight};
    }
    const auto rules = rules_for(language, {}, true);
    const auto findings = evaluate(rules, *analysis.ast, code);
    const auto score = std::min<std::size_t>(findings.size() * kQuickCriticalWeight, kMaxRiskScore);
    return QuickValidation{.is_valid = findings.empty(),
                           .critical_issues = findings.size(),
                           .risk_score = static_cast<int>(score)};
}

}  // namespace secbox::rules
