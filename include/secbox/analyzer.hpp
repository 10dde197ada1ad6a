#pragma once

/**
 * @file analyzer.hpp
 * @brief Static analysis: parsing with fallback, metric extraction, complexity score
 */

#include "secbox/ast.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <string>
#include <string_view>
#include <vector>

namespace secbox::analyzer {

/// Appended to AnalysisResult::warnings when the secondary parser produced the tree
inline constexpr std::string_view kFallbackWarning =
    "Parsed with fallback parser, some features may not be available";

/**
 * @brief Parses guest code and extracts structural metrics
 *
 * JavaScript and TypeScript go through the strict parser and then the
 * error-recovering one; Python goes through the indentation-aware parser and
 * then the line scanner. Analysis never fails: a module neither path accepts
 * yields success=false, the errors of both attempts and zero-valued metrics.
 */
class CodeAnalyzer
{
public:
    [[nodiscard]] AnalysisResult analyze(std::string_view code, Language language) const;
};

/**
 * Single visitor pass over a tree.
 * @param root Program node
 * @param code Source text (for the non-blank line count)
 */
[[nodiscard]] CodeMetrics extract_metrics(const ast::Node& root, std::string_view code);

/// Warnings for eval/exec, Function construction, subprocess and os.system usage
[[nodiscard]] std::vector<std::string> safety_warnings(const ast::Node& root, Language language);

/**
 * Complexity on a 0..10 scale:
 * min(complexity/10, 5) + min(loops*0.5, 2) + min(functions*0.2, 2) + min(loc/100, 1).
 */
[[nodiscard]] double complexity_score(const CodeMetrics& metrics) noexcept;

/// False for failed analyses and for analyses carrying a dangerous-call warning
[[nodiscard]] bool is_safe_for_execution(const AnalysisResult& analysis);

}  // namespace secbox::analyzer
