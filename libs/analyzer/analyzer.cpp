/**
 * @file analyzer.cpp
 * @brief CodeAnalyzer: primary parse, fallback parse, metric extraction
 */

#include "secbox/analyzer.hpp"

#include "js_parser.hpp"
#include "line_scanner.hpp"
#include "py_parser.hpp"

#include <format>
#include <iterator>
#include <memory>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::analyzer {

namespace {

void finish(AnalysisResult& result, std::unique_ptr<ast::Node> program, std::string_view code,
            Language language)
{
    result.success = true;
    result.node_count = ast::count_nodes(*program);
    result.metrics = extract_metrics(*program, code);
    auto warnings = safety_warnings(*program, language);
    result.warnings.insert(result.warnings.end(), std::make_move_iterator(warnings.begin()),
                           std::make_move_iterator(warnings.end()));
    result.ast = std::shared_ptr<const ast::Node>(std::move(program));
}

AnalysisResult analyze_javascript(std::string_view code, Language language)
{
    AnalysisResult result;
    const bool typescript = language == Language::kTypeScript;

    auto strict = js::parse(code, typescript, js::ParseMode::kStrict);
    if (strict) {
        result.parser = ParserKind::kStrict;
        result.type_only_ranges = std::move(strict->type_only_ranges);
        result.erasure_blockers = std::move(strict->erasure_blockers);
        finish(result, std::move(strict->program), code, language);
        return result;
    }
    // Reported only when the fallback fails too
    auto strict_error = std::format("Parse error: {}", strict.error().message);

    auto tolerant = js::parse(code, typescript, js::ParseMode::kTolerant);
    if (!tolerant) {
        result.errors.push_back(std::move(strict_error));
        result.errors.push_back(std::format("Fallback parse error: {}", tolerant.error().message));
        spdlog::debug("{} analysis failed: {}", display_name(language), tolerant.error().message);
        return result;
    }
    spdlog::debug("{} parsed with the tolerant parser ({} recovered errors)",
                  display_name(language), tolerant->errors.size());
    result.parser = ParserKind::kTolerant;
    result.warnings.emplace_back(kFallbackWarning);
    for (auto& recovered : tolerant->errors) {
        result.warnings.push_back(std::format("Recovered: {}", recovered));
    }
    result.type_only_ranges = std::move(tolerant->type_only_ranges);
    result.erasure_blockers = std::move(tolerant->erasure_blockers);
    finish(result, std::move(tolerant->program), code, language);
    return result;
}

AnalysisResult analyze_python(std::string_view code)
{
    AnalysisResult result;
    auto parsed = py::parse(code);
    if (parsed) {
        result.parser = ParserKind::kStrict;
        finish(result, std::move(*parsed), code, Language::kPython);
        return result;
    }
    auto strict_error = std::format("Python syntax error: {}", parsed.error().message);

    auto scanned = py::scan_lines(code);
    if (!scanned) {
        result.errors.push_back(std::move(strict_error));
        result.errors.push_back(std::format("Fallback parse error: {}", scanned.error().message));
        spdlog::debug("Python analysis failed: {}", scanned.error().message);
        return result;
    }
    spdlog::debug("Python analyzed with the line scanner");
    result.parser = ParserKind::kLineScanner;
    result.warnings.emplace_back(kFallbackWarning);
    finish(result, std::move(*scanned), code, Language::kPython);
    return result;
}

}  // namespace

AnalysisResult CodeAnalyzer::analyze(std::string_view code, Language language) const
{
    switch (language) {
        case Language::kPython:
            return analyze_python(code);
        case Language::kJavaScript:
        case Language::kTypeScript:
            return analyze_javascript(code, language);
    }
    return AnalysisResult{};
}

}  // namespace secbox::analyzer
