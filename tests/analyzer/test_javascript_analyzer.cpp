/**
 * @file test_javascript_analyzer.cpp
 * @brief JavaScript parsing, fallback and metric extraction
 */

#include "secbox/analyzer.hpp"

#include <algorithm>
#include <string>

#include <gtest/gtest.h>

namespace secbox::analyzer::test {

namespace {

[[nodiscard]] bool has_call(const CodeMetrics& metrics, std::string_view name)
{
    return std::ranges::any_of(metrics.calls, [&](const CallInfo& call) { return call.name == name; });
}

[[nodiscard]] bool has_warning(const AnalysisResult& result, std::string_view fragment)
{
    return std::ranges::any_of(result.warnings, [&](const std::string& w) { return w.contains(fragment); });
}

}  // namespace

TEST(JavaScriptAnalyzer, ExtractsFunctionsLoopsAndCalls)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("function add(a, b) { return a + b; }\n"
                                         "const total = add(1, 2);\n"
                                         "\n"
                                         "for (let i = 0; i < 3; i++) { console.log(i); }\n",
                                         Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kStrict);
    EXPECT_TRUE(result.errors.empty());
    ASSERT_NE(result.ast, nullptr);
    EXPECT_GT(result.node_count, 10U);

    EXPECT_EQ(result.metrics.lines_of_code, 3U);
    EXPECT_EQ(result.metrics.functions, 1U);
    ASSERT_EQ(result.metrics.loops.size(), 1U);
    EXPECT_EQ(result.metrics.loops.front().kind, LoopKind::kFor);
    EXPECT_EQ(result.metrics.loops.front().line, 4U);
    EXPECT_FALSE(result.metrics.loops.front().is_infinite);
    EXPECT_EQ(result.metrics.complexity, 3U);
    EXPECT_TRUE(has_call(result.metrics, "add"));
    EXPECT_TRUE(has_call(result.metrics, "log"));
}

TEST(JavaScriptAnalyzer, CountsClassesMethodsAndArrows)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("class Counter {\n"
                                         "  constructor() { this.n = 0; }\n"
                                         "  inc() { this.n += 1; }\n"
                                         "}\n"
                                         "const twice = (x) => x * 2;\n",
                                         Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.metrics.classes, 1U);
    EXPECT_EQ(result.metrics.functions, 3U);
}

TEST(JavaScriptAnalyzer, CountsImports)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("import fs from 'fs';\nimport { join } from 'path';\n",
                                         Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.metrics.imports, 2U);
}

TEST(JavaScriptAnalyzer, FlagsInfiniteLoopsWithoutBreak)
{
    const CodeAnalyzer analyzer;
    const auto endless = analyzer.analyze("while (true) { tick(); }", Language::kJavaScript);
    ASSERT_TRUE(endless.success);
    ASSERT_EQ(endless.metrics.loops.size(), 1U);
    EXPECT_TRUE(endless.metrics.loops.front().is_infinite);
    EXPECT_FALSE(endless.metrics.loops.front().has_break);

    const auto bounded = analyzer.analyze("for (;;) { if (done()) { break; } }", Language::kJavaScript);
    ASSERT_TRUE(bounded.success);
    ASSERT_EQ(bounded.metrics.loops.size(), 1U);
    EXPECT_TRUE(bounded.metrics.loops.front().has_break);
    EXPECT_FALSE(bounded.metrics.loops.front().is_infinite);
}

TEST(JavaScriptAnalyzer, FallsBackToTolerantParser)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("let a = 1;\nlet b = ;\nconsole.log(a);\n", Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kTolerant);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(has_warning(result, kFallbackWarning));
    ASSERT_GE(result.warnings.size(), 2U);
    EXPECT_TRUE(std::ranges::any_of(result.warnings, [](const std::string& w) { return w.starts_with("Recovered: "); }));
    EXPECT_TRUE(has_call(result.metrics, "log"));
}

TEST(JavaScriptAnalyzer, UnbalancedSourceFailsBothParsers)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("function broken( {\n  return 1;\n", Language::kJavaScript);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kNone);
    EXPECT_EQ(result.errors.size(), 2U);
    EXPECT_EQ(result.ast, nullptr);
    EXPECT_EQ(result.metrics.functions, 0U);
    EXPECT_EQ(result.metrics.lines_of_code, 0U);
}

TEST(JavaScriptAnalyzer, WarnsAboutDynamicCode)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("eval('1 + 1');\nconst f = new Function('return 1');\n",
                                         Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(has_warning(result, "eval() usage detected"));
    EXPECT_TRUE(has_warning(result, "Function constructor usage detected"));
    EXPECT_FALSE(is_safe_for_execution(result));
}

TEST(JavaScriptAnalyzer, PlainCodeIsSafeForExecution)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("const xs = [1, 2, 3].map((x) => x + 1);", Language::kJavaScript);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(is_safe_for_execution(result));
}

TEST(ComplexityScore, FollowsWeightedFormula)
{
    CodeMetrics metrics;
    metrics.complexity = 20;
    metrics.functions = 5;
    metrics.lines_of_code = 50;
    metrics.loops.resize(3);
    // 2.0 + 1.5 + 1.0 + 0.5
    EXPECT_DOUBLE_EQ(complexity_score(metrics), 5.0);

    metrics.complexity = 500;
    metrics.functions = 100;
    metrics.lines_of_code = 10'000;
    metrics.loops.resize(40);
    EXPECT_DOUBLE_EQ(complexity_score(metrics), 10.0);
}

}  // namespace secbox::analyzer::test
