/**
 * @file test_python_analyzer.cpp
 * @brief Python parsing, line-scanner fallback and metric extraction
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

TEST(PythonAnalyzer, ExtractsFunctionsLoopsAndCalls)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("def double(x):\n"
                                         "    return x * 2\n"
                                         "\n"
                                         "for i in range(3):\n"
                                         "    print(double(i))\n",
                                         Language::kPython);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kStrict);
    EXPECT_EQ(result.metrics.lines_of_code, 4U);
    EXPECT_EQ(result.metrics.functions, 1U);
    ASSERT_EQ(result.metrics.loops.size(), 1U);
    EXPECT_EQ(result.metrics.loops.front().kind, LoopKind::kFor);
    EXPECT_EQ(result.metrics.loops.front().line, 4U);
    EXPECT_TRUE(has_call(result.metrics, "print"));
    EXPECT_TRUE(has_call(result.metrics, "double"));
    EXPECT_TRUE(has_call(result.metrics, "range"));
}

TEST(PythonAnalyzer, CountsImportStatementsAndClasses)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("import math, json\n"
                                         "from collections import deque\n"
                                         "\n"
                                         "class Stack:\n"
                                         "    def push(self, item):\n"
                                         "        pass\n",
                                         Language::kPython);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.metrics.imports, 2U);
    EXPECT_EQ(result.metrics.classes, 1U);
    EXPECT_EQ(result.metrics.functions, 1U);
}

TEST(PythonAnalyzer, DetectsInfiniteWhileLoop)
{
    const CodeAnalyzer analyzer;
    const auto endless = analyzer.analyze("while True:\n    pass\n", Language::kPython);
    ASSERT_TRUE(endless.success);
    ASSERT_EQ(endless.metrics.loops.size(), 1U);
    EXPECT_TRUE(endless.metrics.loops.front().is_infinite);

    const auto bounded = analyzer.analyze("while True:\n    break\n", Language::kPython);
    ASSERT_TRUE(bounded.success);
    ASSERT_EQ(bounded.metrics.loops.size(), 1U);
    EXPECT_FALSE(bounded.metrics.loops.front().is_infinite);
}

TEST(PythonAnalyzer, FallsBackToLineScanner)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("print \"legacy\"\nx = len([1, 2])\n", Language::kPython);
    ASSERT_TRUE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kLineScanner);
    EXPECT_TRUE(result.errors.empty());
    EXPECT_TRUE(has_warning(result, kFallbackWarning));
    EXPECT_TRUE(has_call(result.metrics, "len"));
}

TEST(PythonAnalyzer, UnbalancedBracketsFailBothPaths)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("values = (1, 2\nprint(values)\n", Language::kPython);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.parser, ParserKind::kNone);
    EXPECT_EQ(result.errors.size(), 2U);
    EXPECT_EQ(result.metrics.lines_of_code, 0U);
}

TEST(PythonAnalyzer, WarnsAboutProcessAndDynamicCode)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("import os\nimport subprocess\nos.system('ls')\nexec('x = 1')\n",
                                         Language::kPython);
    ASSERT_TRUE(result.success);
    EXPECT_TRUE(has_warning(result, "subprocess usage detected"));
    EXPECT_TRUE(has_warning(result, "os.system() usage detected"));
    EXPECT_TRUE(has_warning(result, "exec() usage detected"));
    EXPECT_FALSE(is_safe_for_execution(result));
}

}  // namespace secbox::analyzer::test
