/**
 * @file test_typescript_analyzer.cpp
 * @brief TypeScript type-syntax ranges and erasure blockers
 */

#include "secbox/analyzer.hpp"

#include <algorithm>
#include <string>
#include <string_view>

#include <gtest/gtest.h>

namespace secbox::analyzer::test {

namespace {

[[nodiscard]] std::string covered_text(std::string_view code, const AnalysisResult& result)
{
    std::string text;
    for (const auto& range : result.type_only_ranges) {
        text += std::string(code.substr(range.begin, range.end - range.begin));
        text += '|';
    }
    return text;
}

}  // namespace

TEST(TypeScriptAnalyzer, RecordsTypeOnlyRanges)
{
    constexpr std::string_view kCode = "let count: number = 5;\n"
                                       "interface Point { x: number; y: number }\n"
                                       "function id<T>(value: T): T { return value; }\n";
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze(kCode, Language::kTypeScript);
    ASSERT_TRUE(result.success) << (result.errors.empty() ? "" : result.errors.front());
    EXPECT_EQ(result.parser, ParserKind::kStrict);
    EXPECT_TRUE(result.erasure_blockers.empty());
    ASSERT_FALSE(result.type_only_ranges.empty());

    const auto covered = covered_text(kCode, result);
    EXPECT_TRUE(covered.contains("number"));
    EXPECT_TRUE(covered.contains("interface Point"));
    EXPECT_TRUE(covered.contains("<T>"));
    EXPECT_EQ(result.metrics.functions, 1U);

    EXPECT_TRUE(std::ranges::is_sorted(result.type_only_ranges, {}, &SourceRange::begin));
    for (const auto& range : result.type_only_ranges) {
        EXPECT_LE(range.begin, range.end);
        EXPECT_LE(range.end, kCode.size());
    }
}

TEST(TypeScriptAnalyzer, RuntimeTypeConstructsBlockErasure)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("enum Color { Red, Green }\nconsole.log(Color.Red);\n",
                                         Language::kTypeScript);
    ASSERT_TRUE(result.success);
    ASSERT_FALSE(result.erasure_blockers.empty());
    EXPECT_TRUE(result.erasure_blockers.front().contains("enum declarations"));
}

TEST(TypeScriptAnalyzer, TypeSyntaxIsRejectedAsJavaScript)
{
    const CodeAnalyzer analyzer;
    const auto result = analyzer.analyze("let count: number = 5;", Language::kJavaScript);
    EXPECT_NE(result.parser, ParserKind::kStrict);
}

}  // namespace secbox::analyzer::test
