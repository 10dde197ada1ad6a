/**
 * @file test_security_validator.cpp
 * @brief Rule evaluation, risk scoring and feedback over real analyses
 */

#include "secbox/rules.hpp"

#include <algorithm>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace secbox::rules::test {

namespace {

[[nodiscard]] std::vector<std::string> rule_ids(const std::vector<Finding>& findings)
{
    std::vector<std::string> ids;
    for (const auto& finding : findings) {
        ids.push_back(finding.rule_id);
    }
    return ids;
}

[[nodiscard]] bool contains(const std::vector<std::string>& ids, std::string_view id)
{
    return std::ranges::find(ids, id) != ids.end();
}

class SecurityValidatorTest : public ::testing::Test
{
protected:
    [[nodiscard]] ValidationResult check(std::string_view code, Language language) const
    {
        return validator.validate(code, language, options);
    }

    SecurityValidator validator;
    ValidationOptions options;
};

}  // namespace

TEST_F(SecurityValidatorTest, CleanCodePasses)
{
    const auto result = check("const values = [1, 2, 3];\nconsole.log(values.length);\n", Language::kJavaScript);
    EXPECT_TRUE(result.is_valid);
    EXPECT_EQ(result.risk_score, 0);
    EXPECT_TRUE(result.violations.empty());
    EXPECT_TRUE(result.warnings.empty());
    EXPECT_TRUE(result.educational_feedback.empty());
    EXPECT_TRUE(result.analysis.success);
    EXPECT_GT(result.performance.rules_checked, 0U);
    EXPECT_GT(result.performance.ast_node_count, 0U);
}

TEST_F(SecurityValidatorTest, EvalIsCriticalViolation)
{
    const auto result = check("const x = 1;\nconst y = eval(\"x + 1\");\n", Language::kJavaScript);
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.risk_score, 40);
    ASSERT_EQ(result.violations.size(), 1U);

    const auto& finding = result.violations.front();
    EXPECT_EQ(finding.rule_id, "js-eval-usage");
    EXPECT_EQ(finding.line, 2U);
    EXPECT_EQ(finding.snippet, "const y = eval(\"x + 1\");");
    EXPECT_EQ(finding.message, "eval() Usage: Code uses eval() which can execute arbitrary code");

    ASSERT_EQ(result.educational_feedback.size(), 2U);
    EXPECT_EQ(result.educational_feedback[0].title, "eval() Usage");
    EXPECT_TRUE(result.educational_feedback[0].example_unsafe.has_value());
    EXPECT_EQ(result.educational_feedback[1].title, "Code Injection");
    EXPECT_EQ(result.educational_feedback[1].severity, Severity::kCritical);
    EXPECT_FALSE(result.educational_feedback[1].example_safe.has_value());
}

TEST_F(SecurityValidatorTest, MemberCallsAndConstructorsMatch)
{
    const auto result = check("window.eval(\"1\");\nconst f = new Function(\"return 1\");\nprocess.exit(0);\n",
                              Language::kJavaScript);
    const auto ids = rule_ids(result.violations);
    EXPECT_TRUE(contains(ids, "js-eval-usage"));
    EXPECT_TRUE(contains(ids, "js-function-constructor"));
    EXPECT_TRUE(contains(ids, "js-process-access"));
    EXPECT_EQ(result.risk_score, 100);
}

TEST_F(SecurityValidatorTest, WarningsAccumulateTowardsThreshold)
{
    const auto one = check("fetch(\"https://example.com\");\n", Language::kJavaScript);
    EXPECT_TRUE(one.is_valid);
    EXPECT_EQ(one.risk_score, 10);
    ASSERT_EQ(one.warnings.size(), 1U);
    EXPECT_EQ(one.warnings.front().rule_id, "js-fetch-usage");

    const auto three = check("const http = require(\"http\");\n"
                             "fetch(\"https://example.com\");\n"
                             "const ws = new WebSocket(\"ws://example.com\");\n",
                             Language::kJavaScript);
    EXPECT_TRUE(three.violations.empty());
    EXPECT_EQ(three.warnings.size(), 3U);
    EXPECT_EQ(three.risk_score, 30);
    EXPECT_FALSE(three.is_valid);
}

TEST_F(SecurityValidatorTest, ModuleMatcherHandlesNodePrefixAndSubmodules)
{
    const auto prefixed = check("const fs = require(\"node:fs\");\n", Language::kJavaScript);
    EXPECT_TRUE(contains(rule_ids(prefixed.violations), "js-fs-access"));

    const auto submodule = check("import { readFile } from \"fs/promises\";\n", Language::kJavaScript);
    EXPECT_TRUE(contains(rule_ids(submodule.violations), "js-fs-access"));

    const auto unrelated = check("const fsx = require(\"fsevents\");\n", Language::kJavaScript);
    EXPECT_FALSE(contains(rule_ids(unrelated.violations), "js-fs-access"));
}

TEST_F(SecurityValidatorTest, LargeAllocationsNeedLargeLiterals)
{
    const auto large = check("const big = new Array(1000000).fill(0);\n", Language::kJavaScript);
    EXPECT_TRUE(contains(rule_ids(large.warnings), "js-large-array"));

    const auto small = check("const small = new Array(10).fill(0);\n", Language::kJavaScript);
    EXPECT_TRUE(small.warnings.empty());

    const auto range = check("values = list(range(1000000))\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(range.warnings), "py-large-range"));
}

TEST_F(SecurityValidatorTest, InfiniteLoopsAreCritical)
{
    const auto js = check("while (true) { console.log(1); }\n", Language::kJavaScript);
    EXPECT_TRUE(contains(rule_ids(js.violations), "js-while-true"));

    const auto js_for = check("for (;;) { console.log(1); }\n", Language::kJavaScript);
    EXPECT_TRUE(contains(rule_ids(js_for.violations), "js-for-infinite"));

    const auto py = check("while True:\n    print(1)\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(py.violations), "py-while-true"));

    const auto bounded = check("while True:\n    break\n", Language::kPython);
    EXPECT_TRUE(bounded.violations.empty());
}

TEST_F(SecurityValidatorTest, PythonImportsAndSystemCalls)
{
    const auto result = check("import os\nos.system(\"ls\")\n", Language::kPython);
    ASSERT_EQ(result.violations.size(), 2U);
    EXPECT_EQ(result.violations[0].rule_id, "py-os-import");
    EXPECT_EQ(result.violations[0].line, 1U);
    EXPECT_EQ(result.violations[1].rule_id, "py-system-calls");
    EXPECT_EQ(result.violations[1].line, 2U);

    const auto from_import = check("from os import path\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(from_import.violations), "py-os-import"));

    const auto lookalike = check("import osmosis\n", Language::kPython);
    EXPECT_TRUE(lookalike.violations.empty());

    const auto spawn = check("import subprocess\nsubprocess.run([\"ls\"])\n", Language::kPython);
    const auto ids = rule_ids(spawn.violations);
    EXPECT_TRUE(contains(ids, "py-subprocess-usage"));
    EXPECT_TRUE(contains(ids, "py-subprocess-call"));
}

TEST_F(SecurityValidatorTest, PythonIntrospectionIsCritical)
{
    const auto traceback = check("try:\n"
                                 "    1 / 0\n"
                                 "except Exception as error:\n"
                                 "    host = error.__traceback__.tb_frame.f_back.f_globals\n",
                                 Language::kPython);
    EXPECT_FALSE(traceback.is_valid);
    ASSERT_FALSE(traceback.violations.empty());
    EXPECT_EQ(traceback.violations.front().rule_id, "py-introspection-escape");
    EXPECT_EQ(traceback.violations.front().line, 4U);

    const auto module = check("import random\nrandom._os.system('id')\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(module.violations), "py-introspection-escape"));

    const auto imported = check("from random import _os\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(imported.violations), "py-introspection-escape"));

    const auto subclasses = check("classes = ().__class__.__base__.__subclasses__()\n", Language::kPython);
    EXPECT_TRUE(contains(rule_ids(subclasses.violations), "py-introspection-escape"));
}

TEST_F(SecurityValidatorTest, UnderscoreKeysAreNotAttributes)
{
    const auto result = check("row = {'_id': 1}\nprint(row['_id'])\n", Language::kPython);
    EXPECT_TRUE(result.is_valid);
    EXPECT_TRUE(result.violations.empty());
}

TEST_F(SecurityValidatorTest, PrototypeChainEscapeIsCritical)
{
    const auto result = check("const probe = {};\n"
                              "probe[Symbol.for('nodejs.util.inspect.custom')] = (depth, opts, inspect) =>\n"
                              "    inspect.constructor('return process')();\n",
                              Language::kJavaScript);
    EXPECT_FALSE(result.is_valid);
    const auto ids = rule_ids(result.violations);
    EXPECT_TRUE(contains(ids, "js-prototype-escape"));

    const auto bracket = check("const F = [][\"constructor\"][\"constructor\"];\n", Language::kTypeScript);
    EXPECT_TRUE(contains(rule_ids(bracket.violations), "js-prototype-escape"));
}

TEST_F(SecurityValidatorTest, RepeatedValidationIsIdentical)
{
    const std::string code = "import subprocess\n"
                             "while True:\n"
                             "    subprocess.run(['ls'])\n"
                             "data = open('notes.txt').read()\n";
    const auto first = check(code, Language::kPython);
    const auto second = check(code, Language::kPython);

    EXPECT_EQ(first.is_valid, second.is_valid);
    EXPECT_EQ(first.risk_score, second.risk_score);
    ASSERT_EQ(first.violations.size(), second.violations.size());
    for (std::size_t i = 0; i < first.violations.size(); ++i) {
        EXPECT_EQ(first.violations[i].rule_id, second.violations[i].rule_id);
        EXPECT_EQ(first.violations[i].line, second.violations[i].line);
        EXPECT_EQ(first.violations[i].column, second.violations[i].column);
    }
    EXPECT_EQ(rule_ids(first.warnings), rule_ids(second.warnings));
    EXPECT_FALSE(first.violations.empty());
}

TEST_F(SecurityValidatorTest, TextRulesScanRawLines)
{
    const auto result = check("const path = \"../../etc/passwd\";\n", Language::kTypeScript);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations.front().rule_id, "js-path-traversal");
    EXPECT_EQ(result.violations.front().line, 1U);
}

TEST_F(SecurityValidatorTest, FindingsAreSortedByPosition)
{
    const auto result = check("fetch(\"a\");\neval(\"1\");\nconst ws = new WebSocket(\"b\");\n",
                              Language::kJavaScript);
    ASSERT_EQ(result.violations.size(), 1U);
    ASSERT_EQ(result.warnings.size(), 2U);
    EXPECT_EQ(result.violations.front().line, 2U);
    EXPECT_EQ(result.warnings[0].line, 1U);
    EXPECT_EQ(result.warnings[1].line, 3U);
}

TEST_F(SecurityValidatorTest, LongLinesAreShortenedInSnippets)
{
    const std::string code = "eval(\"" + std::string(200, 'a') + "\");\n";
    const auto result = check(code, Language::kJavaScript);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations.front().snippet.size(), 123U);
    EXPECT_TRUE(result.violations.front().snippet.ends_with("..."));
}

TEST_F(SecurityValidatorTest, UnparsableCodeIsRejected)
{
    const auto result = check("values = (1, 2\nprint(values)\n", Language::kPython);
    EXPECT_FALSE(result.is_valid);
    EXPECT_EQ(result.risk_score, 100);
    ASSERT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.violations.front().rule_id, kParseFailureRuleId);
    EXPECT_TRUE(result.violations.front().message.starts_with("Failed to parse code"));
    EXPECT_FALSE(result.analysis.success);
}

TEST_F(SecurityValidatorTest, CategoryFilterAndEducationalMode)
{
    options.enabled_categories = {RuleCategory::kNetwork};
    options.educational_mode = false;
    const auto result = check("eval(\"1\");\nfetch(\"a\");\n", Language::kJavaScript);
    EXPECT_TRUE(result.violations.empty());
    ASSERT_EQ(result.warnings.size(), 1U);
    EXPECT_EQ(result.warnings.front().rule_id, "js-fetch-usage");
    EXPECT_TRUE(result.educational_feedback.empty());
    EXPECT_TRUE(result.is_valid);
}

TEST_F(SecurityValidatorTest, PolicyControlsBlocking)
{
    options.policy.critical_blocks = false;
    options.policy.max_risk_score = 50;
    const auto result = check("eval(\"1\");\n", Language::kJavaScript);
    EXPECT_EQ(result.violations.size(), 1U);
    EXPECT_EQ(result.risk_score, 40);
    EXPECT_TRUE(result.is_valid);
}

TEST_F(SecurityValidatorTest, UnknownLanguageTagIsAnError)
{
    const auto result = validator.validate("puts 1", "ruby", options);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "UnsupportedLanguage");

    const auto ok = validator.validate("print(1)", "python", options);
    ASSERT_TRUE(ok);
    EXPECT_TRUE(ok->is_valid);
}

TEST(QuickValidate, CountsCriticalFindingsOnly)
{
    const SecurityValidator validator;
    const auto clean = validator.quick_validate("print(1)\n", Language::kPython);
    EXPECT_TRUE(clean.is_valid);
    EXPECT_EQ(clean.critical_issues, 0U);
    EXPECT_EQ(clean.risk_score, 0);

    const auto warning_only = validator.quick_validate("fetch(\"a\");\n", Language::kJavaScript);
    EXPECT_TRUE(warning_only.is_valid);

    const auto two = validator.quick_validate("eval(\"1\");\nprocess.exit(0);\n", Language::kJavaScript);
    EXPECT_FALSE(two.is_valid);
    EXPECT_EQ(two.critical_issues, 2U);
    EXPECT_EQ(two.risk_score, 50);

    const auto broken = validator.quick_validate("values = (1, 2\n", Language::kPython);
    EXPECT_FALSE(broken.is_valid);
    EXPECT_EQ(broken.critical_issues, 1U);
    EXPECT_EQ(broken.risk_score, 25);
}

TEST(RiskScore, WeightsAndClamps)
{
    const RiskPolicy policy;
    const std::vector<Finding> violations(2);
    const std::vector<Finding> warnings(1);
    EXPECT_EQ(risk_score(violations, warnings, policy, 10), 90);
    EXPECT_EQ(risk_score(violations, warnings, policy, 0), 0);

    const std::vector<Finding> many(5);
    EXPECT_EQ(risk_score(many, warnings, policy, 10), 100);
}

}  // namespace secbox::rules::test
