/**
 * @file test_javascript_engine.cpp
 * @brief JavaScript and TypeScript engines against a real Node.js (skipped when absent)
 */

#include "process.hpp"

#include "secbox/analyzer.hpp"
#include "secbox/engine.hpp"

#include <algorithm>
#include <filesystem>
#include <format>
#include <memory>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

namespace secbox::engine::test {

namespace {

class RecordingObserver final : public ExecutionObserver
{
public:
    void on_process_started(int) override {}
    void on_guest_ready() override { ++ready; }
    void on_network_attempt(std::string_view target) override { network.emplace_back(target); }
    void on_dom_mutation() override { ++dom; }
    void on_output(std::size_t) override {}

    int ready = 0;
    int dom = 0;
    std::vector<std::string> network;
};

class NodeEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        if (!find_executable("node")) {
            GTEST_SKIP() << "node is not installed";
        }
        m_dir = std::filesystem::temp_directory_path()
                / ("secbox_node_" + std::to_string(::getpid()) + "_"
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(m_dir);
    }

    void TearDown() override
    {
        m_engines.clear();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] ExecutionEngine& engine(Language language)
    {
        m_engines.push_back(make_engine(language, EngineSettings{.interpreter = "node",
                                                                 .work_dir = m_dir,
                                                                 .allowed_modules = {}}));
        return *m_engines.back();
    }

    [[nodiscard]] ExecutionResult run(Language language,
                                      std::string_view code,
                                      const std::vector<std::string>& inputs = {},
                                      const ExecutionLimits& limits = {})
    {
        ExecutionContext context{.cancellation = &m_token,
                                 .observer = &m_observer,
                                 .analysis = nullptr,
                                 .inspect_variables = true,
                                 .hidden_prefixes = {}};
        return engine(language).execute(code, inputs, limits, context);
    }

    std::filesystem::path m_dir;
    std::vector<std::unique_ptr<ExecutionEngine>> m_engines;
    CancellationToken m_token;
    RecordingObserver m_observer;
};

}  // namespace

TEST_F(NodeEngineTest, ReportsVersionAndFeatures)
{
    auto& js = engine(Language::kJavaScript);
    ASSERT_TRUE(js.initialize().get());
    const auto status = js.status();
    EXPECT_TRUE(status.initialized);
    EXPECT_TRUE(status.version.starts_with("Node.js v")) << status.version;
    EXPECT_EQ(std::ranges::find(status.features, "type-erasure"), status.features.end());

    auto& ts = engine(Language::kTypeScript);
    ASSERT_TRUE(ts.initialize().get());
    const auto ts_status = ts.status();
    EXPECT_EQ(ts_status.language, Language::kTypeScript);
    EXPECT_NE(std::ranges::find(ts_status.features, "type-erasure"), ts_status.features.end());
}

TEST_F(NodeEngineTest, RunsCodeAndCapturesBindings)
{
    const auto result = run(Language::kJavaScript,
                            "const total = 1 + 2;\n"
                            "let items = ['a', 'b'];\n"
                            "function helper() { return total; }\n"
                            "console.log('total', total);\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "total 3\n");
    ASSERT_TRUE(result.variables.has_value());
    EXPECT_EQ((*result.variables)["total"], 3);
    EXPECT_EQ((*result.variables)["items"], nlohmann::json::array({"a", "b"}));
    EXPECT_TRUE(result.variables->contains("helper"));
    EXPECT_FALSE(result.variables->contains("console"));
    EXPECT_EQ(m_observer.ready, 1);
}

TEST_F(NodeEngineTest, PromptReplaysInputsThenReturnsNull)
{
    const auto result = run(Language::kJavaScript,
                            "const a = prompt('A? ');\nconst b = prompt('B? ');\nconsole.log(a, b);\n", {"1"});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "A? 1\nB? 1 null\n");
}

TEST_F(NodeEngineTest, NetworkAccessIsBlockedAndReported)
{
    const auto result = run(Language::kJavaScript,
                            "fetch('https://example.com/data').catch((error) => console.log(error.message));\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Network access to https://example.com/data is not allowed in the sandbox\n");
    ASSERT_EQ(m_observer.network.size(), 1U);
    EXPECT_EQ(m_observer.network.front(), "https://example.com/data");
}

TEST_F(NodeEngineTest, RequireIsUnavailable)
{
    const auto result = run(Language::kJavaScript, "const cp = require('child_process');\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(result.error, "Error: Module 'child_process' is not available in the sandbox");
}

TEST_F(NodeEngineTest, StringCodeGenerationIsDisabled)
{
    const auto result = run(Language::kJavaScript, "const v = eval('1 + 1');\n");
    EXPECT_FALSE(result.success);
    EXPECT_TRUE(result.error.value_or("").starts_with("EvalError")) << result.error.value_or("");
}

TEST_F(NodeEngineTest, DomMutationsAreCounted)
{
    const auto result = run(Language::kJavaScript,
                            "const div = document.createElement('div');\n"
                            "div.setAttribute('id', 'main');\n"
                            "document.body.appendChild(div);\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(m_observer.dom, 2);
}

TEST_F(NodeEngineTest, RuntimeErrorsAreNormalized)
{
    const auto result = run(Language::kJavaScript, "const value = null;\nconsole.log(value.length);\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_TRUE(result.error.value_or("").starts_with("TypeError: ")) << result.error.value_or("");
    EXPECT_FALSE(result.variables.has_value());
}

TEST_F(NodeEngineTest, LimitsStopRunawayCode)
{
    ExecutionLimits limits;
    limits.max_wall_clock_ms = 500;
    const auto endless = run(Language::kJavaScript, "while (true) {}\n", {}, limits);
    EXPECT_FALSE(endless.success);
    EXPECT_EQ(endless.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(endless.error, "Wall-clock time limit exceeded");

    const auto deep = run(Language::kJavaScript, "function dive(n) { return dive(n + 1) + 1; }\ndive(0);\n");
    EXPECT_FALSE(deep.success);
    EXPECT_EQ(deep.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(deep.error, "Maximum recursion depth exceeded");
}

TEST_F(NodeEngineTest, RecursionCeilingIsEnforced)
{
    ExecutionLimits limits;
    limits.max_recursion_depth = 100;
    const auto result = run(Language::kJavaScript,
                            "function count(n) { return n === 0 ? 0 : 1 + count(n - 1); }\n"
                            "console.log(count(50));\n"
                            "try {\n"
                            "  count(5000);\n"
                            "} catch (error) {\n"
                            "  console.log('caught');\n"
                            "}\n",
                            {},
                            limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result.error, "Maximum recursion depth exceeded");
    EXPECT_EQ(result.output, "50\n");
}

TEST_F(NodeEngineTest, ConsoleFormatsInsideTheSandbox)
{
    const auto result = run(Language::kJavaScript,
                            "console.log([1, 'two', { three: 3 }]);\n"
                            "console.log('%s has %d items', 'cart', 3);\n"
                            "console.log({ get secret() { return 'ran'; } }, new Set([1]));\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "[ 1, 'two', { three: 3 } ]\n"
                             "cart has 3 items\n"
                             "{ secret: [Getter] } Set(1) { 1 }\n");
}

TEST_F(NodeEngineTest, InspectionHooksNeverReachTheHost)
{
    const auto marker = m_dir / "escaped";
    const auto code = std::format("const value = {{}};\n"
                                  "value[Symbol.for('nodejs.util.inspect.custom')] = (depth, options, inspect) => {{\n"
                                  "  const proc = inspect.constructor('return process')();\n"
                                  "  proc.mainModule.require('child_process').execSync('touch {}');\n"
                                  "  return 'JS-ESCAPE';\n"
                                  "}};\n"
                                  "console.log(value);\n",
                                  marker.string());
    const auto printed = run(Language::kJavaScript, code);
    ASSERT_TRUE(printed.success) << printed.error.value_or("");
    EXPECT_EQ(printed.output, "{}\n");
    ASSERT_TRUE(printed.variables.has_value());
    EXPECT_EQ((*printed.variables)["value"], nlohmann::json::object());

    const auto thrown = run(Language::kJavaScript, code + "throw value;\n");
    EXPECT_FALSE(thrown.success);
    EXPECT_EQ(thrown.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(thrown.error, "Uncaught {}");

    EXPECT_FALSE(printed.output.contains("JS-ESCAPE"));
    EXPECT_FALSE(thrown.output.contains("JS-ESCAPE"));
    EXPECT_FALSE(std::filesystem::exists(marker));
}

TEST_F(NodeEngineTest, TypeScriptRunsAfterErasure)
{
    const auto result = run(Language::kTypeScript,
                            "interface Greeter { greet(who: string): string }\n"
                            "const count: number = 2;\n"
                            "const greet = (who: string): string => 'hi ' + who;\n"
                            "console.log(greet('ts'), count);\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "hi ts 2\n");
    ASSERT_TRUE(result.variables.has_value());
    EXPECT_EQ((*result.variables)["count"], 2);
}

TEST_F(NodeEngineTest, TypeScriptRejectsUnsupportedAndInvalidCode)
{
    const auto unsupported = run(Language::kTypeScript, "enum Color { Red }\nconsole.log(Color.Red);\n");
    EXPECT_FALSE(unsupported.success);
    EXPECT_EQ(unsupported.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(unsupported.error, "TypeScript feature not supported: enum declarations (line 1)");

    const auto invalid = run(Language::kTypeScript, "function broken( {\n");
    EXPECT_FALSE(invalid.success);
    EXPECT_TRUE(invalid.error.value_or("").starts_with("SyntaxError: ")) << invalid.error.value_or("");
}

TEST_F(NodeEngineTest, UsesCallerAnalysisWhenProvided)
{
    const auto analysis = analyzer::CodeAnalyzer{}.analyze("var shared = 5;\n", Language::kJavaScript);
    ExecutionContext context{.cancellation = nullptr,
                             .observer = nullptr,
                             .analysis = &analysis,
                             .inspect_variables = true,
                             .hidden_prefixes = {}};
    const auto result = engine(Language::kJavaScript).execute("var shared = 5;\n", {}, ExecutionLimits{}, context);
    ASSERT_TRUE(result.success) << result.error.value_or("");
    ASSERT_TRUE(result.variables.has_value());
    EXPECT_EQ((*result.variables)["shared"], 5);
}

}  // namespace secbox::engine::test
