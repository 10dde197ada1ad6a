/**
 * @file test_runtime.cpp
 * @brief Runtime orchestration with scripted engines
 */

#include "secbox/runtime.hpp"

#include <algorithm>
#include <filesystem>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

#include <gtest/gtest.h>

namespace secbox::runtime::test {

namespace {

const std::filesystem::path kSchemaDir = SECBOX_SCHEMA_DIR;

/// What the scripted engine saw and what it answers
struct EngineScript
{
    int runs = 0;
    std::string last_code;
    bool had_analysis = false;
    engine::EngineSettings settings;
    std::function<void(ExecutionContext&)> during_run;
    ExecutionResult answer;
};

class ScriptedEngine final : public engine::ExecutionEngine
{
public:
    ScriptedEngine(Language language, std::shared_ptr<EngineScript> script)
        : ExecutionEngine(language)
        , m_script(std::move(script))
    {}

    ~ScriptedEngine() override { join_initialization(); }

protected:
    secbox::Result<Installed> install() override
    {
        return Installed{.version = "scripted 1.0", .features = {"scripted"}};
    }

    ExecutionResult run(std::string_view code,
                        const std::vector<std::string>&,
                        const ExecutionLimits&,
                        ExecutionContext& context) override
    {
        ++m_script->runs;
        m_script->last_code = std::string(code);
        m_script->had_analysis = context.analysis != nullptr;
        if (m_script->during_run) {
            m_script->during_run(context);
        }
        return m_script->answer;
    }

private:
    std::shared_ptr<EngineScript> m_script;
};

class FailingProbe final : public monitor::ProcessProbe
{
public:
    secbox::Result<monitor::ProcessSample> sample(int) override
    {
        return std::unexpected(Error::make("ProbeFailed", "no process"));
    }
};

class RuntimeTest : public ::testing::Test
{
protected:
    RuntimeTest()
    {
        script->answer.success = true;
        script->answer.output = "ok\n";
        script->answer.variables = nlohmann::json{{"x", 1}};
    }

    [[nodiscard]] std::unique_ptr<Runtime> make_runtime(common::SandboxConfig config = common::default_config())
    {
        config.work_dir = std::filesystem::temp_directory_path() / "secbox_runtime_test";
        RuntimeHooks hooks{.engine_factory =
                               [this](Language language, engine::EngineSettings settings) {
                                   script->settings = settings;
                                   return std::make_unique<ScriptedEngine>(language, script);
                               },
                           .probe_factory = [] { return std::make_shared<FailingProbe>(); }};
        return std::make_unique<Runtime>(std::move(config), std::move(hooks));
    }

    [[nodiscard]] static ExecutionRequest request(Language language, std::string code)
    {
        ExecutionRequest req;
        req.language = language;
        req.code = std::move(code);
        return req;
    }

    std::shared_ptr<EngineScript> script = std::make_shared<EngineScript>();
};

}  // namespace

TEST_F(RuntimeTest, RunsValidatedCode)
{
    auto runtime = make_runtime();
    EXPECT_EQ(runtime->state(), RuntimeState::kIdle);

    const auto result = runtime->execute(request(Language::kPython, "print(1)\n"));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_EQ(result->output, "ok\n");
    ASSERT_TRUE(result->security_validation.has_value());
    EXPECT_TRUE(result->security_validation->is_valid);
    EXPECT_EQ(script->runs, 1);
    EXPECT_EQ(script->last_code, "print(1)\n");
    EXPECT_TRUE(script->had_analysis);
    EXPECT_EQ(runtime->state(), RuntimeState::kFinalized);
    EXPECT_GT(result->metrics.execution_time_ms, 0.0);
}

TEST_F(RuntimeTest, StrictModeBlocksViolations)
{
    auto runtime = make_runtime();
    const auto result = runtime->execute(request(Language::kPython, "value = eval(\"1 + 1\")\n"));
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(result->error,
              "Security validation failed: eval() Usage\n"
              "  line 1: eval() Usage: Code uses eval() which can execute arbitrary Python code");
    ASSERT_TRUE(result->security_validation.has_value());
    EXPECT_FALSE(result->security_validation->is_valid);
    EXPECT_EQ(script->runs, 0);
    EXPECT_EQ(runtime->state(), RuntimeState::kFinalized);
}

TEST_F(RuntimeTest, NonStrictModeRunsAnyway)
{
    auto runtime = make_runtime();
    auto req = request(Language::kJavaScript, "eval('1');\n");
    req.strict_security_mode = false;
    const auto result = runtime->execute(req);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->success);
    EXPECT_EQ(script->runs, 1);
    ASSERT_TRUE(result->security_validation.has_value());
    EXPECT_FALSE(result->security_validation->is_valid);
}

TEST_F(RuntimeTest, SkippingValidationLeavesNoReport)
{
    auto runtime = make_runtime();
    auto req = request(Language::kJavaScript, "eval('1');\n");
    req.skip_security_validation = true;
    const auto result = runtime->execute(req);
    ASSERT_TRUE(result);
    EXPECT_TRUE(result->success);
    EXPECT_FALSE(result->security_validation.has_value());
    EXPECT_FALSE(script->had_analysis);
}

TEST_F(RuntimeTest, RejectsLimitsOutOfRange)
{
    auto runtime = make_runtime();
    auto req = request(Language::kPython, "print(1)\n");
    req.limits.max_memory_mb = kMaxMemoryLimitMb + 1;
    const auto result = runtime->execute(req);
    ASSERT_FALSE(result);
    EXPECT_EQ(result.error().code, "LimitOutOfRange");
    EXPECT_EQ(script->runs, 0);
}

TEST_F(RuntimeTest, CriticalAlertFailsRunThatCompleted)
{
    auto runtime = make_runtime();
    std::mutex alerts_mutex;
    std::vector<Alert> alerts;
    const auto unsubscribe = runtime->subscribe([&](const monitor::MonitorEvent& event) {
        if (event.alert) {
            std::lock_guard lock(alerts_mutex);
            alerts.push_back(*event.alert);
        }
    });
    script->during_run = [](ExecutionContext& context) {
        for (int i = 0; i < 3; ++i) {
            context.observer->on_network_attempt("https://example.com");
        }
    };

    auto req = request(Language::kJavaScript, "console.log(1);\n");
    req.limits.max_network_requests = 2;
    const auto result = runtime->execute(req);
    unsubscribe();

    ASSERT_TRUE(result);
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result->error, "Network request limit exceeded");
    EXPECT_FALSE(result->variables.has_value());
    EXPECT_EQ(result->metrics.network_request_count, 3U);
    ASSERT_EQ(result->metrics.alerts.size(), 2U);

    std::lock_guard lock(alerts_mutex);
    ASSERT_EQ(alerts.size(), 2U);
    EXPECT_EQ(alerts[0].severity, Severity::kWarning);
    EXPECT_EQ(alerts[1].severity, Severity::kCritical);
}

TEST_F(RuntimeTest, ExecutesJsonRequests)
{
    auto runtime = make_runtime();
    const nlohmann::json valid = {
        {"language", "javascript"},
        {    "code", "console.log(1);"},
        {  "inputs", nlohmann::json::array({"a"})}
    };
    const auto result = runtime->execute_json(valid, kSchemaDir);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_TRUE(result->success);
    EXPECT_EQ(script->last_code, "console.log(1);");

    const nlohmann::json missing_code = {
        {"language", "python"}
    };
    const auto invalid = runtime->execute_json(missing_code, kSchemaDir);
    ASSERT_FALSE(invalid);
    EXPECT_EQ(invalid.error().code, "SchemaInvalid");
}

TEST_F(RuntimeTest, EnginesAreBuiltFromConfiguration)
{
    auto config = common::default_config();
    config.interpreters.python = "python3.12";
    config.python_allowed_modules = {"math"};
    auto runtime = make_runtime(config);

    ASSERT_TRUE(runtime->warm_up(Language::kPython).get());
    EXPECT_EQ(script->settings.interpreter, "python3.12");
    EXPECT_EQ(script->settings.allowed_modules, std::vector<std::string>{"math"});
    EXPECT_EQ(script->settings.work_dir, std::filesystem::temp_directory_path() / "secbox_runtime_test");

    const auto status = runtime->engine_status(Language::kPython);
    EXPECT_TRUE(status.initialized);
    EXPECT_EQ(status.version, "scripted 1.0");
}

TEST_F(RuntimeTest, ValidationUsesConfiguredPolicy)
{
    auto config = common::default_config();
    config.risk_policy.critical_blocks = false;
    config.risk_policy.max_risk_score = 100;
    auto runtime = make_runtime(config);

    const auto result = runtime->validate("eval('1');\n", Language::kJavaScript);
    EXPECT_EQ(result.violations.size(), 1U);
    EXPECT_TRUE(result.is_valid);

    const auto again = runtime->validate("eval('1');\n", Language::kJavaScript);
    EXPECT_EQ(again.risk_score, result.risk_score);

    const auto quick = runtime->quick_validate("eval('1');\n", Language::kJavaScript);
    EXPECT_FALSE(quick.is_valid);
    EXPECT_EQ(quick.critical_issues, 1U);
}

TEST(RuntimeWithPython, BusyLoopRaisesTimeAlert)
{
    auto config = common::default_config();
    config.work_dir = std::filesystem::temp_directory_path() / "secbox_runtime_cpu_test";
    Runtime runtime(std::move(config));
    if (!runtime.warm_up(Language::kPython).get()) {
        GTEST_SKIP() << "python3 is not installed";
    }

    ExecutionRequest req;
    req.language = Language::kPython;
    req.code = "while True:\n    pass\n";
    req.skip_security_validation = true;
    req.limits.max_execution_time_ms = 1'000;
    req.limits.max_wall_clock_ms = 20'000;
    const auto result = runtime.execute(req);
    ASSERT_TRUE(result) << result.error().message;
    EXPECT_FALSE(result->success);
    EXPECT_EQ(result->fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result->error, "Execution time limit exceeded");
    EXPECT_TRUE(std::ranges::any_of(result->metrics.alerts, [](const Alert& alert) {
        return alert.kind == AlertKind::kTime && alert.severity == Severity::kCritical;
    }));
    EXPECT_GE(result->metrics.cpu_time_ms, 1'000.0);
}

TEST(BlockedMessage, FallsBackToRiskScore)
{
    ValidationResult validation;
    validation.risk_score = 30;
    EXPECT_EQ(blocked_message(validation), "Security validation failed: risk score 30");

    Finding warning;
    warning.rule_name = "Network Requests";
    warning.line = 4;
    warning.message = "Network Requests: Code makes network requests";
    validation.warnings = {warning, warning};
    EXPECT_EQ(blocked_message(validation),
              "Security validation failed: Network Requests\n"
              "  line 4: Network Requests: Code makes network requests\n"
              "  line 4: Network Requests: Code makes network requests");
}

TEST(RuntimeStateNames, AreLowercase)
{
    EXPECT_EQ(to_string(RuntimeState::kBlocked), "blocked");
    EXPECT_EQ(to_string(RuntimeState::kFinalized), "finalized");
}

}  // namespace secbox::runtime::test
