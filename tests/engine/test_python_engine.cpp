/**
 * @file test_python_engine.cpp
 * @brief Python engine against a real CPython interpreter (skipped when absent)
 */

#include "process.hpp"

#include "secbox/engine.hpp"

#include <algorithm>
#include <filesystem>
#include <string>
#include <vector>

#include <unistd.h>

#include <gtest/gtest.h>

namespace secbox::engine::test {

namespace {

class RecordingObserver final : public ExecutionObserver
{
public:
    void on_process_started(int pid) override { started_pid = pid; }
    void on_guest_ready() override { ++ready; }
    void on_network_attempt(std::string_view target) override { network.emplace_back(target); }
    void on_dom_mutation() override { ++dom; }
    void on_output(std::size_t bytes) override { output_bytes += bytes; }

    int started_pid = 0;
    int ready = 0;
    int dom = 0;
    std::size_t output_bytes = 0;
    std::vector<std::string> network;
};

class PythonEngineTest : public ::testing::Test
{
protected:
    void SetUp() override
    {
        if (!find_executable("python3")) {
            GTEST_SKIP() << "python3 is not installed";
        }
        m_dir = std::filesystem::temp_directory_path()
                / ("secbox_python_" + std::to_string(::getpid()) + "_"
                   + ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(m_dir);
        m_engine = std::make_unique<PythonEngine>(EngineSettings{.interpreter = "python3",
                                                                 .work_dir = m_dir,
                                                                 .allowed_modules = {"math", "json", "random", "operator",
                                                                                     "string", "typing", "dataclasses"}});
    }

    void TearDown() override
    {
        m_engine.reset();
        std::error_code ec;
        std::filesystem::remove_all(m_dir, ec);
    }

    [[nodiscard]] ExecutionResult run(std::string_view code,
                                      const std::vector<std::string>& inputs = {},
                                      const ExecutionLimits& limits = {})
    {
        ExecutionContext context{.cancellation = &m_token,
                                 .observer = &m_observer,
                                 .analysis = nullptr,
                                 .inspect_variables = m_inspect,
                                 .hidden_prefixes = m_hidden};
        return m_engine->execute(code, inputs, limits, context);
    }

    std::filesystem::path m_dir;
    std::unique_ptr<PythonEngine> m_engine;
    CancellationToken m_token;
    RecordingObserver m_observer;
    bool m_inspect = true;
    std::vector<std::string> m_hidden;
};

}  // namespace

TEST_F(PythonEngineTest, ReportsVersionAndFeatures)
{
    ASSERT_TRUE(m_engine->initialize().get());
    const auto status = m_engine->status();
    EXPECT_TRUE(status.initialized);
    EXPECT_TRUE(status.version.starts_with("Python 3")) << status.version;
    EXPECT_FALSE(status.error.has_value());
    EXPECT_NE(std::ranges::find(status.features, "input-replay"), status.features.end());
    EXPECT_NE(std::ranges::find(status.features, "module:math"), status.features.end());
}

TEST_F(PythonEngineTest, RunsCodeAndCapturesVariables)
{
    const auto result = run("print('hello')\nanswer = 41 + 1\nnames = ['a', 'b']\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "hello\n");
    ASSERT_TRUE(result.variables.has_value());
    EXPECT_EQ((*result.variables)["answer"], 42);
    EXPECT_EQ((*result.variables)["names"], nlohmann::json::array({"a", "b"}));

    EXPECT_GT(m_observer.started_pid, 0);
    EXPECT_EQ(m_observer.ready, 1);
    EXPECT_EQ(m_observer.output_bytes, 6U);
}

TEST_F(PythonEngineTest, ReplaysInputsThenRaisesEof)
{
    const auto result = run("name = input('Name? ')\nprint('Hi', name)\n", {"Ada"});
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Name? Ada\nHi Ada\n");

    const auto exhausted = run("first = input()\nsecond = input()\n", {"1"});
    EXPECT_FALSE(exhausted.success);
    EXPECT_EQ(exhausted.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_TRUE(exhausted.error.value_or("").starts_with("EOFError"));
}

TEST_F(PythonEngineTest, ImportsAreLimitedToAllowlist)
{
    const auto allowed = run("import math\nprint(math.sqrt(16))\n");
    ASSERT_TRUE(allowed.success) << allowed.error.value_or("");
    EXPECT_EQ(allowed.output, "4.0\n");

    const auto denied = run("import os\n");
    EXPECT_FALSE(denied.success);
    EXPECT_EQ(denied.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(denied.error, "ImportError: Import of module 'os' is not allowed in the sandbox");
}

TEST_F(PythonEngineTest, NetworkImportsAreReported)
{
    const auto result = run("import socket\n");
    EXPECT_FALSE(result.success);
    ASSERT_EQ(m_observer.network.size(), 1U);
    EXPECT_EQ(m_observer.network.front(), "socket");
}

TEST_F(PythonEngineTest, RecursionCeilingIsEnforced)
{
    ExecutionLimits limits;
    limits.max_recursion_depth = 50;
    const auto result = run("def dive(n):\n    return dive(n + 1)\n\ndive(0)\n", {}, limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result.error, "Maximum recursion depth exceeded");
}

TEST_F(PythonEngineTest, WallClockLimitStopsEndlessLoop)
{
    ExecutionLimits limits;
    limits.max_wall_clock_ms = 500;
    const auto result = run("while True:\n    pass\n", {}, limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result.error, "Wall-clock time limit exceeded");
}

TEST_F(PythonEngineTest, CpuTimeLimitStopsBusyLoop)
{
    ExecutionLimits limits;
    limits.max_execution_time_ms = 1'000;
    limits.max_wall_clock_ms = 20'000;
    const auto result = run("while True:\n    pass\n", {}, limits);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kResourceExceeded);
    EXPECT_EQ(result.error, "Execution time limit exceeded");
}

TEST_F(PythonEngineTest, TracebackFramesAreUnreachable)
{
    const auto result = run("try:\n"
                            "    1 / 0\n"
                            "except Exception as error:\n"
                            "    host = error.__traceback__.tb_frame.f_back.f_globals\n"
                            "    host['_os'].system('echo escaped')\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(result.error, "SecurityError: Access to attribute '__traceback__' is not allowed in the sandbox (line 4)");
    EXPECT_EQ(m_observer.ready, 0);
    EXPECT_FALSE(result.output.contains("escaped"));
}

TEST_F(PythonEngineTest, PrivateModuleAttributesAreUnreachable)
{
    const auto dotted = run("import random\nprint(random._os)\n");
    EXPECT_EQ(dotted.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(dotted.error, "SecurityError: Access to attribute '_os' is not allowed in the sandbox (line 2)");

    const auto imported = run("from random import _os\n");
    EXPECT_EQ(imported.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(imported.error, "SecurityError: Import of name '_os' is not allowed in the sandbox (line 1)");

    const auto dynamic = run("import random\nname = '_' + 'os'\nprint(getattr(random, name))\n");
    EXPECT_FALSE(dynamic.success);
    EXPECT_EQ(dynamic.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(dynamic.error, "AttributeError: Access to attribute '_os' is not allowed in the sandbox");
}

TEST_F(PythonEngineTest, SubclassWalkIsRefused)
{
    const auto result = run("for cls in ().__class__.__base__.__subclasses__():\n"
                            "    print(cls.__name__)\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(result.error, "SecurityError: Access to attribute '__class__' is not allowed in the sandbox (line 1)");
    EXPECT_TRUE(result.output.empty());
}

TEST_F(PythonEngineTest, ImportedModulesExposeOnlyTheirOwnNames)
{
    const auto result = run("import json\nimport random\n"
                            "print(hasattr(json, 'codecs'), hasattr(json, 'decoder'), hasattr(random, 'randint'))\n"
                            "print(json.dumps([1, 2]))\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "False True True\n[1, 2]\n");
}

TEST_F(PythonEngineTest, StringAttributeHelpersAreGuarded)
{
    const auto getter = run("import operator\nimport random\nprint(operator.attrgetter('_os')(random))\n");
    EXPECT_EQ(getter.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(getter.error, "AttributeError: Access to attribute '_os' is not allowed in the sandbox");

    const auto caller = run("import operator\nprint(operator.methodcaller('__subclasses__')(object))\n");
    EXPECT_EQ(caller.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_EQ(caller.error, "AttributeError: Access to attribute '__subclasses__' is not allowed in the sandbox");

    const auto allowed = run("import operator\nprint(operator.attrgetter('real')(3), operator.itemgetter(1)('ab'))\n");
    ASSERT_TRUE(allowed.success) << allowed.error.value_or("");
    EXPECT_EQ(allowed.output, "3 b\n");

    const auto formatter = run("import string\nprint(hasattr(string, 'Formatter'), string.Template('$x').substitute(x=1))\n");
    ASSERT_TRUE(formatter.success) << formatter.error.value_or("");
    EXPECT_EQ(formatter.output, "False 1\n");
}

TEST_F(PythonEngineTest, EvaluatedAnnotationsPassTheAttributeGate)
{
    const auto result = run("import typing\n"
                            "def f(x: '().__class__.__base__'):\n"
                            "    pass\n"
                            "print(typing.get_type_hints(f))\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_TRUE(result.error.value_or("").starts_with("SecurityError: Access to attribute '__class__'"))
        << result.error.value_or("");
    EXPECT_TRUE(result.output.empty());

    const auto global = run("import typing\n"
                            "class Holder:\n"
                            "    target: '_os'\n"
                            "print(typing.get_type_hints(Holder))\n");
    EXPECT_EQ(global.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(global.error, "SecurityError: Access to name '_os' is not allowed in the sandbox");
}

TEST_F(PythonEngineTest, GeneratedLibraryCodeStillRuns)
{
    const auto result = run("import dataclasses\nimport typing\n"
                            "@dataclasses.dataclass(frozen=True)\n"
                            "class Point:\n"
                            "    x: int\n"
                            "    y: 'int' = 0\n"
                            "print(Point(1, 2))\n"
                            "print(typing.get_type_hints(Point))\n");
    ASSERT_TRUE(result.success) << result.error.value_or("");
    EXPECT_EQ(result.output, "Point(x=1, y=2)\n{'x': <class 'int'>, 'y': <class 'int'>}\n");
}

TEST_F(PythonEngineTest, SyntaxErrorsAreRuntimeFaults)
{
    const auto result = run("def broken(:\n    pass\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kRuntimeFault);
    EXPECT_TRUE(result.error.value_or("").contains("SyntaxError"));
    EXPECT_EQ(m_observer.ready, 0);
}

TEST_F(PythonEngineTest, OutputIsTruncated)
{
    ExecutionLimits limits;
    limits.max_output_bytes = 100;
    const auto result = run("print('x' * 1000)\n", {}, limits);
    EXPECT_TRUE(result.output.ends_with(kTruncationMarker));
    EXPECT_LE(result.output.size(), 100 + kTruncationMarker.size());
}

TEST_F(PythonEngineTest, HiddenPrefixesAndInspectionSwitch)
{
    m_hidden = {"tmp"};
    const auto filtered = run("tmp_value = 1\nkept = 2\n_private = 3\n");
    ASSERT_TRUE(filtered.success) << filtered.error.value_or("");
    ASSERT_TRUE(filtered.variables.has_value());
    EXPECT_TRUE(filtered.variables->contains("kept"));
    EXPECT_FALSE(filtered.variables->contains("tmp_value"));
    EXPECT_FALSE(filtered.variables->contains("_private"));

    m_inspect = false;
    const auto silent = run("kept = 2\n");
    ASSERT_TRUE(silent.success);
    EXPECT_FALSE(silent.variables.has_value());
}

TEST_F(PythonEngineTest, CancellationKillsTheGuest)
{
    m_token.cancel(FaultKind::kSecurityViolation, "Execution cancelled");
    const auto result = run("while True:\n    pass\n");
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kSecurityViolation);
    EXPECT_EQ(result.error, "Execution cancelled");
}

TEST(PythonEngineUnavailable, MissingInterpreterIsReported)
{
    const auto dir = std::filesystem::temp_directory_path();
    PythonEngine engine(EngineSettings{.interpreter = "secbox-no-such-python", .work_dir = dir, .allowed_modules = {}});
    ExecutionContext context;
    const auto result = engine.execute("print(1)", {}, ExecutionLimits{}, context);
    EXPECT_FALSE(result.success);
    EXPECT_EQ(result.fault_kind, FaultKind::kEngineUnavailable);
    EXPECT_EQ(result.error, "Python engine not available");

    const auto status = engine.status();
    EXPECT_FALSE(status.initialized);
    ASSERT_TRUE(status.error.has_value());
    EXPECT_TRUE(status.error->contains("secbox-no-such-python"));
}

}  // namespace secbox::engine::test
