/**
 * @file javascript_engine.cpp
 * @brief Node.js engine for JavaScript, and TypeScript by type erasure
 */

#include "guest_run.hpp"
#include "preludes.hpp"
#include "process.hpp"

#include "secbox/analyzer.hpp"
#include "secbox/ast.hpp"
#include "secbox/common.hpp"
#include "secbox/engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace secbox::engine {

namespace {

constexpr std::chrono::milliseconds kVersionProbeTimeout{5'000};
constexpr std::chrono::milliseconds kWallClockGrace{500};
/// Smallest old-space size V8 starts reliably with
constexpr std::uint32_t kMinHeapMb = 64;

[[nodiscard]] std::string trim(std::string text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r' || text.back() == ' ')) {
        text.pop_back();
    }
    return text;
}

void push_unique(std::vector<std::string>& names, const std::string& name)
{
    if (!name.empty() && std::ranges::find(names, name) == names.end()) {
        names.push_back(name);
    }
}

[[nodiscard]] ExecutionResult runtime_fault(std::string message)
{
    ExecutionResult result;
    result.success = false;
    result.fault_kind = FaultKind::kRuntimeFault;
    result.error = std::move(message);
    return result;
}

}  // namespace

secbox::Result<std::string> erase_types(std::string_view code, const AnalysisResult& analysis)
{
    if (!analysis.erasure_blockers.empty()) {
        return std::unexpected(
            Error::make("TypeErasureUnsupported",
                        std::format("TypeScript feature not supported: {}", analysis.erasure_blockers.front())));
    }
    std::string script(code);
    for (const auto& range : analysis.type_only_ranges) {
        const auto end = std::min(range.end, script.size());
        for (auto i = range.begin; i < end; ++i) {
            if (script[i] != '\n' && script[i] != '\r') {
                script[i] = ' ';
            }
        }
    }
    return script;
}

std::vector<std::string> top_level_bindings(const AnalysisResult& analysis)
{
    std::vector<std::string> names;
    if (!analysis.ast) {
        return names;
    }
    for (const auto& statement : analysis.ast->children) {
        switch (statement->kind) {
            case ast::NodeKind::kVarDecl:
                // Identifier initializers land here too; the prelude tolerates extra names
                for (const auto& child : statement->children) {
                    if (child->kind == ast::NodeKind::kIdentifier) {
                        push_unique(names, child->name);
                    }
                }
                break;
            case ast::NodeKind::kFunctionDecl:
            case ast::NodeKind::kClassDecl:
                push_unique(names, statement->name);
                break;
            default:
                break;
        }
    }
    return names;
}

namespace {

class FunctionBodyCollector final : public ast::AstVisitor
{
public:
    explicit FunctionBodyCollector(std::string_view script)
        : m_script(script)
    {}

    void enter(const ast::Node& node) override
    {
        if (!ast::is_function(node.kind) || node.children.empty()) {
            return;
        }
        const auto& body = *node.children.back();
        const auto offset = body.location.offset;
        if (body.kind != ast::NodeKind::kBlock || offset >= m_script.size() || m_script[offset] != '{') {
            return;
        }
        const auto first = m_script.find_first_not_of(" \t\r\n", offset + 1);
        if (first != std::string_view::npos && (m_script[first] == '\'' || m_script[first] == '"')) {
            return;
        }
        m_offsets.push_back(offset + 1);
    }

    [[nodiscard]] std::vector<std::size_t> take() { return std::move(m_offsets); }

private:
    std::string_view m_script;
    std::vector<std::size_t> m_offsets;
};

}  // namespace

std::string instrument_function_entries(std::string_view script, const AnalysisResult& analysis)
{
    if (!analysis.ast) {
        return std::string(script);
    }
    FunctionBodyCollector collector(script);
    ast::walk(*analysis.ast, collector);
    auto offsets = collector.take();
    std::ranges::sort(offsets);

    std::string instrumented;
    instrumented.reserve(script.size() + offsets.size() * kFunctionEntryHook.size());
    std::size_t copied = 0;
    for (const auto offset : offsets) {
        instrumented.append(script.substr(copied, offset - copied));
        instrumented.append(kFunctionEntryHook);
        copied = offset;
    }
    instrumented.append(script.substr(copied));
    return instrumented;
}

JavaScriptEngine::JavaScriptEngine(EngineSettings settings)
    : JavaScriptEngine(Language::kJavaScript, std::move(settings))
{}

JavaScriptEngine::JavaScriptEngine(Language language, EngineSettings settings)
    : ExecutionEngine(language)
    , m_settings(std::move(settings))
{}

JavaScriptEngine::~JavaScriptEngine()
{
    join_initialization();
}

secbox::Result<ExecutionEngine::Installed> JavaScriptEngine::install()
{
    auto executable = find_executable(m_settings.interpreter);
    if (!executable) {
        return std::unexpected(executable.error());
    }
    auto version = capture_output(*executable, {m_settings.interpreter, "--version"}, kVersionProbeTimeout);
    if (!version) {
        return std::unexpected(version.error());
    }

    const auto prelude = m_settings.work_dir / "javascript_prelude.js";
    if (auto written = common::write_text_file(prelude, javascript_prelude()); !written) {
        return std::unexpected(written.error());
    }
    m_executable = std::move(*executable);
    m_prelude = prelude;
    spdlog::debug("JavaScript prelude installed at {}", m_prelude.string());

    Installed installed{.version = std::format("Node.js {}", trim(std::move(*version))),
                        .features = {"prompt-replay", "variable-inspection", "vm-context", "wall-clock-watchdog",
                                     "network-interception", "dom-emulation"}};
    if (language() == Language::kTypeScript) {
        installed.features.emplace_back("type-erasure");
    }
    return installed;
}

ExecutionResult JavaScriptEngine::run(std::string_view code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionLimits& limits,
                                      ExecutionContext& context)
{
    if (context.analysis != nullptr) {
        return run_script(code, *context.analysis, inputs, limits, context);
    }
    const analyzer::CodeAnalyzer analyzer;
    const auto analysis = analyzer.analyze(code, Language::kJavaScript);
    return run_script(code, analysis, inputs, limits, context);
}

ExecutionResult JavaScriptEngine::run_script(std::string_view script,
                                             const AnalysisResult& analysis,
                                             const std::vector<std::string>& inputs,
                                             const ExecutionLimits& limits,
                                             ExecutionContext& context)
{
    nlohmann::json payload = {
        {             "code", instrument_function_entries(script, analysis)},
        {           "inputs",                         inputs},
        {         "bindings",   top_level_bindings(analysis)},
        {"maxRecursionDepth",     limits.max_recursion_depth},
        {   "maxWallClockMs",       limits.max_wall_clock_ms},
        { "inspectVariables",      context.inspect_variables},
        {   "hiddenPrefixes",        context.hidden_prefixes}
    };

    // V8 reserves far more address space than it commits, so memory is bounded
    // by the heap flag and the monitor rather than RLIMIT_AS
    const auto heap_mb = std::max(limits.max_memory_mb * 2, kMinHeapMb);
    GuestRun run{.language = language(),
                 .work_dir = m_settings.work_dir,
                 .payload = std::move(payload),
                 .launch = LaunchOptions{.executable = m_executable,
                                     .argv = {m_settings.interpreter,
                                              std::format("--max-old-space-size={}", heap_mb),
                                              "--no-warnings",
                                              m_prelude.string()},
                                     .env = guest_environment(m_settings.work_dir),
                                     .working_dir = m_settings.work_dir,
                                     .cpu_seconds = (limits.max_execution_time_ms + 999) / 1'000 + 1,
                                     .address_space_bytes = 0,
                                     .wall_clock = std::chrono::milliseconds{limits.max_wall_clock_ms}
                                                   + kWallClockGrace,
                                     .max_output_bytes = limits.max_output_bytes}};
    return run_guest(std::move(run), limits, context);
}

TypeScriptEngine::TypeScriptEngine(EngineSettings settings)
    : JavaScriptEngine(Language::kTypeScript, std::move(settings))
{}

ExecutionResult TypeScriptEngine::run(std::string_view code,
                                      const std::vector<std::string>& inputs,
                                      const ExecutionLimits& limits,
                                      ExecutionContext& context)
{
    AnalysisResult local;
    const AnalysisResult* analysis = context.analysis;
    if (analysis == nullptr) {
        local = analyzer::CodeAnalyzer{}.analyze(code, Language::kTypeScript);
        analysis = &local;
    }
    if (!analysis->success) {
        return runtime_fault(std::format("SyntaxError: {}",
                                         analysis->errors.empty() ? "Failed to parse code" : analysis->errors.front()));
    }
    auto script = erase_types(code, *analysis);
    if (!script) {
        spdlog::info("TypeScript erasure rejected: {}", script.error().message);
        return runtime_fault(script.error().message);
    }
    return run_script(*script, *analysis, inputs, limits, context);
}

}  // namespace secbox::engine
