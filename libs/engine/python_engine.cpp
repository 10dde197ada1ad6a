/**
 * @file python_engine.cpp
 * @brief CPython engine: isolated interpreter hosting the Python prelude
 */

#include "guest_run.hpp"
#include "preludes.hpp"
#include "process.hpp"

#include "secbox/common.hpp"
#include "secbox/engine.hpp"

#include <algorithm>
#include <chrono>
#include <cstdint>
#include <format>
#include <string>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::engine {

namespace {

constexpr std::chrono::milliseconds kVersionProbeTimeout{5'000};
/// Extra wall-clock budget so the in-process watchdog reports first
constexpr std::chrono::milliseconds kWallClockGrace{500};
/// RLIMIT_AS headroom over twice the memory limit: the interpreter maps its
/// own code and allocator arenas before guest code runs
constexpr std::uint64_t kAddressSpaceHeadroomMb = 512;

[[nodiscard]] std::string trim(std::string text)
{
    const auto is_space = [](unsigned char c) { return c == ' ' || c == '\n' || c == '\r' || c == '\t'; };
    while (!text.empty() && is_space(static_cast<unsigned char>(text.back()))) {
        text.pop_back();
    }
    const auto first = std::ranges::find_if_not(text, is_space);
    text.erase(text.begin(), first);
    return text;
}

}  // namespace

PythonEngine::PythonEngine(EngineSettings settings)
    : ExecutionEngine(Language::kPython)
    , m_settings(std::move(settings))
{}

PythonEngine::~PythonEngine()
{
    join_initialization();
}

secbox::Result<ExecutionEngine::Installed> PythonEngine::install()
{
    auto executable = find_executable(m_settings.interpreter);
    if (!executable) {
        return std::unexpected(executable.error());
    }
    auto version = capture_output(*executable, {m_settings.interpreter, "--version"}, kVersionProbeTimeout);
    if (!version) {
        return std::unexpected(version.error());
    }

    const auto prelude = m_settings.work_dir / "python_prelude.py";
    if (auto written = common::write_text_file(prelude, python_prelude()); !written) {
        return std::unexpected(written.error());
    }
    m_executable = std::move(*executable);
    m_prelude = prelude;
    spdlog::debug("Python prelude installed at {}", m_prelude.string());

    Installed installed{.version = trim(std::move(*version)),
                        .features = {"input-replay", "variable-inspection", "recursion-limit",
                                     "wall-clock-watchdog"}};
    for (const auto& module : m_settings.allowed_modules) {
        installed.features.push_back(std::format("module:{}", module));
    }
    return installed;
}

ExecutionResult PythonEngine::run(std::string_view code,
                                  const std::vector<std::string>& inputs,
                                  const ExecutionLimits& limits,
                                  ExecutionContext& context)
{
    nlohmann::json payload = {
        {             "code",        std::string(code)},
        {           "inputs",                   inputs},
        {"maxRecursionDepth", limits.max_recursion_depth},
        {   "maxWallClockMs",   limits.max_wall_clock_ms},
        { "inspectVariables",  context.inspect_variables},
        {   "hiddenPrefixes",   context.hidden_prefixes},
        {   "allowedModules", m_settings.allowed_modules}
    };

    const std::uint32_t cpu_seconds = (limits.max_execution_time_ms + 999) / 1'000 + 1;
    const std::uint64_t address_space_mb = std::uint64_t{limits.max_memory_mb} * 2 + kAddressSpaceHeadroomMb;

    GuestRun run{.language = Language::kPython,
                 .work_dir = m_settings.work_dir,
                 .payload = std::move(payload),
                 .launch = LaunchOptions{.executable = m_executable,
                                     .argv = {m_settings.interpreter, "-I", "-B", "-u", m_prelude.string()},
                                     .env = guest_environment(m_settings.work_dir),
                                     .working_dir = m_settings.work_dir,
                                     .cpu_seconds = cpu_seconds,
                                     .address_space_bytes = address_space_mb * 1'024 * 1'024,
                                     .wall_clock = std::chrono::milliseconds{limits.max_wall_clock_ms}
                                                   + kWallClockGrace,
                                     .max_output_bytes = limits.max_output_bytes}};
    return run_guest(std::move(run), limits, context);
}

}  // namespace secbox::engine
