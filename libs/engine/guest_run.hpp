#pragma once

/**
 * @file guest_run.hpp
 * @brief One prelude-hosted guest run: payload file, control events, result normalization
 */

#include "process.hpp"

#include "secbox/execution.hpp"
#include "secbox/language.hpp"
#include "secbox/types.hpp"

#include <filesystem>

#include <nlohmann/json.hpp>

namespace secbox::engine {

struct GuestRun
{
    Language language = Language::kPython;
    std::filesystem::path work_dir;
    /// Written to a payload file whose path is appended to launch.argv
    nlohmann::json payload;
    LaunchOptions launch;
};

/**
 * Execute a prepared run and fold the process outcome and control events
 * into an ExecutionResult.
 */
[[nodiscard]] ExecutionResult run_guest(GuestRun run, const ExecutionLimits& limits, ExecutionContext& context);

/// Minimal environment handed to interpreters
[[nodiscard]] std::vector<std::string> guest_environment(const std::filesystem::path& home);

}  // namespace secbox::engine
