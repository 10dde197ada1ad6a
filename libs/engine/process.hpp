#pragma once

/**
 * @file process.hpp
 * @brief Supervised interpreter child process (internal to secbox_engine)
 */

#include "secbox/common.hpp"
#include "secbox/execution.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::engine {

/// File descriptor the child writes control events to
inline constexpr int kControlFd = 3;

struct LaunchOptions
{
    std::filesystem::path executable;
    std::vector<std::string> argv;  ///< argv[0] included
    std::vector<std::string> env;   ///< KEY=VALUE
    std::filesystem::path working_dir;
    /// RLIMIT_CPU in seconds, 0 = unlimited
    std::uint32_t cpu_seconds = 0;
    /// RLIMIT_AS in bytes, 0 = unlimited
    std::uint64_t address_space_bytes = 0;
    std::chrono::milliseconds wall_clock{10'000};
    std::size_t max_output_bytes = 0;
};

struct ProcessCallbacks
{
    std::function<void(int pid)> on_started;
    std::function<void(std::size_t bytes)> on_output;
    /// One complete control line, without the newline
    std::function<void(std::string_view line)> on_control;
};

struct ProcessOutcome
{
    std::string output;
    bool output_truncated = false;
    std::string errors;
    int exit_code = -1;
    int term_signal = 0;
    /// Set when the supervisor killed the process group
    std::optional<FaultKind> kill_kind;
    std::optional<std::string> kill_reason;
    double cpu_time_ms = 0.0;
    double max_rss_mb = 0.0;
    double wall_time_ms = 0.0;
};

/**
 * Fork, exec and supervise until the child exits and its pipes close.
 *
 * The child gets stdin from /dev/null, stdout/stderr pipes, the control pipe
 * on kControlFd and its own process group, with core dumps and file writes
 * disabled. The group is killed with SIGKILL when the token is cancelled or
 * the wall-clock budget runs out.
 *
 * @return Outcome, or SpawnFailed when the process could not be started
 */
[[nodiscard]] secbox::Result<ProcessOutcome> run_process(const LaunchOptions& launch,
                                                         const ProcessCallbacks& callbacks,
                                                         CancellationToken* cancellation);

/// Resolve an interpreter name against PATH (absolute paths are only checked)
[[nodiscard]] secbox::Result<std::filesystem::path> find_executable(std::string_view name);

/**
 * Run a short helper command and capture its stdout (used for version probes).
 */
[[nodiscard]] secbox::Result<std::string> capture_output(const std::filesystem::path& executable,
                                                         const std::vector<std::string>& argv,
                                                         std::chrono::milliseconds timeout);

}  // namespace secbox::engine
