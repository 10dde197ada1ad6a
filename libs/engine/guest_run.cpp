/**
 * @file guest_run.cpp
 * @brief Guest run plumbing shared by the interpreter engines
 */

#include "guest_run.hpp"

#include "secbox/common.hpp"
#include "secbox/engine.hpp"

#include <atomic>
#include <cstdint>
#include <format>
#include <optional>
#include <string>
#include <utility>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace secbox::engine {

namespace {

std::atomic<std::uint64_t> g_run_counter{0};

/**
 * @brief Removes the payload file when the run ends
 */
class ScopedFile
{
public:
    explicit ScopedFile(std::filesystem::path path)
        : m_path(std::move(path))
    {}
    ~ScopedFile()
    {
        std::error_code ec;
        std::filesystem::remove(m_path, ec);
    }
    ScopedFile(const ScopedFile&) = delete;
    ScopedFile& operator=(const ScopedFile&) = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return m_path; }

private:
    std::filesystem::path m_path;
};

/// Fault tag reported by a prelude; unknown tags are runtime faults
[[nodiscard]] FaultKind guest_fault_kind(std::string_view tag) noexcept
{
    if (tag == "ResourceExceeded") {
        return FaultKind::kResourceExceeded;
    }
    if (tag == "SecurityViolation") {
        return FaultKind::kSecurityViolation;
    }
    return FaultKind::kRuntimeFault;
}

struct GuestFault
{
    FaultKind kind = FaultKind::kRuntimeFault;
    std::string message;
};

/**
 * @brief Dispatches control-channel lines to the observer and keeps the final events
 */
class ControlChannel
{
public:
    explicit ControlChannel(ExecutionObserver* observer)
        : m_observer(observer)
    {}

    void handle(std::string_view line)
    {
        auto event = nlohmann::json::parse(line, nullptr, false);
        if (event.is_discarded() || !event.is_object()) {
            spdlog::debug("Ignoring malformed control line ({} bytes)", line.size());
            return;
        }
        const auto name = event.value("event", std::string{});
        if (name == "ready") {
            if (m_observer != nullptr) {
                m_observer->on_guest_ready();
            }
        } else if (name == "network") {
            if (m_observer != nullptr) {
                m_observer->on_network_attempt(event.value("target", std::string{"unknown"}));
            }
        } else if (name == "dom") {
            if (m_observer != nullptr) {
                m_observer->on_dom_mutation();
            }
        } else if (name == "fault") {
            m_fault = GuestFault{.kind = guest_fault_kind(event.value("kind", std::string{})),
                                 .message = event.value("message", std::string{"Execution failed"})};
        } else if (name == "variables") {
            const auto values = event.find("values");
            if (values != event.end() && values->is_object()) {
                m_variables = *values;
            }
        }
    }

    [[nodiscard]] const std::optional<GuestFault>& fault() const noexcept { return m_fault; }
    [[nodiscard]] std::optional<nlohmann::json>& variables() noexcept { return m_variables; }

private:
    ExecutionObserver* m_observer;
    std::optional<GuestFault> m_fault;
    std::optional<nlohmann::json> m_variables;
};

[[nodiscard]] bool out_of_memory(std::string_view errors)
{
    return errors.contains("heap out of memory") || errors.contains("MemoryError")
           || errors.contains("Cannot allocate memory");
}

[[nodiscard]] std::string last_line(std::string_view text)
{
    while (!text.empty() && (text.back() == '\n' || text.back() == '\r')) {
        text.remove_suffix(1);
    }
    const auto newline = text.rfind('\n');
    return std::string(newline == std::string_view::npos ? text : text.substr(newline + 1));
}

void fail(ExecutionResult& result, FaultKind kind, std::string message)
{
    result.success = false;
    result.fault_kind = kind;
    result.error = std::move(message);
}

}  // namespace

std::vector<std::string> guest_environment(const std::filesystem::path& home)
{
    return {"PATH=/usr/local/bin:/usr/bin:/bin",
            "LANG=C.UTF-8",
            "LC_ALL=C.UTF-8",
            "PYTHONIOENCODING=utf-8",
            "PYTHONDONTWRITEBYTECODE=1",
            "NODE_DISABLE_COLORS=1",
            std::format("HOME={}", home.string())};
}

ExecutionResult run_guest(GuestRun run, const ExecutionLimits& limits, ExecutionContext& context)
{
    ExecutionResult result;
    const auto name = display_name(run.language);

    ScopedFile payload_file(run.work_dir
                            / std::format("payload-{}-{}.json", ::getpid(), g_run_counter.fetch_add(1)));
    if (auto written = common::write_text_file(payload_file.path(), run.payload.dump()); !written) {
        fail(result, FaultKind::kEngineUnavailable,
             std::format("{} engine could not stage the program: {}", name, written.error().message));
        return result;
    }
    run.launch.argv.push_back(payload_file.path().string());
    run.launch.max_output_bytes = limits.max_output_bytes;

    ControlChannel control(context.observer);
    std::size_t output_bytes = 0;
    const ProcessCallbacks callbacks{
        .on_started =
            [&](int pid) {
                spdlog::debug("{} guest process {} started", name, pid);
                if (context.observer != nullptr) {
                    context.observer->on_process_started(pid);
                }
            },
        .on_output =
            [&](std::size_t bytes) {
                output_bytes += bytes;
                if (context.observer != nullptr) {
                    context.observer->on_output(bytes);
                }
            },
        .on_control = [&](std::string_view line) { control.handle(line); }};

    auto outcome = run_process(run.launch, callbacks, context.cancellation);
    if (!outcome) {
        spdlog::error("{} engine failed to start the interpreter: {}", name, outcome.error().message);
        fail(result, FaultKind::kEngineUnavailable,
             std::format("{} engine failed to start: {}", name, outcome.error().message));
        return result;
    }

    result.output = std::move(outcome->output);
    truncate_output(result.output, limits.max_output_bytes);
    result.metrics.cpu_time_ms = outcome->cpu_time_ms;
    result.metrics.execution_time_ms = outcome->wall_time_ms;
    result.metrics.output_bytes = output_bytes;

    if (outcome->kill_kind) {
        fail(result, *outcome->kill_kind, outcome->kill_reason.value_or("Execution aborted"));
    } else if (control.fault()) {
        fail(result, control.fault()->kind, control.fault()->message);
    } else if (outcome->term_signal != 0) {
        if (out_of_memory(outcome->errors)) {
            fail(result, FaultKind::kResourceExceeded, "Memory limit exceeded");
        } else {
            fail(result, FaultKind::kRuntimeFault,
                 std::format("Process terminated by signal {}", outcome->term_signal));
        }
    } else if (outcome->exit_code != 0) {
        if (out_of_memory(outcome->errors)) {
            fail(result, FaultKind::kResourceExceeded, "Memory limit exceeded");
        } else {
            auto detail = last_line(outcome->errors);
            fail(result, FaultKind::kRuntimeFault,
                 detail.empty() ? std::format("Process exited with code {}", outcome->exit_code)
                                : std::move(detail));
        }
    } else {
        result.success = true;
        if (context.inspect_variables && control.variables()) {
            result.variables = std::move(*control.variables());
        }
    }

    if (!result.success) {
        spdlog::info("{} execution failed: {}", name, result.error.value_or(""));
    }
    return result;
}

}  // namespace secbox::engine
