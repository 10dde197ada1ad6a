#pragma once

/**
 * @file runtime.hpp
 * @brief Runtime orchestrator: validation gate, engine dispatch and monitoring
 */

#include "secbox/analyzer.hpp"
#include "secbox/common.hpp"
#include "secbox/config.hpp"
#include "secbox/engine.hpp"
#include "secbox/language.hpp"
#include "secbox/monitor.hpp"
#include "secbox/rules.hpp"
#include "secbox/types.hpp"
#include "secbox/validation_cache.hpp"

#include <array>
#include <atomic>
#include <filesystem>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace secbox::runtime {

/// Request lifecycle; monitoring runs concurrently with kExecuting
enum class RuntimeState {
    kIdle,
    kValidating,
    kBlocked,
    kExecuting,
    kFinalized
};

[[nodiscard]] std::string_view to_string(RuntimeState state) noexcept;

using EngineFactory = std::function<std::unique_ptr<engine::ExecutionEngine>(Language, engine::EngineSettings)>;
using ProbeFactory = std::function<std::shared_ptr<monitor::ProcessProbe>()>;

/// Seams for tests; empty members select make_engine and ProcfsProbe
struct RuntimeHooks
{
    EngineFactory engine_factory;
    ProbeFactory probe_factory;
};

/**
 * @brief Serializes execution requests through validation, execution and monitoring
 *
 * One request runs at a time. Engines are created on first use per language
 * and owned by the runtime. Every request ends in kFinalized with a result;
 * only malformed requests produce an Error.
 */
class Runtime
{
public:
    explicit Runtime(common::SandboxConfig config, RuntimeHooks hooks = {});

    Runtime(const Runtime&) = delete;
    Runtime& operator=(const Runtime&) = delete;

    /**
     * Validate (unless skipped), then run under the resource monitor.
     * @return Result, or LimitOutOfRange for limits above their bounds
     */
    [[nodiscard]] secbox::Result<ExecutionResult> execute(const ExecutionRequest& request);

    /**
     * Schema-check and decode a JSON request, then execute it.
     * @param schema_dir Directory holding execution_request.v1.schema.json
     * @return Result, or SchemaInvalid / InvalidRequest / UnsupportedLanguage / LimitOutOfRange
     */
    [[nodiscard]] secbox::Result<ExecutionResult> execute_json(const nlohmann::json& request,
                                                               const std::filesystem::path& schema_dir);

    [[nodiscard]] AnalysisResult analyze(std::string_view code, Language language) const;

    /// Validation through the result cache
    [[nodiscard]] ValidationResult validate(std::string_view code, Language language, const ValidationOptions& options);

    /// Validation with the configured risk policy
    [[nodiscard]] ValidationResult validate(std::string_view code, Language language);

    [[nodiscard]] QuickValidation quick_validate(std::string_view code, Language language) const;

    /// Receive monitor samples and alerts of every execution
    [[nodiscard]] monitor::Unsubscribe subscribe(monitor::MonitorListener listener);

    /// Start engine initialization without waiting for it
    std::shared_future<secbox::VoidResult> warm_up(Language language);

    [[nodiscard]] engine::EngineStatus engine_status(Language language);

    [[nodiscard]] RuntimeState state() const noexcept { return m_state.load(); }

    [[nodiscard]] const common::SandboxConfig& config() const noexcept { return m_config; }

    [[nodiscard]] ValidationOptions default_validation_options() const;

private:
    engine::ExecutionEngine& engine_for(Language language);
    void set_state(RuntimeState state);

    common::SandboxConfig m_config;
    RuntimeHooks m_hooks;
    std::filesystem::path m_work_dir;

    rules::SecurityValidator m_validator;
    rules::ValidationCache m_cache;
    analyzer::CodeAnalyzer m_analyzer;
    std::shared_ptr<monitor::ListenerRegistry> m_listeners;

    std::mutex m_request_mutex;
    std::mutex m_engine_mutex;
    std::array<std::unique_ptr<engine::ExecutionEngine>, kAllLanguages.size()> m_engines;
    std::atomic<RuntimeState> m_state{RuntimeState::kIdle};
};

/**
 * Error text for a blocked request: "Security validation failed: <rule names>"
 * followed by one "  line N: <message>" line per finding.
 */
[[nodiscard]] std::string blocked_message(const ValidationResult& validation);

}  // namespace secbox::runtime
