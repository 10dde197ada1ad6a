/**
 * @file runtime.cpp
 * @brief Runtime orchestrator implementation
 */

#include "secbox/runtime.hpp"

#include "secbox/schema_validate.hpp"
#include "secbox/version.hpp"

#include <algorithm>
#include <chrono>
#include <format>
#include <string>
#include <system_error>
#include <utility>
#include <vector>

#include <unistd.h>

#include <spdlog/spdlog.h>

namespace secbox::runtime {

namespace {

[[nodiscard]] std::filesystem::path resolve_work_dir(const std::filesystem::path& configured)
{
    if (!configured.empty()) {
        return configured;
    }
    std::error_code ec;
    auto base = std::filesystem::temp_directory_path(ec);
    if (ec) {
        base = "/tmp";
    }
    // Per-process directory: concurrent runtimes never share prelude files
    return base / std::format("secbox-{}", ::getpid());
}

[[nodiscard]] std::size_t engine_index(Language language)
{
    return static_cast<std::size_t>(std::ranges::find(kAllLanguages, language) - kAllLanguages.begin());
}

/// Fold the monitor's view into the engine's metrics; rusage CPU and wall time stay authoritative
void merge_usage(ResourceUsage& metrics, const ResourceUsage& observed)
{
    metrics.memory_mb = observed.memory_mb;
    metrics.peak_memory_mb = std::max(observed.peak_memory_mb, observed.memory_mb);
    metrics.cpu_percent_estimate = observed.cpu_percent_estimate;
    metrics.peak_cpu_percent = observed.peak_cpu_percent;
    metrics.network_request_count = observed.network_request_count;
    metrics.dom_mutation_count = observed.dom_mutation_count;
    metrics.output_bytes = std::max(metrics.output_bytes, observed.output_bytes);
    if (metrics.cpu_time_ms == 0.0) {
        metrics.cpu_time_ms = observed.cpu_time_ms;
    }
    if (metrics.execution_time_ms == 0.0) {
        metrics.execution_time_ms = observed.execution_time_ms;
    }
    metrics.alerts = observed.alerts;
}

}  // namespace

std::string_view to_string(RuntimeState state) noexcept
{
    switch (state) {
        case RuntimeState::kIdle:
            return "idle";
        case RuntimeState::kValidating:
            return "validating";
        case RuntimeState::kBlocked:
            return "blocked";
        case RuntimeState::kExecuting:
            return "executing";
        case RuntimeState::kFinalized:
            return "finalized";
    }
    return "unknown";
}

std::string blocked_message(const ValidationResult& validation)
{
    const auto& findings = validation.violations.empty() ? validation.warnings : validation.violations;
    std::vector<std::string> names;
    for (const auto& finding : findings) {
        if (std::ranges::find(names, finding.rule_name) == names.end()) {
            names.push_back(finding.rule_name);
        }
    }
    std::string message = "Security validation failed";
    if (!names.empty()) {
        message += ": ";
        for (std::size_t i = 0; i < names.size(); ++i) {
            message += (i == 0 ? "" : ", ") + names[i];
        }
    } else {
        message += std::format(": risk score {}", validation.risk_score);
    }
    for (const auto& finding : findings) {
        message += std::format("\n  line {}: {}", finding.line, finding.message);
    }
    return message;
}

Runtime::Runtime(common::SandboxConfig config, RuntimeHooks hooks)
    : m_config(std::move(config))
    , m_hooks(std::move(hooks))
    , m_work_dir(resolve_work_dir(m_config.work_dir))
    , m_cache(m_config.validation_cache.ttl, m_config.validation_cache.capacity)
    , m_listeners(std::make_shared<monitor::ListenerRegistry>())
{
    if (!m_hooks.engine_factory) {
        m_hooks.engine_factory = [](Language language, engine::EngineSettings settings) {
            return engine::make_engine(language, std::move(settings));
        };
    }
    if (!m_hooks.probe_factory) {
        m_hooks.probe_factory = [] { return std::make_shared<monitor::ProcfsProbe>(); };
    }
    spdlog::debug("Runtime work directory: {}", m_work_dir.string());
}

void Runtime::set_state(RuntimeState state)
{
    m_state.store(state);
    spdlog::debug("Runtime state -> {}", to_string(state));
}

ValidationOptions Runtime::default_validation_options() const
{
    ValidationOptions options;
    options.policy = m_config.risk_policy;
    return options;
}

engine::ExecutionEngine& Runtime::engine_for(Language language)
{
    std::lock_guard lock(m_engine_mutex);
    auto& slot = m_engines.at(engine_index(language));
    if (!slot) {
        engine::EngineSettings settings{
            .interpreter = language == Language::kPython ? m_config.interpreters.python : m_config.interpreters.node,
            .work_dir = m_work_dir,
            .allowed_modules = language == Language::kPython ? m_config.python_allowed_modules
                                                             : std::vector<std::string>{}};
        slot = m_hooks.engine_factory(language, std::move(settings));
    }
    return *slot;
}

std::shared_future<secbox::VoidResult> Runtime::warm_up(Language language)
{
    return engine_for(language).initialize();
}

engine::EngineStatus Runtime::engine_status(Language language)
{
    return engine_for(language).status();
}

AnalysisResult Runtime::analyze(std::string_view code, Language language) const
{
    return m_analyzer.analyze(code, language);
}

ValidationResult Runtime::validate(std::string_view code, Language language, const ValidationOptions& options)
{
    auto key = rules::ValidationCache::make_key(code, language, options);
    if (!key) {
        spdlog::warn("Validation cache bypassed: {}", key.error().message);
        return m_validator.validate(code, language, options);
    }
    if (auto cached = m_cache.find(*key)) {
        spdlog::debug("Validation cache hit for {} code", to_string(language));
        return std::move(*cached);
    }
    auto result = m_validator.validate(code, language, options);
    m_cache.insert(*key, result);
    return result;
}

ValidationResult Runtime::validate(std::string_view code, Language language)
{
    return validate(code, language, default_validation_options());
}

QuickValidation Runtime::quick_validate(std::string_view code, Language language) const
{
    return m_validator.quick_validate(code, language);
}

monitor::Unsubscribe Runtime::subscribe(monitor::MonitorListener listener)
{
    return monitor::subscribe(m_listeners, std::move(listener));
}

secbox::Result<ExecutionResult> Runtime::execute_json(const nlohmann::json& request,
                                                      const std::filesystem::path& schema_dir)
{
    if (auto valid = common::validate_json(request, schema_dir, kRequestSchemaVersion); !valid) {
        return std::unexpected(Error::make("SchemaInvalid", valid.error().message));
    }
    auto decoded = execution_request_from_json(request, m_config.default_limits);
    if (!decoded) {
        return std::unexpected(decoded.error());
    }
    return execute(*decoded);
}

secbox::Result<ExecutionResult> Runtime::execute(const ExecutionRequest& request)
{
    if (auto valid = validate_limits(request.limits); !valid) {
        return std::unexpected(valid.error());
    }

    std::lock_guard request_lock(m_request_mutex);
    set_state(RuntimeState::kIdle);
    const auto language = display_name(request.language);

    std::optional<ValidationResult> validation;
    if (!request.skip_security_validation) {
        set_state(RuntimeState::kValidating);
        validation = validate(request.code, request.language);
        spdlog::info("{} security validation: risk {}/100, {} violation(s), {} warning(s)",
                     language,
                     validation->risk_score,
                     validation->violations.size(),
                     validation->warnings.size());

        if (!validation->is_valid && request.strict_security_mode) {
            set_state(RuntimeState::kBlocked);
            ExecutionResult blocked;
            blocked.success = false;
            blocked.fault_kind = FaultKind::kSecurityViolation;
            blocked.error = blocked_message(*validation);
            blocked.security_validation = std::move(*validation);
            spdlog::info("{} execution blocked by security validation", language);
            set_state(RuntimeState::kFinalized);
            return blocked;
        }
        if (!validation->is_valid) {
            spdlog::warn("{} code failed security validation; running anyway (non-strict mode)", language);
        }
    }

    set_state(RuntimeState::kExecuting);
    CancellationToken token;
    monitor::ResourceMonitor resource_monitor(request.limits, m_hooks.probe_factory(), m_config.monitor);
    const auto forward = resource_monitor.subscribe(
        [listeners = m_listeners](const monitor::MonitorEvent& event) { listeners->publish(event); });

    ExecutionContext context{.cancellation = &token,
                             .observer = &resource_monitor,
                             .analysis = validation ? &validation->analysis : nullptr,
                             .inspect_variables = request.inspect_variables,
                             .hidden_prefixes = request.hidden_prefixes};

    const auto started = std::chrono::steady_clock::now();
    resource_monitor.start(token);
    auto result = engine_for(request.language).execute(request.code, request.inputs, request.limits, context);
    resource_monitor.stop();
    forward();

    merge_usage(result.metrics, resource_monitor.usage());
    if (result.metrics.execution_time_ms == 0.0) {
        result.metrics.execution_time_ms =
            std::chrono::duration<double, std::milli>(std::chrono::steady_clock::now() - started).count();
    }
    // The guest may exit between a critical alert and the kill
    if (result.success && token.is_cancelled()) {
        result.success = false;
        result.fault_kind = token.kind();
        result.error = token.reason();
        result.variables.reset();
    }
    if (validation) {
        result.security_validation = std::move(*validation);
    }

    if (result.success) {
        spdlog::info("{} execution completed in {:.0f}ms", language, result.metrics.execution_time_ms);
    } else {
        spdlog::info("{} execution failed ({}): {}",
                     language,
                     result.fault_kind ? to_string(*result.fault_kind) : "unknown",
                     result.error.value_or(""));
    }
    set_state(RuntimeState::kFinalized);
    return result;
}

}  // namespace secbox::runtime
