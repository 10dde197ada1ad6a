/**
 * @file engine.cpp
 * @brief ExecutionEngine base: lazy asynchronous initialization and status
 */

#include "secbox/engine.hpp"

#include <format>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::engine {

void to_json(nlohmann::json& j, const EngineStatus& value)
{
    j = nlohmann::json{
        {   "language", to_string(value.language)},
        {"initialized",         value.initialized},
        {    "version",             value.version},
        {   "features",            value.features}
    };
    if (value.error) {
        j["error"] = *value.error;
    }
}

ExecutionEngine::ExecutionEngine(Language language)
    : m_language(language)
{}

std::shared_future<secbox::VoidResult> ExecutionEngine::initialize()
{
    std::lock_guard lock(m_mutex);
    if (!m_init) {
        spdlog::info("Initializing {} engine", display_name(m_language));
        m_init = std::async(std::launch::async, [this]() -> secbox::VoidResult {
                     auto installed = install();
                     std::lock_guard guard(m_mutex);
                     if (!installed) {
                         spdlog::error("{} engine initialization failed: {}",
                                       display_name(m_language),
                                       installed.error().message);
                         m_init_error = installed.error().message;
                         return std::unexpected(installed.error());
                     }
                     spdlog::info("{} engine ready ({})", display_name(m_language), installed->version);
                     m_installed = std::move(*installed);
                     return {};
                 }).share();
    }
    return *m_init;
}

void ExecutionEngine::join_initialization() noexcept
{
    std::optional<std::shared_future<secbox::VoidResult>> pending;
    {
        std::lock_guard lock(m_mutex);
        pending = m_init;
    }
    if (pending && pending->valid()) {
        pending->wait();
    }
}

bool ExecutionEngine::is_ready() const
{
    std::lock_guard lock(m_mutex);
    return m_installed.has_value();
}

EngineStatus ExecutionEngine::status() const
{
    std::lock_guard lock(m_mutex);
    EngineStatus status{.language = m_language,
                        .initialized = m_installed.has_value(),
                        .version = {},
                        .features = {},
                        .error = m_init_error};
    if (m_installed) {
        status.version = m_installed->version;
        status.features = m_installed->features;
    }
    return status;
}

ExecutionResult ExecutionEngine::execute(std::string_view code,
                                         const std::vector<std::string>& inputs,
                                         const ExecutionLimits& limits,
                                         ExecutionContext& context)
{
    const auto ready = initialize().get();
    if (!ready) {
        ExecutionResult result;
        result.success = false;
        result.fault_kind = FaultKind::kEngineUnavailable;
        result.error = std::format("{} engine not available", display_name(m_language));
        return result;
    }
    return run(code, inputs, limits, context);
}

bool truncate_output(std::string& output, std::size_t max_bytes)
{
    if (output.size() <= max_bytes) {
        return false;
    }
    auto cut = max_bytes;
    // Back up over UTF-8 continuation bytes so no code point is split
    while (cut > 0 && (static_cast<unsigned char>(output[cut]) & 0xC0U) == 0x80U) {
        --cut;
    }
    output.resize(cut);
    output.append(kTruncationMarker);
    return true;
}

std::unique_ptr<ExecutionEngine> make_engine(Language language, EngineSettings settings)
{
    switch (language) {
        case Language::kPython:
            return std::make_unique<PythonEngine>(std::move(settings));
        case Language::kJavaScript:
            return std::make_unique<JavaScriptEngine>(std::move(settings));
        case Language::kTypeScript:
            return std::make_unique<TypeScriptEngine>(std::move(settings));
    }
    return nullptr;
}

}  // namespace secbox::engine
