/**
 * @file config.cpp
 * @brief Sandbox configuration decoding and loading
 */

#include "secbox/config.hpp"

#include "secbox/schema_validate.hpp"
#include "secbox/version.hpp"

#include <format>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace secbox::common {

namespace {

[[nodiscard]] secbox::Error invalid_config(std::string message)
{
    return Error::make("InvalidConfig", std::move(message));
}

[[nodiscard]] secbox::VoidResult read_string(const nlohmann::json& j,
                                             const char* key,
                                             std::string& out)
{
    const auto it = j.find(key);
    if (it == j.end()) {
        return {};
    }
    if (!it->is_string()) {
        return std::unexpected(invalid_config(std::format("'{}' must be a string", key)));
    }
    out = it->get<std::string>();
    return {};
}

[[nodiscard]] secbox::VoidResult read_milliseconds(const nlohmann::json& j,
                                                   const char* key,
                                                   std::chrono::milliseconds& out)
{
    const auto it = j.find(key);
    if (it == j.end()) {
        return {};
    }
    if (!it->is_number_integer() || it->get<std::int64_t>() <= 0) {
        return std::unexpected(
            invalid_config(std::format("'{}' must be a positive integer", key)));
    }
    out = std::chrono::milliseconds(it->get<std::int64_t>());
    return {};
}

secbox::VoidResult apply_interpreters(const nlohmann::json& j, InterpreterPaths& out)
{
    if (auto result = read_string(j, "python", out.python); !result) {
        return result;
    }
    return read_string(j, "node", out.node);
}

secbox::VoidResult apply_monitor(const nlohmann::json& j, MonitorSettings& out)
{
    if (auto result = read_milliseconds(j, "sample_interval_ms", out.sample_interval); !result) {
        return result;
    }
    if (const auto it = j.find("cpu_alert_percent"); it != j.end()) {
        if (!it->is_number()) {
            return std::unexpected(invalid_config("'cpu_alert_percent' must be a number"));
        }
        out.cpu_alert_percent = it->get<double>();
    }
    return {};
}

secbox::VoidResult apply_cache(const nlohmann::json& j, CacheSettings& out)
{
    if (auto result = read_milliseconds(j, "ttl_ms", out.ttl); !result) {
        return result;
    }
    if (const auto it = j.find("capacity"); it != j.end()) {
        if (!it->is_number_unsigned()) {
            return std::unexpected(invalid_config("'capacity' must be a non-negative integer"));
        }
        out.capacity = it->get<std::size_t>();
    }
    return {};
}

}  // namespace

SandboxConfig default_config()
{
    return SandboxConfig{
        .default_limits = ExecutionLimits{},
        .risk_policy = RiskPolicy{},
        .interpreters = InterpreterPaths{},
        .monitor = MonitorSettings{},
        .validation_cache = CacheSettings{},
        .python_allowed_modules = {"math",      "random",      "datetime", "json",
                                   "re",        "string",      "collections", "itertools",
                                   "functools", "operator",    "statistics",  "decimal",
                                   "fractions", "heapq",       "bisect",      "copy",
                                   "typing",    "dataclasses", "enum",        "textwrap"},
        .work_dir = {},
        .logging = LogConfig{},
    };
}

secbox::Result<SandboxConfig> config_from_json(const nlohmann::json& j)
{
    if (!j.is_object()) {
        return std::unexpected(invalid_config("Configuration must be a JSON object"));
    }
    SandboxConfig config = default_config();

    if (const auto it = j.find("limits"); it != j.end()) {
        auto limits = limits_from_json(*it, config.default_limits);
        if (!limits) {
            return std::unexpected(invalid_config(limits.error().message));
        }
        config.default_limits = *limits;
    }
    if (const auto it = j.find("risk_policy"); it != j.end()) {
        auto policy = risk_policy_from_json(*it, config.risk_policy);
        if (!policy) {
            return std::unexpected(invalid_config(policy.error().message));
        }
        config.risk_policy = *policy;
    }
    if (const auto it = j.find("interpreters"); it != j.end() && it->is_object()) {
        if (auto result = apply_interpreters(*it, config.interpreters); !result) {
            return std::unexpected(result.error());
        }
    }
    if (const auto it = j.find("monitor"); it != j.end() && it->is_object()) {
        if (auto result = apply_monitor(*it, config.monitor); !result) {
            return std::unexpected(result.error());
        }
    }
    if (const auto it = j.find("validation_cache"); it != j.end() && it->is_object()) {
        if (auto result = apply_cache(*it, config.validation_cache); !result) {
            return std::unexpected(result.error());
        }
    }
    if (const auto python = j.find("python"); python != j.end() && python->is_object()) {
        if (const auto modules = python->find("allowed_modules"); modules != python->end()) {
            config.python_allowed_modules.clear();
            for (const auto& module : *modules) {
                if (!module.is_string()) {
                    return std::unexpected(invalid_config("'allowed_modules' must hold strings"));
                }
                config.python_allowed_modules.push_back(module.get<std::string>());
            }
        }
    }
    if (const auto it = j.find("work_dir"); it != j.end()) {
        if (!it->is_string()) {
            return std::unexpected(invalid_config("'work_dir' must be a string"));
        }
        config.work_dir = it->get<std::string>();
    }
    if (const auto logging = j.find("logging"); logging != j.end() && logging->is_object()) {
        if (auto result = read_string(*logging, "level", config.logging.level); !result) {
            return std::unexpected(result.error());
        }
        if (auto result = read_string(*logging, "pattern", config.logging.pattern); !result) {
            return std::unexpected(result.error());
        }
    }
    return config;
}

secbox::Result<SandboxConfig> load_config(const std::filesystem::path& path,
                                          const std::filesystem::path& schema_dir)
{
    std::error_code ec;
    if (!std::filesystem::exists(path, ec)) {
        spdlog::debug("No configuration at {}, using built-in defaults", path.string());
        return default_config();
    }

    auto document = read_json_file(path);
    if (!document) {
        return std::unexpected(document.error());
    }
    if (auto valid = validate_json(*document, schema_dir, kConfigSchemaVersion); !valid) {
        return std::unexpected(Error::make(
            "SchemaInvalid",
            std::format("{} does not match {}: {}", path.string(), kConfigSchemaVersion,
                        valid.error().message)));
    }
    auto config = config_from_json(*document);
    if (config) {
        spdlog::info("Loaded configuration from {}", path.string());
    }
    return config;
}

}  // namespace secbox::common
