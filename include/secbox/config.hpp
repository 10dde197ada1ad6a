#pragma once

/**
 * @file config.hpp
 * @brief Sandbox configuration loaded from config/secbox.json
 */

#include "secbox/common.hpp"
#include "secbox/logging.hpp"
#include "secbox/types.hpp"

#include <chrono>
#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace secbox::common {

struct InterpreterPaths
{
    std::string python = "python3";
    std::string node = "node";
};

struct MonitorSettings
{
    std::chrono::milliseconds sample_interval{50};
    /// CPU percent above which a (non-blocking) cpu warning is raised
    double cpu_alert_percent = 80.0;
};

struct CacheSettings
{
    std::chrono::milliseconds ttl{300'000};
    std::size_t capacity = 256;
};

struct SandboxConfig
{
    ExecutionLimits default_limits;
    RiskPolicy risk_policy;
    InterpreterPaths interpreters;
    MonitorSettings monitor;
    CacheSettings validation_cache;
    /// Modules guest Python code may import
    std::vector<std::string> python_allowed_modules;
    /// Directory where engine preludes are written; empty selects a per-process temp directory
    std::filesystem::path work_dir;
    LogConfig logging;
};

/// Built-in configuration used when no file is present
[[nodiscard]] SandboxConfig default_config();

/**
 * Decode a configuration document (keys absent from the document keep their defaults).
 * @return Configuration, or InvalidConfig
 */
[[nodiscard]] secbox::Result<SandboxConfig> config_from_json(const nlohmann::json& j);

/**
 * Load and schema-check a configuration file.
 *
 * A missing file yields default_config(); an unreadable or invalid file is an error.
 *
 * @param path Configuration file
 * @param schema_dir Directory holding config.v1.schema.json
 */
[[nodiscard]] secbox::Result<SandboxConfig> load_config(const std::filesystem::path& path,
                                                        const std::filesystem::path& schema_dir);

}  // namespace secbox::common
