#pragma once

/**
 * @file logging.hpp
 * @brief spdlog setup shared by the library and the CLI
 *
 * Components log through the default spdlog logger; this only decides where
 * it writes (stderr, so JSON on stdout stays machine-readable) and at what level.
 */

#include "secbox/common.hpp"

#include <string>

namespace secbox::common {

struct LogConfig
{
    std::string level = "warn";
    std::string pattern = "[%Y-%m-%d %H:%M:%S.%e] [%^%l%$] %v";
};

/// Environment variable that overrides LogConfig::level
constexpr const char* kLogLevelEnv = "SECBOX_LOG_LEVEL";

/**
 * Install a stderr color logger as the spdlog default.
 * @return Empty on success, InvalidLogLevel for an unknown level name
 */
[[nodiscard]] secbox::VoidResult init_logging(const LogConfig& config);

}  // namespace secbox::common
