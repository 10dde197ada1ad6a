/**
 * @file logging.cpp
 * @brief Default spdlog logger configuration
 */

#include "secbox/logging.hpp"

#include <cstdlib>
#include <memory>

#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace secbox::common {

secbox::VoidResult init_logging(const LogConfig& config)
{
    std::string level_name = config.level;
    if (const char* env = std::getenv(kLogLevelEnv); env != nullptr && *env != '\0') {
        level_name = env;
    }

    const auto level = spdlog::level::from_str(level_name);
    // from_str maps unknown names to "off"
    if (level == spdlog::level::off && level_name != "off") {
        return std::unexpected(
            Error::make("InvalidLogLevel", "Unknown log level: " + level_name));
    }

    auto logger = spdlog::get("secbox");
    if (!logger) {
        logger = spdlog::stderr_color_mt("secbox");
    }
    logger->set_level(level);
    logger->set_pattern(config.pattern);
    spdlog::set_default_logger(std::move(logger));
    return {};
}

}  // namespace secbox::common
