#pragma once

/**
 * @file version.hpp
 * @brief Release and artifact versions reported by `secbox version`
 */

#include <string_view>

namespace secbox {

inline constexpr std::string_view kVersion = "0.1.0";
inline constexpr std::string_view kBuildId = "dev";

/// Bumped whenever a rule is added, removed or re-weighted
inline constexpr std::string_view kRuleCatalogVersion = "rules.v1";

// Schema file stems under schemas/ (<stem>.schema.json)
inline constexpr std::string_view kConfigSchemaVersion = "config.v1";
inline constexpr std::string_view kRequestSchemaVersion = "execution_request.v1";
inline constexpr std::string_view kLimitsSchemaVersion = "limits.v1";

}  // namespace secbox
