#pragma once

/**
 * @file canonical_json.hpp
 * @brief Byte-stable JSON text for cache keys
 *
 * Two documents that compare equal produce the same bytes: compact
 * separators, keys in byte order, UTF-8 output. Floating-point values are
 * refused because their text form is not stable across platforms.
 */

#include "secbox/common.hpp"

#include <string>

#include <nlohmann/json.hpp>

namespace secbox::canonical {

/// @return Canonical text, or FloatingPointNotAllowed / InvalidUtf8
[[nodiscard]] secbox::Result<std::string> canonicalize(const nlohmann::json& j);

/// "sha256:<hex>" digest of canonicalize(j)
[[nodiscard]] secbox::Result<std::string> hash_canonical(const nlohmann::json& j);

}  // namespace secbox::canonical
