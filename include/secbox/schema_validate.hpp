#pragma once

/**
 * @file schema_validate.hpp
 * @brief Draft-07 JSON Schema checks for config files and execution requests
 */

#include "secbox/common.hpp"

#include <filesystem>
#include <string_view>

#include <nlohmann/json.hpp>

namespace secbox::common {

/**
 * Check `j` against the schema at `schema_path`.
 *
 * A `$ref` of `secbox:schema/<stem>` loads `<stem>.schema.json` from the
 * same directory, which is how requests and configs share limits.v1.
 *
 * @return Empty, or SchemaFileOpenFailed / SchemaParseFailed /
 *         SchemaBuildFailed / SchemaValidationFailed (one "pointer: reason"
 *         line per violation)
 */
[[nodiscard]] secbox::VoidResult validate_json(const nlohmann::json& j,
                                               const std::filesystem::path& schema_path);

/// validate_json() against `<schema_dir>/<stem>.schema.json`
[[nodiscard]] secbox::VoidResult validate_json(const nlohmann::json& j,
                                               const std::filesystem::path& schema_dir,
                                               std::string_view stem);

}  // namespace secbox::common
