#pragma once

/**
 * @file common.hpp
 * @brief Error reporting shared by every secbox library, plus digest and
 *        file helpers used by the config loader and validation cache
 */

#include <cstdint>
#include <expected>
#include <filesystem>
#include <format>
#include <string>
#include <string_view>
#include <utility>

#include <nlohmann/json.hpp>

namespace secbox {

/**
 * @brief Failure carried by Result
 *
 * `code` is a stable PascalCase tag (IOError, LimitOutOfRange, SchemaInvalid,
 * ...) that callers branch on; `message` is for people and logs.
 */
struct Error
{
    std::string code;
    std::string message;

    [[nodiscard]] static Error make(std::string code, std::string message)
    {
        return Error{.code = std::move(code), .message = std::move(message)};
    }

    [[nodiscard]] bool is(std::string_view expected_code) const noexcept { return code == expected_code; }

    /// "<code>: <message>"
    [[nodiscard]] std::string describe() const { return std::format("{}: {}", code, message); }
};

template <typename T>
using Result = std::expected<T, Error>;

using VoidResult = std::expected<void, Error>;

}  // namespace secbox

namespace secbox::common {

/// Lowercase hex SHA-256 digest (64 characters)
[[nodiscard]] std::string sha256(std::string_view data);

/// sha256() with a "sha256:" tag, the form stored in cache keys
[[nodiscard]] std::string sha256_prefixed(std::string_view data);

/// Whole file as bytes; IOError when it cannot be opened or read
[[nodiscard]] secbox::Result<std::string> read_text_file(const std::filesystem::path& path);

/// Config and request documents; IOError or ParseError
[[nodiscard]] secbox::Result<nlohmann::json> read_json_file(const std::filesystem::path& path);

/// Replace `path` with `content`, creating missing parent directories
[[nodiscard]] secbox::VoidResult write_text_file(const std::filesystem::path& path, std::string_view content);

/// Lines of code for risk scoring: lines holding anything but whitespace
[[nodiscard]] std::size_t count_non_blank_lines(std::string_view text) noexcept;

}  // namespace secbox::common
