/**
 * @file file_io.cpp
 * @brief File and JSON reading and writing helpers
 */

#include "secbox/common.hpp"

#include <algorithm>
#include <cctype>
#include <fstream>
#include <ranges>
#include <sstream>

namespace secbox::common {

secbox::Result<std::string> read_text_file(const std::filesystem::path& path)
{
    std::ifstream in(path, std::ios::binary);
    if (!in) {
        return std::unexpected(Error::make("IOError", "Failed to open file: " + path.string()));
    }
    std::ostringstream buffer;
    buffer << in.rdbuf();
    if (in.bad()) {
        return std::unexpected(Error::make("IOError", "Failed to read file: " + path.string()));
    }
    return buffer.str();
}

secbox::Result<nlohmann::json> read_json_file(const std::filesystem::path& path)
{
    std::ifstream in(path);
    if (!in) {
        return std::unexpected(
            Error::make("IOError", "Failed to open JSON file: " + path.string()));
    }
    nlohmann::json payload;
    try {
        in >> payload;
    } catch (const std::exception& ex) {
        return std::unexpected(Error::make(
            "ParseError",
            "Failed to parse JSON file: " + path.string() + ": " + std::string(ex.what())));
    }
    return payload;
}

secbox::VoidResult write_text_file(const std::filesystem::path& path, std::string_view content)
{
    std::error_code ec;
    if (path.has_parent_path()) {
        std::filesystem::create_directories(path.parent_path(), ec);
        if (ec) {
            return std::unexpected(Error::make(
                "IOError", "Failed to create directory: " + path.parent_path().string() + ": " + ec.message()));
        }
    }
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out.is_open()) {
        return std::unexpected(Error::make("IOError", "Failed to open file for write: " + path.string()));
    }
    out.write(content.data(), static_cast<std::streamsize>(content.size()));
    if (!out) {
        return std::unexpected(Error::make("IOError", "Failed to write file: " + path.string()));
    }
    return {};
}

std::size_t count_non_blank_lines(std::string_view text) noexcept
{
    std::size_t count = 0;
    for (auto line : std::views::split(text, '\n')) {
        const bool blank = std::ranges::all_of(line, [](char c) {
            return std::isspace(static_cast<unsigned char>(c)) != 0;
        });
        if (!blank) {
            ++count;
        }
    }
    return count;
}

}  // namespace secbox::common
