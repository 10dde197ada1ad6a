/**
 * @file canonical_json.cpp
 * @brief Canonical JSON text and digest
 */

#include "secbox/canonical_json.hpp"

#include <cstddef>
#include <format>
#include <optional>

namespace secbox::canonical {

namespace {

/// Location of the first floating-point value below `j`, if any
[[nodiscard]] std::optional<std::string> find_float(const nlohmann::json& j, const std::string& where)
{
    if (j.is_number_float()) {
        return where;
    }
    if (j.is_object()) {
        for (const auto& [key, value] : j.items()) {
            if (auto hit = find_float(value, where + "." + key)) {
                return hit;
            }
        }
    } else if (j.is_array()) {
        std::size_t index = 0;
        for (const auto& value : j) {
            if (auto hit = find_float(value, std::format("{}[{}]", where, index++))) {
                return hit;
            }
        }
    }
    return std::nullopt;
}

}  // namespace

secbox::Result<std::string> canonicalize(const nlohmann::json& j)
{
    if (auto where = find_float(j, "$")) {
        return std::unexpected(Error::make("FloatingPointNotAllowed",
                                           std::format("Cache key input holds a floating-point value at {}", *where)));
    }
    // nlohmann::json keeps object members in a std::map, so dump() already
    // emits keys in byte order; only the separators and UTF-8 policy are ours.
    try {
        return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::strict);
    } catch (const nlohmann::json::type_error& ex) {
        return std::unexpected(Error::make("InvalidUtf8", ex.what()));
    }
}

secbox::Result<std::string> hash_canonical(const nlohmann::json& j)
{
    return canonicalize(j).transform([](const std::string& text) { return common::sha256_prefixed(text); });
}

}  // namespace secbox::canonical
