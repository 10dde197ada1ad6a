#pragma once

/**
 * @file language.hpp
 * @brief Guest language tags
 */

#include "secbox/common.hpp"

#include <array>
#include <string_view>

namespace secbox {

enum class Language {
    kPython,
    kJavaScript,
    kTypeScript
};

inline constexpr std::array<Language, 3> kAllLanguages = {Language::kPython,
                                                          Language::kJavaScript,
                                                          Language::kTypeScript};

/// Textual tag: "python", "javascript" or "typescript"
[[nodiscard]] std::string_view to_string(Language language) noexcept;

/// Display name used in messages ("Python", "JavaScript", "TypeScript")
[[nodiscard]] std::string_view display_name(Language language) noexcept;

/**
 * Parse a textual language tag.
 * @return Language, or UnsupportedLanguage
 */
[[nodiscard]] secbox::Result<Language> parse_language(std::string_view tag);

[[nodiscard]] constexpr bool is_javascript_family(Language language) noexcept
{
    return language == Language::kJavaScript || language == Language::kTypeScript;
}

}  // namespace secbox
