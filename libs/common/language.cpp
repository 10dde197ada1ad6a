/**
 * @file language.cpp
 * @brief Guest language tag conversion
 */

#include "secbox/language.hpp"

#include <format>

namespace secbox {

std::string_view to_string(Language language) noexcept
{
    switch (language) {
        case Language::kPython:
            return "python";
        case Language::kJavaScript:
            return "javascript";
        case Language::kTypeScript:
            return "typescript";
    }
    return "unknown";
}

std::string_view display_name(Language language) noexcept
{
    switch (language) {
        case Language::kPython:
            return "Python";
        case Language::kJavaScript:
            return "JavaScript";
        case Language::kTypeScript:
            return "TypeScript";
    }
    return "Unknown";
}

secbox::Result<Language> parse_language(std::string_view tag)
{
    for (auto language : kAllLanguages) {
        if (to_string(language) == tag) {
            return language;
        }
    }
    return std::unexpected(
        Error::make("UnsupportedLanguage", std::format("Unsupported language: {}", tag)));
}

}  // namespace secbox
