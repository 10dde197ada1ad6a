#pragma once

/**
 * @file js_lexer.hpp
 * @brief Tokenizer shared by the strict and tolerant JavaScript/TypeScript parsers
 */

#include "secbox/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::analyzer::js {

enum class TokenKind {
    kIdentifier,  ///< identifiers and keywords alike; parsers check `text`
    kPrivateName,
    kNumber,
    kString,
    kTemplate,
    kRegex,
    kPunctuator,
    kEnd
};

/// Source span of one `${...}` substitution inside a template literal
struct TemplateSubstitution
{
    std::size_t begin = 0;  ///< offset of the first byte after `${`
    std::size_t end = 0;    ///< offset of the closing `}`
    std::uint32_t line = 1;
    std::uint32_t column = 0;
};

struct Token
{
    TokenKind kind = TokenKind::kEnd;
    std::string text;  ///< raw text; for strings the decoded value
    std::uint32_t line = 1;
    std::uint32_t column = 0;
    std::size_t begin = 0;
    std::size_t end = 0;
    bool newline_before = false;
    std::vector<TemplateSubstitution> substitutions;

    [[nodiscard]] bool is(TokenKind k, std::string_view t) const noexcept
    {
        return kind == k && text == t;
    }
    [[nodiscard]] bool is_punct(std::string_view t) const noexcept
    {
        return is(TokenKind::kPunctuator, t);
    }
    [[nodiscard]] bool is_word(std::string_view t) const noexcept
    {
        return is(TokenKind::kIdentifier, t);
    }
};

/**
 * Tokenize `source[begin, end)`.
 *
 * Line/column of the first byte are `line`/`column`, so substitutions of a
 * template literal can be re-tokenized with their real positions.
 *
 * @return Tokens terminated by a kEnd token, or LexError
 */
[[nodiscard]] secbox::Result<std::vector<Token>> tokenize(std::string_view source,
                                                          std::size_t begin,
                                                          std::size_t end,
                                                          std::uint32_t line = 1,
                                                          std::uint32_t column = 0);

[[nodiscard]] inline secbox::Result<std::vector<Token>> tokenize(std::string_view source)
{
    return tokenize(source, 0, source.size());
}

/// Reserved words that can never start an arrow parameter or be a binding
[[nodiscard]] bool is_reserved_word(std::string_view word) noexcept;

}  // namespace secbox::analyzer::js
