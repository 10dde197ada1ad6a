#pragma once

/**
 * @file py_lexer.hpp
 * @brief Indentation-aware Python tokenizer (NEWLINE/INDENT/DEDENT)
 */

#include "secbox/common.hpp"

#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::analyzer::py {

enum class TokenKind {
    kName,  ///< identifiers and keywords alike
    kNumber,
    kString,
    kOperator,
    kNewline,
    kIndent,
    kDedent,
    kEnd
};

/// Source span of one replacement field `{expr}` of an f-string
struct FieldSpan
{
    std::size_t begin = 0;
    std::size_t end = 0;
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
    bool formatted = false;  ///< f-string
    std::vector<FieldSpan> fields;

    [[nodiscard]] bool is_op(std::string_view t) const noexcept
    {
        return kind == TokenKind::kOperator && text == t;
    }
    [[nodiscard]] bool is_name(std::string_view t) const noexcept
    {
        return kind == TokenKind::kName && text == t;
    }
};

/**
 * Tokenize a whole module.
 * @return Tokens ending in NEWLINE, DEDENT*, kEnd; or SyntaxError / IndentationError
 */
[[nodiscard]] secbox::Result<std::vector<Token>> tokenize(std::string_view source);

/**
 * Tokenize an f-string replacement field as a bare expression (no layout tokens).
 */
[[nodiscard]] secbox::Result<std::vector<Token>> tokenize_expression(std::string_view source,
                                                                     const FieldSpan& span);

/// Hard keywords; never valid as a name
[[nodiscard]] bool is_keyword(std::string_view word) noexcept;

}  // namespace secbox::analyzer::py
