/**
 * @file py_lexer.cpp
 * @brief Python tokenizer
 *
 * Layout tokens follow the reference tokenizer: blank and comment-only lines
 * produce nothing, newlines inside brackets are ignored, and each logical line
 * ends in exactly one NEWLINE.
 */

#include "py_lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace secbox::analyzer::py {

namespace {

constexpr std::array<std::string_view, 35> kKeywords = {
    "False",  "None",   "True",    "and",      "as",       "assert", "async",
    "await",  "break",  "class",   "continue", "def",      "del",    "elif",
    "else",   "except", "finally", "for",      "from",     "global", "if",
    "import", "in",     "is",      "lambda",   "nonlocal", "not",    "or",
    "pass",   "raise",  "return",  "try",      "while",    "with",   "yield"};

// Longest first
constexpr std::array<std::string_view, 25> kMultiCharOperators = {
    "**=", "//=", ">>=", "<<=", "...", "->", ":=", "**", "//", "<<", ">>", "<=", ">=",
    "==",  "!=",  "+=",  "-=",  "*=",  "/=", "%=", "&=", "|=", "^=", "@=", "<>"};

constexpr std::string_view kSingleOperators = "+-*/%@&|^~<>()[]{},:;.=!";

constexpr int kTabSize = 8;

[[nodiscard]] bool is_name_start(unsigned char c) noexcept
{
    return std::isalpha(c) != 0 || c == '_' || c >= 0x80;
}

[[nodiscard]] bool is_name_part(unsigned char c) noexcept
{
    return is_name_start(c) || std::isdigit(c) != 0;
}

[[nodiscard]] bool is_string_prefix(std::string_view prefix) noexcept
{
    if (prefix.empty() || prefix.size() > 2) {
        return false;
    }
    std::string lower;
    for (const char c : prefix) {
        lower += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return lower == "r" || lower == "u" || lower == "b" || lower == "f" || lower == "rb"
           || lower == "br" || lower == "fr" || lower == "rf";
}

class Lexer
{
public:
    Lexer(std::string_view source, std::size_t begin, std::size_t end, std::uint32_t line,
          std::uint32_t column, bool layout)
        : m_src(source)
        , m_pos(begin)
        , m_end(end)
        , m_line(line)
        , m_column(column)
        , m_layout(layout)
    {}

    secbox::Result<std::vector<Token>> run()
    {
        bool at_line_start = m_layout;
        while (true) {
            if (at_line_start) {
                auto indented = handle_indentation();
                if (!indented) {
                    return std::unexpected(indented.error());
                }
                at_line_start = false;
                if (m_pos >= m_end) {
                    break;
                }
            }
            skip_spaces();
            if (m_pos >= m_end) {
                break;
            }
            const char c = peek();
            if (c == '#') {
                skip_comment();
                continue;
            }
            if (c == '\\' && (peek(1) == '\n' || (peek(1) == '\r' && peek(2) == '\n'))) {
                advance();
                consume_newline();
                continue;
            }
            if (c == '\n' || c == '\r') {
                consume_newline();
                if (m_brackets.empty() && m_layout) {
                    emit_newline_if_needed();
                    at_line_start = true;
                }
                continue;
            }
            auto token = next_token();
            if (!token) {
                return std::unexpected(token.error());
            }
            m_tokens.push_back(std::move(*token));
        }
        return finish();
    }

private:
    [[nodiscard]] char peek(std::size_t ahead = 0) const noexcept
    {
        return m_pos + ahead < m_end ? m_src[m_pos + ahead] : '\0';
    }

    void advance() noexcept
    {
        if (m_src[m_pos] == '\n') {
            ++m_line;
            m_column = 0;
        } else {
            ++m_column;
        }
        ++m_pos;
    }

    void consume_newline() noexcept
    {
        if (peek() == '\r') {
            ++m_pos;
            if (peek() != '\n') {
                ++m_line;
                m_column = 0;
                return;
            }
        }
        advance();
    }

    void skip_spaces() noexcept
    {
        while (m_pos < m_end && (peek() == ' ' || peek() == '\t' || peek() == '\f')) {
            advance();
        }
    }

    void skip_comment() noexcept
    {
        while (m_pos < m_end && peek() != '\n' && peek() != '\r') {
            advance();
        }
    }

    [[nodiscard]] Error error(std::string_view code, std::string_view message) const
    {
        return Error::make(std::string(code),
                           std::format("{} ({}:{})", message, m_line, m_column));
    }

    [[nodiscard]] Token make(TokenKind kind, std::string text, std::size_t begin,
                             std::uint32_t line, std::uint32_t column) const
    {
        return Token{.kind = kind,
                     .text = std::move(text),
                     .line = line,
                     .column = column,
                     .begin = begin,
                     .end = m_pos,
                     .formatted = false,
                     .fields = {}};
    }

    void emit_newline_if_needed()
    {
        if (!m_tokens.empty() && m_tokens.back().kind != TokenKind::kNewline
            && m_tokens.back().kind != TokenKind::kIndent
            && m_tokens.back().kind != TokenKind::kDedent) {
            m_tokens.push_back(make(TokenKind::kNewline, {}, m_pos, m_line, m_column));
        }
    }

    /// Measure the indentation of the next non-blank line and emit INDENT/DEDENT
    secbox::VoidResult handle_indentation()
    {
        while (m_pos < m_end) {
            int width = 0;
            while (m_pos < m_end && (peek() == ' ' || peek() == '\t' || peek() == '\f')) {
                width = peek() == '\t' ? (width / kTabSize + 1) * kTabSize
                                       : peek() == '\f' ? 0 : width + 1;
                advance();
            }
            if (m_pos >= m_end) {
                return {};
            }
            const char c = peek();
            if (c == '#') {
                skip_comment();
            }
            if (peek() == '\n' || peek() == '\r') {
                consume_newline();
                continue;
            }
            if (m_pos >= m_end) {
                return {};
            }
            if (width > m_indents.back()) {
                m_indents.push_back(width);
                m_tokens.push_back(make(TokenKind::kIndent, {}, m_pos, m_line, m_column));
                return {};
            }
            while (width < m_indents.back()) {
                m_indents.pop_back();
                m_tokens.push_back(make(TokenKind::kDedent, {}, m_pos, m_line, m_column));
            }
            if (width != m_indents.back()) {
                return std::unexpected(error(
                    "IndentationError", "unindent does not match any outer indentation level"));
            }
            return {};
        }
        return {};
    }

    secbox::Result<std::vector<Token>> finish()
    {
        if (!m_brackets.empty()) {
            const auto& open = m_brackets.back();
            return std::unexpected(Error::make(
                "SyntaxError", std::format("'{}' was never closed ({}:{})", open.text, open.line,
                                           open.column)));
        }
        if (m_layout) {
            emit_newline_if_needed();
            while (m_indents.size() > 1) {
                m_indents.pop_back();
                m_tokens.push_back(make(TokenKind::kDedent, {}, m_pos, m_line, m_column));
            }
        }
        m_tokens.push_back(make(TokenKind::kEnd, {}, m_pos, m_line, m_column));
        return std::move(m_tokens);
    }

    secbox::Result<Token> next_token()
    {
        const auto begin = m_pos;
        const auto line = m_line;
        const auto column = m_column;
        const auto c = static_cast<unsigned char>(peek());

        if (is_name_start(c)) {
            while (m_pos < m_end && is_name_part(static_cast<unsigned char>(peek()))) {
                advance();
            }
            const auto word = m_src.substr(begin, m_pos - begin);
            if ((peek() == '\'' || peek() == '"') && is_string_prefix(word)) {
                return lex_string(begin, line, column, word);
            }
            return make(TokenKind::kName, std::string(word), begin, line, column);
        }
        if (std::isdigit(c) != 0 || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
            return lex_number(begin, line, column);
        }
        if (c == '\'' || c == '"') {
            return lex_string(begin, line, column, {});
        }
        return lex_operator(begin, line, column);
    }

    secbox::Result<Token> lex_number(std::size_t begin, std::uint32_t line, std::uint32_t column)
    {
        if (peek() == '0' && std::string_view("xXoObB").contains(peek(1))) {
            advance();
            advance();
            while (std::isxdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_') {
                advance();
            }
        } else {
            while (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_' || peek() == '.') {
                advance();
            }
            if (peek() == 'e' || peek() == 'E') {
                const bool sign = peek(1) == '+' || peek(1) == '-';
                if (std::isdigit(static_cast<unsigned char>(peek(sign ? 2 : 1))) != 0) {
                    advance();
                    if (sign) {
                        advance();
                    }
                    while (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_') {
                        advance();
                    }
                }
            }
            if (peek() == 'j' || peek() == 'J') {
                advance();
            }
        }
        if (is_name_start(static_cast<unsigned char>(peek()))) {
            return std::unexpected(error("SyntaxError", "invalid decimal literal"));
        }
        return make(TokenKind::kNumber, std::string(m_src.substr(begin, m_pos - begin)), begin,
                    line, column);
    }

    secbox::Result<Token> lex_string(std::size_t begin, std::uint32_t line, std::uint32_t column,
                                     std::string_view prefix)
    {
        const bool raw = std::ranges::any_of(prefix, [](char p) { return p == 'r' || p == 'R'; });
        const bool formatted = std::ranges::any_of(prefix, [](char p) { return p == 'f' || p == 'F'; });
        const char quote = peek();
        const bool triple = peek(1) == quote && peek(2) == quote;
        for (int i = 0; i < (triple ? 3 : 1); ++i) {
            advance();
        }

        Token token = make(TokenKind::kString, {}, begin, line, column);
        token.formatted = formatted;
        std::string value;
        while (true) {
            if (m_pos >= m_end || (!triple && (peek() == '\n' || peek() == '\r'))) {
                return std::unexpected(Error::make(
                    "SyntaxError",
                    std::format("{} string literal ({}:{})",
                                triple ? "unterminated triple-quoted" : "unterminated", line, column)));
            }
            const char c = peek();
            if (c == quote && (!triple || (peek(1) == quote && peek(2) == quote))) {
                for (int i = 0; i < (triple ? 3 : 1); ++i) {
                    advance();
                }
                break;
            }
            if (c == '\\') {
                advance();
                if (m_pos >= m_end) {
                    continue;
                }
                const char escaped = peek();
                if (escaped == '\n' || escaped == '\r') {
                    consume_newline();
                    if (raw) {
                        value += "\\\n";
                    }
                    continue;
                }
                advance();
                if (raw) {
                    value += '\\';
                    value += escaped;
                    continue;
                }
                switch (escaped) {
                    case 'n':
                        value += '\n';
                        break;
                    case 't':
                        value += '\t';
                        break;
                    case 'r':
                        value += '\r';
                        break;
                    case '0':
                        value += '\0';
                        break;
                    case '\\':
                    case '\'':
                    case '"':
                        value += escaped;
                        break;
                    default:
                        value += '\\';
                        value += escaped;
                        break;
                }
                continue;
            }
            if (formatted && c == '{') {
                if (peek(1) == '{') {
                    advance();
                    advance();
                    value += '{';
                    continue;
                }
                auto field = scan_field(quote, triple);
                if (!field) {
                    return std::unexpected(field.error());
                }
                token.fields.push_back(*field);
                value += "{}";
                continue;
            }
            if (formatted && c == '}' && peek(1) == '}') {
                advance();
            }
            value += c;
            if (c == '\n' || c == '\r') {
                consume_newline();
            } else {
                advance();
            }
        }
        token.text = std::move(value);
        token.end = m_pos;
        return token;
    }

    /// Scan `{expr[!conv][:spec]}`; returns the span of `expr`
    secbox::Result<FieldSpan> scan_field(char quote, bool triple)
    {
        advance();  // '{'
        FieldSpan span{.begin = m_pos, .end = m_pos, .line = m_line, .column = m_column};
        int depth = 0;
        bool expression_done = false;
        while (m_pos < m_end) {
            const char c = peek();
            if (c == quote && (!triple || (peek(1) == quote && peek(2) == quote))) {
                break;
            }
            if (!triple && (c == '\n' || c == '\r')) {
                break;
            }
            if (!expression_done && (c == '\'' || c == '"')) {
                skip_inner_string(c);
                continue;
            }
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if ((c == ')' || c == ']') && depth > 0) {
                --depth;
            } else if (c == '}') {
                if (depth == 0) {
                    if (!expression_done) {
                        span.end = m_pos;
                    }
                    advance();
                    return span;
                }
                --depth;
            } else if (depth == 0 && !expression_done
                       && ((c == '!' && peek(1) != '=') || c == ':')) {
                span.end = m_pos;
                expression_done = true;
            }
            if (c == '\n' || c == '\r') {
                consume_newline();
            } else {
                advance();
            }
        }
        return std::unexpected(error("SyntaxError", "f-string: expecting '}'"));
    }

    void skip_inner_string(char quote)
    {
        advance();
        while (m_pos < m_end && peek() != quote && peek() != '\n') {
            if (peek() == '\\') {
                advance();
            }
            if (m_pos < m_end) {
                advance();
            }
        }
        if (m_pos < m_end && peek() == quote) {
            advance();
        }
    }

    secbox::Result<Token> lex_operator(std::size_t begin, std::uint32_t line, std::uint32_t column)
    {
        const auto rest = m_src.substr(m_pos, m_end - m_pos);
        std::string_view op;
        for (const auto candidate : kMultiCharOperators) {
            if (rest.starts_with(candidate)) {
                op = candidate;
                break;
            }
        }
        if (op.empty() && kSingleOperators.contains(rest.front())) {
            op = rest.substr(0, 1);
        }
        if (op.empty()) {
            return std::unexpected(error(
                "SyntaxError",
                std::format("invalid character '{}'", rest.substr(0, 1))));
        }
        for (std::size_t i = 0; i < op.size(); ++i) {
            advance();
        }
        Token token = make(TokenKind::kOperator, std::string(op), begin, line, column);

        if (op == "(" || op == "[" || op == "{") {
            m_brackets.push_back(token);
        } else if (op == ")" || op == "]" || op == "}") {
            const char expected = op == ")" ? '(' : op == "]" ? '[' : '{';
            if (m_brackets.empty()) {
                return std::unexpected(Error::make(
                    "SyntaxError", std::format("unmatched '{}' ({}:{})", op, line, column)));
            }
            if (m_brackets.back().text.front() != expected) {
                return std::unexpected(Error::make(
                    "SyntaxError",
                    std::format("closing parenthesis '{}' does not match opening parenthesis '{}' ({}:{})",
                                op, m_brackets.back().text, line, column)));
            }
            m_brackets.pop_back();
        }
        return token;
    }

    std::string_view m_src;
    std::size_t m_pos;
    std::size_t m_end;
    std::uint32_t m_line;
    std::uint32_t m_column;
    bool m_layout;
    std::vector<int> m_indents{0};
    std::vector<Token> m_brackets;
    std::vector<Token> m_tokens;
};

}  // namespace

secbox::Result<std::vector<Token>> tokenize(std::string_view source)
{
    return Lexer(source, 0, source.size(), 1, 0, true).run();
}

secbox::Result<std::vector<Token>> tokenize_expression(std::string_view source, const FieldSpan& span)
{
    return Lexer(source, span.begin, span.end, span.line, span.column, false).run();
}

bool is_keyword(std::string_view word) noexcept
{
    return std::ranges::find(kKeywords, word) != kKeywords.end();
}

}  // namespace secbox::analyzer::py
