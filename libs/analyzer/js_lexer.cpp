/**
 * @file js_lexer.cpp
 * @brief JavaScript/TypeScript tokenizer
 */

#include "js_lexer.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <format>

namespace secbox::analyzer::js {

namespace {

// Longest first so a greedy scan picks the right operator
constexpr std::array<std::string_view, 52> kPunctuators = {
    ">>>=", "...", "===", "!==", "**=", "<<=", ">>=", ">>>", "&&=", "||=", "??=",
    "=>",   "==",  "!=",  "<=",  ">=",  "&&",  "||",  "??",  "?.",  "++",  "--",
    "+=",   "-=",  "*=",  "/=",  "%=",  "&=",  "|=",  "^=",  "**",  "<<",  ">>",
    "{",    "}",   "(",   ")",   "[",   "]",   ";",   ",",   "<",   ">",   "+",
    "-",    "*",   "/",   "%",   "&",   "|",   "^",   "!"};

constexpr std::string_view kSingleExtra = "~?:=.@";

constexpr std::array<std::string_view, 14> kRegexAfterKeywords = {
    "return", "typeof", "instanceof", "in",   "of",    "new",  "delete",
    "void",   "throw",  "case",       "do",   "else",  "yield", "await"};

constexpr std::array<std::string_view, 37> kReservedWords = {
    "break",  "case",   "catch",      "class",  "const",   "continue", "debugger", "default",
    "delete", "do",     "else",       "export", "extends", "false",    "finally",  "for",
    "function", "if",   "import",     "in",     "instanceof", "new",   "null",     "return",
    "super",  "switch", "this",       "throw",  "true",    "try",      "typeof",   "var",
    "void",   "while",  "with",       "enum",   "yield"};

[[nodiscard]] bool is_identifier_start(unsigned char c) noexcept
{
    return std::isalpha(c) != 0 || c == '_' || c == '$' || c >= 0x80;
}

[[nodiscard]] bool is_identifier_part(unsigned char c) noexcept
{
    return is_identifier_start(c) || std::isdigit(c) != 0;
}

void append_utf8(std::string& out, std::uint32_t cp)
{
    if (cp < 0x80) {
        out += static_cast<char>(cp);
    } else if (cp < 0x800) {
        out += static_cast<char>(0xC0 | (cp >> 6));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
        out += static_cast<char>(0xE0 | (cp >> 12));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
        out += static_cast<char>(0xF0 | (cp >> 18));
        out += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
        out += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
        out += static_cast<char>(0x80 | (cp & 0x3F));
    }
}

class Lexer
{
public:
    Lexer(std::string_view source,
          std::size_t begin,
          std::size_t end,
          std::uint32_t line,
          std::uint32_t column)
        : m_src(source)
        , m_pos(begin)
        , m_end(end)
        , m_line(line)
        , m_column(column)
    {}

    secbox::Result<std::vector<Token>> run()
    {
        if (m_src.substr(m_pos).starts_with("#!")) {
            while (m_pos < m_end && m_src[m_pos] != '\n') {
                advance();
            }
        }
        while (true) {
            bool newline = false;
            if (auto skipped = skip_trivia(newline); !skipped) {
                return std::unexpected(skipped.error());
            }
            if (m_pos >= m_end) {
                Token end_token{.kind = TokenKind::kEnd,
                                .text = {},
                                .line = m_line,
                                .column = m_column,
                                .begin = m_pos,
                                .end = m_pos,
                                .newline_before = true,
                                .substitutions = {}};
                m_tokens.push_back(std::move(end_token));
                return std::move(m_tokens);
            }
            auto token = next_token();
            if (!token) {
                return std::unexpected(token.error());
            }
            token->newline_before = newline;
            m_tokens.push_back(std::move(*token));
        }
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

    [[nodiscard]] secbox::Error error_here(std::string_view what) const
    {
        return Error::make("LexError",
                           std::format("{} ({}:{})", what, m_line, m_column));
    }

    secbox::VoidResult skip_trivia(bool& newline)
    {
        while (m_pos < m_end) {
            const char c = peek();
            if (c == '\n') {
                newline = true;
                advance();
            } else if (c == ' ' || c == '\t' || c == '\r' || c == '\v' || c == '\f') {
                advance();
            } else if (c == '/' && peek(1) == '/') {
                while (m_pos < m_end && peek() != '\n') {
                    advance();
                }
            } else if (c == '/' && peek(1) == '*') {
                const auto line = m_line;
                const auto column = m_column;
                advance();
                advance();
                while (m_pos < m_end && !(peek() == '*' && peek(1) == '/')) {
                    if (peek() == '\n') {
                        newline = true;
                    }
                    advance();
                }
                if (m_pos >= m_end) {
                    return std::unexpected(Error::make(
                        "LexError", std::format("Unterminated comment ({}:{})", line, column)));
                }
                advance();
                advance();
            } else {
                break;
            }
        }
        return {};
    }

    [[nodiscard]] bool regex_allowed() const noexcept
    {
        if (m_tokens.empty()) {
            return true;
        }
        const Token& prev = m_tokens.back();
        switch (prev.kind) {
            case TokenKind::kIdentifier:
                return std::ranges::find(kRegexAfterKeywords, prev.text)
                       != kRegexAfterKeywords.end();
            case TokenKind::kPunctuator:
                return prev.text != ")" && prev.text != "]" && prev.text != "}"
                       && prev.text != "++" && prev.text != "--";
            case TokenKind::kPrivateName:
            case TokenKind::kNumber:
            case TokenKind::kString:
            case TokenKind::kTemplate:
            case TokenKind::kRegex:
            case TokenKind::kEnd:
                return false;
        }
        return false;
    }

    [[nodiscard]] Token start_token(TokenKind kind) const
    {
        return Token{.kind = kind,
                     .text = {},
                     .line = m_line,
                     .column = m_column,
                     .begin = m_pos,
                     .end = m_pos,
                     .newline_before = false,
                     .substitutions = {}};
    }

    secbox::Result<Token> next_token()
    {
        const auto c = static_cast<unsigned char>(peek());
        if (is_identifier_start(c) || c == '\\') {
            return scan_identifier(TokenKind::kIdentifier);
        }
        if (c == '#') {
            advance();
            return scan_identifier(TokenKind::kPrivateName);
        }
        if (std::isdigit(c) != 0 || (c == '.' && std::isdigit(static_cast<unsigned char>(peek(1))) != 0)) {
            return scan_number();
        }
        if (c == '"' || c == '\'') {
            return scan_string();
        }
        if (c == '`') {
            return scan_template();
        }
        if (c == '/' && regex_allowed()) {
            return scan_regex();
        }
        return scan_punctuator();
    }

    secbox::Result<Token> scan_identifier(TokenKind kind)
    {
        Token token = start_token(kind);
        if (kind == TokenKind::kPrivateName) {
            token.begin = m_pos - 1;
            token.column = m_column - 1;
            token.text = "#";
        }
        while (m_pos < m_end) {
            const auto c = static_cast<unsigned char>(peek());
            if (c == '\\' && peek(1) == 'u') {
                // Unicode escapes spell ordinary identifiers (`eval` is `eval`)
                advance();
                advance();
                auto cp = scan_unicode_escape();
                if (!cp) {
                    return std::unexpected(cp.error());
                }
                append_utf8(token.text, *cp);
                continue;
            }
            if (!is_identifier_part(c)) {
                break;
            }
            token.text += static_cast<char>(c);
            advance();
        }
        if (token.text.empty() || token.text == "#") {
            return std::unexpected(error_here("Unexpected character"));
        }
        token.end = m_pos;
        return token;
    }

    /// After `\u`: `XXXX` or `{X...}`
    secbox::Result<std::uint32_t> scan_unicode_escape()
    {
        std::uint32_t cp = 0;
        if (peek() == '{') {
            advance();
            std::size_t digits = 0;
            while (m_pos < m_end && std::isxdigit(static_cast<unsigned char>(peek())) != 0) {
                cp = cp * 16 + static_cast<std::uint32_t>(hex_value(peek()));
                advance();
                ++digits;
            }
            if (peek() != '}' || digits == 0 || cp > 0x10FFFF) {
                return std::unexpected(error_here("Invalid Unicode escape sequence"));
            }
            advance();
            return cp;
        }
        for (int i = 0; i < 4; ++i) {
            if (std::isxdigit(static_cast<unsigned char>(peek())) == 0) {
                return std::unexpected(error_here("Invalid Unicode escape sequence"));
            }
            cp = cp * 16 + static_cast<std::uint32_t>(hex_value(peek()));
            advance();
        }
        return cp;
    }

    [[nodiscard]] static int hex_value(char c) noexcept
    {
        if (c >= '0' && c <= '9') {
            return c - '0';
        }
        return (std::tolower(static_cast<unsigned char>(c)) - 'a') + 10;
    }

    secbox::Result<Token> scan_number()
    {
        Token token = start_token(TokenKind::kNumber);
        const auto start = m_pos;
        const bool radix = peek() == '0' && std::string_view("xXoObB").contains(peek(1));
        if (radix) {
            advance();
            advance();
            while (m_pos < m_end
                   && (std::isxdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
                advance();
            }
        } else {
            auto digits = [this] {
                while (m_pos < m_end
                       && (std::isdigit(static_cast<unsigned char>(peek())) != 0 || peek() == '_')) {
                    advance();
                }
            };
            digits();
            if (peek() == '.') {
                advance();
                digits();
            }
            if ((peek() == 'e' || peek() == 'E')
                && (std::isdigit(static_cast<unsigned char>(peek(1))) != 0
                    || ((peek(1) == '+' || peek(1) == '-')
                        && std::isdigit(static_cast<unsigned char>(peek(2))) != 0))) {
                advance();
                advance();
                digits();
            }
        }
        if (peek() == 'n') {
            advance();
        }
        if (is_identifier_start(static_cast<unsigned char>(peek()))) {
            return std::unexpected(error_here("Identifier directly after number"));
        }
        token.text = std::string(m_src.substr(start, m_pos - start));
        token.end = m_pos;
        return token;
    }

    /// Decode one escape after the backslash; appends to `out`
    secbox::VoidResult scan_escape(std::string& out)
    {
        const char c = peek();
        switch (c) {
            case 'n':
                out += '\n';
                break;
            case 't':
                out += '\t';
                break;
            case 'r':
                out += '\r';
                break;
            case 'b':
                out += '\b';
                break;
            case 'f':
                out += '\f';
                break;
            case 'v':
                out += '\v';
                break;
            case '0':
                out += '\0';
                break;
            case '\r':
                advance();
                if (peek() == '\n') {
                    advance();
                }
                return {};
            case '\n':
                break;
            case 'x': {
                advance();
                if (std::isxdigit(static_cast<unsigned char>(peek())) == 0
                    || std::isxdigit(static_cast<unsigned char>(peek(1))) == 0) {
                    return std::unexpected(error_here("Invalid hexadecimal escape sequence"));
                }
                append_utf8(out, static_cast<std::uint32_t>(hex_value(peek()) * 16 + hex_value(peek(1))));
                advance();
                advance();
                return {};
            }
            case 'u': {
                advance();
                auto cp = scan_unicode_escape();
                if (!cp) {
                    return std::unexpected(cp.error());
                }
                append_utf8(out, *cp);
                return {};
            }
            default:
                out += c;
                break;
        }
        advance();
        return {};
    }

    secbox::Result<Token> scan_string()
    {
        Token token = start_token(TokenKind::kString);
        const char quote = peek();
        advance();
        while (true) {
            if (m_pos >= m_end || peek() == '\n') {
                return std::unexpected(Error::make(
                    "LexError",
                    std::format("Unterminated string constant ({}:{})", token.line, token.column)));
            }
            const char c = peek();
            if (c == quote) {
                advance();
                break;
            }
            if (c == '\\') {
                advance();
                if (m_pos >= m_end) {
                    continue;
                }
                if (auto escaped = scan_escape(token.text); !escaped) {
                    return std::unexpected(escaped.error());
                }
                continue;
            }
            token.text += c;
            advance();
        }
        token.end = m_pos;
        return token;
    }

    /// Skip a `${ ... }` body; on return m_pos is at the closing `}`
    secbox::VoidResult skip_substitution()
    {
        int depth = 1;
        while (m_pos < m_end) {
            const char c = peek();
            if (c == '\'' || c == '"') {
                auto skipped = scan_string();
                if (!skipped) {
                    return std::unexpected(skipped.error());
                }
                continue;
            }
            if (c == '`') {
                auto skipped = scan_template();
                if (!skipped) {
                    return std::unexpected(skipped.error());
                }
                continue;
            }
            if (c == '/' && (peek(1) == '/' || peek(1) == '*')) {
                bool ignored = false;
                if (auto trivia = skip_trivia(ignored); !trivia) {
                    return trivia;
                }
                continue;
            }
            if (c == '{') {
                ++depth;
            } else if (c == '}') {
                if (--depth == 0) {
                    return {};
                }
            }
            advance();
        }
        return std::unexpected(error_here("Unterminated template"));
    }

    secbox::Result<Token> scan_template()
    {
        Token token = start_token(TokenKind::kTemplate);
        advance();
        while (true) {
            if (m_pos >= m_end) {
                return std::unexpected(Error::make(
                    "LexError",
                    std::format("Unterminated template ({}:{})", token.line, token.column)));
            }
            const char c = peek();
            if (c == '`') {
                advance();
                break;
            }
            if (c == '\\') {
                advance();
                if (m_pos < m_end) {
                    advance();
                }
                continue;
            }
            if (c == '$' && peek(1) == '{') {
                advance();
                advance();
                TemplateSubstitution sub{.begin = m_pos, .end = m_pos, .line = m_line, .column = m_column};
                if (auto skipped = skip_substitution(); !skipped) {
                    return std::unexpected(skipped.error());
                }
                sub.end = m_pos;
                token.substitutions.push_back(sub);
                advance();
                continue;
            }
            advance();
        }
        token.end = m_pos;
        token.text = std::string(m_src.substr(token.begin, token.end - token.begin));
        return token;
    }

    secbox::Result<Token> scan_regex()
    {
        Token token = start_token(TokenKind::kRegex);
        advance();
        bool in_class = false;
        while (true) {
            if (m_pos >= m_end || peek() == '\n') {
                return std::unexpected(Error::make(
                    "LexError", std::format("Unterminated regular expression ({}:{})", token.line,
                                            token.column)));
            }
            const char c = peek();
            if (c == '\\') {
                advance();
                if (m_pos < m_end && peek() != '\n') {
                    advance();
                }
                continue;
            }
            if (c == '[') {
                in_class = true;
            } else if (c == ']') {
                in_class = false;
            } else if (c == '/' && !in_class) {
                advance();
                break;
            }
            advance();
        }
        while (m_pos < m_end && is_identifier_part(static_cast<unsigned char>(peek()))) {
            advance();
        }
        token.end = m_pos;
        token.text = std::string(m_src.substr(token.begin, token.end - token.begin));
        return token;
    }

    secbox::Result<Token> scan_punctuator()
    {
        Token token = start_token(TokenKind::kPunctuator);
        const auto rest = m_src.substr(m_pos, m_end - m_pos);
        for (auto punct : kPunctuators) {
            if (!rest.starts_with(punct)) {
                continue;
            }
            // `?.5` is a conditional followed by a number
            if (punct == "?." && rest.size() > 2
                && std::isdigit(static_cast<unsigned char>(rest[2])) != 0) {
                continue;
            }
            token.text = std::string(punct);
            break;
        }
        if (token.text.empty() && kSingleExtra.contains(rest.front())) {
            token.text = std::string(1, rest.front());
        }
        if (token.text.empty()) {
            return std::unexpected(error_here(
                std::format("Unexpected character '{}'", rest.front())));
        }
        for (std::size_t i = 0; i < token.text.size(); ++i) {
            advance();
        }
        token.end = m_pos;
        return token;
    }

    std::string_view m_src;
    std::size_t m_pos;
    std::size_t m_end;
    std::uint32_t m_line;
    std::uint32_t m_column;
    std::vector<Token> m_tokens;
};

}  // namespace

secbox::Result<std::vector<Token>> tokenize(std::string_view source,
                                            std::size_t begin,
                                            std::size_t end,
                                            std::uint32_t line,
                                            std::uint32_t column)
{
    return Lexer(source, begin, std::min(end, source.size()), line, column).run();
}

bool is_reserved_word(std::string_view word) noexcept
{
    return std::ranges::find(kReservedWords, word) != kReservedWords.end();
}

}  // namespace secbox::analyzer::js
