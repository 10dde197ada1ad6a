/**
 * @file line_scanner.cpp
 * @brief Line-oriented Python fallback scanner
 */

#include "line_scanner.hpp"

#include "py_lexer.hpp"

#include <algorithm>
#include <cctype>
#include <format>
#include <iterator>
#include <regex>
#include <string>
#include <utility>
#include <vector>

namespace secbox::analyzer::py {

namespace {

using ast::LiteralKind;
using ast::Node;
using ast::NodeKind;
using NodePtr = std::unique_ptr<Node>;

/// One logical line: physical lines joined by open brackets or backslashes
struct LogicalLine
{
    std::size_t begin = 0;
    std::size_t end = 0;
    int indent = 0;
};

/**
 * Copy of the source with comment and string-literal contents blanked out.
 * Offsets, lines and quotes are preserved so positions map back 1:1.
 */
secbox::Result<std::string> blank_strings_and_comments(std::string_view source)
{
    std::string out(source);
    std::size_t i = 0;
    while (i < out.size()) {
        const char c = out[i];
        if (c == '#') {
            while (i < out.size() && out[i] != '\n') {
                out[i++] = ' ';
            }
            continue;
        }
        if (c != '\'' && c != '"') {
            ++i;
            continue;
        }
        const bool triple = i + 2 < out.size() && out[i + 1] == c && out[i + 2] == c;
        const std::size_t quote_len = triple ? 3 : 1;
        const std::size_t start = i;
        i += quote_len;
        bool closed = false;
        while (i < out.size()) {
            if (out[i] == '\\' && i + 1 < out.size()) {
                out[i] = ' ';
                if (out[i + 1] != '\n') {
                    out[i + 1] = ' ';
                }
                i += 2;
                continue;
            }
            if (!triple && out[i] == '\n') {
                break;
            }
            if (out[i] == c && (!triple || (i + 2 < out.size() && out[i + 1] == c && out[i + 2] == c))) {
                i += quote_len;
                closed = true;
                break;
            }
            if (out[i] != '\n') {
                out[i] = ' ';
            }
            ++i;
        }
        if (!closed && triple) {
            const auto line = 1 + std::ranges::count(source.substr(0, start), '\n');
            return std::unexpected(Error::make(
                "SyntaxError", std::format("unterminated triple-quoted string literal (line {})", line)));
        }
    }
    return out;
}

[[nodiscard]] std::vector<std::string> bracket_mismatches(std::string_view text)
{
    std::vector<std::string> errors;
    if (std::ranges::count(text, '(') != std::ranges::count(text, ')')) {
        errors.emplace_back("Mismatched parentheses");
    }
    if (std::ranges::count(text, '[') != std::ranges::count(text, ']')) {
        errors.emplace_back("Mismatched brackets");
    }
    if (std::ranges::count(text, '{') != std::ranges::count(text, '}')) {
        errors.emplace_back("Mismatched braces");
    }
    return errors;
}

[[nodiscard]] std::vector<LogicalLine> split_logical_lines(std::string_view text)
{
    std::vector<LogicalLine> lines;
    std::size_t pos = 0;
    while (pos < text.size()) {
        LogicalLine line{.begin = pos, .end = pos, .indent = 0};
        while (pos < text.size() && (text[pos] == ' ' || text[pos] == '\t')) {
            line.indent += text[pos] == '\t' ? 8 - (line.indent % 8) : 1;
            ++pos;
        }
        int depth = 0;
        while (pos < text.size()) {
            const char c = text[pos];
            if (c == '(' || c == '[' || c == '{') {
                ++depth;
            } else if ((c == ')' || c == ']' || c == '}') && depth > 0) {
                --depth;
            } else if (c == '\n') {
                const bool continued = depth > 0 || (pos > 0 && text[pos - 1] == '\\');
                if (!continued) {
                    break;
                }
            }
            ++pos;
        }
        line.end = pos;
        if (pos < text.size()) {
            ++pos;
        }
        const auto body = text.substr(line.begin, line.end - line.begin);
        if (body.find_first_not_of(" \t\r\n\\") != std::string_view::npos) {
            lines.push_back(line);
        }
    }
    return lines;
}

class LineIndex
{
public:
    explicit LineIndex(std::string_view text)
    {
        m_starts.push_back(0);
        for (std::size_t i = 0; i < text.size(); ++i) {
            if (text[i] == '\n') {
                m_starts.push_back(i + 1);
            }
        }
    }

    [[nodiscard]] ast::SourceLocation locate(std::size_t offset) const
    {
        const auto it = std::ranges::upper_bound(m_starts, offset);
        const auto index = static_cast<std::size_t>(std::distance(m_starts.begin(), it)) - 1;
        return ast::SourceLocation{.line = static_cast<std::uint32_t>(index + 1),
                                   .column = static_cast<std::uint32_t>(offset - m_starts[index]),
                                   .offset = offset};
    }

private:
    std::vector<std::size_t> m_starts;
};

[[nodiscard]] std::string_view trim(std::string_view text) noexcept
{
    const auto first = text.find_first_not_of(" \t\r\n");
    if (first == std::string_view::npos) {
        return {};
    }
    const auto last = text.find_last_not_of(" \t\r\n");
    return text.substr(first, last - first + 1);
}

[[nodiscard]] bool starts_with_word(std::string_view text, std::string_view word) noexcept
{
    return text.starts_with(word)
           && (text.size() == word.size()
               || !(std::isalnum(static_cast<unsigned char>(text[word.size()])) != 0
                    || text[word.size()] == '_'));
}

/// Number of top-level arguments between `open` (a '(') and its closing paren
[[nodiscard]] std::uint32_t count_arguments(std::string_view text, std::size_t open) noexcept
{
    int depth = 0;
    std::uint32_t commas = 0;
    bool any = false;
    for (std::size_t i = open; i < text.size(); ++i) {
        const char c = text[i];
        if (c == '(' || c == '[' || c == '{') {
            ++depth;
            if (depth == 1) {
                continue;
            }
        } else if (c == ')' || c == ']' || c == '}') {
            if (--depth == 0) {
                break;
            }
        } else if (depth == 1 && c == ',') {
            ++commas;
            continue;
        }
        if (depth >= 1 && std::isspace(static_cast<unsigned char>(c)) == 0) {
            any = true;
        }
    }
    return any ? commas + 1 : 0;
}

NodePtr make_callee(std::string_view dotted, const ast::SourceLocation& location)
{
    NodePtr callee;
    std::size_t pos = 0;
    while (pos <= dotted.size()) {
        const auto dot = dotted.find('.', pos);
        const auto part = trim(dotted.substr(pos, dot == std::string_view::npos ? dotted.npos : dot - pos));
        if (!callee) {
            callee = Node::make(NodeKind::kIdentifier, location);
        } else {
            auto member = Node::make(NodeKind::kMember, location);
            member->add(std::move(callee));
            callee = std::move(member);
        }
        callee->name = part;
        if (dot == std::string_view::npos) {
            break;
        }
        pos = dot + 1;
    }
    return callee;
}

NodePtr make_loop_test(std::string_view condition, const ast::SourceLocation& location)
{
    auto test = Node::make(NodeKind::kLiteral, location);
    test->text = condition;
    if (condition == "True" || condition == "False") {
        test->literal = LiteralKind::kBoolean;
    } else if (!condition.empty()
               && std::ranges::all_of(condition, [](char c) {
                      return std::isdigit(static_cast<unsigned char>(c)) != 0 || c == '.' || c == '_';
                  })) {
        test->literal = LiteralKind::kNumber;
    } else {
        test->kind = NodeKind::kOther;
    }
    return test;
}

void add_imports(Node& import, std::string_view clause, const ast::SourceLocation& location)
{
    std::size_t pos = 0;
    while (pos <= clause.size()) {
        const auto comma = clause.find(',', pos);
        auto part = trim(clause.substr(pos, comma == std::string_view::npos ? clause.npos : comma - pos));
        if (const auto alias = part.find(" as "); alias != std::string_view::npos) {
            part = trim(part.substr(0, alias));
        }
        if (!part.empty()) {
            auto literal = Node::make(NodeKind::kLiteral, location);
            literal->literal = LiteralKind::kString;
            literal->text = part;
            if (import.name.empty()) {
                import.name = part;
            }
            import.add(std::move(literal));
        }
        if (comma == std::string_view::npos) {
            break;
        }
        pos = comma + 1;
    }
}

/// Statement node for one logical line, judged by its prefix
NodePtr classify(std::string_view statement, const ast::SourceLocation& location)
{
    std::string_view rest = statement;
    if (starts_with_word(rest, "async")) {
        rest = trim(rest.substr(5));
    }
    auto name_after = [](std::string_view text, std::size_t skip) {
        text = trim(text.substr(skip));
        const auto end = std::ranges::find_if(text, [](char c) {
            return !(std::isalnum(static_cast<unsigned char>(c)) != 0 || c == '_');
        });
        return std::string(text.begin(), end);
    };

    if (starts_with_word(rest, "def")) {
        auto node = Node::make(NodeKind::kFunctionDecl, location);
        node->name = name_after(rest, 3);
        return node;
    }
    if (starts_with_word(rest, "class")) {
        auto node = Node::make(NodeKind::kClassDecl, location);
        node->name = name_after(rest, 5);
        return node;
    }
    if (starts_with_word(rest, "import")) {
        auto node = Node::make(NodeKind::kImport, location);
        add_imports(*node, rest.substr(6), location);
        return node;
    }
    if (starts_with_word(rest, "from")) {
        auto node = Node::make(NodeKind::kImport, location);
        const auto import_at = rest.find(" import");
        add_imports(*node, trim(rest.substr(4, import_at == std::string_view::npos ? rest.npos : import_at - 4)),
                    location);
        return node;
    }
    if (starts_with_word(rest, "for")) {
        return Node::make(NodeKind::kForIn, location);
    }
    if (starts_with_word(rest, "while")) {
        auto node = Node::make(NodeKind::kWhile, location);
        auto condition = trim(rest.substr(5));
        if (condition.ends_with(':')) {
            condition.remove_suffix(1);
        }
        condition = trim(condition);
        if (condition.starts_with('(') && condition.ends_with(')')) {
            condition = trim(condition.substr(1, condition.size() - 2));
        }
        node->test = make_loop_test(condition, location);
        return node;
    }
    if (starts_with_word(rest, "break")) {
        return Node::make(NodeKind::kBreak, location);
    }
    if (starts_with_word(rest, "continue")) {
        return Node::make(NodeKind::kContinue, location);
    }
    if (statement.ends_with(':')) {
        return Node::make(NodeKind::kBlock, location);
    }
    return Node::make(NodeKind::kExprStmt, location);
}

}  // namespace

secbox::Result<std::unique_ptr<ast::Node>> scan_lines(std::string_view source)
{
    auto blanked = blank_strings_and_comments(source);
    if (!blanked) {
        return std::unexpected(blanked.error());
    }
    const std::string& text = *blanked;
    if (auto mismatches = bracket_mismatches(text); !mismatches.empty()) {
        std::string message;
        for (const auto& mismatch : mismatches) {
            message += message.empty() ? mismatch : "; " + mismatch;
        }
        return std::unexpected(Error::make("SyntaxError", std::move(message)));
    }

    static const std::regex kCallPattern(
        R"(([A-Za-z_][A-Za-z0-9_]*(?:\s*\.\s*[A-Za-z_][A-Za-z0-9_]*)*)\s*\()");

    const LineIndex index(text);
    auto program = Node::make(NodeKind::kProgram, ast::SourceLocation{});

    struct Scope
    {
        int indent;
        Node* container;
    };
    std::vector<Scope> scopes{{.indent = -1, .container = program.get()}};

    for (const auto& line : split_logical_lines(text)) {
        const std::string_view body(text.data() + line.begin, line.end - line.begin);
        const auto statement = trim(body);
        const auto location = index.locate(line.begin + body.find_first_not_of(" \t\r\n"));

        while (scopes.size() > 1 && line.indent <= scopes.back().indent) {
            scopes.pop_back();
        }
        auto node = classify(statement, location);

        const bool declaration = node->kind == NodeKind::kFunctionDecl || node->kind == NodeKind::kClassDecl;
        for (auto it = std::cregex_iterator(body.data(), body.data() + body.size(), kCallPattern);
             it != std::cregex_iterator(); ++it) {
            const auto& match = *it;
            const std::string_view dotted(match[1].first, static_cast<std::size_t>(match[1].length()));
            const auto last_dot = dotted.rfind('.');
            const auto callee_name = std::string(trim(last_dot == std::string_view::npos ? dotted : dotted.substr(last_dot + 1)));
            if (is_keyword(dotted) || (declaration && callee_name == node->name)) {
                continue;
            }
            const auto offset = line.begin + static_cast<std::size_t>(match.position(0));
            const auto call_location = index.locate(offset);
            auto call = Node::make(NodeKind::kCall, call_location);
            call->name = callee_name;
            call->add(make_callee(dotted, call_location));
            call->argument_count = count_arguments(body, static_cast<std::size_t>(match.position(0) + match.length(0) - 1));
            node->add(std::move(call));
        }

        Node* raw = node.get();
        const bool opens_block = statement.ends_with(':');
        scopes.back().container->add(std::move(node));
        if (opens_block) {
            scopes.push_back(Scope{.indent = line.indent, .container = raw});
        }
    }
    return program;
}

}  // namespace secbox::analyzer::py
