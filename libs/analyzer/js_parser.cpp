/**
 * @file js_parser.cpp
 * @brief JavaScript/TypeScript parser
 *
 * Failure model: a failed production records the first error, sets m_failed
 * and returns nullptr; every caller checks m_failed before going on. The
 * tolerant mode clears the failure at the nearest statement list and skips to
 * the next statement boundary.
 *
 * TypeScript syntax is parsed and skipped; the byte ranges it covered are
 * recorded so the engine can blank them out and run the rest as JavaScript.
 */

#include "js_parser.hpp"

#include "js_lexer.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>

namespace secbox::analyzer::js {

namespace {

using ast::LiteralKind;
using ast::Node;
using ast::NodeKind;
using NodePtr = std::unique_ptr<Node>;

constexpr int kMaxDepth = 256;

constexpr std::array<std::string_view, 16> kAssignmentOperators = {
    "=",  "+=",  "-=",   "*=",  "/=",  "%=",  "**=", "<<=",
    ">>=", ">>>=", "&=", "|=",  "^=",  "&&=", "||=", "??="};

constexpr std::array<std::string_view, 7> kTsParameterModifiers = {
    "public", "private", "protected", "readonly", "override", "declare", "abstract"};

constexpr std::array<std::string_view, 12> kClassModifiers = {
    "static",   "public",   "private", "protected", "readonly", "abstract",
    "override", "declare",  "accessor", "async",    "get",      "set"};

[[nodiscard]] int binary_precedence(const Token& token, bool no_in) noexcept
{
    if (token.kind == TokenKind::kIdentifier) {
        if (token.text == "instanceof" || (token.text == "in" && !no_in)) {
            return 8;
        }
        return 0;
    }
    if (token.kind != TokenKind::kPunctuator) {
        return 0;
    }
    const std::string_view op = token.text;
    if (op == "??") {
        return 1;
    }
    if (op == "||") {
        return 2;
    }
    if (op == "&&") {
        return 3;
    }
    if (op == "|") {
        return 4;
    }
    if (op == "^") {
        return 5;
    }
    if (op == "&") {
        return 6;
    }
    if (op == "==" || op == "!=" || op == "===" || op == "!==") {
        return 7;
    }
    if (op == "<" || op == ">" || op == "<=" || op == ">=") {
        return 8;
    }
    if (op == "<<" || op == ">>" || op == ">>>") {
        return 9;
    }
    if (op == "+" || op == "-") {
        return 10;
    }
    if (op == "*" || op == "/" || op == "%") {
        return 11;
    }
    if (op == "**") {
        return 12;
    }
    return 0;
}

[[nodiscard]] std::string callee_name(const Node& callee)
{
    if (callee.kind == NodeKind::kIdentifier || callee.kind == NodeKind::kMember) {
        return callee.name;
    }
    return {};
}

[[nodiscard]] ast::SourceLocation location_of(const Token& token) noexcept
{
    return ast::SourceLocation{.line = token.line, .column = token.column, .offset = token.begin};
}

/// Check bracket nesting over the whole token stream
[[nodiscard]] secbox::VoidResult check_brackets(const std::vector<Token>& tokens)
{
    std::vector<const Token*> open;
    for (const auto& token : tokens) {
        if (token.kind != TokenKind::kPunctuator) {
            continue;
        }
        if (token.text == "(" || token.text == "[" || token.text == "{") {
            open.push_back(&token);
            continue;
        }
        if (token.text != ")" && token.text != "]" && token.text != "}") {
            continue;
        }
        const char expected = token.text == ")" ? '(' : token.text == "]" ? '[' : '{';
        if (open.empty() || open.back()->text.front() != expected) {
            return std::unexpected(Error::make(
                "SyntaxError",
                std::format("Unbalanced bracket '{}' ({}:{})", token.text, token.line, token.column)));
        }
        open.pop_back();
    }
    if (!open.empty()) {
        return std::unexpected(Error::make(
            "SyntaxError", std::format("Unclosed bracket '{}' ({}:{})", open.back()->text,
                                       open.back()->line, open.back()->column)));
    }
    return {};
}

enum class ListEnd {
    kEof,
    kBrace,
    kCaseClause
};

class Parser
{
public:
    Parser(std::string_view source, std::vector<Token> tokens, bool typescript, bool tolerant, int depth)
        : m_source(source)
        , m_tokens(std::move(tokens))
        , m_typescript(typescript)
        , m_tolerant(tolerant)
        , m_depth(depth)
    {}

    NodePtr parse_program()
    {
        auto program = Node::make(NodeKind::kProgram, location_of(cur()));
        parse_statement_list(*program, ListEnd::kEof);
        return program;
    }

    NodePtr parse_standalone_expression()
    {
        auto expr = parse_expression();
        if (!m_failed && !at_end()) {
            fail("Unexpected token");
        }
        return expr;
    }

    [[nodiscard]] bool failed() const noexcept { return m_failed; }
    [[nodiscard]] const std::string& error() const noexcept { return m_error; }
    std::vector<std::string>& recovered_errors() noexcept { return m_recovered; }
    std::vector<SourceRange>& type_ranges() noexcept { return m_type_ranges; }
    std::vector<std::string>& blockers() noexcept { return m_blockers; }

private:
    // ------------------------------------------------------------------
    // Token helpers
    // ------------------------------------------------------------------

    [[nodiscard]] const Token& cur() const noexcept { return m_tokens[m_index]; }

    [[nodiscard]] const Token& peek(std::size_t ahead = 1) const noexcept
    {
        return m_tokens[std::min(m_index + ahead, m_tokens.size() - 1)];
    }

    [[nodiscard]] bool at_end() const noexcept { return cur().kind == TokenKind::kEnd; }

    void next() noexcept
    {
        if (!at_end()) {
            ++m_index;
        }
    }

    [[nodiscard]] std::size_t prev_end() const noexcept
    {
        return m_index == 0 ? cur().begin : m_tokens[m_index - 1].end;
    }

    bool eat_punct(std::string_view text)
    {
        if (cur().is_punct(text)) {
            next();
            return true;
        }
        return false;
    }

    bool eat_word(std::string_view text)
    {
        if (cur().is_word(text)) {
            next();
            return true;
        }
        return false;
    }

    bool expect_punct(std::string_view text)
    {
        if (eat_punct(text)) {
            return true;
        }
        fail(std::format("Unexpected token, expected \"{}\"", text));
        return false;
    }

    void fail(std::string_view message)
    {
        if (m_failed) {
            return;
        }
        m_failed = true;
        const Token& token = cur();
        m_error = std::format("{} ({}:{})", message, token.line, token.column);
    }

    void record_type_range(std::size_t begin, std::size_t end)
    {
        if (end > begin) {
            m_type_ranges.push_back(SourceRange{.begin = begin, .end = end});
        }
    }

    void add_blocker(std::string_view what, const Token& at)
    {
        m_blockers.push_back(std::format("{} (line {})", what, at.line));
    }

    [[nodiscard]] bool is_identifier_token(const Token& token) const noexcept
    {
        return token.kind == TokenKind::kIdentifier && !is_reserved_word(token.text);
    }

    /// Guards recursion; returns false (and fails) once nesting is too deep
    class DepthGuard
    {
    public:
        explicit DepthGuard(Parser& parser)
            : m_parser(parser)
        {
            if (++m_parser.m_depth > kMaxDepth) {
                m_parser.fail("Maximum nesting depth exceeded");
            }
        }
        ~DepthGuard() { --m_parser.m_depth; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& m_parser;
    };

    class NoInScope
    {
    public:
        NoInScope(Parser& parser, bool value)
            : m_parser(parser)
            , m_saved(parser.m_no_in)
        {
            m_parser.m_no_in = value;
        }
        ~NoInScope() { m_parser.m_no_in = m_saved; }
        NoInScope(const NoInScope&) = delete;
        NoInScope& operator=(const NoInScope&) = delete;

    private:
        Parser& m_parser;
        bool m_saved;
    };

    /// Run `attempt` and rewind when it fails or `accept` rejects the position
    template <typename Attempt, typename Accept>
    bool speculate(Attempt&& attempt, Accept&& accept)
    {
        const auto saved_index = m_index;
        const auto saved_ranges = m_type_ranges.size();
        attempt();
        if (!m_failed && accept()) {
            return true;
        }
        m_failed = false;
        m_error.clear();
        m_index = saved_index;
        m_type_ranges.resize(saved_ranges);
        return false;
    }

    // ------------------------------------------------------------------
    // Statements
    // ------------------------------------------------------------------

    [[nodiscard]] bool at_list_end(ListEnd end) const noexcept
    {
        if (at_end()) {
            return true;
        }
        switch (end) {
            case ListEnd::kEof:
                return false;
            case ListEnd::kBrace:
                return cur().is_punct("}");
            case ListEnd::kCaseClause:
                return cur().is_punct("}") || cur().is_word("case") || cur().is_word("default");
        }
        return false;
    }

    void parse_statement_list(Node& parent, ListEnd end)
    {
        while (!at_list_end(end)) {
            const auto start = m_index;
            auto statement = parse_statement();
            if (m_failed) {
                if (!m_tolerant) {
                    return;
                }
                recover(start);
                continue;
            }
            parent.add(std::move(statement));
        }
    }

    /// Skip to the next statement boundary after a recorded error
    void recover(std::size_t start)
    {
        m_recovered.push_back(m_error);
        m_failed = false;
        m_error.clear();
        if (m_index == start) {
            next();
        }
        int depth = 0;
        while (!at_end()) {
            const Token& token = cur();
            if (depth == 0) {
                if (token.is_punct(";")) {
                    next();
                    return;
                }
                if (token.is_punct("}") || (token.newline_before && m_index > start)) {
                    return;
                }
            }
            if (token.is_punct("{") || token.is_punct("(") || token.is_punct("[")) {
                ++depth;
            } else if ((token.is_punct("}") || token.is_punct(")") || token.is_punct("]"))
                       && depth > 0) {
                --depth;
            }
            next();
        }
    }

    void consume_semicolon()
    {
        if (eat_punct(";")) {
            return;
        }
        if (cur().is_punct("}") || at_end() || cur().newline_before) {
            return;
        }
        fail("Missing semicolon");
    }

    NodePtr parse_statement()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        const Token& token = cur();
        if (token.kind == TokenKind::kPunctuator) {
            if (token.text == "{") {
                return parse_block();
            }
            if (token.text == ";") {
                auto empty = Node::make(NodeKind::kOther, location_of(token));
                next();
                return empty;
            }
            if (token.text == "@") {
                return parse_decorated();
            }
        }
        if (token.kind == TokenKind::kIdentifier) {
            if (auto statement = parse_keyword_statement(); statement || m_failed) {
                return statement;
            }
        }
        return parse_expression_statement();
    }

    /// Keyword-led statements; nullptr without failure means "not a keyword statement"
    NodePtr parse_keyword_statement()
    {
        const Token& token = cur();
        const std::string_view word = token.text;
        const Token& following = peek();

        if (word == "var" || (word == "const" && !following.is_word("enum"))) {
            return parse_variable_declaration(true);
        }
        if (word == "let"
            && (following.kind == TokenKind::kIdentifier || following.is_punct("[")
                || following.is_punct("{"))) {
            return parse_variable_declaration(true);
        }
        if (word == "function") {
            return parse_function(NodeKind::kFunctionDecl);
        }
        if (word == "async" && following.is_word("function") && !following.newline_before) {
            next();
            return parse_function(NodeKind::kFunctionDecl);
        }
        if (word == "class") {
            return parse_class(NodeKind::kClassDecl);
        }
        if (word == "if") {
            return parse_if();
        }
        if (word == "for") {
            return parse_for();
        }
        if (word == "while") {
            return parse_while();
        }
        if (word == "do") {
            return parse_do_while();
        }
        if (word == "return") {
            return parse_return();
        }
        if (word == "break" || word == "continue") {
            return parse_jump(word == "break" ? NodeKind::kBreak : NodeKind::kContinue);
        }
        if (word == "throw") {
            return parse_throw();
        }
        if (word == "try") {
            return parse_try();
        }
        if (word == "switch") {
            return parse_switch();
        }
        if (word == "with") {
            auto node = Node::make(NodeKind::kWith, location_of(token));
            next();
            if (!expect_punct("(")) {
                return nullptr;
            }
            node->test = parse_expression();
            if (m_failed || !expect_punct(")")) {
                return nullptr;
            }
            node->add(parse_statement());
            return m_failed ? nullptr : std::move(node);
        }
        if (word == "debugger") {
            auto node = Node::make(NodeKind::kOther, location_of(token));
            next();
            consume_semicolon();
            return m_failed ? nullptr : std::move(node);
        }
        if (word == "import" && !following.is_punct("(") && !following.is_punct(".")) {
            return parse_import();
        }
        if (word == "export") {
            return parse_export();
        }
        if (m_typescript) {
            if (auto declaration = parse_typescript_declaration(); declaration || m_failed) {
                return declaration;
            }
        }
        if (following.is_punct(":") && is_identifier_token(token)) {
            auto node = Node::make(NodeKind::kLabeled, location_of(token));
            node->name = token.text;
            next();
            next();
            node->add(parse_statement());
            return m_failed ? nullptr : std::move(node);
        }
        return nullptr;
    }

    NodePtr parse_expression_statement()
    {
        auto node = Node::make(NodeKind::kExprStmt, location_of(cur()));
        node->add(parse_expression());
        if (m_failed) {
            return nullptr;
        }
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_block()
    {
        auto block = Node::make(NodeKind::kBlock, location_of(cur()));
        if (!expect_punct("{")) {
            return nullptr;
        }
        parse_statement_list(*block, ListEnd::kBrace);
        if (m_failed || !expect_punct("}")) {
            return nullptr;
        }
        return block;
    }

    NodePtr parse_decorated()
    {
        const Token& at = cur();
        add_blocker("decorators", at);
        while (eat_punct("@")) {
            auto decorator = parse_call_member();
            if (m_failed) {
                return nullptr;
            }
        }
        return parse_statement();
    }

    NodePtr parse_variable_declaration(bool with_semicolon)
    {
        auto node = Node::make(NodeKind::kVarDecl, location_of(cur()));
        node->name = cur().text;
        next();
        do {
            node->add(parse_binding_target());
            if (m_failed) {
                return nullptr;
            }
            if (m_typescript && cur().is_punct("!")) {
                record_type_range(cur().begin, cur().end);
                next();
            }
            if (m_typescript && cur().is_punct(":")) {
                skip_type_annotation();
            }
            if (eat_punct("=")) {
                node->add(parse_assignment());
            }
            if (m_failed) {
                return nullptr;
            }
        } while (eat_punct(","));
        if (with_semicolon) {
            consume_semicolon();
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_binding_target()
    {
        const Token& token = cur();
        if (token.is_punct("[")) {
            return parse_array_literal();
        }
        if (token.is_punct("{")) {
            return parse_object_literal();
        }
        if (token.kind == TokenKind::kIdentifier && (!is_reserved_word(token.text) || token.text == "this")) {
            auto node = Node::make(NodeKind::kIdentifier, location_of(token));
            node->name = token.text;
            next();
            return node;
        }
        fail("Unexpected token");
        return nullptr;
    }

    NodePtr parse_if()
    {
        auto node = Node::make(NodeKind::kIf, location_of(cur()));
        next();
        if (!expect_punct("(")) {
            return nullptr;
        }
        node->test = parse_expression();
        if (m_failed || !expect_punct(")")) {
            return nullptr;
        }
        node->add(parse_statement());
        if (!m_failed && eat_word("else")) {
            node->add(parse_statement());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_while()
    {
        auto node = Node::make(NodeKind::kWhile, location_of(cur()));
        next();
        if (!expect_punct("(")) {
            return nullptr;
        }
        node->test = parse_expression();
        if (m_failed || !expect_punct(")")) {
            return nullptr;
        }
        node->add(parse_statement());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_do_while()
    {
        auto node = Node::make(NodeKind::kDoWhile, location_of(cur()));
        next();
        node->add(parse_statement());
        if (m_failed) {
            return nullptr;
        }
        if (!eat_word("while")) {
            fail("Unexpected token, expected \"while\"");
            return nullptr;
        }
        if (!expect_punct("(")) {
            return nullptr;
        }
        node->test = parse_expression();
        if (m_failed || !expect_punct(")")) {
            return nullptr;
        }
        eat_punct(";");
        return node;
    }

    NodePtr parse_for()
    {
        const Token& start = cur();
        next();
        eat_word("await");
        if (!expect_punct("(")) {
            return nullptr;
        }

        NodePtr init;
        if (!cur().is_punct(";")) {
            NoInScope no_in(*this, true);
            const bool declaration = cur().is_word("var") || cur().is_word("const")
                                     || (cur().is_word("let") && peek().kind != TokenKind::kPunctuator)
                                     || (cur().is_word("let") && (peek().is_punct("[") || peek().is_punct("{")));
            init = declaration ? parse_variable_declaration(false) : parse_expression();
            if (m_failed) {
                return nullptr;
            }
        }

        if (cur().is_word("of") || cur().is_word("in")) {
            const bool of = cur().is_word("of");
            next();
            auto node = Node::make(NodeKind::kForIn, location_of(start));
            node->add(std::move(init));
            node->add(of ? parse_assignment() : parse_expression());
            if (m_failed || !expect_punct(")")) {
                return nullptr;
            }
            node->add(parse_statement());
            return m_failed ? nullptr : std::move(node);
        }

        auto node = Node::make(NodeKind::kFor, location_of(start));
        if (!expect_punct(";")) {
            return nullptr;
        }
        if (!cur().is_punct(";")) {
            node->test = parse_expression();
        }
        if (m_failed || !expect_punct(";")) {
            return nullptr;
        }
        NodePtr update;
        if (!cur().is_punct(")")) {
            update = parse_expression();
        }
        if (m_failed || !expect_punct(")")) {
            return nullptr;
        }
        node->has_header = init != nullptr || node->test != nullptr || update != nullptr;
        node->add(std::move(init));
        node->add(std::move(update));
        node->add(parse_statement());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_return()
    {
        auto node = Node::make(NodeKind::kReturn, location_of(cur()));
        next();
        if (!cur().is_punct(";") && !cur().is_punct("}") && !at_end() && !cur().newline_before) {
            node->add(parse_expression());
        }
        if (m_failed) {
            return nullptr;
        }
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_jump(NodeKind kind)
    {
        auto node = Node::make(kind, location_of(cur()));
        next();
        if (is_identifier_token(cur()) && !cur().newline_before) {
            node->name = cur().text;
            next();
        }
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_throw()
    {
        auto node = Node::make(NodeKind::kThrow, location_of(cur()));
        next();
        if (cur().newline_before) {
            fail("Illegal newline after throw");
            return nullptr;
        }
        node->add(parse_expression());
        if (m_failed) {
            return nullptr;
        }
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_try()
    {
        auto node = Node::make(NodeKind::kTry, location_of(cur()));
        next();
        node->add(parse_block());
        if (m_failed) {
            return nullptr;
        }
        bool handled = false;
        if (eat_word("catch")) {
            handled = true;
            if (eat_punct("(")) {
                node->add(parse_binding_target());
                if (!m_failed && m_typescript && cur().is_punct(":")) {
                    skip_type_annotation();
                }
                if (m_failed || !expect_punct(")")) {
                    return nullptr;
                }
            }
            node->add(parse_block());
        }
        if (!m_failed && eat_word("finally")) {
            handled = true;
            node->add(parse_block());
        }
        if (!m_failed && !handled) {
            fail("Missing catch or finally clause");
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_switch()
    {
        auto node = Node::make(NodeKind::kSwitch, location_of(cur()));
        next();
        if (!expect_punct("(")) {
            return nullptr;
        }
        node->test = parse_expression();
        if (m_failed || !expect_punct(")") || !expect_punct("{")) {
            return nullptr;
        }
        while (!m_failed && !cur().is_punct("}") && !at_end()) {
            auto clause = Node::make(NodeKind::kBlock, location_of(cur()));
            if (eat_word("case")) {
                clause->test = parse_expression();
            } else if (!eat_word("default")) {
                fail("Unexpected token, expected \"case\"");
                return nullptr;
            }
            if (m_failed || !expect_punct(":")) {
                return nullptr;
            }
            parse_statement_list(*clause, ListEnd::kCaseClause);
            node->add(std::move(clause));
        }
        if (m_failed || !expect_punct("}")) {
            return nullptr;
        }
        return node;
    }

    NodePtr parse_import()
    {
        const Token& start = cur();
        next();

        if (m_typescript && cur().is_word("type")
            && (peek().is_punct("{") || peek().is_punct("*") || is_identifier_token(peek()))
            && !peek().is_word("from")) {
            skip_to_statement_end();
            record_type_range(start.begin, prev_end());
            return Node::make(NodeKind::kOther, location_of(start));
        }

        auto node = Node::make(NodeKind::kImport, location_of(start));
        std::string module;
        if (cur().kind == TokenKind::kString) {
            module = cur().text;
            next();
        } else {
            if (is_identifier_token(cur()) || cur().is_word("from")) {
                next();
                if (m_typescript && cur().is_punct("=")) {
                    return parse_import_equals(start);
                }
                eat_punct(",");
            }
            if (eat_punct("*")) {
                if (!eat_word("as") || !is_identifier_token(cur())) {
                    fail("Unexpected token");
                    return nullptr;
                }
                next();
            } else if (cur().is_punct("{")) {
                skip_balanced("{", "}");
            }
            if (m_failed) {
                return nullptr;
            }
            if (!eat_word("from") || cur().kind != TokenKind::kString) {
                fail("Unexpected token, expected \"from\"");
                return nullptr;
            }
            module = cur().text;
            next();
        }
        if ((cur().is_word("with") || cur().is_word("assert")) && peek().is_punct("{")
            && !cur().newline_before) {
            next();
            skip_balanced("{", "}");
        }
        consume_semicolon();
        if (m_failed) {
            return nullptr;
        }
        add_module(*node, module, start);
        return node;
    }

    /// TypeScript `import x = require("m")`
    NodePtr parse_import_equals(const Token& start)
    {
        add_blocker("import assignments", start);
        next();
        auto node = Node::make(NodeKind::kExprStmt, location_of(start));
        node->add(parse_assignment());
        if (m_failed) {
            return nullptr;
        }
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    void add_module(Node& import, const std::string& module, const Token& at)
    {
        auto literal = Node::make(NodeKind::kLiteral, location_of(at));
        literal->literal = LiteralKind::kString;
        literal->text = module;
        if (import.name.empty()) {
            import.name = module;
        }
        import.add(std::move(literal));
    }

    NodePtr parse_export()
    {
        const Token& start = cur();
        next();

        if (m_typescript && cur().is_word("type") && (peek().is_punct("{") || peek().is_punct("*"))) {
            skip_to_statement_end();
            record_type_range(start.begin, prev_end());
            return Node::make(NodeKind::kOther, location_of(start));
        }
        if (eat_word("default")) {
            if (cur().is_word("function")
                || (cur().is_word("async") && peek().is_word("function"))) {
                eat_word("async");
                return parse_function(NodeKind::kFunctionDecl);
            }
            if (cur().is_word("class")) {
                return parse_class(NodeKind::kClassDecl);
            }
            if (m_typescript && cur().is_word("interface")) {
                m_erasure_begin = start.begin;
                return parse_typescript_declaration();
            }
            auto node = Node::make(NodeKind::kExprStmt, location_of(start));
            node->add(parse_assignment());
            if (m_failed) {
                return nullptr;
            }
            consume_semicolon();
            return m_failed ? nullptr : std::move(node);
        }
        if (eat_punct("*")) {
            if (eat_word("as")) {
                next();
            }
            return parse_reexport(start);
        }
        if (cur().is_punct("{")) {
            skip_balanced("{", "}");
            if (m_failed) {
                return nullptr;
            }
            if (cur().is_word("from")) {
                return parse_reexport(start);
            }
            consume_semicolon();
            return m_failed ? nullptr : Node::make(NodeKind::kOther, location_of(start));
        }
        m_erasure_begin = start.begin;
        auto declaration = parse_statement();
        m_erasure_begin.reset();
        return declaration;
    }

    /// `export ... from "m"` loads the module like an import does
    NodePtr parse_reexport(const Token& start)
    {
        if (!eat_word("from") || cur().kind != TokenKind::kString) {
            fail("Unexpected token, expected \"from\"");
            return nullptr;
        }
        auto node = Node::make(NodeKind::kImport, location_of(start));
        add_module(*node, cur().text, start);
        next();
        consume_semicolon();
        return m_failed ? nullptr : std::move(node);
    }

    // ------------------------------------------------------------------
    // TypeScript declarations
    // ------------------------------------------------------------------

    [[nodiscard]] std::size_t take_erasure_begin(std::size_t fallback) noexcept
    {
        const auto begin = m_erasure_begin.value_or(fallback);
        m_erasure_begin.reset();
        return begin;
    }

    /// nullptr without failure when the current token is not a TypeScript declaration
    NodePtr parse_typescript_declaration()
    {
        const Token& token = cur();
        const Token& following = peek();
        const std::string_view word = token.text;

        if (word == "interface" && is_identifier_token(following) && !following.newline_before) {
            const auto begin = take_erasure_begin(token.begin);
            next();
            while (!m_failed && !at_end() && !cur().is_punct("{")) {
                if (cur().is_punct("<")) {
                    skip_angle();
                } else {
                    next();
                }
            }
            skip_balanced("{", "}");
            if (m_failed) {
                return nullptr;
            }
            record_type_range(begin, prev_end());
            return Node::make(NodeKind::kOther, location_of(token));
        }
        if (word == "type" && is_identifier_token(following) && !following.newline_before
            && (peek(2).is_punct("=") || peek(2).is_punct("<"))) {
            const auto begin = take_erasure_begin(token.begin);
            next();
            next();
            if (cur().is_punct("<")) {
                skip_angle();
            }
            if (m_failed || !expect_punct("=")) {
                return nullptr;
            }
            skip_type();
            if (m_failed) {
                return nullptr;
            }
            consume_semicolon();
            if (m_failed) {
                return nullptr;
            }
            record_type_range(begin, prev_end());
            return Node::make(NodeKind::kOther, location_of(token));
        }
        if (word == "declare" && following.kind == TokenKind::kIdentifier && !following.newline_before) {
            const auto begin = take_erasure_begin(token.begin);
            next();
            skip_to_statement_end();
            if (m_failed) {
                return nullptr;
            }
            record_type_range(begin, prev_end());
            return Node::make(NodeKind::kOther, location_of(token));
        }
        if (word == "abstract" && following.is_word("class")) {
            record_type_range(token.begin, token.end);
            next();
            return parse_class(NodeKind::kClassDecl);
        }
        if (word == "enum" || (word == "const" && following.is_word("enum"))) {
            m_erasure_begin.reset();
            add_blocker("enum declarations", token);
            auto node = Node::make(NodeKind::kOther, location_of(token));
            node->name = "enum";
            eat_word("const");
            next();
            if (!is_identifier_token(cur())) {
                fail("Unexpected token");
                return nullptr;
            }
            next();
            skip_balanced("{", "}");
            return m_failed ? nullptr : std::move(node);
        }
        if ((word == "namespace" || word == "module") && following.kind == TokenKind::kIdentifier
            && !following.newline_before) {
            m_erasure_begin.reset();
            add_blocker("namespace declarations", token);
            next();
            while (!m_failed && !at_end() && !cur().is_punct("{")) {
                next();
            }
            return parse_block();
        }
        return nullptr;
    }

    /// Consume a declaration up to its `;`, or through its outermost `{...}` body
    void skip_to_statement_end()
    {
        const auto start = m_index;
        while (!m_failed && !at_end()) {
            const Token& token = cur();
            if (token.is_punct(";")) {
                next();
                return;
            }
            if (m_index > start && token.newline_before) {
                return;
            }
            if (token.is_punct("{")) {
                skip_balanced("{", "}");
                if (cur().newline_before || at_end() || cur().is_punct("}")) {
                    eat_punct(";");
                    return;
                }
                continue;
            }
            if (token.is_punct("(")) {
                skip_balanced("(", ")");
                continue;
            }
            if (token.is_punct("[")) {
                skip_balanced("[", "]");
                continue;
            }
            if (token.is_punct("}")) {
                return;
            }
            next();
        }
    }

    // ------------------------------------------------------------------
    // Type syntax (skipped, recorded by the caller)
    // ------------------------------------------------------------------

    void skip_balanced(std::string_view open, std::string_view close)
    {
        if (!expect_punct(open)) {
            return;
        }
        int depth = 1;
        while (!at_end()) {
            if (cur().is_punct(open)) {
                ++depth;
            } else if (cur().is_punct(close) && --depth == 0) {
                next();
                return;
            }
            next();
        }
        fail(std::format("Unexpected end of input, expected \"{}\"", close));
    }

    /// Skip `<...>`, treating `>>`/`>>>` as several closers
    void skip_angle()
    {
        if (!expect_punct("<")) {
            return;
        }
        int depth = 1;
        while (!at_end()) {
            const Token& token = cur();
            if (token.is_punct("<")) {
                ++depth;
            } else if (token.is_punct(">")) {
                --depth;
            } else if (token.is_punct(">>")) {
                depth -= 2;
            } else if (token.is_punct(">>>")) {
                depth -= 3;
            } else if (token.is_punct("(")) {
                skip_balanced("(", ")");
                continue;
            } else if (token.is_punct("{")) {
                skip_balanced("{", "}");
                continue;
            } else if (token.is_punct("[")) {
                skip_balanced("[", "]");
                continue;
            } else if (token.is_punct(";") || token.is_punct(")") || token.is_punct("}")) {
                fail("Unterminated type argument list");
                return;
            }
            next();
            if (depth <= 0) {
                return;
            }
        }
        fail("Unterminated type argument list");
    }

    void skip_type_annotation()
    {
        const auto begin = cur().begin;
        next();
        skip_type();
        if (!m_failed) {
            record_type_range(begin, prev_end());
        }
    }

    void skip_type_parameters()
    {
        const auto begin = cur().begin;
        skip_angle();
        if (!m_failed) {
            record_type_range(begin, prev_end());
        }
    }

    void skip_type()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return;
        }
        skip_union_type();
        if (!m_failed && cur().is_word("extends") && !cur().newline_before) {
            next();
            skip_union_type();
            if (m_failed || !expect_punct("?")) {
                return;
            }
            skip_type();
            if (m_failed || !expect_punct(":")) {
                return;
            }
            skip_type();
        }
    }

    void skip_union_type()
    {
        if (!eat_punct("|")) {
            eat_punct("&");
        }
        skip_postfix_type();
        while (!m_failed && (cur().is_punct("|") || cur().is_punct("&"))) {
            next();
            skip_postfix_type();
        }
    }

    void skip_postfix_type()
    {
        skip_primary_type();
        while (!m_failed && cur().is_punct("[") && !cur().newline_before) {
            skip_balanced("[", "]");
        }
    }

    void skip_primary_type()
    {
        const Token& token = cur();
        if (token.is_word("keyof") || token.is_word("unique") || token.is_word("readonly")) {
            next();
            skip_postfix_type();
            return;
        }
        if (token.is_word("infer")) {
            next();
            next();
            return;
        }
        if (token.is_word("typeof")) {
            next();
            skip_entity_name();
            return;
        }
        if (token.is_word("asserts") && is_identifier_token(peek())) {
            next();
            next();
            if (eat_word("is")) {
                skip_type();
            }
            return;
        }
        if (token.is_word("new")) {
            next();
        }
        if (cur().is_punct("<")) {
            skip_angle();
        }
        if (m_failed) {
            return;
        }
        if (cur().is_punct("(")) {
            skip_balanced("(", ")");
            if (!m_failed && eat_punct("=>")) {
                skip_type();
            }
            return;
        }
        if (cur().is_punct("[")) {
            skip_balanced("[", "]");
            return;
        }
        if (cur().is_punct("{")) {
            skip_balanced("{", "}");
            return;
        }
        if (cur().kind == TokenKind::kString || cur().kind == TokenKind::kNumber
            || cur().kind == TokenKind::kTemplate) {
            next();
            return;
        }
        if (cur().is_punct("-") && peek().kind == TokenKind::kNumber) {
            next();
            next();
            return;
        }
        if (cur().is_word("import") && peek().is_punct("(")) {
            next();
            skip_balanced("(", ")");
            while (!m_failed && cur().is_punct(".")) {
                next();
                next();
            }
            if (!m_failed && cur().is_punct("<")) {
                skip_angle();
            }
            return;
        }
        if (cur().kind == TokenKind::kIdentifier) {
            skip_entity_name();
            if (!m_failed && cur().is_word("is") && !cur().newline_before) {
                next();
                skip_type();
            }
            return;
        }
        fail("Type expected");
    }

    void skip_entity_name()
    {
        if (cur().kind != TokenKind::kIdentifier) {
            fail("Identifier expected");
            return;
        }
        next();
        while (cur().is_punct(".") && peek().kind == TokenKind::kIdentifier) {
            next();
            next();
        }
        if (cur().is_punct("<") && !cur().newline_before) {
            skip_angle();
        }
    }

    // ------------------------------------------------------------------
    // Functions and classes
    // ------------------------------------------------------------------

    void parse_parameters(Node& function)
    {
        if (!expect_punct("(")) {
            return;
        }
        NoInScope allow_in(*this, false);
        while (!m_failed && !cur().is_punct(")")) {
            if (m_typescript && cur().is_word("this") && peek().is_punct(":")) {
                const auto begin = cur().begin;
                next();
                next();
                skip_type();
                eat_punct(",");
                if (!m_failed) {
                    record_type_range(begin, prev_end());
                }
                continue;
            }
            while (cur().is_punct("@")) {
                add_blocker("decorators", cur());
                next();
                auto decorator = parse_call_member();
                if (m_failed) {
                    return;
                }
            }
            if (m_typescript && std::ranges::find(kTsParameterModifiers, cur().text) != kTsParameterModifiers.end()
                && cur().kind == TokenKind::kIdentifier
                && (is_identifier_token(peek()) || peek().is_punct("{") || peek().is_punct("["))) {
                add_blocker("parameter properties", cur());
                record_type_range(cur().begin, cur().end);
                next();
                continue;
            }
            const bool rest = eat_punct("...");
            auto target = parse_binding_target();
            if (m_failed) {
                return;
            }
            if (rest) {
                auto spread = Node::make(NodeKind::kSpread, target->location);
                spread->add(std::move(target));
                target = std::move(spread);
            }
            function.add(std::move(target));
            if (m_typescript && cur().is_punct("?")) {
                record_type_range(cur().begin, cur().end);
                next();
            }
            if (m_typescript && cur().is_punct(":")) {
                skip_type_annotation();
            }
            if (!m_failed && eat_punct("=")) {
                function.add(parse_assignment());
            }
            if (m_failed || !eat_punct(",")) {
                break;
            }
        }
        expect_punct(")");
    }

    /// Parses an optional return type; on `{` parses the body
    void parse_function_rest(Node& function, std::size_t declaration_begin, bool allow_signature)
    {
        if (m_typescript && cur().is_punct("<")) {
            skip_type_parameters();
        }
        parse_parameters(function);
        if (m_failed) {
            return;
        }
        if (m_typescript && cur().is_punct(":")) {
            skip_type_annotation();
            if (m_failed) {
                return;
            }
        }
        if (allow_signature && m_typescript && !cur().is_punct("{")) {
            // overload or abstract signature: no runtime code at all
            consume_semicolon();
            if (!m_failed) {
                m_type_ranges.erase(std::remove_if(m_type_ranges.begin(), m_type_ranges.end(),
                                                   [declaration_begin](const SourceRange& range) {
                                                       return range.begin >= declaration_begin;
                                                   }),
                                    m_type_ranges.end());
                record_type_range(declaration_begin, prev_end());
                function.kind = NodeKind::kOther;
                function.children.clear();
            }
            return;
        }
        function.add(parse_function_body());
    }

    NodePtr parse_function_body()
    {
        NoInScope allow_in(*this, false);
        return parse_block();
    }

    NodePtr parse_function(NodeKind kind)
    {
        const Token& start = cur();
        const auto begin = take_erasure_begin(start.begin);
        auto node = Node::make(kind, location_of(start));
        next();
        eat_punct("*");
        if (is_identifier_token(cur()) || cur().is_word("yield") || cur().is_word("await")) {
            node->name = cur().text;
            next();
        }
        parse_function_rest(*node, begin, kind == NodeKind::kFunctionDecl);
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_class(NodeKind kind)
    {
        const Token& start = cur();
        m_erasure_begin.reset();
        auto node = Node::make(kind, location_of(start));
        next();
        if (is_identifier_token(cur()) && !cur().is_word("implements")) {
            node->name = cur().text;
            next();
        }
        if (m_typescript && cur().is_punct("<")) {
            skip_type_parameters();
        }
        if (!m_failed && eat_word("extends")) {
            node->add(parse_call_member());
            if (!m_failed && m_typescript && cur().is_punct("<")) {
                skip_type_parameters();
            }
        }
        if (!m_failed && m_typescript && cur().is_word("implements")) {
            const auto begin = cur().begin;
            next();
            while (!m_failed && !at_end() && !cur().is_punct("{")) {
                if (cur().is_punct("<")) {
                    skip_angle();
                } else {
                    next();
                }
            }
            record_type_range(begin, prev_end());
        }
        if (m_failed || !expect_punct("{")) {
            return nullptr;
        }
        while (!m_failed && !cur().is_punct("}") && !at_end()) {
            parse_class_member(*node);
        }
        if (m_failed || !expect_punct("}")) {
            return nullptr;
        }
        return node;
    }

    [[nodiscard]] bool is_member_key_start(const Token& token) const noexcept
    {
        return token.kind == TokenKind::kIdentifier || token.kind == TokenKind::kString
               || token.kind == TokenKind::kNumber || token.kind == TokenKind::kPrivateName
               || token.is_punct("[") || token.is_punct("*") || token.is_punct("#");
    }

    void parse_class_member(Node& klass)
    {
        if (eat_punct(";")) {
            return;
        }
        while (cur().is_punct("@")) {
            add_blocker("decorators", cur());
            next();
            auto decorator = parse_call_member();
            if (m_failed) {
                return;
            }
        }
        if (cur().is_word("static") && peek().is_punct("{")) {
            next();
            klass.add(parse_block());
            return;
        }

        const Token& start = cur();
        const auto member_begin = start.begin;
        bool erase_member = false;
        while (cur().kind == TokenKind::kIdentifier
               && std::ranges::find(kClassModifiers, cur().text) != kClassModifiers.end()
               && is_member_key_start(peek()) && !peek().newline_before) {
            const std::string_view modifier = cur().text;
            const bool type_only = modifier != "static" && modifier != "async" && modifier != "get"
                                   && modifier != "set" && modifier != "accessor";
            if (type_only && !m_typescript) {
                break;
            }
            if (modifier == "abstract" || modifier == "declare") {
                erase_member = true;
            }
            if (type_only) {
                record_type_range(cur().begin, cur().end);
            }
            next();
        }
        eat_punct("*");

        std::string key;
        if (cur().is_punct("[")) {
            if (m_typescript && is_identifier_token(peek()) && peek(2).is_punct(":")) {
                // index signature
                skip_balanced("[", "]");
                if (!m_failed && cur().is_punct(":")) {
                    next();
                    skip_type();
                }
                consume_semicolon();
                if (!m_failed) {
                    record_type_range(member_begin, prev_end());
                }
                return;
            }
            next();
            auto computed = parse_assignment();
            if (m_failed || !expect_punct("]")) {
                return;
            }
            klass.add(std::move(computed));
        } else if (cur().kind == TokenKind::kIdentifier || cur().kind == TokenKind::kString
                   || cur().kind == TokenKind::kNumber || cur().kind == TokenKind::kPrivateName) {
            key = cur().text;
            next();
        } else {
            fail("Unexpected token");
            return;
        }

        if (m_typescript && (cur().is_punct("?") || cur().is_punct("!"))) {
            record_type_range(cur().begin, cur().end);
            next();
        }

        if (cur().is_punct("(") || cur().is_punct("<")) {
            auto method = Node::make(NodeKind::kMethod, location_of(start));
            method->name = key;
            parse_function_rest(*method, member_begin, m_typescript);
            if (m_failed) {
                return;
            }
            if (method->kind == NodeKind::kMethod) {
                klass.add(std::move(method));
            }
            return;
        }

        auto field = Node::make(NodeKind::kOther, location_of(start));
        field->name = key;
        if (m_typescript && cur().is_punct(":")) {
            skip_type_annotation();
        }
        if (!m_failed && eat_punct("=")) {
            NoInScope allow_in(*this, false);
            field->add(parse_assignment());
        }
        if (m_failed) {
            return;
        }
        consume_semicolon();
        if (m_failed) {
            return;
        }
        if (erase_member) {
            m_type_ranges.erase(std::remove_if(m_type_ranges.begin(), m_type_ranges.end(),
                                               [member_begin](const SourceRange& range) {
                                                   return range.begin >= member_begin;
                                               }),
                                m_type_ranges.end());
            record_type_range(member_begin, prev_end());
            return;
        }
        klass.add(std::move(field));
    }

    // ------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------

    NodePtr parse_expression()
    {
        auto first = parse_assignment();
        if (m_failed || !cur().is_punct(",")) {
            return first;
        }
        auto sequence = Node::make(NodeKind::kOther, first->location);
        sequence->name = ",";
        sequence->add(std::move(first));
        while (!m_failed && eat_punct(",")) {
            sequence->add(parse_assignment());
        }
        return m_failed ? nullptr : std::move(sequence);
    }

    /// Index of the token closing the bracket opened at `open_index`
    [[nodiscard]] std::optional<std::size_t> matching_close(std::size_t open_index) const
    {
        int depth = 0;
        for (std::size_t i = open_index; i < m_tokens.size(); ++i) {
            const Token& token = m_tokens[i];
            if (token.kind != TokenKind::kPunctuator) {
                continue;
            }
            if (token.text == "(" || token.text == "[" || token.text == "{") {
                ++depth;
            } else if (token.text == ")" || token.text == "]" || token.text == "}") {
                if (--depth == 0) {
                    return i;
                }
            }
        }
        return std::nullopt;
    }

    /// Does the parenthesized list starting at `open_index` begin an arrow function?
    bool is_arrow_at(std::size_t open_index)
    {
        if (!m_tokens[open_index].is_punct("(")) {
            return false;
        }
        const auto close = matching_close(open_index);
        if (!close) {
            return false;
        }
        const Token& after = m_tokens[std::min(*close + 1, m_tokens.size() - 1)];
        if (after.is_punct("=>") && !after.newline_before) {
            return true;
        }
        if (!m_typescript || !after.is_punct(":")) {
            return false;
        }
        const auto saved = m_index;
        m_index = *close + 2;
        const bool arrow = speculate([this] { skip_type(); },
                                     [this] { return cur().is_punct("=>"); });
        m_index = saved;
        return arrow;
    }

    NodePtr parse_arrow(const Token& start)
    {
        auto node = Node::make(NodeKind::kArrowFunction, location_of(start));
        if (cur().kind == TokenKind::kIdentifier && !cur().is_punct("(")) {
            auto param = Node::make(NodeKind::kIdentifier, location_of(cur()));
            param->name = cur().text;
            next();
            node->add(std::move(param));
        } else {
            if (m_typescript && cur().is_punct("<")) {
                skip_type_parameters();
            }
            parse_parameters(*node);
            if (!m_failed && m_typescript && cur().is_punct(":")) {
                skip_type_annotation();
            }
        }
        if (m_failed || !expect_punct("=>")) {
            return nullptr;
        }
        if (cur().is_punct("{")) {
            node->add(parse_function_body());
        } else {
            node->add(parse_assignment());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr try_parse_arrow()
    {
        const Token& token = cur();
        if (is_identifier_token(token) && peek().is_punct("=>") && !peek().newline_before) {
            return parse_arrow(token);
        }
        if (token.is_word("async") && !peek().newline_before) {
            if (is_identifier_token(peek()) && peek(2).is_punct("=>")) {
                next();
                return parse_arrow(token);
            }
            if (peek().is_punct("(") && is_arrow_at(m_index + 1)) {
                next();
                return parse_arrow(token);
            }
        }
        if (token.is_punct("(") && is_arrow_at(m_index)) {
            return parse_arrow(token);
        }
        if (m_typescript && token.is_punct("<")) {
            const auto saved = m_index;
            std::size_t after_params = 0;
            const bool generic_arrow = speculate([this] { skip_angle(); },
                                                 [this, &after_params] {
                                                     after_params = m_index;
                                                     return is_arrow_at(m_index);
                                                 });
            m_index = saved;
            if (generic_arrow && after_params > 0) {
                return parse_arrow(token);
            }
        }
        return nullptr;
    }

    NodePtr parse_assignment()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        if (auto arrow = try_parse_arrow(); arrow || m_failed) {
            return arrow;
        }
        if (cur().is_word("yield") && !peek().newline_before) {
            auto node = Node::make(NodeKind::kYield, location_of(cur()));
            next();
            eat_punct("*");
            const Token& token = cur();
            const bool has_argument = !(token.is_punct(")") || token.is_punct("]") || token.is_punct("}")
                                        || token.is_punct(",") || token.is_punct(";")
                                        || token.is_punct(":") || at_end() || token.newline_before);
            if (has_argument) {
                node->add(parse_assignment());
            }
            return m_failed ? nullptr : std::move(node);
        }

        auto left = parse_conditional();
        if (m_failed) {
            return nullptr;
        }
        if (cur().kind == TokenKind::kPunctuator
            && std::ranges::find(kAssignmentOperators, cur().text) != kAssignmentOperators.end()) {
            auto node = Node::make(NodeKind::kAssign, location_of(cur()));
            node->name = cur().text;
            next();
            node->add(std::move(left));
            node->add(parse_assignment());
            return m_failed ? nullptr : std::move(node);
        }
        return left;
    }

    NodePtr parse_conditional()
    {
        auto test = parse_binary(1);
        if (m_failed || !cur().is_punct("?")) {
            return test;
        }
        auto node = Node::make(NodeKind::kConditional, location_of(cur()));
        next();
        node->test = std::move(test);
        {
            NoInScope allow_in(*this, false);
            node->add(parse_assignment());
        }
        if (m_failed || !expect_punct(":")) {
            return nullptr;
        }
        node->add(parse_assignment());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_binary(int min_precedence)
    {
        auto left = parse_unary();
        while (!m_failed) {
            const Token& op = cur();
            if (m_typescript && (op.is_word("as") || op.is_word("satisfies")) && !op.newline_before) {
                const auto begin = op.begin;
                next();
                if (!eat_word("const")) {
                    skip_type();
                }
                if (!m_failed) {
                    record_type_range(begin, prev_end());
                }
                continue;
            }
            const int precedence = binary_precedence(op, m_no_in);
            if (precedence == 0 || precedence < min_precedence) {
                break;
            }
            auto node = Node::make(NodeKind::kBinary, location_of(op));
            node->name = op.text;
            next();
            auto right = parse_binary(op.text == "**" ? precedence : precedence + 1);
            if (m_failed) {
                return nullptr;
            }
            node->add(std::move(left));
            node->add(std::move(right));
            left = std::move(node);
        }
        return m_failed ? nullptr : std::move(left);
    }

    NodePtr parse_unary()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        const Token& token = cur();
        const bool prefix_punct = token.kind == TokenKind::kPunctuator
                                  && (token.text == "!" || token.text == "~" || token.text == "+"
                                      || token.text == "-" || token.text == "++"
                                      || token.text == "--");
        const bool prefix_word = token.is_word("typeof") || token.is_word("void")
                                 || token.is_word("delete");
        if (prefix_punct || prefix_word) {
            auto node = Node::make(NodeKind::kUnary, location_of(token));
            node->name = token.text;
            next();
            node->add(parse_unary());
            return m_failed ? nullptr : std::move(node);
        }
        if (token.is_word("await") && !peek().is_punct(")") && !peek().is_punct(";")
            && !peek().is_punct(",") && !peek().is_punct("=") && !peek().is_punct(".")) {
            auto node = Node::make(NodeKind::kAwait, location_of(token));
            next();
            node->add(parse_unary());
            return m_failed ? nullptr : std::move(node);
        }
        if (m_typescript && token.is_punct("<")) {
            // `<T>value` type assertion
            skip_type_parameters();
            return m_failed ? nullptr : parse_unary();
        }
        auto operand = parse_call_member();
        if (m_failed) {
            return nullptr;
        }
        if ((cur().is_punct("++") || cur().is_punct("--")) && !cur().newline_before) {
            auto node = Node::make(NodeKind::kUnary, location_of(cur()));
            node->name = cur().text;
            next();
            node->add(std::move(operand));
            return node;
        }
        return operand;
    }

    void parse_arguments(Node& call)
    {
        if (!expect_punct("(")) {
            return;
        }
        NoInScope allow_in(*this, false);
        while (!m_failed && !cur().is_punct(")")) {
            if (cur().is_punct("...")) {
                auto spread = Node::make(NodeKind::kSpread, location_of(cur()));
                next();
                spread->add(parse_assignment());
                call.add(std::move(spread));
            } else {
                call.add(parse_assignment());
            }
            ++call.argument_count;
            if (m_failed || !eat_punct(",")) {
                break;
            }
        }
        expect_punct(")");
    }

    NodePtr make_member(NodePtr object, const Token& at, std::string name)
    {
        auto member = Node::make(NodeKind::kMember, location_of(at));
        member->name = std::move(name);
        member->add(std::move(object));
        return member;
    }

    NodePtr make_call(NodePtr callee, const Token& at)
    {
        auto call = Node::make(NodeKind::kCall, callee ? callee->location : location_of(at));
        call->name = callee_name(*callee);
        call->add(std::move(callee));
        parse_arguments(*call);
        return m_failed ? nullptr : std::move(call);
    }

    bool try_skip_type_arguments_before_call()
    {
        const auto begin = cur().begin;
        const bool skipped = speculate([this] { skip_angle(); },
                                       [this] { return cur().is_punct("(") || cur().kind == TokenKind::kTemplate; });
        if (skipped) {
            record_type_range(begin, prev_end());
        }
        return skipped;
    }

    NodePtr parse_call_member()
    {
        NodePtr expr = cur().is_word("new") ? parse_new() : parse_primary();
        while (!m_failed) {
            const Token& token = cur();
            if ((token.is_punct(".") || token.is_punct("?."))
                && (peek().kind == TokenKind::kIdentifier || peek().kind == TokenKind::kPrivateName)) {
                next();
                const Token& property = cur();
                expr = make_member(std::move(expr), property, property.text);
                next();
                continue;
            }
            if (token.is_punct("?.") && peek().is_punct("(")) {
                next();
                expr = make_call(std::move(expr), token);
                continue;
            }
            if (token.is_punct("[") || (token.is_punct("?.") && peek().is_punct("["))) {
                eat_punct("?.");
                const Token& open = cur();
                next();
                NodePtr property;
                {
                    NoInScope allow_in(*this, false);
                    property = parse_expression();
                }
                if (m_failed || !expect_punct("]")) {
                    return nullptr;
                }
                std::string name = property->kind == NodeKind::kLiteral && property->literal == LiteralKind::kString
                                       ? property->text
                                       : std::string{};
                expr = make_member(std::move(expr), open, std::move(name));
                expr->add(std::move(property));
                continue;
            }
            if (token.is_punct("(")) {
                expr = make_call(std::move(expr), token);
                continue;
            }
            if (token.kind == TokenKind::kTemplate) {
                auto call = Node::make(NodeKind::kCall, expr->location);
                call->name = callee_name(*expr);
                call->add(std::move(expr));
                call->add(parse_template());
                call->argument_count = 1;
                expr = std::move(call);
                continue;
            }
            if (m_typescript && token.is_punct("!") && !token.newline_before
                && m_index > 0 && m_tokens[m_index - 1].end == token.begin) {
                record_type_range(token.begin, token.end);
                next();
                continue;
            }
            if (m_typescript && token.is_punct("<") && try_skip_type_arguments_before_call()) {
                continue;
            }
            break;
        }
        return m_failed ? nullptr : std::move(expr);
    }

    NodePtr parse_new()
    {
        DepthGuard guard(*this);
        const Token& start = cur();
        next();
        if (cur().is_punct(".")) {
            next();
            if (!eat_word("target")) {
                fail("Unexpected token");
                return nullptr;
            }
            auto target = Node::make(NodeKind::kIdentifier, location_of(start));
            target->name = "new";
            return make_member(std::move(target), start, "target");
        }
        NodePtr callee = cur().is_word("new") ? parse_new() : parse_primary();
        while (!m_failed) {
            if (cur().is_punct(".") && peek().kind == TokenKind::kIdentifier) {
                next();
                const Token& property = cur();
                callee = make_member(std::move(callee), property, property.text);
                next();
            } else if (cur().is_punct("[")) {
                const Token& open = cur();
                next();
                auto property = parse_expression();
                if (m_failed || !expect_punct("]")) {
                    return nullptr;
                }
                callee = make_member(std::move(callee), open, {});
                callee->add(std::move(property));
            } else {
                break;
            }
        }
        if (m_failed) {
            return nullptr;
        }
        if (m_typescript && cur().is_punct("<")) {
            const auto begin = cur().begin;
            if (speculate([this] { skip_angle(); }, [] { return true; })) {
                record_type_range(begin, prev_end());
            }
        }
        auto node = Node::make(NodeKind::kNew, location_of(start));
        node->name = callee_name(*callee);
        node->add(std::move(callee));
        if (cur().is_punct("(")) {
            parse_arguments(*node);
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr make_literal(const Token& token, LiteralKind kind)
    {
        auto literal = Node::make(NodeKind::kLiteral, location_of(token));
        literal->literal = kind;
        literal->text = token.text;
        next();
        return literal;
    }

    NodePtr parse_primary()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        const Token& token = cur();
        switch (token.kind) {
            case TokenKind::kNumber:
                return make_literal(token, LiteralKind::kNumber);
            case TokenKind::kString:
                return make_literal(token, LiteralKind::kString);
            case TokenKind::kRegex:
                return make_literal(token, LiteralKind::kRegex);
            case TokenKind::kTemplate:
                return parse_template();
            case TokenKind::kPrivateName: {
                auto node = Node::make(NodeKind::kIdentifier, location_of(token));
                node->name = token.text;
                next();
                return node;
            }
            case TokenKind::kPunctuator:
                return parse_punctuator_primary();
            case TokenKind::kIdentifier:
                return parse_word_primary();
            case TokenKind::kEnd:
                break;
        }
        fail("Unexpected token");
        return nullptr;
    }

    NodePtr parse_punctuator_primary()
    {
        const Token& token = cur();
        if (token.is_punct("(")) {
            next();
            NoInScope allow_in(*this, false);
            auto inner = parse_expression();
            if (m_failed || !expect_punct(")")) {
                return nullptr;
            }
            return inner;
        }
        if (token.is_punct("[")) {
            return parse_array_literal();
        }
        if (token.is_punct("{")) {
            return parse_object_literal();
        }
        fail("Unexpected token");
        return nullptr;
    }

    NodePtr parse_word_primary()
    {
        const Token& token = cur();
        const std::string_view word = token.text;
        if (word == "function") {
            return parse_function(NodeKind::kFunctionExpr);
        }
        if (word == "async" && peek().is_word("function") && !peek().newline_before) {
            next();
            return parse_function(NodeKind::kFunctionExpr);
        }
        if (word == "class") {
            return parse_class(NodeKind::kClassExpr);
        }
        if (word == "true" || word == "false") {
            return make_literal(token, LiteralKind::kBoolean);
        }
        if (word == "null") {
            return make_literal(token, LiteralKind::kNull);
        }
        if (word == "import") {
            next();
            if (cur().is_punct("(")) {
                auto callee = Node::make(NodeKind::kIdentifier, location_of(token));
                callee->name = "import";
                return make_call(std::move(callee), token);
            }
            if (eat_punct(".") && eat_word("meta")) {
                auto object = Node::make(NodeKind::kIdentifier, location_of(token));
                object->name = "import";
                return make_member(std::move(object), token, "meta");
            }
            fail("Unexpected token");
            return nullptr;
        }
        if (is_reserved_word(word) && word != "this" && word != "super") {
            fail(std::format("Unexpected keyword '{}'", word));
            return nullptr;
        }
        auto node = Node::make(NodeKind::kIdentifier, location_of(token));
        node->name = token.text;
        next();
        return node;
    }

    NodePtr parse_template()
    {
        const Token& token = cur();
        auto node = Node::make(NodeKind::kTemplate, location_of(token));
        node->text = token.text;
        const auto substitutions = token.substitutions;
        next();
        for (const auto& sub : substitutions) {
            auto tokens = tokenize(m_source, sub.begin, sub.end, sub.line, sub.column);
            if (!tokens) {
                fail(tokens.error().message);
                return nullptr;
            }
            Parser inner(m_source, std::move(*tokens), m_typescript, false, m_depth);
            auto expr = inner.parse_standalone_expression();
            if (inner.failed()) {
                fail(inner.error());
                return nullptr;
            }
            std::ranges::move(inner.type_ranges(), std::back_inserter(m_type_ranges));
            std::ranges::move(inner.blockers(), std::back_inserter(m_blockers));
            node->add(std::move(expr));
        }
        return node;
    }

    NodePtr parse_array_literal()
    {
        auto node = Node::make(NodeKind::kArray, location_of(cur()));
        next();
        NoInScope allow_in(*this, false);
        while (!m_failed && !cur().is_punct("]")) {
            if (eat_punct(",")) {
                continue;
            }
            if (cur().is_punct("...")) {
                auto spread = Node::make(NodeKind::kSpread, location_of(cur()));
                next();
                spread->add(parse_assignment());
                node->add(std::move(spread));
            } else {
                node->add(parse_assignment());
            }
            if (m_failed || !eat_punct(",")) {
                break;
            }
        }
        if (m_failed || !expect_punct("]")) {
            return nullptr;
        }
        return node;
    }

    NodePtr parse_object_literal()
    {
        auto node = Node::make(NodeKind::kObject, location_of(cur()));
        next();
        NoInScope allow_in(*this, false);
        while (!m_failed && !cur().is_punct("}")) {
            parse_object_property(*node);
            if (m_failed || !eat_punct(",")) {
                break;
            }
        }
        if (m_failed || !expect_punct("}")) {
            return nullptr;
        }
        return node;
    }

    void parse_object_property(Node& object)
    {
        const Token& start = cur();
        if (eat_punct("...")) {
            auto spread = Node::make(NodeKind::kSpread, location_of(start));
            spread->add(parse_assignment());
            object.add(std::move(spread));
            return;
        }
        while ((cur().is_word("get") || cur().is_word("set") || cur().is_word("async"))
               && is_member_key_start(peek())) {
            next();
        }
        eat_punct("*");

        const Token& key_token = cur();
        std::string key;
        if (eat_punct("[")) {
            object.add(parse_assignment());
            if (m_failed || !expect_punct("]")) {
                return;
            }
        } else if (key_token.kind == TokenKind::kIdentifier || key_token.kind == TokenKind::kString
                   || key_token.kind == TokenKind::kNumber) {
            key = key_token.text;
            next();
        } else {
            fail("Unexpected token");
            return;
        }

        if (cur().is_punct("(") || (m_typescript && cur().is_punct("<"))) {
            auto method = Node::make(NodeKind::kMethod, location_of(start));
            method->name = key;
            parse_function_rest(*method, start.begin, false);
            if (!m_failed) {
                object.add(std::move(method));
            }
            return;
        }
        if (eat_punct(":")) {
            object.add(parse_assignment());
            return;
        }
        auto shorthand = Node::make(NodeKind::kIdentifier, location_of(key_token));
        shorthand->name = key;
        object.add(std::move(shorthand));
        if (eat_punct("=")) {
            object.add(parse_assignment());
        }
    }

    std::string_view m_source;
    std::vector<Token> m_tokens;
    std::size_t m_index = 0;
    bool m_typescript;
    bool m_tolerant;
    int m_depth;
    bool m_no_in = false;
    bool m_failed = false;
    std::string m_error;
    std::optional<std::size_t> m_erasure_begin;
    std::vector<std::string> m_recovered;
    std::vector<SourceRange> m_type_ranges;
    std::vector<std::string> m_blockers;
};

}  // namespace

secbox::Result<ParseOutput> parse(std::string_view source, bool typescript, ParseMode mode)
{
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    const bool tolerant = mode == ParseMode::kTolerant;
    if (tolerant) {
        if (auto balanced = check_brackets(*tokens); !balanced) {
            return std::unexpected(balanced.error());
        }
    }

    Parser parser(source, std::move(*tokens), typescript, tolerant, 0);
    auto program = parser.parse_program();
    if (parser.failed()) {
        return std::unexpected(Error::make("SyntaxError", parser.error()));
    }

    auto ranges = std::move(parser.type_ranges());
    std::ranges::sort(ranges, {}, &SourceRange::begin);
    return ParseOutput{.program = std::move(program),
                       .errors = std::move(parser.recovered_errors()),
                       .type_only_ranges = std::move(ranges),
                       .erasure_blockers = std::move(parser.blockers())};
}

}  // namespace secbox::analyzer::js
