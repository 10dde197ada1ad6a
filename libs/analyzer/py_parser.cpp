/**
 * @file py_parser.cpp
 * @brief Python parser
 *
 * Covers the statement and expression grammar of current Python 3 releases.
 * `match` patterns are skipped rather than modelled; their guards and bodies
 * are parsed normally.
 */

#include "py_parser.hpp"

#include "py_lexer.hpp"

#include <algorithm>
#include <array>
#include <format>
#include <utility>
#include <vector>

namespace secbox::analyzer::py {

namespace {

using ast::LiteralKind;
using ast::Node;
using ast::NodeKind;
using NodePtr = std::unique_ptr<Node>;

constexpr int kMaxDepth = 200;

constexpr std::array<std::string_view, 13> kAugmentedAssignments = {
    "+=", "-=", "*=", "/=", "//=", "%=", "@=", "&=", "|=", "^=", ">>=", "<<=", "**="};

[[nodiscard]] int arithmetic_precedence(const Token& token) noexcept
{
    if (token.kind != TokenKind::kOperator) {
        return 0;
    }
    const std::string_view op = token.text;
    if (op == "|") {
        return 1;
    }
    if (op == "^") {
        return 2;
    }
    if (op == "&") {
        return 3;
    }
    if (op == "<<" || op == ">>") {
        return 4;
    }
    if (op == "+" || op == "-") {
        return 5;
    }
    if (op == "*" || op == "/" || op == "//" || op == "%" || op == "@") {
        return 6;
    }
    return 0;
}

[[nodiscard]] ast::SourceLocation location_of(const Token& token) noexcept
{
    return ast::SourceLocation{.line = token.line, .column = token.column, .offset = token.begin};
}

class Parser
{
public:
    Parser(std::string_view source, std::vector<Token> tokens, int depth)
        : m_source(source)
        , m_tokens(std::move(tokens))
        , m_depth(depth)
    {}

    NodePtr parse_module()
    {
        auto module = Node::make(NodeKind::kProgram, location_of(cur()));
        while (!m_failed && !at(TokenKind::kEnd)) {
            if (eat(TokenKind::kNewline)) {
                continue;
            }
            parse_statement(*module);
        }
        return m_failed ? nullptr : std::move(module);
    }

    NodePtr parse_field_expression()
    {
        auto expr = parse_star_expressions();
        if (!m_failed && !cur().is_op("=") && !at(TokenKind::kEnd)) {
            fail("f-string: invalid syntax");
        }
        return m_failed ? nullptr : std::move(expr);
    }

    [[nodiscard]] bool failed() const noexcept { return m_failed; }
    [[nodiscard]] const std::string& error() const noexcept { return m_error; }

private:
    // ------------------------------------------------------------------
    // Token helpers
    // ------------------------------------------------------------------

    [[nodiscard]] const Token& cur() const noexcept { return m_tokens[m_index]; }

    [[nodiscard]] const Token& peek(std::size_t ahead = 1) const noexcept
    {
        return m_tokens[std::min(m_index + ahead, m_tokens.size() - 1)];
    }

    [[nodiscard]] bool at(TokenKind kind) const noexcept { return cur().kind == kind; }

    void next() noexcept
    {
        if (!at(TokenKind::kEnd)) {
            ++m_index;
        }
    }

    bool eat(TokenKind kind)
    {
        if (at(kind)) {
            next();
            return true;
        }
        return false;
    }

    bool eat_op(std::string_view op)
    {
        if (cur().is_op(op)) {
            next();
            return true;
        }
        return false;
    }

    bool eat_name(std::string_view word)
    {
        if (cur().is_name(word)) {
            next();
            return true;
        }
        return false;
    }

    bool expect_op(std::string_view op)
    {
        if (eat_op(op)) {
            return true;
        }
        fail(std::format("expected '{}'", op));
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

    [[nodiscard]] bool is_plain_name(const Token& token) const noexcept
    {
        return token.kind == TokenKind::kName && !is_keyword(token.text);
    }

    class DepthGuard
    {
    public:
        explicit DepthGuard(Parser& parser)
            : m_parser(parser)
        {
            if (++m_parser.m_depth > kMaxDepth) {
                m_parser.fail("too many nested parentheses");
            }
        }
        ~DepthGuard() { --m_parser.m_depth; }
        DepthGuard(const DepthGuard&) = delete;
        DepthGuard& operator=(const DepthGuard&) = delete;

    private:
        Parser& m_parser;
    };

    NodePtr make_name(const Token& token)
    {
        auto node = Node::make(NodeKind::kIdentifier, location_of(token));
        node->name = token.text;
        next();
        return node;
    }

    // ------------------------------------------------------------------
    // Statements
    // ------------------------------------------------------------------

    void parse_statement(Node& parent)
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return;
        }
        const Token& token = cur();
        if (token.is_op("@")) {
            parent.add(parse_decorated());
            return;
        }
        if (token.kind == TokenKind::kName) {
            if (auto compound = parse_compound_statement(); compound || m_failed) {
                parent.add(std::move(compound));
                return;
            }
        }
        if (at(TokenKind::kIndent)) {
            fail("unexpected indent");
            return;
        }
        parse_simple_statements(parent);
    }

    /// nullptr without failure when the current token does not start a compound statement
    NodePtr parse_compound_statement()
    {
        const std::string_view word = cur().text;
        if (word == "if") {
            return parse_if();
        }
        if (word == "while") {
            return parse_while();
        }
        if (word == "for") {
            return parse_for();
        }
        if (word == "try") {
            return parse_try();
        }
        if (word == "with") {
            return parse_with();
        }
        if (word == "def") {
            return parse_def();
        }
        if (word == "class") {
            return parse_class();
        }
        if (word == "async") {
            const Token& following = peek();
            if (following.is_name("def")) {
                next();
                return parse_def();
            }
            if (following.is_name("for")) {
                next();
                return parse_for();
            }
            if (following.is_name("with")) {
                next();
                return parse_with();
            }
            return nullptr;
        }
        if (word == "match" && looks_like_match()) {
            return parse_match();
        }
        return nullptr;
    }

    void parse_simple_statements(Node& parent)
    {
        while (!m_failed) {
            parent.add(parse_simple_statement());
            if (m_failed) {
                return;
            }
            if (!eat_op(";")) {
                break;
            }
            if (at(TokenKind::kNewline) || at(TokenKind::kEnd)) {
                break;
            }
        }
        if (!m_failed && !eat(TokenKind::kNewline) && !at(TokenKind::kEnd)) {
            fail("invalid syntax");
        }
    }

    NodePtr parse_simple_statement()
    {
        const Token& token = cur();
        const std::string_view word = token.kind == TokenKind::kName ? std::string_view(token.text)
                                                                     : std::string_view{};
        if (word == "pass") {
            auto node = Node::make(NodeKind::kOther, location_of(token));
            node->name = "pass";
            next();
            return node;
        }
        if (word == "break" || word == "continue") {
            auto node = Node::make(word == "break" ? NodeKind::kBreak : NodeKind::kContinue,
                                   location_of(token));
            next();
            return node;
        }
        if (word == "return") {
            auto node = Node::make(NodeKind::kReturn, location_of(token));
            next();
            if (!at_statement_end()) {
                node->add(parse_star_expressions());
            }
            return m_failed ? nullptr : std::move(node);
        }
        if (word == "raise") {
            auto node = Node::make(NodeKind::kThrow, location_of(token));
            next();
            if (!at_statement_end()) {
                node->add(parse_expression());
                if (!m_failed && eat_name("from")) {
                    node->add(parse_expression());
                }
            }
            return m_failed ? nullptr : std::move(node);
        }
        if (word == "global" || word == "nonlocal") {
            auto node = Node::make(NodeKind::kOther, location_of(token));
            node->name = word;
            next();
            do {
                if (!is_plain_name(cur())) {
                    fail("invalid syntax");
                    return nullptr;
                }
                node->add(make_name(cur()));
            } while (eat_op(","));
            return node;
        }
        if (word == "del" || word == "assert") {
            auto node = Node::make(NodeKind::kOther, location_of(token));
            node->name = word;
            next();
            node->add(parse_star_expressions());
            return m_failed ? nullptr : std::move(node);
        }
        if (word == "import") {
            return parse_import();
        }
        if (word == "from") {
            return parse_from_import();
        }
        if (word == "type" && is_plain_name(peek()) && (peek(2).is_op("=") || peek(2).is_op("["))) {
            auto node = Node::make(NodeKind::kOther, location_of(token));
            node->name = "type";
            next();
            next();
            if (cur().is_op("[")) {
                skip_type_parameters();
            }
            if (m_failed || !expect_op("=")) {
                return nullptr;
            }
            node->add(parse_expression());
            return m_failed ? nullptr : std::move(node);
        }
        return parse_expression_statement();
    }

    [[nodiscard]] bool at_statement_end() const noexcept
    {
        return at(TokenKind::kNewline) || at(TokenKind::kEnd) || cur().is_op(";");
    }

    NodePtr parse_expression_statement()
    {
        const Token& start = cur();
        auto first = cur().is_name("yield") ? parse_yield() : parse_star_expressions();
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_op(":")) {
            auto node = Node::make(NodeKind::kAssign, location_of(start));
            node->name = ":";
            next();
            node->add(std::move(first));
            node->add(parse_expression());
            if (!m_failed && eat_op("=")) {
                node->add(parse_assignment_value());
            }
            return m_failed ? nullptr : std::move(node);
        }
        if (cur().kind == TokenKind::kOperator
            && std::ranges::find(kAugmentedAssignments, cur().text) != kAugmentedAssignments.end()) {
            auto node = Node::make(NodeKind::kAssign, location_of(start));
            node->name = cur().text;
            next();
            node->add(std::move(first));
            node->add(parse_assignment_value());
            return m_failed ? nullptr : std::move(node);
        }
        if (cur().is_op("=")) {
            auto node = Node::make(NodeKind::kAssign, location_of(start));
            node->name = "=";
            node->add(std::move(first));
            while (!m_failed && eat_op("=")) {
                node->add(parse_assignment_value());
            }
            return m_failed ? nullptr : std::move(node);
        }
        auto statement = Node::make(NodeKind::kExprStmt, location_of(start));
        statement->add(std::move(first));
        return statement;
    }

    NodePtr parse_assignment_value()
    {
        return cur().is_name("yield") ? parse_yield() : parse_star_expressions();
    }

    std::string parse_dotted_name()
    {
        std::string dotted;
        if (!is_plain_name(cur())) {
            fail("invalid syntax");
            return dotted;
        }
        dotted = cur().text;
        next();
        while (cur().is_op(".") && is_plain_name(peek())) {
            next();
            dotted += '.';
            dotted += cur().text;
            next();
        }
        return dotted;
    }

    void add_module(Node& import, std::string module, const Token& at_token)
    {
        auto literal = Node::make(NodeKind::kLiteral, location_of(at_token));
        literal->literal = LiteralKind::kString;
        literal->text = std::move(module);
        if (import.name.empty()) {
            import.name = literal->text;
        }
        import.add(std::move(literal));
    }

    NodePtr parse_import()
    {
        auto node = Node::make(NodeKind::kImport, location_of(cur()));
        next();
        do {
            const Token& module_token = cur();
            auto module = parse_dotted_name();
            if (m_failed) {
                return nullptr;
            }
            if (eat_name("as")) {
                if (!is_plain_name(cur())) {
                    fail("invalid syntax");
                    return nullptr;
                }
                next();
            }
            add_module(*node, std::move(module), module_token);
        } while (eat_op(","));
        return node;
    }

    NodePtr parse_from_import()
    {
        auto node = Node::make(NodeKind::kImport, location_of(cur()));
        next();
        const Token& module_token = cur();
        std::string module;
        while (cur().is_op(".") || cur().is_op("...")) {
            module += cur().text;
            next();
        }
        if (!cur().is_name("import")) {
            module += parse_dotted_name();
            if (m_failed) {
                return nullptr;
            }
        }
        if (!eat_name("import")) {
            fail("invalid syntax");
            return nullptr;
        }
        std::vector<NodePtr> imported;
        if (!eat_op("*")) {
            const bool parenthesized = eat_op("(");
            do {
                if (parenthesized && cur().is_op(")")) {
                    break;
                }
                if (!is_plain_name(cur())) {
                    fail("invalid syntax");
                    return nullptr;
                }
                auto binding = Node::make(NodeKind::kMember, location_of(cur()));
                binding->name = cur().text;
                auto owner = Node::make(NodeKind::kIdentifier, location_of(module_token));
                owner->name = module;
                binding->add(std::move(owner));
                imported.push_back(std::move(binding));
                next();
                if (eat_name("as")) {
                    if (!is_plain_name(cur())) {
                        fail("invalid syntax");
                        return nullptr;
                    }
                    next();
                }
            } while (eat_op(","));
            if (parenthesized && !expect_op(")")) {
                return nullptr;
            }
        }
        add_module(*node, std::move(module), module_token);
        for (auto& binding : imported) {
            node->add(std::move(binding));
        }
        return node;
    }

    /// `:` followed by an indented suite or simple statements on the same line
    NodePtr parse_block()
    {
        const Token& colon = cur();
        if (!expect_op(":")) {
            return nullptr;
        }
        auto block = Node::make(NodeKind::kBlock, location_of(colon));
        if (!eat(TokenKind::kNewline)) {
            parse_simple_statements(*block);
            return m_failed ? nullptr : std::move(block);
        }
        if (!eat(TokenKind::kIndent)) {
            fail("expected an indented block");
            return nullptr;
        }
        while (!m_failed && !at(TokenKind::kDedent) && !at(TokenKind::kEnd)) {
            if (eat(TokenKind::kNewline)) {
                continue;
            }
            parse_statement(*block);
        }
        eat(TokenKind::kDedent);
        return m_failed ? nullptr : std::move(block);
    }

    NodePtr parse_if()
    {
        auto node = Node::make(NodeKind::kIf, location_of(cur()));
        next();
        node->test = parse_named_expression();
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_name("elif")) {
            node->add(parse_if());
        } else if (eat_name("else")) {
            node->add(parse_block());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_while()
    {
        auto node = Node::make(NodeKind::kWhile, location_of(cur()));
        next();
        node->test = parse_named_expression();
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        if (!m_failed && eat_name("else")) {
            node->add(parse_block());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_for()
    {
        auto node = Node::make(NodeKind::kForIn, location_of(cur()));
        next();
        node->add(parse_targets());
        if (m_failed) {
            return nullptr;
        }
        if (!eat_name("in")) {
            fail("invalid syntax");
            return nullptr;
        }
        node->add(parse_star_expressions());
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        if (!m_failed && eat_name("else")) {
            node->add(parse_block());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_try()
    {
        auto node = Node::make(NodeKind::kTry, location_of(cur()));
        next();
        node->add(parse_block());
        bool handled = false;
        while (!m_failed && cur().is_name("except")) {
            handled = true;
            auto handler = Node::make(NodeKind::kBlock, location_of(cur()));
            next();
            eat_op("*");
            if (!cur().is_op(":")) {
                handler->test = parse_expression();
                if (m_failed) {
                    return nullptr;
                }
                if (cur().is_op(",")) {
                    auto types = Node::make(NodeKind::kArray, handler->test->location);
                    types->add(std::move(handler->test));
                    while (!m_failed && eat_op(",")) {
                        types->add(parse_expression());
                    }
                    handler->test = std::move(types);
                }
                if (!m_failed && eat_name("as") && !is_plain_name(cur())) {
                    fail("invalid syntax");
                }
                if (!m_failed && is_plain_name(cur())) {
                    next();
                }
            }
            if (m_failed) {
                return nullptr;
            }
            handler->add(parse_block());
            node->add(std::move(handler));
        }
        if (!m_failed && handled && eat_name("else")) {
            node->add(parse_block());
        }
        if (!m_failed && eat_name("finally")) {
            handled = true;
            node->add(parse_block());
        }
        if (!m_failed && !handled) {
            fail("expected 'except' or 'finally' block");
        }
        return m_failed ? nullptr : std::move(node);
    }

    void parse_with_items(Node& with, std::string_view terminator)
    {
        do {
            if (!terminator.empty() && cur().is_op(terminator)) {
                break;
            }
            with.add(parse_expression());
            if (!m_failed && eat_name("as")) {
                with.add(parse_target());
            }
        } while (!m_failed && eat_op(","));
    }

    NodePtr parse_with()
    {
        auto node = Node::make(NodeKind::kWith, location_of(cur()));
        next();
        bool parsed = false;
        if (cur().is_op("(")) {
            // `with (a as b, c as d):` form; rewind if it was a parenthesized expression
            const auto saved = m_index;
            next();
            parse_with_items(*node, ")");
            if (!m_failed && eat_op(")") && cur().is_op(":")) {
                parsed = true;
            } else {
                m_failed = false;
                m_error.clear();
                m_index = saved;
                node->children.clear();
            }
        }
        if (!parsed) {
            parse_with_items(*node, {});
        }
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        return m_failed ? nullptr : std::move(node);
    }

    void skip_type_parameters()
    {
        int depth = 0;
        do {
            if (cur().is_op("[")) {
                ++depth;
            } else if (cur().is_op("]")) {
                --depth;
            }
            next();
        } while (depth > 0 && !at(TokenKind::kEnd));
    }

    void parse_parameters(Node& function, std::string_view closer, bool annotations)
    {
        while (!m_failed && !cur().is_op(closer)) {
            if (eat_op("/")) {
                if (!eat_op(",")) {
                    break;
                }
                continue;
            }
            const bool star = cur().is_op("*") || cur().is_op("**");
            if (star) {
                next();
                if (cur().is_op(",")) {
                    next();
                    continue;
                }
            }
            if (!is_plain_name(cur())) {
                fail("invalid syntax");
                return;
            }
            auto param = make_name(cur());
            if (star) {
                auto spread = Node::make(NodeKind::kSpread, param->location);
                spread->add(std::move(param));
                param = std::move(spread);
            }
            function.add(std::move(param));
            if (annotations && eat_op(":")) {
                function.add(parse_star_expression());
            }
            if (!m_failed && eat_op("=")) {
                function.add(parse_expression());
            }
            if (m_failed || !eat_op(",")) {
                break;
            }
        }
    }

    NodePtr parse_def()
    {
        auto node = Node::make(NodeKind::kFunctionDecl, location_of(cur()));
        next();
        if (!is_plain_name(cur())) {
            fail("invalid syntax");
            return nullptr;
        }
        node->name = cur().text;
        next();
        if (cur().is_op("[")) {
            skip_type_parameters();
        }
        if (!expect_op("(")) {
            return nullptr;
        }
        parse_parameters(*node, ")", true);
        if (m_failed || !expect_op(")")) {
            return nullptr;
        }
        if (eat_op("->")) {
            node->add(parse_expression());
        }
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_class()
    {
        auto node = Node::make(NodeKind::kClassDecl, location_of(cur()));
        next();
        if (!is_plain_name(cur())) {
            fail("invalid syntax");
            return nullptr;
        }
        node->name = cur().text;
        next();
        if (cur().is_op("[")) {
            skip_type_parameters();
        }
        if (cur().is_op("(")) {
            parse_arguments(*node);
        }
        if (m_failed) {
            return nullptr;
        }
        node->add(parse_block());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_decorated()
    {
        std::vector<NodePtr> decorators;
        while (!m_failed && eat_op("@")) {
            decorators.push_back(parse_named_expression());
            if (!m_failed && !eat(TokenKind::kNewline)) {
                fail("invalid syntax");
            }
        }
        if (m_failed) {
            return nullptr;
        }
        eat_name("async");
        NodePtr target;
        if (cur().is_name("def")) {
            target = parse_def();
        } else if (cur().is_name("class")) {
            target = parse_class();
        } else {
            fail("invalid syntax");
        }
        if (m_failed) {
            return nullptr;
        }
        for (auto& decorator : decorators) {
            target->add(std::move(decorator));
        }
        return target;
    }

    /// `match` is a soft keyword: only a statement when `match <expr>:` ends the line
    [[nodiscard]] bool looks_like_match() const noexcept
    {
        const Token& following = peek();
        if (following.kind == TokenKind::kNewline || following.kind == TokenKind::kEnd) {
            return false;
        }
        if (following.kind == TokenKind::kOperator && !following.is_op("(")
            && !following.is_op("[") && !following.is_op("{") && !following.is_op("-")
            && !following.is_op("*")) {
            return false;
        }
        int depth = 0;
        for (std::size_t i = m_index + 1; i < m_tokens.size(); ++i) {
            const Token& token = m_tokens[i];
            if (token.kind == TokenKind::kNewline || token.kind == TokenKind::kEnd) {
                return false;
            }
            if (token.is_op("(") || token.is_op("[") || token.is_op("{")) {
                ++depth;
            } else if (token.is_op(")") || token.is_op("]") || token.is_op("}")) {
                --depth;
            } else if (depth == 0 && token.is_op(":")) {
                return m_tokens[i + 1].kind == TokenKind::kNewline;
            }
        }
        return false;
    }

    NodePtr parse_match()
    {
        auto node = Node::make(NodeKind::kSwitch, location_of(cur()));
        next();
        node->test = parse_star_expressions();
        if (m_failed || !expect_op(":")) {
            return nullptr;
        }
        if (!eat(TokenKind::kNewline) || !eat(TokenKind::kIndent)) {
            fail("expected an indented block");
            return nullptr;
        }
        while (!m_failed && cur().is_name("case")) {
            auto clause = Node::make(NodeKind::kBlock, location_of(cur()));
            next();
            int depth = 0;
            while (!at(TokenKind::kEnd) && !at(TokenKind::kNewline)) {
                if (depth == 0 && (cur().is_op(":") || cur().is_name("if"))) {
                    break;
                }
                if (cur().is_op("(") || cur().is_op("[") || cur().is_op("{")) {
                    ++depth;
                } else if (cur().is_op(")") || cur().is_op("]") || cur().is_op("}")) {
                    --depth;
                }
                next();
            }
            if (eat_name("if")) {
                clause->test = parse_named_expression();
            }
            if (m_failed) {
                return nullptr;
            }
            clause->add(parse_block());
            node->add(std::move(clause));
            while (eat(TokenKind::kNewline)) {
            }
        }
        if (!m_failed && !eat(TokenKind::kDedent) && !at(TokenKind::kEnd)) {
            fail("invalid syntax");
        }
        return m_failed ? nullptr : std::move(node);
    }

    // ------------------------------------------------------------------
    // Expressions
    // ------------------------------------------------------------------

    [[nodiscard]] bool at_expression_end() const noexcept
    {
        const Token& token = cur();
        return token.kind == TokenKind::kNewline || token.kind == TokenKind::kEnd
               || token.is_op(")") || token.is_op("]") || token.is_op("}") || token.is_op("=")
               || token.is_op(":") || token.is_op(";") || token.is_name("in")
               || (token.kind == TokenKind::kOperator
                   && std::ranges::find(kAugmentedAssignments, token.text)
                          != kAugmentedAssignments.end());
    }

    /// Comma-separated list; a trailing comma or several items make a tuple
    template <typename ParseItem>
    NodePtr parse_tuple_list(ParseItem&& parse_item)
    {
        auto first = parse_item();
        if (m_failed || !cur().is_op(",")) {
            return first;
        }
        auto tuple = Node::make(NodeKind::kArray, first->location);
        tuple->name = "tuple";
        tuple->add(std::move(first));
        while (!m_failed && eat_op(",")) {
            if (at_expression_end()) {
                break;
            }
            tuple->add(parse_item());
        }
        return m_failed ? nullptr : std::move(tuple);
    }

    NodePtr parse_star_expressions()
    {
        return parse_tuple_list([this] { return parse_star_expression(); });
    }

    NodePtr parse_targets()
    {
        return parse_tuple_list([this] { return parse_target(); });
    }

    NodePtr parse_target()
    {
        if (cur().is_op("*")) {
            auto spread = Node::make(NodeKind::kSpread, location_of(cur()));
            next();
            spread->add(parse_arithmetic(1));
            return m_failed ? nullptr : std::move(spread);
        }
        return parse_arithmetic(1);
    }

    NodePtr parse_star_expression()
    {
        if (cur().is_op("*")) {
            auto spread = Node::make(NodeKind::kSpread, location_of(cur()));
            next();
            spread->add(parse_arithmetic(1));
            return m_failed ? nullptr : std::move(spread);
        }
        return parse_named_expression();
    }

    NodePtr parse_named_expression()
    {
        if (is_plain_name(cur()) && peek().is_op(":=")) {
            auto node = Node::make(NodeKind::kAssign, location_of(cur()));
            node->name = ":=";
            node->add(make_name(cur()));
            next();
            node->add(parse_expression());
            return m_failed ? nullptr : std::move(node);
        }
        return parse_expression();
    }

    NodePtr parse_yield()
    {
        auto node = Node::make(NodeKind::kYield, location_of(cur()));
        next();
        if (eat_name("from")) {
            node->add(parse_expression());
        } else if (!at_expression_end() && !cur().is_op(",")) {
            node->add(parse_star_expressions());
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_expression()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_name("lambda")) {
            return parse_lambda();
        }
        auto body = parse_disjunction();
        if (m_failed || !cur().is_name("if")) {
            return body;
        }
        auto node = Node::make(NodeKind::kConditional, location_of(cur()));
        next();
        node->test = parse_disjunction();
        if (m_failed) {
            return nullptr;
        }
        if (!eat_name("else")) {
            fail("expected 'else' after 'if' expression");
            return nullptr;
        }
        node->add(std::move(body));
        node->add(parse_expression());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_lambda()
    {
        auto node = Node::make(NodeKind::kLambda, location_of(cur()));
        next();
        parse_parameters(*node, ":", false);
        if (m_failed || !expect_op(":")) {
            return nullptr;
        }
        node->add(parse_expression());
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr make_binary(const Token& op, std::string name, NodePtr left, NodePtr right)
    {
        auto node = Node::make(NodeKind::kBinary, location_of(op));
        node->name = std::move(name);
        node->add(std::move(left));
        node->add(std::move(right));
        return node;
    }

    NodePtr parse_disjunction()
    {
        auto left = parse_conjunction();
        while (!m_failed && cur().is_name("or")) {
            const Token& op = cur();
            next();
            auto right = parse_conjunction();
            left = make_binary(op, "or", std::move(left), std::move(right));
        }
        return m_failed ? nullptr : std::move(left);
    }

    NodePtr parse_conjunction()
    {
        auto left = parse_inversion();
        while (!m_failed && cur().is_name("and")) {
            const Token& op = cur();
            next();
            auto right = parse_inversion();
            left = make_binary(op, "and", std::move(left), std::move(right));
        }
        return m_failed ? nullptr : std::move(left);
    }

    NodePtr parse_inversion()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_name("not")) {
            auto node = Node::make(NodeKind::kUnary, location_of(cur()));
            node->name = "not";
            next();
            node->add(parse_inversion());
            return m_failed ? nullptr : std::move(node);
        }
        return parse_comparison();
    }

    /// Returns the comparison operator at the cursor (consuming it) or an empty string
    std::string take_comparison_operator()
    {
        const Token& token = cur();
        if (token.kind == TokenKind::kOperator
            && (token.text == "<" || token.text == ">" || token.text == "==" || token.text == ">="
                || token.text == "<=" || token.text == "!=" || token.text == "<>")) {
            std::string op = token.text;
            next();
            return op;
        }
        if (token.is_name("in")) {
            next();
            return "in";
        }
        if (token.is_name("not") && peek().is_name("in")) {
            next();
            next();
            return "not in";
        }
        if (token.is_name("is")) {
            next();
            return eat_name("not") ? "is not" : "is";
        }
        return {};
    }

    NodePtr parse_comparison()
    {
        auto left = parse_arithmetic(1);
        while (!m_failed) {
            const Token& op_token = cur();
            auto op = take_comparison_operator();
            if (op.empty()) {
                break;
            }
            auto right = parse_arithmetic(1);
            left = make_binary(op_token, std::move(op), std::move(left), std::move(right));
        }
        return m_failed ? nullptr : std::move(left);
    }

    NodePtr parse_arithmetic(int min_precedence)
    {
        auto left = parse_factor();
        while (!m_failed) {
            const Token& op = cur();
            const int precedence = arithmetic_precedence(op);
            if (precedence == 0 || precedence < min_precedence) {
                break;
            }
            next();
            auto right = parse_arithmetic(precedence + 1);
            left = make_binary(op, op.text, std::move(left), std::move(right));
        }
        return m_failed ? nullptr : std::move(left);
    }

    NodePtr parse_factor()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_op("+") || cur().is_op("-") || cur().is_op("~")) {
            auto node = Node::make(NodeKind::kUnary, location_of(cur()));
            node->name = cur().text;
            next();
            node->add(parse_factor());
            return m_failed ? nullptr : std::move(node);
        }
        return parse_power();
    }

    NodePtr parse_power()
    {
        NodePtr base;
        if (cur().is_name("await")) {
            base = Node::make(NodeKind::kAwait, location_of(cur()));
            next();
            base->add(parse_primary());
        } else {
            base = parse_primary();
        }
        if (m_failed || !cur().is_op("**")) {
            return m_failed ? nullptr : std::move(base);
        }
        const Token& op = cur();
        next();
        auto exponent = parse_factor();
        return m_failed ? nullptr : make_binary(op, "**", std::move(base), std::move(exponent));
    }

    NodePtr parse_primary()
    {
        auto expr = parse_atom();
        while (!m_failed) {
            const Token& token = cur();
            if (token.is_op(".")) {
                next();
                if (cur().kind != TokenKind::kName) {
                    fail("invalid syntax");
                    return nullptr;
                }
                auto member = Node::make(NodeKind::kMember, location_of(cur()));
                member->name = cur().text;
                member->add(std::move(expr));
                next();
                expr = std::move(member);
                continue;
            }
            if (token.is_op("(")) {
                auto call = Node::make(NodeKind::kCall, expr->location);
                if (expr->kind == NodeKind::kIdentifier || expr->kind == NodeKind::kMember) {
                    call->name = expr->name;
                }
                call->add(std::move(expr));
                parse_arguments(*call);
                expr = std::move(call);
                continue;
            }
            if (token.is_op("[")) {
                auto member = Node::make(NodeKind::kMember, location_of(token));
                next();
                member->add(std::move(expr));
                auto index = parse_subscript();
                if (m_failed || !expect_op("]")) {
                    return nullptr;
                }
                if (index->kind == NodeKind::kLiteral && index->literal == LiteralKind::kString) {
                    member->name = index->text;
                }
                member->add(std::move(index));
                expr = std::move(member);
                continue;
            }
            break;
        }
        return m_failed ? nullptr : std::move(expr);
    }

    NodePtr parse_slice()
    {
        const Token& start = cur();
        NodePtr lower;
        if (!cur().is_op(":")) {
            lower = parse_star_expression();
            if (m_failed || !cur().is_op(":")) {
                return lower;
            }
        }
        auto slice = Node::make(NodeKind::kOther, location_of(start));
        slice->name = "slice";
        slice->add(std::move(lower));
        for (int part = 0; part < 2 && eat_op(":"); ++part) {
            if (!cur().is_op(":") && !cur().is_op("]") && !cur().is_op(",")) {
                slice->add(parse_expression());
            }
        }
        return m_failed ? nullptr : std::move(slice);
    }

    NodePtr parse_subscript()
    {
        return parse_tuple_list([this] { return parse_slice(); });
    }

    void parse_arguments(Node& call)
    {
        if (!expect_op("(")) {
            return;
        }
        while (!m_failed && !cur().is_op(")")) {
            const Token& start = cur();
            if (start.is_op("*") || start.is_op("**")) {
                const bool positional = start.is_op("*");
                auto spread = Node::make(NodeKind::kSpread, location_of(start));
                spread->name = start.text;
                next();
                spread->add(parse_expression());
                call.add(std::move(spread));
                if (positional) {
                    ++call.argument_count;
                }
            } else if (is_plain_name(start) && peek().is_op("=")) {
                auto keyword = Node::make(NodeKind::kAssign, location_of(start));
                keyword->name = "=";
                keyword->add(make_name(start));
                next();
                keyword->add(parse_expression());
                call.add(std::move(keyword));
            } else {
                auto argument = parse_named_expression();
                if (!m_failed && (cur().is_name("for") || cur().is_name("async"))) {
                    argument = parse_comprehension(std::move(argument), nullptr);
                }
                call.add(std::move(argument));
                ++call.argument_count;
            }
            if (m_failed || !eat_op(",")) {
                break;
            }
        }
        expect_op(")");
    }

    /// `element [value] for targets in iterable [if cond]...`
    NodePtr parse_comprehension(NodePtr element, NodePtr value)
    {
        auto node = Node::make(NodeKind::kComprehension, element->location);
        node->add(std::move(element));
        node->add(std::move(value));
        while (!m_failed && (cur().is_name("for") || cur().is_name("async"))) {
            eat_name("async");
            if (!eat_name("for")) {
                fail("invalid syntax");
                return nullptr;
            }
            node->add(parse_targets());
            if (m_failed || !eat_name("in")) {
                fail("invalid syntax");
                return nullptr;
            }
            node->add(parse_disjunction());
            while (!m_failed && eat_name("if")) {
                node->add(parse_disjunction());
            }
        }
        return m_failed ? nullptr : std::move(node);
    }

    NodePtr parse_atom()
    {
        DepthGuard guard(*this);
        if (m_failed) {
            return nullptr;
        }
        const Token& token = cur();
        switch (token.kind) {
            case TokenKind::kNumber: {
                auto literal = Node::make(NodeKind::kLiteral, location_of(token));
                literal->literal = LiteralKind::kNumber;
                literal->text = token.text;
                next();
                return literal;
            }
            case TokenKind::kString:
                return parse_strings();
            case TokenKind::kName:
                return parse_name_atom();
            case TokenKind::kOperator:
                if (token.is_op("(")) {
                    return parse_parenthesized();
                }
                if (token.is_op("[")) {
                    return parse_list();
                }
                if (token.is_op("{")) {
                    return parse_dict_or_set();
                }
                if (token.is_op("...")) {
                    auto ellipsis = Node::make(NodeKind::kLiteral, location_of(token));
                    ellipsis->text = "...";
                    next();
                    return ellipsis;
                }
                break;
            case TokenKind::kNewline:
            case TokenKind::kIndent:
            case TokenKind::kDedent:
            case TokenKind::kEnd:
                break;
        }
        fail("invalid syntax");
        return nullptr;
    }

    NodePtr parse_name_atom()
    {
        const Token& token = cur();
        if (token.text == "True" || token.text == "False") {
            auto literal = Node::make(NodeKind::kLiteral, location_of(token));
            literal->literal = LiteralKind::kBoolean;
            literal->text = token.text;
            next();
            return literal;
        }
        if (token.text == "None") {
            auto literal = Node::make(NodeKind::kLiteral, location_of(token));
            literal->literal = LiteralKind::kNull;
            literal->text = token.text;
            next();
            return literal;
        }
        if (is_keyword(token.text)) {
            fail("invalid syntax");
            return nullptr;
        }
        return make_name(token);
    }

    /// Adjacent literals concatenate; any f-string part makes the whole a template
    NodePtr parse_strings()
    {
        const Token& first = cur();
        std::string value;
        std::vector<NodePtr> fields;
        bool formatted = false;
        while (at(TokenKind::kString)) {
            const Token& token = cur();
            value += token.text;
            formatted = formatted || token.formatted;
            for (const auto& span : token.fields) {
                auto field = parse_field(span);
                if (m_failed) {
                    return nullptr;
                }
                fields.push_back(std::move(field));
            }
            next();
        }
        auto node = Node::make(formatted ? NodeKind::kTemplate : NodeKind::kLiteral, location_of(first));
        node->literal = formatted ? LiteralKind::kNone : LiteralKind::kString;
        node->text = std::move(value);
        for (auto& field : fields) {
            node->add(std::move(field));
        }
        return node;
    }

    NodePtr parse_field(const FieldSpan& span)
    {
        auto tokens = tokenize_expression(m_source, span);
        if (!tokens) {
            fail(tokens.error().message);
            return nullptr;
        }
        Parser inner(m_source, std::move(*tokens), m_depth);
        auto expr = inner.parse_field_expression();
        if (inner.failed()) {
            fail(inner.error());
            return nullptr;
        }
        return expr;
    }

    NodePtr parse_parenthesized()
    {
        const Token& open = cur();
        next();
        if (eat_op(")")) {
            auto tuple = Node::make(NodeKind::kArray, location_of(open));
            tuple->name = "tuple";
            return tuple;
        }
        if (cur().is_name("yield")) {
            auto yield = parse_yield();
            if (m_failed || !expect_op(")")) {
                return nullptr;
            }
            return yield;
        }
        auto first = parse_star_expression();
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_name("for") || cur().is_name("async")) {
            auto generator = parse_comprehension(std::move(first), nullptr);
            if (m_failed || !expect_op(")")) {
                return nullptr;
            }
            return generator;
        }
        if (eat_op(")")) {
            return first;
        }
        auto tuple = Node::make(NodeKind::kArray, location_of(open));
        tuple->name = "tuple";
        tuple->add(std::move(first));
        while (!m_failed && eat_op(",")) {
            if (cur().is_op(")")) {
                break;
            }
            tuple->add(parse_star_expression());
        }
        if (m_failed || !expect_op(")")) {
            return nullptr;
        }
        return tuple;
    }

    NodePtr parse_list()
    {
        const Token& open = cur();
        next();
        auto list = Node::make(NodeKind::kArray, location_of(open));
        if (eat_op("]")) {
            return list;
        }
        auto first = parse_star_expression();
        if (m_failed) {
            return nullptr;
        }
        if (cur().is_name("for") || cur().is_name("async")) {
            auto comprehension = parse_comprehension(std::move(first), nullptr);
            if (m_failed || !expect_op("]")) {
                return nullptr;
            }
            return comprehension;
        }
        list->add(std::move(first));
        while (!m_failed && eat_op(",")) {
            if (cur().is_op("]")) {
                break;
            }
            list->add(parse_star_expression());
        }
        if (m_failed || !expect_op("]")) {
            return nullptr;
        }
        return list;
    }

    NodePtr parse_dict_or_set()
    {
        const Token& open = cur();
        next();
        auto node = Node::make(NodeKind::kObject, location_of(open));
        if (eat_op("}")) {
            return node;
        }
        bool first_entry = true;
        while (!m_failed && !cur().is_op("}")) {
            if (eat_op("**")) {
                auto spread = Node::make(NodeKind::kSpread, location_of(cur()));
                spread->name = "**";
                spread->add(parse_arithmetic(1));
                node->add(std::move(spread));
            } else {
                auto key = parse_star_expression();
                NodePtr value;
                if (!m_failed && eat_op(":")) {
                    value = parse_expression();
                }
                if (m_failed) {
                    return nullptr;
                }
                if (first_entry && (cur().is_name("for") || cur().is_name("async"))) {
                    auto comprehension = parse_comprehension(std::move(key), std::move(value));
                    if (m_failed || !expect_op("}")) {
                        return nullptr;
                    }
                    return comprehension;
                }
                node->add(std::move(key));
                node->add(std::move(value));
            }
            first_entry = false;
            if (m_failed || !eat_op(",")) {
                break;
            }
        }
        if (m_failed || !expect_op("}")) {
            return nullptr;
        }
        return node;
    }

    std::string_view m_source;
    std::vector<Token> m_tokens;
    std::size_t m_index = 0;
    int m_depth;
    bool m_failed = false;
    std::string m_error;
};

}  // namespace

secbox::Result<std::unique_ptr<ast::Node>> parse(std::string_view source)
{
    auto tokens = tokenize(source);
    if (!tokens) {
        return std::unexpected(tokens.error());
    }
    Parser parser(source, std::move(*tokens), 0);
    auto module = parser.parse_module();
    if (parser.failed()) {
        return std::unexpected(Error::make("SyntaxError", parser.error()));
    }
    return module;
}

}  // namespace secbox::analyzer::py
