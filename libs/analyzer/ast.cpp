/**
 * @file ast.cpp
 * @brief Syntax tree traversal and loop predicates
 */

#include "secbox/ast.hpp"

#include <cctype>

namespace secbox::ast {

namespace {

class NodeCounter final : public AstVisitor
{
public:
    void enter(const Node& node) override
    {
        (void)node;
        ++m_count;
    }

    [[nodiscard]] std::size_t count() const noexcept { return m_count; }

private:
    std::size_t m_count = 0;
};

[[nodiscard]] bool subtree_has_break(const Node& node)
{
    if (node.kind == NodeKind::kBreak) {
        return true;
    }
    if (node.test && subtree_has_break(*node.test)) {
        return true;
    }
    for (const auto& child : node.children) {
        if (subtree_has_break(*child)) {
            return true;
        }
    }
    return false;
}

[[nodiscard]] bool is_zero_number(std::string_view text) noexcept
{
    const bool radix_prefix = text.size() > 2 && text[0] == '0'
                              && std::string_view("xXoObB").contains(text[1]);
    const bool hex = radix_prefix && (text[1] == 'x' || text[1] == 'X');
    bool saw_digit = false;
    for (std::size_t i = radix_prefix ? 2 : 0; i < text.size(); ++i) {
        const auto c = static_cast<unsigned char>(text[i]);
        if (!hex && (c == 'e' || c == 'E')) {
            break;
        }
        if (c == '0') {
            saw_digit = true;
            continue;
        }
        if (std::isdigit(c) != 0 || (hex && std::isxdigit(c) != 0)) {
            return false;
        }
        // separators, decimal point and suffixes (n, j, L) carry no value
    }
    return saw_digit;
}

}  // namespace

std::string_view to_string(NodeKind kind) noexcept
{
    switch (kind) {
        case NodeKind::kProgram:
            return "Program";
        case NodeKind::kBlock:
            return "Block";
        case NodeKind::kFunctionDecl:
            return "FunctionDeclaration";
        case NodeKind::kFunctionExpr:
            return "FunctionExpression";
        case NodeKind::kArrowFunction:
            return "ArrowFunction";
        case NodeKind::kMethod:
            return "Method";
        case NodeKind::kLambda:
            return "Lambda";
        case NodeKind::kClassDecl:
            return "ClassDeclaration";
        case NodeKind::kClassExpr:
            return "ClassExpression";
        case NodeKind::kImport:
            return "Import";
        case NodeKind::kVarDecl:
            return "VariableDeclaration";
        case NodeKind::kExprStmt:
            return "ExpressionStatement";
        case NodeKind::kIf:
            return "If";
        case NodeKind::kWhile:
            return "While";
        case NodeKind::kDoWhile:
            return "DoWhile";
        case NodeKind::kFor:
            return "For";
        case NodeKind::kForIn:
            return "ForIn";
        case NodeKind::kSwitch:
            return "Switch";
        case NodeKind::kTry:
            return "Try";
        case NodeKind::kWith:
            return "With";
        case NodeKind::kReturn:
            return "Return";
        case NodeKind::kBreak:
            return "Break";
        case NodeKind::kContinue:
            return "Continue";
        case NodeKind::kThrow:
            return "Throw";
        case NodeKind::kLabeled:
            return "Labeled";
        case NodeKind::kCall:
            return "Call";
        case NodeKind::kNew:
            return "New";
        case NodeKind::kMember:
            return "Member";
        case NodeKind::kIdentifier:
            return "Identifier";
        case NodeKind::kLiteral:
            return "Literal";
        case NodeKind::kTemplate:
            return "Template";
        case NodeKind::kArray:
            return "Array";
        case NodeKind::kObject:
            return "Object";
        case NodeKind::kUnary:
            return "Unary";
        case NodeKind::kBinary:
            return "Binary";
        case NodeKind::kAssign:
            return "Assign";
        case NodeKind::kConditional:
            return "Conditional";
        case NodeKind::kSpread:
            return "Spread";
        case NodeKind::kYield:
            return "Yield";
        case NodeKind::kAwait:
            return "Await";
        case NodeKind::kComprehension:
            return "Comprehension";
        case NodeKind::kOther:
            return "Other";
    }
    return "Other";
}

void walk(const Node& root, AstVisitor& visitor)
{
    visitor.enter(root);
    if (root.test) {
        walk(*root.test, visitor);
    }
    for (const auto& child : root.children) {
        walk(*child, visitor);
    }
    visitor.leave(root);
}

std::size_t count_nodes(const Node& root)
{
    NodeCounter counter;
    walk(root, counter);
    return counter.count();
}

bool is_loop(NodeKind kind) noexcept
{
    return kind == NodeKind::kWhile || kind == NodeKind::kDoWhile || kind == NodeKind::kFor
           || kind == NodeKind::kForIn;
}

bool is_function(NodeKind kind) noexcept
{
    return kind == NodeKind::kFunctionDecl || kind == NodeKind::kFunctionExpr
           || kind == NodeKind::kArrowFunction || kind == NodeKind::kMethod;
}

bool is_truthy_literal(const Node& node) noexcept
{
    if (node.kind != NodeKind::kLiteral) {
        return false;
    }
    switch (node.literal) {
        case LiteralKind::kBoolean:
            return node.text == "true" || node.text == "True";
        case LiteralKind::kNumber:
            return !is_zero_number(node.text);
        case LiteralKind::kNone:
        case LiteralKind::kString:
        case LiteralKind::kNull:
        case LiteralKind::kRegex:
            return false;
    }
    return false;
}

bool contains_break(const Node& loop)
{
    for (const auto& child : loop.children) {
        if (subtree_has_break(*child)) {
            return true;
        }
    }
    return false;
}

bool is_infinite_loop(const Node& loop)
{
    bool literal_forever = false;
    switch (loop.kind) {
        case NodeKind::kWhile:
        case NodeKind::kDoWhile:
            literal_forever = loop.test && is_truthy_literal(*loop.test);
            break;
        case NodeKind::kFor:
            literal_forever = !loop.has_header;
            break;
        default:
            return false;
    }
    return literal_forever && !contains_break(loop);
}

}  // namespace secbox::ast
