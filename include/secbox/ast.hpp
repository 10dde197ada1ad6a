#pragma once

/**
 * @file ast.hpp
 * @brief Language-neutral syntax tree shared by the JavaScript/TypeScript and
 *        Python front ends
 *
 * Every parser (strict, tolerant, line scanner) lowers into this one tree, so
 * metric extraction and rule evaluation never know which path produced it.
 */

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::ast {

/// Closed set of node kinds; consumers switch over it exhaustively
enum class NodeKind {
    kProgram,
    kBlock,
    // Declarations
    kFunctionDecl,
    kFunctionExpr,
    kArrowFunction,
    kMethod,
    kLambda,
    kClassDecl,
    kClassExpr,
    kImport,
    kVarDecl,
    // Statements
    kExprStmt,
    kIf,
    kWhile,
    kDoWhile,
    kFor,
    kForIn,
    kSwitch,
    kTry,
    kWith,
    kReturn,
    kBreak,
    kContinue,
    kThrow,
    kLabeled,
    // Expressions
    kCall,
    kNew,
    kMember,
    kIdentifier,
    kLiteral,
    kTemplate,
    kArray,
    kObject,
    kUnary,
    kBinary,
    kAssign,
    kConditional,
    kSpread,
    kYield,
    kAwait,
    kComprehension,
    /// Anything without rule or metric relevance (pass, empty statement, ...)
    kOther
};

enum class LiteralKind {
    kNone,
    kBoolean,
    kNumber,
    kString,
    kNull,
    kRegex
};

struct SourceLocation
{
    std::uint32_t line = 1;    ///< 1-based
    std::uint32_t column = 0;  ///< 0-based
    std::size_t offset = 0;    ///< byte offset into the source
};

/**
 * @brief One syntax tree node
 *
 * Field use by kind:
 * - kIdentifier: `name`
 * - kLiteral: `literal`, `text` (string contents or raw number/regex text)
 * - kCall / kNew: `name` = callee identifier or member property, `children[0]` =
 *   callee, remaining children = arguments, `argument_count` = positional arguments
 * - kMember: `name` = property, `children[0]` = object
 * - kImport: `name` = first module, `children` = one kLiteral per imported module,
 *   then for Python `from m import a` one kMember per imported name (object `m`)
 * - kWhile / kDoWhile / kFor / kIf / kConditional: `test` = condition (null for
 *   `for(;;)`), `has_header` = a for loop with any init/test/update clause
 * - kFunction* / kMethod / kClass*: `name` when named
 */
struct Node
{
    NodeKind kind = NodeKind::kOther;
    SourceLocation location{};
    std::string name;
    LiteralKind literal = LiteralKind::kNone;
    std::string text;
    std::unique_ptr<Node> test;
    std::vector<std::unique_ptr<Node>> children;
    std::uint32_t argument_count = 0;
    bool has_header = false;

    [[nodiscard]] static std::unique_ptr<Node> make(NodeKind kind, SourceLocation location)
    {
        auto node = std::make_unique<Node>();
        node->kind = kind;
        node->location = location;
        return node;
    }

    void add(std::unique_ptr<Node> child)
    {
        if (child) {
            children.push_back(std::move(child));
        }
    }
};

[[nodiscard]] std::string_view to_string(NodeKind kind) noexcept;

/**
 * @brief Pre-order visitor; `walk` calls `enter` exactly once per node
 *
 * A loop's `test` is visited before its children.
 */
class AstVisitor
{
public:
    virtual ~AstVisitor() = default;

    virtual void enter(const Node& node) = 0;
    virtual void leave(const Node& node) { (void)node; }
};

void walk(const Node& root, AstVisitor& visitor);

[[nodiscard]] std::size_t count_nodes(const Node& root);

/// True for loop kinds (kWhile, kDoWhile, kFor, kForIn)
[[nodiscard]] bool is_loop(NodeKind kind) noexcept;

/// True for function-like kinds counted as functions in metrics
[[nodiscard]] bool is_function(NodeKind kind) noexcept;

/// True when `node` is a boolean true or non-zero numeric literal
[[nodiscard]] bool is_truthy_literal(const Node& node) noexcept;

/// True when a kBreak appears anywhere inside the loop body (the test excluded)
[[nodiscard]] bool contains_break(const Node& loop);

/**
 * True for `while (<truthy literal>)`, `do ... while (<truthy literal>)` and
 * `for (;;)` loops with no break in their body.
 */
[[nodiscard]] bool is_infinite_loop(const Node& loop);

}  // namespace secbox::ast
