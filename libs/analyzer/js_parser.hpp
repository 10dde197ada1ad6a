#pragma once

/**
 * @file js_parser.hpp
 * @brief Recursive-descent JavaScript/TypeScript parser lowering into ast::Node
 */

#include "secbox/ast.hpp"
#include "secbox/common.hpp"
#include "secbox/types.hpp"

#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace secbox::analyzer::js {

enum class ParseMode {
    kStrict,   ///< first syntax error aborts the parse
    kTolerant  ///< syntax errors are recorded and skipped at statement boundaries
};

struct ParseOutput
{
    std::unique_ptr<ast::Node> program;
    /// Errors recovered from (tolerant mode only)
    std::vector<std::string> errors;
    /// TypeScript: byte ranges holding pure type syntax
    std::vector<SourceRange> type_only_ranges;
    /// TypeScript: constructs with runtime semantics that erasure cannot keep
    std::vector<std::string> erasure_blockers;
};

/**
 * Parse a JavaScript or TypeScript program.
 *
 * Strict mode fails with SyntaxError on the first error. Tolerant mode fails
 * only on lexical errors (LexError) or unbalanced brackets (SyntaxError).
 */
[[nodiscard]] secbox::Result<ParseOutput> parse(std::string_view source,
                                                bool typescript,
                                                ParseMode mode);

}  // namespace secbox::analyzer::js
