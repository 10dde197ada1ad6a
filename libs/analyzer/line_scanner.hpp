#pragma once

/**
 * @file line_scanner.hpp
 * @brief Heuristic Python scanner used when the Python parser rejects a module
 *
 * Statement prefixes (`def`, `class`, `import`/`from`, `for`/`while`, `break`)
 * and call sites are recognised line by line; indentation nests the lines into
 * the same ast::Node tree the parser produces, so loop/break relations survive.
 */

#include "secbox/ast.hpp"
#include "secbox/common.hpp"

#include <memory>
#include <string_view>

namespace secbox::analyzer::py {

/**
 * Scan a module line by line.
 * @return Program node, or SyntaxError naming the unbalanced bracket kinds
 *         ("Mismatched parentheses; Mismatched brackets") or an unterminated
 *         triple-quoted string
 */
[[nodiscard]] secbox::Result<std::unique_ptr<ast::Node>> scan_lines(std::string_view source);

}  // namespace secbox::analyzer::py
