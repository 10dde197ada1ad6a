#pragma once

/**
 * @file py_parser.hpp
 * @brief Recursive-descent Python parser lowering into ast::Node
 */

#include "secbox/ast.hpp"
#include "secbox/common.hpp"

#include <memory>
#include <string_view>

namespace secbox::analyzer::py {

/**
 * Parse a Python module.
 * @return Program node, or SyntaxError / IndentationError with "(line:col)"
 */
[[nodiscard]] secbox::Result<std::unique_ptr<ast::Node>> parse(std::string_view source);

}  // namespace secbox::analyzer::py
