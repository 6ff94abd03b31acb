/**
 * AST Printer
 *
 * Renders an AST back to source text that parses to an equivalent
 * tree. Binary and unary expressions are fully parenthesized, so the
 * output does not depend on precedence; statements are joined by "; ".
 */

#pragma once

#include "parser/ast.hpp"
#include <string>

namespace luna {
namespace parser {

std::string toSource(const Block& block);
std::string toSource(const Stat& stat);
std::string toSource(const Exp& exp);

/**
 * Number literal text; integral values print without a fraction and
 * no form ever uses an exponent
 */
std::string numberLiteral(double value);

/**
 * Double-quoted string literal with escapes
 */
std::string stringLiteral(const std::string& text);

} // namespace parser
} // namespace luna
