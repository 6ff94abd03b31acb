/**
 * AST Implementation
 */

#include "parser/ast.hpp"

namespace luna {
namespace parser {

// Defined here, where Stat is complete
Block::Block() = default;
Block::~Block() = default;
Block::Block(Block&&) noexcept = default;
Block& Block::operator=(Block&&) noexcept = default;

const char* binaryOpSymbol(BinaryOp op) {
    switch (op) {
        case BinaryOp::Or: return "or";
        case BinaryOp::And: return "and";
        case BinaryOp::Lt: return "<";
        case BinaryOp::Gt: return ">";
        case BinaryOp::Le: return "<=";
        case BinaryOp::Ge: return ">=";
        case BinaryOp::Ne: return "~=";
        case BinaryOp::Eq: return "==";
        case BinaryOp::Concat: return "..";
        case BinaryOp::Add: return "+";
        case BinaryOp::Sub: return "-";
        case BinaryOp::Mul: return "*";
        case BinaryOp::Div: return "/";
        case BinaryOp::Mod: return "%";
        case BinaryOp::Pow: return "^";
    }
    return "?";
}

const char* unaryOpSymbol(UnaryOp op) {
    switch (op) {
        case UnaryOp::Not: return "not";
        case UnaryOp::Neg: return "-";
        case UnaryOp::Len: return "#";
    }
    return "?";
}

} // namespace parser
} // namespace luna
