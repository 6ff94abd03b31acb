/**
 * Abstract Syntax Tree - Node Definitions
 *
 * Two disjoint families, each a closed sum type:
 * - Stat: executed for effect
 * - Exp: evaluated to a value; Var and Index are also assignment targets
 *
 * Consumers match exhaustively with std::visit. Nodes are immutable
 * once parsed; function bodies are shared so closures can keep them
 * alive after the tree that declared them is gone.
 */

#pragma once

#include "runtime/value.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <variant>
#include <vector>

namespace luna {
namespace parser {

struct Exp;
struct Stat;

using ExpPtr = std::unique_ptr<Exp>;
using ExpList = std::vector<ExpPtr>;
using StatPtr = std::unique_ptr<Stat>;

// Name of the trailing parameter that collects extra arguments
constexpr const char* kVarargs = "...";

// =============================================================================
// Blocks & Function Bodies
// =============================================================================

/**
 * Sequence of statements
 */
struct Block {
    std::vector<StatPtr> stats;

    Block();
    ~Block();
    Block(Block&&) noexcept;
    Block& operator=(Block&&) noexcept;
};

/**
 * Parameter list + body shared by function literals and definitions
 */
struct FunctionBody {
    std::vector<std::string> params;   // May end with kVarargs
    Block block;

    bool isVararg() const { return !params.empty() && params.back() == kVarargs; }
};

using FunctionBodyPtr = std::shared_ptr<const FunctionBody>;

// =============================================================================
// Expressions
// =============================================================================

enum class BinaryOp {
    Or, And,
    Lt, Gt, Le, Ge, Ne, Eq,
    Concat,
    Add, Sub, Mul, Div, Mod, Pow
};

enum class UnaryOp {
    Not, Neg, Len
};

const char* binaryOpSymbol(BinaryOp op);
const char* unaryOpSymbol(UnaryOp op);

struct Binary {
    BinaryOp op;
    ExpPtr left;
    ExpPtr right;
};

struct Unary {
    UnaryOp op;
    ExpPtr operand;
};

/**
 * nil, true, false, a number or a string
 */
struct Lit {
    runtime::Value value;
};

struct Var {
    std::string name;
};

/**
 * table[key]; table.name is sugar with a string key
 */
struct Index {
    ExpPtr table;
    ExpPtr key;
};

struct FuncCall {
    ExpPtr func;
    ExpList args;
};

/**
 * receiver:method(args)
 */
struct MethCall {
    ExpPtr receiver;
    std::string method;
    ExpList args;
};

/**
 * Function literal
 */
struct Func {
    FunctionBodyPtr body;
};

struct Field {
    ExpPtr key;     // Null for positional fields
    ExpPtr value;
};

struct TableConst {
    std::vector<Field> fields;
};

/**
 * Parenthesized expression - always exactly one value
 */
struct Paren {
    ExpPtr exp;
};

struct Exp {
    using Node = std::variant<Binary, Unary, Lit, Var, Index, FuncCall, MethCall, Func, TableConst, Paren>;

    Node node;
    std::size_t offset;

    template <typename T>
    Exp(T&& n, std::size_t off) : node(std::forward<T>(n)), offset(off) {}

    template <typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template <typename T>
    const T& as() const { return std::get<T>(node); }

    bool isCall() const { return is<FuncCall>() || is<MethCall>(); }
    bool isAssignable() const { return is<Var>() || is<Index>(); }
};

template <typename T>
ExpPtr makeExp(T&& node, std::size_t offset = 0) {
    return std::make_unique<Exp>(std::forward<T>(node), offset);
}

// =============================================================================
// Statements
// =============================================================================

struct While {
    ExpPtr cond;
    Block block;
};

struct Repeat {
    Block block;
    ExpPtr cond;
};

/**
 * if/else; elseif chains nest as an If inside the else block
 */
struct If {
    ExpPtr cond;
    Block thenBlock;
    Block elseBlock;
};

struct NumericFor {
    std::string name;
    ExpPtr start;
    ExpPtr stop;
    ExpPtr step;
    Block block;
};

struct GenericFor {
    std::vector<std::string> names;
    ExpList exps;
    Block block;
};

/**
 * function a.b.c(params) ... end
 */
struct FuncDef {
    std::vector<std::string> names;
    FunctionBodyPtr body;
};

/**
 * function a.b:m(params) ... end - body params start with "self"
 */
struct MethDef {
    std::vector<std::string> names;
    std::string method;
    FunctionBodyPtr body;
};

struct LocalFuncDef {
    std::string name;
    FunctionBodyPtr body;
};

struct Local {
    std::vector<std::string> names;
    ExpList exps;
};

struct Return {
    ExpList exps;
};

struct Break {};

struct Assign {
    ExpList targets;
    ExpList exps;
};

/**
 * Function or method call used as a statement
 */
struct CallStat {
    ExpPtr call;
};

struct Stat {
    using Node = std::variant<Block, While, Repeat, If, NumericFor, GenericFor, FuncDef, MethDef,
                              LocalFuncDef, Local, Return, Break, Assign, CallStat>;

    Node node;
    std::size_t offset;

    template <typename T>
    Stat(T&& n, std::size_t off) : node(std::forward<T>(n)), offset(off) {}

    template <typename T>
    bool is() const { return std::holds_alternative<T>(node); }

    template <typename T>
    const T& as() const { return std::get<T>(node); }
};

template <typename T>
StatPtr makeStat(T&& node, std::size_t offset = 0) {
    return std::make_unique<Stat>(std::forward<T>(node), offset);
}

} // namespace parser
} // namespace luna
