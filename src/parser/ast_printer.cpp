/**
 * AST Printer Implementation
 */

#include "parser/ast_printer.hpp"
#include <cctype>
#include <cmath>
#include <cstdio>
#include <vector>

namespace luna {
namespace parser {

namespace {

bool isKeyword(const std::string& name) {
    static const char* const keywords[] = {
        "and", "break", "do", "else", "elseif", "end", "false", "for", "function", "if", "in",
        "local", "nil", "not", "or", "repeat", "return", "then", "true", "until", "while"};
    for (const char* keyword : keywords) {
        if (name == keyword) return true;
    }
    return false;
}

bool isIdentifier(const std::string& text) {
    if (text.empty()) return false;
    unsigned char first = static_cast<unsigned char>(text[0]);
    if (!std::isalpha(first) && first != '_') return false;
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        if (!std::isalnum(u) && u != '_') return false;
    }
    return !isKeyword(text);
}

std::string join(const std::vector<std::string>& parts, const char* separator) {
    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += separator;
        out += parts[i];
    }
    return out;
}

// "kw" + " body " + "end", collapsing to "kw end" for an empty body
std::string wrap(const std::string& head, const std::string& body, const std::string& tail) {
    if (body.empty()) return head + " " + tail;
    return head + " " + body + " " + tail;
}

// Literals, function literals and constructors need parentheses
// before a call or index suffix
std::string prefix(const Exp& exp) {
    if (exp.is<Lit>() || exp.is<Func>() || exp.is<TableConst>()) {
        return "(" + toSource(exp) + ")";
    }
    return toSource(exp);
}

// ============================================================================
// Expression Visitor
// ============================================================================

struct ExpPrinter {
    std::string operator()(const Binary& e) const {
        return "(" + toSource(*e.left) + " " + binaryOpSymbol(e.op) + " " + toSource(*e.right) + ")";
    }

    std::string operator()(const Unary& e) const {
        std::string operand = toSource(*e.operand);
        std::string symbol = unaryOpSymbol(e.op);
        if (e.op == UnaryOp::Not) {
            return "(" + symbol + " " + operand + ")";
        }
        // "--" would start a comment
        if (e.op == UnaryOp::Neg && !operand.empty() && operand[0] == '-') {
            return "(- " + operand + ")";
        }
        return "(" + symbol + operand + ")";
    }

    std::string operator()(const Lit& e) const {
        const runtime::Value& v = e.value;
        switch (v.kind()) {
            case runtime::ValueKind::Nil: return "nil";
            case runtime::ValueKind::Boolean: return v.asBoolean() ? "true" : "false";
            case runtime::ValueKind::Number: return numberLiteral(v.asNumber());
            case runtime::ValueKind::String: return stringLiteral(v.asString());
            default:
                // Only the host can put a table or function into a literal
                return v.toString();
        }
    }

    std::string operator()(const Var& e) const { return e.name; }

    std::string operator()(const Index& e) const {
        std::string table = prefix(*e.table);
        if (e.key->is<Lit>()) {
            const runtime::Value& key = e.key->as<Lit>().value;
            if (key.isString() && isIdentifier(key.asString())) {
                return table + "." + key.asString();
            }
        }
        return table + "[" + toSource(*e.key) + "]";
    }

    std::string operator()(const FuncCall& e) const {
        return prefix(*e.func) + "(" + list(e.args) + ")";
    }

    std::string operator()(const MethCall& e) const {
        return prefix(*e.receiver) + ":" + e.method + "(" + list(e.args) + ")";
    }

    std::string operator()(const Func& e) const {
        return wrap("function(" + join(e.body->params, ", ") + ")", toSource(e.body->block), "end");
    }

    std::string operator()(const TableConst& e) const {
        std::vector<std::string> fields;
        for (const auto& field : e.fields) {
            if (field.key) {
                fields.push_back("[" + toSource(*field.key) + "] = " + toSource(*field.value));
            } else {
                fields.push_back(toSource(*field.value));
            }
        }
        return "{" + join(fields, ", ") + "}";
    }

    std::string operator()(const Paren& e) const { return "(" + toSource(*e.exp) + ")"; }

    static std::string list(const ExpList& exps) {
        std::vector<std::string> parts;
        for (const auto& exp : exps) parts.push_back(toSource(*exp));
        return join(parts, ", ");
    }
};

// ============================================================================
// Statement Visitor
// ============================================================================

struct StatPrinter {
    std::string operator()(const Block& s) const { return wrap("do", toSource(s), "end"); }

    std::string operator()(const While& s) const {
        return wrap("while " + toSource(*s.cond) + " do", toSource(s.block), "end");
    }

    std::string operator()(const Repeat& s) const {
        return wrap("repeat", toSource(s.block), "until " + toSource(*s.cond));
    }

    std::string operator()(const If& s) const {
        std::string out = wrap("if " + toSource(*s.cond) + " then", toSource(s.thenBlock), "");
        if (!s.elseBlock.stats.empty()) {
            out = wrap(out + "else", toSource(s.elseBlock), "");
        }
        return out + "end";
    }

    std::string operator()(const NumericFor& s) const {
        std::string head = "for " + s.name + " = " + toSource(*s.start) + ", " + toSource(*s.stop) +
                           ", " + toSource(*s.step) + " do";
        return wrap(head, toSource(s.block), "end");
    }

    std::string operator()(const GenericFor& s) const {
        std::string head = "for " + join(s.names, ", ") + " in " + ExpPrinter::list(s.exps) + " do";
        return wrap(head, toSource(s.block), "end");
    }

    std::string operator()(const FuncDef& s) const {
        return function(join(s.names, "."), s.body->params, s.body->block);
    }

    std::string operator()(const MethDef& s) const {
        // Drop the implicit "self"
        std::vector<std::string> params(s.body->params.begin() + 1, s.body->params.end());
        return function(join(s.names, ".") + ":" + s.method, params, s.body->block);
    }

    std::string operator()(const LocalFuncDef& s) const {
        return "local " + function(s.name, s.body->params, s.body->block);
    }

    std::string operator()(const Local& s) const {
        std::string out = "local " + join(s.names, ", ");
        if (!s.exps.empty()) out += " = " + ExpPrinter::list(s.exps);
        return out;
    }

    std::string operator()(const Return& s) const {
        if (s.exps.empty()) return "return";
        return "return " + ExpPrinter::list(s.exps);
    }

    std::string operator()(const Break&) const { return "break"; }

    std::string operator()(const Assign& s) const {
        return ExpPrinter::list(s.targets) + " = " + ExpPrinter::list(s.exps);
    }

    std::string operator()(const CallStat& s) const { return toSource(*s.call); }

    static std::string function(const std::string& name, const std::vector<std::string>& params,
                                const Block& block) {
        return wrap("function " + name + "(" + join(params, ", ") + ")", toSource(block), "end");
    }
};

} // namespace

// ============================================================================
// Public Interface
// ============================================================================

std::string toSource(const Block& block) {
    std::vector<std::string> stats;
    for (const auto& stat : block.stats) stats.push_back(toSource(*stat));
    return join(stats, "; ");
}

std::string toSource(const Stat& stat) {
    return std::visit(StatPrinter{}, stat.node);
}

std::string toSource(const Exp& exp) {
    return std::visit(ExpPrinter{}, exp.node);
}

std::string numberLiteral(double value) {
    if (std::isnan(value)) return "(0 / 0)";
    if (std::isinf(value)) return value > 0 ? "(1 / 0)" : "(-1 / 0)";
    if (std::signbit(value)) return "(-" + numberLiteral(-value) + ")";

    char buf[64];
    if (value == std::floor(value)) {
        std::vector<char> wide(400);
        std::snprintf(wide.data(), wide.size(), "%.0f", value);
        return wide.data();
    }

    std::snprintf(buf, sizeof(buf), "%.17g", value);
    std::string text = buf;
    if (text.find('e') == std::string::npos) return text;

    // Small magnitudes: spell out the leading zeros instead of an exponent
    int exponent = static_cast<int>(std::floor(std::log10(value)));
    std::vector<char> wide(400);
    std::snprintf(wide.data(), wide.size(), "%.*f", 17 - exponent, value);
    return wide.data();
}

std::string stringLiteral(const std::string& text) {
    std::string out = "\"";
    for (char c : text) {
        unsigned char u = static_cast<unsigned char>(c);
        switch (c) {
            case '"': out += "\\\""; break;
            case '\\': out += "\\\\"; break;
            case '\n': out += "\\n"; break;
            case '\r': out += "\\r"; break;
            case '\t': out += "\\t"; break;
            case '\b': out += "\\b"; break;
            case '\f': out += "\\f"; break;
            default:
                if (u < 0x20 || u == 0x7f) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", u);
                    out += buf;
                } else {
                    out += c;
                }
        }
    }
    out += "\"";
    return out;
}

} // namespace parser
} // namespace luna
