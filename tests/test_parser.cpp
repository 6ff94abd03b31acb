/**
 * Parser Tests - Precedence, Statement Forms, Syntax Errors, Printing
 */

#undef NDEBUG
#include "parser/ast_printer.hpp"
#include "parser/parser.hpp"
#include "parser/scanner.hpp"
#include <cassert>
#include <iostream>
#include <string>

using namespace luna::parser;

Block parse(const std::string& source) {
    Scanner scanner(source);
    Parser parser(scanner);
    return parser.parseChunk();
}

// Parse then print back in canonical form
std::string canonical(const std::string& source) {
    return toSource(parse(source));
}

std::string syntaxError(const std::string& source) {
    auto error = checkSyntax(source);
    assert(error.has_value() && "Source should be rejected");
    return *error;
}

void test_precedence() {
    std::cout << "=== Test: Operator Precedence ===\n";

    assert(canonical("return 1 + 2 * 3") == "return (1 + (2 * 3))");
    assert(canonical("return 1 - 2 - 3") == "return ((1 - 2) - 3)");
    assert(canonical("return a or b and c") == "return (a or (b and c))");
    assert(canonical("return not a == b") == "return ((not a) == b)");
    assert(canonical("return #t + 1") == "return ((#t) + 1)");
    assert(canonical("return a .. b == c") == "return ((a .. b) == c)");
    assert(canonical("return 1 + 2 .. 3") == "return ((1 + 2) .. 3)");
    assert(canonical("return 7 % 3 * 2") == "return ((7 % 3) * 2)");

    std::cout << canonical("return 1 + 2 * 3 ^ 2") << "\n";
    std::cout << "✓ Precedence levels correct\n";
}

void test_associativity() {
    std::cout << "\n=== Test: Associativity ===\n";

    assert(canonical("return a .. b .. c") == "return (a .. (b .. c))");
    assert(canonical("return 2 ^ 3 ^ 2") == "return (2 ^ (3 ^ 2))");
    assert(canonical("return -2 ^ 2") == "return (-(2 ^ 2))");
    assert(canonical("return 2 ^ -3") == "return (2 ^ (-3))");
    assert(canonical("return - -x") == "return (-(-x))");

    std::cout << "✓ Associativity correct\n";
}

void test_comparison_chaining() {
    std::cout << "\n=== Test: Comparison Chaining ===\n";

    assert(canonical("return a < b < c") == "return ((a < b) < c)");
    assert(canonical("return a >= b ~= c") == "return ((a >= b) ~= c)");
    assert(canonical("return 1 <= 2 > 3") == "return ((1 <= 2) > 3)");

    std::cout << "✓ Comparisons chain left to right\n";
}

void test_literals() {
    std::cout << "\n=== Test: Literals ===\n";

    Block block = parse("return nil, true, 1.5, 'x', ...");
    assert(block.stats.size() == 1);
    assert(block.stats[0]->is<Return>());
    const auto& ret = block.stats[0]->as<Return>();
    assert(ret.exps.size() == 5);
    assert(ret.exps[0]->as<Lit>().value.isNil());
    assert(ret.exps[1]->as<Lit>().value.asBoolean());
    assert(ret.exps[2]->as<Lit>().value.asNumber() == 1.5);
    assert(ret.exps[3]->as<Lit>().value.asString() == "x");
    assert(ret.exps[4]->as<Var>().name == kVarargs);

    std::cout << "✓ Literals parsed\n";
}

void test_postfix_chains() {
    std::cout << "\n=== Test: Postfix Chains ===\n";

    Block block = parse("a.b:c(1)[2]()");
    assert(block.stats.size() == 1);
    assert(block.stats[0]->is<CallStat>());
    const auto& stat = block.stats[0]->as<CallStat>();
    assert(stat.call->is<FuncCall>());

    const auto& outer = stat.call->as<FuncCall>();
    assert(outer.func->is<Index>());
    const auto& index = outer.func->as<Index>();
    assert(index.table->is<MethCall>());
    assert(index.table->as<MethCall>().method == "c");

    assert(toSource(block) == "a.b:c(1)[2]()");
    assert(canonical("f'str'") == "f(\"str\")");
    assert(canonical("f{1}") == "f({1})");
    assert(canonical("obj:m{}") == "obj:m({})");
    assert(canonical("t['not a name'] = 1") == "t[\"not a name\"] = 1");
    assert(canonical("t['end'] = 1") == "t[\"end\"] = 1");

    std::cout << "✓ Postfix chains left-associate\n";
}

void test_table_constructor() {
    std::cout << "\n=== Test: Table Constructor ===\n";

    Block block = parse("local t = {1, x = 2, [3] = 4; f(),}");
    const auto& local = block.stats[0]->as<Local>();
    const auto& table = local.exps[0]->as<TableConst>();

    assert(table.fields.size() == 4);
    assert(!table.fields[0].key);
    assert(table.fields[1].key->as<Lit>().value.asString() == "x");
    assert(table.fields[2].key->as<Lit>().value.asNumber() == 3);
    assert(!table.fields[3].key);
    assert(table.fields[3].value->isCall());

    assert(toSource(block) == "local t = {1, [\"x\"] = 2, [3] = 4, f()}");

    // A bare name is a positional field, not a key
    Block positional = parse("local t = {x}");
    const auto& single = positional.stats[0]->as<Local>().exps[0]->as<TableConst>();
    assert(single.fields.size() == 1);
    assert(!single.fields[0].key);
    assert(single.fields[0].value->is<Var>());

    std::cout << "✓ Table constructor fields parsed\n";
}

void test_statements() {
    std::cout << "\n=== Test: Statement Forms ===\n";

    assert(canonical("do x = 1 end") == "do x = 1 end");
    assert(canonical("while true do break end") == "while true do break end");
    assert(canonical("repeat x = x + 1 until x > 3") == "repeat x = (x + 1) until (x > 3)");
    assert(canonical("for i = 1, 10 do end") == "for i = 1, 10, 1 do end");
    assert(canonical("for i = 10, 1, -1 do f(i) end") == "for i = 10, 1, (-1) do f(i) end");
    assert(canonical("for k, v in pairs(t) do end") == "for k, v in pairs(t) do end");
    assert(canonical("function a.b.c(x, ...) return ... end") ==
           "function a.b.c(x, ...) return ... end");
    assert(canonical("function a:m(x) return self end") == "function a:m(x) return self end");
    assert(canonical("local function f() end") == "local function f() end");
    assert(canonical("local a, b") == "local a, b");
    assert(canonical("a, b.c = 1, 2") == "a, b.c = 1, 2");
    assert(canonical("return") == "return");
    assert(canonical("return (f())") == "return (f())");
    assert(canonical("return (1 + 2) * 3") == "return ((1 + 2) * 3)");
    assert(canonical("return ('x'):upper()") == "return (\"x\"):upper()");

    std::cout << "✓ Statement forms parsed\n";
}

void test_method_definition() {
    std::cout << "\n=== Test: Method Definition ===\n";

    Block block = parse("function a.b:m(x) end");
    const auto& def = block.stats[0]->as<MethDef>();
    assert(def.names.size() == 2);
    assert(def.method == "m");
    assert(def.body->params.size() == 2);
    assert(def.body->params[0] == "self");
    assert(def.body->params[1] == "x");

    std::cout << "✓ Method definitions take self\n";
}

void test_elseif_nesting() {
    std::cout << "\n=== Test: Elseif Nesting ===\n";

    Block block = parse("if a then b() elseif c then d() else e() end");
    const auto& outer = block.stats[0]->as<If>();
    assert(outer.elseBlock.stats.size() == 1);
    const auto& inner = outer.elseBlock.stats[0]->as<If>();
    assert(inner.elseBlock.stats.size() == 1);

    assert(toSource(block) == "if a then b() else if c then d() else e() end end");

    std::cout << "✓ Elseif nests into the else block\n";
}

void test_separators() {
    std::cout << "\n=== Test: Statement Separators ===\n";

    assert(parse("x = 1; y = 2").stats.size() == 2);
    assert(parse("x = 1;; y = 2;").stats.size() == 2);
    assert(parse(";").stats.empty());
    assert(parse("").stats.empty());
    assert(parse("do ; end").stats.size() == 1);
    assert(parse("if x then return; end").stats.size() == 1);

    std::cout << "✓ Separators tolerated\n";
}

void test_block_entry_point() {
    std::cout << "\n=== Test: Block Entry Point ===\n";

    // parseBlock stops at a terminator without consuming it
    Scanner scanner("x = 1 end");
    Parser parser(scanner);
    Block block = parser.parseBlock();
    assert(block.stats.size() == 1);
    assert(scanner.token().type == TokenType::KW_END);

    std::cout << "✓ parseBlock leaves the terminator\n";
}

void test_syntax_errors() {
    std::cout << "\n=== Test: Syntax Errors ===\n";

    assert(syntaxError("x = = 1") == "syntax error: unexpected token at 4");
    assert(syntaxError("if x then y()") == "syntax error: expected 'end' at 13");
    assert(syntaxError("a b") == "syntax error: expected '=' at 2");
    assert(syntaxError("x = 1 y = 2") == "syntax error: expected end of input at 6");
    assert(syntaxError("x = 1 $") == "syntax error: invalid token '$' at 6");
    assert(syntaxError("local function (x) end") == "syntax error: Name expected at 15");
    assert(syntaxError("a, f() = 1") == "syntax error: cannot assign to this expression at 3");
    assert(syntaxError("for a, b = 1, 2 do end") == "syntax error: only one name before '=' allowed at 9");
    assert(syntaxError("obj:m") == "syntax error: expected arguments after method name at 5");

    assert(syntaxError("(a) = 1") == "syntax error: do, while, repeat, if, for, function, local, "
                                     "call or assignment expected at 0");

    std::string message = syntaxError("1 + 2");
    assert(message.find("at 0") != std::string::npos);

    try {
        parse("while x do");
        assert(false && "Should have thrown");
    } catch (const SyntaxError& e) {
        assert(e.offset == 10);
        assert(e.token.empty());
    }

    try {
        parse("return )");
        assert(false && "Should have thrown");
    } catch (const SyntaxError& e) {
        assert(e.offset == 7);
        assert(e.token == ")");
    }

    assert(!checkSyntax("return 1").has_value());

    std::cout << message << "\n";
    std::cout << "✓ Syntax errors carry offsets\n";
}

void test_printer_round_trip() {
    std::cout << "\n=== Test: Printer Round Trip ===\n";

    const char* sources[] = {
        "function fac(n) if n == 0 then return 1 end; return n * fac(n - 1) end; print(fac(6))",
        "local c = {}; function c:m() return self.b end; c.b = 42; print(c:m())",
        "local t = {1, 2; n = 'a\\tb\\\"c', [f(x)] = -y ^ 2}; return #t, t.n .. \"!\"",
        "for i = 1, 3 do local s = 0.25 + i; while s < 10 do s = s * 2 end end",
        "repeat local x = not (a or b) until x ~= nil",
        "local f = function(a, ...) return ... end; return f(1, 2, 3), (f(4))",
    };

    for (const char* source : sources) {
        std::string once = canonical(source);
        std::string twice = canonical(once);
        assert(once == twice);
    }

    assert(numberLiteral(42) == "42");
    assert(numberLiteral(0.5) == "0.5");
    assert(numberLiteral(0.0001) == "0.0001");
    assert(stringLiteral("a\"b\n") == "\"a\\\"b\\n\"");
    assert(stringLiteral(std::string(1, '\x01')) == "\"\\u0001\"");

    std::cout << canonical(sources[0]) << "\n";
    std::cout << "✓ Printed source reparses to the same tree\n";
}

int main() {
    std::cout << "Parser Test Suite\n";
    std::cout << "=================\n\n";

    try {
        test_precedence();
        test_associativity();
        test_comparison_chaining();
        test_literals();
        test_postfix_chains();
        test_table_constructor();
        test_statements();
        test_method_definition();
        test_elseif_nesting();
        test_separators();
        test_block_entry_point();
        test_syntax_errors();
        test_printer_round_trip();

        std::cout << "\n✅ All parser tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
