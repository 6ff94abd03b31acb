/**
 * Executor Tests - Validates statement execution and expression evaluation
 */

#undef NDEBUG
#include "executor/executor.hpp"
#include "parser/ast_printer.hpp"
#include "parser/parser.hpp"
#include "runtime/environment.hpp"
#include "runtime/errors.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/table.hpp"
#include <cassert>
#include <iostream>
#include <sstream>
#include <string>
#include <vector>

using namespace luna;
using runtime::ErrorKind;
using runtime::Value;
using runtime::ValueList;

/**
 * Interpreter with a recording print and a setmetatable builtin
 */
class Session {
public:
    explicit Session(runtime::InterpreterConfig config = runtime::InterpreterConfig())
        : interp(config)
    {
        interp.bindBuiltin("print", [this](const ValueList& args) {
            std::string line;
            for (std::size_t i = 0; i < args.size(); ++i) {
                if (i > 0) line += "\t";
                line += args[i].toString();
            }
            printed.push_back(line);
            return ValueList{};
        });
        interp.bindBuiltin("setmetatable", [](const ValueList& args) {
            args[0].asTable()->setMetatable(args[1].isNil() ? nullptr : args[1].asTable());
            return ValueList{args[0]};
        });
    }

    std::vector<std::string> run(const std::string& source) {
        printed.clear();
        interp.run(source);
        return printed;
    }

    runtime::Interpreter interp;
    std::vector<std::string> printed;
};

using Lines = std::vector<std::string>;

ErrorKind runtimeErrorOf(const std::string& source) {
    Session session;
    try {
        session.run(source);
    } catch (const runtime::RuntimeError& e) {
        std::cout << runtime::errorKindName(e.kind) << ": " << e.what() << "\n";
        return e.kind;
    }
    assert(false && "Should have thrown");
    return ErrorKind::OperationUnsupported;
}

void test_literal_evaluation() {
    std::cout << "=== Test: Literal Evaluation ===\n";

    runtime::Interpreter interp;
    executor::Evaluator evaluator(interp);

    const double numbers[] = {0, 1, 2.5, 1e10, 123456789, 0.1, 1e300};
    for (double n : numbers) {
        auto lit = parser::makeExp(parser::Lit{Value::number(n)});
        assert(evaluator.evaluate(*lit, interp.globals()).asNumber() == n);
        assert(interp.run("return " + parser::numberLiteral(n))[0].asNumber() == n);
    }

    std::cout << "✓ Literals evaluate to themselves\n";
}

void test_print_recorder() {
    std::cout << "\n=== Test: Print ===\n";

    Session session;
    assert(session.run("print(3 + 4)") == Lines{"7"});
    assert(session.run("print('a' .. 1 .. 2)") == Lines{"a12"});
    assert(session.run("print(10 / 4, 1 / 0, -1 / 0)") == Lines{"2.5\tinf\t-inf"});
    assert(session.run("print'hi'") == Lines{"hi"});
    assert(session.run("print()") == Lines{""});
    assert(session.run("#!/usr/bin/env luna\nprint(1)") == Lines{"1"});

    std::cout << "✓ Print recorder captures output\n";
}

void test_numeric_for() {
    std::cout << "\n=== Test: Numeric For ===\n";

    Session session;
    assert(session.run("for i = 0, 5 do print(i) end") == (Lines{"0", "1", "2", "3", "4", "5"}));
    assert(session.run("for i = 3, 1, -1 do print(i) end") == (Lines{"3", "2", "1"}));
    assert(session.run("for i = 1, 2, 0.5 do print(i) end") == (Lines{"1", "1.5", "2"}));
    assert(session.run("for i = 5, 1 do print(i) end").empty());

    assert(runtimeErrorOf("for i = 'a', 2 do end") == ErrorKind::InvalidForLoop);
    assert(runtimeErrorOf("for i = 1, 2, nil do end") == ErrorKind::InvalidForLoop);

    std::cout << "✓ Numeric for counts both ways\n";
}

void test_generic_for() {
    std::cout << "\n=== Test: Generic For ===\n";

    Session session;
    Lines out = session.run(
        "local function iter(t, i) i = i + 1; local v = t[i]; if v then return i, v end end; "
        "for i, v in iter, {10, 20, 30}, 0 do print(i, v) end");
    assert(out == (Lines{"1\t10", "2\t20", "3\t30"}));

    // Iterator from a factory call; the call expands to all three values
    out = session.run(
        "local function iter(t, i) i = i + 1; if t[i] then return i end end; "
        "local function each(t) return iter, t, 0 end; "
        "for i in each({'a', 'b'}) do print(i) end");
    assert(out == (Lines{"1", "2"}));

    std::cout << "✓ Generic for drives the iterator protocol\n";
}

void test_recursion() {
    std::cout << "\n=== Test: Recursion ===\n";

    Session session;
    Lines out = session.run(
        "function fac(n) if n == 0 then return 1 end; return n * fac(n - 1) end; print(fac(6))");
    assert(out == Lines{"720"});

    out = session.run(
        "local function fib(n) if n < 2 then return n end; return fib(n - 1) + fib(n - 2) end; "
        "print(fib(15))");
    assert(out == Lines{"610"});

    std::cout << "✓ Recursive functions working\n";
}

void test_multiple_values() {
    std::cout << "\n=== Test: Multiple Values ===\n";

    Session session;
    assert(session.run("function v() return 1, 2 end; local a, b = v(); print(b)") == Lines{"2"});

    // Only the last element expands
    assert(session.run("local function v() return 1, 2 end; local a, b, c = v(), v(); print(a, b, c)") ==
           Lines{"1\t1\t2"});
    assert(session.run("local function v() return 1, 2 end; print(v(), v())") == Lines{"1\t1\t2"});
    assert(session.run("local function v() return 1, 2 end; print(#{v(), v()})") == Lines{"3"});

    // Parentheses truncate to one value
    assert(session.run("local function v() return 1, 2 end; local a, b = (v()); print(a, b)") ==
           Lines{"1\tnil"});
    assert(session.run("local function v() return 1, 2 end; print(#{v(), (v())})") == Lines{"2"});

    // Missing values are nil, extras are dropped
    assert(session.run("local a, b = 1; print(a, b)") == Lines{"1\tnil"});
    assert(session.run("local a = 1, 2; print(a)") == Lines{"1"});
    assert(session.run("local a, b = 1, 2; a, b = b, a; print(a, b)") == Lines{"2\t1"});

    std::cout << "✓ Multi-value expansion follows the last-element rule\n";
}

void test_method_calls() {
    std::cout << "\n=== Test: Method Calls ===\n";

    Session session;
    Lines out = session.run(
        "local c = {}; function c:m() return self.b end; c.b = 42; print(c:m())");
    assert(out == Lines{"42"});

    out = session.run(
        "local account = {balance = 10}; "
        "function account:deposit(n) self.balance = self.balance + n; return self end; "
        "account:deposit(5):deposit(7); "
        "print(account.balance)");
    assert(out == Lines{"22"});

    out = session.run(
        "local ns = {inner = {}}; function ns.inner.twice(x) return x * 2 end; print(ns.inner.twice(4))");
    assert(out == Lines{"8"});

    std::cout << "✓ Method sugar binds self\n";
}

void test_table_length() {
    std::cout << "\n=== Test: Table Length ===\n";

    Session session;
    assert(session.run("print(#{1, [2]=2, [4]=4, n=5})") == Lines{"2"});
    assert(session.run("print(#'hello', #{})") == Lines{"5\t0"});
    // Encoded bytes, not characters
    assert(session.run("print(#'\\u00e9')") == Lines{"2"});
    assert(session.run("local t = {[1] = 'x', 'y'}; print(t[1])") == Lines{"y"});
    assert(runtimeErrorOf("return #5") == ErrorKind::CannotApplyLength);

    std::cout << "✓ Length stops at the first gap\n";
}

void test_round_trip_evaluation() {
    std::cout << "\n=== Test: Printed Expressions Evaluate the Same ===\n";

    const char* expressions[] = {
        "1 + 2 * 3 - 4 / 8",
        "2 ^ 3 ^ 2 % 7",
        "-(3 - 5) * 2",
        "10 % -3 + 0.5",
        "-2 ^ 2",
        "2 ^ -1 - - 4",
        "((1.25))",
    };

    runtime::Interpreter interp;
    for (const char* expression : expressions) {
        std::string source = std::string("return ") + expression;
        std::string printed = parser::toSource(interp.load(source));
        double direct = interp.run(source)[0].asNumber();
        double reprinted = interp.run(printed)[0].asNumber();
        assert(direct == reprinted);
        std::cout << expression << "  =>  " << printed << " = " << direct << "\n";
    }

    std::cout << "✓ Canonical re-print preserves results\n";
}

void test_less_equal_fallback() {
    std::cout << "\n=== Test: <= Through __lt ===\n";

    Session session;
    Lines out = session.run(
        "local mt = {__lt = function(a, b) return a.v < b.v end}; "
        "local one = setmetatable({v = 1}, mt); "
        "local two = setmetatable({v = 2}, mt); "
        "print(one <= two, two <= one, one <= one, one < two, two > one, one >= two)");
    assert(out == Lines{"true\tfalse\ttrue\ttrue\ttrue\tfalse"});

    std::cout << "✓ <= falls back to not (b < a)\n";
}

void test_index_chain() {
    std::cout << "\n=== Test: Chained __index ===\n";

    Session session;
    Lines out = session.run(
        "local base = {greet = 'hello'}; "
        "local middle = setmetatable({}, {__index = base}); "
        "local object = setmetatable({}, {__index = middle}); "
        "print(object.greet, object.missing)");
    assert(out == Lines{"hello\tnil"});

    out = session.run(
        "local proxy = setmetatable({}, {__index = function(t, k) return k .. '?' end}); "
        "print(proxy.what)");
    assert(out == Lines{"what?"});

    std::cout << "✓ Lookups resolve through two levels\n";
}

void test_metamethods_from_scripts() {
    std::cout << "\n=== Test: Metamethods From Scripts ===\n";

    Session session;
    Lines out = session.run(
        "local V = {}; "
        "V.__add = function(a, b) return setmetatable({x = a.x + b.x}, V) end; "
        "V.__eq = function(a, b) return a.x == b.x end; "
        "V.__call = function(self, k) return self.x * k end; "
        "V.__unm = function(a) return setmetatable({x = -a.x}, V) end; "
        "V.__len = function(a) return a.x end; "
        "V.__concat = function(a, b) return 'joined' end; "
        "local p = setmetatable({x = 1}, V); "
        "local q = setmetatable({x = 2}, V); "
        "local r = p + q; "
        "print(r.x, r == setmetatable({x = 3}, V), r(10), (-r).x, #q, p .. 'tail')");
    assert(out == Lines{"3\ttrue\t30\t-3\t2\tjoined"});

    out = session.run(
        "local log = {}; "
        "local t = setmetatable({}, {__newindex = function(t, k, v) log[#log + 1] = k end}); "
        "t.a = 1; t.b = 2; "
        "print(#log, log[1], log[2], t.a)");
    assert(out == Lines{"2\ta\tb\tnil"});

    std::cout << "✓ Script-defined handlers dispatched\n";
}

void test_string_methods() {
    std::cout << "\n=== Test: String Kind Metatable ===\n";

    Session session;
    runtime::Table* methods = session.interp.newTable();
    methods->set(Value::string("upper"), Value::function(session.interp.newFunction([](const ValueList& args) {
        std::string text = args[0].asString();
        for (char& c : text) {
            if (c >= 'a' && c <= 'z') c = static_cast<char>(c - 'a' + 'A');
        }
        return ValueList{Value::string(text)};
    })));
    session.interp.kindMetatable(runtime::ValueKind::String)
        ->set(Value::string("__index"), Value::table(methods));

    assert(session.run("local s = 'abc'; print(s:upper(), ('x'):upper())") == Lines{"ABC\tX"});

    std::cout << "✓ Strings use the shared metatable\n";
}

void test_control_flow() {
    std::cout << "\n=== Test: Break and Return ===\n";

    Session session;
    assert(session.run("local i = 0; while true do i = i + 1; if i == 3 then break end end; print(i)") ==
           Lines{"3"});
    assert(session.run("local i = 0; repeat i = i + 1 until i >= 4; print(i)") == Lines{"4"});

    // Break leaves only the innermost loop
    Lines out = session.run(
        "for i = 1, 2 do for j = 1, 10 do if j > 2 then break end; print(i, j) end end");
    assert(out == (Lines{"1\t1", "1\t2", "2\t1", "2\t2"}));

    // Return passes through loops to the function boundary
    out = session.run(
        "local function find(t, x) for i = 1, #t do while true do if t[i] == x then return i end; break end end; "
        "return nil end; "
        "print(find({5, 6, 7}, 7), find({5}, 9))");
    assert(out == Lines{"3\tnil"});

    // A chunk may return values to the host
    ValueList results = session.interp.run("return 1, 'two'");
    assert(results.size() == 2);
    assert(results[1].asString() == "two");

    std::cout << "✓ Signals consumed by the right construct\n";
}

void test_escaping_break() {
    std::cout << "\n=== Test: Escaping Break ===\n";

    Session session;
    try {
        session.run("local function f() break end; f()");
        assert(false && "Should have thrown");
    } catch (const runtime::ControlFlowError& e) {
        assert(std::string(e.what()) == "break outside of a loop");
    }

    try {
        session.run("break");
        assert(false && "Should have thrown");
    } catch (const runtime::ControlFlowError&) {
    }

    // The raw outcome is visible through execute()
    parser::Block block = session.interp.load("if true then break end");
    executor::Outcome outcome = session.interp.execute(block, session.interp.globals());
    assert(outcome.signal == executor::Signal::Break);

    block = session.interp.load("return 5");
    outcome = session.interp.execute(block, session.interp.globals());
    assert(outcome.signal == executor::Signal::Return);
    assert(outcome.values[0].asNumber() == 5);

    std::cout << "✓ Escaping break reported as a defect\n";
}

void test_varargs() {
    std::cout << "\n=== Test: Varargs ===\n";

    Session session;
    Lines out = session.run(
        "local function pack(first, ...) local rest = ...; return first, #rest, rest[2] end; "
        "print(pack(1, 2, 3, 4))");
    assert(out == Lines{"1\t3\t3"});

    out = session.run("local function count(...) return #... end; print(count(), count(nil, nil, 1))");
    assert(out == Lines{"0\t0"});

    std::cout << "✓ Extra arguments collected into a table\n";
}

void test_short_circuit() {
    std::cout << "\n=== Test: Short Circuit ===\n";

    Session session;
    // `undefined` is never evaluated
    assert(session.run("print(nil or 'default', false and undefined, 1 and 2, 1 or undefined)") ==
           Lines{"default\tfalse\t2\t1"});
    assert(session.run("print(not nil, not 0)") == Lines{"true\tfalse"});

    std::cout << "✓ and/or return the deciding operand\n";
}

void test_comparisons() {
    std::cout << "\n=== Test: Comparisons ===\n";

    Session session;
    assert(session.run("print(1 < 2, 2 <= 1, 3 > 2, 'a' < 'b', 1 == 1, 1 ~= 2, 2 >= 2)") ==
           Lines{"true\tfalse\ttrue\ttrue\ttrue\ttrue\ttrue"});
    assert(session.run("print(1 < 2 == true, {} == {})") == Lines{"true\tfalse"});

    // Chains compare a boolean with the next operand
    assert(runtimeErrorOf("return 1 < 2 < 3") == ErrorKind::CannotCompare);

    std::cout << "✓ Comparisons working\n";
}

void test_runtime_errors() {
    std::cout << "\n=== Test: Runtime Errors ===\n";

    assert(runtimeErrorOf("local t = nil; return t.x") == ErrorKind::CannotIndex);
    assert(runtimeErrorOf("return {} + 1") == ErrorKind::OperationUnsupported);
    assert(runtimeErrorOf("local x = 5; x()") == ErrorKind::NotCallable);
    assert(runtimeErrorOf("return missing") == ErrorKind::UnknownVariable);
    assert(runtimeErrorOf("local t = {}; t[nil] = 1") == ErrorKind::InvalidTableKey);

    // Builtin failures propagate unchanged
    Session session;
    session.interp.bindBuiltin("fail", [](const ValueList&) -> ValueList {
        throw runtime::RuntimeError(ErrorKind::OperationUnsupported, "builtin refused");
    });
    try {
        session.run("fail()");
        assert(false && "Should have thrown");
    } catch (const runtime::RuntimeError& e) {
        assert(std::string(e.what()) == "builtin refused");
    }

    std::cout << "✓ Runtime errors surface to the host\n";
}

void test_syntax_errors_surface() {
    std::cout << "\n=== Test: Syntax Errors Surface ===\n";

    Session session;
    try {
        session.run("print(");
        assert(false && "Should have thrown");
    } catch (const parser::SyntaxError& e) {
        assert(e.offset == 6);
    }
    assert(session.printed.empty());

    std::cout << "✓ Nothing runs when parsing fails\n";
}

void test_call_tracing() {
    std::cout << "\n=== Test: Call Tracing ===\n";

    std::ostringstream log;
    runtime::InterpreterConfig config;
    config.diagnostics = &log;
    config.traceCalls = true;

    Session session(config);
    session.run("local function f() return 1 end; print(f())");

    std::string text = log.str();
    assert(text.find("[DEBUG] call closure") != std::string::npos);
    assert(text.find("[DEBUG] call builtin") != std::string::npos);
    assert(text.find("with 1 argument(s)") != std::string::npos);

    std::cout << "✓ Calls traced to the diagnostics stream\n";
}

int main() {
    std::cout << "Executor Test Suite\n";
    std::cout << "===================\n\n";

    try {
        test_literal_evaluation();
        test_print_recorder();
        test_numeric_for();
        test_generic_for();
        test_recursion();
        test_multiple_values();
        test_method_calls();
        test_table_length();
        test_round_trip_evaluation();
        test_less_equal_fallback();
        test_index_chain();
        test_metamethods_from_scripts();
        test_string_methods();
        test_control_flow();
        test_escaping_break();
        test_varargs();
        test_short_circuit();
        test_comparisons();
        test_runtime_errors();
        test_syntax_errors_surface();
        test_call_tracing();

        std::cout << "\n✅ All executor tests passed!\n\n";
        return 0;

    } catch (const std::exception& e) {
        std::cerr << "\n❌ Test failed: " << e.what() << "\n";
        return 1;
    }
}
