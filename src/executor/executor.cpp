/**
 * Evaluator Implementation
 */

#include "executor/executor.hpp"
#include "runtime/environment.hpp"
#include "runtime/errors.hpp"
#include "runtime/function.hpp"
#include "runtime/heap.hpp"
#include "runtime/interpreter.hpp"
#include "runtime/table.hpp"
#include <stdexcept>
#include <string>
#include <variant>

namespace luna {
namespace executor {

using runtime::Environment;
using runtime::ErrorKind;
using runtime::RuntimeError;
using runtime::Value;
using runtime::ValueList;

namespace {

Value first(const ValueList& values) {
    return values.empty() ? Value() : values.front();
}

Value at(const ValueList& values, std::size_t i) {
    return i < values.size() ? values[i] : Value();
}

} // namespace

// =============================================================================
// Root Stack
// =============================================================================

// Scoped root: a frame, a value list tracked by address (it may keep
// growing while rooted) or a copy of a single value
class Evaluator::Root {
public:
    Root(Evaluator& owner, Environment* frame) : owner_(owner), kind_(Kind::Frame) {
        owner_.frames_.push_back(frame);
    }

    Root(Evaluator& owner, const ValueList& values) : owner_(owner), kind_(Kind::List) {
        owner_.lists_.push_back(&values);
    }

    Root(Evaluator& owner, const Value& value) : owner_(owner), kind_(Kind::Single) {
        owner_.values_.push_back(value);
    }

    ~Root() {
        switch (kind_) {
            case Kind::Frame: owner_.frames_.pop_back(); break;
            case Kind::List: owner_.lists_.pop_back(); break;
            case Kind::Single: owner_.values_.pop_back(); break;
        }
    }

    Root(const Root&) = delete;
    Root& operator=(const Root&) = delete;

private:
    enum class Kind { Frame, List, Single };

    Evaluator& owner_;
    Kind kind_;
};

Evaluator::Evaluator(runtime::Interpreter& interp)
    : interp_(interp)
{
    interp_.attach(this);
}

Evaluator::~Evaluator() {
    interp_.detach(this);
}

void Evaluator::markRoots(runtime::Heap& heap) const {
    for (Environment* frame : frames_) {
        heap.markObject(frame);
    }
    for (const ValueList* list : lists_) {
        for (const Value& value : *list) {
            heap.markValue(value);
        }
    }
    for (const Value& value : values_) {
        heap.markValue(value);
    }
}

// =============================================================================
// Dispatch
// =============================================================================

Outcome Evaluator::execute(const parser::Block& block, Environment* env) {
    Root frame(*this, env);
    for (const auto& stat : block.stats) {
        interp_.collectIfDue();
        Outcome outcome = execute(*stat, env);
        if (!outcome.isNormal()) {
            return outcome;
        }
    }
    return Outcome::normal();
}

Outcome Evaluator::execute(const parser::Stat& stat, Environment* env) {
    Root frame(*this, env);
    return std::visit([this, env](const auto& node) { return exec(node, env); }, stat.node);
}

Value Evaluator::evaluate(const parser::Exp& exp, Environment* env) {
    return first(evaluateMulti(exp, env));
}

ValueList Evaluator::evaluateMulti(const parser::Exp& exp, Environment* env) {
    return std::visit([this, env](const auto& node) { return eval(node, env); }, exp.node);
}

ValueList Evaluator::evaluateList(const parser::ExpList& exps, Environment* env) {
    ValueList values;
    values.reserve(exps.size());
    Root root(*this, values);

    for (std::size_t i = 0; i < exps.size(); ++i) {
        const parser::Exp& exp = *exps[i];
        if (i + 1 == exps.size() && exp.isCall()) {
            ValueList rest = evaluateMulti(exp, env);
            values.insert(values.end(), rest.begin(), rest.end());
        } else {
            values.push_back(evaluate(exp, env));
        }
    }
    return values;
}

void Evaluator::assign(const parser::Exp& target, const Value& value, Environment* env) {
    if (target.is<parser::Var>()) {
        env->update(target.as<parser::Var>().name, value);
        return;
    }
    if (target.is<parser::Index>()) {
        const auto& index = target.as<parser::Index>();
        Value table = evaluate(*index.table, env);
        Root root(*this, table);
        Value key = evaluate(*index.key, env);
        interp_.setIndex(table, key, value);
        return;
    }
    throw std::logic_error("assignment target is neither a variable nor an index");
}

// =============================================================================
// Function Activation
// =============================================================================

ValueList Evaluator::callClosure(const runtime::Function& function, const ValueList& args) {
    const parser::FunctionBody* body = function.body();
    Environment* frame = interp_.newEnvironment(function.environment());

    const auto& params = body->params;
    std::size_t fixed = body->isVararg() ? params.size() - 1 : params.size();
    for (std::size_t i = 0; i < fixed; ++i) {
        frame->bind(params[i], at(args, i));
    }
    if (body->isVararg()) {
        runtime::Table* extra = interp_.newTable();
        for (std::size_t j = fixed; j < args.size(); ++j) {
            extra->set(Value::number(static_cast<double>(j - fixed + 1)), args[j]);
        }
        frame->bind(parser::kVarargs, Value::table(extra));
    }

    Outcome outcome = execute(body->block, frame);
    switch (outcome.signal) {
        case Signal::Return:
            return std::move(outcome.values);
        case Signal::Break:
            throw runtime::ControlFlowError("break outside of a loop");
        case Signal::Normal:
            break;
    }
    return ValueList();
}

// =============================================================================
// Statements
// =============================================================================

bool Evaluator::runBody(const parser::Block& block, Environment* env, Outcome& exit) {
    Outcome outcome = execute(block, env);
    switch (outcome.signal) {
        case Signal::Normal:
            return false;
        case Signal::Break:
            exit = Outcome::normal();
            return true;
        case Signal::Return:
            exit = std::move(outcome);
            return true;
    }
    return false;
}

Outcome Evaluator::exec(const parser::Block& s, Environment* env) {
    return execute(s, env);
}

Outcome Evaluator::exec(const parser::While& s, Environment* env) {
    Outcome exit;
    while (evaluate(*s.cond, env).isTruthy()) {
        if (runBody(s.block, env, exit)) return exit;
    }
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::Repeat& s, Environment* env) {
    Outcome exit;
    do {
        if (runBody(s.block, env, exit)) return exit;
    } while (!evaluate(*s.cond, env).isTruthy());
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::If& s, Environment* env) {
    if (evaluate(*s.cond, env).isTruthy()) {
        return execute(s.thenBlock, env);
    }
    return execute(s.elseBlock, env);
}

Outcome Evaluator::exec(const parser::NumericFor& s, Environment* env) {
    Value start = evaluate(*s.start, env);
    Value stop = evaluate(*s.stop, env);
    Value step = evaluate(*s.step, env);

    if (!start.isNumber()) {
        throw RuntimeError(ErrorKind::InvalidForLoop, "'for' initial value must be a number, got " +
                           runtime::describe(start));
    }
    if (!stop.isNumber()) {
        throw RuntimeError(ErrorKind::InvalidForLoop, "'for' limit must be a number, got " +
                           runtime::describe(stop));
    }
    if (!step.isNumber()) {
        throw RuntimeError(ErrorKind::InvalidForLoop, "'for' step must be a number, got " +
                           runtime::describe(step));
    }

    double i = start.asNumber();
    double limit = stop.asNumber();
    double delta = step.asNumber();

    Outcome exit;
    while (delta > 0 ? i <= limit : i >= limit) {
        // Fresh binding per iteration, so closures see their own value
        Environment* iteration = interp_.newEnvironment(env);
        iteration->bind(s.name, Value::number(i));
        if (runBody(s.block, iteration, exit)) return exit;
        i += delta;
    }
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::GenericFor& s, Environment* env) {
    // Iterator, state, control
    ValueList loop = evaluateList(s.exps, env);
    loop.resize(3);
    Root root(*this, loop);

    Outcome exit;
    while (true) {
        ValueList results = interp_.call(loop[0], {loop[1], loop[2]});

        Environment* iteration = interp_.newEnvironment(env);
        for (std::size_t i = 0; i < s.names.size(); ++i) {
            iteration->bind(s.names[i], at(results, i));
        }

        Value head = first(results);
        if (head.isNil()) break;
        loop[2] = head;

        if (runBody(s.block, iteration, exit)) return exit;
    }
    return Outcome::normal();
}

Value Evaluator::resolvePath(const std::vector<std::string>& names, std::size_t count,
                             Environment* env) {
    Value current = env->lookup(names[0]);
    for (std::size_t i = 1; i < count; ++i) {
        current = interp_.index(current, Value::string(names[i]));
    }
    return current;
}

Outcome Evaluator::exec(const parser::FuncDef& s, Environment* env) {
    if (s.names.size() == 1) {
        const std::string& name = s.names[0];
        Value closure = Value::function(interp_.newClosure(env, s.body));
        if (env->isBound(name)) {
            env->update(name, closure);
        } else {
            env->bind(name, closure);
        }
        return Outcome::normal();
    }

    // Resolving may run __index handlers; allocate the closure after
    Value owner = resolvePath(s.names, s.names.size() - 1, env);
    Value closure = Value::function(interp_.newClosure(env, s.body));
    interp_.setIndex(owner, Value::string(s.names.back()), closure);
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::MethDef& s, Environment* env) {
    Value owner = resolvePath(s.names, s.names.size(), env);
    Value closure = Value::function(interp_.newClosure(env, s.body));
    interp_.setIndex(owner, Value::string(s.method), closure);
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::LocalFuncDef& s, Environment* env) {
    // Bound in the captured frame, so the body can call itself
    env->bind(s.name, Value::function(interp_.newClosure(env, s.body)));
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::Local& s, Environment* env) {
    ValueList values = evaluateList(s.exps, env);
    for (std::size_t i = 0; i < s.names.size(); ++i) {
        env->bind(s.names[i], at(values, i));
    }
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::Return& s, Environment* env) {
    return Outcome::returning(evaluateList(s.exps, env));
}

Outcome Evaluator::exec(const parser::Break&, Environment*) {
    return Outcome::breakLoop();
}

Outcome Evaluator::exec(const parser::Assign& s, Environment* env) {
    ValueList values = evaluateList(s.exps, env);
    Root root(*this, values);
    for (std::size_t i = 0; i < s.targets.size(); ++i) {
        assign(*s.targets[i], at(values, i), env);
    }
    return Outcome::normal();
}

Outcome Evaluator::exec(const parser::CallStat& s, Environment* env) {
    evaluateMulti(*s.call, env);
    return Outcome::normal();
}

// =============================================================================
// Expressions
// =============================================================================

Value Evaluator::binary(parser::BinaryOp op, const Value& a, const Value& b) {
    using parser::BinaryOp;

    switch (op) {
        case BinaryOp::Lt: return Value::boolean(interp_.lessThan(a, b));
        case BinaryOp::Gt: return Value::boolean(interp_.greaterThan(a, b));
        case BinaryOp::Le: return Value::boolean(interp_.lessEqual(a, b));
        case BinaryOp::Ge: return Value::boolean(interp_.greaterEqual(a, b));
        case BinaryOp::Ne: return Value::boolean(!interp_.equals(a, b));
        case BinaryOp::Eq: return Value::boolean(interp_.equals(a, b));
        case BinaryOp::Concat: return interp_.concat(a, b);
        case BinaryOp::Add: return interp_.add(a, b);
        case BinaryOp::Sub: return interp_.sub(a, b);
        case BinaryOp::Mul: return interp_.mul(a, b);
        case BinaryOp::Div: return interp_.div(a, b);
        case BinaryOp::Mod: return interp_.mod(a, b);
        case BinaryOp::Pow: return interp_.pow(a, b);
        case BinaryOp::Or:
        case BinaryOp::And:
            break;
    }
    throw std::logic_error(std::string("short-circuit operator reached eager dispatch: ") +
                           parser::binaryOpSymbol(op));
}

ValueList Evaluator::eval(const parser::Binary& e, Environment* env) {
    Value left = evaluate(*e.left, env);

    // Short-circuit: the deciding operand is the result
    if (e.op == parser::BinaryOp::Or) {
        return {left.isTruthy() ? left : evaluate(*e.right, env)};
    }
    if (e.op == parser::BinaryOp::And) {
        return {left.isTruthy() ? evaluate(*e.right, env) : left};
    }

    Root root(*this, left);
    Value right = evaluate(*e.right, env);
    return {binary(e.op, left, right)};
}

ValueList Evaluator::eval(const parser::Unary& e, Environment* env) {
    Value operand = evaluate(*e.operand, env);
    switch (e.op) {
        case parser::UnaryOp::Not: return {Value::boolean(!operand.isTruthy())};
        case parser::UnaryOp::Neg: return {interp_.unm(operand)};
        case parser::UnaryOp::Len: return {interp_.len(operand)};
    }
    return {Value()};
}

ValueList Evaluator::eval(const parser::Lit& e, Environment*) {
    return {e.value};
}

ValueList Evaluator::eval(const parser::Var& e, Environment* env) {
    return {env->lookup(e.name)};
}

ValueList Evaluator::eval(const parser::Index& e, Environment* env) {
    Value table = evaluate(*e.table, env);
    Root root(*this, table);
    Value key = evaluate(*e.key, env);
    return {interp_.index(table, key)};
}

ValueList Evaluator::eval(const parser::FuncCall& e, Environment* env) {
    Value callee = evaluate(*e.func, env);
    Root calleeRoot(*this, callee);
    ValueList args = evaluateList(e.args, env);
    Root argsRoot(*this, args);
    return interp_.call(callee, args);
}

ValueList Evaluator::eval(const parser::MethCall& e, Environment* env) {
    Value receiver = evaluate(*e.receiver, env);
    Root receiverRoot(*this, receiver);
    Value method = interp_.index(receiver, Value::string(e.method));
    Root methodRoot(*this, method);

    ValueList args;
    Root argsRoot(*this, args);
    args.push_back(receiver);
    ValueList rest = evaluateList(e.args, env);
    args.insert(args.end(), rest.begin(), rest.end());
    return interp_.call(method, args);
}

ValueList Evaluator::eval(const parser::Func& e, Environment* env) {
    return {Value::function(interp_.newClosure(env, e.body))};
}

ValueList Evaluator::eval(const parser::TableConst& e, Environment* env) {
    runtime::Table* table = interp_.newTable();
    Root root(*this, Value::table(table));
    double position = 1;

    for (std::size_t i = 0; i < e.fields.size(); ++i) {
        const parser::Field& field = e.fields[i];
        if (field.key) {
            Value key = evaluate(*field.key, env);
            table->set(key, evaluate(*field.value, env));
        } else if (i + 1 == e.fields.size() && field.value->isCall()) {
            for (const Value& value : evaluateMulti(*field.value, env)) {
                table->set(Value::number(position++), value);
            }
        } else {
            table->set(Value::number(position++), evaluate(*field.value, env));
        }
    }
    return {Value::table(table)};
}

ValueList Evaluator::eval(const parser::Paren& e, Environment* env) {
    return {evaluate(*e.exp, env)};
}

} // namespace executor
} // namespace luna
