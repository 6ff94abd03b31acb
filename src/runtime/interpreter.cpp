/**
 * Interpreter Session Implementation
 */

#include "runtime/interpreter.hpp"
#include "executor/executor.hpp"
#include "parser/parser.hpp"
#include "parser/scanner.hpp"
#include "runtime/environment.hpp"
#include "runtime/errors.hpp"
#include "runtime/table.hpp"
#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace luna {
namespace runtime {

// =============================================================================
// Activity Tracking
// =============================================================================

// Counts nested activity: script evaluation, or builtins whose C++
// locals the collector cannot see
class Interpreter::DepthGuard {
public:
    explicit DepthGuard(std::size_t& depth) : depth_(depth) { depth_++; }
    ~DepthGuard() { depth_--; }

    DepthGuard(const DepthGuard&) = delete;
    DepthGuard& operator=(const DepthGuard&) = delete;

private:
    std::size_t& depth_;
};

std::string describe(const Value& value) {
    std::string text = value.toString();
    if (value.isString()) {
        text = "'" + text + "'";
    }
    return std::string(kindName(value.kind())) + " (" + text + ")";
}

// =============================================================================
// Construction
// =============================================================================

Interpreter::Interpreter(InterpreterConfig config)
    : config_(config)
{
    globals_ = heap_.allocate<Environment>(nullptr);

    numberMetatable_ = heap_.allocate<Table>();
    booleanMetatable_ = heap_.allocate<Table>();
    stringMetatable_ = heap_.allocate<Table>();
    functionMetatable_ = heap_.allocate<Table>();
    nextCollection_ = heap_.objectCount() + config_.collectionThreshold;

    evaluator_ = std::make_unique<executor::Evaluator>(*this);
}

Interpreter::~Interpreter() = default;

Table* Interpreter::newTable() {
    return heap_.allocate<Table>();
}

Function* Interpreter::newFunction(Builtin builtin) {
    return heap_.allocate<Function>(std::move(builtin));
}

Function* Interpreter::newClosure(Environment* env, std::shared_ptr<const parser::FunctionBody> body) {
    return heap_.allocate<Function>(env, std::move(body));
}

Environment* Interpreter::newEnvironment(Environment* parent) {
    return heap_.allocate<Environment>(parent);
}

void Interpreter::bindBuiltin(const std::string& name, Builtin builtin) {
    globals_->bind(name, Value::function(newFunction(std::move(builtin))));
}

// =============================================================================
// Loading & Execution
// =============================================================================

parser::Block Interpreter::load(const std::string& source) const {
    parser::Scanner scanner(source);
    parser::Parser parser(scanner);
    return parser.parseChunk();
}

executor::Outcome Interpreter::execute(const parser::Block& block, Environment* env) {
    DepthGuard guard(activeDepth_);
    return evaluator_->execute(block, env);
}

ValueList Interpreter::run(const std::string& source) {
    parser::Block chunk = load(source);
    executor::Outcome outcome = execute(chunk, globals_);

    if (outcome.signal == executor::Signal::Break) {
        throw ControlFlowError("break outside of a loop");
    }
    return outcome.values;
}

// =============================================================================
// Metatables
// =============================================================================

void Interpreter::setKindMetatable(ValueKind kind, Table* metatable) {
    switch (kind) {
        case ValueKind::Number: numberMetatable_ = metatable; break;
        case ValueKind::Boolean: booleanMetatable_ = metatable; break;
        case ValueKind::String: stringMetatable_ = metatable; break;
        case ValueKind::Function: functionMetatable_ = metatable; break;
        case ValueKind::Nil:
        case ValueKind::Table:
            throw std::invalid_argument(std::string("no shared metatable for kind ") + kindName(kind));
    }
}

Table* Interpreter::kindMetatable(ValueKind kind) const {
    switch (kind) {
        case ValueKind::Number: return numberMetatable_;
        case ValueKind::Boolean: return booleanMetatable_;
        case ValueKind::String: return stringMetatable_;
        case ValueKind::Function: return functionMetatable_;
        case ValueKind::Nil:
        case ValueKind::Table:
            return nullptr;
    }
    return nullptr;
}

Table* Interpreter::metatableOf(const Value& value) const {
    if (value.isTable()) {
        return value.asTable()->metatable();
    }
    return kindMetatable(value.kind());
}

Value Interpreter::metamethod(const Value& value, const char* event) const {
    Table* metatable = metatableOf(value);
    if (metatable == nullptr) {
        return Value();
    }
    return metatable->get(Value::string(event));
}

// First operand's handler wins, then the second's
Value Interpreter::binaryHandler(const Value& a, const Value& b, const char* event) const {
    Value handler = metamethod(a, event);
    if (handler.isNil()) {
        handler = metamethod(b, event);
    }
    return handler;
}

// =============================================================================
// Arithmetic
// =============================================================================

Value Interpreter::arithmetic(const Value& a, const Value& b, const char* event, const char* operation) {
    Value handler = binaryHandler(a, b, event);
    if (!handler.isNil()) {
        return call1(handler, {a, b});
    }
    throw RuntimeError(ErrorKind::OperationUnsupported,
        std::string("cannot ") + operation + " " + describe(a) + " and " + describe(b));
}

Value Interpreter::add(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return Value::number(a.asNumber() + b.asNumber());
    }
    return arithmetic(a, b, "__add", "add");
}

Value Interpreter::sub(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return Value::number(a.asNumber() - b.asNumber());
    }
    return arithmetic(a, b, "__sub", "subtract");
}

Value Interpreter::mul(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return Value::number(a.asNumber() * b.asNumber());
    }
    return arithmetic(a, b, "__mul", "multiply");
}

Value Interpreter::div(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return Value::number(a.asNumber() / b.asNumber());
    }
    return arithmetic(a, b, "__div", "divide");
}

Value Interpreter::mod(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        double x = a.asNumber();
        double y = b.asNumber();
        return Value::number(x - std::floor(x / y) * y);
    }
    return arithmetic(a, b, "__mod", "modulo");
}

Value Interpreter::pow(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return Value::number(std::pow(a.asNumber(), b.asNumber()));
    }
    return arithmetic(a, b, "__pow", "exponentiate");
}

Value Interpreter::unm(const Value& a) {
    if (a.isNumber()) {
        return Value::number(-a.asNumber());
    }
    Value handler = metamethod(a, "__unm");
    if (!handler.isNil()) {
        return call1(handler, {a});
    }
    throw RuntimeError(ErrorKind::OperationUnsupported, "cannot negate " + describe(a));
}

Value Interpreter::concat(const Value& a, const Value& b) {
    if ((a.isNumber() || a.isString()) && (b.isNumber() || b.isString())) {
        return Value::string(a.toString() + b.toString());
    }
    return arithmetic(a, b, "__concat", "concatenate");
}

Value Interpreter::len(const Value& a) {
    if (a.isString()) {
        return Value::number(static_cast<double>(a.asString().size()));
    }
    Value handler = metamethod(a, "__len");
    if (!handler.isNil()) {
        return call1(handler, {a});
    }
    if (a.isTable()) {
        return Value::number(static_cast<double>(a.asTable()->length()));
    }
    throw RuntimeError(ErrorKind::CannotApplyLength, "cannot apply length to " + describe(a));
}

// =============================================================================
// Comparison
// =============================================================================

bool Interpreter::equals(const Value& a, const Value& b) {
    if (a == b) {
        return true;
    }
    // Handler only applies to same-kind operands sharing the same __eq
    if (a.kind() != b.kind()) {
        return false;
    }
    Value h1 = metamethod(a, "__eq");
    Value h2 = metamethod(b, "__eq");
    if (h1.isNil() || h1 != h2) {
        return false;
    }
    return call1(h1, {a, b}).isTruthy();
}

bool Interpreter::lessThan(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return a.asNumber() < b.asNumber();
    }
    if (a.isString() && b.isString()) {
        return a.asString() < b.asString();
    }
    Value handler = binaryHandler(a, b, "__lt");
    if (!handler.isNil()) {
        return call1(handler, {a, b}).isTruthy();
    }
    throw RuntimeError(ErrorKind::CannotCompare,
        "cannot compute " + describe(a) + " < " + describe(b));
}

bool Interpreter::lessEqual(const Value& a, const Value& b) {
    if (a.isNumber() && b.isNumber()) {
        return a.asNumber() <= b.asNumber();
    }
    if (a.isString() && b.isString()) {
        return a.asString() <= b.asString();
    }
    Value handler = binaryHandler(a, b, "__le");
    if (!handler.isNil()) {
        return call1(handler, {a, b}).isTruthy();
    }
    // a <= b  is  not (b < a)
    handler = binaryHandler(a, b, "__lt");
    if (!handler.isNil()) {
        return !call1(handler, {b, a}).isTruthy();
    }
    throw RuntimeError(ErrorKind::CannotCompare,
        "cannot compute " + describe(a) + " <= " + describe(b));
}

// =============================================================================
// Indexing
// =============================================================================

void Interpreter::checkChainDepth(std::size_t depth) const {
    if (config_.metatableChainLimit != 0 && depth > config_.metatableChainLimit) {
        throw RuntimeError(ErrorKind::MetatableDepthExceeded,
            "metatable chain longer than " + std::to_string(config_.metatableChainLimit));
    }
}

Value Interpreter::index(const Value& object, const Value& key) {
    return indexChain(object, key, 0);
}

Value Interpreter::indexChain(const Value& object, const Value& key, std::size_t depth) {
    checkChainDepth(depth);

    Value handler;
    if (object.isTable()) {
        Value value = object.asTable()->get(key);
        if (!value.isNil()) {
            return value;
        }
        handler = metamethod(object, "__index");
        if (handler.isNil()) {
            return Value();
        }
    } else {
        handler = metamethod(object, "__index");
        if (handler.isNil()) {
            throw RuntimeError(ErrorKind::CannotIndex,
                "cannot index " + describe(object) + " with " + describe(key));
        }
    }

    if (handler.isFunction()) {
        return call1(handler, {object, key});
    }
    return indexChain(handler, key, depth + 1);
}

void Interpreter::setIndex(const Value& object, const Value& key, const Value& value) {
    setIndexChain(object, key, value, 0);
}

void Interpreter::setIndexChain(const Value& object, const Value& key, const Value& value, std::size_t depth) {
    checkChainDepth(depth);

    Value handler;
    if (object.isTable()) {
        Table* table = object.asTable();
        if (!table->get(key).isNil()) {
            table->set(key, value);
            return;
        }
        handler = metamethod(object, "__newindex");
        if (handler.isNil()) {
            table->set(key, value);
            return;
        }
    } else {
        handler = metamethod(object, "__newindex");
        if (handler.isNil()) {
            throw RuntimeError(ErrorKind::CannotIndex,
                "cannot set " + describe(object) + "[" + key.toString() + "] to " + describe(value));
        }
    }

    if (handler.isFunction()) {
        call(handler, {object, key, value});
        return;
    }
    setIndexChain(handler, key, value, depth + 1);
}

// =============================================================================
// Calls
// =============================================================================

ValueList Interpreter::call(const Value& callee, const ValueList& args) {
    if (callee.isFunction()) {
        Function* function = callee.asFunction();
        if (config_.traceCalls && config_.diagnostics) {
            *config_.diagnostics << "[DEBUG] call " << (function->isBuiltin() ? "builtin" : "closure")
                                 << " " << static_cast<const void*>(function)
                                 << " with " << args.size() << " argument(s)\n";
        }

        DepthGuard guard(activeDepth_);
        if (function->isBuiltin()) {
            DepthGuard builtinGuard(builtinDepth_);
            return function->builtin()(args);
        }
        return evaluator_->callClosure(*function, args);
    }

    Value handler = metamethod(callee, "__call");
    if (!handler.isNil()) {
        ValueList forwarded;
        forwarded.reserve(args.size() + 1);
        forwarded.push_back(callee);
        forwarded.insert(forwarded.end(), args.begin(), args.end());
        return call(handler, forwarded);
    }
    throw RuntimeError(ErrorKind::NotCallable, "cannot call " + describe(callee));
}

Value Interpreter::call1(const Value& callee, const ValueList& args) {
    ValueList results = call(callee, args);
    return results.empty() ? Value() : results.front();
}

// =============================================================================
// Memory
// =============================================================================

void Interpreter::pin(Environment* env) {
    pinned_.push_back(env);
}

void Interpreter::unpin(Environment* env) {
    auto it = std::find(pinned_.begin(), pinned_.end(), env);
    if (it != pinned_.end()) {
        pinned_.erase(it);
    }
}

void Interpreter::attach(executor::Evaluator* evaluator) {
    evaluators_.push_back(evaluator);
}

void Interpreter::detach(executor::Evaluator* evaluator) {
    auto it = std::find(evaluators_.begin(), evaluators_.end(), evaluator);
    if (it != evaluators_.end()) {
        evaluators_.erase(it);
    }
}

std::size_t Interpreter::collectGarbage(const ValueList& extraRoots) {
    if (isRunning()) {
        warn("garbage collection requested while a script is running; skipped");
        return 0;
    }
    return collect(extraRoots);
}

void Interpreter::collectIfDue() {
    if (config_.collectionThreshold == 0 || builtinDepth_ > 0) return;
    if (heap_.objectCount() < nextCollection_) return;
    collect(ValueList());
}

std::size_t Interpreter::collect(const ValueList& extraRoots) {
    std::size_t before = heap_.objectCount();

    heap_.markObject(globals_);
    heap_.markObject(numberMetatable_);
    heap_.markObject(booleanMetatable_);
    heap_.markObject(stringMetatable_);
    heap_.markObject(functionMetatable_);
    for (Environment* env : pinned_) {
        heap_.markObject(env);
    }
    for (const Value& root : extraRoots) {
        heap_.markValue(root);
    }
    for (const executor::Evaluator* evaluator : evaluators_) {
        evaluator->markRoots(heap_);
    }

    std::size_t freed = heap_.collect();
    std::size_t live = heap_.objectCount();
    nextCollection_ = std::max(live * 2, live + config_.collectionThreshold);
    debug("gc: " + std::to_string(before) + " objects, freed " + std::to_string(freed) +
          ", " + std::to_string(heap_.objectCount()) + " live");
    return freed;
}

// =============================================================================
// Diagnostics
// =============================================================================

void Interpreter::debug(const std::string& message) const {
    if (config_.debugLogging && config_.diagnostics) {
        *config_.diagnostics << "[DEBUG] " << message << "\n";
    }
}

void Interpreter::warn(const std::string& message) const {
    if (config_.diagnostics) {
        *config_.diagnostics << "[WARNING] " << message << "\n";
    }
}

} // namespace runtime
} // namespace luna
