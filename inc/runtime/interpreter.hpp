/**
 * Interpreter Session
 *
 * Owns everything one embedding needs:
 * - The heap of tables, functions and environments
 * - The per-kind metatables (numbers, booleans, strings, functions)
 * - The global environment the host populates with builtins
 * - The metatable-dispatch protocol for every operator, indexing and calls
 *
 * Example usage:
 *
 *   Interpreter interp;
 *   interp.bindBuiltin("print", [](const ValueList& args) {
 *       std::cout << args[0].toString() << "\n";
 *       return ValueList{};
 *   });
 *   interp.run("print(3 + 4)");
 *
 * Single-threaded: a host sharing one session across threads must
 * synchronize access itself.
 *
 * While a script runs, the heap may be collected between statements.
 * Objects the host holds only in C++ variables across run(), execute()
 * or call() must be reachable from the globals, a pinned environment
 * or the call's arguments. Collection never runs while a builtin is
 * executing.
 */

#ifndef LUNA_INTERPRETER_HPP
#define LUNA_INTERPRETER_HPP

#include "executor/outcome.hpp"
#include "parser/ast.hpp"
#include "runtime/config.hpp"
#include "runtime/function.hpp"
#include "runtime/heap.hpp"
#include "runtime/value.hpp"
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace luna {

namespace executor {
class Evaluator;
}

namespace runtime {

class Environment;
class Table;

class Interpreter {
public:
    explicit Interpreter(InterpreterConfig config = InterpreterConfig());
    ~Interpreter();

    // Non-copyable
    Interpreter(const Interpreter&) = delete;
    Interpreter& operator=(const Interpreter&) = delete;

    // =========================================================================
    // Host Embedding
    // =========================================================================

    Environment* globals() const { return globals_; }

    Table* newTable();
    Function* newFunction(Builtin builtin);
    Function* newClosure(Environment* env, std::shared_ptr<const parser::FunctionBody> body);
    Environment* newEnvironment(Environment* parent);

    /**
     * Bind a host function in the global environment
     */
    void bindBuiltin(const std::string& name, Builtin builtin);

    /**
     * Parse a complete chunk (throws parser::SyntaxError)
     */
    parser::Block load(const std::string& source) const;

    /**
     * Execute a block in the given environment, returning its raw outcome
     */
    executor::Outcome execute(const parser::Block& block, Environment* env);

    /**
     * Load and execute source in the global environment
     *
     * @return Values returned by a top-level return statement, if any
     * @throws ControlFlowError if a break escapes the chunk
     */
    ValueList run(const std::string& source);

    // =========================================================================
    // Metatables
    // =========================================================================

    void setKindMetatable(ValueKind kind, Table* metatable);
    Table* kindMetatable(ValueKind kind) const;

    /**
     * The table's own metatable, or the shared one for the value's kind
     */
    Table* metatableOf(const Value& value) const;

    /**
     * Handler for `event` in the value's metatable, nil if none
     */
    Value metamethod(const Value& value, const char* event) const;

    static const char* typeName(const Value& value) { return kindName(value.kind()); }

    // =========================================================================
    // Operator Dispatch
    // =========================================================================

    Value add(const Value& a, const Value& b);
    Value sub(const Value& a, const Value& b);
    Value mul(const Value& a, const Value& b);
    Value div(const Value& a, const Value& b);
    Value mod(const Value& a, const Value& b);
    Value pow(const Value& a, const Value& b);
    Value unm(const Value& a);

    Value concat(const Value& a, const Value& b);

    // Strings measure in bytes, so UTF-8 text counts each encoded byte
    Value len(const Value& a);

    bool equals(const Value& a, const Value& b);
    bool lessThan(const Value& a, const Value& b);
    bool lessEqual(const Value& a, const Value& b);

    // a > b is not (a <= b), a >= b is not (a < b)
    bool greaterThan(const Value& a, const Value& b) { return !lessEqual(a, b); }
    bool greaterEqual(const Value& a, const Value& b) { return !lessThan(a, b); }

    Value index(const Value& object, const Value& key);
    void setIndex(const Value& object, const Value& key, const Value& value);

    ValueList call(const Value& callee, const ValueList& args);

    /**
     * Call and reduce to the first result (nil if there was none)
     */
    Value call1(const Value& callee, const ValueList& args);

    // =========================================================================
    // Memory
    // =========================================================================

    /**
     * Keep an environment alive across collections
     */
    void pin(Environment* env);
    void unpin(Environment* env);

    /**
     * Free everything unreachable from the globals, the kind
     * metatables, pinned environments and `extraRoots`.
     * Refused (returns 0) while a script is running.
     *
     * @return Number of objects freed
     */
    std::size_t collectGarbage(const ValueList& extraRoots = ValueList());

    /**
     * Collect if the heap has grown past the configured threshold.
     * Called by the evaluator between statements; no-op inside builtins.
     */
    void collectIfDue();

    /**
     * Evaluators register so their root stacks are marked
     */
    void attach(executor::Evaluator* evaluator);
    void detach(executor::Evaluator* evaluator);

    std::size_t heapSize() const { return heap_.objectCount(); }

    bool isRunning() const { return activeDepth_ > 0; }

    const InterpreterConfig& config() const { return config_; }

private:
    class DepthGuard;

    Value arithmetic(const Value& a, const Value& b, const char* event, const char* operation);
    Value binaryHandler(const Value& a, const Value& b, const char* event) const;
    Value indexChain(const Value& object, const Value& key, std::size_t depth);
    void setIndexChain(const Value& object, const Value& key, const Value& value, std::size_t depth);
    void checkChainDepth(std::size_t depth) const;
    std::size_t collect(const ValueList& extraRoots);

    void debug(const std::string& message) const;
    void warn(const std::string& message) const;

    InterpreterConfig config_;
    Heap heap_;
    Environment* globals_ = nullptr;

    Table* numberMetatable_ = nullptr;
    Table* booleanMetatable_ = nullptr;
    Table* stringMetatable_ = nullptr;
    Table* functionMetatable_ = nullptr;

    std::vector<Environment*> pinned_;
    std::vector<executor::Evaluator*> evaluators_;
    std::unique_ptr<executor::Evaluator> evaluator_;

    std::size_t activeDepth_ = 0;
    std::size_t builtinDepth_ = 0;
    std::size_t nextCollection_ = 0;
};

/**
 * Operand description used in error messages: kind plus canonical form
 */
std::string describe(const Value& value);

} // namespace runtime
} // namespace luna

#endif // LUNA_INTERPRETER_HPP
