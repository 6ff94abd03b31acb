/**
 * Evaluator - tree-walking execution of parsed chunks
 *
 * Executes statements against an Environment and evaluates
 * expressions to Values. Every operator, index and call goes through
 * the owning Interpreter so metatable dispatch applies uniformly.
 *
 * Control transfer:
 * - Statements return an Outcome (Normal, Break, Return)
 * - Loops consume Break and pass Return upward
 * - Closure activations consume Return; a Break reaching a function
 *   boundary raises ControlFlowError
 *
 * Multi-value rule: only the last element of an expression list
 * expands to all results of a call; every other element, and any
 * parenthesized expression, contributes exactly one value.
 *
 * Collection: the evaluator registers itself with its Interpreter and
 * keeps every executing frame and every value it holds between
 * sub-evaluations on a root stack, so the heap can be collected
 * between statements while a script runs.
 */

#ifndef LUNA_EXECUTOR_HPP
#define LUNA_EXECUTOR_HPP

#include "executor/outcome.hpp"
#include "parser/ast.hpp"
#include "runtime/value.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace luna {

namespace runtime {
class Environment;
class Function;
class Heap;
class Interpreter;
}

namespace executor {

class Evaluator {
public:
    explicit Evaluator(runtime::Interpreter& interp);
    ~Evaluator();

    // Non-copyable
    Evaluator(const Evaluator&) = delete;
    Evaluator& operator=(const Evaluator&) = delete;

    Outcome execute(const parser::Block& block, runtime::Environment* env);
    Outcome execute(const parser::Stat& stat, runtime::Environment* env);

    /**
     * Evaluate to exactly one value
     */
    runtime::Value evaluate(const parser::Exp& exp, runtime::Environment* env);

    /**
     * All results of a call expression; one value for anything else
     */
    runtime::ValueList evaluateMulti(const parser::Exp& exp, runtime::Environment* env);

    /**
     * Evaluate an expression list, expanding only a trailing call
     */
    runtime::ValueList evaluateList(const parser::ExpList& exps, runtime::Environment* env);

    /**
     * Store into a Var or Index target
     */
    void assign(const parser::Exp& target, const runtime::Value& value, runtime::Environment* env);

    /**
     * Activate a closure: fresh frame under the captured environment,
     * parameters bound positionally, extra arguments collected into a
     * table when the last parameter is "..."
     */
    runtime::ValueList callClosure(const runtime::Function& function, const runtime::ValueList& args);

    /**
     * Mark executing frames and in-flight temporaries
     */
    void markRoots(runtime::Heap& heap) const;

private:
    class Root;

    // Statement executors
    Outcome exec(const parser::Block& s, runtime::Environment* env);
    Outcome exec(const parser::While& s, runtime::Environment* env);
    Outcome exec(const parser::Repeat& s, runtime::Environment* env);
    Outcome exec(const parser::If& s, runtime::Environment* env);
    Outcome exec(const parser::NumericFor& s, runtime::Environment* env);
    Outcome exec(const parser::GenericFor& s, runtime::Environment* env);
    Outcome exec(const parser::FuncDef& s, runtime::Environment* env);
    Outcome exec(const parser::MethDef& s, runtime::Environment* env);
    Outcome exec(const parser::LocalFuncDef& s, runtime::Environment* env);
    Outcome exec(const parser::Local& s, runtime::Environment* env);
    Outcome exec(const parser::Return& s, runtime::Environment* env);
    Outcome exec(const parser::Break& s, runtime::Environment* env);
    Outcome exec(const parser::Assign& s, runtime::Environment* env);
    Outcome exec(const parser::CallStat& s, runtime::Environment* env);

    // Expression evaluators; calls yield all their results
    runtime::ValueList eval(const parser::Binary& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Unary& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Lit& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Var& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Index& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::FuncCall& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::MethCall& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Func& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::TableConst& e, runtime::Environment* env);
    runtime::ValueList eval(const parser::Paren& e, runtime::Environment* env);

    runtime::Value binary(parser::BinaryOp op, const runtime::Value& a, const runtime::Value& b);

    // Resolve a.b.c, starting with a lookup of the first name
    runtime::Value resolvePath(const std::vector<std::string>& names, std::size_t count,
                               runtime::Environment* env);

    // Run one loop body; true if the loop must stop, with `exit` set
    bool runBody(const parser::Block& block, runtime::Environment* env, Outcome& exit);

    runtime::Interpreter& interp_;

    // Root stack, strictly LIFO through Root
    std::vector<runtime::Environment*> frames_;
    std::vector<const runtime::ValueList*> lists_;
    std::vector<runtime::Value> values_;
};

} // namespace executor
} // namespace luna

#endif // LUNA_EXECUTOR_HPP
