/**
 * Runtime Error Types
 *
 * RuntimeError is raised by the value model and the evaluator;
 * syntax errors live with the parser. ControlFlowError flags a
 * break/return signal that escaped to a place that cannot consume it,
 * which only malformed input produces.
 */

#ifndef LUNA_ERRORS_HPP
#define LUNA_ERRORS_HPP

#include <stdexcept>
#include <string>

namespace luna {
namespace runtime {

enum class ErrorKind {
    OperationUnsupported,    // arithmetic/concat/unary minus without handler
    CannotApplyLength,       // # on a value without __len that is not a table or string
    CannotCompare,           // < or <= without a usable handler
    CannotIndex,             // indexing a non-table without __index/__newindex
    NotCallable,             // calling a non-function without __call
    InvalidForLoop,          // numeric for bounds that are not numbers
    UnknownVariable,         // reference or assignment of an unbound name
    InvalidTableKey,         // nil or NaN used as a table key on write
    MetatableDepthExceeded   // configured __index/__newindex chain limit hit
};

const char* errorKindName(ErrorKind kind);

class RuntimeError : public std::runtime_error {
public:
    RuntimeError(ErrorKind errorKind, const std::string& msg)
        : std::runtime_error(msg), kind(errorKind) {}

    ErrorKind kind;
};

class ControlFlowError : public std::logic_error {
public:
    explicit ControlFlowError(const std::string& msg) : std::logic_error(msg) {}
};

} // namespace runtime
} // namespace luna

#endif // LUNA_ERRORS_HPP
