/**
 * Function Values
 *
 * Either a closure (function literal + the environment it was
 * evaluated in) or a builtin supplied by the host. Both take an
 * ordered argument list and produce an ordered result list.
 */

#pragma once

#include "runtime/heap.hpp"
#include "runtime/value.hpp"
#include <functional>
#include <memory>

namespace luna {
namespace parser {
struct FunctionBody;
}

namespace runtime {

class Environment;

/**
 * Host-supplied callable
 */
using Builtin = std::function<ValueList(const ValueList& args)>;

class Function : public GcObject {
public:
    explicit Function(Builtin builtin)
        : GcObject(GcObjectType::Function), builtin_(std::move(builtin)) {}

    Function(Environment* env, std::shared_ptr<const parser::FunctionBody> body)
        : GcObject(GcObjectType::Function), env_(env), body_(std::move(body)) {}

    bool isBuiltin() const { return body_ == nullptr; }

    const Builtin& builtin() const { return builtin_; }

    // Closure parts; null for builtins
    Environment* environment() const { return env_; }
    const parser::FunctionBody* body() const { return body_.get(); }

private:
    Builtin builtin_;
    Environment* env_ = nullptr;
    std::shared_ptr<const parser::FunctionBody> body_;
};

} // namespace runtime
} // namespace luna
