/**
 * Environment Implementation
 */

#include "runtime/environment.hpp"
#include "runtime/errors.hpp"

namespace luna {
namespace runtime {

void Environment::bind(const std::string& name, const Value& value) {
    vars_[name] = value;
}

void Environment::update(const std::string& name, const Value& value) {
    for (Environment* env = this; env != nullptr; env = env->parent_) {
        auto it = env->vars_.find(name);
        if (it != env->vars_.end()) {
            it->second = value;
            return;
        }
    }
    throw RuntimeError(ErrorKind::UnknownVariable, "assignment to unknown variable " + name);
}

Value Environment::lookup(const std::string& name) const {
    for (const Environment* env = this; env != nullptr; env = env->parent_) {
        auto it = env->vars_.find(name);
        if (it != env->vars_.end()) {
            return it->second;
        }
    }
    throw RuntimeError(ErrorKind::UnknownVariable, "reference of unknown variable " + name);
}

bool Environment::isBound(const std::string& name) const {
    for (const Environment* env = this; env != nullptr; env = env->parent_) {
        if (env->vars_.count(name)) return true;
    }
    return false;
}

} // namespace runtime
} // namespace luna
