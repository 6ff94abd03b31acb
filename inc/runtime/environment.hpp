/**
 * Runtime environment - chained variable bindings
 *
 * bind() always writes the current frame (shadowing outer bindings);
 * update() and lookup() walk outward to the nearest frame that has
 * the name and fail if none does. There is no implicit global
 * creation.
 */

#ifndef LUNA_ENVIRONMENT_HPP
#define LUNA_ENVIRONMENT_HPP

#include "runtime/heap.hpp"
#include "runtime/value.hpp"
#include <string>
#include <unordered_map>

namespace luna {
namespace runtime {

class Environment : public GcObject {
public:
    explicit Environment(Environment* parent = nullptr)
        : GcObject(GcObjectType::Environment), parent_(parent) {}

    void bind(const std::string& name, const Value& value);
    void update(const std::string& name, const Value& value);
    Value lookup(const std::string& name) const;

    /**
     * Whether any frame up the chain has the name
     */
    bool isBound(const std::string& name) const;

    Environment* parent() const { return parent_; }
    const std::unordered_map<std::string, Value>& bindings() const { return vars_; }

private:
    std::unordered_map<std::string, Value> vars_;
    Environment* parent_;
};

} // namespace runtime
} // namespace luna

#endif // LUNA_ENVIRONMENT_HPP
