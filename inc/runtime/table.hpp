/**
 * Tables - associative arrays with an optional metatable
 */

#pragma once

#include "runtime/heap.hpp"
#include "runtime/value.hpp"
#include <cstddef>
#include <optional>
#include <unordered_map>
#include <utility>

namespace luna {
namespace runtime {

class Table : public GcObject {
public:
    using Fields = std::unordered_map<Value, Value, ValueHash>;

    Table() : GcObject(GcObjectType::Table) {}

    /**
     * Raw read, no metamethods. Absent keys read as nil.
     */
    Value get(const Value& key) const;

    /**
     * Raw write, no metamethods. Writing nil removes the entry.
     * Throws RuntimeError for a nil or NaN key.
     */
    void set(const Value& key, const Value& value);

    /**
     * Border: the largest n such that keys 1..n are all present,
     * found by scanning forward from 1.
     */
    std::size_t length() const;

    /**
     * Iteration in unspecified order: the entry after `key`,
     * or the first entry when `key` is nil. Empty at the end.
     */
    std::optional<std::pair<Value, Value>> next(const Value& key) const;

    Table* metatable() const { return metatable_; }
    void setMetatable(Table* metatable) { metatable_ = metatable; }

    std::size_t size() const { return fields_.size(); }
    const Fields& fields() const { return fields_; }

private:
    Fields fields_;
    Table* metatable_ = nullptr;
};

} // namespace runtime
} // namespace luna
