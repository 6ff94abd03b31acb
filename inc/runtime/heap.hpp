/**
 * Interpreter Heap - Mark & Sweep Collection
 *
 * Every table, function and environment is allocated here and owned
 * by the heap. Values and environments refer to each other through
 * raw pointers, so reference cycles (a table holding a closure whose
 * environment holds the table) are fine: reachability is decided by
 * tracing from the roots the interpreter marks before a collection.
 */

#ifndef LUNA_HEAP_HPP
#define LUNA_HEAP_HPP

#include "runtime/value.hpp"
#include <cstddef>
#include <memory>
#include <utility>
#include <vector>

namespace luna {
namespace runtime {

enum class GcObjectType {
    Table,
    Function,
    Environment
};

/**
 * Common header of all heap objects
 */
class GcObject {
public:
    explicit GcObject(GcObjectType type) : type_(type) {}
    virtual ~GcObject() = default;

    GcObject(const GcObject&) = delete;
    GcObject& operator=(const GcObject&) = delete;

    GcObjectType gcType() const { return type_; }

private:
    friend class Heap;

    GcObjectType type_;
    bool marked_ = false;
};

class Heap {
public:
    Heap() = default;

    Heap(const Heap&) = delete;
    Heap& operator=(const Heap&) = delete;

    template <typename T, typename... Args>
    T* allocate(Args&&... args) {
        auto object = std::make_unique<T>(std::forward<Args>(args)...);
        T* raw = object.get();
        objects_.push_back(std::move(object));
        return raw;
    }

    /**
     * Root marking - call for every root before collect()
     */
    void markValue(const Value& value);
    void markObject(GcObject* object);

    /**
     * Trace from the marked roots, free everything unreached
     *
     * @return Number of objects freed
     */
    std::size_t collect();

    std::size_t objectCount() const { return objects_.size(); }

private:
    void blacken(GcObject* object);

    std::vector<std::unique_ptr<GcObject>> objects_;
    std::vector<GcObject*> grayStack_;
};

} // namespace runtime
} // namespace luna

#endif // LUNA_HEAP_HPP
