/**
 * Heap Implementation - tri-color mark & sweep
 */

#include "runtime/heap.hpp"
#include "runtime/environment.hpp"
#include "runtime/function.hpp"
#include "runtime/table.hpp"
#include <algorithm>

namespace luna {
namespace runtime {

void Heap::markValue(const Value& value) {
    if (value.isTable()) {
        markObject(value.asTable());
    } else if (value.isFunction()) {
        markObject(value.asFunction());
    }
}

void Heap::markObject(GcObject* object) {
    if (object == nullptr || object->marked_) return;
    object->marked_ = true;
    grayStack_.push_back(object);
}

void Heap::blacken(GcObject* object) {
    switch (object->gcType()) {
        case GcObjectType::Table: {
            auto* table = static_cast<Table*>(object);
            markObject(table->metatable());
            for (const auto& entry : table->fields()) {
                markValue(entry.first);
                markValue(entry.second);
            }
            break;
        }
        case GcObjectType::Function: {
            auto* function = static_cast<Function*>(object);
            markObject(function->environment());
            break;
        }
        case GcObjectType::Environment: {
            auto* env = static_cast<Environment*>(object);
            markObject(env->parent());
            for (const auto& binding : env->bindings()) {
                markValue(binding.second);
            }
            break;
        }
    }
}

std::size_t Heap::collect() {
    // Trace: iterative so deep structures do not exhaust the stack
    while (!grayStack_.empty()) {
        GcObject* object = grayStack_.back();
        grayStack_.pop_back();
        blacken(object);
    }

    // Sweep
    auto firstDead = std::partition(objects_.begin(), objects_.end(),
        [](const std::unique_ptr<GcObject>& object) { return object->marked_; });
    std::size_t freed = static_cast<std::size_t>(objects_.end() - firstDead);
    objects_.erase(firstDead, objects_.end());

    for (auto& object : objects_) {
        object->marked_ = false;
    }
    return freed;
}

} // namespace runtime
} // namespace luna
