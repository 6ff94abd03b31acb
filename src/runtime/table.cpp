/**
 * Table Implementation
 */

#include "runtime/table.hpp"
#include "runtime/errors.hpp"
#include <cmath>

namespace luna {
namespace runtime {

namespace {

// -0 and 0 must land on the same entry
Value normalizeKey(const Value& key) {
    if (key.isNumber() && key.asNumber() == 0.0) {
        return Value::number(0.0);
    }
    return key;
}

} // namespace

Value Table::get(const Value& key) const {
    auto it = fields_.find(normalizeKey(key));
    if (it == fields_.end()) {
        return Value();
    }
    return it->second;
}

void Table::set(const Value& key, const Value& value) {
    if (key.isNil()) {
        throw RuntimeError(ErrorKind::InvalidTableKey, "table index is nil");
    }
    if (key.isNumber() && std::isnan(key.asNumber())) {
        throw RuntimeError(ErrorKind::InvalidTableKey, "table index is NaN");
    }

    if (value.isNil()) {
        fields_.erase(normalizeKey(key));
    } else {
        fields_[normalizeKey(key)] = value;
    }
}

std::size_t Table::length() const {
    std::size_t n = 0;
    while (fields_.find(Value::number(static_cast<double>(n + 1))) != fields_.end()) {
        n++;
    }
    return n;
}

std::optional<std::pair<Value, Value>> Table::next(const Value& key) const {
    Fields::const_iterator it;
    if (key.isNil()) {
        it = fields_.begin();
    } else {
        it = fields_.find(normalizeKey(key));
        if (it == fields_.end()) {
            return std::nullopt;
        }
        ++it;
    }

    if (it == fields_.end()) {
        return std::nullopt;
    }
    return std::make_pair(it->first, it->second);
}

} // namespace runtime
} // namespace luna
