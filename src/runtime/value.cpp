/**
 * Runtime Value Implementation
 */

#include "runtime/value.hpp"
#include <cmath>
#include <cstdio>
#include <functional>
#include <sstream>
#include <type_traits>

namespace luna {
namespace runtime {

// =============================================================================
// Kind Names
// =============================================================================

const char* kindName(ValueKind kind) {
    switch (kind) {
        case ValueKind::Nil: return "nil";
        case ValueKind::Boolean: return "boolean";
        case ValueKind::Number: return "number";
        case ValueKind::String: return "string";
        case ValueKind::Table: return "table";
        case ValueKind::Function: return "function";
    }
    return "unknown";
}

// =============================================================================
// String Conversion
// =============================================================================

std::string numberToString(double number) {
    if (std::isnan(number)) return "nan";
    if (std::isinf(number)) return number > 0 ? "inf" : "-inf";

    char buffer[64];
    if (std::floor(number) == number && std::fabs(number) < 1e15) {
        std::snprintf(buffer, sizeof(buffer), "%lld", static_cast<long long>(number));
    } else {
        std::snprintf(buffer, sizeof(buffer), "%.14g", number);
    }
    return buffer;
}

std::string Value::toString() const {
    return std::visit([](auto&& arg) -> std::string {
        using T = std::decay_t<decltype(arg)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
            return "nil";
        } else if constexpr (std::is_same_v<T, bool>) {
            return arg ? "true" : "false";
        } else if constexpr (std::is_same_v<T, double>) {
            return numberToString(arg);
        } else if constexpr (std::is_same_v<T, std::string>) {
            return arg;
        } else if constexpr (std::is_same_v<T, Table*>) {
            std::ostringstream out;
            out << "table: " << static_cast<const void*>(arg);
            return out.str();
        } else {
            std::ostringstream out;
            out << "function: " << static_cast<const void*>(arg);
            return out.str();
        }
    }, data_);
}

std::size_t Value::hash() const {
    return std::hash<Storage>{}(data_);
}

} // namespace runtime
} // namespace luna
