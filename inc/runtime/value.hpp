/**
 * Runtime Values
 *
 * The closed set of values a script can produce:
 * - nil, boolean, number (double precision), string
 * - table and function (shared by reference, compared by identity)
 *
 * Tables and functions live on the interpreter heap; a Value only
 * holds a non-owning pointer to them.
 */

#pragma once

#include <cstddef>
#include <string>
#include <variant>
#include <vector>

namespace luna {
namespace runtime {

class Table;
class Function;

/**
 * Value kinds, in the same order as the alternatives of Value::Storage
 */
enum class ValueKind {
    Nil,
    Boolean,
    Number,
    String,
    Table,
    Function
};

/**
 * Name of a kind as scripts see it ("nil", "number", ...)
 */
const char* kindName(ValueKind kind);

/**
 * Canonical string form of a number: integral values print
 * without a decimal point.
 */
std::string numberToString(double number);

class Value {
public:
    using Storage = std::variant<
        std::monostate,   // Nil
        bool,             // Boolean
        double,           // Number
        std::string,      // String
        Table*,           // Table
        Function*         // Function
    >;

    Value() = default;

    static Value nil() { return Value(); }
    static Value boolean(bool b) { Value v; v.data_ = b; return v; }
    static Value number(double d) { Value v; v.data_ = d; return v; }
    static Value string(std::string s) { Value v; v.data_ = std::move(s); return v; }
    static Value table(Table* t) { Value v; v.data_ = t; return v; }
    static Value function(Function* f) { Value v; v.data_ = f; return v; }

    ValueKind kind() const { return static_cast<ValueKind>(data_.index()); }

    bool isNil() const { return std::holds_alternative<std::monostate>(data_); }
    bool isBoolean() const { return std::holds_alternative<bool>(data_); }
    bool isNumber() const { return std::holds_alternative<double>(data_); }
    bool isString() const { return std::holds_alternative<std::string>(data_); }
    bool isTable() const { return std::holds_alternative<Table*>(data_); }
    bool isFunction() const { return std::holds_alternative<Function*>(data_); }

    bool asBoolean() const { return std::get<bool>(data_); }
    double asNumber() const { return std::get<double>(data_); }
    const std::string& asString() const { return std::get<std::string>(data_); }
    Table* asTable() const { return std::get<Table*>(data_); }
    Function* asFunction() const { return std::get<Function*>(data_); }

    /**
     * Anything but nil and false
     */
    bool isTruthy() const {
        if (isNil()) return false;
        if (isBoolean()) return asBoolean();
        return true;
    }

    /**
     * Canonical string form, as used by concatenation and printing
     */
    std::string toString() const;

    /**
     * Raw equality: by value for nil/boolean/number/string,
     * by identity for tables and functions. No metamethods.
     */
    bool operator==(const Value& other) const { return data_ == other.data_; }
    bool operator!=(const Value& other) const { return !(*this == other); }

    std::size_t hash() const;

private:
    Storage data_;
};

using ValueList = std::vector<Value>;

struct ValueHash {
    std::size_t operator()(const Value& value) const { return value.hash(); }
};

} // namespace runtime
} // namespace luna
