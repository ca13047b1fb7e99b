#pragma once

#include <cstdint>
#include <map>
#include <optional>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace trustchain::json {

enum class ValueType {
    Null,
    Boolean,
    Integer,
    Double,
    String,
    Object,
    Array
};

struct Value {
    ValueType type{ValueType::Null};
    bool boolean_value{false};
    std::int64_t integer_value{0};
    double double_value{0.0};
    std::string string_value;
    std::map<std::string, Value> object_value;
    std::vector<Value> array_value;

    Value() = default;
    explicit Value(bool value) : type(ValueType::Boolean), boolean_value(value) {}
    explicit Value(std::int64_t value) : type(ValueType::Integer), integer_value(value) {}
    explicit Value(double value) : type(ValueType::Double), double_value(value) {}
    explicit Value(std::string value) : type(ValueType::String), string_value(std::move(value)) {}
    Value(const char* value) : Value(std::string(value)) {}

    static Value make_object() {
        Value value;
        value.type = ValueType::Object;
        return value;
    }

    static Value make_array() {
        Value value;
        value.type = ValueType::Array;
        return value;
    }

    bool is_null() const { return type == ValueType::Null; }
    bool is_boolean() const { return type == ValueType::Boolean; }
    bool is_integer() const { return type == ValueType::Integer; }
    bool is_double() const { return type == ValueType::Double; }
    bool is_number() const { return is_integer() || is_double(); }
    bool is_string() const { return type == ValueType::String; }
    bool is_object() const { return type == ValueType::Object; }
    bool is_array() const { return type == ValueType::Array; }

    double number() const { return is_integer() ? static_cast<double>(integer_value) : double_value; }

    std::map<std::string, Value>& ensure_object();
    std::vector<Value>& ensure_array();

    const std::map<std::string, Value>& as_object() const;
    std::map<std::string, Value>& as_object() { return ensure_object(); }

    const std::vector<Value>& as_array() const;
    std::vector<Value>& as_array() { return ensure_array(); }

    const Value* find(std::string_view key) const;
};

class ParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

Value parse(std::string_view text);

// Compact serialization; object keys come out in sorted order.
std::string serialize(const Value& value);

// Double-quoted, escaped JSON string literal.
std::string quote(std::string_view text);

const Value* find_path(const Value& root, const std::vector<std::string>& path);
Value merge_objects(const Value& base, const Value& overlay);

std::optional<std::string> get_string(const Value& object, std::string_view key);
std::optional<std::int64_t> get_int64(const Value& object, std::string_view key);
std::optional<double> get_double(const Value& object, std::string_view key);
std::optional<bool> get_bool(const Value& object, std::string_view key);

}  // namespace trustchain::json
