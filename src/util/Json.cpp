#include "trustchain/util/Json.hpp"

#include <cerrno>
#include <charconv>
#include <cmath>
#include <cstdio>
#include <cstdlib>
#include <system_error>

namespace trustchain::json {

namespace {

constexpr std::size_t kMaxDepth = 64;

bool is_digit(char ch) {
    return ch >= '0' && ch <= '9';
}

int hex_digit_value(char ch) {
    if (ch >= '0' && ch <= '9') {
        return ch - '0';
    }
    if (ch >= 'a' && ch <= 'f') {
        return ch - 'a' + 10;
    }
    if (ch >= 'A' && ch <= 'F') {
        return ch - 'A' + 10;
    }
    return -1;
}

void append_utf8(std::string& out, std::uint32_t code_point) {
    if (code_point < 0x80) {
        out.push_back(static_cast<char>(code_point));
    } else if (code_point < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (code_point >> 6)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else if (code_point < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (code_point >> 12)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (code_point >> 18)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code_point >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code_point & 0x3F)));
    }
}

class Reader {
public:
    explicit Reader(std::string_view text) : text_(text) {}

    Value document() {
        Value value = read_value(0);
        skip_space();
        if (offset_ != text_.size()) {
            fail("trailing content after document");
        }
        return value;
    }

private:
    [[noreturn]] void fail(std::string_view what) const {
        throw ParseError("JSON offset " + std::to_string(offset_) + ": " + std::string(what));
    }

    void skip_space() {
        while (offset_ < text_.size()) {
            const char ch = text_[offset_];
            if (ch != ' ' && ch != '\t' && ch != '\n' && ch != '\r') {
                return;
            }
            ++offset_;
        }
    }

    char current() const {
        return offset_ < text_.size() ? text_[offset_] : '\0';
    }

    bool consume(char expected) {
        skip_space();
        if (current() != expected) {
            return false;
        }
        ++offset_;
        return true;
    }

    void expect(char expected) {
        if (!consume(expected)) {
            fail(std::string("expected '") + expected + "'");
        }
    }

    bool consume_word(std::string_view word) {
        if (text_.substr(offset_, word.size()) != word) {
            return false;
        }
        offset_ += word.size();
        return true;
    }

    Value read_value(std::size_t depth) {
        if (depth > kMaxDepth) {
            fail("nesting too deep");
        }
        skip_space();
        switch (current()) {
            case '{':
                return read_object(depth);
            case '[':
                return read_array(depth);
            case '"':
                return Value(read_string());
            case '\0':
                fail("unexpected end of input");
            default:
                break;
        }
        if (consume_word("true")) {
            return Value(true);
        }
        if (consume_word("false")) {
            return Value(false);
        }
        if (consume_word("null")) {
            return Value();
        }
        if (current() == '-' || is_digit(current())) {
            return read_number();
        }
        fail("unexpected character");
    }

    Value read_object(std::size_t depth) {
        ++offset_;
        Value object = Value::make_object();
        if (consume('}')) {
            return object;
        }
        do {
            skip_space();
            if (current() != '"') {
                fail("object keys must be strings");
            }
            std::string key = read_string();
            expect(':');
            object.object_value.insert_or_assign(std::move(key), read_value(depth + 1));
        } while (consume(','));
        expect('}');
        return object;
    }

    Value read_array(std::size_t depth) {
        ++offset_;
        Value array = Value::make_array();
        if (consume(']')) {
            return array;
        }
        do {
            array.array_value.push_back(read_value(depth + 1));
        } while (consume(','));
        expect(']');
        return array;
    }

    std::uint32_t read_hex4() {
        if (text_.size() - offset_ < 4) {
            fail("truncated \\u escape");
        }
        std::uint32_t unit = 0;
        for (int i = 0; i < 4; ++i) {
            const int digit = hex_digit_value(text_[offset_++]);
            if (digit < 0) {
                fail("bad hex digit in \\u escape");
            }
            unit = (unit << 4) | static_cast<std::uint32_t>(digit);
        }
        return unit;
    }

    std::uint32_t read_code_point() {
        const std::uint32_t unit = read_hex4();
        if (unit < 0xD800 || unit > 0xDBFF) {
            return unit;
        }
        if (!consume_word("\\u")) {
            fail("unpaired surrogate");
        }
        const std::uint32_t low = read_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
            fail("unpaired surrogate");
        }
        return 0x10000 + ((unit - 0xD800) << 10) + (low - 0xDC00);
    }

    std::string read_string() {
        ++offset_;
        std::string out;
        while (offset_ < text_.size()) {
            const char ch = text_[offset_++];
            if (ch == '"') {
                return out;
            }
            if (static_cast<unsigned char>(ch) < 0x20) {
                fail("raw control character in string");
            }
            if (ch != '\\') {
                out.push_back(ch);
                continue;
            }
            if (offset_ == text_.size()) {
                break;
            }
            const char escape = text_[offset_++];
            switch (escape) {
                case '"':
                case '\\':
                case '/':
                    out.push_back(escape);
                    break;
                case 'b':
                    out.push_back('\b');
                    break;
                case 'f':
                    out.push_back('\f');
                    break;
                case 'n':
                    out.push_back('\n');
                    break;
                case 'r':
                    out.push_back('\r');
                    break;
                case 't':
                    out.push_back('\t');
                    break;
                case 'u':
                    append_utf8(out, read_code_point());
                    break;
                default:
                    fail("unknown escape");
            }
        }
        fail("unterminated string");
    }

    void skip_digits() {
        while (is_digit(current())) {
            ++offset_;
        }
    }

    Value read_number() {
        const std::size_t begin = offset_;
        if (current() == '-') {
            ++offset_;
        }
        skip_digits();
        bool integral = true;
        if (current() == '.') {
            integral = false;
            ++offset_;
            skip_digits();
        }
        if (current() == 'e' || current() == 'E') {
            integral = false;
            ++offset_;
            if (current() == '+' || current() == '-') {
                ++offset_;
            }
            skip_digits();
        }
        const std::string token(text_.substr(begin, offset_ - begin));
        if (integral) {
            std::int64_t value{};
            const auto [end, ec] = std::from_chars(token.data(), token.data() + token.size(), value);
            if (ec == std::errc{} && end == token.data() + token.size()) {
                return Value(value);
            }
        }
        // Integers outside int64 fall through to double.
        char* end = nullptr;
        errno = 0;
        const double value = std::strtod(token.c_str(), &end);
        if (token.empty() || end != token.c_str() + token.size() || errno == ERANGE) {
            fail("malformed number");
        }
        return Value(value);
    }

    std::string_view text_;
    std::size_t offset_{0};
};

void append_quoted(std::string& out, std::string_view text) {
    static constexpr char kHex[] = "0123456789abcdef";
    out.push_back('"');
    for (const char ch : text) {
        const auto byte = static_cast<unsigned char>(ch);
        if (ch == '"' || ch == '\\') {
            out.push_back('\\');
            out.push_back(ch);
        } else if (ch == '\n') {
            out += "\\n";
        } else if (ch == '\r') {
            out += "\\r";
        } else if (ch == '\t') {
            out += "\\t";
        } else if (byte < 0x20) {
            out += "\\u00";
            out.push_back(kHex[byte >> 4]);
            out.push_back(kHex[byte & 0x0F]);
        } else {
            out.push_back(ch);
        }
    }
    out.push_back('"');
}

void append_value(std::string& out, const Value& value) {
    switch (value.type) {
        case ValueType::Null:
            out += "null";
            return;
        case ValueType::Boolean:
            out += value.boolean_value ? "true" : "false";
            return;
        case ValueType::Integer:
            out += std::to_string(value.integer_value);
            return;
        case ValueType::Double: {
            if (!std::isfinite(value.double_value)) {
                out += "null";
                return;
            }
            char buffer[32];
            std::snprintf(buffer, sizeof(buffer), "%.17g", value.double_value);
            out += buffer;
            return;
        }
        case ValueType::String:
            append_quoted(out, value.string_value);
            return;
        case ValueType::Object: {
            out.push_back('{');
            const char* separator = "";
            for (const auto& [key, child] : value.object_value) {
                out += separator;
                separator = ",";
                append_quoted(out, key);
                out.push_back(':');
                append_value(out, child);
            }
            out.push_back('}');
            return;
        }
        case ValueType::Array: {
            out.push_back('[');
            const char* separator = "";
            for (const auto& child : value.array_value) {
                out += separator;
                separator = ",";
                append_value(out, child);
            }
            out.push_back(']');
            return;
        }
    }
}

}  // namespace

std::map<std::string, Value>& Value::ensure_object() {
    if (type != ValueType::Object) {
        type = ValueType::Object;
        object_value.clear();
        array_value.clear();
        string_value.clear();
    }
    return object_value;
}

std::vector<Value>& Value::ensure_array() {
    if (type != ValueType::Array) {
        type = ValueType::Array;
        array_value.clear();
        object_value.clear();
        string_value.clear();
    }
    return array_value;
}

const std::map<std::string, Value>& Value::as_object() const {
    static const std::map<std::string, Value> empty{};
    return type == ValueType::Object ? object_value : empty;
}

const std::vector<Value>& Value::as_array() const {
    static const std::vector<Value> empty{};
    return type == ValueType::Array ? array_value : empty;
}

const Value* Value::find(std::string_view key) const {
    if (!is_object()) {
        return nullptr;
    }
    const auto it = object_value.find(std::string(key));
    return it == object_value.end() ? nullptr : &it->second;
}

Value parse(std::string_view text) {
    return Reader(text).document();
}

std::string serialize(const Value& value) {
    std::string out;
    append_value(out, value);
    return out;
}

std::string quote(std::string_view text) {
    std::string out;
    out.reserve(text.size() + 2);
    append_quoted(out, text);
    return out;
}

const Value* find_path(const Value& root, const std::vector<std::string>& path) {
    const Value* node = &root;
    for (const auto& segment : path) {
        node = node->find(segment);
        if (!node) {
            return nullptr;
        }
    }
    return node;
}

Value merge_objects(const Value& base, const Value& overlay) {
    if (!overlay.is_object()) {
        return overlay;
    }
    Value result = base;
    if (!result.is_object()) {
        result = Value::make_object();
    }
    for (const auto& [key, value] : overlay.as_object()) {
        auto& fields = result.as_object();
        const auto existing = fields.find(key);
        if (value.is_object() && existing != fields.end() && existing->second.is_object()) {
            existing->second = merge_objects(existing->second, value);
        } else {
            fields[key] = value;
        }
    }
    return result;
}

std::optional<std::string> get_string(const Value& object, std::string_view key) {
    const Value* node = object.find(key);
    if (!node || !node->is_string()) {
        return std::nullopt;
    }
    return node->string_value;
}

std::optional<std::int64_t> get_int64(const Value& object, std::string_view key) {
    const Value* node = object.find(key);
    if (!node) {
        return std::nullopt;
    }
    if (node->is_integer()) {
        return node->integer_value;
    }
    if (node->is_double()) {
        const double rounded = std::floor(node->double_value + 0.5);
        if (std::abs(node->double_value - rounded) < 1e-9) {
            return static_cast<std::int64_t>(rounded);
        }
    }
    return std::nullopt;
}

std::optional<double> get_double(const Value& object, std::string_view key) {
    const Value* node = object.find(key);
    if (!node || !node->is_number()) {
        return std::nullopt;
    }
    return node->number();
}

std::optional<bool> get_bool(const Value& object, std::string_view key) {
    const Value* node = object.find(key);
    if (!node || !node->is_boolean()) {
        return std::nullopt;
    }
    return node->boolean_value;
}

}  // namespace trustchain::json
