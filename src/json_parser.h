#pragma once

#include <cmath>
#include <cstdint>
#include <fstream>
#include <iterator>
#include <map>
#include <stdexcept>
#include <string>
#include <vector>

/**
 * Minimal JSON reader for configuration files and raw play exports.
 * Supports: objects, arrays, strings (with \u escapes), numbers, booleans, null.
 */
namespace playledger {
namespace json {

/**
 * JSON value type - represents any JSON data structure.
 */
struct Value {
    enum Type { OBJECT, ARRAY, STRING, NUMBER, BOOLEAN, NULL_VALUE };

    Type type = NULL_VALUE;

    std::map<std::string, Value> object;
    std::vector<Value> array;
    std::string string;
    double number = 0.0;
    bool number_is_integer = false;  // literal had no fraction/exponent
    int64_t integer = 0;             // valid when number_is_integer
    bool boolean = false;

    bool is_object() const { return type == OBJECT; }
    bool is_array() const { return type == ARRAY; }
    bool is_string() const { return type == STRING; }
    bool is_number() const { return type == NUMBER; }
    bool is_bool() const { return type == BOOLEAN; }
    bool is_null() const { return type == NULL_VALUE; }

    /**
     * Check if this value is an object and has a specific key.
     */
    bool has_key(const std::string& key) const {
        return type == OBJECT && object.find(key) != object.end();
    }

    /**
     * Get a value by key (for objects). Throws if not an object or key missing.
     */
    const Value& operator[](const std::string& key) const {
        if (type != OBJECT) {
            throw std::runtime_error("JSON value is not an object");
        }
        auto it = object.find(key);
        if (it == object.end()) {
            throw std::runtime_error("JSON key not found: " + key);
        }
        return it->second;
    }

    /**
     * String member or fallback when absent/not a string.
     */
    std::string get_string(const std::string& key, const std::string& fallback = "") const {
        if (has_key(key) && object.at(key).is_string()) {
            return object.at(key).string;
        }
        return fallback;
    }

    int64_t get_int(const std::string& key, int64_t fallback) const {
        if (has_key(key) && object.at(key).is_number()) {
            const Value& v = object.at(key);
            return v.number_is_integer ? v.integer : static_cast<int64_t>(v.number);
        }
        return fallback;
    }

    bool get_bool(const std::string& key, bool fallback) const {
        if (has_key(key) && object.at(key).is_bool()) {
            return object.at(key).boolean;
        }
        return fallback;
    }

    /**
     * Array of strings member; non-string entries are rejected.
     */
    std::vector<std::string> get_string_list(const std::string& key) const {
        std::vector<std::string> out;
        if (!has_key(key)) {
            return out;
        }
        const Value& v = object.at(key);
        if (!v.is_array()) {
            throw std::runtime_error("JSON key '" + key + "' must be an array of strings");
        }
        for (const auto& item : v.array) {
            if (!item.is_string()) {
                throw std::runtime_error("JSON key '" + key + "' must be an array of strings");
            }
            out.push_back(item.string);
        }
        return out;
    }
};

/**
 * Recursive-descent parser over an in-memory document.
 */
class Parser {
public:
    explicit Parser(const std::string& json_string) : json_(json_string), pos_(0) {}

    Value parse() {
        Value result = parse_value();
        skip_whitespace();
        if (pos_ != json_.size()) {
            fail("trailing characters after value");
        }
        return result;
    }

private:
    const std::string& json_;
    size_t pos_;

    [[noreturn]] void fail(const std::string& what) const {
        throw std::runtime_error("JSON: " + what + " at offset " + std::to_string(pos_));
    }

    void skip_whitespace() {
        while (pos_ < json_.size() &&
               (json_[pos_] == ' ' || json_[pos_] == '\n' ||
                json_[pos_] == '\t' || json_[pos_] == '\r')) {
            ++pos_;
        }
    }

    bool try_consume(char c) {
        skip_whitespace();
        if (pos_ < json_.size() && json_[pos_] == c) {
            ++pos_;
            return true;
        }
        return false;
    }

    unsigned parse_hex4() {
        if (pos_ + 4 > json_.size()) {
            fail("incomplete \\u escape");
        }
        unsigned code = 0;
        for (int i = 0; i < 4; ++i) {
            char h = json_[pos_++];
            code <<= 4;
            if (h >= '0' && h <= '9') code |= static_cast<unsigned>(h - '0');
            else if (h >= 'a' && h <= 'f') code |= static_cast<unsigned>(h - 'a' + 10);
            else if (h >= 'A' && h <= 'F') code |= static_cast<unsigned>(h - 'A' + 10);
            else fail("invalid \\u escape");
        }
        return code;
    }

    static void append_utf8(std::string& out, unsigned cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else if (cp < 0x10000) {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xF0 | (cp >> 18)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 12) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parse_string() {
        skip_whitespace();
        if (pos_ >= json_.size() || json_[pos_] != '"') {
            fail("expected string");
        }
        ++pos_;

        std::string result;
        while (pos_ < json_.size()) {
            char c = json_[pos_++];

            if (c == '"') {
                return result;
            }

            if (c != '\\') {
                result.push_back(c);
                continue;
            }

            if (pos_ >= json_.size()) {
                fail("incomplete escape sequence");
            }
            char escape = json_[pos_++];
            switch (escape) {
                case '"':  result.push_back('"'); break;
                case '\\': result.push_back('\\'); break;
                case '/':  result.push_back('/'); break;
                case 'b':  result.push_back('\b'); break;
                case 'f':  result.push_back('\f'); break;
                case 'n':  result.push_back('\n'); break;
                case 'r':  result.push_back('\r'); break;
                case 't':  result.push_back('\t'); break;
                case 'u': {
                    unsigned cp = parse_hex4();
                    // Surrogate pair
                    if (cp >= 0xD800 && cp <= 0xDBFF &&
                        pos_ + 1 < json_.size() && json_[pos_] == '\\' && json_[pos_ + 1] == 'u') {
                        pos_ += 2;
                        unsigned low = parse_hex4();
                        if (low >= 0xDC00 && low <= 0xDFFF) {
                            cp = 0x10000 + ((cp - 0xD800) << 10) + (low - 0xDC00);
                        } else {
                            append_utf8(result, cp);
                            cp = low;
                        }
                    }
                    append_utf8(result, cp);
                    break;
                }
                default:
                    fail("invalid escape sequence");
            }
        }

        fail("unterminated string");
    }

    Value parse_number() {
        size_t start = pos_;
        bool integral = true;
        if (json_[pos_] == '-') {
            ++pos_;
        }
        while (pos_ < json_.size()) {
            char c = json_[pos_];
            if (c >= '0' && c <= '9') {
                ++pos_;
            } else if (c == '.' || c == 'e' || c == 'E' || c == '+' || c == '-') {
                integral = false;
                ++pos_;
            } else {
                break;
            }
        }
        if (pos_ == start) {
            fail("unexpected character");
        }

        std::string literal = json_.substr(start, pos_ - start);
        Value v;
        v.type = Value::NUMBER;
        try {
            v.number = std::stod(literal);
        } catch (const std::logic_error&) {
            fail("invalid number '" + literal + "'");
        }
        if (integral) {
            // Integers beyond int64 stay doubles
            try {
                v.integer = std::stoll(literal);
                v.number_is_integer = true;
            } catch (const std::out_of_range&) {
                v.number_is_integer = false;
            }
        }
        return v;
    }

    Value parse_value() {
        skip_whitespace();
        if (pos_ >= json_.size()) {
            fail("unexpected end of input");
        }

        char c = json_[pos_];
        if (c == '{') {
            return parse_object();
        }
        if (c == '[') {
            return parse_array();
        }
        if (c == '"') {
            Value v;
            v.type = Value::STRING;
            v.string = parse_string();
            return v;
        }
        if (json_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            Value v;
            v.type = Value::BOOLEAN;
            v.boolean = true;
            return v;
        }
        if (json_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            Value v;
            v.type = Value::BOOLEAN;
            return v;
        }
        if (json_.compare(pos_, 4, "null") == 0) {
            pos_ += 4;
            return Value();
        }
        return parse_number();
    }

    Value parse_object() {
        Value v;
        v.type = Value::OBJECT;

        if (!try_consume('{')) {
            fail("expected '{'");
        }
        if (try_consume('}')) {
            return v;
        }

        while (true) {
            std::string key = parse_string();
            if (!try_consume(':')) {
                fail("expected ':'");
            }
            Value value = parse_value();
            v.object[std::move(key)] = std::move(value);

            if (try_consume('}')) {
                break;
            }
            if (!try_consume(',')) {
                fail("expected ',' or '}'");
            }
        }
        return v;
    }

    Value parse_array() {
        Value v;
        v.type = Value::ARRAY;

        if (!try_consume('[')) {
            fail("expected '['");
        }
        if (try_consume(']')) {
            return v;
        }

        while (true) {
            v.array.push_back(parse_value());
            if (try_consume(']')) {
                break;
            }
            if (!try_consume(',')) {
                fail("expected ',' or ']'");
            }
        }
        return v;
    }
};

inline Value parse(const std::string& document) {
    Parser parser(document);
    return parser.parse();
}

/**
 * Parse a JSON file and return the root value.
 */
inline Value parse_file(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file) {
        throw std::runtime_error("Failed to open JSON file: " + filepath);
    }

    std::string content(
        (std::istreambuf_iterator<char>(file)),
        std::istreambuf_iterator<char>()
    );
    try {
        return parse(content);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(filepath + ": " + e.what());
    }
}

} // namespace json
} // namespace playledger
