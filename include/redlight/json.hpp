#pragma once

#include <cctype>
#include <cmath>
#include <cstdint>
#include <fstream>
#include <iomanip>
#include <map>
#include <sstream>
#include <stdexcept>
#include <string>
#include <variant>
#include <vector>

namespace redlight {

class JsonError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class JsonValue {
public:
    using object_t = std::map<std::string, JsonValue>;
    using array_t = std::vector<JsonValue>;
    using value_t = std::variant<std::nullptr_t, bool, double, std::string, object_t, array_t>;

    JsonValue() : value_(nullptr) {}
    JsonValue(std::nullptr_t) : value_(nullptr) {}
    JsonValue(bool v) : value_(v) {}
    JsonValue(int v) : value_(static_cast<double>(v)) {}
    JsonValue(long v) : value_(static_cast<double>(v)) {}
    JsonValue(long long v) : value_(static_cast<double>(v)) {}
    JsonValue(double v) : value_(v) {}
    JsonValue(const char* v) : value_(std::string(v)) {}
    JsonValue(std::string v) : value_(std::move(v)) {}
    JsonValue(object_t v) : value_(std::move(v)) {}
    JsonValue(array_t v) : value_(std::move(v)) {}

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value_); }
    bool isBool() const { return std::holds_alternative<bool>(value_); }
    bool isNumber() const { return std::holds_alternative<double>(value_); }
    bool isString() const { return std::holds_alternative<std::string>(value_); }
    bool isObject() const { return std::holds_alternative<object_t>(value_); }
    bool isArray() const { return std::holds_alternative<array_t>(value_); }

    const object_t& asObject() const { return get<object_t>("object"); }
    object_t& asObject() { return get<object_t>("object"); }
    const array_t& asArray() const { return get<array_t>("array"); }
    array_t& asArray() { return get<array_t>("array"); }
    const std::string& asString() const { return get<std::string>("string"); }
    double asNumber() const { return get<double>("number"); }
    bool asBool() const { return get<bool>("boolean"); }
    bool asBool(bool fallback) const { return isBool() ? std::get<bool>(value_) : fallback; }

    bool contains(const std::string& key) const {
        if (!isObject()) {
            return false;
        }
        const auto& obj = std::get<object_t>(value_);
        return obj.find(key) != obj.end();
    }

    const JsonValue& at(const std::string& key) const {
        const auto& obj = asObject();
        auto it = obj.find(key);
        if (it == obj.end()) {
            throw JsonError("key not found: " + key);
        }
        return it->second;
    }

    const JsonValue& operator[](const std::string& key) const { return at(key); }
    JsonValue& operator[](const std::string& key) { return asObject()[key]; }

    std::string getString(const std::string& key, const std::string& fallback = {}) const {
        if (!contains(key) || !at(key).isString()) {
            return fallback;
        }
        return at(key).asString();
    }

    double getNumber(const std::string& key, double fallback = 0.0) const {
        if (!contains(key) || !at(key).isNumber()) {
            return fallback;
        }
        return at(key).asNumber();
    }

    bool getBool(const std::string& key, bool fallback = false) const {
        if (!contains(key)) {
            return fallback;
        }
        return at(key).asBool(fallback);
    }

    std::string dump(int indent = -1) const {
        std::string out;
        dumpImpl(out, indent, 0);
        return out;
    }

private:
    template <typename T>
    const T& get(const char* expected) const {
        if (const T* p = std::get_if<T>(&value_)) {
            return *p;
        }
        throw JsonError(std::string("JSON value is not a ") + expected);
    }

    template <typename T>
    T& get(const char* expected) {
        if (T* p = std::get_if<T>(&value_)) {
            return *p;
        }
        throw JsonError(std::string("JSON value is not a ") + expected);
    }

    void dumpImpl(std::string& out, int indent, int depth) const;

    value_t value_;
};

inline JsonValue makeObject() { return JsonValue(JsonValue::object_t{}); }
inline JsonValue makeArray() { return JsonValue(JsonValue::array_t{}); }

namespace detail {

inline void appendEscaped(std::string& out, const std::string& text) {
    out.push_back('"');
    for (char c : text) {
        switch (c) {
        case '\\': out += "\\\\"; break;
        case '"': out += "\\\""; break;
        case '\n': out += "\\n"; break;
        case '\r': out += "\\r"; break;
        case '\t': out += "\\t"; break;
        case '\b': out += "\\b"; break;
        case '\f': out += "\\f"; break;
        default:
            if (static_cast<unsigned char>(c) < 0x20) {
                std::ostringstream oss;
                oss << "\\u" << std::hex << std::setw(4) << std::setfill('0')
                    << static_cast<int>(static_cast<unsigned char>(c));
                out += oss.str();
            } else {
                out.push_back(c);
            }
            break;
        }
    }
    out.push_back('"');
}

inline void appendNumber(std::string& out, double value) {
    if (!std::isfinite(value)) {
        out += "null";
        return;
    }
    std::ostringstream oss;
    oss << std::setprecision(15) << value;
    out += oss.str();
}

inline void newline(std::string& out, int indent, int depth) {
    if (indent >= 0) {
        out.push_back('\n');
        out.append(static_cast<std::size_t>(depth * indent), ' ');
    }
}

class Parser {
public:
    explicit Parser(const std::string& text) : s_(text) {}

    JsonValue parse() {
        JsonValue value = parseValue();
        skipWs();
        if (pos_ != s_.size()) {
            fail("unexpected trailing characters");
        }
        return value;
    }

private:
    [[noreturn]] void fail(const std::string& what) const {
        throw JsonError("JSON parse error at offset " + std::to_string(pos_) + ": " + what);
    }

    void skipWs() {
        while (pos_ < s_.size() && std::isspace(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }

    char peek() const { return pos_ < s_.size() ? s_[pos_] : '\0'; }

    bool consume(char expected) {
        skipWs();
        if (peek() != expected) {
            return false;
        }
        ++pos_;
        return true;
    }

    JsonValue parseValue() {
        skipWs();
        const char c = peek();
        if (c == '"') return JsonValue(parseString());
        if (c == '{') return parseObject();
        if (c == '[') return parseArray();
        if (c == 't' || c == 'f') return parseBool();
        if (c == 'n') return parseNull();
        if (c == '-' || std::isdigit(static_cast<unsigned char>(c))) return parseNumber();
        fail("invalid value");
    }

    JsonValue parseObject() {
        consume('{');
        JsonValue::object_t obj;
        if (consume('}')) {
            return JsonValue(std::move(obj));
        }
        while (true) {
            skipWs();
            if (peek() != '"') {
                fail("expected string key");
            }
            std::string key = parseString();
            if (!consume(':')) {
                fail("expected ':' after key");
            }
            obj[std::move(key)] = parseValue();
            if (consume('}')) {
                break;
            }
            if (!consume(',')) {
                fail("expected ',' in object");
            }
        }
        return JsonValue(std::move(obj));
    }

    JsonValue parseArray() {
        consume('[');
        JsonValue::array_t arr;
        if (consume(']')) {
            return JsonValue(std::move(arr));
        }
        while (true) {
            arr.push_back(parseValue());
            if (consume(']')) {
                break;
            }
            if (!consume(',')) {
                fail("expected ',' in array");
            }
        }
        return JsonValue(std::move(arr));
    }

    static void appendUtf8(std::string& out, unsigned int cp) {
        if (cp < 0x80) {
            out.push_back(static_cast<char>(cp));
        } else if (cp < 0x800) {
            out.push_back(static_cast<char>(0xC0 | (cp >> 6)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        } else {
            out.push_back(static_cast<char>(0xE0 | (cp >> 12)));
            out.push_back(static_cast<char>(0x80 | ((cp >> 6) & 0x3F)));
            out.push_back(static_cast<char>(0x80 | (cp & 0x3F)));
        }
    }

    std::string parseString() {
        ++pos_;  // opening quote
        std::string out;
        while (true) {
            if (pos_ >= s_.size()) {
                fail("unterminated string");
            }
            char c = s_[pos_++];
            if (c == '"') {
                break;
            }
            if (c != '\\') {
                out.push_back(c);
                continue;
            }
            if (pos_ >= s_.size()) {
                fail("invalid escape sequence");
            }
            char esc = s_[pos_++];
            switch (esc) {
            case '"': out.push_back('"'); break;
            case '\\': out.push_back('\\'); break;
            case '/': out.push_back('/'); break;
            case 'b': out.push_back('\b'); break;
            case 'f': out.push_back('\f'); break;
            case 'n': out.push_back('\n'); break;
            case 'r': out.push_back('\r'); break;
            case 't': out.push_back('\t'); break;
            case 'u': {
                if (pos_ + 4 > s_.size()) {
                    fail("truncated unicode escape");
                }
                unsigned int cp = 0;
                for (int i = 0; i < 4; ++i) {
                    const char h = s_[pos_++];
                    cp <<= 4;
                    if (h >= '0' && h <= '9') cp |= static_cast<unsigned int>(h - '0');
                    else if (h >= 'a' && h <= 'f') cp |= static_cast<unsigned int>(h - 'a' + 10);
                    else if (h >= 'A' && h <= 'F') cp |= static_cast<unsigned int>(h - 'A' + 10);
                    else fail("invalid unicode escape");
                }
                appendUtf8(out, cp);
                break;
            }
            default:
                fail("unsupported escape sequence");
            }
        }
        return out;
    }

    JsonValue parseBool() {
        if (s_.compare(pos_, 4, "true") == 0) {
            pos_ += 4;
            return JsonValue(true);
        }
        if (s_.compare(pos_, 5, "false") == 0) {
            pos_ += 5;
            return JsonValue(false);
        }
        fail("invalid boolean literal");
    }

    JsonValue parseNull() {
        if (s_.compare(pos_, 4, "null") != 0) {
            fail("invalid null literal");
        }
        pos_ += 4;
        return JsonValue(nullptr);
    }

    void skipDigits() {
        while (pos_ < s_.size() && std::isdigit(static_cast<unsigned char>(s_[pos_]))) {
            ++pos_;
        }
    }

    JsonValue parseNumber() {
        const std::size_t start = pos_;
        if (peek() == '-') {
            ++pos_;
        }
        if (!std::isdigit(static_cast<unsigned char>(peek()))) {
            fail("invalid number");
        }
        skipDigits();
        if (peek() == '.') {
            ++pos_;
            skipDigits();
        }
        if (peek() == 'e' || peek() == 'E') {
            ++pos_;
            if (peek() == '+' || peek() == '-') {
                ++pos_;
            }
            skipDigits();
        }
        try {
            return JsonValue(std::stod(s_.substr(start, pos_ - start)));
        } catch (const std::exception&) {
            fail("number out of range");
        }
    }

    const std::string& s_;
    std::size_t pos_{0};
};

}  // namespace detail

inline void JsonValue::dumpImpl(std::string& out, int indent, int depth) const {
    if (isNull()) {
        out += "null";
    } else if (isBool()) {
        out += std::get<bool>(value_) ? "true" : "false";
    } else if (isNumber()) {
        detail::appendNumber(out, std::get<double>(value_));
    } else if (isString()) {
        detail::appendEscaped(out, std::get<std::string>(value_));
    } else if (isArray()) {
        const auto& arr = std::get<array_t>(value_);
        out.push_back('[');
        for (std::size_t i = 0; i < arr.size(); ++i) {
            if (i > 0) {
                out.push_back(',');
            }
            detail::newline(out, indent, depth + 1);
            arr[i].dumpImpl(out, indent, depth + 1);
        }
        if (!arr.empty()) {
            detail::newline(out, indent, depth);
        }
        out.push_back(']');
    } else {
        const auto& obj = std::get<object_t>(value_);
        out.push_back('{');
        std::size_t count = 0;
        for (const auto& kv : obj) {
            if (count++ > 0) {
                out.push_back(',');
            }
            detail::newline(out, indent, depth + 1);
            detail::appendEscaped(out, kv.first);
            out.push_back(':');
            if (indent >= 0) {
                out.push_back(' ');
            }
            kv.second.dumpImpl(out, indent, depth + 1);
        }
        if (!obj.empty()) {
            detail::newline(out, indent, depth);
        }
        out.push_back('}');
    }
}

inline JsonValue parseJson(const std::string& text) {
    detail::Parser parser(text);
    return parser.parse();
}

inline JsonValue parseJsonFile(const std::string& path) {
    std::ifstream input(path);
    if (!input.is_open()) {
        throw JsonError("Failed to open file: " + path);
    }
    std::string content((std::istreambuf_iterator<char>(input)), std::istreambuf_iterator<char>());
    return parseJson(content);
}

}  // namespace redlight
