//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONParser.cpp
// Purpose: Minimalistic JSON parser and serializer using only std library
//==========================================================================================================

#include <sstream>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <limits>
#include "authgate/JSONValue.h"
#include "logging/Logger.h"


namespace authgate {

//----------------------------------------------------------------------------------------------------------
// JSONValue special members (out-of-line definitions)
//----------------------------------------------------------------------------------------------------------
JSONValue::JSONValue() : value(nullptr) {}
JSONValue::JSONValue(const JSONValue&) = default;
JSONValue::JSONValue(JSONValue&&) = default;
JSONValue& JSONValue::operator=(const JSONValue&) = default;
JSONValue& JSONValue::operator=(JSONValue&&) = default;
JSONValue::~JSONValue() {}

// Explicit constructors
JSONValue::JSONValue(std::nullptr_t) : value(nullptr) {}
JSONValue::JSONValue(bool v) : value(v) {}
JSONValue::JSONValue(int64_t v) : value(v) {}
JSONValue::JSONValue(double v) : value(v) {}
JSONValue::JSONValue(const char* s) : value(std::string(s ? s : "")) {}
JSONValue::JSONValue(const std::string& s) : value(s) {}
JSONValue::JSONValue(std::string&& s) : value(std::move(s)) {}
JSONValue::JSONValue(const Array& a) : value(a) {}
JSONValue::JSONValue(Array&& a) : value(std::move(a)) {}
JSONValue::JSONValue(const Object& o) : value(o) {}
JSONValue::JSONValue(Object&& o) : value(std::move(o)) {}

// -------------------------------
// Minimal recursive JSON parser
// -------------------------------
namespace {
constexpr int kMaxDepth = 64;

void appendUtf8(std::string& out, unsigned int code) {
    if (code <= 0x7F) {
        out.push_back(static_cast<char>(code));
    } else if (code <= 0x7FF) {
        out.push_back(static_cast<char>(0xC0 | ((code >> 6) & 0x1F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else if (code <= 0xFFFF) {
        out.push_back(static_cast<char>(0xE0 | ((code >> 12) & 0x0F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | ((code >> 18) & 0x07)));
        out.push_back(static_cast<char>(0x80 | ((code >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
    }
}

struct JsonParser {
    const std::string& s;
    std::size_t i{0};
    int depth{0};

    explicit JsonParser(const std::string& str) : s(str) {}

    [[noreturn]] void fail(const std::string& what) const {
        throw JSONParseError(what + " at offset " + std::to_string(i));
    }

    void skipWs() {
        while (i < s.size()) {
            char c = s[i];
            if (c == ' ' || c == '\t' || c == '\r' || c == '\n') { ++i; } else { break; }
        }
    }

    bool match(char c) {
        skipWs();
        if (i < s.size() && s[i] == c) { ++i; return true; }
        return false;
    }

    unsigned int parseHex4() {
        if (i + 4 > s.size()) fail("Invalid unicode escape");
        unsigned int code = 0;
        for (std::size_t k = 0; k < 4; ++k) {
            char h = s[i++];
            code <<= 4;
            if (h >= '0' && h <= '9') code += static_cast<unsigned int>(h - '0');
            else if (h >= 'a' && h <= 'f') code += 10u + static_cast<unsigned int>(h - 'a');
            else if (h >= 'A' && h <= 'F') code += 10u + static_cast<unsigned int>(h - 'A');
            else fail("Invalid hex in unicode escape");
        }
        return code;
    }

    std::string parseString() {
        skipWs();
        if (i >= s.size() || s[i] != '"') fail("Expected '\"' at string start");
        ++i; // skip opening quote
        std::string out;
        while (true) {
            if (i >= s.size()) fail("Unterminated string");
            char c = s[i++];
            if (c == '"') break;
            if (c == '\\') {
                if (i >= s.size()) fail("Invalid escape");
                char e = s[i++];
                switch (e) {
                    case '"': out.push_back('"'); break;
                    case '\\': out.push_back('\\'); break;
                    case '/': out.push_back('/'); break;
                    case 'b': out.push_back('\b'); break;
                    case 'f': out.push_back('\f'); break;
                    case 'n': out.push_back('\n'); break;
                    case 'r': out.push_back('\r'); break;
                    case 't': out.push_back('\t'); break;
                    case 'u': {
                        unsigned int code = parseHex4();
                        // Combine surrogate pairs; lone surrogates become U+FFFD
                        if (code >= 0xD800 && code <= 0xDBFF) {
                            if (i + 6 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
                                i += 2;
                                unsigned int low = parseHex4();
                                if (low >= 0xDC00 && low <= 0xDFFF) {
                                    code = 0x10000 + ((code - 0xD800) << 10) + (low - 0xDC00);
                                } else {
                                    code = 0xFFFD;
                                }
                            } else {
                                code = 0xFFFD;
                            }
                        } else if (code >= 0xDC00 && code <= 0xDFFF) {
                            code = 0xFFFD;
                        }
                        appendUtf8(out, code);
                        break;
                    }
                    default: fail("Unknown escape");
                }
            } else {
                out.push_back(c);
            }
        }
        return out;
    }

    JSONValue parseNumber() {
        skipWs();
        std::size_t start = i;
        if (i < s.size() && s[i] == '-') ++i;
        std::size_t digitsStart = i;
        while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        if (i == digitsStart) fail("Invalid number");
        bool isFloat = false;
        if (i < s.size() && s[i] == '.') {
            isFloat = true; ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
            isFloat = true; ++i;
            if (i < s.size() && (s[i] == '-' || s[i] == '+')) ++i;
            while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
        }
        std::string num = s.substr(start, i - start);
        try {
            if (!isFloat) {
                long long v = std::stoll(num);
                return JSONValue(static_cast<int64_t>(v));
            }
            return JSONValue(std::stod(num));
        } catch (const std::out_of_range&) {
            // Integers beyond int64 still parse as doubles
            return JSONValue(std::stod(num));
        } catch (const std::invalid_argument&) {
            fail("Invalid number");
        }
    }

    JSONValue parseArray() {
        if (!match('[')) fail("Expected '['");
        JSONValue::Array arr;
        if (match(']')) return JSONValue(std::move(arr));
        while (true) {
            JSONValue val = parseValue();
            arr.push_back(std::make_shared<JSONValue>(std::move(val)));
            if (match(']')) break;
            if (!match(',')) fail("Expected ',' in array");
        }
        return JSONValue(std::move(arr));
    }

    JSONValue parseObject() {
        if (!match('{')) fail("Expected '{'");
        JSONValue::Object obj;
        if (match('}')) return JSONValue(std::move(obj));
        while (true) {
            std::string key = parseString();
            if (!match(':')) fail("Expected ':' after key");
            JSONValue val = parseValue();
            obj[key] = std::make_shared<JSONValue>(std::move(val));
            if (match('}')) break;
            if (!match(',')) fail("Expected ',' in object");
        }
        return JSONValue(std::move(obj));
    }

    JSONValue parseValue() {
        skipWs();
        if (i >= s.size()) fail("Unexpected end of JSON");
        if (++depth > kMaxDepth) fail("Nesting too deep");
        JSONValue out;
        char c = s[i];
        if (c == '"') {
            out = JSONValue(parseString());
        } else if (c == '{') {
            out = parseObject();
        } else if (c == '[') {
            out = parseArray();
        } else if (s.compare(i, 4, "true") == 0) {
            i += 4; out = JSONValue(true);
        } else if (s.compare(i, 5, "false") == 0) {
            i += 5; out = JSONValue(false);
        } else if (s.compare(i, 4, "null") == 0) {
            i += 4; out = JSONValue(nullptr);
        } else {
            out = parseNumber();
        }
        --depth;
        return out;
    }
};

void writeString(std::ostringstream& oss, const std::string& v) {
    oss << '"';
    for (char c : v) {
        switch (c) {
            case '"': oss << "\\\""; break;
            case '\\': oss << "\\\\"; break;
            case '\b': oss << "\\b"; break;
            case '\f': oss << "\\f"; break;
            case '\n': oss << "\\n"; break;
            case '\r': oss << "\\r"; break;
            case '\t': oss << "\\t"; break;
            default:
                if (c >= 0 && c < 32) {
                    oss << "\\u" << std::hex << std::setw(4) << std::setfill('0') << static_cast<int>(c) << std::dec;
                } else {
                    oss << c;
                }
                break;
        }
    }
    oss << '"';
}
} // namespace

JSONValue parseJSON(const std::string& json) {
    FUNC_SCOPE();
    JsonParser p(json);
    JSONValue v = p.parseValue();
    p.skipWs();
    if (p.i != json.size()) {
        p.fail("Unexpected trailing content");
    }
    return v;
}

// Simple JSON serialization
std::string serializeJSONValue(const JSONValue& value) {
    FUNC_SCOPE();
    auto result = std::visit([](const auto& v) -> std::string {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::nullptr_t>) {
            return "null";
        } else if constexpr (std::is_same_v<T, bool>) {
            return v ? "true" : "false";
        } else if constexpr (std::is_same_v<T, int64_t>) {
            return std::to_string(v);
        } else if constexpr (std::is_same_v<T, double>) {
            if (!std::isfinite(v)) {
                return "null";
            }
            std::ostringstream oss;
            oss << std::setprecision(std::numeric_limits<double>::max_digits10) << v;
            return oss.str();
        } else if constexpr (std::is_same_v<T, std::string>) {
            std::ostringstream oss;
            writeString(oss, v);
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Array>) {
            std::ostringstream oss;
            oss << '[';
            for (size_t i = 0; i < v.size(); ++i) {
                if (i > 0) oss << ',';
                oss << (v[i] ? serializeJSONValue(*v[i]) : std::string("null"));
            }
            oss << ']';
            return oss.str();
        } else if constexpr (std::is_same_v<T, JSONValue::Object>) {
            std::ostringstream oss;
            oss << '{';
            bool first = true;
            for (const auto& [key, val] : v) {
                if (!first) oss << ',';
                first = false;
                writeString(oss, key);
                oss << ':' << (val ? serializeJSONValue(*val) : std::string("null"));
            }
            oss << '}';
            return oss.str();
        } else {
            return "null";
        }
    }, value.get());
    return result;
}

const JSONValue::Object* asObject(const JSONValue& v) {
    return std::get_if<JSONValue::Object>(&v.value);
}

const JSONValue* findMember(const JSONValue::Object& obj, const std::string& key) {
    auto it = obj.find(key);
    if (it == obj.end() || !it->second) {
        return nullptr;
    }
    return it->second.get();
}

std::optional<std::string> findString(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = findMember(obj, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v->value)) {
        return *s;
    }
    return std::nullopt;
}

std::optional<bool> findBool(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = findMember(obj, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* b = std::get_if<bool>(&v->value)) {
        return *b;
    }
    return std::nullopt;
}

std::optional<int64_t> findInt64(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = findMember(obj, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* n = std::get_if<int64_t>(&v->value)) {
        return *n;
    }
    if (const auto* d = std::get_if<double>(&v->value)) {
        // 2^63 is exactly representable while INT64_MAX is not; the upper bound must be exclusive
        constexpr double kTwoPow63 = 9223372036854775808.0;
        if (std::isfinite(*d) && *d >= -kTwoPow63 && *d < kTwoPow63) {
            return static_cast<int64_t>(*d);
        }
    }
    return std::nullopt;
}

std::optional<std::vector<std::string>> findStringList(const JSONValue::Object& obj, const std::string& key) {
    const JSONValue* v = findMember(obj, key);
    if (v == nullptr) return std::nullopt;
    if (const auto* s = std::get_if<std::string>(&v->value)) {
        return std::vector<std::string>{*s};
    }
    if (const auto* arr = std::get_if<JSONValue::Array>(&v->value)) {
        std::vector<std::string> out;
        for (const auto& item : *arr) {
            if (!item) continue;
            if (const auto* s = std::get_if<std::string>(&item->value)) {
                out.push_back(*s);
            }
        }
        return out;
    }
    return std::nullopt;
}

} // namespace authgate
