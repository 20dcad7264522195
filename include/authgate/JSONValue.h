//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON value model, parser and serializer used for key sets, JWT segments and error bodies
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <stdexcept>
#include <unordered_map>
#include <vector>

namespace authgate {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
//==========================================================================================================
struct JSONValue {
    using Array = std::vector<std::shared_ptr<JSONValue>>;
    using Object = std::unordered_map<std::string, std::shared_ptr<JSONValue>>;

    std::variant<
        std::nullptr_t,
        bool,
        int64_t,
        double,
        std::string,
        Array,
        Object
    > value;

    // Constructors and special members (defined out-of-line)
    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&);
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&);
    ~JSONValue();

    // Explicit constructors for supported types
    explicit JSONValue(std::nullptr_t);
    explicit JSONValue(bool v);
    explicit JSONValue(int64_t v);
    explicit JSONValue(double v);
    explicit JSONValue(const char* s);
    explicit JSONValue(const std::string& s);
    explicit JSONValue(std::string&& s);
    explicit JSONValue(const Array& a);
    explicit JSONValue(Array&& a);
    explicit JSONValue(const Object& o);
    explicit JSONValue(Object&& o);

    // Access the underlying variant
    auto& get() { return value; }
    const auto& get() const { return value; }
};

// Thrown by parseJSON on malformed input.
class JSONParseError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

//==========================================================================================================
// parseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace content is rejected.
// Throws:
//   JSONParseError describing the first syntax problem encountered.
//==========================================================================================================
JSONValue parseJSON(const std::string& json);

//==========================================================================================================
// serializeJSONValue
// Purpose: Compact JSON serialization (object key order is unspecified).
//==========================================================================================================
std::string serializeJSONValue(const JSONValue& value);

// Typed lookups on objects. Each returns null/nullopt when the key is absent or of another type.
const JSONValue::Object* asObject(const JSONValue& v);
const JSONValue* findMember(const JSONValue::Object& obj, const std::string& key);
std::optional<std::string> findString(const JSONValue::Object& obj, const std::string& key);
std::optional<bool> findBool(const JSONValue::Object& obj, const std::string& key);

// Accepts integral and floating JSON numbers; floating values are truncated toward zero.
std::optional<int64_t> findInt64(const JSONValue::Object& obj, const std::string& key);

// Accepts either a single string or an array of strings; non-string array elements are skipped.
std::optional<std::vector<std::string>> findStringList(const JSONValue::Object& obj, const std::string& key);

} // namespace authgate
