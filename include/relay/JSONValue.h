//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONValue.h
// Purpose: Minimal JSON document model, parser and serializer used for relay bodies and status output
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace relay {

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

    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }

    // Member lookup on objects; nullptr when this is not an object or the key is absent.
    const JSONValue* find(const std::string& key) const;
};

//==========================================================================================================
// ParseJSON
// Purpose: Parses a complete JSON document. Trailing non-whitespace is rejected.
// Args:
//   text: Document text.
//   error: Optional sink receiving a parse error description.
// Returns:
//   The parsed value, or std::nullopt on malformed input.
//==========================================================================================================
std::optional<JSONValue> ParseJSON(const std::string& text, std::string* error = nullptr);

// Compact serialization (no insignificant whitespace).
std::string SerializeJSON(const JSONValue& value);

// Typed member accessors; std::nullopt when absent or of another type.
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<int64_t> GetIntMember(const JSONValue& obj, const std::string& key);

// Convenience builders for status documents.
inline std::shared_ptr<JSONValue> MakeJSON(const std::string& s) { return std::make_shared<JSONValue>(s); }
inline std::shared_ptr<JSONValue> MakeJSON(const char* s) { return std::make_shared<JSONValue>(s); }
inline std::shared_ptr<JSONValue> MakeJSON(int64_t v) { return std::make_shared<JSONValue>(v); }
inline std::shared_ptr<JSONValue> MakeJSON(bool v) { return std::make_shared<JSONValue>(v); }
inline std::shared_ptr<JSONValue> MakeJSON(double v) { return std::make_shared<JSONValue>(v); }
inline std::shared_ptr<JSONValue> MakeJSONNull() { return std::make_shared<JSONValue>(nullptr); }

} // namespace relay
