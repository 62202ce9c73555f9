//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JSONRPCTypes.h
// Purpose: JSON value model, parser/serializers and JSON-RPC 2.0 error helpers used by toolhost
//==========================================================================================================

#pragma once

#include <cstdint>
#include <string>
#include <memory>
#include <variant>
#include <optional>
#include <unordered_map>
#include <vector>

namespace toolhost {

//==========================================================================================================
// JSONValue
// Purpose: Simplified JSON representation backed by std::variant and shared_ptr graphs.
// Fields:
//   Array: vector<shared_ptr<JSONValue>> representing a JSON array.
//   Object: unordered_map<string, shared_ptr<JSONValue>> representing a JSON object.
//   value: variant holding nullptr, bool, int64_t, double, string, Array, or Object.
// Notes:
//   Integers should be passed as int64_t; a plain int is ambiguous between the bool/int64_t/double ctors.
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

    JSONValue();
    JSONValue(const JSONValue&);
    JSONValue(JSONValue&&) noexcept;
    JSONValue& operator=(const JSONValue&);
    JSONValue& operator=(JSONValue&&) noexcept;
    ~JSONValue();

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

    auto& get() { return value; }
    const auto& get() const { return value; }

    bool isNull() const { return std::holds_alternative<std::nullptr_t>(value); }
    bool isObject() const { return std::holds_alternative<Object>(value); }
    bool isArray() const { return std::holds_alternative<Array>(value); }
    bool isString() const { return std::holds_alternative<std::string>(value); }
    bool isNumber() const {
        return std::holds_alternative<int64_t>(value) || std::holds_alternative<double>(value);
    }

    // Returns the member stored under key, or nullptr when this is not an object or the key is absent.
    const JSONValue* find(const std::string& key) const;
};

// Structural equality. Objects compare key-wise; int64_t 1 and double 1.0 are distinct.
bool operator==(const JSONValue& a, const JSONValue& b);

//==========================================================================================================
// Member helpers
// Purpose: Small accessors used when reading loosely-typed payloads from providers and settings files.
//==========================================================================================================
std::optional<std::string> GetStringMember(const JSONValue& obj, const std::string& key);
std::optional<bool> GetBoolMember(const JSONValue& obj, const std::string& key);
// Accepts integer or floating-point members; returns the value as double.
std::optional<double> GetNumberMember(const JSONValue& obj, const std::string& key);
void SetMember(JSONValue::Object& obj, const std::string& key, JSONValue value);

//==========================================================================================================
// ParseJSON
// Purpose: Strict recursive-descent parse of a complete JSON document.
// Args:
//   text: JSON text. Surrounding whitespace is allowed; any other trailing content is an error.
// Returns:
//   Parsed JSONValue.
// Throws:
//   std::runtime_error describing the first syntax error and its offset.
//==========================================================================================================
JSONValue ParseJSON(const std::string& text);

//==========================================================================================================
// SerializeJSON
// Purpose: Compact single-line serialization. Control characters (including newlines) inside strings
//          are always escaped, so the output never spans multiple lines.
//==========================================================================================================
std::string SerializeJSON(const JSONValue& value);

//==========================================================================================================
// SerializeJSONPretty
// Purpose: Indented serialization with object keys sorted, used for files meant to be read by humans.
// Args:
//   value: Value to serialize.
//   indent: Spaces per nesting level.
//==========================================================================================================
std::string SerializeJSONPretty(const JSONValue& value, int indent = 2);

//==========================================================================================================
// JSONRPCId
// Purpose: JSON-RPC 2.0 id variant: string, integer, or null.
//==========================================================================================================
using JSONRPCId = std::variant<std::string, int64_t, std::nullptr_t>;

// Returns a printable form of an id for logs ("42", "\"abc\"", "null").
std::string IdToString(const JSONRPCId& id);

//==========================================================================================================
// JSONRPCErrorCodes
// Purpose: Standard JSON-RPC 2.0 error codes plus the server-defined range used by tool providers.
//==========================================================================================================
namespace JSONRPCErrorCodes {
    constexpr int ParseError = -32700;
    constexpr int InvalidRequest = -32600;
    constexpr int MethodNotFound = -32601;
    constexpr int InvalidParams = -32602;
    constexpr int InternalError = -32603;

    constexpr int RequestTimeout = -32001;
    constexpr int ToolNotFound = -32003;
}

//==========================================================================================================
// CreateErrorObject
// Purpose: Build a JSON error object with shape { code, message, data? }.
// Args:
//   code: Integer error code.
//   message: Human-readable description.
//   data: Optional structured payload.
// Returns:
//   JSONValue object representing the error.
//==========================================================================================================
JSONValue CreateErrorObject(int code, const std::string& message,
                           const std::optional<JSONValue>& data = std::nullopt);

} // namespace toolhost
