//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolSchema.cpp
// Purpose: JSON Schema to parameter descriptor conversion
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <format>
#include <set>

#include "toolhost/ToolSchema.h"

namespace toolhost {

const char* toString(ParameterKind k) {
    switch (k) {
        case ParameterKind::String: return "string";
        case ParameterKind::Number: return "number";
        case ParameterKind::Integer: return "integer";
        case ParameterKind::Boolean: return "boolean";
        case ParameterKind::Array: return "array";
        case ParameterKind::Object: return "object";
        case ParameterKind::Unknown: return "any";
    }
    return "any";
}

const PropertyDescriptor* ParameterDescriptor::findProperty(const std::string& name) const {
    for (const auto& p : properties) {
        if (p.name == name) return &p;
    }
    return nullptr;
}

namespace {

ParameterKind kindFromType(const std::optional<std::string>& type) {
    if (!type) return ParameterKind::Unknown;
    if (*type == "string") return ParameterKind::String;
    if (*type == "number") return ParameterKind::Number;
    if (*type == "integer") return ParameterKind::Integer;
    if (*type == "boolean") return ParameterKind::Boolean;
    if (*type == "array") return ParameterKind::Array;
    if (*type == "object") return ParameterKind::Object;
    return ParameterKind::Unknown;
}

void fillProperties(ParameterDescriptor& out, const JSONValue& schema);

ParameterDescriptor convertNode(const JSONValue& schema) {
    ParameterDescriptor d;
    if (!schema.isObject()) {
        return d;
    }
    d.kind = kindFromType(GetStringMember(schema, "type"));
    d.description = GetStringMember(schema, "description").value_or("");
    switch (d.kind) {
        case ParameterKind::Array: {
            const JSONValue* items = schema.find("items");
            d.items = std::make_shared<ParameterDescriptor>(items ? convertNode(*items) : ParameterDescriptor{});
            break;
        }
        case ParameterKind::Object:
            fillProperties(d, schema);
            break;
        default:
            break;
    }
    return d;
}

void fillProperties(ParameterDescriptor& out, const JSONValue& schema) {
    const JSONValue* props = schema.find("properties");
    const auto* obj = props ? std::get_if<JSONValue::Object>(&props->value) : nullptr;
    if (!obj) {
        out.openObject = true;
        return;
    }
    std::set<std::string> required;
    if (const JSONValue* req = schema.find("required")) {
        if (const auto* arr = std::get_if<JSONValue::Array>(&req->value)) {
            for (const auto& r : *arr) {
                if (r && r->isString()) required.insert(std::get<std::string>(r->value));
            }
        }
    }
    for (const auto& [name, sub] : *obj) {
        PropertyDescriptor p;
        p.name = name;
        p.required = required.count(name) != 0;
        p.schema = std::make_shared<ParameterDescriptor>(sub ? convertNode(*sub) : ParameterDescriptor{});
        out.properties.push_back(std::move(p));
    }
    std::sort(out.properties.begin(), out.properties.end(),
              [](const PropertyDescriptor& a, const PropertyDescriptor& b) { return a.name < b.name; });
}

bool matches(ParameterKind kind, const JSONValue& v) {
    switch (kind) {
        case ParameterKind::String: return v.isString();
        case ParameterKind::Number: return v.isNumber();
        case ParameterKind::Integer:
            if (std::holds_alternative<int64_t>(v.value)) return true;
            if (const auto* d = std::get_if<double>(&v.value)) return std::floor(*d) == *d;
            return false;
        case ParameterKind::Boolean: return std::holds_alternative<bool>(v.value);
        case ParameterKind::Array: return v.isArray();
        case ParameterKind::Object: return v.isObject();
        case ParameterKind::Unknown: return true;
    }
    return true;
}

void validateNode(const ParameterDescriptor& d, const JSONValue& v, const std::string& path, std::vector<std::string>& problems) {
    if (!matches(d.kind, v)) {
        problems.push_back(std::format("{}: expected {}", path.empty() ? "arguments" : path, toString(d.kind)));
        return;
    }
    if (d.kind == ParameterKind::Array && d.items) {
        const auto& arr = std::get<JSONValue::Array>(v.value);
        for (std::size_t i = 0; i < arr.size(); ++i) {
            validateNode(*d.items, arr[i] ? *arr[i] : JSONValue{}, std::format("{}[{}]", path, i), problems);
        }
    } else if (d.kind == ParameterKind::Object && !d.openObject) {
        for (const auto& p : d.properties) {
            const std::string childPath = path.empty() ? p.name : path + "." + p.name;
            const JSONValue* member = v.find(p.name);
            if (!member) {
                if (p.required) problems.push_back(childPath + ": required");
                continue;
            }
            if (p.schema) validateNode(*p.schema, *member, childPath, problems);
        }
    }
}

} // namespace

ParameterDescriptor ConvertSchema(const JSONValue& inputSchema) {
    ParameterDescriptor root;
    root.kind = ParameterKind::Object;
    if (!inputSchema.isObject()) {
        return root;
    }
    root.description = GetStringMember(inputSchema, "description").value_or("");
    if (inputSchema.find("properties") == nullptr) {
        return root;
    }
    fillProperties(root, inputSchema);
    return root;
}

std::vector<std::string> ValidateArguments(const ParameterDescriptor& schema, const JSONValue& arguments) {
    std::vector<std::string> problems;
    const JSONValue empty{JSONValue::Object{}};
    validateNode(schema, arguments.isNull() ? empty : arguments, std::string(), problems);
    return problems;
}

} // namespace toolhost
