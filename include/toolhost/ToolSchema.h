//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolSchema.h
// Purpose: Typed parameter descriptors converted from a tool's JSON Schema
//==========================================================================================================

#pragma once

#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"

namespace toolhost {

enum class ParameterKind {
    String,
    Number,
    Integer,
    Boolean,
    Array,
    Object,
    Unknown
};

const char* toString(ParameterKind k);

struct ParameterDescriptor;

struct PropertyDescriptor {
    std::string name;
    bool required{false};
    std::shared_ptr<ParameterDescriptor> schema;
};

//==========================================================================================================
// ParameterDescriptor
// Purpose: One node of the parameter tree.
// Fields:
//   items: Element type for Array (Unknown when the schema has no items).
//   properties: Members for Object, in name order. An object without properties accepts any members
//               (openObject is true).
//==========================================================================================================
struct ParameterDescriptor {
    ParameterKind kind{ParameterKind::Unknown};
    std::string description;
    std::shared_ptr<ParameterDescriptor> items;
    std::vector<PropertyDescriptor> properties;
    bool openObject{false};

    const PropertyDescriptor* findProperty(const std::string& name) const;
};

//==========================================================================================================
// ConvertSchema
// Purpose: Maps a tool inputSchema onto the parameter tree. The root is always an Object: a missing or
//          non-object schema, or one without properties, yields an Object with no parameters.
//          A property is required when its name is listed in the enclosing schema's "required" array.
//==========================================================================================================
ParameterDescriptor ConvertSchema(const JSONValue& inputSchema);

//==========================================================================================================
// ValidateArguments
// Purpose: Checks call arguments against a converted schema: missing required members and members whose
//          JSON type does not match the descriptor. Unknown parameters accept anything.
// Returns:
//   One message per problem; empty when the arguments fit.
//==========================================================================================================
std::vector<std::string> ValidateArguments(const ParameterDescriptor& schema, const JSONValue& arguments);

} // namespace toolhost
