//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.cpp
// Purpose: Payload builders and parsers for initialize, tools/list and tools/call
//==========================================================================================================

#include "toolhost/Protocol.h"
#include "logging/Logger.h"

namespace toolhost {

JSONValue BuildInitializeParams(const Implementation& clientInfo) {
    JSONValue::Object capabilities;
    SetMember(capabilities, "experimental", JSONValue(JSONValue::Object{}));
    SetMember(capabilities, "sampling", JSONValue(JSONValue::Object{}));

    JSONValue::Object info;
    SetMember(info, "name", JSONValue(clientInfo.name));
    SetMember(info, "version", JSONValue(clientInfo.version));

    JSONValue::Object params;
    SetMember(params, "protocolVersion", JSONValue(PROTOCOL_VERSION));
    SetMember(params, "capabilities", JSONValue(std::move(capabilities)));
    SetMember(params, "clientInfo", JSONValue(std::move(info)));
    return JSONValue(std::move(params));
}

ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult) {
    ServerCapabilities caps;
    if (auto v = GetStringMember(initializeResult, "protocolVersion")) {
        caps.protocolVersion = *v;
    }
    if (const JSONValue* info = initializeResult.find("serverInfo")) {
        Implementation impl;
        impl.name = GetStringMember(*info, "name").value_or("");
        impl.version = GetStringMember(*info, "version").value_or("");
        caps.serverInfo = impl;
    }
    const JSONValue* c = initializeResult.find("capabilities");
    if (!c) {
        return caps;
    }
    if (const JSONValue* tools = c->find("tools")) {
        ToolsCapability tc;
        tc.listChanged = GetBoolMember(*tools, "listChanged").value_or(false);
        caps.tools = tc;
    }
    if (c->find("logging")) {
        caps.logging = LoggingCapability{};
    }
    return caps;
}

std::vector<Tool> ParseToolList(const JSONValue& listResult) {
    std::vector<Tool> out;
    const JSONValue* tools = listResult.find("tools");
    if (!tools) {
        return out;
    }
    const auto* arr = std::get_if<JSONValue::Array>(&tools->value);
    if (!arr) {
        LOG_WARN("tools/list result has a non-array 'tools' member");
        return out;
    }
    out.reserve(arr->size());
    for (const auto& item : *arr) {
        if (!item) continue;
        auto name = GetStringMember(*item, "name");
        if (!name || name->empty()) {
            LOG_DEBUG("tools/list: skipping entry without a name");
            continue;
        }
        Tool t;
        t.name = *name;
        t.description = GetStringMember(*item, "description").value_or("");
        if (const JSONValue* schema = item->find("inputSchema")) {
            t.inputSchema = *schema;
        }
        out.push_back(std::move(t));
    }
    return out;
}

JSONValue ToolToJSON(const Tool& tool) {
    JSONValue::Object obj;
    SetMember(obj, "name", JSONValue(tool.name));
    SetMember(obj, "description", JSONValue(tool.description));
    SetMember(obj, "inputSchema", tool.inputSchema);
    return JSONValue(std::move(obj));
}

JSONValue BuildCallToolParams(const std::string& name, const JSONValue& arguments) {
    JSONValue::Object params;
    SetMember(params, "name", JSONValue(name));
    SetMember(params, "arguments", arguments.isNull() ? JSONValue(JSONValue::Object{}) : arguments);
    return JSONValue(std::move(params));
}

} // namespace toolhost
