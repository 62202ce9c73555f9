//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Protocol.h
// Purpose: Tool-provider protocol data structures, method names and payload builders
//==========================================================================================================

#pragma once

#include "toolhost/JSONRPCTypes.h"
#include <string>
#include <vector>
#include <optional>

namespace toolhost {
//==========================================================================================================
// Protocol types and constants
// Purpose: Shared protocol structures, capabilities, and method names.
//==========================================================================================================
///////////////////////////////////////// Protocol constants ///////////////////////////////////////////
constexpr const char* PROTOCOL_VERSION = "2024-11-05";

///////////////////////////////////////// Implementation ///////////////////////////////////////////
struct Implementation {
    std::string name;
    std::string version;

    Implementation() = default;
    Implementation(std::string name, std::string version)
        : name(std::move(name)), version(std::move(version)) {}
};

///////////////////////////////////////// Capabilities ///////////////////////////////////////////
struct ToolsCapability {
    bool listChanged = false;
};

struct LoggingCapability {
    // Presence indicates logging notifications are supported
};

// What a provider announced in its initialize result. Unknown sections are ignored.
struct ServerCapabilities {
    std::optional<ToolsCapability> tools;
    std::optional<LoggingCapability> logging;
    std::optional<Implementation> serverInfo;
    std::string protocolVersion;
};

///////////////////////////////////////// Tools ///////////////////////////////////////////
struct Tool {
    std::string name;
    std::string description;
    JSONValue inputSchema;  // JSON Schema for tool parameters

    Tool() = default;
    Tool(std::string name, std::string description, JSONValue inputSchema = JSONValue{})
        : name(std::move(name)), description(std::move(description)), inputSchema(std::move(inputSchema)) {}
};

///////////////////////////////////////// Payload helpers ///////////////////////////////////////////
// Builds initialize params: { protocolVersion, capabilities: { experimental: {}, sampling: {} }, clientInfo }.
JSONValue BuildInitializeParams(const Implementation& clientInfo);

// Parses the initialize result; missing sections stay empty.
ServerCapabilities ParseServerCapabilities(const JSONValue& initializeResult);

// Reads result.tools[]. Entries without a string name are skipped; a missing description becomes "".
std::vector<Tool> ParseToolList(const JSONValue& listResult);

JSONValue ToolToJSON(const Tool& tool);

// Builds tools/call params: { name, arguments }.
JSONValue BuildCallToolParams(const std::string& name, const JSONValue& arguments);

///////////////////////////////////////// Method names ///////////////////////////////////////////
namespace Methods {
    // Client to provider
    constexpr const char* Initialize = "initialize";
    constexpr const char* ListTools = "tools/list";
    constexpr const char* CallTool = "tools/call";

    // Notifications
    constexpr const char* Initialized = "notifications/initialized";
    constexpr const char* Shutdown = "notifications/shutdown";
    constexpr const char* ToolListChanged = "notifications/tools/list_changed";
    constexpr const char* LoggingMessage = "logging/message";
    constexpr const char* Log = "notifications/message";
}

} // namespace toolhost
