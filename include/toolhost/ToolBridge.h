//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.h
// Purpose: Exposes the registry's aggregate tool table as callable functions for a tool-using caller
//==========================================================================================================

#pragma once

#include <functional>
#include <future>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/ToolSchema.h"

namespace toolhost {

class ServerRegistry;

//==========================================================================================================
// ToolInvocationResult
// Purpose: Caller-facing outcome of one invocation. Failures are reported here instead of thrown.
// Fields:
//   content: Text rendering of the result (text items joined by newlines; other items summarized).
//   raw: The provider's tools/call result, when there was one.
//==========================================================================================================
struct ToolInvocationResult {
    bool success{false};
    std::string content;
    std::optional<JSONValue> raw;
    std::optional<std::string> error;
};

//==========================================================================================================
// CallableTool
// Fields:
//   qualifiedName: "mcp_<serverId>_<toolName>".
//   description: "[MCP:<serverId>] <tool description>".
//   autoApprove: The server config lists the tool under autoApprove.
//   invoke: Validates the arguments, forwards to ServerRegistry::CallTool and renders the result.
//==========================================================================================================
struct CallableTool {
    std::string qualifiedName;
    std::string serverId;
    std::string toolName;
    std::string description;
    ParameterDescriptor parameters;
    bool autoApprove{false};
    std::function<std::future<ToolInvocationResult>(const JSONValue& arguments)> invoke;
};

std::string QualifiedToolName(const std::string& serverId, const std::string& toolName);

// Flattens a tools/call result: text items verbatim, images and resources as bracketed placeholders,
// anything else as compact JSON. Results without a content array are pretty-printed whole.
std::string RenderToolResult(const JSONValue& result);

//==========================================================================================================
// ToolBridge
// Purpose: Builds CallableTool entries from the registry's current tool table. The registry must outlive
//          the bridge and every CallableTool it produced.
//==========================================================================================================
class ToolBridge {
public:
    explicit ToolBridge(ServerRegistry& registry);

    // One entry per aggregated tool, ordered by (serverId, tool name). When two servers produce the same
    // qualified name, the server whose id sorts first keeps it and the other tool is left out.
    std::vector<CallableTool> BuildTools() const;

    // Looks a tool up by qualified name in the current table.
    std::optional<CallableTool> FindTool(const std::string& qualifiedName) const;

    // Text summary of every server: status, tool count, uptime and last error.
    std::string DescribeServers() const;

    // Text listing of the available tools grouped by server, optionally for one server only.
    std::string DescribeTools(const std::optional<std::string>& serverId = std::nullopt) const;

private:
    ServerRegistry& registry;
};

} // namespace toolhost
