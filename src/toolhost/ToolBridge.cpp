//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolBridge.cpp
// Purpose: Tool-calling bridge over the server registry
//==========================================================================================================

#include <chrono>
#include <format>
#include <map>
#include <set>

#include "logging/Logger.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/ToolBridge.h"
#include "toolhost/async/FutureAwaitable.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

std::string QualifiedToolName(const std::string& serverId, const std::string& toolName) {
    return "mcp_" + serverId + "_" + toolName;
}

std::string RenderToolResult(const JSONValue& result) {
    const JSONValue* content = result.find("content");
    if (!content) {
        return SerializeJSONPretty(result);
    }
    if (content->isString()) {
        return std::get<std::string>(content->value);
    }
    const auto* items = std::get_if<JSONValue::Array>(&content->value);
    if (!items) {
        return SerializeJSON(*content);
    }
    std::string out;
    for (const auto& item : *items) {
        if (!item) continue;
        if (!out.empty()) out += '\n';
        const std::string type = GetStringMember(*item, "type").value_or("");
        if (type == "text") {
            out += GetStringMember(*item, "text").value_or("");
        } else if (type == "image") {
            out += "[Image: " + GetStringMember(*item, "mimeType").value_or("unknown type") + "]";
        } else if (type == "resource") {
            std::string uri;
            if (const JSONValue* res = item->find("resource")) uri = GetStringMember(*res, "uri").value_or("");
            out += "[Resource: " + uri + "]";
        } else {
            out += SerializeJSON(*item);
        }
    }
    return out;
}

namespace {

async::Task<ToolInvocationResult> coInvoke(ServerRegistry* registry, std::string serverId, std::string toolName,
                                           JSONValue arguments) {
    ToolInvocationResult r;
    std::optional<std::string> failure;
    try {
        JSONValue raw = co_await async::makeFutureAwaitable(registry->CallTool(serverId, toolName, arguments));
        const bool isError = GetBoolMember(raw, "isError").value_or(false);
        r.content = RenderToolResult(raw);
        r.success = !isError;
        if (isError) r.error = r.content;
        r.raw = std::move(raw);
    } catch (const errors::ToolHostError& e) {
        failure = std::format("{} ({})", e.what(), errors::toString(e.category()));
    } catch (const std::exception& e) {
        failure = e.what();
    }
    if (failure) {
        LOG_WARN("Bridge: {} failed: {}", QualifiedToolName(serverId, toolName), *failure);
        r.success = false;
        r.error = failure;
        r.content = "Error executing " + toolName + ": " + *failure;
    }
    co_return r;
}

CallableTool makeCallable(ServerRegistry& registry, const AggregatedTool& at, bool autoApprove) {
    CallableTool c;
    c.serverId = at.serverId;
    c.toolName = at.tool.name;
    c.qualifiedName = QualifiedToolName(at.serverId, at.tool.name);
    c.description = "[MCP:" + at.serverId + "] " + at.tool.description;
    c.parameters = ConvertSchema(at.tool.inputSchema);
    c.autoApprove = autoApprove;
    ServerRegistry* reg = &registry;
    c.invoke = [reg, serverId = c.serverId, toolName = c.toolName, params = c.parameters](const JSONValue& args) {
        const JSONValue effective = args.isNull() ? JSONValue(JSONValue::Object{}) : args;
        auto problems = ValidateArguments(params, effective);
        if (!problems.empty()) {
            std::string joined;
            for (const auto& p : problems) {
                if (!joined.empty()) joined += "; ";
                joined += p;
            }
            ToolInvocationResult r;
            r.error = "Invalid arguments: " + joined;
            r.content = "Error executing " + toolName + ": " + *r.error;
            return async::readyFuture(std::move(r));
        }
        return coInvoke(reg, serverId, toolName, effective).toFuture();
    };
    return c;
}

std::string formatUptime(const std::optional<std::chrono::system_clock::time_point>& startedAt) {
    if (!startedAt) return "N/A";
    const auto secs = std::chrono::duration_cast<std::chrono::seconds>(std::chrono::system_clock::now() - *startedAt);
    return std::format("{}s", secs.count());
}

} // namespace

ToolBridge::ToolBridge(ServerRegistry& r) : registry(r) {}

std::vector<CallableTool> ToolBridge::BuildTools() const {
    std::map<std::string, ServerConfig> configs;
    for (auto& inst : registry.ListServers()) {
        configs.emplace(inst.config.id, std::move(inst.config));
    }
    std::vector<CallableTool> out;
    std::set<std::string> seen;
    // The aggregate is ordered by server id, so the first server to claim a qualified name keeps it
    for (const auto& at : registry.GetAllTools()) {
        const std::string qualified = QualifiedToolName(at.serverId, at.tool.name);
        if (!seen.insert(qualified).second) {
            LOG_WARN("Bridge: skipping {} from server {}: name already taken by another server", qualified, at.serverId);
            continue;
        }
        auto it = configs.find(at.serverId);
        const bool approve = it != configs.end() && it->second.AutoApproves(at.tool.name);
        out.push_back(makeCallable(registry, at, approve));
    }
    LOG_DEBUG("Bridge: {} callable tool(s)", out.size());
    return out;
}

std::optional<CallableTool> ToolBridge::FindTool(const std::string& qualifiedName) const {
    for (auto& t : BuildTools()) {
        if (t.qualifiedName == qualifiedName) return std::move(t);
    }
    return std::nullopt;
}

std::string ToolBridge::DescribeServers() const {
    std::string out = "Tool servers:\n";
    for (const auto& inst : registry.ListServers()) {
        out += std::format("\n{} ({}):\n  Status: {}\n  Tools: {}\n  Uptime: {}\n",
                           inst.config.name, inst.config.id, toString(inst.status), inst.tools.size(),
                           formatUptime(inst.startedAt));
        if (inst.lastError) out += "  Error: " + *inst.lastError + "\n";
    }
    return out;
}

std::string ToolBridge::DescribeTools(const std::optional<std::string>& serverId) const {
    std::map<std::string, std::vector<Tool>> byServer;
    std::size_t total = 0;
    for (const auto& at : registry.GetAllTools()) {
        if (serverId && at.serverId != *serverId) continue;
        byServer[at.serverId].push_back(at.tool);
        ++total;
    }
    std::string out = std::format("Available tools ({}):\n", total);
    for (const auto& [id, tools] : byServer) {
        out += "\n" + id + ":\n";
        for (const auto& t : tools) {
            out += "  - " + t.name + ": " + t.description + "\n";
        }
    }
    return out;
}

} // namespace toolhost
