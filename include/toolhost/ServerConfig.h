//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.h
// Purpose: Server configuration, status and instance records shared by the client and the registry
//==========================================================================================================

#pragma once

#include <chrono>
#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"

namespace toolhost {

enum class ConnectionType {
    Stdio,
    Sse,
    Https
};

enum class ServerStatus {
    Stopped,
    Starting,
    Running,
    Error
};

const char* toString(ConnectionType t);
const char* toString(ServerStatus s);

// Accepts "stdio", "sse", "https" (and "http" as https); returns nullopt for anything else.
std::optional<ConnectionType> connectionTypeFromString(const std::string& s);

constexpr double kDefaultTimeoutSeconds = 30.0;
constexpr double kMaxTimeoutSeconds = 24.0 * 60.0 * 60.0;
constexpr int kDefaultRetryAttempts = 3;

//==========================================================================================================
// ServerConfig
// Purpose: How to reach one tool provider.
// Fields:
//   id: Registry key; unique.
//   name: Display name (defaults to id).
//   command/args/env: Launch line for stdio servers; env overlays the parent environment.
//   connectionType/url: Remote servers (sse/https) are reachability-probed at url.
//   disabled: Disabled servers stay configured but are never started.
//   autoApprove: Tool names the caller may invoke without confirmation.
//   timeoutSeconds: Per-request timeout; unset or non-positive means kDefaultTimeoutSeconds, and values
//                   above kMaxTimeoutSeconds are capped.
//   retryAttempts: Persisted for callers; the registry does not retry on its own.
//==========================================================================================================
struct ServerConfig {
    std::string id;
    std::string name;
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    ConnectionType connectionType{ConnectionType::Stdio};
    std::optional<std::string> url;
    bool disabled{false};
    std::vector<std::string> autoApprove;
    std::optional<double> timeoutSeconds;
    int retryAttempts{kDefaultRetryAttempts};

    std::chrono::milliseconds RequestTimeout() const;
    bool AutoApproves(const std::string& toolName) const;
};

//==========================================================================================================
// ServerConfigPatch
// Purpose: Partial update for UpdateServer; only engaged fields are applied. The id never changes.
//==========================================================================================================
struct ServerConfigPatch {
    std::optional<std::string> name;
    std::optional<std::string> command;
    std::optional<std::vector<std::string>> args;
    std::optional<std::map<std::string, std::string>> env;
    std::optional<ConnectionType> connectionType;
    std::optional<std::string> url;
    std::optional<bool> disabled;
    std::optional<std::vector<std::string>> autoApprove;
    std::optional<double> timeoutSeconds;
    std::optional<int> retryAttempts;
};

ServerConfig ApplyPatch(const ServerConfig& base, const ServerConfigPatch& patch);

//==========================================================================================================
// ValidateServerConfig
// Purpose: Throws ToolHostError(InvalidConfig) when the config cannot be started: empty id, stdio without
//          a command, or sse/https without a url.
//==========================================================================================================
void ValidateServerConfig(const ServerConfig& config);

//==========================================================================================================
// ServerConfigFromJSON
// Purpose: Reads one persisted entry. Missing members take their defaults; the connection type is read
//          from "type" or "connectionType".
// Throws:
//   ToolHostError(InvalidConfig) when entry is not an object or names an unknown connection type.
//==========================================================================================================
ServerConfig ServerConfigFromJSON(const std::string& id, const JSONValue& entry);

// Writes the persisted form (keyed by id by the caller, so id itself is not written).
JSONValue ServerConfigToJSON(const ServerConfig& config);

//==========================================================================================================
// Connection
// Purpose: Liveness of the transport behind an instance.
//==========================================================================================================
struct Connection {
    ConnectionType type{ConnectionType::Stdio};
    bool connected{false};
    std::optional<std::chrono::system_clock::time_point> lastPing;
    std::optional<std::string> lastError;
};

//==========================================================================================================
// ServerInstance
// Purpose: Registry record for one configured server. Returned to callers by value (snapshot).
//==========================================================================================================
struct ServerInstance {
    ServerConfig config;
    ServerStatus status{ServerStatus::Stopped};
    std::vector<Tool> tools;
    std::optional<std::string> lastError;
    std::optional<std::chrono::system_clock::time_point> startedAt;
    int restartCount{0};
    Connection connection;
    std::optional<ServerCapabilities> capabilities;
};

} // namespace toolhost
