//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.h
// Purpose: Multi-server registry: persisted configuration, lifecycle, aggregate tool table and events
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/Channel.h"
#include "toolhost/HttpProbe.hpp"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// RegistryOptions
// Fields:
//   settingsPath: Settings document; empty means SettingsStore::DefaultPath().
//   clientInfo: Sent in initialize; empty name means defaultClientInfo().
//   channelFactory: Opens provider channels; null means ProcessChannelFactory.
//   probe: Reachability check for sse/https servers; null means BeastReachabilityProbe.
//   restartSettleDelay: Pause between stop and start in RestartServer (TOOLHOST_RESTART_SETTLE_MS).
//   toolsRetryDelay, stopGrace: Passed to each ProviderClient.
//==========================================================================================================
struct RegistryOptions {
    std::string settingsPath;
    Implementation clientInfo;
    std::shared_ptr<IChannelFactory> channelFactory;
    std::shared_ptr<IReachabilityProbe> probe;
    std::chrono::milliseconds restartSettleDelay{1000};
    std::chrono::milliseconds toolsRetryDelay{1000};
    std::chrono::milliseconds stopGrace{500};

    // Defaults with the TOOLHOST_* environment overrides applied.
    static RegistryOptions FromEnvironment();
};

enum class LifecycleEventType {
    ServerAdded,
    ServerRemoved,
    ServerUpdated,
    StatusChanged,
    ToolsChanged,
    Error
};

const char* toString(LifecycleEventType t);

struct LifecycleEvent {
    LifecycleEventType type{LifecycleEventType::StatusChanged};
    std::string serverId;
    ServerStatus status{ServerStatus::Stopped};
    std::optional<std::string> error;
    std::size_t toolCount{0};
    std::chrono::system_clock::time_point timestamp;
};

// One tool of the aggregate table with the server that provides it.
struct AggregatedTool {
    std::string serverId;
    Tool tool;
};

struct ServerOperationResult {
    std::string serverId;
    bool ok{false};
    std::optional<std::string> error;
};

//==========================================================================================================
// ServerRegistry
// Purpose: Owns one ServerInstance per configured id and the ProviderClient behind each stdio server.
// Notes:
//   - All accessors return snapshots.
//   - Listeners and clients are never called while the registry lock is held.
//   - Operations on unknown ids fail with ServerNotFound.
//==========================================================================================================
class ServerRegistry {
public:
    using Listener = std::function<void(const LifecycleEvent& event)>;
    using Unsubscribe = std::function<void()>;

    ServerRegistry();
    explicit ServerRegistry(RegistryOptions options);
    // Stops every server.
    ~ServerRegistry();

    ServerRegistry(const ServerRegistry&) = delete;
    ServerRegistry& operator=(const ServerRegistry&) = delete;

    /////////////////////////////////////////// Configuration ///////////////////////////////////////////
    //==========================================================================================================
    // LoadConfig
    // Purpose: Replaces the configured set with the settings file. Every entry, disabled ones included,
    //          becomes a Stopped instance; nothing is started. Running servers from a previous load are
    //          stopped first.
    // Notes:
    //   Never throws. An unreadable or malformed file leaves the registry empty and the failure is
    //   available from GetConfigLoadError().
    //==========================================================================================================
    void LoadConfig();

    // Message of the last LoadConfig failure (ConfigLoadError), if any.
    std::optional<std::string> GetConfigLoadError() const;

    // Writes the configured set back, preserving unrelated settings. Throws ToolHostError(ConfigLoadError).
    void SaveConfig();

    const std::string& SettingsPath() const;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // StartServer
    // Purpose: Starts one server. Completes immediately when it is already Running.
    // Returns:
    //   Future failing with ServerNotFound, InvalidConfig (disabled or incomplete config), or the client's
    //   start error (SpawnError, HandshakeTimeout, HandshakeProtocolError) / ProbeError for remote servers.
    //==========================================================================================================
    std::future<void> StartServer(const std::string& serverId);

    // Stops one server; a no-op when it is already stopped.
    std::future<void> StopServer(const std::string& serverId);

    // Stop, wait restartSettleDelay, start.
    std::future<void> RestartServer(const std::string& serverId);

    // Starts every enabled server that is not Running, concurrently. One result per attempted server.
    std::future<std::vector<ServerOperationResult>> StartAllServers();

    // Stops every server concurrently. One result per server.
    std::future<std::vector<ServerOperationResult>> StopAllServers();

    /////////////////////////////////////////// Mutation ///////////////////////////////////////////
    //==========================================================================================================
    // AddServer
    // Purpose: Adds a Stopped instance and persists the configuration.
    // Throws:
    //   ToolHostError(InvalidConfig) for a duplicate id or an incomplete config; ToolHostError(ConfigLoadError)
    //   when saving fails (the server stays added).
    //==========================================================================================================
    void AddServer(const ServerConfig& config);

    // Stops the server, removes it and persists.
    std::future<void> RemoveServer(const std::string& serverId);

    //==========================================================================================================
    // UpdateServer
    // Purpose: Applies a patch and persists. A running server is stopped first and started again
    //          afterwards unless the patch disabled it.
    //==========================================================================================================
    std::future<void> UpdateServer(const std::string& serverId, const ServerConfigPatch& patch);

    /////////////////////////////////////////// Tools ///////////////////////////////////////////
    // Union of the tools of every server, ordered by (serverId, tool name).
    std::vector<AggregatedTool> GetAllTools() const;

    //==========================================================================================================
    // CallTool
    // Purpose: Routes tools/call to the owning server.
    // Returns:
    //   Future with the raw tools/call result. Fails with ServerNotFound, NotRunning, ToolNotFound, the
    //   client's errors, or TransportError for anything else.
    //==========================================================================================================
    std::future<JSONValue> CallTool(const std::string& serverId, const std::string& toolName, const JSONValue& arguments);

    /////////////////////////////////////////// State ///////////////////////////////////////////
    std::vector<ServerInstance> ListServers() const;
    std::optional<ServerInstance> GetServer(const std::string& serverId) const;
    // Stopped for unknown ids.
    ServerStatus GetServerStatus(const std::string& serverId) const;
    std::vector<Tool> GetServerTools(const std::string& serverId) const;

    /////////////////////////////////////////// Events ///////////////////////////////////////////
    // Registers a listener; call the returned function to remove it. Safe to call after the registry is gone.
    Unsubscribe Subscribe(Listener listener);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost
