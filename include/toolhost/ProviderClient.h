//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderClient.h
// Purpose: Protocol client for one tool-provider process (handshake, request correlation, timeouts,
//          notifications and tool discovery)
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <functional>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/Channel.h"
#include "toolhost/JSONRPCTypes.h"
#include "toolhost/Protocol.h"
#include "toolhost/ServerConfig.h"

namespace toolhost {

//==========================================================================================================
// ProviderClient
// Purpose: Owns the channel to one provider and everything negotiated over it.
// Notes:
//   - Status: Stopped -> Starting -> Running; Error from Starting or Running; Stopped from any state
//     through Stop(). A client can be started again after it stopped; each Start() opens a new channel.
//   - Request ids come from a per-client monotonically increasing 64-bit counter and are never reused.
//   - Futures fail with errors::ToolHostError; see errors::ErrorCategory for the classes used.
//   - Handlers run on internal threads and must not block on this client's own futures.
//==========================================================================================================
class ProviderClient {
public:
    struct Options {
        Implementation clientInfo;                              // defaults to defaultClientInfo()
        std::chrono::milliseconds toolsRetryDelay{1000};        // delay before the single tools/list retry
        std::chrono::milliseconds stopGrace{500};               // per-step grace while closing the channel
        std::size_t diagnosticTailLines{20};                    // stderr lines kept for lastError
    };

    //==========================================================================================================
    // Constructor
    // Args:
    //   config: Server configuration (copied). Only stdio servers are driven by a ProviderClient.
    //   channelFactory: Creates the channel for each Start().
    //   options: Client tuning; TOOLHOST_TOOLS_RETRY_DELAY_MS and TOOLHOST_STOP_GRACE_MS override defaults.
    //==========================================================================================================
    ProviderClient(ServerConfig config, std::shared_ptr<IChannelFactory> channelFactory);
    ProviderClient(ServerConfig config, std::shared_ptr<IChannelFactory> channelFactory, Options options);
    ~ProviderClient();

    ProviderClient(const ProviderClient&) = delete;
    ProviderClient& operator=(const ProviderClient&) = delete;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Start
    // Purpose: Spawns the provider, performs initialize / notifications/initialized, then lists tools.
    // Returns:
    //   Future completing once the client is Running and the first tools/list attempt finished. Fails with
    //   SpawnError, HandshakeTimeout or HandshakeProtocolError (status becomes Error). A tools/list failure
    //   or an empty list does not fail Start; the listing is retried once after toolsRetryDelay.
    //   Calling Start while Running completes immediately; while Starting it waits for that start.
    //==========================================================================================================
    std::future<void> Start();

    //==========================================================================================================
    // Stop
    // Purpose: Sends notifications/shutdown (best effort), closes the channel within a bounded time,
    //          rejects every pending request with ServerStopped and clears the tool list.
    //==========================================================================================================
    std::future<void> Stop();

    /////////////////////////////////////////// Requests ///////////////////////////////////////////
    //==========================================================================================================
    // SendRequest
    // Purpose: Sends one request and correlates the response by id.
    // Returns:
    //   Future resolving to the response's result. Fails with ProtocolError (provider error payload kept
    //   verbatim in ToolHostError::protocolError()), RequestTimeout after the server's timeout (the pending
    //   entry is removed), ServerStopped / ServerExited, or NotRunning when no channel is open.
    //==========================================================================================================
    std::future<JSONValue> SendRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Fire-and-forget. Returns whether the line was queued.
    bool SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    //==========================================================================================================
    // ListTools
    // Purpose: Refreshes the tool list with tools/list and publishes it through the tools-changed handler.
    //          Before the client is Running it returns the last known list without sending anything.
    //==========================================================================================================
    std::future<std::vector<Tool>> ListTools();

    //==========================================================================================================
    // CallTool
    // Purpose: Sends tools/call {name, arguments} and returns the raw result.
    //          Fails immediately with NotRunning unless the client is Running.
    //==========================================================================================================
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments);

    /////////////////////////////////////////// State ///////////////////////////////////////////
    const std::string& ServerId() const;
    ServerStatus GetStatus() const;
    bool IsRunning() const;
    std::vector<Tool> GetTools() const;
    std::optional<ServerCapabilities> GetCapabilities() const;
    std::optional<std::string> GetLastError() const;
    std::size_t GetPendingRequestCount() const;
    // Time of the last line received from the provider.
    std::optional<std::chrono::system_clock::time_point> GetLastActivity() const;

    /////////////////////////////////////////// Callbacks ///////////////////////////////////////////
    using ToolsChangedHandler = std::function<void(const std::vector<Tool>& tools)>;
    using StatusHandler = std::function<void(ServerStatus status, const std::optional<std::string>& error)>;

    void SetToolsChangedHandler(ToolsChangedHandler handler);
    void SetStatusHandler(StatusHandler handler);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost
