//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Channel.h
// Purpose: Line channel abstraction between a ProviderClient and one tool-provider endpoint
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace toolhost {

//==========================================================================================================
// ExitInfo
// Purpose: How the far end of a channel went away.
// Fields:
//   exitCode: Process exit status when it exited normally.
//   signal: Terminating signal number when it was killed.
//   requested: True when the exit followed a local Close().
//==========================================================================================================
struct ExitInfo {
    std::optional<int> exitCode;
    std::optional<int> signal;
    bool requested{false};

    bool clean() const { return exitCode.has_value() && *exitCode == 0; }
    std::string describe() const {
        if (exitCode) return "exit code " + std::to_string(*exitCode);
        if (signal) return "signal " + std::to_string(*signal);
        return "stream closed";
    }
};

//==========================================================================================================
// ChannelSpec
// Purpose: What to launch. env entries overlay the parent environment.
//==========================================================================================================
struct ChannelSpec {
    std::string label;     // server id, used in logs
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::chrono::milliseconds stopGrace{500};
};

//==========================================================================================================
// ILineChannel
// Purpose: Bidirectional stream of text lines with a side band for diagnostics and an exit signal.
//==========================================================================================================
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    /////////////////////////////////////////// Lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Opens the channel (spawns the process for process-backed channels).
    // Args:
    //   (none)
    // Returns:
    //   Future that completes when lines can be written, or fails with a SpawnError ToolHostError.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Closes the channel and releases the endpoint. Bounded: escalates to forced termination rather than
    // waiting indefinitely for a process that ignores its closed stdin.
    // Returns:
    //   Future that completes when the endpoint is gone.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsOpen() const = 0;

    // Returns a diagnostic identifier (pid, command).
    virtual std::string Describe() const = 0;

    /////////////////////////////////////////// I/O ///////////////////////////////////////////
    //==========================================================================================================
    // Queues one line for writing. Lines are written in call order. A missing trailing '\n' is added.
    // Returns:
    //   false when the channel is not open or the write queue is over its limit.
    //==========================================================================================================
    virtual bool WriteLine(std::string line) = 0;

    // Invoked on the channel's reader thread for every complete line received.
    using LineHandler = std::function<void(std::string&&)>;
    virtual void SetLineHandler(LineHandler handler) = 0;

    // Invoked for every line on the diagnostic stream (stderr for processes).
    using DiagnosticHandler = std::function<void(const std::string&)>;
    virtual void SetDiagnosticHandler(DiagnosticHandler handler) = 0;

    // Invoked once when the endpoint goes away, after all of its lines have been delivered.
    using ExitHandler = std::function<void(const ExitInfo&)>;
    virtual void SetExitHandler(ExitHandler handler) = 0;
};

//==========================================================================================================
// IChannelFactory
// Purpose: Creates the channel a ProviderClient talks over. The registry owns one factory for all servers.
//==========================================================================================================
class IChannelFactory {
public:
    virtual ~IChannelFactory() = default;
    virtual std::unique_ptr<ILineChannel> CreateChannel(const ChannelSpec& spec) = 0;
};

} // namespace toolhost
