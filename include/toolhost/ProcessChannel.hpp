//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProcessChannel.hpp
// Purpose: Line channel over the stdin/stdout/stderr pipes of a spawned child process (POSIX)
//==========================================================================================================
#pragma once

#include "toolhost/Channel.h"
#include <cstddef>
#include <memory>

namespace toolhost {

//==========================================================================================================
// ProcessChannel
// Purpose: Spawns ChannelSpec::command with ChannelSpec::args and an environment made of the parent
//          environment overlaid with ChannelSpec::env. Lines written go to the child's stdin; stdout is
//          split into lines for the line handler; stderr lines go to the diagnostic handler.
// Notes:
//   - One reader thread (epoll on stdout, stderr and a wake eventfd) and one writer thread per channel.
//   - The reader thread reaps the child and reports the exit once both streams are drained.
//   - Close(): drain queued writes, close stdin, wait stopGrace, SIGTERM, wait stopGrace, SIGKILL.
//==========================================================================================================
class ProcessChannel : public ILineChannel {
public:
    explicit ProcessChannel(ChannelSpec spec);
    virtual ~ProcessChannel();

    ////////////////////////////////////////// ILineChannel //////////////////////////////////////////
    //==========================================================================================================
    // Spawns the child. Fails with SpawnError when pipes cannot be created, fork fails or exec fails
    // (e.g. command not found); exec failures are reported synchronously through a close-on-exec pipe.
    //==========================================================================================================
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsOpen() const override;
    std::string Describe() const override;

    bool WriteLine(std::string line) override;
    void SetLineHandler(LineHandler handler) override;
    void SetDiagnosticHandler(DiagnosticHandler handler) override;
    void SetExitHandler(ExitHandler handler) override;

    //==========================================================================================================
    // SetWriteQueueMaxBytes
    // Purpose: Backpressure clamp for pending writes; WriteLine fails once the queue would exceed it.
    //==========================================================================================================
    void SetWriteQueueMaxBytes(std::size_t maxBytes);

    // Child pid while running, -1 otherwise.
    int Pid() const;

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

//==========================================================================================================
// ProcessChannelFactory
// Purpose: Default factory used by the registry for stdio servers.
//==========================================================================================================
class ProcessChannelFactory : public IChannelFactory {
public:
    std::unique_ptr<ILineChannel> CreateChannel(const ChannelSpec& spec) override;
};

} // namespace toolhost
