//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.hpp
// Purpose: In-memory line channel pair for tests and embedding
//==========================================================================================================
#pragma once

#include "toolhost/Channel.h"
#include <memory>
#include <utility>

namespace toolhost {

//==========================================================================================================
// InMemoryChannel
// Purpose: In-process ILineChannel. Lines written on one endpoint are delivered, in order, to the line
//          handler of its paired endpoint on that endpoint's processing thread.
// Notes:
//   - The far endpoint can play the provider: EmitDiagnostic() feeds the peer's diagnostic handler and
//     SimulateExit() makes the peer observe a process exit after all earlier lines.
//==========================================================================================================
class InMemoryChannel : public ILineChannel {
public:
    InMemoryChannel();
    virtual ~InMemoryChannel();

    //==========================================================================================================
    // CreatePair
    // Purpose: Creates two endpoints wired to each other.
    // Returns:
    //   pair(left,right) where writing on one delivers to the other.
    //==========================================================================================================
    static std::pair<std::unique_ptr<InMemoryChannel>, std::unique_ptr<InMemoryChannel>> CreatePair();

    ////////////////////////////////////////// ILineChannel //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> Close() override;
    bool IsOpen() const override;
    std::string Describe() const override;
    bool WriteLine(std::string line) override;
    void SetLineHandler(LineHandler handler) override;
    void SetDiagnosticHandler(DiagnosticHandler handler) override;
    void SetExitHandler(ExitHandler handler) override;

    ////////////////////////////////////////// Peer simulation //////////////////////////////////////////
    // Delivers a diagnostic line to the peer.
    void EmitDiagnostic(const std::string& line);

    // Closes this endpoint and reports info to the peer's exit handler once queued lines are delivered.
    void SimulateExit(ExitInfo info);

    // Makes the next Start() fail with a SpawnError carrying message.
    void FailNextStart(std::string message);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace toolhost
