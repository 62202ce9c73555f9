//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpProbe.hpp
// Purpose: Reachability probe for remote (sse/https) tool servers
//==========================================================================================================

#pragma once

#include <chrono>
#include <future>
#include <memory>
#include <string>

namespace toolhost {

//==========================================================================================================
// ProbeResult
// Purpose: Outcome of a successful probe.
//==========================================================================================================
struct ProbeResult {
    int statusCode{0};
    std::chrono::milliseconds latency{0};
};

//==========================================================================================================
// IReachabilityProbe
// Purpose: Checks that a remote server answers at its url. The registry calls it once per start.
// Returns:
//   Future resolving to ProbeResult on a 2xx answer. Fails with ToolHostError(ProbeError) on a
//   malformed url, a resolve/connect/TLS/read failure, a timeout or a non-2xx status.
//==========================================================================================================
class IReachabilityProbe {
public:
    virtual ~IReachabilityProbe() = default;
    virtual std::future<ProbeResult> Probe(const std::string& url) = 0;
};

//==========================================================================================================
// BeastReachabilityProbe
// Purpose: Sends one GET (Accept: text/event-stream, application/json) and reads only the status line and
//          headers, so event streams that never end are fine.
// Notes:
//   - https verifies the peer against the default trust store with SNI set; TLS 1.2 or newer.
//   - The whole exchange is bounded by the timeout (TOOLHOST_PROBE_TIMEOUT_MS, default 5000 ms).
//==========================================================================================================
class BeastReachabilityProbe : public IReachabilityProbe {
public:
    struct Options {
        std::chrono::milliseconds timeout{5000};
        bool verifyPeer{true};
    };

    BeastReachabilityProbe();
    explicit BeastReachabilityProbe(Options options);

    std::future<ProbeResult> Probe(const std::string& url) override;

private:
    Options opts;
};

} // namespace toolhost
