//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_http_probe.cpp
// Purpose: BeastReachabilityProbe against a loopback HTTP responder and unreachable endpoints
//==========================================================================================================

#include <gtest/gtest.h>
#include <boost/asio.hpp>
#include <chrono>
#include <future>
#include <string>
#include <thread>

#include "ScriptedProvider.h"
#include "toolhost/HttpProbe.hpp"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace toolhost::testing;
using toolhost::errors::ErrorCategory;
using boost::asio::ip::tcp;
using namespace std::chrono_literals;

namespace {

// Accepts one connection, reads the request head and answers with a canned status line.
class OneShotResponder {
public:
    explicit OneShotResponder(std::string statusLine)
        : acceptor(ioc, tcp::endpoint(boost::asio::ip::make_address("127.0.0.1"), 0)) {
        port = acceptor.local_endpoint().port();
        worker = std::thread([this, statusLine]() {
            boost::system::error_code ec;
            tcp::socket sock(ioc);
            acceptor.accept(sock, ec);
            if (ec) return;
            boost::asio::streambuf buf;
            boost::asio::read_until(sock, buf, "\r\n\r\n", ec);
            const std::string response = "HTTP/1.1 " + statusLine + "\r\nContent-Length: 0\r\nConnection: close\r\n\r\n";
            boost::asio::write(sock, boost::asio::buffer(response), ec);
            sock.shutdown(tcp::socket::shutdown_both, ec);
        });
    }
    ~OneShotResponder() {
        boost::system::error_code ec;
        acceptor.close(ec);
        if (worker.joinable()) worker.join();
    }

    std::string Url() const { return "http://127.0.0.1:" + std::to_string(port) + "/mcp"; }

private:
    boost::asio::io_context ioc;
    tcp::acceptor acceptor;
    unsigned short port{0};
    std::thread worker;
};

BeastReachabilityProbe quickProbe() {
    BeastReachabilityProbe::Options o;
    o.timeout = 2000ms;
    return BeastReachabilityProbe(o);
}

} // namespace

TEST(HttpProbe, SuccessfulStatusIsReachable) {
    OneShotResponder server("204 No Content");
    auto probe = quickProbe();
    ProbeResult r = probe.Probe(server.Url()).get();
    EXPECT_EQ(r.statusCode, 204);
    EXPECT_GE(r.latency.count(), 0);
}

TEST(HttpProbe, ErrorStatusIsProbeError) {
    OneShotResponder server("503 Service Unavailable");
    auto probe = quickProbe();
    auto fut = probe.Probe(server.Url());
    try {
        fut.get();
        FAIL() << "expected ProbeError";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::ProbeError);
        EXPECT_NE(std::string(e.what()).find("503"), std::string::npos);
    }
}

TEST(HttpProbe, RefusedConnectionIsProbeError) {
    auto probe = quickProbe();
    auto fut = probe.Probe("http://127.0.0.1:1/");
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::ProbeError);
}

TEST(HttpProbe, MalformedUrlsAreProbeErrors) {
    auto probe = quickProbe();
    auto noScheme = probe.Probe("localhost:8080/mcp");
    EXPECT_EQ(FailureCategory(noScheme), ErrorCategory::ProbeError);
    auto badScheme = probe.Probe("ftp://example.com/");
    EXPECT_EQ(FailureCategory(badScheme), ErrorCategory::ProbeError);
    auto noHost = probe.Probe("http:///path");
    EXPECT_EQ(FailureCategory(noHost), ErrorCategory::ProbeError);
}
