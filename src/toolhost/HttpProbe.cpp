//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: HttpProbe.cpp
// Purpose: Boost.Beast reachability probe (HTTP and HTTPS)
//==========================================================================================================

#include <chrono>
#include <format>
#include <future>
#include <string>
#include <utility>

#include <boost/asio.hpp>
#include <boost/asio/co_spawn.hpp>
#include <boost/asio/ssl.hpp>
#include <boost/asio/use_awaitable.hpp>
#include <boost/asio/use_future.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>
#include <boost/beast/ssl.hpp>

#include <openssl/ssl.h>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/HttpProbe.hpp"
#include "toolhost/errors/Errors.h"

namespace toolhost {
namespace net = boost::asio;
namespace ssl = boost::asio::ssl;
namespace http = boost::beast::http;
using tcp = net::ip::tcp;

using errors::ErrorCategory;
using errors::ToolHostError;

namespace {

struct UrlParts {
    std::string scheme;
    std::string host;
    std::string port;
    std::string path;
};

UrlParts parseUrl(const std::string& url) {
    UrlParts parts;
    std::size_t pos = 0;
    std::size_t schemeEnd = url.find("://");
    if (schemeEnd == std::string::npos) {
        throw ToolHostError(ErrorCategory::ProbeError, "Invalid url (missing scheme): " + url);
    }
    parts.scheme = url.substr(0, schemeEnd);
    for (auto& c : parts.scheme) c = static_cast<char>(::tolower(static_cast<unsigned char>(c)));
    if (parts.scheme != "http" && parts.scheme != "https") {
        throw ToolHostError(ErrorCategory::ProbeError, "Unsupported url scheme: " + parts.scheme);
    }
    pos = schemeEnd + 3;

    std::size_t slash = url.find_first_of("/?", pos);
    std::string hostPort;
    if (slash == std::string::npos) {
        hostPort = url.substr(pos);
        parts.path = "/";
    } else {
        hostPort = url.substr(pos, slash - pos);
        parts.path = url.substr(slash);
        if (parts.path.front() == '?') parts.path.insert(parts.path.begin(), '/');
    }
    if (auto at = hostPort.rfind('@'); at != std::string::npos) {
        hostPort = hostPort.substr(at + 1);
    }

    if (!hostPort.empty() && hostPort.front() == '[') {
        // [v6]:port
        std::size_t close = hostPort.find(']');
        if (close == std::string::npos) {
            throw ToolHostError(ErrorCategory::ProbeError, "Invalid url host: " + url);
        }
        parts.host = hostPort.substr(1, close - 1);
        if (close + 1 < hostPort.size() && hostPort[close + 1] == ':') parts.port = hostPort.substr(close + 2);
    } else {
        std::size_t colon = hostPort.find(':');
        if (colon == std::string::npos) {
            parts.host = hostPort;
        } else {
            parts.host = hostPort.substr(0, colon);
            parts.port = hostPort.substr(colon + 1);
        }
    }
    if (parts.port.empty()) {
        parts.port = parts.scheme == "https" ? "443" : "80";
    }
    if (parts.host.empty()) {
        throw ToolHostError(ErrorCategory::ProbeError, "Invalid url (empty host): " + url);
    }
    return parts;
}

http::request<http::empty_body> makeRequest(const UrlParts& u) {
    http::request<http::empty_body> req{http::verb::get, u.path, 11};
    req.set(http::field::host, u.host);
    req.set(http::field::user_agent, "toolhost-probe");
    req.set(http::field::accept, "text/event-stream, application/json");
    req.set(http::field::connection, "close");
    return req;
}

net::awaitable<int> coProbe(UrlParts u, BeastReachabilityProbe::Options opts) {
    auto executor = co_await net::this_coro::executor;
    tcp::resolver resolver(executor);
    auto results = co_await resolver.async_resolve(u.host, u.port, net::use_awaitable);

    boost::beast::flat_buffer buffer;
    http::response_parser<http::empty_body> parser;
    parser.skip(false);
    auto req = makeRequest(u);

    if (u.scheme == "https") {
        ssl::context ctx(ssl::context::tls_client);
        ::SSL_CTX_set_min_proto_version(ctx.native_handle(), TLS1_2_VERSION);
        if (opts.verifyPeer) {
            boost::system::error_code vec;
            ctx.set_default_verify_paths(vec);
            if (vec) {
                LOG_DEBUG("Probe: set_default_verify_paths failed: {}", vec.message());
            }
            ctx.set_verify_mode(ssl::verify_peer);
        } else {
            ctx.set_verify_mode(ssl::verify_none);
        }

        boost::beast::ssl_stream<boost::beast::tcp_stream> stream(executor, ctx);
        if (!::SSL_set_tlsext_host_name(stream.native_handle(), u.host.c_str())) {
            throw ToolHostError(ErrorCategory::ProbeError, "HTTPS: failed to set SNI hostname " + u.host);
        }
        if (opts.verifyPeer) {
            (void)::SSL_set1_host(stream.native_handle(), u.host.c_str());
        }
        stream.next_layer().expires_after(opts.timeout);
        co_await stream.next_layer().async_connect(results, net::use_awaitable);
        co_await stream.async_handshake(ssl::stream_base::client, net::use_awaitable);
        co_await http::async_write(stream, req, net::use_awaitable);
        co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
        boost::system::error_code ec;
        stream.next_layer().socket().shutdown(tcp::socket::shutdown_both, ec);
        co_return static_cast<int>(parser.get().result_int());
    }

    boost::beast::tcp_stream stream(executor);
    stream.expires_after(opts.timeout);
    co_await stream.async_connect(results, net::use_awaitable);
    co_await http::async_write(stream, req, net::use_awaitable);
    co_await http::async_read_header(stream, buffer, parser, net::use_awaitable);
    boost::system::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);
    co_return static_cast<int>(parser.get().result_int());
}

ProbeResult runProbe(const std::string& url, BeastReachabilityProbe::Options opts) {
    UrlParts u = parseUrl(url);
    const auto begin = std::chrono::steady_clock::now();
    int status = 0;
    try {
        net::io_context ioc;
        auto fut = net::co_spawn(ioc, coProbe(u, opts), net::use_future);
        // Resolution has no timer of its own; the run_for bound covers it
        ioc.run_for(opts.timeout + std::chrono::milliseconds(250));
        if (fut.wait_for(std::chrono::seconds(0)) != std::future_status::ready) {
            ioc.stop();
            throw ToolHostError(ErrorCategory::ProbeError,
                std::format("{}: no answer within {} ms", url, opts.timeout.count()));
        }
        status = fut.get();
    } catch (const ToolHostError&) {
        throw;
    } catch (const boost::system::system_error& e) {
        throw ToolHostError(ErrorCategory::ProbeError, std::format("{}: {}", url, e.code().message()));
    } catch (const std::exception& e) {
        throw ToolHostError(ErrorCategory::ProbeError, std::format("{}: {}", url, e.what()));
    }
    const auto latency = std::chrono::duration_cast<std::chrono::milliseconds>(std::chrono::steady_clock::now() - begin);
    if (status < 200 || status >= 300) {
        throw ToolHostError(ErrorCategory::ProbeError, std::format("{}: HTTP status {}", url, status));
    }
    LOG_DEBUG("Probe: {} answered {} in {} ms", url, status, latency.count());
    return ProbeResult{status, latency};
}

} // namespace

BeastReachabilityProbe::BeastReachabilityProbe() {
    opts.timeout = GetEnvMillisOrDefault("TOOLHOST_PROBE_TIMEOUT_MS", opts.timeout);
}

BeastReachabilityProbe::BeastReachabilityProbe(Options options) : opts(options) {}

std::future<ProbeResult> BeastReachabilityProbe::Probe(const std::string& url) {
    FUNC_SCOPE();
    return std::async(std::launch::async, [url, o = opts]() { return runProbe(url, o); });
}

} // namespace toolhost
