//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ProviderClient.cpp
// Purpose: Protocol client implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ProviderClient.h"
#include "toolhost/WireCodec.h"
#include "toolhost/async/FutureAwaitable.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"

namespace toolhost {

using errors::ErrorCategory;
using errors::ToolHostError;
using steady = std::chrono::steady_clock;

namespace {

// Providers usually echo the integer id; some echo it as a decimal string.
std::optional<int64_t> numericId(const JSONRPCId& id) {
    if (const auto* n = std::get_if<int64_t>(&id)) return *n;
    if (const auto* s = std::get_if<std::string>(&id)) {
        if (s->empty() || s->size() > 18) return std::nullopt;
        int64_t v = 0;
        for (char c : *s) {
            if (c < '0' || c > '9') return std::nullopt;
            v = v * 10 + (c - '0');
        }
        return v;
    }
    return std::nullopt;
}

ProviderClient::Options defaultOptions() {
    ProviderClient::Options o;
    o.toolsRetryDelay = GetEnvMillisOrDefault("TOOLHOST_TOOLS_RETRY_DELAY_MS", o.toolsRetryDelay);
    o.stopGrace = GetEnvMillisOrDefault("TOOLHOST_STOP_GRACE_MS", o.stopGrace);
    return o;
}

} // namespace

class ProviderClient::Impl : public std::enable_shared_from_this<ProviderClient::Impl> {
public:
    struct PendingRequest {
        std::promise<JSONValue> promise;
        steady::time_point deadline;
        std::string method;
    };

    ServerConfig config;
    std::shared_ptr<IChannelFactory> channelFactory;
    ProviderClient::Options options;
    std::chrono::milliseconds requestTimeout;

    // Guards the pointer only; channel calls are made on a local copy
    mutable std::mutex channelMutex;
    std::shared_ptr<ILineChannel> channel;

    mutable std::mutex stateMutex;
    ServerStatus status{ServerStatus::Stopped};
    std::vector<Tool> tools;
    std::optional<ServerCapabilities> capabilities;
    std::optional<std::string> lastError;
    std::deque<std::string> diagnosticTail;
    std::optional<std::chrono::system_clock::time_point> lastActivity;
    std::map<uint64_t, std::vector<std::promise<void>>> startWaiters; // keyed by session
    uint64_t session{0}; // bumped by Start and Stop; callbacks from older sessions are ignored

    std::atomic<bool> stopping{false};
    std::atomic<int64_t> nextId{0};

    mutable std::mutex requestMutex;
    std::condition_variable_any cvTimeout;
    std::unordered_map<int64_t, PendingRequest> pendingRequests;
    uint64_t pendingGeneration{0};

    std::mutex handlerMutex;
    ProviderClient::ToolsChangedHandler toolsHandler;
    ProviderClient::StatusHandler statusHandler;

    std::mutex retryMutex;
    std::jthread retryThread;

    // Declared last: started in the constructor, stopped first on destruction
    std::jthread timeoutThread;

    Impl(ServerConfig cfg, std::shared_ptr<IChannelFactory> factory, ProviderClient::Options opts)
        : config(std::move(cfg)), channelFactory(std::move(factory)), options(std::move(opts)),
          requestTimeout(config.RequestTimeout()) {
        if (options.clientInfo.name.empty()) {
            options.clientInfo = defaultClientInfo();
        }
        timeoutThread = std::jthread([this](std::stop_token st) { timeoutLoop(st); });
    }

    ~Impl() {
        {
            std::lock_guard<std::mutex> lk(retryMutex);
            if (retryThread.joinable() && retryThread.get_id() == std::this_thread::get_id()) {
                retryThread.detach();
            }
        }
        rejectAll(ErrorCategory::ServerStopped, config.id + ": client destroyed");
    }

    ////////////////////////////////////////// helpers //////////////////////////////////////////

    std::shared_ptr<ILineChannel> currentChannel() const {
        std::lock_guard<std::mutex> lk(channelMutex);
        return channel;
    }

    bool isCurrentSession(uint64_t s) const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return s == session && !stopping.load();
    }

    ServerStatus getStatus() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return status;
    }

    std::vector<Tool> getTools() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        return tools;
    }

    std::string diagnosticSummary() const {
        std::lock_guard<std::mutex> lk(stateMutex);
        std::string out;
        for (const auto& l : diagnosticTail) {
            if (!out.empty()) out += '\n';
            out += l;
        }
        return out;
    }

    void publishStatus(ServerStatus s, const std::optional<std::string>& error) {
        ProviderClient::StatusHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = statusHandler;
        }
        if (!h) return;
        try {
            h(s, error);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: status handler threw: {}", config.id, e.what());
        }
    }

    void publishTools(const std::vector<Tool>& list) {
        ProviderClient::ToolsChangedHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = toolsHandler;
        }
        if (!h) return;
        try {
            h(list);
        } catch (const std::exception& e) {
            LOG_ERROR("{}: tools handler threw: {}", config.id, e.what());
        }
    }

    // Completes the callers waiting on session s; waiters of later sessions are left alone.
    void completeStartWaiters(uint64_t s, const std::exception_ptr& failure) {
        std::vector<std::promise<void>> waiters;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            auto it = startWaiters.find(s);
            if (it == startWaiters.end()) return;
            waiters.swap(it->second);
            startWaiters.erase(it);
        }
        for (auto& w : waiters) {
            if (failure) w.set_exception(failure); else w.set_value();
        }
    }

    ////////////////////////////////////////// requests //////////////////////////////////////////

    std::future<JSONValue> sendRequest(const std::string& method, std::optional<JSONValue> params) {
        auto ch = currentChannel();
        if (!ch || !ch->IsOpen()) {
            return async::failedFuture<JSONValue>(ToolHostError(ErrorCategory::NotRunning,
                std::format("{}: cannot send {}: not connected", config.id, method)));
        }
        const int64_t id = ++nextId;
        std::promise<JSONValue> promise;
        auto fut = promise.get_future();
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            pendingRequests.emplace(id, PendingRequest{std::move(promise), steady::now() + requestTimeout, method});
            ++pendingGeneration;
        }
        cvTimeout.notify_all();
        LOG_DEBUG("{}: -> {} (id {})", config.id, method, id);
        if (!ch->WriteLine(EncodeEnvelope(Envelope::Request(id, method, std::move(params))))) {
            failPending(id, ErrorCategory::TransportError, std::format("{}: failed to write {} request", config.id, method));
        }
        return fut;
    }

    bool sendNotification(const std::string& method, std::optional<JSONValue> params) {
        auto ch = currentChannel();
        if (!ch || !ch->IsOpen()) {
            LOG_DEBUG("{}: dropping notification {} (not connected)", config.id, method);
            return false;
        }
        LOG_DEBUG("{}: -> {} (notification)", config.id, method);
        return ch->WriteLine(EncodeEnvelope(Envelope::Notification(method, std::move(params))));
    }

    void failPending(int64_t id, ErrorCategory category, const std::string& message) {
        std::optional<PendingRequest> entry;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            auto it = pendingRequests.find(id);
            if (it == pendingRequests.end()) return;
            entry.emplace(std::move(it->second));
            pendingRequests.erase(it);
        }
        entry->promise.set_exception(std::make_exception_ptr(ToolHostError(category, message)));
    }

    void rejectAll(ErrorCategory category, const std::string& message) {
        std::unordered_map<int64_t, PendingRequest> drained;
        {
            std::lock_guard<std::mutex> lk(requestMutex);
            drained.swap(pendingRequests);
        }
        if (!drained.empty()) {
            LOG_DEBUG("{}: rejecting {} pending request(s): {}", config.id, drained.size(), message);
        }
        for (auto& [id, p] : drained) {
            p.promise.set_exception(std::make_exception_ptr(ToolHostError(category, message)));
        }
    }

    void timeoutLoop(std::stop_token st) {
        std::unique_lock<std::mutex> lk(requestMutex);
        while (!st.stop_requested()) {
            const auto now = steady::now();
            std::vector<std::pair<int64_t, PendingRequest>> expired;
            std::optional<steady::time_point> earliest;
            for (auto it = pendingRequests.begin(); it != pendingRequests.end();) {
                if (it->second.deadline <= now) {
                    expired.emplace_back(it->first, std::move(it->second));
                    it = pendingRequests.erase(it);
                } else {
                    if (!earliest || it->second.deadline < *earliest) earliest = it->second.deadline;
                    ++it;
                }
            }
            if (!expired.empty()) {
                lk.unlock();
                for (auto& [id, p] : expired) {
                    LOG_WARN("{}: request {} ({}) timed out after {} ms", config.id, id, p.method, requestTimeout.count());
                    p.promise.set_exception(std::make_exception_ptr(ToolHostError(ErrorCategory::RequestTimeout,
                        std::format("{}: request {} ({}) timed out after {} ms", config.id, id, p.method, requestTimeout.count()))));
                }
                lk.lock();
                continue;
            }
            const uint64_t seen = pendingGeneration;
            if (earliest) {
                cvTimeout.wait_until(lk, st, *earliest, [&]() { return pendingGeneration != seen; });
            } else {
                cvTimeout.wait(lk, st, [&]() { return pendingGeneration != seen; });
            }
        }
    }

    ////////////////////////////////////////// inbound //////////////////////////////////////////

    void wireChannel(ILineChannel& ch, uint64_t s) {
        std::weak_ptr<Impl> weak = weak_from_this();
        ch.SetLineHandler([weak](std::string&& line) {
            if (auto self = weak.lock()) self->onLine(std::move(line));
        });
        ch.SetDiagnosticHandler([weak](const std::string& line) {
            if (auto self = weak.lock()) self->onDiagnostic(line);
        });
        ch.SetExitHandler([weak, s](const ExitInfo& info) {
            if (auto self = weak.lock()) self->onExit(s, info);
        });
    }

    void onLine(std::string&& line) {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            lastActivity = std::chrono::system_clock::now();
        }
        DecodeResult decoded = DecodeLine(line);
        if (decoded.outcome == DecodeOutcome::Foreign) {
            if (!line.empty()) {
                LOG_DEBUG("{}: ignoring non-protocol output: {}", config.id, line);
            }
            return;
        }
        if (decoded.outcome == DecodeOutcome::ParseError) {
            LOG_WARN("{}: dropping malformed message ({}): {}", config.id, decoded.error, line);
            return;
        }
        Envelope& env = decoded.envelope;
        switch (ClassifyEnvelope(env)) {
            case MessageKind::Response:
                onResponse(env);
                break;
            case MessageKind::Notification:
                onNotification(env);
                break;
            case MessageKind::Request:
                onProviderRequest(env);
                break;
            case MessageKind::Unknown:
                LOG_DEBUG("{}: ignoring unclassifiable message: {}", config.id, line);
                break;
        }
    }

    void onResponse(const Envelope& env) {
        auto id = numericId(*env.id);
        std::optional<PendingRequest> entry;
        if (id) {
            std::lock_guard<std::mutex> lk(requestMutex);
            auto it = pendingRequests.find(*id);
            if (it != pendingRequests.end()) {
                entry.emplace(std::move(it->second));
                pendingRequests.erase(it);
            }
        }
        if (!entry) {
            LOG_DEBUG("{}: response for unknown request id {}", config.id, IdToString(*env.id));
            return;
        }
        LOG_DEBUG("{}: <- {} (id {}){}", config.id, entry->method, *id, env.error ? " error" : "");
        if (env.error) {
            entry->promise.set_exception(std::make_exception_ptr(errors::makeProtocolError(*env.error)));
        } else {
            entry->promise.set_value(env.result.value_or(JSONValue{}));
        }
    }

    void onNotification(const Envelope& env) {
        const std::string& method = *env.method;
        if (method == Methods::ToolListChanged) {
            LOG_INFO("{}: tool list changed; refreshing", config.id);
            // Runs on a waiter thread once the request is sent; the reader thread never blocks on it
            (void)coRefreshTools(shared_from_this());
            return;
        }
        if (method == Methods::LoggingMessage || method == Methods::Log) {
            logProviderMessage(env.params.value_or(JSONValue{}));
            return;
        }
        LOG_DEBUG("{}: unhandled notification {}", config.id, method);
    }

    // The client exposes no capabilities beyond liveness checks; other requests get MethodNotFound.
    void onProviderRequest(const Envelope& env) {
        const std::string& method = *env.method;
        Envelope reply;
        if (method == "ping") {
            reply = Envelope::Result(*env.id, JSONValue(JSONValue::Object{}));
        } else {
            LOG_DEBUG("{}: rejecting provider request {}", config.id, method);
            reply = Envelope::Error(*env.id, CreateErrorObject(JSONRPCErrorCodes::MethodNotFound,
                                                               "Method not supported by client: " + method));
        }
        auto ch = currentChannel();
        if (ch && !ch->WriteLine(EncodeEnvelope(reply))) {
            LOG_DEBUG("{}: failed to reply to provider request {}", config.id, method);
        }
    }

    void logProviderMessage(const JSONValue& params) {
        const std::string level = GetStringMember(params, "level").value_or("info");
        std::string text;
        if (const JSONValue* data = params.find("data")) {
            text = data->isString() ? std::get<std::string>(data->value) : SerializeJSON(*data);
        }
        if (auto logger = GetStringMember(params, "logger")) {
            text = *logger + ": " + text;
        }
        switch (Logger::levelFromString(level)) {
            case LogLevel::LOG_DEBUG_LEVEL: LOG_DEBUG("[{}] {}", config.id, text); break;
            case LogLevel::LOG_INFO_LEVEL: LOG_INFO("[{}] {}", config.id, text); break;
            case LogLevel::LOG_WARN_LEVEL: LOG_WARN("[{}] {}", config.id, text); break;
            default: LOG_ERROR("[{}] {}", config.id, text); break;
        }
    }

    void onDiagnostic(const std::string& line) {
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            diagnosticTail.push_back(line);
            while (diagnosticTail.size() > options.diagnosticTailLines) diagnosticTail.pop_front();
        }
        LOG_INFO("[{} stderr] {}", config.id, line);
    }

    void onExit(uint64_t s, const ExitInfo& info) {
        if (info.requested || stopping.load()) return;
        const std::string tail = diagnosticSummary();
        std::string message;
        if (!info.clean()) {
            message = std::format("{} exited unexpectedly ({})", config.id, info.describe());
            if (!tail.empty()) message += ": " + tail;
        }
        bool wasStarting = false;
        ServerStatus newStatus = info.clean() ? ServerStatus::Stopped : ServerStatus::Error;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            if (s != session) return;
            wasStarting = (status == ServerStatus::Starting);
            if (!wasStarting) {
                tools.clear();
                status = newStatus;
            }
            if (!message.empty()) lastError = message;
            else if (!wasStarting) lastError.reset();
        }
        rejectAll(ErrorCategory::ServerExited, std::format("{}: provider exited ({})", config.id, info.describe()));
        if (wasStarting) return; // the handshake reports the failure
        if (info.clean()) {
            LOG_INFO("{}: provider exited", config.id);
            publishStatus(newStatus, std::nullopt);
        } else {
            LOG_ERROR("{}", message);
            publishStatus(newStatus, message);
        }
        publishTools({});
    }

    ////////////////////////////////////////// lifecycle //////////////////////////////////////////

    ToolHostError handshakeError(const ToolHostError& e) const {
        switch (e.category()) {
            case ErrorCategory::RequestTimeout:
                return ToolHostError(ErrorCategory::HandshakeTimeout,
                    std::format("{}: no initialize response within {} ms", config.id, requestTimeout.count()));
            case ErrorCategory::ProtocolError:
                if (e.protocolError()) {
                    return ToolHostError(ErrorCategory::HandshakeProtocolError,
                        std::format("{}: initialize rejected: {}", config.id, e.protocolError()->message), *e.protocolError());
                }
                return ToolHostError(ErrorCategory::HandshakeProtocolError, e.what());
            case ErrorCategory::ServerExited: {
                std::string msg = std::format("{}: provider exited during handshake", config.id);
                const std::string tail = diagnosticSummary();
                if (!tail.empty()) msg += ": " + tail;
                return ToolHostError(ErrorCategory::HandshakeProtocolError, msg);
            }
            default:
                return e;
        }
    }

    void abortStart(uint64_t s, const std::shared_ptr<ILineChannel>& ch, const ToolHostError& err) {
        bool current = false;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            current = (s == session) && status == ServerStatus::Starting && !stopping.load();
            if (current) {
                status = ServerStatus::Error;
                lastError = err.what();
                tools.clear();
            }
        }
        bool owned = false;
        {
            std::lock_guard<std::mutex> lk(channelMutex);
            if (ch && channel == ch) {
                channel.reset();
                owned = true;
            }
        }
        // A channel no longer published was taken by stop(), which closes it
        if (owned) ch->Close().get();
        if (current) {
            rejectAll(err.category(), err.what());
            LOG_ERROR("{}: start failed: {}", config.id, err.what());
            publishStatus(ServerStatus::Error, std::string(err.what()));
        }
    }

    ToolHostError staleStart() const {
        return ToolHostError(ErrorCategory::ServerStopped, config.id + ": stopped while starting");
    }

    static async::Task<void> coStart(std::shared_ptr<Impl> self, uint64_t s) {
        FUNC_SCOPE();
        const ServerConfig& cfg = self->config;
        std::optional<ToolHostError> err;

        // 1. Open the channel (spawns the provider)
        ChannelSpec spec;
        spec.label = cfg.id;
        spec.command = cfg.command;
        spec.args = cfg.args;
        spec.env = cfg.env;
        spec.stopGrace = self->options.stopGrace;
        std::shared_ptr<ILineChannel> ch;
        try {
            ch = std::shared_ptr<ILineChannel>(self->channelFactory->CreateChannel(spec));
        } catch (const std::exception& e) {
            err = ToolHostError(ErrorCategory::SpawnError, std::format("{}: {}", cfg.id, e.what()));
        }
        if (!err && !ch) {
            err = ToolHostError(ErrorCategory::SpawnError, cfg.id + ": no channel available");
        }
        if (err) {
            self->abortStart(s, nullptr, *err);
            throw *err;
        }
        self->wireChannel(*ch, s);
        bool published = false;
        {
            std::lock_guard<std::mutex> lk(self->stateMutex);
            std::lock_guard<std::mutex> chLock(self->channelMutex);
            if (s == self->session && !self->stopping.load()) {
                self->channel = ch;
                published = true;
            }
        }
        if (!published) {
            err = self->staleStart();
            self->abortStart(s, nullptr, *err);
            throw *err;
        }
        try {
            co_await async::makeFutureAwaitable(ch->Start());
        } catch (const ToolHostError& e) {
            err = e;
        } catch (const std::exception& e) {
            err = ToolHostError(ErrorCategory::SpawnError, std::format("{}: {}", cfg.id, e.what()));
        }
        if (!err && !self->isCurrentSession(s)) err = self->staleStart();
        if (err) {
            self->abortStart(s, ch, *err);
            throw *err;
        }

        // 2. Handshake
        JSONValue initResult;
        try {
            initResult = co_await async::makeFutureAwaitable(
                self->sendRequest(Methods::Initialize, BuildInitializeParams(self->options.clientInfo)));
        } catch (const ToolHostError& e) {
            err = self->handshakeError(e);
        }
        if (!err && !self->isCurrentSession(s)) err = self->staleStart();
        if (err) {
            self->abortStart(s, ch, *err);
            throw *err;
        }
        ServerCapabilities caps = ParseServerCapabilities(initResult);
        if (!self->sendNotification(Methods::Initialized, std::nullopt)) {
            LOG_WARN("{}: failed to send {}", cfg.id, Methods::Initialized);
        }
        {
            std::lock_guard<std::mutex> lk(self->stateMutex);
            if (s != self->session) {
                err = self->staleStart();
            } else {
                self->capabilities = caps;
                self->status = ServerStatus::Running;
                self->lastError.reset();
            }
        }
        if (err) {
            self->abortStart(s, ch, *err);
            throw *err;
        }
        LOG_INFO("{}: running ({} {}, protocol {})", cfg.id,
                 caps.serverInfo ? caps.serverInfo->name : std::string("unknown"),
                 caps.serverInfo ? caps.serverInfo->version : std::string(""),
                 caps.protocolVersion.empty() ? std::string("unspecified") : caps.protocolVersion);
        self->publishStatus(ServerStatus::Running, std::nullopt);

        // 3. Initial tool discovery; failures leave the list empty and schedule one retry
        bool haveTools = false;
        try {
            auto listed = co_await async::makeFutureAwaitable(coListTools(self).toFuture());
            haveTools = !listed.empty();
        } catch (const ToolHostError& e) {
            LOG_WARN("{}: initial tools/list failed: {}", cfg.id, e.what());
        }
        if (!haveTools) {
            self->scheduleToolsRetry(s);
        }
        co_return;
    }

    static async::Task<void> coRunStart(std::shared_ptr<Impl> self, uint64_t s) {
        std::exception_ptr failure;
        try {
            co_await async::makeFutureAwaitable(coStart(self, s).toFuture());
        } catch (const std::exception&) {
            failure = std::current_exception();
        }
        self->completeStartWaiters(s, failure);
    }

    static async::Task<std::vector<Tool>> coListTools(std::shared_ptr<Impl> self) {
        if (self->getStatus() != ServerStatus::Running) {
            co_return self->getTools();
        }
        JSONValue result = co_await async::makeFutureAwaitable(
            self->sendRequest(Methods::ListTools, JSONValue(JSONValue::Object{})));
        std::vector<Tool> list = ParseToolList(result);
        bool publish = false;
        {
            std::lock_guard<std::mutex> lk(self->stateMutex);
            if (self->status == ServerStatus::Running) {
                self->tools = list;
                publish = true;
            }
        }
        if (publish) {
            LOG_INFO("{}: {} tool(s) available", self->config.id, list.size());
            self->publishTools(list);
        }
        co_return list;
    }

    static async::Task<void> coRefreshTools(std::shared_ptr<Impl> self) {
        try {
            (void) co_await async::makeFutureAwaitable(coListTools(self).toFuture());
        } catch (const ToolHostError& e) {
            LOG_WARN("{}: tools refresh failed: {}", self->config.id, e.what());
        }
    }

    void scheduleToolsRetry(uint64_t s) {
        std::weak_ptr<Impl> weak = weak_from_this();
        const auto delay = options.toolsRetryDelay;
        std::lock_guard<std::mutex> lk(retryMutex);
        stopRetryLocked();
        retryThread = std::jthread([weak, delay, s](std::stop_token st) {
            {
                std::mutex m;
                std::condition_variable_any cv;
                std::unique_lock<std::mutex> wl(m);
                cv.wait_for(wl, st, delay, []() { return false; });
            }
            if (st.stop_requested()) return;
            auto self = weak.lock();
            if (!self || !self->isCurrentSession(s) || self->getStatus() != ServerStatus::Running) return;
            LOG_INFO("{}: retrying tools/list", self->config.id);
            try {
                auto listed = coListTools(self).toFuture().get();
                if (listed.empty()) {
                    LOG_INFO("{}: provider reports no tools; waiting for a list_changed notification", self->config.id);
                }
            } catch (const ToolHostError& e) {
                LOG_WARN("{}: tools/list retry failed: {}", self->config.id, e.what());
            }
        });
    }

    void stopRetryLocked() {
        if (!retryThread.joinable()) return;
        retryThread.request_stop();
        if (retryThread.get_id() == std::this_thread::get_id()) {
            retryThread.detach();
        } else {
            retryThread.join();
        }
    }

    void stop() {
        bool wasStopped = false;
        std::map<uint64_t, std::vector<std::promise<void>>> abandoned;
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            wasStopped = (status == ServerStatus::Stopped);
            ++session;
            abandoned.swap(startWaiters);
        }
        if (!abandoned.empty()) {
            auto failure = std::make_exception_ptr(staleStart());
            for (auto& [s, waiters] : abandoned) {
                for (auto& w : waiters) w.set_exception(failure);
            }
        }
        stopping = true;
        std::shared_ptr<ILineChannel> ch;
        {
            std::lock_guard<std::mutex> lk(channelMutex);
            ch = std::move(channel);
        }
        if (ch) {
            if (ch->IsOpen() && !ch->WriteLine(EncodeEnvelope(Envelope::Notification(Methods::Shutdown)))) {
                LOG_DEBUG("{}: shutdown notification not sent", config.id);
            }
            ch->Close().get();
        }
        rejectAll(ErrorCategory::ServerStopped, config.id + ": server stopped");
        {
            std::lock_guard<std::mutex> lk(retryMutex);
            stopRetryLocked();
        }
        {
            std::lock_guard<std::mutex> lk(stateMutex);
            tools.clear();
            status = ServerStatus::Stopped;
            lastError.reset();
        }
        stopping = false;
        if (!wasStopped) {
            LOG_INFO("{}: stopped", config.id);
            publishStatus(ServerStatus::Stopped, std::nullopt);
            publishTools({});
        }
    }
};

ProviderClient::ProviderClient(ServerConfig config, std::shared_ptr<IChannelFactory> channelFactory)
    : ProviderClient(std::move(config), std::move(channelFactory), defaultOptions()) {}

ProviderClient::ProviderClient(ServerConfig config, std::shared_ptr<IChannelFactory> channelFactory, Options options)
    : pImpl(std::make_shared<Impl>(std::move(config), std::move(channelFactory), std::move(options))) {
    FUNC_SCOPE();
}

ProviderClient::~ProviderClient() {
    FUNC_SCOPE();
    {
        std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
        pImpl->toolsHandler = nullptr;
        pImpl->statusHandler = nullptr;
    }
    pImpl->stop();
}

std::future<void> ProviderClient::Start() {
    FUNC_SCOPE();
    std::promise<void> waiter;
    auto fut = waiter.get_future();
    bool launch = false;
    uint64_t s = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->stateMutex);
        if (pImpl->status == ServerStatus::Running) {
            waiter.set_value();
            return fut;
        }
        if (pImpl->status != ServerStatus::Starting) {
            pImpl->status = ServerStatus::Starting;
            pImpl->lastError.reset();
            pImpl->diagnosticTail.clear();
            s = ++pImpl->session;
            launch = true;
        }
        pImpl->startWaiters[pImpl->session].push_back(std::move(waiter));
    }
    if (launch) {
        LOG_INFO("{}: starting '{}'", pImpl->config.id, pImpl->config.command);
        pImpl->publishStatus(ServerStatus::Starting, std::nullopt);
        (void)Impl::coRunStart(pImpl, s);
    }
    return fut;
}

std::future<void> ProviderClient::Stop() {
    FUNC_SCOPE();
    pImpl->stop();
    return async::readyFuture();
}

std::future<JSONValue> ProviderClient::SendRequest(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->sendRequest(method, std::move(params));
}

bool ProviderClient::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    return pImpl->sendNotification(method, std::move(params));
}

std::future<std::vector<Tool>> ProviderClient::ListTools() {
    return Impl::coListTools(pImpl).toFuture();
}

std::future<JSONValue> ProviderClient::CallTool(const std::string& name, const JSONValue& arguments) {
    if (!IsRunning()) {
        return async::failedFuture<JSONValue>(ToolHostError(ErrorCategory::NotRunning,
            std::format("{}: cannot call {}: server is not running", pImpl->config.id, name)));
    }
    return pImpl->sendRequest(Methods::CallTool, BuildCallToolParams(name, arguments));
}

const std::string& ProviderClient::ServerId() const { return pImpl->config.id; }
ServerStatus ProviderClient::GetStatus() const { return pImpl->getStatus(); }
bool ProviderClient::IsRunning() const { return pImpl->getStatus() == ServerStatus::Running; }
std::vector<Tool> ProviderClient::GetTools() const { return pImpl->getTools(); }

std::optional<ServerCapabilities> ProviderClient::GetCapabilities() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->capabilities;
}

std::optional<std::string> ProviderClient::GetLastError() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->lastError;
}

std::size_t ProviderClient::GetPendingRequestCount() const {
    std::lock_guard<std::mutex> lk(pImpl->requestMutex);
    return pImpl->pendingRequests.size();
}

std::optional<std::chrono::system_clock::time_point> ProviderClient::GetLastActivity() const {
    std::lock_guard<std::mutex> lk(pImpl->stateMutex);
    return pImpl->lastActivity;
}

void ProviderClient::SetToolsChangedHandler(ToolsChangedHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->toolsHandler = std::move(handler);
}

void ProviderClient::SetStatusHandler(StatusHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->statusHandler = std::move(handler);
}

} // namespace toolhost
