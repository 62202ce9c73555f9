//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryChannel.cpp
// Purpose: In-memory line channel implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <mutex>
#include <optional>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <variant>

#include "logging/Logger.h"
#include "toolhost/InMemoryChannel.hpp"
#include "toolhost/async/FutureAwaitable.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

namespace {
struct LineEvent { std::string line; };
struct DiagnosticEvent { std::string line; };
struct ExitEvent { ExitInfo info; };
using ChannelEvent = std::variant<LineEvent, DiagnosticEvent, ExitEvent>;
} // namespace

class InMemoryChannel::Impl {
public:
    std::atomic<bool> open{false};
    std::string sessionId;
    std::weak_ptr<Impl> peer;
    std::optional<std::string> startFailure;

    std::mutex handlerMutex;
    ILineChannel::LineHandler lineHandler;
    ILineChannel::DiagnosticHandler diagnosticHandler;
    ILineChannel::ExitHandler exitHandler;

    std::deque<ChannelEvent> eventQueue;
    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::mutex threadMutex;
    std::jthread processingThread;

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    ~Impl() {
        stopProcessing();
    }

    // Concurrent callers each take the thread out under threadMutex, so only one of them joins it
    void stopProcessing() {
        std::jthread worker;
        {
            std::lock_guard<std::mutex> lk(threadMutex);
            worker = std::move(processingThread);
        }
        if (!worker.joinable()) return;
        worker.request_stop();
        queueCondition.notify_all();
        if (worker.get_id() == std::this_thread::get_id()) {
            // Stopping from one of our own handlers: the loop exits after the current event
            worker.detach();
            return;
        }
        worker.join();
    }

    void startProcessing() {
        std::lock_guard<std::mutex> lk(threadMutex);
        processingThread = std::jthread([this](std::stop_token st) {
            while (!st.stop_requested()) {
                ChannelEvent ev;
                {
                    std::unique_lock<std::mutex> lock(queueMutex);
                    if (!queueCondition.wait(lock, st, [this]() { return !eventQueue.empty(); })) {
                        break;
                    }
                    ev = std::move(eventQueue.front());
                    eventQueue.pop_front();
                }
                deliver(std::move(ev));
            }
        });
    }

    void deliver(ChannelEvent&& ev) {
        if (auto* l = std::get_if<LineEvent>(&ev)) {
            ILineChannel::LineHandler h;
            { std::lock_guard<std::mutex> lk(handlerMutex); h = lineHandler; }
            if (!h) return;
            try { h(std::move(l->line)); }
            catch (const std::exception& e) { LOG_ERROR("InMemoryChannel[{}]: line handler threw: {}", sessionId, e.what()); }
        } else if (auto* d = std::get_if<DiagnosticEvent>(&ev)) {
            ILineChannel::DiagnosticHandler h;
            { std::lock_guard<std::mutex> lk(handlerMutex); h = diagnosticHandler; }
            if (!h) { LOG_INFO("[{} stderr] {}", sessionId, d->line); return; }
            try { h(d->line); }
            catch (const std::exception& e) { LOG_ERROR("InMemoryChannel[{}]: diagnostic handler threw: {}", sessionId, e.what()); }
        } else if (auto* x = std::get_if<ExitEvent>(&ev)) {
            open = false;
            ILineChannel::ExitHandler h;
            { std::lock_guard<std::mutex> lk(handlerMutex); h = exitHandler; }
            if (!h) return;
            try { h(x->info); }
            catch (const std::exception& e) { LOG_ERROR("InMemoryChannel[{}]: exit handler threw: {}", sessionId, e.what()); }
        }
    }

    void enqueue(ChannelEvent ev) {
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            eventQueue.push_back(std::move(ev));
        }
        queueCondition.notify_one();
    }

    bool sendToPeer(ChannelEvent ev) {
        auto p = peer.lock();
        if (!p || !p->open.load()) {
            LOG_DEBUG("InMemoryChannel[{}]: peer not connected; dropping event", sessionId);
            return false;
        }
        p->enqueue(std::move(ev));
        return true;
    }
};

InMemoryChannel::InMemoryChannel() : pImpl(std::make_shared<Impl>()) { FUNC_SCOPE(); }

InMemoryChannel::~InMemoryChannel() {
    FUNC_SCOPE();
    if (pImpl->open.load()) {
        Close().get();
    }
    pImpl->stopProcessing();
}

std::pair<std::unique_ptr<InMemoryChannel>, std::unique_ptr<InMemoryChannel>> InMemoryChannel::CreatePair() {
    FUNC_SCOPE();
    auto left = std::make_unique<InMemoryChannel>();
    auto right = std::make_unique<InMemoryChannel>();
    left->pImpl->peer = right->pImpl;
    right->pImpl->peer = left->pImpl;
    return std::make_pair(std::move(left), std::move(right));
}

std::future<void> InMemoryChannel::Start() {
    FUNC_SCOPE();
    if (pImpl->startFailure.has_value()) {
        std::string msg = std::move(*pImpl->startFailure);
        pImpl->startFailure.reset();
        return async::failedFuture<void>(errors::ToolHostError(errors::ErrorCategory::SpawnError, msg));
    }
    if (!pImpl->open.exchange(true)) {
        LOG_DEBUG("InMemoryChannel[{}]: started", pImpl->sessionId);
        pImpl->stopProcessing();
        pImpl->startProcessing();
    }
    return async::readyFuture();
}

std::future<void> InMemoryChannel::Close() {
    FUNC_SCOPE();
    if (pImpl->open.exchange(false)) {
        LOG_DEBUG("InMemoryChannel[{}]: closing", pImpl->sessionId);
        // The far side sees a clean exit, as a provider does when its stdin closes
        ExitInfo info;
        info.exitCode = 0;
        pImpl->sendToPeer(ExitEvent{info});
    }
    pImpl->stopProcessing();
    return async::readyFuture();
}

bool InMemoryChannel::IsOpen() const { return pImpl->open.load(); }

std::string InMemoryChannel::Describe() const { return pImpl->sessionId; }

bool InMemoryChannel::WriteLine(std::string line) {
    if (!pImpl->open.load()) {
        return false;
    }
    if (!line.empty() && line.back() == '\n') line.pop_back();
    return pImpl->sendToPeer(LineEvent{std::move(line)});
}

void InMemoryChannel::SetLineHandler(LineHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->lineHandler = std::move(handler);
}

void InMemoryChannel::SetDiagnosticHandler(DiagnosticHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->diagnosticHandler = std::move(handler);
}

void InMemoryChannel::SetExitHandler(ExitHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->exitHandler = std::move(handler);
}

void InMemoryChannel::EmitDiagnostic(const std::string& line) {
    (void)pImpl->sendToPeer(DiagnosticEvent{line});
}

void InMemoryChannel::SimulateExit(ExitInfo info) {
    FUNC_SCOPE();
    info.requested = false;
    (void)pImpl->sendToPeer(ExitEvent{info});
    pImpl->open = false;
    pImpl->stopProcessing();
}

void InMemoryChannel::FailNextStart(std::string message) {
    pImpl->startFailure = std::move(message);
}

} // namespace toolhost
