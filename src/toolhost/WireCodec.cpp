//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WireCodec.cpp
// Purpose: Envelope codec and line buffering over the provider byte streams
//========================================================================================================

#include <cmath>
#include <stdexcept>
#include <string>

#include "logging/Logger.h"
#include "toolhost/WireCodec.h"

namespace toolhost {

Envelope Envelope::Request(int64_t id, std::string method, std::optional<JSONValue> params) {
    Envelope env;
    env.id = JSONRPCId{id};
    env.method = std::move(method);
    env.params = std::move(params);
    return env;
}

Envelope Envelope::Notification(std::string method, std::optional<JSONValue> params) {
    Envelope env;
    env.method = std::move(method);
    env.params = std::move(params);
    return env;
}

Envelope Envelope::Result(JSONRPCId id, JSONValue result) {
    Envelope env;
    env.id = std::move(id);
    env.result = std::move(result);
    return env;
}

Envelope Envelope::Error(JSONRPCId id, JSONValue error) {
    Envelope env;
    env.id = std::move(id);
    env.error = std::move(error);
    return env;
}

MessageKind ClassifyEnvelope(const Envelope& env) {
    if (env.id.has_value() && (env.result.has_value() || env.error.has_value())) {
        return MessageKind::Response;
    }
    if (env.method.has_value()) {
        return env.id.has_value() ? MessageKind::Request : MessageKind::Notification;
    }
    return MessageKind::Unknown;
}

std::string EncodeEnvelope(const Envelope& env) {
    JSONValue::Object obj;
    SetMember(obj, "jsonrpc", JSONValue(env.jsonrpc));
    if (env.id.has_value()) {
        std::visit([&](const auto& v) {
            using T = std::decay_t<decltype(v)>;
            if constexpr (std::is_same_v<T, std::nullptr_t>) {
                SetMember(obj, "id", JSONValue(nullptr));
            } else {
                SetMember(obj, "id", JSONValue(v));
            }
        }, *env.id);
    }
    if (env.method.has_value()) SetMember(obj, "method", JSONValue(*env.method));
    if (env.params.has_value()) SetMember(obj, "params", *env.params);
    if (env.result.has_value()) SetMember(obj, "result", *env.result);
    if (env.error.has_value()) SetMember(obj, "error", *env.error);
    std::string line = SerializeJSON(JSONValue(std::move(obj)));
    line.push_back('\n');
    return line;
}

DecodeResult DecodeLine(std::string_view line) {
    DecodeResult out;
    std::size_t start = 0;
    while (start < line.size() && (line[start] == ' ' || line[start] == '\t' || line[start] == '\r')) {
        ++start;
    }
    if (start >= line.size() || line[start] != '{') {
        out.outcome = DecodeOutcome::Foreign;
        return out;
    }

    JSONValue root;
    try {
        root = ParseJSON(std::string(line.substr(start)));
    } catch (const std::runtime_error& e) {
        out.outcome = DecodeOutcome::ParseError;
        out.error = e.what();
        return out;
    }

    Envelope& env = out.envelope;
    if (auto v = GetStringMember(root, "jsonrpc")) env.jsonrpc = *v;
    if (const JSONValue* id = root.find("id")) {
        if (const auto* n = std::get_if<int64_t>(&id->value)) {
            env.id = JSONRPCId{*n};
        } else if (const auto* s = std::get_if<std::string>(&id->value)) {
            env.id = JSONRPCId{*s};
        } else if (const auto* d = std::get_if<double>(&id->value)) {
            // Only whole numbers in int64 range name one of our requests; keep anything else by its text
            if (*d >= -9223372036854775808.0 && *d < 9223372036854775808.0 && std::trunc(*d) == *d) {
                env.id = JSONRPCId{static_cast<int64_t>(*d)};
            } else {
                env.id = JSONRPCId{SerializeJSON(*id)};
            }
        } else if (id->isNull()) {
            env.id = JSONRPCId{nullptr};
        }
    }
    if (auto m = GetStringMember(root, "method")) env.method = *m;
    if (const JSONValue* p = root.find("params")) env.params = *p;
    if (const JSONValue* r = root.find("result")) env.result = *r;
    if (const JSONValue* e = root.find("error")) env.error = *e;
    out.outcome = DecodeOutcome::Envelope;
    return out;
}

LineBuffer::LineBuffer(std::size_t maxLineBytes) : maxLineBytes_(maxLineBytes) {}

void LineBuffer::Append(std::string_view chunk, const LineSink& sink) {
    while (!chunk.empty()) {
        const std::size_t nl = chunk.find('\n');
        if (nl == std::string_view::npos) {
            if (!discarding_) {
                pending_.append(chunk.data(), chunk.size());
                if (pending_.size() > maxLineBytes_) {
                    LOG_WARN("LineBuffer: discarding line longer than {} bytes", maxLineBytes_);
                    pending_.clear();
                    discarding_ = true;
                    ++dropped_;
                }
            }
            return;
        }
        if (discarding_) {
            discarding_ = false;
        } else {
            pending_.append(chunk.data(), nl);
            if (!pending_.empty() && pending_.back() == '\r') pending_.pop_back();
            std::string line;
            line.swap(pending_);
            if (line.size() > maxLineBytes_) {
                LOG_WARN("LineBuffer: discarding line longer than {} bytes", maxLineBytes_);
                ++dropped_;
            } else {
                sink(std::move(line));
            }
        }
        chunk.remove_prefix(nl + 1);
    }
}

void LineBuffer::Flush(const LineSink& sink) {
    if (discarding_) {
        discarding_ = false;
        pending_.clear();
        return;
    }
    if (pending_.empty()) return;
    if (pending_.back() == '\r') pending_.pop_back();
    std::string line;
    line.swap(pending_);
    sink(std::move(line));
}

} // namespace toolhost
