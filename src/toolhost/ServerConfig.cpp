//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerConfig.cpp
// Purpose: Server configuration defaults, patching, validation and JSON mapping
//==========================================================================================================

#include <algorithm>
#include <cmath>
#include <limits>

#include "logging/Logger.h"
#include "toolhost/ServerConfig.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::ErrorCategory;
using errors::ToolHostError;

const char* toString(ConnectionType t) {
    switch (t) {
        case ConnectionType::Stdio: return "stdio";
        case ConnectionType::Sse: return "sse";
        case ConnectionType::Https: return "https";
    }
    return "stdio";
}

const char* toString(ServerStatus s) {
    switch (s) {
        case ServerStatus::Stopped: return "stopped";
        case ServerStatus::Starting: return "starting";
        case ServerStatus::Running: return "running";
        case ServerStatus::Error: return "error";
    }
    return "stopped";
}

std::optional<ConnectionType> connectionTypeFromString(const std::string& s) {
    std::string lower;
    lower.reserve(s.size());
    for (char c : s) lower.push_back(static_cast<char>(::tolower(static_cast<unsigned char>(c))));
    if (lower == "stdio") return ConnectionType::Stdio;
    if (lower == "sse") return ConnectionType::Sse;
    if (lower == "https" || lower == "http") return ConnectionType::Https;
    return std::nullopt;
}

std::chrono::milliseconds ServerConfig::RequestTimeout() const {
    double secs = kDefaultTimeoutSeconds;
    if (timeoutSeconds.has_value() && std::isfinite(*timeoutSeconds) && *timeoutSeconds > 0.0) {
        secs = std::min(*timeoutSeconds, kMaxTimeoutSeconds);
    }
    return std::chrono::milliseconds(static_cast<int64_t>(std::llround(secs * 1000.0)));
}

bool ServerConfig::AutoApproves(const std::string& toolName) const {
    return std::find(autoApprove.begin(), autoApprove.end(), toolName) != autoApprove.end();
}

ServerConfig ApplyPatch(const ServerConfig& base, const ServerConfigPatch& patch) {
    ServerConfig out = base;
    if (patch.name) out.name = *patch.name;
    if (patch.command) out.command = *patch.command;
    if (patch.args) out.args = *patch.args;
    if (patch.env) out.env = *patch.env;
    if (patch.connectionType) out.connectionType = *patch.connectionType;
    if (patch.url) out.url = *patch.url;
    if (patch.disabled) out.disabled = *patch.disabled;
    if (patch.autoApprove) out.autoApprove = *patch.autoApprove;
    if (patch.timeoutSeconds) out.timeoutSeconds = *patch.timeoutSeconds;
    if (patch.retryAttempts) out.retryAttempts = *patch.retryAttempts;
    return out;
}

void ValidateServerConfig(const ServerConfig& config) {
    if (config.id.empty()) {
        throw ToolHostError(ErrorCategory::InvalidConfig, "Server id must not be empty");
    }
    if (config.connectionType == ConnectionType::Stdio) {
        if (config.command.empty()) {
            throw ToolHostError(ErrorCategory::InvalidConfig,
                std::format("Server {} has no command", config.id));
        }
    } else if (!config.url.has_value() || config.url->empty()) {
        throw ToolHostError(ErrorCategory::InvalidConfig,
            std::format("Server {} uses connection type {} but has no url", config.id, toString(config.connectionType)));
    }
}

namespace {
std::vector<std::string> readStringArray(const JSONValue& entry, const std::string& key, const std::string& id) {
    std::vector<std::string> out;
    const JSONValue* v = entry.find(key);
    if (!v) return out;
    const auto* arr = std::get_if<JSONValue::Array>(&v->value);
    if (!arr) {
        LOG_WARN("Server {}: '{}' is not an array; ignoring", id, key);
        return out;
    }
    for (const auto& item : *arr) {
        if (item && item->isString()) {
            out.push_back(std::get<std::string>(item->value));
        }
    }
    return out;
}
} // namespace

ServerConfig ServerConfigFromJSON(const std::string& id, const JSONValue& entry) {
    if (!entry.isObject()) {
        throw ToolHostError(ErrorCategory::InvalidConfig, std::format("Server {}: entry is not an object", id));
    }
    ServerConfig cfg;
    cfg.id = id;
    cfg.name = GetStringMember(entry, "name").value_or(id);
    cfg.command = GetStringMember(entry, "command").value_or("");
    cfg.args = readStringArray(entry, "args", id);
    if (const JSONValue* env = entry.find("env")) {
        if (const auto* obj = std::get_if<JSONValue::Object>(&env->value)) {
            for (const auto& [k, v] : *obj) {
                if (v && v->isString()) cfg.env[k] = std::get<std::string>(v->value);
            }
        }
    }
    auto type = GetStringMember(entry, "type");
    if (!type) type = GetStringMember(entry, "connectionType");
    if (type) {
        auto parsed = connectionTypeFromString(*type);
        if (!parsed) {
            throw ToolHostError(ErrorCategory::InvalidConfig,
                std::format("Server {}: unknown connection type '{}'", id, *type));
        }
        cfg.connectionType = *parsed;
    }
    cfg.url = GetStringMember(entry, "url");
    cfg.disabled = GetBoolMember(entry, "disabled").value_or(false);
    cfg.autoApprove = readStringArray(entry, "autoApprove", id);
    if (auto t = GetNumberMember(entry, "timeout")) {
        cfg.timeoutSeconds = *t;
    }
    if (auto r = GetNumberMember(entry, "retryAttempts"); r && *r >= 0) {
        if (!(*r <= static_cast<double>(std::numeric_limits<int>::max()))) {
            throw ToolHostError(ErrorCategory::InvalidConfig,
                std::format("Server {}: retryAttempts {} is out of range", id, *r));
        }
        cfg.retryAttempts = static_cast<int>(*r);
    }
    return cfg;
}

JSONValue ServerConfigToJSON(const ServerConfig& config) {
    JSONValue::Object obj;
    if (!config.name.empty() && config.name != config.id) {
        SetMember(obj, "name", JSONValue(config.name));
    }
    if (!config.command.empty()) {
        SetMember(obj, "command", JSONValue(config.command));
    }
    JSONValue::Array args;
    for (const auto& a : config.args) args.push_back(std::make_shared<JSONValue>(a));
    SetMember(obj, "args", JSONValue(std::move(args)));
    JSONValue::Object env;
    for (const auto& [k, v] : config.env) SetMember(env, k, JSONValue(v));
    SetMember(obj, "env", JSONValue(std::move(env)));
    SetMember(obj, "type", JSONValue(toString(config.connectionType)));
    if (config.url) SetMember(obj, "url", JSONValue(*config.url));
    SetMember(obj, "disabled", JSONValue(config.disabled));
    JSONValue::Array approve;
    for (const auto& a : config.autoApprove) approve.push_back(std::make_shared<JSONValue>(a));
    SetMember(obj, "autoApprove", JSONValue(std::move(approve)));
    if (config.timeoutSeconds) {
        const double t = *config.timeoutSeconds;
        if (std::floor(t) == t && std::fabs(t) < 1e15) {
            SetMember(obj, "timeout", JSONValue(static_cast<int64_t>(t)));
        } else {
            SetMember(obj, "timeout", JSONValue(t));
        }
    }
    SetMember(obj, "retryAttempts", JSONValue(static_cast<int64_t>(config.retryAttempts)));
    return JSONValue(std::move(obj));
}

} // namespace toolhost
