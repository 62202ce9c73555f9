//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SettingsStore.cpp
// Purpose: Settings document load/save
//==========================================================================================================

#include <filesystem>
#include <fstream>
#include <sstream>
#include <system_error>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/SettingsStore.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::ErrorCategory;
using errors::ToolHostError;

namespace fs = std::filesystem;

namespace {
constexpr const char* kNestedKey = "mcp";
constexpr const char* kServersKey = "mcpServers";
} // namespace

SettingsStore::SettingsStore(std::string p) : path(std::move(p)) {}

std::string SettingsStore::DefaultPath() {
    const std::string explicitPath = GetEnvOrDefault("TOOLHOST_SETTINGS_PATH", "");
    if (!explicitPath.empty()) {
        return explicitPath;
    }
    const std::string home = GetEnvOrDefault("HOME", ".");
    return (fs::path(home) / ".toolhost" / "settings.json").string();
}

SettingsDocument SettingsStore::Load() const {
    FUNC_SCOPE();
    SettingsDocument doc;
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        LOG_INFO("Settings: {} does not exist; starting with no servers", path);
        return doc;
    }

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        throw ToolHostError(ErrorCategory::ConfigLoadError, "Cannot open settings file " + path);
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    const std::string text = buf.str();

    JSONValue root;
    try {
        // An empty file is treated as an empty document
        root = text.find_first_not_of(" \t\r\n") == std::string::npos ? JSONValue(JSONValue::Object{}) : ParseJSON(text);
    } catch (const std::exception& e) {
        throw ToolHostError(ErrorCategory::ConfigLoadError, std::format("Malformed settings file {}: {}", path, e.what()));
    }
    if (!root.isObject()) {
        throw ToolHostError(ErrorCategory::ConfigLoadError, std::format("Settings file {} is not a JSON object", path));
    }

    const JSONValue* servers = nullptr;
    if (const JSONValue* bare = root.find(kServersKey)) {
        servers = bare;
        doc.layout = SettingsLayout::Bare;
    } else if (const JSONValue* nested = root.find(kNestedKey)) {
        servers = nested->find(kServersKey);
        doc.layout = SettingsLayout::Nested;
    }
    doc.root = std::move(root);
    if (!servers) {
        return doc;
    }
    const auto* obj = std::get_if<JSONValue::Object>(&servers->value);
    if (!obj) {
        throw ToolHostError(ErrorCategory::ConfigLoadError, std::format("Settings file {}: mcpServers is not an object", path));
    }
    for (const auto& [id, entry] : *obj) {
        try {
            doc.servers.emplace(id, ServerConfigFromJSON(id, entry ? *entry : JSONValue{}));
        } catch (const ToolHostError& e) {
            LOG_WARN("Settings: skipping server {}: {}", id, e.what());
            doc.skipped.push_back(e.what());
            doc.unparsed.emplace(id, entry ? *entry : JSONValue{});
        }
    }
    LOG_INFO("Settings: loaded {} server(s) from {}", doc.servers.size(), path);
    return doc;
}

void SettingsStore::Save(const SettingsDocument& doc) const {
    FUNC_SCOPE();
    JSONValue::Object servers;
    for (const auto& [id, cfg] : doc.servers) {
        SetMember(servers, id, ServerConfigToJSON(cfg));
    }
    for (const auto& [id, raw] : doc.unparsed) {
        if (doc.servers.count(id) == 0) {
            SetMember(servers, id, raw);
        }
    }

    JSONValue root = doc.root.isObject() ? doc.root : JSONValue(JSONValue::Object{});
    auto& rootObj = std::get<JSONValue::Object>(root.value);
    if (doc.layout == SettingsLayout::Bare) {
        SetMember(rootObj, kServersKey, JSONValue(std::move(servers)));
    } else {
        JSONValue::Object nested;
        auto it = rootObj.find(kNestedKey);
        if (it != rootObj.end() && it->second && it->second->isObject()) {
            nested = std::get<JSONValue::Object>(it->second->value);
        }
        SetMember(nested, kServersKey, JSONValue(std::move(servers)));
        SetMember(rootObj, kNestedKey, JSONValue(std::move(nested)));
    }

    const fs::path target(path);
    std::error_code ec;
    if (target.has_parent_path()) {
        fs::create_directories(target.parent_path(), ec);
        if (ec) {
            throw ToolHostError(ErrorCategory::ConfigLoadError,
                std::format("Cannot create {}: {}", target.parent_path().string(), ec.message()));
        }
    }
    const fs::path tmp = target.string() + ".tmp";
    {
        std::ofstream out(tmp, std::ios::binary | std::ios::trunc);
        if (!out) {
            throw ToolHostError(ErrorCategory::ConfigLoadError, "Cannot write settings file " + tmp.string());
        }
        out << SerializeJSONPretty(root);
        out.flush();
        if (!out) {
            throw ToolHostError(ErrorCategory::ConfigLoadError, "Short write to settings file " + tmp.string());
        }
    }
    fs::rename(tmp, target, ec);
    if (ec) {
        fs::remove(tmp, ec);
        throw ToolHostError(ErrorCategory::ConfigLoadError, std::format("Cannot replace settings file {}", path));
    }
    LOG_DEBUG("Settings: saved {} server(s) to {}", doc.servers.size(), path);
}

std::optional<std::string> SettingsStore::Backup() const {
    std::error_code ec;
    if (!fs::exists(path, ec)) {
        return std::nullopt;
    }
    const std::string backup = path + ".bak";
    fs::copy_file(path, backup, fs::copy_options::overwrite_existing, ec);
    if (ec) {
        LOG_WARN("Settings: cannot back up {}: {}", path, ec.message());
        return std::nullopt;
    }
    return backup;
}

} // namespace toolhost
