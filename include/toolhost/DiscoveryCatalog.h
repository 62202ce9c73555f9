//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: DiscoveryCatalog.h
// Purpose: Candidate server configurations from a static catalog and local filesystem probing
//==========================================================================================================

#pragma once

#include <map>
#include <optional>
#include <string>
#include <vector>

#include "toolhost/ServerConfig.h"

namespace toolhost {

enum class DiscoverySource {
    PackageIndex, // launched through uvx
    Npm,          // launched through npx
    Local,        // executable found in a search directory
    Config        // listed in a servers.json file
};

const char* toString(DiscoverySource s);

struct DiscoveredServer {
    std::string id;
    std::string name;
    std::string description;
    std::string command;
    std::vector<std::string> args;
    ConnectionType connectionType{ConnectionType::Stdio};
    DiscoverySource source{DiscoverySource::Local};
    std::optional<std::string> url;
    std::map<std::string, std::string> env;
    std::vector<std::string> requirements;
    std::vector<std::string> tags;
};

struct DiscoveryResult {
    std::vector<DiscoveredServer> servers;
    std::vector<std::string> errors;
};

//==========================================================================================================
// DiscoveryCatalog
// Purpose: Produces candidates for ServerRegistry::AddServer. Contains no protocol logic.
// Notes:
//   - Well-known entries are offered only when their launcher (uvx, npx) is an executable on the search
//     PATH.
//   - Local scan: regular executable files whose name contains "mcp-server" or "mcp_server".
//   - Config files: { "servers": [ { name|id, command, args?, env?, description?, connectionType? } ] }.
//   - Results are de-duplicated by id; the first occurrence wins.
//==========================================================================================================
class DiscoveryCatalog {
public:
    struct Options {
        std::string pathVariable;                 // PATH-style list; defaults to $PATH
        std::vector<std::string> localDirectories; // defaults to ~/.local/bin, ~/bin, /usr/local/bin, /opt/homebrew/bin
        std::vector<std::string> configFiles;      // defaults to ~/.config/mcp/servers.json, ~/.mcp/servers.json, ./mcp-servers.json
    };

    DiscoveryCatalog();
    explicit DiscoveryCatalog(Options options);

    DiscoveryResult Discover() const;

    // Case-insensitive match on name, description or tags.
    std::vector<DiscoveredServer> Search(const std::string& query) const;
    std::vector<DiscoveredServer> ByTag(const std::string& tag) const;

    // Full path of an executable named command on the search PATH, if any. Paths containing '/' are
    // checked directly.
    std::optional<std::string> FindExecutable(const std::string& command) const;

    // The static catalog, regardless of which launchers are installed.
    static const std::vector<DiscoveredServer>& WellKnownServers();

private:
    Options opts;
};

// Converts a candidate to an enabled configuration with the same id.
ServerConfig ToServerConfig(const DiscoveredServer& server);

} // namespace toolhost
