//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: main.cpp
// Purpose: Command-line host: manages configured tool servers, lists their tools and invokes them
//==========================================================================================================

#include "logging/Logger.h"
#include "toolhost/DiscoveryCatalog.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/ToolBridge.h"
#include "toolhost/errors/Errors.h"
#include "toolhost/version.h"
#include <iostream>
#include <chrono>

using namespace toolhost;

//==========================================================================================================
// getArgValue
// Purpose: Parses key=value style CLI options.
// Args:
//   argc: Argument count
//   argv: Argument vector
//   key: Key string including leading dashes (e.g., "--settings")
// Returns:
//   Optional string containing the value when present
//==========================================================================================================
static std::optional<std::string> getArgValue(int argc, char** argv, const std::string& key) {
    for (size_t i = 1; i < static_cast<size_t>(argc); ++i) {
        std::string a = argv[i];
        auto eq = a.find('=');
        if (eq != std::string::npos && a.substr(0, eq) == key) {
            return a.substr(eq + 1);
        }
    }
    return std::nullopt;
}

// Positional arguments (anything not of the form --key=value).
static std::vector<std::string> positional(int argc, char** argv) {
    std::vector<std::string> out;
    for (int i = 1; i < argc; ++i) {
        std::string a = argv[i];
        if (a.rfind("--", 0) == 0 && a.find('=') != std::string::npos) continue;
        out.push_back(std::move(a));
    }
    return out;
}

static void usage() {
    std::cout << "toolhost " << getVersionString() << "\n"
              << "usage: toolhost_cli [--settings=PATH] <command> [args]\n"
              << "  list                         configured servers and their status\n"
              << "  tools [server]               start enabled servers and list their tools\n"
              << "  call <qualified-tool> [json] start the owning server and invoke a tool\n"
              << "  start|restart <server>       start a server and report the outcome\n"
              << "  add <id> <command> [args..]  add a stdio server\n"
              << "  remove <id>                  remove a server\n"
              << "  enable|disable <id>          toggle a server\n"
              << "  discover [query]             list candidate servers found on this machine\n"
              << "  adopt <discovered-id>        add a discovered server to the settings\n";
}

static int listServers(ServerRegistry& registry) {
    for (const auto& inst : registry.ListServers()) {
        std::cout << inst.config.id << "\t" << toString(inst.status) << "\t" << toString(inst.config.connectionType)
                  << (inst.config.disabled ? "\tdisabled" : "") << "\n";
    }
    return 0;
}

static int startAll(ServerRegistry& registry) {
    int failures = 0;
    for (const auto& r : registry.StartAllServers().get()) {
        if (!r.ok) {
            ++failures;
            std::cerr << r.serverId << ": " << r.error.value_or("unknown error") << "\n";
        }
    }
    return failures;
}

static int callTool(ServerRegistry& registry, const std::string& qualified, const std::string& argsText) {
    JSONValue args{JSONValue::Object{}};
    if (!argsText.empty()) {
        args = ParseJSON(argsText);
    }
    // Start only the owning server: "mcp_<id>_<tool>" with ids that may contain '_'.
    for (const auto& inst : registry.ListServers()) {
        const std::string prefix = "mcp_" + inst.config.id + "_";
        if (qualified.rfind(prefix, 0) == 0 && !inst.config.disabled) {
            registry.StartServer(inst.config.id).get();
        }
    }
    ToolBridge bridge(registry);
    auto tool = bridge.FindTool(qualified);
    if (!tool) {
        std::cerr << "No such tool: " << qualified << "\n";
        return 1;
    }
    auto result = tool->invoke(args).get();
    std::cout << result.content << "\n";
    return result.success ? 0 : 1;
}

static int run(ServerRegistry& registry, const std::vector<std::string>& pos) {
    const std::string& cmd = pos[0];
    auto arg = [&](std::size_t i) -> std::string { return i < pos.size() ? pos[i] : std::string(); };

    if (cmd == "list") {
        return listServers(registry);
    }
    if (cmd == "tools") {
        startAll(registry);
        ToolBridge bridge(registry);
        const std::string id = arg(1);
        std::cout << bridge.DescribeTools(id.empty() ? std::nullopt : std::optional<std::string>(id));
        return 0;
    }
    if (cmd == "call") {
        if (pos.size() < 2) { usage(); return 2; }
        return callTool(registry, arg(1), arg(2));
    }
    if (cmd == "start" || cmd == "restart") {
        if (pos.size() < 2) { usage(); return 2; }
        if (cmd == "start") {
            registry.StartServer(arg(1)).get();
        } else {
            registry.RestartServer(arg(1)).get();
        }
        ToolBridge bridge(registry);
        std::cout << bridge.DescribeServers();
        return 0;
    }
    if (cmd == "add") {
        if (pos.size() < 3) { usage(); return 2; }
        ServerConfig cfg;
        cfg.id = arg(1);
        cfg.name = arg(1);
        cfg.command = arg(2);
        cfg.args.assign(pos.begin() + 3, pos.end());
        registry.AddServer(cfg);
        return 0;
    }
    if (cmd == "remove") {
        if (pos.size() < 2) { usage(); return 2; }
        registry.RemoveServer(arg(1)).get();
        return 0;
    }
    if (cmd == "enable" || cmd == "disable") {
        if (pos.size() < 2) { usage(); return 2; }
        ServerConfigPatch patch;
        patch.disabled = (cmd == "disable");
        registry.UpdateServer(arg(1), patch).get();
        return 0;
    }
    if (cmd == "discover") {
        DiscoveryCatalog catalog;
        auto found = arg(1).empty() ? catalog.Discover().servers : catalog.Search(arg(1));
        for (const auto& d : found) {
            std::cout << d.id << "\t" << toString(d.source) << "\t" << d.name << " - " << d.description << "\n";
        }
        return 0;
    }
    if (cmd == "adopt") {
        if (pos.size() < 2) { usage(); return 2; }
        DiscoveryCatalog catalog;
        for (const auto& d : catalog.Discover().servers) {
            if (d.id == arg(1)) {
                registry.AddServer(ToServerConfig(d));
                return 0;
            }
        }
        std::cerr << "Not discovered: " << arg(1) << "\n";
        return 1;
    }
    usage();
    return 2;
}

int main(int argc, char** argv) {
    Logger::setLogLevel(LogLevel::LOG_WARN_LEVEL);
    Logger::configureFromEnv();
    FUNC_SCOPE();

    auto pos = positional(argc, argv);
    if (pos.empty()) {
        usage();
        return 2;
    }

    RegistryOptions opts = RegistryOptions::FromEnvironment();
    if (auto settings = getArgValue(argc, argv, "--settings")) {
        opts.settingsPath = *settings;
    }
    ServerRegistry registry(std::move(opts));
    registry.Subscribe([](const LifecycleEvent& ev) {
        LOG_INFO("{} {} {}", toString(ev.type), ev.serverId, ev.error.value_or(""));
    });
    registry.LoadConfig();
    if (auto err = registry.GetConfigLoadError()) {
        std::cerr << "Settings not loaded: " << *err << "\n";
    }

    int rc = 0;
    try {
        rc = run(registry, pos);
    } catch (const errors::ToolHostError& e) {
        std::cerr << errors::toString(e.category()) << ": " << e.what() << "\n";
        rc = 1;
    } catch (const std::exception& e) {
        std::cerr << e.what() << "\n";
        rc = 1;
    }
    registry.StopAllServers().get();
    return rc;
}
