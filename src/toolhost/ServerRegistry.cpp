//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerRegistry.cpp
// Purpose: Server registry implementation
//==========================================================================================================

#include <future>
#include <map>
#include <mutex>
#include <thread>
#include <utility>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "toolhost/ProcessChannel.hpp"
#include "toolhost/ProviderClient.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/SettingsStore.h"
#include "toolhost/async/FutureAwaitable.h"
#include "toolhost/async/Task.h"
#include "toolhost/errors/Errors.h"

namespace toolhost {

using errors::ErrorCategory;
using errors::ToolHostError;

const char* toString(LifecycleEventType t) {
    switch (t) {
        case LifecycleEventType::ServerAdded: return "server-added";
        case LifecycleEventType::ServerRemoved: return "server-removed";
        case LifecycleEventType::ServerUpdated: return "server-updated";
        case LifecycleEventType::StatusChanged: return "status-changed";
        case LifecycleEventType::ToolsChanged: return "tools-changed";
        case LifecycleEventType::Error: return "error";
    }
    return "unknown";
}

RegistryOptions RegistryOptions::FromEnvironment() {
    RegistryOptions o;
    o.settingsPath = SettingsStore::DefaultPath();
    o.restartSettleDelay = GetEnvMillisOrDefault("TOOLHOST_RESTART_SETTLE_MS", o.restartSettleDelay);
    o.toolsRetryDelay = GetEnvMillisOrDefault("TOOLHOST_TOOLS_RETRY_DELAY_MS", o.toolsRetryDelay);
    o.stopGrace = GetEnvMillisOrDefault("TOOLHOST_STOP_GRACE_MS", o.stopGrace);
    return o;
}

namespace {

ToolHostError notFound(const std::string& id) {
    return ToolHostError(ErrorCategory::ServerNotFound, "Server " + id + " not found");
}

} // namespace

class ServerRegistry::Impl : public std::enable_shared_from_this<ServerRegistry::Impl> {
public:
    struct Entry {
        ServerInstance instance;
        std::shared_ptr<ProviderClient> client; // stdio servers only; created on first start
        uint64_t generation{0};                 // changes whenever the client is replaced
        bool everStarted{false};
    };

    RegistryOptions options;
    SettingsStore store;

    mutable std::mutex mutex;
    std::map<std::string, Entry> entries;
    std::map<std::pair<std::string, std::string>, Tool> toolTable;
    JSONValue settingsRoot{JSONValue::Object{}};
    SettingsLayout layout{SettingsLayout::Nested};
    std::map<std::string, JSONValue> unparsedEntries; // entries this build cannot read, kept for write-back
    std::optional<std::string> configLoadError;
    bool backupBeforeSave{false};
    uint64_t nextGeneration{0};
    bool shuttingDown{false};

    std::mutex saveMutex;

    std::mutex listenerMutex;
    std::map<uint64_t, ServerRegistry::Listener> listeners;
    uint64_t nextListenerId{0};

    explicit Impl(RegistryOptions opts)
        : options(std::move(opts)),
          store(options.settingsPath.empty() ? SettingsStore::DefaultPath() : options.settingsPath) {
        if (!options.channelFactory) {
            options.channelFactory = std::make_shared<ProcessChannelFactory>();
        }
        if (!options.probe) {
            options.probe = std::make_shared<BeastReachabilityProbe>();
        }
    }

    ////////////////////////////////////////// events //////////////////////////////////////////

    void emit(const LifecycleEvent& ev) {
        std::vector<ServerRegistry::Listener> copy;
        {
            std::lock_guard<std::mutex> lk(listenerMutex);
            copy.reserve(listeners.size());
            for (const auto& [id, l] : listeners) copy.push_back(l);
        }
        for (auto& l : copy) {
            try {
                l(ev);
            } catch (const std::exception& e) {
                LOG_ERROR("Registry: listener threw on {} for {}: {}", toString(ev.type), ev.serverId, e.what());
            }
        }
    }

    // Snapshots the server's status and tool count, then notifies outside the lock.
    void emitFor(LifecycleEventType type, const std::string& id, std::optional<std::string> error = std::nullopt) {
        LifecycleEvent ev;
        ev.type = type;
        ev.serverId = id;
        ev.error = std::move(error);
        ev.timestamp = std::chrono::system_clock::now();
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it != entries.end()) {
                ev.status = it->second.instance.status;
                ev.toolCount = it->second.instance.tools.size();
            }
        }
        emit(ev);
    }

    ////////////////////////////////////////// client plumbing //////////////////////////////////////////

    // Called with the lock held; the constructor does not call back.
    std::shared_ptr<ProviderClient> makeClient(const ServerConfig& cfg, uint64_t gen) {
        ProviderClient::Options co;
        co.clientInfo = options.clientInfo;
        co.toolsRetryDelay = options.toolsRetryDelay;
        co.stopGrace = options.stopGrace;
        auto client = std::make_shared<ProviderClient>(cfg, options.channelFactory, co);
        std::weak_ptr<Impl> weak = weak_from_this();
        const std::string id = cfg.id;
        client->SetStatusHandler([weak, id, gen](ServerStatus s, const std::optional<std::string>& err) {
            if (auto self = weak.lock()) self->applyStatus(id, gen, s, err);
        });
        client->SetToolsChangedHandler([weak, id, gen](const std::vector<Tool>& tools) {
            if (auto self = weak.lock()) self->applyTools(id, gen, tools);
        });
        return client;
    }

    void applyStatus(const std::string& id, uint64_t gen, ServerStatus s, const std::optional<std::string>& err) {
        std::shared_ptr<ProviderClient> client;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it == entries.end() || it->second.generation != gen) return;
            client = it->second.client;
        }
        std::optional<ServerCapabilities> caps;
        if (s == ServerStatus::Running && client) {
            caps = client->GetCapabilities();
        }
        const auto now = std::chrono::system_clock::now();
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it == entries.end() || it->second.generation != gen) return;
            ServerInstance& inst = it->second.instance;
            inst.status = s;
            switch (s) {
                case ServerStatus::Starting:
                    inst.connection.lastError.reset();
                    break;
                case ServerStatus::Running:
                    inst.startedAt = now;
                    inst.lastError.reset();
                    inst.capabilities = caps;
                    inst.connection.connected = true;
                    inst.connection.lastPing = now;
                    inst.connection.lastError.reset();
                    break;
                case ServerStatus::Stopped:
                    inst.startedAt.reset();
                    inst.connection.connected = false;
                    break;
                case ServerStatus::Error:
                    if (err) inst.lastError = err;
                    inst.connection.connected = false;
                    inst.connection.lastError = err;
                    break;
            }
        }
        LOG_INFO("Registry: {} is {}", id, toString(s));
        emitFor(LifecycleEventType::StatusChanged, id, err);
        if (s == ServerStatus::Error) {
            emitFor(LifecycleEventType::Error, id, err);
        }
    }

    void applyTools(const std::string& id, uint64_t gen, const std::vector<Tool>& tools) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it == entries.end() || it->second.generation != gen) return;
            it->second.instance.tools = tools;
            it->second.instance.connection.lastPing = std::chrono::system_clock::now();
            eraseToolsLocked(id);
            for (const auto& t : tools) {
                toolTable[{id, t.name}] = t;
            }
        }
        LOG_DEBUG("Registry: {} now provides {} tool(s)", id, tools.size());
        emitFor(LifecycleEventType::ToolsChanged, id);
    }

    void eraseToolsLocked(const std::string& id) {
        for (auto it = toolTable.lower_bound({id, std::string()}); it != toolTable.end() && it->first.first == id;) {
            it = toolTable.erase(it);
        }
    }

    void noteError(const std::string& id, const std::string& message, bool notify = true) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it == entries.end()) return;
            it->second.instance.lastError = message;
        }
        if (notify) {
            emitFor(LifecycleEventType::Error, id, message);
        }
    }

    void markStarted(const std::string& id, uint64_t gen) {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = entries.find(id);
        if (it == entries.end() || it->second.generation != gen) return;
        if (it->second.everStarted) {
            ++it->second.instance.restartCount;
        }
        it->second.everStarted = true;
    }

    ////////////////////////////////////////// lifecycle //////////////////////////////////////////

    static async::Task<void> coStartServer(std::shared_ptr<Impl> self, std::string id) {
        std::shared_ptr<ProviderClient> client;
        ServerConfig cfg;
        uint64_t gen = 0;
        bool alreadyRunning = false;
        std::optional<ToolHostError> err;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            auto it = self->entries.find(id);
            if (it == self->entries.end()) throw notFound(id);
            if (self->shuttingDown) throw ToolHostError(ErrorCategory::ServerStopped, "Registry is shutting down");
            Entry& e = it->second;
            cfg = e.instance.config;
            gen = e.generation;
            if (cfg.disabled) throw ToolHostError(ErrorCategory::InvalidConfig, "Server " + id + " is disabled");
            if (e.instance.status == ServerStatus::Running) {
                alreadyRunning = true;
            } else {
                try {
                    ValidateServerConfig(cfg);
                } catch (const ToolHostError& ex) {
                    err = ex;
                    e.instance.status = ServerStatus::Error;
                    e.instance.lastError = ex.what();
                }
                if (!err && cfg.connectionType == ConnectionType::Stdio) {
                    if (!e.client) e.client = self->makeClient(cfg, gen);
                    client = e.client;
                }
            }
        }
        if (alreadyRunning) {
            LOG_DEBUG("Registry: {} is already running", id);
            co_return;
        }
        if (err) {
            LOG_ERROR("Registry: cannot start {}: {}", id, err->what());
            self->emitFor(LifecycleEventType::StatusChanged, id, std::string(err->what()));
            self->emitFor(LifecycleEventType::Error, id, std::string(err->what()));
            throw *err;
        }

        LOG_INFO("Registry: starting {} ({})", id, toString(cfg.connectionType));
        if (client) {
            try {
                co_await async::makeFutureAwaitable(client->Start());
            } catch (const ToolHostError& e) {
                err = e;
            } catch (const std::exception& e) {
                err = ToolHostError(ErrorCategory::TransportError, std::format("{}: {}", id, e.what()));
            }
        } else {
            // sse/https: a single reachability probe stands in for the connection
            self->applyStatus(id, gen, ServerStatus::Starting, std::nullopt);
            try {
                ProbeResult pr = co_await async::makeFutureAwaitable(self->options.probe->Probe(*cfg.url));
                LOG_INFO("Registry: {} reachable (HTTP {}, {} ms)", id, pr.statusCode, pr.latency.count());
            } catch (const ToolHostError& e) {
                err = e;
            } catch (const std::exception& e) {
                err = ToolHostError(ErrorCategory::ProbeError, std::format("{}: {}", id, e.what()));
            }
            self->applyStatus(id, gen, err ? ServerStatus::Error : ServerStatus::Running,
                              err ? std::optional<std::string>(err->what()) : std::nullopt);
        }
        if (err) {
            LOG_ERROR("Registry: failed to start {}: {}", id, err->what());
            // The client already reported the Error status; keep the start failure as lastError
            if (client) self->noteError(id, err->what(), false);
            throw *err;
        }
        self->markStarted(id, gen);
    }

    void stopServerSync(const std::string& id) {
        std::shared_ptr<ProviderClient> client;
        uint64_t gen = 0;
        ServerStatus st = ServerStatus::Stopped;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = entries.find(id);
            if (it == entries.end()) throw notFound(id);
            client = it->second.client;
            gen = it->second.generation;
            st = it->second.instance.status;
        }
        if (client) {
            client->Stop().get();
        } else if (st != ServerStatus::Stopped) {
            applyStatus(id, gen, ServerStatus::Stopped, std::nullopt);
        }
    }

    void restartServerSync(const std::string& id) {
        stopServerSync(id);
        std::this_thread::sleep_for(options.restartSettleDelay);
        coStartServer(shared_from_this(), id).toFuture().get();
    }

    std::vector<std::string> idsWhere(bool enabledAndNotRunningOnly) const {
        std::vector<std::string> ids;
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& [id, e] : entries) {
            if (enabledAndNotRunningOnly && (e.instance.config.disabled || e.instance.status == ServerStatus::Running)) {
                continue;
            }
            ids.push_back(id);
        }
        return ids;
    }

    static std::vector<ServerOperationResult> collect(std::vector<std::pair<std::string, std::future<void>>>& futs) {
        std::vector<ServerOperationResult> results;
        results.reserve(futs.size());
        for (auto& [id, f] : futs) {
            ServerOperationResult r;
            r.serverId = id;
            try {
                f.get();
                r.ok = true;
            } catch (const std::exception& e) {
                r.error = e.what();
            }
            results.push_back(std::move(r));
        }
        return results;
    }

    static async::Task<JSONValue> coCallTool(std::shared_ptr<Impl> self, std::shared_ptr<ProviderClient> client,
                                             std::string id, std::string toolName, JSONValue arguments) {
        std::optional<ToolHostError> err;
        JSONValue result;
        try {
            result = co_await async::makeFutureAwaitable(client->CallTool(toolName, arguments));
        } catch (const ToolHostError& e) {
            err = e;
        } catch (const std::exception& e) {
            err = ToolHostError(ErrorCategory::TransportError, std::format("{}: {}", id, e.what()));
        }
        if (err) {
            LOG_WARN("Registry: {}/{} failed: {}", id, toolName, err->what());
            self->noteError(id, err->what());
            throw *err;
        }
        co_return result;
    }

    ////////////////////////////////////////// settings //////////////////////////////////////////

    void saveConfig() {
        std::lock_guard<std::mutex> sl(saveMutex);
        SettingsDocument doc;
        bool backup = false;
        {
            std::lock_guard<std::mutex> lk(mutex);
            doc.root = settingsRoot;
            doc.layout = layout;
            doc.unparsed = unparsedEntries;
            for (const auto& [id, e] : entries) {
                doc.servers.emplace(id, e.instance.config);
            }
            backup = backupBeforeSave;
        }
        if (backup) {
            // The file on disk could not be read; keep it before replacing it
            if (auto path = store.Backup()) {
                LOG_WARN("Registry: unreadable settings file kept as {}", *path);
            }
        }
        store.Save(doc);
        std::lock_guard<std::mutex> lk(mutex);
        backupBeforeSave = false;
    }

    void persist(const char* what) {
        try {
            saveConfig();
        } catch (const ToolHostError& e) {
            LOG_ERROR("Registry: failed to persist after {}: {}", what, e.what());
            emitFor(LifecycleEventType::Error, std::string(), std::string(e.what()));
            throw;
        }
    }

    void shutdown() {
        {
            std::lock_guard<std::mutex> lk(listenerMutex);
            listeners.clear();
        }
        std::vector<std::shared_ptr<ProviderClient>> clients;
        {
            std::lock_guard<std::mutex> lk(mutex);
            shuttingDown = true;
            for (auto& [id, e] : entries) {
                if (e.client) clients.push_back(std::move(e.client));
                ++e.generation;
            }
            toolTable.clear();
        }
        for (auto& c : clients) {
            c->Stop().get();
        }
    }
};

ServerRegistry::ServerRegistry() : ServerRegistry(RegistryOptions::FromEnvironment()) {}

ServerRegistry::ServerRegistry(RegistryOptions options) : pImpl(std::make_shared<Impl>(std::move(options))) {
    FUNC_SCOPE();
}

ServerRegistry::~ServerRegistry() {
    FUNC_SCOPE();
    pImpl->shutdown();
}

void ServerRegistry::LoadConfig() {
    FUNC_SCOPE();
    SettingsDocument doc;
    std::optional<std::string> failure;
    try {
        doc = pImpl->store.Load();
    } catch (const ToolHostError& e) {
        failure = e.what();
        LOG_ERROR("Registry: {}; continuing with no servers", e.what());
    }

    std::map<std::string, Impl::Entry> previous;
    std::vector<std::string> loaded;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        previous.swap(pImpl->entries);
        pImpl->toolTable.clear();
        pImpl->configLoadError = failure;
        pImpl->backupBeforeSave = failure.has_value();
        pImpl->settingsRoot = failure ? JSONValue(JSONValue::Object{}) : doc.root;
        pImpl->layout = doc.layout;
        pImpl->unparsedEntries = std::move(doc.unparsed);
        for (auto& [id, cfg] : doc.servers) {
            Impl::Entry e;
            e.instance.config = cfg;
            e.instance.connection.type = cfg.connectionType;
            e.generation = ++pImpl->nextGeneration;
            pImpl->entries.emplace(id, std::move(e));
            loaded.push_back(id);
        }
    }
    // Clients of the previous set no longer match any generation, so their callbacks are ignored
    for (auto& [id, e] : previous) {
        if (e.client) e.client->Stop().get();
    }
    previous.clear();

    for (const auto& id : loaded) {
        pImpl->emitFor(LifecycleEventType::ServerAdded, id);
    }
    if (failure) {
        pImpl->emitFor(LifecycleEventType::Error, std::string(), failure);
    }
}

std::optional<std::string> ServerRegistry::GetConfigLoadError() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->configLoadError;
}

void ServerRegistry::SaveConfig() {
    FUNC_SCOPE();
    pImpl->saveConfig();
}

const std::string& ServerRegistry::SettingsPath() const {
    return pImpl->store.Path();
}

std::future<void> ServerRegistry::StartServer(const std::string& serverId) {
    FUNC_SCOPE();
    return Impl::coStartServer(pImpl, serverId).toFuture();
}

std::future<void> ServerRegistry::StopServer(const std::string& serverId) {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self, serverId]() { self->stopServerSync(serverId); });
}

std::future<void> ServerRegistry::RestartServer(const std::string& serverId) {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self, serverId]() { self->restartServerSync(serverId); });
}

std::future<std::vector<ServerOperationResult>> ServerRegistry::StartAllServers() {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self]() {
        std::vector<std::pair<std::string, std::future<void>>> futs;
        for (const auto& id : self->idsWhere(true)) {
            futs.emplace_back(id, Impl::coStartServer(self, id).toFuture());
        }
        auto results = Impl::collect(futs);
        for (const auto& r : results) {
            if (!r.ok) {
                LOG_WARN("Registry: {} did not start: {}", r.serverId, r.error.value_or(""));
            }
        }
        return results;
    });
}

std::future<std::vector<ServerOperationResult>> ServerRegistry::StopAllServers() {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self]() {
        std::vector<std::pair<std::string, std::future<void>>> futs;
        for (const auto& id : self->idsWhere(false)) {
            futs.emplace_back(id, std::async(std::launch::async, [self, id]() { self->stopServerSync(id); }));
        }
        return Impl::collect(futs);
    });
}

void ServerRegistry::AddServer(const ServerConfig& config) {
    FUNC_SCOPE();
    ValidateServerConfig(config);
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->entries.count(config.id) != 0) {
            throw ToolHostError(ErrorCategory::InvalidConfig, "Server " + config.id + " already exists");
        }
        Impl::Entry e;
        e.instance.config = config;
        if (e.instance.config.name.empty()) e.instance.config.name = config.id;
        e.instance.connection.type = config.connectionType;
        e.generation = ++pImpl->nextGeneration;
        pImpl->entries.emplace(config.id, std::move(e));
    }
    LOG_INFO("Registry: added {}", config.id);
    pImpl->emitFor(LifecycleEventType::ServerAdded, config.id);
    pImpl->persist("add");
}

std::future<void> ServerRegistry::RemoveServer(const std::string& serverId) {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self, serverId]() {
        self->stopServerSync(serverId);
        std::shared_ptr<ProviderClient> doomed;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            auto it = self->entries.find(serverId);
            if (it == self->entries.end()) throw notFound(serverId);
            doomed = std::move(it->second.client);
            self->eraseToolsLocked(serverId);
            self->entries.erase(it);
        }
        doomed.reset();
        LOG_INFO("Registry: removed {}", serverId);
        self->emitFor(LifecycleEventType::ServerRemoved, serverId);
        self->persist("remove");
    });
}

std::future<void> ServerRegistry::UpdateServer(const std::string& serverId, const ServerConfigPatch& patch) {
    FUNC_SCOPE();
    auto self = pImpl;
    return std::async(std::launch::async, [self, serverId, patch]() {
        ServerConfig updated;
        bool wasActive = false;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            auto it = self->entries.find(serverId);
            if (it == self->entries.end()) throw notFound(serverId);
            updated = ApplyPatch(it->second.instance.config, patch);
            const ServerStatus st = it->second.instance.status;
            wasActive = (st == ServerStatus::Running || st == ServerStatus::Starting);
        }
        ValidateServerConfig(updated);
        if (wasActive) {
            self->stopServerSync(serverId);
        }
        std::shared_ptr<ProviderClient> previous;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            auto it = self->entries.find(serverId);
            if (it == self->entries.end()) throw notFound(serverId);
            Impl::Entry& e = it->second;
            e.instance.config = updated;
            e.instance.connection.type = updated.connectionType;
            previous = std::move(e.client);
            e.generation = ++self->nextGeneration;
        }
        previous.reset();
        LOG_INFO("Registry: updated {}", serverId);
        self->emitFor(LifecycleEventType::ServerUpdated, serverId);
        self->persist("update");
        if (wasActive && !updated.disabled) {
            Impl::coStartServer(self, serverId).toFuture().get();
        }
    });
}

std::vector<AggregatedTool> ServerRegistry::GetAllTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<AggregatedTool> out;
    out.reserve(pImpl->toolTable.size());
    for (const auto& [key, tool] : pImpl->toolTable) {
        out.push_back(AggregatedTool{key.first, tool});
    }
    return out;
}

std::future<JSONValue> ServerRegistry::CallTool(const std::string& serverId, const std::string& toolName,
                                                const JSONValue& arguments) {
    FUNC_SCOPE();
    std::shared_ptr<ProviderClient> client;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->entries.find(serverId);
        if (it == pImpl->entries.end()) {
            return async::failedFuture<JSONValue>(notFound(serverId));
        }
        if (it->second.instance.status != ServerStatus::Running || !it->second.client) {
            return async::failedFuture<JSONValue>(ToolHostError(ErrorCategory::NotRunning, "Server " + serverId + " is not running"));
        }
        if (pImpl->toolTable.count({serverId, toolName}) == 0) {
            return async::failedFuture<JSONValue>(ToolHostError(ErrorCategory::ToolNotFound,
                "Tool " + toolName + " not found on server " + serverId));
        }
        client = it->second.client;
    }
    LOG_DEBUG("Registry: calling {}/{}", serverId, toolName);
    return Impl::coCallTool(pImpl, std::move(client), serverId, toolName, arguments).toFuture();
}

std::vector<ServerInstance> ServerRegistry::ListServers() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::vector<ServerInstance> out;
    out.reserve(pImpl->entries.size());
    for (const auto& [id, e] : pImpl->entries) out.push_back(e.instance);
    return out;
}

std::optional<ServerInstance> ServerRegistry::GetServer(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->entries.find(serverId);
    if (it == pImpl->entries.end()) return std::nullopt;
    return it->second.instance;
}

ServerStatus ServerRegistry::GetServerStatus(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->entries.find(serverId);
    return it == pImpl->entries.end() ? ServerStatus::Stopped : it->second.instance.status;
}

std::vector<Tool> ServerRegistry::GetServerTools(const std::string& serverId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->entries.find(serverId);
    if (it == pImpl->entries.end()) return {};
    return it->second.instance.tools;
}

ServerRegistry::Unsubscribe ServerRegistry::Subscribe(Listener listener) {
    uint64_t id = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->listenerMutex);
        id = ++pImpl->nextListenerId;
        pImpl->listeners.emplace(id, std::move(listener));
    }
    std::weak_ptr<Impl> weak = pImpl;
    return [weak, id]() {
        if (auto self = weak.lock()) {
            std::lock_guard<std::mutex> lk(self->listenerMutex);
            self->listeners.erase(id);
        }
    };
}

} // namespace toolhost
