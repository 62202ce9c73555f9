//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_registry.cpp
// Purpose: ServerRegistry configuration, lifecycle, aggregate tool table, routing and events
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "ScriptedProvider.h"
#include "TempDir.h"
#include "toolhost/ServerRegistry.h"
#include "toolhost/errors/Errors.h"

using namespace toolhost;
using namespace toolhost::testing;
using toolhost::errors::ErrorCategory;
using namespace std::chrono_literals;

namespace {

class FakeProbe : public IReachabilityProbe {
public:
    std::atomic<bool> reachable{true};
    std::atomic<int> calls{0};

    std::future<ProbeResult> Probe(const std::string& url) override {
        ++calls;
        std::promise<ProbeResult> p;
        if (reachable) {
            p.set_value(ProbeResult{200, 3ms});
        } else {
            p.set_exception(std::make_exception_ptr(
                errors::ToolHostError(ErrorCategory::ProbeError, url + ": connection refused")));
        }
        return p.get_future();
    }
};

class EventLog {
public:
    void operator()(const LifecycleEvent& ev) {
        std::lock_guard<std::mutex> lk(mutex);
        events.push_back(ev);
    }
    std::size_t Count(LifecycleEventType type, const std::string& id) {
        std::lock_guard<std::mutex> lk(mutex);
        std::size_t n = 0;
        for (const auto& e : events) {
            if (e.type == type && e.serverId == id) ++n;
        }
        return n;
    }

private:
    std::mutex mutex;
    std::vector<LifecycleEvent> events;
};

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        factory = std::make_shared<ScriptedProviderFactory>();
        factory->configure = [](const ChannelSpec& spec, ScriptedProvider& p) {
            if (spec.label == "files") {
                p.tools = {Tool("read_file", "Reads a file"), Tool("list_dir", "Lists a directory")};
            } else if (spec.label == "silent") {
                p.answerInitialize = false;
            } else {
                p.tools = {Tool("ping", "Replies pong")};
            }
        };
        probe = std::make_shared<FakeProbe>();
    }

    RegistryOptions options() {
        RegistryOptions o;
        o.settingsPath = tmp.File("settings.json");
        o.clientInfo = Implementation("registry-tests", "0.0.1");
        o.channelFactory = factory;
        o.probe = probe;
        o.restartSettleDelay = 10ms;
        o.toolsRetryDelay = 50ms;
        o.stopGrace = 100ms;
        return o;
    }

    static ServerConfig stdio(const std::string& id, double timeoutSeconds = 2.0) {
        ServerConfig cfg;
        cfg.id = id;
        cfg.command = id + "-provider";
        cfg.timeoutSeconds = timeoutSeconds;
        return cfg;
    }

    TempDir tmp;
    std::shared_ptr<ScriptedProviderFactory> factory;
    std::shared_ptr<FakeProbe> probe;
};

} // namespace

TEST_F(RegistryTest, LoadConfigMaterializesEveryEntryAsStopped) {
    tmp.Write("settings.json", R"({"mcp":{"mcpServers":{
        "files": {"command": "files-provider"},
        "off": {"command": "off-provider", "disabled": true}
    }}})");
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.LoadConfig();

    EXPECT_FALSE(registry.GetConfigLoadError().has_value());
    auto servers = registry.ListServers();
    ASSERT_EQ(servers.size(), 2u);
    for (const auto& s : servers) {
        EXPECT_EQ(s.status, ServerStatus::Stopped);
        EXPECT_TRUE(s.tools.empty());
    }
    EXPECT_EQ(log.Count(LifecycleEventType::ServerAdded, "files"), 1u);
    EXPECT_EQ(log.Count(LifecycleEventType::ServerAdded, "off"), 1u);
    EXPECT_EQ(factory->Count(), 0u);
}

TEST_F(RegistryTest, MissingSettingsFileIsNotAnError) {
    ServerRegistry registry(options());
    registry.LoadConfig();
    EXPECT_FALSE(registry.GetConfigLoadError().has_value());
    EXPECT_TRUE(registry.ListServers().empty());
}

TEST_F(RegistryTest, MalformedSettingsFileIsReportedAndBackedUpBeforeOverwrite) {
    tmp.Write("settings.json", "{\"mcp\": {\"mcpServers\": ");
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.LoadConfig();

    ASSERT_TRUE(registry.GetConfigLoadError().has_value());
    EXPECT_TRUE(registry.ListServers().empty());
    EXPECT_EQ(log.Count(LifecycleEventType::Error, ""), 1u);

    registry.AddServer(stdio("files"));
    EXPECT_EQ(tmp.Read("settings.json.bak"), "{\"mcp\": {\"mcpServers\": ");
    JSONValue saved = ParseJSON(tmp.Read("settings.json"));
    ASSERT_NE(saved.find("mcp"), nullptr);
    EXPECT_NE(saved.find("mcp")->find("mcpServers")->find("files"), nullptr);
}

TEST_F(RegistryTest, StartPublishesToolsAndStopRemovesThem) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("files"));
    registry.AddServer(stdio("util"));

    ASSERT_NO_THROW(registry.StartServer("files").get());
    EXPECT_EQ(registry.GetServerStatus("files"), ServerStatus::Running);
    auto inst = registry.GetServer("files");
    ASSERT_TRUE(inst.has_value());
    EXPECT_TRUE(inst->startedAt.has_value());
    EXPECT_TRUE(inst->connection.connected);
    ASSERT_TRUE(inst->capabilities.has_value());
    EXPECT_EQ(inst->tools.size(), 2u);

    ASSERT_NO_THROW(registry.StartServer("util").get());
    auto all = registry.GetAllTools();
    ASSERT_EQ(all.size(), 3u);
    // Ordered by (serverId, tool name)
    EXPECT_EQ(all[0].serverId, "files");
    EXPECT_EQ(all[0].tool.name, "list_dir");
    EXPECT_EQ(all[1].tool.name, "read_file");
    EXPECT_EQ(all[2].serverId, "util");

    ASSERT_NO_THROW(registry.StopServer("files").get());
    EXPECT_EQ(registry.GetServerStatus("files"), ServerStatus::Stopped);
    EXPECT_TRUE(registry.GetServerTools("files").empty());
    all = registry.GetAllTools();
    ASSERT_EQ(all.size(), 1u);
    EXPECT_EQ(all[0].serverId, "util");
}

TEST_F(RegistryTest, StartAndStopAreIdempotent) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();
    registry.StartServer("util").get();
    EXPECT_EQ(factory->Count(), 1u);

    registry.StopServer("util").get();
    EXPECT_NO_THROW(registry.StopServer("util").get());
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Stopped);

    registry.StartServer("util").get();
    EXPECT_EQ(registry.GetServer("util")->restartCount, 1);
}

TEST_F(RegistryTest, RestartCreatesFreshSession) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();
    ASSERT_NO_THROW(registry.RestartServer("util").get());
    EXPECT_EQ(factory->Count(), 2u);
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
    EXPECT_EQ(registry.GetServer("util")->restartCount, 1);
}

TEST_F(RegistryTest, DisabledServerCannotStart) {
    ServerRegistry registry(options());
    ServerConfig cfg = stdio("off");
    cfg.disabled = true;
    registry.AddServer(cfg);
    auto fut = registry.StartServer("off");
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::InvalidConfig);
    EXPECT_EQ(factory->Count(), 0u);
    EXPECT_EQ(registry.GetServerStatus("off"), ServerStatus::Stopped);
}

TEST_F(RegistryTest, UnknownIdsFailWithServerNotFound) {
    ServerRegistry registry(options());
    auto start = registry.StartServer("ghost");
    EXPECT_EQ(FailureCategory(start), ErrorCategory::ServerNotFound);
    auto stop = registry.StopServer("ghost");
    EXPECT_EQ(FailureCategory(stop), ErrorCategory::ServerNotFound);
    auto remove = registry.RemoveServer("ghost");
    EXPECT_EQ(FailureCategory(remove), ErrorCategory::ServerNotFound);
    ServerConfigPatch patch;
    patch.disabled = true;
    auto update = registry.UpdateServer("ghost", patch);
    EXPECT_EQ(FailureCategory(update), ErrorCategory::ServerNotFound);
    auto call = registry.CallTool("ghost", "ping", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(FailureCategory(call), ErrorCategory::ServerNotFound);

    EXPECT_EQ(registry.GetServerStatus("ghost"), ServerStatus::Stopped);
    EXPECT_FALSE(registry.GetServer("ghost").has_value());
    EXPECT_TRUE(registry.GetServerTools("ghost").empty());
}

TEST_F(RegistryTest, AddServerRejectsDuplicatesAndIncompleteConfigs) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    try {
        registry.AddServer(stdio("util"));
        FAIL() << "expected InvalidConfig";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::InvalidConfig);
    }
    ServerConfig noCommand;
    noCommand.id = "broken";
    EXPECT_THROW(registry.AddServer(noCommand), errors::ToolHostError);
    EXPECT_EQ(registry.ListServers().size(), 1u);
    EXPECT_EQ(registry.GetServer("util")->config.name, "util");
}

TEST_F(RegistryTest, CallToolRoutesAndReportsFailures) {
    factory->configure = [](const ChannelSpec&, ScriptedProvider& p) {
        p.tools = {Tool("ping", "Replies pong"), Tool("explode", "Always fails")};
        p.script = [](ScriptedProvider& self, const Envelope& req) {
            if (*req.method != Methods::CallTool || !req.params) return false;
            if (GetStringMember(*req.params, "name").value_or("") != "explode") return false;
            self.Send(Envelope::Error(*req.id, ErrorObject(-32000, "kaboom")));
            return true;
        };
    };
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.AddServer(stdio("util"));

    auto notRunning = registry.CallTool("util", "ping", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(FailureCategory(notRunning), ErrorCategory::NotRunning);

    registry.StartServer("util").get();
    auto missing = registry.CallTool("util", "nope", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(FailureCategory(missing), ErrorCategory::ToolNotFound);

    JSONValue ok = registry.CallTool("util", "ping", JSONValue(JSONValue::Object{})).get();
    EXPECT_NE(ok.find("content"), nullptr);

    auto failed = registry.CallTool("util", "explode", JSONValue(JSONValue::Object{}));
    EXPECT_EQ(FailureCategory(failed), ErrorCategory::ProtocolError);
    EXPECT_NE(registry.GetServer("util")->lastError.value_or("").find("kaboom"), std::string::npos);
    EXPECT_EQ(log.Count(LifecycleEventType::Error, "util"), 1u);
    // A failed call does not take the server down
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
}

TEST_F(RegistryTest, StartAllIsolatesFailures) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("files"));
    registry.AddServer(stdio("silent", 0.2));
    ServerConfig off = stdio("off");
    off.disabled = true;
    registry.AddServer(off);

    auto results = registry.StartAllServers().get();
    ASSERT_EQ(results.size(), 2u);
    for (const auto& r : results) {
        if (r.serverId == "files") {
            EXPECT_TRUE(r.ok);
        } else {
            EXPECT_EQ(r.serverId, "silent");
            EXPECT_FALSE(r.ok);
            EXPECT_TRUE(r.error.has_value());
        }
    }
    EXPECT_EQ(registry.GetServerStatus("files"), ServerStatus::Running);
    EXPECT_EQ(registry.GetServerStatus("silent"), ServerStatus::Error);
    EXPECT_TRUE(registry.GetServer("silent")->lastError.has_value());
    EXPECT_EQ(registry.GetServerStatus("off"), ServerStatus::Stopped);

    auto stopped = registry.StopAllServers().get();
    EXPECT_EQ(stopped.size(), 3u);
    for (const auto& r : stopped) EXPECT_TRUE(r.ok);
    EXPECT_EQ(registry.GetServerStatus("files"), ServerStatus::Stopped);
    EXPECT_TRUE(registry.GetAllTools().empty());
}

TEST_F(RegistryTest, UpdateToDisabledStopsRunningServer) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();

    ServerConfigPatch patch;
    patch.disabled = true;
    ASSERT_NO_THROW(registry.UpdateServer("util", patch).get());
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Stopped);
    EXPECT_TRUE(registry.GetServer("util")->config.disabled);
    EXPECT_TRUE(registry.GetAllTools().empty());
    EXPECT_EQ(factory->Count(), 1u);

    ServerRegistry reloaded(options());
    reloaded.LoadConfig();
    ASSERT_TRUE(reloaded.GetServer("util").has_value());
    EXPECT_TRUE(reloaded.GetServer("util")->config.disabled);
}

TEST_F(RegistryTest, UpdateRunningServerRestartsWithNewConfig) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();

    ServerConfigPatch patch;
    patch.args = std::vector<std::string>{"--verbose"};
    ASSERT_NO_THROW(registry.UpdateServer("util", patch).get());
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
    auto created = factory->Created();
    ASSERT_EQ(created.size(), 2u);
    ASSERT_EQ(created[1].args.size(), 1u);
    EXPECT_EQ(created[1].args[0], "--verbose");
}

TEST_F(RegistryTest, UpdateRejectsInvalidResultWithoutTouchingServer) {
    ServerRegistry registry(options());
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();
    ServerConfigPatch patch;
    patch.command = std::string();
    auto fut = registry.UpdateServer("util", patch);
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::InvalidConfig);
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
    EXPECT_EQ(registry.GetServer("util")->config.command, "util-provider");
}

TEST_F(RegistryTest, RemoveServerStopsAndPersists) {
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.AddServer(stdio("util"));
    registry.AddServer(stdio("files"));
    registry.StartServer("util").get();

    ASSERT_NO_THROW(registry.RemoveServer("util").get());
    EXPECT_FALSE(registry.GetServer("util").has_value());
    EXPECT_EQ(log.Count(LifecycleEventType::ServerRemoved, "util"), 1u);
    for (const auto& t : registry.GetAllTools()) EXPECT_NE(t.serverId, "util");

    JSONValue saved = ParseJSON(tmp.Read("settings.json"));
    const JSONValue* servers = saved.find("mcp")->find("mcpServers");
    EXPECT_EQ(servers->find("util"), nullptr);
    EXPECT_NE(servers->find("files"), nullptr);
}

TEST_F(RegistryTest, SaveLoadRoundTripPreservesOtherSettings) {
    tmp.Write("settings.json", R"({"editor":{"fontSize":14},"mcp":{"mcpServers":{}}})");
    {
        ServerRegistry registry(options());
        registry.LoadConfig();
        ServerConfig cfg = stdio("util");
        cfg.autoApprove = {"ping"};
        cfg.env = {{"TOKEN", "abc"}};
        registry.AddServer(cfg);
    }
    JSONValue saved = ParseJSON(tmp.Read("settings.json"));
    ASSERT_NE(saved.find("editor"), nullptr);
    EXPECT_EQ(GetNumberMember(*saved.find("editor"), "fontSize").value_or(0), 14);

    ServerRegistry reloaded(options());
    reloaded.LoadConfig();
    auto inst = reloaded.GetServer("util");
    ASSERT_TRUE(inst.has_value());
    EXPECT_TRUE(inst->config.AutoApproves("ping"));
    EXPECT_EQ(inst->config.env.at("TOKEN"), "abc");
    EXPECT_EQ(inst->config.RequestTimeout().count(), 2000);
}

TEST_F(RegistryTest, ProviderCrashMarksErrorAndDropsTools) {
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();
    ASSERT_EQ(registry.GetAllTools().size(), 1u);

    ExitInfo info;
    info.signal = 9;
    factory->Last()->Endpoint().SimulateExit(info);

    ASSERT_TRUE(WaitUntil([&]() { return registry.GetServerStatus("util") == ServerStatus::Error; }));
    EXPECT_TRUE(WaitUntil([&]() { return registry.GetAllTools().empty(); }));
    EXPECT_NE(registry.GetServer("util")->lastError.value_or("").find("signal 9"), std::string::npos);
    EXPECT_FALSE(registry.GetServer("util")->connection.connected);
    EXPECT_GE(log.Count(LifecycleEventType::Error, "util"), 1u);

    // A crashed server can be started again
    ASSERT_NO_THROW(registry.StartServer("util").get());
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
}

TEST_F(RegistryTest, ListChangedUpdatesAggregateTable) {
    ServerRegistry registry(options());
    EventLog log;
    registry.Subscribe(std::ref(log));
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();

    auto provider = factory->Last();
    provider->tools.push_back(Tool("pong", "Replies ping"));
    provider->Send(Envelope::Notification(Methods::ToolListChanged));
    ASSERT_TRUE(WaitUntil([&]() { return registry.GetAllTools().size() == 2u; }));
    EXPECT_GE(log.Count(LifecycleEventType::ToolsChanged, "util"), 2u);
}

TEST_F(RegistryTest, RemoteServerIsProbedOnce) {
    ServerRegistry registry(options());
    ServerConfig remote;
    remote.id = "remote";
    remote.connectionType = ConnectionType::Https;
    remote.url = "https://tools.example.com/mcp";
    registry.AddServer(remote);

    ASSERT_NO_THROW(registry.StartServer("remote").get());
    EXPECT_EQ(registry.GetServerStatus("remote"), ServerStatus::Running);
    EXPECT_EQ(probe->calls.load(), 1);
    EXPECT_EQ(factory->Count(), 0u);
    EXPECT_TRUE(registry.GetServerTools("remote").empty());

    registry.StopServer("remote").get();
    EXPECT_EQ(registry.GetServerStatus("remote"), ServerStatus::Stopped);

    probe->reachable = false;
    auto fut = registry.StartServer("remote");
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::ProbeError);
    EXPECT_EQ(registry.GetServerStatus("remote"), ServerStatus::Error);
    EXPECT_EQ(probe->calls.load(), 2);
}

TEST_F(RegistryTest, UnsubscribeStopsDelivery) {
    ServerRegistry registry(options());
    std::atomic<int> seen{0};
    auto unsubscribe = registry.Subscribe([&](const LifecycleEvent&) { ++seen; });
    registry.AddServer(stdio("a"));
    const int before = seen.load();
    EXPECT_GE(before, 1);
    unsubscribe();
    registry.AddServer(stdio("b"));
    EXPECT_EQ(seen.load(), before);
}

TEST_F(RegistryTest, StatusEventsCarryServerState) {
    ServerRegistry registry(options());
    std::mutex m;
    std::vector<ServerStatus> statuses;
    registry.Subscribe([&](const LifecycleEvent& ev) {
        if (ev.type != LifecycleEventType::StatusChanged) return;
        std::lock_guard<std::mutex> lk(m);
        statuses.push_back(ev.status);
    });
    registry.AddServer(stdio("util"));
    registry.StartServer("util").get();
    registry.StopServer("util").get();
    std::lock_guard<std::mutex> lk(m);
    ASSERT_EQ(statuses.size(), 3u);
    EXPECT_EQ(statuses[0], ServerStatus::Starting);
    EXPECT_EQ(statuses[1], ServerStatus::Running);
    EXPECT_EQ(statuses[2], ServerStatus::Stopped);
}

TEST_F(RegistryTest, StopDuringHandshakeThenStartReachesRunning) {
    auto created = std::make_shared<std::atomic<int>>(0);
    factory->configure = [created](const ChannelSpec&, ScriptedProvider& p) {
        if ((*created)++ == 0) p.answerInitialize = false;
    };
    ServerRegistry registry(options());
    registry.AddServer(stdio("util", 30.0));
    auto first = registry.StartServer("util");
    ASSERT_TRUE(WaitUntil([&]() { return factory->Count() == 1u && !factory->Last()->ReceivedMethods().empty(); }));
    ASSERT_NO_THROW(registry.StopServer("util").get());
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(FailureCategory(first), ErrorCategory::ServerStopped);

    auto second = registry.StartServer("util");
    ASSERT_EQ(second.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(second.get());
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
    EXPECT_FALSE(registry.GetServer("util")->lastError.has_value());
}

TEST_F(RegistryTest, UpdateDuringHandshakeRestartsCleanly) {
    auto created = std::make_shared<std::atomic<int>>(0);
    factory->configure = [created](const ChannelSpec&, ScriptedProvider& p) {
        if ((*created)++ == 0) p.answerInitialize = false;
    };
    ServerRegistry registry(options());
    registry.AddServer(stdio("util", 30.0));
    auto first = registry.StartServer("util");
    ASSERT_TRUE(WaitUntil([&]() { return factory->Count() == 1u && !factory->Last()->ReceivedMethods().empty(); }));

    ServerConfigPatch patch;
    patch.args = std::vector<std::string>{"--fast"};
    auto update = registry.UpdateServer("util", patch);
    ASSERT_EQ(update.wait_for(3s), std::future_status::ready);
    EXPECT_NO_THROW(update.get());
    ASSERT_EQ(first.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(registry.GetServerStatus("util"), ServerStatus::Running);
    EXPECT_EQ(factory->Count(), 2u);
}

TEST_F(RegistryTest, UnreadableEntriesSurviveAddServer) {
    tmp.Write("settings.json", R"({"mcp":{"mcpServers":{
        "future": {"command": "x", "type": "websocket"}
    }}})");
    ServerRegistry registry(options());
    registry.LoadConfig();
    EXPECT_FALSE(registry.GetServer("future").has_value());
    registry.AddServer(stdio("util"));

    JSONValue saved = ParseJSON(tmp.Read("settings.json"));
    const JSONValue* servers = saved.find("mcp")->find("mcpServers");
    ASSERT_NE(servers, nullptr);
    EXPECT_NE(servers->find("util"), nullptr);
    const JSONValue* future = servers->find("future");
    ASSERT_NE(future, nullptr);
    EXPECT_EQ(GetStringMember(*future, "type").value_or(""), "websocket");
}
