//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_process_channel.cpp
// Purpose: ProcessChannel and ProviderClient against a real child process (tests/fake_provider)
//==========================================================================================================

#include <gtest/gtest.h>
#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <string>
#include <vector>

#include "ScriptedProvider.h"
#include "toolhost/ProcessChannel.hpp"
#include "toolhost/ProviderClient.h"
#include "toolhost/errors/Errors.h"

#ifndef TOOLHOST_FAKE_PROVIDER_PATH
#error "TOOLHOST_FAKE_PROVIDER_PATH must name the fake_provider executable"
#endif

using namespace toolhost;
using namespace toolhost::testing;
using toolhost::errors::ErrorCategory;
using namespace std::chrono_literals;

namespace {

ServerConfig fakeConfig(const std::string& mode, double timeoutSeconds = 5.0) {
    ServerConfig cfg;
    cfg.id = "fake-" + mode;
    cfg.command = TOOLHOST_FAKE_PROVIDER_PATH;
    cfg.args = {"--mode=" + mode};
    cfg.timeoutSeconds = timeoutSeconds;
    return cfg;
}

ProviderClient::Options options() {
    ProviderClient::Options o;
    o.toolsRetryDelay = 100ms;
    o.stopGrace = 300ms;
    return o;
}

} // namespace

TEST(ProcessChannel, MissingCommandFailsStartWithSpawnError) {
    ChannelSpec spec;
    spec.label = "missing";
    spec.command = "/nonexistent/toolhost-provider";
    ProcessChannel ch(spec);
    auto fut = ch.Start();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::SpawnError);
    EXPECT_FALSE(ch.IsOpen());
}

TEST(ProcessChannel, EchoesLinesAndReportsExit) {
    ChannelSpec spec;
    spec.label = "cat";
    spec.command = "/bin/cat";
    ProcessChannel ch(spec);

    std::mutex m;
    std::vector<std::string> lines;
    std::promise<ExitInfo> exited;
    ch.SetLineHandler([&](std::string&& l) {
        std::lock_guard<std::mutex> lk(m);
        lines.push_back(std::move(l));
    });
    ch.SetExitHandler([&](const ExitInfo& info) { exited.set_value(info); });
    ch.Start().get();
    EXPECT_TRUE(ch.IsOpen());
    EXPECT_GT(ch.Pid(), 0);
    EXPECT_TRUE(ch.WriteLine("{\"a\":1}"));
    EXPECT_TRUE(ch.WriteLine("second\n"));
    ASSERT_TRUE(WaitUntil([&]() {
        std::lock_guard<std::mutex> lk(m);
        return lines.size() == 2;
    }));
    {
        std::lock_guard<std::mutex> lk(m);
        EXPECT_EQ(lines[0], "{\"a\":1}");
        EXPECT_EQ(lines[1], "second");
    }
    ch.Close().get();
    auto exitFut = exited.get_future();
    ASSERT_EQ(exitFut.wait_for(2s), std::future_status::ready);
    EXPECT_TRUE(exitFut.get().requested);
    EXPECT_FALSE(ch.WriteLine("late"));
}

TEST(ProcessChannel, CloseIsBoundedForChildIgnoringStdin) {
    ChannelSpec spec;
    spec.label = "sleeper";
    spec.command = "/bin/sh";
    spec.args = {"-c", "trap '' TERM; sleep 30"};
    spec.stopGrace = 200ms;
    ProcessChannel ch(spec);
    ch.Start().get();
    const auto begin = std::chrono::steady_clock::now();
    ch.Close().get();
    EXPECT_LT(std::chrono::steady_clock::now() - begin, 5s);
    EXPECT_FALSE(ch.IsOpen());
}

TEST(ProcessChannel, EnvironmentOverlayReachesChild) {
    ChannelSpec spec;
    spec.label = "env";
    spec.command = "/bin/sh";
    spec.args = {"-c", "echo \"$TOOLHOST_TEST_VALUE\""};
    spec.env = {{"TOOLHOST_TEST_VALUE", "overlay-ok"}};
    ProcessChannel ch(spec);
    std::promise<std::string> first;
    std::atomic<bool> got{false};
    ch.SetLineHandler([&](std::string&& l) {
        if (!got.exchange(true)) first.set_value(l);
    });
    ch.Start().get();
    auto fut = first.get_future();
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get(), "overlay-ok");
    ch.Close().get();
}

TEST(ProcessProvider, FullSessionAgainstFakeProvider) {
    ProviderClient client(fakeConfig("normal"), std::make_shared<ProcessChannelFactory>(), options());
    ASSERT_NO_THROW(client.Start().get());
    EXPECT_TRUE(client.IsRunning());

    auto tools = client.GetTools();
    ASSERT_FALSE(tools.empty());
    EXPECT_EQ(tools[0].name, "ping");

    JSONValue::Object args;
    SetMember(args, "message", JSONValue(std::string("hello")));
    JSONValue result = client.CallTool("echo", JSONValue(args)).get();
    const auto& items = std::get<JSONValue::Array>(result.find("content")->value);
    EXPECT_EQ(GetStringMember(*items[0], "text").value_or(""), "hello");

    client.Stop().get();
    EXPECT_EQ(client.GetStatus(), ServerStatus::Stopped);
}

TEST(ProcessProvider, ProviderCrashDuringHandshakeCarriesStderr) {
    ProviderClient client(fakeConfig("crash"), std::make_shared<ProcessChannelFactory>(), options());
    auto fut = client.Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    try {
        fut.get();
        FAIL() << "expected start failure";
    } catch (const errors::ToolHostError& e) {
        EXPECT_EQ(e.category(), ErrorCategory::HandshakeProtocolError);
    }
    EXPECT_EQ(client.GetStatus(), ServerStatus::Error);
    ASSERT_TRUE(client.GetLastError().has_value());
    EXPECT_NE(client.GetLastError()->find("missing configuration"), std::string::npos);
}

TEST(ProcessProvider, CrashWhileRunningRejectsInFlightCall) {
    ProviderClient client(fakeConfig("normal"), std::make_shared<ProcessChannelFactory>(), options());
    client.Start().get();
    auto fut = client.CallTool("crash", JSONValue(JSONValue::Object{}));
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::ServerExited);
    ASSERT_TRUE(WaitUntil([&]() { return client.GetStatus() == ServerStatus::Error; }));
    EXPECT_NE(client.GetLastError().value_or("").find("exit code 5"), std::string::npos);
}

TEST(ProcessProvider, SilentProviderTimesOutHandshake) {
    ProviderClient client(fakeConfig("silent", 0.3), std::make_shared<ProcessChannelFactory>(), options());
    auto fut = client.Start();
    ASSERT_EQ(fut.wait_for(5s), std::future_status::ready);
    EXPECT_EQ(FailureCategory(fut), ErrorCategory::HandshakeTimeout);
}

TEST(ProcessProvider, ToolAddedAtRuntimeAppearsAfterListChanged) {
    ProviderClient client(fakeConfig("normal"), std::make_shared<ProcessChannelFactory>(), options());
    client.Start().get();
    const auto before = client.GetTools().size();
    client.CallTool("grow", JSONValue(JSONValue::Object{})).get();
    ASSERT_TRUE(WaitUntil([&]() { return client.GetTools().size() == before + 1; }));
    EXPECT_EQ(client.GetTools().back().name, "extra");
}

TEST(ProcessChannel, ConcurrentCloseJoinsOnce) {
    ChannelSpec spec;
    spec.label = "cat-close";
    spec.command = "/bin/cat";
    spec.stopGrace = 200ms;
    ProcessChannel ch(spec);
    ch.Start().get();
    auto a = std::async(std::launch::async, [&]() { ch.Close().get(); });
    auto b = std::async(std::launch::async, [&]() { ch.Close().get(); });
    ASSERT_EQ(a.wait_for(5s), std::future_status::ready);
    ASSERT_EQ(b.wait_for(5s), std::future_status::ready);
    EXPECT_NO_THROW(a.get());
    EXPECT_NO_THROW(b.get());
    EXPECT_FALSE(ch.IsOpen());
}
