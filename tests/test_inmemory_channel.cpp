//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_inmemory_channel.cpp
// Purpose: InMemoryChannel basic tests
//==========================================================================================================

#include <gtest/gtest.h>
#include "toolhost/InMemoryChannel.hpp"
#include "toolhost/errors/Errors.h"
#include "ScriptedProvider.h"
#include <future>
#include <chrono>
#include <mutex>
#include <vector>

using namespace toolhost;
using namespace toolhost::testing;

TEST(InMemoryChannel, LinesArriveInOrderWithoutTerminator) {
    auto pair = InMemoryChannel::CreatePair();
    auto left = std::move(pair.first);
    auto right = std::move(pair.second);

    std::mutex m;
    std::vector<std::string> got;
    right->SetLineHandler([&](std::string&& line) {
        std::lock_guard<std::mutex> lk(m);
        got.push_back(std::move(line));
    });
    left->Start().get();
    right->Start().get();

    EXPECT_TRUE(left->WriteLine("{\"n\":1}\n"));
    EXPECT_TRUE(left->WriteLine("{\"n\":2}"));
    ASSERT_TRUE(WaitUntil([&]() {
        std::lock_guard<std::mutex> lk(m);
        return got.size() == 2;
    }));
    {
        std::lock_guard<std::mutex> lk(m);
        EXPECT_EQ(got[0], "{\"n\":1}");
        EXPECT_EQ(got[1], "{\"n\":2}");
    }

    left->Close().get();
    right->Close().get();
}

TEST(InMemoryChannel, CloseReportsCleanExitToPeer) {
    auto pair = InMemoryChannel::CreatePair();
    auto left = std::move(pair.first);
    auto right = std::move(pair.second);
    std::promise<ExitInfo> exited;
    left->SetExitHandler([&](const ExitInfo& info) { exited.set_value(info); });
    left->Start().get();
    right->Start().get();

    right->Close().get();
    auto fut = exited.get_future();
    ASSERT_EQ(fut.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ExitInfo info = fut.get();
    EXPECT_TRUE(info.clean());
    EXPECT_EQ(info.describe(), "exit code 0");
    EXPECT_FALSE(left->IsOpen());

    // Writing to a closed peer fails
    EXPECT_FALSE(left->WriteLine("late"));
}

TEST(InMemoryChannel, DiagnosticsAndSimulatedExit) {
    auto pair = InMemoryChannel::CreatePair();
    auto host = std::move(pair.first);
    auto provider = std::move(pair.second);
    std::promise<std::string> diag;
    std::promise<ExitInfo> exited;
    host->SetDiagnosticHandler([&](const std::string& line) { diag.set_value(line); });
    host->SetExitHandler([&](const ExitInfo& info) { exited.set_value(info); });
    host->Start().get();
    provider->Start().get();

    provider->EmitDiagnostic("warming up");
    ExitInfo crash;
    crash.signal = 11;
    provider->SimulateExit(crash);

    EXPECT_EQ(diag.get_future().get(), "warming up");
    ExitInfo seen = exited.get_future().get();
    EXPECT_FALSE(seen.clean());
    EXPECT_FALSE(seen.requested);
    EXPECT_EQ(seen.describe(), "signal 11");
    host->Close().get();
}

TEST(InMemoryChannel, FailNextStartIsOneShot) {
    auto pair = InMemoryChannel::CreatePair();
    auto ch = std::move(pair.first);
    ch->FailNextStart("cannot launch provider");
    auto first = ch->Start();
    EXPECT_EQ(FailureCategory(first), errors::ErrorCategory::SpawnError);
    EXPECT_FALSE(ch->IsOpen());
    EXPECT_NO_THROW(ch->Start().get());
    EXPECT_TRUE(ch->IsOpen());
    ch->Close().get();
}

TEST(InMemoryChannel, ConcurrentCloseIsSafe) {
    auto pair = InMemoryChannel::CreatePair();
    auto left = std::move(pair.first);
    auto right = std::move(pair.second);
    left->Start().get();
    right->Start().get();
    auto a = std::async(std::launch::async, [&]() { left->Close().get(); });
    auto b = std::async(std::launch::async, [&]() { left->Close().get(); });
    ASSERT_EQ(a.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    ASSERT_EQ(b.wait_for(std::chrono::seconds(2)), std::future_status::ready);
    EXPECT_NO_THROW(a.get());
    EXPECT_NO_THROW(b.get());
    EXPECT_FALSE(left->IsOpen());
    right->Close().get();
}
