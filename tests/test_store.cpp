//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_store.cpp
// Purpose: ConnectionStore snapshot tracking of registry events and active-server selection
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/Store.h"
#include "mcplink/transports/InMemoryTransport.hpp"
#include <atomic>
#include <cstdlib>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <thread>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {

ServerDescriptor memoryServer(const std::string& id) {
    ServerDescriptor d;
    d.id = id;
    d.transport = TransportKind::InMemory;
    d.heartbeatInterval = 0ms;
    d.maxReconnectAttempts = 0;
    return d;
}

bool waitUntil(const std::function<bool()>& pred, std::chrono::milliseconds limit = 2000ms) {
    const auto deadline = std::chrono::steady_clock::now() + limit;
    while (std::chrono::steady_clock::now() < deadline) {
        if (pred()) {
            return true;
        }
        std::this_thread::sleep_for(5ms);
    }
    return pred();
}

} // namespace

TEST(ConnectionStore, SeedsFromExistingRegistry) {
    auto server = InMemoryServer::Create();
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server));
    registry.AddServer(memoryServer("pre"));

    ConnectionStore store(registry);
    StoreSnapshot snap = store.Snapshot();
    ASSERT_EQ(snap.servers.size(), 1u);
    EXPECT_EQ(snap.servers[0].id, "pre");
    EXPECT_FALSE(snap.activeServerId.has_value());
    EXPECT_FALSE(snap.logs.empty()); // "server added"
}

TEST(ConnectionStore, TracksServersToolsAndExecutions) {
    auto server = InMemoryServer::Create();
    server->AddTool("echo", "Echo", [](const JSONValue& args) { return args; });
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server));
    ConnectionStore store(registry);

    std::atomic<int> notifications{0};
    const SubscriptionId sub = store.Subscribe([&](const StoreSnapshot&) { ++notifications; });

    registry.AddServer(memoryServer("s1"));
    registry.ConnectServer("s1").get();
    StoreSnapshot snap = store.Snapshot();
    ASSERT_EQ(snap.servers.size(), 1u);
    EXPECT_EQ(snap.servers[0].state, ConnectionState::Connected);

    store.SetActiveServer(std::string("s1"));
    auto tools = store.RefreshTools().get();
    ASSERT_EQ(tools.size(), 1u);
    snap = store.Snapshot();
    ASSERT_EQ(snap.tools.count("s1"), 1u);
    EXPECT_EQ(snap.tools.at("s1").size(), 1u);
    EXPECT_EQ(snap.servers[0].toolCount, 1u);

    ToolExecution exec = registry.ExecuteTool("s1", "echo", MakeObject({{"x", JSONValue(true)}})).get();
    ASSERT_TRUE(waitUntil([&]() {
        auto s = store.Snapshot();
        return !s.executions.empty() && s.executions.front().status == ExecutionStatus::Completed;
    }));
    snap = store.Snapshot();
    ASSERT_EQ(snap.executions.size(), 1u);
    EXPECT_EQ(snap.executions.front().id, exec.id);

    EXPECT_GT(notifications.load(), 0);
    const uint64_t revision = snap.revision;
    EXPECT_GT(revision, 0u);

    registry.DisconnectServer("s1").get();
    snap = store.Snapshot();
    EXPECT_EQ(snap.servers[0].state, ConnectionState::Disconnected);
    EXPECT_EQ(snap.tools.count("s1"), 0u);
    EXPECT_GT(snap.revision, revision);

    EXPECT_TRUE(store.Unsubscribe(sub));
}

TEST(ConnectionStore, RemovingActiveServerClearsSelection) {
    auto server = InMemoryServer::Create();
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server));
    ConnectionStore store(registry);
    registry.AddServer(memoryServer("keep"));
    registry.AddServer(memoryServer("gone"));

    store.SetActiveServer(std::string("gone"));
    EXPECT_EQ(store.ActiveServer().value_or(""), "gone");
    registry.RemoveServer("gone").get();

    EXPECT_FALSE(store.ActiveServer().has_value());
    StoreSnapshot snap = store.Snapshot();
    ASSERT_EQ(snap.servers.size(), 1u);
    EXPECT_EQ(snap.servers[0].id, "keep");

    // removing a server that is not selected leaves the selection alone
    store.SetActiveServer(std::string("keep"));
    registry.AddServer(memoryServer("other"));
    registry.RemoveServer("other").get();
    EXPECT_EQ(store.ActiveServer().value_or(""), "keep");
}

TEST(ConnectionStore, SelectionRequiresKnownServer) {
    auto server = InMemoryServer::Create();
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server));
    ConnectionStore store(registry);
    EXPECT_THROW(store.SetActiveServer(std::string("missing")), errors::ClientError);
    EXPECT_NO_THROW(store.SetActiveServer(std::nullopt));

    auto fut = store.RefreshTools();
    try {
        fut.get();
        FAIL() << "expected ServerNotFound";
    } catch (const errors::ClientError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerNotFound);
    }
}

TEST(ConnectionStore, LogsFollowTheRing) {
    auto server = InMemoryServer::Create();
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server), nullptr, 4);
    ConnectionStore store(registry);
    registry.AddServer(memoryServer("s1"));
    registry.ConnectServer("s1").get();

    StoreSnapshot snap = store.Snapshot();
    EXPECT_EQ(snap.logs.size(), 4u); // capped by the ring
    registry.DisconnectServer("s1").get();
    registry.ClearLogs();
    EXPECT_TRUE(store.Snapshot().logs.empty());
}

TEST(ConnectionStore, ExecutionsAreBoundedLikeRegistryHistory) {
    ::setenv("MCPLINK_EXECUTION_LOG_CAPACITY", "3", 1);
    auto server = InMemoryServer::Create();
    server->AddTool("echo", "Echo", [](const JSONValue& args) { return args; });
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server));
    ::unsetenv("MCPLINK_EXECUTION_LOG_CAPACITY");
    ASSERT_EQ(registry.ExecutionHistoryCapacity(), 3u);

    ConnectionStore store(registry);
    registry.AddServer(memoryServer("s1"));
    registry.ConnectServer("s1").get();

    std::string lastId;
    for (int i = 0; i < 20; ++i) {
        lastId = registry.ExecuteTool("s1", "echo", MakeObject({{"n", JSONValue(static_cast<int64_t>(i))}})).get().id;
    }
    ASSERT_TRUE(waitUntil([&]() {
        auto s = store.Snapshot();
        return !s.executions.empty() && s.executions.front().id == lastId &&
               s.executions.front().status == ExecutionStatus::Completed;
    }));

    StoreSnapshot snap = store.Snapshot();
    const auto history = registry.GetExecutions();
    ASSERT_EQ(history.size(), 3u);
    ASSERT_EQ(snap.executions.size(), history.size());
    for (std::size_t i = 0; i < history.size(); ++i) {
        EXPECT_EQ(snap.executions[i].id, history[i].id);
    }
}

TEST(ConnectionStore, LogsAppendInOrderAndReloadOnClear) {
    auto server = InMemoryServer::Create();
    ConnectionRegistry registry(std::make_shared<InMemoryTransportFactory>(server), nullptr, 50);
    ConnectionStore store(registry);
    registry.AddServer(memoryServer("a"));
    registry.AddServer(memoryServer("b"));
    registry.ConnectServer("a").get();

    auto matchesRing = [&]() {
        const auto ring = registry.GetLogs();
        const auto logs = store.Snapshot().logs;
        if (logs.size() != ring.size()) {
            return false;
        }
        for (std::size_t i = 0; i < ring.size(); ++i) {
            if (logs[i].id != ring[i].id) {
                return false;
            }
        }
        return true;
    };
    EXPECT_TRUE(waitUntil(matchesRing));
    const auto logs = store.Snapshot().logs;
    ASSERT_FALSE(logs.empty());
    for (std::size_t i = 1; i < logs.size(); ++i) {
        EXPECT_LT(logs[i - 1].id, logs[i].id);
    }

    registry.ClearLogs(std::string("a"));
    ASSERT_FALSE(store.Snapshot().logs.empty()); // "b" keeps its entries
    for (const auto& e : store.Snapshot().logs) {
        EXPECT_NE(e.serverId, "a");
    }
    EXPECT_TRUE(waitUntil(matchesRing));
}
