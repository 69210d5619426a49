//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_registry.cpp
// Purpose: ConnectionRegistry end-to-end over in-memory servers (lifecycle, tools, executions, logs, events)
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/ConnectionRegistry.h"
#include "mcplink/Protocol.h"
#include "mcplink/transports/InMemoryTransport.hpp"
#include <chrono>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {

ServerDescriptor sseDescriptor(const std::string& id) {
    ServerDescriptor d;
    d.id = id;
    d.name = "Server " + id;
    d.transport = TransportKind::PushStream;
    d.endpoint = "https://x/sse";
    d.heartbeatInterval = 0ms;
    d.requestTimeout = 2000ms;
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

template <typename T>
errors::ErrorKind failureKind(std::future<T>& fut) {
    try {
        fut.get();
    } catch (const errors::ClientError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "future did not fail with ClientError";
    return errors::ErrorKind::InvalidMessage;
}

std::string headerValue(const std::vector<auth::HeaderKV>& headers, const std::string& name) {
    for (const auto& h : headers) {
        if (h.name == name) {
            return h.value;
        }
    }
    return "";
}

class RegistryTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = InMemoryServer::Create("registry-peer");
        server->AddTool("echo", "Echo arguments back", [](const JSONValue& args) { return args; });
        registry = std::make_unique<ConnectionRegistry>(std::make_shared<InMemoryTransportFactory>(server));
        registry->Events().Subscribe([this](const RegistryEvent& ev) {
            std::lock_guard<std::mutex> lk(mutex);
            events.push_back(ev);
        });
    }

    void TearDown() override {
        registry.reset();
    }

    std::size_t countEvents(RegistryEventKind kind) {
        std::lock_guard<std::mutex> lk(mutex);
        std::size_t n = 0;
        for (const auto& ev : events) {
            if (ev.kind == kind) {
                ++n;
            }
        }
        return n;
    }

    std::shared_ptr<InMemoryServer> server;
    std::unique_ptr<ConnectionRegistry> registry;
    std::mutex mutex;
    std::vector<RegistryEvent> events;
};

} // namespace

////////////////////////////////////////// End to end //////////////////////////////////////////

TEST_F(RegistryTest, ConnectListAndExecute) {
    registry->AddServer(sseDescriptor("s1"));
    ServerStatus st = registry->GetServerStatus("s1");
    EXPECT_EQ(st.state, ConnectionState::Disconnected);
    EXPECT_EQ(st.endpoint, "https://x/sse");
    EXPECT_EQ(st.name, "Server s1");

    auto connected = registry->ConnectServer("s1");
    ASSERT_EQ(connected.wait_for(3s), std::future_status::ready);
    ASSERT_NO_THROW(connected.get());
    st = registry->GetServerStatus("s1");
    EXPECT_EQ(st.state, ConnectionState::Connected);
    ASSERT_TRUE(st.initializeResult.has_value());
    EXPECT_EQ(st.initializeResult->serverInfo.name, "registry-peer");

    auto toolsFut = registry->ListTools("s1");
    ASSERT_EQ(toolsFut.wait_for(2s), std::future_status::ready);
    auto tools = toolsFut.get();
    ASSERT_EQ(tools.size(), 1u);
    EXPECT_EQ(tools[0].name, "echo");
    EXPECT_EQ(registry->GetCachedTools("s1").size(), 1u);
    EXPECT_EQ(registry->GetServerStatus("s1").toolCount, 1u);
    EXPECT_EQ(countEvents(RegistryEventKind::ToolsUpdated), 1u);

    const JSONValue args = MakeObject({{"msg", JSONValue("hi")}});
    auto execFut = registry->ExecuteTool("s1", "echo", args);
    ASSERT_EQ(execFut.wait_for(3s), std::future_status::ready);
    ToolExecution exec = execFut.get();
    EXPECT_EQ(exec.status, ExecutionStatus::Completed);
    ASSERT_TRUE(exec.result.has_value());
    EXPECT_EQ(*exec.result, args);
    ASSERT_TRUE(exec.endTime.has_value());
    EXPECT_GT(*exec.endTime, exec.startTime);

    ASSERT_TRUE(waitUntil([&]() { return countEvents(RegistryEventKind::ExecutionCompleted) == 1u; }));
    EXPECT_EQ(countEvents(RegistryEventKind::ExecutionStarted), 1u);
    auto stored = registry->GetExecution(exec.id);
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored->status, ExecutionStatus::Completed);

    registry->DisconnectServer("s1").get();
    EXPECT_EQ(registry->GetServerStatus("s1").state, ConnectionState::Disconnected);
    EXPECT_TRUE(registry->GetCachedTools("s1").empty());
}

TEST_F(RegistryTest, ProtocolTrafficIsLogged) {
    registry->AddServer(sseDescriptor("s1"));
    registry->ConnectServer("s1").get();

    auto logs = registry->GetLogs(std::string("s1"));
    bool sentInitialize = false;
    bool sawStateChange = false;
    for (const auto& e : logs) {
        if (e.direction && *e.direction == LogDirection::Sent && e.message.find("\"initialize\"") != std::string::npos) {
            sentInitialize = true;
        }
        if (e.message.find("handshaking -> connected") != std::string::npos) {
            sawStateChange = true;
        }
    }
    EXPECT_TRUE(sentInitialize);
    EXPECT_TRUE(sawStateChange);
    for (std::size_t i = 1; i < logs.size(); ++i) {
        EXPECT_LT(logs[i - 1].id, logs[i].id);
    }
    EXPECT_EQ(registry->GetLogs(std::string("s1"), 3).size(), 3u);
    EXPECT_GT(countEvents(RegistryEventKind::LogAppended), 0u);

    registry->DisconnectServer("s1").get();
    const std::size_t before = registry->GetLogs(std::string("s1")).size();
    EXPECT_EQ(registry->ClearLogs(std::string("s1")), before);
    EXPECT_TRUE(registry->GetLogs(std::string("s1")).empty());
    EXPECT_EQ(countEvents(RegistryEventKind::LogsCleared), 1u);
}

////////////////////////////////////////// Registration //////////////////////////////////////////

TEST_F(RegistryTest, RegistrationErrors) {
    registry->AddServer(sseDescriptor("s1"));
    try {
        registry->AddServer(sseDescriptor("s1"));
        FAIL() << "expected DuplicateServer";
    } catch (const errors::ClientError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::DuplicateServer);
    }

    ServerDescriptor noEndpoint = sseDescriptor("s2");
    noEndpoint.endpoint.clear();
    EXPECT_THROW(registry->AddServer(noEndpoint), std::invalid_argument);

    try {
        (void)registry->GetServerStatus("ghost");
        FAIL() << "expected ServerNotFound";
    } catch (const errors::ClientError& e) {
        EXPECT_EQ(e.kind(), errors::ErrorKind::ServerNotFound);
    }
    auto connect = registry->ConnectServer("ghost");
    EXPECT_EQ(failureKind(connect), errors::ErrorKind::ServerNotFound);
    auto exec = registry->ExecuteTool("ghost", "echo", JSONValue{JSONValue::Object{}});
    EXPECT_EQ(failureKind(exec), errors::ErrorKind::ServerNotFound);
    EXPECT_THROW(registry->UpdateServerAuth("ghost", AuthConfig{}), errors::ClientError);
    EXPECT_EQ(registry->GetConnection("ghost"), nullptr);

    EXPECT_EQ(registry->GetAllServers().size(), 1u);
}

TEST_F(RegistryTest, ServersKeepRegistrationOrderAndRemove) {
    registry->AddServer(sseDescriptor("b"));
    registry->AddServer(sseDescriptor("a"));
    registry->AddServer(sseDescriptor("c"));
    auto all = registry->GetAllServers();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, "b");
    EXPECT_EQ(all[1].id, "a");
    EXPECT_EQ(all[2].id, "c");
    EXPECT_EQ(countEvents(RegistryEventKind::ServerAdded), 3u);

    registry->ConnectServer("a").get();
    auto removed = registry->RemoveServer("a");
    ASSERT_EQ(removed.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(countEvents(RegistryEventKind::ServerRemoved), 1u);
    all = registry->GetAllServers();
    ASSERT_EQ(all.size(), 2u);
    EXPECT_EQ(all[1].id, "c");

    auto again = registry->RemoveServer("a");
    EXPECT_EQ(failureKind(again), errors::ErrorKind::ServerNotFound);
}

TEST_F(RegistryTest, UpdateAuthAppliesOnNextConnect) {
    ServerDescriptor d = sseDescriptor("s1");
    d.auth.mode = AuthMode::Bearer;
    d.auth.accessToken = "old-token";
    registry->AddServer(d);
    registry->ConnectServer("s1").get();
    ASSERT_FALSE(server->ReceivedHeaders().empty());
    EXPECT_EQ(headerValue(server->ReceivedHeaders().back(), "Authorization"), "Bearer old-token");

    AuthConfig fresh;
    fresh.mode = AuthMode::Bearer;
    fresh.accessToken = "new-token";
    registry->UpdateServerAuth("s1", fresh);
    EXPECT_EQ(registry->GetServerStatus("s1").state, ConnectionState::Connected);
    EXPECT_EQ(server->StartCount(), 1u);

    registry->DisconnectServer("s1").get();
    registry->ConnectServer("s1").get();
    EXPECT_EQ(headerValue(server->ReceivedHeaders().back(), "Authorization"), "Bearer new-token");
    EXPECT_EQ(registry->GetConnection("s1")->Descriptor()->auth.accessToken, "new-token");
}

TEST_F(RegistryTest, ExhaustedServerReportsLastError) {
    server->SetAcceptConnections(false);
    registry->AddServer(sseDescriptor("s1"));
    auto fut = registry->ConnectServer("s1");
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(failureKind(fut), errors::ErrorKind::TransportLost);

    ServerStatus st = registry->GetServerStatus("s1");
    EXPECT_EQ(st.state, ConnectionState::Error);
    ASSERT_TRUE(st.lastError.has_value());
    EXPECT_EQ(*st.lastError, errors::ErrorKind::ReconnectExhausted);

    bool sawFatal = false;
    {
        std::lock_guard<std::mutex> lk(mutex);
        for (const auto& ev : events) {
            if (ev.kind == RegistryEventKind::ServerNotification && ev.notification &&
                ev.notification->kind == ConnectionEventKind::Fatal) {
                sawFatal = true;
            }
        }
    }
    EXPECT_TRUE(sawFatal);

    server->SetAcceptConnections(true);
    registry->ConnectServer("s1").get();
    EXPECT_FALSE(registry->GetServerStatus("s1").lastError.has_value());
}

////////////////////////////////////////// Tools and executions //////////////////////////////////////////

TEST_F(RegistryTest, ToolListChangeRefreshesAutomatically) {
    registry->AddServer(sseDescriptor("s1"));
    registry->ConnectServer("s1").get();
    registry->ListTools("s1").get();
    ASSERT_EQ(registry->GetCachedTools("s1").size(), 1u);

    server->AddTool("reverse", "Reverse a string", [](const JSONValue& args) { return args; });
    ASSERT_TRUE(server->PushNotification(Methods::ToolListChanged));

    ASSERT_TRUE(waitUntil([&]() { return countEvents(RegistryEventKind::ToolsUpdated) == 2u; }));
    EXPECT_EQ(registry->GetCachedTools("s1").size(), 2u);
    std::lock_guard<std::mutex> lk(mutex);
    const RegistryEvent* last = nullptr;
    for (const auto& ev : events) {
        if (ev.kind == RegistryEventKind::ToolsUpdated) {
            last = &ev;
        }
    }
    ASSERT_NE(last, nullptr);
    ASSERT_TRUE(last->tools.has_value());
    EXPECT_EQ(last->tools->size(), 2u);
}

TEST_F(RegistryTest, ListToolsRequiresConnection) {
    registry->AddServer(sseDescriptor("s1"));
    auto fut = registry->ListTools("s1");
    EXPECT_EQ(failureKind(fut), errors::ErrorKind::NotConnected);
}

TEST_F(RegistryTest, ExecutionHistoryIsMostRecentFirst) {
    registry->AddServer(sseDescriptor("s1"));
    registry->AddServer(sseDescriptor("s2"));
    registry->ConnectServer("s1").get();
    registry->ConnectServer("s2").get();

    std::vector<std::string> ids;
    for (const std::string& sid : {"s1", "s2", "s1"}) {
        ToolExecution e = registry->ExecuteTool(sid, "echo", MakeObject({{"from", JSONValue(sid)}})).get();
        ids.push_back(e.id);
    }
    ASSERT_TRUE(waitUntil([&]() { return countEvents(RegistryEventKind::ExecutionCompleted) == 3u; }));

    auto all = registry->GetExecutions();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].id, ids[2]);
    EXPECT_EQ(all[2].id, ids[0]);
    EXPECT_EQ(registry->GetExecutions(1).size(), 1u);
    EXPECT_EQ(registry->GetServerExecutions("s1").size(), 2u);
    EXPECT_EQ(registry->GetServerExecutions("s2").size(), 1u);
    for (const auto& e : all) {
        EXPECT_TRUE(e.IsTerminal());
    }
}

TEST_F(RegistryTest, CancelExecutionThroughRegistry) {
    server->On(Methods::CallTool, [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> { return nullptr; });
    registry->AddServer(sseDescriptor("s1"));
    registry->ConnectServer("s1").get();

    auto fut = registry->ExecuteTool("s1", "echo", JSONValue{JSONValue::Object{}});
    auto running = registry->GetExecutions(1);
    ASSERT_EQ(running.size(), 1u);
    EXPECT_TRUE(registry->CancelExecution(running[0].id));
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(fut.get().status, ExecutionStatus::Cancelled);
    EXPECT_FALSE(registry->CancelExecution("exec-unknown"));
}

////////////////////////////////////////// Resources, prompts, logging //////////////////////////////////////////

TEST_F(RegistryTest, ResourcePromptAndLoggingHelpers) {
    server->On(Methods::ListResources, [](const JSONRPCRequest& req) {
        JSONValue::Array arr;
        arr.push_back(std::make_shared<JSONValue>(MakeObject({
            {"uri", JSONValue("file:///notes.txt")}, {"name", JSONValue("notes")}, {"mimeType", JSONValue("text/plain")}})));
        return std::make_unique<JSONRPCResponse>(req.id, MakeObject({{"resources", JSONValue(std::move(arr))}}));
    });
    server->On(Methods::ReadResource, [](const JSONRPCRequest& req) {
        return std::make_unique<JSONRPCResponse>(req.id, MakeObject({{"uri", JSONValue(
            GetString(req.params.value_or(JSONValue{}), "uri").value_or(""))}}));
    });
    server->On(Methods::ListPrompts, [](const JSONRPCRequest& req) {
        JSONValue::Array arr;
        arr.push_back(std::make_shared<JSONValue>(MakeObject({
            {"name", JSONValue("summarize")}, {"description", JSONValue("Summarize text")}})));
        return std::make_unique<JSONRPCResponse>(req.id, MakeObject({
            {"prompts", JSONValue(std::move(arr))}, {"nextCursor", JSONValue("more")}}));
    });
    server->On(Methods::GetPrompt, [](const JSONRPCRequest& req) {
        return std::make_unique<JSONRPCResponse>(req.id, MakeObject({{"description", JSONValue("ok")}}));
    });
    server->On(Methods::SetLogLevel, [](const JSONRPCRequest& req) {
        return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
    });

    registry->AddServer(sseDescriptor("s1"));
    registry->ConnectServer("s1").get();

    ResourcesListResult resources = registry->ListResources("s1").get();
    ASSERT_EQ(resources.resources.size(), 1u);
    EXPECT_EQ(resources.resources[0].uri, "file:///notes.txt");
    ASSERT_TRUE(resources.resources[0].mimeType.has_value());
    EXPECT_EQ(*resources.resources[0].mimeType, "text/plain");

    JSONValue read = registry->ReadResource("s1", "file:///notes.txt").get();
    EXPECT_EQ(GetString(read, "uri").value_or(""), "file:///notes.txt");

    PromptsListResult prompts = registry->ListPrompts("s1").get();
    ASSERT_EQ(prompts.prompts.size(), 1u);
    EXPECT_EQ(prompts.prompts[0].name, "summarize");
    ASSERT_TRUE(prompts.nextCursor.has_value());
    EXPECT_EQ(*prompts.nextCursor, "more");

    JSONValue prompt = registry->GetPrompt("s1", "summarize", MakeObject({{"text", JSONValue("abc")}})).get();
    EXPECT_EQ(GetString(prompt, "description").value_or(""), "ok");

    EXPECT_NO_THROW(registry->SetServerLogLevel("s1", "warning").get());
    EXPECT_EQ(server->CountReceived(Methods::SetLogLevel), 1u);
}

TEST_F(RegistryTest, ServerLogMessagesReachTheRing) {
    registry->AddServer(sseDescriptor("s1"));
    registry->ConnectServer("s1").get();
    ASSERT_TRUE(server->PushNotification(Methods::Log, MakeObject({
        {"level", JSONValue("error")}, {"data", JSONValue("index corrupted")}})));

    ASSERT_TRUE(waitUntil([&]() {
        for (const auto& e : registry->GetLogs(std::string("s1"))) {
            if (e.message == "server: index corrupted") {
                return e.level == LogSeverity::Error;
            }
        }
        return false;
    }));
    EXPECT_GE(countEvents(RegistryEventKind::ServerNotification), 1u);
}

TEST(RegistryEventNames, AreStable) {
    EXPECT_STREQ(ToString(RegistryEventKind::ToolsUpdated), "toolsUpdated");
    EXPECT_STREQ(ToString(RegistryEventKind::LogsCleared), "logsCleared");
}
