//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_tool_execution.cpp
// Purpose: Tool execution records (timing, terminal status, cancellation, concurrency)
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/ToolExecution.h"
#include "mcplink/Protocol.h"
#include "mcplink/transports/InMemoryTransport.hpp"
#include <chrono>
#include <future>
#include <memory>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <vector>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {

class ToolExecutionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server = InMemoryServer::Create("tools");
        server->AddTool("echo", "Echo arguments back", [](const JSONValue& args) { return args; });
        server->AddTool("fail", "Reports a tool-level error", [](const JSONValue&) {
            JSONValue::Array content;
            content.push_back(std::make_shared<JSONValue>(
                MakeObject({{"type", JSONValue("text")}, {"text", JSONValue("bad input")}})));
            return MakeObject({{"content", JSONValue(std::move(content))}, {"isError", JSONValue(true)}});
        });
        auto d = std::make_shared<ServerDescriptor>();
        d->id = "tools";
        d->transport = TransportKind::InMemory;
        d->heartbeatInterval = 0ms;
        d->requestTimeout = 2000ms;
        d->maxReconnectAttempts = 0;
        scheduler = std::make_shared<Scheduler>();
        conn = Connection::Create(d, std::make_shared<InMemoryTransportFactory>(server), scheduler);
    }

    void TearDown() override {
        (void)conn->Disconnect().wait_for(2s);
    }

    static ToolExecution settle(std::future<ToolExecution>& fut) {
        EXPECT_EQ(fut.wait_for(3s), std::future_status::ready);
        return fut.get();
    }

    std::shared_ptr<InMemoryServer> server;
    std::shared_ptr<Scheduler> scheduler;
    std::shared_ptr<Connection> conn;
    ToolExecutionTracker tracker;
};

} // namespace

TEST_F(ToolExecutionTest, CompletedCarriesResultAndTiming) {
    conn->Connect().get();
    std::mutex mutex;
    std::vector<ExecutionEvent> events;
    tracker.Events().Subscribe([&](const ExecutionEvent& ev) {
        std::lock_guard<std::mutex> lk(mutex);
        events.push_back(ev);
    });

    const JSONValue args = MakeObject({{"msg", JSONValue("hi")}});
    auto fut = tracker.Execute(conn, "echo", args);
    ToolExecution exec = settle(fut);

    EXPECT_EQ(exec.status, ExecutionStatus::Completed);
    EXPECT_EQ(exec.serverId, "tools");
    EXPECT_EQ(exec.tool, "echo");
    EXPECT_EQ(exec.id.rfind("exec-", 0), 0u);
    EXPECT_FALSE(exec.requestId.empty());
    ASSERT_TRUE(exec.result.has_value());
    EXPECT_EQ(*exec.result, args);
    EXPECT_FALSE(exec.isError);
    EXPECT_FALSE(exec.error.has_value());
    ASSERT_TRUE(exec.endTime.has_value());
    EXPECT_GT(*exec.endTime, exec.startTime);
    ASSERT_TRUE(exec.durationMs.has_value());
    EXPECT_GE(*exec.durationMs, 0);
    EXPECT_TRUE(exec.IsTerminal());
    EXPECT_TRUE(tracker.Running().empty());

    std::lock_guard<std::mutex> lk(mutex);
    ASSERT_EQ(events.size(), 2u);
    EXPECT_EQ(events[0].kind, ExecutionEventKind::Started);
    EXPECT_EQ(events[0].execution.status, ExecutionStatus::Pending);
    EXPECT_EQ(events[1].kind, ExecutionEventKind::Completed);
    EXPECT_EQ(events[1].execution.status, ExecutionStatus::Completed);
    EXPECT_EQ(events[0].execution.id, exec.id);
}

TEST_F(ToolExecutionTest, ToolLevelErrorStillCompletes) {
    conn->Connect().get();
    auto fut = tracker.Execute(conn, "fail", JSONValue{JSONValue::Object{}});
    ToolExecution exec = settle(fut);
    EXPECT_EQ(exec.status, ExecutionStatus::Completed);
    EXPECT_TRUE(exec.isError);
    ASSERT_TRUE(exec.result.has_value());
    CallToolResult parsed = ParseCallToolResult(*exec.result);
    ASSERT_EQ(parsed.content.size(), 1u);
    EXPECT_EQ(GetString(parsed.content[0], "text").value_or(""), "bad input");
}

TEST_F(ToolExecutionTest, RemoteErrorFails) {
    conn->Connect().get();
    auto fut = tracker.Execute(conn, "no-such-tool", JSONValue{JSONValue::Object{}});
    ToolExecution exec = settle(fut);
    EXPECT_EQ(exec.status, ExecutionStatus::Failed);
    ASSERT_TRUE(exec.error.has_value());
    EXPECT_EQ(exec.error->kind, errors::ErrorKind::RemoteError);
    ASSERT_TRUE(exec.error->remote.has_value());
    EXPECT_EQ(exec.error->remote->code, JSONRPCErrorCodes::ToolNotFound);
    EXPECT_FALSE(exec.result.has_value());
    ASSERT_TRUE(exec.endTime.has_value());
    EXPECT_GT(*exec.endTime, exec.startTime);
}

TEST_F(ToolExecutionTest, NotConnectedFailsImmediately) {
    auto fut = tracker.Execute(conn, "echo", JSONValue{JSONValue::Object{}});
    ToolExecution exec = settle(fut);
    EXPECT_EQ(exec.status, ExecutionStatus::Failed);
    ASSERT_TRUE(exec.error.has_value());
    EXPECT_EQ(exec.error->kind, errors::ErrorKind::NotConnected);
    EXPECT_EQ(server->CountReceived(Methods::CallTool), 0u);
}

TEST_F(ToolExecutionTest, CancelRunningExecution) {
    server->On(Methods::CallTool, [](const JSONRPCRequest&) -> std::unique_ptr<JSONRPCResponse> { return nullptr; });
    conn->Connect().get();

    auto fut = tracker.Execute(conn, "echo", JSONValue{JSONValue::Object{}});
    auto running = tracker.Running();
    ASSERT_EQ(running.size(), 1u);
    EXPECT_EQ(running[0].status, ExecutionStatus::Running);
    const std::string execId = running[0].id;
    ASSERT_TRUE(tracker.GetRunning(execId).has_value());

    EXPECT_TRUE(tracker.Cancel(execId, "stop"));
    ToolExecution exec = settle(fut);
    EXPECT_EQ(exec.status, ExecutionStatus::Cancelled);
    ASSERT_TRUE(exec.error.has_value());
    EXPECT_EQ(exec.error->kind, errors::ErrorKind::Cancelled);
    EXPECT_FALSE(tracker.GetRunning(execId).has_value());
    EXPECT_FALSE(tracker.Cancel(execId));
    EXPECT_EQ(server->CountReceived(Methods::Cancelled), 1u);
}

TEST_F(ToolExecutionTest, ConcurrentExecutionsAreIndependent) {
    conn->Connect().get();
    std::vector<std::future<ToolExecution>> futs;
    for (int i = 0; i < 8; ++i) {
        futs.push_back(tracker.Execute(conn, "echo", MakeObject({{"i", JSONValue(static_cast<int64_t>(i))}})));
    }
    std::set<std::string> ids;
    for (int i = 0; i < 8; ++i) {
        ToolExecution exec = settle(futs[i]);
        EXPECT_EQ(exec.status, ExecutionStatus::Completed);
        ASSERT_TRUE(exec.result.has_value());
        EXPECT_EQ(GetInt(*exec.result, "i").value_or(-1), i);
        ids.insert(exec.id);
    }
    EXPECT_EQ(ids.size(), 8u);
}

TEST(ExecutionStatus, Names) {
    EXPECT_STREQ(ToString(ExecutionStatus::Pending), "pending");
    EXPECT_STREQ(ToString(ExecutionStatus::Cancelled), "cancelled");
}
