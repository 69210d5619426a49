//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_pending_requests.cpp
// Purpose: At-most-once settlement of pending requests (resolve, reject, expire, drain)
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/PendingRequestTable.h"
#include "mcplink/Scheduler.h"
#include "mcplink/errors/Errors.h"
#include <atomic>
#include <chrono>
#include <future>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace mcplink;
using namespace std::chrono_literals;

namespace {
errors::ErrorKind kindOf(std::future<JSONValue>& fut) {
    try {
        (void)fut.get();
    } catch (const errors::ClientError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "future did not fail with ClientError";
    return errors::ErrorKind::InvalidMessage;
}
} // namespace

TEST(PendingRequestTable, ResolveBeforeDeadlineWins) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("1", 50ms, "tools/call");

    std::this_thread::sleep_for(10ms);
    ASSERT_TRUE(table.Resolve("1", MakeObject({{"value", JSONValue("first")}})));

    // Let the original deadline pass, then fire the deadline path by hand as well.
    std::this_thread::sleep_for(60ms);
    EXPECT_FALSE(table.Expire("1"));
    EXPECT_FALSE(table.Reject("1", std::make_exception_ptr(std::runtime_error("late"))));
    EXPECT_FALSE(table.Resolve("1", MakeObject({{"value", JSONValue("second")}})));

    ASSERT_EQ(fut.wait_for(0ms), std::future_status::ready);
    JSONValue v = fut.get();
    EXPECT_EQ(GetString(v, "value").value_or(""), "first");
    EXPECT_EQ(table.Size(), 0u);
}

TEST(PendingRequestTable, DeadlineFailsWithRequestTimeout) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("slow", 20ms);
    ASSERT_EQ(fut.wait_for(2s), std::future_status::ready);
    EXPECT_EQ(kindOf(fut), errors::ErrorKind::RequestTimeout);
    EXPECT_FALSE(table.Contains("slow"));
    EXPECT_FALSE(table.Resolve("slow", JSONValue{}));
}

TEST(PendingRequestTable, ZeroTimeoutNeverExpires) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("forever", 0ms);
    EXPECT_EQ(fut.wait_for(50ms), std::future_status::timeout);
    EXPECT_TRUE(table.Contains("forever"));
    EXPECT_TRUE(table.Resolve("forever", JSONValue(true)));
}

TEST(PendingRequestTable, RejectDeliversTheGivenError) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("r", 1s);
    JSONValue errVal = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "bad");
    ASSERT_TRUE(table.Reject("r", std::make_exception_ptr(errors::remoteError(errVal))));
    EXPECT_EQ(kindOf(fut), errors::ErrorKind::RemoteError);
}

TEST(PendingRequestTable, DrainAllFailsEveryEntryInOnePass) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    std::vector<std::future<JSONValue>> futs;
    for (int i = 0; i < 5; ++i) {
        futs.push_back(table.Register("id-" + std::to_string(i), 10s));
    }
    EXPECT_EQ(table.Size(), 5u);
    EXPECT_EQ(table.DrainAll(errors::ErrorKind::ConnectionClosed, "closed"), 5u);
    EXPECT_EQ(table.Size(), 0u);
    for (auto& f : futs) {
        ASSERT_EQ(f.wait_for(0ms), std::future_status::ready);
        EXPECT_EQ(kindOf(f), errors::ErrorKind::ConnectionClosed);
    }
    EXPECT_EQ(table.DrainAll(errors::ErrorKind::ConnectionClosed, "again"), 0u);
}

TEST(PendingRequestTable, DuplicateIdIsRejected) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("dup", 1s);
    EXPECT_THROW(table.Register("dup", 1s), std::invalid_argument);
    EXPECT_TRUE(table.Resolve("dup", JSONValue{}));
}

TEST(PendingRequestTable, ConcurrentSettlersResolveExactlyOnce) {
    Scheduler scheduler;
    PendingRequestTable table(scheduler);
    auto fut = table.Register("race", 5ms);
    std::atomic<int> wins{0};
    std::vector<std::thread> threads;
    for (int i = 0; i < 8; ++i) {
        threads.emplace_back([&table, &wins, i]() {
            bool won = (i % 2 == 0) ? table.Resolve("race", JSONValue(static_cast<int64_t>(i)))
                                    : table.Expire("race");
            if (won) {
                ++wins;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }
    std::this_thread::sleep_for(20ms);
    // The scheduled deadline may also have won; the total is still exactly one.
    EXPECT_LE(wins.load(), 1);
    EXPECT_EQ(fut.wait_for(1s), std::future_status::ready);
    EXPECT_FALSE(table.Contains("race"));
}
