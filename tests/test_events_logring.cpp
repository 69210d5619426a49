//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_events_logring.cpp
// Purpose: Typed event fan-out and the bounded protocol log
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/Events.h"
#include "mcplink/LogRing.h"
#include <stdexcept>
#include <string>
#include <vector>

using namespace mcplink;

TEST(EventEmitter, DeliversInSubscriptionOrderAndUnsubscribes) {
    EventEmitter<int> emitter;
    std::vector<std::string> seen;
    auto a = emitter.Subscribe([&](const int& v) { seen.push_back("a" + std::to_string(v)); });
    auto b = emitter.Subscribe([&](const int& v) { seen.push_back("b" + std::to_string(v)); });
    emitter.Publish(1);
    EXPECT_TRUE(emitter.Unsubscribe(a));
    EXPECT_FALSE(emitter.Unsubscribe(a));
    emitter.Publish(2);
    EXPECT_EQ(seen, (std::vector<std::string>{"a1", "b1", "b2"}));
    EXPECT_EQ(emitter.SubscriberCount(), 1u);
    (void)b;
}

TEST(EventEmitter, ThrowingHandlerDoesNotStopOthers) {
    EventEmitter<int> emitter;
    int delivered = 0;
    emitter.Subscribe([](const int&) { throw std::runtime_error("boom"); });
    emitter.Subscribe([&](const int&) { ++delivered; });
    EXPECT_NO_THROW(emitter.Publish(5));
    EXPECT_EQ(delivered, 1);
}

TEST(EventEmitter, HandlerMayUnsubscribeItself) {
    EventEmitter<int> emitter;
    int calls = 0;
    SubscriptionId self = 0;
    self = emitter.Subscribe([&](const int&) {
        ++calls;
        emitter.Unsubscribe(self);
    });
    emitter.Publish(1);
    emitter.Publish(2);
    EXPECT_EQ(calls, 1);
}

TEST(LogRing, EvictsOldestAtCapacity) {
    LogRing ring(3);
    for (int i = 1; i <= 5; ++i) {
        ring.Append("s1", LogSeverity::Info, "m" + std::to_string(i));
    }
    auto all = ring.Get();
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].message, "m3");
    EXPECT_EQ(all[2].message, "m5");
    EXPECT_LT(all[0].id, all[1].id);
    EXPECT_LT(all[1].id, all[2].id);
    EXPECT_EQ(ring.Capacity(), 3u);
}

TEST(LogRing, FiltersByServerAndLimit) {
    LogRing ring;
    ring.Append("s1", LogSeverity::Debug, "{\"id\":1}", LogDirection::Sent);
    ring.Append("s2", LogSeverity::Warn, "other");
    ring.Append("s1", LogSeverity::Debug, "{\"id\":1,\"result\":{}}", LogDirection::Received);
    ring.Append("s1", LogSeverity::Error, "failed");

    auto s1 = ring.Get(std::string("s1"));
    ASSERT_EQ(s1.size(), 3u);
    ASSERT_TRUE(s1[0].direction.has_value());
    EXPECT_EQ(*s1[0].direction, LogDirection::Sent);

    auto newest = ring.Get(std::string("s1"), 2);
    ASSERT_EQ(newest.size(), 2u);
    EXPECT_EQ(newest[1].message, "failed");
    EXPECT_EQ(newest[1].level, LogSeverity::Error);
}

TEST(LogRing, ClearOneServerOrAll) {
    LogRing ring;
    ring.Append("s1", LogSeverity::Info, "a");
    ring.Append("s2", LogSeverity::Info, "b");
    ring.Append("s1", LogSeverity::Info, "c");
    EXPECT_EQ(ring.Clear(std::string("s1")), 2u);
    EXPECT_EQ(ring.Size(), 1u);
    EXPECT_EQ(ring.Get().at(0).serverId, "s2");
    EXPECT_EQ(ring.Clear(), 1u);
    EXPECT_EQ(ring.Size(), 0u);
}
