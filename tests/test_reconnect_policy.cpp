//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_reconnect_policy.cpp
// Purpose: Exponential reconnect backoff and attempt budget
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/ReconnectPolicy.h"
#include "mcplink/ServerDescriptor.h"

using namespace mcplink;
using std::chrono::milliseconds;

TEST(ReconnectPolicy, DoublesFromBaseAndCaps) {
    ReconnectPolicy p;
    p.baseDelay = milliseconds(5000);
    p.maxDelay = milliseconds(30000);
    EXPECT_EQ(p.DelayForAttempt(1), milliseconds(5000));
    EXPECT_EQ(p.DelayForAttempt(2), milliseconds(10000));
    EXPECT_EQ(p.DelayForAttempt(3), milliseconds(20000));
    EXPECT_EQ(p.DelayForAttempt(4), milliseconds(30000));
    EXPECT_EQ(p.DelayForAttempt(5), milliseconds(30000));
}

TEST(ReconnectPolicy, DelaysNeverDecrease) {
    ReconnectPolicy p;
    p.baseDelay = milliseconds(7);
    p.maxDelay = milliseconds(1000);
    milliseconds prev{0};
    for (unsigned int n = 1; n <= 64; ++n) {
        const auto d = p.DelayForAttempt(n);
        EXPECT_GE(d, prev) << "attempt " << n;
        EXPECT_LE(d, p.maxDelay);
        prev = d;
    }
}

TEST(ReconnectPolicy, AttemptBudget) {
    ReconnectPolicy p;
    p.maxAttempts = 2;
    EXPECT_TRUE(p.CanAttempt(0));
    EXPECT_TRUE(p.CanAttempt(1));
    EXPECT_FALSE(p.CanAttempt(2));

    p.maxAttempts = 0;
    EXPECT_FALSE(p.CanAttempt(0));
}

TEST(ReconnectPolicy, DescriptorDefaults) {
    ServerDescriptor d;
    const ReconnectPolicy p = d.Reconnect();
    EXPECT_EQ(p.baseDelay, milliseconds(5000));
    EXPECT_EQ(p.maxDelay, milliseconds(30000));
    EXPECT_EQ(p.maxAttempts, 10u);
}
