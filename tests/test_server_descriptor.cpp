//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_server_descriptor.cpp
// Purpose: Server descriptor config parsing, validation and auth header construction
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/ServerDescriptor.h"
#include "mcplink/auth/BearerAuth.hpp"
#include <stdexcept>

using namespace mcplink;
using std::chrono::milliseconds;

TEST(ServerDescriptor, ParsesPushStreamConfig) {
    ServerDescriptor d = ParseServerDescriptor(
        "id=s1; name=Search; transport=sse; endpoint=https://x/sse; header=X-Team: tools; "
        "auth=bearer; token=abc; reconnectIntervalMs=250; maxReconnectAttempts=3; requestTimeoutMs=1500");
    EXPECT_EQ(d.id, "s1");
    EXPECT_EQ(d.Label(), "Search");
    EXPECT_EQ(d.transport, TransportKind::PushStream);
    EXPECT_EQ(d.endpoint, "https://x/sse");
    ASSERT_EQ(d.headers.count("X-Team"), 1u);
    EXPECT_EQ(d.headers.at("X-Team"), "tools");
    EXPECT_EQ(d.auth.mode, AuthMode::Bearer);
    EXPECT_EQ(d.auth.accessToken, "abc");
    EXPECT_EQ(d.reconnectInterval, milliseconds(250));
    EXPECT_EQ(d.maxReconnectAttempts, 3u);
    EXPECT_EQ(d.requestTimeout, milliseconds(1500));
    // untouched keys keep their defaults
    EXPECT_EQ(d.handshakeTimeout, milliseconds(10000));
    EXPECT_EQ(d.heartbeatInterval, milliseconds(30000));
    EXPECT_EQ(d.heartbeatMethod, "ping");
}

TEST(ServerDescriptor, ParsesCommandConfig) {
    ServerDescriptor d = ParseServerDescriptor("id=local; transport=command; command=/usr/bin/env; arg=node; "
                                               "arg=server.js; env=DEBUG=1");
    EXPECT_EQ(d.transport, TransportKind::Command);
    EXPECT_EQ(d.Label(), "local");
    ASSERT_EQ(d.args.size(), 2u);
    EXPECT_EQ(d.args[0], "node");
    EXPECT_EQ(d.args[1], "server.js");
    ASSERT_EQ(d.env.count("DEBUG"), 1u);
    EXPECT_EQ(d.env.at("DEBUG"), "1");
}

TEST(ServerDescriptor, RejectsBadConfig) {
    EXPECT_THROW(ParseServerDescriptor("name=no-id; endpoint=https://x/sse"), std::invalid_argument);
    EXPECT_THROW(ParseServerDescriptor("id=s1; endpoint=https://x/sse; bogus=1"), std::invalid_argument);
    EXPECT_THROW(ParseServerDescriptor("id=s1; endpoint=https://x/sse; requestTimeoutMs=soon"), std::invalid_argument);
    EXPECT_THROW(ParseServerDescriptor("id=s1; transport=carrier-pigeon"), std::invalid_argument);
    EXPECT_THROW(ParseServerDescriptor("id=s1; transport=ws"), std::invalid_argument); // no endpoint
    EXPECT_THROW(ParseServerDescriptor("id=s1; transport=command"), std::invalid_argument); // no command
}

TEST(ServerDescriptor, TransportNames) {
    EXPECT_EQ(TransportKindFromString("WSS"), TransportKind::Socket);
    EXPECT_EQ(TransportKindFromString("stdio"), TransportKind::Command);
    EXPECT_EQ(TransportKindFromString("sse"), TransportKind::PushStream);
    EXPECT_FALSE(TransportKindFromString("smtp").has_value());
}

TEST(BearerAuth, ProviderFollowsAuthMode) {
    AuthConfig none;
    EXPECT_EQ(auth::MakeAuthProvider(none), nullptr);

    AuthConfig bearer;
    bearer.mode = AuthMode::Bearer;
    bearer.accessToken = "t0k";
    auto provider = auth::MakeAuthProvider(bearer);
    ASSERT_NE(provider, nullptr);
    auto headers = provider->headers();
    ASSERT_EQ(headers.size(), 1u);
    EXPECT_EQ(headers[0].name, "Authorization");
    EXPECT_EQ(headers[0].value, "Bearer t0k");

    AuthConfig oauth;
    oauth.mode = AuthMode::OAuth2;
    oauth.accessToken = "at";
    oauth.tokenType = "DPoP";
    auto p2 = auth::MakeAuthProvider(oauth);
    ASSERT_NE(p2, nullptr);
    EXPECT_EQ(p2->headers().at(0).value, "DPoP at");
}
