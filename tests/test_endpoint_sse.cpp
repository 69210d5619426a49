//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_endpoint_sse.cpp
// Purpose: URL handling for the network transports, the event-stream decoder and POST reply mapping
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/transports/Endpoint.hpp"
#include "mcplink/transports/SseTransport.hpp"
#include "mcplink/errors/Errors.h"
#include <stdexcept>
#include <string>
#include <vector>

using namespace mcplink;
using namespace mcplink::transports;

TEST(Endpoint, ParsesSchemesAndDefaultsPorts) {
    UrlParts a = ParseUrl("https://x/sse");
    EXPECT_EQ(a.scheme, "https");
    EXPECT_EQ(a.host, "x");
    EXPECT_EQ(a.port, "443");
    EXPECT_EQ(a.target, "/sse");
    EXPECT_TRUE(a.secure);

    UrlParts b = ParseUrl("ws://127.0.0.1:9000");
    EXPECT_EQ(b.port, "9000");
    EXPECT_EQ(b.target, "/");
    EXPECT_FALSE(b.secure);

    UrlParts c = ParseUrl("WSS://[::1]/mcp?session=1");
    EXPECT_EQ(c.scheme, "wss");
    EXPECT_EQ(c.host, "::1");
    EXPECT_EQ(c.port, "443");
    EXPECT_EQ(c.target, "/mcp?session=1");
}

TEST(Endpoint, RejectsUnsupportedUrls) {
    EXPECT_THROW(ParseUrl("x/sse"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("ftp://host/file"), std::invalid_argument);
    EXPECT_THROW(ParseUrl("http:///nohost"), std::invalid_argument);
}

TEST(Endpoint, ResolvesEndpointReferences) {
    UrlParts base = ParseUrl("https://api.example.com:8443/mcp/sse");
    UrlParts abs = ResolveReference(base, "/mcp/messages?sessionId=42");
    EXPECT_EQ(abs.host, "api.example.com");
    EXPECT_EQ(abs.port, "8443");
    EXPECT_EQ(abs.target, "/mcp/messages?sessionId=42");

    UrlParts other = ResolveReference(base, "http://other:81/post");
    EXPECT_EQ(other.host, "other");
    EXPECT_EQ(other.port, "81");
    EXPECT_FALSE(other.secure);

    EXPECT_EQ(HostHeader(ParseUrl("https://x/sse")), "x");
    EXPECT_EQ(HostHeader(base), "api.example.com:8443");
}

TEST(SseEventParser, SplitsEventsAcrossChunks) {
    SseEventParser p;
    EXPECT_TRUE(p.Feed("event: endpoint\nda").empty());
    auto evs = p.Feed("ta: /messages?id=1\n\ndata: {\"a\":1}\n");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].event, "endpoint");
    EXPECT_EQ(evs[0].data, "/messages?id=1");

    evs = p.Feed("\n");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].event, "message");
    EXPECT_EQ(evs[0].data, "{\"a\":1}");
}

TEST(SseEventParser, HandlesCrLfCommentsAndMultilineData) {
    SseEventParser p;
    auto evs = p.Feed(": keep-alive\r\nid: 7\r\ndata: line1\r");
    EXPECT_TRUE(evs.empty());
    evs = p.Feed("\ndata: line2\r\n\r\n");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].data, "line1\nline2");
    EXPECT_EQ(evs[0].id, "7");
}

TEST(SseEventParser, BlankLinesWithoutDataDispatchNothing) {
    SseEventParser p;
    EXPECT_TRUE(p.Feed("event: ping\n\n\n").empty());
    auto evs = p.Feed("data:x\n\n");
    ASSERT_EQ(evs.size(), 1u);
    EXPECT_EQ(evs[0].event, "message"); // event name reset by the earlier blank line
    EXPECT_EQ(evs[0].data, "x");
}

TEST(SseEventParser, NotificationEventsAreDelivered) {
    SseEventParser p;
    auto evs = p.Feed("event: notification\n"
                      "data: {\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\"}\n\n"
                      "event: endpoint\ndata: /post\n\n"
                      "data: {\"jsonrpc\":\"2.0\",\"id\":1,\"result\":{}}\n\n"
                      "event: heartbeat\ndata: tick\n\n");
    ASSERT_EQ(evs.size(), 4u);
    EXPECT_EQ(RouteSseEvent(evs[0]), SseEventRoute::Deliver);
    EXPECT_EQ(evs[0].data, "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/tools/list_changed\"}");
    EXPECT_EQ(RouteSseEvent(evs[1]), SseEventRoute::Endpoint);
    EXPECT_EQ(RouteSseEvent(evs[2]), SseEventRoute::Deliver);
    EXPECT_EQ(RouteSseEvent(evs[3]), SseEventRoute::Ignore);
}

namespace {
errors::ErrorKind settleFailure(const SsePostReply& reply) {
    std::vector<SseEvent> streamed;
    try {
        (void)SettlePostReply(reply, streamed);
    } catch (const errors::ClientError& e) {
        return e.kind();
    }
    ADD_FAILURE() << "HTTP " << reply.status << " was accepted";
    return errors::ErrorKind::InvalidMessage;
}
} // namespace

TEST(SsePostReply, StatusCodesMapToErrorKinds) {
    EXPECT_EQ(settleFailure({401, "application/json", ""}), errors::ErrorKind::Unauthorized);
    EXPECT_EQ(settleFailure({403, "text/plain", "forbidden"}), errors::ErrorKind::Unauthorized);
    EXPECT_EQ(settleFailure({500, "text/plain", "boom"}), errors::ErrorKind::TransportLost);
    EXPECT_EQ(settleFailure({503, "", ""}), errors::ErrorKind::TransportLost);
    EXPECT_EQ(settleFailure({400, "application/json", "{}"}), errors::ErrorKind::InvalidMessage);
    EXPECT_EQ(settleFailure({404, "", ""}), errors::ErrorKind::InvalidMessage);
}

TEST(SsePostReply, AcknowledgementShapes) {
    std::vector<SseEvent> streamed;
    const std::string body = R"({"jsonrpc":"2.0","id":"req_1","result":{"tools":[]}})";

    auto ack = SettlePostReply({200, "application/json", body}, streamed);
    ASSERT_TRUE(ack.has_value());
    EXPECT_EQ(*ack, body);

    EXPECT_FALSE(SettlePostReply({202, "application/json", "{}"}, streamed).has_value());
    EXPECT_FALSE(SettlePostReply({204, "", ""}, streamed).has_value());
    EXPECT_FALSE(SettlePostReply({200, "application/json", ""}, streamed).has_value());
    EXPECT_TRUE(streamed.empty());

    // an event-stream reply is unpacked, even without a trailing blank line
    ack = SettlePostReply({200, "text/event-stream; charset=utf-8", "event: message\ndata: " + body + "\n"}, streamed);
    EXPECT_FALSE(ack.has_value());
    ASSERT_EQ(streamed.size(), 1u);
    EXPECT_EQ(streamed[0].data, body);
}
