//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_json_codec.cpp
// Purpose: JSON value parsing/serialization and inbound frame classification
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/JsonRpcCodec.h"
#include <string>

using namespace mcplink;

TEST(JSONValue, ParsesNestedDocument) {
    JSONValue v = ParseJSON(R"({"a":1,"b":[true,null,2.5,"x"],"c":{"d":"e\nA"}})");
    ASSERT_TRUE(v.IsObject());
    EXPECT_EQ(GetInt(v, "a").value_or(0), 1);
    const JSONValue* b = v.Find("b");
    ASSERT_NE(b, nullptr);
    ASSERT_TRUE(b->IsArray());
    const auto& arr = std::get<JSONValue::Array>(b->value);
    ASSERT_EQ(arr.size(), 4u);
    EXPECT_TRUE(std::get<bool>(arr[0]->value));
    EXPECT_TRUE(arr[1]->IsNull());
    EXPECT_DOUBLE_EQ(std::get<double>(arr[2]->value), 2.5);
    const JSONValue* c = v.Find("c");
    ASSERT_NE(c, nullptr);
    EXPECT_EQ(GetString(*c, "d").value_or(""), "e\nA");
}

TEST(JSONValue, SerializeParsesBackToEqualValue) {
    JSONValue original = MakeObject({
        {"name", JSONValue("echo")},
        {"count", JSONValue(static_cast<int64_t>(3))},
        {"nested", MakeObject({{"quote", JSONValue("say \"hi\"")}})}
    });
    EXPECT_EQ(ParseJSON(SerializeJSON(original)), original);
}

TEST(JSONValue, MalformedInputThrows) {
    EXPECT_THROW(ParseJSON("{\"a\":"), std::exception);
    EXPECT_THROW(ParseJSON("[1,2"), std::exception);
    EXPECT_THROW(ParseJSON("{} trailing"), std::exception);
}

TEST(JsonRpcCodec, ClassifiesResponse) {
    DecodedMessage m = DecodeMessage(R"({"jsonrpc":"2.0","id":"req_1","result":{"ok":true}})");
    ASSERT_EQ(m.kind, MessageKind::Response);
    ASSERT_TRUE(m.response.has_value());
    EXPECT_EQ(IdToString(m.response->id), "req_1");
    ASSERT_TRUE(m.response->result.has_value());
    EXPECT_TRUE(GetBool(*m.response->result, "ok").value_or(false));
}

TEST(JsonRpcCodec, ClassifiesErrorResponseWithNumericId) {
    DecodedMessage m = DecodeMessage(R"({"jsonrpc":"2.0","id":7,"error":{"code":-32601,"message":"nope"}})");
    ASSERT_EQ(m.kind, MessageKind::Response);
    EXPECT_EQ(IdToString(m.response->id), "7");
    ASSERT_TRUE(m.response->IsError());
    EXPECT_EQ(GetInt(*m.response->error, "code").value_or(0), JSONRPCErrorCodes::MethodNotFound);
}

TEST(JsonRpcCodec, ClassifiesServerRequest) {
    DecodedMessage m = DecodeMessage(R"({"jsonrpc":"2.0","id":"srv-1","method":"ping"})");
    ASSERT_EQ(m.kind, MessageKind::Request);
    EXPECT_EQ(m.request->method, "ping");
}

TEST(JsonRpcCodec, ClassifiesNotification) {
    DecodedMessage m = DecodeMessage(R"({"jsonrpc":"2.0","method":"notifications/tools/list_changed"})");
    ASSERT_EQ(m.kind, MessageKind::Notification);
    EXPECT_EQ(m.notification->method, "notifications/tools/list_changed");
    EXPECT_FALSE(m.notification->params.has_value());
}

TEST(JsonRpcCodec, InvalidFramesKeepAnError) {
    DecodedMessage bad = DecodeMessage("{not json");
    EXPECT_EQ(bad.kind, MessageKind::Invalid);
    EXPECT_FALSE(bad.error.empty());

    DecodedMessage array = DecodeMessage("[1,2,3]");
    EXPECT_EQ(array.kind, MessageKind::Invalid);

    DecodedMessage neither = DecodeMessage(R"({"jsonrpc":"2.0","id":1})");
    EXPECT_EQ(neither.kind, MessageKind::Invalid);
}

TEST(JsonRpcCodec, RequestSerializationCarriesParams) {
    JSONRPCRequest req(std::string("req_9"), "tools/call",
                       MakeObject({{"name", JSONValue("echo")}, {"arguments", MakeObject({{"msg", JSONValue("hi")}})}}));
    JSONValue wire = ParseJSON(req.Serialize());
    EXPECT_EQ(GetString(wire, "jsonrpc").value_or(""), "2.0");
    EXPECT_EQ(GetString(wire, "id").value_or(""), "req_9");
    EXPECT_EQ(GetString(wire, "method").value_or(""), "tools/call");
    const JSONValue* params = wire.Find("params");
    ASSERT_NE(params, nullptr);
    EXPECT_EQ(GetString(*params, "name").value_or(""), "echo");
}

TEST(JsonRpcCodec, ErrorResponseShape) {
    auto resp = CreateErrorResponse(JSONRPCId(std::string("x")), JSONRPCErrorCodes::InvalidParams, "bad args");
    ASSERT_TRUE(resp);
    JSONValue wire = ParseJSON(resp->Serialize());
    const JSONValue* err = wire.Find("error");
    ASSERT_NE(err, nullptr);
    EXPECT_EQ(GetInt(*err, "code").value_or(0), JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(GetString(*err, "message").value_or(""), "bad args");
    EXPECT_EQ(wire.Find("result"), nullptr);
}
