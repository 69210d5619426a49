//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: test_errors.cpp
// Purpose: GoogleTests for the client error taxonomy and JSON-RPC error mapping helpers
//==========================================================================================================

#include <gtest/gtest.h>
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/errors/Errors.h"
#include <set>
#include <string>

using namespace mcplink;

TEST(Errors, CategoryMapping) {
    using mcplink::errors::ErrorCategory;
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ParseError), ErrorCategory::JsonRpcParse);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidRequest), ErrorCategory::JsonRpcInvalidRequest);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::MethodNotFound), ErrorCategory::JsonRpcMethodNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InvalidParams), ErrorCategory::JsonRpcInvalidParams);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::InternalError), ErrorCategory::JsonRpcInternal);
    EXPECT_EQ(errors::errorCategoryFromCode(JSONRPCErrorCodes::ToolNotFound), ErrorCategory::McpToolNotFound);
    EXPECT_EQ(errors::errorCategoryFromCode(12345), ErrorCategory::Unknown);
}

TEST(Errors, RemoteErrorCarriesCodeMessageAndData) {
    JSONValue errVal = CreateErrorObject(JSONRPCErrorCodes::InvalidParams, "missing msg",
                                         MakeObject({{"field", JSONValue("msg")}}));
    errors::ClientError e = errors::remoteError(errVal);
    EXPECT_EQ(e.kind(), errors::ErrorKind::RemoteError);
    ASSERT_TRUE(e.remote().has_value());
    EXPECT_EQ(e.remote()->code, JSONRPCErrorCodes::InvalidParams);
    EXPECT_EQ(e.remote()->message, "missing msg");
    ASSERT_TRUE(e.remote()->data.has_value());
    EXPECT_EQ(GetString(*e.remote()->data, "field").value_or(""), "msg");
    EXPECT_NE(std::string(e.what()).find("missing msg"), std::string::npos);
}

TEST(Errors, MalformedErrorObjectStillYieldsReason) {
    errors::McpError e = errors::mcpErrorFromErrorValue(JSONValue(std::string("oops")));
    EXPECT_EQ(e.code, JSONRPCErrorCodes::InternalError);
    EXPECT_FALSE(e.message.empty());
}

TEST(Errors, KindNamesAreDistinct) {
    using errors::ErrorKind;
    const ErrorKind kinds[] = {
        ErrorKind::HandshakeTimeout, ErrorKind::HandshakeRejected, ErrorKind::ChannelOpenFailed,
        ErrorKind::RequestTimeout, ErrorKind::RemoteError, ErrorKind::TransportLost,
        ErrorKind::ReconnectExhausted, ErrorKind::NotConnected, ErrorKind::UnknownResponseId,
        ErrorKind::Unauthorized, ErrorKind::ConnectionClosed, ErrorKind::Cancelled,
        ErrorKind::InvalidMessage, ErrorKind::ServerNotFound, ErrorKind::DuplicateServer};
    std::set<std::string> names;
    for (auto k : kinds) {
        names.insert(errors::ToString(k));
    }
    EXPECT_EQ(names.size(), sizeof(kinds) / sizeof(kinds[0]));
}
