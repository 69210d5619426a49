//========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: JsonRpcCodec.h
// Purpose: Stateless classification and decoding of inbound JSON-RPC frames
//========================================================================================================

#pragma once

#include <optional>
#include <string>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {

enum class MessageKind {
    Response,
    Request,
    Notification,
    Invalid
};

const char* ToString(MessageKind kind);

//========================================================================================================
// DecodedMessage
// Purpose: Result of decoding one raw frame. Exactly one of response/request/notification is set
//          unless kind == Invalid, in which case error describes the problem.
//========================================================================================================
struct DecodedMessage {
    MessageKind kind{MessageKind::Invalid};
    std::optional<JSONRPCResponse> response;
    std::optional<JSONRPCRequest> request;
    std::optional<JSONRPCNotification> notification;
    std::string error;
};

//========================================================================================================
// DecodeMessage
// Purpose: Parse the raw text once and classify it.
//   Response:     top-level id plus result or error.
//   Request:      top-level id plus method (server-initiated).
//   Notification: method without id.
//   Invalid:      malformed JSON, non-object root, or none of the above.
// Never throws.
//========================================================================================================
DecodedMessage DecodeMessage(const std::string& raw);

} // namespace mcplink
