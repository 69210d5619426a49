//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Errors.h
// Purpose: Typed client error taxonomy and JSON-RPC error mapping helpers for mcplink
//==========================================================================================================

#pragma once

#include <optional>
#include <stdexcept>
#include <string>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {
namespace errors {

// Categorization of common JSON-RPC and MCP error codes.
enum class ErrorCategory {
    JsonRpcParse,
    JsonRpcInvalidRequest,
    JsonRpcMethodNotFound,
    JsonRpcInvalidParams,
    JsonRpcInternal,
    McpInvalidRequestId,
    McpMethodNotAllowed,
    McpResourceNotFound,
    McpToolNotFound,
    McpPromptNotFound,
    Unknown
};

// Typed remote error (the `error` member of a JSON-RPC response).
struct McpError {
    int code{0};
    std::string message;
    std::optional<JSONValue> data;
    ErrorCategory category{ErrorCategory::Unknown};
};

//==========================================================================================================
// ErrorKind
// Purpose: Client-side failure taxonomy. Session-wide kinds (TransportLost, ConnectionClosed,
//          ReconnectExhausted) affect Connection state; request-local kinds (RequestTimeout, RemoteError,
//          Cancelled) only reach the one caller.
//==========================================================================================================
enum class ErrorKind {
    HandshakeTimeout,
    HandshakeRejected,
    ChannelOpenFailed,
    RequestTimeout,
    RemoteError,
    TransportLost,
    ReconnectExhausted,
    NotConnected,
    UnknownResponseId,
    Unauthorized,
    ConnectionClosed,
    Cancelled,
    InvalidMessage,
    ServerNotFound,
    DuplicateServer
};

inline const char* ToString(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::HandshakeTimeout: return "HandshakeTimeout";
        case ErrorKind::HandshakeRejected: return "HandshakeRejected";
        case ErrorKind::ChannelOpenFailed: return "ChannelOpenFailed";
        case ErrorKind::RequestTimeout: return "RequestTimeout";
        case ErrorKind::RemoteError: return "RemoteError";
        case ErrorKind::TransportLost: return "TransportLost";
        case ErrorKind::ReconnectExhausted: return "ReconnectExhausted";
        case ErrorKind::NotConnected: return "NotConnected";
        case ErrorKind::UnknownResponseId: return "UnknownResponseId";
        case ErrorKind::Unauthorized: return "Unauthorized";
        case ErrorKind::ConnectionClosed: return "ConnectionClosed";
        case ErrorKind::Cancelled: return "Cancelled";
        case ErrorKind::InvalidMessage: return "InvalidMessage";
        case ErrorKind::ServerNotFound: return "ServerNotFound";
        case ErrorKind::DuplicateServer: return "DuplicateServer";
    }
    return "Unknown";
}

//==========================================================================================================
// ClientError
// Purpose: Exception type carried through std::future for every mcplink failure.
// Fields:
//   kind(): ErrorKind classifying the failure.
//   remote(): McpError when the failure originated from a JSON-RPC error response.
//==========================================================================================================
class ClientError : public std::runtime_error {
public:
    ClientError(ErrorKind kind, const std::string& message)
        : std::runtime_error(message), kind_(kind) {}
    ClientError(ErrorKind kind, const std::string& message, McpError remote)
        : std::runtime_error(message), kind_(kind), remote_(std::move(remote)) {}

    ErrorKind kind() const noexcept { return kind_; }
    const std::optional<McpError>& remote() const noexcept { return remote_; }

private:
    ErrorKind kind_;
    std::optional<McpError> remote_;
};

// Map a JSON-RPC/MCP numeric error code to an ErrorCategory.
//
// Args:
//   code: The integer error code (JSON-RPC standard or MCP-specific).
//
// Returns:
//   ErrorCategory corresponding to the code, or Unknown when unmapped.
inline ErrorCategory errorCategoryFromCode(int code) {
    switch (code) {
        case JSONRPCErrorCodes::ParseError: return ErrorCategory::JsonRpcParse;
        case JSONRPCErrorCodes::InvalidRequest: return ErrorCategory::JsonRpcInvalidRequest;
        case JSONRPCErrorCodes::MethodNotFound: return ErrorCategory::JsonRpcMethodNotFound;
        case JSONRPCErrorCodes::InvalidParams: return ErrorCategory::JsonRpcInvalidParams;
        case JSONRPCErrorCodes::InternalError: return ErrorCategory::JsonRpcInternal;
        case JSONRPCErrorCodes::InvalidRequestId: return ErrorCategory::McpInvalidRequestId;
        case JSONRPCErrorCodes::MethodNotAllowed: return ErrorCategory::McpMethodNotAllowed;
        case JSONRPCErrorCodes::ResourceNotFound: return ErrorCategory::McpResourceNotFound;
        case JSONRPCErrorCodes::ToolNotFound: return ErrorCategory::McpToolNotFound;
        case JSONRPCErrorCodes::PromptNotFound: return ErrorCategory::McpPromptNotFound;
        default: return ErrorCategory::Unknown;
    }
}

// Convert a JSON-RPC error object (shape: { code, message, data? }) to McpError.
// A malformed object still yields an InternalError-coded McpError so the caller is never left without
// a reason.
//
// Args:
//   errVal: JSONValue expected to be an Object with code/message and optional data.
//
// Returns:
//   McpError describing the remote failure.
inline McpError mcpErrorFromErrorValue(const JSONValue& errVal) {
    McpError e;
    auto code = GetInt(errVal, "code");
    auto message = GetString(errVal, "message");
    e.code = code ? static_cast<int>(*code) : JSONRPCErrorCodes::InternalError;
    e.message = message ? *message : std::string("Malformed error object");
    if (const JSONValue* data = errVal.Find("data")) {
        e.data = *data;
    }
    e.category = errorCategoryFromCode(e.code);
    return e;
}

// Convenience: build a ClientError of kind RemoteError from an error object.
inline ClientError remoteError(const JSONValue& errVal) {
    McpError e = mcpErrorFromErrorValue(errVal);
    std::string what = "Remote error " + std::to_string(e.code) + ": " + e.message;
    return ClientError(ErrorKind::RemoteError, what, std::move(e));
}

} // namespace errors
} // namespace mcplink
