//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Transport.h
// Purpose: Client transport interfaces - a request channel plus a server push channel per session
//==========================================================================================================

#pragma once

#include <memory>
#include <string>
#include <functional>
#include <future>
#include <optional>
#include <cstdint>

namespace mcplink {

struct ServerDescriptor;

//==========================================================================================================
// ITransport
// Purpose: One client session with a server. Carries raw JSON-RPC text in both directions; framing and
//          correlation live in Connection.
// Notes:
//   - Start() brings up the request channel. Messages pushed by the server may arrive from then on.
//   - OpenPushChannel() completes once the server push channel is live (SSE stream open). Transports
//     whose request channel is also the push channel complete it immediately.
//   - Submit() may yield a synchronous acknowledgement body (e.g., the JSON-RPC reply carried in an HTTP
//     POST response). Connection routes it through the same path as pushed messages.
//   - Failures are reported as mcplink::errors::ClientError through the returned futures.
//   - Handlers may be invoked from transport-owned threads; none are invoked after Close() completes.
//==========================================================================================================
class ITransport {
public:
    virtual ~ITransport() = default;

    /////////////////////////////////////////// Connection lifecycle ///////////////////////////////////////////
    //==========================================================================================================
    // Starts the transport I/O and the request channel.
    // Returns:
    //   A future that completes when requests may be submitted.
    //==========================================================================================================
    virtual std::future<void> Start() = 0;

    //==========================================================================================================
    // Opens the server push channel.
    // Returns:
    //   A future that completes when the channel is live; fails with ChannelOpenFailed or Unauthorized.
    //==========================================================================================================
    virtual std::future<void> OpenPushChannel() = 0;

    //==========================================================================================================
    // Closes the transport and releases resources. Idempotent.
    //==========================================================================================================
    virtual std::future<void> Close() = 0;

    virtual bool IsConnected() const = 0;

    // Diagnostic session identifier.
    virtual std::string GetSessionId() const = 0;

    /////////////////////////////////////////// Message sending ///////////////////////////////////////////
    //==========================================================================================================
    // Submits one serialized JSON-RPC message.
    // Args:
    //   payload: serialized request, response or notification.
    // Returns:
    //   Future with the synchronous acknowledgement body when the transport carries one (empty otherwise).
    //==========================================================================================================
    virtual std::future<std::optional<std::string>> Submit(const std::string& payload) = 0;

    /////////////////////////////////////////// Handlers ///////////////////////////////////////////
    // Raw message pushed by the server.
    using MessageHandler = std::function<void(const std::string& raw)>;
    virtual void SetMessageHandler(MessageHandler handler) = 0;

    // Session lost without a local Close() (stream ended, socket reset, child exited).
    using CloseHandler = std::function<void(const std::string& reason)>;
    virtual void SetCloseHandler(CloseHandler handler) = 0;

    // Non-fatal diagnostics.
    using ErrorHandler = std::function<void(const std::string& error)>;
    virtual void SetErrorHandler(ErrorHandler handler) = 0;
};

// Concrete transports are declared in their respective headers:
//  - mcplink/transports/SseTransport.hpp
//  - mcplink/transports/WebSocketTransport.hpp
//  - mcplink/transports/ProcessTransport.hpp
//  - mcplink/transports/InMemoryTransport.hpp

//==========================================================================================================
// Transport factory interface
// Purpose: Creates a fresh transport for every connect attempt from the server descriptor.
//==========================================================================================================
class ITransportFactory {
public:
    virtual ~ITransportFactory() = default;

    //==========================================================================================================
    // Creates a transport instance for the descriptor.
    // Throws:
    //   std::invalid_argument when the descriptor's transport kind is not supported by this factory.
    //==========================================================================================================
    virtual std::unique_ptr<ITransport> CreateTransport(const ServerDescriptor& desc) = 0;
};

//==========================================================================================================
// DefaultTransportFactory
// Purpose: Maps TransportKind to SseTransport, WebSocketTransport or ProcessTransport. InMemory descriptors
//          are rejected (use InMemoryTransportFactory).
//==========================================================================================================
class DefaultTransportFactory : public ITransportFactory {
public:
    std::unique_ptr<ITransport> CreateTransport(const ServerDescriptor& desc) override;
};

} // namespace mcplink
