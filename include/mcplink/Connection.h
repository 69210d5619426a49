//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.h
// Purpose: Per-server MCP protocol client - handshake, push channel, request correlation, heartbeat and
//          reconnection
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/Events.h"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/LogRing.h"
#include "mcplink/PendingRequestTable.h"
#include "mcplink/Protocol.h"
#include "mcplink/Scheduler.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/Transport.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

enum class ConnectionState {
    Disconnected,
    Connecting,
    Handshaking,
    Connected,
    Reconnecting,
    Error
};

const char* ToString(ConnectionState state);

enum class ConnectionEventKind {
    StateChanged,
    ToolListChanged,
    ResourceListChanged,
    ResourceUpdated,
    PromptListChanged,
    LogMessage,  // notifications/message from the server
    Progress,
    Log,         // protocol traffic and diagnostics for the log ring
    Fatal        // ReconnectExhausted; manual Connect() required
};

const char* ToString(ConnectionEventKind kind);

//==========================================================================================================
// ConnectionEvent
// Purpose: One event published by a Connection. Fields not relevant to the kind are left empty.
//==========================================================================================================
struct ConnectionEvent {
    ConnectionEventKind kind{ConnectionEventKind::StateChanged};
    std::string serverId;

    // StateChanged
    ConnectionState previousState{ConnectionState::Disconnected};
    ConnectionState state{ConnectionState::Disconnected};
    unsigned int attempt{0};                // reconnect attempt number while Reconnecting
    std::optional<errors::ErrorKind> error; // cause of Error / Disconnected / Fatal

    // Notifications
    std::string method;
    std::optional<JSONValue> params;

    // Log / Fatal
    LogSeverity severity{LogSeverity::Info};
    std::string message;
    std::optional<LogDirection> direction;
};

// A request in flight: its id (usable with CancelRequest) and the eventual result.
struct PendingCall {
    std::string id;
    std::future<JSONValue> result;
};

//==========================================================================================================
// Connection
// Purpose: Drives one server through the ConnectionState machine over a transport created per attempt.
// Notes:
//   - Always held by shared_ptr (Create). In-flight coroutines and timers keep only what they need alive;
//     a generation counter makes callbacks from an earlier session inert.
//   - Responses are correlated solely by id; arrival order does not matter.
//   - Errors are delivered as errors::ClientError through the returned futures.
//==========================================================================================================
class Connection : public std::enable_shared_from_this<Connection> {
public:
    static std::shared_ptr<Connection> Create(std::shared_ptr<const ServerDescriptor> descriptor,
                                              std::shared_ptr<ITransportFactory> factory,
                                              std::shared_ptr<Scheduler> scheduler);
    ~Connection();

    Connection(const Connection&) = delete;
    Connection& operator=(const Connection&) = delete;

    ////////////////////////////////////////// Lifecycle //////////////////////////////////////////
    //======================================================================================================
    // Connect
    // Purpose: Handshake (initialize + notifications/initialized), open the push channel, start heartbeat.
    // Returns:
    //   Future completing when Connected, or failing with HandshakeTimeout, HandshakeRejected,
    //   ChannelOpenFailed, Unauthorized, TransportLost or ConnectionClosed. Completes at once when already
    //   Connected; joins the running attempt when Connecting/Handshaking. A manual Connect() resets the
    //   reconnect attempt counter.
    //======================================================================================================
    std::future<void> Connect();

    //======================================================================================================
    // Disconnect
    // Purpose: Idempotent teardown. Cancels heartbeat and reconnect timers, fails every pending request
    //          with ConnectionClosed in one pass, closes the transport and clears the negotiated session.
    //======================================================================================================
    std::future<void> Disconnect();

    ////////////////////////////////////////// Requests //////////////////////////////////////////
    // Sends a request; the deadline defaults to the descriptor's requestTimeout. Fails with NotConnected
    // unless Connected.
    std::future<JSONValue> SendRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                                       std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    // As SendRequest, also exposing the generated request id.
    PendingCall StartRequest(const std::string& method, std::optional<JSONValue> params = std::nullopt,
                             std::optional<std::chrono::milliseconds> timeout = std::nullopt);

    std::future<void> SendNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Sends notifications/cancelled for id and fails its caller with Cancelled. False when id is not pending.
    bool CancelRequest(const std::string& id, const std::string& reason = "cancelled by client");

    //======================================================================================================
    // OnPushMessage
    // Purpose: Entry point for every inbound frame (push channel and Submit acknowledgements).
    //   - Response: resolves/rejects its pending request; unknown ids are logged and dropped.
    //   - Server request: ping is answered with {}; anything else gets MethodNotFound.
    //   - Notification: published as a typed event; unknown methods are logged and dropped.
    // Never throws.
    //======================================================================================================
    void OnPushMessage(const std::string& raw);

    ////////////////////////////////////////// MCP helpers //////////////////////////////////////////
    // tools/list across every page; the result replaces the tool cache.
    std::future<std::vector<Tool>> ListTools();
    std::future<ToolsListResult> ListToolsPage(const std::optional<std::string>& cursor);
    std::future<JSONValue> CallTool(const std::string& name, const JSONValue& arguments);
    std::future<ResourcesListResult> ListResources(const std::optional<std::string>& cursor = std::nullopt);
    std::future<JSONValue> ReadResource(const std::string& uri);
    std::future<PromptsListResult> ListPrompts(const std::optional<std::string>& cursor = std::nullopt);
    std::future<JSONValue> GetPrompt(const std::string& name, const std::optional<JSONValue>& arguments = std::nullopt);
    std::future<void> SetLogLevel(const std::string& level);

    ////////////////////////////////////////// State //////////////////////////////////////////
    ConnectionState State() const;
    bool IsConnected() const;
    std::string ServerId() const;
    std::shared_ptr<const ServerDescriptor> Descriptor() const;
    // Replaces the descriptor wholesale; takes effect on the next connect attempt.
    void SetDescriptor(std::shared_ptr<const ServerDescriptor> descriptor);
    std::optional<InitializeResult> GetInitializeResult() const;
    unsigned int ReconnectAttempts() const;
    std::size_t PendingRequestCount() const;

    // Tool cache: filled by ListTools(), invalidated by notifications/tools/list_changed and disconnect.
    std::optional<std::vector<Tool>> CachedTools() const;

    EventEmitter<ConnectionEvent>& Events() { return events; }

private:
    Connection(std::shared_ptr<const ServerDescriptor> descriptor, std::shared_ptr<ITransportFactory> factory,
               std::shared_ptr<Scheduler> scheduler);

    EventEmitter<ConnectionEvent> events;
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink
