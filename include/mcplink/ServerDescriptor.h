//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDescriptor.h
// Purpose: Immutable per-server configuration (transport, endpoint, auth, timeouts, reconnect policy)
//==========================================================================================================

#pragma once

#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

#include "mcplink/ReconnectPolicy.h"

namespace mcplink {

enum class TransportKind {
    PushStream, // HTTP(S) Server-Sent Events + POST
    Socket,     // WebSocket (ws/wss)
    Command,    // child process, newline-delimited JSON over stdio
    InMemory    // in-process peer (tests, embedding)
};

const char* ToString(TransportKind kind);
std::optional<TransportKind> TransportKindFromString(const std::string& s);

enum class AuthMode {
    None,
    Bearer,
    OAuth2
};

const char* ToString(AuthMode mode);

//==========================================================================================================
// AuthConfig
// Purpose: Credential block attached to a descriptor. OAuth2 tokens are obtained by the caller; the client
//          only presents accessToken (as "<tokenType> <accessToken>") and never refreshes it.
//==========================================================================================================
struct AuthConfig {
    AuthMode mode{AuthMode::None};
    std::string accessToken;
    std::string tokenType{"Bearer"};
    std::string refreshToken;
    std::string scope;
};

//==========================================================================================================
// ServerDescriptor
// Purpose: Everything needed to reach and supervise one MCP server. Held as shared_ptr<const ...> and
//          replaced wholesale on reconfiguration.
//==========================================================================================================
struct ServerDescriptor {
    std::string id;
    std::string name;
    TransportKind transport{TransportKind::PushStream};

    // PushStream / Socket
    std::string endpoint;
    std::string caFile;
    std::string caPath;
    std::unordered_map<std::string, std::string> headers;

    // Command
    std::string command;
    std::vector<std::string> args;
    std::unordered_map<std::string, std::string> env;

    AuthConfig auth;

    std::chrono::milliseconds reconnectInterval{5000};
    std::chrono::milliseconds reconnectMaxDelay{30000};
    unsigned int maxReconnectAttempts{10};
    std::chrono::milliseconds handshakeTimeout{10000};
    std::chrono::milliseconds channelOpenTimeout{10000};
    std::chrono::milliseconds heartbeatInterval{30000}; // 0 disables heartbeat
    std::chrono::milliseconds heartbeatTimeout{10000};
    std::string heartbeatMethod{"ping"};
    std::chrono::milliseconds requestTimeout{30000};

    ReconnectPolicy Reconnect() const {
        ReconnectPolicy p;
        p.baseDelay = reconnectInterval;
        p.maxDelay = reconnectMaxDelay;
        p.maxAttempts = maxReconnectAttempts;
        return p;
    }

    // Display label: name when present, otherwise id.
    const std::string& Label() const { return name.empty() ? id : name; }
};

//==========================================================================================================
// ParseServerDescriptor
// Purpose: Parse semicolon-delimited key=value config into a ServerDescriptor.
// Keys:
//   id, name, transport (sse|ws|command|inmemory), endpoint, command, arg (repeatable), env (K=V, repeatable),
//   header (Name:Value, repeatable), auth (none|bearer|oauth2), token, tokenType, refreshToken, scope,
//   caFile, caPath, reconnectIntervalMs, reconnectMaxDelayMs, maxReconnectAttempts, handshakeTimeoutMs,
//   channelOpenTimeoutMs, heartbeatIntervalMs, heartbeatTimeoutMs, heartbeatMethod, requestTimeoutMs.
// Throws:
//   std::invalid_argument on unknown keys, malformed numbers, or a missing id.
//==========================================================================================================
ServerDescriptor ParseServerDescriptor(const std::string& config);

// Validates required fields for the selected transport. Throws std::invalid_argument.
void ValidateServerDescriptor(const ServerDescriptor& desc);

} // namespace mcplink
