//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ServerDescriptor.cpp
// Purpose: Parsing and validation of semicolon-delimited server descriptor strings
//==========================================================================================================

#include <cctype>
#include <stdexcept>

#include "logging/Logger.h"
#include "mcplink/ServerDescriptor.h"

namespace mcplink {

namespace {
std::string trim(const std::string& s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) {
        ++b;
    }
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) {
        --e;
    }
    return s.substr(b, e - b);
}

std::string lower(std::string s) {
    for (auto& c : s) {
        c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
    }
    return s;
}

unsigned long long parseNumber(const std::string& key, const std::string& val) {
    if (val.empty()) {
        throw std::invalid_argument("Empty value for " + key);
    }
    for (char c : val) {
        if (c < '0' || c > '9') {
            throw std::invalid_argument("Invalid number for " + key + ": " + val);
        }
    }
    try {
        return std::stoull(val);
    } catch (const std::out_of_range&) {
        throw std::invalid_argument("Number out of range for " + key + ": " + val);
    }
}

std::chrono::milliseconds parseMs(const std::string& key, const std::string& val) {
    return std::chrono::milliseconds(static_cast<int64_t>(parseNumber(key, val)));
}
} // namespace

const char* ToString(TransportKind kind) {
    switch (kind) {
        case TransportKind::PushStream: return "sse";
        case TransportKind::Socket: return "ws";
        case TransportKind::Command: return "command";
        case TransportKind::InMemory: return "inmemory";
    }
    return "sse";
}

std::optional<TransportKind> TransportKindFromString(const std::string& s) {
    const std::string v = lower(s);
    if (v == "sse" || v == "http" || v == "https" || v == "pushstream") return TransportKind::PushStream;
    if (v == "ws" || v == "wss" || v == "websocket" || v == "socket") return TransportKind::Socket;
    if (v == "command" || v == "stdio" || v == "process") return TransportKind::Command;
    if (v == "inmemory" || v == "memory") return TransportKind::InMemory;
    return std::nullopt;
}

const char* ToString(AuthMode mode) {
    switch (mode) {
        case AuthMode::None: return "none";
        case AuthMode::Bearer: return "bearer";
        case AuthMode::OAuth2: return "oauth2";
    }
    return "none";
}

ServerDescriptor ParseServerDescriptor(const std::string& config) {
    ServerDescriptor desc;
    std::size_t start = 0;
    while (start < config.size()) {
        std::size_t sep = config.find(';', start);
        if (sep == std::string::npos) { sep = config.size(); }
        std::string kv = trim(config.substr(start, sep - start));
        start = sep + 1;
        if (kv.empty()) {
            continue;
        }
        std::size_t eq = kv.find('=');
        if (eq == std::string::npos) {
            throw std::invalid_argument("Expected key=value in server config: " + kv);
        }
        std::string key = trim(kv.substr(0, eq));
        std::string val = trim(kv.substr(eq + 1));
        if (key == "id") {
            desc.id = val;
        } else if (key == "name") {
            desc.name = val;
        } else if (key == "transport") {
            auto kind = TransportKindFromString(val);
            if (!kind) {
                throw std::invalid_argument("Unknown transport: " + val);
            }
            desc.transport = *kind;
        } else if (key == "endpoint" || key == "url") {
            desc.endpoint = val;
        } else if (key == "command") {
            desc.command = val;
        } else if (key == "arg") {
            desc.args.push_back(val);
        } else if (key == "env") {
            std::size_t e2 = val.find('=');
            if (e2 == std::string::npos) {
                throw std::invalid_argument("env expects NAME=VALUE: " + val);
            }
            desc.env[val.substr(0, e2)] = val.substr(e2 + 1);
        } else if (key == "header") {
            std::size_t colon = val.find(':');
            if (colon == std::string::npos) {
                throw std::invalid_argument("header expects Name:Value: " + val);
            }
            desc.headers[trim(val.substr(0, colon))] = trim(val.substr(colon + 1));
        } else if (key == "auth") {
            const std::string m = lower(val);
            if (m == "none") desc.auth.mode = AuthMode::None;
            else if (m == "bearer") desc.auth.mode = AuthMode::Bearer;
            else if (m == "oauth2") desc.auth.mode = AuthMode::OAuth2;
            else throw std::invalid_argument("Unknown auth mode: " + val);
        } else if (key == "token" || key == "accessToken") {
            desc.auth.accessToken = val;
        } else if (key == "tokenType") {
            desc.auth.tokenType = val;
        } else if (key == "refreshToken") {
            desc.auth.refreshToken = val;
        } else if (key == "scope") {
            desc.auth.scope = val;
        } else if (key == "caFile") {
            desc.caFile = val;
        } else if (key == "caPath") {
            desc.caPath = val;
        } else if (key == "reconnectIntervalMs") {
            desc.reconnectInterval = parseMs(key, val);
        } else if (key == "reconnectMaxDelayMs") {
            desc.reconnectMaxDelay = parseMs(key, val);
        } else if (key == "maxReconnectAttempts") {
            desc.maxReconnectAttempts = static_cast<unsigned int>(parseNumber(key, val));
        } else if (key == "handshakeTimeoutMs") {
            desc.handshakeTimeout = parseMs(key, val);
        } else if (key == "channelOpenTimeoutMs") {
            desc.channelOpenTimeout = parseMs(key, val);
        } else if (key == "heartbeatIntervalMs") {
            desc.heartbeatInterval = parseMs(key, val);
        } else if (key == "heartbeatTimeoutMs") {
            desc.heartbeatTimeout = parseMs(key, val);
        } else if (key == "heartbeatMethod") {
            desc.heartbeatMethod = val;
        } else if (key == "requestTimeoutMs") {
            desc.requestTimeout = parseMs(key, val);
        } else {
            throw std::invalid_argument("Unknown server config key: " + key);
        }
    }
    if (desc.id.empty()) {
        throw std::invalid_argument("Server config requires id");
    }
    if (desc.auth.mode == AuthMode::None && !desc.auth.accessToken.empty()) {
        // A bare token implies bearer auth
        desc.auth.mode = AuthMode::Bearer;
    }
    ValidateServerDescriptor(desc);
    LOG_DEBUG("Parsed server descriptor id={} transport={}", desc.id, ToString(desc.transport));
    return desc;
}

void ValidateServerDescriptor(const ServerDescriptor& desc) {
    if (desc.id.empty()) {
        throw std::invalid_argument("Server descriptor requires an id");
    }
    switch (desc.transport) {
        case TransportKind::PushStream:
        case TransportKind::Socket:
            if (desc.endpoint.empty()) {
                throw std::invalid_argument("Server " + desc.id + " requires an endpoint");
            }
            break;
        case TransportKind::Command:
            if (desc.command.empty()) {
                throw std::invalid_argument("Server " + desc.id + " requires a command");
            }
            break;
        case TransportKind::InMemory:
            break;
    }
    if (desc.heartbeatMethod.empty()) {
        throw std::invalid_argument("Server " + desc.id + " heartbeatMethod must not be empty");
    }
}

} // namespace mcplink
