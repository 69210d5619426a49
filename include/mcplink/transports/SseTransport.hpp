//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: SseTransport.hpp
// Purpose: HTTP(S) Server-Sent Events client transport (GET event stream + POST submission) on Boost.Beast
//==========================================================================================================
#pragma once

#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "mcplink/Transport.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/auth/IAuth.hpp"

namespace mcplink {

//==========================================================================================================
// SseEvent / SseEventParser
// Purpose: Incremental text/event-stream decoder. Feed() accepts arbitrary chunks and returns the events
//          completed by them. Comment lines (":") are ignored; "data" lines are joined with '\n'.
//==========================================================================================================
struct SseEvent {
    std::string event{"message"};
    std::string data;
    std::string id;
};

class SseEventParser {
public:
    std::vector<SseEvent> Feed(std::string_view chunk);
    void Reset();

private:
    void processLine(std::string_view line, std::vector<SseEvent>& out);

    std::string buffer;
    std::string eventName;
    std::string data;
    std::string lastId;
    bool haveData{false};
};

// "endpoint" redirects submission; "message" and "notification" carry JSON-RPC traffic; other events are
// ignored.
enum class SseEventRoute {
    Endpoint,
    Deliver,
    Ignore
};

SseEventRoute RouteSseEvent(const SseEvent& ev);

//==========================================================================================================
// SsePostReply / SettlePostReply
// Purpose: Maps the HTTP reply to a submitted message onto the acknowledgement contract.
// Returns:
//   The body when it is the synchronous JSON-RPC acknowledgement. std::nullopt for 202/204 or an empty
//   body, and for an event-stream body, whose decoded events are appended to streamed.
// Throws:
//   errors::ClientError Unauthorized on 401/403, TransportLost on 5xx, InvalidMessage on any other 4xx.
//==========================================================================================================
struct SsePostReply {
    unsigned status{0};
    std::string contentType;
    std::string body;
};

std::optional<std::string> SettlePostReply(const SsePostReply& reply, std::vector<SseEvent>& streamed);

//==========================================================================================================
// SseTransport
// Purpose: PushStream transport.
// Notes:
//   - Start() validates the endpoint and brings up the I/O thread. Until the stream announces an "endpoint"
//     event, messages are POSTed to the configured endpoint URL itself.
//   - OpenPushChannel() issues GET with Accept: text/event-stream and completes when response headers arrive.
//     401/403 fail with Unauthorized, any other non-2xx status with ChannelOpenFailed.
//   - Submit() POSTs application/json with descriptor headers plus auth headers. A JSON body in the reply is
//     returned as the acknowledgement; an event-stream body is delivered through the message handler.
//   - The stream ending (or the socket failing) after open is reported through the close handler.
//==========================================================================================================
class SseTransport : public ITransport {
public:
    SseTransport(const ServerDescriptor& desc, auth::IAuthPtr auth);
    virtual ~SseTransport();

    ////////////////////////////////////////// ITransport //////////////////////////////////////////
    std::future<void> Start() override;
    std::future<void> OpenPushChannel() override;
    std::future<void> Close() override;
    bool IsConnected() const override;
    std::string GetSessionId() const override;
    std::future<std::optional<std::string>> Submit(const std::string& payload) override;
    void SetMessageHandler(MessageHandler handler) override;
    void SetCloseHandler(CloseHandler handler) override;
    void SetErrorHandler(ErrorHandler handler) override;

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcplink
