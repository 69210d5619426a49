//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: WebSocketTransport.hpp
// Purpose: ws/wss client transport on Boost.Beast websocket
//==========================================================================================================
#pragma once

#include <memory>
#include <string>

#include "mcplink/Transport.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/auth/IAuth.hpp"

namespace mcplink {

//==========================================================================================================
// WebSocketTransport
// Purpose: Socket transport. One websocket carries both directions.
// Notes:
//   - Start() resolves, connects, performs the TLS handshake for wss, then the websocket upgrade with the
//     descriptor and auth headers. HTTP 401/403 on upgrade fails with Unauthorized.
//   - OpenPushChannel() completes immediately once started; every inbound text frame is a pushed message.
//   - Submit() writes one text frame; writes are serialized in submission order. There is no
//     acknowledgement body.
//==========================================================================================================
class WebSocketTransport : public ITransport {
public:
    WebSocketTransport(const ServerDescriptor& desc, auth::IAuthPtr auth);
    virtual ~WebSocketTransport();

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
