//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.hpp
// Purpose: In-process scripted MCP server and the client transport attached to it (tests and embedding)
//==========================================================================================================
#pragma once

#include "mcplink/Transport.h"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/auth/IAuth.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace mcplink {

class InMemoryTransport;

//==========================================================================================================
// InMemoryServer
// Purpose: Scriptable in-process MCP peer. Handlers are registered per method; defaults answer initialize
//          and ping. Replies are delivered either as the Submit acknowledgement or over the push channel.
// Notes:
//   - A handler returning nullptr sends no reply (useful to hold a request and answer later via PushRaw).
//   - Handlers run on a transport worker thread, one thread per request.
//==========================================================================================================
class InMemoryServer : public std::enable_shared_from_this<InMemoryServer> {
public:
    using RequestHandler = std::function<std::unique_ptr<JSONRPCResponse>(const JSONRPCRequest&)>;
    using NotificationHandler = std::function<void(const JSONRPCNotification&)>;

    enum class ReplyMode {
        Push,           // replies arrive over the push channel
        Acknowledgement // replies arrive as the Submit acknowledgement body
    };

    enum class ChannelBehavior {
        Open,
        Fail,
        Hang
    };

    static std::shared_ptr<InMemoryServer> Create(std::string name = "inmemory-server");
    ~InMemoryServer();

    ////////////////////////////////////////// Scripting //////////////////////////////////////////
    void On(const std::string& method, RequestHandler handler);
    void OnNotification(NotificationHandler handler);

    // Registers a tool answered by tools/list and tools/call. The callback receives the call arguments.
    void AddTool(const std::string& name, const std::string& description,
                 std::function<JSONValue(const JSONValue& arguments)> call,
                 JSONValue inputSchema = JSONValue{JSONValue::Object{}});

    void SetReplyMode(ReplyMode mode);
    void SetChannelBehavior(ChannelBehavior behavior);
    void SetAcceptConnections(bool accept);
    void SetCapabilities(JSONValue capabilities);

    ////////////////////////////////////////// Driving //////////////////////////////////////////
    // Delivers raw text over the push channel of the attached session. Returns false when none is attached.
    bool PushRaw(const std::string& raw);
    bool PushNotification(const std::string& method, std::optional<JSONValue> params = std::nullopt);

    // Simulates loss of the attached session (the client's close handler fires).
    void DropConnection(const std::string& reason = "connection reset by peer");

    ////////////////////////////////////////// Inspection //////////////////////////////////////////
    std::vector<std::string> ReceivedMethods() const;
    std::vector<std::string> ReceivedMessages() const;
    std::vector<std::vector<auth::HeaderKV>> ReceivedHeaders() const;
    std::size_t CountReceived(const std::string& method) const;
    unsigned int StartCount() const;
    bool HasSession() const;

private:
    friend class InMemoryTransport;
    explicit InMemoryServer(std::string name);

    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransport
// Purpose: Client-side ITransport bound to an InMemoryServer. Pushed messages are delivered in order by a
//          dedicated worker thread.
//==========================================================================================================
class InMemoryTransport : public ITransport {
public:
    InMemoryTransport(std::shared_ptr<InMemoryServer> server, auth::IAuthPtr auth = nullptr);
    virtual ~InMemoryTransport();

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
    friend class InMemoryServer;
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

//==========================================================================================================
// InMemoryTransportFactory
// Purpose: Creates InMemoryTransports attached to one server regardless of the descriptor's kind, so tests
//          can drive a registry configured with real endpoints.
//==========================================================================================================
class InMemoryTransportFactory : public ITransportFactory {
public:
    explicit InMemoryTransportFactory(std::shared_ptr<InMemoryServer> server) : server(std::move(server)) {}
    std::unique_ptr<ITransport> CreateTransport(const ServerDescriptor& desc) override;

private:
    std::shared_ptr<InMemoryServer> server;
};

} // namespace mcplink
