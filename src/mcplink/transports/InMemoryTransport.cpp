//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: InMemoryTransport.cpp
// Purpose: In-memory transport and scripted server implementation
//==========================================================================================================

#include <atomic>
#include <condition_variable>
#include <deque>
#include <future>
#include <map>
#include <mutex>
#include <random>
#include <stop_token>
#include <string>
#include <thread>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/JsonRpcCodec.h"
#include "mcplink/Protocol.h"
#include "mcplink/errors/Errors.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/auth/BearerAuth.hpp"
#include "mcplink/transports/InMemoryTransport.hpp"

namespace mcplink {

////////////////////////////////////////// Client session //////////////////////////////////////////

class InMemoryTransport::Impl {
public:
    struct Item {
        bool close{false};
        std::string payload;
    };

    std::shared_ptr<InMemoryServer> server;
    auth::IAuthPtr auth;
    std::atomic<bool> connected{false};
    std::atomic<bool> closed{false};
    std::string sessionId;

    std::mutex handlerMutex;
    ITransport::MessageHandler messageHandler;
    ITransport::CloseHandler closeHandler;
    ITransport::ErrorHandler errorHandler;

    std::mutex queueMutex;
    std::condition_variable_any queueCondition;
    std::deque<Item> queue;
    std::jthread worker;

    std::mutex channelMutex;
    std::vector<std::promise<void>> hungChannels; // kept unresolved for ChannelBehavior::Hang

    Impl() {
        std::random_device rd;
        std::mt19937 gen(rd());
        std::uniform_int_distribution<> dis(1000, 9999);
        sessionId = "memory-" + std::to_string(dis(gen));
    }

    void startWorker(const std::shared_ptr<Impl>& self) {
        worker = std::jthread([self](std::stop_token st) {
            while (!st.stop_requested()) {
                Item item;
                {
                    std::unique_lock<std::mutex> lock(self->queueMutex);
                    self->queueCondition.wait(lock, st, [&self]() { return !self->queue.empty(); });
                    if (st.stop_requested()) {
                        break;
                    }
                    item = std::move(self->queue.front());
                    self->queue.pop_front();
                }
                self->dispatch(item);
            }
        });
    }

    void dispatch(const Item& item) {
        if (closed.load()) {
            return;
        }
        if (item.close) {
            connected = false;
            ITransport::CloseHandler h;
            {
                std::lock_guard<std::mutex> lk(handlerMutex);
                h = closeHandler;
            }
            if (h) {
                h(item.payload);
            }
            return;
        }
        ITransport::MessageHandler h;
        {
            std::lock_guard<std::mutex> lk(handlerMutex);
            h = messageHandler;
        }
        if (h) {
            h(item.payload);
        } else {
            LOG_WARN("InMemoryTransport: no message handler; dropping pushed message");
        }
    }

    bool enqueue(Item item) {
        if (!connected.load()) {
            return false;
        }
        {
            std::lock_guard<std::mutex> lock(queueMutex);
            queue.push_back(std::move(item));
        }
        queueCondition.notify_one();
        return true;
    }

    void stopWorker() {
        if (!worker.joinable()) {
            return;
        }
        worker.request_stop();
        queueCondition.notify_all();
        if (worker.get_id() == std::this_thread::get_id()) {
            // Closing from inside a handler; the thread exits after the current dispatch
            worker.detach();
        } else {
            worker.join();
        }
    }
};

////////////////////////////////////////// Scripted server //////////////////////////////////////////

class InMemoryServer::Impl {
public:
    struct ToolEntry {
        std::string description;
        JSONValue inputSchema;
        std::function<JSONValue(const JSONValue&)> call;
    };

    std::string name;
    mutable std::mutex mutex;
    std::unordered_map<std::string, RequestHandler> handlers;
    NotificationHandler notificationHandler;
    std::map<std::string, ToolEntry> tools; // ordered so tools/list is deterministic
    ReplyMode replyMode{ReplyMode::Push};
    ChannelBehavior channelBehavior{ChannelBehavior::Open};
    bool accept{true};
    JSONValue capabilities;

    std::weak_ptr<InMemoryTransport::Impl> session;
    std::vector<std::string> messages;
    std::vector<std::string> methods;
    std::vector<std::vector<auth::HeaderKV>> headers;
    unsigned int startCount{0u};

    explicit Impl(std::string n) : name(std::move(n)) {
        capabilities = MakeObject({
            {"tools", MakeObject({{"listChanged", JSONValue(true)}})},
            {"resources", MakeObject({{"subscribe", JSONValue(false)}, {"listChanged", JSONValue(true)}})},
            {"prompts", MakeObject({{"listChanged", JSONValue(true)}})},
            {"logging", JSONValue{JSONValue::Object{}}}
        });
    }

    std::unique_ptr<JSONRPCResponse> handle(const JSONRPCRequest& req) {
        RequestHandler custom;
        {
            std::lock_guard<std::mutex> lk(mutex);
            auto it = handlers.find(req.method);
            if (it != handlers.end()) {
                custom = it->second;
            }
        }
        if (custom) {
            auto resp = custom(req);
            if (resp) {
                resp->id = req.id;
            }
            return resp;
        }
        if (req.method == Methods::Initialize) {
            JSONValue caps;
            {
                std::lock_guard<std::mutex> lk(mutex);
                caps = capabilities;
            }
            JSONValue result = MakeObject({
                {"protocolVersion", JSONValue(PROTOCOL_VERSION)},
                {"capabilities", caps},
                {"serverInfo", MakeObject({{"name", JSONValue(name)}, {"version", JSONValue("1.0.0")}})}
            });
            return std::make_unique<JSONRPCResponse>(req.id, std::move(result));
        }
        if (req.method == Methods::Ping) {
            return std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        }
        if (req.method == Methods::ListTools) {
            JSONValue::Array arr;
            {
                std::lock_guard<std::mutex> lk(mutex);
                for (const auto& [toolName, entry] : tools) {
                    arr.push_back(std::make_shared<JSONValue>(ToolToJSON(Tool(toolName, entry.description, entry.inputSchema))));
                }
            }
            return std::make_unique<JSONRPCResponse>(req.id, MakeObject({{"tools", JSONValue(std::move(arr))}}));
        }
        if (req.method == Methods::CallTool) {
            const JSONValue params = req.params.value_or(JSONValue{JSONValue::Object{}});
            const std::string toolName = GetString(params, "name").value_or("");
            std::function<JSONValue(const JSONValue&)> call;
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = tools.find(toolName);
                if (it != tools.end()) {
                    call = it->second.call;
                }
            }
            if (!call) {
                return CreateErrorResponse(req.id, JSONRPCErrorCodes::ToolNotFound, "Unknown tool: " + toolName);
            }
            const JSONValue* args = params.Find("arguments");
            return std::make_unique<JSONRPCResponse>(req.id, call(args ? *args : JSONValue{JSONValue::Object{}}));
        }
        return CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound, "Method not found: " + req.method);
    }
};

////////////////////////////////////////// InMemoryServer //////////////////////////////////////////

InMemoryServer::InMemoryServer(std::string name) : pImpl(std::make_shared<Impl>(std::move(name))) {}

InMemoryServer::~InMemoryServer() = default;

std::shared_ptr<InMemoryServer> InMemoryServer::Create(std::string name) {
    return std::shared_ptr<InMemoryServer>(new InMemoryServer(std::move(name)));
}

void InMemoryServer::On(const std::string& method, RequestHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->handlers[method] = std::move(handler);
}

void InMemoryServer::OnNotification(NotificationHandler handler) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->notificationHandler = std::move(handler);
}

void InMemoryServer::AddTool(const std::string& name, const std::string& description,
                             std::function<JSONValue(const JSONValue&)> call, JSONValue inputSchema) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->tools[name] = Impl::ToolEntry{description, std::move(inputSchema), std::move(call)};
}

void InMemoryServer::SetReplyMode(ReplyMode mode) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->replyMode = mode;
}

void InMemoryServer::SetChannelBehavior(ChannelBehavior behavior) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->channelBehavior = behavior;
}

void InMemoryServer::SetAcceptConnections(bool accept) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->accept = accept;
}

void InMemoryServer::SetCapabilities(JSONValue capabilities) {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->capabilities = std::move(capabilities);
}

bool InMemoryServer::PushRaw(const std::string& raw) {
    std::shared_ptr<InMemoryTransport::Impl> s;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        s = pImpl->session.lock();
    }
    if (!s) {
        return false;
    }
    return s->enqueue(InMemoryTransport::Impl::Item{false, raw});
}

bool InMemoryServer::PushNotification(const std::string& method, std::optional<JSONValue> params) {
    JSONRPCNotification n(method, std::move(params));
    return PushRaw(n.Serialize());
}

void InMemoryServer::DropConnection(const std::string& reason) {
    std::shared_ptr<InMemoryTransport::Impl> s;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        s = pImpl->session.lock();
        pImpl->session.reset();
    }
    if (!s) {
        return;
    }
    LOG_INFO("InMemoryServer {}: dropping session {} ({})", pImpl->name, s->sessionId, reason);
    // Close marker travels behind already-queued messages
    s->enqueue(InMemoryTransport::Impl::Item{true, reason});
}

std::vector<std::string> InMemoryServer::ReceivedMethods() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->methods;
}

std::vector<std::string> InMemoryServer::ReceivedMessages() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->messages;
}

std::vector<std::vector<auth::HeaderKV>> InMemoryServer::ReceivedHeaders() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->headers;
}

std::size_t InMemoryServer::CountReceived(const std::string& method) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    std::size_t n = 0;
    for (const auto& m : pImpl->methods) {
        if (m == method) {
            ++n;
        }
    }
    return n;
}

unsigned int InMemoryServer::StartCount() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->startCount;
}

bool InMemoryServer::HasSession() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return !pImpl->session.expired();
}

////////////////////////////////////////// InMemoryTransport //////////////////////////////////////////

InMemoryTransport::InMemoryTransport(std::shared_ptr<InMemoryServer> server, auth::IAuthPtr auth)
    : pImpl(std::make_shared<Impl>()) {
    FUNC_SCOPE();
    pImpl->server = std::move(server);
    pImpl->auth = std::move(auth);
}

InMemoryTransport::~InMemoryTransport() {
    FUNC_SCOPE();
    Close();
}

std::future<void> InMemoryTransport::Start() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    auto& srv = *pImpl->server->pImpl;
    {
        std::lock_guard<std::mutex> lk(srv.mutex);
        ++srv.startCount;
        if (!srv.accept) {
            promise.set_exception(std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::TransportLost, "Connection refused by " + srv.name)));
            return fut;
        }
        srv.session = pImpl;
    }
    LOG_DEBUG("Starting InMemoryTransport {}", pImpl->sessionId);
    pImpl->connected = true;
    pImpl->startWorker(pImpl);
    promise.set_value();
    return fut;
}

std::future<void> InMemoryTransport::OpenPushChannel() {
    FUNC_SCOPE();
    std::promise<void> promise;
    auto fut = promise.get_future();
    InMemoryServer::ChannelBehavior behavior;
    {
        std::lock_guard<std::mutex> lk(pImpl->server->pImpl->mutex);
        behavior = pImpl->server->pImpl->channelBehavior;
    }
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::ChannelOpenFailed, "Transport not started")));
        return fut;
    }
    switch (behavior) {
        case InMemoryServer::ChannelBehavior::Open:
            promise.set_value();
            break;
        case InMemoryServer::ChannelBehavior::Fail:
            promise.set_exception(std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::ChannelOpenFailed, "Push channel rejected by server")));
            break;
        case InMemoryServer::ChannelBehavior::Hang: {
            std::lock_guard<std::mutex> lk(pImpl->channelMutex);
            pImpl->hungChannels.push_back(std::move(promise));
            break;
        }
    }
    return fut;
}

std::future<void> InMemoryTransport::Close() {
    FUNC_SCOPE();
    if (!pImpl->closed.exchange(true)) {
        LOG_DEBUG("Closing InMemoryTransport {}", pImpl->sessionId);
        pImpl->connected = false;
        {
            auto& srv = *pImpl->server->pImpl;
            std::lock_guard<std::mutex> lk(srv.mutex);
            if (srv.session.lock() == pImpl) {
                srv.session.reset();
            }
        }
        pImpl->stopWorker();
        {
            std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
            pImpl->messageHandler = nullptr;
            pImpl->closeHandler = nullptr;
            pImpl->errorHandler = nullptr;
        }
    }
    std::promise<void> promise; promise.set_value(); return promise.get_future();
}

bool InMemoryTransport::IsConnected() const { FUNC_SCOPE(); return pImpl->connected; }
std::string InMemoryTransport::GetSessionId() const { FUNC_SCOPE(); return pImpl->sessionId; }

std::future<std::optional<std::string>> InMemoryTransport::Submit(const std::string& payload) {
    FUNC_SCOPE();
    std::promise<std::optional<std::string>> promise;
    auto fut = promise.get_future();
    if (!pImpl->connected.load()) {
        promise.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::TransportLost, "InMemoryTransport not connected")));
        return fut;
    }

    auto srv = pImpl->server->pImpl;
    DecodedMessage decoded = DecodeMessage(payload);
    InMemoryServer::ReplyMode mode;
    InMemoryServer::NotificationHandler onNote;
    {
        std::lock_guard<std::mutex> lk(srv->mutex);
        srv->messages.push_back(payload);
        srv->headers.push_back(pImpl->auth ? pImpl->auth->headers() : std::vector<auth::HeaderKV>{});
        if (decoded.request) {
            srv->methods.push_back(decoded.request->method);
        } else if (decoded.notification) {
            srv->methods.push_back(decoded.notification->method);
        }
        mode = srv->replyMode;
        onNote = srv->notificationHandler;
    }
    LOG_DEBUG("InMemoryTransport {} submit: {}", pImpl->sessionId, payload);

    if (decoded.kind == MessageKind::Request) {
        // Handle each request on a separate thread so a held request never blocks later traffic
        std::thread([srv, session = pImpl, req = std::move(*decoded.request), mode, pr = std::move(promise)]() mutable {
            std::unique_ptr<JSONRPCResponse> resp;
            try {
                resp = srv->handle(req);
            } catch (const std::exception& e) {
                LOG_ERROR("InMemoryServer handler exception: {}", e.what());
                resp = CreateErrorResponse(req.id, JSONRPCErrorCodes::InternalError, e.what());
            }
            if (!resp) {
                pr.set_value(std::nullopt);
                return;
            }
            if (mode == InMemoryServer::ReplyMode::Acknowledgement) {
                pr.set_value(resp->Serialize());
            } else {
                pr.set_value(std::nullopt);
                if (!session->enqueue(InMemoryTransport::Impl::Item{false, resp->Serialize()})) {
                    LOG_WARN("InMemoryServer: session closed before reply to {}", req.method);
                }
            }
        }).detach();
        return fut;
    }

    if (decoded.kind == MessageKind::Notification && onNote) {
        onNote(*decoded.notification);
    } else if (decoded.kind == MessageKind::Invalid) {
        LOG_WARN("InMemoryServer received invalid message: {}", decoded.error);
    }
    promise.set_value(std::nullopt);
    return fut;
}

void InMemoryTransport::SetMessageHandler(MessageHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->messageHandler = std::move(handler);
}

void InMemoryTransport::SetCloseHandler(CloseHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->closeHandler = std::move(handler);
}

void InMemoryTransport::SetErrorHandler(ErrorHandler handler) {
    FUNC_SCOPE();
    std::lock_guard<std::mutex> lk(pImpl->handlerMutex);
    pImpl->errorHandler = std::move(handler);
}

std::unique_ptr<ITransport> InMemoryTransportFactory::CreateTransport(const ServerDescriptor& desc) {
    return std::make_unique<InMemoryTransport>(server, auth::MakeAuthProvider(desc.auth));
}

} // namespace mcplink
