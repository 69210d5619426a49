//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Connection.cpp
// Purpose: Per-server MCP protocol client implementation (coroutine handshake, heartbeat, reconnect)
//==========================================================================================================

#include <atomic>
#include <chrono>
#include <mutex>
#include <unordered_set>
#include <utility>

#include "logging/Logger.h"
#include "mcplink/Connection.h"
#include "mcplink/JsonRpcCodec.h"
#include "mcplink/async/FutureAwaitable.h"
#include "mcplink/async/Task.h"
#include "mcplink/version.h"

namespace mcplink {

namespace {
template <typename T>
std::future<T> failedFuture(errors::ErrorKind kind, const std::string& message) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(errors::ClientError(kind, message)));
    return p.get_future();
}

std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

// Maps an MCP log level (RFC 5424 names) onto the ring severity.
LogSeverity severityFromMcpLevel(const std::string& level) {
    if (level == "debug") return LogSeverity::Debug;
    if (level == "info" || level == "notice") return LogSeverity::Info;
    if (level == "warning") return LogSeverity::Warn;
    if (level == "error" || level == "critical" || level == "alert" || level == "emergency") return LogSeverity::Error;
    return LogSeverity::Info;
}

// Upper bound on tools/list pages followed in one ListTools call.
constexpr int kMaxListPages = 1000;
} // namespace

const char* ToString(ConnectionState state) {
    switch (state) {
        case ConnectionState::Disconnected: return "disconnected";
        case ConnectionState::Connecting: return "connecting";
        case ConnectionState::Handshaking: return "handshaking";
        case ConnectionState::Connected: return "connected";
        case ConnectionState::Reconnecting: return "reconnecting";
        case ConnectionState::Error: return "error";
    }
    return "disconnected";
}

const char* ToString(ConnectionEventKind kind) {
    switch (kind) {
        case ConnectionEventKind::StateChanged: return "stateChanged";
        case ConnectionEventKind::ToolListChanged: return "toolListChanged";
        case ConnectionEventKind::ResourceListChanged: return "resourceListChanged";
        case ConnectionEventKind::ResourceUpdated: return "resourceUpdated";
        case ConnectionEventKind::PromptListChanged: return "promptListChanged";
        case ConnectionEventKind::LogMessage: return "logMessage";
        case ConnectionEventKind::Progress: return "progress";
        case ConnectionEventKind::Log: return "log";
        case ConnectionEventKind::Fatal: return "fatal";
    }
    return "log";
}

class Connection::Impl {
public:
    Connection& owner;
    std::shared_ptr<ITransportFactory> factory;
    std::shared_ptr<Scheduler> scheduler;
    PendingRequestTable pending;
    const std::string serverId;
    std::atomic<uint64_t> requestCounter{0};

    mutable std::mutex mutex;
    std::shared_ptr<const ServerDescriptor> desc;
    ConnectionState state{ConnectionState::Disconnected};
    uint64_t generation{0};
    unsigned int attempts{0};
    std::shared_ptr<ITransport> transport;
    std::optional<InitializeResult> initResult;
    std::shared_ptr<TimerHandle> heartbeatTimer;
    std::shared_ptr<TimerHandle> reconnectTimer;
    std::vector<std::promise<void>> connectWaiters;
    std::optional<std::vector<Tool>> toolCache;

    Impl(Connection& o, std::shared_ptr<const ServerDescriptor> d, std::shared_ptr<ITransportFactory> f,
         std::shared_ptr<Scheduler> s)
        : owner(o), factory(std::move(f)), scheduler(std::move(s)), pending(*scheduler), serverId(d->id),
          desc(std::move(d)) {}

    ~Impl() {
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lk(mutex);
            cancelTimersLocked();
            t = std::move(transport);
        }
        if (t) {
            (void)t->Close();
        }
    }

    ////////////////////////////////////////// Helpers //////////////////////////////////////////
    std::shared_ptr<const ServerDescriptor> descriptor() const {
        std::lock_guard<std::mutex> lk(mutex);
        return desc;
    }

    bool isCurrent(uint64_t gen) const {
        std::lock_guard<std::mutex> lk(mutex);
        return gen == generation;
    }

    std::string nextRequestId() {
        const auto now = std::chrono::duration_cast<std::chrono::milliseconds>(
            std::chrono::system_clock::now().time_since_epoch()).count();
        return "req_" + std::to_string(++requestCounter) + "_" + std::to_string(now);
    }

    void cancelTimersLocked() {
        if (heartbeatTimer) {
            heartbeatTimer->Cancel();
            heartbeatTimer.reset();
        }
        if (reconnectTimer) {
            reconnectTimer->Cancel();
            reconnectTimer.reset();
        }
    }

    void transitionLocked(ConnectionState next, std::vector<ConnectionEvent>& outbox,
                          std::optional<errors::ErrorKind> cause = std::nullopt, unsigned int attempt = 0) {
        if (state == next) {
            return;
        }
        ConnectionEvent ev;
        ev.kind = ConnectionEventKind::StateChanged;
        ev.serverId = serverId;
        ev.previousState = state;
        ev.state = next;
        ev.attempt = attempt;
        ev.error = cause;
        LOG_INFO("Server {}: {} -> {}", serverId, ToString(state), ToString(next));
        state = next;
        outbox.push_back(std::move(ev));
    }

    void publish(std::vector<ConnectionEvent>& outbox) {
        for (const auto& ev : outbox) {
            owner.events.Publish(ev);
        }
        outbox.clear();
    }

    void emitLog(LogSeverity severity, std::string message, std::optional<LogDirection> direction = std::nullopt,
                 std::optional<JSONValue> data = std::nullopt) {
        ConnectionEvent ev;
        ev.kind = ConnectionEventKind::Log;
        ev.serverId = serverId;
        ev.severity = severity;
        ev.message = std::move(message);
        ev.direction = direction;
        ev.params = std::move(data);
        owner.events.Publish(ev);
    }

    ////////////////////////////////////////// Transport plumbing //////////////////////////////////////////
    void wireTransport(const std::shared_ptr<ITransport>& t, uint64_t gen) {
        std::weak_ptr<Connection> weak = owner.weak_from_this();
        t->SetMessageHandler([weak, gen](const std::string& raw) {
            auto self = weak.lock();
            if (self && self->pImpl->isCurrent(gen)) {
                self->OnPushMessage(raw);
            }
        });
        t->SetCloseHandler([weak, gen](const std::string& reason) {
            auto self = weak.lock();
            if (!self) {
                return;
            }
            self->pImpl->scheduler->Post([weak, gen, reason]() {
                if (auto s = weak.lock()) {
                    s->pImpl->handleTransportLoss(gen, reason);
                }
            });
        });
        t->SetErrorHandler([weak](const std::string& error) {
            if (auto self = weak.lock()) {
                self->pImpl->emitLog(LogSeverity::Warn, "transport: " + error);
            }
        });
    }

    bool adoptTransport(const std::shared_ptr<ITransport>& t, uint64_t gen) {
        std::lock_guard<std::mutex> lk(mutex);
        if (gen != generation) {
            return false;
        }
        transport = t;
        return true;
    }

    void submit(const std::shared_ptr<ITransport>& t, uint64_t gen, const std::string& payload,
                std::optional<std::string> requestId) {
        LOG_DEBUG("Server {} <- {}", serverId, payload);
        emitLog(LogSeverity::Debug, payload, LogDirection::Sent);
        (void)coAwaitAck(owner.shared_from_this(), gen, t->Submit(payload), std::move(requestId));
    }

    // Routes a Submit acknowledgement body through OnPushMessage; a failed Submit fails its request and,
    // for TransportLost, the session.
    static async::Task<void> coAwaitAck(std::shared_ptr<Connection> self, uint64_t gen,
                                        std::future<std::optional<std::string>> ack,
                                        std::optional<std::string> requestId) {
        Impl& impl = *self->pImpl;
        std::optional<std::string> body;
        std::exception_ptr failure;
        bool lost = false;
        std::string reason;
        try {
            body = co_await async::makeFutureAwaitable(std::move(ack));
        } catch (const errors::ClientError& e) {
            failure = std::current_exception();
            lost = e.kind() == errors::ErrorKind::TransportLost;
            reason = e.what();
        } catch (const std::exception& e) {
            failure = std::make_exception_ptr(errors::ClientError(errors::ErrorKind::TransportLost, e.what()));
            lost = true;
            reason = e.what();
        }
        if (failure) {
            if (requestId) {
                (void)impl.pending.Reject(*requestId, failure);
            }
            LOG_WARN("Server {}: submit failed: {}", impl.serverId, reason);
            impl.emitLog(LogSeverity::Error, "submit failed: " + reason);
            if (lost) {
                std::weak_ptr<Connection> weak = self;
                impl.scheduler->Post([weak, gen, reason]() {
                    if (auto s = weak.lock()) {
                        s->pImpl->handleTransportLoss(gen, reason);
                    }
                });
            }
            co_return;
        }
        if (body && !body->empty() && impl.isCurrent(gen)) {
            self->OnPushMessage(*body);
        }
    }

    ////////////////////////////////////////// Connect //////////////////////////////////////////
    // A reconnect-timer attempt passes the generation it was armed under; it is abandoned when Disconnect()
    // or a manual Connect() has moved the connection on since then.
    std::future<void> startAttempt(bool manual, std::optional<uint64_t> armedGen = std::nullopt) {
        std::promise<void> waiter;
        auto fut = waiter.get_future();
        std::vector<ConnectionEvent> outbox;
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (armedGen && (*armedGen != generation || state != ConnectionState::Reconnecting)) {
                LOG_DEBUG("Server {}: stale reconnect timer ignored", serverId);
                waiter.set_value();
                return fut;
            }
            if (state == ConnectionState::Connected) {
                waiter.set_value();
                return fut;
            }
            if (state == ConnectionState::Connecting || state == ConnectionState::Handshaking) {
                connectWaiters.push_back(std::move(waiter));
                return fut;
            }
            if (manual) {
                attempts = 0;
            }
            if (reconnectTimer) {
                reconnectTimer->Cancel();
                reconnectTimer.reset();
            }
            gen = ++generation;
            connectWaiters.push_back(std::move(waiter));
            transitionLocked(ConnectionState::Connecting, outbox);
        }
        publish(outbox);
        (void)coConnect(owner.shared_from_this(), gen);
        return fut;
    }

    static async::Task<void> coConnect(std::shared_ptr<Connection> self, uint64_t gen) {
        Impl& impl = *self->pImpl;
        const auto d = impl.descriptor();
        std::exception_ptr failure;
        try {
            std::shared_ptr<ITransport> t(impl.factory->CreateTransport(*d));
            impl.wireTransport(t, gen);
            if (!impl.adoptTransport(t, gen)) {
                (void)t->Close();
                co_return;
            }
            co_await async::makeFutureAwaitable(t->Start());

            // initialize, bounded by the handshake timeout
            const std::string initId = impl.nextRequestId();
            auto initFut = impl.pending.Register(initId, d->handshakeTimeout, Methods::Initialize);
            JSONRPCRequest initReq(initId, Methods::Initialize,
                                   BuildInitializeParams(Implementation(kClientName, getVersionString()),
                                                         ClientCapabilities{}));
            impl.submit(t, gen, initReq.Serialize(), initId);
            JSONValue initValue;
            try {
                initValue = co_await async::makeFutureAwaitable(std::move(initFut));
            } catch (const errors::ClientError& e) {
                if (e.kind() == errors::ErrorKind::RequestTimeout) {
                    throw errors::ClientError(errors::ErrorKind::HandshakeTimeout,
                        "initialize timed out after " + std::to_string(d->handshakeTimeout.count()) + " ms");
                }
                if (e.kind() == errors::ErrorKind::RemoteError) {
                    const std::string msg = std::string("initialize rejected: ") + e.what();
                    if (e.remote()) {
                        throw errors::ClientError(errors::ErrorKind::HandshakeRejected, msg, *e.remote());
                    }
                    throw errors::ClientError(errors::ErrorKind::HandshakeRejected, msg);
                }
                throw;
            }
            InitializeResult init;
            try {
                init = ParseInitializeResult(initValue);
            } catch (const std::runtime_error& e) {
                throw errors::ClientError(errors::ErrorKind::HandshakeRejected,
                                          std::string("invalid initialize result: ") + e.what());
            }
            if (init.protocolVersion != PROTOCOL_VERSION) {
                LOG_INFO("Server {}: negotiated protocol version {} (requested {})", impl.serverId,
                         init.protocolVersion, PROTOCOL_VERSION);
            }
            impl.submit(t, gen, JSONRPCNotification(Methods::Initialized).Serialize(), std::nullopt);
            if (!impl.enterHandshaking(gen, std::move(init))) {
                co_return;
            }

            // push channel, bounded by the channel-open timeout
            auto channel = t->OpenPushChannel();
            const auto bound = d->channelOpenTimeout.count() > 0 ? d->channelOpenTimeout
                                                                  : std::chrono::milliseconds(std::chrono::hours(24));
            const bool opened = co_await async::waitFor(channel, bound);
            if (!opened) {
                throw errors::ClientError(errors::ErrorKind::ChannelOpenFailed,
                    "push channel did not open within " + std::to_string(bound.count()) + " ms");
            }
            try {
                channel.get();
            } catch (const errors::ClientError&) {
                throw;
            } catch (const std::exception& e) {
                throw errors::ClientError(errors::ErrorKind::ChannelOpenFailed, e.what());
            }
            impl.completeConnect(gen);
            co_return;
        } catch (const errors::ClientError&) {
            failure = std::current_exception();
        } catch (const std::exception& e) {
            failure = std::make_exception_ptr(
                errors::ClientError(errors::ErrorKind::TransportLost, std::string("connect failed: ") + e.what()));
        }
        impl.failAttempt(gen, failure);
    }

    bool enterHandshaking(uint64_t gen, InitializeResult init) {
        std::vector<ConnectionEvent> outbox;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (gen != generation) {
                return false;
            }
            LOG_INFO("Server {}: initialized with {} {} (protocol {})", serverId, init.serverInfo.name,
                     init.serverInfo.version, init.protocolVersion);
            initResult = std::move(init);
            transitionLocked(ConnectionState::Handshaking, outbox);
        }
        publish(outbox);
        return true;
    }

    void completeConnect(uint64_t gen) {
        std::vector<ConnectionEvent> outbox;
        std::vector<std::promise<void>> waiters;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (gen != generation) {
                return;
            }
            attempts = 0;
            transitionLocked(ConnectionState::Connected, outbox);
            startHeartbeatLocked(gen);
            waiters.swap(connectWaiters);
        }
        publish(outbox);
        emitLog(LogSeverity::Info, "connected");
        for (auto& w : waiters) {
            w.set_value();
        }
    }

    void failAttempt(uint64_t gen, std::exception_ptr failure) {
        errors::ErrorKind kind = errors::ErrorKind::TransportLost;
        std::string what;
        try {
            std::rethrow_exception(failure);
        } catch (const errors::ClientError& e) {
            kind = e.kind();
            what = e.what();
        } catch (const std::exception& e) {
            what = e.what();
        }

        std::vector<ConnectionEvent> outbox;
        std::vector<std::promise<void>> waiters;
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (gen != generation) {
                return; // superseded; Disconnect() already settled the waiters
            }
            ++generation;
            cancelTimersLocked();
            t = std::move(transport);
            initResult.reset();
            waiters.swap(connectWaiters);
            transitionLocked(ConnectionState::Error, outbox, kind);
            scheduleReconnectLocked(outbox);
        }
        LOG_WARN("Server {}: connect failed ({}): {}", serverId, errors::ToString(kind), what);
        emitLog(LogSeverity::Error, std::string("connect failed (") + errors::ToString(kind) + "): " + what);
        (void)pending.DrainAll(errors::ErrorKind::TransportLost, "connect attempt failed");
        if (t) {
            (void)t->Close();
        }
        publish(outbox);
        for (auto& w : waiters) {
            w.set_exception(failure);
        }
    }

    ////////////////////////////////////////// Failure / reconnect //////////////////////////////////////////
    void handleTransportLoss(uint64_t gen, const std::string& reason) {
        std::vector<ConnectionEvent> outbox;
        std::shared_ptr<ITransport> t;
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (gen != generation) {
                return;
            }
            if (state == ConnectionState::Connecting || state == ConnectionState::Handshaking) {
                // The running attempt observes the loss through its own awaited operations.
                t = nullptr;
            } else if (state != ConnectionState::Connected) {
                return;
            } else {
                ++generation;
                cancelTimersLocked();
                t = std::move(transport);
                initResult.reset();
                toolCache.reset();
                transitionLocked(ConnectionState::Disconnected, outbox, errors::ErrorKind::TransportLost);
            }
        }
        if (!t) {
            (void)pending.DrainAll(errors::ErrorKind::TransportLost, "transport lost: " + reason);
            return;
        }
        LOG_WARN("Server {}: transport lost: {}", serverId, reason);
        emitLog(LogSeverity::Error, "transport lost: " + reason);
        publish(outbox);
        (void)pending.DrainAll(errors::ErrorKind::TransportLost, "transport lost: " + reason);
        (void)t->Close();
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (generation == gen + 1 && state == ConnectionState::Disconnected) {
                scheduleReconnectLocked(outbox);
            }
        }
        publish(outbox);
    }

    void scheduleReconnectLocked(std::vector<ConnectionEvent>& outbox) {
        const ReconnectPolicy policy = desc->Reconnect();
        if (!policy.CanAttempt(attempts)) {
            transitionLocked(ConnectionState::Error, outbox, errors::ErrorKind::ReconnectExhausted);
            ConnectionEvent fatal;
            fatal.kind = ConnectionEventKind::Fatal;
            fatal.serverId = serverId;
            fatal.state = ConnectionState::Error;
            fatal.error = errors::ErrorKind::ReconnectExhausted;
            fatal.severity = LogSeverity::Error;
            fatal.message = "reconnect attempts exhausted after " + std::to_string(attempts) + " attempt(s)";
            LOG_ERROR("Server {}: {}", serverId, fatal.message);
            outbox.push_back(std::move(fatal));
            return;
        }
        ++attempts;
        const auto delay = policy.DelayForAttempt(attempts);
        transitionLocked(ConnectionState::Reconnecting, outbox, std::nullopt, attempts);
        LOG_INFO("Server {}: reconnect attempt {}/{} in {} ms", serverId, attempts, policy.maxAttempts, delay.count());
        const uint64_t gen = generation;
        std::weak_ptr<Connection> weak = owner.weak_from_this();
        reconnectTimer = scheduler->ScheduleAfter(delay, [weak, gen]() {
            if (auto self = weak.lock()) {
                self->pImpl->onReconnectTimer(gen);
            }
        });
    }

    void onReconnectTimer(uint64_t gen) {
        (void)startAttempt(false, gen);
    }

    ////////////////////////////////////////// Heartbeat //////////////////////////////////////////
    void startHeartbeatLocked(uint64_t gen) {
        const auto interval = desc->heartbeatInterval;
        if (interval.count() <= 0) {
            return;
        }
        std::weak_ptr<Connection> weak = owner.weak_from_this();
        heartbeatTimer = scheduler->ScheduleAfter(interval, [weak, gen]() {
            if (auto self = weak.lock()) {
                self->pImpl->onHeartbeat(gen);
            }
        });
    }

    void onHeartbeat(uint64_t gen) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            if (gen != generation || state != ConnectionState::Connected) {
                return;
            }
        }
        (void)coHeartbeat(owner.shared_from_this(), gen);
    }

    static async::Task<void> coHeartbeat(std::shared_ptr<Connection> self, uint64_t gen) {
        Impl& impl = *self->pImpl;
        const auto d = impl.descriptor();
        PendingCall call = self->StartRequest(d->heartbeatMethod, std::nullopt, d->heartbeatTimeout);
        bool alive = true;
        bool stop = false;
        std::string reason;
        try {
            (void)co_await async::makeFutureAwaitable(std::move(call.result));
        } catch (const errors::ClientError& e) {
            switch (e.kind()) {
                case errors::ErrorKind::RemoteError:
                    break; // an error reply still proves the peer is alive
                case errors::ErrorKind::ConnectionClosed:
                case errors::ErrorKind::NotConnected:
                case errors::ErrorKind::TransportLost:
                    stop = true; // teardown already in progress
                    break;
                default:
                    alive = false;
                    reason = e.what();
                    break;
            }
        }
        if (stop) {
            co_return;
        }
        if (!alive) {
            LOG_WARN("Server {}: heartbeat failed: {}", impl.serverId, reason);
            impl.handleTransportLoss(gen, "heartbeat failed: " + reason);
            co_return;
        }
        std::lock_guard<std::mutex> lk(impl.mutex);
        if (gen == impl.generation && impl.state == ConnectionState::Connected) {
            impl.startHeartbeatLocked(gen);
        }
    }

    ////////////////////////////////////////// Inbound //////////////////////////////////////////
    void handleResponse(const JSONRPCResponse& resp) {
        const std::string id = IdToString(resp.id);
        bool matched = false;
        if (resp.error) {
            matched = pending.Reject(id, std::make_exception_ptr(errors::remoteError(*resp.error)));
        } else {
            matched = pending.Resolve(id, resp.result.value_or(JSONValue{}));
        }
        if (!matched) {
            LOG_WARN("Server {}: {}: dropping response for id '{}'", serverId,
                     errors::ToString(errors::ErrorKind::UnknownResponseId), id);
            emitLog(LogSeverity::Warn, std::string(errors::ToString(errors::ErrorKind::UnknownResponseId)) +
                                           ": dropped response for id '" + id + "'");
        }
    }

    void handleServerRequest(const JSONRPCRequest& req) {
        std::unique_ptr<JSONRPCResponse> reply;
        if (req.method == Methods::Ping) {
            reply = std::make_unique<JSONRPCResponse>(req.id, JSONValue{JSONValue::Object{}});
        } else {
            LOG_WARN("Server {}: unsupported server request '{}'", serverId, req.method);
            emitLog(LogSeverity::Warn, "unsupported server request: " + req.method);
            reply = CreateErrorResponse(req.id, JSONRPCErrorCodes::MethodNotFound,
                                        "Method not supported by client: " + req.method);
        }
        std::shared_ptr<ITransport> t;
        uint64_t gen = 0;
        {
            std::lock_guard<std::mutex> lk(mutex);
            t = transport;
            gen = generation;
        }
        if (t) {
            submit(t, gen, reply->Serialize(), std::nullopt);
        }
    }

    void handleNotification(const JSONRPCNotification& n) {
        ConnectionEvent ev;
        ev.serverId = serverId;
        ev.method = n.method;
        ev.params = n.params;
        if (n.method == Methods::ToolListChanged) {
            ev.kind = ConnectionEventKind::ToolListChanged;
            std::lock_guard<std::mutex> lk(mutex);
            toolCache.reset();
        } else if (n.method == Methods::ResourceListChanged) {
            ev.kind = ConnectionEventKind::ResourceListChanged;
        } else if (n.method == Methods::ResourceUpdated) {
            ev.kind = ConnectionEventKind::ResourceUpdated;
        } else if (n.method == Methods::PromptListChanged) {
            ev.kind = ConnectionEventKind::PromptListChanged;
        } else if (n.method == Methods::Progress) {
            ev.kind = ConnectionEventKind::Progress;
        } else if (n.method == Methods::Log) {
            ev.kind = ConnectionEventKind::LogMessage;
            if (n.params) {
                if (auto level = GetString(*n.params, "level")) {
                    ev.severity = severityFromMcpLevel(*level);
                }
                if (const JSONValue* data = n.params->Find("data")) {
                    ev.message = data->IsString() ? std::get<std::string>(data->value) : SerializeJSON(*data);
                }
            }
        } else if (n.method == Methods::Cancelled) {
            LOG_DEBUG("Server {}: server cancelled one of its requests", serverId);
            return;
        } else {
            LOG_WARN("Server {}: ignoring unknown notification '{}'", serverId, n.method);
            emitLog(LogSeverity::Warn, "ignoring unknown notification: " + n.method);
            return;
        }
        owner.events.Publish(ev);
    }

    ////////////////////////////////////////// Paged helpers //////////////////////////////////////////
    static std::optional<JSONValue> cursorParams(const std::optional<std::string>& cursor) {
        if (!cursor) {
            return std::nullopt;
        }
        return MakeObject({{"cursor", JSONValue(*cursor)}});
    }

    static async::Task<ToolsListResult> coListToolsPage(std::shared_ptr<Connection> self,
                                                        std::optional<std::string> cursor) {
        JSONValue result = co_await async::makeFutureAwaitable(self->SendRequest(Methods::ListTools, cursorParams(cursor)));
        co_return ParseToolsList(result);
    }

    static async::Task<std::vector<Tool>> coListTools(std::shared_ptr<Connection> self) {
        std::vector<Tool> all;
        std::unordered_set<std::string> seenCursors;
        std::optional<std::string> cursor;
        for (int page = 0; page < kMaxListPages; ++page) {
            JSONValue result = co_await async::makeFutureAwaitable(
                self->SendRequest(Methods::ListTools, cursorParams(cursor)));
            ToolsListResult parsed = ParseToolsList(result);
            for (auto& t : parsed.tools) {
                all.push_back(std::move(t));
            }
            if (!parsed.nextCursor || parsed.nextCursor->empty()) {
                break;
            }
            if (!seenCursors.insert(*parsed.nextCursor).second) {
                LOG_WARN("Server {}: tools/list repeated cursor '{}'; stopping", self->pImpl->serverId, *parsed.nextCursor);
                break;
            }
            cursor = parsed.nextCursor;
        }
        {
            std::lock_guard<std::mutex> lk(self->pImpl->mutex);
            self->pImpl->toolCache = all;
        }
        LOG_DEBUG("Server {}: cached {} tool(s)", self->pImpl->serverId, all.size());
        co_return all;
    }

    static async::Task<ResourcesListResult> coListResources(std::shared_ptr<Connection> self,
                                                            std::optional<std::string> cursor) {
        JSONValue result = co_await async::makeFutureAwaitable(
            self->SendRequest(Methods::ListResources, cursorParams(cursor)));
        co_return ParseResourcesList(result);
    }

    static async::Task<PromptsListResult> coListPrompts(std::shared_ptr<Connection> self,
                                                        std::optional<std::string> cursor) {
        JSONValue result = co_await async::makeFutureAwaitable(
            self->SendRequest(Methods::ListPrompts, cursorParams(cursor)));
        co_return ParsePromptsList(result);
    }

    static async::Task<void> coSetLogLevel(std::shared_ptr<Connection> self, std::string level) {
        (void)co_await async::makeFutureAwaitable(
            self->SendRequest(Methods::SetLogLevel, MakeObject({{"level", JSONValue(level)}})));
        co_return;
    }
};

////////////////////////////////////////// Connection //////////////////////////////////////////

Connection::Connection(std::shared_ptr<const ServerDescriptor> descriptor, std::shared_ptr<ITransportFactory> factory,
                       std::shared_ptr<Scheduler> scheduler)
    : pImpl(std::make_unique<Impl>(*this, std::move(descriptor), std::move(factory), std::move(scheduler))) {}

std::shared_ptr<Connection> Connection::Create(std::shared_ptr<const ServerDescriptor> descriptor,
                                               std::shared_ptr<ITransportFactory> factory,
                                               std::shared_ptr<Scheduler> scheduler) {
    FUNC_SCOPE();
    if (!descriptor || !factory || !scheduler) {
        throw std::invalid_argument("Connection requires a descriptor, a transport factory and a scheduler");
    }
    return std::shared_ptr<Connection>(new Connection(std::move(descriptor), std::move(factory), std::move(scheduler)));
}

Connection::~Connection() = default;

std::future<void> Connection::Connect() {
    FUNC_SCOPE();
    return pImpl->startAttempt(true);
}

std::future<void> Connection::Disconnect() {
    FUNC_SCOPE();
    std::vector<ConnectionEvent> outbox;
    std::vector<std::promise<void>> waiters;
    std::shared_ptr<ITransport> t;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        ++pImpl->generation;
        pImpl->cancelTimersLocked();
        t = std::move(pImpl->transport);
        pImpl->initResult.reset();
        pImpl->toolCache.reset();
        waiters.swap(pImpl->connectWaiters);
        pImpl->transitionLocked(ConnectionState::Disconnected, outbox);
    }
    const std::size_t drained = pImpl->pending.DrainAll(errors::ErrorKind::ConnectionClosed, "connection closed");
    if (drained > 0) {
        LOG_INFO("Server {}: failed {} pending request(s) on disconnect", pImpl->serverId, drained);
    }
    for (auto& w : waiters) {
        w.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::ConnectionClosed, "disconnected before connect completed")));
    }
    pImpl->publish(outbox);
    if (t) {
        return t->Close();
    }
    return readyFuture();
}

PendingCall Connection::StartRequest(const std::string& method, std::optional<JSONValue> params,
                                     std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    PendingCall call;
    std::shared_ptr<ITransport> t;
    uint64_t gen = 0;
    std::chrono::milliseconds deadline{0};
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state != ConnectionState::Connected || !pImpl->transport) {
            call.result = failedFuture<JSONValue>(errors::ErrorKind::NotConnected,
                "Server " + pImpl->serverId + " is not connected (" + ToString(pImpl->state) + ")");
            return call;
        }
        t = pImpl->transport;
        gen = pImpl->generation;
        deadline = timeout.value_or(pImpl->desc->requestTimeout);
    }
    call.id = pImpl->nextRequestId();
    call.result = pImpl->pending.Register(call.id, deadline, method);
    JSONRPCRequest req(call.id, method, std::move(params));
    pImpl->submit(t, gen, req.Serialize(), call.id);
    return call;
}

std::future<JSONValue> Connection::SendRequest(const std::string& method, std::optional<JSONValue> params,
                                               std::optional<std::chrono::milliseconds> timeout) {
    FUNC_SCOPE();
    return StartRequest(method, std::move(params), timeout).result;
}

std::future<void> Connection::SendNotification(const std::string& method, std::optional<JSONValue> params) {
    FUNC_SCOPE();
    std::shared_ptr<ITransport> t;
    uint64_t gen = 0;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state != ConnectionState::Connected || !pImpl->transport) {
            return failedFuture<void>(errors::ErrorKind::NotConnected, "Server " + pImpl->serverId + " is not connected");
        }
        t = pImpl->transport;
        gen = pImpl->generation;
    }
    pImpl->submit(t, gen, JSONRPCNotification(method, std::move(params)).Serialize(), std::nullopt);
    return readyFuture();
}

bool Connection::CancelRequest(const std::string& id, const std::string& reason) {
    FUNC_SCOPE();
    if (!pImpl->pending.Contains(id)) {
        return false;
    }
    if (IsConnected()) {
        (void)SendNotification(Methods::Cancelled,
                               MakeObject({{"requestId", JSONValue(id)}, {"reason", JSONValue(reason)}}));
    }
    const bool rejected = pImpl->pending.Reject(
        id, std::make_exception_ptr(errors::ClientError(errors::ErrorKind::Cancelled, reason)));
    if (rejected) {
        LOG_INFO("Server {}: cancelled request {}: {}", pImpl->serverId, id, reason);
    }
    return rejected;
}

void Connection::OnPushMessage(const std::string& raw) {
    FUNC_SCOPE();
    LOG_DEBUG("Server {} -> {}", pImpl->serverId, raw);
    pImpl->emitLog(LogSeverity::Debug, raw, LogDirection::Received);
    try {
        DecodedMessage msg = DecodeMessage(raw);
        switch (msg.kind) {
            case MessageKind::Response:
                pImpl->handleResponse(*msg.response);
                break;
            case MessageKind::Request:
                pImpl->handleServerRequest(*msg.request);
                break;
            case MessageKind::Notification:
                pImpl->handleNotification(*msg.notification);
                break;
            case MessageKind::Invalid:
                LOG_WARN("Server {}: {}: {}", pImpl->serverId,
                         errors::ToString(errors::ErrorKind::InvalidMessage), msg.error);
                pImpl->emitLog(LogSeverity::Warn, "dropping invalid message: " + msg.error);
                break;
        }
    } catch (const std::exception& e) {
        LOG_ERROR("Server {}: failed to handle inbound message: {}", pImpl->serverId, e.what());
        pImpl->emitLog(LogSeverity::Error, std::string("failed to handle inbound message: ") + e.what());
    }
}

////////////////////////////////////////// MCP helpers //////////////////////////////////////////

std::future<std::vector<Tool>> Connection::ListTools() {
    FUNC_SCOPE();
    return Impl::coListTools(shared_from_this()).toFuture();
}

std::future<ToolsListResult> Connection::ListToolsPage(const std::optional<std::string>& cursor) {
    FUNC_SCOPE();
    return Impl::coListToolsPage(shared_from_this(), cursor).toFuture();
}

std::future<JSONValue> Connection::CallTool(const std::string& name, const JSONValue& arguments) {
    FUNC_SCOPE();
    return SendRequest(Methods::CallTool, MakeObject({{"name", JSONValue(name)}, {"arguments", arguments}}));
}

std::future<ResourcesListResult> Connection::ListResources(const std::optional<std::string>& cursor) {
    FUNC_SCOPE();
    return Impl::coListResources(shared_from_this(), cursor).toFuture();
}

std::future<JSONValue> Connection::ReadResource(const std::string& uri) {
    FUNC_SCOPE();
    return SendRequest(Methods::ReadResource, MakeObject({{"uri", JSONValue(uri)}}));
}

std::future<PromptsListResult> Connection::ListPrompts(const std::optional<std::string>& cursor) {
    FUNC_SCOPE();
    return Impl::coListPrompts(shared_from_this(), cursor).toFuture();
}

std::future<JSONValue> Connection::GetPrompt(const std::string& name, const std::optional<JSONValue>& arguments) {
    FUNC_SCOPE();
    JSONValue params = arguments ? MakeObject({{"name", JSONValue(name)}, {"arguments", *arguments}})
                                 : MakeObject({{"name", JSONValue(name)}});
    return SendRequest(Methods::GetPrompt, std::move(params));
}

std::future<void> Connection::SetLogLevel(const std::string& level) {
    FUNC_SCOPE();
    return Impl::coSetLogLevel(shared_from_this(), level).toFuture();
}

////////////////////////////////////////// State //////////////////////////////////////////

ConnectionState Connection::State() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state;
}

bool Connection::IsConnected() const {
    return State() == ConnectionState::Connected;
}

std::string Connection::ServerId() const {
    return pImpl->serverId;
}

std::shared_ptr<const ServerDescriptor> Connection::Descriptor() const {
    return pImpl->descriptor();
}

void Connection::SetDescriptor(std::shared_ptr<const ServerDescriptor> descriptor) {
    FUNC_SCOPE();
    if (!descriptor || descriptor->id != pImpl->serverId) {
        throw std::invalid_argument("Replacement descriptor must keep server id " + pImpl->serverId);
    }
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    pImpl->desc = std::move(descriptor);
}

std::optional<InitializeResult> Connection::GetInitializeResult() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->initResult;
}

unsigned int Connection::ReconnectAttempts() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->attempts;
}

std::size_t Connection::PendingRequestCount() const {
    return pImpl->pending.Size();
}

std::optional<std::vector<Tool>> Connection::CachedTools() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->toolCache;
}

} // namespace mcplink
