//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.cpp
// Purpose: Connection registry implementation
//==========================================================================================================

#include <algorithm>
#include <deque>
#include <mutex>
#include <unordered_map>

#include "env/EnvVars.h"
#include "logging/Logger.h"
#include "mcplink/ConnectionRegistry.h"
#include "mcplink/async/FutureAwaitable.h"
#include "mcplink/async/Task.h"

namespace mcplink {

namespace {
template <typename T>
std::future<T> notFound(const std::string& id) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(
        errors::ClientError(errors::ErrorKind::ServerNotFound, "Unknown server: " + id)));
    return p.get_future();
}

constexpr std::size_t kDefaultExecutionLogCapacity = 1000;
} // namespace

const char* ToString(RegistryEventKind kind) {
    switch (kind) {
        case RegistryEventKind::ServerAdded: return "serverAdded";
        case RegistryEventKind::ServerRemoved: return "serverRemoved";
        case RegistryEventKind::ServerStateChanged: return "serverStateChanged";
        case RegistryEventKind::ServerNotification: return "serverNotification";
        case RegistryEventKind::ToolsUpdated: return "toolsUpdated";
        case RegistryEventKind::ExecutionStarted: return "executionStarted";
        case RegistryEventKind::ExecutionCompleted: return "executionCompleted";
        case RegistryEventKind::LogAppended: return "logAppended";
        case RegistryEventKind::LogsCleared: return "logsCleared";
    }
    return "serverAdded";
}

class ConnectionRegistry::Impl : public std::enable_shared_from_this<ConnectionRegistry::Impl> {
public:
    struct Entry {
        std::shared_ptr<Connection> connection;
        SubscriptionId subscription{0};
        std::optional<errors::ErrorKind> lastError;
    };

    std::shared_ptr<ITransportFactory> factory;
    std::shared_ptr<Scheduler> scheduler;
    LogRing ring;
    ToolExecutionTracker tracker;
    EventEmitter<RegistryEvent> events;
    SubscriptionId trackerSubscription{0};

    mutable std::mutex mutex;
    std::unordered_map<std::string, Entry> servers;
    std::vector<std::string> order; // registration order for GetAllServers
    std::deque<ToolExecution> history; // most recent first
    std::size_t historyCapacity;

    Impl(std::shared_ptr<ITransportFactory> f, std::shared_ptr<Scheduler> s, std::size_t logCapacity)
        : factory(std::move(f)), scheduler(std::move(s)), ring(logCapacity),
          historyCapacity(static_cast<std::size_t>(
              GetEnvUInt64OrDefault("MCPLINK_EXECUTION_LOG_CAPACITY", kDefaultExecutionLogCapacity))) {
        if (historyCapacity == 0) {
            historyCapacity = 1;
        }
    }

    std::shared_ptr<Connection> find(const std::string& id) const {
        std::lock_guard<std::mutex> lk(mutex);
        auto it = servers.find(id);
        return it == servers.end() ? nullptr : it->second.connection;
    }

    std::shared_ptr<Connection> require(const std::string& id) const {
        auto conn = find(id);
        if (!conn) {
            throw errors::ClientError(errors::ErrorKind::ServerNotFound, "Unknown server: " + id);
        }
        return conn;
    }

    ServerStatus statusOf(const std::shared_ptr<Connection>& conn) const {
        const auto desc = conn->Descriptor();
        ServerStatus st;
        st.id = desc->id;
        st.name = desc->Label();
        st.transport = desc->transport;
        st.endpoint = desc->transport == TransportKind::Command ? desc->command : desc->endpoint;
        st.state = conn->State();
        st.reconnectAttempts = conn->ReconnectAttempts();
        st.initializeResult = conn->GetInitializeResult();
        if (auto tools = conn->CachedTools()) {
            st.toolCount = tools->size();
        }
        std::lock_guard<std::mutex> lk(mutex);
        auto it = servers.find(desc->id);
        if (it != servers.end()) {
            st.lastError = it->second.lastError;
        }
        return st;
    }

    void appendLog(const std::string& serverId, LogSeverity level, std::string message,
                   std::optional<LogDirection> direction = std::nullopt, std::optional<JSONValue> data = std::nullopt) {
        RegistryEvent ev;
        ev.kind = RegistryEventKind::LogAppended;
        ev.serverId = serverId;
        ev.log = ring.Append(serverId, level, std::move(message), direction, std::move(data));
        events.Publish(ev);
    }

    ////////////////////////////////////////// Connection events //////////////////////////////////////////
    void onConnectionEvent(const std::shared_ptr<Connection>& conn, const ConnectionEvent& ce) {
        switch (ce.kind) {
            case ConnectionEventKind::StateChanged: {
                {
                    std::lock_guard<std::mutex> lk(mutex);
                    auto it = servers.find(ce.serverId);
                    if (it != servers.end()) {
                        if (ce.state == ConnectionState::Connected) {
                            it->second.lastError.reset();
                        } else if (ce.error) {
                            it->second.lastError = ce.error;
                        }
                    }
                }
                std::string text = std::string("state: ") + ToString(ce.previousState) + " -> " + ToString(ce.state);
                if (ce.state == ConnectionState::Reconnecting) {
                    text += " (attempt " + std::to_string(ce.attempt) + ")";
                }
                if (ce.error) {
                    text += std::string(" [") + errors::ToString(*ce.error) + "]";
                }
                appendLog(ce.serverId, ce.state == ConnectionState::Error ? LogSeverity::Error : LogSeverity::Info,
                          std::move(text));
                RegistryEvent ev;
                ev.kind = RegistryEventKind::ServerStateChanged;
                ev.serverId = ce.serverId;
                ev.status = statusOf(conn);
                ev.notification = ce;
                events.Publish(ev);
                break;
            }
            case ConnectionEventKind::Log:
                appendLog(ce.serverId, ce.severity, ce.message, ce.direction, ce.params);
                break;
            case ConnectionEventKind::LogMessage:
                appendLog(ce.serverId, ce.severity, "server: " + ce.message, LogDirection::Received, ce.params);
                publishNotification(ce);
                break;
            case ConnectionEventKind::ToolListChanged:
                publishNotification(ce);
                if (conn->IsConnected()) {
                    LOG_INFO("Server {}: tool list changed; refreshing", ce.serverId);
                    (void)coRefreshTools(weak_from_this(), conn);
                }
                break;
            case ConnectionEventKind::Fatal:
                {
                    std::lock_guard<std::mutex> lk(mutex);
                    auto it = servers.find(ce.serverId);
                    if (it != servers.end()) {
                        it->second.lastError = ce.error.value_or(errors::ErrorKind::ReconnectExhausted);
                    }
                }
                appendLog(ce.serverId, LogSeverity::Error, ce.message);
                publishNotification(ce);
                break;
            case ConnectionEventKind::ResourceListChanged:
            case ConnectionEventKind::ResourceUpdated:
            case ConnectionEventKind::PromptListChanged:
            case ConnectionEventKind::Progress:
                publishNotification(ce);
                break;
        }
    }

    void publishNotification(const ConnectionEvent& ce) {
        RegistryEvent ev;
        ev.kind = RegistryEventKind::ServerNotification;
        ev.serverId = ce.serverId;
        ev.notification = ce;
        events.Publish(ev);
    }

    void publishTools(const std::string& serverId, const std::vector<Tool>& tools) {
        RegistryEvent ev;
        ev.kind = RegistryEventKind::ToolsUpdated;
        ev.serverId = serverId;
        ev.tools = tools;
        events.Publish(ev);
    }

    static async::Task<void> coRefreshTools(std::weak_ptr<Impl> weak, std::shared_ptr<Connection> conn) {
        std::vector<Tool> tools;
        std::string failure;
        try {
            tools = co_await async::makeFutureAwaitable(conn->ListTools());
        } catch (const std::exception& e) {
            failure = e.what();
        }
        auto self = weak.lock();
        if (!self) {
            co_return;
        }
        if (!failure.empty()) {
            LOG_WARN("Server {}: tool refresh failed: {}", conn->ServerId(), failure);
            self->appendLog(conn->ServerId(), LogSeverity::Warn, "tool refresh failed: " + failure);
            co_return;
        }
        self->publishTools(conn->ServerId(), tools);
    }

    static async::Task<std::vector<Tool>> coListTools(std::weak_ptr<Impl> weak, std::shared_ptr<Connection> conn) {
        std::vector<Tool> tools = co_await async::makeFutureAwaitable(conn->ListTools());
        if (auto self = weak.lock()) {
            self->publishTools(conn->ServerId(), tools);
        }
        co_return tools;
    }

    ////////////////////////////////////////// Executions //////////////////////////////////////////
    void onExecutionEvent(const ExecutionEvent& ee) {
        const ToolExecution& rec = ee.execution;
        RegistryEvent ev;
        ev.serverId = rec.serverId;
        ev.execution = rec;
        if (ee.kind == ExecutionEventKind::Started) {
            {
                std::lock_guard<std::mutex> lk(mutex);
                history.push_front(rec);
                while (history.size() > historyCapacity) {
                    history.pop_back();
                }
            }
            appendLog(rec.serverId, LogSeverity::Info, "execution " + rec.id + " started: " + rec.tool, std::nullopt,
                      rec.arguments);
            ev.kind = RegistryEventKind::ExecutionStarted;
        } else {
            {
                std::lock_guard<std::mutex> lk(mutex);
                auto it = std::find_if(history.begin(), history.end(),
                                       [&](const ToolExecution& e) { return e.id == rec.id; });
                if (it != history.end()) {
                    *it = rec;
                } else {
                    history.push_front(rec);
                    while (history.size() > historyCapacity) {
                        history.pop_back();
                    }
                }
            }
            std::string text = "execution " + rec.id + " " + ToString(rec.status) + ": " + rec.tool;
            if (rec.durationMs) {
                text += " (" + std::to_string(*rec.durationMs) + " ms)";
            }
            if (rec.error) {
                text += ": " + rec.error->message;
                appendLog(rec.serverId, LogSeverity::Error, std::move(text));
            } else {
                appendLog(rec.serverId, rec.isError ? LogSeverity::Warn : LogSeverity::Info, std::move(text),
                          std::nullopt, rec.result);
            }
            ev.kind = RegistryEventKind::ExecutionCompleted;
        }
        events.Publish(ev);
    }
};

////////////////////////////////////////// ConnectionRegistry //////////////////////////////////////////

ConnectionRegistry::ConnectionRegistry(std::shared_ptr<ITransportFactory> factory, std::shared_ptr<Scheduler> scheduler,
                                       std::optional<std::size_t> logCapacity) {
    if (!factory) {
        factory = std::make_shared<DefaultTransportFactory>();
    }
    if (!scheduler) {
        scheduler = std::make_shared<Scheduler>();
    }
    const std::size_t capacity = logCapacity.value_or(static_cast<std::size_t>(
        GetEnvUInt64OrDefault("MCPLINK_LOG_RING_CAPACITY", LogRing::kDefaultCapacity)));
    pImpl = std::make_shared<Impl>(std::move(factory), std::move(scheduler), capacity);

    std::weak_ptr<Impl> weak = pImpl;
    pImpl->trackerSubscription = pImpl->tracker.Events().Subscribe([weak](const ExecutionEvent& ev) {
        if (auto self = weak.lock()) {
            self->onExecutionEvent(ev);
        }
    });
}

ConnectionRegistry::~ConnectionRegistry() {
    std::vector<Impl::Entry> entries;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (auto& [id, entry] : pImpl->servers) {
            entries.push_back(std::move(entry));
        }
        pImpl->servers.clear();
        pImpl->order.clear();
    }
    (void)pImpl->tracker.Events().Unsubscribe(pImpl->trackerSubscription);
    for (auto& entry : entries) {
        (void)entry.connection->Events().Unsubscribe(entry.subscription);
        auto done = entry.connection->Disconnect();
        if (done.wait_for(std::chrono::seconds(2)) != std::future_status::ready) {
            LOG_WARN("Server {}: transport did not close within 2s during shutdown", entry.connection->ServerId());
        }
    }
}

void ConnectionRegistry::AddServer(const ServerDescriptor& descriptor) {
    FUNC_SCOPE();
    ValidateServerDescriptor(descriptor);
    auto conn = Connection::Create(std::make_shared<const ServerDescriptor>(descriptor), pImpl->factory,
                                   pImpl->scheduler);
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->servers.count(descriptor.id) > 0) {
            throw errors::ClientError(errors::ErrorKind::DuplicateServer, "Server already registered: " + descriptor.id);
        }
        std::weak_ptr<Impl> weak = pImpl;
        std::weak_ptr<Connection> weakConn = conn;
        Impl::Entry entry;
        entry.connection = conn;
        entry.subscription = conn->Events().Subscribe([weak, weakConn](const ConnectionEvent& ev) {
            auto self = weak.lock();
            auto c = weakConn.lock();
            if (self && c) {
                self->onConnectionEvent(c, ev);
            }
        });
        pImpl->servers.emplace(descriptor.id, std::move(entry));
        pImpl->order.push_back(descriptor.id);
    }
    LOG_INFO("Registered server {} ({}, {})", descriptor.id, descriptor.Label(), ToString(descriptor.transport));
    pImpl->appendLog(descriptor.id, LogSeverity::Info, "server added");
    RegistryEvent ev;
    ev.kind = RegistryEventKind::ServerAdded;
    ev.serverId = descriptor.id;
    ev.status = pImpl->statusOf(conn);
    pImpl->events.Publish(ev);
}

std::future<void> ConnectionRegistry::RemoveServer(const std::string& id) {
    FUNC_SCOPE();
    Impl::Entry entry;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->servers.find(id);
        if (it == pImpl->servers.end()) {
            return notFound<void>(id);
        }
        entry = std::move(it->second);
        pImpl->servers.erase(it);
        pImpl->order.erase(std::remove(pImpl->order.begin(), pImpl->order.end(), id), pImpl->order.end());
    }
    auto closed = entry.connection->Disconnect();
    (void)entry.connection->Events().Unsubscribe(entry.subscription);
    LOG_INFO("Removed server {}", id);
    pImpl->appendLog(id, LogSeverity::Info, "server removed");
    RegistryEvent ev;
    ev.kind = RegistryEventKind::ServerRemoved;
    ev.serverId = id;
    pImpl->events.Publish(ev);
    return closed;
}

std::future<void> ConnectionRegistry::ConnectServer(const std::string& id) {
    FUNC_SCOPE();
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<void>(id);
    }
    return conn->Connect();
}

std::future<void> ConnectionRegistry::DisconnectServer(const std::string& id) {
    FUNC_SCOPE();
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<void>(id);
    }
    return conn->Disconnect();
}

void ConnectionRegistry::UpdateServerAuth(const std::string& id, const AuthConfig& auth) {
    FUNC_SCOPE();
    auto conn = pImpl->require(id);
    ServerDescriptor updated = *conn->Descriptor();
    updated.auth = auth;
    conn->SetDescriptor(std::make_shared<const ServerDescriptor>(std::move(updated)));
    LOG_INFO("Server {}: auth updated (mode {})", id, ToString(auth.mode));
    pImpl->appendLog(id, LogSeverity::Info, std::string("auth updated: ") + ToString(auth.mode));
}

ServerStatus ConnectionRegistry::GetServerStatus(const std::string& id) const {
    return pImpl->statusOf(pImpl->require(id));
}

std::vector<ServerStatus> ConnectionRegistry::GetAllServers() const {
    std::vector<std::shared_ptr<Connection>> conns;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        for (const auto& id : pImpl->order) {
            conns.push_back(pImpl->servers.at(id).connection);
        }
    }
    std::vector<ServerStatus> out;
    out.reserve(conns.size());
    for (const auto& c : conns) {
        out.push_back(pImpl->statusOf(c));
    }
    return out;
}

std::shared_ptr<Connection> ConnectionRegistry::GetConnection(const std::string& id) const {
    return pImpl->find(id);
}

std::future<std::vector<Tool>> ConnectionRegistry::ListTools(const std::string& id) {
    FUNC_SCOPE();
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<std::vector<Tool>>(id);
    }
    return Impl::coListTools(pImpl, conn).toFuture();
}

std::vector<Tool> ConnectionRegistry::GetCachedTools(const std::string& id) const {
    return pImpl->require(id)->CachedTools().value_or(std::vector<Tool>{});
}

std::future<ToolExecution> ConnectionRegistry::ExecuteTool(const std::string& id, const std::string& toolName,
                                                           const JSONValue& arguments) {
    FUNC_SCOPE();
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<ToolExecution>(id);
    }
    return pImpl->tracker.Execute(conn, toolName, arguments);
}

bool ConnectionRegistry::CancelExecution(const std::string& executionId) {
    FUNC_SCOPE();
    return pImpl->tracker.Cancel(executionId);
}

std::optional<ToolExecution> ConnectionRegistry::GetExecution(const std::string& executionId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    for (const auto& e : pImpl->history) {
        if (e.id == executionId) {
            return e;
        }
    }
    return std::nullopt;
}

std::vector<ToolExecution> ConnectionRegistry::GetExecutions(std::optional<std::size_t> limit) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    const std::size_t n = limit ? std::min(*limit, pImpl->history.size()) : pImpl->history.size();
    return std::vector<ToolExecution>(pImpl->history.begin(),
                                      pImpl->history.begin() + static_cast<std::ptrdiff_t>(n));
}

std::vector<ToolExecution> ConnectionRegistry::GetServerExecutions(const std::string& serverId) const {
    std::vector<ToolExecution> out;
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    for (const auto& e : pImpl->history) {
        if (e.serverId == serverId) {
            out.push_back(e);
        }
    }
    return out;
}

std::size_t ConnectionRegistry::ExecutionHistoryCapacity() const {
    return pImpl->historyCapacity;
}

std::future<ResourcesListResult> ConnectionRegistry::ListResources(const std::string& id,
                                                                   const std::optional<std::string>& cursor) {
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<ResourcesListResult>(id);
    }
    return conn->ListResources(cursor);
}

std::future<JSONValue> ConnectionRegistry::ReadResource(const std::string& id, const std::string& uri) {
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<JSONValue>(id);
    }
    return conn->ReadResource(uri);
}

std::future<PromptsListResult> ConnectionRegistry::ListPrompts(const std::string& id,
                                                               const std::optional<std::string>& cursor) {
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<PromptsListResult>(id);
    }
    return conn->ListPrompts(cursor);
}

std::future<JSONValue> ConnectionRegistry::GetPrompt(const std::string& id, const std::string& name,
                                                     const std::optional<JSONValue>& arguments) {
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<JSONValue>(id);
    }
    return conn->GetPrompt(name, arguments);
}

std::future<void> ConnectionRegistry::SetServerLogLevel(const std::string& id, const std::string& level) {
    auto conn = pImpl->find(id);
    if (!conn) {
        return notFound<void>(id);
    }
    return conn->SetLogLevel(level);
}

std::vector<LogEntry> ConnectionRegistry::GetLogs(const std::optional<std::string>& serverId,
                                                  std::optional<std::size_t> limit) const {
    return pImpl->ring.Get(serverId, limit);
}

std::size_t ConnectionRegistry::ClearLogs(const std::optional<std::string>& serverId) {
    FUNC_SCOPE();
    const std::size_t removed = pImpl->ring.Clear(serverId);
    LOG_DEBUG("Cleared {} log entr{} for {}", removed, removed == 1 ? "y" : "ies", serverId.value_or("all servers"));
    RegistryEvent ev;
    ev.kind = RegistryEventKind::LogsCleared;
    ev.serverId = serverId.value_or(std::string());
    ev.cleared = removed;
    pImpl->events.Publish(ev);
    return removed;
}

EventEmitter<RegistryEvent>& ConnectionRegistry::Events() {
    return pImpl->events;
}

std::size_t ConnectionRegistry::LogCapacity() const {
    return pImpl->ring.Capacity();
}

} // namespace mcplink
