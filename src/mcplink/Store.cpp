//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Store.cpp
// Purpose: Observable registry snapshot implementation
//==========================================================================================================

#include <algorithm>
#include <iterator>
#include <mutex>

#include "logging/Logger.h"
#include "mcplink/Store.h"

namespace mcplink {

class ConnectionStore::Impl {
public:
    explicit Impl(ConnectionRegistry& r)
        : registry(r), executionCapacity(r.ExecutionHistoryCapacity()), logCapacity(r.LogCapacity()) {}

    ConnectionRegistry& registry;
    const std::size_t executionCapacity;
    const std::size_t logCapacity;
    SubscriptionId registrySubscription{0};
    EventEmitter<StoreSnapshot> changes;

    mutable std::mutex mutex;
    StoreSnapshot state;

    void upsertServerLocked(const ServerStatus& st) {
        auto it = std::find_if(state.servers.begin(), state.servers.end(),
                               [&](const ServerStatus& s) { return s.id == st.id; });
        if (it != state.servers.end()) {
            *it = st;
        } else {
            state.servers.push_back(st);
        }
    }

    void upsertExecutionLocked(const ToolExecution& rec) {
        auto it = std::find_if(state.executions.begin(), state.executions.end(),
                               [&](const ToolExecution& e) { return e.id == rec.id; });
        if (it != state.executions.end()) {
            *it = rec;
        } else {
            state.executions.insert(state.executions.begin(), rec);
            if (state.executions.size() > executionCapacity) {
                state.executions.resize(executionCapacity);
            }
        }
    }

    // Entries arrive from several publishing threads; keep chronological (id) order and the ring's bound.
    void appendLogLocked(const LogEntry& entry) {
        auto pos = state.logs.end();
        while (pos != state.logs.begin() && std::prev(pos)->id >= entry.id) {
            if (std::prev(pos)->id == entry.id) {
                return;
            }
            --pos;
        }
        state.logs.insert(pos, entry);
        if (state.logs.size() > logCapacity) {
            state.logs.erase(state.logs.begin(),
                             state.logs.begin() + static_cast<std::ptrdiff_t>(state.logs.size() - logCapacity));
        }
    }

    void notify() {
        StoreSnapshot copy;
        {
            std::lock_guard<std::mutex> lk(mutex);
            ++state.revision;
            copy = state;
        }
        changes.Publish(copy);
    }

    void onRegistryEvent(const RegistryEvent& ev) {
        {
            std::lock_guard<std::mutex> lk(mutex);
            switch (ev.kind) {
                case RegistryEventKind::ServerAdded:
                case RegistryEventKind::ServerStateChanged:
                    if (ev.status) {
                        upsertServerLocked(*ev.status);
                    }
                    if (ev.status && ev.status->state != ConnectionState::Connected) {
                        state.tools.erase(ev.serverId);
                    }
                    break;
                case RegistryEventKind::ServerRemoved:
                    state.servers.erase(std::remove_if(state.servers.begin(), state.servers.end(),
                                                       [&](const ServerStatus& s) { return s.id == ev.serverId; }),
                                        state.servers.end());
                    state.tools.erase(ev.serverId);
                    if (state.activeServerId == ev.serverId) {
                        state.activeServerId.reset();
                    }
                    break;
                case RegistryEventKind::ToolsUpdated:
                    if (ev.tools) {
                        state.tools[ev.serverId] = *ev.tools;
                        for (auto& s : state.servers) {
                            if (s.id == ev.serverId) {
                                s.toolCount = ev.tools->size();
                            }
                        }
                    }
                    break;
                case RegistryEventKind::ExecutionStarted:
                case RegistryEventKind::ExecutionCompleted:
                    if (ev.execution) {
                        upsertExecutionLocked(*ev.execution);
                    }
                    break;
                case RegistryEventKind::LogAppended:
                    if (ev.log) {
                        appendLogLocked(*ev.log);
                    }
                    break;
                case RegistryEventKind::LogsCleared:
                    state.logs = registry.GetLogs();
                    break;
                case RegistryEventKind::ServerNotification:
                    return;
            }
        }
        notify();
    }
};

ConnectionStore::ConnectionStore(ConnectionRegistry& registry) : pImpl(std::make_shared<Impl>(registry)) {
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->state.servers = registry.GetAllServers();
        pImpl->state.executions = registry.GetExecutions();
        pImpl->state.logs = registry.GetLogs();
        for (const auto& s : pImpl->state.servers) {
            auto tools = registry.GetCachedTools(s.id);
            if (!tools.empty()) {
                pImpl->state.tools[s.id] = std::move(tools);
            }
        }
    }
    std::weak_ptr<Impl> weak = pImpl;
    pImpl->registrySubscription = registry.Events().Subscribe([weak](const RegistryEvent& ev) {
        if (auto self = weak.lock()) {
            self->onRegistryEvent(ev);
        }
    });
}

ConnectionStore::~ConnectionStore() {
    (void)pImpl->registry.Events().Unsubscribe(pImpl->registrySubscription);
}

StoreSnapshot ConnectionStore::Snapshot() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state;
}

void ConnectionStore::SetActiveServer(const std::optional<std::string>& id) {
    FUNC_SCOPE();
    if (id && !pImpl->registry.GetConnection(*id)) {
        throw errors::ClientError(errors::ErrorKind::ServerNotFound, "Unknown server: " + *id);
    }
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        if (pImpl->state.activeServerId == id) {
            return;
        }
        pImpl->state.activeServerId = id;
    }
    LOG_DEBUG("Active server: {}", id.value_or("(none)"));
    pImpl->notify();
}

std::optional<std::string> ConnectionStore::ActiveServer() const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    return pImpl->state.activeServerId;
}

std::future<std::vector<Tool>> ConnectionStore::RefreshTools(const std::optional<std::string>& id) {
    FUNC_SCOPE();
    std::optional<std::string> target = id ? id : ActiveServer();
    if (!target) {
        std::promise<std::vector<Tool>> p;
        p.set_exception(std::make_exception_ptr(
            errors::ClientError(errors::ErrorKind::ServerNotFound, "No server selected")));
        return p.get_future();
    }
    // The registry publishes ToolsUpdated on success, which updates the snapshot.
    return pImpl->registry.ListTools(*target);
}

SubscriptionId ConnectionStore::Subscribe(std::function<void(const StoreSnapshot&)> handler) {
    return pImpl->changes.Subscribe(std::move(handler));
}

bool ConnectionStore::Unsubscribe(SubscriptionId id) {
    return pImpl->changes.Unsubscribe(id);
}

} // namespace mcplink
