//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Store.h
// Purpose: Observable snapshot of a ConnectionRegistry for presentation code
//==========================================================================================================

#pragma once

#include <cstdint>
#include <functional>
#include <future>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/ConnectionRegistry.h"
#include "mcplink/Events.h"

namespace mcplink {

//==========================================================================================================
// StoreSnapshot
// Fields:
//   servers: registration order
//   activeServerId: the selected server, if any
//   tools: last known tool set per server
//   executions: most recent first
//   logs: oldest first
//   revision: incremented on every change
//==========================================================================================================
struct StoreSnapshot {
    std::vector<ServerStatus> servers;
    std::optional<std::string> activeServerId;
    std::map<std::string, std::vector<Tool>> tools;
    std::vector<ToolExecution> executions;
    std::vector<LogEntry> logs;
    uint64_t revision{0};
};

//==========================================================================================================
// ConnectionStore
// Purpose: Subscribes to a registry and keeps a consumable snapshot in sync with its events.
// Notes:
//   - Removing the selected server clears the selection.
//   - Subscribers are notified after the snapshot is updated, on the thread that produced the registry
//     event.
//   - The registry must outlive the store.
//==========================================================================================================
class ConnectionStore {
public:
    explicit ConnectionStore(ConnectionRegistry& registry);
    ~ConnectionStore();

    ConnectionStore(const ConnectionStore&) = delete;
    ConnectionStore& operator=(const ConnectionStore&) = delete;

    StoreSnapshot Snapshot() const;

    // Selects a server (or clears the selection with nullopt). Throws ClientError(ServerNotFound).
    void SetActiveServer(const std::optional<std::string>& id);
    std::optional<std::string> ActiveServer() const;

    // Re-lists the tools of a server (the active one when id is empty) and stores the result.
    std::future<std::vector<Tool>> RefreshTools(const std::optional<std::string>& id = std::nullopt);

    // Change notifications carry the new snapshot.
    SubscriptionId Subscribe(std::function<void(const StoreSnapshot&)> handler);
    bool Unsubscribe(SubscriptionId id);

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcplink
