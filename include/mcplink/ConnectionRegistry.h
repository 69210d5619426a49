//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ConnectionRegistry.h
// Purpose: Named collection of Connections behind a server-agnostic facade (tools, executions, logs)
//==========================================================================================================

#pragma once

#include <cstddef>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/Connection.h"
#include "mcplink/Events.h"
#include "mcplink/LogRing.h"
#include "mcplink/Protocol.h"
#include "mcplink/Scheduler.h"
#include "mcplink/ServerDescriptor.h"
#include "mcplink/ToolExecution.h"
#include "mcplink/Transport.h"

namespace mcplink {

//==========================================================================================================
// ServerStatus
// Purpose: Point-in-time copy of one registered server for presentation code.
//==========================================================================================================
struct ServerStatus {
    std::string id;
    std::string name;
    TransportKind transport{TransportKind::PushStream};
    std::string endpoint;
    ConnectionState state{ConnectionState::Disconnected};
    unsigned int reconnectAttempts{0};
    std::optional<errors::ErrorKind> lastError;
    std::optional<InitializeResult> initializeResult;
    std::size_t toolCount{0};
};

enum class RegistryEventKind {
    ServerAdded,
    ServerRemoved,
    ServerStateChanged,
    ServerNotification,
    ToolsUpdated,
    ExecutionStarted,
    ExecutionCompleted,
    LogAppended,
    LogsCleared
};

const char* ToString(RegistryEventKind kind);

// One registry event. Only the members relevant to the kind are set.
struct RegistryEvent {
    RegistryEventKind kind{RegistryEventKind::ServerAdded};
    std::string serverId;
    std::optional<ServerStatus> status;             // ServerAdded, ServerStateChanged
    std::optional<ConnectionEvent> notification;    // ServerNotification, ServerStateChanged
    std::optional<std::vector<Tool>> tools;         // ToolsUpdated
    std::optional<ToolExecution> execution;         // ExecutionStarted, ExecutionCompleted
    std::optional<LogEntry> log;                    // LogAppended
    std::size_t cleared{0};                         // LogsCleared
};

//==========================================================================================================
// ConnectionRegistry
// Purpose: Owns Connections by server id, the execution history and the shared log ring.
// Notes:
//   - Explicitly constructed; there is no process-wide instance.
//   - Unknown ids fail with errors::ClientError(ServerNotFound); duplicates with DuplicateServer. Synchronous
//     operations throw, future-returning operations deliver the error through the future.
//   - The connection map, execution history and log ring are mutex-serialised; every read returns a copy.
//   - A tools/list_changed notification triggers an automatic tools/list refresh while connected.
// Environment:
//   MCPLINK_LOG_RING_CAPACITY        default capacity of the log ring (1000)
//   MCPLINK_EXECUTION_LOG_CAPACITY   executions kept in the history (1000)
//==========================================================================================================
class ConnectionRegistry {
public:
    // A null factory selects DefaultTransportFactory; a null scheduler creates a private one.
    explicit ConnectionRegistry(std::shared_ptr<ITransportFactory> factory = nullptr,
                                std::shared_ptr<Scheduler> scheduler = nullptr,
                                std::optional<std::size_t> logCapacity = std::nullopt);
    ~ConnectionRegistry();

    ConnectionRegistry(const ConnectionRegistry&) = delete;
    ConnectionRegistry& operator=(const ConnectionRegistry&) = delete;

    ////////////////////////////////////////// Servers //////////////////////////////////////////
    // Registers a descriptor in Disconnected state without connecting. Throws invalid_argument when the
    // descriptor fails validation and ClientError(DuplicateServer) when the id is taken.
    void AddServer(const ServerDescriptor& descriptor);

    // Disconnects and forgets the server. Callers holding it as a UI selection must clear it themselves.
    std::future<void> RemoveServer(const std::string& id);

    std::future<void> ConnectServer(const std::string& id);
    std::future<void> DisconnectServer(const std::string& id);

    // Replaces the descriptor's auth block. Takes effect on the next connect; never reconnects by itself.
    void UpdateServerAuth(const std::string& id, const AuthConfig& auth);

    ServerStatus GetServerStatus(const std::string& id) const;
    std::vector<ServerStatus> GetAllServers() const;
    std::shared_ptr<Connection> GetConnection(const std::string& id) const;

    ////////////////////////////////////////// Tools //////////////////////////////////////////
    // tools/list across all pages; fails with NotConnected unless the server is connected.
    std::future<std::vector<Tool>> ListTools(const std::string& id);

    // Cached tool set of a server (empty when never listed or invalidated).
    std::vector<Tool> GetCachedTools(const std::string& id) const;

    //======================================================================================================
    // ExecuteTool
    // Purpose: Run one tools/call through the execution tracker and record the result.
    // Returns:
    //   Future of the terminal ToolExecution. Request failures (NotConnected, RemoteError, RequestTimeout,
    //   TransportLost, Cancelled) are carried in the record rather than thrown; only an unknown server id
    //   fails the future.
    //======================================================================================================
    std::future<ToolExecution> ExecuteTool(const std::string& id, const std::string& toolName,
                                           const JSONValue& arguments);
    bool CancelExecution(const std::string& executionId);

    std::optional<ToolExecution> GetExecution(const std::string& executionId) const;
    // Most recent first.
    std::vector<ToolExecution> GetExecutions(std::optional<std::size_t> limit = std::nullopt) const;
    std::vector<ToolExecution> GetServerExecutions(const std::string& serverId) const;
    std::size_t ExecutionHistoryCapacity() const;

    ////////////////////////////////////////// Resources / prompts / logging //////////////////////////////
    std::future<ResourcesListResult> ListResources(const std::string& id,
                                                   const std::optional<std::string>& cursor = std::nullopt);
    std::future<JSONValue> ReadResource(const std::string& id, const std::string& uri);
    std::future<PromptsListResult> ListPrompts(const std::string& id,
                                               const std::optional<std::string>& cursor = std::nullopt);
    std::future<JSONValue> GetPrompt(const std::string& id, const std::string& name,
                                     const std::optional<JSONValue>& arguments = std::nullopt);
    std::future<void> SetServerLogLevel(const std::string& id, const std::string& level);

    ////////////////////////////////////////// Log ring //////////////////////////////////////////
    std::vector<LogEntry> GetLogs(const std::optional<std::string>& serverId = std::nullopt,
                                  std::optional<std::size_t> limit = std::nullopt) const;
    // Removes ring entries of one server, or every entry when serverId is empty. Returns the count removed.
    std::size_t ClearLogs(const std::optional<std::string>& serverId = std::nullopt);
    std::size_t LogCapacity() const;

    EventEmitter<RegistryEvent>& Events();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcplink
