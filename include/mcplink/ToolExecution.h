//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecution.h
// Purpose: Auditable lifecycle record for one tools/call and the tracker that drives it
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstdint>
#include <future>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/Connection.h"
#include "mcplink/Events.h"
#include "mcplink/JSONRPCTypes.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

enum class ExecutionStatus {
    Pending,
    Running,
    Completed,
    Failed,
    Cancelled
};

const char* ToString(ExecutionStatus status);

struct ExecutionError {
    errors::ErrorKind kind{errors::ErrorKind::TransportLost};
    std::string message;
    std::optional<errors::McpError> remote;
};

//==========================================================================================================
// ToolExecution
// Purpose: One tool invocation. Status only moves forward (Pending -> Running -> terminal); once terminal
//          the record is never modified again.
// Fields:
//   id: "exec-<n>-<random>"
//   requestId: JSON-RPC id of the tools/call request (empty until Running)
//   result: the raw tools/call result when Completed; isError mirrors its tool-level isError flag
//   error: why the call failed when Failed or Cancelled
//==========================================================================================================
struct ToolExecution {
    std::string id;
    std::string serverId;
    std::string tool;
    JSONValue arguments;
    ExecutionStatus status{ExecutionStatus::Pending};
    std::string requestId;
    std::chrono::system_clock::time_point startTime;
    std::optional<std::chrono::system_clock::time_point> endTime;
    std::optional<int64_t> durationMs;
    std::optional<JSONValue> result;
    bool isError{false};
    std::optional<ExecutionError> error;

    bool IsTerminal() const {
        return status == ExecutionStatus::Completed || status == ExecutionStatus::Failed ||
               status == ExecutionStatus::Cancelled;
    }
};

enum class ExecutionEventKind {
    Started,
    Completed // emitted for every terminal status
};

struct ExecutionEvent {
    ExecutionEventKind kind{ExecutionEventKind::Started};
    ToolExecution execution;
};

//==========================================================================================================
// ToolExecutionTracker
// Purpose: Wraps Connection::CallTool-style requests in ToolExecution records.
// Notes:
//   - Concurrent executions are independent; correlation is by request id in the connection's table.
//   - The tracker remembers running executions only, for Cancel(). Completed records are returned to the
//     caller, which owns the history.
//==========================================================================================================
class ToolExecutionTracker {
public:
    ToolExecutionTracker();
    ~ToolExecutionTracker();

    ToolExecutionTracker(const ToolExecutionTracker&) = delete;
    ToolExecutionTracker& operator=(const ToolExecutionTracker&) = delete;

    //======================================================================================================
    // Execute
    // Purpose: Create a Pending record, publish Started, move to Running, issue tools/call {name, arguments}
    //          and settle to Completed, Failed or Cancelled; publish Completed in every case.
    // Returns:
    //   Future that always yields the terminal record; failures are carried in ToolExecution::error.
    //======================================================================================================
    std::future<ToolExecution> Execute(const std::shared_ptr<Connection>& connection, const std::string& toolName,
                                       const JSONValue& arguments);

    // Cancels a running execution through the connection. False when executionId is not running.
    bool Cancel(const std::string& executionId, const std::string& reason = "cancelled by client");

    // Snapshot of a running execution.
    std::optional<ToolExecution> GetRunning(const std::string& executionId) const;
    std::vector<ToolExecution> Running() const;

    EventEmitter<ExecutionEvent>& Events();

private:
    class Impl;
    std::shared_ptr<Impl> pImpl;
};

} // namespace mcplink
