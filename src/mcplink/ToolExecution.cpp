//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: ToolExecution.cpp
// Purpose: Tool execution tracker implementation
//==========================================================================================================

#include <atomic>
#include <iomanip>
#include <mutex>
#include <random>
#include <sstream>
#include <unordered_map>

#include "logging/Logger.h"
#include "mcplink/Protocol.h"
#include "mcplink/ToolExecution.h"
#include "mcplink/async/FutureAwaitable.h"
#include "mcplink/async/Task.h"

namespace mcplink {

const char* ToString(ExecutionStatus status) {
    switch (status) {
        case ExecutionStatus::Pending: return "pending";
        case ExecutionStatus::Running: return "running";
        case ExecutionStatus::Completed: return "completed";
        case ExecutionStatus::Failed: return "failed";
        case ExecutionStatus::Cancelled: return "cancelled";
    }
    return "pending";
}

class ToolExecutionTracker::Impl : public std::enable_shared_from_this<ToolExecutionTracker::Impl> {
public:
    struct Active {
        ToolExecution record;
        std::weak_ptr<Connection> connection;
    };

    EventEmitter<ExecutionEvent> events;
    std::atomic<uint64_t> counter{0};
    mutable std::mutex mutex;
    std::unordered_map<std::string, Active> running;
    std::mt19937 rng{std::random_device{}()};

    std::string nextExecutionId() {
        uint32_t suffix = 0;
        {
            std::lock_guard<std::mutex> lk(mutex);
            suffix = static_cast<uint32_t>(rng() & 0xFFFFFFu);
        }
        std::ostringstream oss;
        oss << "exec-" << ++counter << "-" << std::hex << std::setw(6) << std::setfill('0') << suffix;
        return oss.str();
    }

    void publish(ExecutionEventKind kind, const ToolExecution& rec) {
        ExecutionEvent ev;
        ev.kind = kind;
        ev.execution = rec;
        events.Publish(ev);
    }

    static async::Task<ToolExecution> coExecute(std::shared_ptr<Impl> self, std::shared_ptr<Connection> conn,
                                                ToolExecution rec) {
        PendingCall call = conn->StartRequest(
            Methods::CallTool, MakeObject({{"name", JSONValue(rec.tool)}, {"arguments", rec.arguments}}));
        rec.requestId = call.id;
        {
            std::lock_guard<std::mutex> lk(self->mutex);
            auto it = self->running.find(rec.id);
            if (it != self->running.end()) {
                it->second.record.requestId = call.id;
            }
        }

        ExecutionStatus terminal = ExecutionStatus::Completed;
        std::optional<JSONValue> result;
        std::optional<ExecutionError> failure;
        try {
            result = co_await async::makeFutureAwaitable(std::move(call.result));
        } catch (const errors::ClientError& e) {
            terminal = e.kind() == errors::ErrorKind::Cancelled ? ExecutionStatus::Cancelled : ExecutionStatus::Failed;
            failure = ExecutionError{e.kind(), e.what(), e.remote()};
        } catch (const std::exception& e) {
            terminal = ExecutionStatus::Failed;
            failure = ExecutionError{errors::ErrorKind::TransportLost, e.what(), std::nullopt};
        }

        auto end = std::chrono::system_clock::now();
        if (end <= rec.startTime) {
            end = rec.startTime + std::chrono::microseconds(1); // endTime is strictly after startTime
        }
        rec.endTime = end;
        rec.durationMs = std::chrono::duration_cast<std::chrono::milliseconds>(end - rec.startTime).count();
        rec.status = terminal;
        if (result) {
            rec.isError = GetBool(*result, "isError").value_or(false);
            rec.result = std::move(result);
        }
        rec.error = std::move(failure);

        {
            std::lock_guard<std::mutex> lk(self->mutex);
            self->running.erase(rec.id);
        }
        if (rec.status == ExecutionStatus::Completed) {
            LOG_INFO("Execution {} ({} on {}) completed in {} ms{}", rec.id, rec.tool, rec.serverId, *rec.durationMs,
                     rec.isError ? " with tool error" : "");
        } else {
            LOG_WARN("Execution {} ({} on {}) {}: {}", rec.id, rec.tool, rec.serverId, ToString(rec.status),
                     rec.error ? rec.error->message : std::string());
        }
        self->publish(ExecutionEventKind::Completed, rec);
        co_return rec;
    }
};

ToolExecutionTracker::ToolExecutionTracker() : pImpl(std::make_shared<Impl>()) {}

ToolExecutionTracker::~ToolExecutionTracker() = default;

std::future<ToolExecution> ToolExecutionTracker::Execute(const std::shared_ptr<Connection>& connection,
                                                         const std::string& toolName, const JSONValue& arguments) {
    FUNC_SCOPE();
    if (!connection) {
        throw std::invalid_argument("ToolExecutionTracker::Execute requires a connection");
    }
    ToolExecution rec;
    rec.id = pImpl->nextExecutionId();
    rec.serverId = connection->ServerId();
    rec.tool = toolName;
    rec.arguments = arguments;
    rec.status = ExecutionStatus::Pending;
    rec.startTime = std::chrono::system_clock::now();
    pImpl->publish(ExecutionEventKind::Started, rec);

    rec.status = ExecutionStatus::Running;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        pImpl->running[rec.id] = Impl::Active{rec, connection};
    }
    LOG_DEBUG("Execution {} started: {} on {}", rec.id, toolName, rec.serverId);
    return Impl::coExecute(pImpl, connection, std::move(rec)).toFuture();
}

bool ToolExecutionTracker::Cancel(const std::string& executionId, const std::string& reason) {
    FUNC_SCOPE();
    std::shared_ptr<Connection> conn;
    std::string requestId;
    {
        std::lock_guard<std::mutex> lk(pImpl->mutex);
        auto it = pImpl->running.find(executionId);
        if (it == pImpl->running.end()) {
            return false;
        }
        conn = it->second.connection.lock();
        requestId = it->second.record.requestId;
    }
    if (!conn || requestId.empty()) {
        return false;
    }
    return conn->CancelRequest(requestId, reason);
}

std::optional<ToolExecution> ToolExecutionTracker::GetRunning(const std::string& executionId) const {
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    auto it = pImpl->running.find(executionId);
    if (it == pImpl->running.end()) {
        return std::nullopt;
    }
    return it->second.record;
}

std::vector<ToolExecution> ToolExecutionTracker::Running() const {
    std::vector<ToolExecution> out;
    std::lock_guard<std::mutex> lk(pImpl->mutex);
    out.reserve(pImpl->running.size());
    for (const auto& [id, active] : pImpl->running) {
        out.push_back(active.record);
    }
    return out;
}

EventEmitter<ExecutionEvent>& ToolExecutionTracker::Events() {
    return pImpl->events;
}

} // namespace mcplink
