//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogRing.h
// Purpose: Bounded in-memory protocol log shared by every server of a registry
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

#include "mcplink/JSONRPCTypes.h"

namespace mcplink {

enum class LogSeverity {
    Debug,
    Info,
    Warn,
    Error
};

const char* ToString(LogSeverity level);

// Direction of a protocol frame relative to this client.
enum class LogDirection {
    Sent,
    Received
};

const char* ToString(LogDirection direction);

struct LogEntry {
    uint64_t id{0};
    std::chrono::system_clock::time_point timestamp;
    std::string serverId;
    LogSeverity level{LogSeverity::Info};
    std::string message;
    std::optional<LogDirection> direction;
    std::optional<JSONValue> data;
};

//==========================================================================================================
// LogRing
// Purpose: Append-only ring of LogEntry with a fixed capacity; the oldest entry is evicted first.
// Notes:
//   - Thread-safe. Reads return copies in chronological order.
//   - Entry ids are strictly increasing for the lifetime of the ring (never reused after eviction).
//==========================================================================================================
class LogRing {
public:
    static constexpr std::size_t kDefaultCapacity = 1000;

    explicit LogRing(std::size_t capacity = kDefaultCapacity);

    // Stores the entry (assigning id and timestamp) and returns the stored copy.
    LogEntry Append(const std::string& serverId, LogSeverity level, std::string message,
                    std::optional<LogDirection> direction = std::nullopt,
                    std::optional<JSONValue> data = std::nullopt);

    //======================================================================================================
    // Get
    // Args:
    //   serverId: restrict to one server; all servers when empty
    //   limit: return at most the newest `limit` matching entries
    // Returns:
    //   Matching entries, oldest first.
    //======================================================================================================
    std::vector<LogEntry> Get(const std::optional<std::string>& serverId = std::nullopt,
                              std::optional<std::size_t> limit = std::nullopt) const;

    // Removes the entries of one server, or everything when serverId is empty. Returns the count removed.
    std::size_t Clear(const std::optional<std::string>& serverId = std::nullopt);

    std::size_t Size() const;
    std::size_t Capacity() const { return capacity; }

private:
    mutable std::mutex mutex;
    std::deque<LogEntry> entries;
    std::size_t capacity;
    uint64_t nextId{1};
};

} // namespace mcplink
