//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: LogRing.cpp
// Purpose: Bounded in-memory protocol log
//==========================================================================================================

#include <algorithm>

#include "mcplink/LogRing.h"

namespace mcplink {

const char* ToString(LogSeverity level) {
    switch (level) {
        case LogSeverity::Debug: return "debug";
        case LogSeverity::Info: return "info";
        case LogSeverity::Warn: return "warn";
        case LogSeverity::Error: return "error";
    }
    return "info";
}

const char* ToString(LogDirection direction) {
    switch (direction) {
        case LogDirection::Sent: return "sent";
        case LogDirection::Received: return "received";
    }
    return "sent";
}

LogRing::LogRing(std::size_t capacity) : capacity(capacity == 0 ? 1 : capacity) {}

LogEntry LogRing::Append(const std::string& serverId, LogSeverity level, std::string message,
                         std::optional<LogDirection> direction, std::optional<JSONValue> data) {
    LogEntry entry;
    entry.timestamp = std::chrono::system_clock::now();
    entry.serverId = serverId;
    entry.level = level;
    entry.message = std::move(message);
    entry.direction = direction;
    entry.data = std::move(data);

    std::lock_guard<std::mutex> lk(mutex);
    entry.id = nextId++;
    while (entries.size() >= capacity) {
        entries.pop_front();
    }
    entries.push_back(entry);
    return entry;
}

std::vector<LogEntry> LogRing::Get(const std::optional<std::string>& serverId, std::optional<std::size_t> limit) const {
    std::vector<LogEntry> out;
    std::lock_guard<std::mutex> lk(mutex);
    for (const auto& e : entries) {
        if (!serverId || e.serverId == *serverId) {
            out.push_back(e);
        }
    }
    if (limit && out.size() > *limit) {
        out.erase(out.begin(), out.end() - static_cast<std::ptrdiff_t>(*limit));
    }
    return out;
}

std::size_t LogRing::Clear(const std::optional<std::string>& serverId) {
    std::lock_guard<std::mutex> lk(mutex);
    const std::size_t before = entries.size();
    if (!serverId) {
        entries.clear();
        return before;
    }
    entries.erase(std::remove_if(entries.begin(), entries.end(),
                                 [&](const LogEntry& e) { return e.serverId == *serverId; }),
                  entries.end());
    return before - entries.size();
}

std::size_t LogRing::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.size();
}

} // namespace mcplink
