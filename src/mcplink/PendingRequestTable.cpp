//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequestTable.cpp
// Purpose: At-most-once resolution of in-flight requests with scheduler-driven deadlines
//==========================================================================================================

#include <stdexcept>

#include "logging/Logger.h"
#include "mcplink/PendingRequestTable.h"

namespace mcplink {

PendingRequestTable::PendingRequestTable(Scheduler& s)
    : scheduler(s), alive(std::make_shared<PendingRequestTable*>(this)) {}

PendingRequestTable::~PendingRequestTable() {
    alive.reset();
    const std::size_t n = DrainAll(errors::ErrorKind::ConnectionClosed, "Connection destroyed");
    if (n > 0) {
        LOG_DEBUG("PendingRequestTable destroyed with {} outstanding request(s)", n);
    }
}

std::future<JSONValue> PendingRequestTable::Register(const std::string& id, std::chrono::milliseconds timeout,
                                                     const std::string& method) {
    FUNC_SCOPE();
    auto entry = std::make_unique<Entry>();
    entry->method = method;
    entry->registeredAt = std::chrono::steady_clock::now();
    auto fut = entry->promise.get_future();
    Entry* raw = entry.get();
    {
        std::lock_guard<std::mutex> lk(mutex);
        if (entries.find(id) != entries.end()) {
            throw std::invalid_argument("Request id already pending: " + id);
        }
        entries.emplace(id, std::move(entry));
        if (timeout.count() > 0) {
            std::weak_ptr<PendingRequestTable*> token = alive;
            // Timer stored while holding the lock so a concurrent settle always sees it
            raw->timer = scheduler.ScheduleAfter(timeout, [token, id]() {
                if (auto self = token.lock()) {
                    if ((*self)->Expire(id)) {
                        LOG_DEBUG("Request {} expired", id);
                    }
                }
            });
        }
    }
    return fut;
}

std::unique_ptr<PendingRequestTable::Entry> PendingRequestTable::take(const std::string& id) {
    std::lock_guard<std::mutex> lk(mutex);
    auto it = entries.find(id);
    if (it == entries.end()) {
        return nullptr;
    }
    std::unique_ptr<Entry> entry = std::move(it->second);
    entries.erase(it);
    return entry;
}

bool PendingRequestTable::Resolve(const std::string& id, JSONValue value) {
    auto entry = take(id);
    if (!entry) {
        return false;
    }
    if (entry->timer) {
        entry->timer->Cancel();
    }
    entry->promise.set_value(std::move(value));
    return true;
}

bool PendingRequestTable::Reject(const std::string& id, std::exception_ptr error) {
    auto entry = take(id);
    if (!entry) {
        return false;
    }
    if (entry->timer) {
        entry->timer->Cancel();
    }
    entry->promise.set_exception(std::move(error));
    return true;
}

bool PendingRequestTable::Expire(const std::string& id) {
    auto entry = take(id);
    if (!entry) {
        return false;
    }
    const auto elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - entry->registeredAt).count();
    std::string what = "Request timed out";
    if (!entry->method.empty()) {
        what += ": " + entry->method;
    }
    what += " (id=" + id + ", after " + std::to_string(elapsed) + "ms)";
    entry->promise.set_exception(std::make_exception_ptr(errors::ClientError(errors::ErrorKind::RequestTimeout, what)));
    return true;
}

std::size_t PendingRequestTable::DrainAll(errors::ErrorKind kind, const std::string& reason) {
    std::unordered_map<std::string, std::unique_ptr<Entry>> drained;
    {
        std::lock_guard<std::mutex> lk(mutex);
        drained.swap(entries);
    }
    for (auto& [id, entry] : drained) {
        if (entry->timer) {
            entry->timer->Cancel();
        }
        entry->promise.set_exception(std::make_exception_ptr(errors::ClientError(kind, reason)));
    }
    return drained.size();
}

std::size_t PendingRequestTable::Size() const {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.size();
}

bool PendingRequestTable::Contains(const std::string& id) const {
    std::lock_guard<std::mutex> lk(mutex);
    return entries.find(id) != entries.end();
}

} // namespace mcplink
