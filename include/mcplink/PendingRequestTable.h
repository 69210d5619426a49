//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: PendingRequestTable.h
// Purpose: Correlates in-flight JSON-RPC request ids with waiting callers and their deadlines
//==========================================================================================================

#pragma once

#include <chrono>
#include <cstddef>
#include <exception>
#include <future>
#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

#include "mcplink/JSONRPCTypes.h"
#include "mcplink/Scheduler.h"
#include "mcplink/errors/Errors.h"

namespace mcplink {

//==========================================================================================================
// PendingRequestTable
// Purpose: At-most-once resolution slot per request id.
// Notes:
//   - Every operation removes the entry under the mutex first and fulfils the promise afterwards, so the
//     first of Resolve/Reject/Expire/DrainAll wins and every later call on the same id is a no-op.
//   - The deadline timer runs on the Scheduler; settling an entry cancels its timer.
//==========================================================================================================
class PendingRequestTable {
public:
    explicit PendingRequestTable(Scheduler& scheduler);
    ~PendingRequestTable();

    PendingRequestTable(const PendingRequestTable&) = delete;
    PendingRequestTable& operator=(const PendingRequestTable&) = delete;

    //======================================================================================================
    // Register
    // Purpose: Creates a pending slot for id with the given deadline.
    // Args:
    //   id: request id key (see IdToString)
    //   timeout: deadline; a zero timeout disables the timer
    //   method: method name, used only for diagnostics
    // Returns:
    //   future fulfilled with the result value, or failing with ClientError (RemoteError, RequestTimeout,
    //   or whatever DrainAll supplies).
    // Throws:
    //   std::invalid_argument when id is already pending.
    //======================================================================================================
    std::future<JSONValue> Register(const std::string& id, std::chrono::milliseconds timeout,
                                    const std::string& method = std::string());

    // Fulfil id with a result. Returns false when id is not pending.
    bool Resolve(const std::string& id, JSONValue value);

    // Fail id with the given exception. Returns false when id is not pending.
    bool Reject(const std::string& id, std::exception_ptr error);

    // Deadline path: fail id with ClientError(RequestTimeout). Returns false when id is not pending.
    bool Expire(const std::string& id);

    // Fail every pending entry with ClientError(kind, reason). Returns the number of entries failed.
    std::size_t DrainAll(errors::ErrorKind kind, const std::string& reason);

    std::size_t Size() const;
    bool Contains(const std::string& id) const;

private:
    struct Entry {
        std::promise<JSONValue> promise;
        std::shared_ptr<TimerHandle> timer;
        std::string method;
        std::chrono::steady_clock::time_point registeredAt;
    };

    // Removes id under the lock; returns the entry (promise still unfulfilled) or nullptr.
    std::unique_ptr<Entry> take(const std::string& id);

    Scheduler& scheduler;
    std::shared_ptr<PendingRequestTable*> alive; // guards timer callbacks after destruction
    mutable std::mutex mutex;
    std::unordered_map<std::string, std::unique_ptr<Entry>> entries;
};

} // namespace mcplink
