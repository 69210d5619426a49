//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Scheduler.h
// Purpose: Shared timer/executor service (one Boost.Asio io_context on a dedicated thread)
//==========================================================================================================

#pragma once

#include <chrono>
#include <functional>
#include <memory>

namespace mcplink {

//==========================================================================================================
// TimerHandle
// Purpose: Cancellable handle for a scheduled callback. Cancel() is idempotent and thread-safe; once it
//          returns the callback will not run (unless it was already running).
//==========================================================================================================
class TimerHandle {
public:
    virtual ~TimerHandle() = default;
    virtual void Cancel() = 0;
    virtual bool IsCancelled() const = 0;
};

//==========================================================================================================
// Scheduler
// Purpose: Posts work and schedules delayed callbacks on a single background thread. All Connection
//          timers (request deadlines, heartbeat, reconnect backoff) run here.
// Notes:
//   - Callbacks must not block; long work should be handed off.
//   - Destroying the Scheduler stops the thread; pending timers are dropped without running.
//==========================================================================================================
class Scheduler {
public:
    Scheduler();
    ~Scheduler();

    Scheduler(const Scheduler&) = delete;
    Scheduler& operator=(const Scheduler&) = delete;

    // Run fn on the scheduler thread as soon as possible.
    void Post(std::function<void()> fn);

    // Run fn after delay unless the returned handle is cancelled first. The timer lives as long as the
    // handle: releasing every copy drops the callback.
    std::shared_ptr<TimerHandle> ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> fn);

    void Stop();

private:
    class Impl;
    std::unique_ptr<Impl> pImpl;
};

} // namespace mcplink
