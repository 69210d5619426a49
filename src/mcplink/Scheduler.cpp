//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Scheduler.cpp
// Purpose: Boost.Asio backed timer/executor service
//==========================================================================================================

#include <atomic>
#include <mutex>
#include <thread>
#include <utility>

#include <boost/asio.hpp>

#include "logging/Logger.h"
#include "mcplink/Scheduler.h"

namespace mcplink {

namespace net = boost::asio;

namespace {
class AsioTimerHandle : public TimerHandle {
public:
    explicit AsioTimerHandle(std::shared_ptr<net::io_context> ctx) : ioc(std::move(ctx)), timer(*ioc) {}

    void Cancel() override {
        cancelled.store(true);
        // Timer cancellation must happen on the io thread; the flag already makes the callback inert.
        net::post(timer.get_executor(), [weak = weakSelf]() {
            if (auto self = weak.lock()) {
                self->timer.cancel();
            }
        });
    }

    bool IsCancelled() const override { return cancelled.load(); }

    std::shared_ptr<net::io_context> ioc; // outlives timer
    net::steady_timer timer;
    std::atomic<bool> cancelled{false};
    std::weak_ptr<AsioTimerHandle> weakSelf;
};
} // namespace

class Scheduler::Impl {
public:
    std::shared_ptr<net::io_context> ioc = std::make_shared<net::io_context>();
    std::unique_ptr<net::executor_work_guard<net::io_context::executor_type>> workGuard;
    std::thread ioThread;
    std::mutex stopMutex;
    bool stopped{false};

    Impl() {
        workGuard = std::make_unique<net::executor_work_guard<net::io_context::executor_type>>(net::make_work_guard(*ioc));
        ioThread = std::thread([this, ctx = ioc]() {
            try {
                ctx->run();
            } catch (const std::exception& e) {
                LOG_ERROR("Scheduler io thread exception: {}", e.what());
            }
        });
    }

    void stop() {
        std::lock_guard<std::mutex> lk(stopMutex);
        if (stopped) {
            return;
        }
        stopped = true;
        workGuard.reset();
        ioc->stop();
        if (ioThread.joinable()) {
            if (std::this_thread::get_id() == ioThread.get_id()) {
                // Last owner released from a callback on our own thread; the thread keeps ioc alive
                ioThread.detach();
            } else {
                ioThread.join();
            }
        }
    }
};

Scheduler::Scheduler() : pImpl(std::make_unique<Impl>()) {}

Scheduler::~Scheduler() {
    pImpl->stop();
}

void Scheduler::Stop() {
    pImpl->stop();
}

void Scheduler::Post(std::function<void()> fn) {
    net::post(*pImpl->ioc, [fn = std::move(fn)]() {
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduler task threw: {}", e.what());
        }
    });
}

std::shared_ptr<TimerHandle> Scheduler::ScheduleAfter(std::chrono::milliseconds delay, std::function<void()> fn) {
    auto handle = std::make_shared<AsioTimerHandle>(pImpl->ioc);
    handle->weakSelf = handle;
    handle->timer.expires_after(delay);
    std::weak_ptr<AsioTimerHandle> weak = handle;
    handle->timer.async_wait([weak, fn = std::move(fn)](const boost::system::error_code& ec) {
        auto self = weak.lock();
        if (!self || ec == net::error::operation_aborted || self->cancelled.load()) {
            return;
        }
        try {
            fn();
        } catch (const std::exception& e) {
            LOG_ERROR("Scheduled callback threw: {}", e.what());
        }
    });
    return handle;
}

} // namespace mcplink
