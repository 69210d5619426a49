//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiters enabling co_await on std::future (plain and deadline-bounded) for C++20 coroutines
//==========================================================================================================

#pragma once

#include <future>
#include <coroutine>
#include <chrono>
#include <thread>
#include <utility>

namespace mcplink {
namespace async {

// Awaiter for std::future<T>. The awaited future's exception (if any) is rethrown from co_await.

template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        // Offload waiting to a background thread and resume when ready.
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    decltype(auto) await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

//==========================================================================================================
// DeadlineAwaitable
// Purpose: Suspends until the referenced future is ready or the timeout elapses, whichever comes first.
//          co_await yields true when the future became ready; the future itself is left untouched so the
//          caller decides whether to get() it. The future must outlive the await (keep it in the frame).
//==========================================================================================================
template <typename T>
class DeadlineAwaitable {
public:
    DeadlineAwaitable(std::future<T>& f, std::chrono::milliseconds timeout) : fut(f), timeout(timeout) {}

    bool await_ready() const noexcept {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            ready = fut.wait_for(timeout) == std::future_status::ready;
            h.resume();
        });
        waiter.detach();
    }

    bool await_resume() {
        using namespace std::chrono_literals;
        return ready || fut.wait_for(0s) == std::future_status::ready;
    }

private:
    std::future<T>& fut;
    std::chrono::milliseconds timeout;
    bool ready{false};
};

// Helper factories

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

template <typename T>
inline DeadlineAwaitable<T> waitFor(std::future<T>& fut, std::chrono::milliseconds timeout) {
    return DeadlineAwaitable<T>(fut, timeout);
}

} // namespace async
} // namespace mcplink
