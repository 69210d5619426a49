//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine Task type bridging to std::future for C++20
//==========================================================================================================

#pragma once

#include <coroutine>
#include <future>
#include <exception>
#include <utility>
#include <type_traits>

namespace mcplink {
namespace async {

// Task<T> - coroutine-returning type that exposes a std::future<T>
// Usage: Task<T> foo() { co_return value; } -> foo().toFuture()
// The coroutine starts eagerly and its frame frees itself on completion; the future is the only handle,
// so dropping the Task never cancels the work.

template <typename T>
class Task;

namespace detail {

template <typename T>
struct TaskPromiseBase {
    std::promise<T> promise;
    std::suspend_never initial_suspend() noexcept { return {}; }
    std::suspend_never final_suspend() noexcept { return {}; }
    void unhandled_exception() { promise.set_exception(std::current_exception()); }
};

template <typename T>
struct TaskPromise : TaskPromiseBase<T> {
    Task<T> get_return_object() noexcept;
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->promise.set_value(std::forward<U>(v)); }
};

template <>
struct TaskPromise<void> : TaskPromiseBase<void> {
    Task<void> get_return_object() noexcept;
    void return_void() { this->promise.set_value(); }
};

} // namespace detail

template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&& other) noexcept : fut(std::move(other.fut)) {}
    Task& operator=(Task&& other) noexcept { fut = std::move(other.fut); return *this; }
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    friend struct detail::TaskPromise<T>;
    explicit Task(std::future<T>&& f) : fut(std::move(f)) {}
    std::future<T> fut;
};

namespace detail {

template <typename T>
Task<T> TaskPromise<T>::get_return_object() noexcept {
    return Task<T>{ this->promise.get_future() };
}

inline Task<void> TaskPromise<void>::get_return_object() noexcept {
    return Task<void>{ this->promise.get_future() };
}

} // namespace detail

} // namespace async
} // namespace mcplink
