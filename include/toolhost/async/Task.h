//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: Task.h
// Purpose: Eager coroutine type whose outcome is observed through a std::future
//==========================================================================================================

#pragma once

#include <concepts>
#include <coroutine>
#include <exception>
#include <future>
#include <type_traits>
#include <utility>

namespace toolhost::async {

template <typename T>
class Task;

namespace detail {

// Shared promise plumbing. The coroutine runs to its first suspension inside the call that created it
// and destroys its own frame when it finishes; the std::promise carries the outcome out.
template <typename T>
struct TaskPromiseBase {
    std::promise<T> outcome;

    Task<T> get_return_object() noexcept;
    std::suspend_never initial_suspend() const noexcept { return {}; }
    std::suspend_never final_suspend() const noexcept { return {}; }
    void unhandled_exception() { outcome.set_exception(std::current_exception()); }
};

template <typename T>
struct TaskPromise : TaskPromiseBase<T> {
    template <typename U>
    requires std::convertible_to<U, T>
    void return_value(U&& v) { this->outcome.set_value(std::forward<U>(v)); }
};

template <>
struct TaskPromise<void> : TaskPromiseBase<void> {
    void return_void() { outcome.set_value(); }
};

} // namespace detail

//==========================================================================================================
// Task
// Purpose: Return type for the client and registry coroutines.
// Notes:
//   - Eager: the body starts immediately. Dropping the Task does not cancel it.
//   - toFuture() hands the outcome over once; a second call yields an invalid future.
//==========================================================================================================
template <typename T>
class Task {
public:
    using value_type = T;
    using promise_type = detail::TaskPromise<T>;

    Task(Task&&) noexcept = default;
    Task& operator=(Task&&) noexcept = default;
    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    std::future<T> toFuture() { return std::move(fut); }

private:
    friend struct detail::TaskPromiseBase<T>;
    explicit Task(std::future<T> f) : fut(std::move(f)) {}

    std::future<T> fut;
};

template <typename T>
Task<T> detail::TaskPromiseBase<T>::get_return_object() noexcept {
    return Task<T>(outcome.get_future());
}

} // namespace toolhost::async
