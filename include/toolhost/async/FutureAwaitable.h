//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: co_await on std::future, plus ready and failed futures for early returns
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <exception>
#include <future>
#include <thread>
#include <type_traits>
#include <utility>

namespace toolhost::async {

//==========================================================================================================
// FutureAwaitable
// Purpose: Suspends a Task until a std::future is ready.
// Notes:
//   The coroutine resumes on a detached waiter thread, so code after a co_await must not assume it runs
//   on the thread that started the coroutine. Exceptions stored in the future are rethrown at the
//   co_await.
//==========================================================================================================
template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const noexcept {
        return fut.wait_for(std::chrono::seconds(0)) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread([this, h]() {
            fut.wait();
            h.resume();
        }).detach();
    }

    T await_resume() {
        if constexpr (std::is_void_v<T>) {
            fut.get();
        } else {
            return fut.get();
        }
    }

private:
    std::future<T> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

// Already-completed futures for paths that answer without doing any work.
template <typename T>
std::future<std::decay_t<T>> readyFuture(T&& value) {
    std::promise<std::decay_t<T>> p;
    p.set_value(std::forward<T>(value));
    return p.get_future();
}

inline std::future<void> readyFuture() {
    std::promise<void> p;
    p.set_value();
    return p.get_future();
}

template <typename T, typename E>
std::future<T> failedFuture(E&& error) {
    std::promise<T> p;
    p.set_exception(std::make_exception_ptr(std::forward<E>(error)));
    return p.get_future();
}

} // namespace toolhost::async
