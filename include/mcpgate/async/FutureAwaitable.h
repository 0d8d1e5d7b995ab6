//==========================================================================================================
// SPDX-License-Identifier: MIT
// Copyright (c) 2025 Vinny Parla
// File: FutureAwaitable.h
// Purpose: Awaiter enabling co_await on std::future inside mcpgate coroutines
//==========================================================================================================

#pragma once

#include <chrono>
#include <coroutine>
#include <future>
#include <thread>
#include <utility>

namespace mcpgate {
namespace async {

// Awaiter for std::future<T>. A ready future (the common case for in-memory storage) resumes inline;
// otherwise a waiter thread blocks on it and resumes the coroutine. wait() does not throw for a
// valid future, so the stored exception surfaces from get() in await_resume.

template <typename T>
class FutureAwaitable {
public:
    explicit FutureAwaitable(std::future<T>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    T await_resume() { return fut.get(); }

private:
    std::future<T> fut;
};

template <>
class FutureAwaitable<void> {
public:
    explicit FutureAwaitable(std::future<void>&& f) : fut(std::move(f)) {}

    bool await_ready() const {
        using namespace std::chrono_literals;
        return fut.wait_for(0s) == std::future_status::ready;
    }

    void await_suspend(std::coroutine_handle<> h) {
        std::thread waiter([this, h]() mutable {
            fut.wait();
            h.resume();
        });
        waiter.detach();
    }

    void await_resume() { fut.get(); }

private:
    std::future<void> fut;
};

template <typename T>
inline FutureAwaitable<T> makeFutureAwaitable(std::future<T>&& fut) {
    return FutureAwaitable<T>(std::move(fut));
}

} // namespace async
} // namespace mcpgate
