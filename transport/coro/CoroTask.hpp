/**
 * \file CoroTask.hpp
 * \brief Minimal C++20 coroutine task type used by the relay tasks.
 * \details Task<T> and Task<void> own the coroutine handle. initial_suspend = suspend_never
 * so a task runs on the caller's thread up to its first suspension point; final_suspend =
 * suspend_always keeps the frame (and its result) alive until the Task is destroyed.
 *
 * Exception policy: for Task<T> an exception escaping the coroutine body is captured and
 * rethrown from get_result(). Task<void> has no result to carry it, so the exception
 * propagates out of whoever resumed the coroutine (the creator, or CoroIoContext, which
 * logs it). Relay loops report ordinary failures as std::error_code results and do not
 * rely on either path.
 */
#pragma once
#include <coroutine>
#include <exception>
#include <optional>
#include <utility>

/**
 * \defgroup coro_module Coroutine I/O Module
 * \brief Event loop, task types, queues and awaitable adapters for cooperative relay tasks.
 * \details `Task<T>` wrappers, the `CoroIoContext` scheduler, `AsyncBoundedQueue`, and
 * awaitable adapters over the local stdio streams and the WebSocket halves.
 */

/** \defgroup coro_task Task Types
 *  \ingroup coro_module
 *  \brief Minimal coroutine task wrappers and semantics.
 */

/** \addtogroup coro_task
 *  @{ */

/** \brief Simple coroutine task type for C++20 coroutines.
 *  \details Owns the coroutine handle; starts executing immediately on creation and stays
 *  suspended at completion until destroyed.
 *  \see transport::CoroIoContext
 */
template<typename T = void>
struct Task {
    struct promise_type {
        Task<T> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        std::suspend_never initial_suspend() { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }
        /// Keep the exception for the owner to observe via get_result()
        void unhandled_exception() { exception_ = std::current_exception(); }

        void return_value(T value) {
            result_ = std::move(value);
        }

        /// Rethrows a captured exception; otherwise returns the stored value
        T get_result() {
            if (exception_) std::rethrow_exception(exception_);
            return std::move(*result_);
        }

    private:
        std::optional<T> result_;
        std::exception_ptr exception_;
    };

    std::coroutine_handle<promise_type> h;

    /// Construct from an existing coroutine handle (Task takes ownership)
    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle) {}
    ~Task() { if (h) h.destroy(); }
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    /// True if the coroutine has reached final suspend
    bool done() const { return !h || h.done(); }

    /// Result produced by the coroutine body; only valid once done()
    T get_result() {
        return h.promise().get_result();
    }
};

/** \brief Specialization for `Task<void>` implementing the same lifetime semantics. */
template<>
struct Task<void> {
    struct promise_type {
        Task<void> get_return_object() {
            return Task{std::coroutine_handle<promise_type>::from_promise(*this)};
        }
        std::suspend_never initial_suspend() { return {}; }
        std::suspend_always final_suspend() noexcept { return {}; }
        void unhandled_exception() { throw; }
        void return_void() {}
    };

    std::coroutine_handle<promise_type> h;

    explicit Task(std::coroutine_handle<promise_type> handle) : h(handle) {}
    ~Task() { if (h) h.destroy(); }
    Task(Task&& other) noexcept : h(other.h) { other.h = nullptr; }
    Task& operator=(Task&& other) noexcept {
        if (this != &other) {
            if (h) h.destroy();
            h = other.h;
            other.h = nullptr;
        }
        return *this;
    }

    Task(const Task&) = delete;
    Task& operator=(const Task&) = delete;

    bool done() const { return !h || h.done(); }
};

/** @} */
