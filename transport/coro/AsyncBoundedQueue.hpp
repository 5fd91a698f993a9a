#ifndef ASYNC_BOUNDED_QUEUE_HPP
#define ASYNC_BOUNDED_QUEUE_HPP

#include "coroIoContext.hpp"
#include "relayErrors.hpp"

#include <coroutine>
#include <cstddef>
#include <deque>
#include <memory>
#include <mutex>
#include <optional>
#include <system_error>
#include <utility>

namespace transport {

/**
 * @brief A fixed-capacity FIFO channel between one producer task and one consumer task.
 *
 * Producers `co_await async_push(v)` and are suspended (not blocked) while the queue is
 * full; consumers `co_await async_pop()` and are suspended while it is empty. Closing the
 * queue lets the consumer drain what is left: once closed and empty, pops yield
 * std::nullopt. Nothing is ever dropped; the length never exceeds the capacity.
 *
 * Suspended operations are parked in the CoroIoContext, which re-polls try_push/try_pop.
 * The mutex keeps the non-awaitable accessors safe to call from any thread.
 *
 * @tparam T The element type; moved in and out.
 */
template <typename T>
class AsyncBoundedQueue {
public:
    AsyncBoundedQueue(std::size_t capacity, std::shared_ptr<CoroIoContext> context)
        : capacity_(capacity == 0 ? 1 : capacity), context_(std::move(context)) {}

    AsyncBoundedQueue(const AsyncBoundedQueue&) = delete;
    AsyncBoundedQueue& operator=(const AsyncBoundedQueue&) = delete;

    /**
     * @brief Attempts to append `value` without suspending.
     *
     * @return true when the attempt is finished: either `value` was moved into the queue,
     *         or the queue is closed and `error` is set to relay::errc::queue_closed.
     *         false when the queue is full.
     */
    bool try_push(T& value, std::error_code& error) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (closed_) {
            error = relay::errc::queue_closed;
            return true;
        }
        if (queue_.size() >= capacity_) {
            return false;
        }
        queue_.push_back(std::move(value));
        error.clear();
        return true;
    }

    /**
     * @brief Attempts to take the front element without suspending.
     *
     * @return true when the attempt is finished: `out` holds the element, or the queue is
     *         closed and drained and `out` is std::nullopt. false when empty but still open.
     */
    bool try_pop(std::optional<T>& out) {
        std::lock_guard<std::mutex> lock(mutex_);
        if (!queue_.empty()) {
            out.emplace(std::move(queue_.front()));
            queue_.pop_front();
            return true;
        }
        if (closed_) {
            out.reset();
            return true;
        }
        return false;
    }

    /**
     * @brief Awaitable push; suspends while full.
     * @throws std::system_error (relay::errc::queue_closed) if the queue was closed.
     */
    auto async_push(T value) {
        struct PushAwaitable {
            AsyncBoundedQueue* queue;
            T value;
            std::error_code error{};
            bool await_ready() { return queue->try_push(value, error); }
            void await_suspend(std::coroutine_handle<> handle) {
                queue->context_->register_pending(CoroIoContext::PendingOpCategory::QueuePush,
                    [this]() { return queue->try_push(value, error); }, handle);
            }
            void await_resume() {
                if (error) {
                    throw std::system_error(error, "Queue push failed");
                }
            }
        };
        return PushAwaitable{this, std::move(value)};
    }

    /**
     * @brief Awaitable pop; suspends while empty and open.
     * @return the front element, or std::nullopt once closed and drained.
     */
    auto async_pop() {
        struct PopAwaitable {
            AsyncBoundedQueue* queue;
            std::optional<T> out{};
            bool await_ready() { return queue->try_pop(out); }
            void await_suspend(std::coroutine_handle<> handle) {
                queue->context_->register_pending(CoroIoContext::PendingOpCategory::QueuePop,
                    [this]() { return queue->try_pop(out); }, handle);
            }
            std::optional<T> await_resume() { return std::move(out); }
        };
        return PopAwaitable{this};
    }

    /// Marks the end of production. Idempotent; buffered elements stay poppable.
    void close() {
        {
            std::lock_guard<std::mutex> lock(mutex_);
            closed_ = true;
        }
        context_->wake();
    }

    bool closed() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return closed_;
    }

    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.size();
    }

    bool empty() const {
        std::lock_guard<std::mutex> lock(mutex_);
        return queue_.empty();
    }

    std::size_t capacity() const { return capacity_; }

private:
    const std::size_t capacity_;
    std::shared_ptr<CoroIoContext> context_;
    mutable std::mutex mutex_;
    std::deque<T> queue_;
    bool closed_ = false;
};

} // namespace transport

#endif // ASYNC_BOUNDED_QUEUE_HPP
