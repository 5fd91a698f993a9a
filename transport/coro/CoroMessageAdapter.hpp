/**
 * \file CoroMessageAdapter.hpp
 * \brief Awaitable send/receive over the halves of a duplex message connection.
 * \details Wraps `ws::IMessageSink` / `ws::IMessageSource` by composition, the same way
 * the stdio adapters wrap the descriptor backend: fast path in `await_ready()`, slow path
 * parked in the `CoroIoContext` until the half reports completion.
 */
#pragma once

#include "coroIoContext.hpp"
#include "relayErrors.hpp"
#include "transport/websocket/IMessageChannel.hpp"

#include <coroutine>
#include <memory>
#include <optional>
#include <system_error>
#include <utility>

namespace transport {

/** \brief Result of one receive: a message, a per-item error, or the end of the sequence.
 *  \ingroup coro_adapter
 */
struct ReceiveResult {
    std::optional<ws::Message> message;
    std::error_code error;

    /// The source has terminated; no further items will follow.
    bool closed() const { return error == relay::errc::connection_closed; }
};

/**
 * \brief Coroutine-aware wrapper over the send half.
 * \ingroup coro_adapter
 * \invariant At most one in-flight send per adapter instance.
 */
class CoroMessageSink {
public:
    CoroMessageSink(std::shared_ptr<ws::IMessageSink> sink, std::shared_ptr<CoroIoContext> ctx)
        : sink_(std::move(sink)), context_(std::move(ctx)) {}

    /** \brief Await transmission of `message`.
     *  \throws std::system_error carrying the transport error when the send fails.
     */
    auto async_send(ws::Message message) {
        struct SendAwaitable {
            CoroMessageSink* adapter;
            ws::Message message;
            std::error_code error{};
            bool await_ready() { return adapter->sink_->try_send(message, error); }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::Send, [this]() {
                    return adapter->sink_->try_send(message, error);
                }, handle);
            }
            void await_resume() {
                if (error) {
                    throw std::system_error(error, "Async send failed");
                }
            }
        };
        return SendAwaitable{this, std::move(message)};
    }

private:
    std::shared_ptr<ws::IMessageSink> sink_;
    std::shared_ptr<CoroIoContext> context_;
};

/**
 * \brief Coroutine-aware wrapper over the receive half.
 * \ingroup coro_adapter
 * \details Never throws: per-item errors and the end of the sequence are part of the result.
 */
class CoroMessageSource {
public:
    CoroMessageSource(std::shared_ptr<ws::IMessageSource> source, std::shared_ptr<CoroIoContext> ctx)
        : source_(std::move(source)), context_(std::move(ctx)) {}

    auto async_receive() {
        struct ReceiveAwaitable {
            CoroMessageSource* adapter;
            ReceiveResult result{};
            bool await_ready() { return adapter->source_->try_receive(result.message, result.error); }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::Receive, [this]() {
                    return adapter->source_->try_receive(result.message, result.error);
                }, handle);
            }
            ReceiveResult await_resume() { return std::move(result); }
        };
        return ReceiveAwaitable{this};
    }

private:
    std::shared_ptr<ws::IMessageSource> source_;
    std::shared_ptr<CoroIoContext> context_;
};

} // namespace transport
