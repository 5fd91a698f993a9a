/**
 * \file WebSocketConnection.hpp
 * \brief Client WebSocket connection split into independent send and receive halves.
 * \ingroup websocket_backend
 * \details Built on Boost.Beast over a Boost.Asio `io_context` that runs on one private
 * I/O thread. The connection is opened synchronously (resolve, TCP connect, upgrade
 * handshake) before the I/O thread starts; afterwards every Beast operation is initiated
 * on that thread and its completion is published to the owning half, which then wakes
 * the `CoroIoContext` so the awaiting task is resumed promptly.
 *
 * The connection is opened once and never re-established. A peer close or a transport
 * failure ends the receive sequence for good.
 */
#pragma once

#include "IMessageChannel.hpp"
#include "WebSocketUrl.hpp"
#include "logger.hpp"
#include "transport/coro/coroIoContext.hpp"

#include <boost/asio/executor_work_guard.hpp>
#include <boost/asio/io_context.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/websocket.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <system_error>
#include <thread>

/** \defgroup websocket_backend WebSocket Backend
 *  \brief Duplex message connection to the remote endpoint.
 */

namespace transport { namespace ws {

/**
 * \brief One client connection to one remote WebSocket endpoint.
 * \ingroup websocket_backend
 * \invariant At most one send and one receive are outstanding at any time.
 */
class WebSocketConnection : public std::enable_shared_from_this<WebSocketConnection> {
    struct Passkey { explicit Passkey() = default; };

public:
    /// Use connect(); the key keeps construction private while allowing make_shared.
    WebSocketConnection(Passkey, std::shared_ptr<Logger> logger, std::shared_ptr<CoroIoContext> ctx);

    /**
     * \brief Open a connection to `url`.
     * \param ctx Scheduler woken whenever a send or receive completes.
     * \return the open connection, or nullptr with `error` set (resolve, connect or
     *         handshake failure).
     */
    static std::shared_ptr<WebSocketConnection> connect(const WebSocketUrl& url,
                                                        std::shared_ptr<Logger> logger,
                                                        std::shared_ptr<CoroIoContext> ctx,
                                                        std::error_code& error);

    /** \brief Stops the I/O thread and drops the TCP connection. */
    ~WebSocketConnection();

    WebSocketConnection(const WebSocketConnection&) = delete;
    WebSocketConnection& operator=(const WebSocketConnection&) = delete;

    /** \brief Send-only half; keeps the connection alive while held. */
    std::shared_ptr<IMessageSink> sink();
    /** \brief Receive-only half; keeps the connection alive while held. */
    std::shared_ptr<IMessageSource> source();

    /** \brief False once the receive side has observed a close or failure. */
    bool is_open() const { return open_.load(std::memory_order_acquire); }
    std::string remote_endpoint() const { return remote_endpoint_; }
    std::string local_endpoint() const { return local_endpoint_; }

private:
    class Sink;
    class Source;

    bool open(const WebSocketUrl& url, std::error_code& error);
    void start_io_thread();

    std::shared_ptr<Logger> logger_;
    std::shared_ptr<CoroIoContext> context_;

    boost::asio::io_context ioc_;
    std::optional<boost::asio::executor_work_guard<boost::asio::io_context::executor_type>> work_guard_;
    boost::beast::websocket::stream<boost::beast::tcp_stream> ws_;
    std::thread io_thread_;

    std::unique_ptr<Sink> sink_;
    std::unique_ptr<Source> source_;

    std::atomic<bool> open_{false};
    std::string remote_endpoint_;
    std::string local_endpoint_;
};

} } // namespace transport::ws
