/**
 * \file WebSocketConnection.cpp
 * \brief Boost.Beast implementation of the duplex connection and its two halves.
 * \ingroup websocket_backend
 * \details Each half keeps a small state machine guarded by its own mutex:
 * idle -> in flight (operation posted to the I/O thread) -> done (completion stored,
 * scheduler woken) -> idle once the polling task has collected the result.
 */
#include "WebSocketConnection.hpp"
#include "relayErrors.hpp"
#include "processUtils.hpp"

#include <boost/asio/ip/tcp.hpp>
#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http/field.hpp>
#include <boost/beast/websocket.hpp>

#include <algorithm>
#include <sstream>
#include <utility>
#include <variant>

namespace beast = boost::beast;
namespace websocket = boost::beast::websocket;
namespace net = boost::asio;
using tcp = boost::asio::ip::tcp;

namespace transport { namespace ws {

namespace {

std::string format_endpoint(const tcp::endpoint& ep) {
    std::ostringstream oss;
    oss << ep;
    return oss.str();
}

websocket::ping_data to_ping_data(const std::string& payload) {
    websocket::ping_data data;
    data.assign(payload.data(), (std::min)(payload.size(), static_cast<std::size_t>(data.max_size())));
    return data;
}

} // namespace

// --- Sink ---------------------------------------------------------------------------

class WebSocketConnection::Sink final : public IMessageSink {
public:
    explicit Sink(WebSocketConnection& owner) : owner_(owner) {}

    bool try_send(const Message& message, std::error_code& error) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (!in_flight_) {
            in_flight_ = true;
            done_ = false;
            result_.clear();
            start(message);
            return false;
        }
        if (!done_) return false;
        in_flight_ = false;
        error = result_;
        return true;
    }

private:
    // Called with mutex_ held; the copy in outgoing_ backs the buffers until completion.
    void start(const Message& message) {
        outgoing_ = message;
        net::post(owner_.ioc_, [this]() {
            auto& ws = owner_.ws_;
            auto on_write = [this](beast::error_code ec, std::size_t) { complete(ec); };
            auto on_control = [this](beast::error_code ec) { complete(ec); };
            if (auto* text = std::get_if<TextMessage>(&outgoing_)) {
                ws.text(true);
                ws.async_write(net::buffer(text->payload), on_write);
            } else if (auto* bin = std::get_if<BinaryMessage>(&outgoing_)) {
                ws.binary(true);
                ws.async_write(net::buffer(bin->payload), on_write);
            } else if (auto* ping = std::get_if<PingMessage>(&outgoing_)) {
                ws.async_ping(to_ping_data(ping->payload), on_control);
            } else if (auto* pong = std::get_if<PongMessage>(&outgoing_)) {
                ws.async_pong(to_ping_data(pong->payload), on_control);
            } else if (auto* close = std::get_if<CloseMessage>(&outgoing_)) {
                ws.async_close(websocket::close_reason(static_cast<websocket::close_code>(close->code), close->reason),
                               on_control);
            }
        });
    }

    void complete(const beast::error_code& ec) {
        {
            std::lock_guard<std::mutex> lk(mutex_);
            result_ = ec;
            done_ = true;
        }
        owner_.context_->wake();
    }

    WebSocketConnection& owner_;
    std::mutex mutex_;
    bool in_flight_ = false;
    bool done_ = false;
    std::error_code result_;
    Message outgoing_;
};

// --- Source -------------------------------------------------------------------------

class WebSocketConnection::Source final : public IMessageSource {
public:
    explicit Source(WebSocketConnection& owner) : owner_(owner) {}

    bool try_receive(std::optional<Message>& message, std::error_code& error) override {
        std::lock_guard<std::mutex> lk(mutex_);
        if (finished_) {
            error = relay::errc::connection_closed;
            return true;
        }
        if (!in_flight_) {
            in_flight_ = true;
            done_ = false;
            start();
            return false;
        }
        if (!done_) return false;
        in_flight_ = false;

        if (result_) {
            // Terminal either way; a transport failure is reported once before the
            // sequence ends.
            finished_ = true;
            owner_.open_.store(false, std::memory_order_release);
            if (result_ == websocket::error::closed) {
                error = relay::errc::connection_closed;
            } else {
                error = std::error_code(result_);
            }
            return true;
        }
        if (got_text_) {
            message.emplace(TextMessage{std::move(payload_)});
        } else {
            message.emplace(BinaryMessage{std::move(payload_)});
        }
        payload_.clear();
        return true;
    }

private:
    void start() {
        net::post(owner_.ioc_, [this]() {
            owner_.ws_.async_read(buffer_, [this](beast::error_code ec, std::size_t) { complete(ec); });
        });
    }

    // Runs on the I/O thread; buffer_ is only touched there.
    void complete(const beast::error_code& ec) {
        std::string payload;
        bool text = false;
        if (!ec) {
            payload = beast::buffers_to_string(buffer_.data());
            text = owner_.ws_.got_text();
        }
        buffer_.consume(buffer_.size());
        {
            std::lock_guard<std::mutex> lk(mutex_);
            result_ = ec;
            payload_ = std::move(payload);
            got_text_ = text;
            done_ = true;
        }
        owner_.context_->wake();
    }

    WebSocketConnection& owner_;
    beast::flat_buffer buffer_;
    std::mutex mutex_;
    bool in_flight_ = false;
    bool done_ = false;
    bool finished_ = false;
    boost::system::error_code result_;
    std::string payload_;
    bool got_text_ = false;
};

// --- Connection ---------------------------------------------------------------------

WebSocketConnection::WebSocketConnection(Passkey, std::shared_ptr<Logger> logger, std::shared_ptr<CoroIoContext> ctx)
    : logger_(std::move(logger)), context_(std::move(ctx)), ioc_(1), ws_(ioc_) {
    sink_ = std::make_unique<Sink>(*this);
    source_ = std::make_unique<Source>(*this);
}

WebSocketConnection::~WebSocketConnection() {
    work_guard_.reset();
    ioc_.stop();
    if (io_thread_.joinable()) io_thread_.join();
}

std::shared_ptr<WebSocketConnection> WebSocketConnection::connect(const WebSocketUrl& url,
                                                                  std::shared_ptr<Logger> logger,
                                                                  std::shared_ptr<CoroIoContext> ctx,
                                                                  std::error_code& error) {
    error.clear();
    if (!ctx) {
        error = relay::errc::not_connected;
        return nullptr;
    }
    auto conn = std::make_shared<WebSocketConnection>(Passkey{}, std::move(logger), std::move(ctx));
    if (!conn->open(url, error)) {
        return nullptr;
    }
    return conn;
}

bool WebSocketConnection::open(const WebSocketUrl& url, std::error_code& error) {
    beast::error_code ec;

    tcp::resolver resolver(ioc_);
    auto const results = resolver.resolve(url.host, url.port, ec);
    if (ec) {
        error = ec;
        if (logger_) logger_->error("WebSocket: cannot resolve " + url.host + ":" + url.port + ": " + ec.message());
        return false;
    }

    auto& layer = beast::get_lowest_layer(ws_);
    layer.connect(results, ec);
    if (ec) {
        error = ec;
        if (logger_) logger_->error("WebSocket: TCP connect to " + url.host + ":" + url.port + " failed: " + ec.message());
        return false;
    }
    layer.socket().set_option(tcp::no_delay(true), ec);
    if (ec && logger_) logger_->warning("WebSocket: cannot set TCP_NODELAY: " + ec.message());

    ws_.set_option(websocket::stream_base::decorator([](websocket::request_type& req) {
        req.set(beast::http::field::user_agent, "stream-relay/0.1");
    }));
    ws_.handshake(url.host_header(), url.target, ec);
    if (ec) {
        error = ec;
        if (logger_) logger_->error("WebSocket: handshake with " + url.to_string() + " failed: " + ec.message());
        return false;
    }

    // Beast answers pings and close frames itself; only note them.
    ws_.control_callback([logger = logger_](websocket::frame_type kind, beast::string_view payload) {
        if (!logger) return;
        const char* name = kind == websocket::frame_type::ping ? "ping"
                         : kind == websocket::frame_type::pong ? "pong" : "close";
        logger->debug(std::string("WebSocket: received ") + name + " frame (" + std::to_string(payload.size()) + " bytes)");
    });

    tcp::endpoint remote = layer.socket().remote_endpoint(ec);
    if (!ec) remote_endpoint_ = format_endpoint(remote);
    tcp::endpoint local = layer.socket().local_endpoint(ec);
    if (!ec) local_endpoint_ = format_endpoint(local);

    open_.store(true, std::memory_order_release);
    start_io_thread();
    if (logger_) logger_->info("WebSocket: connected to " + url.to_string() + " (" + local_endpoint_ + " -> " + remote_endpoint_ + ")");
    return true;
}

void WebSocketConnection::start_io_thread() {
    work_guard_.emplace(net::make_work_guard(ioc_));
    io_thread_ = std::thread([this]() {
        if (!ProcessUtils::set_current_thread_name("RelayWsIo") && logger_) {
            logger_->debug("WebSocket: could not name I/O thread");
        }
        if (logger_) logger_->debug("WebSocket: I/O thread running (tid=" + std::to_string(ProcessUtils::get_native_thread_id()) + ")");
        ioc_.run();
    });
}

std::shared_ptr<IMessageSink> WebSocketConnection::sink() {
    return std::shared_ptr<IMessageSink>(shared_from_this(), sink_.get());
}

std::shared_ptr<IMessageSource> WebSocketConnection::source() {
    return std::shared_ptr<IMessageSource>(shared_from_this(), source_.get());
}

} } // namespace transport::ws
