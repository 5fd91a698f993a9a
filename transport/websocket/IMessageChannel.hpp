/**
 * \file IMessageChannel.hpp
 * \brief The two independent halves of a duplex message connection.
 * \ingroup websocket_backend
 * \details Both halves follow the transport `try_*` contract used by the coroutine
 * adapters: the first call starts the operation, later calls poll it, and `true` means
 * finished (success or `error` set). One operation per half may be in flight; the two
 * halves may be driven concurrently by different tasks.
 * \see transport::CoroMessageSink \see transport::CoroMessageSource
 */
#pragma once

#include "Message.hpp"

#include <optional>
#include <system_error>

namespace transport { namespace ws {

/** \brief Send-only half. */
struct IMessageSink {
    virtual ~IMessageSink() = default;
    /** \brief Start or poll transmission of `message`.
     *  \details Call again with the same message until it returns true.
     */
    virtual bool try_send(const Message& message, std::error_code& error) = 0;
};

/** \brief Receive-only half: a lazy sequence of messages or per-item errors.
 *  \details The sequence ends with `relay::errc::connection_closed`, after which every
 *  call returns true immediately with the same code.
 */
struct IMessageSource {
    virtual ~IMessageSource() = default;
    /** \brief Start or poll reception of the next item.
     *  \return true with `message` set, or with `error` set (per-item error, or
     *          relay::errc::connection_closed at the end of the sequence).
     */
    virtual bool try_receive(std::optional<Message>& message, std::error_code& error) = 0;
};

} } // namespace transport::ws
