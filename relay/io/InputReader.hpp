/**
 * \file relay/io/InputReader.hpp
 * \brief Task that turns local input lines into outbound text messages.
 */
#pragma once

#include "transport/coro/AsyncBoundedQueue.hpp"
#include "transport/coro/CoroStdioAdapter.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/websocket/Message.hpp"
#include "logger.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace relay {

using MessageQueue = transport::AsyncBoundedQueue<transport::ws::Message>;

/**
 * \brief Sole producer of the outbound queue.
 * \details Each line (terminator kept) becomes one Text message, logged as
 * `outgoing: <line>` before it is enqueued. End of input or a read error ends the task;
 * either way the outbound queue is closed so the consumer can drain it.
 */
class InputReader {
public:
    InputReader(std::shared_ptr<transport::CoroLineReader> reader,
                std::shared_ptr<MessageQueue> outbound,
                std::shared_ptr<Logger> logger);

    /** \brief Runs until end of input. Returns the read error, if one ended the task. */
    Task<std::error_code> run();

    std::uint64_t lines_read() const { return lines_read_; }

private:
    std::shared_ptr<transport::CoroLineReader> reader_;
    std::shared_ptr<MessageQueue> outbound_;
    std::shared_ptr<Logger> logger_;
    std::uint64_t lines_read_ = 0;
};

} // namespace relay
