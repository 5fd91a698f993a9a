/**
 * \file relay/RelayOrchestrator.hpp
 * \brief Pumps both directions between the message queues and the connection halves.
 */
#pragma once

#include "relay/io/InputReader.hpp"
#include "transport/coro/CoroMessageAdapter.hpp"
#include "transport/coro/CoroTask.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "logger.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace relay {

/** \brief Outcome of both relay loops once they have joined. */
struct RelayResult {
    std::error_code outbound;      ///< Send error that ended the outbound loop, if any.
    std::error_code inbound;       ///< Set only if the inbound queue was closed under the loop.
    std::uint64_t sent = 0;        ///< Messages transmitted on the sink.
    std::uint64_t received = 0;    ///< Messages pushed onto the inbound queue.
    std::uint64_t receive_errors = 0;
};

/**
 * \brief Runs the outbound loop (queue -> sink) and the inbound loop (source -> queue).
 * \details The loops are independent: a failed send ends only the outbound loop, and
 * the end of the source ends only the inbound loop. `run()` completes when both have.
 */
class RelayOrchestrator {
public:
    RelayOrchestrator(std::shared_ptr<transport::CoroMessageSink> sink,
                      std::shared_ptr<transport::CoroMessageSource> source,
                      std::shared_ptr<MessageQueue> outbound,
                      std::shared_ptr<MessageQueue> inbound,
                      std::shared_ptr<transport::CoroIoContext> context,
                      std::shared_ptr<Logger> logger);

    Task<RelayResult> run();

private:
    Task<std::error_code> outbound_loop();
    Task<std::error_code> inbound_loop();

    std::shared_ptr<transport::CoroMessageSink> sink_;
    std::shared_ptr<transport::CoroMessageSource> source_;
    std::shared_ptr<MessageQueue> outbound_;
    std::shared_ptr<MessageQueue> inbound_;
    std::shared_ptr<transport::CoroIoContext> context_;
    std::shared_ptr<Logger> logger_;

    std::uint64_t sent_ = 0;
    std::uint64_t received_ = 0;
    std::uint64_t receive_errors_ = 0;
};

} // namespace relay
