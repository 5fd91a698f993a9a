#include "RelayOrchestrator.hpp"

#include <string>
#include <utility>

namespace relay {

RelayOrchestrator::RelayOrchestrator(std::shared_ptr<transport::CoroMessageSink> sink,
                                     std::shared_ptr<transport::CoroMessageSource> source,
                                     std::shared_ptr<MessageQueue> outbound,
                                     std::shared_ptr<MessageQueue> inbound,
                                     std::shared_ptr<transport::CoroIoContext> context,
                                     std::shared_ptr<Logger> logger)
    : sink_(std::move(sink)), source_(std::move(source)),
      outbound_(std::move(outbound)), inbound_(std::move(inbound)),
      context_(std::move(context)), logger_(std::move(logger)) {}

Task<RelayResult> RelayOrchestrator::run() {
    auto outbound = outbound_loop();
    auto inbound = inbound_loop();

    // Join, never race: the relay is finished only when both directions are.
    co_await context_->wait_until([&outbound, &inbound]() {
        return outbound.done() && inbound.done();
    });

    RelayResult result;
    result.outbound = outbound.get_result();
    result.inbound = inbound.get_result();
    result.sent = sent_;
    result.received = received_;
    result.receive_errors = receive_errors_;
    co_return result;
}

Task<std::error_code> RelayOrchestrator::outbound_loop() {
    for (;;) {
        auto message = co_await outbound_->async_pop();
        if (!message) break;
        try {
            co_await sink_->async_send(std::move(*message));
        } catch (const std::system_error& e) {
            if (logger_) logger_->error(std::string{"Send failed, outbound direction stopped: "} + e.code().message());
            // Lets the input reader stop instead of waiting on a queue nobody drains.
            outbound_->close();
            co_return e.code();
        }
        ++sent_;
    }
    if (logger_) logger_->debug("Outbound loop finished after " + std::to_string(sent_) + " messages");
    co_return std::error_code{};
}

Task<std::error_code> RelayOrchestrator::inbound_loop() {
    std::error_code result;
    for (;;) {
        auto item = co_await source_->async_receive();
        if (item.closed()) {
            if (logger_) logger_->info("Connection closed by peer");
            break;
        }
        if (item.error) {
            ++receive_errors_;
            if (logger_) logger_->warning(std::string{"Receive error: "} + item.error.message());
            continue;
        }
        if (!item.message) continue;

        try {
            co_await inbound_->async_push(std::move(*item.message));
        } catch (const std::system_error& e) {
            if (logger_) logger_->warning(std::string{"Inbound direction stopped, output no longer written: "} + e.code().message());
            result = e.code();
            break;
        }
        ++received_;
    }
    inbound_->close();
    if (logger_) logger_->debug("Inbound loop finished after " + std::to_string(received_) + " messages");
    co_return result;
}

} // namespace relay
