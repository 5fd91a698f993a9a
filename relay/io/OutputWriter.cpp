#include "OutputWriter.hpp"
#include "LineTrim.hpp"

#include <optional>
#include <string>
#include <utility>

namespace relay {

OutputWriter::OutputWriter(std::shared_ptr<MessageQueue> inbound,
                           std::shared_ptr<transport::CoroByteWriter> writer,
                           std::shared_ptr<Logger> logger)
    : inbound_(std::move(inbound)), writer_(std::move(writer)), logger_(std::move(logger)) {}

Task<std::error_code> OutputWriter::run() {
    for (;;) {
        auto message = co_await inbound_->async_pop();
        if (!message) break; // closed and drained

        const std::string* payload = transport::ws::text_payload(*message);
        if (!payload) {
            ++messages_dropped_;
            if (logger_) logger_->debug(std::string{"Dropping inbound "} + std::string(transport::ws::kind_name(*message)) + " message");
            continue;
        }

        if (logger_) logger_->info("incoming: " + trim_line_end(*payload));
        try {
            co_await writer_->async_write_all(*payload);
        } catch (const std::system_error& e) {
            if (logger_) logger_->error(std::string{"Output write failed: "} + e.code().message());
            // Unblock the inbound loop; nothing will consume the queue any more.
            inbound_->close();
            co_return e.code();
        }
        ++messages_written_;
    }
    co_return std::error_code{};
}

} // namespace relay
