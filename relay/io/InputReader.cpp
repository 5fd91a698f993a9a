#include "InputReader.hpp"
#include "LineTrim.hpp"

#include <optional>
#include <string>
#include <utility>

namespace relay {

InputReader::InputReader(std::shared_ptr<transport::CoroLineReader> reader,
                         std::shared_ptr<MessageQueue> outbound,
                         std::shared_ptr<Logger> logger)
    : reader_(std::move(reader)), outbound_(std::move(outbound)), logger_(std::move(logger)) {}

Task<std::error_code> InputReader::run() {
    std::error_code result;
    for (;;) {
        std::optional<std::string> line;
        try {
            line = co_await reader_->async_read_line();
        } catch (const std::system_error& e) {
            if (logger_) logger_->warning(std::string{"Input read failed: "} + e.code().message());
            result = e.code();
            break;
        }
        if (!line) {
            if (logger_) logger_->debug("Input reached end of stream after " + std::to_string(lines_read_) + " lines");
            break;
        }

        if (logger_) logger_->info("outgoing: " + trim_line_end(*line));
        try {
            co_await outbound_->async_push(transport::ws::make_text(std::move(*line)));
        } catch (const std::system_error& e) {
            // The outbound loop closes the queue once sending has failed.
            if (logger_) logger_->warning(std::string{"Outbound direction stopped, input no longer relayed: "} + e.code().message());
            result = e.code();
            break;
        }
        ++lines_read_;
    }
    outbound_->close();
    co_return result;
}

} // namespace relay
