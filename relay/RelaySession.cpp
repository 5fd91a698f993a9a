#include "RelaySession.hpp"
#include "relay/io/InputReader.hpp"
#include "relay/io/OutputWriter.hpp"
#include "relayErrors.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "transport/coro/CoroMessageAdapter.hpp"
#include "transport/coro/CoroStdioAdapter.hpp"
#include "transport/stdio/FdStream.hpp"
#include "transport/websocket/WebSocketConnection.hpp"
#include "transport/websocket/WebSocketUrl.hpp"

#include <string>
#include <utility>

using transport::CoroIoContext;

namespace relay {

int RelayReport::exit_code() const {
    if (!startup_error) return 0;
    return connect_failed ? 3 : 2;
}

RelaySession::RelaySession(RelayOptions options, std::shared_ptr<Logger> logger, int input_fd, int output_fd)
    : options_(std::move(options)), logger_(std::move(logger)), input_fd_(input_fd), output_fd_(output_fd) {}

RelayReport RelaySession::run() {
    RelayReport report;

    if (options_.url.empty()) {
        report.startup_error = errc::missing_url;
        logger_->error("No endpoint given: pass a ws:// URL or set relay.url in the config file");
        return report;
    }

    std::error_code ec;
    auto url = transport::ws::WebSocketUrl::parse(options_.url, ec);
    if (!url) {
        report.startup_error = ec;
        logger_->error("Bad endpoint '" + options_.url + "': " + ec.message());
        return report;
    }

    auto ctx = std::make_shared<CoroIoContext>();
    ctx->set_logger(logger_);
    ctx->set_poll_interval(options_.poll_interval);

    // The connection must be up before anything is read from local input.
    auto connection = transport::ws::WebSocketConnection::connect(*url, logger_, ctx, ec);
    if (!connection) {
        report.startup_error = ec;
        report.connect_failed = true;
        logger_->error("Cannot connect to " + url->to_string() + ": " + ec.message());
        return report;
    }

    auto outbound = std::make_shared<MessageQueue>(options_.queue_capacity, ctx);
    auto inbound = std::make_shared<MessageQueue>(options_.queue_capacity, ctx);

    InputReader reader(
        std::make_shared<transport::CoroLineReader>(std::make_shared<transport::FdLineReader>(input_fd_), ctx),
        outbound, logger_);
    OutputWriter writer(
        inbound,
        std::make_shared<transport::CoroByteWriter>(std::make_shared<transport::FdWriter>(output_fd_), ctx),
        logger_);
    RelayOrchestrator orchestrator(
        std::make_shared<transport::CoroMessageSink>(connection->sink(), ctx),
        std::make_shared<transport::CoroMessageSource>(connection->source(), ctx),
        outbound, inbound, ctx, logger_);

    logger_->debug("Relaying with queue capacity " + std::to_string(options_.queue_capacity));

    auto reader_task = reader.run();
    auto writer_task = writer.run();
    auto relay_task = orchestrator.run();

    ctx->run_until([&]() {
        return reader_task.done() && writer_task.done() && relay_task.done();
    });

    report.input_error = reader_task.get_result();
    report.output_error = writer_task.get_result();
    report.relay = relay_task.get_result();
    report.lines_read = reader.lines_read();
    report.messages_written = writer.messages_written();
    report.messages_dropped = writer.messages_dropped();

    logger_->info("Relay finished: sent=" + std::to_string(report.relay.sent) +
                  " received=" + std::to_string(report.relay.received) +
                  " written=" + std::to_string(report.messages_written));
    if (report.messages_dropped > 0) {
        logger_->debug("Dropped " + std::to_string(report.messages_dropped) + " non-text inbound messages");
    }
    logger_->debug("Scheduler: " + ctx->format_statistics());
    return report;
}

} // namespace relay
