//
// Local stream task tests
//
// 1. InputReader: one Text message per line, terminators kept, unterminated tail sent,
//    `outgoing:` diagnostics, outbound queue closed at end of input
// 2. InputReader: a small queue suspends the reader without losing lines
// 3. OutputWriter: text payloads written verbatim, other kinds dropped, `incoming:` lines
// 4. OutputWriter: a broken output pipe ends the task and closes its queue
// 5. OutputWriter: a payload larger than the pipe suspends only the writer task, the
//    reader on the same context keeps running, and the descriptor flags are restored
//
// Local streams are pipes; diagnostics are captured with a VectorSink.
//

#undef NDEBUG
#include "relay/io/InputReader.hpp"
#include "relay/io/OutputWriter.hpp"
#include "transport/coro/CoroStdioAdapter.hpp"
#include "transport/coro/coroIoContext.hpp"
#include "transport/stdio/FdStream.hpp"
#include "logger.hpp"

#include <cassert>
#include <cerrno>
#include <csignal>
#include <fcntl.h>
#include <thread>
#include <iostream>
#include <memory>
#include <string>
#include <vector>
#include <unistd.h>

using transport::CoroIoContext;
using relay::MessageQueue;

namespace {

struct Pipe {
    int read_end = -1;
    int write_end = -1;
    Pipe() {
        int fds[2];
        int rc = ::pipe(fds);
        assert(rc == 0);
        read_end = fds[0];
        write_end = fds[1];
    }
    ~Pipe() {
        close_read();
        close_write();
    }
    void close_read() { if (read_end >= 0) { ::close(read_end); read_end = -1; } }
    void close_write() { if (write_end >= 0) { ::close(write_end); write_end = -1; } }
    void write_all(const std::string& data) {
        std::size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(write_end, data.data() + off, data.size() - off);
            assert(n > 0);
            off += static_cast<std::size_t>(n);
        }
    }
    std::string read_all() {
        close_write();
        std::string out;
        char buf[512];
        for (;;) {
            ssize_t n = ::read(read_end, buf, sizeof(buf));
            if (n <= 0) break;
            out.append(buf, static_cast<std::size_t>(n));
        }
        return out;
    }
};

std::shared_ptr<Logger> make_logger(std::shared_ptr<VectorSink>& sink) {
    auto logger = std::make_shared<Logger>("test_relay_io");
    sink = std::make_shared<VectorSink>();
    sink->set_level(LogLevel::Debug);
    logger->add_sink(sink);
    return logger;
}

std::shared_ptr<transport::CoroLineReader> line_reader(int fd, std::shared_ptr<CoroIoContext> ctx, std::size_t chunk = 4096) {
    return std::make_shared<transport::CoroLineReader>(std::make_shared<transport::FdLineReader>(fd, chunk), ctx);
}

std::shared_ptr<transport::CoroByteWriter> byte_writer(int fd, std::shared_ptr<CoroIoContext> ctx) {
    return std::make_shared<transport::CoroByteWriter>(std::make_shared<transport::FdWriter>(fd), ctx);
}

Task<void> drain(MessageQueue& queue, std::vector<std::string>& out) {
    for (;;) {
        auto message = co_await queue.async_pop();
        if (!message) break;
        auto* text = transport::ws::text_payload(*message);
        assert(text);
        out.push_back(*text);
    }
}

} // namespace

//==============================================================================
// Test 1: Lines become Text messages, terminators and tail preserved
//==============================================================================
void test_reader_lines() {
    std::cout << "=== Test 1: InputReader lines ===" << std::endl;
    std::shared_ptr<VectorSink> log_sink;
    auto logger = make_logger(log_sink);
    auto ctx = std::make_shared<CoroIoContext>();
    auto outbound = std::make_shared<MessageQueue>(32, ctx);

    Pipe in;
    in.write_all("first\nsecond\r\n\nlast");
    in.close_write();

    relay::InputReader reader(line_reader(in.read_end, ctx), outbound, logger);
    auto task = reader.run();
    ctx->run_until([&]() { return task.done(); });

    assert(!task.get_result());
    assert(outbound->closed());
    assert(reader.lines_read() == 4);

    std::vector<std::string> lines;
    auto consumer = drain(*outbound, lines);
    ctx->run_until([&]() { return consumer.done(); });
    assert((lines == std::vector<std::string>{"first\n", "second\r\n", "\n", "last"}));

    assert(log_sink->contains("outgoing: first"));
    assert(log_sink->contains("outgoing: second"));
    assert(log_sink->contains("outgoing: last"));
    std::cout << "Read " << lines.size() << " lines" << std::endl << std::endl;
}

//==============================================================================
// Test 2: Reader suspends on a full queue and loses nothing
//==============================================================================
void test_reader_backpressure() {
    std::cout << "=== Test 2: InputReader with capacity 1 ===" << std::endl;
    std::shared_ptr<VectorSink> log_sink;
    auto logger = make_logger(log_sink);
    auto ctx = std::make_shared<CoroIoContext>();
    ctx->set_poll_interval(std::chrono::milliseconds(1));
    auto outbound = std::make_shared<MessageQueue>(1, ctx);

    std::string input;
    std::vector<std::string> expected;
    for (int i = 0; i < 50; ++i) {
        expected.push_back("line " + std::to_string(i) + "\n");
        input += expected.back();
    }
    Pipe in;
    in.write_all(input);
    in.close_write();

    // Tiny chunks exercise lines split across reads.
    relay::InputReader reader(line_reader(in.read_end, ctx, 7), outbound, logger);
    auto producer = reader.run();
    assert(!producer.done());
    assert(outbound->size() == 1);

    std::vector<std::string> lines;
    auto consumer = drain(*outbound, lines);
    ctx->run_until([&]() { return producer.done() && consumer.done(); });

    assert(lines == expected);
    std::cout << "All " << lines.size() << " lines delivered in order" << std::endl << std::endl;
}

//==============================================================================
// Test 3: Writer outputs text payloads only
//==============================================================================
void test_writer_output() {
    std::cout << "=== Test 3: OutputWriter ===" << std::endl;
    std::shared_ptr<VectorSink> log_sink;
    auto logger = make_logger(log_sink);
    auto ctx = std::make_shared<CoroIoContext>();
    auto inbound = std::make_shared<MessageQueue>(8, ctx);

    std::error_code ec;
    std::vector<transport::ws::Message> items{
        transport::ws::make_text("a\n"),
        transport::ws::BinaryMessage{"\x01\x02"},
        transport::ws::make_text("no newline"),
        transport::ws::make_text("b\n"),
    };
    for (auto& m : items) {
        assert(inbound->try_push(m, ec) && !ec);
    }
    inbound->close();

    Pipe out;
    relay::OutputWriter writer(inbound, byte_writer(out.write_end, ctx), logger);
    auto task = writer.run();
    ctx->run_until([&]() { return task.done(); });

    assert(!task.get_result());
    assert(writer.messages_written() == 3);
    assert(writer.messages_dropped() == 1);
    assert(out.read_all() == "a\nno newlineb\n");
    assert(log_sink->contains("incoming: a"));
    assert(log_sink->contains("incoming: no newline"));
    assert(log_sink->contains("Dropping inbound binary message"));
    std::cout << "Wrote text payloads, dropped binary" << std::endl << std::endl;
}

//==============================================================================
// Test 4: Broken output ends the writer and closes the queue
//==============================================================================
void test_writer_broken_pipe() {
    std::cout << "=== Test 4: OutputWriter on broken pipe ===" << std::endl;
    std::shared_ptr<VectorSink> log_sink;
    auto logger = make_logger(log_sink);
    auto ctx = std::make_shared<CoroIoContext>();
    auto inbound = std::make_shared<MessageQueue>(4, ctx);

    Pipe out;
    out.close_read();

    std::error_code ec;
    transport::ws::Message m = transport::ws::make_text("lost\n");
    assert(inbound->try_push(m, ec) && !ec);

    relay::OutputWriter writer(inbound, byte_writer(out.write_end, ctx), logger);
    auto task = writer.run();
    ctx->run_until([&]() { return task.done(); });

    auto result = task.get_result();
    assert(result == std::errc::broken_pipe);
    assert(inbound->closed());
    assert(writer.messages_written() == 0);
    assert(log_sink->contains("Output write failed"));
    std::cout << "Writer stopped with: " << result.message() << std::endl << std::endl;
}

//==============================================================================
// Test 5: Large payload to a slow reader suspends only the writer
//==============================================================================
void test_writer_large_payload_does_not_stall() {
    std::cout << "=== Test 5: Large payload, late reader ===" << std::endl;
    std::shared_ptr<VectorSink> log_sink;
    auto logger = make_logger(log_sink);
    auto ctx = std::make_shared<CoroIoContext>();
    ctx->set_poll_interval(std::chrono::milliseconds(1));

    const std::string big(1024 * 1024, 'z');
    auto inbound = std::make_shared<MessageQueue>(2, ctx);
    std::error_code ec;
    transport::ws::Message m = transport::ws::make_text(big);
    assert(inbound->try_push(m, ec) && !ec);
    inbound->close();

    Pipe out;
    const int flags_before = ::fcntl(out.write_end, F_GETFL, 0);
    assert(!(flags_before & O_NONBLOCK));

    auto writer = std::make_unique<relay::OutputWriter>(inbound, byte_writer(out.write_end, ctx), logger);
    // Fills the pipe, then parks; creating the task must not block this thread.
    auto writer_task = writer->run();
    assert(!writer_task.done());

    auto outbound = std::make_shared<MessageQueue>(4, ctx);
    Pipe in;
    in.write_all("still moving\n");
    in.close_write();
    relay::InputReader reader(line_reader(in.read_end, ctx), outbound, logger);
    auto reader_task = reader.run();
    std::vector<std::string> lines;
    auto consumer = drain(*outbound, lines);

    ctx->run_until([&]() { return reader_task.done() && consumer.done(); });
    assert((lines == std::vector<std::string>{"still moving\n"}));
    assert(!writer_task.done());

    // Only now does anyone read the output.
    std::size_t drained = 0;
    bool all_z = true;
    std::thread drainer([&]() {
        char buf[8192];
        while (drained < big.size()) {
            ssize_t n = ::read(out.read_end, buf, sizeof(buf));
            if (n <= 0) break;
            for (ssize_t i = 0; i < n; ++i) all_z = all_z && buf[i] == 'z';
            drained += static_cast<std::size_t>(n);
        }
    });
    ctx->run_until([&]() { return writer_task.done(); });
    drainer.join();

    assert(!writer_task.get_result());
    assert(writer->messages_written() == 1);
    assert(drained == big.size() && all_z);

    writer.reset(); // drops the FdWriter
    assert(::fcntl(out.write_end, F_GETFL, 0) == flags_before);
    std::cout << "Reader finished while " << big.size() << " bytes waited for the output" << std::endl << std::endl;
}

int main() {
    std::signal(SIGPIPE, SIG_IGN);
    test_reader_lines();
    test_reader_backpressure();
    test_writer_output();
    test_writer_broken_pipe();
    test_writer_large_payload_does_not_stall();
    std::cout << "All relay I/O tests passed" << std::endl;
    return 0;
}
