/**
 * \file relay/io/OutputWriter.hpp
 * \brief Task that writes inbound text payloads to local output.
 */
#pragma once

#include "InputReader.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace relay {

/**
 * \brief Sole consumer of the inbound queue.
 * \details Text payloads are written verbatim with unbuffered writes (one flush per
 * message) and logged as `incoming: <payload>`. Other message kinds are dropped. The
 * task ends once the queue is closed and drained, or on the first write failure, in
 * which case it closes the queue so its producer stops as well.
 */
class OutputWriter {
public:
    OutputWriter(std::shared_ptr<MessageQueue> inbound,
                 std::shared_ptr<transport::CoroByteWriter> writer,
                 std::shared_ptr<Logger> logger);

    /** \brief Returns the write error that ended the task, or an empty code. */
    Task<std::error_code> run();

    std::uint64_t messages_written() const { return messages_written_; }
    std::uint64_t messages_dropped() const { return messages_dropped_; }

private:
    std::shared_ptr<MessageQueue> inbound_;
    std::shared_ptr<transport::CoroByteWriter> writer_;
    std::shared_ptr<Logger> logger_;
    std::uint64_t messages_written_ = 0;
    std::uint64_t messages_dropped_ = 0;
};

} // namespace relay
