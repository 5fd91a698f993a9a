/**
 * \file relay/RelaySession.hpp
 * \brief One complete relay run: connect, start the four tasks, drive them to completion.
 */
#pragma once

#include "RelayOptions.hpp"
#include "RelayOrchestrator.hpp"
#include "logger.hpp"

#include <cstdint>
#include <memory>
#include <system_error>

namespace relay {

/** \brief What happened during a session, for logging and the process exit status. */
struct RelayReport {
    std::error_code startup_error;   ///< Set if nothing was relayed at all.
    bool connect_failed = false;     ///< startup_error came from resolve/connect/handshake.
    std::error_code input_error;
    std::error_code output_error;
    RelayResult relay;
    std::uint64_t lines_read = 0;
    std::uint64_t messages_written = 0;
    std::uint64_t messages_dropped = 0;

    /// 0 after a completed relay, 2 for a missing or bad endpoint, 3 if the connection failed.
    int exit_code() const;
};

/**
 * \brief Wires local input/output and one WebSocket connection through two bounded queues.
 * \details Descriptors are borrowed; the session never closes them.
 */
class RelaySession {
public:
    RelaySession(RelayOptions options, std::shared_ptr<Logger> logger, int input_fd, int output_fd);

    /** \brief Blocks until both directions are finished or startup has failed. */
    RelayReport run();

private:
    RelayOptions options_;
    std::shared_ptr<Logger> logger_;
    int input_fd_;
    int output_fd_;
};

} // namespace relay
