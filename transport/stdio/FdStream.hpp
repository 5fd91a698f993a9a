/**
 * \file FdStream.hpp
 * \brief Non-blocking line reader and byte writer over POSIX file descriptors.
 * \ingroup stdio_backend
 * \details Both types follow the transport `try_*` contract: each call makes as much
 * progress as possible without blocking and returns true once the operation has
 * finished (successfully or with `error` set). The coroutine adapters in
 * `transport/coro/CoroStdioAdapter.hpp` poll them from the event loop.
 * Descriptors are borrowed, never closed.
 */
#pragma once

#include <cstddef>
#include <string>
#include <system_error>
#include <vector>

/** \defgroup stdio_backend Local Stream Backend
 *  \brief Descriptor-level access to the relay's local input and output.
 */

namespace transport {

/** \brief Splits a readable descriptor into lines, keeping each terminator.
 *  \ingroup stdio_backend
 */
class FdLineReader {
public:
    explicit FdLineReader(int fd, std::size_t chunk_size = 4096);

    /**
     * \brief Try to produce the next line.
     * \param line Receives the line including its trailing '\n'. A final unterminated line
     *        is returned as-is. Left empty at end of stream.
     * \return false if no complete line is available yet; true when `line` is set, the
     *         stream ended (`line` empty, no error) or reading failed (`error` set).
     */
    bool try_read_line(std::string& line, std::error_code& error);

private:
    bool take_line(std::string& line);

    int fd_;
    std::vector<char> chunk_;
    std::string buffer_;
    bool eof_ = false;
};

/** \brief Writes byte buffers to a descriptor with unbuffered write(2) calls.
 *  \ingroup stdio_backend
 *  \details The descriptor is switched to O_NONBLOCK for the writer's lifetime, so a
 *  write larger than the free space in a pipe returns a partial count instead of
 *  stalling the scheduler thread. The original flags are restored on destruction.
 */
class FdWriter {
public:
    explicit FdWriter(int fd);
    ~FdWriter();

    FdWriter(const FdWriter&) = delete;
    FdWriter& operator=(const FdWriter&) = delete;

    /**
     * \brief Try to write `size` bytes starting at `buffer`.
     * \param bytes_written Receives the number of bytes accepted by this call (may be partial).
     * \return false if the descriptor is not writable yet; true after a write attempt
     *         (check `error`, then `bytes_written`).
     */
    bool try_write(const void* buffer, std::size_t size, std::size_t& bytes_written, std::error_code& error);

private:
    void set_non_blocking(bool non_blocking);

    int fd_;
    int original_flags_ = -1;
};

} // namespace transport
