/**
 * \file FdStream.cpp
 * \brief poll(2)-gated reads and writes for the local stream backend.
 * \ingroup stdio_backend
 */
#include "FdStream.hpp"

#include <cerrno>
#include <fcntl.h>
#include <poll.h>
#include <unistd.h>

namespace transport {

namespace {

/// Zero-timeout readiness probe; hang-up and error states count as ready so the
/// following read/write observes them.
int poll_ready(int fd, short events, std::error_code& error) {
    pollfd pfd{};
    pfd.fd = fd;
    pfd.events = events;
    int rc = ::poll(&pfd, 1, 0);
    if (rc < 0) {
        if (errno == EINTR) return 0;
        error = std::error_code(errno, std::generic_category());
        return -1;
    }
    if (rc > 0 && (pfd.revents & POLLNVAL)) {
        error = std::make_error_code(std::errc::bad_file_descriptor);
        return -1;
    }
    return rc;
}

} // namespace

FdLineReader::FdLineReader(int fd, std::size_t chunk_size)
    : fd_(fd), chunk_(chunk_size == 0 ? 4096 : chunk_size) {}

bool FdLineReader::take_line(std::string& line) {
    auto pos = buffer_.find('\n');
    if (pos == std::string::npos) {
        if (!eof_) return false;
        // Stream ended: hand out the unterminated tail (possibly empty, meaning EOF).
        line = std::move(buffer_);
        buffer_.clear();
        return true;
    }
    line.assign(buffer_, 0, pos + 1);
    buffer_.erase(0, pos + 1);
    return true;
}

bool FdLineReader::try_read_line(std::string& line, std::error_code& error) {
    error.clear();
    line.clear();
    for (;;) {
        if (take_line(line)) return true;

        int ready = poll_ready(fd_, POLLIN, error);
        if (ready < 0) return true;
        if (ready == 0) return false;

        ssize_t n = ::read(fd_, chunk_.data(), chunk_.size());
        if (n > 0) {
            buffer_.append(chunk_.data(), static_cast<std::size_t>(n));
            continue;
        }
        if (n == 0) {
            eof_ = true;
            continue;
        }
        if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return false;
        error = std::error_code(errno, std::generic_category());
        return true;
    }
}

FdWriter::FdWriter(int fd) : fd_(fd) {
    original_flags_ = ::fcntl(fd_, F_GETFL, 0);
    set_non_blocking(true);
}

FdWriter::~FdWriter() {
    set_non_blocking(false);
}

void FdWriter::set_non_blocking(bool non_blocking) {
    if (fd_ < 0 || original_flags_ < 0) return;
    if (original_flags_ & O_NONBLOCK) return; // caller's choice; leave it alone

    int flags = original_flags_;
    if (non_blocking) {
        flags |= O_NONBLOCK;
    }
    ::fcntl(fd_, F_SETFL, flags);
}

bool FdWriter::try_write(const void* buffer, std::size_t size, std::size_t& bytes_written, std::error_code& error) {
    error.clear();
    bytes_written = 0;
    if (size == 0) return true;

    int ready = poll_ready(fd_, POLLOUT, error);
    if (ready < 0) return true;
    if (ready == 0) return false;

    ssize_t n = ::write(fd_, buffer, size);
    if (n >= 0) {
        bytes_written = static_cast<std::size_t>(n);
        return true;
    }
    if (errno == EINTR || errno == EAGAIN || errno == EWOULDBLOCK) return false;
    error = std::error_code(errno, std::generic_category());
    return true;
}

} // namespace transport
