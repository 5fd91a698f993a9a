/**
 * \file CoroStdioAdapter.hpp
 * \brief Awaitable line reads and full writes over the local stream backend.
 * \details Same shape as the other coroutine adapters: `await_ready()` tries the
 * non-blocking `try_*` call first, and only unfinished operations are parked in the
 * `CoroIoContext`. Each adapter supports one in-flight operation at a time.
 */
#pragma once

#include "coroIoContext.hpp"
#include "transport/stdio/FdStream.hpp"

#include <coroutine>
#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>

namespace transport {

/** \defgroup coro_adapter Awaitable Adapters
 *  \ingroup coro_module
 *  \brief Awaitable operations over the local streams and WebSocket halves.
 */

/**
 * \brief Coroutine-aware reader yielding one line per await.
 * \ingroup coro_adapter
 */
class CoroLineReader {
public:
    CoroLineReader(std::shared_ptr<FdLineReader> reader, std::shared_ptr<CoroIoContext> ctx)
        : reader_(std::move(reader)), context_(std::move(ctx)) {}

    /** \brief Await the next line.
     *  \return the line with its terminator, or std::nullopt at end of stream.
     *  \throws std::system_error when the descriptor read fails.
     */
    auto async_read_line() {
        struct ReadLineAwaitable {
            CoroLineReader* adapter;
            std::string line{};
            std::error_code error{};
            bool await_ready() { return adapter->reader_->try_read_line(line, error); }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::LocalRead, [this]() {
                    return adapter->reader_->try_read_line(line, error);
                }, handle);
            }
            std::optional<std::string> await_resume() {
                if (error) {
                    throw std::system_error(error, "Local read failed");
                }
                if (line.empty()) return std::nullopt;
                return std::move(line);
            }
        };
        return ReadLineAwaitable{this};
    }

private:
    std::shared_ptr<FdLineReader> reader_;
    std::shared_ptr<CoroIoContext> context_;
};

/**
 * \brief Coroutine-aware writer; each await completes once every byte is written.
 * \ingroup coro_adapter
 */
class CoroByteWriter {
public:
    CoroByteWriter(std::shared_ptr<FdWriter> writer, std::shared_ptr<CoroIoContext> ctx)
        : writer_(std::move(writer)), context_(std::move(ctx)) {}

    /** \brief Await a complete write of `data` (which must outlive the await).
     *  \return number of bytes written (always data.size() on success).
     *  \throws std::system_error when the descriptor write fails.
     */
    auto async_write_all(std::string_view data) {
        struct WriteAllAwaitable {
            CoroByteWriter* adapter;
            std::string_view data;
            std::size_t offset = 0;
            std::error_code error{};

            bool step() {
                while (offset < data.size()) {
                    std::size_t written = 0;
                    if (!adapter->writer_->try_write(data.data() + offset, data.size() - offset, written, error)) {
                        return false;
                    }
                    if (error) return true;
                    if (written == 0) return false;
                    offset += written;
                }
                return true;
            }
            bool await_ready() { return step(); }
            void await_suspend(std::coroutine_handle<> handle) {
                adapter->context_->register_pending(CoroIoContext::PendingOpCategory::LocalWrite,
                    [this]() { return step(); }, handle);
            }
            std::size_t await_resume() {
                if (error) {
                    throw std::system_error(error, "Local write failed");
                }
                return offset;
            }
        };
        return WriteAllAwaitable{this, data};
    }

private:
    std::shared_ptr<FdWriter> writer_;
    std::shared_ptr<CoroIoContext> context_;
};

} // namespace transport
