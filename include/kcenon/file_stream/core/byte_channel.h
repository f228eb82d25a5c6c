/**
 * @file byte_channel.h
 * @brief Bounded single-producer single-consumer byte pipe
 *
 * The producer blocks while the buffer is full and the consumer blocks
 * while it is empty, so at most capacity() bytes separate the two sides.
 * Either side can end the stream: the producer with close() or
 * close_with_error(), the consumer with abort().
 */

#ifndef KCENON_FILE_STREAM_CORE_BYTE_CHANNEL_H
#define KCENON_FILE_STREAM_CORE_BYTE_CHANNEL_H

#include "types.h"

#include <chrono>
#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <optional>
#include <span>
#include <stop_token>
#include <vector>

namespace kcenon::file_stream {

class byte_channel {
public:
    /**
     * @brief Construct a channel
     * @param capacity Buffered bytes allowed between producer and consumer
     */
    explicit byte_channel(std::size_t capacity);

    byte_channel(const byte_channel&) = delete;
    auto operator=(const byte_channel&) -> byte_channel& = delete;

    /**
     * @brief Append bytes, blocking while the buffer is full
     *
     * Data larger than the capacity is handed over in several pieces.
     *
     * @return Success once every byte is buffered; the abort error if the
     *         consumer gave up; error_code::cancelled if @p stop fired;
     *         internal_error if the channel was already closed
     */
    [[nodiscard]] auto write(std::span<const std::byte> data, std::stop_token stop = {})
        -> result<void>;

    /**
     * @brief Mark the end of the stream
     */
    auto close() -> void;

    /**
     * @brief End the stream with a failure the consumer will observe
     */
    auto close_with_error(error err) -> void;

    /**
     * @brief Read up to out.size() bytes, blocking while the buffer is empty
     *
     * Bytes buffered before close are always delivered first.
     *
     * @return Bytes read, 0 at end of stream, the producer's error, or
     *         error_code::cancelled if @p stop fired
     */
    [[nodiscard]] auto read(std::span<std::byte> out, std::stop_token stop = {})
        -> result<std::size_t>;

    /**
     * @brief read() that gives up at @p deadline
     * @return As read(), or error_code::connection_timeout when nothing
     *         arrived before the deadline
     */
    [[nodiscard]] auto read_until(std::span<std::byte> out,
                                  std::chrono::steady_clock::time_point deadline,
                                  std::stop_token stop = {}) -> result<std::size_t>;

    /**
     * @brief Consumer-side shutdown; pending and future writes fail with @p err
     *
     * No effect once the producer has closed the stream.
     */
    auto abort(error err) -> void;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return buffer_.size(); }

    [[nodiscard]] auto buffered() const -> std::size_t;

    [[nodiscard]] auto is_closed() const -> bool;

private:
    // Caller holds mutex_.
    auto take_locked(std::span<std::byte> out) -> result<std::size_t>;

    std::vector<std::byte> buffer_;
    std::size_t head_ = 0;
    std::size_t size_ = 0;

    bool closed_ = false;
    std::optional<error> close_error_;
    std::optional<error> abort_error_;

    mutable std::mutex mutex_;
    std::condition_variable_any readable_;
    std::condition_variable_any writable_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_BYTE_CHANNEL_H
