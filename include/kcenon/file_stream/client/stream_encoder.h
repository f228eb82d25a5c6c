/**
 * @file stream_encoder.h
 * @brief Producer side of a streamed multipart upload
 */

#ifndef KCENON_FILE_STREAM_CLIENT_STREAM_ENCODER_H
#define KCENON_FILE_STREAM_CLIENT_STREAM_ENCODER_H

#include "kcenon/file_stream/core/byte_channel.h"
#include "kcenon/file_stream/core/multipart_writer.h"
#include "kcenon/file_stream/core/progress.h"
#include "kcenon/file_stream/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stop_token>

namespace kcenon::file_stream {

/**
 * @brief Source file of one encoding run
 */
struct encode_source {
    std::filesystem::path path;
    uint64_t expected_size = 0;  ///< Size measured when the attempt started
    uint32_t attempt = 0;
};

/**
 * @brief Reads a file in chunks and writes it, framed, into a byte_channel
 *
 * Runs on its own thread while a transport drains the channel. The
 * channel is always closed when encode() returns: normally on success,
 * with the failure otherwise. Cancellation is checked between chunks.
 *
 * @code
 * byte_channel channel(config.chunk_size);
 * stream_encoder encoder(config.chunk_size, config.progress_interval);
 * std::jthread producer([&](std::stop_token st) {
 *     status = encoder.encode(source, framing, channel, sink, st);
 * });
 * @endcode
 */
class stream_encoder {
public:
    stream_encoder(std::size_t chunk_size, std::chrono::milliseconds progress_interval);

    /**
     * @brief Stream preamble, file content and trailer into @p channel
     *
     * @param sink Receives throttled progress; may be null
     * @return Success; file_access_denied if the file cannot be opened;
     *         file_read_error on a read failure or a size change;
     *         error_code::cancelled; or the consumer's abort error
     */
    [[nodiscard]] auto encode(const encode_source& source,
                              const multipart_writer& framing,
                              byte_channel& channel,
                              progress_sink* sink,
                              std::stop_token stop) const -> result<void>;

    [[nodiscard]] auto chunk_size() const noexcept -> std::size_t { return chunk_size_; }

private:
    [[nodiscard]] auto stream_file(const encode_source& source,
                                   const multipart_writer& framing,
                                   byte_channel& channel,
                                   progress_sink* sink,
                                   std::stop_token stop) const -> result<void>;

    std::size_t chunk_size_;
    std::chrono::milliseconds progress_interval_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CLIENT_STREAM_ENCODER_H
