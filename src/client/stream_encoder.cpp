/**
 * @file stream_encoder.cpp
 * @brief Producer side of a streamed multipart upload
 */

#include "kcenon/file_stream/client/stream_encoder.h"

#include "kcenon/file_stream/core/logging.h"

#include <algorithm>
#include <fstream>
#include <span>
#include <vector>

namespace kcenon::file_stream {

namespace {

auto as_bytes(const std::string& text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

}  // namespace

stream_encoder::stream_encoder(std::size_t chunk_size, std::chrono::milliseconds progress_interval)
    : chunk_size_(std::max<std::size_t>(chunk_size, 1)), progress_interval_(progress_interval) {}

auto stream_encoder::encode(const encode_source& source,
                            const multipart_writer& framing,
                            byte_channel& channel,
                            progress_sink* sink,
                            std::stop_token stop) const -> result<void> {
    auto status = stream_file(source, framing, channel, sink, stop);
    if (status) {
        channel.close();
    } else {
        channel.close_with_error(status.error());
    }
    return status;
}

auto stream_encoder::stream_file(const encode_source& source,
                                 const multipart_writer& framing,
                                 byte_channel& channel,
                                 progress_sink* sink,
                                 std::stop_token stop) const -> result<void> {
    std::ifstream file(source.path, std::ios::binary);
    if (!file) {
        return unexpected{error{error_code::file_access_denied,
                                "cannot open file: " + source.path.string()}};
    }

    auto written = channel.write(as_bytes(framing.preamble()), stop);
    if (!written) {
        return written;
    }

    progress_throttle throttle(progress_interval_);
    std::vector<char> buffer(chunk_size_);
    uint64_t bytes = 0;

    while (true) {
        if (stop.stop_requested()) {
            return unexpected{error{error_code::cancelled, "upload cancelled"}};
        }

        file.read(buffer.data(), static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(file.gcount());

        if (got > 0) {
            if (bytes + got > source.expected_size) {
                return unexpected{error{error_code::file_read_error,
                                        "file grew during upload: " + source.path.string()}};
            }

            written = channel.write(
                std::span<const std::byte>(reinterpret_cast<const std::byte*>(buffer.data()), got),
                stop);
            if (!written) {
                return written;
            }
            bytes += got;

            if (sink && throttle.should_report(bytes, source.expected_size,
                                               progress_throttle::clock::now())) {
                sink->on_progress(progress_event::make(source.path, bytes, source.expected_size,
                                                       source.attempt));
            }
        }

        if (!file) {
            if (file.eof()) {
                break;
            }
            return unexpected{error{error_code::file_read_error,
                                    "error reading file: " + source.path.string()}};
        }
    }

    if (bytes != source.expected_size) {
        return unexpected{error{error_code::file_read_error,
                                "file shrank during upload: " + source.path.string()}};
    }

    FS_LOG_DEBUG(log_category::pipeline, "Encoded " + std::to_string(bytes) + " bytes of " +
                                             source.path.filename().string());

    return channel.write(as_bytes(framing.trailer()), stop);
}

}  // namespace kcenon::file_stream
