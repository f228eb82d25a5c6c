/**
 * @file upload_handler.h
 * @brief Receives one multipart upload request and persists its file
 *
 * The handler is independent of the HTTP library: the server hands it the
 * request head and a function pulling the next piece of the body, and
 * writes back the returned status and text.
 */

#ifndef KCENON_FILE_STREAM_SERVER_UPLOAD_HANDLER_H
#define KCENON_FILE_STREAM_SERVER_UPLOAD_HANDLER_H

#include "server_types.h"
#include "upload_observer.h"

#include "kcenon/file_stream/core/types.h"

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::file_stream {

/**
 * @brief Request head of an upload
 */
struct inbound_upload {
    std::string method;
    std::string content_type;
    std::optional<uint64_t> content_length;
    std::string remote_address;
    std::string user_agent;
};

/**
 * @brief Pulls request body bytes into the buffer
 * @return Bytes stored, 0 at end of body, or the read error
 */
using body_reader = std::function<result<std::size_t>(std::span<std::byte>)>;

/**
 * @brief Status and plain-text body to send back
 */
struct handler_response {
    unsigned status = 200;
    std::string body;

    [[nodiscard]] auto ok() const noexcept -> bool { return status == 200; }
};

/**
 * @brief Streams the `file` field of a multipart POST into the upload directory
 *
 * Responses:
 * - 405 for any method other than POST
 * - 400 for a malformed envelope, a missing `file` field or an unusable
 *   file name, detected before the destination file is opened
 * - 500 for directory or file creation failures and any failure once the
 *   destination file is open; the partial file is kept
 * - 200 with a confirmation once the whole field has been written
 *
 * Thread-safe: one handler serves all connections.
 */
class upload_handler {
public:
    explicit upload_handler(server_config config,
                            std::shared_ptr<upload_observer> observer = nullptr);

    upload_handler(const upload_handler&) = delete;
    auto operator=(const upload_handler&) -> upload_handler& = delete;

    [[nodiscard]] auto handle(const inbound_upload& request, const body_reader& body)
        -> handler_response;

    /**
     * @brief Upload counters; active_connections is left 0
     */
    [[nodiscard]] auto statistics() const -> server_statistics;

    [[nodiscard]] auto config() const -> const server_config& { return config_; }

private:
    server_config config_;
    std::shared_ptr<upload_observer> observer_;

    std::atomic<uint64_t> files_received_{0};
    std::atomic<uint64_t> bytes_received_{0};
    std::atomic<uint64_t> failed_uploads_{0};
    std::atomic<std::size_t> active_uploads_{0};
};

/**
 * @brief Reduce a client-supplied file name to its final path component
 *
 * Both '/' and '\\' separate components.
 *
 * @return The name, or invalid_filename for an empty result, ".", ".."
 *         or a name containing NUL
 */
[[nodiscard]] auto sanitize_upload_filename(std::string_view declared) -> result<std::string>;

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_SERVER_UPLOAD_HANDLER_H
