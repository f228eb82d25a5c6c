/**
 * @file client_types.h
 * @brief Type definitions for the upload client
 */

#ifndef KCENON_FILE_STREAM_CLIENT_CLIENT_TYPES_H
#define KCENON_FILE_STREAM_CLIENT_CLIENT_TYPES_H

#include "kcenon/file_stream/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace kcenon::file_stream {

/**
 * @brief Destination of an upload
 */
struct upload_endpoint {
    std::string host;
    uint16_t port = 80;
    std::string target = "/";

    /**
     * @brief Value for the Host header
     */
    [[nodiscard]] auto host_header() const -> std::string {
        return port == 80 ? host : host + ":" + std::to_string(port);
    }

    [[nodiscard]] auto to_url() const -> std::string {
        return "http://" + host_header() + target;
    }
};

/**
 * @brief Parse an `http://host[:port][/path]` URL
 * @return Endpoint, or invalid_endpoint for other schemes or malformed URLs
 */
[[nodiscard]] auto parse_endpoint(std::string_view url) -> result<upload_endpoint>;

/**
 * @brief Request metadata handed to a transport; the body comes from a byte_channel
 */
struct upload_request {
    upload_endpoint endpoint;
    std::string content_type;
    uint64_t content_length = 0;
    std::chrono::milliseconds timeout{std::chrono::minutes{30}};
    std::size_t chunk_size = 64 * 1024;
};

struct upload_response {
    unsigned status = 0;
    std::string body;
};

/**
 * @brief Result of one file in a batch
 */
struct batch_file_result {
    std::filesystem::path file;
    bool success = false;
    uint64_t bytes_transferred = 0;
    uint32_t attempts = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<error> failure;
};

/**
 * @brief Result of a batch upload
 */
struct batch_result {
    std::size_t total_files = 0;
    std::size_t succeeded = 0;
    std::size_t failed = 0;
    uint64_t total_bytes = 0;
    std::chrono::milliseconds elapsed{0};
    std::vector<batch_file_result> file_results;

    [[nodiscard]] auto all_succeeded() const noexcept -> bool {
        return failed == 0 && succeeded == total_files;
    }

    /**
     * @brief One error listing every failed file and its cause
     * @return nullopt when all files succeeded
     */
    [[nodiscard]] auto aggregate_error() const -> std::optional<error>;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CLIENT_CLIENT_TYPES_H
