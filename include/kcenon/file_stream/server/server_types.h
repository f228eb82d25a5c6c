/**
 * @file server_types.h
 * @brief Server-related type definitions for file_stream_system
 */

#ifndef KCENON_FILE_STREAM_SERVER_SERVER_TYPES_H
#define KCENON_FILE_STREAM_SERVER_SERVER_TYPES_H

#include "kcenon/file_stream/core/multipart_reader.h"
#include "kcenon/file_stream/core/transfer_config.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <optional>
#include <string>

namespace kcenon::file_stream {

/**
 * @brief Server state enumeration
 */
enum class server_state {
    stopped,
    starting,
    running,
    stopping
};

[[nodiscard]] constexpr auto to_string(server_state state) -> const char* {
    switch (state) {
        case server_state::stopped: return "stopped";
        case server_state::starting: return "starting";
        case server_state::running: return "running";
        case server_state::stopping: return "stopping";
        default: return "unknown";
    }
}

/**
 * @brief Address the server listens on
 */
struct endpoint {
    std::string host;
    uint16_t port;

    endpoint() : host("0.0.0.0"), port(0) {}
    endpoint(std::string h, uint16_t p) : host(std::move(h)), port(p) {}
    explicit endpoint(uint16_t p) : host("0.0.0.0"), port(p) {}
};

/**
 * @brief Server configuration
 */
struct server_config {
    std::filesystem::path upload_directory = "uploads";
    std::size_t chunk_size = default_chunk_size;
    std::size_t max_header_bytes = default_max_header_bytes;
    std::size_t max_connections = 100;
    std::chrono::milliseconds report_interval{1000};

    [[nodiscard]] auto is_valid() const -> bool {
        return !upload_directory.empty() && chunk_size > 0 && max_header_bytes > 0 &&
               max_connections > 0 && report_interval.count() > 0;
    }
};

/**
 * @brief Server statistics
 */
struct server_statistics {
    uint64_t total_files_received = 0;
    uint64_t total_bytes_received = 0;
    uint64_t failed_uploads = 0;
    std::size_t active_uploads = 0;
    std::size_t active_connections = 0;
};

/**
 * @brief An upload being received
 */
struct inbound_file {
    std::string filename;  ///< sanitized name
    std::filesystem::path stored_path;
    std::string remote_address;
    std::string user_agent;
    std::optional<uint64_t> expected_bytes;  ///< unset when the size is unknown
};

/**
 * @brief Periodic receive throughput
 */
struct throughput_report {
    uint64_t bytes_received = 0;
    uint64_t total_bytes = 0;
    double percentage = 0.0;
    double bytes_per_second = 0.0;            ///< since the previous report
    std::chrono::milliseconds elapsed{0};     ///< since the upload started
    std::optional<double> eta_seconds;        ///< unset when speed is zero
};

/**
 * @brief Final accounting of a received upload
 */
struct upload_summary {
    uint64_t bytes_received = 0;
    std::chrono::milliseconds duration{0};
    double average_bytes_per_second = 0.0;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_SERVER_SERVER_TYPES_H
