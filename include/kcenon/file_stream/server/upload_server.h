/**
 * @file upload_server.h
 * @brief HTTP server receiving multipart file uploads
 */

#ifndef KCENON_FILE_STREAM_SERVER_UPLOAD_SERVER_H
#define KCENON_FILE_STREAM_SERVER_UPLOAD_SERVER_H

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <memory>

#include "kcenon/file_stream/adapters/thread_pool_adapter.h"
#include "kcenon/file_stream/core/types.h"
#include "kcenon/file_stream/server/server_types.h"
#include "kcenon/file_stream/server/upload_observer.h"

namespace kcenon::file_stream {

/// Path served by the upload handler
inline constexpr const char* upload_route = "/upload";

/**
 * @brief HTTP/1.1 upload server
 *
 * `POST /upload` stores the `file` field under the upload directory,
 * other methods on `/upload` get 405, and every other path answers 200
 * with a short liveness text. Each connection runs on the task pool.
 *
 * @code
 * auto server_result = upload_server::builder()
 *     .with_upload_directory("uploads")
 *     .build();
 *
 * if (server_result.has_value()) {
 *     auto& server = server_result.value();
 *     server.start(endpoint{8080});
 * }
 * @endcode
 */
class upload_server {
public:
    /**
     * @brief Builder for upload_server
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set directory uploaded files are written to (default: "uploads")
         */
        auto with_upload_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Set body read size in bytes (default: 64KB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the largest multipart header block kept in memory
         *        (default: 10MB)
         */
        auto with_max_header_bytes(std::size_t size) -> builder&;

        /**
         * @brief Set maximum number of concurrent connections (default: 100)
         */
        auto with_max_connections(std::size_t max_count) -> builder&;

        /**
         * @brief Set minimum interval between throughput reports (default: 1 second)
         */
        auto with_report_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Replace the default logging observer
         */
        auto with_observer(std::shared_ptr<upload_observer> observer) -> builder&;

        /**
         * @brief Run connections on an existing pool
         */
        auto with_task_pool(
            std::shared_ptr<adapters::upload_task_pool_interface> pool) -> builder&;

        /**
         * @brief Build the server instance
         * @return Result containing the server or an error
         */
        [[nodiscard]] auto build() -> result<upload_server>;

    private:
        server_config config_;
        std::shared_ptr<upload_observer> observer_;
        std::shared_ptr<adapters::upload_task_pool_interface> pool_;
    };

    // Non-copyable, movable
    upload_server(const upload_server&) = delete;
    auto operator=(const upload_server&) -> upload_server& = delete;
    upload_server(upload_server&&) noexcept;
    auto operator=(upload_server&&) noexcept -> upload_server&;
    ~upload_server();

    /**
     * @brief Start listening
     * @param listen_addr Address to bind; port 0 picks a free port
     * @return Success, already_initialized, or connection_failed
     */
    [[nodiscard]] auto start(const endpoint& listen_addr) -> result<void>;

    /**
     * @brief Stop accepting, shut down open connections and wait for them
     * @return Success, or server_not_running
     */
    [[nodiscard]] auto stop() -> result<void>;

    [[nodiscard]] auto is_running() const -> bool;

    [[nodiscard]] auto state() const -> server_state;

    /**
     * @brief Get the port the server is listening on
     * @return Port number, or 0 if not running
     */
    [[nodiscard]] auto port() const -> uint16_t;

    [[nodiscard]] auto get_statistics() const -> server_statistics;

    [[nodiscard]] auto config() const -> const server_config&;

private:
    struct impl;

    explicit upload_server(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_SERVER_UPLOAD_SERVER_H
