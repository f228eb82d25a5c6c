/**
 * @file upload_client.h
 * @brief Streaming multipart upload client
 *
 * @code
 * auto client = upload_client::builder()
 *     .with_max_concurrency(4)
 *     .with_retry_attempts(2)
 *     .build();
 *
 * auto endpoint = parse_endpoint("http://localhost:8080/upload");
 * auto status = client.value().upload_file("data.bin", endpoint.value());
 * @endcode
 */

#ifndef KCENON_FILE_STREAM_CLIENT_UPLOAD_CLIENT_H
#define KCENON_FILE_STREAM_CLIENT_UPLOAD_CLIENT_H

#include "client_types.h"
#include "upload_transport.h"

#include "kcenon/file_stream/adapters/thread_pool_adapter.h"
#include "kcenon/file_stream/core/concurrency_limiter.h"
#include "kcenon/file_stream/core/progress.h"
#include "kcenon/file_stream/core/transfer_config.h"
#include "kcenon/file_stream/core/types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <stop_token>
#include <vector>

namespace kcenon::file_stream {

/**
 * @brief Uploads files as streamed multipart/form-data POST requests
 *
 * Every upload holds a slot of the client's concurrency_limiter while its
 * attempts run, so single-file calls from several threads and batch
 * uploads share one bound. Cancellation is requested through the
 * std::stop_token passed to each call.
 */
class upload_client {
public:
    /**
     * @brief Builder for upload_client
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set read and channel chunk size in bytes (default: 64KB)
         */
        auto with_chunk_size(std::size_t size) -> builder&;

        /**
         * @brief Set the number of uploads allowed to run at once
         *        (default: hardware concurrency)
         */
        auto with_max_concurrency(std::size_t count) -> builder&;

        /**
         * @brief Set the per-attempt request timeout (default: 30 minutes)
         */
        auto with_timeout(std::chrono::milliseconds timeout) -> builder&;

        /**
         * @brief Set the number of retries after the first attempt (default: 3)
         */
        auto with_retry_attempts(uint32_t attempts) -> builder&;

        /**
         * @brief Set the delay between attempts (default: 1 second)
         */
        auto with_retry_delay(std::chrono::milliseconds delay) -> builder&;

        /**
         * @brief Set the minimum interval between progress events (default: 1 second)
         */
        auto with_progress_interval(std::chrono::milliseconds interval) -> builder&;

        /**
         * @brief Replace the whole configuration
         */
        auto with_config(const transfer_config& config) -> builder&;

        /**
         * @brief Use a custom transport (default: beast_upload_transport)
         */
        auto with_transport(std::shared_ptr<upload_transport> transport) -> builder&;

        /**
         * @brief Share an existing limiter instead of creating one
         *
         * The limiter's capacity replaces max_concurrency.
         */
        auto with_concurrency_limiter(std::shared_ptr<concurrency_limiter> limiter) -> builder&;

        /**
         * @brief Run batch tasks on an existing pool
         */
        auto with_task_pool(
            std::shared_ptr<adapters::upload_task_pool_interface> pool) -> builder&;

        /**
         * @brief Build the client instance
         * @return Client, or the configuration error
         */
        [[nodiscard]] auto build() -> result<upload_client>;

    private:
        transfer_config config_;
        std::shared_ptr<upload_transport> transport_;
        std::shared_ptr<concurrency_limiter> limiter_;
        std::shared_ptr<adapters::upload_task_pool_interface> pool_;
    };

    /**
     * @brief Client with default configuration and @p timeout
     */
    [[nodiscard]] static auto create(
        std::chrono::milliseconds timeout = std::chrono::minutes{30}) -> result<upload_client>;

    ~upload_client();

    upload_client(const upload_client&) = delete;
    auto operator=(const upload_client&) -> upload_client& = delete;
    upload_client(upload_client&&) noexcept;
    auto operator=(upload_client&&) noexcept -> upload_client&;

    /**
     * @brief Upload one file
     *
     * Zero-length, missing and non-regular files fail before a slot is
     * taken. Transient failures are retried up to retry_attempts times.
     *
     * @param sink Progress observer; may be null
     * @return Success, or the last attempt's error annotated with the
     *         number of attempts
     */
    [[nodiscard]] auto upload_file(const std::filesystem::path& source,
                                   const upload_endpoint& endpoint,
                                   progress_sink* sink = nullptr,
                                   std::stop_token stop = {}) -> result<void>;

    /**
     * @brief Upload one file, logging progress at most once per second
     */
    [[nodiscard]] auto upload_file_with_progress(const std::filesystem::path& source,
                                                 const upload_endpoint& endpoint,
                                                 std::stop_token stop = {}) -> result<void>;

    /**
     * @brief Upload several files concurrently
     *
     * @param sink Shared by all files; must be thread-safe
     * @return Success, empty_file_set, error_code::cancelled if @p stop
     *         fired, or batch_failed listing every failed file
     */
    [[nodiscard]] auto upload_files(const std::vector<std::filesystem::path>& sources,
                                    const upload_endpoint& endpoint,
                                    progress_sink* sink = nullptr,
                                    std::stop_token stop = {}) -> result<void>;

    /**
     * @brief Upload several files and report every file's outcome
     *
     * Fails only when the file set is empty; per-file failures are in the
     * returned batch_result.
     */
    [[nodiscard]] auto upload_files_detailed(const std::vector<std::filesystem::path>& sources,
                                             const upload_endpoint& endpoint,
                                             progress_sink* sink = nullptr,
                                             std::stop_token stop = {}) -> result<batch_result>;

    /**
     * @brief Upload every regular file directly inside @p directory
     *
     * Subdirectories are not descended into.
     */
    [[nodiscard]] auto upload_directory(const std::filesystem::path& directory,
                                        const upload_endpoint& endpoint,
                                        progress_sink* sink = nullptr,
                                        std::stop_token stop = {}) -> result<void>;

    [[nodiscard]] auto config() const -> const transfer_config&;

    [[nodiscard]] auto limiter() const -> const concurrency_limiter&;

private:
    struct impl;

    explicit upload_client(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief Regular files directly inside @p directory, sorted by name
 * @return Paths, or directory_read_error
 */
[[nodiscard]] auto list_directory_files(const std::filesystem::path& directory)
    -> result<std::vector<std::filesystem::path>>;

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CLIENT_UPLOAD_CLIENT_H
