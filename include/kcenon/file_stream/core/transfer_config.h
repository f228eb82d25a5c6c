/**
 * @file transfer_config.h
 * @brief Tuning parameters shared by all uploads of one client
 */

#ifndef KCENON_FILE_STREAM_CORE_TRANSFER_CONFIG_H
#define KCENON_FILE_STREAM_CORE_TRANSFER_CONFIG_H

#include "types.h"

#include <chrono>
#include <cstddef>
#include <cstdint>

namespace kcenon::file_stream {

/// Default read and channel size in bytes
inline constexpr std::size_t default_chunk_size = 64 * 1024;

/**
 * @brief Transfer configuration
 *
 * Read-only once a client is built; shared by every concurrent session.
 */
struct transfer_config {
    std::size_t chunk_size = default_chunk_size;
    std::size_t max_concurrency = default_concurrency();
    std::chrono::milliseconds timeout{std::chrono::minutes{30}};
    uint32_t retry_attempts = 3;
    std::chrono::milliseconds retry_delay{1000};
    std::chrono::milliseconds progress_interval{1000};

    /**
     * @brief Total attempts a session may make
     */
    [[nodiscard]] auto max_attempts() const noexcept -> uint32_t {
        return retry_attempts + 1;
    }

    /**
     * @brief Validate the configuration
     * @return Success, or invalid_chunk_size / invalid_configuration
     */
    [[nodiscard]] auto validate() const -> result<void>;

    /**
     * @brief Available hardware parallelism, at least 1
     */
    [[nodiscard]] static auto default_concurrency() noexcept -> std::size_t;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_TRANSFER_CONFIG_H
