/**
 * @file transfer_config.cpp
 * @brief Transfer configuration validation
 */

#include "kcenon/file_stream/core/transfer_config.h"

#include <thread>

namespace kcenon::file_stream {

auto transfer_config::validate() const -> result<void> {
    if (chunk_size == 0) {
        return unexpected{error{error_code::invalid_chunk_size,
                                "chunk size must be greater than zero"}};
    }
    if (max_concurrency == 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "max concurrency must be at least 1"}};
    }
    if (timeout.count() <= 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "timeout must be positive"}};
    }
    if (retry_delay.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "retry delay must not be negative"}};
    }
    if (progress_interval.count() < 0) {
        return unexpected{error{error_code::invalid_configuration,
                                "progress interval must not be negative"}};
    }
    return {};
}

auto transfer_config::default_concurrency() noexcept -> std::size_t {
    auto n = std::thread::hardware_concurrency();
    return n == 0 ? 1 : static_cast<std::size_t>(n);
}

}  // namespace kcenon::file_stream
