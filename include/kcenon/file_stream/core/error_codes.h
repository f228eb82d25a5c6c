/**
 * @file error_codes.h
 * @brief Retry classification of error codes
 *
 * Every error_code belongs to exactly one error_class. The mapping is
 * closed: new codes must be added to classify() explicitly.
 */

#ifndef KCENON_FILE_STREAM_CORE_ERROR_CODES_H
#define KCENON_FILE_STREAM_CORE_ERROR_CODES_H

#include "types.h"

#include <string_view>

namespace kcenon::file_stream {

/**
 * @brief Retry classification of a failure
 */
enum class error_class {
    permanent,  ///< Retrying cannot help
    transient,  ///< Retrying may help
    cancelled   ///< Caller asked to stop
};

[[nodiscard]] constexpr auto to_string(error_class cls) noexcept -> std::string_view {
    switch (cls) {
        case error_class::permanent:
            return "permanent";
        case error_class::transient:
            return "transient";
        case error_class::cancelled:
            return "cancelled";
    }
    return "unknown";
}

/**
 * @brief Check if error code is in file error range
 */
[[nodiscard]] constexpr auto is_file_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -100 && v >= -119;
}

/**
 * @brief Check if error code is in network error range
 */
[[nodiscard]] constexpr auto is_network_error(error_code code) noexcept -> bool {
    auto v = static_cast<int>(code);
    return v <= -160 && v >= -179;
}

/**
 * @brief Classify an error code for the retry loop
 */
[[nodiscard]] constexpr auto classify(error_code code) noexcept -> error_class {
    switch (code) {
        case error_code::connection_failed:
        case error_code::connection_timeout:
        case error_code::connection_refused:
        case error_code::connection_lost:
        case error_code::server_not_running:
        case error_code::http_status_error:
            return error_class::transient;
        case error_code::cancelled:
            return error_class::cancelled;
        case error_code::success:
        case error_code::file_not_found:
        case error_code::file_access_denied:
        case error_code::file_empty:
        case error_code::not_regular_file:
        case error_code::file_read_error:
        case error_code::file_write_error:
        case error_code::directory_read_error:
        case error_code::multipart_encode_error:
        case error_code::multipart_parse_error:
        case error_code::missing_form_field:
        case error_code::invalid_filename:
        case error_code::invalid_chunk_size:
        case error_code::invalid_configuration:
        case error_code::invalid_endpoint:
        case error_code::batch_failed:
        case error_code::empty_file_set:
        case error_code::internal_error:
        case error_code::already_initialized:
            return error_class::permanent;
    }
    return error_class::permanent;
}

[[nodiscard]] inline auto classify(const error& err) noexcept -> error_class {
    return classify(err.code);
}

/**
 * @brief Check if the error is retryable
 */
[[nodiscard]] constexpr auto is_retryable(error_code code) noexcept -> bool {
    return classify(code) == error_class::transient;
}

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_ERROR_CODES_H
