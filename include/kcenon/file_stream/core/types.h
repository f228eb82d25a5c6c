/**
 * @file types.h
 * @brief Core type definitions for file_stream_system
 */

#ifndef KCENON_FILE_STREAM_CORE_TYPES_H
#define KCENON_FILE_STREAM_CORE_TYPES_H

#include <cstdint>
#include <optional>
#include <string>
#include <utility>

namespace kcenon::file_stream {

/**
 * @brief Error codes for streaming upload operations
 */
enum class error_code {
    success = 0,

    // File errors (-100 to -119)
    file_not_found = -100,
    file_access_denied = -101,
    file_empty = -102,
    not_regular_file = -103,
    file_read_error = -105,
    file_write_error = -106,
    directory_read_error = -107,

    // Encoding errors (-120 to -139)
    multipart_encode_error = -120,
    multipart_parse_error = -121,
    missing_form_field = -122,
    invalid_filename = -123,

    // Configuration errors (-140 to -159)
    invalid_chunk_size = -140,
    invalid_configuration = -141,
    invalid_endpoint = -142,

    // Network errors (-160 to -179)
    connection_failed = -160,
    connection_timeout = -161,
    connection_refused = -162,
    connection_lost = -163,
    server_not_running = -164,
    http_status_error = -165,

    // Transfer control errors (-180 to -199)
    cancelled = -180,
    batch_failed = -181,
    empty_file_set = -182,

    // Internal errors (-200 to -219)
    internal_error = -200,
    already_initialized = -202,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::file_not_found:
            return "file not found";
        case error_code::file_access_denied:
            return "file access denied";
        case error_code::file_empty:
            return "file is empty";
        case error_code::not_regular_file:
            return "not a regular file";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::directory_read_error:
            return "directory read error";
        case error_code::multipart_encode_error:
            return "multipart encode error";
        case error_code::multipart_parse_error:
            return "multipart parse error";
        case error_code::missing_form_field:
            return "missing form field";
        case error_code::invalid_filename:
            return "invalid filename";
        case error_code::invalid_chunk_size:
            return "invalid chunk size";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::invalid_endpoint:
            return "invalid endpoint";
        case error_code::connection_failed:
            return "connection failed";
        case error_code::connection_timeout:
            return "connection timeout";
        case error_code::connection_refused:
            return "connection refused";
        case error_code::connection_lost:
            return "connection lost";
        case error_code::server_not_running:
            return "server not running";
        case error_code::http_status_error:
            return "unexpected http status";
        case error_code::cancelled:
            return "cancelled";
        case error_code::batch_failed:
            return "batch upload failed";
        case error_code::empty_file_set:
            return "no files specified";
        case error_code::internal_error:
            return "internal error";
        case error_code::already_initialized:
            return "already initialized";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * Holds either a value of type T or an error, in the manner of
 * std::expected (C++23).
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_TYPES_H
