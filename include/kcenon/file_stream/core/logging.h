// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

/**
 * @file logging.h
 * @brief Structured logging for file_stream_system
 *
 * Records go to logger_system when the library is built with
 * BUILD_WITH_LOGGER_SYSTEM, otherwise to stderr. A callback can be
 * installed to observe every record (used by tests).
 */

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>

#include "kcenon/file_stream/config/feature_flags.h"

// logger_system integration requires common_system
#if FILE_STREAM_USE_LOGGER_SYSTEM
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::file_stream {

/**
 * @brief Log categories for file_stream_system
 */
struct log_category {
    static constexpr std::string_view client = "file_stream.client";
    static constexpr std::string_view server = "file_stream.server";
    static constexpr std::string_view pipeline = "file_stream.pipeline";
    static constexpr std::string_view retry = "file_stream.retry";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Structured fields attached to an upload log record
 */
struct transfer_log_context {
    std::string filename;
    std::optional<std::string> remote_address;
    std::optional<uint64_t> file_size;
    std::optional<uint64_t> bytes_transferred;
    std::optional<uint32_t> attempt;
    std::optional<double> progress_percent;
    std::optional<double> rate_mbps;
    std::optional<double> eta_seconds;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        std::ostringstream oss;
        oss << "{";
        bool first = true;
        auto sep = [&] {
            if (!first) oss << ",";
            first = false;
        };
        auto add_string = [&](const char* name, std::string_view value) {
            sep();
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            sep();
            oss << "\"" << name << "\":" << value;
        };
        auto add_double = [&](const char* name, double value) {
            sep();
            oss << "\"" << name << "\":" << std::fixed << std::setprecision(2) << value;
        };

        if (!filename.empty()) add_string("filename", filename);
        if (remote_address) add_string("remote_address", *remote_address);
        if (file_size) add_uint("size", *file_size);
        if (bytes_transferred) add_uint("bytes_transferred", *bytes_transferred);
        if (attempt) add_uint("attempt", *attempt);
        if (progress_percent) add_double("progress_percent", *progress_percent);
        if (rate_mbps) add_double("rate_mbps", *rate_mbps);
        if (eta_seconds) add_double("eta_seconds", *eta_seconds);
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) add_string("error_message", *error_message);

        oss << "}";
        return oss.str();
    }
};

enum class log_output_format {
    text,
    json
};

class file_stream_logger;

file_stream_logger& get_logger();

/**
 * @brief Process-wide logger for file_stream_system
 */
class file_stream_logger {
public:
    using log_callback = std::function<void(
        log_level, std::string_view, std::string_view, const transfer_log_context*)>;

    file_stream_logger() = default;
    ~file_stream_logger() = default;

    file_stream_logger(const file_stream_logger&) = delete;
    file_stream_logger& operator=(const file_stream_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times. Called when clients and servers are built.
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#if FILE_STREAM_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#if FILE_STREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#if FILE_STREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    /**
     * @brief Install a callback receiving every enabled record
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             [[maybe_unused]] const char* file = nullptr,
             [[maybe_unused]] int line = 0,
             [[maybe_unused]] const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        auto formatted = get_output_format() == log_output_format::json
            ? format_json(level, category, message, context)
            : format_text(category, message, context);

#if FILE_STREAM_USE_LOGGER_SYSTEM
        if (logger_) {
            if (file && line > 0 && function) {
                logger_->log(to_logger_level(level), formatted, file, line, function);
            } else {
                logger_->log(to_logger_level(level), formatted);
            }
            return;
        }
#endif
        write_stderr(level, formatted);
    }

private:
    static auto format_text(std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "[" << category << "] " << message;
        if (context) {
            oss << " " << context->to_json();
        }
        return oss.str();
    }

    static auto format_json(log_level level,
                            std::string_view category,
                            std::string_view message,
                            const transfer_log_context* context) -> std::string {
        std::ostringstream oss;
        oss << "{\"timestamp\":\"" << get_timestamp("%Y-%m-%dT%H:%M:%S", true) << "Z\""
            << ",\"level\":\"" << log_level_to_string(level) << "\""
            << ",\"category\":\"" << category << "\""
            << ",\"message\":\"" << detail::escape_json(message) << "\"";
        if (context) {
            auto ctx = context->to_json();
            if (ctx.size() > 2) {
                oss << "," << ctx.substr(1, ctx.size() - 2);
            }
        }
        oss << "}";
        return oss.str();
    }

    static void write_stderr(log_level level, const std::string& formatted) {
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << get_timestamp("%Y-%m-%d %H:%M:%S", false)
                  << " [" << log_level_to_string(level) << "] " << formatted << "\n";
    }

    static auto get_timestamp(const char* pattern, bool utc) -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        if (utc) gmtime_s(&tm_buf, &time_t_val); else localtime_s(&tm_buf, &time_t_val);
#else
        if (utc) gmtime_r(&time_t_val, &tm_buf); else localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, pattern)
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

#if FILE_STREAM_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    log_callback callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    mutable std::mutex config_mutex_;
};

inline file_stream_logger& get_logger() {
    static file_stream_logger instance;
    return instance;
}

#define FS_LOG(level, category, message) \
    kcenon::file_stream::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define FS_LOG_CTX(level, category, message, context) \
    kcenon::file_stream::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define FS_LOG_TRACE(category, message) \
    FS_LOG(kcenon::file_stream::log_level::trace, category, message)

#define FS_LOG_DEBUG(category, message) \
    FS_LOG(kcenon::file_stream::log_level::debug, category, message)

#define FS_LOG_INFO(category, message) \
    FS_LOG(kcenon::file_stream::log_level::info, category, message)

#define FS_LOG_WARN(category, message) \
    FS_LOG(kcenon::file_stream::log_level::warn, category, message)

#define FS_LOG_ERROR(category, message) \
    FS_LOG(kcenon::file_stream::log_level::error, category, message)

#define FS_LOG_DEBUG_CTX(category, message, ctx) \
    FS_LOG_CTX(kcenon::file_stream::log_level::debug, category, message, ctx)

#define FS_LOG_INFO_CTX(category, message, ctx) \
    FS_LOG_CTX(kcenon::file_stream::log_level::info, category, message, ctx)

#define FS_LOG_WARN_CTX(category, message, ctx) \
    FS_LOG_CTX(kcenon::file_stream::log_level::warn, category, message, ctx)

#define FS_LOG_ERROR_CTX(category, message, ctx) \
    FS_LOG_CTX(kcenon::file_stream::log_level::error, category, message, ctx)

}  // namespace kcenon::file_stream
