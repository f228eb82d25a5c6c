/**
 * @file throughput_meter.h
 * @brief Receive speed and remaining-time estimation
 */

#ifndef KCENON_FILE_STREAM_SERVER_THROUGHPUT_METER_H
#define KCENON_FILE_STREAM_SERVER_THROUGHPUT_METER_H

#include "server_types.h"

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::file_stream {

/**
 * @brief Tracks received bytes of one upload and rate-limits reports
 *
 * Reports are produced only when the expected total is known, and at most
 * once per interval. Speed is instantaneous: bytes since the previous
 * report divided by the time since it. Time points are passed in so the
 * meter can be driven by tests.
 */
class throughput_meter {
public:
    using clock = std::chrono::steady_clock;

    /**
     * @param total_bytes Expected size; unset or 0 disables reports
     * @param interval Minimum time between reports
     * @param start Time the upload started
     */
    throughput_meter(std::optional<uint64_t> total_bytes,
                     std::chrono::milliseconds interval,
                     clock::time_point start = clock::now());

    /**
     * @brief Account for @p bytes more received at @p now
     * @return A report when one is due
     */
    [[nodiscard]] auto record(uint64_t bytes, clock::time_point now = clock::now())
        -> std::optional<throughput_report>;

    /**
     * @brief Duration and average rate from start to @p now
     */
    [[nodiscard]] auto summarize(clock::time_point now = clock::now()) const -> upload_summary;

    [[nodiscard]] auto bytes_received() const noexcept -> uint64_t { return received_; }

    [[nodiscard]] auto total_bytes() const noexcept -> std::optional<uint64_t> { return total_; }

private:
    std::optional<uint64_t> total_;
    std::chrono::milliseconds interval_;
    clock::time_point start_;
    clock::time_point last_report_;
    uint64_t received_ = 0;
    uint64_t received_at_last_report_ = 0;
};

/**
 * @brief Human-readable byte count ("512 B", "1.5 MB")
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

/**
 * @brief Duration rounded to seconds ("45s", "2m5s", "1h0m3s")
 */
[[nodiscard]] auto format_duration(std::chrono::milliseconds duration) -> std::string;

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_SERVER_THROUGHPUT_METER_H
