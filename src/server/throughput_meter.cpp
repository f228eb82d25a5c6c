/**
 * @file throughput_meter.cpp
 * @brief Receive speed and remaining-time estimation
 */

#include "kcenon/file_stream/server/throughput_meter.h"

#include <algorithm>
#include <cstdio>

namespace kcenon::file_stream {

namespace {

auto to_seconds(throughput_meter::clock::duration d) -> double {
    return std::chrono::duration<double>(d).count();
}

}  // namespace

throughput_meter::throughput_meter(std::optional<uint64_t> total_bytes,
                                   std::chrono::milliseconds interval,
                                   clock::time_point start)
    : total_(total_bytes && *total_bytes > 0 ? total_bytes : std::nullopt)
    , interval_(interval)
    , start_(start)
    , last_report_(start) {}

auto throughput_meter::record(uint64_t bytes, clock::time_point now)
    -> std::optional<throughput_report> {
    received_ += bytes;

    if (!total_ || now - last_report_ < interval_) {
        return std::nullopt;
    }

    auto window = to_seconds(now - last_report_);
    if (window <= 0.0) {
        return std::nullopt;
    }

    throughput_report report;
    report.bytes_received = received_;
    report.total_bytes = *total_;
    report.percentage = std::min(100.0, static_cast<double>(received_) /
                                            static_cast<double>(*total_) * 100.0);
    report.bytes_per_second =
        static_cast<double>(received_ - received_at_last_report_) / window;
    report.elapsed = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_);
    if (report.bytes_per_second > 0.0) {
        auto remaining = *total_ > received_ ? *total_ - received_ : 0;
        report.eta_seconds = static_cast<double>(remaining) / report.bytes_per_second;
    }

    last_report_ = now;
    received_at_last_report_ = received_;
    return report;
}

auto throughput_meter::summarize(clock::time_point now) const -> upload_summary {
    upload_summary summary;
    summary.bytes_received = received_;
    summary.duration = std::chrono::duration_cast<std::chrono::milliseconds>(now - start_);
    auto seconds = to_seconds(now - start_);
    if (seconds > 0.0) {
        summary.average_bytes_per_second = static_cast<double>(received_) / seconds;
    }
    return summary;
}

auto format_bytes(uint64_t bytes) -> std::string {
    constexpr uint64_t unit = 1024;
    if (bytes < unit) {
        return std::to_string(bytes) + " B";
    }
    uint64_t div = unit;
    int exp = 0;
    for (uint64_t n = bytes / unit; n >= unit; n /= unit) {
        div *= unit;
        ++exp;
    }
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.1f %cB",
                  static_cast<double>(bytes) / static_cast<double>(div), "KMGTPE"[exp]);
    return buf;
}

auto format_duration(std::chrono::milliseconds duration) -> std::string {
    auto total = (std::max<int64_t>(duration.count(), 0) + 500) / 1000;
    auto hours = total / 3600;
    auto minutes = (total % 3600) / 60;
    auto seconds = total % 60;

    std::string out;
    if (hours > 0) {
        out += std::to_string(hours) + "h";
    }
    if (hours > 0 || minutes > 0) {
        out += std::to_string(minutes) + "m";
    }
    out += std::to_string(seconds) + "s";
    return out;
}

}  // namespace kcenon::file_stream
