/**
 * @file upload_observer.cpp
 * @brief Logging upload observer
 */

#include "kcenon/file_stream/server/upload_observer.h"

#include "kcenon/file_stream/core/logging.h"
#include "kcenon/file_stream/server/throughput_meter.h"

namespace kcenon::file_stream {

namespace {

constexpr double bytes_per_mib = 1024.0 * 1024.0;

auto base_context(const inbound_file& file) -> transfer_log_context {
    transfer_log_context ctx;
    ctx.filename = file.filename;
    if (!file.remote_address.empty()) {
        ctx.remote_address = file.remote_address;
    }
    if (file.expected_bytes) {
        ctx.file_size = *file.expected_bytes;
    }
    return ctx;
}

auto with_summary(transfer_log_context ctx, const upload_summary& summary)
    -> transfer_log_context {
    ctx.bytes_transferred = summary.bytes_received;
    ctx.duration_ms = static_cast<uint64_t>(summary.duration.count());
    ctx.rate_mbps = summary.average_bytes_per_second / bytes_per_mib;
    return ctx;
}

}  // namespace

void logging_upload_observer::on_upload_started(const inbound_file& file) {
    auto size = file.expected_bytes ? format_bytes(*file.expected_bytes) : std::string("unknown");
    std::string message = "Upload started: " + file.filename + " (" + size + ")";
    if (!file.user_agent.empty()) {
        message += " user-agent=" + file.user_agent;
    }
    auto ctx = base_context(file);
    FS_LOG_INFO_CTX(log_category::server, message, ctx);
}

void logging_upload_observer::on_upload_progress(const inbound_file& file,
                                                 const throughput_report& report) {
    auto ctx = base_context(file);
    ctx.bytes_transferred = report.bytes_received;
    ctx.progress_percent = report.percentage;
    ctx.rate_mbps = report.bytes_per_second / bytes_per_mib;
    ctx.eta_seconds = report.eta_seconds;

    std::string message = "Receiving " + format_bytes(report.bytes_received) + " / " +
                          format_bytes(report.total_bytes) + " at " +
                          format_bytes(static_cast<uint64_t>(report.bytes_per_second)) +
                          "/s, elapsed " + format_duration(report.elapsed);
    if (report.eta_seconds) {
        message += ", remaining " + format_duration(std::chrono::milliseconds(
                                        static_cast<int64_t>(*report.eta_seconds * 1000.0)));
    }
    FS_LOG_INFO_CTX(log_category::server, message, ctx);
}

void logging_upload_observer::on_upload_completed(const inbound_file& file,
                                                  const upload_summary& summary) {
    auto ctx = with_summary(base_context(file), summary);
    FS_LOG_INFO_CTX(log_category::server,
                    "Upload completed: " + file.stored_path.string() + ", " +
                        format_bytes(summary.bytes_received) + " in " +
                        format_duration(summary.duration) + " (" +
                        format_bytes(static_cast<uint64_t>(summary.average_bytes_per_second)) +
                        "/s)",
                    ctx);
}

void logging_upload_observer::on_upload_failed(const inbound_file& file,
                                               const upload_summary& summary,
                                               const error& cause) {
    auto ctx = with_summary(base_context(file), summary);
    ctx.error_message = cause.message;
    FS_LOG_ERROR_CTX(log_category::server, "Upload aborted, partial file kept: " +
                                               file.stored_path.string(),
                     ctx);
}

}  // namespace kcenon::file_stream
