/**
 * @file logging_progress_sink.cpp
 * @brief progress_sink writing throttled progress to the logger
 */

#include "kcenon/file_stream/client/logging_progress_sink.h"

#include "kcenon/file_stream/core/logging.h"

namespace kcenon::file_stream {

logging_progress_sink::logging_progress_sink(std::chrono::milliseconds interval)
    : interval_(interval) {}

auto logging_progress_sink::on_progress(const progress_event& event) -> void {
    auto now = std::chrono::steady_clock::now();
    bool finished = event.bytes_transferred >= event.total_bytes;
    {
        std::lock_guard lock(mutex_);
        auto [it, inserted] = last_logged_.try_emplace(event.file, now);
        if (!inserted) {
            if (!finished && now - it->second < interval_) {
                return;
            }
            it->second = now;
        }
    }

    transfer_log_context ctx;
    ctx.filename = event.file.filename().string();
    ctx.bytes_transferred = event.bytes_transferred;
    ctx.file_size = event.total_bytes;
    ctx.progress_percent = event.percentage;
    ctx.attempt = event.attempt + 1;
    FS_LOG_INFO_CTX(log_category::client, "Upload progress", ctx);
}

auto logging_progress_sink::on_complete(const upload_outcome& outcome) -> void {
    {
        std::lock_guard lock(mutex_);
        last_logged_.erase(outcome.file);
    }

    transfer_log_context ctx;
    ctx.filename = outcome.file.filename().string();
    ctx.file_size = outcome.file_size;
    ctx.attempt = outcome.attempts;
    ctx.duration_ms = static_cast<uint64_t>(outcome.elapsed.count());

    if (outcome.succeeded()) {
        FS_LOG_INFO_CTX(log_category::client, "Upload finished", ctx);
    } else {
        ctx.error_message = outcome.failure->message;
        FS_LOG_ERROR_CTX(log_category::client, "Upload failed", ctx);
    }
}

}  // namespace kcenon::file_stream
