/**
 * @file logging_progress_sink.h
 * @brief progress_sink writing throttled progress to the logger
 */

#ifndef KCENON_FILE_STREAM_CLIENT_LOGGING_PROGRESS_SINK_H
#define KCENON_FILE_STREAM_CLIENT_LOGGING_PROGRESS_SINK_H

#include "kcenon/file_stream/core/progress.h"

#include <chrono>
#include <map>
#include <mutex>

namespace kcenon::file_stream {

/**
 * @brief Logs each file's progress at most once per interval
 *
 * Thread-safe; one instance can observe a whole batch.
 */
class logging_progress_sink : public progress_sink {
public:
    explicit logging_progress_sink(
        std::chrono::milliseconds interval = std::chrono::seconds{1});

    auto on_progress(const progress_event& event) -> void override;

    auto on_complete(const upload_outcome& outcome) -> void override;

private:
    std::chrono::milliseconds interval_;
    std::mutex mutex_;
    std::map<std::filesystem::path, std::chrono::steady_clock::time_point> last_logged_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CLIENT_LOGGING_PROGRESS_SINK_H
