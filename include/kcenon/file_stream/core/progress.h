/**
 * @file progress.h
 * @brief Upload progress events and the sink that observes them
 */

#ifndef KCENON_FILE_STREAM_CORE_PROGRESS_H
#define KCENON_FILE_STREAM_CORE_PROGRESS_H

#include "types.h"

#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <optional>
#include <utility>

namespace kcenon::file_stream {

/**
 * @brief Cumulative progress of one upload attempt
 */
struct progress_event {
    std::filesystem::path file;
    uint64_t bytes_transferred = 0;
    uint64_t total_bytes = 0;
    double percentage = 0.0;
    uint32_t attempt = 0;  ///< 0-based attempt number

    [[nodiscard]] static auto make(std::filesystem::path file,
                                   uint64_t bytes,
                                   uint64_t total,
                                   uint32_t attempt) -> progress_event;
};

/**
 * @brief Terminal result of one upload session
 */
struct upload_outcome {
    std::filesystem::path file;
    uint64_t file_size = 0;
    uint32_t attempts = 0;
    std::chrono::milliseconds elapsed{0};
    std::optional<error> failure;

    [[nodiscard]] auto succeeded() const noexcept -> bool { return !failure.has_value(); }
};

/**
 * @brief Observer of upload progress
 *
 * The engine does not serialize calls: a sink shared by a batch receives
 * calls from several sessions at once and must be thread-safe.
 * on_complete() is called exactly once per session, after which the
 * session never calls the sink again.
 */
class progress_sink {
public:
    virtual ~progress_sink() = default;

    virtual auto on_progress(const progress_event& event) -> void = 0;

    virtual auto on_complete(const upload_outcome& outcome) -> void = 0;
};

/**
 * @brief progress_sink forwarding to callables
 *
 * Either callback may be empty.
 */
class callback_progress_sink : public progress_sink {
public:
    using progress_callback = std::function<void(const progress_event&)>;
    using complete_callback = std::function<void(const upload_outcome&)>;

    explicit callback_progress_sink(progress_callback on_progress,
                                    complete_callback on_complete = {})
        : on_progress_(std::move(on_progress)), on_complete_(std::move(on_complete)) {}

    auto on_progress(const progress_event& event) -> void override {
        if (on_progress_) on_progress_(event);
    }

    auto on_complete(const upload_outcome& outcome) -> void override {
        if (on_complete_) on_complete_(outcome);
    }

private:
    progress_callback on_progress_;
    complete_callback on_complete_;
};

/**
 * @brief Decides when a progress event is due
 *
 * Reports at most once per interval, measured from the last report or
 * from reset(). Reaching the total is always reported so observers see
 * the completed state.
 */
class progress_throttle {
public:
    using clock = std::chrono::steady_clock;

    explicit progress_throttle(std::chrono::milliseconds interval,
                               clock::time_point start = clock::now())
        : interval_(interval), last_(start) {}

    auto reset(clock::time_point start) -> void { last_ = start; }

    /**
     * @brief Check whether to report, and record the report if so
     */
    [[nodiscard]] auto should_report(uint64_t bytes, uint64_t total, clock::time_point now)
        -> bool {
        if ((total > 0 && bytes >= total) || now - last_ >= interval_) {
            last_ = now;
            return true;
        }
        return false;
    }

private:
    std::chrono::milliseconds interval_;
    clock::time_point last_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_PROGRESS_H
