/**
 * @file progress.cpp
 * @brief Upload progress events
 */

#include "kcenon/file_stream/core/progress.h"

#include <utility>

namespace kcenon::file_stream {

auto progress_event::make(std::filesystem::path file,
                          uint64_t bytes,
                          uint64_t total,
                          uint32_t attempt) -> progress_event {
    progress_event event;
    event.file = std::move(file);
    event.bytes_transferred = bytes;
    event.total_bytes = total;
    event.attempt = attempt;
    event.percentage = total == 0
        ? 0.0
        : static_cast<double>(bytes) / static_cast<double>(total) * 100.0;
    return event;
}

}  // namespace kcenon::file_stream
