/**
 * @file concurrency_limiter.cpp
 * @brief Fixed-capacity permit pool
 */

#include "kcenon/file_stream/core/concurrency_limiter.h"

#include <algorithm>
#include <utility>

namespace kcenon::file_stream {

// ============================================================================
// concurrency_slot
// ============================================================================

concurrency_slot::~concurrency_slot() {
    release();
}

concurrency_slot::concurrency_slot(concurrency_slot&& other) noexcept
    : owner_(std::exchange(other.owner_, nullptr)) {}

auto concurrency_slot::operator=(concurrency_slot&& other) noexcept -> concurrency_slot& {
    if (this != &other) {
        release();
        owner_ = std::exchange(other.owner_, nullptr);
    }
    return *this;
}

auto concurrency_slot::release() noexcept -> void {
    if (auto* owner = std::exchange(owner_, nullptr)) {
        owner->release_one();
    }
}

// ============================================================================
// concurrency_limiter
// ============================================================================

concurrency_limiter::concurrency_limiter(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

auto concurrency_limiter::acquire(std::stop_token stop) -> result<concurrency_slot> {
    std::unique_lock lock(mutex_);

    bool granted = !stop.stop_requested() &&
                   cv_.wait(lock, stop, [this] { return in_use_ < capacity_; });
    if (!granted || stop.stop_requested()) {
        // pass a wakeup we may have absorbed on to the next waiter
        cv_.notify_one();
        return unexpected{error{error_code::cancelled,
                                "cancelled while waiting for a concurrency slot"}};
    }

    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return concurrency_slot{this};
}

auto concurrency_limiter::try_acquire() -> result<concurrency_slot> {
    std::lock_guard lock(mutex_);
    if (in_use_ >= capacity_) {
        return unexpected{error{error_code::internal_error, "no concurrency slot available"}};
    }
    ++in_use_;
    peak_ = std::max(peak_, in_use_);
    return concurrency_slot{this};
}

auto concurrency_limiter::in_use() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return in_use_;
}

auto concurrency_limiter::peak_in_use() const -> std::size_t {
    std::lock_guard lock(mutex_);
    return peak_;
}

auto concurrency_limiter::release_one() noexcept -> void {
    {
        std::lock_guard lock(mutex_);
        if (in_use_ > 0) {
            --in_use_;
        }
    }
    cv_.notify_one();
}

}  // namespace kcenon::file_stream
