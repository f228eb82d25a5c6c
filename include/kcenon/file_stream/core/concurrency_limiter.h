/**
 * @file concurrency_limiter.h
 * @brief Fixed-capacity permit pool bounding simultaneous uploads
 *
 * One limiter is owned per client; pass the same shared instance to
 * several clients to make them share capacity.
 */

#ifndef KCENON_FILE_STREAM_CORE_CONCURRENCY_LIMITER_H
#define KCENON_FILE_STREAM_CORE_CONCURRENCY_LIMITER_H

#include "types.h"

#include <condition_variable>
#include <cstddef>
#include <mutex>
#include <stop_token>

namespace kcenon::file_stream {

class concurrency_limiter;

/**
 * @brief Permit held while a session runs its attempt loop
 *
 * Move-only. The permit returns to its pool when release() is called or
 * the slot is destroyed, whichever happens first.
 */
class concurrency_slot {
public:
    concurrency_slot() = default;
    ~concurrency_slot();

    concurrency_slot(const concurrency_slot&) = delete;
    auto operator=(const concurrency_slot&) -> concurrency_slot& = delete;
    concurrency_slot(concurrency_slot&& other) noexcept;
    auto operator=(concurrency_slot&& other) noexcept -> concurrency_slot&;

    /**
     * @brief Return the permit to the pool
     */
    auto release() noexcept -> void;

    [[nodiscard]] auto held() const noexcept -> bool { return owner_ != nullptr; }

private:
    friend class concurrency_limiter;
    explicit concurrency_slot(concurrency_limiter* owner) : owner_(owner) {}

    concurrency_limiter* owner_ = nullptr;
};

/**
 * @brief Counting semaphore with cancellable acquire
 *
 * @code
 * concurrency_limiter limiter(4);
 *
 * auto slot = limiter.acquire(stop.get_token());
 * if (!slot) {
 *     return unexpected{slot.error()};  // cancelled
 * }
 * // ... run the upload; the permit returns when slot goes out of scope
 * @endcode
 */
class concurrency_limiter {
public:
    /**
     * @brief Construct a limiter
     * @param capacity Maximum simultaneous permits (at least 1)
     */
    explicit concurrency_limiter(std::size_t capacity);

    concurrency_limiter(const concurrency_limiter&) = delete;
    auto operator=(const concurrency_limiter&) -> concurrency_limiter& = delete;

    /**
     * @brief Wait for a free permit
     *
     * @param stop Cancellation signal observed while waiting
     * @return Slot, or error_code::cancelled without consuming a permit
     */
    [[nodiscard]] auto acquire(std::stop_token stop = {}) -> result<concurrency_slot>;

    /**
     * @brief Take a permit only if one is free right now
     */
    [[nodiscard]] auto try_acquire() -> result<concurrency_slot>;

    [[nodiscard]] auto capacity() const noexcept -> std::size_t { return capacity_; }

    /**
     * @brief Number of permits currently held
     */
    [[nodiscard]] auto in_use() const -> std::size_t;

    /**
     * @brief Highest number of permits held at once since construction
     */
    [[nodiscard]] auto peak_in_use() const -> std::size_t;

private:
    friend class concurrency_slot;

    auto release_one() noexcept -> void;

    const std::size_t capacity_;
    std::size_t in_use_ = 0;
    std::size_t peak_ = 0;
    mutable std::mutex mutex_;
    std::condition_variable_any cv_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_CONCURRENCY_LIMITER_H
