/**
 * @file retry_policy.h
 * @brief Bounded retry loop driven by error classification
 */

#ifndef KCENON_FILE_STREAM_CORE_RETRY_POLICY_H
#define KCENON_FILE_STREAM_CORE_RETRY_POLICY_H

#include "error_codes.h"
#include "types.h"

#include <chrono>
#include <cstdint>
#include <functional>
#include <stop_token>

namespace kcenon::file_stream {

/**
 * @brief Final status of a retry loop and the number of attempts it made
 */
struct retry_outcome {
    result<void> status;
    uint32_t attempts = 0;
};

/**
 * @brief Runs an attempt until success, a non-transient error, or the limit
 *
 * Transient failures are retried after a delay that the stop token can
 * interrupt. Permanent failures and cancellation end the loop at once.
 * Every failure returned keeps the code of the last attempt's cause and
 * states how many attempts were made.
 *
 * @code
 * retry_policy policy(3, std::chrono::seconds{1});
 * auto outcome = policy.run([&](uint32_t attempt) { return upload_once(attempt); },
 *                           stop.get_token());
 * @endcode
 */
class retry_policy {
public:
    using attempt_function = std::function<result<void>(uint32_t attempt)>;

    /**
     * @param retry_attempts Additional attempts after the first
     * @param retry_delay Wait between attempts
     */
    retry_policy(uint32_t retry_attempts, std::chrono::milliseconds retry_delay);

    [[nodiscard]] auto max_attempts() const noexcept -> uint32_t { return retry_attempts_ + 1; }

    [[nodiscard]] auto retry_delay() const noexcept -> std::chrono::milliseconds {
        return retry_delay_;
    }

    /**
     * @brief Run @p attempt with retries
     * @param attempt Called with the 0-based attempt number
     * @param stop Cancels before an attempt and during the delay
     */
    [[nodiscard]] auto run(const attempt_function& attempt, std::stop_token stop = {}) const
        -> retry_outcome;

private:
    /**
     * @brief Sleep for the retry delay
     * @return false if @p stop fired first
     */
    [[nodiscard]] auto wait_delay(std::stop_token stop) const -> bool;

    uint32_t retry_attempts_;
    std::chrono::milliseconds retry_delay_;
};

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_RETRY_POLICY_H
