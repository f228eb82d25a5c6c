/**
 * @file retry_policy.cpp
 * @brief Bounded retry loop driven by error classification
 */

#include "kcenon/file_stream/core/retry_policy.h"

#include "kcenon/file_stream/core/error_codes.h"
#include "kcenon/file_stream/core/logging.h"

#include <condition_variable>
#include <mutex>
#include <string>

namespace kcenon::file_stream {

namespace {

auto attempts_text(uint32_t attempts) -> std::string {
    return std::to_string(attempts) + (attempts == 1 ? " attempt" : " attempts");
}

auto wrap_failure(const error& cause, uint32_t attempts) -> error {
    if (cause.code == error_code::cancelled) {
        return error{error_code::cancelled,
                     "upload cancelled after " + attempts_text(attempts) + ": " + cause.message};
    }
    return error{cause.code,
                 "upload failed after " + attempts_text(attempts) + ": " + cause.message};
}

}  // namespace

retry_policy::retry_policy(uint32_t retry_attempts, std::chrono::milliseconds retry_delay)
    : retry_attempts_(retry_attempts), retry_delay_(retry_delay) {}

auto retry_policy::run(const attempt_function& attempt, std::stop_token stop) const
    -> retry_outcome {
    retry_outcome outcome;
    error last{error_code::cancelled, "cancelled before the first attempt"};

    for (uint32_t n = 0; n < max_attempts(); ++n) {
        if (n > 0 && !wait_delay(stop)) {
            last = error{error_code::cancelled, "cancelled while waiting to retry"};
            break;
        }
        if (stop.stop_requested()) {
            last = error{error_code::cancelled, "cancelled"};
            break;
        }

        auto status = attempt(n);
        ++outcome.attempts;
        if (status) {
            outcome.status = {};
            return outcome;
        }

        last = status.error();
        auto cls = classify(last);
        if (cls != error_class::transient) {
            break;
        }

        if (n + 1 < max_attempts()) {
            transfer_log_context ctx;
            ctx.attempt = n + 1;
            ctx.error_message = last.message;
            FS_LOG_WARN_CTX(log_category::retry, "Attempt failed, retrying", ctx);
        }
    }

    outcome.status = unexpected{wrap_failure(last, outcome.attempts)};
    return outcome;
}

auto retry_policy::wait_delay(std::stop_token stop) const -> bool {
    if (retry_delay_.count() <= 0) {
        return !stop.stop_requested();
    }

    std::mutex mutex;
    std::condition_variable_any cv;
    std::unique_lock lock(mutex);
    cv.wait_for(lock, stop, retry_delay_, [] { return false; });
    return !stop.stop_requested();
}

}  // namespace kcenon::file_stream
