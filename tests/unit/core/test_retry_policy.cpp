/**
 * @file test_retry_policy.cpp
 * @brief Unit tests for retry_policy
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/core/retry_policy.h>

#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace kcenon::file_stream::test {

class RetryPolicyTest : public ::testing::Test {
protected:
    static auto transient() -> result<void> {
        return unexpected{error{error_code::http_status_error, "server returned status 500"}};
    }

    static auto permanent() -> result<void> {
        return unexpected{error{error_code::file_empty, "file is empty"}};
    }
};

TEST_F(RetryPolicyTest, FirstSuccessMakesOneAttempt) {
    retry_policy policy(3, std::chrono::milliseconds{0});
    auto outcome = policy.run([](uint32_t) { return result<void>{}; });

    EXPECT_TRUE(outcome.status.has_value());
    EXPECT_EQ(outcome.attempts, 1u);
}

TEST_F(RetryPolicyTest, ExhaustsTransientFailures) {
    retry_policy policy(2, std::chrono::milliseconds{0});
    std::vector<uint32_t> seen;
    auto outcome = policy.run([&](uint32_t attempt) {
        seen.push_back(attempt);
        return transient();
    });

    ASSERT_FALSE(outcome.status.has_value());
    EXPECT_EQ(outcome.attempts, 3u);
    EXPECT_EQ(seen, (std::vector<uint32_t>{0, 1, 2}));
    EXPECT_EQ(outcome.status.error().code, error_code::http_status_error);
    EXPECT_NE(outcome.status.error().message.find("3 attempts"), std::string::npos);
    EXPECT_NE(outcome.status.error().message.find("status 500"), std::string::npos);
}

TEST_F(RetryPolicyTest, SucceedsOnFinalAttempt) {
    retry_policy policy(2, std::chrono::milliseconds{0});
    auto outcome = policy.run([](uint32_t attempt) {
        return attempt < 2 ? transient() : result<void>{};
    });

    EXPECT_TRUE(outcome.status.has_value());
    EXPECT_EQ(outcome.attempts, 3u);
}

TEST_F(RetryPolicyTest, PermanentFailureStopsImmediately) {
    retry_policy policy(5, std::chrono::milliseconds{0});
    auto outcome = policy.run([](uint32_t) { return permanent(); });

    ASSERT_FALSE(outcome.status.has_value());
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(outcome.status.error().code, error_code::file_empty);
    EXPECT_NE(outcome.status.error().message.find("1 attempt"), std::string::npos);
}

TEST_F(RetryPolicyTest, ZeroRetriesMeansSingleAttempt) {
    retry_policy policy(0, std::chrono::milliseconds{0});
    EXPECT_EQ(policy.max_attempts(), 1u);

    auto outcome = policy.run([](uint32_t) { return transient(); });
    EXPECT_EQ(outcome.attempts, 1u);
}

TEST_F(RetryPolicyTest, CancellationDuringDelay) {
    retry_policy policy(3, std::chrono::seconds{30});
    std::stop_source stop;

    auto started = std::chrono::steady_clock::now();
    auto run = std::async(std::launch::async, [&] {
        return policy.run([](uint32_t) { return transient(); }, stop.get_token());
    });

    std::this_thread::sleep_for(std::chrono::milliseconds{50});
    stop.request_stop();
    auto outcome = run.get();

    EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds{10});
    ASSERT_FALSE(outcome.status.has_value());
    EXPECT_EQ(outcome.status.error().code, error_code::cancelled);
    EXPECT_EQ(outcome.attempts, 1u);
}

TEST_F(RetryPolicyTest, CancelledAttemptIsNotRetried) {
    retry_policy policy(3, std::chrono::milliseconds{0});
    auto outcome = policy.run([](uint32_t) -> result<void> {
        return unexpected{error{error_code::cancelled, "stopped"}};
    });

    ASSERT_FALSE(outcome.status.has_value());
    EXPECT_EQ(outcome.attempts, 1u);
    EXPECT_EQ(outcome.status.error().code, error_code::cancelled);
}

TEST_F(RetryPolicyTest, StopBeforeFirstAttempt) {
    retry_policy policy(3, std::chrono::milliseconds{0});
    std::stop_source stop;
    stop.request_stop();

    bool called = false;
    auto outcome = policy.run([&](uint32_t) {
        called = true;
        return result<void>{};
    }, stop.get_token());

    EXPECT_FALSE(called);
    EXPECT_EQ(outcome.attempts, 0u);
    EXPECT_EQ(outcome.status.error().code, error_code::cancelled);
}

}  // namespace kcenon::file_stream::test
