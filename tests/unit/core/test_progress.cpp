/**
 * @file test_progress.cpp
 * @brief Unit tests for progress events and throttling
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/core/progress.h>

#include <chrono>
#include <vector>

namespace kcenon::file_stream::test {

using namespace std::chrono_literals;

class ProgressEventTest : public ::testing::Test {};

TEST_F(ProgressEventTest, PercentageFromBytes) {
    auto event = progress_event::make("a.bin", 256, 1024, 1);
    EXPECT_EQ(event.file, "a.bin");
    EXPECT_EQ(event.bytes_transferred, 256u);
    EXPECT_EQ(event.total_bytes, 1024u);
    EXPECT_DOUBLE_EQ(event.percentage, 25.0);
    EXPECT_EQ(event.attempt, 1u);
}

TEST_F(ProgressEventTest, ZeroTotalGivesZeroPercent) {
    EXPECT_DOUBLE_EQ(progress_event::make("a", 10, 0, 0).percentage, 0.0);
}

TEST_F(ProgressEventTest, OutcomeSucceededWithoutFailure) {
    upload_outcome outcome;
    EXPECT_TRUE(outcome.succeeded());
    outcome.failure = error{error_code::file_empty, "empty"};
    EXPECT_FALSE(outcome.succeeded());
}

class ProgressThrottleTest : public ::testing::Test {
protected:
    progress_throttle::clock::time_point start_ = progress_throttle::clock::now();
};

TEST_F(ProgressThrottleTest, SuppressesWithinInterval) {
    progress_throttle throttle(1000ms, start_);
    EXPECT_FALSE(throttle.should_report(10, 100, start_ + 10ms));
    EXPECT_FALSE(throttle.should_report(20, 100, start_ + 999ms));
    EXPECT_TRUE(throttle.should_report(30, 100, start_ + 1000ms));
    EXPECT_FALSE(throttle.should_report(40, 100, start_ + 1500ms));
    EXPECT_TRUE(throttle.should_report(50, 100, start_ + 2000ms));
}

TEST_F(ProgressThrottleTest, CompletionAlwaysReported) {
    progress_throttle throttle(1000ms, start_);
    EXPECT_TRUE(throttle.should_report(100, 100, start_ + 1ms));
}

TEST_F(ProgressThrottleTest, ResetRestartsInterval) {
    progress_throttle throttle(1000ms, start_);
    throttle.reset(start_ + 5s);
    EXPECT_FALSE(throttle.should_report(1, 100, start_ + 5500ms));
    EXPECT_TRUE(throttle.should_report(1, 100, start_ + 6s));
}

class CallbackProgressSinkTest : public ::testing::Test {};

TEST_F(CallbackProgressSinkTest, ForwardsToCallables) {
    std::vector<double> percentages;
    int completions = 0;
    callback_progress_sink sink([&](const progress_event& e) { percentages.push_back(e.percentage); },
                                [&](const upload_outcome&) { ++completions; });

    sink.on_progress(progress_event::make("a", 50, 100, 0));
    sink.on_complete(upload_outcome{});

    ASSERT_EQ(percentages.size(), 1u);
    EXPECT_DOUBLE_EQ(percentages[0], 50.0);
    EXPECT_EQ(completions, 1);
}

TEST_F(CallbackProgressSinkTest, EmptyCallbacksAreIgnored) {
    callback_progress_sink sink({});
    sink.on_progress(progress_event::make("a", 1, 2, 0));
    sink.on_complete(upload_outcome{});
    SUCCEED();
}

}  // namespace kcenon::file_stream::test
