/**
 * @file test_throughput_meter.cpp
 * @brief Unit tests for receive throughput reporting
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/server/throughput_meter.h>

namespace kcenon::file_stream::test {

using namespace std::chrono_literals;

class ThroughputMeterTest : public ::testing::Test {
protected:
    throughput_meter::clock::time_point t0_ = throughput_meter::clock::now();
};

TEST_F(ThroughputMeterTest, ReportsAtMostOncePerInterval) {
    throughput_meter meter(1000, 1s, t0_);

    EXPECT_FALSE(meter.record(100, t0_ + 500ms).has_value());

    auto first = meter.record(400, t0_ + 1s);
    ASSERT_TRUE(first.has_value());
    EXPECT_EQ(first->bytes_received, 500u);
    EXPECT_EQ(first->total_bytes, 1000u);
    EXPECT_DOUBLE_EQ(first->percentage, 50.0);
    EXPECT_DOUBLE_EQ(first->bytes_per_second, 500.0);
    EXPECT_EQ(first->elapsed, 1000ms);
    ASSERT_TRUE(first->eta_seconds.has_value());
    EXPECT_DOUBLE_EQ(*first->eta_seconds, 1.0);

    EXPECT_FALSE(meter.record(100, t0_ + 1500ms).has_value());

    auto second = meter.record(400, t0_ + 2s);
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second->percentage, 100.0);
    EXPECT_DOUBLE_EQ(second->bytes_per_second, 500.0);
    ASSERT_TRUE(second->eta_seconds.has_value());
    EXPECT_DOUBLE_EQ(*second->eta_seconds, 0.0);
}

TEST_F(ThroughputMeterTest, UnknownTotalNeverReports) {
    throughput_meter meter(std::nullopt, 1s, t0_);
    EXPECT_FALSE(meter.record(100, t0_ + 5s).has_value());
    EXPECT_EQ(meter.bytes_received(), 100u);

    throughput_meter zero(0, 1s, t0_);
    EXPECT_FALSE(zero.total_bytes().has_value());
    EXPECT_FALSE(zero.record(100, t0_ + 5s).has_value());
}

TEST_F(ThroughputMeterTest, PercentageIsCapped) {
    throughput_meter meter(100, 1s, t0_);
    auto report = meter.record(250, t0_ + 1s);
    ASSERT_TRUE(report.has_value());
    EXPECT_DOUBLE_EQ(report->percentage, 100.0);
}

TEST_F(ThroughputMeterTest, StalledTransferHasNoEta) {
    throughput_meter meter(1000, 1s, t0_);
    ASSERT_TRUE(meter.record(100, t0_ + 1s).has_value());

    auto stalled = meter.record(0, t0_ + 2s);
    ASSERT_TRUE(stalled.has_value());
    EXPECT_DOUBLE_EQ(stalled->bytes_per_second, 0.0);
    EXPECT_FALSE(stalled->eta_seconds.has_value());
}

TEST_F(ThroughputMeterTest, SummaryAveragesWholeUpload) {
    throughput_meter meter(std::nullopt, 1s, t0_);
    (void)meter.record(3000, t0_ + 1s);

    auto summary = meter.summarize(t0_ + 2s);
    EXPECT_EQ(summary.bytes_received, 3000u);
    EXPECT_EQ(summary.duration, 2000ms);
    EXPECT_DOUBLE_EQ(summary.average_bytes_per_second, 1500.0);
}

class FormatTest : public ::testing::Test {};

TEST_F(FormatTest, Bytes) {
    EXPECT_EQ(format_bytes(0), "0 B");
    EXPECT_EQ(format_bytes(512), "512 B");
    EXPECT_EQ(format_bytes(1536), "1.5 KB");
    EXPECT_EQ(format_bytes(1024 * 1024), "1.0 MB");
    EXPECT_EQ(format_bytes(5ull * 1024 * 1024 * 1024), "5.0 GB");
}

TEST_F(FormatTest, Duration) {
    EXPECT_EQ(format_duration(0ms), "0s");
    EXPECT_EQ(format_duration(45s), "45s");
    EXPECT_EQ(format_duration(125s), "2m5s");
    EXPECT_EQ(format_duration(3603s), "1h0m3s");
    EXPECT_EQ(format_duration(1600ms), "2s");
}

}  // namespace kcenon::file_stream::test
