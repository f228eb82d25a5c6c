/**
 * @file test_concurrency_limiter.cpp
 * @brief Unit tests for concurrency_limiter
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/core/concurrency_limiter.h>

#include <atomic>
#include <chrono>
#include <future>
#include <thread>
#include <vector>

namespace kcenon::file_stream::test {

class ConcurrencyLimiterTest : public ::testing::Test {};

TEST_F(ConcurrencyLimiterTest, ZeroCapacityIsClampedToOne) {
    concurrency_limiter limiter(0);
    EXPECT_EQ(limiter.capacity(), 1u);
}

TEST_F(ConcurrencyLimiterTest, SlotReleasedOnDestruction) {
    concurrency_limiter limiter(1);
    {
        auto slot = limiter.acquire();
        ASSERT_TRUE(slot.has_value());
        EXPECT_TRUE(slot.value().held());
        EXPECT_EQ(limiter.in_use(), 1u);
        EXPECT_FALSE(limiter.try_acquire().has_value());
    }
    EXPECT_EQ(limiter.in_use(), 0u);
    EXPECT_TRUE(limiter.try_acquire().has_value());
}

TEST_F(ConcurrencyLimiterTest, ExplicitReleaseIsIdempotent) {
    concurrency_limiter limiter(2);
    auto slot = limiter.acquire();
    ASSERT_TRUE(slot.has_value());
    slot.value().release();
    slot.value().release();
    EXPECT_FALSE(slot.value().held());
    EXPECT_EQ(limiter.in_use(), 0u);
}

TEST_F(ConcurrencyLimiterTest, MovedSlotReleasesOnce) {
    concurrency_limiter limiter(1);
    auto slot = limiter.acquire();
    ASSERT_TRUE(slot.has_value());

    concurrency_slot moved = std::move(slot.value());
    EXPECT_TRUE(moved.held());
    EXPECT_FALSE(slot.value().held());
    EXPECT_EQ(limiter.in_use(), 1u);

    moved.release();
    EXPECT_EQ(limiter.in_use(), 0u);
}

TEST_F(ConcurrencyLimiterTest, AcquireWithStopAlreadyRequested) {
    concurrency_limiter limiter(1);
    std::stop_source stop;
    stop.request_stop();

    auto slot = limiter.acquire(stop.get_token());
    ASSERT_FALSE(slot.has_value());
    EXPECT_EQ(slot.error().code, error_code::cancelled);
    EXPECT_EQ(limiter.in_use(), 0u);
}

TEST_F(ConcurrencyLimiterTest, WaitingAcquireIsCancelled) {
    concurrency_limiter limiter(1);
    auto held = limiter.acquire();
    ASSERT_TRUE(held.has_value());

    std::stop_source stop;
    auto waiter = std::async(std::launch::async,
                             [&] { return limiter.acquire(stop.get_token()); });

    EXPECT_EQ(waiter.wait_for(std::chrono::milliseconds{50}), std::future_status::timeout);
    stop.request_stop();

    auto slot = waiter.get();
    ASSERT_FALSE(slot.has_value());
    EXPECT_EQ(slot.error().code, error_code::cancelled);
    EXPECT_EQ(limiter.in_use(), 1u);
}

TEST_F(ConcurrencyLimiterTest, WaiterProceedsAfterRelease) {
    concurrency_limiter limiter(1);
    auto held = limiter.acquire();
    ASSERT_TRUE(held.has_value());

    auto waiter = std::async(std::launch::async, [&] { return limiter.acquire(); });
    std::this_thread::sleep_for(std::chrono::milliseconds{20});
    held.value().release();

    auto slot = waiter.get();
    EXPECT_TRUE(slot.has_value());
}

TEST_F(ConcurrencyLimiterTest, NeverExceedsCapacity) {
    constexpr std::size_t capacity = 3;
    concurrency_limiter limiter(capacity);
    std::atomic<std::size_t> inside{0};
    std::atomic<std::size_t> max_inside{0};

    std::vector<std::thread> workers;
    for (int i = 0; i < 12; ++i) {
        workers.emplace_back([&] {
            auto slot = limiter.acquire();
            ASSERT_TRUE(slot.has_value());
            auto now = ++inside;
            auto seen = max_inside.load();
            while (now > seen && !max_inside.compare_exchange_weak(seen, now)) {
            }
            std::this_thread::sleep_for(std::chrono::milliseconds{5});
            --inside;
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    EXPECT_LE(max_inside.load(), capacity);
    EXPECT_LE(limiter.peak_in_use(), capacity);
    EXPECT_EQ(limiter.in_use(), 0u);
}

}  // namespace kcenon::file_stream::test
