/**
 * @file test_concurrency.cpp
 * @brief Concurrent uploads against one server
 */

#include "test_fixtures.h"

#include <atomic>
#include <future>

namespace kcenon::file_stream::test {

using namespace std::chrono_literals;

class ConcurrencyTest : public IntegrationFixture {};

TEST_F(ConcurrencyTest, BatchOfFilesAllArrive) {
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 12; ++i) {
        sources.push_back(create_test_file("batch_" + std::to_string(i) + ".bin",
                                           256 * 1024 + static_cast<std::size_t>(i)));
    }

    auto batch = client_->upload_files_detailed(sources, upload_url());
    ASSERT_TRUE(batch.has_value());
    EXPECT_TRUE(batch.value().all_succeeded());
    EXPECT_EQ(batch.value().succeeded, sources.size());
    EXPECT_LE(client_->limiter().peak_in_use(), 4u);

    for (const auto& source : sources) {
        EXPECT_TRUE(files_equal(source, upload_dir_ / source.filename())) << source;
    }
}

TEST_F(ConcurrencyTest, IndependentClientsShareServer) {
    constexpr int client_count = 4;
    std::vector<std::future<result<void>>> uploads;
    std::vector<std::filesystem::path> sources;

    for (int i = 0; i < client_count; ++i) {
        sources.push_back(create_test_file("client_" + std::to_string(i) + ".bin", 512 * 1024));
    }

    for (int i = 0; i < client_count; ++i) {
        uploads.push_back(std::async(std::launch::async, [this, &sources, i] {
            auto client = upload_client::builder().with_retry_attempts(0).build();
            if (!client) {
                return result<void>{unexpected{client.error()}};
            }
            return client.value().upload_file(sources[static_cast<std::size_t>(i)], upload_url());
        }));
    }

    for (auto& upload : uploads) {
        auto status = upload.get();
        EXPECT_TRUE(status.has_value()) << status.error().message;
    }
    EXPECT_EQ(server_->get_statistics().total_files_received, static_cast<uint64_t>(client_count));
}

TEST_F(ConcurrencyTest, SharedSinkSeesEveryFile) {
    std::atomic<int> completions{0};
    std::atomic<int> progress_events{0};
    callback_progress_sink sink([&](const progress_event&) { ++progress_events; },
                                [&](const upload_outcome&) { ++completions; });

    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 6; ++i) {
        sources.push_back(create_test_file("sink_" + std::to_string(i) + ".bin", 64 * 1024));
    }

    ASSERT_TRUE(client_->upload_files(sources, upload_url(), &sink).has_value());
    EXPECT_EQ(completions.load(), 6);
    EXPECT_GE(progress_events.load(), 6);
}

TEST_F(ConcurrencyTest, CancelledBatchReturnsPromptly) {
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 8; ++i) {
        sources.push_back(create_test_file("cancel_" + std::to_string(i) + ".bin", 2 * 1024 * 1024));
    }

    std::stop_source stop;
    auto batch = std::async(std::launch::async, [&] {
        return client_->upload_files(sources, upload_url(), nullptr, stop.get_token());
    });
    std::this_thread::sleep_for(20ms);
    stop.request_stop();

    ASSERT_EQ(batch.wait_for(30s), std::future_status::ready);
    auto status = batch.get();
    // a fast machine may finish every file before the stop lands
    if (!status.has_value()) {
        EXPECT_EQ(status.error().code, error_code::cancelled);
    }
    EXPECT_EQ(client_->limiter().in_use(), 0u);
}

}  // namespace kcenon::file_stream::test
