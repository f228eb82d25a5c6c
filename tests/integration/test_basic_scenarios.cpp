/**
 * @file test_basic_scenarios.cpp
 * @brief End-to-end upload scenarios over loopback HTTP
 */

#include "test_fixtures.h"

namespace kcenon::file_stream::test {

namespace http = boost::beast::http;

class BasicUploadTest : public IntegrationFixture {};

TEST_F(BasicUploadTest, SmallFileArrivesIntact) {
    auto source = create_test_file("small.bin", 1024);

    auto status = client_->upload_file(source, upload_url());
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_TRUE(files_equal(source, upload_dir_ / "small.bin"));
}

TEST_F(BasicUploadTest, MultiChunkFileArrivesIntact) {
    auto source = create_test_file("large.bin", 5 * 1024 * 1024 + 17);

    auto status = client_->upload_file(source, upload_url());
    ASSERT_TRUE(status.has_value()) << status.error().message;
    EXPECT_TRUE(files_equal(source, upload_dir_ / "large.bin"));

    auto stats = server_->get_statistics();
    EXPECT_EQ(stats.total_files_received, 1u);
    EXPECT_EQ(stats.total_bytes_received, 5u * 1024 * 1024 + 17);
    EXPECT_EQ(stats.active_uploads, 0u);
}

TEST_F(BasicUploadTest, ProgressEndsAtCompletion) {
    auto source = create_test_file("progress.bin", 1024 * 1024);
    std::vector<progress_event> events;
    std::vector<upload_outcome> outcomes;
    callback_progress_sink sink([&](const progress_event& e) { events.push_back(e); },
                                [&](const upload_outcome& o) { outcomes.push_back(o); });

    ASSERT_TRUE(client_->upload_file(source, upload_url(), &sink).has_value());

    ASSERT_FALSE(events.empty());
    EXPECT_DOUBLE_EQ(events.back().percentage, 100.0);
    ASSERT_EQ(outcomes.size(), 1u);
    EXPECT_TRUE(outcomes[0].succeeded());
}

TEST_F(BasicUploadTest, DirectoryUpload) {
    std::vector<std::filesystem::path> sources;
    for (int i = 0; i < 5; ++i) {
        sources.push_back(create_test_file("dir_" + std::to_string(i) + ".bin", 32 * 1024 + i));
    }

    auto status = client_->upload_directory(source_dir_, upload_url());
    ASSERT_TRUE(status.has_value()) << status.error().message;

    for (const auto& source : sources) {
        EXPECT_TRUE(files_equal(source, upload_dir_ / source.filename())) << source;
    }
    EXPECT_EQ(server_->get_statistics().total_files_received, 5u);
}

TEST_F(BasicUploadTest, SameNameOverwrites) {
    auto first = create_test_file("same.bin", 2048);
    ASSERT_TRUE(client_->upload_file(first, upload_url()).has_value());

    auto second = create_test_file("same.bin", 100);
    ASSERT_TRUE(client_->upload_file(second, upload_url()).has_value());

    EXPECT_EQ(std::filesystem::file_size(upload_dir_ / "same.bin"), 100u);
}

TEST_F(BasicUploadTest, RootAnswersLiveness) {
    auto response = send_raw_request(port_, http::verb::get, "/");
    EXPECT_EQ(response.status, 200u);
    EXPECT_EQ(response.body, "HTTP File Upload Server is running");
}

class ServerLifecycleTest : public TempDirectoryFixture {};

TEST_F(ServerLifecycleTest, StartStopTransitions) {
    auto server = upload_server::builder().with_upload_directory(upload_dir_).build();
    ASSERT_TRUE(server.has_value());

    EXPECT_EQ(server.value().state(), server_state::stopped);
    ASSERT_TRUE(server.value().start(endpoint{"127.0.0.1", 0}).has_value());
    EXPECT_TRUE(server.value().is_running());
    EXPECT_NE(server.value().port(), 0);

    auto again = server.value().start(endpoint{"127.0.0.1", 0});
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::already_initialized);

    ASSERT_TRUE(server.value().stop().has_value());
    EXPECT_EQ(server.value().state(), server_state::stopped);
    EXPECT_EQ(server.value().port(), 0);

    auto stopped = server.value().stop();
    ASSERT_FALSE(stopped.has_value());
    EXPECT_EQ(stopped.error().code, error_code::server_not_running);
}

TEST_F(ServerLifecycleTest, RestartAfterStop) {
    auto server = upload_server::builder().with_upload_directory(upload_dir_).build();
    ASSERT_TRUE(server.has_value());

    ASSERT_TRUE(server.value().start(endpoint{"127.0.0.1", 0}).has_value());
    ASSERT_TRUE(server.value().stop().has_value());
    ASSERT_TRUE(server.value().start(endpoint{"127.0.0.1", 0}).has_value());
    EXPECT_TRUE(server.value().is_running());
}

TEST_F(ServerLifecycleTest, InvalidConfigRejected) {
    auto server = upload_server::builder().with_chunk_size(0).build();
    ASSERT_FALSE(server.has_value());
    EXPECT_EQ(server.error().code, error_code::invalid_configuration);
}

}  // namespace kcenon::file_stream::test
