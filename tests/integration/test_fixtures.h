/**
 * @file test_fixtures.h
 * @brief Test fixtures for integration tests
 */

#ifndef KCENON_FILE_STREAM_TEST_FIXTURES_H
#define KCENON_FILE_STREAM_TEST_FIXTURES_H

#include <gtest/gtest.h>

#include <kcenon/file_stream/file_stream.h>

#include <boost/asio/connect.hpp>
#include <boost/asio/ip/tcp.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <memory>
#include <random>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::file_stream::test {

/**
 * @brief Test fixture for temporary directory management
 */
class TempDirectoryFixture : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir_ = std::filesystem::temp_directory_path() /
                    ("file_stream_it_" + std::to_string(std::random_device{}()));
        std::filesystem::create_directories(test_dir_);
        source_dir_ = test_dir_ / "outgoing";
        std::filesystem::create_directories(source_dir_);
        upload_dir_ = test_dir_ / "uploads";
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(test_dir_, ec);
    }

    auto create_test_file(const std::string& name, std::size_t size)
        -> std::filesystem::path {
        auto path = source_dir_ / name;
        std::ofstream file(path, std::ios::binary);

        std::mt19937 gen(static_cast<unsigned>(size));
        std::uniform_int_distribution<> dis(0, 255);

        for (std::size_t i = 0; i < size; ++i) {
            char byte = static_cast<char>(dis(gen));
            file.write(&byte, 1);
        }

        return path;
    }

    static auto read_file(const std::filesystem::path& path) -> std::string {
        std::ifstream in(path, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    static auto files_equal(const std::filesystem::path& a, const std::filesystem::path& b)
        -> bool {
        return std::filesystem::exists(b) && read_file(a) == read_file(b);
    }

    std::filesystem::path test_dir_;
    std::filesystem::path source_dir_;
    std::filesystem::path upload_dir_;
};

/**
 * @brief Upload server on an ephemeral loopback port
 */
class ServerFixture : public TempDirectoryFixture {
protected:
    void SetUp() override {
        TempDirectoryFixture::SetUp();

        auto server_result = upload_server::builder()
            .with_upload_directory(upload_dir_)
            .with_max_connections(16)
            .build();

        ASSERT_TRUE(server_result.has_value()) << "Failed to create server";
        server_ = std::make_unique<upload_server>(std::move(server_result.value()));

        auto started = server_->start(endpoint{"127.0.0.1", 0});
        ASSERT_TRUE(started.has_value()) << started.error().message;
        port_ = server_->port();
    }

    void TearDown() override {
        if (server_ && server_->is_running()) {
            (void)server_->stop();
        }
        server_.reset();
        TempDirectoryFixture::TearDown();
    }

    [[nodiscard]] auto upload_url() const -> upload_endpoint {
        return upload_endpoint{"127.0.0.1", port_, std::string(upload_route)};
    }

    std::unique_ptr<upload_server> server_;
    uint16_t port_ = 0;
};

/**
 * @brief Server plus a client with a short retry delay
 */
class IntegrationFixture : public ServerFixture {
protected:
    void SetUp() override {
        ServerFixture::SetUp();

        auto client_result = upload_client::builder()
            .with_max_concurrency(4)
            .with_retry_attempts(1)
            .with_retry_delay(std::chrono::milliseconds{10})
            .with_timeout(std::chrono::seconds{30})
            .build();

        ASSERT_TRUE(client_result.has_value()) << "Failed to create client";
        client_ = std::make_unique<upload_client>(std::move(client_result.value()));
    }

    void TearDown() override {
        client_.reset();
        ServerFixture::TearDown();
    }

    std::unique_ptr<upload_client> client_;
};

/**
 * @brief Status and body of a raw request
 */
struct raw_response {
    unsigned status = 0;
    std::string body;
    std::string allow;
};

/**
 * @brief Issue one plain request with Beast, bypassing upload_client
 */
inline auto send_raw_request(uint16_t port,
                             boost::beast::http::verb method,
                             const std::string& target,
                             const std::string& content_type = {},
                             const std::string& body = {}) -> raw_response {
    namespace beast = boost::beast;
    namespace http = beast::http;
    using tcp = boost::asio::ip::tcp;

    boost::asio::io_context ioc;
    tcp::resolver resolver(ioc);
    beast::tcp_stream stream(ioc);
    stream.connect(resolver.resolve("127.0.0.1", std::to_string(port)));

    http::request<http::string_body> req{method, target, 11};
    req.set(http::field::host, "127.0.0.1");
    if (!content_type.empty()) {
        req.set(http::field::content_type, content_type);
    }
    req.body() = body;
    req.prepare_payload();
    http::write(stream, req);

    beast::flat_buffer buffer;
    http::response<http::string_body> res;
    http::read(stream, buffer, res);

    beast::error_code ec;
    stream.socket().shutdown(tcp::socket::shutdown_both, ec);

    return {res.result_int(), res.body(), std::string(res[http::field::allow])};
}

}  // namespace kcenon::file_stream::test

#endif  // KCENON_FILE_STREAM_TEST_FIXTURES_H
