/**
 * @file test_endpoint.cpp
 * @brief Unit tests for endpoint parsing and batch result aggregation
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/client/client_types.h>

namespace kcenon::file_stream::test {

class EndpointTest : public ::testing::Test {};

TEST_F(EndpointTest, HostPortAndTarget) {
    auto endpoint = parse_endpoint("http://localhost:8080/upload");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint.value().host, "localhost");
    EXPECT_EQ(endpoint.value().port, 8080);
    EXPECT_EQ(endpoint.value().target, "/upload");
    EXPECT_EQ(endpoint.value().host_header(), "localhost:8080");
    EXPECT_EQ(endpoint.value().to_url(), "http://localhost:8080/upload");
}

TEST_F(EndpointTest, DefaultsPortAndTarget) {
    auto endpoint = parse_endpoint("HTTP://example.com");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint.value().port, 80);
    EXPECT_EQ(endpoint.value().target, "/");
    EXPECT_EQ(endpoint.value().host_header(), "example.com");
}

TEST_F(EndpointTest, QueryKeptFragmentDropped) {
    auto endpoint = parse_endpoint("http://h/upload?dir=a#top");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint.value().target, "/upload?dir=a");

    auto bare_query = parse_endpoint("http://h?x=1");
    ASSERT_TRUE(bare_query.has_value());
    EXPECT_EQ(bare_query.value().target, "/?x=1");
}

TEST_F(EndpointTest, Ipv6Literal) {
    auto endpoint = parse_endpoint("http://[::1]:9000/upload");
    ASSERT_TRUE(endpoint.has_value());
    EXPECT_EQ(endpoint.value().host, "::1");
    EXPECT_EQ(endpoint.value().port, 9000);
}

TEST_F(EndpointTest, RejectsMalformedUrls) {
    for (const char* url : {"localhost:8080/upload", "https://h/upload", "ftp://h/",
                            "http:///upload", "http://h:0/", "http://h:70000/",
                            "http://h:8x/", "http://user@h/", "http://[::1/"}) {
        auto endpoint = parse_endpoint(url);
        ASSERT_FALSE(endpoint.has_value()) << url;
        EXPECT_EQ(endpoint.error().code, error_code::invalid_endpoint) << url;
    }
}

class BatchResultTest : public ::testing::Test {};

TEST_F(BatchResultTest, NoAggregateWhenAllSucceeded) {
    batch_result batch;
    batch.total_files = 2;
    batch.succeeded = 2;
    EXPECT_TRUE(batch.all_succeeded());
    EXPECT_FALSE(batch.aggregate_error().has_value());
}

TEST_F(BatchResultTest, AggregateListsEveryFailure) {
    batch_result batch;
    batch.total_files = 3;
    batch.succeeded = 1;
    batch.failed = 2;
    batch.file_results.push_back({"ok.bin", true, 10, 1, {}, std::nullopt});
    batch.file_results.push_back(
        {"a.bin", false, 0, 1, {}, error{error_code::file_empty, "file is empty: a.bin"}});
    batch.file_results.push_back(
        {"b.bin", false, 0, 3, {}, error{error_code::http_status_error, "status 500"}});

    auto aggregate = batch.aggregate_error();
    ASSERT_TRUE(aggregate.has_value());
    EXPECT_EQ(aggregate->code, error_code::batch_failed);
    EXPECT_NE(aggregate->message.find("2 of 3"), std::string::npos);
    EXPECT_NE(aggregate->message.find("a.bin: file is empty"), std::string::npos);
    EXPECT_NE(aggregate->message.find("b.bin: status 500"), std::string::npos);
    EXPECT_EQ(aggregate->message.find("ok.bin"), std::string::npos);
}

}  // namespace kcenon::file_stream::test
