/**
 * @file test_multipart_writer.cpp
 * @brief Unit tests for multipart framing
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/core/multipart_writer.h>

#include <string>

namespace kcenon::file_stream::test {

class MultipartWriterTest : public ::testing::Test {};

TEST_F(MultipartWriterTest, FramingWithFixedBoundary) {
    auto writer = multipart_writer::create("file", "report.pdf", "XyZ123");
    ASSERT_TRUE(writer.has_value());

    EXPECT_EQ(writer.value().content_type(), "multipart/form-data; boundary=XyZ123");
    EXPECT_EQ(writer.value().preamble(),
              "--XyZ123\r\n"
              "Content-Disposition: form-data; name=\"file\"; filename=\"report.pdf\"\r\n"
              "Content-Type: application/octet-stream\r\n\r\n");
    EXPECT_EQ(writer.value().trailer(), "\r\n--XyZ123--\r\n");
}

TEST_F(MultipartWriterTest, ContentLengthCoversFraming) {
    auto writer = multipart_writer::create("file", "a.bin", "b");
    ASSERT_TRUE(writer.has_value());

    const auto& w = writer.value();
    EXPECT_EQ(w.content_length(100), w.preamble().size() + 100 + w.trailer().size());
}

TEST_F(MultipartWriterTest, GeneratedBoundariesDiffer) {
    auto first = multipart_writer::generate_boundary();
    auto second = multipart_writer::generate_boundary();
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());

    EXPECT_EQ(first.value().size(), 60u);
    EXPECT_NE(first.value(), second.value());
}

TEST_F(MultipartWriterTest, EscapesQuotesInFilename) {
    auto writer = multipart_writer::create("file", "my \"big\" file.txt", "b");
    ASSERT_TRUE(writer.has_value());
    EXPECT_NE(writer.value().preamble().find("filename=\"my \\\"big\\\" file.txt\""),
              std::string::npos);
}

TEST_F(MultipartWriterTest, RejectsLineBreakInFilename) {
    auto writer = multipart_writer::create("file", "evil\r\nX-Injected: 1", "b");
    ASSERT_FALSE(writer.has_value());
    EXPECT_EQ(writer.error().code, error_code::multipart_encode_error);
}

TEST_F(MultipartWriterTest, RejectsInvalidBoundary) {
    EXPECT_FALSE(multipart_writer::create("file", "a", "bad boundary;").has_value());
    EXPECT_FALSE(multipart_writer::create("file", "a", std::string(71, 'a')).has_value());
}

}  // namespace kcenon::file_stream::test
