/**
 * @file test_multipart_reader.cpp
 * @brief Unit tests for the incremental multipart parser
 */

#include <gtest/gtest.h>

#include <kcenon/file_stream/core/multipart_reader.h>
#include <kcenon/file_stream/core/multipart_writer.h>

#include <string>
#include <vector>

namespace kcenon::file_stream::test {

namespace {

auto bytes_of(std::string_view text) -> std::span<const std::byte> {
    return {reinterpret_cast<const std::byte*>(text.data()), text.size()};
}

struct captured_part {
    multipart_part_info info;
    std::string content;
    bool ended = false;
};

}  // namespace

class MultipartReaderTest : public ::testing::Test {
protected:
    auto make_reader(std::string boundary, std::size_t max_header_bytes = default_max_header_bytes)
        -> multipart_reader {
        multipart_reader::handlers handlers;
        handlers.on_part_begin = [this](const multipart_part_info& info) -> result<void> {
            parts_.push_back({info, {}, false});
            return {};
        };
        handlers.on_part_data = [this](std::span<const std::byte> data) -> result<void> {
            parts_.back().content.append(reinterpret_cast<const char*>(data.data()), data.size());
            return {};
        };
        handlers.on_part_end = [this]() -> result<void> {
            parts_.back().ended = true;
            return {};
        };
        return multipart_reader(std::move(boundary), std::move(handlers), max_header_bytes);
    }

    // Feeds the body in pieces of `step` bytes.
    static auto feed_in_pieces(multipart_reader& reader, std::string_view body, std::size_t step)
        -> result<void> {
        for (std::size_t offset = 0; offset < body.size(); offset += step) {
            auto status = reader.feed(bytes_of(body.substr(offset, step)));
            if (!status) {
                return status;
            }
        }
        return reader.finish();
    }

    std::vector<captured_part> parts_;
};

TEST_F(MultipartReaderTest, ParsesWriterOutputAcrossPieceSizes) {
    auto writer = multipart_writer::create("file", "notes.txt", "BoUnDaRy");
    ASSERT_TRUE(writer.has_value());

    // content deliberately contains boundary-like text
    const std::string content = "line one\r\n--BoUnDaR\r\nline two --BoUnDaRy\r\n";
    const std::string body = writer.value().preamble() + content + writer.value().trailer();

    for (std::size_t step : {1u, 3u, 7u, 64u, 4096u}) {
        parts_.clear();
        auto reader = make_reader("BoUnDaRy");
        ASSERT_TRUE(feed_in_pieces(reader, body, step).has_value()) << "step " << step;
        EXPECT_TRUE(reader.is_complete());

        ASSERT_EQ(parts_.size(), 1u);
        EXPECT_EQ(parts_[0].info.name, "file");
        ASSERT_TRUE(parts_[0].info.filename.has_value());
        EXPECT_EQ(*parts_[0].info.filename, "notes.txt");
        EXPECT_EQ(parts_[0].info.content_type, "application/octet-stream");
        EXPECT_EQ(parts_[0].content, content);
        EXPECT_TRUE(parts_[0].ended);
    }
}

TEST_F(MultipartReaderTest, MultiplePartsWithPreambleAndEpilogue) {
    const std::string body =
        "ignored preamble\r\n"
        "--xx\r\n"
        "Content-Disposition: form-data; name=\"note\"\r\n\r\n"
        "hello\r\n"
        "--xx\r\n"
        "Content-Disposition: form-data; name=\"file\"; filename=\"a.bin\"\r\n"
        "Content-Length: 3\r\n\r\n"
        "abc\r\n"
        "--xx--\r\n"
        "epilogue";

    auto reader = make_reader("xx");
    ASSERT_TRUE(feed_in_pieces(reader, body, 5).has_value());

    ASSERT_EQ(parts_.size(), 2u);
    EXPECT_EQ(parts_[0].info.name, "note");
    EXPECT_FALSE(parts_[0].info.filename.has_value());
    EXPECT_EQ(parts_[0].content, "hello");
    EXPECT_EQ(parts_[1].info.name, "file");
    EXPECT_EQ(parts_[1].info.content_length.value_or(0), 3u);
    EXPECT_EQ(parts_[1].content, "abc");
}

TEST_F(MultipartReaderTest, TruncatedBodyFailsOnFinish) {
    auto reader = make_reader("xx");
    ASSERT_TRUE(reader.feed(bytes_of("--xx\r\nContent-Disposition: form-data; name=\"file\"\r\n\r\npartial"))
                    .has_value());

    auto status = reader.finish();
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::multipart_parse_error);
}

TEST_F(MultipartReaderTest, GarbageAfterBoundaryIsRejected) {
    auto reader = make_reader("xx");
    auto status = reader.feed(bytes_of("--xxjunk\r\n"));
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::multipart_parse_error);

    // the reader stays failed
    EXPECT_FALSE(reader.feed(bytes_of("more")).has_value());
}

TEST_F(MultipartReaderTest, OversizedHeadersAreRejected) {
    auto reader = make_reader("xx", 32);
    auto status = reader.feed(bytes_of("--xx\r\nX-Long: " + std::string(64, 'a')));
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::multipart_parse_error);
}

TEST_F(MultipartReaderTest, CallbackErrorStopsParsing) {
    multipart_reader::handlers handlers;
    handlers.on_part_begin = [](const multipart_part_info&) -> result<void> {
        return unexpected{error{error_code::invalid_filename, "bad name"}};
    };
    multipart_reader reader("xx", std::move(handlers));

    auto status = reader.feed(bytes_of("--xx\r\nContent-Disposition: form-data; name=\"f\"\r\n\r\n"));
    ASSERT_FALSE(status.has_value());
    EXPECT_EQ(status.error().code, error_code::invalid_filename);
}

// =============================================================================
// Header helpers
// =============================================================================

class MultipartHeaderTest : public ::testing::Test {};

TEST_F(MultipartHeaderTest, BoundaryFromContentType) {
    auto plain = parse_multipart_boundary("multipart/form-data; boundary=abc123");
    ASSERT_TRUE(plain.has_value());
    EXPECT_EQ(plain.value(), "abc123");

    auto quoted = parse_multipart_boundary("Multipart/Form-Data; charset=utf-8; boundary=\"a b\"");
    ASSERT_TRUE(quoted.has_value());
    EXPECT_EQ(quoted.value(), "a b");
}

TEST_F(MultipartHeaderTest, RejectsOtherContentTypes) {
    EXPECT_FALSE(parse_multipart_boundary("application/json").has_value());
    EXPECT_FALSE(parse_multipart_boundary("multipart/form-data").has_value());
    EXPECT_FALSE(parse_multipart_boundary("").has_value());
}

TEST_F(MultipartHeaderTest, PartHeadersAreCaseInsensitive) {
    auto info = parse_part_headers(
        "content-disposition: form-data; NAME=\"file\"; filename=\"x \\\"y\\\".txt\"\r\n"
        "CONTENT-TYPE: text/plain");
    ASSERT_TRUE(info.has_value());
    EXPECT_EQ(info.value().name, "file");
    ASSERT_TRUE(info.value().filename.has_value());
    EXPECT_EQ(*info.value().filename, "x \"y\".txt");
    EXPECT_EQ(info.value().content_type, "text/plain");
}

TEST_F(MultipartHeaderTest, MalformedHeaderLine) {
    auto info = parse_part_headers("no colon here");
    ASSERT_FALSE(info.has_value());
    EXPECT_EQ(info.error().code, error_code::multipart_parse_error);
}

}  // namespace kcenon::file_stream::test
