/**
 * @file multipart_writer.cpp
 * @brief multipart/form-data framing for a single file field
 */

#include "kcenon/file_stream/core/multipart_writer.h"

#include <openssl/rand.h>

#include <array>
#include <cstdio>

namespace kcenon::file_stream {

namespace {

constexpr std::size_t boundary_random_bytes = 30;
constexpr std::size_t max_boundary_length = 70;

auto is_boundary_char(char c) -> bool {
    if ((c >= '0' && c <= '9') || (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z')) {
        return true;
    }
    switch (c) {
        case '\'': case '(': case ')': case '+': case '_': case ',': case '-':
        case '.': case '/': case ':': case '=': case '?':
            return true;
        default:
            return false;
    }
}

auto has_line_break(std::string_view value) -> bool {
    return value.find_first_of("\r\n") != std::string_view::npos;
}

}  // namespace

auto escape_quoted(std::string_view value) -> std::string {
    std::string out;
    out.reserve(value.size());
    for (char c : value) {
        if (c == '\\' || c == '"') {
            out += '\\';
        }
        out += c;
    }
    return out;
}

auto multipart_writer::generate_boundary() -> result<std::string> {
    std::array<unsigned char, boundary_random_bytes> random{};
    if (RAND_bytes(random.data(), static_cast<int>(random.size())) != 1) {
        return unexpected{error{error_code::multipart_encode_error,
                                "failed to generate multipart boundary"}};
    }

    std::string boundary;
    boundary.reserve(random.size() * 2);
    for (auto byte : random) {
        char hex[3];
        std::snprintf(hex, sizeof(hex), "%02x", byte);
        boundary += hex;
    }
    return boundary;
}

auto multipart_writer::create(std::string_view field_name,
                              std::string_view filename,
                              std::string boundary) -> result<multipart_writer> {
    if (boundary.empty()) {
        auto generated = generate_boundary();
        if (!generated) {
            return unexpected{generated.error()};
        }
        boundary = std::move(generated.value());
    }

    if (boundary.size() > max_boundary_length) {
        return unexpected{error{error_code::multipart_encode_error,
                                "multipart boundary longer than 70 characters"}};
    }
    for (char c : boundary) {
        if (!is_boundary_char(c)) {
            return unexpected{error{error_code::multipart_encode_error,
                                    "invalid character in multipart boundary"}};
        }
    }
    if (field_name.empty() || has_line_break(field_name) || has_line_break(filename)) {
        return unexpected{error{error_code::multipart_encode_error,
                                "cannot encode form field name or filename"}};
    }

    multipart_writer writer;
    writer.boundary_ = std::move(boundary);

    writer.preamble_ = "--" + writer.boundary_ + "\r\n";
    writer.preamble_ += "Content-Disposition: form-data; name=\"" + escape_quoted(field_name) +
                        "\"; filename=\"" + escape_quoted(filename) + "\"\r\n";
    writer.preamble_ += "Content-Type: application/octet-stream\r\n\r\n";

    writer.trailer_ = "\r\n--" + writer.boundary_ + "--\r\n";

    return writer;
}

auto multipart_writer::content_type() const -> std::string {
    return "multipart/form-data; boundary=" + boundary_;
}

}  // namespace kcenon::file_stream
