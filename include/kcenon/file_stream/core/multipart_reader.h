/**
 * @file multipart_reader.h
 * @brief Incremental multipart/form-data parser
 *
 * Input is fed in arbitrary pieces. Part content is delivered as it
 * arrives, so memory use is bounded by the size of one fed piece plus
 * the part headers (limited by max_header_bytes).
 */

#ifndef KCENON_FILE_STREAM_CORE_MULTIPART_READER_H
#define KCENON_FILE_STREAM_CORE_MULTIPART_READER_H

#include "types.h"

#include <cstddef>
#include <cstdint>
#include <functional>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::file_stream {

/// Upper bound on buffered part headers
inline constexpr std::size_t default_max_header_bytes = 10 * 1024 * 1024;

/**
 * @brief Headers of one multipart part
 */
struct multipart_part_info {
    std::string name;
    std::optional<std::string> filename;
    std::string content_type;
    std::optional<uint64_t> content_length;
};

class multipart_reader {
public:
    /**
     * @brief Part callbacks
     *
     * An error returned by a callback stops parsing and is returned
     * unchanged from feed().
     */
    struct handlers {
        std::function<result<void>(const multipart_part_info&)> on_part_begin;
        std::function<result<void>(std::span<const std::byte>)> on_part_data;
        std::function<result<void>()> on_part_end;
    };

    multipart_reader(std::string boundary,
                     handlers callbacks,
                     std::size_t max_header_bytes = default_max_header_bytes);

    /**
     * @brief Consume the next piece of the body
     * @return Success, multipart_parse_error, or a callback's error
     */
    [[nodiscard]] auto feed(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Signal end of input
     * @return multipart_parse_error unless the closing boundary was seen
     */
    [[nodiscard]] auto finish() -> result<void>;

    [[nodiscard]] auto is_complete() const noexcept -> bool { return state_ == state::done; }

private:
    enum class state { preamble, after_delimiter, headers, body, done };

    [[nodiscard]] auto process() -> result<void>;
    [[nodiscard]] auto begin_part(std::string_view header_block) -> result<void>;
    [[nodiscard]] auto emit(std::size_t count) -> result<void>;

    std::string delimiter_;
    handlers handlers_;
    std::size_t max_header_bytes_;
    std::string pending_;
    state state_ = state::preamble;
    bool failed_ = false;
};

/**
 * @brief Extract the boundary from a multipart/form-data Content-Type
 * @return Boundary, or multipart_parse_error
 */
[[nodiscard]] auto parse_multipart_boundary(std::string_view content_type) -> result<std::string>;

/**
 * @brief Parse the headers of one part
 */
[[nodiscard]] auto parse_part_headers(std::string_view header_block) -> result<multipart_part_info>;

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_MULTIPART_READER_H
