/**
 * @file multipart_writer.h
 * @brief multipart/form-data framing for a single file field
 *
 * The body is preamble() + file bytes + trailer(); only the framing is
 * held in memory.
 */

#ifndef KCENON_FILE_STREAM_CORE_MULTIPART_WRITER_H
#define KCENON_FILE_STREAM_CORE_MULTIPART_WRITER_H

#include "types.h"

#include <cstdint>
#include <string>
#include <string_view>

namespace kcenon::file_stream {

/// Form field carrying the uploaded file
inline constexpr std::string_view upload_field_name = "file";

class multipart_writer {
public:
    /**
     * @brief Build framing for one file part
     *
     * @param field_name Form field name
     * @param filename Filename announced to the receiver
     * @param boundary Boundary to use; a random one is generated when empty
     * @return Writer, or multipart_encode_error for an invalid boundary or
     *         a name containing a line break
     */
    [[nodiscard]] static auto create(std::string_view field_name,
                                     std::string_view filename,
                                     std::string boundary = {}) -> result<multipart_writer>;

    /**
     * @brief 60 hex characters from 30 random bytes
     */
    [[nodiscard]] static auto generate_boundary() -> result<std::string>;

    [[nodiscard]] auto boundary() const -> const std::string& { return boundary_; }

    /**
     * @brief Value for the request Content-Type header
     */
    [[nodiscard]] auto content_type() const -> std::string;

    /**
     * @brief Opening boundary and part headers
     */
    [[nodiscard]] auto preamble() const -> const std::string& { return preamble_; }

    /**
     * @brief Closing boundary
     */
    [[nodiscard]] auto trailer() const -> const std::string& { return trailer_; }

    /**
     * @brief Exact body size for a payload of @p payload_size bytes
     */
    [[nodiscard]] auto content_length(uint64_t payload_size) const noexcept -> uint64_t {
        return preamble_.size() + payload_size + trailer_.size();
    }

private:
    multipart_writer() = default;

    std::string boundary_;
    std::string preamble_;
    std::string trailer_;
};

/**
 * @brief Escape backslashes and double quotes for a quoted header parameter
 */
[[nodiscard]] auto escape_quoted(std::string_view value) -> std::string;

}  // namespace kcenon::file_stream

#endif  // KCENON_FILE_STREAM_CORE_MULTIPART_WRITER_H
