/**
 * @file multipart_reader.cpp
 * @brief Incremental multipart/form-data parser
 */

#include "kcenon/file_stream/core/multipart_reader.h"

#include <algorithm>
#include <cctype>
#include <charconv>
#include <utility>
#include <vector>

namespace kcenon::file_stream {

namespace {

constexpr std::string_view crlf = "\r\n";

auto parse_error(std::string message) -> unexpected {
    return unexpected{error{error_code::multipart_parse_error, std::move(message)}};
}

auto to_lower(std::string_view text) -> std::string {
    std::string out(text);
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

auto trim(std::string_view text) -> std::string_view {
    while (!text.empty() && (text.front() == ' ' || text.front() == '\t')) {
        text.remove_prefix(1);
    }
    while (!text.empty() && (text.back() == ' ' || text.back() == '\t')) {
        text.remove_suffix(1);
    }
    return text;
}

/**
 * @brief A header value of the form `value; key=token; key="quoted"`
 */
struct parameterized_value {
    std::string value;
    std::vector<std::pair<std::string, std::string>> params;

    [[nodiscard]] auto param(std::string_view key) const -> std::optional<std::string> {
        for (const auto& [k, v] : params) {
            if (k == key) {
                return v;
            }
        }
        return std::nullopt;
    }
};

auto parse_parameterized(std::string_view text) -> std::optional<parameterized_value> {
    parameterized_value out;

    auto semi = text.find(';');
    out.value = to_lower(trim(text.substr(0, semi)));
    if (semi == std::string_view::npos) {
        return out;
    }
    text.remove_prefix(semi + 1);

    while (true) {
        text = trim(text);
        while (!text.empty() && text.front() == ';') {
            text = trim(text.substr(1));
        }
        if (text.empty()) {
            break;
        }

        auto eq = text.find_first_of("=;");
        if (eq == std::string_view::npos || text[eq] == ';') {
            // key without value
            out.params.emplace_back(to_lower(trim(text.substr(0, eq))), std::string{});
            if (eq == std::string_view::npos) {
                break;
            }
            text.remove_prefix(eq);
            continue;
        }

        auto key = to_lower(trim(text.substr(0, eq)));
        text = trim(text.substr(eq + 1));

        std::string value;
        if (!text.empty() && text.front() == '"') {
            std::size_t i = 1;
            bool closed = false;
            for (; i < text.size(); ++i) {
                char c = text[i];
                if (c == '\\' && i + 1 < text.size()) {
                    value += text[++i];
                } else if (c == '"') {
                    closed = true;
                    ++i;
                    break;
                } else {
                    value += c;
                }
            }
            if (!closed) {
                return std::nullopt;
            }
            text.remove_prefix(i);
        } else {
            auto end = text.find(';');
            value = std::string(trim(text.substr(0, end)));
            text.remove_prefix(end == std::string_view::npos ? text.size() : end);
        }
        out.params.emplace_back(std::move(key), std::move(value));
    }

    return out;
}

}  // namespace

// ============================================================================
// Free functions
// ============================================================================

auto parse_multipart_boundary(std::string_view content_type) -> result<std::string> {
    auto parsed = parse_parameterized(content_type);
    if (!parsed || parsed->value != "multipart/form-data") {
        return parse_error("request Content-Type isn't multipart/form-data");
    }
    auto boundary = parsed->param("boundary");
    if (!boundary || boundary->empty() || boundary->size() > 70) {
        return parse_error("no multipart boundary param in Content-Type");
    }
    return *boundary;
}

auto parse_part_headers(std::string_view header_block) -> result<multipart_part_info> {
    std::vector<std::pair<std::string, std::string>> headers;

    while (!header_block.empty()) {
        auto eol = header_block.find(crlf);
        auto line = header_block.substr(0, eol);
        header_block.remove_prefix(eol == std::string_view::npos ? header_block.size()
                                                                 : eol + crlf.size());
        if (line.empty()) {
            continue;
        }

        if (line.front() == ' ' || line.front() == '\t') {
            if (headers.empty()) {
                return parse_error("malformed MIME header: continuation without header");
            }
            headers.back().second += ' ';
            headers.back().second += trim(line);
            continue;
        }

        auto colon = line.find(':');
        if (colon == std::string_view::npos || colon == 0) {
            return parse_error("malformed MIME header line: " + std::string(line));
        }
        headers.emplace_back(to_lower(trim(line.substr(0, colon))),
                             std::string(trim(line.substr(colon + 1))));
    }

    multipart_part_info info;
    for (const auto& [name, value] : headers) {
        if (name == "content-disposition") {
            auto parsed = parse_parameterized(value);
            if (!parsed) {
                return parse_error("malformed Content-Disposition header");
            }
            if (auto field = parsed->param("name")) {
                info.name = *field;
            }
            if (auto filename = parsed->param("filename")) {
                info.filename = *filename;
            }
        } else if (name == "content-type") {
            info.content_type = value;
        } else if (name == "content-length") {
            uint64_t length = 0;
            auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), length);
            if (ec == std::errc{} && ptr == value.data() + value.size()) {
                info.content_length = length;
            }
        }
    }
    return info;
}

// ============================================================================
// multipart_reader
// ============================================================================

multipart_reader::multipart_reader(std::string boundary,
                                   handlers callbacks,
                                   std::size_t max_header_bytes)
    : delimiter_("\r\n--" + boundary)
    , handlers_(std::move(callbacks))
    , max_header_bytes_(max_header_bytes)
    , pending_("\r\n") {}  // lets the first boundary match the delimiter form

auto multipart_reader::feed(std::span<const std::byte> data) -> result<void> {
    if (failed_) {
        return parse_error("multipart reader already failed");
    }
    if (state_ == state::done) {
        return {};  // epilogue
    }

    pending_.append(reinterpret_cast<const char*>(data.data()), data.size());

    auto status = process();
    if (!status) {
        failed_ = true;
    }
    return status;
}

auto multipart_reader::finish() -> result<void> {
    if (failed_) {
        return parse_error("multipart reader already failed");
    }
    if (state_ != state::done) {
        failed_ = true;
        return parse_error("multipart: unexpected end of body");
    }
    return {};
}

auto multipart_reader::process() -> result<void> {
    while (true) {
        switch (state_) {
            case state::preamble: {
                auto pos = pending_.find(delimiter_);
                if (pos == std::string::npos) {
                    auto keep = delimiter_.size() - 1;
                    if (pending_.size() > keep) {
                        pending_.erase(0, pending_.size() - keep);
                    }
                    return {};
                }
                pending_.erase(0, pos + delimiter_.size());
                state_ = state::after_delimiter;
                break;
            }

            case state::after_delimiter: {
                if (pending_.size() < 2) {
                    return {};
                }
                if (pending_.compare(0, 2, "--") == 0) {
                    state_ = state::done;
                    pending_.clear();
                    return {};
                }
                auto eol = pending_.find(crlf);
                if (eol == std::string::npos) {
                    if (pending_.find_first_not_of(" \t") != std::string::npos) {
                        return parse_error("multipart: boundary followed by garbage");
                    }
                    return {};
                }
                if (trim(std::string_view(pending_).substr(0, eol)).size() != 0) {
                    return parse_error("multipart: boundary followed by garbage");
                }
                pending_.erase(0, eol + crlf.size());
                state_ = state::headers;
                break;
            }

            case state::headers: {
                std::string_view block;
                std::size_t consumed = 0;
                if (pending_.compare(0, crlf.size(), crlf) == 0) {
                    consumed = crlf.size();
                } else {
                    auto end = pending_.find("\r\n\r\n");
                    if (end == std::string::npos) {
                        if (pending_.size() > max_header_bytes_) {
                            return parse_error("multipart: part headers too large");
                        }
                        return {};
                    }
                    block = std::string_view(pending_).substr(0, end);
                    consumed = end + 4;
                }
                if (block.size() > max_header_bytes_) {
                    return parse_error("multipart: part headers too large");
                }

                auto status = begin_part(block);
                if (!status) {
                    return status;
                }
                pending_.erase(0, consumed);
                state_ = state::body;
                break;
            }

            case state::body: {
                auto pos = pending_.find(delimiter_);
                if (pos == std::string::npos) {
                    auto keep = delimiter_.size() - 1;
                    if (pending_.size() > keep) {
                        return emit(pending_.size() - keep);
                    }
                    return {};
                }

                auto status = emit(pos);
                if (!status) {
                    return status;
                }
                pending_.erase(0, delimiter_.size());
                if (handlers_.on_part_end) {
                    auto ended = handlers_.on_part_end();
                    if (!ended) {
                        return ended;
                    }
                }
                state_ = state::after_delimiter;
                break;
            }

            case state::done:
                pending_.clear();
                return {};
        }
    }
}

auto multipart_reader::begin_part(std::string_view header_block) -> result<void> {
    auto info = parse_part_headers(header_block);
    if (!info) {
        return unexpected{info.error()};
    }
    if (handlers_.on_part_begin) {
        return handlers_.on_part_begin(info.value());
    }
    return {};
}

auto multipart_reader::emit(std::size_t count) -> result<void> {
    if (count == 0) {
        return {};
    }
    if (handlers_.on_part_data) {
        auto status = handlers_.on_part_data(
            std::span<const std::byte>(reinterpret_cast<const std::byte*>(pending_.data()), count));
        if (!status) {
            return status;
        }
    }
    pending_.erase(0, count);
    return {};
}

}  // namespace kcenon::file_stream
