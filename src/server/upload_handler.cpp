/**
 * @file upload_handler.cpp
 * @brief Multipart upload receiving handler
 */

#include "kcenon/file_stream/server/upload_handler.h"

#include "kcenon/file_stream/core/logging.h"
#include "kcenon/file_stream/core/multipart_reader.h"
#include "kcenon/file_stream/server/throughput_meter.h"

#include <filesystem>
#include <fstream>
#include <system_error>
#include <vector>

namespace kcenon::file_stream {

namespace fs = std::filesystem;

namespace {

/**
 * @brief Per-request state shared by the multipart callbacks
 */
struct receive_state {
    inbound_file file;
    std::ofstream out;
    std::optional<throughput_meter> meter;
    bool writing = false;    ///< destination open, field not finished
    bool completed = false;  ///< field fully written and closed
};

auto is_client_error(error_code code) -> bool {
    return code == error_code::multipart_parse_error || code == error_code::missing_form_field ||
           code == error_code::invalid_filename;
}

auto declared_size(const inbound_upload& request, const multipart_part_info& part)
    -> std::optional<uint64_t> {
    if (request.content_length && *request.content_length > 0) {
        return request.content_length;
    }
    if (part.content_length && *part.content_length > 0) {
        return part.content_length;
    }
    return std::nullopt;
}

}  // namespace

auto sanitize_upload_filename(std::string_view declared) -> result<std::string> {
    if (declared.find('\0') != std::string_view::npos) {
        return unexpected{error{error_code::invalid_filename,
                                "Error retrieving file: file name contains NUL"}};
    }

    auto sep = declared.find_last_of("/\\");
    auto name = sep == std::string_view::npos ? declared : declared.substr(sep + 1);
    if (name.empty() || name == "." || name == "..") {
        return unexpected{error{error_code::invalid_filename,
                                "Error retrieving file: invalid file name '" +
                                    std::string(declared) + "'"}};
    }
    return std::string(name);
}

upload_handler::upload_handler(server_config config, std::shared_ptr<upload_observer> observer)
    : config_(std::move(config)), observer_(std::move(observer)) {}

auto upload_handler::handle(const inbound_upload& request, const body_reader& body)
    -> handler_response {
    if (request.method != "POST") {
        return {405, "Method not allowed"};
    }

    auto boundary = parse_multipart_boundary(request.content_type);
    if (!boundary) {
        return {400, "Error parsing form: " + boundary.error().message};
    }

    receive_state st;
    st.file.remote_address = request.remote_address;
    st.file.user_agent = request.user_agent;

    multipart_reader::handlers callbacks;

    callbacks.on_part_begin = [&](const multipart_part_info& part) -> result<void> {
        // Only the first `file` part carrying a file name is stored.
        if (st.completed || part.name != "file" || !part.filename) {
            return {};
        }

        auto name = sanitize_upload_filename(*part.filename);
        if (!name) {
            return unexpected{name.error()};
        }

        std::error_code ec;
        fs::create_directories(config_.upload_directory, ec);
        if (ec) {
            return unexpected{error{error_code::file_write_error,
                                    "Error creating directory: " + ec.message()}};
        }

        st.file.filename = name.value();
        st.file.stored_path = config_.upload_directory / name.value();
        st.file.expected_bytes = declared_size(request, part);

        st.out.open(st.file.stored_path, std::ios::binary | std::ios::trunc);
        if (!st.out) {
            return unexpected{error{error_code::file_write_error,
                                    "Error creating file: " + st.file.stored_path.string()}};
        }

        st.writing = true;
        st.meter.emplace(st.file.expected_bytes, config_.report_interval);
        ++active_uploads_;
        if (observer_) {
            observer_->on_upload_started(st.file);
        }
        return {};
    };

    callbacks.on_part_data = [&](std::span<const std::byte> data) -> result<void> {
        if (!st.writing) {
            return {};
        }
        st.out.write(reinterpret_cast<const char*>(data.data()),
                     static_cast<std::streamsize>(data.size()));
        if (!st.out) {
            return unexpected{error{error_code::file_write_error,
                                    "Error writing file: " + st.file.stored_path.string()}};
        }
        bytes_received_ += data.size();

        if (auto report = st.meter->record(data.size()); report && observer_) {
            observer_->on_upload_progress(st.file, *report);
        }
        return {};
    };

    callbacks.on_part_end = [&]() -> result<void> {
        if (!st.writing) {
            return {};
        }
        st.out.close();
        if (st.out.fail()) {
            return unexpected{error{error_code::file_write_error,
                                    "Error writing file: " + st.file.stored_path.string()}};
        }
        st.writing = false;
        st.completed = true;

        ++files_received_;
        --active_uploads_;
        if (observer_) {
            observer_->on_upload_completed(st.file, st.meter->summarize());
        }
        return {};
    };

    multipart_reader reader(boundary.value(), std::move(callbacks), config_.max_header_bytes);
    std::vector<std::byte> buffer(config_.chunk_size);

    result<void> status;
    while (true) {
        auto n = body(buffer);
        if (!n) {
            status = unexpected{error{n.error().code,
                                      "Error reading request body: " + n.error().message}};
            break;
        }
        if (n.value() == 0) {
            status = reader.finish();
            break;
        }
        status = reader.feed(std::span<const std::byte>(buffer.data(), n.value()));
        if (!status) {
            break;
        }
    }

    if (status && !st.completed) {
        status = unexpected{error{error_code::missing_form_field,
                                  "Error retrieving file: no 'file' field in form"}};
    }

    if (!status) {
        if (st.writing) {
            ++failed_uploads_;
            --active_uploads_;
            if (observer_) {
                observer_->on_upload_failed(st.file, st.meter->summarize(), status.error());
            }
            return {500, status.error().message};
        }

        FS_LOG_WARN(log_category::server,
                    "Rejected upload from " + request.remote_address + ": " +
                        status.error().message);
        if (is_client_error(status.error().code)) {
            auto message = status.error().code == error_code::multipart_parse_error
                               ? "Error parsing form: " + status.error().message
                               : status.error().message;
            return {400, message};
        }
        return {500, status.error().message};
    }

    return {200, "File " + st.file.filename + " uploaded successfully"};
}

auto upload_handler::statistics() const -> server_statistics {
    server_statistics stats;
    stats.total_files_received = files_received_.load();
    stats.total_bytes_received = bytes_received_.load();
    stats.failed_uploads = failed_uploads_.load();
    stats.active_uploads = active_uploads_.load();
    return stats;
}

}  // namespace kcenon::file_stream
