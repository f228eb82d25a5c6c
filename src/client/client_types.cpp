/**
 * @file client_types.cpp
 * @brief Endpoint parsing and batch result aggregation
 */

#include "kcenon/file_stream/client/client_types.h"

#include <algorithm>
#include <cctype>
#include <charconv>

namespace kcenon::file_stream {

namespace {

auto endpoint_error(std::string_view url, std::string_view reason) -> unexpected {
    return unexpected{error{error_code::invalid_endpoint,
                            "invalid endpoint \"" + std::string(url) + "\": " +
                                std::string(reason)}};
}

}  // namespace

auto parse_endpoint(std::string_view url) -> result<upload_endpoint> {
    auto scheme_end = url.find("://");
    if (scheme_end == std::string_view::npos) {
        return endpoint_error(url, "missing scheme");
    }

    std::string scheme(url.substr(0, scheme_end));
    std::transform(scheme.begin(), scheme.end(), scheme.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (scheme != "http") {
        return endpoint_error(url, "only http is supported");
    }

    auto rest = url.substr(scheme_end + 3);
    auto path_start = rest.find_first_of("/?");
    auto authority = rest.substr(0, path_start);

    upload_endpoint endpoint;
    if (path_start != std::string_view::npos) {
        endpoint.target = std::string(rest.substr(path_start));
        if (endpoint.target.front() == '?') {
            endpoint.target.insert(endpoint.target.begin(), '/');
        }
    }
    auto fragment = endpoint.target.find('#');
    if (fragment != std::string::npos) {
        endpoint.target.erase(fragment);
    }

    if (authority.find('@') != std::string_view::npos) {
        return endpoint_error(url, "user information is not supported");
    }

    std::string_view host = authority;
    std::string_view port;
    if (!authority.empty() && authority.front() == '[') {
        auto close = authority.find(']');
        if (close == std::string_view::npos) {
            return endpoint_error(url, "unterminated IPv6 address");
        }
        host = authority.substr(1, close - 1);
        auto after = authority.substr(close + 1);
        if (!after.empty()) {
            if (after.front() != ':') {
                return endpoint_error(url, "unexpected characters after host");
            }
            port = after.substr(1);
        }
    } else {
        auto colon = authority.rfind(':');
        if (colon != std::string_view::npos) {
            host = authority.substr(0, colon);
            port = authority.substr(colon + 1);
        }
    }

    if (host.empty()) {
        return endpoint_error(url, "missing host");
    }
    endpoint.host = std::string(host);

    if (!port.empty()) {
        unsigned value = 0;
        auto [ptr, ec] = std::from_chars(port.data(), port.data() + port.size(), value);
        if (ec != std::errc{} || ptr != port.data() + port.size() || value == 0 ||
            value > 65535) {
            return endpoint_error(url, "invalid port");
        }
        endpoint.port = static_cast<uint16_t>(value);
    }

    return endpoint;
}

auto batch_result::aggregate_error() const -> std::optional<error> {
    if (failed == 0) {
        return std::nullopt;
    }

    std::string message = "upload failed for " + std::to_string(failed) + " of " +
                          std::to_string(total_files) + " files:";
    for (const auto& file_result : file_results) {
        if (file_result.success) {
            continue;
        }
        message += "\n  " + file_result.file.string() + ": ";
        message += file_result.failure ? file_result.failure->message : "unknown error";
    }
    return error{error_code::batch_failed, std::move(message)};
}

}  // namespace kcenon::file_stream
