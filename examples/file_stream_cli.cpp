/**
 * @file file_stream_cli.cpp
 * @brief Command line front end for the upload server and client
 *
 * Usage:
 *   file_stream_cli server [--port N] [--dir D]
 *   file_stream_cli client (--file F | --dir D) [--url U] [--timeout T]
 *                          [--concurrency K] [--retries R]
 *
 * T accepts plain seconds or a value with an s, m or h suffix.
 */

#include <kcenon/file_stream/file_stream.h>

#include <atomic>
#include <charconv>
#include <chrono>
#include <csignal>
#include <future>
#include <iostream>
#include <map>
#include <optional>
#include <stop_token>
#include <string>
#include <string_view>
#include <thread>

using namespace kcenon::file_stream;

namespace {

std::atomic<bool> interrupted{false};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        interrupted = true;
    }
}

void print_usage(const char* program) {
    std::cerr << "Usage:\n"
              << "  " << program << " server [--port N] [--dir D]\n"
              << "  " << program << " client (--file F | --dir D) [--url U] [--timeout T]\n"
              << "      [--concurrency K] [--retries R]\n";
}

auto parse_flags(int argc, char* argv[], int first)
    -> std::optional<std::map<std::string, std::string>> {
    std::map<std::string, std::string> flags;
    for (int i = first; i < argc; ++i) {
        std::string_view arg = argv[i];
        if (arg.substr(0, 2) != "--" || i + 1 >= argc) {
            std::cerr << "Unexpected argument: " << arg << std::endl;
            return std::nullopt;
        }
        flags[std::string(arg.substr(2))] = argv[++i];
    }
    return flags;
}

template <typename T>
auto parse_number(std::string_view text) -> std::optional<T> {
    T value{};
    auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (ec != std::errc{} || ptr != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

auto parse_timeout(std::string_view text) -> std::optional<std::chrono::milliseconds> {
    if (text.empty()) {
        return std::nullopt;
    }
    int64_t scale = 1;
    switch (text.back()) {
        case 's': scale = 1; text.remove_suffix(1); break;
        case 'm': scale = 60; text.remove_suffix(1); break;
        case 'h': scale = 3600; text.remove_suffix(1); break;
        default: break;
    }
    auto value = parse_number<int64_t>(text);
    if (!value || *value <= 0) {
        return std::nullopt;
    }
    return std::chrono::seconds{*value * scale};
}

auto run_server(const std::map<std::string, std::string>& flags) -> int {
    uint16_t port = 8080;
    std::string dir = "uploads";

    if (auto it = flags.find("port"); it != flags.end()) {
        auto parsed = parse_number<uint16_t>(it->second);
        if (!parsed) {
            std::cerr << "Invalid port: " << it->second << std::endl;
            return 1;
        }
        port = *parsed;
    }
    if (auto it = flags.find("dir"); it != flags.end()) {
        dir = it->second;
    }

    auto server_result = upload_server::builder().with_upload_directory(dir).build();
    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: " << server_result.error().message << std::endl;
        return 1;
    }
    auto& server = server_result.value();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    auto start_result = server.start(endpoint{port});
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: " << start_result.error().message << std::endl;
        return 1;
    }

    while (!interrupted && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    std::cout << "\nShutdown signal received, stopping server..." << std::endl;
    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: " << stop_result.error().message << std::endl;
        return 1;
    }
    return 0;
}

auto run_client(const std::map<std::string, std::string>& flags) -> int {
    auto file_it = flags.find("file");
    auto dir_it = flags.find("dir");
    if ((file_it == flags.end()) == (dir_it == flags.end())) {
        std::cerr << "Client mode needs exactly one of --file or --dir" << std::endl;
        return 1;
    }

    std::string url = "http://localhost:8080/upload";
    if (auto it = flags.find("url"); it != flags.end()) {
        url = it->second;
    }
    auto endpoint = parse_endpoint(url);
    if (!endpoint) {
        std::cerr << endpoint.error().message << std::endl;
        return 1;
    }

    auto builder = upload_client::builder();
    if (auto it = flags.find("timeout"); it != flags.end()) {
        auto timeout = parse_timeout(it->second);
        if (!timeout) {
            std::cerr << "Invalid timeout: " << it->second << std::endl;
            return 1;
        }
        builder.with_timeout(*timeout);
    }
    if (auto it = flags.find("concurrency"); it != flags.end()) {
        auto count = parse_number<std::size_t>(it->second);
        if (!count) {
            std::cerr << "Invalid concurrency: " << it->second << std::endl;
            return 1;
        }
        builder.with_max_concurrency(*count);
    }
    if (auto it = flags.find("retries"); it != flags.end()) {
        auto retries = parse_number<uint32_t>(it->second);
        if (!retries) {
            std::cerr << "Invalid retry count: " << it->second << std::endl;
            return 1;
        }
        builder.with_retry_attempts(*retries);
    }

    auto client_result = builder.build();
    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    std::stop_source stop;
    logging_progress_sink sink;
    auto upload = std::async(std::launch::async, [&]() -> result<void> {
        if (file_it != flags.end()) {
            std::cout << "Uploading " << file_it->second << " to " << endpoint.value().to_url()
                      << std::endl;
            return client.upload_file(file_it->second, endpoint.value(), &sink,
                                      stop.get_token());
        }
        std::cout << "Uploading directory " << dir_it->second << " to "
                  << endpoint.value().to_url() << std::endl;
        return client.upload_directory(dir_it->second, endpoint.value(), &sink,
                                       stop.get_token());
    });

    while (upload.wait_for(std::chrono::milliseconds(100)) != std::future_status::ready) {
        if (interrupted && !stop.stop_requested()) {
            std::cout << "\nInterrupted, cancelling upload..." << std::endl;
            stop.request_stop();
        }
    }

    auto status = upload.get();
    if (!status.has_value()) {
        std::cerr << "Upload failed: " << status.error().message << std::endl;
        return 1;
    }
    std::cout << "Upload complete" << std::endl;
    return 0;
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    auto flags = parse_flags(argc, argv, 2);
    if (!flags) {
        print_usage(argv[0]);
        return 1;
    }

    std::string_view mode = argv[1];
    if (mode == "server") {
        return run_server(*flags);
    }
    if (mode == "client") {
        return run_client(*flags);
    }

    std::cerr << "Unknown mode: " << mode << std::endl;
    print_usage(argv[0]);
    return 1;
}
