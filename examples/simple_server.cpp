/**
 * @file simple_server.cpp
 * @brief Basic upload server example
 *
 * This example demonstrates how to:
 * - Configure an upload server with the builder
 * - Observe incoming uploads with a custom observer
 * - Start the server and shut it down on a signal
 */

#include <kcenon/file_stream/file_stream.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>

using namespace kcenon::file_stream;

// Global flag for graceful shutdown
static std::atomic<bool> running{true};

void signal_handler(int signal) {
    if (signal == SIGINT || signal == SIGTERM) {
        running = false;
    }
}

/**
 * @brief Prints upload events to stdout
 */
class console_observer : public upload_observer {
public:
    auto on_upload_started(const inbound_file& file) -> void override {
        std::cout << "[Started] " << file.filename << " from " << file.remote_address
                  << std::endl;
    }

    auto on_upload_progress(const inbound_file& file, const throughput_report& report)
        -> void override {
        std::cout << "\r[Progress] " << file.filename << ": "
                  << static_cast<int>(report.percentage) << "% at "
                  << format_bytes(static_cast<uint64_t>(report.bytes_per_second)) << "/s"
                  << std::flush;
    }

    auto on_upload_completed(const inbound_file& file, const upload_summary& summary)
        -> void override {
        std::cout << "\n[Completed] " << file.filename << ", "
                  << format_bytes(summary.bytes_received) << " in "
                  << format_duration(summary.duration) << std::endl;
    }

    auto on_upload_failed(const inbound_file& file, const upload_summary&, const error& err)
        -> void override {
        std::cout << "\n[Failed] " << file.filename << ": " << err.message << std::endl;
    }
};

int main(int argc, char* argv[]) {
    uint16_t port = 8080;
    std::string upload_dir = "./uploads";

    if (argc >= 2) {
        port = static_cast<uint16_t>(std::stoi(argv[1]));
    }
    if (argc >= 3) {
        upload_dir = argv[2];
    }

    std::cout << "=== Upload Server Example ===" << std::endl;
    std::cout << "Port: " << port << std::endl;
    std::cout << "Upload directory: " << upload_dir << std::endl;

    auto server_result = upload_server::builder()
        .with_upload_directory(upload_dir)
        .with_max_connections(50)
        .with_chunk_size(256 * 1024)
        .with_observer(std::make_shared<console_observer>())
        .build();

    if (!server_result.has_value()) {
        std::cerr << "Failed to create server: " << server_result.error().message << std::endl;
        return 1;
    }
    auto& server = server_result.value();

    auto start_result = server.start(endpoint{port});
    if (!start_result.has_value()) {
        std::cerr << "Failed to start server: " << start_result.error().message << std::endl;
        return 1;
    }

    std::cout << "Listening on port " << server.port() << ", POST files to "
              << upload_route << std::endl;
    std::cout << "Press Ctrl+C to stop..." << std::endl;

    std::signal(SIGINT, signal_handler);
    std::signal(SIGTERM, signal_handler);

    while (running && server.is_running()) {
        std::this_thread::sleep_for(std::chrono::milliseconds(200));
    }

    auto stop_result = server.stop();
    if (!stop_result.has_value()) {
        std::cerr << "Error during shutdown: " << stop_result.error().message << std::endl;
    }

    auto stats = server.get_statistics();
    std::cout << std::endl;
    std::cout << "=== Final Statistics ===" << std::endl;
    std::cout << "Files received: " << stats.total_files_received << std::endl;
    std::cout << "Bytes received: " << format_bytes(stats.total_bytes_received) << std::endl;
    std::cout << "Failed uploads: " << stats.failed_uploads << std::endl;

    return 0;
}
