/**
 * @file upload_example.cpp
 * @brief Single file upload with progress output and error handling
 *
 * This example demonstrates:
 * - Building a client with custom chunk size, timeout and retries
 * - Observing progress through a callback sink
 * - Telling permanent failures from exhausted retries
 *
 * Usage: upload_example <file> [url]
 */

#include <kcenon/file_stream/file_stream.h>

#include <iomanip>
#include <iostream>
#include <string>

using namespace kcenon::file_stream;

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [url]" << std::endl;
        return 1;
    }

    const std::filesystem::path file = argv[1];
    const std::string url = argc >= 3 ? argv[2] : "http://localhost:8080/upload";

    auto endpoint = parse_endpoint(url);
    if (!endpoint) {
        std::cerr << endpoint.error().message << std::endl;
        return 1;
    }

    auto client_result = upload_client::builder()
        .with_chunk_size(256 * 1024)
        .with_timeout(std::chrono::minutes(10))
        .with_retry_attempts(5)
        .with_retry_delay(std::chrono::seconds(2))
        .with_progress_interval(std::chrono::milliseconds(500))
        .build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    callback_progress_sink sink(
        [](const progress_event& event) {
            std::cout << "\r[attempt " << event.attempt + 1 << "] "
                      << format_bytes(event.bytes_transferred) << " / "
                      << format_bytes(event.total_bytes) << " (" << std::fixed
                      << std::setprecision(1) << event.percentage << "%)" << std::flush;
        },
        [](const upload_outcome& outcome) {
            std::cout << std::endl;
            if (outcome.succeeded()) {
                std::cout << "Uploaded " << outcome.file.filename().string() << " in "
                          << format_duration(outcome.elapsed) << " after "
                          << outcome.attempts << " attempt(s)" << std::endl;
            }
        });

    auto status = client.upload_file(file, endpoint.value(), &sink);
    if (status.has_value()) {
        return 0;
    }

    const auto& err = status.error();
    switch (classify(err)) {
        case error_class::permanent:
            std::cerr << "Upload rejected: " << err.message << std::endl;
            break;
        case error_class::transient:
            std::cerr << "Server unavailable: " << err.message << std::endl;
            break;
        case error_class::cancelled:
            std::cerr << "Upload cancelled" << std::endl;
            break;
    }
    return 1;
}
