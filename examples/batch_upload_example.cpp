/**
 * @file batch_upload_example.cpp
 * @brief Concurrent upload of several files with a shared progress sink
 *
 * This example demonstrates:
 * - Limiting the number of uploads in flight
 * - Sharing one thread-safe sink across the batch
 * - Reading the per-file results of upload_files_detailed()
 *
 * Usage: batch_upload_example <url> <file>...
 */

#include <kcenon/file_stream/file_stream.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <vector>

using namespace kcenon::file_stream;

namespace {

/**
 * @brief Sums the bytes of every file in the batch
 */
class batch_progress : public progress_sink {
public:
    auto on_progress(const progress_event& event) -> void override {
        std::lock_guard lock(mutex_);
        auto& sent = per_file_[event.file];
        // a retry starts the file again from zero
        if (event.bytes_transferred >= sent) {
            total_ += event.bytes_transferred - sent;
        }
        sent = event.bytes_transferred;
        std::cout << "\rTransferred " << format_bytes(total_) << std::flush;
    }

    auto on_complete(const upload_outcome& outcome) -> void override {
        std::lock_guard lock(mutex_);
        std::cout << "\n" << (outcome.succeeded() ? "[done] " : "[fail] ")
                  << outcome.file.filename().string() << std::endl;
    }

private:
    std::mutex mutex_;
    std::map<std::filesystem::path, uint64_t> per_file_;
    uint64_t total_ = 0;
};

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 3) {
        std::cerr << "Usage: " << argv[0] << " <url> <file>..." << std::endl;
        return 1;
    }

    auto endpoint = parse_endpoint(argv[1]);
    if (!endpoint) {
        std::cerr << endpoint.error().message << std::endl;
        return 1;
    }

    std::vector<std::filesystem::path> files(argv + 2, argv + argc);

    auto client_result = upload_client::builder()
        .with_chunk_size(256 * 1024)
        .with_max_concurrency(8)
        .with_retry_attempts(5)
        .with_retry_delay(std::chrono::seconds(2))
        .build();

    if (!client_result.has_value()) {
        std::cerr << "Failed to create client: " << client_result.error().message << std::endl;
        return 1;
    }
    auto& client = client_result.value();

    std::cout << "Uploading " << files.size() << " files, up to "
              << client.config().max_concurrency << " at a time" << std::endl;

    batch_progress sink;
    auto batch = client.upload_files_detailed(files, endpoint.value(), &sink);
    if (!batch.has_value()) {
        std::cerr << batch.error().message << std::endl;
        return 1;
    }

    const auto& summary = batch.value();
    std::cout << std::endl << "=== Batch Summary ===" << std::endl;
    for (const auto& file : summary.file_results) {
        std::cout << std::left << std::setw(40) << file.file.filename().string()
                  << (file.success ? "ok" : file.failure->message) << std::endl;
    }
    std::cout << summary.succeeded << "/" << summary.total_files << " files, "
              << format_bytes(summary.total_bytes) << " in "
              << format_duration(summary.elapsed) << std::endl;

    return summary.all_succeeded() ? 0 : 1;
}
