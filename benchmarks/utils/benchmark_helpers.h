/**
 * @file benchmark_helpers.h
 * @brief Helper utilities for benchmarks
 */

#ifndef KCENON_FILE_STREAM_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_FILE_STREAM_BENCHMARKS_BENCHMARK_HELPERS_H

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <string>
#include <vector>

namespace kcenon::file_stream::benchmark {

/**
 * @brief Random payload bytes
 * @param seed Random seed (0 for random)
 */
auto generate_random_data(std::size_t size, uint32_t seed = 0) -> std::string;

/**
 * @brief Scratch directory for benchmark input files, removed on destruction
 */
class temp_file_manager {
public:
    temp_file_manager();
    ~temp_file_manager();

    temp_file_manager(const temp_file_manager&) = delete;
    auto operator=(const temp_file_manager&) -> temp_file_manager& = delete;

    /**
     * @brief Create a file of random content
     * @return Path to created file
     */
    auto create_random_file(const std::string& name, std::size_t size, uint32_t seed = 0)
        -> std::filesystem::path;

    [[nodiscard]] auto base_dir() const -> const std::filesystem::path& { return base_dir_; }

private:
    std::filesystem::path base_dir_;
};

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

constexpr std::size_t default_chunk = 64 * KB;
}  // namespace sizes

}  // namespace kcenon::file_stream::benchmark

#endif  // KCENON_FILE_STREAM_BENCHMARKS_BENCHMARK_HELPERS_H
