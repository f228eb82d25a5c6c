/**
 * @file benchmark_helpers.cpp
 * @brief Implementation of benchmark helper utilities
 */

#include "utils/benchmark_helpers.h"

#include <fstream>
#include <random>

namespace kcenon::file_stream::benchmark {

auto generate_random_data(std::size_t size, uint32_t seed) -> std::string {
    std::string data(size, '\0');

    std::mt19937 gen(seed == 0 ? std::random_device{}() : seed);
    std::uniform_int_distribution<uint16_t> dis(0, 255);

    for (auto& byte : data) {
        byte = static_cast<char>(dis(gen));
    }
    return data;
}

temp_file_manager::temp_file_manager()
    : base_dir_(std::filesystem::temp_directory_path() /
                ("file_stream_benchmarks_" + std::to_string(std::random_device{}()))) {
    std::error_code ec;
    std::filesystem::create_directories(base_dir_, ec);
}

temp_file_manager::~temp_file_manager() {
    std::error_code ec;
    std::filesystem::remove_all(base_dir_, ec);
}

auto temp_file_manager::create_random_file(const std::string& name,
                                           std::size_t size,
                                           uint32_t seed) -> std::filesystem::path {
    auto path = base_dir_ / name;
    auto data = generate_random_data(size, seed);
    std::ofstream file(path, std::ios::binary);
    file.write(data.data(), static_cast<std::streamsize>(data.size()));
    return path;
}

}  // namespace kcenon::file_stream::benchmark
