/**
 * @file bench_pipeline.cpp
 * @brief Benchmarks for the client producer/consumer pipeline
 *
 * Streams a file through stream_encoder and byte_channel into an in-memory
 * consumer, which is the client-side cost of an upload without the network.
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_stream/client/stream_encoder.h>
#include <kcenon/file_stream/core/byte_channel.h>
#include <kcenon/file_stream/core/multipart_writer.h>

#include "utils/benchmark_helpers.h"

#include <chrono>
#include <filesystem>
#include <thread>
#include <vector>

namespace kcenon::file_stream::benchmark {

/**
 * @brief Encode a file of state.range(0) bytes with chunk size state.range(1)
 */
static void BM_Pipeline_EncodeFile(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    temp_file_manager temp_files;
    auto file = temp_files.create_random_file("pipeline.bin", file_size, 42);

    auto framing = multipart_writer::create("file", "pipeline.bin");
    if (!framing) {
        state.SkipWithError("Failed to create multipart framing");
        return;
    }

    stream_encoder encoder(chunk_size, std::chrono::seconds{1});
    std::vector<std::byte> buffer(chunk_size);

    for (auto _ : state) {
        byte_channel channel(chunk_size);
        result<void> produced;
        {
            std::jthread producer([&] {
                produced = encoder.encode({file, file_size, 0}, framing.value(), channel,
                                          nullptr, {});
            });

            uint64_t consumed = 0;
            while (true) {
                auto n = channel.read(buffer);
                if (!n || n.value() == 0) {
                    break;
                }
                consumed += n.value();
            }
            ::benchmark::DoNotOptimize(consumed);
        }
        if (!produced) {
            state.SkipWithError("Encoding failed");
            return;
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(file_size) *
                            static_cast<int64_t>(state.iterations()));
    state.counters["throughput_MB_s"] =
        ::benchmark::Counter(static_cast<double>(file_size) / sizes::MB,
                             ::benchmark::Counter::kIsIterationInvariantRate);
}
BENCHMARK(BM_Pipeline_EncodeFile)
    ->Args({sizes::small_file, sizes::default_chunk})
    ->Args({sizes::medium_file, 4 * sizes::KB})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Args({sizes::large_file, sizes::default_chunk})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Raw channel hand-off between two threads
 */
static void BM_Pipeline_ChannelHandoff(::benchmark::State& state) {
    const auto chunk_size = static_cast<std::size_t>(state.range(0));
    constexpr std::size_t total = 16 * sizes::MB;
    const std::vector<std::byte> chunk(chunk_size);
    std::vector<std::byte> buffer(chunk_size);

    for (auto _ : state) {
        byte_channel channel(chunk_size);
        std::jthread producer([&] {
            for (std::size_t sent = 0; sent < total; sent += chunk_size) {
                if (!channel.write(chunk)) {
                    break;
                }
            }
            channel.close();
        });

        while (true) {
            auto n = channel.read(buffer);
            if (!n || n.value() == 0) {
                break;
            }
        }
    }

    state.SetBytesProcessed(static_cast<int64_t>(total) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Pipeline_ChannelHandoff)
    ->Arg(4 * sizes::KB)
    ->Arg(sizes::default_chunk)
    ->Arg(sizes::MB);

}  // namespace kcenon::file_stream::benchmark
