/**
 * @file bench_multipart.cpp
 * @brief Benchmarks for the incremental multipart parser
 *
 * Measures how fast the receiving side can split a body into part content
 * for the buffer sizes a server connection reads with.
 */

#include <benchmark/benchmark.h>

#include <kcenon/file_stream/core/multipart_reader.h>
#include <kcenon/file_stream/core/multipart_writer.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <span>

namespace kcenon::file_stream::benchmark {

/**
 * @brief Parse a whole body fed in pieces of state.range(1) bytes
 */
static void BM_Multipart_Parse(::benchmark::State& state) {
    const auto payload_size = static_cast<std::size_t>(state.range(0));
    const auto piece_size = static_cast<std::size_t>(state.range(1));

    auto writer = multipart_writer::create("file", "bench.bin");
    if (!writer) {
        state.SkipWithError("Failed to create multipart framing");
        return;
    }
    const auto body = writer.value().preamble() + generate_random_data(payload_size, 42) +
                      writer.value().trailer();

    for (auto _ : state) {
        uint64_t received = 0;
        multipart_reader::handlers handlers;
        handlers.on_part_data = [&received](std::span<const std::byte> data) -> result<void> {
            received += data.size();
            return {};
        };
        multipart_reader reader(writer.value().boundary(), std::move(handlers));

        for (std::size_t offset = 0; offset < body.size(); offset += piece_size) {
            auto n = std::min(piece_size, body.size() - offset);
            auto status = reader.feed(
                std::span<const std::byte>(reinterpret_cast<const std::byte*>(body.data()) + offset, n));
            if (!status) {
                state.SkipWithError("Parse failed");
                return;
            }
        }
        if (!reader.finish() || received != payload_size) {
            state.SkipWithError("Incomplete parse");
            return;
        }
        ::benchmark::DoNotOptimize(received);
    }

    state.SetBytesProcessed(static_cast<int64_t>(body.size()) *
                            static_cast<int64_t>(state.iterations()));
}
BENCHMARK(BM_Multipart_Parse)
    ->Args({sizes::MB, 4 * sizes::KB})
    ->Args({sizes::MB, sizes::default_chunk})
    ->Args({sizes::medium_file, sizes::default_chunk})
    ->Unit(::benchmark::kMillisecond);

/**
 * @brief Parse part headers of a typical file part
 */
static void BM_Multipart_PartHeaders(::benchmark::State& state) {
    const std::string block =
        "Content-Disposition: form-data; name=\"file\"; filename=\"quarterly report.pdf\"\r\n"
        "Content-Type: application/octet-stream";

    for (auto _ : state) {
        auto info = parse_part_headers(block);
        ::benchmark::DoNotOptimize(info);
    }
}
BENCHMARK(BM_Multipart_PartHeaders);

/**
 * @brief Boundary generation cost per request
 */
static void BM_Multipart_GenerateBoundary(::benchmark::State& state) {
    for (auto _ : state) {
        auto boundary = multipart_writer::generate_boundary();
        ::benchmark::DoNotOptimize(boundary);
    }
}
BENCHMARK(BM_Multipart_GenerateBoundary);

}  // namespace kcenon::file_stream::benchmark
