/**
 * @file bench_compression.cpp
 * @brief Benchmarks for LZ4 and Brotli compression performance
 *
 * Performance Targets:
 * - LZ4 compression: >= 400 MB/s
 * - LZ4 decompression: >= 1.5 GB/s
 */

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/core/compression_engine.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace kcenon::secure_transfer::benchmark {

/**
 * @brief Compression throughput per algorithm and level
 *
 * Args: data size, algorithm (0 = lz4, 1 = brotli), level
 */
static void BM_Compress(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto algorithm = state.range(1) == 0 ? compression_algorithm::lz4
                                               : compression_algorithm::brotli;
    const auto level = static_cast<int>(state.range(2));
    auto data = make_payload(payload_kind::text, data_size, 42);

    compression_engine engine;

    for (auto _ : state) {
        auto result = engine.compress(data, algorithm, level);
        if (!result) {
            state.SkipWithError("Compression failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    report_throughput(state, data_size);
    state.SetLabel(to_string(algorithm));
}

/**
 * @brief Decompression throughput per algorithm
 *
 * Target: >= 1.5 GB/s for LZ4
 */
static void BM_Decompress(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto algorithm = state.range(1) == 0 ? compression_algorithm::lz4
                                               : compression_algorithm::brotli;
    auto original = make_payload(payload_kind::text, data_size, 42);

    compression_engine engine;
    auto packed = engine.compress(original, algorithm, default_compression_level);
    if (!packed) {
        state.SkipWithError("Failed to prepare compressed data");
        return;
    }

    for (auto _ : state) {
        auto result = engine.decompress(packed.value(), algorithm);
        if (!result) {
            state.SkipWithError("Decompression failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    report_throughput(state, data_size);
    state.SetLabel(to_string(algorithm));
}

/**
 * @brief Ratio reached for data of varying compressibility
 *
 * Args: data size, compressibility percent
 */
static void BM_Compression_Ratio(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const double compressibility = static_cast<double>(state.range(1)) / 100.0;
    auto data = make_compressible_payload(
        data_size, compressibility, 42);

    compression_engine engine;
    uint64_t stored = 0;

    for (auto _ : state) {
        auto result = engine.compress(data, compression_algorithm::lz4, default_compression_level);
        if (!result) {
            state.SkipWithError("Compression failed");
            return;
        }
        stored = result.value().size();
        ::benchmark::DoNotOptimize(result.value());
    }

    state.counters["ratio_percent"] = compression_ratio(data_size, stored).ratio_percent;
    report_throughput(state, data_size);
}

/**
 * @brief Streaming compression with varying window sizes
 */
static void BM_Compress_Streaming(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto window = static_cast<std::size_t>(state.range(1));
    auto data = make_payload(payload_kind::text, data_size, 42);

    compression_engine engine(window);

    for (auto _ : state) {
        auto packer = engine.create_compressor(compression_algorithm::lz4, 1);
        if (!packer) {
            state.SkipWithError("Failed to create compressor");
            return;
        }

        std::size_t produced = 0;
        for (std::size_t offset = 0; offset < data_size; offset += window) {
            const auto size = std::min(window, data_size - offset);
            auto out = packer.value()->process(
                std::span<const std::byte>(data.data() + offset, size));
            if (!out) {
                state.SkipWithError("Streaming compression failed");
                return;
            }
            produced += out.value().size();
        }
        auto tail = packer.value()->finish();
        if (!tail) {
            state.SkipWithError("Streaming compression finish failed");
            return;
        }
        produced += tail.value().size();
        ::benchmark::DoNotOptimize(produced);
    }

    report_throughput(state, data_size);
}

// Compression - lz4 and brotli at fast, default and max levels
BENCHMARK(BM_Compress)
    ->Args({static_cast<int64_t>(1 * sizes::MB), 0, 1})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 0, 6})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 0, 9})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 1, 1})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 1, 6})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 1, 9})
    ->Args({static_cast<int64_t>(16 * sizes::MB), 0, 1})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Decompress)
    ->Args({static_cast<int64_t>(1 * sizes::MB), 0})
    ->Args({static_cast<int64_t>(16 * sizes::MB), 0})
    ->Args({static_cast<int64_t>(1 * sizes::MB), 1})
    ->Args({static_cast<int64_t>(16 * sizes::MB), 1})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Compression_Ratio)
    ->Args({static_cast<int64_t>(1 * sizes::MB), 0})    // Random (incompressible)
    ->Args({static_cast<int64_t>(1 * sizes::MB), 50})   // Medium compressibility
    ->Args({static_cast<int64_t>(1 * sizes::MB), 100})  // Highly compressible
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Compress_Streaming)
    ->Args({static_cast<int64_t>(4 * sizes::MB), static_cast<int64_t>(sizes::min_window)})
    ->Args({static_cast<int64_t>(4 * sizes::MB), static_cast<int64_t>(sizes::default_window)})
    ->Args({static_cast<int64_t>(4 * sizes::MB), static_cast<int64_t>(sizes::max_window)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::secure_transfer::benchmark
