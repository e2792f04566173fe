/**
 * @file bench_chunk_operations.cpp
 * @brief Benchmarks for chunked upload assembly and checksum operations
 */

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/core/checksum.h>
#include <kcenon/secure_transfer/core/chunk_assembler.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <numeric>
#include <random>
#include <span>
#include <string>
#include <vector>

namespace kcenon::secure_transfer::benchmark {

namespace {

auto split(const byte_buffer& data, std::size_t chunk_size) -> std::vector<byte_buffer> {
    std::vector<byte_buffer> chunks;
    for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
        const auto size = std::min(chunk_size, data.size() - offset);
        chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                            data.begin() + static_cast<std::ptrdiff_t>(offset + size));
    }
    return chunks;
}

}  // namespace

/**
 * @brief Benchmark for chunk_assembler with in-order arrival
 */
static void BM_ChunkAssembler_InOrder(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto data = make_payload(payload_kind::binary, file_size, 42);
    auto chunks = split(data, chunk_size);
    const auto total = static_cast<uint64_t>(chunks.size());

    chunk_assembler assembler;
    uint64_t round = 0;

    for (auto _ : state) {
        const std::string id = "upload-" + std::to_string(round++);
        for (uint64_t i = 0; i < total; ++i) {
            auto progress = assembler.accept_chunk(id, i, total, chunks[i]);
            if (!progress) {
                state.SkipWithError("Failed to accept chunk");
                return;
            }
            if (progress.value().complete) {
                ::benchmark::DoNotOptimize(progress.value().assembled);
            }
        }
    }

    report_throughput(state, file_size);
    state.SetItemsProcessed(static_cast<int64_t>(total) *
                           static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark for chunk_assembler with shuffled arrival
 */
static void BM_ChunkAssembler_Shuffled(::benchmark::State& state) {
    const auto file_size = static_cast<std::size_t>(state.range(0));
    const auto chunk_size = static_cast<std::size_t>(state.range(1));

    auto data = make_payload(payload_kind::binary, file_size, 42);
    auto chunks = split(data, chunk_size);
    const auto total = static_cast<uint64_t>(chunks.size());

    std::vector<uint64_t> order(total);
    std::iota(order.begin(), order.end(), uint64_t{0});
    std::shuffle(order.begin(), order.end(), std::mt19937(7));

    chunk_assembler assembler;
    uint64_t round = 0;

    for (auto _ : state) {
        const std::string id = "upload-" + std::to_string(round++);
        for (auto index : order) {
            auto progress = assembler.accept_chunk(id, index, total, chunks[index]);
            if (!progress) {
                state.SkipWithError("Failed to accept chunk");
                return;
            }
            ::benchmark::DoNotOptimize(progress.value());
        }
    }

    report_throughput(state, file_size);
}

/**
 * @brief Benchmark for SHA-256 over a buffer
 */
static void BM_SHA256_Buffer(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto data = make_payload(payload_kind::binary, data_size, 42);

    for (auto _ : state) {
        auto digest = checksum::sha256(data);
        ::benchmark::DoNotOptimize(digest);
    }

    report_throughput(state, data_size);
}

/**
 * @brief Benchmark for incremental SHA-256 as used by the store pipeline
 */
static void BM_SHA256_Incremental(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto window = static_cast<std::size_t>(state.range(1));
    auto data = make_payload(payload_kind::binary, data_size, 42);

    for (auto _ : state) {
        sha256_hasher hasher;
        for (std::size_t offset = 0; offset < data_size; offset += window) {
            const auto size = std::min(window, data_size - offset);
            auto updated = hasher.update(std::span<const std::byte>(data.data() + offset, size));
            if (!updated) {
                state.SkipWithError("Hash update failed");
                return;
            }
        }
        auto digest = hasher.finish();
        if (!digest) {
            state.SkipWithError("Hash finish failed");
            return;
        }
        ::benchmark::DoNotOptimize(digest.value());
    }

    report_throughput(state, data_size);
}

BENCHMARK(BM_ChunkAssembler_InOrder)
    ->Args({static_cast<int64_t>(1 * sizes::MB), static_cast<int64_t>(64 * sizes::KB)})
    ->Args({static_cast<int64_t>(10 * sizes::MB), static_cast<int64_t>(256 * sizes::KB)})
    ->Args({static_cast<int64_t>(10 * sizes::MB), static_cast<int64_t>(1 * sizes::MB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_ChunkAssembler_Shuffled)
    ->Args({static_cast<int64_t>(10 * sizes::MB), static_cast<int64_t>(64 * sizes::KB)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_SHA256_Buffer)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(16 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_SHA256_Incremental)
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(sizes::default_window)})
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::secure_transfer::benchmark
