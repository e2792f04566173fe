/**
 * @file bench_store_retrieve.cpp
 * @brief End-to-end throughput of the store and retrieve pipelines
 *
 * Payload kinds route through different compression schemes:
 * text and json use Brotli, binary uses LZ4.
 */

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/secure_transfer.h>

#include "utils/benchmark_helpers.h"

#include <optional>
#include <string>

namespace kcenon::secure_transfer::benchmark {

namespace {

auto kind_arg(int64_t value) -> payload_kind {
    return static_cast<payload_kind>(value);
}

constexpr auto text = static_cast<int64_t>(payload_kind::text);
constexpr auto json = static_cast<int64_t>(payload_kind::json);
constexpr auto binary = static_cast<int64_t>(payload_kind::binary);

}  // namespace

/**
 * @brief Store throughput
 *
 * Args: data size, payload kind, compression level
 */
static void BM_Store(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto kind = kind_arg(state.range(1));
    const auto level = static_cast<int>(state.range(2));

    bench_workspace workspace;
    auto* service = workspace.service();
    if (service == nullptr) {
        state.SkipWithError("Failed to create service");
        return;
    }

    const auto data = make_payload(kind, data_size);
    const auto opts = upload_options_for(kind, level);
    uint64_t stored = 0;

    for (auto _ : state) {
        auto receipt = service->store(data, opts);
        if (!receipt) {
            state.SkipWithError("Store failed");
            return;
        }

        state.PauseTiming();
        stored = receipt.value().metadata.compressed_size;
        if (!service->remove(receipt.value().transfer_id)) {
            state.SkipWithError("Remove failed");
            return;
        }
        state.ResumeTiming();
    }

    report_throughput(state, data_size);
    state.counters["stored_bytes"] = static_cast<double>(stored);
    state.SetLabel(mime_type_for(kind));
}

/**
 * @brief Retrieve throughput including checksum verification
 *
 * Args: data size, payload kind
 */
static void BM_Retrieve(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));
    const auto kind = kind_arg(state.range(1));

    bench_workspace workspace;
    auto* service = workspace.service();
    if (service == nullptr) {
        state.SkipWithError("Failed to create service");
        return;
    }

    auto receipt = service->store(make_payload(kind, data_size), upload_options_for(kind));
    if (!receipt) {
        state.SkipWithError("Failed to prepare transfer");
        return;
    }

    for (auto _ : state) {
        auto file = service->retrieve(receipt.value().transfer_id, receipt.value().key,
                                      receipt.value().auth_tag);
        if (!file) {
            state.SkipWithError("Retrieve failed");
            return;
        }
        ::benchmark::DoNotOptimize(file.value().data);
    }

    report_throughput(state, data_size);
    state.SetLabel(mime_type_for(kind));
}

/**
 * @brief Password gate cost on retrieve
 *
 * Args: data size
 */
static void BM_Retrieve_With_Password(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));

    bench_workspace workspace;
    auto* service = workspace.service();
    if (service == nullptr) {
        state.SkipWithError("Failed to create service");
        return;
    }

    auto opts = upload_options_for(payload_kind::binary);
    opts.password = "bench-password";
    auto receipt = service->store(make_payload(payload_kind::binary, data_size), opts);
    if (!receipt) {
        state.SkipWithError("Failed to prepare transfer");
        return;
    }
    const std::optional<std::string> password = *opts.password;

    for (auto _ : state) {
        auto file = service->retrieve(receipt.value().transfer_id, receipt.value().key,
                                      receipt.value().auth_tag, password);
        if (!file) {
            state.SkipWithError("Retrieve failed");
            return;
        }
        ::benchmark::DoNotOptimize(file.value().data);
    }

    report_throughput(state, data_size);
}

/**
 * @brief Store throughput when streaming from disk
 */
static void BM_Store_File(::benchmark::State& state) {
    const auto data_size = static_cast<std::size_t>(state.range(0));

    bench_workspace workspace;
    auto* service = workspace.service();
    if (service == nullptr) {
        state.SkipWithError("Failed to create service");
        return;
    }
    auto path = workspace.write_source("source.bin",
                                       make_payload(payload_kind::binary, data_size));
    if (!path) {
        state.SkipWithError("Failed to write source file");
        return;
    }

    for (auto _ : state) {
        auto receipt = service->store_file(path.value(), upload_options{});
        if (!receipt) {
            state.SkipWithError("Store failed");
            return;
        }

        state.PauseTiming();
        if (!service->remove(receipt.value().transfer_id)) {
            state.SkipWithError("Remove failed");
            return;
        }
        state.ResumeTiming();
    }

    report_throughput(state, data_size);
}

BENCHMARK(BM_Store)
    ->Args({static_cast<int64_t>(sizes::small_file), text, 6})
    ->Args({static_cast<int64_t>(sizes::medium_file), text, 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), text, 6})
    ->Args({static_cast<int64_t>(sizes::medium_file), json, 6})
    ->Args({static_cast<int64_t>(sizes::medium_file), binary, 1})
    ->Args({static_cast<int64_t>(sizes::medium_file), binary, 6})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Retrieve)
    ->Args({static_cast<int64_t>(sizes::small_file), text})
    ->Args({static_cast<int64_t>(sizes::medium_file), text})
    ->Args({static_cast<int64_t>(sizes::medium_file), json})
    ->Args({static_cast<int64_t>(sizes::medium_file), binary})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Retrieve_With_Password)
    ->Arg(static_cast<int64_t>(sizes::small_file))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Store_File)
    ->Arg(static_cast<int64_t>(sizes::medium_file))
    ->Arg(static_cast<int64_t>(sizes::large_file))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::secure_transfer::benchmark
