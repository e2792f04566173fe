/**
 * @file bench_encryption_throughput.cpp
 * @brief Benchmarks for AES-256-GCM encryption/decryption throughput
 *
 * Performance Targets:
 * - Encryption throughput: >= 1 GB/s
 * - Decryption throughput: >= 1 GB/s
 */

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <cstddef>
#include <span>
#include <vector>

namespace kcenon::secure_transfer::benchmark {

namespace {

struct key_material {
    byte_buffer key;
    byte_buffer iv;
};

auto get_key_material() -> const key_material& {
    static const key_material material = [] {
        key_material m;
        // Deterministic key and IV for benchmarking
        m.key.resize(AES_256_KEY_SIZE);
        m.iv.resize(TRANSFER_IV_SIZE);
        for (std::size_t i = 0; i < m.key.size(); ++i) {
            m.key[i] = static_cast<std::byte>(i & 0xFF);
        }
        for (std::size_t i = 0; i < m.iv.size(); ++i) {
            m.iv[i] = static_cast<std::byte>((i * 7) & 0xFF);
        }
        return m;
    }();
    return material;
}

}  // namespace

/**
 * @brief Benchmark one-shot AES-256-GCM encryption
 * Target: >= 1 GB/s
 */
static void BM_AES_GCM_Encryption(::benchmark::State& state) {
    const auto& material = get_key_material();
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto plaintext = make_payload(payload_kind::binary, data_size, 42);

    aes_gcm_engine engine;

    for (auto _ : state) {
        auto result = engine.encrypt(plaintext, material.key, material.iv);
        if (!result.has_value()) {
            state.SkipWithError("Encryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    report_throughput(state, data_size);
}

/**
 * @brief Benchmark one-shot AES-256-GCM decryption with tag verification
 */
static void BM_AES_GCM_Decryption(::benchmark::State& state) {
    const auto& material = get_key_material();
    const auto data_size = static_cast<std::size_t>(state.range(0));
    auto plaintext = make_payload(payload_kind::binary, data_size, 42);

    aes_gcm_engine engine;
    auto sealed = engine.encrypt(plaintext, material.key, material.iv);
    if (!sealed.has_value()) {
        state.SkipWithError("Failed to prepare encrypted data");
        return;
    }

    for (auto _ : state) {
        auto result = engine.decrypt(sealed.value().ciphertext, material.key, material.iv,
                                     sealed.value().auth_tag);
        if (!result.has_value()) {
            state.SkipWithError("Decryption failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    report_throughput(state, data_size);
}

/**
 * @brief Benchmark streaming encryption with varying window sizes
 */
static void BM_AES_GCM_Stream_Encrypt(::benchmark::State& state) {
    const auto& material = get_key_material();
    const auto total_size = static_cast<std::size_t>(state.range(0));
    const auto window = static_cast<std::size_t>(state.range(1));
    auto data = make_payload(payload_kind::binary, total_size, 42);

    aes_gcm_engine engine;

    for (auto _ : state) {
        auto stream = engine.create_encrypt_stream(material.key, material.iv);
        if (!stream) {
            state.SkipWithError("Failed to create encrypt stream");
            return;
        }

        std::size_t produced = 0;
        for (std::size_t offset = 0; offset < total_size; offset += window) {
            const std::size_t size = std::min(window, total_size - offset);
            auto chunk = std::span<const std::byte>(data.data() + offset, size);

            auto result = stream.value()->process_chunk(chunk);
            if (!result.has_value()) {
                state.SkipWithError("Stream chunk processing failed");
                return;
            }
            produced += result.value().size();
        }

        auto final_result = stream.value()->finalize();
        if (!final_result.has_value()) {
            state.SkipWithError("Stream finalization failed");
            return;
        }
        produced += final_result.value().size();
        ::benchmark::DoNotOptimize(produced);
        ::benchmark::DoNotOptimize(stream.value()->auth_tag());
    }

    report_throughput(state, total_size);
}

/**
 * @brief Benchmark streaming decryption, tag checked at finalize
 */
static void BM_AES_GCM_Stream_Decrypt(::benchmark::State& state) {
    const auto& material = get_key_material();
    const auto total_size = static_cast<std::size_t>(state.range(0));
    const auto window = static_cast<std::size_t>(state.range(1));
    auto data = make_payload(payload_kind::binary, total_size, 42);

    aes_gcm_engine engine;
    auto sealed = engine.encrypt(data, material.key, material.iv);
    if (!sealed.has_value()) {
        state.SkipWithError("Failed to prepare encrypted data");
        return;
    }
    const auto& ciphertext = sealed.value().ciphertext;

    for (auto _ : state) {
        auto stream = engine.create_decrypt_stream(material.key, material.iv,
                                                   sealed.value().auth_tag);
        if (!stream) {
            state.SkipWithError("Failed to create decrypt stream");
            return;
        }

        std::size_t produced = 0;
        for (std::size_t offset = 0; offset < ciphertext.size(); offset += window) {
            const std::size_t size = std::min(window, ciphertext.size() - offset);
            auto result = stream.value()->process_chunk(
                std::span<const std::byte>(ciphertext.data() + offset, size));
            if (!result.has_value()) {
                state.SkipWithError("Stream chunk processing failed");
                return;
            }
            produced += result.value().size();
        }

        auto final_result = stream.value()->finalize();
        if (!final_result.has_value()) {
            state.SkipWithError("Authentication failed");
            return;
        }
        ::benchmark::DoNotOptimize(produced);
    }

    report_throughput(state, total_size);
}

/**
 * @brief Benchmark key and IV generation from the CSPRNG
 */
static void BM_Key_Generation(::benchmark::State& state) {
    for (auto _ : state) {
        auto key = aes_gcm_engine::generate_key();
        auto iv = aes_gcm_engine::generate_iv();
        if (!key || !iv) {
            state.SkipWithError("Random generation failed");
            return;
        }
        ::benchmark::DoNotOptimize(key.value());
        ::benchmark::DoNotOptimize(iv.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_AES_GCM_Encryption)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(16 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_AES_GCM_Decryption)
    ->Arg(static_cast<int64_t>(64 * sizes::KB))
    ->Arg(static_cast<int64_t>(1 * sizes::MB))
    ->Arg(static_cast<int64_t>(16 * sizes::MB))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_AES_GCM_Stream_Encrypt)
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(sizes::min_window)})
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(sizes::default_window)})
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(sizes::max_window)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_AES_GCM_Stream_Decrypt)
    ->Args({static_cast<int64_t>(16 * sizes::MB), static_cast<int64_t>(sizes::default_window)})
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_Key_Generation)
    ->Unit(::benchmark::kMicrosecond);

}  // namespace kcenon::secure_transfer::benchmark
