/**
 * @file bench_key_derivation.cpp
 * @brief Benchmarks for PBKDF2 download password hashing
 */

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/encryption/password_hasher.h>

#include <cstddef>
#include <string>

namespace kcenon::secure_transfer::benchmark {

/**
 * @brief Benchmark hashing a password with varying iteration counts
 */
static void BM_PBKDF2_Hash(::benchmark::State& state) {
    const auto iterations = static_cast<uint32_t>(state.range(0));
    pbkdf2_password_hasher hasher(iterations);

    const std::string password = "secure-benchmark-password-123!@#";

    for (auto _ : state) {
        auto result = hasher.hash(password);
        if (!result.has_value()) {
            state.SkipWithError("Password hashing failed");
            return;
        }
        ::benchmark::DoNotOptimize(result.value());
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark verifying a password against a stored hash
 */
static void BM_PBKDF2_Verify(::benchmark::State& state) {
    const auto iterations = static_cast<uint32_t>(state.range(0));
    pbkdf2_password_hasher hasher(iterations);

    const std::string password = "secure-benchmark-password-123!@#";
    auto encoded = hasher.hash(password);
    if (!encoded.has_value()) {
        state.SkipWithError("Failed to prepare password hash");
        return;
    }

    for (auto _ : state) {
        bool ok = hasher.verify(password, encoded.value());
        if (!ok) {
            state.SkipWithError("Verification failed");
            return;
        }
        ::benchmark::DoNotOptimize(ok);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

/**
 * @brief Benchmark rejecting a wrong password
 */
static void BM_PBKDF2_Reject(::benchmark::State& state) {
    pbkdf2_password_hasher hasher(static_cast<uint32_t>(state.range(0)));

    auto encoded = hasher.hash("the-right-password");
    if (!encoded.has_value()) {
        state.SkipWithError("Failed to prepare password hash");
        return;
    }

    for (auto _ : state) {
        bool ok = hasher.verify("the-wrong-password", encoded.value());
        ::benchmark::DoNotOptimize(ok);
    }

    state.SetItemsProcessed(static_cast<int64_t>(state.iterations()));
}

BENCHMARK(BM_PBKDF2_Hash)
    ->Arg(1000)
    ->Arg(10000)
    ->Arg(100000)
    ->Arg(static_cast<int64_t>(PBKDF2_DEFAULT_ITERATIONS))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_PBKDF2_Verify)
    ->Arg(10000)
    ->Arg(static_cast<int64_t>(PBKDF2_DEFAULT_ITERATIONS))
    ->Unit(::benchmark::kMillisecond);

BENCHMARK(BM_PBKDF2_Reject)
    ->Arg(static_cast<int64_t>(PBKDF2_DEFAULT_ITERATIONS))
    ->Unit(::benchmark::kMillisecond);

}  // namespace kcenon::secure_transfer::benchmark
