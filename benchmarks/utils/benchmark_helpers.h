/**
 * @file benchmark_helpers.h
 * @brief Payloads and service fixtures shared by the pipeline benchmarks
 */

#ifndef KCENON_SECURE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
#define KCENON_SECURE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H

#include <benchmark/benchmark.h>

#include <kcenon/secure_transfer/secure_transfer.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>

namespace kcenon::secure_transfer::benchmark {

namespace sizes {
constexpr std::size_t KB = 1024;
constexpr std::size_t MB = 1024 * KB;

constexpr std::size_t small_file = 100 * KB;
constexpr std::size_t medium_file = 10 * MB;
constexpr std::size_t large_file = 100 * MB;

// Pipeline window sizes
constexpr std::size_t min_window = 16 * KB;
constexpr std::size_t default_window = 64 * KB;
constexpr std::size_t max_window = 1 * MB;
}  // namespace sizes

/**
 * @brief Shape of an uploaded payload
 *
 * Each kind maps to a MIME type that routes it to a different compression
 * scheme: text and json go to Brotli, binary to LZ4.
 */
enum class payload_kind {
    text,    ///< Prose-like log lines
    json,    ///< One JSON object per line
    binary   ///< Uniformly random bytes
};

[[nodiscard]] auto mime_type_for(payload_kind kind) -> std::string;

/**
 * @brief Deterministic payload of exactly @p size bytes
 */
[[nodiscard]] auto make_payload(payload_kind kind, std::size_t size, uint32_t seed = 42)
    -> byte_buffer;

/**
 * @brief Payload drawing from a reduced byte alphabet
 * @param compressibility 0.0 = all 256 values, 1.0 = a single value
 */
[[nodiscard]] auto make_compressible_payload(std::size_t size, double compressibility,
                                             uint32_t seed = 42) -> byte_buffer;

/**
 * @brief Upload options naming a file of the given kind
 */
[[nodiscard]] auto upload_options_for(payload_kind kind,
                                      int level = default_compression_level)
    -> upload_options;

/**
 * @brief Storage directory and service owned by one benchmark run
 *
 * The directory is removed on destruction, together with every artifact the
 * service left behind.
 */
class bench_workspace {
public:
    bench_workspace();
    ~bench_workspace();

    bench_workspace(const bench_workspace&) = delete;
    auto operator=(const bench_workspace&) -> bench_workspace& = delete;

    /**
     * @brief Service storing into this workspace, or nullptr if it failed to build
     *
     * Logging is silenced and PBKDF2 runs with a low iteration count so
     * password hashing does not dominate pipeline timings.
     */
    [[nodiscard]] auto service() -> secure_transfer_service*;

    /**
     * @brief Write @p data to a source file inside the workspace
     */
    [[nodiscard]] auto write_source(const std::string& name, const byte_buffer& data)
        -> result<std::filesystem::path>;

private:
    std::filesystem::path root_;
    std::unique_ptr<secure_transfer_service> service_;
};

/**
 * @brief Report @p bytes_per_iteration as the benchmark's throughput
 */
void report_throughput(::benchmark::State& state, std::size_t bytes_per_iteration);

}  // namespace kcenon::secure_transfer::benchmark

#endif  // KCENON_SECURE_TRANSFER_BENCHMARKS_BENCHMARK_HELPERS_H
