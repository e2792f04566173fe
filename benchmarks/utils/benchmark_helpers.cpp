/**
 * @file benchmark_helpers.cpp
 * @brief Payloads and service fixtures shared by the pipeline benchmarks
 */

#include "utils/benchmark_helpers.h"

#include <algorithm>
#include <array>
#include <fstream>
#include <random>
#include <string_view>

namespace kcenon::secure_transfer::benchmark {

namespace {

constexpr uint32_t bench_pbkdf2_iterations = 1000;

void append(byte_buffer& out, std::string_view text, std::size_t limit) {
    for (char c : text) {
        if (out.size() >= limit) {
            return;
        }
        out.push_back(static_cast<std::byte>(c));
    }
}

auto make_text(std::size_t size, std::mt19937& gen) -> byte_buffer {
    static constexpr std::array<std::string_view, 12> subjects = {
        "upload", "download", "transfer", "artifact", "chunk", "checksum",
        "cipher", "quota", "expiry", "password", "window", "stream"
    };
    static constexpr std::array<std::string_view, 6> verbs = {
        "accepted", "rejected", "verified", "expired", "compressed", "stored"
    };

    std::uniform_int_distribution<std::size_t> subject(0, subjects.size() - 1);
    std::uniform_int_distribution<std::size_t> verb(0, verbs.size() - 1);
    std::uniform_int_distribution<int> number(0, 99999);

    byte_buffer out;
    out.reserve(size);
    while (out.size() < size) {
        append(out, subjects[subject(gen)], size);
        append(out, " ", size);
        append(out, verbs[verb(gen)], size);
        append(out, " after ", size);
        append(out, std::to_string(number(gen)), size);
        append(out, " bytes\n", size);
    }
    return out;
}

auto make_json(std::size_t size, std::mt19937& gen) -> byte_buffer {
    static constexpr std::array<std::string_view, 4> statuses = {
        "active", "expired", "deleted", "active"
    };
    std::uniform_int_distribution<std::size_t> status(0, statuses.size() - 1);
    std::uniform_int_distribution<uint64_t> count(0, 1u << 20);

    byte_buffer out;
    out.reserve(size);
    for (uint64_t seq = 0; out.size() < size; ++seq) {
        append(out, "{\"seq\":" + std::to_string(seq) + ",\"status\":\"", size);
        append(out, statuses[status(gen)], size);
        append(out, "\",\"original_size\":" + std::to_string(count(gen)) +
                    ",\"downloads\":" + std::to_string(count(gen) % 8) + "}\n", size);
    }
    return out;
}

auto make_random(std::size_t size, std::mt19937& gen) -> byte_buffer {
    byte_buffer out(size);
    std::uniform_int_distribution<int> dis(0, 255);
    for (auto& b : out) {
        b = static_cast<std::byte>(dis(gen));
    }
    return out;
}

}  // namespace

auto mime_type_for(payload_kind kind) -> std::string {
    switch (kind) {
        case payload_kind::text:
            return "text/plain";
        case payload_kind::json:
            return "application/json";
        case payload_kind::binary:
            return "application/octet-stream";
    }
    return "application/octet-stream";
}

auto make_payload(payload_kind kind, std::size_t size, uint32_t seed) -> byte_buffer {
    std::mt19937 gen(seed);
    switch (kind) {
        case payload_kind::text:
            return make_text(size, gen);
        case payload_kind::json:
            return make_json(size, gen);
        case payload_kind::binary:
            return make_random(size, gen);
    }
    return make_random(size, gen);
}

auto make_compressible_payload(std::size_t size, double compressibility, uint32_t seed)
    -> byte_buffer {
    const auto alphabet = std::clamp(
        static_cast<int>(256 * (1.0 - compressibility)), 1, 256);

    std::mt19937 gen(seed);
    std::uniform_int_distribution<int> dis(0, alphabet - 1);
    byte_buffer out(size);
    for (auto& b : out) {
        b = static_cast<std::byte>(dis(gen));
    }
    return out;
}

auto upload_options_for(payload_kind kind, int level) -> upload_options {
    upload_options opts;
    switch (kind) {
        case payload_kind::text:
            opts.filename = "bench.log";
            break;
        case payload_kind::json:
            opts.filename = "bench.json";
            break;
        case payload_kind::binary:
            opts.filename = "bench.bin";
            break;
    }
    opts.mime_type = mime_type_for(kind);
    opts.compression_level = level;
    return opts;
}

bench_workspace::bench_workspace()
    : root_(std::filesystem::temp_directory_path() /
            ("secure_transfer_bench_" + std::to_string(std::random_device{}()))) {
    get_logger().set_sink_enabled(false);

    auto built = secure_transfer_service::builder()
        .with_storage_directory(root_ / "storage")
        .with_max_file_size(1024ULL * sizes::MB)
        .with_pbkdf2_iterations(bench_pbkdf2_iterations)
        .build();
    if (built) {
        service_ = std::make_unique<secure_transfer_service>(std::move(built.value()));
    }
}

bench_workspace::~bench_workspace() {
    service_.reset();
    std::error_code ec;
    std::filesystem::remove_all(root_, ec);
}

auto bench_workspace::service() -> secure_transfer_service* {
    return service_.get();
}

auto bench_workspace::write_source(const std::string& name, const byte_buffer& data)
    -> result<std::filesystem::path> {
    auto path = root_ / name;
    std::ofstream file(path, std::ios::binary);
    file.write(reinterpret_cast<const char*>(data.data()),
               static_cast<std::streamsize>(data.size()));
    if (!file) {
        return make_error(error_code::file_write_error,
                          "Failed to write benchmark source " + path.string());
    }
    return path;
}

void report_throughput(::benchmark::State& state, std::size_t bytes_per_iteration) {
    state.SetBytesProcessed(static_cast<int64_t>(bytes_per_iteration) *
                            static_cast<int64_t>(state.iterations()));
}

}  // namespace kcenon::secure_transfer::benchmark
