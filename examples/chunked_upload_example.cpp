/**
 * @file chunked_upload_example.cpp
 * @brief Upload a file in chunks that arrive out of order
 *
 * This example demonstrates:
 * - Splitting a payload into indexed chunks
 * - Feeding the chunks concurrently and in any order
 * - Storing the reassembled bytes once the last chunk arrives
 * - Purging abandoned uploads
 */

#include <kcenon/secure_transfer/secure_transfer.h>

#include <algorithm>
#include <chrono>
#include <filesystem>
#include <iostream>
#include <mutex>
#include <optional>
#include <random>
#include <span>
#include <string>
#include <thread>
#include <vector>

using namespace kcenon::secure_transfer;

namespace {

constexpr std::size_t chunk_size = 256 * 1024;  // 256KB

auto make_payload(std::size_t size) -> byte_buffer {
    const std::string line = "{\"event\":\"sample\",\"value\":42,\"tags\":[\"a\",\"b\"]}\n";
    byte_buffer data(size);
    for (std::size_t i = 0; i < size; ++i) {
        data[i] = static_cast<std::byte>(line[i % line.size()]);
    }
    return data;
}

}  // namespace

int main() {
    const auto storage = std::filesystem::temp_directory_path() / "secure_transfer_chunked";

    auto service_result = secure_transfer_service::builder()
        .with_storage_directory(storage)
        .with_stale_upload_age(std::chrono::minutes(30))
        .build();
    if (!service_result) {
        std::cerr << "Failed to create service: " << service_result.error().message << "\n";
        return 1;
    }
    auto& service = service_result.value();

    const auto payload = make_payload(4 * 1024 * 1024 + 123);
    const uint64_t total = (payload.size() + chunk_size - 1) / chunk_size;
    const std::string upload_id = "events-upload";

    // Shuffle the arrival order to mimic a parallel client
    std::vector<uint64_t> order(total);
    for (uint64_t i = 0; i < total; ++i) order[i] = i;
    std::shuffle(order.begin(), order.end(), std::mt19937(std::random_device{}()));

    std::cout << "Uploading " << format_bytes(payload.size()) << " in " << total
              << " chunks\n";

    std::mutex mutex;
    std::optional<byte_buffer> assembled;
    std::vector<std::thread> workers;
    constexpr std::size_t worker_count = 4;

    for (std::size_t w = 0; w < worker_count; ++w) {
        workers.emplace_back([&, w] {
            for (std::size_t n = w; n < order.size(); n += worker_count) {
                const uint64_t index = order[n];
                const std::size_t offset = index * chunk_size;
                const std::size_t size = std::min(chunk_size, payload.size() - offset);

                auto progress = service.store_chunk(
                    upload_id, index, total,
                    std::span<const std::byte>(payload.data() + offset, size));
                if (!progress) {
                    std::lock_guard lock(mutex);
                    std::cerr << "Chunk " << index << " rejected: "
                              << progress.error().message << "\n";
                    continue;
                }
                if (progress.value().complete) {
                    std::lock_guard lock(mutex);
                    assembled = std::move(progress.value().assembled);
                }
            }
        });
    }
    for (auto& worker : workers) {
        worker.join();
    }

    if (!assembled) {
        std::cerr << "Upload did not complete\n";
        return 1;
    }

    upload_options options;
    options.filename = "events.json";
    options.mime_type = "application/json";
    options.max_downloads = 1;

    auto receipt = service.store(*assembled, options);
    if (!receipt) {
        std::cerr << "Store failed: " << receipt.error().message << "\n";
        return 1;
    }
    const auto& meta = receipt.value().metadata;
    std::cout << "Stored " << meta.id << " with " << to_string(meta.algorithm) << ", "
              << format_bytes(meta.original_size) << " -> "
              << format_bytes(meta.compressed_size) << "\n";

    auto file = service.retrieve(receipt.value().transfer_id, receipt.value().key,
                                 receipt.value().auth_tag);
    if (!file || file.value().data != payload) {
        std::cerr << "Round trip failed\n";
        return 1;
    }
    std::cout << "Round trip verified\n";

    // The download limit is now reached
    auto again = service.retrieve(receipt.value().transfer_id, receipt.value().key,
                                  receipt.value().auth_tag);
    if (!again) {
        std::cout << "Second download: " << again.error().message << "\n";
    }

    // An upload that never finishes is eventually purged
    auto partial = service.store_chunk("abandoned", 0, 3,
                                       std::span<const std::byte>(payload.data(), chunk_size));
    if (partial) {
        std::cout << "Abandoned upload at " << partial.value().received_chunks << "/"
                  << partial.value().total_chunks << ", purged "
                  << service.purge_stale_uploads(std::chrono::milliseconds(0)) << "\n";
    }

    return 0;
}
