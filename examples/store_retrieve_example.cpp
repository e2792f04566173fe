/**
 * @file store_retrieve_example.cpp
 * @brief Store a file as an encrypted artifact and download it again
 *
 * This example demonstrates:
 * - Building a service with a storage directory
 * - Storing a file with a password, an expiry and a download limit
 * - Keeping the returned key and auth tag, which the service never stores
 * - Retrieving the file and handling the lifecycle errors
 *
 * Usage:
 *   store_retrieve_example <file> [storage_dir]
 */

#include <kcenon/secure_transfer/secure_transfer.h>

#include <filesystem>
#include <iomanip>
#include <iostream>
#include <string>

using namespace kcenon::secure_transfer;

namespace {

void print_progress(const transfer_progress& progress) {
    std::cout << "\r  [" << std::setw(13) << std::left << to_string(progress.stage) << "] "
              << std::fixed << std::setprecision(1) << progress.percentage() << "%"
              << std::flush;
    if (progress.stage == transfer_stage::complete) {
        std::cout << "\n";
    }
}

void print_metadata(const transfer_metadata& meta) {
    std::cout << "  Transfer ID:  " << meta.id << "\n";
    std::cout << "  Filename:     " << meta.filename << "\n";
    std::cout << "  Algorithm:    " << to_string(meta.algorithm) << "\n";
    std::cout << "  Original:     " << format_bytes(meta.original_size) << "\n";
    std::cout << "  Stored:       " << format_bytes(meta.compressed_size) << "\n";
    std::cout << "  Ratio:        " << std::fixed << std::setprecision(2)
              << meta.compression_ratio << "%\n";
    std::cout << "  Password:     " << (meta.has_password ? "yes" : "no") << "\n";
    if (meta.max_downloads) {
        std::cout << "  Downloads:    " << meta.download_count << " / " << *meta.max_downloads
                  << "\n";
    }
}

}  // namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        std::cerr << "Usage: " << argv[0] << " <file> [storage_dir]\n";
        return 1;
    }

    const std::filesystem::path input = argv[1];
    const std::filesystem::path storage =
        argc > 2 ? std::filesystem::path(argv[2])
                 : std::filesystem::temp_directory_path() / "secure_transfer_example";

    auto service_result = secure_transfer_service::builder()
        .with_storage_directory(storage)
        .with_max_file_size(1024ULL * 1024 * 1024)  // 1GB
        .build();

    if (!service_result) {
        std::cerr << "Failed to create service: " << service_result.error().message << "\n";
        return 1;
    }
    auto& service = service_result.value();
    service.on_progress(print_progress);

    // Store
    upload_options options;
    options.password = "example-password";
    options.expires_in_hours = 24.0;
    options.max_downloads = 2;

    std::cout << "Storing " << input << "\n";
    auto receipt = service.store_file(input, options);
    if (!receipt) {
        std::cerr << "Store failed: " << receipt.error().message << "\n";
        return 1;
    }
    print_metadata(receipt.value().metadata);

    // The key and tag are the only way back to the plaintext
    std::cout << "  Key:          " << to_hex(receipt.value().key) << "\n";
    std::cout << "  Auth tag:     " << to_hex(receipt.value().auth_tag) << "\n\n";

    const auto& id = receipt.value().transfer_id;

    // Without the password the download is refused
    auto refused = service.retrieve(id, receipt.value().key, receipt.value().auth_tag);
    if (!refused) {
        std::cout << "Download without password: " << refused.error().message << "\n";
    }

    // With the password the file comes back intact
    std::cout << "Retrieving " << id << "\n";
    auto file = service.retrieve(id, receipt.value().key, receipt.value().auth_tag,
                                 std::string("example-password"));
    if (!file) {
        std::cerr << "Retrieve failed: " << file.error().message << "\n";
        return 1;
    }
    std::cout << "  Got " << format_bytes(file.value().data.size()) << " as "
              << file.value().filename << " (" << file.value().mime_type << ")\n\n";

    // Audit trail
    auto details = service.get_transfer_details(id);
    if (details) {
        std::cout << "Audit log:\n";
        for (const auto& entry : details.value().logs) {
            std::cout << "  " << std::setw(16) << std::left << to_string(entry.action)
                      << entry.details << "\n";
        }
    }

    auto stats = service.get_statistics();
    std::cout << "\nActive transfers: " << stats.total_uploads
              << ", downloads: " << stats.total_downloads
              << ", saved: " << format_bytes(stats.total_saved()) << "\n";

    auto removed = service.remove(id);
    if (!removed) {
        std::cerr << "Remove failed: " << removed.error().message << "\n";
        return 1;
    }
    std::cout << "Transfer removed\n";
    return 0;
}
