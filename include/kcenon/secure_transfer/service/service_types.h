/**
 * @file service_types.h
 * @brief Configuration and request/response types for secure_transfer_service
 */

#ifndef KCENON_SECURE_TRANSFER_SERVICE_SERVICE_TYPES_H
#define KCENON_SECURE_TRANSFER_SERVICE_SERVICE_TYPES_H

#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/encryption/encryption_config.h>
#include <kcenon/secure_transfer/storage/transfer_record.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::secure_transfer {

/// Longest accepted expiry, 100 years
inline constexpr double max_expiry_hours = 24.0 * 365 * 100;

/**
 * @brief Service configuration
 */
struct service_config {
    std::filesystem::path storage_directory;
    uint64_t max_file_size = 500ULL * 1024 * 1024;        // 500MB
    std::size_t stream_buffer_size = 64 * 1024;           // 64KB
    int default_compression_level = ::kcenon::secure_transfer::default_compression_level;
    uint32_t pbkdf2_iterations = PBKDF2_DEFAULT_ITERATIONS;
    std::chrono::milliseconds stale_upload_age = std::chrono::hours(24);
    std::size_t default_list_limit = 50;

    [[nodiscard]] auto is_valid() const -> bool {
        return !storage_directory.empty() && max_file_size > 0 && stream_buffer_size > 0 &&
               default_compression_level >= min_compression_level &&
               default_compression_level <= max_compression_level &&
               pbkdf2_iterations > 0 && pbkdf2_iterations <= PBKDF2_MAX_ITERATIONS;
    }
};

/**
 * @brief Pipeline stage reported to progress listeners
 */
enum class transfer_stage {
    uploading,
    compressing,
    encrypting,
    complete,
    reading,
    verifying,
    decrypting,
    decompressing
};

[[nodiscard]] constexpr auto to_string(transfer_stage stage) -> const char* {
    switch (stage) {
        case transfer_stage::uploading: return "uploading";
        case transfer_stage::compressing: return "compressing";
        case transfer_stage::encrypting: return "encrypting";
        case transfer_stage::complete: return "complete";
        case transfer_stage::reading: return "reading";
        case transfer_stage::verifying: return "verifying";
        case transfer_stage::decrypting: return "decrypting";
        case transfer_stage::decompressing: return "decompressing";
        default: return "unknown";
    }
}

/**
 * @brief Progress notification for one transfer
 */
struct transfer_progress {
    std::string transfer_id;
    transfer_stage stage = transfer_stage::uploading;
    uint64_t bytes_processed = 0;
    uint64_t total_bytes = 0;

    [[nodiscard]] auto percentage() const -> double {
        if (total_bytes == 0) return 0.0;
        return static_cast<double>(bytes_processed) / static_cast<double>(total_bytes) * 100.0;
    }
};

/**
 * @brief Fire-and-forget progress listener
 *
 * Exceptions thrown by the listener are logged and otherwise ignored.
 */
using progress_callback = std::function<void(const transfer_progress&)>;

/**
 * @brief Cooperative cancellation flag shared between caller and pipeline
 *
 * Copies share the same flag. The pipeline checks it between buffer windows.
 */
class cancellation_token {
public:
    cancellation_token() : flag_(std::make_shared<std::atomic<bool>>(false)) {}

    void cancel() { flag_->store(true); }

    [[nodiscard]] auto is_cancelled() const -> bool { return flag_->load(); }

private:
    std::shared_ptr<std::atomic<bool>> flag_;
};

/**
 * @brief Options for storing a file
 */
struct upload_options {
    std::string filename;
    std::string mime_type;
    std::optional<int> compression_level;     ///< Defaults to service_config
    std::optional<std::string> password;      ///< Gates download when set
    std::optional<double> expires_in_hours;   ///< Must be positive when set
    std::optional<uint64_t> max_downloads;    ///< Must be positive when set
    cancellation_token cancel;
};

/**
 * @brief Public view of a transfer record
 *
 * Never carries the password hash, the IV or the salt.
 */
struct transfer_metadata {
    std::string id;
    std::string filename;
    std::string mime_type;
    uint64_t original_size = 0;
    uint64_t compressed_size = 0;
    double compression_ratio = 0.0;
    compression_algorithm algorithm = compression_algorithm::lz4;
    bool has_password = false;
    uint64_t download_count = 0;
    std::optional<uint64_t> max_downloads;
    std::optional<time_point> expires_at;
    time_point created_at{};
    transfer_status status = transfer_status::active;

    [[nodiscard]] static auto from_record(const transfer_record& record) -> transfer_metadata {
        transfer_metadata meta;
        meta.id = record.id;
        meta.filename = record.original_filename;
        meta.mime_type = record.mime_type;
        meta.original_size = record.original_size;
        meta.compressed_size = record.compressed_size;
        meta.compression_ratio = record.compression_ratio;
        meta.algorithm = record.algorithm;
        meta.has_password = record.has_password();
        meta.download_count = record.download_count;
        meta.max_downloads = record.max_downloads;
        meta.expires_at = record.expires_at;
        meta.created_at = record.created_at;
        meta.status = record.status;
        return meta;
    }
};

/**
 * @brief Result of a successful store
 *
 * The key and tag are returned exactly once and are not kept server-side.
 */
struct store_receipt {
    std::string transfer_id;
    byte_buffer key;
    byte_buffer auth_tag;
    transfer_metadata metadata;
};

/**
 * @brief Result of a successful retrieval
 */
struct retrieved_file {
    byte_buffer data;
    std::string filename;
    std::string mime_type;
};

/**
 * @brief Metadata plus audit trail, newest entry first
 */
struct transfer_details {
    transfer_metadata metadata;
    std::vector<transfer_log_entry> logs;
};

/**
 * @brief Aggregate figures over active transfers
 */
struct transfer_statistics {
    uint64_t total_uploads = 0;
    uint64_t total_downloads = 0;
    uint64_t total_original_size = 0;
    uint64_t total_compressed_size = 0;
    double average_compression_ratio = 0.0;  ///< Mean of per-transfer ratios, two decimals

    [[nodiscard]] auto total_saved() const -> uint64_t {
        if (total_compressed_size >= total_original_size) return 0;
        return total_original_size - total_compressed_size;
    }
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_SERVICE_SERVICE_TYPES_H
