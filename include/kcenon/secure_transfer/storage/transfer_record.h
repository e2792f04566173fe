/**
 * @file transfer_record.h
 * @brief Persisted transfer metadata and audit log entries
 */

#ifndef KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_RECORD_H
#define KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_RECORD_H

#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/core/types.h>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace kcenon::secure_transfer {

using clock_type = std::chrono::system_clock;
using time_point = clock_type::time_point;

/**
 * @brief Transfer lifecycle status
 *
 * active -> expired and active -> deleted are the only transitions;
 * an expired transfer may still be removed (expired -> deleted).
 */
enum class transfer_status {
    active,
    expired,
    deleted
};

[[nodiscard]] constexpr auto to_string(transfer_status status) -> const char* {
    switch (status) {
        case transfer_status::active: return "active";
        case transfer_status::expired: return "expired";
        case transfer_status::deleted: return "deleted";
        default: return "unknown";
    }
}

/**
 * @brief One stored transfer
 */
struct transfer_record {
    std::string id;
    std::string original_filename;
    std::string mime_type;

    uint64_t original_size = 0;
    uint64_t compressed_size = 0;    ///< Ciphertext length on disk
    double compression_ratio = 0.0;  ///< compressed_size / original_size * 100
    compression_algorithm algorithm = compression_algorithm::lz4;

    std::string cipher_iv;    ///< Hex, immutable once set
    std::string cipher_salt;  ///< Hex, stored but not used for key derivation
    std::optional<std::string> password_hash;
    std::string checksum;     ///< SHA-256 hex of the ciphertext

    time_point created_at{};
    std::optional<time_point> expires_at;

    uint64_t download_count = 0;
    std::optional<uint64_t> max_downloads;

    transfer_status status = transfer_status::active;

    /// Store-managed revision, bumped on every successful compare-and-swap
    uint64_t version = 0;

    [[nodiscard]] auto has_password() const -> bool { return password_hash.has_value(); }

    [[nodiscard]] auto is_past_expiry(time_point now) const -> bool {
        return expires_at.has_value() && now > *expires_at;
    }

    [[nodiscard]] auto quota_exhausted() const -> bool {
        return max_downloads.has_value() && download_count >= *max_downloads;
    }
};

/**
 * @brief Audit log action kinds
 */
enum class log_action {
    upload,
    download,
    download_failed,
    deleted
};

[[nodiscard]] constexpr auto to_string(log_action action) -> const char* {
    switch (action) {
        case log_action::upload: return "upload";
        case log_action::download: return "download";
        case log_action::download_failed: return "download_failed";
        case log_action::deleted: return "deleted";
        default: return "unknown";
    }
}

/**
 * @brief Append-only audit entry, weakly owned by a transfer id
 */
struct transfer_log_entry {
    std::string transfer_id;
    log_action action = log_action::upload;
    time_point timestamp{};
    std::string details;  ///< JSON object text, empty when there are no details
    uint64_t sequence = 0;  ///< Assigned by the log store
};

/**
 * @brief Render a time point as ISO-8601 UTC with milliseconds
 */
[[nodiscard]] auto format_timestamp(time_point tp) -> std::string;

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_RECORD_H
