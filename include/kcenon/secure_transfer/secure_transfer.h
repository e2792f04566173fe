/**
 * @file secure_transfer.h
 * @brief Main header for secure_transfer library
 * @version 0.1.0
 *
 * Include this header to access the whole secure transfer pipeline.
 *
 * @code
 * #include <kcenon/secure_transfer/secure_transfer.h>
 *
 * using namespace kcenon::secure_transfer;
 *
 * auto service = secure_transfer_service::builder()
 *     .with_storage_directory("/path/to/storage")
 *     .build();
 * @endcode
 */

#ifndef KCENON_SECURE_TRANSFER_SECURE_TRANSFER_H
#define KCENON_SECURE_TRANSFER_SECURE_TRANSFER_H

#include <cstdint>
#include <string>

// Core
#include <kcenon/secure_transfer/core/types.h>
#include <kcenon/secure_transfer/core/checksum.h>
#include <kcenon/secure_transfer/core/chunk_assembler.h>
#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/core/logging.h>

// Encryption
#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>
#include <kcenon/secure_transfer/encryption/password_hasher.h>

// Storage
#include <kcenon/secure_transfer/storage/artifact_storage.h>
#include <kcenon/secure_transfer/storage/transfer_store.h>

// Service
#include <kcenon/secure_transfer/service/service_types.h>
#include <kcenon/secure_transfer/service/secure_transfer_service.h>

namespace kcenon::secure_transfer {

/**
 * @brief Library version information
 */
struct version {
    static constexpr int major = 0;
    static constexpr int minor = 1;
    static constexpr int patch = 0;

    /**
     * @brief Get version string
     * @return Version string in format "major.minor.patch"
     */
    static std::string to_string() {
        return std::to_string(major) + "." +
               std::to_string(minor) + "." +
               std::to_string(patch);
    }
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_SECURE_TRANSFER_H
