/**
 * @file encryption_config.h
 * @brief Encryption parameter sizes and result types
 */

#ifndef KCENON_SECURE_TRANSFER_ENCRYPTION_ENCRYPTION_CONFIG_H
#define KCENON_SECURE_TRANSFER_ENCRYPTION_ENCRYPTION_CONFIG_H

#include <kcenon/secure_transfer/core/types.h>

#include <cstddef>
#include <cstdint>

namespace kcenon::secure_transfer {

// Standard sizes for cryptographic parameters
inline constexpr std::size_t AES_256_KEY_SIZE = 32;      ///< 256 bits
inline constexpr std::size_t TRANSFER_IV_SIZE = 16;      ///< 128 bits, stored with the record
inline constexpr std::size_t AES_GCM_TAG_SIZE = 16;      ///< 128 bits
inline constexpr std::size_t AES_BLOCK_SIZE = 16;        ///< 128 bits
inline constexpr std::size_t SALT_SIZE = 32;             ///< 256 bits

/// PBKDF2 recommended minimum iterations (OWASP 2023)
inline constexpr uint32_t PBKDF2_DEFAULT_ITERATIONS = 600000;
/// Largest iteration count accepted in configuration and stored hashes
inline constexpr uint32_t PBKDF2_MAX_ITERATIONS = 10'000'000;
inline constexpr std::size_t PASSWORD_SALT_SIZE = 16;
inline constexpr std::size_t PASSWORD_HASH_SIZE = 32;

/**
 * @brief Output of a one-shot encryption
 *
 * The tag is handed to the uploader and never persisted server-side.
 */
struct encryption_result {
    byte_buffer ciphertext;
    byte_buffer auth_tag;
};

/**
 * @brief Running counters for an encryption engine
 */
struct encryption_statistics {
    uint64_t bytes_encrypted = 0;
    uint64_t bytes_decrypted = 0;
    uint64_t encryption_count = 0;
    uint64_t decryption_count = 0;
    uint64_t authentication_failures = 0;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_ENCRYPTION_ENCRYPTION_CONFIG_H
