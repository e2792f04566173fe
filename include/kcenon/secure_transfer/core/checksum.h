/**
 * @file checksum.h
 * @brief SHA-256 digests for stored artifact integrity verification
 */

#ifndef KCENON_SECURE_TRANSFER_CORE_CHECKSUM_H
#define KCENON_SECURE_TRANSFER_CORE_CHECKSUM_H

#include <kcenon/secure_transfer/core/types.h>

#include <cstddef>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::secure_transfer {

/**
 * @brief Incremental SHA-256 hasher
 *
 * Used when the ciphertext is produced or read window by window, so the
 * digest is computed without holding the whole artifact in memory.
 *
 * @code
 * sha256_hasher hasher;
 * hasher.update(window_a);
 * hasher.update(window_b);
 * auto hex = hasher.finish();
 * @endcode
 */
class sha256_hasher {
public:
    sha256_hasher();
    ~sha256_hasher();

    sha256_hasher(const sha256_hasher&) = delete;
    auto operator=(const sha256_hasher&) -> sha256_hasher& = delete;
    sha256_hasher(sha256_hasher&&) noexcept;
    auto operator=(sha256_hasher&&) noexcept -> sha256_hasher&;

    /**
     * @brief Feed more bytes into the digest
     */
    [[nodiscard]] auto update(std::span<const std::byte> data) -> result<void>;

    /**
     * @brief Finalize and return the lowercase hex digest
     *
     * The hasher cannot be updated after finish().
     */
    [[nodiscard]] auto finish() -> result<std::string>;

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Checksum utilities for SHA-256 calculations
 *
 * The checksum of a transfer is computed over its ciphertext and is
 * distinct from the AEAD authentication tag: it detects storage corruption
 * before any decryption is attempted.
 */
class checksum {
public:
    /**
     * @brief Calculate SHA-256 hash of data
     * @param data Input data span
     * @return SHA-256 hash as 64 lowercase hex characters
     */
    [[nodiscard]] static auto sha256(std::span<const std::byte> data) -> std::string;

    /**
     * @brief Calculate SHA-256 hash of a file
     * @param path Path to the file
     * @return SHA-256 hash as hex string, or error
     */
    [[nodiscard]] static auto sha256_file(const std::filesystem::path& path)
        -> result<std::string>;

    /**
     * @brief Compare two hex digests in constant time
     */
    [[nodiscard]] static auto digests_equal(const std::string& a, const std::string& b) -> bool;

    /**
     * @brief Verify SHA-256 hash of data
     */
    [[nodiscard]] static auto verify_sha256(
        std::span<const std::byte> data, const std::string& expected) -> bool;

    /**
     * @brief Verify SHA-256 hash of a file
     * @return true if hash matches, false otherwise (including read errors)
     */
    [[nodiscard]] static auto verify_sha256_file(
        const std::filesystem::path& path, const std::string& expected) -> bool;
};

/**
 * @brief Lowercase hex encoding of a byte span
 */
[[nodiscard]] auto to_hex(std::span<const std::byte> data) -> std::string;

/**
 * @brief Decode a hex string
 * @return Bytes, or validation_error on odd length or non-hex characters
 */
[[nodiscard]] auto from_hex(const std::string& hex) -> result<byte_buffer>;

/**
 * @brief URL-safe base64 without padding (RFC 4648 section 5)
 */
[[nodiscard]] auto to_base64url(std::span<const std::byte> data) -> std::string;

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_CORE_CHECKSUM_H
