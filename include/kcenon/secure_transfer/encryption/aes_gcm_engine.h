/**
 * @file aes_gcm_engine.h
 * @brief AES-256-GCM authenticated encryption for stored transfers
 *
 * Every transfer is sealed with its own random key and IV. The key and the
 * authentication tag go back to the uploader; only the IV (and an unused
 * salt) are stored with the transfer record.
 */

#ifndef KCENON_SECURE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H
#define KCENON_SECURE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H

#include <kcenon/secure_transfer/encryption/encryption_config.h>

#include <memory>
#include <span>

namespace kcenon::secure_transfer {

/**
 * @brief Streaming AES-256-GCM context
 *
 * Encrypting contexts expose the tag after finalize(). Decrypting contexts
 * return plaintext from process_chunk() before the tag has been verified;
 * callers must hold that output back until finalize() succeeds.
 */
class aes_gcm_stream_context {
public:
    ~aes_gcm_stream_context();

    aes_gcm_stream_context(const aes_gcm_stream_context&) = delete;
    auto operator=(const aes_gcm_stream_context&) -> aes_gcm_stream_context& = delete;
    aes_gcm_stream_context(aes_gcm_stream_context&&) noexcept;
    auto operator=(aes_gcm_stream_context&&) noexcept -> aes_gcm_stream_context&;

    [[nodiscard]] auto process_chunk(std::span<const std::byte> input) -> result<byte_buffer>;

    /**
     * @brief Finish the stream
     *
     * For decryption this verifies the tag and fails with decryption_failure
     * when it does not match.
     */
    [[nodiscard]] auto finalize() -> result<byte_buffer>;

    /**
     * @brief Authentication tag (encrypting contexts, after finalize())
     */
    [[nodiscard]] auto auth_tag() const -> const byte_buffer&;

    [[nodiscard]] auto bytes_processed() const -> uint64_t;

    [[nodiscard]] auto is_encryption() const -> bool;

private:
    friend class aes_gcm_engine;

    struct impl;
    explicit aes_gcm_stream_context(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

/**
 * @brief AES-256-GCM engine
 *
 * @code
 * aes_gcm_engine engine;
 * auto key = aes_gcm_engine::generate_key();
 * auto iv = aes_gcm_engine::generate_iv();
 * auto sealed = engine.encrypt(plaintext, key.value(), iv.value());
 * auto opened = engine.decrypt(sealed.value().ciphertext, key.value(), iv.value(),
 *                              sealed.value().auth_tag);
 * @endcode
 */
class aes_gcm_engine {
public:
    aes_gcm_engine();
    ~aes_gcm_engine();

    aes_gcm_engine(const aes_gcm_engine&) = delete;
    auto operator=(const aes_gcm_engine&) -> aes_gcm_engine& = delete;
    aes_gcm_engine(aes_gcm_engine&&) noexcept;
    auto operator=(aes_gcm_engine&&) noexcept -> aes_gcm_engine&;

    /**
     * @brief CSPRNG bytes
     */
    [[nodiscard]] static auto random_bytes(std::size_t size) -> result<byte_buffer>;

    [[nodiscard]] static auto generate_key() -> result<byte_buffer>;   ///< 32 bytes
    [[nodiscard]] static auto generate_iv() -> result<byte_buffer>;    ///< 16 bytes
    [[nodiscard]] static auto generate_salt() -> result<byte_buffer>;  ///< 32 bytes

    [[nodiscard]] auto encrypt(std::span<const std::byte> plaintext,
                               std::span<const std::byte> key,
                               std::span<const std::byte> iv) -> result<encryption_result>;

    /**
     * @brief Decrypt and authenticate
     *
     * Fails with decryption_failure on a wrong-sized key, IV or tag and on
     * tag mismatch. No plaintext is returned unless the tag verifies.
     */
    [[nodiscard]] auto decrypt(std::span<const std::byte> ciphertext,
                               std::span<const std::byte> key,
                               std::span<const std::byte> iv,
                               std::span<const std::byte> auth_tag) -> result<byte_buffer>;

    [[nodiscard]] auto create_encrypt_stream(std::span<const std::byte> key,
                                             std::span<const std::byte> iv)
        -> result<std::unique_ptr<aes_gcm_stream_context>>;

    [[nodiscard]] auto create_decrypt_stream(std::span<const std::byte> key,
                                             std::span<const std::byte> iv,
                                             std::span<const std::byte> auth_tag)
        -> result<std::unique_ptr<aes_gcm_stream_context>>;

    [[nodiscard]] auto get_statistics() const -> encryption_statistics;

    void reset_statistics();

private:
    struct impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Overwrite a buffer with zeros in a way the optimizer keeps
 */
void secure_zero(byte_buffer& buffer);

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_ENCRYPTION_AES_GCM_ENGINE_H
