/**
 * @file aes_gcm_engine.cpp
 * @brief AES-256-GCM encryption engine implementation
 */

#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <openssl/crypto.h>
#include <openssl/err.h>
#include <openssl/evp.h>
#include <openssl/rand.h>

#include <array>
#include <atomic>
#include <string>

namespace kcenon::secure_transfer {

namespace {

/**
 * @brief Get OpenSSL error message
 */
auto get_openssl_error() -> std::string {
    unsigned long err = ERR_get_error();
    if (err == 0) {
        return "Unknown OpenSSL error";
    }
    std::array<char, 256> buffer{};
    ERR_error_string_n(err, buffer.data(), buffer.size());
    return std::string(buffer.data());
}

/**
 * @brief RAII wrapper for EVP_CIPHER_CTX
 */
class evp_cipher_ctx_wrapper {
public:
    evp_cipher_ctx_wrapper() : ctx_(EVP_CIPHER_CTX_new()) {}

    ~evp_cipher_ctx_wrapper() {
        if (ctx_) {
            EVP_CIPHER_CTX_free(ctx_);
        }
    }

    evp_cipher_ctx_wrapper(const evp_cipher_ctx_wrapper&) = delete;
    auto operator=(const evp_cipher_ctx_wrapper&) -> evp_cipher_ctx_wrapper& = delete;

    [[nodiscard]] auto get() const -> EVP_CIPHER_CTX* { return ctx_; }
    [[nodiscard]] explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_CIPHER_CTX* ctx_;
};

auto as_uchar(const std::byte* p) -> const unsigned char* {
    return reinterpret_cast<const unsigned char*>(p);
}

auto as_uchar(std::byte* p) -> unsigned char* {
    return reinterpret_cast<unsigned char*>(p);
}

auto check_sizes(std::span<const std::byte> key, std::span<const std::byte> iv,
                 error_code on_error) -> result<void> {
    if (key.size() != AES_256_KEY_SIZE) {
        return make_error(on_error,
            "Invalid key size: expected " + std::to_string(AES_256_KEY_SIZE) +
            " bytes, got " + std::to_string(key.size()));
    }
    if (iv.size() != TRANSFER_IV_SIZE) {
        return make_error(on_error,
            "Invalid IV size: expected " + std::to_string(TRANSFER_IV_SIZE) +
            " bytes, got " + std::to_string(iv.size()));
    }
    return {};
}

struct stats_block {
    std::atomic<uint64_t> bytes_encrypted{0};
    std::atomic<uint64_t> bytes_decrypted{0};
    std::atomic<uint64_t> encryption_count{0};
    std::atomic<uint64_t> decryption_count{0};
    std::atomic<uint64_t> authentication_failures{0};
};

}  // namespace

void secure_zero(byte_buffer& buffer) {
    if (!buffer.empty()) {
        OPENSSL_cleanse(buffer.data(), buffer.size());
    }
}

// ============================================================================
// aes_gcm_stream_context::impl
// ============================================================================

struct aes_gcm_stream_context::impl {
    evp_cipher_ctx_wrapper ctx;
    byte_buffer key;
    byte_buffer tag;
    std::shared_ptr<stats_block> stats;
    uint64_t bytes_processed = 0;
    bool is_encrypting = true;
    bool finalized = false;

    ~impl() {
        secure_zero(key);
    }

    auto initialize(std::span<const std::byte> iv) -> result<void> {
        // Setup failures on the decrypt side surface as decryption_failure
        const auto failure = is_encrypting ? error_code::encryption_failed
                                           : error_code::decryption_failure;
        if (!ctx) {
            return make_error(failure, "Failed to create cipher context");
        }

        const EVP_CIPHER* cipher = EVP_aes_256_gcm();
        auto init = is_encrypting ? EVP_EncryptInit_ex : EVP_DecryptInit_ex;

        if (init(ctx.get(), cipher, nullptr, nullptr, nullptr) != 1) {
            return make_error(failure, get_openssl_error());
        }

        if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                                static_cast<int>(iv.size()), nullptr) != 1) {
            return make_error(failure, "Failed to set IV length");
        }

        if (init(ctx.get(), nullptr, nullptr, as_uchar(key.data()), as_uchar(iv.data())) != 1) {
            return make_error(failure, get_openssl_error());
        }

        if (!is_encrypting) {
            if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                                    static_cast<int>(tag.size()), tag.data()) != 1) {
                return make_error(failure, "Failed to set auth tag");
            }
        }

        return {};
    }
};

// ============================================================================
// aes_gcm_stream_context
// ============================================================================

aes_gcm_stream_context::aes_gcm_stream_context(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

aes_gcm_stream_context::~aes_gcm_stream_context() = default;

aes_gcm_stream_context::aes_gcm_stream_context(aes_gcm_stream_context&&) noexcept = default;
auto aes_gcm_stream_context::operator=(aes_gcm_stream_context&&) noexcept
    -> aes_gcm_stream_context& = default;

auto aes_gcm_stream_context::process_chunk(std::span<const std::byte> input)
    -> result<byte_buffer> {
    if (!impl_ || impl_->finalized) {
        return make_error(error_code::internal_error, "Stream context invalid or finalized");
    }
    if (input.empty()) {
        return byte_buffer{};
    }

    byte_buffer output(input.size() + AES_BLOCK_SIZE);
    int out_len = 0;

    if (impl_->is_encrypting) {
        if (EVP_EncryptUpdate(impl_->ctx.get(), as_uchar(output.data()), &out_len,
                              as_uchar(input.data()), static_cast<int>(input.size())) != 1) {
            return make_error(error_code::encryption_failed, get_openssl_error());
        }
    } else {
        if (EVP_DecryptUpdate(impl_->ctx.get(), as_uchar(output.data()), &out_len,
                              as_uchar(input.data()), static_cast<int>(input.size())) != 1) {
            return make_error(error_code::decryption_failure, get_openssl_error());
        }
    }

    output.resize(static_cast<std::size_t>(out_len));
    impl_->bytes_processed += input.size();
    return output;
}

auto aes_gcm_stream_context::finalize() -> result<byte_buffer> {
    if (!impl_ || impl_->finalized) {
        return make_error(error_code::internal_error,
                          "Stream context invalid or already finalized");
    }

    byte_buffer output(AES_BLOCK_SIZE);
    int out_len = 0;
    impl_->finalized = true;

    if (impl_->is_encrypting) {
        if (EVP_EncryptFinal_ex(impl_->ctx.get(), as_uchar(output.data()), &out_len) != 1) {
            return make_error(error_code::encryption_failed, get_openssl_error());
        }
        output.resize(static_cast<std::size_t>(out_len));

        impl_->tag.resize(AES_GCM_TAG_SIZE);
        if (EVP_CIPHER_CTX_ctrl(impl_->ctx.get(), EVP_CTRL_GCM_GET_TAG,
                                static_cast<int>(impl_->tag.size()),
                                impl_->tag.data()) != 1) {
            return make_error(error_code::encryption_failed, "Failed to get auth tag");
        }

        impl_->stats->encryption_count++;
        impl_->stats->bytes_encrypted += impl_->bytes_processed;
    } else {
        if (EVP_DecryptFinal_ex(impl_->ctx.get(), as_uchar(output.data()), &out_len) != 1) {
            impl_->stats->authentication_failures++;
            ST_LOG_WARN(log_category::encryption,
                "Authentication tag mismatch after " +
                std::to_string(impl_->bytes_processed) + " bytes");
            return make_error(error_code::decryption_failure,
                              "Authentication failed - wrong key, tag or tampered data");
        }
        output.resize(static_cast<std::size_t>(out_len));

        impl_->stats->decryption_count++;
        impl_->stats->bytes_decrypted += impl_->bytes_processed;
    }

    return output;
}

auto aes_gcm_stream_context::auth_tag() const -> const byte_buffer& {
    return impl_->tag;
}

auto aes_gcm_stream_context::bytes_processed() const -> uint64_t {
    return impl_ ? impl_->bytes_processed : 0;
}

auto aes_gcm_stream_context::is_encryption() const -> bool {
    return impl_ ? impl_->is_encrypting : true;
}

// ============================================================================
// aes_gcm_engine
// ============================================================================

struct aes_gcm_engine::impl {
    std::shared_ptr<stats_block> stats = std::make_shared<stats_block>();
};

aes_gcm_engine::aes_gcm_engine() : impl_(std::make_unique<impl>()) {}

aes_gcm_engine::~aes_gcm_engine() = default;

aes_gcm_engine::aes_gcm_engine(aes_gcm_engine&&) noexcept = default;
auto aes_gcm_engine::operator=(aes_gcm_engine&&) noexcept -> aes_gcm_engine& = default;

auto aes_gcm_engine::random_bytes(std::size_t size) -> result<byte_buffer> {
    byte_buffer out(size);
    if (size == 0) {
        return out;
    }
    if (RAND_bytes(as_uchar(out.data()), static_cast<int>(out.size())) != 1) {
        return make_error(error_code::random_generation_failed,
                          "RAND_bytes failed: " + get_openssl_error());
    }
    return out;
}

auto aes_gcm_engine::generate_key() -> result<byte_buffer> {
    return random_bytes(AES_256_KEY_SIZE);
}

auto aes_gcm_engine::generate_iv() -> result<byte_buffer> {
    return random_bytes(TRANSFER_IV_SIZE);
}

auto aes_gcm_engine::generate_salt() -> result<byte_buffer> {
    return random_bytes(SALT_SIZE);
}

auto aes_gcm_engine::create_encrypt_stream(std::span<const std::byte> key,
                                           std::span<const std::byte> iv)
    -> result<std::unique_ptr<aes_gcm_stream_context>> {
    auto sizes = check_sizes(key, iv, error_code::validation_error);
    if (!sizes) {
        return unexpected(sizes.error());
    }

    auto state = std::make_unique<aes_gcm_stream_context::impl>();
    state->key.assign(key.begin(), key.end());
    state->stats = impl_->stats;
    state->is_encrypting = true;

    auto init = state->initialize(iv);
    if (!init) {
        ST_LOG_ERROR(log_category::encryption, "Encrypt stream setup failed: " + init.error().message);
        return unexpected(init.error());
    }

    return std::unique_ptr<aes_gcm_stream_context>(new aes_gcm_stream_context(std::move(state)));
}

auto aes_gcm_engine::create_decrypt_stream(std::span<const std::byte> key,
                                           std::span<const std::byte> iv,
                                           std::span<const std::byte> auth_tag)
    -> result<std::unique_ptr<aes_gcm_stream_context>> {
    auto sizes = check_sizes(key, iv, error_code::decryption_failure);
    if (!sizes) {
        return unexpected(sizes.error());
    }
    if (auth_tag.size() != AES_GCM_TAG_SIZE) {
        return make_error(error_code::decryption_failure,
            "Invalid auth tag size: expected " + std::to_string(AES_GCM_TAG_SIZE) +
            " bytes, got " + std::to_string(auth_tag.size()));
    }

    auto state = std::make_unique<aes_gcm_stream_context::impl>();
    state->key.assign(key.begin(), key.end());
    state->tag.assign(auth_tag.begin(), auth_tag.end());
    state->stats = impl_->stats;
    state->is_encrypting = false;

    auto init = state->initialize(iv);
    if (!init) {
        return unexpected(init.error());
    }

    return std::unique_ptr<aes_gcm_stream_context>(new aes_gcm_stream_context(std::move(state)));
}

auto aes_gcm_engine::encrypt(std::span<const std::byte> plaintext,
                             std::span<const std::byte> key,
                             std::span<const std::byte> iv) -> result<encryption_result> {
    auto stream = create_encrypt_stream(key, iv);
    if (!stream) {
        return unexpected(stream.error());
    }

    auto body = stream.value()->process_chunk(plaintext);
    if (!body) {
        return unexpected(body.error());
    }
    auto tail = stream.value()->finalize();
    if (!tail) {
        return unexpected(tail.error());
    }

    encryption_result sealed;
    sealed.ciphertext = std::move(body.value());
    sealed.ciphertext.insert(sealed.ciphertext.end(), tail.value().begin(), tail.value().end());
    sealed.auth_tag = stream.value()->auth_tag();
    return sealed;
}

auto aes_gcm_engine::decrypt(std::span<const std::byte> ciphertext,
                             std::span<const std::byte> key,
                             std::span<const std::byte> iv,
                             std::span<const std::byte> auth_tag) -> result<byte_buffer> {
    auto stream = create_decrypt_stream(key, iv, auth_tag);
    if (!stream) {
        return unexpected(stream.error());
    }

    auto body = stream.value()->process_chunk(ciphertext);
    if (!body) {
        return unexpected(body.error());
    }

    auto tail = stream.value()->finalize();
    if (!tail) {
        secure_zero(body.value());
        return unexpected(tail.error());
    }

    byte_buffer plaintext = std::move(body.value());
    plaintext.insert(plaintext.end(), tail.value().begin(), tail.value().end());
    return plaintext;
}

auto aes_gcm_engine::get_statistics() const -> encryption_statistics {
    encryption_statistics out;
    out.bytes_encrypted = impl_->stats->bytes_encrypted.load();
    out.bytes_decrypted = impl_->stats->bytes_decrypted.load();
    out.encryption_count = impl_->stats->encryption_count.load();
    out.decryption_count = impl_->stats->decryption_count.load();
    out.authentication_failures = impl_->stats->authentication_failures.load();
    return out;
}

void aes_gcm_engine::reset_statistics() {
    impl_->stats->bytes_encrypted = 0;
    impl_->stats->bytes_decrypted = 0;
    impl_->stats->encryption_count = 0;
    impl_->stats->decryption_count = 0;
    impl_->stats->authentication_failures = 0;
}

}  // namespace kcenon::secure_transfer
