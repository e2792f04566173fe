/**
 * @file password_hasher.h
 * @brief One-way password hashing used to gate downloads
 */

#ifndef KCENON_SECURE_TRANSFER_ENCRYPTION_PASSWORD_HASHER_H
#define KCENON_SECURE_TRANSFER_ENCRYPTION_PASSWORD_HASHER_H

#include <kcenon/secure_transfer/encryption/encryption_config.h>

#include <string>

namespace kcenon::secure_transfer {

/**
 * @brief One-way hash and compare primitive
 *
 * The stored hash gates downloads only; it plays no part in key
 * derivation. Embedders with their own scheme (bcrypt, argon2) implement
 * this interface and pass it to the service builder.
 */
class password_hasher_interface {
public:
    virtual ~password_hasher_interface() = default;

    /**
     * @brief Produce a self-describing encoded hash of @p password
     */
    [[nodiscard]] virtual auto hash(const std::string& password) -> result<std::string> = 0;

    /**
     * @brief Compare @p password against an encoded hash
     * @return false on mismatch and on malformed encodings
     */
    [[nodiscard]] virtual auto verify(const std::string& password,
                                      const std::string& encoded) const -> bool = 0;
};

/**
 * @brief PBKDF2-HMAC-SHA256 password hasher
 *
 * Encoded form: @c pbkdf2-sha256$<iterations>$<salt hex>$<hash hex>
 */
class pbkdf2_password_hasher : public password_hasher_interface {
public:
    explicit pbkdf2_password_hasher(uint32_t iterations = PBKDF2_DEFAULT_ITERATIONS);

    [[nodiscard]] auto hash(const std::string& password) -> result<std::string> override;

    [[nodiscard]] auto verify(const std::string& password,
                              const std::string& encoded) const -> bool override;

    [[nodiscard]] auto iterations() const -> uint32_t { return iterations_; }

    static constexpr const char* scheme = "pbkdf2-sha256";

private:
    uint32_t iterations_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_ENCRYPTION_PASSWORD_HASHER_H
