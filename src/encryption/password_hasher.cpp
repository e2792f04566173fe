/**
 * @file password_hasher.cpp
 * @brief PBKDF2-HMAC-SHA256 password hashing
 */

#include <kcenon/secure_transfer/encryption/password_hasher.h>
#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>
#include <kcenon/secure_transfer/core/checksum.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <algorithm>
#include <charconv>
#include <vector>

namespace kcenon::secure_transfer {

namespace {

auto derive(const std::string& password, const byte_buffer& salt, uint32_t iterations,
            std::size_t length) -> result<byte_buffer> {
    byte_buffer out(length);
    if (PKCS5_PBKDF2_HMAC(password.data(), static_cast<int>(password.size()),
                          reinterpret_cast<const unsigned char*>(salt.data()),
                          static_cast<int>(salt.size()),
                          static_cast<int>(iterations), EVP_sha256(),
                          static_cast<int>(out.size()),
                          reinterpret_cast<unsigned char*>(out.data())) != 1) {
        return make_error(error_code::internal_error, "PBKDF2 derivation failed");
    }
    return out;
}

auto split(const std::string& text, char sep) -> std::vector<std::string> {
    std::vector<std::string> parts;
    std::size_t start = 0;
    while (true) {
        auto pos = text.find(sep, start);
        if (pos == std::string::npos) {
            parts.push_back(text.substr(start));
            break;
        }
        parts.push_back(text.substr(start, pos - start));
        start = pos + 1;
    }
    return parts;
}

}  // namespace

pbkdf2_password_hasher::pbkdf2_password_hasher(uint32_t iterations)
    : iterations_(std::clamp<uint32_t>(iterations, 1, PBKDF2_MAX_ITERATIONS)) {}

auto pbkdf2_password_hasher::hash(const std::string& password) -> result<std::string> {
    auto salt = aes_gcm_engine::random_bytes(PASSWORD_SALT_SIZE);
    if (!salt) {
        return unexpected(salt.error());
    }

    auto derived = derive(password, salt.value(), iterations_, PASSWORD_HASH_SIZE);
    if (!derived) {
        return unexpected(derived.error());
    }

    return std::string(scheme) + "$" + std::to_string(iterations_) + "$" +
           to_hex(salt.value()) + "$" + to_hex(derived.value());
}

auto pbkdf2_password_hasher::verify(const std::string& password,
                                    const std::string& encoded) const -> bool {
    auto parts = split(encoded, '$');
    if (parts.size() != 4 || parts[0] != scheme) {
        return false;
    }

    uint32_t iterations = 0;
    auto [ptr, ec] = std::from_chars(parts[1].data(), parts[1].data() + parts[1].size(),
                                     iterations);
    if (ec != std::errc{} || ptr != parts[1].data() + parts[1].size() ||
        iterations == 0 || iterations > PBKDF2_MAX_ITERATIONS) {
        return false;
    }

    auto salt = from_hex(parts[2]);
    auto expected = from_hex(parts[3]);
    if (!salt || !expected || expected.value().empty()) {
        return false;
    }

    auto derived = derive(password, salt.value(), iterations, expected.value().size());
    if (!derived) {
        return false;
    }

    return CRYPTO_memcmp(derived.value().data(), expected.value().data(),
                         expected.value().size()) == 0;
}

}  // namespace kcenon::secure_transfer
