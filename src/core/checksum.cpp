/**
 * @file checksum.cpp
 * @brief Implementation of SHA-256 checksum utilities
 */

#include <kcenon/secure_transfer/core/checksum.h>

#include <openssl/crypto.h>
#include <openssl/evp.h>

#include <array>
#include <fstream>
#include <vector>

namespace kcenon::secure_transfer {

namespace {

constexpr std::size_t file_read_window = 64 * 1024;

struct evp_md_ctx_deleter {
    void operator()(EVP_MD_CTX* ctx) const {
        if (ctx) {
            EVP_MD_CTX_free(ctx);
        }
    }
};

using evp_md_ctx_ptr = std::unique_ptr<EVP_MD_CTX, evp_md_ctx_deleter>;

auto hex_value(char c) -> int {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}  // namespace

// ============================================================================
// sha256_hasher
// ============================================================================

struct sha256_hasher::impl {
    evp_md_ctx_ptr ctx{EVP_MD_CTX_new()};
    bool ready = false;
    bool finished = false;

    impl() {
        if (ctx && EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) == 1) {
            ready = true;
        }
    }
};

sha256_hasher::sha256_hasher() : impl_(std::make_unique<impl>()) {}

sha256_hasher::~sha256_hasher() = default;

sha256_hasher::sha256_hasher(sha256_hasher&&) noexcept = default;
auto sha256_hasher::operator=(sha256_hasher&&) noexcept -> sha256_hasher& = default;

auto sha256_hasher::update(std::span<const std::byte> data) -> result<void> {
    if (!impl_->ready || impl_->finished) {
        return make_error(error_code::internal_error, "SHA-256 context is not usable");
    }
    if (data.empty()) {
        return {};
    }
    if (EVP_DigestUpdate(impl_->ctx.get(), data.data(), data.size()) != 1) {
        return make_error(error_code::internal_error, "SHA-256 update failed");
    }
    return {};
}

auto sha256_hasher::finish() -> result<std::string> {
    if (!impl_->ready || impl_->finished) {
        return make_error(error_code::internal_error, "SHA-256 context is not usable");
    }

    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    impl_->finished = true;
    if (EVP_DigestFinal_ex(impl_->ctx.get(), digest.data(), &digest_len) != 1) {
        return make_error(error_code::internal_error, "SHA-256 finalization failed");
    }

    return to_hex(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(digest.data()), digest_len));
}

// ============================================================================
// checksum
// ============================================================================

auto checksum::sha256(std::span<const std::byte> data) -> std::string {
    std::array<unsigned char, EVP_MAX_MD_SIZE> digest{};
    unsigned int digest_len = 0;
    if (EVP_Digest(data.data(), data.size(), digest.data(), &digest_len,
                   EVP_sha256(), nullptr) != 1) {
        return {};
    }
    return to_hex(std::span<const std::byte>(
        reinterpret_cast<const std::byte*>(digest.data()), digest_len));
}

auto checksum::sha256_file(const std::filesystem::path& path) -> result<std::string> {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(error_code::file_read_error,
                          "Failed to open file: " + path.string());
    }

    sha256_hasher hasher;
    std::vector<std::byte> buffer(file_read_window);
    while (file) {
        file.read(reinterpret_cast<char*>(buffer.data()),
                  static_cast<std::streamsize>(buffer.size()));
        auto got = static_cast<std::size_t>(file.gcount());
        if (got == 0) {
            break;
        }
        auto updated = hasher.update(std::span<const std::byte>(buffer.data(), got));
        if (!updated) {
            return unexpected(updated.error());
        }
    }

    if (file.bad()) {
        return make_error(error_code::file_read_error,
                          "Failed to read file: " + path.string());
    }

    return hasher.finish();
}

auto checksum::digests_equal(const std::string& a, const std::string& b) -> bool {
    if (a.size() != b.size() || a.empty()) {
        return false;
    }
    return CRYPTO_memcmp(a.data(), b.data(), a.size()) == 0;
}

auto checksum::verify_sha256(
    std::span<const std::byte> data, const std::string& expected) -> bool {
    return digests_equal(sha256(data), expected);
}

auto checksum::verify_sha256_file(
    const std::filesystem::path& path, const std::string& expected) -> bool {
    auto actual = sha256_file(path);
    if (!actual) {
        return false;
    }
    return digests_equal(actual.value(), expected);
}

auto to_hex(std::span<const std::byte> data) -> std::string {
    static constexpr char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(data.size() * 2);
    for (auto b : data) {
        auto v = static_cast<unsigned char>(b);
        out.push_back(digits[v >> 4]);
        out.push_back(digits[v & 0x0F]);
    }
    return out;
}

auto from_hex(const std::string& hex) -> result<byte_buffer> {
    if (hex.size() % 2 != 0) {
        return make_error(error_code::validation_error, "Hex string has odd length");
    }

    byte_buffer out(hex.size() / 2);
    for (std::size_t i = 0; i < out.size(); ++i) {
        int hi = hex_value(hex[2 * i]);
        int lo = hex_value(hex[2 * i + 1]);
        if (hi < 0 || lo < 0) {
            return make_error(error_code::validation_error, "Invalid hex character");
        }
        out[i] = static_cast<std::byte>((hi << 4) | lo);
    }
    return out;
}

auto to_base64url(std::span<const std::byte> data) -> std::string {
    static constexpr char alphabet[] =
        "ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz0123456789-_";

    std::string out;
    out.reserve((data.size() * 4 + 2) / 3);

    for (std::size_t i = 0; i < data.size(); i += 3) {
        uint32_t n = static_cast<uint32_t>(data[i]) << 16;
        if (i + 1 < data.size()) n |= static_cast<uint32_t>(data[i + 1]) << 8;
        if (i + 2 < data.size()) n |= static_cast<uint32_t>(data[i + 2]);

        out += alphabet[(n >> 18) & 0x3F];
        out += alphabet[(n >> 12) & 0x3F];
        if (i + 1 < data.size()) out += alphabet[(n >> 6) & 0x3F];
        if (i + 2 < data.size()) out += alphabet[n & 0x3F];
    }
    return out;
}

}  // namespace kcenon::secure_transfer
