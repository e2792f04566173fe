/**
 * @file types.h
 * @brief Core type definitions for secure_transfer
 */

#ifndef KCENON_SECURE_TRANSFER_CORE_TYPES_H
#define KCENON_SECURE_TRANSFER_CORE_TYPES_H

#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace kcenon::secure_transfer {

/**
 * @brief Error codes for secure transfer operations
 */
enum class error_code {
    success = 0,

    // Access errors (-100 to -119)
    not_found = -100,
    expired = -101,
    quota_exhausted = -102,
    unauthorized = -103,

    // Verification errors (-120 to -139)
    integrity_failure = -120,
    decryption_failure = -121,
    decompression_failure = -122,

    // Input errors (-140 to -159)
    validation_error = -140,
    invalid_configuration = -141,

    // Processing errors (-160 to -179)
    compression_failed = -160,
    encryption_failed = -161,
    random_generation_failed = -162,
    transfer_cancelled = -163,

    // Storage errors (-180 to -199)
    storage_error = -180,
    file_read_error = -181,
    file_write_error = -182,
    version_conflict = -183,
    already_exists = -184,

    // Internal errors (-200 to -219)
    internal_error = -200,
};

/**
 * @brief Convert error code to string
 */
[[nodiscard]] constexpr auto to_string(error_code code) -> const char* {
    switch (code) {
        case error_code::success:
            return "success";
        case error_code::not_found:
            return "not found";
        case error_code::expired:
            return "expired";
        case error_code::quota_exhausted:
            return "quota exhausted";
        case error_code::unauthorized:
            return "unauthorized";
        case error_code::integrity_failure:
            return "integrity failure";
        case error_code::decryption_failure:
            return "decryption failure";
        case error_code::decompression_failure:
            return "decompression failure";
        case error_code::validation_error:
            return "validation error";
        case error_code::invalid_configuration:
            return "invalid configuration";
        case error_code::compression_failed:
            return "compression failed";
        case error_code::encryption_failed:
            return "encryption failed";
        case error_code::random_generation_failed:
            return "random generation failed";
        case error_code::transfer_cancelled:
            return "transfer cancelled";
        case error_code::storage_error:
            return "storage error";
        case error_code::file_read_error:
            return "file read error";
        case error_code::file_write_error:
            return "file write error";
        case error_code::version_conflict:
            return "version conflict";
        case error_code::already_exists:
            return "already exists";
        case error_code::internal_error:
            return "internal error";
        default:
            return "unknown error";
    }
}

/**
 * @brief Error type with code and optional message
 */
struct error {
    error_code code;
    std::string message;

    error() : code(error_code::success) {}
    explicit error(error_code c) : code(c), message(to_string(c)) {}
    error(error_code c, std::string msg) : code(c), message(std::move(msg)) {}

    [[nodiscard]] explicit operator bool() const noexcept {
        return code != error_code::success;
    }
};

/**
 * @brief Wrapper for unexpected error (used with result<T>)
 */
struct unexpected {
    error err;

    explicit unexpected(error e) : err(std::move(e)) {}
};

/**
 * @brief Result type for operations that can fail
 *
 * A simple Result type similar to std::expected (C++23).
 * Contains either a value of type T or an error.
 */
template <typename T>
class result {
public:
    result() : value_(std::nullopt), error_{} {}

    result(T value) : value_(std::move(value)), error_{} {}

    result(unexpected u) : value_(std::nullopt), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return value_.has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return value_.has_value(); }

    [[nodiscard]] auto value() & -> T& { return *value_; }
    [[nodiscard]] auto value() const& -> const T& { return *value_; }
    [[nodiscard]] auto value() && -> T&& { return std::move(*value_); }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    std::optional<T> value_;
    struct error error_;
};

/**
 * @brief Specialization of result for void return type
 */
template <>
class result<void> {
public:
    result() : has_value_(true) {}

    result(unexpected u) : has_value_(false), error_(std::move(u.err)) {}

    result(const result&) = default;
    result(result&&) noexcept = default;
    auto operator=(const result&) -> result& = default;
    auto operator=(result&&) noexcept -> result& = default;

    [[nodiscard]] auto has_value() const noexcept -> bool { return has_value_; }
    [[nodiscard]] explicit operator bool() const noexcept { return has_value_; }

    [[nodiscard]] auto error() const -> const struct error& { return error_; }

private:
    bool has_value_;
    struct error error_;
};

/**
 * @brief Shorthand for building an error result
 */
[[nodiscard]] inline auto make_error(error_code code, std::string message) -> unexpected {
    return unexpected(error(code, std::move(message)));
}

/**
 * @brief Opaque byte buffer used throughout the pipeline
 */
using byte_buffer = std::vector<std::byte>;

/**
 * @brief Convert a string to a byte buffer
 */
[[nodiscard]] inline auto to_bytes(std::string_view text) -> byte_buffer {
    byte_buffer out(text.size());
    for (std::size_t i = 0; i < text.size(); ++i) {
        out[i] = static_cast<std::byte>(text[i]);
    }
    return out;
}

/**
 * @brief Chunk assembly progress information
 */
struct assembly_progress {
    std::string id;
    uint64_t total_chunks = 0;
    uint64_t received_chunks = 0;
    uint64_t bytes_received = 0;

    [[nodiscard]] auto fraction() const -> double {
        if (total_chunks == 0) return 0.0;
        return static_cast<double>(received_chunks) / static_cast<double>(total_chunks);
    }

    [[nodiscard]] auto completion_percentage() const -> double {
        return fraction() * 100.0;
    }
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_CORE_TYPES_H
