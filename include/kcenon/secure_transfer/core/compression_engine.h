/**
 * @file compression_engine.h
 * @brief Streaming LZ4 / Brotli compression engine for stored transfers
 */

#ifndef KCENON_SECURE_TRANSFER_CORE_COMPRESSION_ENGINE_H
#define KCENON_SECURE_TRANSFER_CORE_COMPRESSION_ENGINE_H

#include <kcenon/secure_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <string_view>

namespace kcenon::secure_transfer {

/**
 * @brief Compression algorithm recorded with every transfer
 */
enum class compression_algorithm {
    lz4,     ///< General-purpose scheme (LZ4 frame, fast or HC)
    brotli   ///< Text-tuned scheme
};

[[nodiscard]] constexpr auto to_string(compression_algorithm algorithm) -> const char* {
    switch (algorithm) {
        case compression_algorithm::lz4:
            return "lz4";
        case compression_algorithm::brotli:
            return "brotli";
        default:
            return "unknown";
    }
}

/**
 * @brief Parse an algorithm name as produced by to_string()
 */
[[nodiscard]] auto parse_compression_algorithm(std::string_view name)
    -> std::optional<compression_algorithm>;

constexpr int min_compression_level = 1;
constexpr int max_compression_level = 9;
constexpr int default_compression_level = 6;

/**
 * @brief Compression statistics accumulated by an engine instance
 */
struct compression_stats {
    uint64_t total_input_bytes = 0;      ///< Bytes fed to compressors
    uint64_t total_output_bytes = 0;     ///< Bytes produced by compressors
    uint64_t compression_calls = 0;
    uint64_t decompression_calls = 0;
    uint64_t decompression_failures = 0;

    /**
     * @brief Output/input ratio (1.0 means no compression benefit)
     */
    [[nodiscard]] auto compression_ratio() const -> double {
        if (total_input_bytes == 0) return 1.0;
        return static_cast<double>(total_output_bytes) /
               static_cast<double>(total_input_bytes);
    }

    [[nodiscard]] auto bytes_saved() const -> uint64_t {
        if (total_output_bytes >= total_input_bytes) return 0;
        return total_input_bytes - total_output_bytes;
    }
};

/**
 * @brief Incremental compressor
 *
 * Feed input windows through process(); each call returns the output
 * produced so far. finish() flushes the remaining output and the stream
 * trailer. The stream cannot be reused after finish().
 */
class compressor_stream {
public:
    virtual ~compressor_stream() = default;

    [[nodiscard]] virtual auto process(std::span<const std::byte> input)
        -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto finish() -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto algorithm() const -> compression_algorithm = 0;
};

/**
 * @brief Incremental decompressor
 *
 * Fails with decompression_failure on corrupted input, on bytes trailing
 * the end of the compressed stream, and (from finish()) on a stream that
 * never reached its end marker.
 */
class decompressor_stream {
public:
    virtual ~decompressor_stream() = default;

    [[nodiscard]] virtual auto process(std::span<const std::byte> input)
        -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto finish() -> result<byte_buffer> = 0;

    [[nodiscard]] virtual auto algorithm() const -> compression_algorithm = 0;
};

/**
 * @brief Compression engine selecting between LZ4 and Brotli
 *
 * Levels run from 1 (fastest) to 9 (best ratio). For LZ4, levels 1-3 use
 * the fast compressor with decreasing acceleration and levels 4-9 use the
 * LZ4HC compressor at the same level. For Brotli the level is used as the
 * encoder quality directly.
 *
 * @code
 * compression_engine engine;
 * auto algorithm = compression_engine::select_algorithm("application/json");
 * auto packed = engine.compress(data, algorithm, 6);
 * if (packed) {
 *     auto restored = engine.decompress(packed.value(), algorithm);
 * }
 * @endcode
 */
class compression_engine {
public:
    static constexpr std::size_t default_buffer_size = 64 * 1024;

    /**
     * @brief Construct engine
     * @param buffer_size Window size used when slicing one-shot input
     */
    explicit compression_engine(std::size_t buffer_size = default_buffer_size);

    ~compression_engine();

    compression_engine(const compression_engine&) = delete;
    auto operator=(const compression_engine&) -> compression_engine& = delete;
    compression_engine(compression_engine&&) noexcept;
    auto operator=(compression_engine&&) noexcept -> compression_engine&;

    /**
     * @brief Choose the scheme for a MIME type
     *
     * text/*, JSON, JavaScript, XML, XHTML and SVG content prefer Brotli;
     * everything else (including an empty MIME type) uses LZ4.
     */
    [[nodiscard]] static auto select_algorithm(std::string_view mime_type)
        -> compression_algorithm;

    /**
     * @brief Check that a level lies within [1, 9]
     */
    [[nodiscard]] static auto validate_level(int level) -> result<void>;

    /**
     * @brief Compress a whole buffer, streaming it through bounded windows
     */
    [[nodiscard]] auto compress(std::span<const std::byte> input,
                                compression_algorithm algorithm,
                                int level = default_compression_level)
        -> result<byte_buffer>;

    /**
     * @brief Decompress a whole buffer produced by compress()
     *
     * The algorithm must match the one used to compress; any mismatch,
     * corruption or truncation yields decompression_failure and no output.
     */
    [[nodiscard]] auto decompress(std::span<const std::byte> input,
                                  compression_algorithm algorithm)
        -> result<byte_buffer>;

    [[nodiscard]] auto create_compressor(compression_algorithm algorithm, int level)
        -> result<std::unique_ptr<compressor_stream>>;

    [[nodiscard]] auto create_decompressor(compression_algorithm algorithm)
        -> result<std::unique_ptr<decompressor_stream>>;

    [[nodiscard]] auto buffer_size() const -> std::size_t;

    [[nodiscard]] auto stats() const -> compression_stats;

    auto reset_stats() -> void;

private:
    class impl;
    std::unique_ptr<impl> impl_;
};

/**
 * @brief Size accounting for a stored transfer
 */
struct compression_report {
    uint64_t original_size = 0;
    uint64_t stored_size = 0;
    double ratio_percent = 0.0;    ///< stored / original * 100, two decimals
    double savings_percent = 0.0;  ///< (1 - stored / original) * 100, two decimals
};

/**
 * @brief Compute ratio and savings; an empty original reports zeros
 */
[[nodiscard]] auto compression_ratio(uint64_t original_size, uint64_t stored_size)
    -> compression_report;

/**
 * @brief Render a byte count as "0 Bytes", "512 Bytes", "1.5 KB", "2 MB" ...
 */
[[nodiscard]] auto format_bytes(uint64_t bytes) -> std::string;

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_CORE_COMPRESSION_ENGINE_H
