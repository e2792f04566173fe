/**
 * @file compression_engine.cpp
 * @brief LZ4 frame and Brotli streaming compression implementation
 */

#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <brotli/decode.h>
#include <brotli/encode.h>
#include <lz4frame.h>
#include <lz4hc.h>

#include <algorithm>
#include <array>
#include <cmath>
#include <cstdio>
#include <cstring>
#include <mutex>

namespace kcenon::secure_transfer {

namespace {

// MIME prefixes routed to the text-tuned scheme
constexpr std::array<std::string_view, 6> text_mime_prefixes = {
    "text/",
    "application/json",
    "application/javascript",
    "application/xml",
    "application/xhtml",
    "image/svg",
};

constexpr int lz4_fast_mode_ceiling = 3;

auto to_lz4_level(int level) -> int {
    // 1..3 -> acceleration 2, 1, default; 4..9 -> LZ4HC
    if (level <= lz4_fast_mode_ceiling) {
        return level - lz4_fast_mode_ceiling;
    }
    return std::max(level, LZ4HC_CLEVEL_MIN);
}

auto append(byte_buffer& out, const std::byte* data, std::size_t size) -> void {
    out.insert(out.end(), data, data + size);
}

auto round2(double value) -> double {
    return std::round(value * 100.0) / 100.0;
}

// ============================================================================
// LZ4 frame
// ============================================================================

class lz4_compressor final : public compressor_stream {
public:
    lz4_compressor(LZ4F_cctx* ctx, int level) : ctx_(ctx) {
        std::memset(&prefs_, 0, sizeof(prefs_));
        prefs_.compressionLevel = to_lz4_level(level);
        prefs_.frameInfo.blockSizeID = LZ4F_max64KB;
        prefs_.frameInfo.contentChecksumFlag = LZ4F_contentChecksumEnabled;
    }

    ~lz4_compressor() override {
        LZ4F_freeCompressionContext(ctx_);
    }

    lz4_compressor(const lz4_compressor&) = delete;
    auto operator=(const lz4_compressor&) -> lz4_compressor& = delete;

    auto process(std::span<const std::byte> input) -> result<byte_buffer> override {
        if (finished_) {
            return make_error(error_code::compression_failed, "LZ4 stream already finished");
        }

        byte_buffer out;
        auto begun = begin(out);
        if (!begun) {
            return unexpected(begun.error());
        }
        if (input.empty()) {
            return out;
        }

        const auto offset = out.size();
        out.resize(offset + LZ4F_compressBound(input.size(), &prefs_));
        const size_t written = LZ4F_compressUpdate(
            ctx_, out.data() + offset, out.size() - offset,
            input.data(), input.size(), nullptr);
        if (LZ4F_isError(written)) {
            return make_error(error_code::compression_failed,
                std::string("LZ4 compression failed: ") + LZ4F_getErrorName(written));
        }
        out.resize(offset + written);
        return out;
    }

    auto finish() -> result<byte_buffer> override {
        if (finished_) {
            return make_error(error_code::compression_failed, "LZ4 stream already finished");
        }

        byte_buffer out;
        auto begun = begin(out);
        if (!begun) {
            return unexpected(begun.error());
        }

        const auto offset = out.size();
        out.resize(offset + LZ4F_compressBound(0, &prefs_));
        const size_t written = LZ4F_compressEnd(
            ctx_, out.data() + offset, out.size() - offset, nullptr);
        if (LZ4F_isError(written)) {
            return make_error(error_code::compression_failed,
                std::string("LZ4 frame end failed: ") + LZ4F_getErrorName(written));
        }
        out.resize(offset + written);
        finished_ = true;
        return out;
    }

    auto algorithm() const -> compression_algorithm override {
        return compression_algorithm::lz4;
    }

private:
    auto begin(byte_buffer& out) -> result<void> {
        if (header_written_) {
            return {};
        }
        out.resize(LZ4F_HEADER_SIZE_MAX);
        const size_t written = LZ4F_compressBegin(ctx_, out.data(), out.size(), &prefs_);
        if (LZ4F_isError(written)) {
            return make_error(error_code::compression_failed,
                std::string("LZ4 frame header failed: ") + LZ4F_getErrorName(written));
        }
        out.resize(written);
        header_written_ = true;
        return {};
    }

    LZ4F_cctx* ctx_;
    LZ4F_preferences_t prefs_;
    bool header_written_ = false;
    bool finished_ = false;
};

class lz4_decompressor final : public decompressor_stream {
public:
    lz4_decompressor(LZ4F_dctx* ctx, std::size_t window) : ctx_(ctx), window_(window) {}

    ~lz4_decompressor() override {
        LZ4F_freeDecompressionContext(ctx_);
    }

    lz4_decompressor(const lz4_decompressor&) = delete;
    auto operator=(const lz4_decompressor&) -> lz4_decompressor& = delete;

    auto process(std::span<const std::byte> input) -> result<byte_buffer> override {
        byte_buffer out;
        if (input.empty()) {
            return out;
        }
        if (frame_done_) {
            return make_error(error_code::decompression_failure,
                              "Unexpected data after end of LZ4 frame");
        }

        byte_buffer window(window_);
        const std::byte* src = input.data();
        std::size_t remaining = input.size();

        while (true) {
            size_t src_size = remaining;
            size_t dst_size = window.size();
            const size_t hint = LZ4F_decompress(
                ctx_, window.data(), &dst_size, src, &src_size, nullptr);
            if (LZ4F_isError(hint)) {
                return make_error(error_code::decompression_failure,
                    std::string("LZ4 decompression failed: ") + LZ4F_getErrorName(hint));
            }

            append(out, window.data(), dst_size);
            src += src_size;
            remaining -= src_size;

            if (hint == 0) {
                frame_done_ = true;
                if (remaining > 0) {
                    return make_error(error_code::decompression_failure,
                                      "Unexpected data after end of LZ4 frame");
                }
                break;
            }

            // Output window filled up: more may be pending even with no input left
            const bool output_full = dst_size == window.size();
            if (remaining == 0 && !output_full) {
                break;
            }
            if (src_size == 0 && dst_size == 0) {
                break;
            }
        }

        return out;
    }

    auto finish() -> result<byte_buffer> override {
        if (!frame_done_) {
            return make_error(error_code::decompression_failure, "Truncated LZ4 frame");
        }
        return byte_buffer{};
    }

    auto algorithm() const -> compression_algorithm override {
        return compression_algorithm::lz4;
    }

private:
    LZ4F_dctx* ctx_;
    std::size_t window_;
    bool frame_done_ = false;
};

// ============================================================================
// Brotli
// ============================================================================

class brotli_compressor final : public compressor_stream {
public:
    brotli_compressor(BrotliEncoderState* state, std::size_t window)
        : state_(state), window_(window) {}

    ~brotli_compressor() override {
        BrotliEncoderDestroyInstance(state_);
    }

    brotli_compressor(const brotli_compressor&) = delete;
    auto operator=(const brotli_compressor&) -> brotli_compressor& = delete;

    auto process(std::span<const std::byte> input) -> result<byte_buffer> override {
        if (finished_) {
            return make_error(error_code::compression_failed, "Brotli stream already finished");
        }
        return run(BROTLI_OPERATION_PROCESS, input);
    }

    auto finish() -> result<byte_buffer> override {
        if (finished_) {
            return make_error(error_code::compression_failed, "Brotli stream already finished");
        }
        auto out = run(BROTLI_OPERATION_FINISH, {});
        if (out) {
            finished_ = true;
        }
        return out;
    }

    auto algorithm() const -> compression_algorithm override {
        return compression_algorithm::brotli;
    }

private:
    auto run(BrotliEncoderOperation op, std::span<const std::byte> input)
        -> result<byte_buffer> {
        byte_buffer out;
        byte_buffer window(window_);

        size_t available_in = input.size();
        auto next_in = reinterpret_cast<const uint8_t*>(input.data());

        while (true) {
            size_t available_out = window.size();
            auto next_out = reinterpret_cast<uint8_t*>(window.data());
            if (!BrotliEncoderCompressStream(state_, op, &available_in, &next_in,
                                             &available_out, &next_out, nullptr)) {
                return make_error(error_code::compression_failed, "Brotli compression failed");
            }
            append(out, window.data(), window.size() - available_out);

            const bool more_output = BrotliEncoderHasMoreOutput(state_) == BROTLI_TRUE;
            if (op == BROTLI_OPERATION_FINISH) {
                if (BrotliEncoderIsFinished(state_) == BROTLI_TRUE && !more_output) {
                    break;
                }
            } else if (available_in == 0 && !more_output) {
                break;
            }
        }
        return out;
    }

    BrotliEncoderState* state_;
    std::size_t window_;
    bool finished_ = false;
};

class brotli_decompressor final : public decompressor_stream {
public:
    brotli_decompressor(BrotliDecoderState* state, std::size_t window)
        : state_(state), window_(window) {}

    ~brotli_decompressor() override {
        BrotliDecoderDestroyInstance(state_);
    }

    brotli_decompressor(const brotli_decompressor&) = delete;
    auto operator=(const brotli_decompressor&) -> brotli_decompressor& = delete;

    auto process(std::span<const std::byte> input) -> result<byte_buffer> override {
        byte_buffer out;
        if (input.empty()) {
            return out;
        }
        if (stream_done_) {
            return make_error(error_code::decompression_failure,
                              "Unexpected data after end of Brotli stream");
        }

        byte_buffer window(window_);
        size_t available_in = input.size();
        auto next_in = reinterpret_cast<const uint8_t*>(input.data());

        while (true) {
            size_t available_out = window.size();
            auto next_out = reinterpret_cast<uint8_t*>(window.data());
            const auto status = BrotliDecoderDecompressStream(
                state_, &available_in, &next_in, &available_out, &next_out, nullptr);
            append(out, window.data(), window.size() - available_out);

            if (status == BROTLI_DECODER_RESULT_ERROR) {
                return make_error(error_code::decompression_failure,
                    std::string("Brotli decompression failed: ") +
                    BrotliDecoderErrorString(BrotliDecoderGetErrorCode(state_)));
            }
            if (status == BROTLI_DECODER_RESULT_SUCCESS) {
                stream_done_ = true;
                if (available_in > 0) {
                    return make_error(error_code::decompression_failure,
                                      "Unexpected data after end of Brotli stream");
                }
                break;
            }
            if (status == BROTLI_DECODER_RESULT_NEEDS_MORE_INPUT) {
                break;
            }
            // NEEDS_MORE_OUTPUT: drain into the next window
        }

        return out;
    }

    auto finish() -> result<byte_buffer> override {
        if (!stream_done_) {
            return make_error(error_code::decompression_failure, "Truncated Brotli stream");
        }
        return byte_buffer{};
    }

    auto algorithm() const -> compression_algorithm override {
        return compression_algorithm::brotli;
    }

private:
    BrotliDecoderState* state_;
    std::size_t window_;
    bool stream_done_ = false;
};

}  // namespace

auto parse_compression_algorithm(std::string_view name)
    -> std::optional<compression_algorithm> {
    if (name == "lz4") return compression_algorithm::lz4;
    if (name == "brotli") return compression_algorithm::brotli;
    return std::nullopt;
}

class compression_engine::impl {
public:
    explicit impl(std::size_t buffer_size)
        : buffer_size_(buffer_size == 0 ? default_buffer_size : buffer_size) {}

    auto create_compressor(compression_algorithm algorithm, int level)
        -> result<std::unique_ptr<compressor_stream>> {
        auto valid = validate_level(level);
        if (!valid) {
            return unexpected(valid.error());
        }

        switch (algorithm) {
            case compression_algorithm::lz4: {
                LZ4F_cctx* ctx = nullptr;
                const size_t rc = LZ4F_createCompressionContext(&ctx, LZ4F_VERSION);
                if (LZ4F_isError(rc)) {
                    return make_error(error_code::compression_failed,
                        std::string("Failed to create LZ4 context: ") + LZ4F_getErrorName(rc));
                }
                return std::unique_ptr<compressor_stream>(
                    std::make_unique<lz4_compressor>(ctx, level));
            }
            case compression_algorithm::brotli: {
                BrotliEncoderState* state =
                    BrotliEncoderCreateInstance(nullptr, nullptr, nullptr);
                if (!state) {
                    return make_error(error_code::compression_failed,
                                      "Failed to create Brotli encoder");
                }
                if (!BrotliEncoderSetParameter(state, BROTLI_PARAM_QUALITY,
                                               static_cast<uint32_t>(level))) {
                    BrotliEncoderDestroyInstance(state);
                    return make_error(error_code::compression_failed,
                                      "Failed to set Brotli quality");
                }
                return std::unique_ptr<compressor_stream>(
                    std::make_unique<brotli_compressor>(state, buffer_size_));
            }
        }
        return make_error(error_code::validation_error, "Unknown compression algorithm");
    }

    auto create_decompressor(compression_algorithm algorithm)
        -> result<std::unique_ptr<decompressor_stream>> {
        switch (algorithm) {
            case compression_algorithm::lz4: {
                LZ4F_dctx* ctx = nullptr;
                const size_t rc = LZ4F_createDecompressionContext(&ctx, LZ4F_VERSION);
                if (LZ4F_isError(rc)) {
                    return make_error(error_code::decompression_failure,
                        std::string("Failed to create LZ4 context: ") + LZ4F_getErrorName(rc));
                }
                return std::unique_ptr<decompressor_stream>(
                    std::make_unique<lz4_decompressor>(ctx, buffer_size_));
            }
            case compression_algorithm::brotli: {
                BrotliDecoderState* state =
                    BrotliDecoderCreateInstance(nullptr, nullptr, nullptr);
                if (!state) {
                    return make_error(error_code::decompression_failure,
                                      "Failed to create Brotli decoder");
                }
                return std::unique_ptr<decompressor_stream>(
                    std::make_unique<brotli_decompressor>(state, buffer_size_));
            }
        }
        return make_error(error_code::validation_error, "Unknown compression algorithm");
    }

    auto compress(std::span<const std::byte> input, compression_algorithm algorithm, int level)
        -> result<byte_buffer> {
        auto stream = create_compressor(algorithm, level);
        if (!stream) {
            return unexpected(stream.error());
        }

        byte_buffer output;
        for (std::size_t offset = 0; offset < input.size(); offset += buffer_size_) {
            auto window = input.subspan(offset, std::min(buffer_size_, input.size() - offset));
            auto produced = stream.value()->process(window);
            if (!produced) {
                log_failure(produced.error());
                return unexpected(produced.error());
            }
            output.insert(output.end(), produced.value().begin(), produced.value().end());
        }

        auto tail = stream.value()->finish();
        if (!tail) {
            log_failure(tail.error());
            return unexpected(tail.error());
        }
        output.insert(output.end(), tail.value().begin(), tail.value().end());

        ST_LOG_TRACE(log_category::compression,
            std::string("Compressed ") + std::to_string(input.size()) + " -> " +
            std::to_string(output.size()) + " bytes with " + to_string(algorithm) +
            " level " + std::to_string(level));

        {
            std::lock_guard lock(stats_mutex_);
            stats_.compression_calls++;
            stats_.total_input_bytes += input.size();
            stats_.total_output_bytes += output.size();
        }

        return output;
    }

    auto decompress(std::span<const std::byte> input, compression_algorithm algorithm)
        -> result<byte_buffer> {
        auto stream = create_decompressor(algorithm);
        if (!stream) {
            return unexpected(stream.error());
        }

        byte_buffer output;
        auto fail = [&](const error& err) -> result<byte_buffer> {
            std::lock_guard lock(stats_mutex_);
            stats_.decompression_failures++;
            ST_LOG_ERROR(log_category::compression,
                std::string(to_string(algorithm)) + " decompression failed: " + err.message);
            return unexpected(err);
        };

        for (std::size_t offset = 0; offset < input.size(); offset += buffer_size_) {
            auto window = input.subspan(offset, std::min(buffer_size_, input.size() - offset));
            auto produced = stream.value()->process(window);
            if (!produced) {
                return fail(produced.error());
            }
            output.insert(output.end(), produced.value().begin(), produced.value().end());
        }

        auto tail = stream.value()->finish();
        if (!tail) {
            return fail(tail.error());
        }
        output.insert(output.end(), tail.value().begin(), tail.value().end());

        {
            std::lock_guard lock(stats_mutex_);
            stats_.decompression_calls++;
        }

        return output;
    }

    auto buffer_size() const -> std::size_t { return buffer_size_; }

    auto stats() const -> compression_stats {
        std::lock_guard lock(stats_mutex_);
        return stats_;
    }

    auto reset_stats() -> void {
        std::lock_guard lock(stats_mutex_);
        stats_ = compression_stats{};
    }

private:
    static auto log_failure(const error& err) -> void {
        ST_LOG_ERROR(log_category::compression, "Compression failed: " + err.message);
    }

    std::size_t buffer_size_;
    compression_stats stats_;
    mutable std::mutex stats_mutex_;
};

compression_engine::compression_engine(std::size_t buffer_size)
    : impl_(std::make_unique<impl>(buffer_size)) {}

compression_engine::~compression_engine() = default;

compression_engine::compression_engine(compression_engine&&) noexcept = default;

auto compression_engine::operator=(compression_engine&&) noexcept
    -> compression_engine& = default;

auto compression_engine::select_algorithm(std::string_view mime_type)
    -> compression_algorithm {
    for (auto prefix : text_mime_prefixes) {
        if (mime_type.substr(0, prefix.size()) == prefix) {
            return compression_algorithm::brotli;
        }
    }
    return compression_algorithm::lz4;
}

auto compression_engine::validate_level(int level) -> result<void> {
    if (level < min_compression_level || level > max_compression_level) {
        return make_error(error_code::validation_error,
            "Compression level must be between 1 and 9, got " + std::to_string(level));
    }
    return {};
}

auto compression_engine::compress(std::span<const std::byte> input,
                                  compression_algorithm algorithm,
                                  int level) -> result<byte_buffer> {
    return impl_->compress(input, algorithm, level);
}

auto compression_engine::decompress(std::span<const std::byte> input,
                                    compression_algorithm algorithm) -> result<byte_buffer> {
    return impl_->decompress(input, algorithm);
}

auto compression_engine::create_compressor(compression_algorithm algorithm, int level)
    -> result<std::unique_ptr<compressor_stream>> {
    return impl_->create_compressor(algorithm, level);
}

auto compression_engine::create_decompressor(compression_algorithm algorithm)
    -> result<std::unique_ptr<decompressor_stream>> {
    return impl_->create_decompressor(algorithm);
}

auto compression_engine::buffer_size() const -> std::size_t {
    return impl_->buffer_size();
}

auto compression_engine::stats() const -> compression_stats {
    return impl_->stats();
}

auto compression_engine::reset_stats() -> void {
    impl_->reset_stats();
}

auto compression_ratio(uint64_t original_size, uint64_t stored_size) -> compression_report {
    compression_report report;
    report.original_size = original_size;
    report.stored_size = stored_size;
    if (original_size == 0) {
        return report;
    }

    const double fraction =
        static_cast<double>(stored_size) / static_cast<double>(original_size);
    report.ratio_percent = round2(fraction * 100.0);
    report.savings_percent = round2((1.0 - fraction) * 100.0);
    return report;
}

auto format_bytes(uint64_t bytes) -> std::string {
    static constexpr std::array<const char*, 5> units = {"Bytes", "KB", "MB", "GB", "TB"};
    if (bytes == 0) {
        return "0 Bytes";
    }

    std::size_t unit = 0;
    double value = static_cast<double>(bytes);
    while (value >= 1024.0 && unit + 1 < units.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", round2(value));
    std::string text(buf);
    // Drop trailing zeros and a dangling decimal point ("1.50" -> "1.5", "2.00" -> "2")
    while (!text.empty() && text.back() == '0') {
        text.pop_back();
    }
    if (!text.empty() && text.back() == '.') {
        text.pop_back();
    }
    return text + " " + units[unit];
}

}  // namespace kcenon::secure_transfer
