// BSD 3-Clause License
//
// Copyright (c) 2025, kcenon
// All rights reserved.

#pragma once

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <ctime>
#include <functional>
#include <iomanip>
#include <iostream>
#include <memory>
#include <mutex>
#include <optional>
#include <regex>
#include <sstream>
#include <string>
#include <string_view>

// logger_system integration requires common_system
#if defined(BUILD_WITH_LOGGER_SYSTEM) && defined(BUILD_WITH_COMMON_SYSTEM)
#define SECURE_TRANSFER_USE_LOGGER_SYSTEM 1
#include <kcenon/logger/core/logger.h>
#include <kcenon/logger/core/logger_builder.h>
#include <kcenon/logger/writers/console_writer.h>
#endif

namespace kcenon::secure_transfer {

/**
 * @brief Log categories for the secure transfer pipeline
 */
struct log_category {
    static constexpr std::string_view service = "secure_transfer.service";
    static constexpr std::string_view compression = "secure_transfer.compression";
    static constexpr std::string_view encryption = "secure_transfer.encryption";
    static constexpr std::string_view chunk = "secure_transfer.chunk";
    static constexpr std::string_view lifecycle = "secure_transfer.lifecycle";
    static constexpr std::string_view retrieval = "secure_transfer.retrieval";
    static constexpr std::string_view storage = "secure_transfer.storage";
};

enum class log_level {
    trace = 0,
    debug = 1,
    info = 2,
    warn = 3,
    error = 4,
    fatal = 5
};

inline std::string_view log_level_to_string(log_level level) {
    switch (level) {
        case log_level::trace: return "TRACE";
        case log_level::debug: return "DEBUG";
        case log_level::info: return "INFO";
        case log_level::warn: return "WARN";
        case log_level::error: return "ERROR";
        case log_level::fatal: return "FATAL";
        default: return "UNKNOWN";
    }
}

namespace detail {

/**
 * @brief Escape a string for embedding in a JSON document
 */
[[nodiscard]] inline auto escape_json(std::string_view input) -> std::string {
    std::string output;
    output.reserve(input.size() + 16);
    for (char c : input) {
        switch (c) {
            case '"':  output += "\\\""; break;
            case '\\': output += "\\\\"; break;
            case '\b': output += "\\b";  break;
            case '\f': output += "\\f";  break;
            case '\n': output += "\\n";  break;
            case '\r': output += "\\r";  break;
            case '\t': output += "\\t";  break;
            default:
                if (static_cast<unsigned char>(c) < 0x20) {
                    char buf[8];
                    std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned char>(c));
                    output += buf;
                } else {
                    output += c;
                }
        }
    }
    return output;
}

}  // namespace detail

/**
 * @brief Configuration for sensitive information masking
 *
 * Keys and authentication tags are never logged by the pipeline itself;
 * @c redact_secrets additionally scrubs long hex runs from free-form
 * messages supplied by embedders.
 */
struct masking_config {
    bool mask_filenames = false;
    bool redact_secrets = false;
    std::string mask_char = "*";
    size_t visible_chars = 4;

    static masking_config all_masked() {
        return {true, true, "*", 4};
    }

    static masking_config none() {
        return {false, false, "*", 4};
    }
};

/**
 * @brief Masks filenames and secret material in log output
 */
class sensitive_info_masker {
public:
    explicit sensitive_info_masker(masking_config config = masking_config::none())
        : config_(std::move(config)) {}

    /**
     * @brief Apply secret redaction to a free-form message
     */
    [[nodiscard]] auto mask(const std::string& input) const -> std::string {
        if (!config_.redact_secrets) {
            return input;
        }
        static const std::regex secret_pattern(R"([0-9a-fA-F]{32,})");
        return std::regex_replace(input, secret_pattern, "[redacted]");
    }

    /**
     * @brief Mask a filename, keeping the first visible characters and extension
     */
    [[nodiscard]] auto mask_filename(const std::string& filename) const -> std::string {
        if (!config_.mask_filenames || filename.size() <= config_.visible_chars) {
            return filename;
        }

        std::string name = filename;
        std::string ext;
        auto dot_pos = filename.find_last_of('.');
        if (dot_pos != std::string::npos && dot_pos > 0) {
            name = filename.substr(0, dot_pos);
            ext = filename.substr(dot_pos);
        }

        if (name.size() <= config_.visible_chars) {
            return filename;
        }

        return name.substr(0, config_.visible_chars)
             + std::string(name.size() - config_.visible_chars, config_.mask_char[0])
             + ext;
    }

    [[nodiscard]] auto get_config() const -> const masking_config& {
        return config_;
    }

    void set_config(masking_config config) {
        config_ = std::move(config);
    }

private:
    masking_config config_;
};

/**
 * @brief Structured log context for a single transfer operation
 */
struct transfer_log_context {
    std::string transfer_id;
    std::string filename;
    std::optional<std::string> stage;
    std::optional<std::string> algorithm;
    std::optional<uint64_t> original_size;
    std::optional<uint64_t> stored_size;
    std::optional<uint64_t> chunk_index;
    std::optional<uint64_t> total_chunks;
    std::optional<double> ratio_percent;
    std::optional<uint64_t> duration_ms;
    std::optional<std::string> error_message;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";

        bool first = true;
        auto add_field = [&](const char* name, const std::string& value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":\"" << detail::escape_json(value) << "\"";
            first = false;
        };
        auto add_uint = [&](const char* name, uint64_t value) {
            if (!first) oss << ",";
            oss << "\"" << name << "\":" << value;
            first = false;
        };

        if (!transfer_id.empty()) add_field("transfer_id", transfer_id);
        if (!filename.empty()) {
            add_field("filename", masker ? masker->mask_filename(filename) : filename);
        }
        if (stage) add_field("stage", *stage);
        if (algorithm) add_field("algorithm", *algorithm);
        if (original_size) add_uint("original_size", *original_size);
        if (stored_size) add_uint("stored_size", *stored_size);
        if (chunk_index) add_uint("chunk_index", *chunk_index);
        if (total_chunks) add_uint("total_chunks", *total_chunks);
        if (ratio_percent) {
            if (!first) oss << ",";
            oss << std::fixed << std::setprecision(2) << "\"ratio_percent\":" << *ratio_percent;
            first = false;
        }
        if (duration_ms) add_uint("duration_ms", *duration_ms);
        if (error_message) {
            add_field("error_message", masker ? masker->mask(*error_message) : *error_message);
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Complete structured log entry with all metadata
 */
struct structured_log_entry {
    std::string timestamp;
    log_level level = log_level::info;
    std::string category;
    std::string message;
    std::optional<transfer_log_context> context;
    std::optional<std::string> source_file;
    std::optional<int> source_line;
    std::optional<std::string> function_name;

    [[nodiscard]] auto to_json() const -> std::string {
        return to_json_with_masking(nullptr);
    }

    [[nodiscard]] auto to_json_with_masking(const sensitive_info_masker* masker) const -> std::string {
        std::ostringstream oss;
        oss << "{";
        oss << "\"timestamp\":\"" << timestamp << "\"";
        oss << ",\"level\":\"" << log_level_to_string(level) << "\"";
        oss << ",\"category\":\"" << category << "\"";

        std::string msg = masker ? masker->mask(message) : message;
        oss << ",\"message\":\"" << detail::escape_json(msg) << "\"";

        if (context) {
            // Flatten the context fields into the top-level object
            std::string ctx_json = context->to_json_with_masking(masker);
            if (ctx_json.size() > 2) {
                oss << "," << ctx_json.substr(1, ctx_json.size() - 2);
            }
        }

        if (source_file) {
            oss << ",\"source\":{\"file\":\"" << detail::escape_json(*source_file) << "\"";
            if (source_line) {
                oss << ",\"line\":" << *source_line;
            }
            if (function_name) {
                oss << ",\"function\":\"" << *function_name << "\"";
            }
            oss << "}";
        }

        oss << "}";
        return oss.str();
    }
};

/**
 * @brief Builder class for creating structured log entries
 *
 * Example usage:
 * @code
 * auto entry = log_entry_builder()
 *     .with_level(log_level::info)
 *     .with_category(log_category::service)
 *     .with_message("Transfer stored")
 *     .with_transfer_id("q1w2e3r4")
 *     .with_filename("report.pdf")
 *     .with_original_size(1048576)
 *     .with_stored_size(524304)
 *     .build();
 * @endcode
 */
class log_entry_builder {
public:
    log_entry_builder() {
        entry_.timestamp = get_iso8601_timestamp();
    }

    auto with_level(log_level level) -> log_entry_builder& {
        entry_.level = level;
        return *this;
    }

    auto with_category(std::string_view category) -> log_entry_builder& {
        entry_.category = std::string(category);
        return *this;
    }

    auto with_message(std::string_view message) -> log_entry_builder& {
        entry_.message = std::string(message);
        return *this;
    }

    auto with_transfer_id(std::string_view id) -> log_entry_builder& {
        ensure_context().transfer_id = std::string(id);
        return *this;
    }

    auto with_filename(std::string_view filename) -> log_entry_builder& {
        ensure_context().filename = std::string(filename);
        return *this;
    }

    auto with_stage(std::string_view stage) -> log_entry_builder& {
        ensure_context().stage = std::string(stage);
        return *this;
    }

    auto with_algorithm(std::string_view algorithm) -> log_entry_builder& {
        ensure_context().algorithm = std::string(algorithm);
        return *this;
    }

    auto with_original_size(uint64_t size) -> log_entry_builder& {
        ensure_context().original_size = size;
        return *this;
    }

    auto with_stored_size(uint64_t size) -> log_entry_builder& {
        ensure_context().stored_size = size;
        return *this;
    }

    auto with_chunk(uint64_t index, uint64_t total) -> log_entry_builder& {
        auto& ctx = ensure_context();
        ctx.chunk_index = index;
        ctx.total_chunks = total;
        return *this;
    }

    auto with_ratio_percent(double ratio) -> log_entry_builder& {
        ensure_context().ratio_percent = ratio;
        return *this;
    }

    auto with_duration_ms(uint64_t duration) -> log_entry_builder& {
        ensure_context().duration_ms = duration;
        return *this;
    }

    auto with_error_message(std::string_view error) -> log_entry_builder& {
        ensure_context().error_message = std::string(error);
        return *this;
    }

    auto with_source_location(const char* file, int line, const char* function) -> log_entry_builder& {
        if (file) entry_.source_file = file;
        if (line > 0) entry_.source_line = line;
        if (function) entry_.function_name = function;
        return *this;
    }

    auto with_context(const transfer_log_context& ctx) -> log_entry_builder& {
        entry_.context = ctx;
        return *this;
    }

    [[nodiscard]] auto build() const -> structured_log_entry {
        return entry_;
    }

    [[nodiscard]] auto build_json() const -> std::string {
        return entry_.to_json();
    }

private:
    auto ensure_context() -> transfer_log_context& {
        if (!entry_.context) {
            entry_.context = transfer_log_context{};
        }
        return *entry_.context;
    }

    [[nodiscard]] static auto get_iso8601_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        gmtime_s(&tm_buf, &time_t_val);
#else
        gmtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%dT%H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count()
            << 'Z';
        return oss.str();
    }

    structured_log_entry entry_;
};

class secure_transfer_logger;

inline secure_transfer_logger& get_logger();

/**
 * @brief Output format for log messages
 */
enum class log_output_format {
    text,   ///< Human readable single-line format
    json    ///< One JSON object per line
};

/**
 * @brief Process-wide logger for the secure transfer pipeline
 */
class secure_transfer_logger {
public:
    using log_callback = std::function<void(log_level, std::string_view, std::string_view, const transfer_log_context*)>;
    using json_log_callback = std::function<void(const structured_log_entry&, const std::string&)>;

    secure_transfer_logger() = default;
    ~secure_transfer_logger() = default;

    secure_transfer_logger(const secure_transfer_logger&) = delete;
    secure_transfer_logger& operator=(const secure_transfer_logger&) = delete;

    /**
     * @brief Initialize the logger
     *
     * Safe to call multiple times; subsequent calls are no-ops.
     * Called by secure_transfer_service::builder::build().
     */
    void initialize() {
        bool expected = false;
        if (!initialized_.compare_exchange_strong(expected, true)) {
            return;
        }

#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        auto result = kcenon::logger::logger_builder()
            .with_async(true)
            .with_min_level(to_logger_level(min_level_.load()))
            .add_writer("console", std::make_unique<kcenon::logger::console_writer>())
            .build();

        if (result) {
            logger_ = std::move(result.value());
        }
#endif
    }

    void shutdown() {
#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
            logger_->stop();
            logger_.reset();
        }
#endif
        initialized_ = false;
    }

    [[nodiscard]] auto is_initialized() const -> bool { return initialized_.load(); }

    void set_level(log_level level) {
        min_level_.store(level);
#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->set_min_level(to_logger_level(level));
        }
#endif
    }

    [[nodiscard]] auto get_level() const -> log_level { return min_level_.load(); }

    void set_output_format(log_output_format format) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        output_format_ = format;
    }

    [[nodiscard]] auto get_output_format() const -> log_output_format {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return output_format_;
    }

    void set_masking_config(masking_config config) {
        std::lock_guard<std::mutex> lock(config_mutex_);
        masker_.set_config(std::move(config));
    }

    [[nodiscard]] auto get_masking_config() const -> masking_config {
        std::lock_guard<std::mutex> lock(config_mutex_);
        return masker_.get_config();
    }

    /**
     * @brief Install a callback invoked for every enabled message
     *
     * Pass an empty function to remove it.
     */
    void set_callback(log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        callback_ = std::move(callback);
    }

    void set_json_callback(json_log_callback callback) {
        std::lock_guard<std::mutex> lock(callback_mutex_);
        json_callback_ = std::move(callback);
    }

    /**
     * @brief Suppress the built-in sink (stderr or logger_system)
     *
     * Callbacks still fire. Used by tests to keep output quiet.
     */
    void set_sink_enabled(bool enabled) {
        sink_enabled_.store(enabled);
    }

    [[nodiscard]] auto is_enabled(log_level level) const -> bool {
        return static_cast<int>(level) >= static_cast<int>(min_level_.load());
    }

    void log(log_level level,
             std::string_view category,
             std::string_view message,
             const transfer_log_context* context = nullptr,
             const char* file = nullptr,
             int line = 0,
             const char* function = nullptr) {
        if (!is_enabled(level)) return;

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (callback_) {
                callback_(level, category, message, context);
            }
        }

        log_output_format format;
        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            format = output_format_;
            current_masker = masker_;
        }

        if (format == log_output_format::json) {
            auto builder = log_entry_builder()
                .with_level(level)
                .with_category(category)
                .with_message(message);
            if (file || line > 0 || function) {
                builder.with_source_location(file, line, function);
            }
            if (context) {
                builder.with_context(*context);
            }
            emit_json(builder.build(), current_masker);
        } else {
            emit_text(level, category, message, context, current_masker);
        }
    }

    void log(const structured_log_entry& entry) {
        if (!is_enabled(entry.level)) return;

        sensitive_info_masker current_masker;
        {
            std::lock_guard<std::mutex> lock(config_mutex_);
            current_masker = masker_;
        }
        emit_json(entry, current_masker);
    }

    void flush() {
#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->flush();
        }
#endif
    }

private:
    void emit_json(const structured_log_entry& entry, const sensitive_info_masker& masker) {
        std::string json_str = entry.to_json_with_masking(&masker);

        {
            std::lock_guard<std::mutex> lock(callback_mutex_);
            if (json_callback_) {
                json_callback_(entry, json_str);
            }
        }

        write_line(entry.level, json_str);
    }

    void emit_text(log_level level,
                   std::string_view category,
                   std::string_view message,
                   const transfer_log_context* context,
                   const sensitive_info_masker& masker) {
        std::ostringstream oss;
#ifndef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        oss << get_timestamp() << " [" << log_level_to_string(level) << "] ";
#endif
        oss << "[" << category << "] " << masker.mask(std::string(message));
        if (context) {
            oss << " " << context->to_json_with_masking(&masker);
        }
        write_line(level, oss.str());
    }

    void write_line([[maybe_unused]] log_level level, const std::string& line) {
        if (!sink_enabled_.load()) return;

#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
        if (logger_) {
            logger_->log(to_logger_level(level), line);
            return;
        }
#endif
        static std::mutex stderr_mutex;
        std::lock_guard<std::mutex> lock(stderr_mutex);
        std::cerr << line << "\n";
    }

#ifdef SECURE_TRANSFER_USE_LOGGER_SYSTEM
    static auto to_logger_level(log_level level) -> kcenon::logger::log_level {
        switch (level) {
            case log_level::trace: return kcenon::logger::log_level::trace;
            case log_level::debug: return kcenon::logger::log_level::debug;
            case log_level::info: return kcenon::logger::log_level::info;
            case log_level::warn: return kcenon::logger::log_level::warning;
            case log_level::error: return kcenon::logger::log_level::error;
            case log_level::fatal: return kcenon::logger::log_level::critical;
            default: return kcenon::logger::log_level::info;
        }
    }

    std::unique_ptr<kcenon::logger::logger> logger_;
#endif

    static auto get_timestamp() -> std::string {
        auto now = std::chrono::system_clock::now();
        auto time_t_val = std::chrono::system_clock::to_time_t(now);
        auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(
            now.time_since_epoch()) % 1000;

        std::tm tm_buf{};
#if defined(_WIN32)
        localtime_s(&tm_buf, &time_t_val);
#else
        localtime_r(&time_t_val, &tm_buf);
#endif

        std::ostringstream oss;
        oss << std::put_time(&tm_buf, "%Y-%m-%d %H:%M:%S")
            << '.' << std::setfill('0') << std::setw(3) << ms.count();
        return oss.str();
    }

    std::atomic<log_level> min_level_{log_level::info};
    std::atomic<bool> initialized_{false};
    std::atomic<bool> sink_enabled_{true};
    log_callback callback_;
    json_log_callback json_callback_;
    std::mutex callback_mutex_;

    log_output_format output_format_{log_output_format::text};
    sensitive_info_masker masker_;
    mutable std::mutex config_mutex_;
};

inline secure_transfer_logger& get_logger() {
    static secure_transfer_logger instance;
    return instance;
}

#define ST_LOG(level, category, message) \
    kcenon::secure_transfer::get_logger().log( \
        level, category, message, nullptr, __FILE__, __LINE__, __FUNCTION__)

#define ST_LOG_CTX(level, category, message, context) \
    kcenon::secure_transfer::get_logger().log( \
        level, category, message, &context, __FILE__, __LINE__, __FUNCTION__)

#define ST_LOG_TRACE(category, message) \
    ST_LOG(kcenon::secure_transfer::log_level::trace, category, message)

#define ST_LOG_DEBUG(category, message) \
    ST_LOG(kcenon::secure_transfer::log_level::debug, category, message)

#define ST_LOG_INFO(category, message) \
    ST_LOG(kcenon::secure_transfer::log_level::info, category, message)

#define ST_LOG_WARN(category, message) \
    ST_LOG(kcenon::secure_transfer::log_level::warn, category, message)

#define ST_LOG_ERROR(category, message) \
    ST_LOG(kcenon::secure_transfer::log_level::error, category, message)

#define ST_LOG_INFO_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::secure_transfer::log_level::info, category, message, ctx)

#define ST_LOG_WARN_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::secure_transfer::log_level::warn, category, message, ctx)

#define ST_LOG_ERROR_CTX(category, message, ctx) \
    ST_LOG_CTX(kcenon::secure_transfer::log_level::error, category, message, ctx)

} // namespace kcenon::secure_transfer
