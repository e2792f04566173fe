/**
 * @file test_logging.cpp
 * @brief Unit tests for structured logging and sensitive information masking
 */

#include <gtest/gtest.h>

#include <kcenon/secure_transfer/core/logging.h>

#include <string>
#include <vector>

namespace kcenon::secure_transfer::test {

// =============================================================================
// Masking Config Tests
// =============================================================================

class MaskingConfigTest : public ::testing::Test {};

TEST_F(MaskingConfigTest, DefaultConfig) {
    masking_config config;

    EXPECT_FALSE(config.mask_filenames);
    EXPECT_FALSE(config.redact_secrets);
    EXPECT_EQ(config.mask_char, "*");
    EXPECT_EQ(config.visible_chars, 4u);
}

TEST_F(MaskingConfigTest, AllMaskedConfig) {
    auto config = masking_config::all_masked();

    EXPECT_TRUE(config.mask_filenames);
    EXPECT_TRUE(config.redact_secrets);
}

// =============================================================================
// Sensitive Info Masker Tests
// =============================================================================

class SensitiveInfoMaskerTest : public ::testing::Test {};

TEST_F(SensitiveInfoMaskerTest, NoMaskingByDefault) {
    sensitive_info_masker masker;
    std::string input =
        "key 00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff";

    EXPECT_EQ(masker.mask(input), input);
    EXPECT_EQ(masker.mask_filename("quarterly-report.pdf"), "quarterly-report.pdf");
}

TEST_F(SensitiveInfoMaskerTest, RedactsLongHexRuns) {
    masking_config config;
    config.redact_secrets = true;
    sensitive_info_masker masker(config);

    auto result = masker.mask(
        "key=00112233445566778899aabbccddeeff00112233445566778899aabbccddeeff ok");

    EXPECT_EQ(result, "key=[redacted] ok");
}

TEST_F(SensitiveInfoMaskerTest, KeepsShortHex) {
    masking_config config;
    config.redact_secrets = true;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask("chunk 0xdeadbeef"), "chunk 0xdeadbeef");
}

TEST_F(SensitiveInfoMaskerTest, MaskFilename) {
    masking_config config;
    config.mask_filenames = true;
    config.visible_chars = 4;
    sensitive_info_masker masker(config);

    EXPECT_EQ(masker.mask_filename("secretfile.txt"), "secr******.txt");
    EXPECT_EQ(masker.mask_filename("abc.txt"), "abc.txt");
}

TEST_F(SensitiveInfoMaskerTest, UpdateConfig) {
    sensitive_info_masker masker;
    EXPECT_EQ(masker.mask_filename("confidential.doc"), "confidential.doc");

    masker.set_config(masking_config::all_masked());
    EXPECT_NE(masker.mask_filename("confidential.doc"), "confidential.doc");
}

// =============================================================================
// Transfer Log Context Tests
// =============================================================================

class TransferLogContextTest : public ::testing::Test {};

TEST_F(TransferLogContextTest, EmptyContextToJson) {
    transfer_log_context ctx;
    EXPECT_EQ(ctx.to_json(), "{}");
}

TEST_F(TransferLogContextTest, AllFieldsToJson) {
    transfer_log_context ctx;
    ctx.transfer_id = "q1w2e3r4";
    ctx.filename = "data.zip";
    ctx.stage = "compressing";
    ctx.algorithm = "lz4";
    ctx.original_size = 1048576;
    ctx.stored_size = 524304;
    ctx.chunk_index = 5;
    ctx.total_chunks = 10;
    ctx.ratio_percent = 50.0;
    ctx.duration_ms = 1000;
    ctx.error_message = "Test error";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\"transfer_id\":\"q1w2e3r4\""), std::string::npos);
    EXPECT_NE(json.find("\"filename\":\"data.zip\""), std::string::npos);
    EXPECT_NE(json.find("\"stage\":\"compressing\""), std::string::npos);
    EXPECT_NE(json.find("\"algorithm\":\"lz4\""), std::string::npos);
    EXPECT_NE(json.find("\"original_size\":1048576"), std::string::npos);
    EXPECT_NE(json.find("\"stored_size\":524304"), std::string::npos);
    EXPECT_NE(json.find("\"chunk_index\":5"), std::string::npos);
    EXPECT_NE(json.find("\"total_chunks\":10"), std::string::npos);
    EXPECT_NE(json.find("\"ratio_percent\":50.00"), std::string::npos);
    EXPECT_NE(json.find("\"duration_ms\":1000"), std::string::npos);
    EXPECT_NE(json.find("\"error_message\":\"Test error\""), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonWithMasking) {
    transfer_log_context ctx;
    ctx.filename = "payroll-2025.xlsx";
    ctx.error_message = "bad tag 00112233445566778899aabbccddeeff";

    sensitive_info_masker masker(masking_config::all_masked());
    auto json = ctx.to_json_with_masking(&masker);

    EXPECT_EQ(json.find("payroll-2025"), std::string::npos);
    EXPECT_NE(json.find(".xlsx"), std::string::npos);
    EXPECT_EQ(json.find("00112233445566778899aabbccddeeff"), std::string::npos);
}

TEST_F(TransferLogContextTest, JsonEscaping) {
    transfer_log_context ctx;
    ctx.transfer_id = "id-with-\"quotes\"";
    ctx.error_message = "Error:\nLine break\tand\ttabs";

    auto json = ctx.to_json();

    EXPECT_NE(json.find("\\\""), std::string::npos);
    EXPECT_NE(json.find("\\n"), std::string::npos);
    EXPECT_NE(json.find("\\t"), std::string::npos);
}

// =============================================================================
// Structured Log Entry Tests
// =============================================================================

class StructuredLogEntryTest : public ::testing::Test {};

TEST_F(StructuredLogEntryTest, BasicEntryToJson) {
    structured_log_entry entry;
    entry.timestamp = "2025-12-11T10:30:00.000Z";
    entry.level = log_level::info;
    entry.category = std::string(log_category::service);
    entry.message = "Transfer stored";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"timestamp\":\"2025-12-11T10:30:00.000Z\""), std::string::npos);
    EXPECT_NE(json.find("\"level\":\"INFO\""), std::string::npos);
    EXPECT_NE(json.find("\"category\":\"secure_transfer.service\""), std::string::npos);
    EXPECT_NE(json.find("\"message\":\"Transfer stored\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, ContextIsFlattened) {
    structured_log_entry entry;
    entry.timestamp = "2025-12-11T10:30:00.000Z";
    entry.category = std::string(log_category::retrieval);
    entry.message = "Transfer downloaded";

    transfer_log_context ctx;
    ctx.transfer_id = "abc-123";
    ctx.original_size = 2048;
    entry.context = ctx;

    auto json = entry.to_json();

    EXPECT_NE(json.find(",\"transfer_id\":\"abc-123\""), std::string::npos);
    EXPECT_NE(json.find("\"original_size\":2048"), std::string::npos);
    EXPECT_EQ(json.find("{\"transfer_id\""), std::string::npos);
}

TEST_F(StructuredLogEntryTest, EntryWithSourceLocation) {
    structured_log_entry entry;
    entry.timestamp = "2025-12-11T10:30:00.000Z";
    entry.level = log_level::error;
    entry.category = std::string(log_category::encryption);
    entry.message = "Authentication failed";
    entry.source_file = "/src/aes_gcm_engine.cpp";
    entry.source_line = 42;
    entry.function_name = "finalize";

    auto json = entry.to_json();

    EXPECT_NE(json.find("\"source\":{"), std::string::npos);
    EXPECT_NE(json.find("\"file\":\"/src/aes_gcm_engine.cpp\""), std::string::npos);
    EXPECT_NE(json.find("\"line\":42"), std::string::npos);
    EXPECT_NE(json.find("\"function\":\"finalize\""), std::string::npos);
}

// =============================================================================
// Log Entry Builder Tests
// =============================================================================

TEST(LogEntryBuilderTest, BuildsEntryWithContext) {
    auto entry = log_entry_builder()
        .with_level(log_level::warn)
        .with_category(log_category::chunk)
        .with_message("Upload exceeds maximum size")
        .with_transfer_id("upload-7")
        .with_chunk(3, 8)
        .with_stage("uploading")
        .build();

    EXPECT_EQ(entry.level, log_level::warn);
    EXPECT_EQ(entry.category, "secure_transfer.chunk");
    ASSERT_TRUE(entry.context.has_value());
    EXPECT_EQ(entry.context->transfer_id, "upload-7");
    EXPECT_EQ(entry.context->chunk_index, 3u);
    EXPECT_EQ(entry.context->total_chunks, 8u);
    EXPECT_FALSE(entry.timestamp.empty());
}

TEST(LogEntryBuilderTest, BuildJson) {
    auto json = log_entry_builder()
        .with_category(log_category::compression)
        .with_message("Compressed")
        .with_algorithm("brotli")
        .with_ratio_percent(12.5)
        .build_json();

    EXPECT_NE(json.find("\"algorithm\":\"brotli\""), std::string::npos);
    EXPECT_NE(json.find("\"ratio_percent\":12.50"), std::string::npos);
}

// =============================================================================
// Logger Tests
// =============================================================================

class LoggerTest : public ::testing::Test {
protected:
    void SetUp() override {
        auto& logger = get_logger();
        previous_level_ = logger.get_level();
        logger.set_sink_enabled(false);
        logger.set_level(log_level::trace);
    }

    void TearDown() override {
        auto& logger = get_logger();
        logger.set_callback(nullptr);
        logger.set_json_callback(nullptr);
        logger.set_output_format(log_output_format::text);
        logger.set_masking_config(masking_config::none());
        logger.set_level(previous_level_);
        logger.set_sink_enabled(true);
    }

    log_level previous_level_ = log_level::info;
};

TEST_F(LoggerTest, CallbackReceivesMessages) {
    std::vector<std::string> messages;
    get_logger().set_callback(
        [&](log_level, std::string_view category, std::string_view message,
            const transfer_log_context*) {
            messages.push_back(std::string(category) + ":" + std::string(message));
        });

    ST_LOG_INFO(log_category::lifecycle, "Transfer expired");

    ASSERT_EQ(messages.size(), 1u);
    EXPECT_EQ(messages[0], "secure_transfer.lifecycle:Transfer expired");
}

TEST_F(LoggerTest, LevelFiltering) {
    int count = 0;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const transfer_log_context*) {
            ++count;
        });

    get_logger().set_level(log_level::warn);
    ST_LOG_DEBUG(log_category::service, "hidden");
    ST_LOG_INFO(log_category::service, "hidden");
    ST_LOG_WARN(log_category::service, "shown");
    ST_LOG_ERROR(log_category::service, "shown");

    EXPECT_EQ(count, 2);
    EXPECT_FALSE(get_logger().is_enabled(log_level::info));
    EXPECT_TRUE(get_logger().is_enabled(log_level::error));
}

TEST_F(LoggerTest, ContextIsPassedToCallback) {
    std::string seen_id;
    get_logger().set_callback(
        [&](log_level, std::string_view, std::string_view, const transfer_log_context* ctx) {
            if (ctx) seen_id = ctx->transfer_id;
        });

    transfer_log_context ctx;
    ctx.transfer_id = "ctx-id";
    ST_LOG_INFO_CTX(log_category::service, "Transfer stored", ctx);

    EXPECT_EQ(seen_id, "ctx-id");
}

TEST_F(LoggerTest, JsonOutputAppliesMasking) {
    std::string captured;
    get_logger().set_output_format(log_output_format::json);
    get_logger().set_masking_config(masking_config::all_masked());
    get_logger().set_json_callback(
        [&](const structured_log_entry&, const std::string& json) { captured = json; });

    transfer_log_context ctx;
    ctx.filename = "salary-review.pdf";
    ST_LOG_ERROR_CTX(log_category::service,
                     "tag 00112233445566778899aabbccddeeff rejected", ctx);

    ASSERT_FALSE(captured.empty());
    EXPECT_NE(captured.find("[redacted]"), std::string::npos);
    EXPECT_EQ(captured.find("salary-review"), std::string::npos);
    EXPECT_NE(captured.find("\"level\":\"ERROR\""), std::string::npos);
}

TEST_F(LoggerTest, InitializeIsIdempotent) {
    get_logger().initialize();
    get_logger().initialize();
    EXPECT_TRUE(get_logger().is_initialized());
}

}  // namespace kcenon::secure_transfer::test
