/**
 * @file retrieval_pipeline.cpp
 * @brief Implementation of the download verification pipeline
 */

#include <kcenon/secure_transfer/service/retrieval_pipeline.h>
#include <kcenon/secure_transfer/core/checksum.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <exception>

namespace kcenon::secure_transfer {

void notify_progress(const progress_callback& callback, const transfer_progress& progress) {
    if (!callback) {
        return;
    }
    try {
        callback(progress);
    } catch (const std::exception& e) {
        ST_LOG_WARN(log_category::service,
            std::string("Progress listener threw during ") + to_string(progress.stage) +
            " of " + progress.transfer_id + ": " + e.what());
    }
}

retrieval_pipeline::retrieval_pipeline(std::shared_ptr<artifact_storage> artifacts,
                                       std::size_t buffer_size)
    : artifacts_(std::move(artifacts)),
      buffer_size_(buffer_size == 0 ? compression_engine::default_buffer_size : buffer_size),
      compressor_(buffer_size_) {}

auto retrieval_pipeline::run(const transfer_record& record,
                             std::span<const std::byte> key,
                             std::span<const std::byte> auth_tag,
                             const cancellation_token& cancel,
                             const progress_callback& on_progress) -> result<byte_buffer> {
    notify_progress(on_progress, {record.id, transfer_stage::reading, 0, record.compressed_size});
    notify_progress(on_progress, {record.id, transfer_stage::verifying, 0, record.compressed_size});

    auto verified = verify_checksum(record, cancel);
    if (!verified) {
        return unexpected(verified.error());
    }

    auto plaintext = decrypt_artifact(record, key, auth_tag, cancel, on_progress);
    if (!plaintext) {
        return unexpected(plaintext.error());
    }

    if (cancel.is_cancelled()) {
        secure_zero(plaintext.value());
        return make_error(error_code::transfer_cancelled, "Retrieval cancelled");
    }

    notify_progress(on_progress,
                    {record.id, transfer_stage::decompressing, 0, record.original_size});

    auto restored = compressor_.decompress(plaintext.value(), record.algorithm);
    secure_zero(plaintext.value());
    if (!restored) {
        return make_error(error_code::decompression_failure,
            "Failed to decompress transfer " + record.id + ": " + restored.error().message);
    }

    if (restored.value().size() != record.original_size) {
        ST_LOG_WARN(log_category::retrieval,
            "Transfer " + record.id + " restored " + std::to_string(restored.value().size()) +
            " bytes, record says " + std::to_string(record.original_size));
    }

    notify_progress(on_progress, {record.id, transfer_stage::decompressing,
                                  restored.value().size(), record.original_size});
    return restored;
}

auto retrieval_pipeline::verify_checksum(const transfer_record& record,
                                         const cancellation_token& cancel) -> result<void> {
    auto reader = artifacts_->open_reader(record.id);
    if (!reader) {
        return unexpected(reader.error());
    }

    sha256_hasher hasher;
    byte_buffer window(buffer_size_);
    while (true) {
        if (cancel.is_cancelled()) {
            return make_error(error_code::transfer_cancelled, "Retrieval cancelled");
        }
        auto got = reader.value()->read(window);
        if (!got) {
            return unexpected(got.error());
        }
        if (got.value() == 0) {
            break;
        }
        auto updated = hasher.update(std::span<const std::byte>(window.data(), got.value()));
        if (!updated) {
            return updated;
        }
    }

    auto digest = hasher.finish();
    if (!digest) {
        return unexpected(digest.error());
    }

    if (!checksum::digests_equal(digest.value(), record.checksum)) {
        ST_LOG_ERROR(log_category::retrieval,
            "Checksum mismatch for transfer " + record.id);
        return make_error(error_code::integrity_failure,
                          "File integrity check failed - file may be corrupted");
    }
    return {};
}

auto retrieval_pipeline::decrypt_artifact(const transfer_record& record,
                                          std::span<const std::byte> key,
                                          std::span<const std::byte> auth_tag,
                                          const cancellation_token& cancel,
                                          const progress_callback& on_progress)
    -> result<byte_buffer> {
    auto iv = from_hex(record.cipher_iv);
    if (!iv) {
        return make_error(error_code::storage_error,
                          "Stored IV for transfer " + record.id + " is malformed");
    }

    auto stream = cipher_.create_decrypt_stream(key, iv.value(), auth_tag);
    if (!stream) {
        return unexpected(stream.error());
    }

    auto reader = artifacts_->open_reader(record.id);
    if (!reader) {
        return unexpected(reader.error());
    }

    byte_buffer plaintext;
    plaintext.reserve(static_cast<std::size_t>(reader.value()->size()));
    auto fail = [&plaintext](error err) -> result<byte_buffer> {
        secure_zero(plaintext);
        return unexpected(std::move(err));
    };

    byte_buffer window(buffer_size_);
    uint64_t consumed = 0;
    while (true) {
        if (cancel.is_cancelled()) {
            return fail(error(error_code::transfer_cancelled, "Retrieval cancelled"));
        }
        auto got = reader.value()->read(window);
        if (!got) {
            return fail(got.error());
        }
        if (got.value() == 0) {
            break;
        }

        auto produced =
            stream.value()->process_chunk(std::span<const std::byte>(window.data(), got.value()));
        if (!produced) {
            return fail(produced.error());
        }
        plaintext.insert(plaintext.end(), produced.value().begin(), produced.value().end());

        consumed += got.value();
        notify_progress(on_progress,
                        {record.id, transfer_stage::decrypting, consumed, record.compressed_size});
    }

    auto tail = stream.value()->finalize();
    if (!tail) {
        return fail(tail.error());
    }
    plaintext.insert(plaintext.end(), tail.value().begin(), tail.value().end());
    return plaintext;
}

}  // namespace kcenon::secure_transfer
