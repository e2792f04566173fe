/**
 * @file retrieval_pipeline.h
 * @brief Verify, decrypt and decompress a stored artifact
 */

#ifndef KCENON_SECURE_TRANSFER_SERVICE_RETRIEVAL_PIPELINE_H
#define KCENON_SECURE_TRANSFER_SERVICE_RETRIEVAL_PIPELINE_H

#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>
#include <kcenon/secure_transfer/service/service_types.h>
#include <kcenon/secure_transfer/storage/artifact_storage.h>

#include <memory>
#include <span>

namespace kcenon::secure_transfer {

/**
 * @brief Download-side pipeline
 *
 * Stages run strictly in order and each failure has its own error code:
 * -# SHA-256 of the stored ciphertext against the record checksum
 *    (integrity_failure; nothing is decrypted)
 * -# AES-256-GCM decryption with the caller's key and tag
 *    (decryption_failure)
 * -# decompression with the recorded algorithm (decompression_failure)
 *
 * Partial plaintext is never returned.
 */
class retrieval_pipeline {
public:
    retrieval_pipeline(std::shared_ptr<artifact_storage> artifacts,
                       std::size_t buffer_size);

    [[nodiscard]] auto run(const transfer_record& record,
                           std::span<const std::byte> key,
                           std::span<const std::byte> auth_tag,
                           const cancellation_token& cancel,
                           const progress_callback& on_progress) -> result<byte_buffer>;

private:
    [[nodiscard]] auto verify_checksum(const transfer_record& record,
                                       const cancellation_token& cancel) -> result<void>;

    [[nodiscard]] auto decrypt_artifact(const transfer_record& record,
                                        std::span<const std::byte> key,
                                        std::span<const std::byte> auth_tag,
                                        const cancellation_token& cancel,
                                        const progress_callback& on_progress)
        -> result<byte_buffer>;

    std::shared_ptr<artifact_storage> artifacts_;
    std::size_t buffer_size_;
    aes_gcm_engine cipher_;
    compression_engine compressor_;
};

/**
 * @brief Invoke a progress listener; a std::exception it throws is logged, not propagated
 */
void notify_progress(const progress_callback& callback, const transfer_progress& progress);

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_SERVICE_RETRIEVAL_PIPELINE_H
