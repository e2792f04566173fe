/**
 * @file secure_transfer_service.h
 * @brief Secure transfer service: compress, encrypt, store, verify and serve files
 */

#ifndef KCENON_SECURE_TRANSFER_SERVICE_SECURE_TRANSFER_SERVICE_H
#define KCENON_SECURE_TRANSFER_SERVICE_SECURE_TRANSFER_SERVICE_H

#include <kcenon/secure_transfer/core/chunk_assembler.h>
#include <kcenon/secure_transfer/encryption/password_hasher.h>
#include <kcenon/secure_transfer/service/lifecycle_manager.h>
#include <kcenon/secure_transfer/service/service_types.h>
#include <kcenon/secure_transfer/storage/artifact_storage.h>
#include <kcenon/secure_transfer/storage/transfer_store.h>

#include <filesystem>
#include <memory>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace kcenon::secure_transfer {

/**
 * @brief Secure transfer service
 *
 * Stores files as compressed, AES-256-GCM encrypted artifacts. The caller
 * receives the key and authentication tag once, at store time; the service
 * keeps only the IV, the ciphertext checksum and the metadata, so it can
 * never decrypt a stored file on its own.
 *
 * @code
 * auto service_result = secure_transfer_service::builder()
 *     .with_storage_directory("/data/transfers")
 *     .build();
 *
 * if (service_result.has_value()) {
 *     auto& service = service_result.value();
 *     upload_options options;
 *     options.filename = "report.pdf";
 *     options.mime_type = "application/pdf";
 *     options.max_downloads = 2;
 *
 *     auto receipt = service.store(data, options);
 *     if (receipt) {
 *         auto file = service.retrieve(receipt.value().transfer_id,
 *                                      receipt.value().key,
 *                                      receipt.value().auth_tag);
 *     }
 * }
 * @endcode
 */
class secure_transfer_service {
public:
    /**
     * @brief Builder for secure_transfer_service
     */
    class builder {
    public:
        builder();

        /**
         * @brief Set the directory holding encrypted artifacts
         * @param dir Path to storage directory (required)
         * @return Reference to builder for chaining
         */
        auto with_storage_directory(const std::filesystem::path& dir) -> builder&;

        /**
         * @brief Set maximum accepted file size
         * @param max_bytes Maximum size in bytes (default: 500MB)
         * @return Reference to builder for chaining
         */
        auto with_max_file_size(uint64_t max_bytes) -> builder&;

        /**
         * @brief Set the window size streamed through each pipeline stage
         * @param size Window size in bytes (default: 64KB)
         * @return Reference to builder for chaining
         */
        auto with_stream_buffer_size(std::size_t size) -> builder&;

        /**
         * @brief Set compression level used when an upload does not name one
         * @param level Level in [1, 9] (default: 6)
         * @return Reference to builder for chaining
         */
        auto with_default_compression_level(int level) -> builder&;

        /**
         * @brief Set PBKDF2 iteration count for download passwords
         */
        auto with_pbkdf2_iterations(uint32_t iterations) -> builder&;

        /**
         * @brief Set age after which abandoned chunked uploads are purged
         */
        auto with_stale_upload_age(std::chrono::milliseconds age) -> builder&;

        /**
         * @brief Replace the in-memory record store
         */
        auto with_transfer_store(std::shared_ptr<transfer_store> store) -> builder&;

        /**
         * @brief Replace the in-memory audit log store
         */
        auto with_log_store(std::shared_ptr<transfer_log_store> store) -> builder&;

        /**
         * @brief Replace the local-disk artifact storage
         */
        auto with_artifact_storage(std::shared_ptr<artifact_storage> storage) -> builder&;

        auto with_password_hasher(std::shared_ptr<password_hasher_interface> hasher) -> builder&;

        /**
         * @brief Override the time source used for expiry
         */
        auto with_clock(lifecycle_manager::clock_function clock) -> builder&;

        /**
         * @brief Build the service instance
         * @return Result containing the service or an error
         */
        [[nodiscard]] auto build() -> result<secure_transfer_service>;

    private:
        service_config config_;
        std::shared_ptr<transfer_store> records_;
        std::shared_ptr<transfer_log_store> logs_;
        std::shared_ptr<artifact_storage> artifacts_;
        std::shared_ptr<password_hasher_interface> hasher_;
        lifecycle_manager::clock_function clock_;
    };

    // Non-copyable, movable
    secure_transfer_service(const secure_transfer_service&) = delete;
    auto operator=(const secure_transfer_service&) -> secure_transfer_service& = delete;
    secure_transfer_service(secure_transfer_service&&) noexcept;
    auto operator=(secure_transfer_service&&) noexcept -> secure_transfer_service&;

    ~secure_transfer_service();

    /**
     * @brief Compress, encrypt and persist a file held in memory
     *
     * The compression scheme follows the MIME type. On any failure the
     * partially written artifact is removed.
     *
     * @return Receipt carrying the key and auth tag needed for retrieval
     */
    [[nodiscard]] auto store(std::span<const std::byte> data, const upload_options& options)
        -> result<store_receipt>;

    /**
     * @brief Same as store(), streaming the file from disk
     *
     * The original filename defaults to the path's filename.
     */
    [[nodiscard]] auto store_file(const std::filesystem::path& path, upload_options options)
        -> result<store_receipt>;

    /**
     * @brief Accept one chunk of a chunked upload
     *
     * When the last chunk arrives the progress carries the assembled bytes,
     * which the caller then passes to store().
     */
    [[nodiscard]] auto store_chunk(const std::string& upload_id,
                                   uint64_t index,
                                   uint64_t total_chunks,
                                   std::span<const std::byte> data)
        -> result<chunk_progress>;

    /**
     * @brief Public metadata of a transfer
     * @return Metadata, or not_found / expired / quota_exhausted
     */
    [[nodiscard]] auto get_metadata(const std::string& id) -> result<transfer_metadata>;

    /**
     * @brief Verify, decrypt and decompress a transfer
     *
     * Consumes one download on success only.
     */
    [[nodiscard]] auto retrieve(const std::string& id,
                                std::span<const std::byte> key,
                                std::span<const std::byte> auth_tag,
                                const std::optional<std::string>& password = std::nullopt,
                                const cancellation_token& cancel = cancellation_token{})
        -> result<retrieved_file>;

    /**
     * @brief Delete a transfer and its artifact
     */
    [[nodiscard]] auto remove(const std::string& id) -> result<void>;

    /**
     * @brief Active transfers, newest first, after an expiry sweep
     */
    [[nodiscard]] auto list_transfers(std::size_t limit = 50, std::size_t offset = 0)
        -> std::vector<transfer_metadata>;

    /**
     * @brief Metadata plus audit log of a transfer, whatever its status
     */
    [[nodiscard]] auto get_transfer_details(const std::string& id) -> result<transfer_details>;

    [[nodiscard]] auto get_statistics() const -> transfer_statistics;

    /**
     * @brief Drop chunked uploads idle longer than @p max_age
     * @return Number of uploads dropped
     */
    auto purge_stale_uploads(std::chrono::milliseconds max_age) -> std::size_t;

    /**
     * @brief Drop chunked uploads idle longer than the configured age
     */
    auto purge_stale_uploads() -> std::size_t;

    /**
     * @brief Expire every active transfer past its expiry time
     */
    auto sweep_expired() -> std::size_t;

    /**
     * @brief Set callback for pipeline progress updates
     */
    void on_progress(progress_callback callback);

    [[nodiscard]] auto config() const -> const service_config&;

private:
    struct impl;
    explicit secure_transfer_service(std::unique_ptr<impl> state);

    std::unique_ptr<impl> impl_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_SERVICE_SECURE_TRANSFER_SERVICE_H
