/**
 * @file secure_transfer_service.cpp
 * @brief Secure transfer service implementation
 */

#include <kcenon/secure_transfer/service/secure_transfer_service.h>
#include <kcenon/secure_transfer/core/checksum.h>
#include <kcenon/secure_transfer/core/compression_engine.h>
#include <kcenon/secure_transfer/core/logging.h>
#include <kcenon/secure_transfer/encryption/aes_gcm_engine.h>
#include <kcenon/secure_transfer/service/retrieval_pipeline.h>

#include <algorithm>
#include <chrono>
#include <cmath>
#include <fstream>
#include <functional>
#include <mutex>

namespace kcenon::secure_transfer {

namespace {

constexpr std::size_t transfer_id_bytes = 16;

using byte_source = std::function<result<std::size_t>(std::span<std::byte>)>;

auto elapsed_ms(std::chrono::steady_clock::time_point start) -> uint64_t {
    return static_cast<uint64_t>(std::chrono::duration_cast<std::chrono::milliseconds>(
        std::chrono::steady_clock::now() - start).count());
}

auto validate_options(const upload_options& options) -> result<void> {
    if (options.filename.empty()) {
        return make_error(error_code::validation_error, "filename is required");
    }
    if (options.expires_in_hours) {
        const double hours = *options.expires_in_hours;
        if (!std::isfinite(hours) || hours <= 0.0) {
            return make_error(error_code::validation_error,
                              "expires_in_hours must be a positive number");
        }
        if (hours > max_expiry_hours) {
            return make_error(error_code::validation_error,
                              "expires_in_hours must not exceed " +
                              std::to_string(static_cast<uint64_t>(max_expiry_hours)));
        }
    }
    if (options.max_downloads && *options.max_downloads == 0) {
        return make_error(error_code::validation_error, "max_downloads must be positive");
    }
    return {};
}

}  // namespace

struct secure_transfer_service::impl {
    service_config config;
    std::shared_ptr<transfer_store> records;
    std::shared_ptr<transfer_log_store> logs;
    std::shared_ptr<artifact_storage> artifacts;

    lifecycle_manager lifecycle;
    retrieval_pipeline retrieval;
    chunk_assembler chunks;
    compression_engine compressor;
    aes_gcm_engine cipher;

    std::mutex callback_mutex;
    progress_callback progress_cb;

    impl(service_config cfg,
         std::shared_ptr<transfer_store> record_store,
         std::shared_ptr<transfer_log_store> log_store,
         std::shared_ptr<artifact_storage> artifact_store,
         std::shared_ptr<password_hasher_interface> hasher,
         lifecycle_manager::clock_function clock)
        : config(std::move(cfg)),
          records(std::move(record_store)),
          logs(std::move(log_store)),
          artifacts(std::move(artifact_store)),
          lifecycle(records, logs, artifacts, std::move(hasher), std::move(clock)),
          retrieval(artifacts, config.stream_buffer_size),
          chunks(config.max_file_size),
          compressor(config.stream_buffer_size) {}

    auto current_callback() -> progress_callback {
        std::lock_guard lock(callback_mutex);
        return progress_cb;
    }

    auto generate_transfer_id() -> result<std::string> {
        auto bytes = aes_gcm_engine::random_bytes(transfer_id_bytes);
        if (!bytes) {
            return unexpected(bytes.error());
        }
        return to_base64url(bytes.value());
    }

    /**
     * @brief Compress -> encrypt -> hash -> write, one window at a time
     */
    auto run_store(const byte_source& read_next, uint64_t total_size,
                   const upload_options& options) -> result<store_receipt> {
        const auto started = std::chrono::steady_clock::now();

        auto valid = validate_options(options);
        if (!valid) {
            return unexpected(valid.error());
        }
        if (total_size > config.max_file_size) {
            return make_error(error_code::validation_error,
                "File size " + format_bytes(total_size) + " exceeds limit of " +
                format_bytes(config.max_file_size));
        }

        const int level = options.compression_level.value_or(config.default_compression_level);
        auto level_ok = compression_engine::validate_level(level);
        if (!level_ok) {
            return unexpected(level_ok.error());
        }
        const auto algorithm = compression_engine::select_algorithm(options.mime_type);

        auto key = aes_gcm_engine::generate_key();
        if (!key) return unexpected(key.error());
        auto iv = aes_gcm_engine::generate_iv();
        if (!iv) return unexpected(iv.error());
        auto salt = aes_gcm_engine::generate_salt();
        if (!salt) return unexpected(salt.error());
        auto id = generate_transfer_id();
        if (!id) return unexpected(id.error());

        const std::string& transfer_id = id.value();
        const auto callback = current_callback();

        transfer_log_context ctx;
        ctx.transfer_id = transfer_id;
        ctx.filename = options.filename;
        ctx.algorithm = to_string(algorithm);
        ctx.original_size = total_size;
        ST_LOG_INFO_CTX(log_category::service, "Storing transfer", ctx);

        notify_progress(callback, {transfer_id, transfer_stage::uploading, 0, total_size});

        auto writer = artifacts->open_writer(transfer_id);
        if (!writer) {
            return unexpected(writer.error());
        }

        auto fail = [&](const error& err) -> result<store_receipt> {
            writer.value()->abort();
            transfer_log_context fail_ctx = ctx;
            fail_ctx.error_message = err.message;
            ST_LOG_ERROR_CTX(log_category::service, "Store failed", fail_ctx);
            return unexpected(err);
        };

        auto packer = compressor.create_compressor(algorithm, level);
        if (!packer) return fail(packer.error());
        auto sealer = cipher.create_encrypt_stream(key.value(), iv.value());
        if (!sealer) return fail(sealer.error());
        sha256_hasher hasher;

        // Encrypts a block of compressed output and appends it to the artifact
        auto emit = [&](const byte_buffer& compressed) -> result<void> {
            auto encrypted = sealer.value()->process_chunk(compressed);
            if (!encrypted) return unexpected(encrypted.error());
            auto hashed = hasher.update(encrypted.value());
            if (!hashed) return hashed;
            return writer.value()->write(encrypted.value());
        };

        byte_buffer window(config.stream_buffer_size);
        uint64_t consumed = 0;
        while (true) {
            if (options.cancel.is_cancelled()) {
                return fail(error(error_code::transfer_cancelled, "Store cancelled"));
            }

            auto got = read_next(window);
            if (!got) return fail(got.error());
            if (got.value() == 0) break;

            consumed += got.value();
            if (consumed > config.max_file_size) {
                return fail(error(error_code::validation_error,
                    "File exceeds limit of " + format_bytes(config.max_file_size)));
            }

            auto compressed =
                packer.value()->process(std::span<const std::byte>(window.data(), got.value()));
            if (!compressed) return fail(compressed.error());
            auto written = emit(compressed.value());
            if (!written) return fail(written.error());

            notify_progress(callback,
                            {transfer_id, transfer_stage::compressing, consumed, total_size});
        }

        auto compressed_tail = packer.value()->finish();
        if (!compressed_tail) return fail(compressed_tail.error());
        auto written = emit(compressed_tail.value());
        if (!written) return fail(written.error());

        notify_progress(callback, {transfer_id, transfer_stage::encrypting, consumed, consumed});

        auto sealed_tail = sealer.value()->finalize();
        if (!sealed_tail) return fail(sealed_tail.error());
        auto hashed = hasher.update(sealed_tail.value());
        if (!hashed) return fail(hashed.error());
        auto tail_written = writer.value()->write(sealed_tail.value());
        if (!tail_written) return fail(tail_written.error());

        byte_buffer auth_tag = sealer.value()->auth_tag();

        auto digest = hasher.finish();
        if (!digest) return fail(digest.error());

        auto stored_size = writer.value()->commit();
        if (!stored_size) return fail(stored_size.error());

        transfer_record record;
        record.id = transfer_id;
        record.original_filename = options.filename;
        record.mime_type = options.mime_type;
        record.original_size = consumed;
        record.compressed_size = stored_size.value();
        record.compression_ratio = compression_ratio(consumed, stored_size.value()).ratio_percent;
        record.algorithm = algorithm;
        record.cipher_iv = to_hex(iv.value());
        record.cipher_salt = to_hex(salt.value());
        record.checksum = digest.value();
        record.created_at = lifecycle.now();
        record.max_downloads = options.max_downloads;
        if (options.expires_in_hours) {
            const std::chrono::duration<double, std::ratio<3600>> hours(*options.expires_in_hours);
            record.expires_at =
                record.created_at + std::chrono::duration_cast<clock_type::duration>(hours);
        }

        if (options.password && !options.password->empty()) {
            auto hashed_password = lifecycle.hash_password(*options.password);
            if (!hashed_password) {
                discard_artifact(transfer_id);
                return unexpected(hashed_password.error());
            }
            record.password_hash = std::move(hashed_password.value());
        }

        auto registered = lifecycle.register_transfer(record);
        if (!registered) {
            discard_artifact(transfer_id);
            return unexpected(registered.error());
        }

        ctx.stored_size = record.compressed_size;
        ctx.ratio_percent = record.compression_ratio;
        ctx.duration_ms = elapsed_ms(started);
        ST_LOG_INFO_CTX(log_category::service, "Transfer stored", ctx);

        notify_progress(callback, {transfer_id, transfer_stage::complete, consumed, consumed});

        store_receipt receipt;
        receipt.transfer_id = transfer_id;
        receipt.key = std::move(key.value());
        receipt.auth_tag = std::move(auth_tag);
        receipt.metadata = transfer_metadata::from_record(registered.value());
        return receipt;
    }

    void discard_artifact(const std::string& id) {
        auto removed = artifacts->remove(id);
        if (!removed) {
            ST_LOG_WARN(log_category::service,
                "Failed to discard artifact " + id + ": " + removed.error().message);
        }
    }
};

// Builder implementation
secure_transfer_service::builder::builder() = default;

auto secure_transfer_service::builder::with_storage_directory(
    const std::filesystem::path& dir) -> builder& {
    config_.storage_directory = dir;
    return *this;
}

auto secure_transfer_service::builder::with_max_file_size(uint64_t max_bytes) -> builder& {
    config_.max_file_size = max_bytes;
    return *this;
}

auto secure_transfer_service::builder::with_stream_buffer_size(std::size_t size) -> builder& {
    config_.stream_buffer_size = size;
    return *this;
}

auto secure_transfer_service::builder::with_default_compression_level(int level) -> builder& {
    config_.default_compression_level = level;
    return *this;
}

auto secure_transfer_service::builder::with_pbkdf2_iterations(uint32_t iterations) -> builder& {
    config_.pbkdf2_iterations = iterations;
    return *this;
}

auto secure_transfer_service::builder::with_stale_upload_age(std::chrono::milliseconds age)
    -> builder& {
    config_.stale_upload_age = age;
    return *this;
}

auto secure_transfer_service::builder::with_transfer_store(
    std::shared_ptr<transfer_store> store) -> builder& {
    records_ = std::move(store);
    return *this;
}

auto secure_transfer_service::builder::with_log_store(
    std::shared_ptr<transfer_log_store> store) -> builder& {
    logs_ = std::move(store);
    return *this;
}

auto secure_transfer_service::builder::with_artifact_storage(
    std::shared_ptr<artifact_storage> storage) -> builder& {
    artifacts_ = std::move(storage);
    return *this;
}

auto secure_transfer_service::builder::with_password_hasher(
    std::shared_ptr<password_hasher_interface> hasher) -> builder& {
    hasher_ = std::move(hasher);
    return *this;
}

auto secure_transfer_service::builder::with_clock(lifecycle_manager::clock_function clock)
    -> builder& {
    clock_ = std::move(clock);
    return *this;
}

auto secure_transfer_service::builder::build() -> result<secure_transfer_service> {
    if (config_.storage_directory.empty() && !artifacts_) {
        return unexpected{error{error_code::invalid_configuration,
                               "storage_directory is required"}};
    }
    if (config_.storage_directory.empty()) {
        // Custom artifact storage; the directory is informational only
        config_.storage_directory = ".";
    }
    if (!config_.is_valid()) {
        return unexpected{error{error_code::invalid_configuration,
                               "Invalid service configuration"}};
    }

    get_logger().initialize();

    if (!artifacts_) {
        auto local = local_artifact_storage::create(config_.storage_directory);
        if (!local) {
            return unexpected{local.error()};
        }
        artifacts_ = std::shared_ptr<artifact_storage>(std::move(local.value()));
    }
    if (!records_) {
        records_ = std::make_shared<memory_transfer_store>();
    }
    if (!logs_) {
        logs_ = std::make_shared<memory_transfer_log_store>();
    }
    if (!hasher_) {
        hasher_ = std::make_shared<pbkdf2_password_hasher>(config_.pbkdf2_iterations);
    }

    ST_LOG_INFO(log_category::service,
        "Secure transfer service ready, storage at " + config_.storage_directory.string());

    return secure_transfer_service(std::make_unique<impl>(
        config_, records_, logs_, artifacts_, hasher_, clock_));
}

secure_transfer_service::secure_transfer_service(std::unique_ptr<impl> state)
    : impl_(std::move(state)) {}

secure_transfer_service::secure_transfer_service(secure_transfer_service&&) noexcept = default;

auto secure_transfer_service::operator=(secure_transfer_service&&) noexcept
    -> secure_transfer_service& = default;

secure_transfer_service::~secure_transfer_service() = default;

auto secure_transfer_service::store(std::span<const std::byte> data,
                                    const upload_options& options) -> result<store_receipt> {
    std::size_t offset = 0;
    byte_source source = [&data, &offset](std::span<std::byte> out) -> result<std::size_t> {
        const std::size_t n = std::min(out.size(), data.size() - offset);
        std::copy_n(data.begin() + static_cast<std::ptrdiff_t>(offset), n, out.begin());
        offset += n;
        return n;
    };
    return impl_->run_store(source, data.size(), options);
}

auto secure_transfer_service::store_file(const std::filesystem::path& path,
                                         upload_options options) -> result<store_receipt> {
    std::error_code ec;
    const auto size = std::filesystem::file_size(path, ec);
    if (ec) {
        return make_error(error_code::file_read_error,
                          "Cannot stat " + path.string() + ": " + ec.message());
    }

    std::ifstream file(path, std::ios::binary);
    if (!file) {
        return make_error(error_code::file_read_error, "Cannot open " + path.string());
    }

    if (options.filename.empty()) {
        options.filename = path.filename().string();
    }

    byte_source source = [&file, &path](std::span<std::byte> out) -> result<std::size_t> {
        file.read(reinterpret_cast<char*>(out.data()), static_cast<std::streamsize>(out.size()));
        if (file.bad()) {
            return make_error(error_code::file_read_error, "Read failed on " + path.string());
        }
        return static_cast<std::size_t>(file.gcount());
    };
    return impl_->run_store(source, size, options);
}

auto secure_transfer_service::store_chunk(const std::string& upload_id,
                                          uint64_t index,
                                          uint64_t total_chunks,
                                          std::span<const std::byte> data)
    -> result<chunk_progress> {
    auto progress = impl_->chunks.accept_chunk(upload_id, index, total_chunks, data);
    if (progress) {
        const auto& p = progress.value();
        notify_progress(impl_->current_callback(),
                        {upload_id, transfer_stage::uploading, p.received_chunks, p.total_chunks});
    }
    return progress;
}

auto secure_transfer_service::get_metadata(const std::string& id) -> result<transfer_metadata> {
    auto record = impl_->lifecycle.check_access(id, access_kind::metadata);
    if (!record) {
        return unexpected(record.error());
    }
    return transfer_metadata::from_record(record.value());
}

auto secure_transfer_service::retrieve(const std::string& id,
                                       std::span<const std::byte> key,
                                       std::span<const std::byte> auth_tag,
                                       const std::optional<std::string>& password,
                                       const cancellation_token& cancel)
    -> result<retrieved_file> {
    const auto started = std::chrono::steady_clock::now();

    auto record = impl_->lifecycle.check_access(id, access_kind::download, password);
    if (!record) {
        return unexpected(record.error());
    }

    if (key.empty() || auth_tag.empty()) {
        return make_error(error_code::validation_error, "Decryption key and auth tag required");
    }

    const auto callback = impl_->current_callback();
    auto data = impl_->retrieval.run(record.value(), key, auth_tag, cancel, callback);
    if (!data) {
        transfer_log_context ctx;
        ctx.transfer_id = id;
        ctx.error_message = data.error().message;
        ST_LOG_WARN_CTX(log_category::retrieval, "Retrieval failed", ctx);
        return unexpected(data.error());
    }

    auto committed = impl_->lifecycle.commit_download(id, data.value().size());
    if (!committed) {
        return unexpected(committed.error());
    }

    transfer_log_context ctx;
    ctx.transfer_id = id;
    ctx.filename = record.value().original_filename;
    ctx.original_size = data.value().size();
    ctx.duration_ms = elapsed_ms(started);
    ST_LOG_INFO_CTX(log_category::retrieval, "Transfer downloaded", ctx);

    notify_progress(callback, {id, transfer_stage::complete, data.value().size(),
                               data.value().size()});

    retrieved_file file;
    file.data = std::move(data.value());
    file.filename = record.value().original_filename;
    file.mime_type = record.value().mime_type.empty() ? "application/octet-stream"
                                                      : record.value().mime_type;
    return file;
}

auto secure_transfer_service::remove(const std::string& id) -> result<void> {
    return impl_->lifecycle.remove(id);
}

auto secure_transfer_service::list_transfers(std::size_t limit, std::size_t offset)
    -> std::vector<transfer_metadata> {
    impl_->lifecycle.sweep_expired();

    std::vector<transfer_metadata> out;
    for (const auto& record : impl_->lifecycle.list_active(limit, offset)) {
        out.push_back(transfer_metadata::from_record(record));
    }
    return out;
}

auto secure_transfer_service::get_transfer_details(const std::string& id)
    -> result<transfer_details> {
    auto record = impl_->lifecycle.find(id);
    if (!record || record.value().status == transfer_status::deleted) {
        return make_error(error_code::not_found, "Transfer not found");
    }

    transfer_details details;
    details.metadata = transfer_metadata::from_record(record.value());
    details.logs = impl_->lifecycle.logs(id);
    return details;
}

auto secure_transfer_service::get_statistics() const -> transfer_statistics {
    return impl_->lifecycle.statistics();
}

auto secure_transfer_service::purge_stale_uploads(std::chrono::milliseconds max_age)
    -> std::size_t {
    return impl_->chunks.purge_stale(max_age);
}

auto secure_transfer_service::purge_stale_uploads() -> std::size_t {
    return impl_->chunks.purge_stale(impl_->config.stale_upload_age);
}

auto secure_transfer_service::sweep_expired() -> std::size_t {
    return impl_->lifecycle.sweep_expired();
}

void secure_transfer_service::on_progress(progress_callback callback) {
    std::lock_guard lock(impl_->callback_mutex);
    impl_->progress_cb = std::move(callback);
}

auto secure_transfer_service::config() const -> const service_config& {
    return impl_->config;
}

}  // namespace kcenon::secure_transfer
