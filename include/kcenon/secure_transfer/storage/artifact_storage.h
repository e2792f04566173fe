/**
 * @file artifact_storage.h
 * @brief Ciphertext artifact storage (one blob per transfer)
 */

#ifndef KCENON_SECURE_TRANSFER_STORAGE_ARTIFACT_STORAGE_H
#define KCENON_SECURE_TRANSFER_STORAGE_ARTIFACT_STORAGE_H

#include <kcenon/secure_transfer/core/types.h>

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <span>
#include <string>

namespace kcenon::secure_transfer {

/**
 * @brief Incremental artifact writer
 *
 * Bytes land in a temporary location and become visible under the
 * artifact name only on commit(). Destroying an uncommitted writer
 * discards the partial artifact.
 */
class artifact_writer {
public:
    virtual ~artifact_writer() = default;

    [[nodiscard]] virtual auto write(std::span<const std::byte> data) -> result<void> = 0;

    /**
     * @brief Publish the artifact
     * @return Number of bytes written
     */
    [[nodiscard]] virtual auto commit() -> result<uint64_t> = 0;

    /**
     * @brief Discard the partial artifact
     */
    virtual void abort() = 0;

    [[nodiscard]] virtual auto bytes_written() const -> uint64_t = 0;
};

/**
 * @brief Incremental artifact reader
 */
class artifact_reader {
public:
    virtual ~artifact_reader() = default;

    /**
     * @brief Read up to buffer.size() bytes
     * @return Bytes read; 0 at end of artifact
     */
    [[nodiscard]] virtual auto read(std::span<std::byte> buffer) -> result<std::size_t> = 0;

    [[nodiscard]] virtual auto size() const -> uint64_t = 0;
};

/**
 * @brief Artifact storage backend interface
 *
 * Artifact names are transfer ids; a name may contain only ASCII letters,
 * digits, '-' and '_'.
 */
class artifact_storage {
public:
    virtual ~artifact_storage() = default;

    [[nodiscard]] virtual auto open_writer(const std::string& name)
        -> result<std::unique_ptr<artifact_writer>> = 0;

    /**
     * @return Reader, or not_found
     */
    [[nodiscard]] virtual auto open_reader(const std::string& name)
        -> result<std::unique_ptr<artifact_reader>> = 0;

    /**
     * @return Success, or not_found
     */
    [[nodiscard]] virtual auto remove(const std::string& name) -> result<void> = 0;

    [[nodiscard]] virtual auto exists(const std::string& name) const -> bool = 0;

    /**
     * @brief Read a whole artifact into memory
     */
    [[nodiscard]] auto read_all(const std::string& name) -> result<byte_buffer>;

    /**
     * @brief Check an artifact name for characters unsafe in a path
     */
    [[nodiscard]] static auto validate_name(const std::string& name) -> result<void>;
};

/**
 * @brief Artifacts as files named @c <name>.enc under a base directory
 *
 * Writers stage into @c <name>.enc.tmp and rename on commit.
 */
class local_artifact_storage : public artifact_storage {
public:
    /**
     * @brief Create storage, creating @p base_path if missing
     */
    [[nodiscard]] static auto create(const std::filesystem::path& base_path)
        -> result<std::unique_ptr<local_artifact_storage>>;

    [[nodiscard]] auto open_writer(const std::string& name)
        -> result<std::unique_ptr<artifact_writer>> override;
    [[nodiscard]] auto open_reader(const std::string& name)
        -> result<std::unique_ptr<artifact_reader>> override;
    [[nodiscard]] auto remove(const std::string& name) -> result<void> override;
    [[nodiscard]] auto exists(const std::string& name) const -> bool override;

    [[nodiscard]] auto base_path() const -> const std::filesystem::path&;

    /**
     * @brief Final on-disk path for an artifact name
     */
    [[nodiscard]] auto artifact_path(const std::string& name) const -> std::filesystem::path;

private:
    explicit local_artifact_storage(std::filesystem::path base_path);

    std::filesystem::path base_path_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_STORAGE_ARTIFACT_STORAGE_H
