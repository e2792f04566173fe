/**
 * @file transfer_store.h
 * @brief Key-value persistence for transfer records and audit logs
 */

#ifndef KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_STORE_H
#define KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_STORE_H

#include <kcenon/secure_transfer/storage/transfer_record.h>

#include <array>
#include <atomic>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::secure_transfer {

/**
 * @brief Record store with single-key atomicity
 *
 * Updates go through compare_and_swap() so concurrent writers of the same
 * record serialize on its version instead of on a transaction.
 */
class transfer_store {
public:
    virtual ~transfer_store() = default;

    /**
     * @brief Insert a new record
     * @return Stored copy with version 1, or already_exists
     */
    [[nodiscard]] virtual auto create(const transfer_record& record)
        -> result<transfer_record> = 0;

    /**
     * @return Record, or not_found
     */
    [[nodiscard]] virtual auto get(const std::string& id) const
        -> result<transfer_record> = 0;

    /**
     * @brief Replace a record if its stored version equals @p expected_version
     * @return Stored copy with version expected_version + 1, version_conflict
     *         when another writer got there first, or not_found
     */
    [[nodiscard]] virtual auto compare_and_swap(const transfer_record& desired,
                                                uint64_t expected_version)
        -> result<transfer_record> = 0;

    /**
     * @return Success, or not_found
     */
    [[nodiscard]] virtual auto erase(const std::string& id) -> result<void> = 0;

    /**
     * @brief Snapshot of all records in unspecified order
     */
    [[nodiscard]] virtual auto list() const -> std::vector<transfer_record> = 0;
};

/**
 * @brief Append-only audit log store
 */
class transfer_log_store {
public:
    virtual ~transfer_log_store() = default;

    [[nodiscard]] virtual auto append(transfer_log_entry entry) -> result<void> = 0;

    /**
     * @brief Entries for one transfer, newest first
     */
    [[nodiscard]] virtual auto list_by_transfer(const std::string& transfer_id) const
        -> std::vector<transfer_log_entry> = 0;
};

/**
 * @brief In-memory transfer_store
 *
 * Records are spread over independently locked shards, so operations on
 * different ids rarely touch the same mutex.
 */
class memory_transfer_store : public transfer_store {
public:
    memory_transfer_store() = default;

    [[nodiscard]] auto create(const transfer_record& record) -> result<transfer_record> override;
    [[nodiscard]] auto get(const std::string& id) const -> result<transfer_record> override;
    [[nodiscard]] auto compare_and_swap(const transfer_record& desired,
                                        uint64_t expected_version)
        -> result<transfer_record> override;
    [[nodiscard]] auto erase(const std::string& id) -> result<void> override;
    [[nodiscard]] auto list() const -> std::vector<transfer_record> override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    static constexpr std::size_t shard_count = 16;

    struct shard {
        std::unordered_map<std::string, transfer_record> records;
        mutable std::shared_mutex mutex;
    };

    [[nodiscard]] auto shard_for(const std::string& id) -> shard&;
    [[nodiscard]] auto shard_for(const std::string& id) const -> const shard&;

    std::array<shard, shard_count> shards_;
};

/**
 * @brief In-memory transfer_log_store
 */
class memory_transfer_log_store : public transfer_log_store {
public:
    [[nodiscard]] auto append(transfer_log_entry entry) -> result<void> override;
    [[nodiscard]] auto list_by_transfer(const std::string& transfer_id) const
        -> std::vector<transfer_log_entry> override;

    [[nodiscard]] auto size() const -> std::size_t;

private:
    std::unordered_map<std::string, std::vector<transfer_log_entry>> entries_;
    std::atomic<uint64_t> next_sequence_{1};
    mutable std::shared_mutex mutex_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_STORAGE_TRANSFER_STORE_H
