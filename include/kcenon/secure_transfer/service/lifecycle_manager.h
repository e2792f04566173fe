/**
 * @file lifecycle_manager.h
 * @brief Transfer lifecycle: expiry, download quota, password gate and deletion
 */

#ifndef KCENON_SECURE_TRANSFER_SERVICE_LIFECYCLE_MANAGER_H
#define KCENON_SECURE_TRANSFER_SERVICE_LIFECYCLE_MANAGER_H

#include <kcenon/secure_transfer/encryption/password_hasher.h>
#include <kcenon/secure_transfer/service/service_types.h>
#include <kcenon/secure_transfer/storage/artifact_storage.h>
#include <kcenon/secure_transfer/storage/transfer_store.h>

#include <functional>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace kcenon::secure_transfer {

/**
 * @brief Kind of access being checked
 */
enum class access_kind {
    metadata,  ///< Metadata query; no password required
    download   ///< Full download; password enforced when set
};

/**
 * @brief Owns the state machine of transfer records
 *
 * A record starts active and moves to expired (lazily, on access past its
 * expiry time) or deleted. Every record mutation goes through a
 * compare-and-swap on the store, so concurrent requests for the same id
 * never lose an update and a quota of N admits at most N downloads.
 *
 * Checks run in a fixed order on every access:
 * -# unknown id or deleted record: not_found
 * -# expired status, or now past expires_at: expired
 * -# download quota reached: quota_exhausted
 * -# (download only) password missing or wrong: unauthorized
 */
class lifecycle_manager {
public:
    using clock_function = std::function<time_point()>;

    /**
     * @param clock Time source; system clock when empty
     */
    lifecycle_manager(std::shared_ptr<transfer_store> records,
                      std::shared_ptr<transfer_log_store> logs,
                      std::shared_ptr<artifact_storage> artifacts,
                      std::shared_ptr<password_hasher_interface> hasher,
                      clock_function clock = {});

    /**
     * @brief Persist a new record and append its upload log entry
     */
    [[nodiscard]] auto register_transfer(const transfer_record& record)
        -> result<transfer_record>;

    [[nodiscard]] auto hash_password(const std::string& password) -> result<std::string>;

    /**
     * @brief Gate an access to a transfer
     * @return Current record when the access is allowed
     */
    [[nodiscard]] auto check_access(const std::string& id,
                                    access_kind kind,
                                    const std::optional<std::string>& password = std::nullopt)
        -> result<transfer_record>;

    /**
     * @brief Count one completed download
     *
     * Re-checks the quota inside the compare-and-swap; the loser of a race
     * for the last download gets quota_exhausted.
     */
    [[nodiscard]] auto commit_download(const std::string& id, uint64_t bytes)
        -> result<transfer_record>;

    /**
     * @brief Delete a transfer
     *
     * The record is marked deleted first so it is unreachable, then the
     * artifact and the record are removed. If a step after the mark fails,
     * calling remove() again finishes the job.
     */
    [[nodiscard]] auto remove(const std::string& id) -> result<void>;

    /**
     * @brief Move every active record past its expiry time to expired
     * @return Number of records transitioned
     */
    auto sweep_expired() -> std::size_t;

    /**
     * @brief Active records, newest first
     */
    [[nodiscard]] auto list_active(std::size_t limit, std::size_t offset) const
        -> std::vector<transfer_record>;

    [[nodiscard]] auto find(const std::string& id) const -> result<transfer_record>;

    [[nodiscard]] auto logs(const std::string& id) const -> std::vector<transfer_log_entry>;

    [[nodiscard]] auto statistics() const -> transfer_statistics;

    [[nodiscard]] auto now() const -> time_point;

private:
    using mutation = std::function<result<void>(transfer_record&)>;

    /**
     * @brief Read-modify-write loop over compare_and_swap
     *
     * The mutation sees the latest stored copy and may veto the update by
     * returning an error, which is passed through.
     */
    [[nodiscard]] auto update_record(const std::string& id, const mutation& mutate)
        -> result<transfer_record>;

    [[nodiscard]] auto expire(const std::string& id) -> result<transfer_record>;

    void append_log(const std::string& id, log_action action, std::string details);

    std::shared_ptr<transfer_store> records_;
    std::shared_ptr<transfer_log_store> logs_;
    std::shared_ptr<artifact_storage> artifacts_;
    std::shared_ptr<password_hasher_interface> hasher_;
    clock_function clock_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_SERVICE_LIFECYCLE_MANAGER_H
