/**
 * @file lifecycle_manager.cpp
 * @brief Implementation of the transfer lifecycle state machine
 */

#include <kcenon/secure_transfer/service/lifecycle_manager.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <iterator>

namespace kcenon::secure_transfer {

namespace {

auto format_double(double value) -> std::string {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "%.2f", value);
    return buf;
}

auto upload_details(const transfer_record& record) -> std::string {
    return "{\"original_size\":" + std::to_string(record.original_size) +
           ",\"compressed_size\":" + std::to_string(record.compressed_size) +
           ",\"compression_ratio\":" + format_double(record.compression_ratio) + "}";
}

auto reason_details(std::string_view reason) -> std::string {
    return "{\"reason\":\"" + detail::escape_json(reason) + "\"}";
}

}  // namespace

lifecycle_manager::lifecycle_manager(std::shared_ptr<transfer_store> records,
                                     std::shared_ptr<transfer_log_store> logs,
                                     std::shared_ptr<artifact_storage> artifacts,
                                     std::shared_ptr<password_hasher_interface> hasher,
                                     clock_function clock)
    : records_(std::move(records)),
      logs_(std::move(logs)),
      artifacts_(std::move(artifacts)),
      hasher_(std::move(hasher)),
      clock_(std::move(clock)) {
    if (!clock_) {
        clock_ = [] { return clock_type::now(); };
    }
}

auto lifecycle_manager::now() const -> time_point {
    return clock_();
}

auto lifecycle_manager::register_transfer(const transfer_record& record)
    -> result<transfer_record> {
    auto created = records_->create(record);
    if (!created) {
        ST_LOG_ERROR(log_category::lifecycle,
            "Failed to register transfer " + record.id + ": " + created.error().message);
        return unexpected(created.error());
    }

    append_log(record.id, log_action::upload, upload_details(created.value()));
    return created;
}

auto lifecycle_manager::hash_password(const std::string& password) -> result<std::string> {
    return hasher_->hash(password);
}

auto lifecycle_manager::check_access(const std::string& id,
                                     access_kind kind,
                                     const std::optional<std::string>& password)
    -> result<transfer_record> {
    auto found = records_->get(id);
    if (!found || found.value().status == transfer_status::deleted) {
        return make_error(error_code::not_found, "Transfer not found");
    }

    transfer_record record = found.value();
    if (record.status == transfer_status::expired) {
        return make_error(error_code::expired, "Transfer has expired");
    }

    if (record.is_past_expiry(now())) {
        auto expired = expire(id);
        if (!expired && expired.error().code != error_code::expired) {
            return unexpected(expired.error());
        }
        return make_error(error_code::expired, "Transfer has expired");
    }

    if (record.quota_exhausted()) {
        return make_error(error_code::quota_exhausted, "Download limit reached");
    }

    if (kind == access_kind::download && record.has_password()) {
        if (!password || password->empty()) {
            return make_error(error_code::unauthorized, "Password required");
        }
        if (!hasher_->verify(*password, *record.password_hash)) {
            append_log(id, log_action::download_failed, reason_details("Invalid password"));
            ST_LOG_WARN(log_category::lifecycle, "Invalid password for transfer " + id);
            return make_error(error_code::unauthorized, "Invalid password");
        }
    }

    return record;
}

auto lifecycle_manager::commit_download(const std::string& id, uint64_t bytes)
    -> result<transfer_record> {
    auto updated = update_record(id, [](transfer_record& record) -> result<void> {
        if (record.status == transfer_status::deleted) {
            return make_error(error_code::not_found, "Transfer not found");
        }
        if (record.status == transfer_status::expired) {
            return make_error(error_code::expired, "Transfer has expired");
        }
        if (record.quota_exhausted()) {
            return make_error(error_code::quota_exhausted, "Download limit reached");
        }
        record.download_count++;
        return {};
    });

    if (!updated) {
        return updated;
    }

    append_log(id, log_action::download, "{\"size\":" + std::to_string(bytes) + "}");
    return updated;
}

auto lifecycle_manager::remove(const std::string& id) -> result<void> {
    auto marked = update_record(id, [](transfer_record& record) -> result<void> {
        record.status = transfer_status::deleted;
        return {};
    });
    if (!marked) {
        return unexpected(marked.error());
    }

    auto removed = artifacts_->remove(id);
    if (!removed && removed.error().code != error_code::not_found) {
        ST_LOG_ERROR(log_category::lifecycle,
            "Failed to remove artifact for " + id + ": " + removed.error().message);
        return removed;
    }

    auto erased = records_->erase(id);
    if (!erased) {
        // A concurrent remove() finished first
        if (erased.error().code == error_code::not_found) {
            return {};
        }
        return erased;
    }

    append_log(id, log_action::deleted, {});
    ST_LOG_INFO(log_category::lifecycle, "Transfer " + id + " deleted");
    return {};
}

auto lifecycle_manager::sweep_expired() -> std::size_t {
    const auto current = now();
    std::size_t count = 0;

    for (const auto& record : records_->list()) {
        if (record.status != transfer_status::active || !record.is_past_expiry(current)) {
            continue;
        }
        auto expired = expire(record.id);
        if (expired) {
            ++count;
        }
    }

    if (count > 0) {
        ST_LOG_INFO(log_category::lifecycle,
            "Expired " + std::to_string(count) + " transfers");
    }
    return count;
}

auto lifecycle_manager::list_active(std::size_t limit, std::size_t offset) const
    -> std::vector<transfer_record> {
    std::vector<transfer_record> active;
    for (auto& record : records_->list()) {
        if (record.status == transfer_status::active) {
            active.push_back(std::move(record));
        }
    }

    std::sort(active.begin(), active.end(),
              [](const transfer_record& a, const transfer_record& b) {
                  if (a.created_at != b.created_at) {
                      return a.created_at > b.created_at;
                  }
                  return a.id < b.id;
              });

    if (offset >= active.size()) {
        return {};
    }
    const auto last = std::min(active.size(), offset + limit);
    return std::vector<transfer_record>(
        std::make_move_iterator(active.begin() + static_cast<std::ptrdiff_t>(offset)),
        std::make_move_iterator(active.begin() + static_cast<std::ptrdiff_t>(last)));
}

auto lifecycle_manager::find(const std::string& id) const -> result<transfer_record> {
    return records_->get(id);
}

auto lifecycle_manager::logs(const std::string& id) const -> std::vector<transfer_log_entry> {
    return logs_->list_by_transfer(id);
}

auto lifecycle_manager::statistics() const -> transfer_statistics {
    transfer_statistics stats;
    double ratio_sum = 0.0;

    for (const auto& record : records_->list()) {
        if (record.status != transfer_status::active) {
            continue;
        }
        stats.total_uploads++;
        stats.total_downloads += record.download_count;
        stats.total_original_size += record.original_size;
        stats.total_compressed_size += record.compressed_size;
        ratio_sum += record.compression_ratio;
    }

    if (stats.total_uploads > 0) {
        const double mean = ratio_sum / static_cast<double>(stats.total_uploads);
        stats.average_compression_ratio = std::round(mean * 100.0) / 100.0;
    }
    return stats;
}

auto lifecycle_manager::update_record(const std::string& id, const mutation& mutate)
    -> result<transfer_record> {
    // A version conflict means another writer committed, so retry on the new state
    while (true) {
        auto current = records_->get(id);
        if (!current) {
            return unexpected(current.error());
        }

        transfer_record desired = current.value();
        auto allowed = mutate(desired);
        if (!allowed) {
            return unexpected(allowed.error());
        }

        auto swapped = records_->compare_and_swap(desired, current.value().version);
        if (swapped || swapped.error().code != error_code::version_conflict) {
            return swapped;
        }
    }
}

auto lifecycle_manager::expire(const std::string& id) -> result<transfer_record> {
    const auto current = now();
    auto updated = update_record(id, [current](transfer_record& record) -> result<void> {
        if (record.status != transfer_status::active) {
            return make_error(error_code::expired, "Transfer is no longer active");
        }
        if (!record.is_past_expiry(current)) {
            return make_error(error_code::validation_error, "Transfer is not past its expiry");
        }
        record.status = transfer_status::expired;
        return {};
    });

    if (updated) {
        ST_LOG_INFO(log_category::lifecycle, "Transfer " + id + " expired");
    }
    return updated;
}

void lifecycle_manager::append_log(const std::string& id, log_action action, std::string details) {
    transfer_log_entry entry;
    entry.transfer_id = id;
    entry.action = action;
    entry.timestamp = now();
    entry.details = std::move(details);

    auto appended = logs_->append(std::move(entry));
    if (!appended) {
        ST_LOG_WARN(log_category::lifecycle,
            std::string("Failed to append ") + to_string(action) + " log for " + id + ": " +
            appended.error().message);
    }
}

}  // namespace kcenon::secure_transfer
