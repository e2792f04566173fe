/**
 * @file transfer_store.cpp
 * @brief In-memory record and audit log stores
 */

#include <kcenon/secure_transfer/storage/transfer_store.h>

#include <algorithm>
#include <functional>

namespace kcenon::secure_transfer {

// ============================================================================
// memory_transfer_store
// ============================================================================

auto memory_transfer_store::shard_for(const std::string& id) -> shard& {
    return shards_[std::hash<std::string>{}(id) % shard_count];
}

auto memory_transfer_store::shard_for(const std::string& id) const -> const shard& {
    return shards_[std::hash<std::string>{}(id) % shard_count];
}

auto memory_transfer_store::create(const transfer_record& record) -> result<transfer_record> {
    if (record.id.empty()) {
        return make_error(error_code::validation_error, "Transfer id is empty");
    }

    auto& s = shard_for(record.id);
    std::unique_lock lock(s.mutex);
    auto [it, inserted] = s.records.try_emplace(record.id, record);
    if (!inserted) {
        return make_error(error_code::already_exists, "Transfer already exists: " + record.id);
    }
    it->second.version = 1;
    return it->second;
}

auto memory_transfer_store::get(const std::string& id) const -> result<transfer_record> {
    const auto& s = shard_for(id);
    std::shared_lock lock(s.mutex);
    auto it = s.records.find(id);
    if (it == s.records.end()) {
        return make_error(error_code::not_found, "Transfer not found: " + id);
    }
    return it->second;
}

auto memory_transfer_store::compare_and_swap(const transfer_record& desired,
                                             uint64_t expected_version)
    -> result<transfer_record> {
    auto& s = shard_for(desired.id);
    std::unique_lock lock(s.mutex);
    auto it = s.records.find(desired.id);
    if (it == s.records.end()) {
        return make_error(error_code::not_found, "Transfer not found: " + desired.id);
    }
    if (it->second.version != expected_version) {
        return make_error(error_code::version_conflict,
            "Transfer " + desired.id + " changed concurrently (expected version " +
            std::to_string(expected_version) + ", found " +
            std::to_string(it->second.version) + ")");
    }

    it->second = desired;
    it->second.version = expected_version + 1;
    return it->second;
}

auto memory_transfer_store::erase(const std::string& id) -> result<void> {
    auto& s = shard_for(id);
    std::unique_lock lock(s.mutex);
    if (s.records.erase(id) == 0) {
        return make_error(error_code::not_found, "Transfer not found: " + id);
    }
    return {};
}

auto memory_transfer_store::list() const -> std::vector<transfer_record> {
    std::vector<transfer_record> out;
    for (const auto& s : shards_) {
        std::shared_lock lock(s.mutex);
        for (const auto& [id, record] : s.records) {
            out.push_back(record);
        }
    }
    return out;
}

auto memory_transfer_store::size() const -> std::size_t {
    std::size_t total = 0;
    for (const auto& s : shards_) {
        std::shared_lock lock(s.mutex);
        total += s.records.size();
    }
    return total;
}

// ============================================================================
// memory_transfer_log_store
// ============================================================================

auto memory_transfer_log_store::append(transfer_log_entry entry) -> result<void> {
    if (entry.transfer_id.empty()) {
        return make_error(error_code::validation_error, "Log entry has no transfer id");
    }

    entry.sequence = next_sequence_.fetch_add(1);
    std::unique_lock lock(mutex_);
    entries_[entry.transfer_id].push_back(std::move(entry));
    return {};
}

auto memory_transfer_log_store::list_by_transfer(const std::string& transfer_id) const
    -> std::vector<transfer_log_entry> {
    std::vector<transfer_log_entry> out;
    {
        std::shared_lock lock(mutex_);
        auto it = entries_.find(transfer_id);
        if (it == entries_.end()) {
            return out;
        }
        out = it->second;
    }

    // Newest first; the sequence breaks timestamp ties
    std::sort(out.begin(), out.end(), [](const auto& a, const auto& b) {
        if (a.timestamp != b.timestamp) {
            return a.timestamp > b.timestamp;
        }
        return a.sequence > b.sequence;
    });
    return out;
}

auto memory_transfer_log_store::size() const -> std::size_t {
    std::shared_lock lock(mutex_);
    std::size_t total = 0;
    for (const auto& [id, list] : entries_) {
        total += list.size();
    }
    return total;
}

}  // namespace kcenon::secure_transfer
