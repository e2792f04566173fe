/**
 * @file test_lifecycle_manager.cpp
 * @brief Unit tests for lifecycle_manager
 */

#include <gtest/gtest.h>

#include <kcenon/secure_transfer/service/lifecycle_manager.h>

#include <atomic>
#include <chrono>
#include <filesystem>
#include <random>
#include <thread>
#include <vector>

namespace kcenon::secure_transfer::test {

using namespace std::chrono_literals;

class LifecycleManagerTest : public ::testing::Test {
protected:
    void SetUp() override {
        base_dir_ = std::filesystem::temp_directory_path() /
                    ("secure_transfer_test_lifecycle_" + std::to_string(std::random_device{}()));
        auto storage = local_artifact_storage::create(base_dir_);
        ASSERT_TRUE(storage.has_value());
        artifacts_ = std::move(storage.value());

        records_ = std::make_shared<memory_transfer_store>();
        logs_ = std::make_shared<memory_transfer_log_store>();
        hasher_ = std::make_shared<pbkdf2_password_hasher>(1000);
        now_ = clock_type::now();

        manager_ = std::make_unique<lifecycle_manager>(
            records_, logs_, artifacts_, hasher_, [this] { return now_.load(); });
    }

    void TearDown() override {
        manager_.reset();
        std::error_code ec;
        std::filesystem::remove_all(base_dir_, ec);
    }

    auto make_record(const std::string& id) -> transfer_record {
        transfer_record record;
        record.id = id;
        record.original_filename = id + ".txt";
        record.original_size = 1000;
        record.compressed_size = 400;
        record.compression_ratio = 40.0;
        record.created_at = now_.load();
        return record;
    }

    auto register_with_artifact(transfer_record record) -> transfer_record {
        auto writer = artifacts_->open_writer(record.id);
        EXPECT_TRUE(writer.has_value());
        if (writer) {
            EXPECT_TRUE(writer.value()->write(to_bytes("ciphertext")).has_value());
            EXPECT_TRUE(writer.value()->commit().has_value());
        }
        auto registered = manager_->register_transfer(record);
        EXPECT_TRUE(registered.has_value());
        return registered ? registered.value() : record;
    }

    void advance(std::chrono::milliseconds delta) {
        now_.store(now_.load() + delta);
    }

    std::filesystem::path base_dir_;
    std::shared_ptr<local_artifact_storage> artifacts_;
    std::shared_ptr<memory_transfer_store> records_;
    std::shared_ptr<memory_transfer_log_store> logs_;
    std::shared_ptr<pbkdf2_password_hasher> hasher_;
    std::atomic<time_point> now_;
    std::unique_ptr<lifecycle_manager> manager_;
};

TEST_F(LifecycleManagerTest, RegisterAppendsUploadLog) {
    register_with_artifact(make_record("upload"));

    auto entries = manager_->logs("upload");
    ASSERT_EQ(entries.size(), 1u);
    EXPECT_EQ(entries[0].action, log_action::upload);
    EXPECT_EQ(entries[0].details,
              "{\"original_size\":1000,\"compressed_size\":400,\"compression_ratio\":40.00}");
}

TEST_F(LifecycleManagerTest, RegisterRejectsDuplicate) {
    register_with_artifact(make_record("twice"));
    auto again = manager_->register_transfer(make_record("twice"));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::already_exists);
}

TEST_F(LifecycleManagerTest, UnknownTransferIsNotFound) {
    auto access = manager_->check_access("nope", access_kind::download);
    ASSERT_FALSE(access.has_value());
    EXPECT_EQ(access.error().code, error_code::not_found);
}

TEST_F(LifecycleManagerTest, ExpiryIsAppliedLazily) {
    auto record = make_record("expiring");
    record.expires_at = now_.load() + 1h;
    register_with_artifact(record);

    EXPECT_TRUE(manager_->check_access("expiring", access_kind::metadata).has_value());

    // Exactly at the expiry instant the transfer is still valid
    advance(1h);
    EXPECT_TRUE(manager_->check_access("expiring", access_kind::download).has_value());

    advance(1ms);
    auto access = manager_->check_access("expiring", access_kind::download);
    ASSERT_FALSE(access.has_value());
    EXPECT_EQ(access.error().code, error_code::expired);

    auto stored = manager_->find("expiring");
    ASSERT_TRUE(stored.has_value());
    EXPECT_EQ(stored.value().status, transfer_status::expired);

    // Expired stays expired even for metadata queries
    auto metadata = manager_->check_access("expiring", access_kind::metadata);
    ASSERT_FALSE(metadata.has_value());
    EXPECT_EQ(metadata.error().code, error_code::expired);
}

TEST_F(LifecycleManagerTest, QuotaIsEnforced) {
    auto record = make_record("quota");
    record.max_downloads = 2;
    register_with_artifact(record);

    for (int i = 0; i < 2; ++i) {
        ASSERT_TRUE(manager_->check_access("quota", access_kind::download).has_value());
        auto committed = manager_->commit_download("quota", 1000);
        ASSERT_TRUE(committed.has_value());
        EXPECT_EQ(committed.value().download_count, static_cast<uint64_t>(i + 1));
    }

    auto access = manager_->check_access("quota", access_kind::download);
    ASSERT_FALSE(access.has_value());
    EXPECT_EQ(access.error().code, error_code::quota_exhausted);

    auto extra = manager_->commit_download("quota", 1000);
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code, error_code::quota_exhausted);

    auto entries = manager_->logs("quota");
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].action, log_action::download);
    EXPECT_EQ(entries[0].details, "{\"size\":1000}");
}

namespace {

// Lets another writer bump the record before each of the first swaps
class contended_transfer_store : public transfer_store {
public:
    explicit contended_transfer_store(int conflicts) : remaining_(conflicts) {}

    auto create(const transfer_record& record) -> result<transfer_record> override {
        return inner_.create(record);
    }
    auto get(const std::string& id) const -> result<transfer_record> override {
        return inner_.get(id);
    }
    auto compare_and_swap(const transfer_record& desired, uint64_t expected_version)
        -> result<transfer_record> override {
        if (remaining_ > 0) {
            --remaining_;
            auto current = inner_.get(desired.id);
            if (current) {
                EXPECT_TRUE(inner_.compare_and_swap(current.value(),
                                                    current.value().version).has_value());
            }
        }
        return inner_.compare_and_swap(desired, expected_version);
    }
    auto erase(const std::string& id) -> result<void> override { return inner_.erase(id); }
    auto list() const -> std::vector<transfer_record> override { return inner_.list(); }

    [[nodiscard]] auto remaining() const -> int { return remaining_; }

private:
    memory_transfer_store inner_;
    int remaining_;
};

}  // namespace

TEST_F(LifecycleManagerTest, CommitDownloadOutlastsContention) {
    auto contended = std::make_shared<contended_transfer_store>(200);
    lifecycle_manager manager(contended, logs_, artifacts_, hasher_,
                              [this] { return now_.load(); });

    auto record = make_record("busy");
    record.max_downloads = 1;
    ASSERT_TRUE(manager.register_transfer(record).has_value());

    auto committed = manager.commit_download("busy", 10);
    ASSERT_TRUE(committed.has_value());
    EXPECT_EQ(committed.value().download_count, 1u);
    EXPECT_EQ(contended->remaining(), 0);

    // Contention never turns into a quota bypass
    auto extra = manager.commit_download("busy", 10);
    ASSERT_FALSE(extra.has_value());
    EXPECT_EQ(extra.error().code, error_code::quota_exhausted);
}

TEST_F(LifecycleManagerTest, ExpiryTakesPrecedenceOverQuota) {
    auto record = make_record("both");
    record.max_downloads = 1;
    record.download_count = 1;
    record.expires_at = now_.load() + 1min;
    register_with_artifact(record);

    auto before = manager_->check_access("both", access_kind::download);
    ASSERT_FALSE(before.has_value());
    EXPECT_EQ(before.error().code, error_code::quota_exhausted);

    advance(2min);
    auto after = manager_->check_access("both", access_kind::download);
    ASSERT_FALSE(after.has_value());
    EXPECT_EQ(after.error().code, error_code::expired);
}

TEST_F(LifecycleManagerTest, PasswordGate) {
    auto hashed = manager_->hash_password("s3cret");
    ASSERT_TRUE(hashed.has_value());

    auto record = make_record("locked");
    record.password_hash = hashed.value();
    register_with_artifact(record);

    // Metadata does not need the password
    EXPECT_TRUE(manager_->check_access("locked", access_kind::metadata).has_value());

    auto missing = manager_->check_access("locked", access_kind::download);
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::unauthorized);

    auto empty = manager_->check_access("locked", access_kind::download, std::string{});
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::unauthorized);

    auto wrong = manager_->check_access("locked", access_kind::download, std::string("guess"));
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, error_code::unauthorized);

    EXPECT_TRUE(manager_->check_access("locked", access_kind::download,
                                       std::string("s3cret")).has_value());

    // Only a mismatched password is audited
    auto entries = manager_->logs("locked");
    ASSERT_EQ(entries.size(), 2u);
    EXPECT_EQ(entries[0].action, log_action::download_failed);
    EXPECT_EQ(entries[0].details, "{\"reason\":\"Invalid password\"}");
    EXPECT_EQ(entries[1].action, log_action::upload);
}

TEST_F(LifecycleManagerTest, PasswordIsIgnoredWhenNoneSet) {
    register_with_artifact(make_record("open"));
    EXPECT_TRUE(manager_->check_access("open", access_kind::download,
                                       std::string("anything")).has_value());
}

TEST_F(LifecycleManagerTest, RemoveDeletesRecordAndArtifact) {
    register_with_artifact(make_record("doomed"));
    ASSERT_TRUE(artifacts_->exists("doomed"));

    ASSERT_TRUE(manager_->remove("doomed").has_value());
    EXPECT_FALSE(artifacts_->exists("doomed"));
    EXPECT_FALSE(manager_->find("doomed").has_value());

    auto access = manager_->check_access("doomed", access_kind::metadata);
    ASSERT_FALSE(access.has_value());
    EXPECT_EQ(access.error().code, error_code::not_found);

    auto entries = manager_->logs("doomed");
    ASSERT_FALSE(entries.empty());
    EXPECT_EQ(entries[0].action, log_action::deleted);

    auto again = manager_->remove("doomed");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::not_found);
}

TEST_F(LifecycleManagerTest, RemoveToleratesMissingArtifact) {
    ASSERT_TRUE(manager_->register_transfer(make_record("orphan")).has_value());
    EXPECT_TRUE(manager_->remove("orphan").has_value());
    EXPECT_FALSE(manager_->find("orphan").has_value());
}

TEST_F(LifecycleManagerTest, RemoveExpiredTransfer) {
    auto record = make_record("old");
    record.expires_at = now_.load() + 1s;
    register_with_artifact(record);
    advance(2s);
    ASSERT_EQ(manager_->sweep_expired(), 1u);

    EXPECT_TRUE(manager_->remove("old").has_value());
    EXPECT_FALSE(artifacts_->exists("old"));
}

TEST_F(LifecycleManagerTest, SweepExpired) {
    for (int i = 0; i < 5; ++i) {
        auto record = make_record("sweep" + std::to_string(i));
        record.expires_at = now_.load() + std::chrono::minutes(i + 1);
        register_with_artifact(record);
    }
    register_with_artifact(make_record("forever"));

    advance(3min + 1s);
    EXPECT_EQ(manager_->sweep_expired(), 3u);
    EXPECT_EQ(manager_->sweep_expired(), 0u);
    EXPECT_EQ(manager_->list_active(50, 0).size(), 3u);
}

TEST_F(LifecycleManagerTest, ListActiveNewestFirstWithPaging) {
    for (int i = 0; i < 5; ++i) {
        register_with_artifact(make_record("list" + std::to_string(i)));
        advance(1s);
    }

    auto page = manager_->list_active(2, 0);
    ASSERT_EQ(page.size(), 2u);
    EXPECT_EQ(page[0].id, "list4");
    EXPECT_EQ(page[1].id, "list3");

    auto next = manager_->list_active(2, 2);
    ASSERT_EQ(next.size(), 2u);
    EXPECT_EQ(next[0].id, "list2");

    EXPECT_EQ(manager_->list_active(2, 4).size(), 1u);
    EXPECT_TRUE(manager_->list_active(2, 10).empty());
}

TEST_F(LifecycleManagerTest, StatisticsCoverActiveTransfers) {
    auto a = make_record("stat-a");
    a.original_size = 1000;
    a.compressed_size = 250;
    a.compression_ratio = 25.0;
    register_with_artifact(a);

    auto b = make_record("stat-b");
    b.original_size = 3000;
    b.compressed_size = 1000;
    b.compression_ratio = 33.34;
    register_with_artifact(b);
    ASSERT_TRUE(manager_->commit_download("stat-b", 3000).has_value());

    auto gone = make_record("stat-c");
    register_with_artifact(gone);
    ASSERT_TRUE(manager_->remove("stat-c").has_value());

    auto stats = manager_->statistics();
    EXPECT_EQ(stats.total_uploads, 2u);
    EXPECT_EQ(stats.total_downloads, 1u);
    EXPECT_EQ(stats.total_original_size, 4000u);
    EXPECT_EQ(stats.total_compressed_size, 1250u);
    EXPECT_EQ(stats.total_saved(), 2750u);
    EXPECT_DOUBLE_EQ(stats.average_compression_ratio, 29.17);
}

TEST_F(LifecycleManagerTest, ConcurrentDownloadsRespectQuota) {
    auto record = make_record("race");
    record.max_downloads = 3;
    register_with_artifact(record);

    constexpr int thread_count = 16;
    std::atomic<int> succeeded{0};
    std::atomic<int> exhausted{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            auto committed = manager_->commit_download("race", 10);
            if (committed) {
                succeeded++;
            } else if (committed.error().code == error_code::quota_exhausted) {
                exhausted++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), 3);
    EXPECT_EQ(exhausted.load(), thread_count - 3);
    EXPECT_EQ(manager_->find("race").value().download_count, 3u);
}

}  // namespace kcenon::secure_transfer::test
