/**
 * @file test_transfer_store.cpp
 * @brief Unit tests for the in-memory record and audit log stores
 */

#include <gtest/gtest.h>

#include <kcenon/secure_transfer/storage/transfer_store.h>

#include <atomic>
#include <chrono>
#include <string>
#include <thread>
#include <vector>

namespace kcenon::secure_transfer::test {

namespace {

auto make_record(const std::string& id) -> transfer_record {
    transfer_record record;
    record.id = id;
    record.original_filename = id + ".bin";
    record.original_size = 100;
    record.compressed_size = 60;
    record.created_at = clock_type::now();
    return record;
}

}  // namespace

// ============================================================================
// memory_transfer_store
// ============================================================================

class TransferStoreTest : public ::testing::Test {
protected:
    memory_transfer_store store_;
};

TEST_F(TransferStoreTest, CreateAssignsFirstVersion) {
    auto created = store_.create(make_record("alpha"));
    ASSERT_TRUE(created.has_value());
    EXPECT_EQ(created.value().version, 1u);
    EXPECT_EQ(store_.size(), 1u);

    auto fetched = store_.get("alpha");
    ASSERT_TRUE(fetched.has_value());
    EXPECT_EQ(fetched.value().original_filename, "alpha.bin");
    EXPECT_EQ(fetched.value().version, 1u);
}

TEST_F(TransferStoreTest, CreateRejectsDuplicatesAndEmptyIds) {
    ASSERT_TRUE(store_.create(make_record("dup")).has_value());

    auto again = store_.create(make_record("dup"));
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::already_exists);

    auto empty = store_.create(make_record(""));
    ASSERT_FALSE(empty.has_value());
    EXPECT_EQ(empty.error().code, error_code::validation_error);
}

TEST_F(TransferStoreTest, GetMissing) {
    auto missing = store_.get("ghost");
    ASSERT_FALSE(missing.has_value());
    EXPECT_EQ(missing.error().code, error_code::not_found);
}

TEST_F(TransferStoreTest, CompareAndSwapBumpsVersion) {
    auto created = store_.create(make_record("cas"));
    ASSERT_TRUE(created.has_value());

    auto desired = created.value();
    desired.download_count = 1;
    auto swapped = store_.compare_and_swap(desired, 1);
    ASSERT_TRUE(swapped.has_value());
    EXPECT_EQ(swapped.value().version, 2u);
    EXPECT_EQ(swapped.value().download_count, 1u);

    // A writer holding the stale version loses
    auto stale = store_.compare_and_swap(desired, 1);
    ASSERT_FALSE(stale.has_value());
    EXPECT_EQ(stale.error().code, error_code::version_conflict);
    EXPECT_EQ(store_.get("cas").value().download_count, 1u);
}

TEST_F(TransferStoreTest, CompareAndSwapMissing) {
    auto result = store_.compare_and_swap(make_record("ghost"), 1);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::not_found);
}

TEST_F(TransferStoreTest, Erase) {
    ASSERT_TRUE(store_.create(make_record("gone")).has_value());
    EXPECT_TRUE(store_.erase("gone").has_value());
    EXPECT_FALSE(store_.get("gone").has_value());

    auto again = store_.erase("gone");
    ASSERT_FALSE(again.has_value());
    EXPECT_EQ(again.error().code, error_code::not_found);
}

TEST_F(TransferStoreTest, ListReturnsEverything) {
    for (int i = 0; i < 40; ++i) {
        ASSERT_TRUE(store_.create(make_record("r" + std::to_string(i))).has_value());
    }
    EXPECT_EQ(store_.list().size(), 40u);
}

TEST_F(TransferStoreTest, ConcurrentIncrementsViaRetryLoop) {
    ASSERT_TRUE(store_.create(make_record("counter")).has_value());

    constexpr int thread_count = 8;
    constexpr int increments = 200;
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            for (int i = 0; i < increments; ++i) {
                while (true) {
                    auto current = store_.get("counter");
                    if (!current) return;
                    auto desired = current.value();
                    desired.download_count++;
                    if (store_.compare_and_swap(desired, current.value().version)) {
                        break;
                    }
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    auto final_record = store_.get("counter");
    ASSERT_TRUE(final_record.has_value());
    EXPECT_EQ(final_record.value().download_count,
              static_cast<uint64_t>(thread_count * increments));
    EXPECT_EQ(final_record.value().version,
              static_cast<uint64_t>(thread_count * increments + 1));
}

// ============================================================================
// memory_transfer_log_store
// ============================================================================

class TransferLogStoreTest : public ::testing::Test {
protected:
    auto entry(const std::string& id, log_action action, time_point ts)
        -> transfer_log_entry {
        transfer_log_entry e;
        e.transfer_id = id;
        e.action = action;
        e.timestamp = ts;
        return e;
    }

    memory_transfer_log_store logs_;
};

TEST_F(TransferLogStoreTest, NewestFirst) {
    const auto base = clock_type::now();
    ASSERT_TRUE(logs_.append(entry("t", log_action::upload, base)).has_value());
    ASSERT_TRUE(logs_.append(
        entry("t", log_action::download, base + std::chrono::seconds(2))).has_value());
    ASSERT_TRUE(logs_.append(
        entry("t", log_action::download_failed, base + std::chrono::seconds(1))).has_value());

    auto listed = logs_.list_by_transfer("t");
    ASSERT_EQ(listed.size(), 3u);
    EXPECT_EQ(listed[0].action, log_action::download);
    EXPECT_EQ(listed[1].action, log_action::download_failed);
    EXPECT_EQ(listed[2].action, log_action::upload);
}

TEST_F(TransferLogStoreTest, SequenceBreaksTimestampTies) {
    const auto ts = clock_type::now();
    ASSERT_TRUE(logs_.append(entry("tie", log_action::upload, ts)).has_value());
    ASSERT_TRUE(logs_.append(entry("tie", log_action::download, ts)).has_value());

    auto listed = logs_.list_by_transfer("tie");
    ASSERT_EQ(listed.size(), 2u);
    EXPECT_EQ(listed[0].action, log_action::download);
    EXPECT_GT(listed[0].sequence, listed[1].sequence);
}

TEST_F(TransferLogStoreTest, EntriesAreScopedByTransfer) {
    const auto ts = clock_type::now();
    ASSERT_TRUE(logs_.append(entry("a", log_action::upload, ts)).has_value());
    ASSERT_TRUE(logs_.append(entry("b", log_action::upload, ts)).has_value());
    ASSERT_TRUE(logs_.append(entry("b", log_action::deleted, ts)).has_value());

    EXPECT_EQ(logs_.list_by_transfer("a").size(), 1u);
    EXPECT_EQ(logs_.list_by_transfer("b").size(), 2u);
    EXPECT_TRUE(logs_.list_by_transfer("c").empty());
    EXPECT_EQ(logs_.size(), 3u);
}

TEST_F(TransferLogStoreTest, RejectsEntryWithoutTransfer) {
    auto result = logs_.append(entry("", log_action::upload, clock_type::now()));
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, error_code::validation_error);
}

}  // namespace kcenon::secure_transfer::test
