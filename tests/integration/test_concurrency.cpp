/**
 * @file test_concurrency.cpp
 * @brief Concurrency tests for the secure transfer service
 *
 * This file contains tests for:
 * - Concurrent stores producing distinct transfers
 * - Racing downloads against a download quota
 * - Concurrent chunked uploads completing exactly once
 * - Mixed store / retrieve / remove traffic
 */

#include "test_fixtures.h"

#include <atomic>
#include <latch>
#include <mutex>
#include <set>
#include <thread>
#include <vector>

namespace kcenon::secure_transfer::test {

using namespace std::chrono_literals;

class ConcurrencyTest : public ServiceFixture {};

TEST_F(ConcurrencyTest, ConcurrentStoresProduceDistinctTransfers) {
    constexpr int thread_count = 8;
    constexpr int per_thread = 5;

    std::mutex mutex;
    std::vector<store_receipt> receipts;
    std::vector<byte_buffer> payloads;
    std::atomic<int> failures{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < per_thread; ++i) {
                auto data = make_binary(8 * 1024, static_cast<unsigned int>(t * 100 + i));
                auto receipt = service_->store(data, options("c.bin"));
                if (!receipt) {
                    failures++;
                    continue;
                }
                std::lock_guard lock(mutex);
                receipts.push_back(std::move(receipt.value()));
                payloads.push_back(std::move(data));
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(failures.load(), 0);
    ASSERT_EQ(receipts.size(), static_cast<std::size_t>(thread_count * per_thread));

    std::set<std::string> ids;
    for (const auto& r : receipts) {
        ids.insert(r.transfer_id);
    }
    EXPECT_EQ(ids.size(), receipts.size());

    for (std::size_t i = 0; i < receipts.size(); ++i) {
        auto file = service_->retrieve(receipts[i].transfer_id, receipts[i].key,
                                       receipts[i].auth_tag);
        ASSERT_TRUE(file.has_value());
        EXPECT_EQ(file.value().data, payloads[i]);
    }
}

TEST_F(ConcurrencyTest, RacingDownloadsRespectQuota) {
    constexpr int thread_count = 12;
    constexpr uint64_t quota = 3;

    auto data = make_text(64 * 1024);
    auto opts = options("race.txt", "text/plain");
    opts.max_downloads = quota;
    auto receipt = store_ok(data, opts);

    std::latch start(thread_count);
    std::atomic<int> succeeded{0};
    std::atomic<int> exhausted{0};
    std::atomic<int> other{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            auto file = service_->retrieve(receipt.transfer_id, receipt.key, receipt.auth_tag);
            if (file) {
                if (file.value().data == data) {
                    succeeded++;
                } else {
                    other++;
                }
            } else if (file.error().code == error_code::quota_exhausted) {
                exhausted++;
            } else {
                other++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(succeeded.load(), static_cast<int>(quota));
    EXPECT_EQ(exhausted.load(), thread_count - static_cast<int>(quota));
    EXPECT_EQ(other.load(), 0);

    auto details = service_->get_transfer_details(receipt.transfer_id);
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details.value().metadata.download_count, quota);

    std::size_t download_logs = 0;
    for (const auto& entry : details.value().logs) {
        if (entry.action == log_action::download) {
            ++download_logs;
        }
    }
    EXPECT_EQ(download_logs, quota);
}

TEST_F(ConcurrencyTest, QuotaOfOneYieldsOneSuccess) {
    auto opts = options("once.bin");
    opts.max_downloads = 1;
    auto receipt = store_ok(make_binary(16 * 1024), opts);

    std::latch start(2);
    std::atomic<int> succeeded{0};
    std::atomic<int> exhausted{0};

    auto download = [&] {
        start.arrive_and_wait();
        auto file = service_->retrieve(receipt.transfer_id, receipt.key, receipt.auth_tag);
        if (file) {
            succeeded++;
        } else if (file.error().code == error_code::quota_exhausted) {
            exhausted++;
        }
    };
    std::thread a(download);
    std::thread b(download);
    a.join();
    b.join();

    EXPECT_EQ(succeeded.load(), 1);
    EXPECT_EQ(exhausted.load(), 1);
}

TEST_F(ConcurrencyTest, ConcurrentChunksCompleteOnce) {
    constexpr uint64_t total = 16;
    constexpr std::size_t chunk_size = 4096;
    auto data = make_binary(total * chunk_size, 7);

    std::atomic<int> completions{0};
    std::mutex mutex;
    byte_buffer assembled;

    std::latch start(static_cast<std::ptrdiff_t>(total));
    std::vector<std::thread> threads;
    for (uint64_t i = 0; i < total; ++i) {
        threads.emplace_back([&, i] {
            byte_buffer chunk(data.begin() + static_cast<std::ptrdiff_t>(i * chunk_size),
                              data.begin() + static_cast<std::ptrdiff_t>((i + 1) * chunk_size));
            start.arrive_and_wait();
            auto progress = service_->store_chunk("parallel", i, total, chunk);
            if (progress && progress.value().complete) {
                completions++;
                std::lock_guard lock(mutex);
                assembled = *progress.value().assembled;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(completions.load(), 1);
    EXPECT_EQ(assembled, data);
}

TEST_F(ConcurrencyTest, ConcurrentRemoveSucceedsOnce) {
    auto receipt = store_ok(make_binary(4096), options("remove.bin"));

    constexpr int thread_count = 8;
    std::latch start(thread_count);
    std::atomic<int> ok{0};
    std::atomic<int> not_found{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            auto removed = service_->remove(receipt.transfer_id);
            if (removed) {
                ok++;
            } else if (removed.error().code == error_code::not_found) {
                not_found++;
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_GE(ok.load(), 1);
    EXPECT_EQ(ok.load() + not_found.load(), thread_count);
    EXPECT_FALSE(std::filesystem::exists(artifact_path(receipt.transfer_id)));
    EXPECT_FALSE(service_->get_metadata(receipt.transfer_id).has_value());
}

TEST_F(ConcurrencyTest, MixedTraffic) {
    constexpr int thread_count = 6;
    constexpr int rounds = 10;
    std::atomic<int> errors{0};

    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&, t] {
            for (int i = 0; i < rounds; ++i) {
                auto data = make_text(static_cast<std::size_t>(1000 + t * 100 + i));
                auto receipt = service_->store(data, options("mixed.txt", "text/plain"));
                if (!receipt) {
                    errors++;
                    continue;
                }
                auto file = service_->retrieve(receipt.value().transfer_id,
                                               receipt.value().key,
                                               receipt.value().auth_tag);
                if (!file || file.value().data != data) {
                    errors++;
                }
                (void)service_->list_transfers(10, 0);
                if (i % 2 == 0 && !service_->remove(receipt.value().transfer_id)) {
                    errors++;
                }
            }
        });
    }
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(errors.load(), 0);
    auto stats = service_->get_statistics();
    EXPECT_EQ(stats.total_uploads, static_cast<uint64_t>(thread_count * rounds / 2));
    EXPECT_EQ(stats.total_downloads, static_cast<uint64_t>(thread_count * rounds / 2));
    EXPECT_EQ(staging_files(), 0u);
}

TEST_F(ConcurrencyTest, ExpiryRacesWithDownload) {
    auto opts = options("expiring.bin");
    opts.expires_in_hours = 1.0;
    auto receipt = store_ok(make_binary(2048), opts);

    advance(1h + 1ms);

    constexpr int thread_count = 8;
    std::latch start(thread_count + 1);
    std::atomic<int> expired{0};
    std::vector<std::thread> threads;
    for (int t = 0; t < thread_count; ++t) {
        threads.emplace_back([&] {
            start.arrive_and_wait();
            auto file = service_->retrieve(receipt.transfer_id, receipt.key, receipt.auth_tag);
            if (!file && file.error().code == error_code::expired) {
                expired++;
            }
        });
    }
    start.arrive_and_wait();
    service_->sweep_expired();
    for (auto& t : threads) {
        t.join();
    }

    EXPECT_EQ(expired.load(), thread_count);
    auto details = service_->get_transfer_details(receipt.transfer_id);
    ASSERT_TRUE(details.has_value());
    EXPECT_EQ(details.value().metadata.status, transfer_status::expired);
    EXPECT_EQ(details.value().metadata.download_count, 0u);
}

}  // namespace kcenon::secure_transfer::test
