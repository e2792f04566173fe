/**
 * @file test_chunk_assembler.cpp
 * @brief Unit tests for chunk_assembler
 */

#include <gtest/gtest.h>

#include <kcenon/secure_transfer/core/chunk_assembler.h>

#include <algorithm>
#include <atomic>
#include <numeric>
#include <random>
#include <thread>
#include <vector>

namespace kcenon::secure_transfer::test {

class ChunkAssemblerTest : public ::testing::Test {
protected:
    static auto make_data(std::size_t size, uint32_t seed = 42) -> byte_buffer {
        std::mt19937 gen(seed);
        std::uniform_int_distribution<> dis(0, 255);
        byte_buffer data(size);
        for (auto& b : data) {
            b = static_cast<std::byte>(dis(gen));
        }
        return data;
    }

    static auto split(const byte_buffer& data, std::size_t chunk_size)
        -> std::vector<byte_buffer> {
        std::vector<byte_buffer> chunks;
        for (std::size_t offset = 0; offset < data.size(); offset += chunk_size) {
            auto end = std::min(data.size(), offset + chunk_size);
            chunks.emplace_back(data.begin() + static_cast<std::ptrdiff_t>(offset),
                                data.begin() + static_cast<std::ptrdiff_t>(end));
        }
        return chunks;
    }

    auto feed(const std::string& id, const std::vector<byte_buffer>& chunks,
              const std::vector<uint64_t>& order) -> result<chunk_progress> {
        result<chunk_progress> last = make_error(error_code::internal_error, "no chunks fed");
        for (auto index : order) {
            last = assembler_.accept_chunk(id, index, chunks.size(), chunks[index]);
            if (!last) {
                return last;
            }
        }
        return last;
    }

    chunk_assembler assembler_;
};

TEST_F(ChunkAssemblerTest, SingleChunkCompletesImmediately) {
    auto data = make_data(100);
    auto progress = assembler_.accept_chunk("single", 0, 1, data);

    ASSERT_TRUE(progress.has_value());
    EXPECT_TRUE(progress.value().complete);
    EXPECT_DOUBLE_EQ(progress.value().fraction(), 1.0);
    ASSERT_TRUE(progress.value().assembled.has_value());
    EXPECT_EQ(*progress.value().assembled, data);
    EXPECT_FALSE(assembler_.has_session("single"));
}

TEST_F(ChunkAssemblerTest, ReportsFractionAfterEachChunk) {
    auto data = make_data(400);
    auto chunks = split(data, 100);

    auto first = assembler_.accept_chunk("frac", 0, 4, chunks[0]);
    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(first.value().complete);
    EXPECT_DOUBLE_EQ(first.value().fraction(), 0.25);
    EXPECT_FALSE(first.value().assembled.has_value());

    auto second = assembler_.accept_chunk("frac", 2, 4, chunks[2]);
    ASSERT_TRUE(second.has_value());
    EXPECT_DOUBLE_EQ(second.value().fraction(), 0.5);
    EXPECT_EQ(second.value().received_chunks, 2u);
    EXPECT_EQ(second.value().total_chunks, 4u);
}

TEST_F(ChunkAssemblerTest, ForwardOrderReassembly) {
    auto data = make_data(10000);
    auto chunks = split(data, 1000);
    std::vector<uint64_t> order(chunks.size());
    std::iota(order.begin(), order.end(), 0);

    auto progress = feed("forward", chunks, order);
    ASSERT_TRUE(progress.has_value());
    ASSERT_TRUE(progress.value().complete);
    EXPECT_EQ(*progress.value().assembled, data);
}

TEST_F(ChunkAssemblerTest, ReverseOrderReassembly) {
    auto data = make_data(10000);
    auto chunks = split(data, 1000);
    std::vector<uint64_t> order(chunks.size());
    std::iota(order.rbegin(), order.rend(), 0);

    auto progress = feed("reverse", chunks, order);
    ASSERT_TRUE(progress.has_value());
    ASSERT_TRUE(progress.value().complete);
    EXPECT_EQ(*progress.value().assembled, data);
}

TEST_F(ChunkAssemblerTest, RandomOrderReassembly) {
    auto data = make_data(65536 + 17);
    auto chunks = split(data, 4096);
    std::vector<uint64_t> order(chunks.size());
    std::iota(order.begin(), order.end(), 0);
    std::mt19937 gen(42);
    std::shuffle(order.begin(), order.end(), gen);

    auto progress = feed("random", chunks, order);
    ASSERT_TRUE(progress.has_value());
    ASSERT_TRUE(progress.value().complete);
    EXPECT_EQ(*progress.value().assembled, data);
}

TEST_F(ChunkAssemblerTest, DuplicateChunkIsIgnored) {
    auto data = make_data(300);
    auto chunks = split(data, 100);

    ASSERT_TRUE(assembler_.accept_chunk("dup", 0, 3, chunks[0]).has_value());
    auto again = assembler_.accept_chunk("dup", 0, 3, chunks[0]);
    ASSERT_TRUE(again.has_value());
    EXPECT_EQ(again.value().received_chunks, 1u);

    ASSERT_TRUE(assembler_.accept_chunk("dup", 1, 3, chunks[1]).has_value());
    auto done = assembler_.accept_chunk("dup", 2, 3, chunks[2]);
    ASSERT_TRUE(done.has_value());
    ASSERT_TRUE(done.value().complete);
    EXPECT_EQ(*done.value().assembled, data);
}

TEST_F(ChunkAssemblerTest, MissingChunksAndProgress) {
    auto data = make_data(500);
    auto chunks = split(data, 100);

    ASSERT_TRUE(assembler_.accept_chunk("gaps", 1, 5, chunks[1]).has_value());
    ASSERT_TRUE(assembler_.accept_chunk("gaps", 3, 5, chunks[3]).has_value());

    auto missing = assembler_.get_missing_chunks("gaps");
    EXPECT_EQ(missing, (std::vector<uint64_t>{0, 2, 4}));

    auto progress = assembler_.get_progress("gaps");
    ASSERT_TRUE(progress.has_value());
    EXPECT_EQ(progress->received_chunks, 2u);
    EXPECT_EQ(progress->bytes_received, 200u);
    EXPECT_DOUBLE_EQ(progress->completion_percentage(), 40.0);
}

TEST_F(ChunkAssemblerTest, UnknownSession) {
    EXPECT_FALSE(assembler_.has_session("nope"));
    EXPECT_FALSE(assembler_.get_progress("nope").has_value());
    EXPECT_TRUE(assembler_.get_missing_chunks("nope").empty());
}

TEST_F(ChunkAssemblerTest, RejectsInvalidChunks) {
    auto data = make_data(10);

    auto empty_id = assembler_.accept_chunk("", 0, 1, data);
    ASSERT_FALSE(empty_id.has_value());
    EXPECT_EQ(empty_id.error().code, error_code::validation_error);

    auto zero_total = assembler_.accept_chunk("x", 0, 0, data);
    ASSERT_FALSE(zero_total.has_value());
    EXPECT_EQ(zero_total.error().code, error_code::validation_error);

    auto out_of_range = assembler_.accept_chunk("x", 3, 3, data);
    ASSERT_FALSE(out_of_range.has_value());
    EXPECT_EQ(out_of_range.error().code, error_code::validation_error);

    auto no_data = assembler_.accept_chunk("x", 0, 3, byte_buffer{});
    ASSERT_FALSE(no_data.has_value());
    EXPECT_EQ(no_data.error().code, error_code::validation_error);
}

TEST_F(ChunkAssemblerTest, RejectsTotalMismatch) {
    auto data = make_data(10);
    ASSERT_TRUE(assembler_.accept_chunk("mismatch", 0, 3, data).has_value());

    auto wrong = assembler_.accept_chunk("mismatch", 1, 4, data);
    ASSERT_FALSE(wrong.has_value());
    EXPECT_EQ(wrong.error().code, error_code::validation_error);
    EXPECT_TRUE(assembler_.has_session("mismatch"));
}

TEST_F(ChunkAssemblerTest, OversizedUploadIsDiscarded) {
    chunk_assembler small(250);
    auto data = make_data(100);

    ASSERT_TRUE(small.accept_chunk("big", 0, 3, data).has_value());
    ASSERT_TRUE(small.accept_chunk("big", 1, 3, data).has_value());

    auto over = small.accept_chunk("big", 2, 3, data);
    ASSERT_FALSE(over.has_value());
    EXPECT_EQ(over.error().code, error_code::validation_error);
    EXPECT_FALSE(small.has_session("big"));
}

TEST_F(ChunkAssemblerTest, CancelSession) {
    auto data = make_data(10);
    ASSERT_TRUE(assembler_.accept_chunk("cancel", 0, 2, data).has_value());
    EXPECT_EQ(assembler_.session_count(), 1u);

    assembler_.cancel_session("cancel");
    EXPECT_FALSE(assembler_.has_session("cancel"));
    EXPECT_EQ(assembler_.session_count(), 0u);

    // A new upload under the same id starts fresh
    auto restarted = assembler_.accept_chunk("cancel", 1, 2, data);
    ASSERT_TRUE(restarted.has_value());
    EXPECT_EQ(restarted.value().received_chunks, 1u);
}

TEST_F(ChunkAssemblerTest, PurgeStaleSessions) {
    auto data = make_data(10);
    ASSERT_TRUE(assembler_.accept_chunk("stale", 0, 2, data).has_value());

    EXPECT_EQ(assembler_.purge_stale(std::chrono::hours(1)), 0u);
    EXPECT_TRUE(assembler_.has_session("stale"));

    std::this_thread::sleep_for(std::chrono::milliseconds(20));
    EXPECT_EQ(assembler_.purge_stale(std::chrono::milliseconds(5)), 1u);
    EXPECT_FALSE(assembler_.has_session("stale"));
}

TEST_F(ChunkAssemblerTest, IndependentSessions) {
    auto a = make_data(200, 1);
    auto b = make_data(200, 2);
    auto chunks_a = split(a, 100);
    auto chunks_b = split(b, 100);

    ASSERT_TRUE(assembler_.accept_chunk("a", 1, 2, chunks_a[1]).has_value());
    ASSERT_TRUE(assembler_.accept_chunk("b", 0, 2, chunks_b[0]).has_value());
    EXPECT_EQ(assembler_.session_count(), 2u);

    auto done_a = assembler_.accept_chunk("a", 0, 2, chunks_a[0]);
    auto done_b = assembler_.accept_chunk("b", 1, 2, chunks_b[1]);
    ASSERT_TRUE(done_a.has_value());
    ASSERT_TRUE(done_b.has_value());
    EXPECT_EQ(*done_a.value().assembled, a);
    EXPECT_EQ(*done_b.value().assembled, b);
}

TEST_F(ChunkAssemblerTest, ConcurrentFinalChunksCompleteOnce) {
    constexpr int rounds = 50;
    constexpr uint64_t total = 8;

    for (int round = 0; round < rounds; ++round) {
        const std::string id = "race-" + std::to_string(round);
        auto data = make_data(total * 64, static_cast<uint32_t>(round));
        auto chunks = split(data, 64);

        std::atomic<int> completions{0};
        std::vector<byte_buffer> assembled(total);
        std::vector<std::thread> threads;
        for (uint64_t i = 0; i < total; ++i) {
            threads.emplace_back([&, i] {
                auto progress = assembler_.accept_chunk(id, i, total, chunks[i]);
                if (progress && progress.value().complete) {
                    assembled[i] = *progress.value().assembled;
                    completions++;
                }
            });
        }
        for (auto& t : threads) {
            t.join();
        }

        ASSERT_EQ(completions.load(), 1) << "round " << round;
        auto it = std::find_if(assembled.begin(), assembled.end(),
                               [](const byte_buffer& b) { return !b.empty(); });
        ASSERT_NE(it, assembled.end());
        EXPECT_EQ(*it, data);
        EXPECT_FALSE(assembler_.has_session(id));
    }
}

}  // namespace kcenon::secure_transfer::test
