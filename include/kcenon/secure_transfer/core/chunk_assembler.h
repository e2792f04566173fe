/**
 * @file chunk_assembler.h
 * @brief In-memory reassembly of resumable chunked uploads
 */

#ifndef KCENON_SECURE_TRANSFER_CORE_CHUNK_ASSEMBLER_H
#define KCENON_SECURE_TRANSFER_CORE_CHUNK_ASSEMBLER_H

#include <kcenon/secure_transfer/core/types.h>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <span>
#include <string>
#include <unordered_map>
#include <vector>

namespace kcenon::secure_transfer {

/**
 * @brief Outcome of accepting one chunk
 */
struct chunk_progress {
    std::string id;
    uint64_t received_chunks = 0;
    uint64_t total_chunks = 0;
    bool complete = false;
    std::optional<byte_buffer> assembled;  ///< Merged bytes, set only when complete

    [[nodiscard]] auto fraction() const -> double {
        if (total_chunks == 0) return 0.0;
        return static_cast<double>(received_chunks) / static_cast<double>(total_chunks);
    }
};

/**
 * @brief Reassembles uploads that arrive as indexed chunks
 *
 * Chunks are tracked by index, never by arrival order, so any arrival
 * permutation produces the same merged bytes. The session is created by
 * the first chunk for an id and removed atomically when the last missing
 * index arrives; the merged buffer is handed to that caller only.
 *
 * Sessions for different ids never contend on the same lock.
 */
class chunk_assembler {
public:
    static constexpr uint64_t default_max_assembled_size = 500ULL * 1024 * 1024;

    /**
     * @brief Construct assembler
     * @param max_assembled_size Upper bound on the merged size of one upload
     */
    explicit chunk_assembler(uint64_t max_assembled_size = default_max_assembled_size);

    ~chunk_assembler();

    chunk_assembler(const chunk_assembler&) = delete;
    auto operator=(const chunk_assembler&) -> chunk_assembler& = delete;

    /**
     * @brief Accept a chunk of an upload
     * @param id Upload identifier chosen by the caller
     * @param index Zero-based chunk index
     * @param total_chunks Declared number of chunks; must match the session
     * @param data Chunk payload, non-empty
     * @return Progress after this chunk, or validation_error
     *
     * A repeated index is ignored and reports unchanged progress.
     */
    [[nodiscard]] auto accept_chunk(const std::string& id,
                                    uint64_t index,
                                    uint64_t total_chunks,
                                    std::span<const std::byte> data)
        -> result<chunk_progress>;

    [[nodiscard]] auto get_progress(const std::string& id) const
        -> std::optional<assembly_progress>;

    /**
     * @brief Indices not yet received, in ascending order
     */
    [[nodiscard]] auto get_missing_chunks(const std::string& id) const
        -> std::vector<uint64_t>;

    [[nodiscard]] auto has_session(const std::string& id) const -> bool;

    /**
     * @brief Drop an in-progress upload and its buffered chunks
     */
    void cancel_session(const std::string& id);

    /**
     * @brief Drop uploads without activity for at least @p max_age
     * @return Number of sessions removed
     */
    auto purge_stale(std::chrono::milliseconds max_age) -> std::size_t;

    [[nodiscard]] auto session_count() const -> std::size_t;

private:
    struct assembly_context {
        uint64_t total_chunks = 0;
        uint64_t bytes_received = 0;
        std::map<uint64_t, byte_buffer> chunks;
        std::chrono::steady_clock::time_point last_activity;
        std::atomic<bool> closed{false};  // merged, cancelled or purged
        mutable std::mutex mutex;
    };

    using context_ptr = std::shared_ptr<assembly_context>;

    [[nodiscard]] auto find_context(const std::string& id) const -> context_ptr;
    [[nodiscard]] auto find_or_create_context(const std::string& id, uint64_t total_chunks)
        -> context_ptr;
    void erase_context(const std::string& id, const context_ptr& ctx);

    uint64_t max_assembled_size_;
    std::unordered_map<std::string, context_ptr> contexts_;
    mutable std::shared_mutex contexts_mutex_;
};

}  // namespace kcenon::secure_transfer

#endif  // KCENON_SECURE_TRANSFER_CORE_CHUNK_ASSEMBLER_H
