/**
 * @file chunk_assembler.cpp
 * @brief Implementation of in-memory chunk reassembly
 */

#include <kcenon/secure_transfer/core/chunk_assembler.h>
#include <kcenon/secure_transfer/core/logging.h>

#include <algorithm>

namespace kcenon::secure_transfer {

chunk_assembler::chunk_assembler(uint64_t max_assembled_size)
    : max_assembled_size_(max_assembled_size) {}

chunk_assembler::~chunk_assembler() {
    std::unique_lock lock(contexts_mutex_);
    if (!contexts_.empty()) {
        ST_LOG_DEBUG(log_category::chunk,
            "Discarding " + std::to_string(contexts_.size()) + " incomplete uploads");
    }
    contexts_.clear();
}

auto chunk_assembler::accept_chunk(const std::string& id,
                                   uint64_t index,
                                   uint64_t total_chunks,
                                   std::span<const std::byte> data)
    -> result<chunk_progress> {
    if (id.empty()) {
        return make_error(error_code::validation_error, "upload id is empty");
    }
    if (total_chunks == 0) {
        return make_error(error_code::validation_error, "total chunk count must be positive");
    }
    if (index >= total_chunks) {
        return make_error(error_code::validation_error,
            "chunk index " + std::to_string(index) + " out of range (total " +
            std::to_string(total_chunks) + ")");
    }
    if (data.empty()) {
        return make_error(error_code::validation_error, "chunk data is empty");
    }

    while (true) {
        auto ctx = find_or_create_context(id, total_chunks);
        std::unique_lock ctx_lock(ctx->mutex);

        // Lost a race with completion or cancellation; start over with a fresh session
        if (ctx->closed) {
            continue;
        }

        if (ctx->total_chunks != total_chunks) {
            return make_error(error_code::validation_error,
                "chunk count mismatch: session expects " + std::to_string(ctx->total_chunks) +
                ", chunk declares " + std::to_string(total_chunks));
        }

        ctx->last_activity = std::chrono::steady_clock::now();

        if (ctx->chunks.find(index) == ctx->chunks.end()) {
            if (ctx->bytes_received + data.size() > max_assembled_size_) {
                ctx->closed = true;
                ctx->chunks.clear();
                ctx_lock.unlock();
                erase_context(id, ctx);
                ST_LOG_WARN(log_category::chunk,
                    "Upload " + id + " exceeds maximum size, discarded");
                return make_error(error_code::validation_error,
                    "upload exceeds maximum size of " +
                    std::to_string(max_assembled_size_) + " bytes");
            }
            ctx->chunks.emplace(index, byte_buffer(data.begin(), data.end()));
            ctx->bytes_received += data.size();
        }

        chunk_progress progress;
        progress.id = id;
        progress.received_chunks = ctx->chunks.size();
        progress.total_chunks = ctx->total_chunks;

        if (progress.received_chunks < progress.total_chunks) {
            ST_LOG_DEBUG(log_category::chunk,
                "Upload " + id + ": chunk " + std::to_string(index) + " received (" +
                std::to_string(progress.received_chunks) + "/" +
                std::to_string(progress.total_chunks) + ")");
            return progress;
        }

        // std::map iterates in index order
        byte_buffer merged;
        merged.reserve(static_cast<std::size_t>(ctx->bytes_received));
        for (auto& [chunk_index, bytes] : ctx->chunks) {
            merged.insert(merged.end(), bytes.begin(), bytes.end());
            byte_buffer().swap(bytes);
        }
        ctx->chunks.clear();
        ctx->closed = true;
        ctx_lock.unlock();
        erase_context(id, ctx);

        ST_LOG_INFO(log_category::chunk,
            "Upload " + id + " assembled: " + std::to_string(progress.total_chunks) +
            " chunks, " + std::to_string(merged.size()) + " bytes");

        progress.complete = true;
        progress.assembled = std::move(merged);
        return progress;
    }
}

auto chunk_assembler::get_progress(const std::string& id) const
    -> std::optional<assembly_progress> {
    auto ctx = find_context(id);
    if (!ctx) {
        return std::nullopt;
    }

    std::lock_guard lock(ctx->mutex);
    if (ctx->closed) {
        return std::nullopt;
    }

    assembly_progress progress;
    progress.id = id;
    progress.total_chunks = ctx->total_chunks;
    progress.received_chunks = ctx->chunks.size();
    progress.bytes_received = ctx->bytes_received;
    return progress;
}

auto chunk_assembler::get_missing_chunks(const std::string& id) const
    -> std::vector<uint64_t> {
    auto ctx = find_context(id);
    if (!ctx) {
        return {};
    }

    std::lock_guard lock(ctx->mutex);
    if (ctx->closed) {
        return {};
    }

    std::vector<uint64_t> missing;
    for (uint64_t i = 0; i < ctx->total_chunks; ++i) {
        if (ctx->chunks.find(i) == ctx->chunks.end()) {
            missing.push_back(i);
        }
    }
    return missing;
}

auto chunk_assembler::has_session(const std::string& id) const -> bool {
    std::shared_lock lock(contexts_mutex_);
    return contexts_.find(id) != contexts_.end();
}

void chunk_assembler::cancel_session(const std::string& id) {
    auto ctx = find_context(id);
    if (!ctx) {
        return;
    }

    {
        std::lock_guard lock(ctx->mutex);
        if (ctx->closed) {
            return;
        }
        ctx->closed = true;
        ctx->chunks.clear();
    }
    erase_context(id, ctx);
    ST_LOG_INFO(log_category::chunk, "Upload " + id + " cancelled");
}

auto chunk_assembler::purge_stale(std::chrono::milliseconds max_age) -> std::size_t {
    std::vector<std::pair<std::string, context_ptr>> snapshot;
    {
        std::shared_lock lock(contexts_mutex_);
        snapshot.reserve(contexts_.size());
        for (const auto& entry : contexts_) {
            snapshot.push_back(entry);
        }
    }

    const auto now = std::chrono::steady_clock::now();
    std::size_t purged = 0;
    for (auto& [id, ctx] : snapshot) {
        {
            std::lock_guard lock(ctx->mutex);
            if (ctx->closed || now - ctx->last_activity < max_age) {
                continue;
            }
            ctx->closed = true;
            ctx->chunks.clear();
        }
        erase_context(id, ctx);
        ++purged;
    }

    if (purged > 0) {
        ST_LOG_INFO(log_category::chunk,
            "Purged " + std::to_string(purged) + " stale uploads");
    }
    return purged;
}

auto chunk_assembler::session_count() const -> std::size_t {
    std::shared_lock lock(contexts_mutex_);
    return contexts_.size();
}

auto chunk_assembler::find_context(const std::string& id) const -> context_ptr {
    std::shared_lock lock(contexts_mutex_);
    auto it = contexts_.find(id);
    return it != contexts_.end() ? it->second : nullptr;
}

auto chunk_assembler::find_or_create_context(const std::string& id, uint64_t total_chunks)
    -> context_ptr {
    if (auto existing = find_context(id); existing && !existing->closed) {
        return existing;
    }

    std::unique_lock lock(contexts_mutex_);
    auto& slot = contexts_[id];
    if (!slot || slot->closed) {
        slot = std::make_shared<assembly_context>();
        slot->total_chunks = total_chunks;
        slot->last_activity = std::chrono::steady_clock::now();
    }
    return slot;
}

void chunk_assembler::erase_context(const std::string& id, const context_ptr& ctx) {
    std::unique_lock lock(contexts_mutex_);
    auto it = contexts_.find(id);
    // A newer session may already occupy the slot
    if (it != contexts_.end() && it->second == ctx) {
        contexts_.erase(it);
    }
}

}  // namespace kcenon::secure_transfer
