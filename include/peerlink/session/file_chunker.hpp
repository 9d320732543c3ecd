#pragma once

#include "peerlink/core/config.hpp"
#include "peerlink/core/result.hpp"
#include "peerlink/core/types.hpp"
#include "peerlink/session/file_info.hpp"

#include <chrono>
#include <deque>
#include <cstdint>
#include <map>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace peerlink::session {

/**
 * @brief One piece of a file as carried by a single channel message
 */
struct FileChunk {
    std::uint32_t transfer_id = 0;
    std::uint32_t index = 0;
    std::uint32_t total_chunks = 0;
    std::string name;
    std::string mime_type;
    Bytes data;
};

struct TransferProgress {
    std::uint32_t transfer_id = 0;
    std::string name;
    std::uint32_t received_chunks = 0;
    std::uint32_t total_chunks = 0;
};

/**
 * @brief Splits payloads into bounded chunks and reassembles them
 *
 * The data channel gives no framing and, for this purpose, no ordering: a
 * transfer is complete when every index in [0, total_chunks) has arrived,
 * whatever the arrival order. Duplicates overwrite the same index, and
 * chunks for a transfer that already completed are ignored, so each file is
 * delivered exactly once. The most recent kCompletedHistory ids are kept.
 *
 * Chunk size is an external bound: it must stay under the transport's
 * maximum message size, minus the frame header. The default (16 KiB) is
 * delivered unfragmented by every browser-compatible SCTP stack.
 */
class FileChunker {
public:
    static constexpr std::size_t kCompletedHistory = 1024;

    explicit FileChunker(std::size_t max_chunk_size = PeerConfig::kDefaultChunkSize);

    [[nodiscard]] std::size_t max_chunk_size() const noexcept { return max_chunk_size_; }

    /// Splits `file` under a fresh transfer id. An empty file yields one empty chunk.
    Result<std::vector<FileChunk>> split(const FileInfo& file);

    /// Same, with a per-call chunk size instead of max_chunk_size().
    Result<std::vector<FileChunk>> split(const FileInfo& file, std::size_t chunk_size);

    static Result<std::vector<FileChunk>> split(const Bytes& payload,
                                                std::size_t max_chunk_size,
                                                std::uint32_t transfer_id);

    /**
     * @brief Record one chunk
     *
     * RETURNS:
     * - the reassembled file once the last missing index arrives (the transfer
     *   state is consumed at that point)
     * - nullopt while indices are still missing, or when the transfer
     *   already completed
     * - InvalidChunk when the chunk contradicts itself or its transfer
     */
    Result<std::optional<FileInfo>> ingest(const FileChunk& chunk);

    [[nodiscard]] std::optional<TransferProgress> progress(std::uint32_t transfer_id) const;
    [[nodiscard]] std::size_t pending_transfers() const noexcept { return transfers_.size(); }

    /// Drops incomplete transfers idle for longer than `max_age`. Returns how many.
    std::size_t prune_stale(std::chrono::steady_clock::duration max_age);

    /// Abandons every incomplete transfer and forgets completed ids. Returns how many were abandoned.
    std::size_t clear();

    [[nodiscard]] bool is_completed(std::uint32_t transfer_id) const;

private:
    struct ChunkedTransfer {
        std::uint32_t total_chunks = 0;
        std::string name;
        std::string mime_type;
        std::map<std::uint32_t, Bytes> received;
        std::chrono::steady_clock::time_point last_activity{};
    };

    std::size_t max_chunk_size_;
    std::uint32_t next_transfer_id_ = 1;
    std::unordered_map<std::uint32_t, ChunkedTransfer> transfers_;
    std::unordered_set<std::uint32_t> completed_;
    std::deque<std::uint32_t> completed_order_;
};

} // namespace peerlink::session
