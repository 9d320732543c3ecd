#include "peerlink/session/file_chunker.hpp"

#include <algorithm>
#include <limits>

namespace peerlink::session {

FileChunker::FileChunker(std::size_t max_chunk_size)
    : max_chunk_size_(max_chunk_size) {}

Result<std::vector<FileChunk>> FileChunker::split(const FileInfo& file) {
    return split(file, max_chunk_size_);
}

Result<std::vector<FileChunk>> FileChunker::split(const FileInfo& file, std::size_t chunk_size) {
    auto chunks = split(file.data, chunk_size, next_transfer_id_);
    if (chunks.is_error()) {
        return chunks;
    }
    ++next_transfer_id_;
    for (auto& chunk : chunks.value()) {
        chunk.name = file.name;
        chunk.mime_type = file.mime_type;
    }
    return chunks;
}

Result<std::vector<FileChunk>> FileChunker::split(const Bytes& payload,
                                                  std::size_t max_chunk_size,
                                                  std::uint32_t transfer_id) {
    if (max_chunk_size == 0) {
        return Err<std::vector<FileChunk>>(ErrorCode::InvalidArgument, "max_chunk_size must be > 0");
    }

    const std::size_t chunk_count = payload.empty() ? 1 : (payload.size() + max_chunk_size - 1) / max_chunk_size;
    if (chunk_count > std::numeric_limits<std::uint32_t>::max()) {
        return Err<std::vector<FileChunk>>(ErrorCode::InvalidArgument, "Payload needs too many chunks");
    }
    const auto total_chunks = static_cast<std::uint32_t>(chunk_count);

    std::vector<FileChunk> chunks;
    chunks.reserve(chunk_count);
    for (std::uint32_t index = 0; index < total_chunks; ++index) {
        const std::size_t offset = static_cast<std::size_t>(index) * max_chunk_size;
        const std::size_t length = std::min(max_chunk_size, payload.size() - offset);

        FileChunk chunk;
        chunk.transfer_id = transfer_id;
        chunk.index = index;
        chunk.total_chunks = total_chunks;
        chunk.data.assign(payload.begin() + static_cast<std::ptrdiff_t>(offset),
                          payload.begin() + static_cast<std::ptrdiff_t>(offset + length));
        chunks.push_back(std::move(chunk));
    }
    return Ok(chunks);
}

Result<std::optional<FileInfo>> FileChunker::ingest(const FileChunk& chunk) {
    using IngestResult = std::optional<FileInfo>;

    if (chunk.total_chunks == 0) {
        return Err<IngestResult>(ErrorCode::InvalidChunk, "Chunk announces an empty transfer");
    }
    if (chunk.index >= chunk.total_chunks) {
        return Err<IngestResult>(ErrorCode::InvalidChunk,
                                 "Chunk index " + std::to_string(chunk.index) + " out of range for " +
                                     std::to_string(chunk.total_chunks) + " chunks");
    }

    if (is_completed(chunk.transfer_id)) {
        return Ok(IngestResult{});
    }

    auto [it, created] = transfers_.try_emplace(chunk.transfer_id);
    auto& transfer = it->second;
    if (created) {
        transfer.total_chunks = chunk.total_chunks;
    } else if (transfer.total_chunks != chunk.total_chunks) {
        return Err<IngestResult>(ErrorCode::InvalidChunk,
                                 "Transfer " + std::to_string(chunk.transfer_id) + " changed its chunk count");
    }

    if (transfer.name.empty()) {
        transfer.name = chunk.name;
        transfer.mime_type = chunk.mime_type;
    }
    transfer.received[chunk.index] = chunk.data;
    transfer.last_activity = std::chrono::steady_clock::now();

    if (transfer.received.size() < transfer.total_chunks) {
        return Ok(IngestResult{});
    }

    FileInfo file;
    file.name = std::move(transfer.name);
    file.mime_type = std::move(transfer.mime_type);
    for (auto& [index, data] : transfer.received) {
        file.data.insert(file.data.end(), data.begin(), data.end());
    }
    transfers_.erase(it);

    completed_.insert(chunk.transfer_id);
    completed_order_.push_back(chunk.transfer_id);
    if (completed_order_.size() > kCompletedHistory) {
        completed_.erase(completed_order_.front());
        completed_order_.pop_front();
    }
    return Ok(IngestResult{std::move(file)});
}

std::optional<TransferProgress> FileChunker::progress(std::uint32_t transfer_id) const {
    auto it = transfers_.find(transfer_id);
    if (it == transfers_.end()) {
        return std::nullopt;
    }
    TransferProgress progress;
    progress.transfer_id = transfer_id;
    progress.name = it->second.name;
    progress.received_chunks = static_cast<std::uint32_t>(it->second.received.size());
    progress.total_chunks = it->second.total_chunks;
    return progress;
}

std::size_t FileChunker::prune_stale(std::chrono::steady_clock::duration max_age) {
    const auto now = std::chrono::steady_clock::now();
    std::size_t pruned = 0;
    for (auto it = transfers_.begin(); it != transfers_.end();) {
        if (now - it->second.last_activity > max_age) {
            it = transfers_.erase(it);
            ++pruned;
        } else {
            ++it;
        }
    }
    return pruned;
}

std::size_t FileChunker::clear() {
    const auto abandoned = transfers_.size();
    transfers_.clear();
    completed_.clear();
    completed_order_.clear();
    return abandoned;
}

bool FileChunker::is_completed(std::uint32_t transfer_id) const {
    return completed_.count(transfer_id) > 0;
}

} // namespace peerlink::session
