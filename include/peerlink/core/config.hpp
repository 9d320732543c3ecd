#pragma once

#include "peerlink/core/result.hpp"

#include <cstddef>
#include <filesystem>
#include <string>
#include <vector>

namespace peerlink {

/**
 * @brief Runtime settings for a peer
 *
 * Loaded from an optional JSON file; every key may be omitted:
 * {
 *   "ice_servers": ["stun:stun.l.google.com:19302"],
 *   "channel_label": "chat",
 *   "max_chunk_size": 16384,
 *   "max_file_size_mb": 50,
 *   "log_level": "info"
 * }
 */
struct PeerConfig {
    /// Largest chunk a browser-compatible SCTP stack delivers unfragmented.
    static constexpr std::size_t kDefaultChunkSize = 16 * 1024;
    static constexpr std::size_t kMaxChunkSize = 256 * 1024;
    /// Largest single channel message (libdatachannel's default limit). File
    /// chunks are shrunk so that data plus frame header stays within it.
    static constexpr std::size_t kMaxMessageSize = 256 * 1024;

    std::vector<std::string> ice_servers{"stun:stun.l.google.com:19302"};
    std::string channel_label = "chat";
    std::size_t max_chunk_size = kDefaultChunkSize;
    std::size_t max_file_size_mb = 50;
    std::string log_level = "info";
};

Result<PeerConfig> parse_config(const std::string& json_text);
Result<PeerConfig> load_config(const std::filesystem::path& path);

} // namespace peerlink
