#pragma once

#include "peerlink/core/result.hpp"
#include "peerlink/core/types.hpp"

#include <cstddef>
#include <filesystem>
#include <string>

namespace peerlink::session {

/**
 * @brief A file as sent over, or received from, the data channel
 */
struct FileInfo {
    std::string name;
    std::string mime_type;
    Bytes data;

    [[nodiscard]] std::size_t size() const noexcept { return data.size(); }

    /// Human readable size: "512 B", "1.5 KB", "2.0 MB", "1.1 GB".
    [[nodiscard]] std::string format_size() const;

    [[nodiscard]] bool is_image() const;
};

/// Rejects files larger than `max_size_mb` mebibytes.
Result<void> validate_file(const FileInfo& file, std::size_t max_size_mb);

/// Reads a file from disk, guessing its MIME type from the extension.
Result<FileInfo> read_file(const std::filesystem::path& path);

std::string guess_mime_type(const std::string& file_name);

} // namespace peerlink::session
