#include "peerlink/session/file_info.hpp"

#include <algorithm>
#include <array>
#include <cctype>
#include <cstdio>
#include <fstream>
#include <iterator>
#include <utility>

namespace peerlink::session {

namespace {

constexpr std::size_t kBytesPerMegabyte = 1024 * 1024;

std::string lower_extension(const std::string& file_name) {
    const auto dot = file_name.find_last_of('.');
    if (dot == std::string::npos || dot + 1 == file_name.size()) {
        return {};
    }
    std::string extension = file_name.substr(dot + 1);
    std::transform(extension.begin(), extension.end(), extension.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return extension;
}

} // namespace

std::string FileInfo::format_size() const {
    const auto bytes = static_cast<double>(data.size());
    if (data.size() < 1024) {
        return std::to_string(data.size()) + " B";
    }

    static constexpr std::array<const char*, 3> kUnits{"KB", "MB", "GB"};
    double value = bytes / 1024.0;
    std::size_t unit = 0;
    while (value >= 1024.0 && unit + 1 < kUnits.size()) {
        value /= 1024.0;
        ++unit;
    }

    char buffer[32];
    std::snprintf(buffer, sizeof(buffer), "%.1f %s", value, kUnits[unit]);
    return buffer;
}

bool FileInfo::is_image() const {
    return mime_type.rfind("image/", 0) == 0;
}

Result<void> validate_file(const FileInfo& file, std::size_t max_size_mb) {
    if (file.name.empty()) {
        return Err<void>(ErrorCode::InvalidArgument, "File has no name");
    }
    if (file.size() > max_size_mb * kBytesPerMegabyte) {
        return Err<void>(ErrorCode::InvalidArgument,
                         "File " + file.name + " is " + file.format_size() +
                             ", limit is " + std::to_string(max_size_mb) + " MB");
    }
    return Ok();
}

Result<FileInfo> read_file(const std::filesystem::path& path) {
    std::error_code ec;
    if (!std::filesystem::is_regular_file(path, ec)) {
        return Err<FileInfo>(ErrorCode::InvalidArgument, "Not a regular file: " + path.string());
    }

    std::ifstream input(path, std::ios::binary);
    if (!input) {
        return Err<FileInfo>(ErrorCode::InvalidArgument, "Cannot open " + path.string());
    }

    FileInfo file;
    file.name = path.filename().string();
    file.mime_type = guess_mime_type(file.name);
    file.data.assign(std::istreambuf_iterator<char>(input), std::istreambuf_iterator<char>());
    if (input.bad()) {
        return Err<FileInfo>(ErrorCode::InvalidArgument, "Failed reading " + path.string());
    }
    return Ok(std::move(file));
}

std::string guess_mime_type(const std::string& file_name) {
    static const std::array<std::pair<const char*, const char*>, 16> kTypes{{
        {"png", "image/png"},
        {"jpg", "image/jpeg"},
        {"jpeg", "image/jpeg"},
        {"gif", "image/gif"},
        {"webp", "image/webp"},
        {"svg", "image/svg+xml"},
        {"txt", "text/plain"},
        {"md", "text/markdown"},
        {"html", "text/html"},
        {"csv", "text/csv"},
        {"json", "application/json"},
        {"pdf", "application/pdf"},
        {"zip", "application/zip"},
        {"mp3", "audio/mpeg"},
        {"mp4", "video/mp4"},
        {"wav", "audio/wav"},
    }};

    const auto extension = lower_extension(file_name);
    for (const auto& [ext, mime] : kTypes) {
        if (extension == ext) {
            return mime;
        }
    }
    return "application/octet-stream";
}

} // namespace peerlink::session
