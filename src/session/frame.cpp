#include "peerlink/session/frame.hpp"

#include <algorithm>
#include <limits>

namespace peerlink::session {

std::size_t FrameCodec::chunk_header_size(const std::string& name, const std::string& mime_type) {
    constexpr std::size_t kMaxString = std::numeric_limits<std::uint16_t>::max();
    return 1 + 4 + 4 + 4 + 2 + std::min(name.size(), kMaxString) + 2 + std::min(mime_type.size(), kMaxString);
}

Bytes FrameCodec::encode_text(const std::string& text) {
    Bytes buffer;
    buffer.reserve(1 + text.size());
    buffer.push_back(static_cast<std::uint8_t>(FrameKind::Text));
    buffer.insert(buffer.end(), text.begin(), text.end());
    return buffer;
}

Bytes FrameCodec::encode_chunk(const FileChunk& chunk) {
    Bytes buffer;
    buffer.reserve(chunk_header_size(chunk.name, chunk.mime_type) + chunk.data.size());
    buffer.push_back(static_cast<std::uint8_t>(FrameKind::FileChunk));
    write_uint32(buffer, chunk.transfer_id);
    write_uint32(buffer, chunk.index);
    write_uint32(buffer, chunk.total_chunks);
    write_short_string(buffer, chunk.name);
    write_short_string(buffer, chunk.mime_type);
    buffer.insert(buffer.end(), chunk.data.begin(), chunk.data.end());
    return buffer;
}

Result<Frame> FrameCodec::decode(const Bytes& message) {
    if (message.empty()) {
        return Err<Frame>(ErrorCode::InvalidChunk, "Empty channel message");
    }

    const auto kind = message[0];
    if (kind == static_cast<std::uint8_t>(FrameKind::Text)) {
        return Ok(Frame{TextFrame{std::string(message.begin() + 1, message.end())}});
    }
    if (kind != static_cast<std::uint8_t>(FrameKind::FileChunk)) {
        return Err<Frame>(ErrorCode::InvalidChunk, "Unknown frame kind " + std::to_string(kind));
    }

    std::size_t cursor = 1;
    FileChunk chunk;

    auto transfer_id = read_uint32(message, cursor);
    if (transfer_id.is_error()) {
        return Err<Frame>(transfer_id.error());
    }
    chunk.transfer_id = transfer_id.value();

    auto index = read_uint32(message, cursor);
    if (index.is_error()) {
        return Err<Frame>(index.error());
    }
    chunk.index = index.value();

    auto total = read_uint32(message, cursor);
    if (total.is_error()) {
        return Err<Frame>(total.error());
    }
    chunk.total_chunks = total.value();

    auto name = read_short_string(message, cursor);
    if (name.is_error()) {
        return Err<Frame>(name.error());
    }
    chunk.name = std::move(name.value());

    auto mime = read_short_string(message, cursor);
    if (mime.is_error()) {
        return Err<Frame>(mime.error());
    }
    chunk.mime_type = std::move(mime.value());

    chunk.data.assign(message.begin() + static_cast<std::ptrdiff_t>(cursor), message.end());
    return Ok(Frame{std::move(chunk)});
}

void FrameCodec::write_uint16(Bytes& buffer, std::uint16_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void FrameCodec::write_uint32(Bytes& buffer, std::uint32_t value) {
    buffer.push_back(static_cast<std::uint8_t>((value >> 24) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 16) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>((value >> 8) & 0xFF));
    buffer.push_back(static_cast<std::uint8_t>(value & 0xFF));
}

void FrameCodec::write_short_string(Bytes& buffer, const std::string& value) {
    // Names longer than a uint16 length are cut, never rejected.
    const auto length = static_cast<std::uint16_t>(
        std::min<std::size_t>(value.size(), std::numeric_limits<std::uint16_t>::max()));
    write_uint16(buffer, length);
    buffer.insert(buffer.end(), value.begin(), value.begin() + length);
}

Result<std::uint16_t> FrameCodec::read_uint16(const Bytes& buffer, std::size_t& cursor) {
    if (cursor + 2 > buffer.size()) {
        return Err<std::uint16_t>(ErrorCode::InvalidChunk, "Frame truncated reading uint16");
    }
    const auto value = static_cast<std::uint16_t>((buffer[cursor] << 8) | buffer[cursor + 1]);
    cursor += 2;
    return Ok(value);
}

Result<std::uint32_t> FrameCodec::read_uint32(const Bytes& buffer, std::size_t& cursor) {
    if (cursor + 4 > buffer.size()) {
        return Err<std::uint32_t>(ErrorCode::InvalidChunk, "Frame truncated reading uint32");
    }
    const std::uint32_t value = (static_cast<std::uint32_t>(buffer[cursor]) << 24) |
                                (static_cast<std::uint32_t>(buffer[cursor + 1]) << 16) |
                                (static_cast<std::uint32_t>(buffer[cursor + 2]) << 8) |
                                static_cast<std::uint32_t>(buffer[cursor + 3]);
    cursor += 4;
    return Ok(value);
}

Result<std::string> FrameCodec::read_short_string(const Bytes& buffer, std::size_t& cursor) {
    auto length = read_uint16(buffer, cursor);
    if (length.is_error()) {
        return Err<std::string>(length.error());
    }
    if (cursor + length.value() > buffer.size()) {
        return Err<std::string>(ErrorCode::InvalidChunk, "Frame truncated reading string");
    }
    std::string value(buffer.begin() + static_cast<std::ptrdiff_t>(cursor),
                      buffer.begin() + static_cast<std::ptrdiff_t>(cursor + length.value()));
    cursor += length.value();
    return Ok(value);
}

} // namespace peerlink::session
