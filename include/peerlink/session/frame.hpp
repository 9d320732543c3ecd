#pragma once

/**
 * @file frame.hpp
 * @brief Framing for everything carried on the data channel
 *
 * The channel delivers whole messages but says nothing about what they
 * contain, so every message starts with a kind byte.
 *
 * BINARY FORMAT (big-endian):
 * [kind: 1 byte]
 * kind 0x01 Text:      [utf-8 text: rest of message]
 * kind 0x02 FileChunk: [transfer_id: 4] [index: 4] [total_chunks: 4]
 *                      [name_length: 2] [name: N]
 *                      [mime_length: 2] [mime: N]
 *                      [data: rest of message]
 */

#include "peerlink/core/result.hpp"
#include "peerlink/core/types.hpp"
#include "peerlink/session/file_chunker.hpp"

#include <cstdint>
#include <string>
#include <variant>

namespace peerlink::session {

enum class FrameKind : std::uint8_t {
    Text = 0x01,
    FileChunk = 0x02
};

struct TextFrame {
    std::string text;
};

using Frame = std::variant<TextFrame, FileChunk>;

class FrameCodec {
public:
    /// Bytes added in front of a chunk's data for a given name and MIME type
    /// (after truncation to a uint16 length).
    static std::size_t chunk_header_size(const std::string& name, const std::string& mime_type);

    static Bytes encode_text(const std::string& text);
    static Bytes encode_chunk(const FileChunk& chunk);

    /// Never throws; truncated or unknown frames are InvalidChunk.
    static Result<Frame> decode(const Bytes& message);

private:
    static void write_uint16(Bytes& buffer, std::uint16_t value);
    static void write_uint32(Bytes& buffer, std::uint32_t value);
    static void write_short_string(Bytes& buffer, const std::string& value);

    static Result<std::uint16_t> read_uint16(const Bytes& buffer, std::size_t& cursor);
    static Result<std::uint32_t> read_uint32(const Bytes& buffer, std::size_t& cursor);
    static Result<std::string> read_short_string(const Bytes& buffer, std::size_t& cursor);
};

} // namespace peerlink::session
