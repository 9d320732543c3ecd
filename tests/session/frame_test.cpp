#include <gtest/gtest.h>
#include "peerlink/session/frame.hpp"

#include <variant>

using peerlink::Bytes;
using peerlink::ErrorCode;
using namespace peerlink::session;

TEST(FrameCodec, TextFrameIsKindByteThenUtf8) {
    const auto encoded = FrameCodec::encode_text("hi");
    EXPECT_EQ(encoded, (Bytes{0x01, 'h', 'i'}));

    auto decoded = FrameCodec::decode(encoded);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_TRUE(std::holds_alternative<TextFrame>(decoded.value()));
    EXPECT_EQ(std::get<TextFrame>(decoded.value()).text, "hi");
}

TEST(FrameCodec, ChunkFrameLayoutIsBigEndian) {
    FileChunk chunk;
    chunk.transfer_id = 0x01020304;
    chunk.index = 1;
    chunk.total_chunks = 2;
    chunk.name = "a";
    chunk.mime_type = "t/p";
    chunk.data = {0xAA, 0xBB};

    const auto encoded = FrameCodec::encode_chunk(chunk);
    const Bytes expected{
        0x02,
        0x01, 0x02, 0x03, 0x04,
        0x00, 0x00, 0x00, 0x01,
        0x00, 0x00, 0x00, 0x02,
        0x00, 0x01, 'a',
        0x00, 0x03, 't', '/', 'p',
        0xAA, 0xBB};
    EXPECT_EQ(encoded, expected);
    EXPECT_EQ(encoded.size(), FrameCodec::chunk_header_size(chunk.name, chunk.mime_type) + chunk.data.size());

    auto decoded = FrameCodec::decode(encoded);
    ASSERT_TRUE(decoded.is_ok());
    ASSERT_TRUE(std::holds_alternative<FileChunk>(decoded.value()));
    const auto& back = std::get<FileChunk>(decoded.value());
    EXPECT_EQ(back.transfer_id, chunk.transfer_id);
    EXPECT_EQ(back.index, 1u);
    EXPECT_EQ(back.total_chunks, 2u);
    EXPECT_EQ(back.name, "a");
    EXPECT_EQ(back.mime_type, "t/p");
    EXPECT_EQ(back.data, chunk.data);
}

TEST(FrameCodec, EmptyTextAndEmptyChunkDataDecode) {
    auto text = FrameCodec::decode(FrameCodec::encode_text(""));
    ASSERT_TRUE(text.is_ok());
    EXPECT_EQ(std::get<TextFrame>(text.value()).text, "");

    FileChunk chunk;
    chunk.total_chunks = 1;
    auto decoded = FrameCodec::decode(FrameCodec::encode_chunk(chunk));
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_TRUE(std::get<FileChunk>(decoded.value()).data.empty());
}

TEST(FrameCodec, RejectsEmptyAndUnknownFrames) {
    auto empty = FrameCodec::decode(Bytes{});
    ASSERT_TRUE(empty.is_error());
    EXPECT_EQ(empty.error().code, ErrorCode::InvalidChunk);

    EXPECT_TRUE(FrameCodec::decode(Bytes{0x07, 'x'}).is_error());
}

TEST(FrameCodec, EveryTruncatedChunkHeaderIsRejected) {
    FileChunk chunk;
    chunk.transfer_id = 5;
    chunk.total_chunks = 1;
    chunk.name = "photo.png";
    chunk.mime_type = "image/png";

    const auto encoded = FrameCodec::encode_chunk(chunk);
    const auto header = FrameCodec::chunk_header_size(chunk.name, chunk.mime_type);
    ASSERT_EQ(encoded.size(), header);

    for (std::size_t length = 1; length < header; ++length) {
        Bytes truncated(encoded.begin(), encoded.begin() + static_cast<std::ptrdiff_t>(length));
        EXPECT_TRUE(FrameCodec::decode(truncated).is_error()) << "length " << length;
    }
}

TEST(FrameCodec, HeaderSizeAccountsForTruncatedName) {
    FileChunk chunk;
    chunk.transfer_id = 1;
    chunk.total_chunks = 1;
    chunk.name.assign(70000, 'n');
    chunk.mime_type = "text/plain";
    chunk.data = {1, 2};

    const auto encoded = FrameCodec::encode_chunk(chunk);
    EXPECT_EQ(encoded.size(), FrameCodec::chunk_header_size(chunk.name, chunk.mime_type) + 2);

    auto decoded = FrameCodec::decode(encoded);
    ASSERT_TRUE(decoded.is_ok());
    EXPECT_EQ(std::get<FileChunk>(decoded.value()).name.size(), 65535u);
}
