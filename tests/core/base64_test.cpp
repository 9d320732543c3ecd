#include <gtest/gtest.h>
#include "peerlink/core/base64.hpp"

#include <string>

using peerlink::Bytes;
using peerlink::base64_decode;
using peerlink::base64_encode;

namespace {

std::string as_text(const Bytes& bytes) {
    return std::string(bytes.begin(), bytes.end());
}

} // namespace

TEST(Base64, EncodesRfc4648Vectors) {
    EXPECT_EQ(base64_encode(std::string_view("")), "");
    EXPECT_EQ(base64_encode(std::string_view("f")), "Zg==");
    EXPECT_EQ(base64_encode(std::string_view("fo")), "Zm8=");
    EXPECT_EQ(base64_encode(std::string_view("foo")), "Zm9v");
    EXPECT_EQ(base64_encode(std::string_view("foob")), "Zm9vYg==");
    EXPECT_EQ(base64_encode(std::string_view("fooba")), "Zm9vYmE=");
    EXPECT_EQ(base64_encode(std::string_view("foobar")), "Zm9vYmFy");
}

TEST(Base64, DecodesRfc4648Vectors) {
    auto decoded = base64_decode("Zm9vYmE=");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(as_text(*decoded), "fooba");

    decoded = base64_decode("Zg==");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(as_text(*decoded), "f");
}

TEST(Base64, BinaryBytesSurvive) {
    Bytes all;
    for (int i = 0; i < 256; ++i) {
        all.push_back(static_cast<std::uint8_t>(i));
    }
    auto decoded = base64_decode(base64_encode(all));
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, all);
}

TEST(Base64, IgnoresWhitespaceFromPastedText) {
    auto decoded = base64_decode("  Zm9v\r\nYmFy \n");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(as_text(*decoded), "foobar");
}

TEST(Base64, EmptyInputDecodesToEmpty) {
    auto decoded = base64_decode("");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->empty());
}

TEST(Base64, RejectsBadLength) {
    EXPECT_FALSE(base64_decode("Zm9").has_value());
    EXPECT_FALSE(base64_decode("Zm9vY").has_value());
}

TEST(Base64, RejectsCharactersOutsideAlphabet) {
    EXPECT_FALSE(base64_decode("Zm9*").has_value());
    EXPECT_FALSE(base64_decode("Zm-v").has_value());
}

TEST(Base64, RejectsMisplacedPadding) {
    EXPECT_FALSE(base64_decode("=m9v").has_value());
    EXPECT_FALSE(base64_decode("Z===").has_value());
    EXPECT_FALSE(base64_decode("Zg==Zm9v").has_value());
    EXPECT_FALSE(base64_decode("Zm=v").has_value());
}

TEST(Base64, WrappedCodeWithPaddingDecodes) {
    auto decoded = base64_decode("Zm9v\nYmE\n=\n");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(as_text(*decoded), "fooba");
}
