#include <gtest/gtest.h>
#include "peerlink/core/config.hpp"

#include <cstdio>
#include <filesystem>
#include <fstream>

using peerlink::ErrorCode;
using peerlink::PeerConfig;
using peerlink::load_config;
using peerlink::parse_config;

TEST(PeerConfig, EmptyObjectGivesDefaults) {
    auto config = parse_config("{}");
    ASSERT_TRUE(config.is_ok());

    const PeerConfig defaults;
    EXPECT_EQ(config.value().ice_servers, defaults.ice_servers);
    EXPECT_EQ(config.value().channel_label, "chat");
    EXPECT_EQ(config.value().max_chunk_size, PeerConfig::kDefaultChunkSize);
    EXPECT_EQ(config.value().max_file_size_mb, 50u);
    EXPECT_EQ(config.value().log_level, "info");
}

TEST(PeerConfig, ReadsEveryKey) {
    auto config = parse_config(R"({
        "ice_servers": ["stun:stun.example.org:3478", "turn:user:pass@turn.example.org"],
        "channel_label": "files",
        "max_chunk_size": 65536,
        "max_file_size_mb": 5,
        "log_level": "debug",
        "ignored": true
    })");
    ASSERT_TRUE(config.is_ok()) << config.error().describe();

    EXPECT_EQ(config.value().ice_servers.size(), 2u);
    EXPECT_EQ(config.value().ice_servers[0], "stun:stun.example.org:3478");
    EXPECT_EQ(config.value().channel_label, "files");
    EXPECT_EQ(config.value().max_chunk_size, 65536u);
    EXPECT_EQ(config.value().max_file_size_mb, 5u);
    EXPECT_EQ(config.value().log_level, "debug");
}

TEST(PeerConfig, EmptyIceServerListIsAllowed) {
    auto config = parse_config(R"({"ice_servers": []})");
    ASSERT_TRUE(config.is_ok());
    EXPECT_TRUE(config.value().ice_servers.empty());
}

TEST(PeerConfig, RejectsInvalidJson) {
    auto config = parse_config("{ not json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigError);
}

TEST(PeerConfig, RejectsNonObjectRoot) {
    EXPECT_TRUE(parse_config("[1, 2]").is_error());
}

TEST(PeerConfig, RejectsWrongTypes) {
    EXPECT_TRUE(parse_config(R"({"ice_servers": "stun:x"})").is_error());
    EXPECT_TRUE(parse_config(R"({"ice_servers": [1]})").is_error());
    EXPECT_TRUE(parse_config(R"({"channel_label": ""})").is_error());
    EXPECT_TRUE(parse_config(R"({"max_file_size_mb": -1})").is_error());
    EXPECT_TRUE(parse_config(R"({"log_level": "loud"})").is_error());
}

TEST(PeerConfig, ChunkSizeMustBeBounded) {
    EXPECT_TRUE(parse_config(R"({"max_chunk_size": 0})").is_error());
    EXPECT_TRUE(parse_config(R"({"max_chunk_size": 262145})").is_error());
    EXPECT_TRUE(parse_config(R"({"max_chunk_size": 262144})").is_ok());
}

TEST(PeerConfig, LoadsFromFile) {
    const auto path = std::filesystem::temp_directory_path() / "peerlink_config_test.json";
    {
        std::ofstream out(path);
        out << R"({"channel_label": "from-file"})";
    }

    auto config = load_config(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(config.is_ok());
    EXPECT_EQ(config.value().channel_label, "from-file");
}

TEST(PeerConfig, MissingFileIsConfigError) {
    auto config = load_config("/nonexistent/peerlink.json");
    ASSERT_TRUE(config.is_error());
    EXPECT_EQ(config.error().code, ErrorCode::ConfigError);
}
