#include <gtest/gtest.h>
#include "peerlink/session/file_info.hpp"

#include <filesystem>
#include <fstream>

using peerlink::ErrorCode;
using namespace peerlink::session;

namespace {

FileInfo file_of_size(std::size_t size, std::string mime = "application/octet-stream") {
    FileInfo file;
    file.name = "blob.bin";
    file.mime_type = std::move(mime);
    file.data.assign(size, 0xAB);
    return file;
}

} // namespace

TEST(FileInfo, FormatsSizeWithUnits) {
    EXPECT_EQ(file_of_size(0).format_size(), "0 B");
    EXPECT_EQ(file_of_size(512).format_size(), "512 B");
    EXPECT_EQ(file_of_size(1023).format_size(), "1023 B");
    EXPECT_EQ(file_of_size(1024).format_size(), "1.0 KB");
    EXPECT_EQ(file_of_size(1536).format_size(), "1.5 KB");
    EXPECT_EQ(file_of_size(2 * 1024 * 1024).format_size(), "2.0 MB");
}

TEST(FileInfo, DetectsImagesByMimeType) {
    EXPECT_TRUE(file_of_size(1, "image/png").is_image());
    EXPECT_TRUE(file_of_size(1, "image/svg+xml").is_image());
    EXPECT_FALSE(file_of_size(1, "text/plain").is_image());
    EXPECT_FALSE(file_of_size(1, "application/image").is_image());
}

TEST(FileInfo, ValidateRejectsOversizedFiles) {
    EXPECT_TRUE(validate_file(file_of_size(1024 * 1024), 1).is_ok());

    auto too_big = validate_file(file_of_size(1024 * 1024 + 1), 1);
    ASSERT_TRUE(too_big.is_error());
    EXPECT_EQ(too_big.error().code, ErrorCode::InvalidArgument);
}

TEST(FileInfo, ValidateRejectsNamelessFiles) {
    auto file = file_of_size(10);
    file.name.clear();
    EXPECT_TRUE(validate_file(file, 50).is_error());
}

TEST(FileInfo, GuessesMimeTypeFromExtension) {
    EXPECT_EQ(guess_mime_type("photo.JPG"), "image/jpeg");
    EXPECT_EQ(guess_mime_type("notes.txt"), "text/plain");
    EXPECT_EQ(guess_mime_type("archive.tar.zip"), "application/zip");
    EXPECT_EQ(guess_mime_type("Makefile"), "application/octet-stream");
    EXPECT_EQ(guess_mime_type("trailing."), "application/octet-stream");
}

TEST(FileInfo, ReadsFileFromDisk) {
    const auto path = std::filesystem::temp_directory_path() / "peerlink_read_file_test.png";
    {
        std::ofstream out(path, std::ios::binary);
        out << "\x89PNG\r\n";
    }

    auto file = read_file(path);
    std::filesystem::remove(path);

    ASSERT_TRUE(file.is_ok());
    EXPECT_EQ(file.value().name, "peerlink_read_file_test.png");
    EXPECT_EQ(file.value().mime_type, "image/png");
    EXPECT_EQ(file.value().size(), 6u);
}

TEST(FileInfo, ReadingMissingFileFails) {
    auto file = read_file("/nonexistent/peerlink/file.txt");
    ASSERT_TRUE(file.is_error());
    EXPECT_EQ(file.error().code, ErrorCode::InvalidArgument);
}
