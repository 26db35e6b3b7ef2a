#include <gtest/gtest.h>
#include "lanbeam/storage/storage_config.hpp"
#include <filesystem>
#include <fstream>

using namespace lanbeam::storage;
using lanbeam::core::ErrorCode;

class StorageConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_dir = std::filesystem::temp_directory_path() / "lanbeam_storage_test";
        std::filesystem::remove_all(test_dir);
        config = StorageConfig(test_dir / "Downloads");
    }

    void TearDown() override {
        std::filesystem::remove_all(test_dir);
    }

    std::filesystem::path test_dir;
    StorageConfig config;
};

TEST_F(StorageConfigTest, ValidateAndCreate) {
    EXPECT_TRUE(config.validate());
    EXPECT_FALSE(StorageConfig().validate());

    ASSERT_TRUE(config.create_directories());
    EXPECT_TRUE(std::filesystem::is_directory(config.download_directory));
    EXPECT_GT(config.get_available_space(), 0u);
    EXPECT_TRUE(config.has_sufficient_space(1));
    EXPECT_FALSE(config.has_sufficient_space(UINT64_MAX));
}

TEST_F(StorageConfigTest, ReserveCreatesDirectoryAndFile) {
    std::filesystem::path destination;
    ASSERT_TRUE(config.reserve_destination("report.pdf", destination));

    EXPECT_EQ(destination, config.download_directory / "report.pdf");
    EXPECT_TRUE(std::filesystem::exists(destination));
    EXPECT_EQ(std::filesystem::file_size(destination), 0u);
}

TEST_F(StorageConfigTest, CollisionsGetNumberedNames) {
    std::filesystem::path first, second, third;
    ASSERT_TRUE(config.reserve_destination("report.pdf", first));
    ASSERT_TRUE(config.reserve_destination("report.pdf", second));
    ASSERT_TRUE(config.reserve_destination("report.pdf", third));

    EXPECT_EQ(first.filename(), "report.pdf");
    EXPECT_EQ(second.filename(), "report (1).pdf");
    EXPECT_EQ(third.filename(), "report (2).pdf");
}

TEST_F(StorageConfigTest, ExistingFilesAreNeverOverwritten) {
    ASSERT_TRUE(config.create_directories());
    auto existing = config.download_directory / "notes";
    std::ofstream(existing) << "keep me";

    std::filesystem::path destination;
    ASSERT_TRUE(config.reserve_destination("notes", destination));
    EXPECT_EQ(destination.filename(), "notes (1)");

    std::ifstream file(existing);
    std::string content;
    std::getline(file, content);
    EXPECT_EQ(content, "keep me");
}

TEST_F(StorageConfigTest, PathComponentsAreStripped) {
    std::filesystem::path destination;
    ASSERT_TRUE(config.reserve_destination("../../etc/passwd", destination));
    EXPECT_EQ(destination, config.download_directory / "passwd");
}

TEST_F(StorageConfigTest, UnusableNamesAreRejected) {
    std::filesystem::path destination;
    EXPECT_EQ(config.reserve_destination("..", destination).error, ErrorCode::PROTOCOL_VIOLATION);
    EXPECT_EQ(config.reserve_destination("", destination).error, ErrorCode::PROTOCOL_VIOLATION);
}

TEST_F(StorageConfigTest, UnwritableDirectoryFails) {
    std::filesystem::create_directories(test_dir);
    std::ofstream(test_dir / "file") << "x";

    StorageConfig blocked(test_dir / "file" / "Downloads");
    std::filesystem::path destination;
    EXPECT_EQ(blocked.reserve_destination("a.txt", destination).error, ErrorCode::DESTINATION_WRITE_FAILURE);
}
