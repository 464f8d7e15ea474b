/**
 * @file test_atomic_file.cpp
 * @brief Unit tests for AtomicFile crash-safe replacement
 */

#include <gtest/gtest.h>
#include <fpservice/storage/AtomicFile.hpp>
#include <fpservice/core/exception.h>

#include "SessionTestDoubles.hpp"

#include <filesystem>
#include <fstream>

using namespace fpservice;
using namespace fpservice::storage;
using fpservice::testing::TempDir;

namespace {

void writeRaw(const std::string& path, const std::string& contents) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    out << contents;
}

} // namespace

class AtomicFileTest : public ::testing::Test {
protected:
    TempDir dir_;
};

TEST_F(AtomicFileTest, MissingFileReadsAsNothing) {
    AtomicFile file(dir_.file("templates.yaml"));
    EXPECT_FALSE(file.exists());
    EXPECT_FALSE(file.read().has_value());
}

TEST_F(AtomicFileTest, WriteThenReadReturnsContents) {
    AtomicFile file(dir_.file("templates.yaml"));
    file.write("first");
    file.write("second");

    auto contents = file.read();
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(*contents, "second");
    EXPECT_FALSE(std::filesystem::exists(file.getBackupPath()));
    EXPECT_FALSE(std::filesystem::exists(file.getStagingPath()));
}

TEST_F(AtomicFileTest, LeftoverBackupWinsOverPublishedFile) {
    AtomicFile file(dir_.file("templates.yaml"));
    // Simulates a crash after the backup was taken and a partial file published
    writeRaw(file.getBackupPath(), "last good");
    writeRaw(file.getPath(), "torn wri");

    EXPECT_TRUE(file.exists());
    auto contents = file.read();
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(*contents, "last good");
    EXPECT_FALSE(std::filesystem::exists(file.getBackupPath()));
}

TEST_F(AtomicFileTest, FailedWriteKeepsPreviousContents) {
    AtomicFile file(dir_.file("templates.yaml"));
    file.write("stable");

    // A directory at the staging path makes creating it fail
    std::filesystem::create_directory(file.getStagingPath());

    try {
        file.write("never published");
        FAIL() << "expected FileException";
    } catch (const core::FileException& e) {
        EXPECT_EQ(e.getResultCode(), core::ResultCode::ERROR_FILE_IO);
    }

    std::filesystem::remove(file.getStagingPath());
    auto contents = file.read();
    ASSERT_TRUE(contents.has_value());
    EXPECT_EQ(*contents, "stable");
}

TEST_F(AtomicFileTest, RemoveDeletesAllCopies) {
    AtomicFile file(dir_.file("templates.yaml"));
    file.write("data");
    writeRaw(file.getBackupPath(), "old");

    file.remove();
    EXPECT_FALSE(file.exists());
    EXPECT_FALSE(std::filesystem::exists(file.getPath()));
    EXPECT_FALSE(std::filesystem::exists(file.getBackupPath()));
}
