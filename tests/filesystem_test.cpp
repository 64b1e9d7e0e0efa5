// filesystem_test.cpp - local filesystem adapter on a scratch directory

#include <patchwise/filesystem.hpp>

#include <gtest/gtest.h>

#include <fstream>
#include <string>
#include <unistd.h>

using patchwise::DirEntry;
using patchwise::LocalFileSystem;

namespace {

class LocalFileSystemTest : public ::testing::Test {
protected:
    std::filesystem::path root;
    LocalFileSystem files;

    void SetUp() override {
        root = std::filesystem::temp_directory_path() /
               ("patchwise_fs_" + std::to_string(::getpid()) + "_" +
                ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::remove_all(root);
        std::filesystem::create_directories(root);
    }

    void TearDown() override {
        std::filesystem::remove_all(root);
    }
};

} // namespace

TEST_F(LocalFileSystemTest, write_then_read_preserves_bytes) {
    const std::string bytes = std::string("line one\r\nline two\n") + '\0' + "tail";
    files.write(root / "data.bin", bytes);
    EXPECT_EQ(files.read(root / "data.bin"), bytes);
    EXPECT_TRUE(files.exists(root / "data.bin"));
}

TEST_F(LocalFileSystemTest, missing_file_reads_as_nullopt) {
    EXPECT_EQ(files.read(root / "absent.txt"), std::nullopt);
    EXPECT_FALSE(files.exists(root / "absent.txt"));
}

TEST_F(LocalFileSystemTest, reading_a_directory_throws) {
    EXPECT_THROW(files.read(root), std::runtime_error);
}

TEST_F(LocalFileSystemTest, writing_into_missing_directory_throws) {
    EXPECT_THROW(files.write(root / "no" / "such" / "file.txt", "x"), std::runtime_error);
}

TEST_F(LocalFileSystemTest, list_is_sorted_and_flags_directories) {
    std::filesystem::create_directories(root / "src");
    std::ofstream(root / "b.txt") << "b";
    std::ofstream(root / "a.txt") << "a";

    const auto entries = files.list(root);
    ASSERT_EQ(entries.size(), 3u);
    EXPECT_EQ(entries[0].name, "a.txt");
    EXPECT_FALSE(entries[0].is_directory);
    EXPECT_EQ(entries[1].name, "b.txt");
    EXPECT_EQ(entries[2].name, "src");
    EXPECT_TRUE(entries[2].is_directory);

    EXPECT_THROW(files.list(root / "missing"), std::runtime_error);
}
