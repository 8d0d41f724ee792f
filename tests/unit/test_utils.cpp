#include <gtest/gtest.h>
#include "chunkvault/core/utils.hpp"
#include <filesystem>
#include <fstream>

using namespace chunkvault::core::utils;

class StringUtilsTest : public ::testing::Test {};

TEST_F(StringUtilsTest, Split) {
    auto result = StringUtils::split("a,b,c", ',');
    ASSERT_EQ(result.size(), 3u);
    EXPECT_EQ(result[0], "a");
    EXPECT_EQ(result[1], "b");
    EXPECT_EQ(result[2], "c");

    EXPECT_TRUE(StringUtils::split("", ',').empty());
}

TEST_F(StringUtilsTest, Trim) {
    EXPECT_EQ(StringUtils::trim("  hello  "), "hello");
    EXPECT_EQ(StringUtils::trim("hello"), "hello");
    EXPECT_EQ(StringUtils::trim("   "), "");
    EXPECT_EQ(StringUtils::trim(""), "");
}

TEST_F(StringUtilsTest, ToLower) {
    EXPECT_EQ(StringUtils::to_lower("Hello World"), "hello world");
}

TEST_F(StringUtilsTest, FormatBytes) {
    EXPECT_EQ(StringUtils::format_bytes(500), "500.00 B");
    EXPECT_EQ(StringUtils::format_bytes(1024), "1.00 KB");
    EXPECT_EQ(StringUtils::format_bytes(5 * 1048576), "5.00 MB");
}

TEST_F(StringUtilsTest, FormatDuration) {
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(250)), "250ms");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(42000)), "42s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(125000)), "2m 5s");
    EXPECT_EQ(StringUtils::format_duration(std::chrono::milliseconds(3720000)), "1h 2m");
}

TEST_F(StringUtilsTest, SanitizeFileName) {
    EXPECT_EQ(StringUtils::sanitize_file_name("movie.mp4"), "movie.mp4");
    EXPECT_EQ(StringUtils::sanitize_file_name("my file (1).txt"), "my_file__1_.txt");
    EXPECT_EQ(StringUtils::sanitize_file_name("../etc/passwd"), ".._etc_passwd");
    EXPECT_EQ(StringUtils::sanitize_file_name(""), "file");
}

class FileUtilsTest : public ::testing::Test {
protected:
    void SetUp() override {
        test_file = "test_file.bin";
        test_dir = "test_dir";
    }

    void TearDown() override {
        std::filesystem::remove(test_file);
        std::filesystem::remove_all(test_dir);
    }

    void write_test_file(const std::string& content) {
        std::ofstream file(test_file, std::ios::binary);
        file << content;
    }

    std::string test_file;
    std::string test_dir;
};

TEST_F(FileUtilsTest, ExistsAndIsFile) {
    EXPECT_FALSE(FileUtils::exists(test_file));

    write_test_file("test");

    EXPECT_TRUE(FileUtils::exists(test_file));
    EXPECT_TRUE(FileUtils::is_file(test_file));
    EXPECT_TRUE(FileUtils::create_directories(test_dir));
    EXPECT_FALSE(FileUtils::is_file(test_dir));
}

TEST_F(FileUtilsTest, FileSize) {
    write_test_file("Hello, World!");

    auto size = FileUtils::file_size(test_file);
    ASSERT_TRUE(size.has_value());
    EXPECT_EQ(*size, 13u);
    EXPECT_FALSE(FileUtils::file_size("missing.bin").has_value());
}

TEST_F(FileUtilsTest, LastModified) {
    write_test_file("x");

    auto modified = FileUtils::last_modified_ms(test_file);
    ASSERT_TRUE(modified.has_value());
    EXPECT_GT(*modified, 0);
}

TEST_F(FileUtilsTest, ReadRange) {
    write_test_file("0123456789");

    auto middle = FileUtils::read_range(test_file, 3, 4);
    ASSERT_TRUE(middle.has_value());
    EXPECT_EQ(std::string(middle->begin(), middle->end()), "3456");

    // A range past the end is truncated to what the file holds
    auto tail = FileUtils::read_range(test_file, 8, 10);
    ASSERT_TRUE(tail.has_value());
    EXPECT_EQ(tail->size(), 2u);

    EXPECT_FALSE(FileUtils::read_range("missing.bin", 0, 1).has_value());
}

class TimeUtilsTest : public ::testing::Test {};

TEST_F(TimeUtilsTest, NowIsMonotonicEnough) {
    auto first = TimeUtils::now_ms();
    auto second = TimeUtils::now_ms();
    EXPECT_GE(second, first);
}

TEST_F(TimeUtilsTest, FormatTimestamp) {
    auto timestamp = TimeUtils::format_timestamp_ms(TimeUtils::now_ms());

    EXPECT_FALSE(timestamp.empty());
    EXPECT_NE(timestamp.find('-'), std::string::npos);
    EXPECT_NE(timestamp.find(':'), std::string::npos);
}
