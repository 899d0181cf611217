// Hydromat - File Utils Tests

#include <gtest/gtest.h>

#include "core/utils/file_utils.h"
#include "test_helpers.h"

using hm_test::TempDir;

// --- getExtension ---

TEST(FileUtils, GetExtension_Basic) {
    EXPECT_EQ(hm::file::getExtension("profile_0001.pdf"), "pdf");
}

TEST(FileUtils, GetExtension_Uppercase) {
    EXPECT_EQ(hm::file::getExtension("DRAWING.PDF"), "pdf");
}

TEST(FileUtils, GetExtension_NoExtension) {
    EXPECT_EQ(hm::file::getExtension("README"), "");
}

// --- read/write text ---

TEST(FileUtils, WriteAndReadText) {
    TempDir tmp("file_utils");
    auto path = tmp / "test.txt";

    ASSERT_TRUE(hm::file::writeText(path, "hello world"));

    auto result = hm::file::readText(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), "hello world");
}

TEST(FileUtils, WriteText_Truncates) {
    TempDir tmp("file_utils");
    auto path = tmp / "test.txt";

    ASSERT_TRUE(hm::file::writeText(path, "long content"));
    ASSERT_TRUE(hm::file::writeText(path, "short"));

    EXPECT_EQ(hm::file::readText(path).value_or(""), "short");
}

TEST(FileUtils, AppendText_CreatesThenAppends) {
    TempDir tmp("file_utils");
    auto path = tmp / "job.log";

    ASSERT_TRUE(hm::file::appendText(path, "first\n"));
    ASSERT_TRUE(hm::file::appendText(path, "second\n"));

    EXPECT_EQ(hm::file::readText(path).value_or(""), "first\nsecond\n");
}

TEST(FileUtils, ReadText_NonExistent) {
    auto result = hm::file::readText("/nonexistent/path/file.txt");
    EXPECT_FALSE(result.has_value());
}

// --- read/write binary ---

TEST(FileUtils, WriteAndReadBinary) {
    TempDir tmp("file_utils");
    auto path = tmp / "test.bin";

    hm::ByteBuffer data = {0xDE, 0xAD, 0xBE, 0xEF};
    ASSERT_TRUE(hm::file::writeBinary(path, data));

    auto result = hm::file::readBinary(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), data);
}

TEST(FileUtils, ReadBinary_EmptyFile) {
    TempDir tmp("file_utils");
    auto path = tmp / "empty.bin";
    ASSERT_TRUE(hm::file::writeBinary(path, hm::ByteBuffer{}));

    auto result = hm::file::readBinary(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_TRUE(result->empty());
}

TEST(FileUtils, ReadBinary_NonExistent) {
    auto result = hm::file::readBinary("/nonexistent/path/file.bin");
    EXPECT_FALSE(result.has_value());
}

// --- exists / isFile / isDirectory ---

TEST(FileUtils, Exists_CreatedFile) {
    TempDir tmp("file_utils");
    auto path = tmp / "exists.txt";
    ASSERT_TRUE(hm::file::writeText(path, "x"));

    EXPECT_TRUE(hm::file::exists(path));
    EXPECT_TRUE(hm::file::isFile(path));
    EXPECT_FALSE(hm::file::isDirectory(path));
}

TEST(FileUtils, Exists_Directory) {
    TempDir tmp("file_utils");
    EXPECT_TRUE(hm::file::exists(tmp.path()));
    EXPECT_TRUE(hm::file::isDirectory(tmp.path()));
    EXPECT_FALSE(hm::file::isFile(tmp.path()));
}

TEST(FileUtils, Exists_NonExistent) {
    EXPECT_FALSE(hm::file::exists("/nonexistent/file"));
}

// --- createDirectories ---

TEST(FileUtils, CreateDirectories_Nested) {
    TempDir tmp("file_utils");
    auto dir = tmp / "a" / "b" / "c";
    ASSERT_TRUE(hm::file::createDirectories(dir));
    EXPECT_TRUE(hm::file::isDirectory(dir));
}

TEST(FileUtils, CreateDirectories_AlreadyExists) {
    TempDir tmp("file_utils");
    EXPECT_TRUE(hm::file::createDirectories(tmp.path()));
}

// --- remove / move ---

TEST(FileUtils, Remove_File) {
    TempDir tmp("file_utils");
    auto path = tmp / "removeme.txt";
    ASSERT_TRUE(hm::file::writeText(path, "x"));

    EXPECT_TRUE(hm::file::remove(path));
    EXPECT_FALSE(hm::file::exists(path));
}

TEST(FileUtils, Remove_MissingReturnsFalse) {
    TempDir tmp("file_utils");
    EXPECT_FALSE(hm::file::remove(tmp / "missing.txt"));
}

TEST(FileUtils, Move_File) {
    TempDir tmp("file_utils");
    auto src = tmp / "src.txt";
    auto dst = tmp / "dst.txt";
    ASSERT_TRUE(hm::file::writeText(src, "content"));

    ASSERT_TRUE(hm::file::move(src, dst));
    EXPECT_FALSE(hm::file::exists(src));
    EXPECT_EQ(hm::file::readText(dst).value_or(""), "content");
}

// --- getFileSize ---

TEST(FileUtils, GetFileSize) {
    TempDir tmp("file_utils");
    auto path = tmp / "size.txt";
    ASSERT_TRUE(hm::file::writeText(path, "hello"));

    auto result = hm::file::getFileSize(path);
    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result.value(), 5u);
}

TEST(FileUtils, GetFileSize_Missing) {
    EXPECT_FALSE(hm::file::getFileSize("/nonexistent/size.txt").has_value());
}

// --- listFiles ---

TEST(FileUtils, ListFiles_SortedByName) {
    TempDir tmp("file_utils");
    ASSERT_TRUE(hm::file::writeText(tmp / "c.txt", "c"));
    ASSERT_TRUE(hm::file::writeText(tmp / "a.txt", "a"));
    ASSERT_TRUE(hm::file::writeText(tmp / "b.pdf", "b"));
    ASSERT_TRUE(hm::file::createDirectories(tmp / "sub"));

    auto all = hm::file::listFiles(tmp.path());
    ASSERT_EQ(all.size(), 3u);
    EXPECT_EQ(all[0].filename(), "a.txt");
    EXPECT_EQ(all[2].filename(), "c.txt");
}

TEST(FileUtils, ListFiles_FilteredByExtension) {
    TempDir tmp("file_utils");
    ASSERT_TRUE(hm::file::writeText(tmp / "a.txt", "a"));
    ASSERT_TRUE(hm::file::writeText(tmp / "b.PDF", "b"));
    ASSERT_TRUE(hm::file::writeText(tmp / "c.txt", "c"));

    auto pdfs = hm::file::listFiles(tmp.path(), "pdf");
    ASSERT_EQ(pdfs.size(), 1u);
    EXPECT_EQ(pdfs[0].filename(), "b.PDF");
}

TEST(FileUtils, ListFiles_MissingDirectory) {
    EXPECT_TRUE(hm::file::listFiles("/nonexistent/dir").empty());
}
