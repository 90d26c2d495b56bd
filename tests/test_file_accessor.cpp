// Copyright (c) 2025 Elias Bachaalany
// SPDX-License-Identifier: MIT

#include "test_helpers.hpp"

#include <acp/file_accessor.hpp>
#include <acp/utf8.hpp>
#include <gtest/gtest.h>
#include <limits>

using namespace acp;
using acp::test::TempDir;

// =============================================================================
// Line Selection Tests
// =============================================================================

TEST(SplitLinesTest, RecognizesAllTerminators)
{
    auto lines = split_lines("a\nb\r\nc\rd");
    EXPECT_EQ(lines, (std::vector<std::string>{"a", "b", "c", "d"}));
}

TEST(SplitLinesTest, TrailingTerminatorAddsNoLine)
{
    EXPECT_EQ(split_lines("a\n"), (std::vector<std::string>{"a"}));
    EXPECT_EQ(split_lines("a\n\n"), (std::vector<std::string>{"a", ""}));
    EXPECT_TRUE(split_lines("").empty());
}

TEST(SelectLinesTest, NoLineReturnsTextUnchanged)
{
    EXPECT_EQ(select_lines("a\r\nb\n", std::nullopt, std::nullopt), "a\r\nb\n");
    EXPECT_EQ(select_lines("a\nb\nc", std::nullopt, 1), "a\nb\nc");
}

TEST(SelectLinesTest, LineAndLimit)
{
    EXPECT_EQ(select_lines("a\nb\nc", 2, 1), "b");
    EXPECT_EQ(select_lines("a\nb\nc", 1, 2), "a\nb");
}

TEST(SelectLinesTest, LineWithoutLimitReadsToEnd)
{
    EXPECT_EQ(select_lines("a\nb\nc", 2, std::nullopt), "b\nc");
    EXPECT_EQ(select_lines("a\nb\nc\n", 1, std::nullopt), "a\nb\nc");
}

TEST(SelectLinesTest, LineBelowOneClampsToStart)
{
    EXPECT_EQ(select_lines("a\nb", 0, std::nullopt), "a\nb");
    EXPECT_EQ(select_lines("a\nb", -5, 1), "a");
}

TEST(SelectLinesTest, OutOfRangeWindows)
{
    EXPECT_EQ(select_lines("a\nb", 10, std::nullopt), "");
    EXPECT_EQ(select_lines("a\nb", 2, 100), "b");
    EXPECT_EQ(select_lines("a\nb", 1, 0), "");
}

TEST(SelectLinesTest, NegativeLimitCountsFromEnd)
{
    EXPECT_EQ(select_lines("a\nb\nc\nd", 1, -1), "a\nb\nc");
    EXPECT_EQ(select_lines("a\nb\nc\nd", 2, -2), "b\nc");
    EXPECT_EQ(select_lines("a\nb\nc\nd", 4, -1), "");
    EXPECT_EQ(select_lines("a\nb", 1, -10), "");
    EXPECT_EQ(select_lines("a\nb", 1, std::numeric_limits<int64_t>::min()), "");
}

TEST(SelectLinesTest, HugeLimitReadsToEnd)
{
    EXPECT_EQ(select_lines("a\nb\nc", 2, std::numeric_limits<int64_t>::max()), "b\nc");
    EXPECT_EQ(
        select_lines("a\nb", std::numeric_limits<int64_t>::max(), std::numeric_limits<int64_t>::max()),
        ""
    );
}

// =============================================================================
// UTF-8 Tests
// =============================================================================

TEST(Utf8Test, SanitizeKeepsWellFormedText)
{
    std::string text = "plain \xc3\xa9 \xe2\x82\xac \xf0\x9f\x98\x80";
    EXPECT_EQ(utf8::sanitize(text), text);
}

TEST(Utf8Test, SanitizeDropsIllFormedBytes)
{
    EXPECT_EQ(utf8::sanitize("a\xff" "b"), "ab");
    EXPECT_EQ(utf8::sanitize("a\xe2\x82" "b"), "ab");
    EXPECT_EQ(utf8::sanitize("\xc0\xaf"), "");       // overlong
    EXPECT_EQ(utf8::sanitize("\xed\xa0\x80"), "");   // surrogate
    EXPECT_EQ(utf8::sanitize("x\x80y"), "xy");
}

TEST(Utf8Test, LengthCountsCodePoints)
{
    EXPECT_EQ(utf8::length(""), 0u);
    EXPECT_EQ(utf8::length("abc"), 3u);
    EXPECT_EQ(utf8::length("\xc3\xa9\xe2\x82\xac\xf0\x9f\x98\x80"), 3u);
}

// =============================================================================
// LocalFileAccessor Tests
// =============================================================================

TEST(LocalFileAccessorTest, ReadExistingFile)
{
    TempDir dir;
    dir.write("notes.txt", "line one\nline two\n");

    LocalFileAccessor files;
    auto content = files.read_text(dir.path() / "notes.txt");
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), "line one\nline two\n");
}

TEST(LocalFileAccessorTest, ReadMissingFileIsNotFound)
{
    TempDir dir;
    LocalFileAccessor files;

    auto content = files.read_text(dir.path() / "missing.txt");
    ASSERT_FALSE(content.ok());
    EXPECT_EQ(content.error().kind, ErrorKind::NotFound);
}

TEST(LocalFileAccessorTest, ReadDirectoryIsIoError)
{
    TempDir dir;
    LocalFileAccessor files;

    auto content = files.read_text(dir.path());
    ASSERT_FALSE(content.ok());
    EXPECT_EQ(content.error().kind, ErrorKind::Io);
}

TEST(LocalFileAccessorTest, ReadDropsInvalidBytes)
{
    TempDir dir;
    dir.write("bin.txt", "ok\xff\xfe!");

    LocalFileAccessor files;
    auto content = files.read_text(dir.path() / "bin.txt");
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), "ok!");
}

TEST(LocalFileAccessorTest, WriteCreatesParentDirectories)
{
    TempDir dir;
    LocalFileAccessor files;

    auto status = files.write_text(dir.path() / "a" / "b" / "c.txt", "deep");
    ASSERT_TRUE(status.ok());
    EXPECT_EQ(dir.read("a/b/c.txt"), "deep");
}

TEST(LocalFileAccessorTest, WriteOverwritesExistingFile)
{
    TempDir dir;
    dir.write("f.txt", "a much longer original body");

    LocalFileAccessor files;
    ASSERT_TRUE(files.write_text(dir.path() / "f.txt", "short").ok());
    EXPECT_EQ(dir.read("f.txt"), "short");
}

TEST(LocalFileAccessorTest, WriteOverDirectoryFails)
{
    TempDir dir;
    std::filesystem::create_directories(dir.path() / "taken");

    LocalFileAccessor files;
    auto status = files.write_text(dir.path() / "taken", "x");
    ASSERT_FALSE(status.ok());
    EXPECT_EQ(status.error().kind, ErrorKind::Io);
}

TEST(LocalFileAccessorTest, WriteThenReadRoundTrip)
{
    TempDir dir;
    LocalFileAccessor files;
    std::string text = "first\nsecond \xe2\x9c\x93\n\nlast";

    ASSERT_TRUE(files.write_text(dir.path() / "x" / "y.md", text).ok());
    auto content = files.read_text(dir.path() / "x" / "y.md");
    ASSERT_TRUE(content.ok());
    EXPECT_EQ(content.value(), text);
}
