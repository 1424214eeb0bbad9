/**
 * @file test_line_reader.cpp
 * @brief Chunked line splitting
 */

#include <gtest/gtest.h>
#include <replay/line_reader.hpp>
#include <support/test_support.hpp>
#include <utils/errors.hpp>

using namespace ChainReplay;
using namespace ChainReplay::test_support;

static std::vector<std::string> read_all(const std::string& path, size_t chunk_size) {
    LineReader reader(path, chunk_size);
    std::vector<std::string> lines;
    while (auto line = reader.next()) lines.push_back(*line);
    return lines;
}

TEST(LineReaderTest, SameLinesForEveryChunkSize) {
    TempDir dir;
    std::string path = dir.file("log.tsv");
    std::string long_line(300, 'x');
    write_text(path, "first\n\nsecond line\r\n" + long_line + "\nlast without newline");

    std::vector<std::string> expected = {"first", "", "second line", long_line, "last without newline"};
    for (size_t chunk : {1u, 2u, 3u, 7u, 64u, 299u, 300u, 301u, 65536u}) {
        EXPECT_EQ(read_all(path, chunk), expected) << "chunk size " << chunk;
    }
}

TEST(LineReaderTest, LineNumbersCountEmptyLines) {
    TempDir dir;
    std::string path = dir.file("log.tsv");
    write_text(path, "a\n\nb\n");

    LineReader reader(path, 2);
    ASSERT_EQ(reader.next().value(), "a");
    EXPECT_EQ(reader.line_number(), 1u);
    ASSERT_EQ(reader.next().value(), "");
    EXPECT_EQ(reader.line_number(), 2u);
    ASSERT_EQ(reader.next().value(), "b");
    EXPECT_EQ(reader.line_number(), 3u);
    EXPECT_FALSE(reader.next().has_value());
    EXPECT_FALSE(reader.next().has_value());
}

TEST(LineReaderTest, EmptyFileHasNoLines) {
    TempDir dir;
    std::string path = dir.file("empty.tsv");
    write_text(path, "");
    EXPECT_TRUE(read_all(path, 16).empty());
}

TEST(LineReaderTest, MissingFileFailsBeforeReading) {
    TempDir dir;
    EXPECT_THROW(LineReader(dir.file("missing.tsv")), IoError);
}
