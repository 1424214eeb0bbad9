/**
 * @file test_reorg_transform.cpp
 * @brief Canonical filtering of the raw log into the preorg file
 */

#include <gtest/gtest.h>
#include <replay/entity_scanner.hpp>
#include <replay/reorg_transform.hpp>
#include <support/test_support.hpp>
#include <filesystem>

using namespace ChainReplay;
using namespace ChainReplay::test_support;

namespace {

RawLogLine event(const std::string& path, const nlohmann::json& payload, uint64_t ordinal) {
    return RawLogLine{path, payload.dump(), ordinal};
}

} // namespace

TEST(ReorgTransformTest, DropsOrphansAndKeepsOrder) {
    std::string a = hash_of("a"), orphan = hash_of("orphan"), b = hash_of("b");
    CanonicalIndex index;
    index.index_block_hashes = {a, b};

    ReorgTransform transform(index);
    auto first = transform.apply(event("/new_block", new_block_payload(a, hash_of("g"), 1), 1));
    auto dropped = transform.apply(event("/new_block", new_block_payload(orphan, a, 2), 2));
    auto raw = transform.apply(RawLogLine{"/new_mempool_tx", "[]", 3});
    auto second = transform.apply(event("/new_block", new_block_payload(b, a, 2), 4));

    ASSERT_TRUE(first.has_value());
    EXPECT_FALSE(dropped.has_value());
    ASSERT_TRUE(raw.has_value());
    ASSERT_TRUE(second.has_value());
    EXPECT_EQ(first->substr(0, 2), "1\t");
    EXPECT_EQ(*raw, "3\t/new_mempool_tx\t[]");
    EXPECT_EQ(second->substr(0, 2), "4\t");

    EXPECT_EQ(transform.stats().lines_read, 4u);
    EXPECT_EQ(transform.stats().lines_written, 3u);
    EXPECT_EQ(transform.stats().orphans_dropped, 1u);
}

TEST(ReorgTransformTest, BurnBlocksCheckedAgainstBurnSet) {
    std::string burn = hash_of("burn");
    CanonicalIndex index;
    index.burn_block_hashes = {burn};

    ReorgTransform transform(index);
    EXPECT_TRUE(transform.apply(event("/new_burn_block", burn_block_payload(burn, 10), 1)).has_value());
    EXPECT_FALSE(transform.apply(event("/new_burn_block", burn_block_payload(hash_of("other"), 10), 2)).has_value());
}

TEST(ReorgTransformTest, RepeatedCanonicalBlockKeptOnce) {
    std::string a = hash_of("a");
    CanonicalIndex index;
    index.index_block_hashes = {a};

    ReorgTransform transform(index);
    EXPECT_TRUE(transform.apply(event("/new_block", new_block_payload(a, hash_of("g"), 1), 1)).has_value());
    EXPECT_FALSE(transform.apply(event("/new_block", new_block_payload(a, hash_of("g"), 1), 2)).has_value());
    EXPECT_EQ(transform.stats().duplicates_dropped, 1u);
}

TEST(ReorgTransformTest, ExcludedPathsAreDropped) {
    CanonicalIndex index;
    ReorgTransform transform(index, {"/new_mempool_tx"});
    EXPECT_FALSE(transform.apply(RawLogLine{"/new_mempool_tx", "[]", 1}).has_value());
    EXPECT_TRUE(transform.apply(RawLogLine{"/drop_mempool_tx", "{}", 2}).has_value());
    EXPECT_EQ(transform.stats().excluded_dropped, 1u);
}

// ============================================================================
// Preorg file generation
// ============================================================================

TEST(PreorgFileTest, ForkFreeLogIsCopiedUnchanged) {
    TempDir dir;
    std::string source = dir.file("events.tsv");
    std::string dest = dir.file("events.tsv-preorg");
    std::string b1 = hash_of("b1"), b2 = hash_of("b2"), burn = hash_of("burn");

    std::vector<nlohmann::json> payloads = {
        burn_block_payload(burn, 700),
        new_block_payload(b1, hash_of("g"), 1),
        new_block_payload(b2, b1, 2),
    };
    write_lines(source, {
        log_event(1, "/new_burn_block", payloads[0]),
        log_event(2, "/new_block", payloads[1]),
        log_line(3, "/attachments/new", "[]"),
        log_event(4, "/new_block", payloads[2]),
    });

    CanonicalIndex index = EntityScanner::scan_file(source, 128);
    auto stats = write_preorg_file(source, dest, index, 128);
    ASSERT_TRUE(stats.has_value());
    EXPECT_EQ(stats->lines_written, 4u);
    EXPECT_FALSE(std::filesystem::exists(dest + ".tmp"));

    auto lines = read_lines(dest);
    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "1\t/new_burn_block\t" + payloads[0].dump());
    EXPECT_EQ(lines[1], "2\t/new_block\t" + payloads[1].dump());
    EXPECT_EQ(lines[2], "3\t/attachments/new\t[]");
    EXPECT_EQ(lines[3], "4\t/new_block\t" + payloads[2].dump());
}

TEST(PreorgFileTest, ExistingDestinationSkipsGeneration) {
    TempDir dir;
    std::string source = dir.file("events.tsv");
    std::string dest = dir.file("events.tsv-preorg");
    write_lines(source, {log_line(1, "/new_mempool_tx", "[]")});
    write_text(dest, "already here\n");

    auto stats = write_preorg_file(source, dest, CanonicalIndex{}, 128);
    EXPECT_FALSE(stats.has_value());
    EXPECT_EQ(read_text(dest), "already here\n");
}
