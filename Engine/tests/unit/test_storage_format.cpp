/**
 * @file test_storage_format.cpp
 * @brief Column formatting and connection settings (no database needed)
 */

#include <gtest/gtest.h>
#include <config/db_config.hpp>
#include <database/bulk_copy.hpp>
#include <storage/format_utils.hpp>
#include <storage/pg_event_store.hpp>
#include <utils/errors.hpp>
#include <utils/hex.hpp>
#include <utils/time_tracker.hpp>
#include <sstream>

using namespace ChainReplay;

TEST(StorageFormatTest, HexBecomesByteaInput) {
    EXPECT_EQ(hex_to_bytea("0xdeadBEEF"), "\\xdeadBEEF");
    EXPECT_EQ(hex_to_bytea("0x"), "\\x");
    EXPECT_EQ(hex_to_bytea(""), "\\x");
    EXPECT_EQ(opt_hex_to_bytea(std::optional<std::string>("0x01")).value(), "\\x01");
    EXPECT_FALSE(opt_hex_to_bytea(std::nullopt).has_value());
}

TEST(StorageFormatTest, Scalars) {
    EXPECT_EQ(bool_field(true), "t");
    EXPECT_EQ(bool_field(false), "f");
    EXPECT_EQ(int_field(static_cast<int16_t>(-2)), "-2");
    EXPECT_EQ(int_field(uint64_t{18446744073709551615ULL}), "18446744073709551615");
}

TEST(StorageFormatTest, HexDecoding) {
    EXPECT_EQ(hex_to_bytes("0x6869"), "hi");
    EXPECT_EQ(hex_to_bytes(""), "");
    EXPECT_THROW(hex_to_bytes("0x123"), ParseError);
    EXPECT_THROW(hex_to_bytes("zz"), ParseError);
}

TEST(StorageFormatTest, IdentifiersAreQuoted) {
    EXPECT_EQ(BulkCopy::quote_identifier("txs"), "\"txs\"");
    EXPECT_EQ(BulkCopy::quote_identifier("we\"ird"), "\"we\"\"ird\"");
}

TEST(DbConfigTest, ConninfoQuotesValuesAndSetsSearchPath) {
    DbConfig config;
    config.host = "db.internal";
    config.password = "p'w";
    config.schema = "stacks";

    std::string conninfo = config.to_conninfo();
    EXPECT_NE(conninfo.find("host='db.internal'"), std::string::npos);
    EXPECT_NE(conninfo.find("dbname='stacks_blockchain_api'"), std::string::npos);
    EXPECT_NE(conninfo.find("password='p\\'w'"), std::string::npos);
    EXPECT_NE(conninfo.find("options='-c search_path=stacks'"), std::string::npos);
}

TEST(TimeTrackerTest, AccumulatesCallsPerName) {
    TimeTracker tracker;
    int value = tracker.track("parse", [] { return 7; });
    tracker.track("parse", [] {});
    EXPECT_THROW(tracker.track("insert", []() -> int { throw StorageError("boom"); }), StorageError);

    EXPECT_EQ(value, 7);
    ASSERT_EQ(tracker.entries().size(), 2u);
    EXPECT_EQ(tracker.entries().at("parse").calls, 2u);
    EXPECT_EQ(tracker.entries().at("insert").calls, 1u);

    std::ostringstream out;
    tracker.print_table(out);
    EXPECT_NE(out.str().find("parse"), std::string::npos);
    EXPECT_NE(out.str().find("insert"), std::string::npos);
}

TEST(PgEventStoreTest, SchemaComesFromTheConnection) {
    EXPECT_EQ(PgEventStore::resolve_schema(std::optional<std::string>("stacks")), "stacks");
    EXPECT_THROW(PgEventStore::resolve_schema(std::nullopt), StorageError);
    EXPECT_THROW(PgEventStore::resolve_schema(std::optional<std::string>("")), StorageError);
}

TEST(PgEventStoreTest, TablesAreSchemaQualified) {
    EXPECT_EQ(PgEventStore::qualified_table("stacks", "blocks"), "\"stacks\".\"blocks\"");
    EXPECT_EQ(PgEventStore::qualified_table("my.schema", "txs"), "\"my.schema\".\"txs\"");
}
