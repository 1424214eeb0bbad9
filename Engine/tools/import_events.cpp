/**
 * @file import_events.cpp
 * @brief Replay a node's event observer log into PostgreSQL
 *
 * Usage: import_events <events.tsv> [--schema <file.sql>] [--conninfo <str>]
 *                      [--tx-batch <n>] [--principal-batch <n>] [--exclude <path>]...
 */

#include <config/db_config.hpp>
#include <config/run_config.hpp>
#include <database/postgres_connection.hpp>
#include <replay/bulk_importer.hpp>
#include <storage/pg_event_store.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

using namespace ChainReplay;
namespace fs = std::filesystem;

static void print_usage(const char* program) {
    std::cerr << "Usage: " << program << " <events.tsv> [options]\n"
              << "  --schema <file.sql>     apply DDL before importing\n"
              << "  --conninfo <str>        libpq connection string (default: PG* environment)\n"
              << "  --tx-batch <n>          txs rows per COPY (default 1000)\n"
              << "  --principal-batch <n>   principal_stx_txs rows per COPY (default 1000)\n"
              << "  --exclude <path>        drop an event path from the preorg file (repeatable)\n";
}

static std::string read_file_content(const std::string& path) {
    std::ifstream file(path);
    if (!file.is_open()) {
        throw IoError("Could not open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return buffer.str();
}

static size_t parse_batch_size(const std::string& flag, const std::string& value) {
    size_t pos = 0;
    unsigned long n = 0;
    try {
        n = std::stoul(value, &pos);
    } catch (const std::exception&) {
        pos = 0;
    }
    if (pos != value.size() || n == 0) {
        throw std::invalid_argument(flag + " expects a positive integer, got '" + value + "'");
    }
    return static_cast<size_t>(n);
}

int main(int argc, char** argv) {
    if (argc < 2) {
        print_usage(argv[0]);
        return 1;
    }

    RunConfig config;
    config.source_path = argv[1];
    std::string schema_path;
    DbConfig db_config = DbConfig::from_env();
    std::string conninfo;

    try {
        for (int i = 2; i < argc; ++i) {
            std::string arg = argv[i];
            if (i + 1 >= argc) {
                throw std::invalid_argument("Missing value for " + arg);
            }
            std::string value = argv[++i];
            if (arg == "--schema") schema_path = value;
            else if (arg == "--conninfo") conninfo = value;
            else if (arg == "--tx-batch") config.tx_batch_size = parse_batch_size(arg, value);
            else if (arg == "--principal-batch") config.principal_batch_size = parse_batch_size(arg, value);
            else if (arg == "--exclude") config.excluded_paths.insert(value);
            else throw std::invalid_argument("Unknown option " + arg);
        }
    } catch (const std::invalid_argument& e) {
        std::cerr << e.what() << "\n";
        print_usage(argv[0]);
        return 1;
    }

    if (conninfo.empty()) {
        conninfo = db_config.to_conninfo();
    }

    try {
        if (!fs::exists(config.source_path)) {
            throw IoError("Event log not found: " + config.source_path);
        }

        Timer total_timer;
        PostgresConnection db(conninfo);

        if (!schema_path.empty()) {
            Logger::step("Applying schema from " + schema_path);
            std::string schema_sql = read_file_content(schema_path);
            PostgresConnection::Transaction txn(db);
            db.execute(schema_sql);
            txn.commit();
            Logger::success("Schema applied");
        }

        // The connection's search_path decides where the tables are, whether it came
        // from PGSCHEMA or from --conninfo; index control and writes both use it.
        std::string schema = PgEventStore::resolve_schema(db.query_single("SELECT current_schema()"));
        if (schema != db_config.schema) {
            Logger::info("Using schema '" + schema + "' from the connection's search_path");
        }

        PgEventStore store(db, schema);
        EventImporter importer(store, config);
        const ImportReport& report = importer.run();

        std::cout << "\n";
        importer.time_tracker().print_table(std::cout);
        std::cout << "\n";
        for (const auto& [phase, records] : report.phase_records) {
            Logger::info(phase + ": " + std::to_string(records) + " events");
        }
        Logger::success("Total import time: " + total_timer.elapsed_str() + "s");
        return 0;

    } catch (const std::exception& e) {
        Logger::error(e.what());
        return 1;
    }
}
