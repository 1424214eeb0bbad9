#pragma once

#include <database/postgres_connection.hpp>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace ChainReplay {

/**
 * @brief Stream many rows into one Postgres table using text-mode COPY.
 *
 * Usage:
 *   BulkCopy bc(conn);
 *   bc.begin_table("txs", {"tx_id","tx_index",...});
 *   for (...) bc.add_row({...});
 *   bc.flush();
 *
 * Notes:
 * - begin_table must be called before add_row.
 * - Rows go straight into the target table; duplicate keys fail only when
 *   the table's unique indexes are live.
 * - A connection can run only one COPY at a time: flush before any other
 *   statement on the same connection.
 * - Not thread-safe; use one instance per connection/thread.
 */
class BulkCopy {
public:
    using Value = std::optional<std::string>;

    explicit BulkCopy(PostgresConnection& db) noexcept;
    ~BulkCopy();

    BulkCopy(const BulkCopy&) = delete;
    BulkCopy& operator=(const BulkCopy&) = delete;

    // Prepare for a target table and column list. Call once before add_row.
    void begin_table(const std::string& table_name, const std::vector<std::string>& columns);

    // Add a row. values.size() may be <= columns.size(); missing values and std::nullopt become NULL.
    void add_row(const std::vector<Value>& values);

    // Send buffered rows and finish the COPY.
    void flush();

    // Number of rows added since begin_table (resets after flush)
    size_t count() const noexcept { return row_count_; }

    static std::string quote_identifier(const std::string& id);

private:
    void start_copy_if_needed();
    void send_buffer();
    void escape_value_into_buffer(const std::string& value);
    std::string full_table_name() const;

    PostgresConnection& db_;
    std::ostringstream buffer_;

    std::string schema_;
    std::string table_name_;
    std::vector<std::string> columns_;
    size_t row_count_ = 0;
    bool in_copy_ = false;

    static constexpr size_t DEFAULT_FLUSH_ROWS = 50000;
};

} // namespace ChainReplay
