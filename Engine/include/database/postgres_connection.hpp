/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection and query interface
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <libpq-fe.h>

namespace ChainReplay {

/**
 * @brief PostgreSQL connection wrapper
 *
 * Failures surface as StorageError; statements rejected by a unique,
 * foreign-key or check constraint (SQLSTATE class 23) surface as
 * ConstraintViolation with the server's detail line attached.
 */
class PostgresConnection {
public:
    /**
     * @brief Connect using PG* environment variables (see DbConfig::from_env)
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    // No copy
    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    // Move OK
    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Check if connected
     */
    bool is_connected() const;

    /**
     * @brief Execute query (no results expected)
     */
    void execute(const std::string& sql);

    /**
     * @brief Execute query with parameters (no results)
     *
     * A std::nullopt parameter is sent as SQL NULL.
     */
    void execute(const std::string& sql, const std::vector<std::optional<std::string>>& params);

    /**
     * @brief Execute query and return single value
     */
    std::optional<std::string> query_single(const std::string& sql);

    /**
     * @brief Execute query and return single value with params
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params);

    /**
     * @brief Send a chunk of COPY FROM STDIN data
     */
    void copy_data(const char* buffer, int nbytes);

    /**
     * @brief Finish COPY FROM STDIN; error_msg != nullptr aborts the COPY
     */
    void copy_end(const char* error_msg);

    /**
     * @brief Begin transaction
     */
    void begin();

    /**
     * @brief Commit transaction
     */
    void commit();

    /**
     * @brief Rollback transaction
     */
    void rollback();

    /**
     * @brief RAII transaction guard
     */
    class Transaction {
    public:
        explicit Transaction(PostgresConnection& conn);
        ~Transaction();

        Transaction(const Transaction&) = delete;
        Transaction& operator=(const Transaction&) = delete;

        void commit();
        void rollback();

    private:
        PostgresConnection& conn_;
        bool committed_ = false;
        bool rolled_back_ = false;
    };

    /**
     * @brief Get last error message
     */
    std::string last_error() const;

private:
    void connect(const std::string& conninfo);
    void disconnect();
    void ensure_connected() const;
    void check_result(PGresult* result);

    PGconn* conn_ = nullptr;
    std::string last_error_;
};

} // namespace ChainReplay
