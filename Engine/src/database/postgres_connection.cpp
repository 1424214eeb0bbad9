/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <config/db_config.hpp>
#include <utils/errors.hpp>
#include <utils/logger.hpp>
#include <cstring>

namespace ChainReplay {

PostgresConnection::PostgresConnection() {
    connect(DbConfig::from_env().to_conninfo());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_), last_error_(std::move(other.last_error_)) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        last_error_ = std::move(other.last_error_);
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        last_error_ = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw StorageError("PostgreSQL connection failed: " + last_error_);
    }

    // Import is re-runnable from cached artifacts, trade durability for speed
    execute("SET synchronous_commit = off");
}

void PostgresConnection::disconnect() {
    if (conn_) {
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

bool PostgresConnection::is_connected() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

void PostgresConnection::ensure_connected() const {
    if (!is_connected()) {
        throw StorageError("Not connected to database");
    }
}

void PostgresConnection::check_result(PGresult* result) {
    ExecStatusType status = PQresultStatus(result);

    if (status == PGRES_COMMAND_OK || status == PGRES_TUPLES_OK ||
        status == PGRES_COPY_IN || status == PGRES_COPY_OUT) {
        return;
    }

    last_error_ = PQerrorMessage(conn_);
    const char* sqlstate = PQresultErrorField(result, PG_DIAG_SQLSTATE);
    const char* detail = PQresultErrorField(result, PG_DIAG_MESSAGE_DETAIL);
    bool constraint = sqlstate && std::strncmp(sqlstate, "23", 2) == 0;
    std::string message = last_error_;
    if (detail) {
        message += std::string(" (") + detail + ")";
    }
    PQclear(result);

    if (constraint) {
        throw ConstraintViolation("PostgreSQL constraint violation: " + message);
    }
    throw StorageError("PostgreSQL query failed: " + message);
}

void PostgresConnection::execute(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);
    PQclear(result);
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::optional<std::string>>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p ? p->c_str() : nullptr);
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    check_result(result);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql) {
    ensure_connected();

    PGresult* result = PQexec(conn_, sql.c_str());
    check_result(result);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    ensure_connected();

    std::vector<const char*> param_values;
    param_values.reserve(params.size());
    for (const auto& p : params) {
        param_values.push_back(p.c_str());
    }

    PGresult* result = PQexecParams(
        conn_,
        sql.c_str(),
        static_cast<int>(params.size()),
        nullptr,
        param_values.data(),
        nullptr,
        nullptr,
        0
    );

    check_result(result);

    std::optional<std::string> value;

    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::copy_data(const char* buffer, int nbytes) {
    ensure_connected();

    int result = PQputCopyData(conn_, buffer, nbytes);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("COPY data failed: " + last_error_);
    }
}

void PostgresConnection::copy_end(const char* error_msg) {
    ensure_connected();

    int result = PQputCopyEnd(conn_, error_msg);
    if (result == -1) {
        last_error_ = PQerrorMessage(conn_);
        throw StorageError("COPY end failed: " + last_error_);
    }

    // After sending end, drain every pending result; the first one carries the COPY status
    PGresult* res = PQgetResult(conn_);
    while (res != nullptr) {
        check_result(res);
        PQclear(res);
        res = PQgetResult(conn_);
    }
}

void PostgresConnection::begin() {
    execute("BEGIN");
}

void PostgresConnection::commit() {
    execute("COMMIT");
}

void PostgresConnection::rollback() {
    execute("ROLLBACK");
}

std::string PostgresConnection::last_error() const {
    return last_error_;
}

// Transaction RAII
PostgresConnection::Transaction::Transaction(PostgresConnection& conn) : conn_(conn) {
    conn_.begin();
}

PostgresConnection::Transaction::~Transaction() {
    if (!committed_ && !rolled_back_) {
        try {
            conn_.rollback();
        } catch (const std::exception& e) {
            Logger::warn(std::string("Rollback failed: ") + e.what());
        }
    }
}

void PostgresConnection::Transaction::commit() {
    conn_.commit();
    committed_ = true;
}

void PostgresConnection::Transaction::rollback() {
    conn_.rollback();
    rolled_back_ = true;
}

} // namespace ChainReplay
