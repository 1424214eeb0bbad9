#pragma once

#include <string>

namespace ChainReplay {

/**
 * @brief Connection settings for the destination database.
 *
 * Read from the standard PostgreSQL environment variables plus PGSCHEMA,
 * which names the schema the event tables live in.
 */
struct DbConfig {
    std::string host = "localhost";
    std::string port = "5432";
    std::string dbname = "stacks_blockchain_api";
    std::string user = "postgres";
    std::string password;
    std::string schema = "public";

    static DbConfig from_env();

    // libpq keyword/value string, values quoted as libpq requires
    std::string to_conninfo() const;
};

} // namespace ChainReplay
