#include <config/db_config.hpp>
#include <cstdlib>
#include <sstream>

namespace ChainReplay {

namespace {

std::string env_or(const char* name, const std::string& fallback) {
    const char* value = std::getenv(name);
    return (value && *value) ? std::string(value) : fallback;
}

std::string quote_conninfo_value(const std::string& value) {
    std::string out = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') out.push_back('\\');
        out.push_back(c);
    }
    out.push_back('\'');
    return out;
}

} // namespace

DbConfig DbConfig::from_env() {
    DbConfig config;
    config.host = env_or("PGHOST", config.host);
    config.port = env_or("PGPORT", config.port);
    config.dbname = env_or("PGDATABASE", config.dbname);
    config.user = env_or("PGUSER", config.user);
    config.password = env_or("PGPASSWORD", "");
    config.schema = env_or("PGSCHEMA", config.schema);
    return config;
}

std::string DbConfig::to_conninfo() const {
    std::ostringstream conninfo;
    conninfo << "host=" << quote_conninfo_value(host) << " ";
    conninfo << "port=" << quote_conninfo_value(port) << " ";
    conninfo << "dbname=" << quote_conninfo_value(dbname) << " ";
    conninfo << "user=" << quote_conninfo_value(user);

    if (!password.empty()) {
        conninfo << " password=" << quote_conninfo_value(password);
    }
    if (!schema.empty()) {
        conninfo << " options=" << quote_conninfo_value("-c search_path=" + schema);
    }
    return conninfo.str();
}

} // namespace ChainReplay
