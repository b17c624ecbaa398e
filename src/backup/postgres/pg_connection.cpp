#include "backup/postgres/pg_connection.hpp"
#include "common/logger.hpp"
#include "common/utils.hpp"
#include <sstream>

namespace {

std::string quoteConninfoValue(const std::string& value) {
    std::string quoted = "'";
    for (char c : value) {
        if (c == '\'' || c == '\\') {
            quoted.push_back('\\');
        }
        quoted.push_back(c);
    }
    quoted.push_back('\'');
    return quoted;
}

} // namespace

std::string PostgresConnectionConfig::conninfo(const std::string& databaseOverride) const {
    std::ostringstream ss;
    ss << "host=" << quoteConninfoValue(host)
       << " port=" << port
       << " dbname=" << quoteConninfoValue(databaseOverride.empty() ? database : databaseOverride)
       << " user=" << quoteConninfoValue(user)
       << " connect_timeout=10"
       << " sslmode=" << (ssl ? "require" : "prefer");
    if (!password.empty()) {
        ss << " password=" << quoteConninfoValue(password);
    }
    return ss.str();
}

std::optional<PostgresConnectionConfig> PostgresConnectionConfig::fromUrl(const std::string& url) {
    auto parsed = utils::parseUrl(url);
    if (!parsed || (parsed->scheme != "postgres" && parsed->scheme != "postgresql")) {
        Logger::error("Invalid PostgreSQL URL (credentials not shown)");
        return std::nullopt;
    }

    PostgresConnectionConfig config;
    if (!parsed->host.empty()) config.host = parsed->host;
    if (parsed->port > 0) config.port = parsed->port;
    if (!parsed->path.empty()) config.database = parsed->path;
    if (!parsed->user.empty()) config.user = parsed->user;
    config.password = parsed->password;

    for (const auto& pair : utils::split(parsed->query, '&')) {
        if (pair == "ssl=true" || pair == "ssl=1" || pair == "sslmode=require") {
            config.ssl = true;
        }
    }
    return config;
}

std::optional<PostgresConnectionConfig> PostgresConnectionConfig::fromEnvironment() {
    auto url = utils::getEnv("BACKUP_PG_URL");
    if (url) {
        return fromUrl(*url);
    }

    if (utils::getEnvOr("STORAGE_DATABASE_TYPE", "") != "postgres") {
        return std::nullopt;
    }

    PostgresConnectionConfig config;
    config.host = utils::getEnvOr("STORAGE_DATABASE_HOST", config.host);
    config.port = utils::getEnvInt("STORAGE_DATABASE_PORT", config.port);
    config.database = utils::getEnvOr("STORAGE_DATABASE_NAME", config.database);
    config.user = utils::getEnvOr("STORAGE_DATABASE_USER", config.user);
    config.password = utils::getEnvOr("STORAGE_DATABASE_PASSWORD", "");
    config.ssl = utils::getEnvBool("STORAGE_DATABASE_SSL", false);
    return config;
}

PgConnection::PgConnection(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());
    if (PQstatus(conn_) == CONNECTION_BAD) {
        lastError_ = std::string("database connection failure: ") + PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
    }
}

PgConnection::~PgConnection() {
    if (conn_) {
        PQfinish(conn_);
    }
}

bool PgConnection::isOpen() const {
    return conn_ && PQstatus(conn_) == CONNECTION_OK;
}

PGresult* PgConnection::run(const std::string& sql, const std::vector<std::string>& params) {
    if (!isOpen()) {
        if (lastError_.empty()) {
            lastError_ = "not connected";
        }
        return nullptr;
    }

    std::vector<const char*> values;
    for (const auto& param : params) {
        values.push_back(param.c_str());
    }
    PGresult* res = PQexecParams(conn_, sql.c_str(), static_cast<int>(values.size()), nullptr,
                                 values.empty() ? nullptr : values.data(), nullptr, nullptr, 0);
    ExecStatusType status = PQresultStatus(res);
    if (status != PGRES_TUPLES_OK && status != PGRES_COMMAND_OK) {
        lastError_ = PQerrorMessage(conn_);
        PQclear(res);
        return nullptr;
    }
    return res;
}

std::optional<std::string> PgConnection::queryScalar(const std::string& sql,
                                                     const std::vector<std::string>& params) {
    PGresult* res = run(sql, params);
    if (!res) {
        return std::nullopt;
    }
    std::optional<std::string> value;
    if (PQntuples(res) > 0 && PQnfields(res) > 0 && !PQgetisnull(res, 0, 0)) {
        value = PQgetvalue(res, 0, 0);
    }
    PQclear(res);
    return value;
}

std::vector<std::string> PgConnection::queryColumn(const std::string& sql,
                                                   const std::vector<std::string>& params) {
    std::vector<std::string> values;
    PGresult* res = run(sql, params);
    if (!res) {
        return values;
    }
    for (int row = 0; row < PQntuples(res); ++row) {
        values.emplace_back(PQgetvalue(res, row, 0));
    }
    PQclear(res);
    return values;
}

bool PgConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* res = run(sql, params);
    if (!res) {
        return false;
    }
    PQclear(res);
    return true;
}

std::string PgConnection::quoteIdentifier(const std::string& identifier) {
    if (!conn_) {
        std::string quoted = "\"";
        for (char c : identifier) {
            if (c == '"') {
                quoted.push_back('"');
            }
            quoted.push_back(c);
        }
        return quoted + "\"";
    }
    char* escaped = PQescapeIdentifier(conn_, identifier.c_str(), identifier.size());
    if (!escaped) {
        lastError_ = PQerrorMessage(conn_);
        return "";
    }
    std::string result(escaped);
    PQfreemem(escaped);
    return result;
}

int PgConnection::serverVersion() const {
    return conn_ ? PQserverVersion(conn_) : 0;
}
