/**
 * @file postgres_connection.cpp
 * @brief PostgreSQL connection implementation
 */

#include <database/postgres_connection.hpp>
#include <core/errors.hpp>
#include <cstdlib>
#include <sstream>

namespace Driftwatch {

std::string PostgresConnection::conninfo_from_env() {
    std::ostringstream conninfo;

    const char* host = std::getenv("PGHOST");
    const char* port = std::getenv("PGPORT");
    const char* dbname = std::getenv("PGDATABASE");
    const char* user = std::getenv("PGUSER");
    const char* password = std::getenv("PGPASSWORD");

    conninfo << "host=" << (host ? host : "localhost") << " ";
    conninfo << "port=" << (port ? port : "5432") << " ";
    conninfo << "dbname=" << (dbname ? dbname : "mlops") << " ";
    conninfo << "user=" << (user ? user : "postgres");

    if (password) {
        conninfo << " password=" << password;
    }

    return conninfo.str();
}

PostgresConnection::PostgresConnection() {
    connect(conninfo_from_env());
}

PostgresConnection::PostgresConnection(const std::string& conninfo) {
    connect(conninfo);
}

PostgresConnection::~PostgresConnection() {
    disconnect();
}

PostgresConnection::PostgresConnection(PostgresConnection&& other) noexcept
    : conn_(other.conn_) {
    other.conn_ = nullptr;
}

PostgresConnection& PostgresConnection::operator=(PostgresConnection&& other) noexcept {
    if (this != &other) {
        disconnect();
        conn_ = other.conn_;
        other.conn_ = nullptr;
    }
    return *this;
}

void PostgresConnection::connect(const std::string& conninfo) {
    conn_ = PQconnectdb(conninfo.c_str());

    if (PQstatus(conn_) != CONNECTION_OK) {
        const std::string message = PQerrorMessage(conn_);
        PQfinish(conn_);
        conn_ = nullptr;
        throw DataSourceError("PostgreSQL connection failed: " + message);
    }
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
    if (!conn_) {
        throw DataSourceError("Not connected to database");
    }
    if (!is_connected()) {
        throw DataSourceError(std::string("Lost connection to database: ") + PQerrorMessage(conn_));
    }
}

void PostgresConnection::set_statement_timeout(int milliseconds) {
    execute("SELECT set_config('statement_timeout', $1, false)", {std::to_string(milliseconds)});
}

PGresult* PostgresConnection::exec_params(const std::string& sql, const std::vector<std::string>& params) {
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
        param_values.empty() ? nullptr : param_values.data(),
        nullptr,
        nullptr,
        0  // Text format
    );

    ExecStatusType status = PQresultStatus(result);
    if (status != PGRES_COMMAND_OK && status != PGRES_TUPLES_OK) {
        const std::string message = PQerrorMessage(conn_);
        PQclear(result);
        throw DataSourceError("PostgreSQL query failed: " + message);
    }

    return result;
}

void PostgresConnection::execute(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);
    PQclear(result);
}

std::optional<std::string> PostgresConnection::query_single(const std::string& sql, const std::vector<std::string>& params) {
    PGresult* result = exec_params(sql, params);

    std::optional<std::string> value;
    if (PQntuples(result) > 0 && PQnfields(result) > 0 && !PQgetisnull(result, 0, 0)) {
        value = PQgetvalue(result, 0, 0);
    }

    PQclear(result);
    return value;
}

void PostgresConnection::query(const std::string& sql, const std::vector<std::string>& params,
                               const RowCallback& callback) {
    PGresult* result = exec_params(sql, params);

    int nrows = PQntuples(result);
    int nfields = PQnfields(result);

    try {
        for (int i = 0; i < nrows; ++i) {
            Row row;
            row.reserve(nfields);

            for (int j = 0; j < nfields; ++j) {
                if (PQgetisnull(result, i, j)) {
                    row.emplace_back(std::nullopt);
                } else {
                    row.emplace_back(std::string(PQgetvalue(result, i, j)));
                }
            }

            callback(row);
        }
    } catch (...) {
        PQclear(result);
        throw;
    }

    PQclear(result);
}

} // namespace Driftwatch
