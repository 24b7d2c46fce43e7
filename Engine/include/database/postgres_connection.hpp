/**
 * @file postgres_connection.hpp
 * @brief PostgreSQL connection used by the log accessor and the run-event sink
 */

#pragma once

#include <string>
#include <vector>
#include <optional>
#include <functional>
#include <libpq-fe.h>

namespace Driftwatch {

/**
 * @brief PostgreSQL connection wrapper
 *
 * One connection per owner; never shared between threads. Every failure
 * surfaces as DataSourceError.
 */
class PostgresConnection {
public:
    /// One result row; std::nullopt marks SQL NULL.
    using Row = std::vector<std::optional<std::string>>;
    using RowCallback = std::function<void(const Row&)>;

    /**
     * @brief Build a conninfo string from the standard environment
     *
     * Uses: PGHOST, PGPORT, PGDATABASE, PGUSER, PGPASSWORD
     * Defaults: localhost, 5432, mlops, postgres, (no password)
     */
    static std::string conninfo_from_env();

    /**
     * @brief Connect using environment variables
     */
    PostgresConnection();

    /**
     * @brief Connect with explicit connection string
     */
    explicit PostgresConnection(const std::string& conninfo);

    ~PostgresConnection();

    PostgresConnection(const PostgresConnection&) = delete;
    PostgresConnection& operator=(const PostgresConnection&) = delete;

    PostgresConnection(PostgresConnection&& other) noexcept;
    PostgresConnection& operator=(PostgresConnection&& other) noexcept;

    /**
     * @brief Abort any statement running longer than this (0 disables)
     */
    void set_statement_timeout(int milliseconds);

    /**
     * @brief Execute a parameterized statement (no results expected)
     */
    void execute(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Execute a parameterized query and return the first column of the first row
     *
     * @return std::nullopt when there are no rows or the value is NULL
     */
    std::optional<std::string> query_single(const std::string& sql, const std::vector<std::string>& params = {});

    /**
     * @brief Execute a parameterized query and iterate rows
     */
    void query(const std::string& sql, const std::vector<std::string>& params, const RowCallback& callback);

private:
    void connect(const std::string& conninfo);
    void disconnect();
    bool is_connected() const;
    void ensure_connected() const;
    PGresult* exec_params(const std::string& sql, const std::vector<std::string>& params);

    PGconn* conn_ = nullptr;
};

} // namespace Driftwatch
