/**
 * @file postgres_log_accessor.hpp
 * @brief LogAccessor over the interaction/evaluation/task/embedding log tables
 */

#pragma once

#include <data/log_accessor.hpp>
#include <database/postgres_connection.hpp>
#include <export.hpp>
#include <string>

namespace Driftwatch {

/**
 * @brief Reads the log tables defined in sql/schema.sql.
 *
 * Each call opens its own connection, so monitors running on separate
 * threads never share a PGconn. Timestamps are compared as UTC.
 */
class DRIFTWATCH_API PostgresLogAccessor : public LogAccessor {
public:
    /**
     * @param conninfo libpq connection string
     * @param statement_timeout_ms upper bound for any single query (0 disables)
     */
    explicit PostgresLogAccessor(std::string conninfo, int statement_timeout_ms = 60000);

    std::vector<InteractionRecord> interactions(const TimeWindow& window, const RecordQuery& query) override;
    std::vector<EvaluationRecord> evaluations(const TimeWindow& window, const RecordQuery& query) override;
    std::optional<std::vector<TaskRecord>> tasks(const TimeWindow& window, const RecordQuery& query) override;
    std::vector<EmbeddingRecord> embeddings(const TimeWindow& window, const RecordQuery& query) override;
    size_t count(LogStream stream, const TimeWindow& window, const RecordQuery& query) override;

    /**
     * @brief Parse pgvector's text form "[0.1,0.2,...]"
     * @throws DataSourceError on malformed input
     */
    static std::vector<double> parse_vector(const std::string& text);

private:
    PostgresConnection open() const;

    std::string conninfo_;
    int statement_timeout_ms_;
};

} // namespace Driftwatch
