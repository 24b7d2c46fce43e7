/**
 * @file log_accessor.hpp
 * @brief Read-only, time-bounded queries over the serving system's log streams
 */

#pragma once

#include <data/records.hpp>
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace Driftwatch {

enum class LogStream {
    Interactions,
    Evaluations,
    Tasks,
    Embeddings
};

std::string to_string(LogStream stream);

enum class RecordOrder {
    OldestFirst,
    NewestFirst
};

/**
 * @brief Filters shared by every stream. Every read is bounded by a row limit.
 */
struct RecordQuery {
    size_t limit = 100000;
    RecordOrder order = RecordOrder::OldestFirst;
    /// When more rows match than `limit`, return `limit` rows evenly spaced
    /// over the whole window instead of the first ones in `order`
    bool spread = false;
    bool refusals_only = false;                   // Interactions only
    EmbeddingType embedding_type = EmbeddingType::All;  // Embeddings only
};

/**
 * @brief Log query interface consumed by every monitor.
 *
 * Implementations return an empty sequence (never an error) when no rows
 * match, and throw DataSourceError when the query itself fails. They must
 * be safe to call concurrently from several monitors.
 */
class LogAccessor {
public:
    virtual ~LogAccessor() = default;

    virtual std::vector<InteractionRecord> interactions(const TimeWindow& window, const RecordQuery& query) = 0;

    virtual std::vector<EvaluationRecord> evaluations(const TimeWindow& window, const RecordQuery& query) = 0;

    /**
     * @return std::nullopt when the task stream does not exist at all
     */
    virtual std::optional<std::vector<TaskRecord>> tasks(const TimeWindow& window, const RecordQuery& query) = 0;

    virtual std::vector<EmbeddingRecord> embeddings(const TimeWindow& window, const RecordQuery& query) = 0;

    /**
     * @brief Number of rows in the window matching the query's filters, ignoring its limit.
     * @return 0 for an absent task stream
     */
    virtual size_t count(LogStream stream, const TimeWindow& window, const RecordQuery& query) = 0;
};

/**
 * @brief Whether a read capped at query.limit left matching rows behind.
 *
 * Only asks the accessor to count when the read came back full.
 */
bool was_truncated(LogAccessor& logs, LogStream stream, const TimeWindow& window,
                   const RecordQuery& query, size_t returned);

} // namespace Driftwatch
