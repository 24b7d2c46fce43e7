/**
 * @file postgres_log_accessor.cpp
 * @brief PostgreSQL log accessor implementation
 */

#include <data/postgres_log_accessor.hpp>
#include <core/errors.hpp>
#include <cstdlib>
#include <cerrno>

namespace Driftwatch {

namespace {

const char* order_sql(RecordOrder order) {
    return order == RecordOrder::NewestFirst ? "DESC" : "ASC";
}

const std::string& require(const PostgresConnection::Row& row, size_t col, const char* name) {
    if (col >= row.size() || !row[col]) {
        throw DataSourceError(std::string("Unexpected NULL in column ") + name);
    }
    return *row[col];
}

bool parse_bool(const std::optional<std::string>& v) {
    return v && !v->empty() && ((*v)[0] == 't' || (*v)[0] == 'T' || (*v)[0] == '1');
}

double parse_double(const std::string& text, const char* name) {
    try {
        return std::stod(text);
    } catch (const std::exception&) {
        throw DataSourceError(std::string("Malformed numeric value in column ") + name + ": " + text);
    }
}

// "<table> t WHERE ..." for one stream; $1/$2 are the window bounds
std::string from_where(LogStream stream, const RecordQuery& query, const char* type_param = "$4") {
    const std::string window = "WHERE t.timestamp >= $1::timestamp AND t.timestamp < $2::timestamp ";
    switch (stream) {
        case LogStream::Interactions:
            return "interaction_log t " + window + (query.refusals_only ? "AND t.refusal_flag = true " : "");
        case LogStream::Evaluations:
            return "evaluation_log t " + window;
        case LogStream::Tasks:
            return "task_log t " + window;
        case LogStream::Embeddings:
            return "embeddings_log t " + window + "AND t.embedding IS NOT NULL " +
                   (query.embedding_type != EmbeddingType::All ? std::string("AND t.type = ") + type_param + " " : "");
    }
    throw std::logic_error("unknown log stream");
}

// At most $3 rows. With query.spread the rows are the first of each of $3
// equal-width buckets over the window's oldest-first row numbers.
std::string limited_select(const std::string& columns, LogStream stream, const RecordQuery& query) {
    const std::string order = std::string(" ORDER BY timestamp ") + order_sql(query.order) + " LIMIT $3";
    if (!query.spread) {
        return "SELECT " + columns + " FROM " + from_where(stream, query) + order;
    }
    return "SELECT " + columns + " FROM ("
           "SELECT t.*, row_number() OVER (ORDER BY t.timestamp) - 1 AS rn, count(*) OVER () AS n "
           "FROM " + from_where(stream, query) + ") s "
           "WHERE n <= $3::bigint OR rn = 0 OR (rn * $3::bigint) / n <> ((rn - 1) * $3::bigint) / n" + order;
}

std::vector<std::string> params_for(const TimeWindow& window, const RecordQuery& query, LogStream stream) {
    std::vector<std::string> params = {
        to_sql_timestamp(window.start), to_sql_timestamp(window.end), std::to_string(query.limit)
    };
    if (stream == LogStream::Embeddings && query.embedding_type != EmbeddingType::All) {
        params.push_back(to_string(query.embedding_type));
    }
    return params;
}

bool task_log_exists(PostgresConnection& db) {
    // task_log is optional; its absence is not an error
    auto exists = db.query_single("SELECT to_regclass('task_log') IS NOT NULL");
    return exists && parse_bool(exists);
}

Timestamp parse_time(const std::string& text) {
    try {
        return parse_sql_timestamp(text);
    } catch (const std::invalid_argument& e) {
        throw DataSourceError(e.what());
    }
}

} // namespace

PostgresLogAccessor::PostgresLogAccessor(std::string conninfo, int statement_timeout_ms)
    : conninfo_(std::move(conninfo)), statement_timeout_ms_(statement_timeout_ms) {}

PostgresConnection PostgresLogAccessor::open() const {
    PostgresConnection db(conninfo_);
    db.execute("SET TIME ZONE 'UTC'");
    if (statement_timeout_ms_ > 0) {
        db.set_statement_timeout(statement_timeout_ms_);
    }
    return db;
}

std::vector<InteractionRecord> PostgresLogAccessor::interactions(const TimeWindow& window, const RecordQuery& query) {
    const std::string sql = limited_select(
        "timestamp, user_query, model_response, refusal_flag, toxicity_flag, error_flag, user_feedback_score",
        LogStream::Interactions, query);

    std::vector<InteractionRecord> records;
    PostgresConnection db = open();
    db.query(sql, params_for(window, query, LogStream::Interactions),
        [&](const PostgresConnection::Row& row) {
            InteractionRecord r;
            r.timestamp = parse_time(require(row, 0, "timestamp"));
            r.user_query = row[1].value_or("");
            r.model_response = row[2];
            r.refusal_flag = parse_bool(row[3]);
            r.toxicity_flag = parse_bool(row[4]);
            r.error_flag = parse_bool(row[5]);
            if (row[6]) r.user_feedback_score = parse_double(*row[6], "user_feedback_score");
            records.push_back(std::move(r));
        });

    return records;
}

std::vector<EvaluationRecord> PostgresLogAccessor::evaluations(const TimeWindow& window, const RecordQuery& query) {
    const std::string sql = limited_select(
        "timestamp, COALESCE(evaluation_set_name, ''), accuracy, precision, recall, f1_score",
        LogStream::Evaluations, query);

    std::vector<EvaluationRecord> records;
    PostgresConnection db = open();
    db.query(sql, params_for(window, query, LogStream::Evaluations),
        [&](const PostgresConnection::Row& row) {
            EvaluationRecord r;
            r.timestamp = parse_time(require(row, 0, "timestamp"));
            r.evaluation_set_name = row[1].value_or("");
            r.accuracy = parse_double(require(row, 2, "accuracy"), "accuracy");
            r.precision = row[3] ? parse_double(*row[3], "precision") : 0.0;
            r.recall = row[4] ? parse_double(*row[4], "recall") : 0.0;
            r.f1_score = row[5] ? parse_double(*row[5], "f1_score") : 0.0;
            records.push_back(std::move(r));
        });

    return records;
}

std::optional<std::vector<TaskRecord>> PostgresLogAccessor::tasks(const TimeWindow& window, const RecordQuery& query) {
    PostgresConnection db = open();

    if (!task_log_exists(db)) {
        return std::nullopt;
    }

    const std::string sql = limited_select("timestamp, success_flag", LogStream::Tasks, query);

    std::vector<TaskRecord> records;
    db.query(sql, params_for(window, query, LogStream::Tasks),
        [&](const PostgresConnection::Row& row) {
            TaskRecord r;
            r.timestamp = parse_time(require(row, 0, "timestamp"));
            r.success_flag = parse_bool(row[1]);
            records.push_back(r);
        });

    return records;
}

std::vector<EmbeddingRecord> PostgresLogAccessor::embeddings(const TimeWindow& window, const RecordQuery& query) {
    const std::string sql = limited_select("timestamp, type, embedding::text", LogStream::Embeddings, query);

    std::vector<EmbeddingRecord> records;
    PostgresConnection db = open();
    db.query(sql, params_for(window, query, LogStream::Embeddings), [&](const PostgresConnection::Row& row) {
        EmbeddingRecord r;
        r.timestamp = parse_time(require(row, 0, "timestamp"));
        const std::string type = row[1].value_or("");
        if (type == "query") r.type = EmbeddingType::Query;
        else if (type == "doc") r.type = EmbeddingType::Doc;
        else r.type = EmbeddingType::All;
        r.vector = parse_vector(require(row, 2, "embedding"));
        records.push_back(std::move(r));
    });

    return records;
}

size_t PostgresLogAccessor::count(LogStream stream, const TimeWindow& window, const RecordQuery& query) {
    PostgresConnection db = open();
    if (stream == LogStream::Tasks && !task_log_exists(db)) {
        return 0;
    }

    std::vector<std::string> params = {to_sql_timestamp(window.start), to_sql_timestamp(window.end)};
    if (stream == LogStream::Embeddings && query.embedding_type != EmbeddingType::All) {
        params.push_back(to_string(query.embedding_type));
    }

    auto n = db.query_single("SELECT count(*) FROM " + from_where(stream, query, "$3"), params);
    if (!n) {
        throw DataSourceError("count(*) returned NULL for " + to_string(stream));
    }
    try {
        return static_cast<size_t>(std::stoull(*n));
    } catch (const std::exception&) {
        throw DataSourceError("Malformed row count for " + to_string(stream) + ": " + *n);
    }
}

std::vector<double> PostgresLogAccessor::parse_vector(const std::string& text) {
    size_t open_pos = text.find('[');
    size_t close_pos = text.rfind(']');
    if (open_pos == std::string::npos || close_pos == std::string::npos || close_pos < open_pos) {
        throw DataSourceError("Malformed vector literal: " + text.substr(0, 64));
    }

    std::vector<double> values;
    const char* p = text.c_str() + open_pos + 1;
    const char* end = text.c_str() + close_pos;

    while (p < end) {
        while (p < end && (*p == ' ' || *p == ',')) ++p;
        if (p >= end) break;

        char* next = nullptr;
        errno = 0;
        double v = std::strtod(p, &next);
        if (next == p || errno == ERANGE) {
            throw DataSourceError("Malformed vector component in: " + text.substr(0, 64));
        }
        values.push_back(v);
        p = next;
    }

    return values;
}

} // namespace Driftwatch
