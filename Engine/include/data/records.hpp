/**
 * @file records.hpp
 * @brief Log record shapes read by the monitors, and the time windows they are read over
 */

#pragma once

#include <utils/time.hpp>
#include <string>
#include <vector>
#include <optional>

namespace Driftwatch {

/**
 * @brief One request/response pair logged by the serving system.
 */
struct InteractionRecord {
    Timestamp timestamp;
    std::string user_query;
    std::optional<std::string> model_response;
    bool refusal_flag = false;
    bool toxicity_flag = false;
    bool error_flag = false;
    std::optional<double> user_feedback_score;  // 0-5 or 0-1, whatever the product collects
};

/**
 * @brief One held-out evaluation result produced by the evaluation harness.
 */
struct EvaluationRecord {
    Timestamp timestamp;
    std::string evaluation_set_name;
    double accuracy = 0.0;
    double precision = 0.0;
    double recall = 0.0;
    double f1_score = 0.0;
};

struct TaskRecord {
    Timestamp timestamp;
    bool success_flag = false;
};

enum class EmbeddingType {
    Query,
    Doc,
    All     // Filter value only: any stored type
};

struct EmbeddingRecord {
    Timestamp timestamp;
    EmbeddingType type = EmbeddingType::Query;
    std::vector<double> vector;
};

std::string to_string(EmbeddingType type);

/**
 * @throws ConfigurationError for an unknown name
 */
EmbeddingType embedding_type_from_string(const std::string& name);

/**
 * @brief Half-open interval [start, end).
 */
struct TimeWindow {
    Timestamp start;
    Timestamp end;

    bool contains(Timestamp t) const { return t >= start && t < end; }
};

/**
 * @brief The two windows every monitor compares.
 *
 * Invariant: baseline.end == current.start.
 */
struct WindowPair {
    TimeWindow baseline;
    TimeWindow current;

    /**
     * @brief current = [now - current_days, now), baseline = the baseline_days before it
     */
    static WindowPair relative_to(Timestamp now, int baseline_days, int current_days) {
        WindowPair w;
        w.current.end = now;
        w.current.start = days_before(now, current_days);
        w.baseline.end = w.current.start;
        w.baseline.start = days_before(w.baseline.end, baseline_days);
        return w;
    }
};

} // namespace Driftwatch
