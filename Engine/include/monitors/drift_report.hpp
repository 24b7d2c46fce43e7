/**
 * @file drift_report.hpp
 * @brief Per-monitor drift reports and the combined report the decision engine consumes
 *
 * Reports are plain values: built once by a monitor, never modified after.
 * Each carries an insufficient_data flag; such a report has no drift score
 * and never raises a drift signal.
 */

#pragma once

#include <config/drift_config.hpp>
#include <data/records.hpp>
#include <nlohmann/json.hpp>
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Driftwatch {

struct PeriodSummary {
    Timestamp start;
    Timestamp end;
    size_t count = 0;
};

// ============================================================================
// Embedding drift
// ============================================================================

struct CentroidDriftSection {
    double euclidean_distance = 0.0;
    double cosine_distance = 0.0;
    bool drift_detected = false;
};

struct VarianceDriftSection {
    double baseline_variance = 0.0;
    double current_variance = 0.0;
    double variance_change = 0.0;
    double variance_change_pct = 0.0;
    bool drift_detected = false;
};

struct ClusterDriftSection {
    bool skipped = false;
    std::string reason;                 ///< Set when skipped
    int n_clusters = 0;
    int n_components = 0;
    double baseline_silhouette = 0.0;
    double current_silhouette = 0.0;
    double silhouette_drop = 0.0;
    double centroid_shift = 0.0;        ///< Centroid i against centroid i
    double matched_centroid_shift = 0.0;
    double alignment_gap = 0.0;         ///< centroid_shift - matched_centroid_shift
    bool centroids_matched = false;     ///< matched shift used for the verdict
    bool drift_detected = false;
};

struct PsiDriftSection {
    double psi = 0.0;
    std::string level;
    int n_bins = 0;
    std::vector<double> baseline_distribution;
    std::vector<double> current_distribution;
    bool drift_detected = false;
};

struct EmbeddingDriftReport {
    bool insufficient_data = false;
    std::string error;

    bool drift_detected = false;
    std::optional<double> drift_score;
    EmbeddingType embedding_type = EmbeddingType::Query;
    size_t dimensions = 0;

    PeriodSummary baseline;
    PeriodSummary current;

    CentroidDriftSection centroid;
    VarianceDriftSection variance;
    ClusterDriftSection clusters;
    PsiDriftSection psi;

    bool truncated = false;             ///< A window held more vectors than were read
};

// ============================================================================
// Behavior drift
// ============================================================================

struct BehaviorPeriodStats {
    Timestamp start;
    Timestamp end;
    size_t total_interactions = 0;
    size_t refusals = 0;
    size_t toxic_responses = 0;
    size_t errors = 0;
    size_t responses_measured = 0;      ///< Non-null responses behind avg_response_length
    double refusal_rate = 0.0;
    double toxicity_rate = 0.0;
    double error_rate = 0.0;
    double avg_response_length = 0.0;
};

struct BehaviorDriftReport {
    bool insufficient_data = false;
    std::string error;

    bool drift_detected = false;
    std::optional<double> drift_score;

    BehaviorPeriodStats baseline;
    BehaviorPeriodStats current;

    bool refusal_drift = false;
    bool toxicity_drift = false;
    bool error_drift = false;
    bool length_anomaly = false;

    double refusal_rate_change = 0.0;
    double toxicity_rate_change = 0.0;
    double error_rate_change = 0.0;
    double length_change = 0.0;         ///< Relative to the baseline average
    bool truncated = false;             ///< Rates come from an even sample of a larger window

    BehaviorThresholds thresholds;
};

/**
 * @brief One refusal-flagged interaction surfaced for inspection.
 */
struct RefusalExample {
    Timestamp timestamp;
    std::string user_query;
    std::optional<std::string> model_response;
    std::optional<std::string> matched_phrase;
};

// ============================================================================
// Accuracy drift
// ============================================================================

struct EvaluationSummary {
    size_t evaluation_count = 0;
    double avg_accuracy = 0.0;
    double avg_precision = 0.0;
    double avg_recall = 0.0;
    double avg_f1 = 0.0;
};

struct FeedbackSummary {
    size_t feedback_count = 0;
    double avg_rating = 0.0;
    size_t positive_count = 0;          ///< rating >= 4
    size_t negative_count = 0;          ///< rating <= 2
    double positive_rate = 0.0;
    double negative_rate = 0.0;
};

struct TaskSummary {
    bool stream_available = false;
    size_t total_tasks = 0;
    size_t successful_tasks = 0;
    double success_rate = 0.0;
};

struct AccuracyPeriodStats {
    Timestamp start;
    Timestamp end;
    EvaluationSummary evaluation;
    FeedbackSummary feedback;
    TaskSummary tasks;
};

struct AccuracyDriftReport {
    bool drift_detected = false;
    double drift_score = 0.0;

    AccuracyPeriodStats baseline;
    AccuracyPeriodStats current;

    // Each sub-comparison is present only when both windows had qualifying records
    std::optional<double> accuracy_drop;
    bool accuracy_drift = false;
    std::optional<double> feedback_drop_pct;
    bool feedback_drift = false;
    std::optional<double> task_success_drop;
    bool task_success_drift = false;
    bool truncated = false;

    AccuracyThresholds thresholds;
};

// ============================================================================
// Combined
// ============================================================================

/**
 * @brief What the three monitors produced in one run.
 *
 * A monitor that failed has no report and an entry in failures.
 */
struct CombinedDriftReport {
    std::optional<EmbeddingDriftReport> embedding;
    std::optional<BehaviorDriftReport> behavior;
    std::optional<AccuracyDriftReport> accuracy;
    std::map<std::string, std::string> failures;    ///< monitor name -> message

    bool overall_drift_detected = false;
    double overall_drift_score = 0.0;

    /**
     * @brief Fill the overall fields: logical OR of verdicts, max of present scores.
     */
    void combine();
};

void to_json(nlohmann::json& j, const PeriodSummary& s);
void to_json(nlohmann::json& j, const EmbeddingDriftReport& r);
void to_json(nlohmann::json& j, const BehaviorPeriodStats& s);
void to_json(nlohmann::json& j, const BehaviorDriftReport& r);
void to_json(nlohmann::json& j, const RefusalExample& e);
void to_json(nlohmann::json& j, const AccuracyDriftReport& r);
void to_json(nlohmann::json& j, const CombinedDriftReport& r);

} // namespace Driftwatch
