/**
 * @file drift_report.cpp
 * @brief JSON rendering of drift reports and the combined verdict
 */

#include <monitors/drift_report.hpp>
#include <algorithm>

namespace Driftwatch {

using nlohmann::json;

namespace {

json optional_number(const std::optional<double>& v) {
    return v ? json(*v) : json(nullptr);
}

} // namespace

void CombinedDriftReport::combine() {
    overall_drift_detected = false;
    overall_drift_score = 0.0;

    auto take = [this](bool detected, const std::optional<double>& score) {
        overall_drift_detected = overall_drift_detected || detected;
        if (score) overall_drift_score = std::max(overall_drift_score, *score);
    };

    if (embedding) take(embedding->drift_detected, embedding->drift_score);
    if (behavior) take(behavior->drift_detected, behavior->drift_score);
    if (accuracy) take(accuracy->drift_detected, accuracy->drift_score);

    overall_drift_score = std::clamp(overall_drift_score, 0.0, 1.0);
}

void to_json(json& j, const PeriodSummary& s) {
    j = json{
        {"start", to_iso8601(s.start)},
        {"end", to_iso8601(s.end)},
        {"count", s.count}
    };
}

void to_json(json& j, const EmbeddingDriftReport& r) {
    if (r.insufficient_data) {
        j = json{
            {"error", r.error},
            {"drift_detected", false},
            {"embedding_type", to_string(r.embedding_type)},
            {"baseline_count", r.baseline.count},
            {"current_count", r.current.count}
        };
        return;
    }

    json clusters;
    if (r.clusters.skipped) {
        clusters = json{{"skipped", true}, {"reason", r.clusters.reason}, {"drift_detected", false}};
    } else {
        clusters = json{
            {"n_clusters", r.clusters.n_clusters},
            {"n_components", r.clusters.n_components},
            {"baseline_silhouette", r.clusters.baseline_silhouette},
            {"current_silhouette", r.clusters.current_silhouette},
            {"silhouette_drop", r.clusters.silhouette_drop},
            {"centroid_shift", r.clusters.centroid_shift},
            {"matched_centroid_shift", r.clusters.matched_centroid_shift},
            {"alignment_gap", r.clusters.alignment_gap},
            {"centroids_matched", r.clusters.centroids_matched},
            {"drift_detected", r.clusters.drift_detected}
        };
    }

    j = json{
        {"drift_detected", r.drift_detected},
        {"drift_score", optional_number(r.drift_score)},
        {"embedding_type", to_string(r.embedding_type)},
        {"dimensions", r.dimensions},
        {"baseline_period", r.baseline},
        {"current_period", r.current},
        {"methods", {
            {"centroid_distance", {
                {"euclidean_distance", r.centroid.euclidean_distance},
                {"cosine_distance", r.centroid.cosine_distance},
                {"drift_detected", r.centroid.drift_detected}
            }},
            {"variance_change", {
                {"baseline_variance", r.variance.baseline_variance},
                {"current_variance", r.variance.current_variance},
                {"variance_change", r.variance.variance_change},
                {"variance_change_pct", r.variance.variance_change_pct},
                {"drift_detected", r.variance.drift_detected}
            }},
            {"cluster_drift", clusters},
            {"psi", {
                {"psi", r.psi.psi},
                {"level", r.psi.level},
                {"n_bins", r.psi.n_bins},
                {"baseline_distribution", r.psi.baseline_distribution},
                {"current_distribution", r.psi.current_distribution},
                {"drift_detected", r.psi.drift_detected}
            }}
        }}
    };
    j["truncated"] = r.truncated;
}

void to_json(json& j, const BehaviorPeriodStats& s) {
    j = json{
        {"start", to_iso8601(s.start)},
        {"end", to_iso8601(s.end)},
        {"total_interactions", s.total_interactions},
        {"refusals", s.refusals},
        {"toxic_responses", s.toxic_responses},
        {"errors", s.errors},
        {"refusal_rate", s.refusal_rate},
        {"toxicity_rate", s.toxicity_rate},
        {"error_rate", s.error_rate},
        {"avg_response_length", s.avg_response_length},
        {"responses_measured", s.responses_measured}
    };
}

void to_json(json& j, const BehaviorDriftReport& r) {
    if (r.insufficient_data) {
        j = json{
            {"error", r.error},
            {"drift_detected", false},
            {"baseline_interactions", r.baseline.total_interactions},
            {"current_interactions", r.current.total_interactions}
        };
        return;
    }

    j = json{
        {"drift_detected", r.drift_detected},
        {"drift_score", optional_number(r.drift_score)},
        {"baseline_period", r.baseline},
        {"current_period", r.current},
        {"signals", {
            {"refusal_drift", r.refusal_drift},
            {"toxicity_drift", r.toxicity_drift},
            {"error_drift", r.error_drift},
            {"length_anomaly", r.length_anomaly}
        }},
        {"changes", {
            {"refusal_rate_change", r.refusal_rate_change},
            {"toxicity_rate_change", r.toxicity_rate_change},
            {"error_rate_change", r.error_rate_change},
            {"length_change", r.length_change}
        }},
        {"thresholds", {
            {"refusal_rate", r.thresholds.refusal_rate_threshold},
            {"toxicity_rate", r.thresholds.toxicity_rate_threshold},
            {"error_rate", r.thresholds.error_rate_threshold},
            {"length_change", r.thresholds.length_change_threshold}
        }}
    };
    j["truncated"] = r.truncated;
}

void to_json(json& j, const RefusalExample& e) {
    j = json{
        {"timestamp", to_iso8601(e.timestamp)},
        {"user_query", e.user_query},
        {"model_response", e.model_response ? json(*e.model_response) : json(nullptr)},
        {"matched_phrase", e.matched_phrase ? json(*e.matched_phrase) : json(nullptr)}
    };
}

void to_json(json& j, const AccuracyDriftReport& r) {
    auto period = [](const AccuracyPeriodStats& p) {
        return json{
            {"start", to_iso8601(p.start)},
            {"end", to_iso8601(p.end)},
            {"evaluation", {
                {"evaluation_count", p.evaluation.evaluation_count},
                {"avg_accuracy", p.evaluation.avg_accuracy},
                {"avg_precision", p.evaluation.avg_precision},
                {"avg_recall", p.evaluation.avg_recall},
                {"avg_f1", p.evaluation.avg_f1}
            }},
            {"feedback", {
                {"feedback_count", p.feedback.feedback_count},
                {"avg_rating", p.feedback.avg_rating},
                {"positive_count", p.feedback.positive_count},
                {"negative_count", p.feedback.negative_count},
                {"positive_rate", p.feedback.positive_rate},
                {"negative_rate", p.feedback.negative_rate}
            }},
            {"tasks", {
                {"stream_available", p.tasks.stream_available},
                {"total_tasks", p.tasks.total_tasks},
                {"successful_tasks", p.tasks.successful_tasks},
                {"success_rate", p.tasks.success_rate}
            }}
        };
    };

    json signals = json::object();
    if (r.accuracy_drop) {
        signals["accuracy"] = {{"accuracy_drop", *r.accuracy_drop}, {"drift_detected", r.accuracy_drift}};
    }
    if (r.feedback_drop_pct) {
        signals["feedback"] = {{"feedback_drop_pct", *r.feedback_drop_pct}, {"drift_detected", r.feedback_drift}};
    }
    if (r.task_success_drop) {
        signals["task_success"] = {{"task_success_drop", *r.task_success_drop}, {"drift_detected", r.task_success_drift}};
    }

    j = json{
        {"drift_detected", r.drift_detected},
        {"drift_score", r.drift_score},
        {"baseline_period", period(r.baseline)},
        {"current_period", period(r.current)},
        {"signals", signals},
        {"thresholds", {
            {"accuracy_threshold", r.thresholds.accuracy_threshold},
            {"feedback_threshold", r.thresholds.feedback_threshold}
        }}
    };
    j["truncated"] = r.truncated;
}

void to_json(json& j, const CombinedDriftReport& r) {
    j = json{
        {"overall_drift_detected", r.overall_drift_detected},
        {"overall_drift_score", r.overall_drift_score},
        {"embedding_drift", r.embedding ? json(*r.embedding) : json(nullptr)},
        {"behavior_drift", r.behavior ? json(*r.behavior) : json(nullptr)},
        {"accuracy_drift", r.accuracy ? json(*r.accuracy) : json(nullptr)},
        {"failures", r.failures}
    };
}

} // namespace Driftwatch
