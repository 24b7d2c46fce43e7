/**
 * @file drift_config.cpp
 * @brief JSON / environment loading and validation of DriftConfig
 */

#include <config/drift_config.hpp>
#include <core/errors.hpp>
#include <database/postgres_connection.hpp>
#include <nlohmann/json.hpp>
#include <cstdlib>
#include <fstream>
#include <sstream>

namespace Driftwatch {

namespace {

using json = nlohmann::json;

template <typename T>
void read(const json& obj, const char* key, T& target) {
    if (!obj.contains(key) || obj[key].is_null()) return;
    try {
        target = obj[key].get<T>();
    } catch (const json::exception& e) {
        throw ConfigurationError(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

const json& section(const json& root, const char* key) {
    static const json empty = json::object();
    if (!root.contains(key)) return empty;
    if (!root[key].is_object()) {
        throw ConfigurationError(std::string("'") + key + "' must be an object");
    }
    return root[key];
}

} // namespace

DriftConfig DriftConfig::load_file(const std::string& path) {
    std::ifstream file(path);
    if (!file) {
        throw ConfigurationError("Cannot open config file: " + path);
    }

    std::stringstream buffer;
    buffer << file.rdbuf();

    DriftConfig config;
    config.merge_json(buffer.str());
    return config;
}

void DriftConfig::merge_json(const std::string& json_text) {
    json root;
    try {
        root = json::parse(json_text);
    } catch (const json::parse_error& e) {
        throw ConfigurationError(std::string("Config is not valid JSON: ") + e.what());
    }
    if (!root.is_object()) {
        throw ConfigurationError("Config root must be a JSON object");
    }

    read(root, "baseline_days", baseline_days);
    read(root, "current_days", current_days);
    read(root, "max_rows_per_window", max_rows_per_window);
    read(root, "max_embeddings_per_window", max_embeddings_per_window);
    read(root, "parallel_monitors", parallel_monitors);
    read(root, "metrics_port", metrics_port);
    read(root, "report_dir", report_dir);
    read(root, "conninfo", conninfo);
    read(root, "statement_timeout_ms", statement_timeout_ms);
    read(root, "record_runs_in_database", record_runs_in_database);

    const json& emb = section(root, "embedding");
    read(emb, "distance_threshold", embedding.distance_threshold);
    read(emb, "variance_threshold", embedding.variance_threshold);
    read(emb, "silhouette_threshold", embedding.silhouette_threshold);
    read(emb, "psi_threshold", embedding.psi_threshold);
    read(emb, "n_clusters", analysis.n_clusters);
    read(emb, "n_components", analysis.n_components);
    read(emb, "n_bins", analysis.n_bins);
    read(emb, "match_cluster_centroids", analysis.match_cluster_centroids);
    read(emb, "silhouette_sample_size", analysis.silhouette_sample_size);
    read(emb, "seed", analysis.seed);
    if (emb.contains("embedding_type")) {
        std::string type;
        read(emb, "embedding_type", type);
        analysis.embedding_type = embedding_type_from_string(type);
    }

    const json& beh = section(root, "behavior");
    read(beh, "refusal_rate_threshold", behavior.refusal_rate_threshold);
    read(beh, "toxicity_rate_threshold", behavior.toxicity_rate_threshold);
    read(beh, "error_rate_threshold", behavior.error_rate_threshold);
    read(beh, "length_change_threshold", behavior.length_change_threshold);

    const json& acc = section(root, "accuracy");
    read(acc, "accuracy_threshold", accuracy.accuracy_threshold);
    read(acc, "feedback_threshold", accuracy.feedback_threshold);

    const json& act = section(root, "actions");
    read(act, "reindex_url", actions.reindex_url);
    read(act, "fine_tune_url", actions.fine_tune_url);
    read(act, "safety_filter_url", actions.safety_filter_url);
    read(act, "timeout_seconds", actions.timeout_seconds);
}

void DriftConfig::apply_env() {
    if (std::getenv("PGHOST") || std::getenv("PGPORT") || std::getenv("PGDATABASE") ||
        std::getenv("PGUSER") || std::getenv("PGPASSWORD")) {
        conninfo = PostgresConnection::conninfo_from_env();
    }

    if (const char* port = std::getenv("DRIFTWATCH_METRICS_PORT")) {
        try {
            metrics_port = std::stoi(port);
        } catch (const std::exception&) {
            throw ConfigurationError(std::string("DRIFTWATCH_METRICS_PORT is not a number: ") + port);
        }
    }

    if (const char* dir = std::getenv("DRIFTWATCH_REPORT_DIR")) {
        report_dir = dir;
    }
}

void DriftConfig::validate() const {
    auto positive = [](double v, const char* name) {
        if (!(v > 0.0)) {
            throw ConfigurationError(std::string(name) + " must be positive");
        }
    };

    positive(baseline_days, "baseline_days");
    positive(current_days, "current_days");

    positive(embedding.distance_threshold, "distance_threshold");
    positive(embedding.variance_threshold, "variance_threshold");
    positive(embedding.silhouette_threshold, "silhouette_threshold");
    positive(embedding.psi_threshold, "psi_threshold");
    positive(behavior.refusal_rate_threshold, "refusal_rate_threshold");
    positive(behavior.toxicity_rate_threshold, "toxicity_rate_threshold");
    positive(behavior.error_rate_threshold, "error_rate_threshold");
    positive(behavior.length_change_threshold, "length_change_threshold");
    positive(accuracy.accuracy_threshold, "accuracy_threshold");
    positive(accuracy.feedback_threshold, "feedback_threshold");

    if (analysis.n_bins < 2) {
        throw ConfigurationError("n_bins must be at least 2");
    }
    if (analysis.n_clusters < 2) {
        throw ConfigurationError("n_clusters must be at least 2");
    }
    if (analysis.n_components < 1) {
        throw ConfigurationError("n_components must be at least 1");
    }
    if (metrics_port < 0 || metrics_port > 65535) {
        throw ConfigurationError("metrics_port must be in 0-65535 (0 disables)");
    }
    if (max_rows_per_window == 0 || max_embeddings_per_window == 0) {
        throw ConfigurationError("row limits must be positive");
    }
    if (actions.timeout_seconds <= 0) {
        throw ConfigurationError("actions.timeout_seconds must be positive");
    }
}

} // namespace Driftwatch
