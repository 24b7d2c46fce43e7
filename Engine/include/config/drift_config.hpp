/**
 * @file drift_config.hpp
 * @brief Every tunable of a drift-detection run, with defaults
 */

#pragma once

#include <data/records.hpp>
#include <cstddef>
#include <cstdint>
#include <string>

namespace Driftwatch {

struct EmbeddingThresholds {
    double distance_threshold = 0.15;
    double variance_threshold = 0.3;
    double silhouette_threshold = 0.2;
    double psi_threshold = 0.2;         ///< PSI above this is "high" and counts as drift
};

struct BehaviorThresholds {
    double refusal_rate_threshold = 0.10;   ///< Absolute, not relative to baseline
    double toxicity_rate_threshold = 0.05;
    double error_rate_threshold = 0.10;
    double length_change_threshold = 0.5;
};

struct AccuracyThresholds {
    double accuracy_threshold = 0.05;
    double feedback_threshold = 0.30;
};

struct EmbeddingAnalysisConfig {
    EmbeddingType embedding_type = EmbeddingType::Query;
    int n_clusters = 5;
    int n_components = 50;
    int n_bins = 10;
    bool match_cluster_centroids = false;
    size_t silhouette_sample_size = 5000;
    uint32_t seed = 42;
};

struct ActionEndpoints {
    std::string reindex_url;
    std::string fine_tune_url;
    std::string safety_filter_url;
    int timeout_seconds = 30;
};

struct DriftConfig {
    int baseline_days = 30;
    int current_days = 7;

    EmbeddingThresholds embedding;
    BehaviorThresholds behavior;
    AccuracyThresholds accuracy;
    EmbeddingAnalysisConfig analysis;
    ActionEndpoints actions;

    size_t max_rows_per_window = 100000;
    size_t max_embeddings_per_window = 20000;
    bool parallel_monitors = true;

    int metrics_port = 8000;            ///< 0 disables the scrape endpoint
    std::string report_dir = ".";

    std::string conninfo;               ///< Empty: built from PG* variables
    int statement_timeout_ms = 60000;
    bool record_runs_in_database = false;

    /**
     * @brief Read a JSON file. Every key is optional; missing keys keep their defaults.
     * @throws ConfigurationError if the file cannot be read or a value has the wrong type
     */
    static DriftConfig load_file(const std::string& path);

    /**
     * @brief Overlay values from a JSON document onto this config.
     */
    void merge_json(const std::string& json_text);

    /**
     * @brief Apply PG*, DRIFTWATCH_METRICS_PORT and DRIFTWATCH_REPORT_DIR overrides
     */
    void apply_env();

    /**
     * @throws ConfigurationError naming the first invalid field
     */
    void validate() const;
};

} // namespace Driftwatch
