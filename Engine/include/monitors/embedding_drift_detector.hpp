/**
 * @file embedding_drift_detector.hpp
 * @brief Representation drift between two windows of stored embeddings
 *
 * Four independent estimators, OR-ed into one verdict:
 *   1. Centroid distance   - Euclidean and cosine distance of the window means
 *   2. Variance change     - relative change of the overall population variance
 *   3. Cluster structure   - PCA (fitted on baseline) + k-means per window,
 *                            silhouette drop and centroid shift
 *   4. PSI                 - Population Stability Index on the first principal component
 */

#pragma once

#include <config/drift_config.hpp>
#include <data/log_accessor.hpp>
#include <monitors/drift_report.hpp>
#include <export.hpp>
#include <Eigen/Core>
#include <vector>

namespace Driftwatch {

class DRIFTWATCH_API EmbeddingDriftDetector {
public:
    EmbeddingDriftDetector(LogAccessor& logs,
                           EmbeddingThresholds thresholds = {},
                           EmbeddingAnalysisConfig analysis = {},
                           size_t max_vectors_per_window = 20000);

    /**
     * @brief Fetch both windows and analyze them.
     * @throws DataSourceError if the query fails or the vectors disagree on dimensionality
     */
    EmbeddingDriftReport detect(const WindowPair& windows);

    /**
     * @brief Run the four estimators on already-loaded samples (one row per vector).
     *
     * Period summaries are left for the caller; counts are filled in.
     */
    EmbeddingDriftReport analyze(const Eigen::MatrixXd& baseline, const Eigen::MatrixXd& current) const;

    /**
     * @brief Derive drift_detected and drift_score from the four method sections.
     *
     * drift_score is the mean of the four sub-signals, each divided by its
     * threshold, clipped to [0, 1]. A skipped cluster section contributes 0.
     */
    static void conclude(EmbeddingDriftReport& report, const EmbeddingThresholds& thresholds);

    /**
     * @brief Stack record vectors into a samples matrix.
     * @throws DataSourceError if the vectors do not share one dimensionality
     */
    static Eigen::MatrixXd to_matrix(const std::vector<EmbeddingRecord>& records);

private:
    void analyze_clusters(const Eigen::MatrixXd& baseline_proj, const Eigen::MatrixXd& current_proj,
                          EmbeddingDriftReport& report) const;

    LogAccessor& logs_;
    EmbeddingThresholds thresholds_;
    EmbeddingAnalysisConfig analysis_;
    size_t max_vectors_;
};

} // namespace Driftwatch
