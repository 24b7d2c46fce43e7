/**
 * @file embedding_drift_detector.cpp
 * @brief Centroid, variance, cluster and PSI drift over embedding windows
 */

#include <monitors/embedding_drift_detector.hpp>
#include <core/errors.hpp>
#include <ml/drift_statistics.hpp>
#include <ml/kmeans.hpp>
#include <ml/pca.hpp>
#include <utils/logger.hpp>
#include <utils/time.hpp>
#include <algorithm>
#include <cmath>
#include <sstream>

namespace Driftwatch {

namespace ml = driftwatch::ml;

namespace {

constexpr const char* kComponent = "embedding";

std::string fixed(double v, int precision = 4) {
    std::ostringstream ss;
    ss.setf(std::ios::fixed);
    ss.precision(precision);
    ss << v;
    return ss.str();
}

} // namespace

EmbeddingDriftDetector::EmbeddingDriftDetector(LogAccessor& logs,
                                               EmbeddingThresholds thresholds,
                                               EmbeddingAnalysisConfig analysis,
                                               size_t max_vectors_per_window)
    : logs_(logs),
      thresholds_(thresholds),
      analysis_(analysis),
      max_vectors_(max_vectors_per_window) {}

Eigen::MatrixXd EmbeddingDriftDetector::to_matrix(const std::vector<EmbeddingRecord>& records) {
    if (records.empty()) return Eigen::MatrixXd(0, 0);

    const size_t d = records.front().vector.size();
    Eigen::MatrixXd m(records.size(), d);

    for (size_t i = 0; i < records.size(); ++i) {
        const auto& v = records[i].vector;
        if (v.size() != d) {
            throw DataSourceError("Inconsistent embedding dimensionality: expected " +
                                  std::to_string(d) + ", got " + std::to_string(v.size()));
        }
        for (size_t c = 0; c < d; ++c) {
            if (!std::isfinite(v[c])) {
                throw DataSourceError("Non-finite value in embedding logged at " + to_iso8601(records[i].timestamp));
            }
            m(i, c) = v[c];
        }
    }
    return m;
}

EmbeddingDriftReport EmbeddingDriftDetector::detect(const WindowPair& windows) {
    Logger::step(kComponent, "Checking " + to_string(analysis_.embedding_type) + " embedding drift");

    RecordQuery query;
    query.limit = max_vectors_;
    query.embedding_type = analysis_.embedding_type;
    query.spread = true;

    bool truncated = false;
    auto read = [&](const TimeWindow& window) {
        auto records = logs_.embeddings(window, query);
        if (was_truncated(logs_, LogStream::Embeddings, window, query, records.size())) {
            Logger::warn(kComponent, "Window from " + to_iso8601(window.start) + " holds more than " +
                                     std::to_string(max_vectors_) + " vectors; using an even sample");
            truncated = true;
        }
        return to_matrix(records);
    };

    Eigen::MatrixXd baseline = read(windows.baseline);
    Eigen::MatrixXd current = read(windows.current);

    Logger::info(kComponent, "Baseline vectors: " + std::to_string(baseline.rows()) +
                             ", current vectors: " + std::to_string(current.rows()));

    EmbeddingDriftReport report;
    if (baseline.rows() == 0 || current.rows() == 0) {
        report.insufficient_data = true;
        report.error = "Insufficient data for drift detection";
        report.baseline.count = static_cast<size_t>(baseline.rows());
        report.current.count = static_cast<size_t>(current.rows());
        Logger::warn(kComponent, report.error);
    } else {
        if (baseline.cols() != current.cols()) {
            throw DataSourceError("Baseline and current embeddings differ in dimensionality: " +
                                  std::to_string(baseline.cols()) + " vs " + std::to_string(current.cols()));
        }
        report = analyze(baseline, current);
    }

    report.embedding_type = analysis_.embedding_type;
    report.truncated = truncated;
    report.baseline.start = windows.baseline.start;
    report.baseline.end = windows.baseline.end;
    report.current.start = windows.current.start;
    report.current.end = windows.current.end;

    if (!report.insufficient_data) {
        if (report.drift_detected) {
            Logger::warn(kComponent, "Embedding drift detected (score " + fixed(*report.drift_score, 3) + ")");
        } else {
            Logger::success(kComponent, "No embedding drift (score " + fixed(*report.drift_score, 3) + ")");
        }
    }
    return report;
}

EmbeddingDriftReport EmbeddingDriftDetector::analyze(const Eigen::MatrixXd& baseline,
                                                     const Eigen::MatrixXd& current) const {
    EmbeddingDriftReport report;
    report.embedding_type = analysis_.embedding_type;
    report.dimensions = static_cast<size_t>(baseline.cols());
    report.baseline.count = static_cast<size_t>(baseline.rows());
    report.current.count = static_cast<size_t>(current.rows());

    // 1. Centroid distance
    ml::CentroidDistance cd = ml::centroid_distance(baseline, current);
    report.centroid.euclidean_distance = cd.euclidean;
    report.centroid.cosine_distance = cd.cosine;
    report.centroid.drift_detected = cd.euclidean > thresholds_.distance_threshold ||
                                     cd.cosine > thresholds_.distance_threshold;
    if (report.centroid.drift_detected) {
        Logger::warn(kComponent, "Centroid drift: euclidean " + fixed(cd.euclidean) + ", cosine " + fixed(cd.cosine));
    }

    // 2. Variance change
    report.variance.baseline_variance = ml::population_variance(baseline);
    report.variance.current_variance = ml::population_variance(current);
    report.variance.variance_change = ml::relative_variance_change(report.variance.baseline_variance,
                                                                   report.variance.current_variance);
    report.variance.variance_change_pct = report.variance.variance_change * 100.0;
    report.variance.drift_detected = report.variance.variance_change > thresholds_.variance_threshold;
    if (report.variance.drift_detected) {
        Logger::warn(kComponent, "Variance drift: " + fixed(report.variance.variance_change_pct, 1) + "% change");
    }

    // Shared projection for the cluster and PSI methods
    ml::PCA pca;
    pca.fit(baseline, analysis_.n_components);
    Eigen::MatrixXd baseline_proj = pca.transform(baseline);
    Eigen::MatrixXd current_proj = pca.transform(current);

    // 3. Cluster structure
    analyze_clusters(baseline_proj, current_proj, report);

    // 4. PSI on the first principal component
    ml::PsiResult psi = ml::population_stability_index(baseline_proj.col(0), current_proj.col(0), analysis_.n_bins);
    report.psi.psi = psi.psi;
    report.psi.level = psi.level;
    report.psi.n_bins = analysis_.n_bins;
    report.psi.baseline_distribution = std::move(psi.baseline_pct);
    report.psi.current_distribution = std::move(psi.current_pct);
    report.psi.drift_detected = psi.psi > thresholds_.psi_threshold;
    if (report.psi.drift_detected) {
        Logger::warn(kComponent, "Distribution drift: PSI " + fixed(psi.psi) + " (" + psi.level + ")");
    }

    conclude(report, thresholds_);
    return report;
}

void EmbeddingDriftDetector::analyze_clusters(const Eigen::MatrixXd& baseline_proj,
                                              const Eigen::MatrixXd& current_proj,
                                              EmbeddingDriftReport& report) const {
    ClusterDriftSection& section = report.clusters;
    const int k = analysis_.n_clusters;
    section.n_clusters = k;
    section.n_components = static_cast<int>(baseline_proj.cols());

    if (baseline_proj.rows() < k || current_proj.rows() < k) {
        section.skipped = true;
        section.reason = "insufficient_samples";
        Logger::info(kComponent, "Cluster analysis skipped: fewer than " + std::to_string(k) + " samples");
        return;
    }

    ml::KMeansConfig km;
    km.n_clusters = k;
    km.seed = analysis_.seed;

    ml::KMeansResult base_fit = ml::kmeans(baseline_proj, km);
    ml::KMeansResult cur_fit = ml::kmeans(current_proj, km);

    section.baseline_silhouette = ml::silhouette_score(baseline_proj, base_fit.labels,
                                                       analysis_.silhouette_sample_size, analysis_.seed);
    section.current_silhouette = ml::silhouette_score(current_proj, cur_fit.labels,
                                                      analysis_.silhouette_sample_size, analysis_.seed);
    section.silhouette_drop = section.baseline_silhouette - section.current_silhouette;

    section.centroid_shift = ml::index_aligned_centroid_shift(base_fit.centroids, cur_fit.centroids);
    section.matched_centroid_shift = ml::matched_centroid_shift(base_fit.centroids, cur_fit.centroids);
    section.alignment_gap = section.centroid_shift - section.matched_centroid_shift;
    section.centroids_matched = analysis_.match_cluster_centroids;

    if (section.alignment_gap > thresholds_.distance_threshold) {
        Logger::warn(kComponent, "Cluster labels are misaligned between windows: index-aligned shift " +
                                 fixed(section.centroid_shift) + " vs matched " + fixed(section.matched_centroid_shift));
    }

    const double shift = section.centroids_matched ? section.matched_centroid_shift : section.centroid_shift;
    section.drift_detected = section.silhouette_drop > thresholds_.silhouette_threshold ||
                             shift > thresholds_.distance_threshold;
    if (section.drift_detected) {
        Logger::warn(kComponent, "Cluster drift: silhouette drop " + fixed(section.silhouette_drop) +
                                 ", centroid shift " + fixed(shift));
    }
}

void EmbeddingDriftDetector::conclude(EmbeddingDriftReport& report, const EmbeddingThresholds& thresholds) {
    report.drift_detected = report.centroid.drift_detected ||
                            report.variance.drift_detected ||
                            report.clusters.drift_detected ||
                            report.psi.drift_detected;

    double silhouette_signal = 0.0;
    if (!report.clusters.skipped) {
        silhouette_signal = std::max(0.0, report.clusters.silhouette_drop) / thresholds.silhouette_threshold;
    }

    const double signals[] = {
        report.centroid.euclidean_distance / thresholds.distance_threshold,
        report.variance.variance_change / thresholds.variance_threshold,
        silhouette_signal,
        report.psi.psi / thresholds.psi_threshold
    };

    double sum = 0.0;
    for (double s : signals) sum += std::isfinite(s) ? s : 1.0;
    report.drift_score = std::clamp(sum / 4.0, 0.0, 1.0);
}

} // namespace Driftwatch
