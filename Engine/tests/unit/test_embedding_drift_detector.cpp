/**
 * @file test_embedding_drift_detector.cpp
 * @brief Unit tests for the four-method embedding drift detector
 *
 * Windows are served from a MemoryLogAccessor; no database needed.
 */

#include <gtest/gtest.h>
#include <core/errors.hpp>
#include <data/memory_log_accessor.hpp>
#include <decision/decision_engine.hpp>
#include <monitors/embedding_drift_detector.hpp>
#include <chrono>
#include <cmath>
#include <limits>
#include <random>

using namespace Driftwatch;

static const Timestamp kNow = parse_sql_timestamp("2026-06-01 00:00:00");

static std::vector<std::vector<double>> random_vectors(size_t n, size_t dim, uint32_t seed) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    std::vector<std::vector<double>> out(n, std::vector<double>(dim));
    for (auto& v : out)
        for (auto& x : v) x = dist(rng);
    return out;
}

// Spread the vectors one minute apart starting at the window start
static void add_window(MemoryLogAccessor& logs, const TimeWindow& window,
                       const std::vector<std::vector<double>>& vectors,
                       EmbeddingType type = EmbeddingType::Query) {
    for (size_t i = 0; i < vectors.size(); ++i) {
        EmbeddingRecord r;
        r.timestamp = window.start + std::chrono::minutes(static_cast<int>(i));
        r.type = type;
        r.vector = vectors[i];
        logs.add(std::move(r));
    }
}

// ============================================================================
// detect() over the log accessor
// ============================================================================

TEST(EmbeddingDriftDetectorTest, IdenticalWindowsShowNoDrift) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    auto vectors = random_vectors(200, 8, 1);
    add_window(logs, windows.baseline, vectors);
    add_window(logs, windows.current, vectors);

    EmbeddingDriftDetector detector(logs);
    EmbeddingDriftReport r = detector.detect(windows);

    ASSERT_FALSE(r.insufficient_data);
    EXPECT_EQ(r.dimensions, 8u);
    EXPECT_EQ(r.baseline.count, 200u);
    EXPECT_EQ(r.current.count, 200u);
    EXPECT_NEAR(r.centroid.euclidean_distance, 0.0, 1e-12);
    EXPECT_NEAR(r.centroid.cosine_distance, 0.0, 1e-9);
    EXPECT_NEAR(r.variance.variance_change, 0.0, 1e-12);
    EXPECT_FALSE(r.clusters.skipped);
    EXPECT_NEAR(r.clusters.silhouette_drop, 0.0, 1e-12);
    EXPECT_NEAR(r.clusters.centroid_shift, 0.0, 1e-9);
    EXPECT_NEAR(r.psi.psi, 0.0, 1e-12);
    EXPECT_FALSE(r.drift_detected);
    ASSERT_TRUE(r.drift_score.has_value());
    EXPECT_NEAR(*r.drift_score, 0.0, 1e-6);
    EXPECT_EQ(r.baseline.start, windows.baseline.start);
    EXPECT_EQ(r.current.end, kNow);
}

TEST(EmbeddingDriftDetectorTest, OtherEmbeddingTypesAreIgnored) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    auto vectors = random_vectors(50, 4, 2);
    add_window(logs, windows.baseline, vectors);
    add_window(logs, windows.current, vectors);
    // Far-away document vectors in the current window only
    auto docs = random_vectors(50, 4, 3);
    for (auto& v : docs)
        for (auto& x : v) x += 100.0;
    add_window(logs, windows.current, docs, EmbeddingType::Doc);

    EmbeddingDriftDetector detector(logs);
    EmbeddingDriftReport r = detector.detect(windows);
    EXPECT_EQ(r.embedding_type, EmbeddingType::Query);
    EXPECT_EQ(r.current.count, 50u);
    EXPECT_FALSE(r.drift_detected);
}

TEST(EmbeddingDriftDetectorTest, EmptyCurrentWindowIsInsufficientData) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_window(logs, windows.baseline, random_vectors(20, 4, 4));

    EmbeddingDriftDetector detector(logs);
    EmbeddingDriftReport r = detector.detect(windows);

    EXPECT_TRUE(r.insufficient_data);
    EXPECT_EQ(r.error, "Insufficient data for drift detection");
    EXPECT_EQ(r.baseline.count, 20u);
    EXPECT_EQ(r.current.count, 0u);
    EXPECT_FALSE(r.drift_detected);
    EXPECT_FALSE(r.drift_score.has_value());

    nlohmann::json j = r;
    EXPECT_EQ(j["baseline_count"], 20);
    EXPECT_EQ(j["current_count"], 0);
}

TEST(EmbeddingDriftDetectorTest, MixedDimensionalityIsADataSourceError) {
    MemoryLogAccessor logs;
    WindowPair windows = WindowPair::relative_to(kNow, 30, 7);
    add_window(logs, windows.baseline, random_vectors(10, 4, 5));
    add_window(logs, windows.current, random_vectors(10, 5, 6));

    EmbeddingDriftDetector detector(logs);
    EXPECT_THROW(detector.detect(windows), DataSourceError);
}

TEST(EmbeddingDriftDetectorTest, ToMatrixRejectsRaggedRecords) {
    std::vector<EmbeddingRecord> records(2);
    records[0].vector = {1.0, 2.0};
    records[1].vector = {1.0, 2.0, 3.0};
    EXPECT_THROW(EmbeddingDriftDetector::to_matrix(records), DataSourceError);
    EXPECT_EQ(EmbeddingDriftDetector::to_matrix({}).rows(), 0);
}

TEST(EmbeddingDriftDetectorTest, ToMatrixRejectsNonFiniteValues) {
    std::vector<EmbeddingRecord> records(2);
    records[0].vector = {1.0, 2.0};
    records[1].timestamp = kNow;
    records[1].vector = {std::numeric_limits<double>::quiet_NaN(), 2.0};
    EXPECT_THROW(EmbeddingDriftDetector::to_matrix(records), DataSourceError);

    records[1].vector = {1.0, -std::numeric_limits<double>::infinity()};
    EXPECT_THROW(EmbeddingDriftDetector::to_matrix(records), DataSourceError);
}

// ============================================================================
// analyze() on in-memory samples
// ============================================================================

static Eigen::MatrixXd to_eigen(const std::vector<std::vector<double>>& vectors) {
    Eigen::MatrixXd m(vectors.size(), vectors.front().size());
    for (size_t i = 0; i < vectors.size(); ++i)
        for (size_t j = 0; j < vectors[i].size(); ++j) m(i, j) = vectors[i][j];
    return m;
}

TEST(EmbeddingDriftDetectorTest, ShiftedWindowTripsCentroidDrift) {
    MemoryLogAccessor logs;
    EmbeddingDriftDetector detector(logs);

    Eigen::MatrixXd baseline = to_eigen(random_vectors(200, 8, 7));
    Eigen::MatrixXd current = baseline.array() + 1.0;

    EmbeddingDriftReport r = detector.analyze(baseline, current);
    EXPECT_NEAR(r.centroid.euclidean_distance, std::sqrt(8.0), 1e-9);
    EXPECT_TRUE(r.centroid.drift_detected);
    EXPECT_TRUE(r.drift_detected);
    ASSERT_TRUE(r.drift_score.has_value());
    EXPECT_GT(*r.drift_score, 0.0);
    EXPECT_LE(*r.drift_score, 1.0);
}

TEST(EmbeddingDriftDetectorTest, ScoreIsClippedForExtremeInputs) {
    MemoryLogAccessor logs;
    EmbeddingDriftDetector detector(logs);

    Eigen::MatrixXd baseline = to_eigen(random_vectors(100, 6, 8));
    Eigen::MatrixXd current = (baseline * 1000.0).array() + 1e6;

    EmbeddingDriftReport r = detector.analyze(baseline, current);
    ASSERT_TRUE(r.drift_score.has_value());
    EXPECT_GE(*r.drift_score, 0.0);
    EXPECT_LE(*r.drift_score, 1.0);
    EXPECT_TRUE(r.drift_detected);
}

TEST(EmbeddingDriftDetectorTest, ClusterAnalysisSkippedBelowClusterCount) {
    MemoryLogAccessor logs;
    EmbeddingDriftDetector detector(logs);

    Eigen::MatrixXd baseline = to_eigen(random_vectors(3, 4, 9));
    Eigen::MatrixXd current = to_eigen(random_vectors(3, 4, 10));

    EmbeddingDriftReport r = detector.analyze(baseline, current);
    EXPECT_TRUE(r.clusters.skipped);
    EXPECT_EQ(r.clusters.reason, "insufficient_samples");
    EXPECT_FALSE(r.clusters.drift_detected);
    EXPECT_TRUE(r.drift_score.has_value());
}

TEST(EmbeddingDriftDetectorTest, MatchedShiftDrivesVerdictWhenEnabled) {
    MemoryLogAccessor logs;
    EmbeddingAnalysisConfig analysis;
    analysis.n_clusters = 2;
    analysis.match_cluster_centroids = true;
    EmbeddingDriftDetector detector(logs, {}, analysis);

    Eigen::MatrixXd m = to_eigen(random_vectors(100, 4, 11));
    EmbeddingDriftReport r = detector.analyze(m, m);
    EXPECT_TRUE(r.clusters.centroids_matched);
    EXPECT_NEAR(r.clusters.matched_centroid_shift, 0.0, 1e-9);
    EXPECT_GE(r.clusters.alignment_gap, -1e-12);
}

// ============================================================================
// conclude() and the score formula
// ============================================================================

TEST(EmbeddingDriftDetectorTest, PsiAloneDrivesDriftAndReindex) {
    EmbeddingThresholds thresholds;

    EmbeddingDriftReport r;
    r.centroid.euclidean_distance = 0.05;
    r.variance.variance_change = 0.01;
    r.clusters.silhouette_drop = 0.0;
    r.psi.psi = 0.25;
    r.psi.drift_detected = r.psi.psi > thresholds.psi_threshold;

    EmbeddingDriftDetector::conclude(r, thresholds);

    EXPECT_TRUE(r.drift_detected);
    ASSERT_TRUE(r.drift_score.has_value());
    double expected = (0.05 / 0.15 + 0.01 / 0.3 + 0.0 + 0.25 / 0.2) / 4.0;
    EXPECT_NEAR(*r.drift_score, expected, 1e-12);

    CombinedDriftReport combined;
    combined.embedding = r;
    combined.combine();
    Decision d = DecisionEngine().decide(combined);
    ASSERT_EQ(d.actions.size(), 1u);
    EXPECT_EQ(d.actions[0], Action::ReindexDocuments);
}

TEST(EmbeddingDriftDetectorTest, SkippedClusterContributesZero) {
    EmbeddingThresholds thresholds;
    EmbeddingDriftReport r;
    r.clusters.skipped = true;
    r.clusters.silhouette_drop = 5.0;
    EmbeddingDriftDetector::conclude(r, thresholds);
    EXPECT_DOUBLE_EQ(*r.drift_score, 0.0);
    EXPECT_FALSE(r.drift_detected);
}

TEST(EmbeddingDriftDetectorTest, NonFiniteSignalCountsAsOne) {
    EmbeddingThresholds thresholds;
    EmbeddingDriftReport r;
    r.variance.variance_change = std::numeric_limits<double>::quiet_NaN();
    EmbeddingDriftDetector::conclude(r, thresholds);
    EXPECT_DOUBLE_EQ(*r.drift_score, 0.25);
}
