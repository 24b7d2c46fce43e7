/**
 * @file test_drift_statistics.cpp
 * @brief Unit tests for PCA, k-means and the drift estimators
 *
 * Pure Eigen computations, no log accessor involved.
 */

#include <gtest/gtest.h>
#include <ml/drift_statistics.hpp>
#include <ml/kmeans.hpp>
#include <ml/pca.hpp>
#include <cmath>
#include <limits>
#include <random>
#include <set>

using namespace driftwatch::ml;

static Eigen::MatrixXd random_matrix(int rows, int cols, uint32_t seed, double offset = 0.0) {
    std::mt19937 rng(seed);
    std::normal_distribution<double> dist(0.0, 1.0);
    Eigen::MatrixXd m(rows, cols);
    for (int i = 0; i < rows; ++i)
        for (int j = 0; j < cols; ++j)
            m(i, j) = dist(rng) + offset;
    return m;
}

// ============================================================================
// PSI
// ============================================================================

TEST(PsiTest, IdenticalSamplesScoreZero) {
    Eigen::VectorXd x = random_matrix(500, 1, 3).col(0);
    for (int bins : {2, 5, 10, 37}) {
        PsiResult r = population_stability_index(x, x, bins);
        EXPECT_NEAR(r.psi, 0.0, 1e-12) << "bins=" << bins;
        EXPECT_EQ(r.level, "low");
        EXPECT_EQ(r.baseline_pct.size(), static_cast<size_t>(bins));
    }
}

TEST(PsiTest, LaplaceSmoothedHistogram) {
    Eigen::VectorXd base(4);
    base << 0.0, 1.0, 2.0, 3.0;
    Eigen::VectorXd cur(4);
    cur << 0.0, 0.0, 0.0, 0.0;

    // Bins [0, 1.5) and [1.5, 3]; baseline counts {2, 2}, current {4, 0}
    PsiResult r = population_stability_index(base, cur, 2);
    ASSERT_EQ(r.baseline_pct.size(), 2u);
    EXPECT_DOUBLE_EQ(r.baseline_pct[0], 0.5);
    EXPECT_DOUBLE_EQ(r.baseline_pct[1], 0.5);
    EXPECT_DOUBLE_EQ(r.current_pct[0], 5.0 / 6.0);
    EXPECT_DOUBLE_EQ(r.current_pct[1], 1.0 / 6.0);

    double expected = (5.0 / 6.0 - 0.5) * std::log((5.0 / 6.0) / 0.5) +
                      (1.0 / 6.0 - 0.5) * std::log((1.0 / 6.0) / 0.5);
    EXPECT_NEAR(r.psi, expected, 1e-12);
    EXPECT_EQ(r.level, "high");
}

TEST(PsiTest, CurrentValuesOutsideBaselineRangeAreNotBinned) {
    Eigen::VectorXd base(4);
    base << 0.0, 1.0, 2.0, 3.0;
    Eigen::VectorXd cur(2);
    cur << 10.0, -5.0;

    PsiResult r = population_stability_index(base, cur, 2);
    // Nothing binned, but both values still count in n: (0 + 1) / (2 + 2)
    EXPECT_DOUBLE_EQ(r.current_pct[0], 0.25);
    EXPECT_DOUBLE_EQ(r.current_pct[1], 0.25);
}

TEST(PsiTest, ConstantBaseline) {
    Eigen::VectorXd base = Eigen::VectorXd::Constant(20, 1.0);
    PsiResult r = population_stability_index(base, base, 10);
    EXPECT_NEAR(r.psi, 0.0, 1e-12);
}

TEST(PsiTest, RejectsInvalidArguments) {
    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(10, 0.0, 1.0);
    EXPECT_THROW(population_stability_index(x, x, 1), std::invalid_argument);
    EXPECT_THROW(population_stability_index(Eigen::VectorXd(), x, 10), std::invalid_argument);
}

TEST(PsiTest, RejectsNonFiniteValues) {
    Eigen::VectorXd x = Eigen::VectorXd::LinSpaced(10, 0.0, 1.0);
    Eigen::VectorXd with_nan = x;
    with_nan[4] = std::numeric_limits<double>::quiet_NaN();
    Eigen::VectorXd with_inf = x;
    with_inf[9] = std::numeric_limits<double>::infinity();

    EXPECT_THROW(population_stability_index(x, with_nan, 10), std::invalid_argument);
    EXPECT_THROW(population_stability_index(with_nan, x, 10), std::invalid_argument);
    EXPECT_THROW(population_stability_index(with_inf, x, 10), std::invalid_argument);
}

TEST(PsiTest, Levels) {
    EXPECT_EQ(psi_level(0.05), "low");
    EXPECT_EQ(psi_level(0.15), "moderate");
    EXPECT_EQ(psi_level(0.25), "high");
}

// ============================================================================
// Centroid and variance
// ============================================================================

TEST(CentroidDistanceTest, IdenticalSetsAreAtDistanceZero) {
    Eigen::MatrixXd m = random_matrix(100, 8, 1, 1.0);
    CentroidDistance d = centroid_distance(m, m);
    EXPECT_DOUBLE_EQ(d.euclidean, 0.0);
    EXPECT_NEAR(d.cosine, 0.0, 1e-12);
}

TEST(CentroidDistanceTest, CosineInvariantToUniformScaling) {
    Eigen::MatrixXd b = random_matrix(100, 8, 1, 1.0);
    Eigen::MatrixXd c = random_matrix(100, 8, 2, 0.5);

    CentroidDistance d1 = centroid_distance(b, c);
    for (double scale : {0.01, 3.7, 250.0}) {
        CentroidDistance d2 = centroid_distance(b * scale, c * scale);
        EXPECT_NEAR(d1.cosine, d2.cosine, 1e-8) << "scale=" << scale;
    }
}

TEST(CentroidDistanceTest, ZeroCentroids) {
    Eigen::MatrixXd zero = Eigen::MatrixXd::Zero(5, 3);
    CentroidDistance d = centroid_distance(zero, zero);
    EXPECT_DOUBLE_EQ(d.euclidean, 0.0);
    EXPECT_DOUBLE_EQ(d.cosine, 0.0);
}

TEST(VarianceTest, PopulationVarianceOverAllCoordinates) {
    Eigen::MatrixXd m(2, 2);
    m << 1.0, 2.0,
         3.0, 4.0;
    EXPECT_DOUBLE_EQ(population_variance(m), 1.25);
}

TEST(VarianceTest, RelativeChange) {
    EXPECT_NEAR(relative_variance_change(2.0, 3.0), 0.5, 1e-9);
    EXPECT_NEAR(relative_variance_change(2.0, 1.0), 0.5, 1e-9);
    EXPECT_DOUBLE_EQ(relative_variance_change(0.0, 0.0), 0.0);
}

// ============================================================================
// Silhouette and centroid alignment
// ============================================================================

TEST(SilhouetteTest, WellSeparatedClusters) {
    Eigen::MatrixXd m(6, 1);
    m << 0.0, 0.1, 0.2, 100.0, 100.1, 100.2;
    std::vector<int> labels = {0, 0, 0, 1, 1, 1};
    EXPECT_GT(silhouette_score(m, labels), 0.99);
}

TEST(SilhouetteTest, SingleClusterScoresZero) {
    Eigen::MatrixXd m = random_matrix(10, 2, 4);
    std::vector<int> labels(10, 0);
    EXPECT_DOUBLE_EQ(silhouette_score(m, labels), 0.0);
}

TEST(SilhouetteTest, SingletonClustersScoreZero) {
    Eigen::MatrixXd m(2, 1);
    m << 0.0, 1.0;
    EXPECT_DOUBLE_EQ(silhouette_score(m, {0, 1}), 0.0);
}

TEST(SilhouetteTest, SampledScoreIsReproducible) {
    Eigen::MatrixXd m = random_matrix(400, 3, 5);
    std::vector<int> labels(400);
    for (int i = 0; i < 400; ++i) labels[i] = m(i, 0) > 0.0 ? 1 : 0;

    double a = silhouette_score(m, labels, 100, 42);
    double b = silhouette_score(m, labels, 100, 42);
    EXPECT_DOUBLE_EQ(a, b);
    EXPECT_GT(a, 0.0);
}

TEST(CentroidShiftTest, MatchingUndoesLabelPermutation) {
    Eigen::MatrixXd a(2, 2);
    a << 0.0, 0.0,
         10.0, 10.0;
    Eigen::MatrixXd b(2, 2);
    b << 10.0, 10.0,
         0.0, 0.0;

    EXPECT_NEAR(index_aligned_centroid_shift(a, b), std::sqrt(200.0), 1e-9);
    EXPECT_NEAR(matched_centroid_shift(a, b), 0.0, 1e-12);
}

TEST(CentroidShiftTest, GreedyMatchingBeyondEightCentroids) {
    Eigen::MatrixXd a(10, 1);
    Eigen::MatrixXd b(10, 1);
    for (int i = 0; i < 10; ++i) {
        a(i, 0) = i * 10.0;
        b(9 - i, 0) = i * 10.0;
    }
    EXPECT_GT(index_aligned_centroid_shift(a, b), 0.0);
    EXPECT_NEAR(matched_centroid_shift(a, b), 0.0, 1e-12);
}

// ============================================================================
// PCA
// ============================================================================

TEST(PCATest, RecoversDominantDirection) {
    Eigen::MatrixXd m(50, 2);
    for (int i = 0; i < 50; ++i) {
        double t = i - 25.0;
        m(i, 0) = t;
        m(i, 1) = 2.0 * t;
    }

    PCA pca;
    pca.fit(m, 2);
    ASSERT_EQ(pca.n_components(), 2);

    Eigen::VectorXd first = pca.components().col(0);
    EXPECT_NEAR(first[0], 1.0 / std::sqrt(5.0), 1e-9);
    EXPECT_NEAR(first[1], 2.0 / std::sqrt(5.0), 1e-9);
    EXPECT_GE(pca.explained_variance()[0], pca.explained_variance()[1]);
}

TEST(PCATest, ComponentsCappedBySamplesAndFeatures) {
    Eigen::MatrixXd wide = random_matrix(3, 10, 6);
    PCA pca;
    pca.fit(wide, 50);
    EXPECT_EQ(pca.n_components(), 3);
    EXPECT_EQ(pca.transform(wide).rows(), 3);
    EXPECT_EQ(pca.transform(wide).cols(), 3);

    Eigen::MatrixXd tall = random_matrix(100, 4, 7);
    pca.fit(tall, 50);
    EXPECT_EQ(pca.n_components(), 4);
}

TEST(PCATest, TransformBeforeFitThrows) {
    PCA pca;
    EXPECT_THROW(pca.transform(Eigen::MatrixXd::Zero(2, 2)), std::logic_error);
}

TEST(PCATest, FeatureMismatchThrows) {
    PCA pca;
    pca.fit(random_matrix(10, 3, 8), 2);
    EXPECT_THROW(pca.transform(Eigen::MatrixXd::Zero(2, 4)), std::invalid_argument);
}

// ============================================================================
// k-means
// ============================================================================

TEST(KMeansTest, SeparatesDistinctBlobs) {
    Eigen::MatrixXd m(90, 2);
    std::mt19937 rng(9);
    std::normal_distribution<double> noise(0.0, 0.1);
    const double centers[3][2] = {{0, 0}, {20, 0}, {0, 20}};
    for (int i = 0; i < 90; ++i) {
        m(i, 0) = centers[i / 30][0] + noise(rng);
        m(i, 1) = centers[i / 30][1] + noise(rng);
    }

    KMeansConfig config;
    config.n_clusters = 3;
    KMeansResult r = kmeans(m, config);

    for (int blob = 0; blob < 3; ++blob) {
        std::set<int> labels;
        for (int i = blob * 30; i < (blob + 1) * 30; ++i) labels.insert(r.labels[i]);
        EXPECT_EQ(labels.size(), 1u) << "blob " << blob << " split across clusters";
    }
    EXPECT_NE(r.labels[0], r.labels[30]);
    EXPECT_NE(r.labels[30], r.labels[60]);
    EXPECT_LT(r.inertia, 90 * 0.1);
}

TEST(KMeansTest, DeterministicForSeed) {
    Eigen::MatrixXd m = random_matrix(200, 4, 10);
    KMeansConfig config;
    KMeansResult a = kmeans(m, config);
    KMeansResult b = kmeans(m, config);
    EXPECT_EQ(a.labels, b.labels);
    EXPECT_DOUBLE_EQ(a.inertia, b.inertia);
}

TEST(KMeansTest, RejectsTooFewSamples) {
    KMeansConfig config;
    config.n_clusters = 5;
    EXPECT_THROW(kmeans(random_matrix(4, 2, 11), config), std::invalid_argument);
}
