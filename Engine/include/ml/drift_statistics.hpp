/**
 * @file drift_statistics.hpp
 * @brief Distribution-shift estimators over two windows of embedding vectors
 *
 * Every function takes sample matrices with one row per vector. None of
 * them throw on valid (non-empty, equal-width) input; callers check the
 * preconditions documented per function.
 */

#pragma once

#include <Eigen/Core>
#include <cstdint>
#include <string>
#include <vector>

namespace driftwatch::ml {

/// Guards every normalization against division by zero.
inline constexpr double kEpsilon = 1e-10;

struct CentroidDistance {
    double euclidean = 0.0;
    double cosine = 0.0;
};

/**
 * @brief Distance between the coordinate-wise means of two sample sets.
 *
 * The cosine distance is taken between the L2-normalized centroids (norm + ε)
 * and is therefore invariant to uniform positive scaling of both sets.
 */
CentroidDistance centroid_distance(const Eigen::MatrixXd& baseline, const Eigen::MatrixXd& current);

/**
 * @brief Population variance over every coordinate of every sample.
 */
double population_variance(const Eigen::MatrixXd& samples);

/**
 * @brief |var_cur - var_base| / (var_base + ε)
 */
double relative_variance_change(double baseline_variance, double current_variance);

/**
 * @brief Mean silhouette coefficient of a labelling.
 *
 * Points in singleton clusters score 0. Returns 0 when fewer than two
 * clusters are populated. When the set has more than max_samples rows a
 * seeded random subset of that size is scored.
 */
double silhouette_score(const Eigen::MatrixXd& samples, const std::vector<int>& labels,
                        size_t max_samples = 0, uint32_t seed = 42);

/**
 * @brief Mean Euclidean distance between centroid i of a and centroid i of b.
 */
double index_aligned_centroid_shift(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b);

/**
 * @brief Mean Euclidean distance under the one-to-one centroid pairing that minimizes it.
 *
 * Exact for up to 8 centroids, greedy nearest-pair matching beyond that.
 */
double matched_centroid_shift(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b);

struct PsiResult {
    double psi = 0.0;
    std::string level;                  ///< "low" (< 0.1), "moderate" (0.1-0.2), "high" (> 0.2)
    std::vector<double> baseline_pct;
    std::vector<double> current_pct;
};

/**
 * @brief Population Stability Index of two one-dimensional samples.
 *
 * Equal-width bins span the baseline's own min/max; the last bin is closed
 * on the right and current values outside that range are not binned.
 * Both histograms get +1 Laplace smoothing: pct = (count + 1) / (n + n_bins).
 *
 * @throws std::invalid_argument if n_bins < 2, either sample is empty or holds NaN/inf
 */
PsiResult population_stability_index(const Eigen::VectorXd& baseline, const Eigen::VectorXd& current, int n_bins);

std::string psi_level(double psi);

} // namespace driftwatch::ml
