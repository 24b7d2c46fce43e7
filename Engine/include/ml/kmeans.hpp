/**
 * @file kmeans.hpp
 * @brief Seeded k-means++ clustering with independent restarts
 */

#pragma once

#include <Eigen/Core>
#include <vector>
#include <cstdint>

namespace driftwatch::ml {

struct KMeansConfig {
    int n_clusters = 5;
    int n_init = 10;            ///< Independent restarts; the lowest-inertia fit wins
    int max_iterations = 300;
    double tolerance = 1e-4;    ///< Stop when centroids move less than this (squared, summed)
    uint32_t seed = 42;
};

struct KMeansResult {
    Eigen::MatrixXd centroids;  ///< n_clusters × n_features
    std::vector<int> labels;    ///< One label per sample
    double inertia = 0.0;       ///< Sum of squared distances to the assigned centroid
    int iterations = 0;
};

/**
 * @brief Lloyd's k-means with k-means++ seeding.
 *
 * Deterministic for a given seed and input. Clusters that lose all their
 * points are re-seeded with the sample farthest from its centroid.
 *
 * @throws std::invalid_argument if samples.rows() < n_clusters or n_clusters < 1
 */
KMeansResult kmeans(const Eigen::MatrixXd& samples, const KMeansConfig& config);

} // namespace driftwatch::ml
