/**
 * @file kmeans.cpp
 * @brief k-means++ seeded Lloyd iterations
 */

#include <ml/kmeans.hpp>
#include <algorithm>
#include <random>
#include <limits>
#include <stdexcept>

namespace driftwatch::ml {

namespace {

Eigen::MatrixXd seed_plus_plus(const Eigen::MatrixXd& x, int k, std::mt19937& rng) {
    const Eigen::Index n = x.rows();
    Eigen::MatrixXd centroids(k, x.cols());

    std::uniform_int_distribution<Eigen::Index> pick(0, n - 1);
    centroids.row(0) = x.row(pick(rng));

    Eigen::VectorXd closest(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        closest[i] = (x.row(i) - centroids.row(0)).squaredNorm();
    }

    for (int c = 1; c < k; ++c) {
        double total = closest.sum();
        Eigen::Index chosen = 0;

        if (total <= 0.0) {
            // Every remaining point coincides with a centroid already chosen
            chosen = pick(rng);
        } else {
            std::uniform_real_distribution<double> u(0.0, total);
            double target = u(rng);
            double acc = 0.0;
            chosen = n - 1;
            for (Eigen::Index i = 0; i < n; ++i) {
                acc += closest[i];
                if (acc >= target) { chosen = i; break; }
            }
        }

        centroids.row(c) = x.row(chosen);
        for (Eigen::Index i = 0; i < n; ++i) {
            closest[i] = std::min(closest[i], (x.row(i) - centroids.row(c)).squaredNorm());
        }
    }

    return centroids;
}

KMeansResult lloyd(const Eigen::MatrixXd& x, Eigen::MatrixXd centroids, const KMeansConfig& config) {
    const Eigen::Index n = x.rows();
    const int k = config.n_clusters;

    KMeansResult result;
    result.labels.assign(n, 0);

    for (int iter = 0; iter < config.max_iterations; ++iter) {
        // Assignment
        Eigen::VectorXd dist(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            double best = std::numeric_limits<double>::max();
            int best_c = 0;
            for (int c = 0; c < k; ++c) {
                double d = (x.row(i) - centroids.row(c)).squaredNorm();
                if (d < best) { best = d; best_c = c; }
            }
            result.labels[i] = best_c;
            dist[i] = best;
        }

        // Update
        Eigen::MatrixXd sums = Eigen::MatrixXd::Zero(k, x.cols());
        std::vector<Eigen::Index> counts(k, 0);
        for (Eigen::Index i = 0; i < n; ++i) {
            sums.row(result.labels[i]) += x.row(i);
            counts[result.labels[i]]++;
        }

        Eigen::MatrixXd updated(k, x.cols());
        for (int c = 0; c < k; ++c) {
            if (counts[c] > 0) {
                updated.row(c) = sums.row(c) / static_cast<double>(counts[c]);
            } else {
                Eigen::Index far = 0;
                dist.maxCoeff(&far);
                updated.row(c) = x.row(far);
                dist[far] = 0.0;
            }
        }

        double shift = (updated - centroids).squaredNorm();
        centroids = std::move(updated);
        result.iterations = iter + 1;
        if (shift <= config.tolerance) break;
    }

    // Final assignment against the converged centroids
    result.inertia = 0.0;
    for (Eigen::Index i = 0; i < n; ++i) {
        double best = std::numeric_limits<double>::max();
        int best_c = 0;
        for (int c = 0; c < k; ++c) {
            double d = (x.row(i) - centroids.row(c)).squaredNorm();
            if (d < best) { best = d; best_c = c; }
        }
        result.labels[i] = best_c;
        result.inertia += best;
    }

    result.centroids = std::move(centroids);
    return result;
}

} // namespace

KMeansResult kmeans(const Eigen::MatrixXd& samples, const KMeansConfig& config) {
    if (config.n_clusters < 1) {
        throw std::invalid_argument("kmeans needs n_clusters >= 1");
    }
    if (samples.rows() < config.n_clusters) {
        throw std::invalid_argument("kmeans needs at least n_clusters samples");
    }

    std::mt19937 rng(config.seed);
    KMeansResult best;
    best.inertia = std::numeric_limits<double>::max();

    const int restarts = std::max(1, config.n_init);
    for (int run = 0; run < restarts; ++run) {
        KMeansResult candidate = lloyd(samples, seed_plus_plus(samples, config.n_clusters, rng), config);
        if (candidate.inertia < best.inertia) {
            best = std::move(candidate);
        }
    }

    return best;
}

} // namespace driftwatch::ml
