/**
 * @file drift_statistics.cpp
 * @brief Centroid, variance, silhouette and PSI estimators
 */

#include <ml/drift_statistics.hpp>
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <random>
#include <stdexcept>

namespace driftwatch::ml {

CentroidDistance centroid_distance(const Eigen::MatrixXd& baseline, const Eigen::MatrixXd& current) {
    Eigen::VectorXd b = baseline.colwise().mean().transpose();
    Eigen::VectorXd c = current.colwise().mean().transpose();

    CentroidDistance out;
    out.euclidean = (b - c).norm();

    Eigen::VectorXd bn = b / (b.norm() + kEpsilon);
    Eigen::VectorXd cn = c / (c.norm() + kEpsilon);

    const double bn_norm = bn.norm();
    const double cn_norm = cn.norm();
    if (bn_norm == 0.0 || cn_norm == 0.0) {
        // A zero centroid has no direction
        out.cosine = (bn_norm == cn_norm) ? 0.0 : 1.0;
    } else {
        double cos = bn.dot(cn) / (bn_norm * cn_norm);
        out.cosine = 1.0 - std::clamp(cos, -1.0, 1.0);
    }

    return out;
}

double population_variance(const Eigen::MatrixXd& samples) {
    if (samples.size() == 0) return 0.0;
    const double mean = samples.mean();
    return (samples.array() - mean).square().sum() / static_cast<double>(samples.size());
}

double relative_variance_change(double baseline_variance, double current_variance) {
    return std::abs(current_variance - baseline_variance) / (baseline_variance + kEpsilon);
}

double silhouette_score(const Eigen::MatrixXd& samples, const std::vector<int>& labels,
                        size_t max_samples, uint32_t seed) {
    const size_t n = static_cast<size_t>(samples.rows());
    if (n == 0 || labels.size() != n) return 0.0;

    int n_clusters = 0;
    for (int l : labels) n_clusters = std::max(n_clusters, l + 1);

    std::vector<size_t> cluster_size(n_clusters, 0);
    for (int l : labels) cluster_size[l]++;
    size_t populated = std::count_if(cluster_size.begin(), cluster_size.end(),
                                     [](size_t s) { return s > 0; });
    if (populated < 2) return 0.0;

    // Scored subset; distances are still measured against every sample
    std::vector<size_t> subset(n);
    std::iota(subset.begin(), subset.end(), 0);
    if (max_samples > 0 && n > max_samples) {
        std::mt19937 rng(seed);
        std::shuffle(subset.begin(), subset.end(), rng);
        subset.resize(max_samples);
    }

    const long long m = static_cast<long long>(subset.size());
    std::vector<double> scores(m, 0.0);

    #pragma omp parallel for schedule(dynamic, 64)
    for (long long s = 0; s < m; ++s) {
        const size_t i = subset[s];
        const int own = labels[i];
        if (cluster_size[own] <= 1) {
            scores[s] = 0.0;
            continue;
        }

        std::vector<double> dist_sum(n_clusters, 0.0);
        for (size_t j = 0; j < n; ++j) {
            if (j == i) continue;
            dist_sum[labels[j]] += (samples.row(i) - samples.row(j)).norm();
        }

        double a = dist_sum[own] / static_cast<double>(cluster_size[own] - 1);
        double b = std::numeric_limits<double>::max();
        for (int c = 0; c < n_clusters; ++c) {
            if (c == own || cluster_size[c] == 0) continue;
            b = std::min(b, dist_sum[c] / static_cast<double>(cluster_size[c]));
        }

        double denom = std::max(a, b);
        scores[s] = denom > 0.0 ? (b - a) / denom : 0.0;
    }

    return std::accumulate(scores.begin(), scores.end(), 0.0) / static_cast<double>(m);
}

double index_aligned_centroid_shift(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
    const Eigen::Index k = std::min(a.rows(), b.rows());
    if (k == 0) return 0.0;

    double total = 0.0;
    for (Eigen::Index i = 0; i < k; ++i) {
        total += (a.row(i) - b.row(i)).norm();
    }
    return total / static_cast<double>(k);
}

double matched_centroid_shift(const Eigen::MatrixXd& a, const Eigen::MatrixXd& b) {
    const Eigen::Index k = std::min(a.rows(), b.rows());
    if (k == 0) return 0.0;

    Eigen::MatrixXd cost(k, k);
    for (Eigen::Index i = 0; i < k; ++i) {
        for (Eigen::Index j = 0; j < k; ++j) {
            cost(i, j) = (a.row(i) - b.row(j)).norm();
        }
    }

    double best = std::numeric_limits<double>::max();

    if (k <= 8) {
        std::vector<Eigen::Index> perm(k);
        std::iota(perm.begin(), perm.end(), 0);
        do {
            double total = 0.0;
            for (Eigen::Index i = 0; i < k; ++i) total += cost(i, perm[i]);
            best = std::min(best, total);
        } while (std::next_permutation(perm.begin(), perm.end()));
    } else {
        std::vector<bool> used_a(k, false), used_b(k, false);
        best = 0.0;
        for (Eigen::Index step = 0; step < k; ++step) {
            double pair_min = std::numeric_limits<double>::max();
            Eigen::Index bi = 0, bj = 0;
            for (Eigen::Index i = 0; i < k; ++i) {
                if (used_a[i]) continue;
                for (Eigen::Index j = 0; j < k; ++j) {
                    if (used_b[j]) continue;
                    if (cost(i, j) < pair_min) { pair_min = cost(i, j); bi = i; bj = j; }
                }
            }
            used_a[bi] = used_b[bj] = true;
            best += pair_min;
        }
    }

    return best / static_cast<double>(k);
}

std::string psi_level(double psi) {
    if (psi > 0.2) return "high";
    if (psi > 0.1) return "moderate";
    return "low";
}

PsiResult population_stability_index(const Eigen::VectorXd& baseline, const Eigen::VectorXd& current, int n_bins) {
    if (n_bins < 2) {
        throw std::invalid_argument("PSI needs at least 2 bins");
    }
    if (baseline.size() == 0 || current.size() == 0) {
        throw std::invalid_argument("PSI needs non-empty samples");
    }
    if (!baseline.allFinite() || !current.allFinite()) {
        throw std::invalid_argument("PSI needs finite samples");
    }

    const double lo = baseline.minCoeff();
    const double hi = baseline.maxCoeff();
    const double width = (hi - lo) / n_bins;

    auto histogram = [&](const Eigen::VectorXd& values) {
        std::vector<double> counts(n_bins, 0.0);
        for (Eigen::Index i = 0; i < values.size(); ++i) {
            const double v = values[i];
            if (v < lo || v > hi) continue;
            int bin = width > 0.0 ? static_cast<int>((v - lo) / width) : 0;
            counts[std::clamp(bin, 0, n_bins - 1)] += 1.0;
        }
        return counts;
    };

    std::vector<double> base_counts = histogram(baseline);
    std::vector<double> cur_counts = histogram(current);

    PsiResult result;
    result.baseline_pct.resize(n_bins);
    result.current_pct.resize(n_bins);

    const double base_denom = static_cast<double>(baseline.size()) + n_bins;
    const double cur_denom = static_cast<double>(current.size()) + n_bins;

    for (int i = 0; i < n_bins; ++i) {
        const double bp = (base_counts[i] + 1.0) / base_denom;
        const double cp = (cur_counts[i] + 1.0) / cur_denom;
        result.baseline_pct[i] = bp;
        result.current_pct[i] = cp;
        result.psi += (cp - bp) * std::log(cp / bp);
    }

    result.level = psi_level(result.psi);
    return result;
}

} // namespace driftwatch::ml
