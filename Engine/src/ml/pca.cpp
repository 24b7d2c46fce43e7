/**
 * @file pca.cpp
 * @brief PCA via symmetric eigen-decomposition
 *
 * With more features than samples the n×n Gram matrix is decomposed
 * instead of the d×d covariance; both give the same leading components.
 */

#include <ml/pca.hpp>
#include <Eigen/Eigenvalues>
#include <algorithm>
#include <stdexcept>

namespace driftwatch::ml {

void PCA::fit(const MatrixXd& samples, int n_components) {
    const Eigen::Index n = samples.rows();
    const Eigen::Index d = samples.cols();

    if (n == 0 || d == 0) {
        throw std::invalid_argument("PCA::fit on an empty matrix");
    }
    if (n_components < 1) {
        throw std::invalid_argument("PCA::fit needs n_components >= 1");
    }

    const Eigen::Index k = std::min<Eigen::Index>({static_cast<Eigen::Index>(n_components), n, d});

    mean_ = samples.colwise().mean().transpose();
    MatrixXd centered = samples.rowwise() - mean_.transpose();
    const double denom = n > 1 ? static_cast<double>(n - 1) : 1.0;

    components_.resize(d, k);
    explained_variance_.resize(k);

    if (d <= n) {
        MatrixXd cov = (centered.transpose() * centered) / denom;
        Eigen::SelfAdjointEigenSolver<MatrixXd> solver(cov);
        if (solver.info() != Eigen::Success) {
            throw std::runtime_error("PCA eigen-decomposition did not converge");
        }
        // Eigen sorts eigenvalues ascending
        for (Eigen::Index c = 0; c < k; ++c) {
            components_.col(c) = solver.eigenvectors().col(d - 1 - c);
            explained_variance_[c] = std::max(0.0, solver.eigenvalues()[d - 1 - c]);
        }
    } else {
        MatrixXd gram = (centered * centered.transpose()) / denom;
        Eigen::SelfAdjointEigenSolver<MatrixXd> solver(gram);
        if (solver.info() != Eigen::Success) {
            throw std::runtime_error("PCA eigen-decomposition did not converge");
        }
        for (Eigen::Index c = 0; c < k; ++c) {
            VectorXd u = solver.eigenvectors().col(n - 1 - c);
            VectorXd v = centered.transpose() * u;
            double norm = v.norm();
            if (norm > 1e-12) {
                v /= norm;
            } else {
                // Degenerate direction (no variance left): any unit vector works
                v = VectorXd::Zero(d);
                v[c % d] = 1.0;
            }
            components_.col(c) = v;
            explained_variance_[c] = std::max(0.0, solver.eigenvalues()[n - 1 - c]);
        }
    }

    for (Eigen::Index c = 0; c < k; ++c) {
        Eigen::Index arg = 0;
        components_.col(c).cwiseAbs().maxCoeff(&arg);
        if (components_(arg, c) < 0.0) components_.col(c) *= -1.0;
    }

    fitted_ = true;
}

PCA::MatrixXd PCA::transform(const MatrixXd& samples) const {
    if (!fitted_) {
        throw std::logic_error("PCA::transform called before fit");
    }
    if (samples.cols() != mean_.size()) {
        throw std::invalid_argument("PCA::transform feature count mismatch");
    }
    return (samples.rowwise() - mean_.transpose()) * components_;
}

} // namespace driftwatch::ml
