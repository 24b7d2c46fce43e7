/**
 * @file pca.hpp
 * @brief Principal component projection used before clustering embeddings
 */

#pragma once

#include <Eigen/Core>

namespace driftwatch::ml {

/**
 * @brief Principal component analysis fitted on one sample matrix.
 *
 * Rows are samples, columns are features. Components are ordered by
 * decreasing explained variance; each component's sign is fixed so that
 * its largest-magnitude loading is positive, which makes fits on the same
 * data reproducible.
 */
class PCA {
public:
    using MatrixXd = Eigen::MatrixXd;
    using VectorXd = Eigen::VectorXd;

    /**
     * @param n_components requested components, capped at min(n_samples, n_features)
     * @throws std::invalid_argument on an empty matrix or n_components < 1
     */
    void fit(const MatrixXd& samples, int n_components);

    /**
     * @brief Project samples onto the fitted components (n_samples × n_components)
     * @throws std::logic_error if called before fit()
     * @throws std::invalid_argument on a feature-count mismatch
     */
    MatrixXd transform(const MatrixXd& samples) const;

    MatrixXd fit_transform(const MatrixXd& samples, int n_components) {
        fit(samples, n_components);
        return transform(samples);
    }

    int n_components() const { return static_cast<int>(components_.cols()); }
    const VectorXd& mean() const { return mean_; }
    const MatrixXd& components() const { return components_; }           // n_features × n_components
    const VectorXd& explained_variance() const { return explained_variance_; }

private:
    VectorXd mean_;
    MatrixXd components_;
    VectorXd explained_variance_;
    bool fitted_ = false;
};

} // namespace driftwatch::ml
