// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

// Gaussian mixture model of points on the unit circle, used for
// finding representative angles of data that do not fit a simple
// linear grid (spread larger than 180 degrees, several modes). Each
// component has a full 2x2 covariance. The components are
// initialized with k-means++ and k-means iterations and then refined
// with expectation-maximization. The random number generator has a
// fixed seed so the result is repeatable.

#pragma once

#include <common/constants.h>
#include <common/eigen.h>

namespace rtcomp {

class CircularMixture
{
private:
    int n_components {};
    unsigned int seed {};
    // Component means, one (cos, sin) pair per row
    ArrayX2d means_ {};
    Eigen::ArrayXd weights {};
    std::vector<Eigen::Matrix2d> covariances {};
    bool converged_ { false };
    int n_iter_ {};

    // Initial component labels from k-means
    [[nodiscard]] auto kMeansLabels(const ArrayX2d& points) const
      -> Eigen::ArrayXi;
    // Update weights, means, and covariances from responsibilities
    auto maximization(const ArrayX2d& points,
                      const Eigen::MatrixXd& resp) -> void;
    // Compute responsibilities and return the mean log-likelihood
    [[nodiscard]] auto expectation(const ArrayX2d& points,
                                   Eigen::MatrixXd& resp) const -> double;

public:
    // Regularization added to the diagonal of each covariance
    static constexpr double reg_covar { 1e-6 };
    // Convergence threshold of the mean log-likelihood
    static constexpr double tol { 1e-3 };
    static constexpr int max_iter { 100 };
    static constexpr int max_kmeans_iter { 300 };

    CircularMixture(const int n_components,
                    const unsigned int seed = lut::cluster_seed);
    // Fit the model. Rows of points are (cos, sin) pairs. If there are
    // fewer points than components, the number of components is
    // reduced to the number of points.
    auto fit(const ArrayX2d& points) -> void;
    [[nodiscard]] auto means() const -> const ArrayX2d& { return means_; }
    // Angles of the component means in degrees, in (-180, 180]
    [[nodiscard]] auto centralAngles() const -> Eigen::ArrayXd;
    [[nodiscard]] auto converged() const -> bool { return converged_; }
    [[nodiscard]] auto nIter() const -> int { return n_iter_; }
};

} // namespace rtcomp
