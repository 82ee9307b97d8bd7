// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "circular_mixture.h"

#include <cmath>
#include <limits>
#include <numbers>
#include <random>
#include <spdlog/spdlog.h>

namespace rtcomp {

CircularMixture::CircularMixture(const int n_components,
                                 const unsigned int seed)
  : n_components { n_components }, seed { seed }
{
    if (n_components < 1) {
        throw std::invalid_argument {
            "number of mixture components must be positive, got "
            + std::to_string(n_components)
        };
    }
}

auto CircularMixture::kMeansLabels(const ArrayX2d& points) const
  -> Eigen::ArrayXi
{
    const auto n_points { static_cast<int>(points.rows()) };
    std::mt19937 gen { seed };

    // k-means++ seeding. Each new center is drawn with a probability
    // proportional to the squared distance to the nearest center.
    ArrayX2d centers(n_components, 2);
    std::uniform_int_distribution<int> first { 0, n_points - 1 };
    centers.row(0) = points.row(first(gen));
    Eigen::ArrayXd min_dist2 {
        (points.rowwise() - centers.row(0)).square().rowwise().sum()
    };
    for (int k { 1 }; k < n_components; ++k) {
        int i_next {};
        if (min_dist2.sum() > 0.0) {
            std::discrete_distribution<int> pick(min_dist2.begin(),
                                                 min_dist2.end());
            i_next = pick(gen);
        } else {
            i_next = first(gen);
        }
        centers.row(k) = points.row(i_next);
        min_dist2 = min_dist2.min(
          (points.rowwise() - centers.row(k)).square().rowwise().sum());
    }

    // Lloyd iterations
    Eigen::ArrayXi labels { Eigen::ArrayXi::Constant(n_points, -1) };
    for (int iter {}; iter < max_kmeans_iter; ++iter) {
        bool changed { false };
        for (int i {}; i < n_points; ++i) {
            Eigen::Index k_min {};
            static_cast<void>(
              (centers.rowwise() - points.row(i)).square().rowwise().sum().minCoeff(
                &k_min));
            if (labels(i) != static_cast<int>(k_min)) {
                labels(i) = static_cast<int>(k_min);
                changed = true;
            }
        }
        if (!changed) {
            break;
        }
        ArrayX2d sums { ArrayX2d::Zero(n_components, 2) };
        Eigen::ArrayXi counts { Eigen::ArrayXi::Zero(n_components) };
        for (int i {}; i < n_points; ++i) {
            sums.row(labels(i)) += points.row(i);
            ++counts(labels(i));
        }
        for (int k {}; k < n_components; ++k) {
            if (counts(k) > 0) {
                centers.row(k) = sums.row(k) / static_cast<double>(counts(k));
            } else {
                // Relocate an empty cluster to the point farthest from
                // its current center.
                Eigen::ArrayXd dist2(n_points);
                for (int i {}; i < n_points; ++i) {
                    dist2(i) =
                      (points.row(i) - centers.row(labels(i))).square().sum();
                }
                Eigen::Index i_far {};
                static_cast<void>(dist2.maxCoeff(&i_far));
                centers.row(k) = points.row(i_far);
            }
        }
    }
    return labels;
}

auto CircularMixture::maximization(const ArrayX2d& points,
                                   const Eigen::MatrixXd& resp) -> void
{
    const Eigen::Index n_points { points.rows() };
    const Eigen::MatrixXd X { points.matrix() };
    const Eigen::VectorXd nk {
        (resp.colwise().sum().transpose().array()
         + 10 * std::numeric_limits<double>::epsilon())
          .matrix()
    };
    weights = nk.array() / static_cast<double>(n_points);
    means_ = ((resp.transpose() * X).array().colwise() / nk.array());
    covariances.resize(n_components);
    for (int k {}; k < n_components; ++k) {
        const Eigen::RowVector2d mean { means_.row(k).matrix() };
        const Eigen::MatrixXd diff { X.rowwise() - mean };
        Eigen::Matrix2d cov { (diff.transpose()
                               * resp.col(k).asDiagonal() * diff)
                              / nk(k) };
        cov.diagonal().array() += reg_covar;
        covariances[k] = cov;
    }
}

auto CircularMixture::expectation(const ArrayX2d& points,
                                  Eigen::MatrixXd& resp) const -> double
{
    const Eigen::Index n_points { points.rows() };
    Eigen::MatrixXd log_prob(n_points, n_components);
    for (int k {}; k < n_components; ++k) {
        const Eigen::Matrix2d& cov { covariances[k] };
        const double det { cov.determinant() };
        const Eigen::Matrix2d inv { cov.inverse() };
        const double log_norm { -std::log(2.0 * std::numbers::pi)
                                - 0.5 * std::log(det)
                                + std::log(weights(k)) };
        for (Eigen::Index i {}; i < n_points; ++i) {
            const Eigen::Vector2d d { (points.row(i) - means_.row(k))
                                        .matrix()
                                        .transpose() };
            log_prob(i, k) = log_norm - 0.5 * d.dot(inv * d);
        }
    }
    // Normalize in log space
    double total {};
    resp.resize(n_points, n_components);
    for (Eigen::Index i {}; i < n_points; ++i) {
        const double max_log { log_prob.row(i).maxCoeff() };
        const double log_sum {
            max_log
            + std::log((log_prob.row(i).array() - max_log).exp().sum())
        };
        resp.row(i) = (log_prob.row(i).array() - log_sum).exp().matrix();
        total += log_sum;
    }
    return total / static_cast<double>(n_points);
}

auto CircularMixture::fit(const ArrayX2d& points) -> void
{
    if (points.rows() == 0) {
        throw std::invalid_argument { "no points to fit a mixture model to" };
    }
    if (points.rows() < n_components) {
        spdlog::debug("reducing the number of mixture components from {} to "
                      "the number of points {}",
                      n_components,
                      points.rows());
        n_components = static_cast<int>(points.rows());
    }
    const Eigen::ArrayXi labels { kMeansLabels(points) };
    Eigen::MatrixXd resp { Eigen::MatrixXd::Zero(points.rows(),
                                                 n_components) };
    for (Eigen::Index i {}; i < points.rows(); ++i) {
        resp(i, labels(i)) = 1.0;
    }
    maximization(points, resp);
    converged_ = false;
    double lower_bound { -std::numeric_limits<double>::infinity() };
    for (n_iter_ = 1; n_iter_ <= max_iter; ++n_iter_) {
        const double prev_lower_bound { lower_bound };
        lower_bound = expectation(points, resp);
        maximization(points, resp);
        if (std::abs(lower_bound - prev_lower_bound) < tol) {
            converged_ = true;
            break;
        }
    }
    if (!converged_) {
        spdlog::debug("mixture model did not converge in {} iterations",
                      max_iter);
    }
}

auto CircularMixture::centralAngles() const -> Eigen::ArrayXd
{
    Eigen::ArrayXd angles(means_.rows());
    for (Eigen::Index k {}; k < means_.rows(); ++k) {
        angles(k) = std::atan2(means_(k, 1), means_(k, 0)) * math::rad_to_deg;
    }
    return angles;
}

} // namespace rtcomp
