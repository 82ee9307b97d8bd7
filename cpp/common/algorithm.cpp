// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "algorithm.h"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <vector>

namespace rtcomp {

auto percentile(const Eigen::ArrayXd& values, const double q) -> double
{
    if (values.size() == 0) {
        throw std::invalid_argument { "percentile of an empty array" };
    }
    std::vector<double> sorted(values.begin(), values.end());
    std::ranges::sort(sorted);
    const double pos { std::clamp(q, 0.0, 100.0) / 100.0
                       * static_cast<double>(sorted.size() - 1) };
    const auto i_lo { static_cast<size_t>(std::floor(pos)) };
    const size_t i_hi { std::min(i_lo + 1, sorted.size() - 1) };
    const double frac { pos - static_cast<double>(i_lo) };
    return sorted[i_lo] + frac * (sorted[i_hi] - sorted[i_lo]);
}

auto sortedUnique(const Eigen::ArrayXd& values) -> Eigen::ArrayXd
{
    std::vector<double> buf(values.begin(), values.end());
    std::ranges::sort(buf);
    const auto last { std::unique(buf.begin(), buf.end()) };
    buf.erase(last, buf.end());
    return Eigen::Map<Eigen::ArrayXd>(buf.data(),
                                      static_cast<Eigen::Index>(buf.size()));
}

auto roundDecimals(const Eigen::ArrayXd& values,
                   const int decimals) -> Eigen::ArrayXd
{
    const double factor { std::pow(10.0, decimals) };
    return (values * factor).round() / factor;
}

auto maskedValues(const ArrayXXd& raster,
                  const ArrayXXb& mask) -> Eigen::ArrayXd
{
    if (raster.rows() != mask.rows() || raster.cols() != mask.cols()) {
        throw std::invalid_argument { "raster and mask dimensions differ" };
    }
    Eigen::ArrayXd values(mask.count());
    Eigen::Index i_val {};
    for (Eigen::Index i {}; i < raster.rows(); ++i) {
        for (Eigen::Index j {}; j < raster.cols(); ++j) {
            if (mask(i, j)) {
                values(i_val++) = raster(i, j);
            }
        }
    }
    return values;
}

} // namespace rtcomp
