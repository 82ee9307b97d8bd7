// This source code is licensed under the 3-clause BSD license found
// in the LICENSE file in the root directory of this project.

#include "coupled_radiance.h"

#include <algorithm>

namespace rtcomp {

auto coupledRadiance(const Quantities& r,
                     const std::vector<std::string>& coupling_terms,
                     const Eigen::ArrayXd& scaling,
                     const double coszen,
                     const double cos_i) -> CoupledRadiance
{
    const bool have_all_terms { coupling_terms.size() == 4
                                && std::ranges::all_of(
                                  coupling_terms, [&r](const auto& key) {
                                      const auto it { r.find(key) };
                                      return it != r.end()
                                             && it->second.size() > 0;
                                  }) };
    CoupledRadiance L {};
    if (have_all_terms) {
        L.bi_direct = scaling * r.at(coupling_terms[0]);
        L.hemi_direct = scaling * r.at(coupling_terms[1]);
        L.direct_hemi = scaling * r.at(coupling_terms[2]);
        L.bi_hemi = scaling * r.at(coupling_terms[3]);
    } else {
        const Eigen::ArrayXd& down_dir { requireQuantity(r,
                                                         "transm_down_dir") };
        const Eigen::ArrayXd& down_dif { requireQuantity(r,
                                                         "transm_down_dif") };
        L.bi_direct = down_dir;
        L.hemi_direct = down_dir + down_dif;
        L.direct_hemi = Eigen::ArrayXd::Zero(down_dir.size());
        L.bi_hemi = Eigen::ArrayXd::Zero(down_dir.size());
    }
    // Unscale and rescale the downward direct radiance by the local
    // solar zenith angle
    const double slope_factor { cos_i / coszen };
    L.bi_direct *= slope_factor;
    L.direct_hemi *= slope_factor;
    return L;
}

} // namespace rtcomp
