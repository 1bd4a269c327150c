#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_list.hpp"
#include "atclean/stats/sigma_clip.hpp"

#include <vector>

namespace atclean::cuts {

struct UncertEstStats {
    int control_index = 0;
    double median_dflux = kNaN;
    double stdev = kNaN;
    double sigma_extra = kNaN;
};

struct UncertEstResult {
    std::vector<UncertEstStats> controls;
    double sigma_extra = kNaN;  // median over the controls
    bool applied = false;
};

// Extra noise not covered by the reported uncertainties, estimated from the
// flux scatter of each control light curve
std::vector<UncertEstStats> get_uncert_est_stats(const core::Supernova& sn, const Cut& cut,
                                                 Mask uncert_cut_flag,
                                                 const stats::SigmaClipOptions& options);

// Adds sigma_extra in quadrature into "duJy_new" and makes it the working uncertainty
void add_noise_to_dflux(core::LightCurve& lc, double sigma_extra);
void add_noise_to_dflux(core::Supernova& sn, double sigma_extra);

// Estimates and, if larger than the cut's apply_min_sigma_extra, applies
UncertEstResult apply_uncert_est(core::Supernova& sn, const Cut& cut, Mask uncert_cut_flag,
                                 const stats::SigmaClipOptions& options);

} // namespace atclean::cuts
