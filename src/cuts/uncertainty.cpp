#include "atclean/cuts/uncertainty.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace atclean::cuts {

namespace {

double stdev_flux(const core::LightCurve& lc, const IndexList& rows,
                  const stats::SigmaClipOptions& options) {
    auto r = stats::sigma_clip_rows(lc.flux(), VectorXd(), rows, {}, options);
    return r.has_data ? r.stdev : kNaN;
}

} // namespace

std::vector<UncertEstStats> get_uncert_est_stats(const core::Supernova& sn, const Cut& cut,
                                                 Mask uncert_cut_flag,
                                                 const stats::SigmaClipOptions& options) {
    const double temp_x2_max = cut.param("temp_x2_max_value");
    std::vector<UncertEstStats> out;

    for (int idx : sn.control_indices()) {
        const core::LightCurve& lc = sn.lc(idx);
        const IndexList dflux_clean_ix = lc.ix_unmasked(uncert_cut_flag);
        IndexList clean_ix;
        const VectorXd& x2 = lc.column(col::CHI_N);
        for (size_t i : dflux_clean_ix) {
            if (x2[static_cast<Eigen::Index>(i)] < temp_x2_max) clean_ix.push_back(i);
        }

        UncertEstStats s;
        s.control_index = idx;
        s.median_dflux = core::median_of(lc.column(col::DFLUX), clean_ix);

        s.stdev = stdev_flux(lc, clean_ix, options);
        if (std::isnan(s.stdev)) {
            core::LogLine(std::cout) << "[UNCERT_EST] control " << idx
                                     << ": no flux stdev from clean rows; retrying without chi-square cut";
            s.stdev = stdev_flux(lc, dflux_clean_ix, options);
            if (std::isnan(s.stdev)) {
                core::LogLine(std::cout) << "[UNCERT_EST] control " << idx
                                         << ": retrying with all rows";
                s.stdev = stdev_flux(lc, core::index_range(lc.size()), options);
            }
        }

        const double diff = s.stdev * s.stdev - s.median_dflux * s.median_dflux;
        if (std::isnan(diff)) {
            s.sigma_extra = kNaN;
        } else {
            s.sigma_extra = diff > 0.0 ? std::sqrt(diff) : 0.0;
        }
        out.push_back(s);
    }
    return out;
}

void add_noise_to_dflux(core::LightCurve& lc, double sigma_extra) {
    const VectorXd& dflux = lc.column(col::DFLUX);
    VectorXd dflux_new = (dflux.array().square() + sigma_extra * sigma_extra).sqrt();
    lc.set_column(col::DFLUX_NEW, std::move(dflux_new), true);
    lc.set_dflux_column(col::DFLUX_NEW);
    lc.set_column(col::SNR, lc.flux().cwiseQuotient(lc.dflux()));
}

void add_noise_to_dflux(core::Supernova& sn, double sigma_extra) {
    for (auto& [idx, lc] : sn.lcs()) {
        add_noise_to_dflux(lc, sigma_extra);
    }
}

UncertEstResult apply_uncert_est(core::Supernova& sn, const Cut& cut, Mask uncert_cut_flag,
                                 const stats::SigmaClipOptions& options) {
    UncertEstResult result;
    result.controls = get_uncert_est_stats(sn, cut, uncert_cut_flag, options);

    std::vector<double> extras;
    for (const auto& s : result.controls) extras.push_back(s.sigma_extra);
    result.sigma_extra = core::median_of(extras);

    const double min_extra = cut.params.count("apply_min_sigma_extra")
                                 ? cut.param("apply_min_sigma_extra")
                                 : 0.0;
    if (!std::isnan(result.sigma_extra) && result.sigma_extra > min_extra) {
        add_noise_to_dflux(sn, result.sigma_extra);
        result.applied = true;
    }
    return result;
}

} // namespace atclean::cuts
