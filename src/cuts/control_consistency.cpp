#include "atclean/cuts/control_consistency.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/cuts/cut_engine.hpp"

#include <cmath>
#include <iostream>

namespace atclean::cuts {

ControlConsistencyAnalyzer::ControlConsistencyAnalyzer(const Cut& cut,
                                                       stats::SigmaClipOptions options)
    : flag_(cut.flag),
      questionable_flag_(cut.param_flag("questionable_flag")),
      x2_flag_(cut.param_flag("x2_flag")),
      stn_flag_(cut.param_flag("stn_flag")),
      Nclip_flag_(cut.param_flag("Nclip_flag")),
      Ngood_flag_(cut.param_flag("Ngood_flag")),
      x2_max_(cut.param("x2_max")),
      stn_max_(cut.param("stn_max")),
      Nclip_max_(cut.param("Nclip_max")),
      Ngood_min_(cut.param("Ngood_min")),
      options_(options) {
    if (flag_ == 0) {
        throw ConfigError("controls cut needs a flag");
    }
}

Mask ControlConsistencyAnalyzer::all_flags() const {
    return flag_ | questionable_flag_ | x2_flag_ | stn_flag_ | Nclip_flag_ | Ngood_flag_;
}

void ControlConsistencyAnalyzer::calculate_control_stats(core::Supernova& sn,
                                                         Mask previous_flags) const {
    core::LogLine(std::cout) << "[CONTROLS_CUT] Calculating control light curve statistics";

    core::LightCurve& lc = sn.transient();
    const size_t n_rows = lc.size();
    const std::vector<int> controls = sn.control_indices();
    if (controls.empty()) {
        throw DataInsufficientError("controls cut on " + sn.name() + " without control light curves");
    }
    for (int idx : controls) {
        const core::LightCurve& c = sn.lc(idx);
        if (c.size() != n_rows) {
            throw AlignmentError("control " + std::to_string(idx) + " of " + sn.name() +
                                 " is not aligned with the transient");
        }
        for (size_t i = 0; i < n_rows; ++i) {
            const auto k = static_cast<Eigen::Index>(i);
            if (c.time()[k] != lc.time()[k]) {
                throw AlignmentError("control " + std::to_string(idx) + " of " + sn.name() +
                                     " differs from the transient in MJD");
            }
        }
    }

    const auto n_controls = static_cast<Eigen::Index>(controls.size());
    VectorXd mean = VectorXd::Constant(static_cast<Eigen::Index>(n_rows), kNaN);
    VectorXd mean_err = mean;
    VectorXd stdev = mean;
    VectorXd x2norm = mean;
    VectorXd abs_stn = mean;
    VectorXd n_good = VectorXd::Zero(static_cast<Eigen::Index>(n_rows));
    VectorXd n_clip = n_good;
    VectorXd n_mask = n_good;
    VectorXd n_nan = n_good;

    VectorXd flux(n_controls);
    VectorXd dflux(n_controls);
    std::vector<bool> excluded(controls.size());

    for (size_t i = 0; i < n_rows; ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        for (size_t j = 0; j < controls.size(); ++j) {
            const core::LightCurve& c = sn.lc(controls[j]);
            const auto jj = static_cast<Eigen::Index>(j);
            flux[jj] = c.flux()[k];
            dflux[jj] = c.dflux()[k];
            excluded[j] = (c.mask()[i] & previous_flags) != 0;
        }

        const auto r = stats::sigma_clip(flux, dflux, excluded, options_);
        n_mask[k] = static_cast<double>(r.n_mask);
        n_nan[k] = static_cast<double>(r.n_nan);
        if (!r.has_data) continue;

        mean[k] = r.mean;
        mean_err[k] = r.mean_err;
        stdev[k] = r.stdev;
        x2norm[k] = r.x2norm;
        n_good[k] = static_cast<double>(r.n_good);
        n_clip[k] = static_cast<double>(r.n_clip);
        abs_stn[k] = std::abs(r.mean / r.mean_err);
    }

    lc.set_column(c2::MEAN, std::move(mean));
    lc.set_column(c2::MEAN_ERR, std::move(mean_err));
    lc.set_column(c2::STDEV, std::move(stdev));
    lc.set_column(c2::X2NORM, std::move(x2norm));
    lc.set_column(c2::NGOOD, std::move(n_good));
    lc.set_column(c2::NCLIP, std::move(n_clip));
    lc.set_column(c2::NMASK, std::move(n_mask));
    lc.set_column(c2::NNAN, std::move(n_nan));
    lc.set_column(c2::ABS_STN, std::move(abs_stn));
}

void ControlConsistencyAnalyzer::flag_by_control_stats(core::LightCurve& lc) const {
    const VectorXd& x2 = lc.column(c2::X2NORM);
    const VectorXd& stn = lc.column(c2::ABS_STN);
    const VectorXd& nclip = lc.column(c2::NCLIP);
    const VectorXd& ngood = lc.column(c2::NGOOD);

    IndexList x2_ix, stn_ix, nclip_ix, ngood_ix, questionable_ix, cut_ix;
    for (size_t i = 0; i < lc.size(); ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        const bool x2_bad = x2[k] > x2_max_;
        const bool stn_bad = stn[k] > stn_max_;
        const bool nclip_bad = nclip[k] > Nclip_max_;
        const bool ngood_bad = ngood[k] < Ngood_min_;
        if (x2_bad) x2_ix.push_back(i);
        if (stn_bad) stn_ix.push_back(i);
        if (nclip_bad) nclip_ix.push_back(i);
        if (ngood_bad) ngood_ix.push_back(i);

        if (!(x2_bad || stn_bad || nclip_bad || ngood_bad)) continue;
        // Nothing was clipped, so the failure may come from the transient epoch itself
        if (nclip[k] == 0.0) {
            questionable_ix.push_back(i);
        } else {
            cut_ix.push_back(i);
        }
    }

    update_mask(lc, x2_flag_, x2_ix);
    update_mask(lc, stn_flag_, stn_ix);
    update_mask(lc, Nclip_flag_, nclip_ix);
    update_mask(lc, Ngood_flag_, ngood_ix);
    update_mask(lc, questionable_flag_, questionable_ix);
    update_mask(lc, flag_, cut_ix);
}

ControlCutReport ControlConsistencyAnalyzer::apply(core::Supernova& sn, Mask previous_flags) const {
    calculate_control_stats(sn, previous_flags);

    core::LightCurve& lc = sn.transient();
    flag_by_control_stats(lc);

    const Mask flags = all_flags();
    for (int idx : sn.control_indices()) {
        core::LightCurve& c = sn.lc(idx);
        auto& mask = c.mask();
        for (size_t i = 0; i < mask.size(); ++i) {
            mask[i] = (mask[i] & ~flags) | (lc.mask()[i] & flags);
        }
    }

    ControlCutReport report;
    report.x2_percent = percent_flagged(lc, x2_flag_);
    report.stn_percent = percent_flagged(lc, stn_flag_);
    report.Nclip_percent = percent_flagged(lc, Nclip_flag_);
    report.Ngood_percent = percent_flagged(lc, Ngood_flag_);
    report.questionable_percent = percent_flagged(lc, questionable_flag_);
    report.percent = percent_flagged(lc, flag_);
    return report;
}

} // namespace atclean::cuts
