#include "atclean/averaging/day_binning.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/cuts/cut_engine.hpp"

#include <cmath>
#include <iostream>

namespace atclean::averaging {

namespace {

struct BinRow {
    double mjd = kNaN;
    double mjdbin = kNaN;
    double flux = kNaN;
    double dflux = kNaN;
    double stdev = kNaN;
    double x2 = kNaN;
    double nclip = 0.0;
    double ngood = 0.0;
    double nexcluded = 0.0;
    Mask mask = 0;
};

// Inverse-variance weighted mean time of the kept rows; plain mean when no
// row has a usable uncertainty
double weighted_time(const VectorXd& time, const VectorXd& dflux, const IndexList& ix) {
    double sum = 0.0;
    double wsum = 0.0;
    for (size_t i : ix) {
        const auto k = static_cast<Eigen::Index>(i);
        if (!(dflux[k] > 0.0) || !std::isfinite(dflux[k])) continue;
        const double w = 1.0 / (dflux[k] * dflux[k]);
        sum += w * time[k];
        wsum += w;
    }
    if (wsum > 0.0) return sum / wsum;
    return core::mean_of(time, ix);
}

void fill_stats(BinRow& row, const stats::SigmaClipResult& r, const VectorXd& time,
                const VectorXd& dflux) {
    row.flux = r.mean;
    row.dflux = r.mean_err;
    row.stdev = r.stdev;
    row.x2 = r.x2norm;
    row.nclip = static_cast<double>(r.n_clip);
    row.ngood = static_cast<double>(r.n_good);
    row.mjd = weighted_time(time, dflux, r.ix_good);
}

} // namespace

void flux_to_mag_columns(core::LightCurve& lc, double sigmalimit) {
    const VectorXd& flux = lc.flux();
    const VectorXd& dflux = lc.dflux();
    const auto n = flux.size();
    VectorXd m = VectorXd::Constant(n, kNaN);
    VectorXd dm = VectorXd::Constant(n, kNaN);

    for (Eigen::Index i = 0; i < n; ++i) {
        if (std::isnan(flux[i]) || std::isnan(dflux[i])) continue;
        if (flux[i] < sigmalimit * dflux[i]) {
            m[i] = core::flux_to_mag(sigmalimit * dflux[i]);
        } else {
            m[i] = core::flux_to_mag(flux[i]);
            dm[i] = 2.5 / std::log(10.0) * dflux[i] / flux[i];
        }
    }
    lc.set_column(col::MAG, std::move(m), true);
    lc.set_column(col::DMAG, std::move(dm), true);
}

DayBinningAverager::DayBinningAverager(const cuts::Cut& cut, DayBinningOptions options,
                                       stats::SigmaClipOptions clip_options)
    : flag_(cut.flag),
      ixclip_flag_(cut.param_flag("ixclip_flag")),
      smallnum_flag_(cut.param_flag("smallnum_flag")),
      nodata_flag_(cut.param_flag("nodata_flag")),
      options_(options),
      clip_options_(clip_options) {
    if (flag_ == 0) {
        throw ConfigError("averaging cut needs a flag");
    }
    if (!(options_.mjd_bin_size > 0.0)) {
        throw ConfigError("mjd_bin_size must be > 0");
    }
}

core::LightCurve DayBinningAverager::average(core::Averageable& lc, Mask previous_flags) const {
    if (lc.control_index() == 0) {
        core::LogLine(std::cout) << "[AVERAGING] Averaging transient light curve";
    } else {
        core::LogLine(std::cout) << "[AVERAGING] Averaging control light curve "
                                 << lc.control_index();
    }

    const VectorXd& time = lc.time();
    const VectorXd& flux = lc.flux();
    const VectorXd& dflux = lc.dflux();
    auto& mask = lc.mask();
    const Mask own_flags = all_flags() & ~nodata_flag_;
    for (auto& m : mask) m &= ~own_flags;

    // Placeholder rows without a time do not belong to any bin
    double t_min = kNaN;
    double t_max = kNaN;
    for (Eigen::Index i = 0; i < time.size(); ++i) {
        if (std::isnan(time[i])) continue;
        if (std::isnan(t_min) || time[i] < t_min) t_min = time[i];
        if (std::isnan(t_max) || time[i] > t_max) t_max = time[i];
    }

    std::vector<BinRow> bins;
    const double bs = options_.mjd_bin_size;
    if (!std::isnan(t_min)) {
        const double start = std::floor(t_min);
        const auto n_bins = static_cast<size_t>(std::floor((t_max - start) / bs)) + 1;
        std::vector<IndexList> members(n_bins);
        for (Eigen::Index i = 0; i < time.size(); ++i) {
            if (std::isnan(time[i])) continue;
            auto b = static_cast<size_t>(std::floor((time[i] - start) / bs));
            if (b >= n_bins) b = n_bins - 1;
            members[b].push_back(static_cast<size_t>(i));
        }

        bins.resize(n_bins);
        for (size_t b = 0; b < n_bins; ++b) {
            BinRow& row = bins[b];
            const IndexList& range_ix = members[b];
            row.mjdbin = start + (static_cast<double>(b) + 0.5) * bs;

            IndexList good_ix;
            IndexList bad_ix;
            for (size_t i : range_ix) {
                if (mask[i] & previous_flags) {
                    bad_ix.push_back(i);
                } else {
                    good_ix.push_back(i);
                }
            }
            row.nexcluded = static_cast<double>(bad_ix.size());

            if (range_ix.empty()) {
                row.mask |= flag_ | nodata_flag_;
                continue;
            }

            if (good_ix.empty()) {
                row.mask |= flag_ | nodata_flag_;
                for (size_t i : range_ix) mask[i] |= flag_;
                if (options_.empty_bin_policy == EmptyBinPolicy::ALL_ROWS) {
                    const auto r = stats::sigma_clip_rows(flux, dflux, range_ix, {}, clip_options_);
                    if (r.has_data) fill_stats(row, r, time, dflux);
                }
                continue;
            }

            const auto r = stats::sigma_clip_rows(flux, dflux, good_ix, {}, clip_options_);
            if (!r.has_data || r.ix_good.empty()) {
                row.mask |= flag_ | nodata_flag_;
                for (size_t i : range_ix) mask[i] |= flag_;
                continue;
            }
            fill_stats(row, r, time, dflux);
            for (size_t i : r.ix_clip) mask[i] |= ixclip_flag_;

            if (good_ix.size() < 3) {
                row.mask |= smallnum_flag_;
                for (size_t i : range_ix) mask[i] |= smallnum_flag_;
                continue;
            }

            const bool is_bad = row.ngood < options_.Ngood_min || row.nclip > options_.Nclip_max ||
                                (!std::isnan(row.x2) && row.x2 > options_.x2_max);
            if (is_bad) {
                row.mask |= flag_;
                for (size_t i : range_ix) mask[i] |= flag_;
            }
        }
    }

    const auto n = static_cast<Eigen::Index>(bins.size());
    VectorXd mjd(n), mjdbin(n), f(n), df(n), stdev(n), x2(n), nclip(n), ngood(n), nexcluded(n);
    std::vector<Mask> bin_mask(bins.size());
    for (Eigen::Index i = 0; i < n; ++i) {
        const BinRow& row = bins[static_cast<size_t>(i)];
        mjd[i] = row.mjd;
        mjdbin[i] = row.mjdbin;
        f[i] = row.flux;
        df[i] = row.dflux;
        stdev[i] = row.stdev;
        x2[i] = row.x2;
        nclip[i] = row.nclip;
        ngood[i] = row.ngood;
        nexcluded[i] = row.nexcluded;
        bin_mask[static_cast<size_t>(i)] = row.mask;
    }

    core::LightCurve out(lc.control_index(), lc.filter());
    out.set_column(col::MJD, std::move(mjd), true);
    out.set_column(col::MJDBIN, std::move(mjdbin), true);
    out.set_column(col::FLUX, std::move(f), true);
    out.set_column(col::DFLUX, std::move(df), true);
    out.set_column(col::STDEV, std::move(stdev), true);
    out.set_column(col::X2, std::move(x2), true);
    out.set_column(col::NCLIP, std::move(nclip), true);
    out.set_column(col::NGOOD, std::move(ngood), true);
    out.set_column(col::NEXCLUDED, std::move(nexcluded), true);
    out.set_mask(std::move(bin_mask));
    out.set_binned(bs);
    flux_to_mag_columns(out, options_.flux2mag_sigmalimit);
    return out;
}

AveragedSupernova average_supernova(core::Supernova& sn, const DayBinningAverager& averager,
                                    Mask previous_flags) {
    AveragedSupernova result;
    result.sn = core::Supernova(sn.name(), sn.filter());
    result.sn.set_coords(sn.coords());
    result.sn.set_mjd0(sn.mjd0());

    for (auto& [idx, lc] : sn.lcs()) {
        result.sn.add(averager.average(lc, previous_flags));
    }

    result.percent = cuts::percent_flagged(result.sn.transient(),
                                           previous_flags | averager.all_flags());
    return result;
}

} // namespace atclean::averaging
