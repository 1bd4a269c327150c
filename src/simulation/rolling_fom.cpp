#include "atclean/simulation/rolling_fom.hpp"
#include "atclean/core/errors.hpp"

#include <algorithm>
#include <cmath>

namespace atclean::simulation {

RollingFomEngine::RollingFomEngine(double sigma_kern, double bin_size, Mask flags)
    : sigma_kern_(sigma_kern), bin_size_(bin_size), flags_(flags) {
    if (!(sigma_kern_ > 0.0)) {
        throw ConfigError("rolling sum kernel sigma must be > 0");
    }
    if (!(bin_size_ > 0.0)) {
        throw ConfigError("rolling sum needs a binned light curve (bin size > 0)");
    }
    sigma_bins_ = std::max(1, static_cast<int>(std::lround(sigma_kern_ / bin_size_)));
    half_window_ = 3 * sigma_bins_;

    kernel_.resize(2 * half_window_ + 1);
    for (int k = -half_window_; k <= half_window_; ++k) {
        const double x = static_cast<double>(k) / static_cast<double>(sigma_bins_);
        kernel_[k + half_window_] = std::exp(-0.5 * x * x);
    }
}

std::vector<bool> RollingFomEngine::valid_rows(const core::LightCurve& lc) const {
    const VectorXd& t = lc.time();
    const VectorXd& f = lc.flux();
    const VectorXd& df = lc.dflux();
    std::vector<bool> valid(lc.size(), false);
    for (size_t i = 0; i < lc.size(); ++i) {
        const auto k = static_cast<Eigen::Index>(i);
        valid[i] = !std::isnan(t[k]) && std::isfinite(f[k]) && df[k] > 0.0 &&
                   (lc.mask()[i] & flags_) == 0;
    }
    return valid;
}

VectorXd RollingFomEngine::snr(const VectorXd& flux, const VectorXd& dflux,
                               const std::vector<bool>& valid) const {
    VectorXd out = VectorXd::Zero(flux.size());
    for (Eigen::Index i = 0; i < flux.size(); ++i) {
        if (valid[static_cast<size_t>(i)]) out[i] = flux[i] / dflux[i];
    }
    return out;
}

VectorXd RollingFomEngine::snr(const core::LightCurve& lc, bool with_injection) const {
    const auto valid = valid_rows(lc);
    if (with_injection && lc.injection()) {
        const VectorXd flux = lc.flux() + lc.injection()->flux;
        return snr(flux, lc.dflux(), valid);
    }
    return snr(lc.flux(), lc.dflux(), valid);
}

double RollingFomEngine::weighted_sum(const VectorXd& series, Eigen::Index i) const {
    const Eigen::Index n = series.size();
    const Eigen::Index lo = std::max<Eigen::Index>(0, i - half_window_);
    const Eigen::Index hi = std::min<Eigen::Index>(n - 1, i + half_window_);
    double s = 0.0;
    for (Eigen::Index j = lo; j <= hi; ++j) {
        s += kernel_[j - i + half_window_] * series[j];
    }
    return s;
}

VectorXd RollingFomEngine::rolling_sum(const VectorXd& series) const {
    VectorXd out(series.size());
    for (Eigen::Index i = 0; i < series.size(); ++i) out[i] = weighted_sum(series, i);
    return out;
}

VectorXd RollingFomEngine::norm(const std::vector<bool>& valid) const {
    VectorXd indicator(static_cast<Eigen::Index>(valid.size()));
    for (size_t i = 0; i < valid.size(); ++i) {
        indicator[static_cast<Eigen::Index>(i)] = valid[i] ? 1.0 : 0.0;
    }
    return rolling_sum(indicator);
}

FomSeries RollingFomEngine::apply(const VectorXd& snr, const std::vector<bool>& valid) const {
    if (snr.size() == 0) {
        throw DataInsufficientError("rolling sum over an empty light curve");
    }
    FomSeries out;
    out.snr = snr;
    out.sum = rolling_sum(snr);
    out.norm = norm(valid);
    out.normalized = apply_range(snr, out.norm, out.norm.maxCoeff(), 0, snr.size() - 1);
    return out;
}

FomSeries RollingFomEngine::apply(const core::LightCurve& lc, bool with_injection) const {
    return apply(snr(lc, with_injection), valid_rows(lc));
}

VectorXd RollingFomEngine::apply_range(const VectorXd& snr, const VectorXd& norm, double norm_max,
                                       Eigen::Index first, Eigen::Index last) const {
    if (first < 0 || last >= snr.size() || first > last) {
        throw ValidationError("rolling sum range out of bounds");
    }
    VectorXd out(last - first + 1);
    for (Eigen::Index i = first; i <= last; ++i) {
        const double w = norm[i];
        out[i - first] = w > 0.0 ? weighted_sum(snr, i) / w * norm_max : 0.0;
    }
    return out;
}

void inject(core::Injectable& target, const VectorXd& times, const InjectionModel& model,
            double peak_mjd, double peak_flux, double width, const std::vector<bool>& valid) {
    if (static_cast<size_t>(times.size()) != valid.size()) {
        throw ValidationError("injection times and validity rows differ in length");
    }
    IndexList rows;
    for (size_t i = 0; i < valid.size(); ++i) {
        if (valid[i]) rows.push_back(i);
    }
    VectorXd at(static_cast<Eigen::Index>(rows.size()));
    for (size_t j = 0; j < rows.size(); ++j) {
        at[static_cast<Eigen::Index>(j)] = times[static_cast<Eigen::Index>(rows[j])];
    }
    const VectorXd f = model.flux_at(at, peak_mjd, peak_flux, width);

    core::InjectionState state;
    state.model = model.name();
    state.peak_mjd = peak_mjd;
    state.peak_flux = peak_flux;
    state.width = width;
    state.flux = VectorXd::Zero(times.size());
    for (size_t j = 0; j < rows.size(); ++j) {
        state.flux[static_cast<Eigen::Index>(rows[j])] = f[static_cast<Eigen::Index>(j)];
    }
    target.set_injection(std::move(state));
}

void inject(core::LightCurve& lc, const InjectionModel& model, double peak_mjd, double peak_flux,
            double width, const std::vector<bool>& valid) {
    inject(lc, lc.time(), model, peak_mjd, peak_flux, width, valid);
}

void add_rolling_fom_columns(core::LightCurve& lc, const RollingFomEngine& engine) {
    const auto valid = engine.valid_rows(lc);
    FomSeries base = engine.apply(engine.snr(lc.flux(), lc.dflux(), valid), valid);
    lc.set_column(fomcol::SNR, std::move(base.snr));
    lc.set_column(fomcol::SNRSUM, std::move(base.sum));
    lc.set_column(fomcol::SNRSUMNORM, std::move(base.normalized));

    if (lc.injection()) {
        const VectorXd flux_sim = lc.flux() + lc.injection()->flux;
        FomSeries sim = engine.apply(engine.snr(flux_sim, lc.dflux(), valid), valid);
        lc.set_column(fomcol::FLUXSIM, flux_sim);
        lc.set_column(fomcol::SNRSIM, std::move(sim.snr));
        lc.set_column(fomcol::SNRSIMSUM, std::move(sim.normalized));
    }
}

} // namespace atclean::simulation
