#include "atclean/simulation/injection_model.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>
#include <numeric>
#include <sstream>

namespace atclean::simulation {

namespace {

void check_params(double peak_flux, double width) {
    if (!(peak_flux > 0.0)) {
        throw ValidationError("injected peak flux must be > 0, got " +
                              core::format_double(peak_flux));
    }
    if (!(width > 0.0)) {
        throw ValidationError("injected width must be > 0, got " + core::format_double(width));
    }
}

} // namespace

GaussianModel::GaussianModel(double rise_scale, double decline_scale)
    : rise_scale_(rise_scale), decline_scale_(decline_scale) {
    if (!(rise_scale_ > 0.0) || !(decline_scale_ > 0.0)) {
        throw ConfigError("gaussian rise and decline scales must be > 0");
    }
}

std::shared_ptr<const GaussianModel::Profile> GaussianModel::profile(double width) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = profiles_.find(width);
    if (it != profiles_.end()) return it->second;

    const double s_rise = width * rise_scale_;
    const double s_decline = width * decline_scale_;
    const double half_span = std::max(kMinHalfSpan, 6.0 * std::max(s_rise, s_decline));
    const auto n = static_cast<Eigen::Index>(std::llround(2.0 * half_span / kProfileStep)) + 1;

    auto p = std::make_shared<Profile>();
    p->x.resize(n);
    p->y.resize(n);
    for (Eigen::Index i = 0; i < n; ++i) {
        const double x = -half_span + static_cast<double>(i) * kProfileStep;
        const double s = x < 0.0 ? s_rise : s_decline;
        p->x[i] = x;
        p->y[i] = std::exp(-0.5 * (x / s) * (x / s));
    }
    profiles_.emplace(width, p);
    return p;
}

VectorXd GaussianModel::flux_at(const VectorXd& times, double peak_time, double peak_flux,
                                double width) const {
    check_params(peak_flux, width);
    const auto p = profile(width);
    const VectorXd rel = (times.array() - peak_time).matrix();
    return peak_flux * core::interp_linear(p->x, p->y, rel, 0.0);
}

TemplateModel::TemplateModel(VectorXd mjd, VectorXd mag, double sigma) : sigma_(sigma) {
    if (mjd.size() != mag.size() || mjd.size() < 2) {
        throw ValidationError("template needs at least two (MJD, magnitude) points");
    }
    if (!(sigma_ > 0.0)) {
        throw ConfigError("template sigma must be > 0");
    }

    std::vector<Eigen::Index> order(static_cast<size_t>(mjd.size()));
    std::iota(order.begin(), order.end(), 0);
    std::stable_sort(order.begin(), order.end(),
                     [&](Eigen::Index a, Eigen::Index b) { return mjd[a] < mjd[b]; });

    Eigen::Index peak = -1;
    for (Eigen::Index i = 0; i < mag.size(); ++i) {
        if (std::isnan(mag[i]) || std::isnan(mjd[i])) {
            throw ValidationError("template contains missing values");
        }
        if (peak < 0 || mag[i] < mag[peak]) peak = i;
    }

    const double peak_mjd = mjd[peak];
    const double peak_flux = core::mag_to_flux(mag[peak]);
    days_.resize(mjd.size());
    rel_flux_.resize(mjd.size());
    for (size_t j = 0; j < order.size(); ++j) {
        const auto k = static_cast<Eigen::Index>(j);
        days_[k] = mjd[order[j]] - peak_mjd;
        rel_flux_[k] = core::mag_to_flux(mag[order[j]]) / peak_flux;
    }
}

TemplateModel TemplateModel::load(const fs::path& path, double sigma) {
    core::LogLine(std::cout) << "[SIMDETEC] Loading template light curve " << path.string();
    std::istringstream in(core::read_text(path));
    std::vector<double> mjd;
    std::vector<double> mag;
    std::string line;
    size_t line_no = 0;
    while (std::getline(in, line)) {
        ++line_no;
        const auto fields = core::split_whitespace(line);
        if (fields.empty() || core::starts_with(fields[0], "#")) continue;
        if (fields.size() < 2) {
            throw IOError("template " + path.string() + " line " + std::to_string(line_no) +
                          ": expected MJD and magnitude");
        }
        auto t = core::parse_double(fields[0]);
        auto m = core::parse_double(fields[1]);
        if (!t || !m) {
            throw IOError("template " + path.string() + " line " + std::to_string(line_no) +
                          ": cannot parse '" + line + "'");
        }
        mjd.push_back(*t);
        mag.push_back(*m);
    }
    return TemplateModel(Eigen::Map<VectorXd>(mjd.data(), static_cast<Eigen::Index>(mjd.size())),
                         Eigen::Map<VectorXd>(mag.data(), static_cast<Eigen::Index>(mag.size())),
                         sigma);
}

VectorXd TemplateModel::flux_at(const VectorXd& times, double peak_time, double peak_flux,
                                double width) const {
    check_params(peak_flux, width);
    const VectorXd rel = (times.array() - peak_time).matrix();
    return peak_flux * core::interp_linear(days_, rel_flux_, rel, 0.0);
}

} // namespace atclean::simulation
