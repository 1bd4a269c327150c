#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/simulation/injection_model.hpp"

#include <vector>

namespace atclean::simulation {

// Columns written by add_rolling_fom_columns()
namespace fomcol {
constexpr const char* SNR = "SNR";
constexpr const char* SNRSUM = "SNRsum";
constexpr const char* SNRSUMNORM = "SNRsumnorm";
constexpr const char* FLUXSIM = "uJysim";
constexpr const char* SNRSIM = "SNRsim";
constexpr const char* SNRSIMSUM = "SNRsimsum";
} // namespace fomcol

struct FomSeries {
    VectorXd snr;
    VectorXd sum;
    VectorXd norm;
    VectorXd normalized;
};

// Gaussian-weighted rolling sum of the signal-to-noise of a binned light
// curve. The kernel has sigma_kern / bin_size bins standard deviation and
// spans +-3 standard deviations.
class RollingFomEngine {
public:
    RollingFomEngine(double sigma_kern, double bin_size, Mask flags);

    double sigma_kern() const { return sigma_kern_; }
    int sigma_bins() const { return sigma_bins_; }
    int half_window() const { return half_window_; }
    const VectorXd& kernel() const { return kernel_; }

    // Rows with a time, finite flux, positive uncertainty and none of `flags`
    std::vector<bool> valid_rows(const core::LightCurve& lc) const;

    // flux / dflux on valid rows, 0 elsewhere
    VectorXd snr(const VectorXd& flux, const VectorXd& dflux, const std::vector<bool>& valid) const;
    // Same, with the light curve's injected flux added when present
    VectorXd snr(const core::LightCurve& lc, bool with_injection) const;

    VectorXd rolling_sum(const VectorXd& series) const;
    // Rolling sum of the validity indicator
    VectorXd norm(const std::vector<bool>& valid) const;

    // Full series; sum rescaled by norm and max(norm), 0 where norm is 0
    FomSeries apply(const VectorXd& snr, const std::vector<bool>& valid) const;
    FomSeries apply(const core::LightCurve& lc, bool with_injection = false) const;

    // Normalized FOM of rows first..last only
    VectorXd apply_range(const VectorXd& snr, const VectorXd& norm, double norm_max,
                         Eigen::Index first, Eigen::Index last) const;

private:
    double weighted_sum(const VectorXd& series, Eigen::Index i) const;

    double sigma_kern_;
    double bin_size_;
    Mask flags_;
    int sigma_bins_;
    int half_window_;
    VectorXd kernel_;
};

// Injected flux at `times` on the valid rows (zero elsewhere), stored as the
// target's injection state
void inject(core::Injectable& target, const VectorXd& times, const InjectionModel& model,
            double peak_mjd, double peak_flux, double width, const std::vector<bool>& valid);
void inject(core::LightCurve& lc, const InjectionModel& model, double peak_mjd, double peak_flux,
            double width, const std::vector<bool>& valid);

// Adds SNR, SNRsum and SNRsumnorm and, with an injection, uJysim, SNRsim and SNRsimsum
void add_rolling_fom_columns(core::LightCurve& lc, const RollingFomEngine& engine);

} // namespace atclean::simulation
