#pragma once

#include "atclean/core/types.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <string>

namespace atclean::simulation {

// Flux-vs-time profile added to a light curve for injection-recovery tests
class InjectionModel {
public:
    virtual ~InjectionModel() = default;

    virtual std::string name() const = 0;

    // Flux in uJy at `times` for a profile peaking at `peak_time` with
    // `peak_flux`. Throws ValidationError for peak_flux <= 0 or width <= 0.
    virtual VectorXd flux_at(const VectorXd& times, double peak_time, double peak_flux,
                             double width) const = 0;
};

// Gaussian with separate widths before and after the peak (width * scale)
class GaussianModel : public InjectionModel {
public:
    explicit GaussianModel(double rise_scale = 1.0, double decline_scale = 1.0);

    std::string name() const override { return "gaussian"; }
    VectorXd flux_at(const VectorXd& times, double peak_time, double peak_flux,
                     double width) const override;

    static constexpr double kProfileStep = 0.01;  // days
    static constexpr double kMinHalfSpan = 100.0;  // days

private:
    struct Profile {
        VectorXd x;  // days from peak
        VectorXd y;  // unit peak
    };

    std::shared_ptr<const Profile> profile(double width) const;

    double rise_scale_;
    double decline_scale_;
    mutable std::mutex mutex_;
    mutable std::map<double, std::shared_ptr<const Profile>> profiles_;
};

// Empirical light curve (MJD, magnitude) shifted so its brightest point
// lands on the requested peak and scaled to the requested peak flux
class TemplateModel : public InjectionModel {
public:
    TemplateModel(VectorXd mjd, VectorXd mag, double sigma = 2.8);

    // Two whitespace separated columns without header: MJD and magnitude
    static TemplateModel load(const fs::path& path, double sigma = 2.8);

    std::string name() const override { return "template"; }
    VectorXd flux_at(const VectorXd& times, double peak_time, double peak_flux,
                     double width) const override;

    // Characteristic width recorded for trials with this template
    double sigma() const { return sigma_; }
    size_t size() const { return static_cast<size_t>(days_.size()); }

private:
    VectorXd days_;      // relative to the brightest point
    VectorXd rel_flux_;  // flux / peak flux
    double sigma_;
};

} // namespace atclean::simulation
