#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/simulation/injection_model.hpp"
#include "atclean/simulation/rolling_fom.hpp"

#include <cstdint>
#include <functional>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace atclean::simulation {

// One Monte Carlo trial
struct SimDetecRecord {
    int control_index = 0;
    double peak_mjd = kNaN;
    std::optional<double> sigma_sim;       // gaussian width
    std::optional<double> sim_erup_sigma;  // template width
    double max_fom = kNaN;
    double max_fom_mjd = kNaN;

    // Width of whichever profile was injected
    double width() const;
    bool is_template() const { return sim_erup_sigma.has_value(); }
};

struct SimDetecKey {
    double sigma_kern = 0.0;
    double peak_appmag = 0.0;

    // "<kern>_<mag with 2 decimals>"
    std::string to_string() const;
    bool operator<(const SimDetecKey& other) const;
};

// Trials of one (kernel width, peak brightness) combination
struct SimDetecTable {
    double sigma_kern = 0.0;
    double peak_appmag = 0.0;
    double peak_flux = 0.0;
    std::vector<SimDetecRecord> records;
    bool complete = true;
    std::string incomplete_reason;

    SimDetecKey key() const { return {sigma_kern, peak_appmag}; }
    std::string filename() const { return "simdetec_" + key().to_string() + ".txt"; }
};

// Tables keyed by (kernel width, peak brightness)
class SimDetecArena {
public:
    void add(SimDetecTable table);
    bool has(const SimDetecKey& key) const { return tables_.count(key) > 0; }
    const SimDetecTable& get(const SimDetecKey& key) const;
    std::vector<SimDetecKey> keys() const;
    size_t size() const { return tables_.size(); }
    bool complete() const;

    const std::map<SimDetecKey, SimDetecTable>& tables() const { return tables_; }

private:
    std::map<SimDetecKey, SimDetecTable> tables_;
};

struct PeakGrid {
    std::vector<double> appmags;
    std::vector<double> fluxes;
};

// Magnitudes linearly spaced from mag_min to mag_max, rounded to 0.01
PeakGrid generate_peaks(double mag_min, double mag_max, int n);

struct MonteCarloOptions {
    int iterations = 50000;
    std::vector<int> skip_controls;
    std::vector<Season> seasons;  // empty: whole light curve
    Mask flags = 0x800000;
    int max_redraws = 1000;       // per trial
    uint64_t seed = 42;
    int parallel_workers = 4;
};

class MonteCarloDetector {
public:
    using ProgressFn = std::function<void(size_t done, size_t total, const SimDetecTable&)>;

    // `averaged` holds the binned control light curves; `template_model` may
    // be null when no width list selects the template
    MonteCarloDetector(const core::Supernova& averaged, std::shared_ptr<const GaussianModel> gaussian,
                       std::shared_ptr<const TemplateModel> template_model,
                       MonteCarloOptions options);

    std::vector<int> valid_controls() const { return controls_; }

    // All (kernel, peak) combinations in parallel; combination i uses seed + i
    SimDetecArena run(const std::vector<double>& sigma_kerns,
                      const std::vector<std::vector<std::optional<double>>>& sigma_sims,
                      const PeakGrid& peaks, const ProgressFn& progress = {}) const;

    // One combination. Throws MonteCarloDrawError when a trial exceeds the
    // redraw cap.
    SimDetecTable run_combination(double sigma_kern, const std::vector<std::optional<double>>& sigma_sims,
                                  double peak_appmag, double peak_flux, uint64_t seed) const;

private:
    // Working copy of one control light curve; trials replace its injection
    struct ControlContext {
        core::LightCurve lc;
        VectorXd mjd;
        VectorXd mjdbin;
        std::vector<bool> valid;
        VectorXd norm;
        double norm_max = 0.0;
    };

    std::vector<ControlContext> make_contexts(const RollingFomEngine& engine) const;

    const core::Supernova& averaged_;
    std::shared_ptr<const GaussianModel> gaussian_;
    std::shared_ptr<const TemplateModel> template_;
    MonteCarloOptions options_;
    std::vector<int> controls_;
    double bin_size_ = 1.0;
};

} // namespace atclean::simulation
