#include "atclean/simulation/monte_carlo.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <algorithm>
#include <atomic>
#include <cmath>
#include <exception>
#include <iostream>
#include <mutex>
#include <random>
#include <thread>

namespace atclean::simulation {

double SimDetecRecord::width() const {
    if (sigma_sim) return *sigma_sim;
    if (sim_erup_sigma) return *sim_erup_sigma;
    return kNaN;
}

std::string SimDetecKey::to_string() const {
    return core::format_double(sigma_kern) + "_" + core::format_fixed(peak_appmag, 2);
}

bool SimDetecKey::operator<(const SimDetecKey& other) const {
    if (sigma_kern != other.sigma_kern) return sigma_kern < other.sigma_kern;
    return core::round_to(peak_appmag, 2) < core::round_to(other.peak_appmag, 2);
}

void SimDetecArena::add(SimDetecTable table) {
    const SimDetecKey key = table.key();
    tables_[key] = std::move(table);
}

const SimDetecTable& SimDetecArena::get(const SimDetecKey& key) const {
    auto it = tables_.find(key);
    if (it == tables_.end()) {
        throw ValidationError("no simulation detection table " + key.to_string());
    }
    return it->second;
}

std::vector<SimDetecKey> SimDetecArena::keys() const {
    std::vector<SimDetecKey> out;
    out.reserve(tables_.size());
    for (const auto& [key, table] : tables_) out.push_back(key);
    return out;
}

bool SimDetecArena::complete() const {
    for (const auto& [key, table] : tables_) {
        if (!table.complete) return false;
    }
    return true;
}

PeakGrid generate_peaks(double mag_min, double mag_max, int n) {
    PeakGrid grid;
    const VectorXd mags = core::linspace(mag_min, mag_max, n);
    for (Eigen::Index i = 0; i < mags.size(); ++i) {
        grid.appmags.push_back(core::round_to(mags[i], 2));
        grid.fluxes.push_back(core::round_to(core::mag_to_flux(mags[i]), 2));
    }
    return grid;
}

MonteCarloDetector::MonteCarloDetector(const core::Supernova& averaged,
                                       std::shared_ptr<const GaussianModel> gaussian,
                                       std::shared_ptr<const TemplateModel> template_model,
                                       MonteCarloOptions options)
    : averaged_(averaged),
      gaussian_(std::move(gaussian)),
      template_(std::move(template_model)),
      options_(std::move(options)) {
    if (!gaussian_) {
        throw ConfigError("Monte Carlo detector needs a gaussian model");
    }
    if (options_.iterations <= 0) {
        throw ConfigError("simulation iterations must be > 0");
    }
    for (int idx : averaged_.control_indices()) {
        if (std::find(options_.skip_controls.begin(), options_.skip_controls.end(), idx) !=
            options_.skip_controls.end()) {
            continue;
        }
        const core::LightCurve& lc = averaged_.lc(idx);
        if (!lc.binned()) {
            throw ValidationError("control " + std::to_string(idx) + " of " + averaged_.name() +
                                  " is not binned");
        }
        if (lc.size() == 0) {
            throw DataInsufficientError("control " + std::to_string(idx) + " of " +
                                        averaged_.name() + " has no bins");
        }
        bin_size_ = lc.bin_size();
        controls_.push_back(idx);
    }
    if (controls_.empty()) {
        throw ConfigError("no control light curves left to simulate on");
    }
}

std::vector<MonteCarloDetector::ControlContext> MonteCarloDetector::make_contexts(
    const RollingFomEngine& engine) const {
    std::vector<ControlContext> contexts;
    for (int idx : controls_) {
        const core::LightCurve& lc = averaged_.lc(idx);
        ControlContext c;
        c.lc = lc;
        c.lc.clear_injection();
        c.mjd = lc.time();
        c.mjdbin = lc.bin_times();
        c.valid = engine.valid_rows(lc);
        c.norm = engine.norm(c.valid);
        c.norm_max = c.norm.maxCoeff();
        contexts.push_back(std::move(c));
    }
    return contexts;
}

SimDetecTable MonteCarloDetector::run_combination(double sigma_kern,
                                                  const std::vector<std::optional<double>>& sigma_sims,
                                                  double peak_appmag, double peak_flux,
                                                  uint64_t seed) const {
    if (sigma_sims.empty()) {
        throw ConfigError("no simulated widths for kernel " + core::format_double(sigma_kern));
    }
    for (const auto& s : sigma_sims) {
        if (!s && !template_) {
            throw ConfigError("a template width is requested but no template is loaded");
        }
    }

    const RollingFomEngine engine(sigma_kern, bin_size_, options_.flags);
    std::vector<ControlContext> contexts = make_contexts(engine);

    SimDetecTable table;
    table.sigma_kern = sigma_kern;
    table.peak_appmag = peak_appmag;
    table.peak_flux = peak_flux;
    table.records.reserve(static_cast<size_t>(options_.iterations));

    std::mt19937_64 rng(seed);
    std::uniform_int_distribution<size_t> pick_control(0, contexts.size() - 1);
    std::uniform_int_distribution<size_t> pick_width(0, sigma_sims.size() - 1);

    VectorXd snr_sim;
    for (int iter = 0; iter < options_.iterations; ++iter) {
        int redraws = 0;
        auto count_redraw = [&](const std::string& what) {
            if (++redraws > options_.max_redraws) {
                throw MonteCarloDrawError("trial " + std::to_string(iter) + " of " +
                                          SimDetecKey{sigma_kern, peak_appmag}.to_string() +
                                          " exceeded " + std::to_string(options_.max_redraws) +
                                          " redraws (" + what + ")");
            }
        };

        while (true) {
            ControlContext& c = contexts[pick_control(rng)];
            const Eigen::Index n = c.mjdbin.size();
            const double start = c.mjdbin[0] - 0.5 * bin_size_;
            const double stop = c.mjdbin[n - 1] + 0.5 * bin_size_;
            const auto n_days = std::max<long long>(1, static_cast<long long>(std::ceil(stop - start)));
            std::uniform_int_distribution<long long> pick_day(0, n_days - 1);

            double peak_mjd = start + static_cast<double>(pick_day(rng)) + 0.5;
            bool in_season = options_.seasons.empty() || in_any_season(options_.seasons, peak_mjd);
            while (!in_season) {
                count_redraw("peak outside observing seasons");
                peak_mjd = start + static_cast<double>(pick_day(rng)) + 0.5;
                in_season = in_any_season(options_.seasons, peak_mjd);
            }

            const std::optional<double>& width_choice = sigma_sims[pick_width(rng)];
            const InjectionModel& model =
                width_choice ? static_cast<const InjectionModel&>(*gaussian_) : *template_;
            const double width = width_choice ? *width_choice : template_->sigma();

            // Bins within one width of the peak
            const double* b = c.mjdbin.data();
            const Eigen::Index first = std::lower_bound(b, b + n, peak_mjd - width) - b;
            const Eigen::Index last = (std::upper_bound(b, b + n, peak_mjd + width) - b) - 1;
            bool any = false;
            for (Eigen::Index i = first; i <= last; ++i) {
                if (!std::isnan(c.mjd[i])) {
                    any = true;
                    break;
                }
            }
            if (!any) {
                count_redraw("no valid bins around the peak");
                continue;
            }

            inject(c.lc, model, peak_mjd, peak_flux, width, c.valid);
            snr_sim = engine.snr(c.lc, true);
            const VectorXd fom = engine.apply_range(snr_sim, c.norm, c.norm_max, first, last);

            SimDetecRecord rec;
            rec.control_index = c.lc.control_index();
            rec.peak_mjd = peak_mjd;
            if (width_choice) {
                rec.sigma_sim = width;
            } else {
                rec.sim_erup_sigma = width;
            }
            for (Eigen::Index i = first; i <= last; ++i) {
                if (std::isnan(c.mjd[i])) continue;
                const double v = fom[i - first];
                if (std::isnan(rec.max_fom) || v > rec.max_fom) {
                    rec.max_fom = v;
                    rec.max_fom_mjd = c.mjd[i];
                }
            }
            table.records.push_back(rec);
            break;
        }
    }
    return table;
}

SimDetecArena MonteCarloDetector::run(const std::vector<double>& sigma_kerns,
                                      const std::vector<std::vector<std::optional<double>>>& sigma_sims,
                                      const PeakGrid& peaks, const ProgressFn& progress) const {
    if (sigma_kerns.size() != sigma_sims.size()) {
        throw ConfigError("each entry in sigma_kerns needs a matching list in sigma_sims");
    }
    if (peaks.appmags.size() != peaks.fluxes.size()) {
        throw ConfigError("peak magnitudes and fluxes differ in length");
    }

    struct Combination {
        size_t kern_index;
        size_t peak_index;
    };
    std::vector<Combination> combos;
    for (size_t k = 0; k < sigma_kerns.size(); ++k) {
        for (size_t p = 0; p < peaks.appmags.size(); ++p) combos.push_back({k, p});
    }

    std::vector<SimDetecTable> results(combos.size());
    std::atomic<size_t> next{0};
    std::atomic<size_t> done{0};
    std::mutex mutex;
    std::exception_ptr first_error;

    auto process = [&](size_t ci) {
        const Combination& cb = combos[ci];
        const double kern = sigma_kerns[cb.kern_index];
        const double mag = peaks.appmags[cb.peak_index];
        const double flux = peaks.fluxes[cb.peak_index];
        try {
            results[ci] = run_combination(kern, sigma_sims[cb.kern_index], mag, flux,
                                          options_.seed + ci);
        } catch (const MonteCarloDrawError& e) {
            SimDetecTable t;
            t.sigma_kern = kern;
            t.peak_appmag = mag;
            t.peak_flux = flux;
            t.complete = false;
            t.incomplete_reason = e.what();
            results[ci] = std::move(t);
        } catch (...) {
            std::lock_guard<std::mutex> lock(mutex);
            if (!first_error) first_error = std::current_exception();
            return;
        }

        const size_t n_done = ++done;
        std::lock_guard<std::mutex> lock(mutex);
        core::LogLine(std::cout) << "[SIMDETEC] " << results[ci].key().to_string() << ": "
                                 << results[ci].records.size() << " trials"
                                 << (results[ci].complete ? "" : " (incomplete)");
        if (progress) progress(n_done, combos.size(), results[ci]);
    };

    const int workers_n = std::max(1, options_.parallel_workers);
    if (workers_n > 1 && combos.size() > 1) {
        std::vector<std::thread> workers;
        for (int w = 0; w < workers_n; ++w) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t ci = next.fetch_add(1);
                    if (ci >= combos.size()) break;
                    process(ci);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t ci = 0; ci < combos.size(); ++ci) process(ci);
    }

    if (first_error) std::rethrow_exception(first_error);

    SimDetecArena arena;
    for (auto& t : results) arena.add(std::move(t));
    return arena;
}

} // namespace atclean::simulation
