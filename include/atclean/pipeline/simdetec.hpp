#pragma once

#include "atclean/config/configuration.hpp"
#include "atclean/core/events.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/pipeline/cleaning.hpp"
#include "atclean/simulation/efficiency.hpp"
#include "atclean/simulation/monte_carlo.hpp"

#include <memory>
#include <ostream>
#include <string>

namespace atclean::pipeline {

// <output_dir>/<name>/bump_analysis
fs::path bump_analysis_dir(const fs::path& output_dir, const std::string& tnsname);

// Injection-recovery simulations and detection efficiencies on the averaged
// control light curves of one object
class SimDetecPipeline {
public:
    SimDetecPipeline(const config::Config& cfg, core::EventEmitter& emitter, std::string run_id,
                     std::ostream& log);

    core::Supernova load_averaged(const std::string& tnsname, const std::string& filter) const;

    // Rolling sum of the transient per kernel, written next to the tables
    void write_rolling_sums(core::Supernova& averaged) const;

    simulation::SimDetecArena simulate(const core::Supernova& averaged) const;
    simulation::EfficiencyTable efficiencies(const simulation::SimDetecArena& arena) const;

    // Full chain for one object; failures are reported in the result
    ObjectResult run_object(const std::string& tnsname, const std::string& filter,
                            bool simulate_tables) const;

private:
    std::shared_ptr<const simulation::TemplateModel> template_model() const;
    bool needs_template() const;

    const config::Config& cfg_;
    core::EventEmitter& emitter_;
    std::string run_id_;
    std::ostream& log_;
    std::shared_ptr<const simulation::GaussianModel> gaussian_;
};

} // namespace atclean::pipeline
