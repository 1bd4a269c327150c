#include "atclean/pipeline/simdetec.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/lc_table.hpp"
#include "atclean/io/text_table.hpp"
#include "atclean/simulation/rolling_fom.hpp"
#include "atclean/simulation/sim_tables.hpp"

#include <iostream>

namespace atclean::pipeline {

fs::path bump_analysis_dir(const fs::path& output_dir, const std::string& tnsname) {
    return output_dir / tnsname / "bump_analysis";
}

SimDetecPipeline::SimDetecPipeline(const config::Config& cfg, core::EventEmitter& emitter,
                                   std::string run_id, std::ostream& log)
    : cfg_(cfg),
      emitter_(emitter),
      run_id_(std::move(run_id)),
      log_(log),
      gaussian_(std::make_shared<simulation::GaussianModel>(
          cfg.simulation.gaussian.rise_scale, cfg.simulation.gaussian.decline_scale)) {}

bool SimDetecPipeline::needs_template() const {
    for (const auto& sims : cfg_.simulation.sigma_sims) {
        for (const auto& s : sims) {
            if (!s) return true;
        }
    }
    return false;
}

std::shared_ptr<const simulation::TemplateModel> SimDetecPipeline::template_model() const {
    if (!needs_template()) return nullptr;
    const auto& tc = cfg_.simulation.template_model;
    if (tc.filename.empty()) {
        throw ConfigError("simulation.sigma_sims selects the template but "
                          "simulation.template.filename is empty");
    }
    return std::make_shared<simulation::TemplateModel>(
        simulation::TemplateModel::load(tc.filename, tc.sigma));
}

core::Supernova SimDetecPipeline::load_averaged(const std::string& tnsname,
                                                const std::string& filter) const {
    io::LoadOptions load;
    load.filter = filter;
    load.num_controls = cfg_.input.num_controls;
    load.max_missing_controls = cfg_.input.max_missing_controls;
    load.bin_size = cfg_.cuts.averaging.mjd_bin_size;
    return io::load_supernova(cfg_.input.output_dir, tnsname, load);
}

void SimDetecPipeline::write_rolling_sums(core::Supernova& averaged) const {
    core::LightCurve& lc = averaged.transient();
    const fs::path dir = bump_analysis_dir(cfg_.input.output_dir, averaged.name());
    const std::string bin = core::format_double(cfg_.cuts.averaging.mjd_bin_size);

    for (double kern : cfg_.simulation.sigma_kerns) {
        const simulation::RollingFomEngine engine(kern, lc.bin_size(), cfg_.simulation.flags);
        simulation::add_rolling_fom_columns(lc, engine);

        io::TextTable table;
        table.header = {col::MJDBIN, col::MJD, col::FLUX, col::DFLUX, col::MASK,
                        simulation::fomcol::SNR, simulation::fomcol::SNRSUM,
                        simulation::fomcol::SNRSUMNORM};
        const VectorXd& snr = lc.column(simulation::fomcol::SNR);
        const VectorXd& sum = lc.column(simulation::fomcol::SNRSUM);
        const VectorXd& norm = lc.column(simulation::fomcol::SNRSUMNORM);
        for (size_t i = 0; i < lc.size(); ++i) {
            const auto k = static_cast<Eigen::Index>(i);
            table.rows.push_back({lc.cell_text(col::MJDBIN, i), lc.cell_text(col::MJD, i),
                                  lc.cell_text(col::FLUX, i), lc.cell_text(col::DFLUX, i),
                                  lc.cell_text(col::MASK, i), core::format_fixed(snr[k], 4),
                                  core::format_fixed(sum[k], 4), core::format_fixed(norm[k], 4)});
        }
        const fs::path path = dir / (averaged.name() + "." + averaged.filter() + "." + bin +
                                     "days.fom_" + core::format_double(kern) + ".txt");
        io::write_table(path, table, cfg_.input.overwrite);
        core::LogLine(std::cout) << "[ROLLING_SUM] " << averaged.name() << ": kernel " << kern
                                 << " days -> " << path.filename().string();
    }
    lc.drop_extra_columns();
}

simulation::SimDetecArena SimDetecPipeline::simulate(const core::Supernova& averaged) const {
    const auto& sc = cfg_.simulation;
    simulation::MonteCarloOptions options;
    options.iterations = sc.iterations;
    options.skip_controls = sc.skip_controls;
    options.seasons = sc.seasons;
    options.flags = sc.flags;
    options.max_redraws = sc.max_redraws;
    options.seed = sc.seed;
    options.parallel_workers = cfg_.runtime.parallel_workers;

    const simulation::MonteCarloDetector detector(averaged, gaussian_, template_model(), options);
    const auto peaks = simulation::generate_peaks(sc.peak_mag_min, sc.peak_mag_max, sc.n_peaks);
    const std::string label = averaged.name() + "." + averaged.filter();

    return detector.run(sc.sigma_kerns, sc.sigma_sims, peaks,
                        [&](size_t done, size_t total, const simulation::SimDetecTable& table) {
                            emitter_.phase_progress(run_id_, Phase::SIMULATION,
                                                    static_cast<int>(done),
                                                    static_cast<int>(total),
                                                    label + " " + table.key().to_string(), log_);
                        });
}

simulation::EfficiencyTable SimDetecPipeline::efficiencies(
    const simulation::SimDetecArena& arena) const {
    const auto& sc = cfg_.simulation;
    const auto peaks = simulation::generate_peaks(sc.peak_mag_min, sc.peak_mag_max, sc.n_peaks);
    std::optional<double> template_sigma;
    if (needs_template()) template_sigma = sc.template_model.sigma;

    simulation::EfficiencyTable table(sc.sigma_kerns, sc.sigma_sims, peaks, template_sigma);
    table.set_fom_limits(cfg_.efficiency.fom_limits);
    if (cfg_.efficiency.restrict_to_seasons) {
        table.compute(arena, sc.seasons);
    } else {
        table.compute(arena);
    }
    return table;
}

ObjectResult SimDetecPipeline::run_object(const std::string& tnsname, const std::string& filter,
                                          bool simulate_tables) const {
    ObjectResult out;
    out.tnsname = tnsname;
    out.filter = filter;
    const std::string label = tnsname + "." + filter;
    const fs::path tables_dir = bump_analysis_dir(cfg_.input.output_dir, tnsname) / "tables";

    try {
        simulation::SimDetecArena arena;
        if (simulate_tables) {
            emitter_.phase_start(run_id_, Phase::LOAD, label, log_);
            core::Supernova averaged = load_averaged(tnsname, filter);
            emitter_.phase_end(run_id_, Phase::LOAD, "ok",
                               {{"object", label}, {"controls", averaged.num_controls()}}, log_);

            emitter_.phase_start(run_id_, Phase::ROLLING_SUM, label, log_);
            write_rolling_sums(averaged);
            emitter_.phase_end(run_id_, Phase::ROLLING_SUM, "ok", {{"object", label}}, log_);

            emitter_.phase_start(run_id_, Phase::SIMULATION, label, log_);
            arena = simulate(averaged);
            simulation::save_simdetec_arena(arena, tables_dir);
            emitter_.phase_end(run_id_, Phase::SIMULATION, arena.complete() ? "ok" : "incomplete",
                               {{"object", label}, {"tables", arena.size()}}, log_);
            if (!arena.complete()) {
                emitter_.warning(run_id_, label + ": some simulation tables are incomplete", log_);
            }
            out.summary["simdetec_tables"] = arena.size();
            out.summary["simdetec_complete"] = arena.complete();
        } else {
            emitter_.phase_start(run_id_, Phase::LOAD, label, log_);
            const auto peaks = simulation::generate_peaks(cfg_.simulation.peak_mag_min,
                                                          cfg_.simulation.peak_mag_max,
                                                          cfg_.simulation.n_peaks);
            arena = simulation::load_simdetec_arena(tables_dir, cfg_.simulation.sigma_kerns,
                                                    peaks.appmags);
            emitter_.phase_end(run_id_, Phase::LOAD, "ok",
                               {{"object", label}, {"tables", arena.size()}}, log_);
        }

        emitter_.phase_start(run_id_, Phase::EFFICIENCY, label, log_);
        const simulation::EfficiencyTable table = efficiencies(arena);
        const fs::path eff_path = tables_dir / "efficiencies.txt";
        table.save(eff_path, cfg_.input.overwrite);
        core::LogLine(std::cout) << "[EFFICIENCY] " << label << ": " << table.rows().size()
                                 << " rows -> " << eff_path.string();
        emitter_.phase_end(run_id_, Phase::EFFICIENCY, "ok",
                           {{"object", label}, {"rows", table.rows().size()}}, log_);
        out.summary["efficiency_rows"] = table.rows().size();

        out.success = true;
        out.status = "ok";
    } catch (const std::exception& e) {
        out.success = false;
        out.status = "failed";
        out.error = e.what();
        core::LogLine(std::cerr) << "[SIMDETEC] " << label << " failed: " << e.what();
        emitter_.object_failed(run_id_, label, e.what(), log_);
    }
    return out;
}

} // namespace atclean::pipeline
