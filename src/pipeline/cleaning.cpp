#include "atclean/pipeline/cleaning.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/cuts/cut_engine.hpp"
#include "atclean/io/lc_table.hpp"

#include <algorithm>
#include <atomic>
#include <iostream>
#include <mutex>
#include <thread>

namespace atclean::pipeline {

namespace {

stats::SigmaClipOptions clip_options_from(const config::Config& cfg) {
    stats::SigmaClipOptions o;
    o.nsigma = cfg.sigma_clip.nsigma;
    o.max_iterations = cfg.sigma_clip.max_iterations;
    o.median_first_iteration = cfg.sigma_clip.median_first_iteration;
    return o;
}

averaging::DayBinningOptions binning_options_from(const config::Config& cfg) {
    const auto& av = cfg.cuts.averaging;
    averaging::DayBinningOptions o;
    o.mjd_bin_size = av.mjd_bin_size;
    o.x2_max = av.x2_max;
    o.Nclip_max = av.Nclip_max;
    o.Ngood_min = av.Ngood_min;
    o.flux2mag_sigmalimit = av.flux2mag_sigmalimit;
    o.empty_bin_policy = av.empty_bin_policy;
    return o;
}

std::string object_label(const std::string& tnsname, const std::string& filter) {
    return tnsname + "." + filter;
}

} // namespace

CleaningPipeline::CleaningPipeline(const config::Config& cfg, core::EventEmitter& emitter,
                                   std::string run_id, std::ostream& log)
    : cfg_(cfg),
      emitter_(emitter),
      run_id_(std::move(run_id)),
      log_(log),
      cut_list_(cuts::make_cut_list(cfg)),
      clip_options_(clip_options_from(cfg)) {}

Phase CleaningPipeline::phase_of(const std::string& cut_name) const {
    if (cut_name == cuts::UNCERT_EST) return Phase::UNCERT_EST;
    if (cut_name == cuts::UNCERT_CUT) return Phase::UNCERT_CUT;
    if (cut_name == cuts::X2_CUT) return Phase::X2_CUT;
    if (cut_name == cuts::CONTROLS_CUT) return Phase::CONTROLS_CUT;
    if (cut_name == cuts::BADDAY_CUT) return Phase::AVERAGING;
    return Phase::CUSTOM_CUTS;
}

CleanResult CleaningPipeline::clean(core::Supernova& sn) const {
    CleanResult result;
    const std::string label = object_label(sn.name(), sn.filter());

    emitter_.phase_start(run_id_, Phase::PREPARE, label, log_);
    core::prepare_for_cleaning(sn);
    emitter_.phase_end(run_id_, Phase::PREPARE, "ok",
                       {{"object", label},
                        {"rows", sn.transient().size()},
                        {"controls", sn.num_controls()}},
                       log_);

    const Mask uncert_cut_flag =
        cut_list_.has(cuts::UNCERT_CUT) ? cut_list_.get(cuts::UNCERT_CUT).flag : 0;

    for (const std::string& name : cut_list_.application_order()) {
        const cuts::Cut& cut = cut_list_.get(name);
        const Phase phase = phase_of(name);
        emitter_.phase_start(run_id_, phase, label, log_);
        json extra{{"object", label}, {"cut", name}};

        if (name == cuts::UNCERT_EST) {
            if (sn.num_controls() == 0) {
                emitter_.warning(run_id_, label + ": no control light curves, skipping uncertainty estimate", log_);
                emitter_.phase_end(run_id_, phase, "skipped", extra, log_);
                continue;
            }
            auto est = cuts::apply_uncert_est(sn, cut, uncert_cut_flag, clip_options_);
            extra["sigma_extra"] = est.sigma_extra;
            extra["applied"] = est.applied;
            core::LogLine(std::cout) << "[UNCERT_EST] " << label << ": sigma_extra = "
                                     << core::format_fixed(est.sigma_extra, 2)
                                     << (est.applied ? " (applied)" : " (not applied)");
            result.summary[name] = {{"sigma_extra", est.sigma_extra}, {"applied", est.applied}};
            result.uncert_est = std::move(est);
        } else if (name == cuts::CONTROLS_CUT) {
            if (sn.num_controls() == 0) {
                emitter_.warning(run_id_, label + ": no control light curves, skipping controls cut", log_);
                emitter_.phase_end(run_id_, phase, "skipped", extra, log_);
                continue;
            }
            const cuts::ControlConsistencyAnalyzer analyzer(cut, clip_options_);
            const auto report = analyzer.apply(sn, cut_list_.get_previous_flags(name));
            extra["percent"] = report.percent;
            extra["questionable_percent"] = report.questionable_percent;
            core::LogLine(std::cout) << "[CONTROLS_CUT] " << label << ": "
                                     << core::format_fixed(report.percent, 2) << "% cut, "
                                     << core::format_fixed(report.questionable_percent, 2)
                                     << "% questionable";
            result.summary[name] = {{"percent", report.percent},
                                    {"x2_percent", report.x2_percent},
                                    {"stn_percent", report.stn_percent},
                                    {"Nclip_percent", report.Nclip_percent},
                                    {"Ngood_percent", report.Ngood_percent},
                                    {"questionable_percent", report.questionable_percent}};
            result.controls = report;
        } else if (name == cuts::BADDAY_CUT) {
            const averaging::DayBinningAverager averager(cut, binning_options_from(cfg_), clip_options_);
            auto avg = averaging::average_supernova(sn, averager, cut_list_.get_previous_flags(name));
            extra["percent"] = avg.percent;
            core::LogLine(std::cout) << "[AVERAGING] " << label << ": "
                                     << core::format_fixed(avg.percent, 2) << "% of bins flagged";
            result.summary[name] = {{"percent", avg.percent}};
            result.averaged = std::move(avg);
        } else {
            if (name == cuts::X2_CUT) {
                const core::LightCurve& lc = sn.transient();
                cuts::LimCutsTable limcuts(lc, cut.param("stn_bound"), lc.ix_unmasked(uncert_cut_flag));
                limcuts.calculate_table(static_cast<int>(cut.param("cut_start")),
                                        static_cast<int>(cut.param("cut_stop")),
                                        static_cast<int>(cut.param("cut_step")));
                result.limcuts = limcuts.rows();
                result.limcuts_text = limcuts.to_text();
            }
            const double percent = cuts::apply_cut(cut, sn);
            extra["percent"] = percent;
            core::LogLine(std::cout) << "[" << phase_to_string(phase) << "] " << label << ": "
                                     << name << " " << core::format_fixed(percent, 2) << "% cut";
            result.summary[name] = {{"percent", percent}};
        }
        emitter_.phase_end(run_id_, phase, "ok", extra, log_);
    }
    return result;
}

ObjectResult CleaningPipeline::run_object(const std::string& tnsname, const std::string& filter,
                                          const std::optional<io::SnInfo>& info) const {
    ObjectResult out;
    out.tnsname = tnsname;
    out.filter = filter;
    const std::string label = object_label(tnsname, filter);

    try {
        emitter_.phase_start(run_id_, Phase::LOAD, label, log_);
        io::LoadOptions load;
        load.filter = filter;
        load.num_controls = cfg_.input.num_controls;
        load.max_missing_controls = cfg_.input.max_missing_controls;
        core::Supernova sn = io::load_supernova(cfg_.input.lc_dir, tnsname, load);
        if (info) {
            if (!info->coords.is_empty()) sn.set_coords(info->coords);
            sn.set_mjd0(info->mjd0);
        }
        emitter_.phase_end(run_id_, Phase::LOAD, "ok",
                           {{"object", label}, {"controls", sn.num_controls()}}, log_);

        CleanResult cleaned = clean(sn);
        out.summary = cleaned.summary;

        emitter_.phase_start(run_id_, Phase::SAVE, label, log_);
        const fs::path out_dir = cfg_.input.output_dir;
        io::save_supernova(sn, out_dir, cfg_.input.overwrite, true);
        if (cleaned.averaged) {
            io::save_supernova(cleaned.averaged->sn, out_dir, cfg_.input.overwrite, false,
                               cfg_.cuts.averaging.mjd_bin_size);
        }
        if (!cleaned.limcuts_text.empty()) {
            const fs::path limcuts_path =
                out_dir / tnsname / (tnsname + "." + filter + ".limcuts.txt");
            fs::create_directories(limcuts_path.parent_path());
            core::write_text(limcuts_path, cleaned.limcuts_text);
            out.summary["limcuts_rows"] = cleaned.limcuts.size();
        }
        emitter_.phase_end(run_id_, Phase::SAVE, "ok", {{"object", label}}, log_);

        out.success = true;
        out.status = "ok";
    } catch (const std::exception& e) {
        out.success = false;
        out.status = "failed";
        out.error = e.what();
        core::LogLine(std::cerr) << "[CLEAN] " << label << " failed: " << e.what();
        emitter_.object_failed(run_id_, label, e.what(), log_);
    }
    return out;
}

std::vector<ObjectResult> CleaningPipeline::run(const std::vector<std::string>& tnsnames,
                                                io::SnInfoTable& sninfo) const {
    struct Job {
        std::string tnsname;
        std::string filter;
        std::optional<io::SnInfo> info;
    };
    std::vector<Job> jobs;
    for (const auto& name : tnsnames) {
        const auto info = sninfo.get(name);
        for (const auto& filter : cfg_.input.filters) jobs.push_back({name, filter, info});
    }

    std::vector<ObjectResult> results(jobs.size());
    std::atomic<size_t> next{0};
    std::atomic<bool> abort{false};
    std::atomic<size_t> done{0};

    auto process = [&](size_t ji) {
        if (abort.load()) {
            results[ji] = {jobs[ji].tnsname, jobs[ji].filter, false, "skipped", "batch aborted", json::object()};
            return;
        }
        results[ji] = run_object(jobs[ji].tnsname, jobs[ji].filter, jobs[ji].info);
        if (!results[ji].success && cfg_.pipeline.abort_on_fail) abort.store(true);
        const size_t n_done = ++done;
        emitter_.phase_progress(run_id_, Phase::DONE, static_cast<int>(n_done),
                                static_cast<int>(jobs.size()), "objects", log_);
    };

    const int parallel = std::max(1, cfg_.runtime.parallel_workers);
    if (parallel > 1 && jobs.size() > 1) {
        core::LogLine(std::cout) << "[CLEAN] Processing " << jobs.size()
                                 << " light curve sets with " << parallel << " workers";
        std::vector<std::thread> workers;
        for (int w = 0; w < parallel; ++w) {
            workers.emplace_back([&]() {
                while (true) {
                    size_t ji = next.fetch_add(1);
                    if (ji >= jobs.size()) break;
                    process(ji);
                }
            });
        }
        for (auto& worker : workers) {
            worker.join();
        }
    } else {
        for (size_t ji = 0; ji < jobs.size(); ++ji) process(ji);
    }
    return results;
}

void write_manifest(const fs::path& path, const std::string& run_id, const std::string& command,
                    const std::string& config_sha256, const std::vector<ObjectResult>& results) {
    json objects = json::array();
    for (const auto& r : results) {
        json o{{"tnsname", r.tnsname},
               {"filter", r.filter},
               {"success", r.success},
               {"status", r.status},
               {"summary", r.summary}};
        if (!r.error.empty()) o["error"] = r.error;
        objects.push_back(std::move(o));
    }
    const json manifest{{"run_id", run_id},
                        {"command", command},
                        {"created", core::get_iso_timestamp()},
                        {"config_sha256", config_sha256},
                        {"objects", objects}};
    core::write_text(path, manifest.dump(2) + "\n");
}

} // namespace atclean::pipeline
