#pragma once

#include "atclean/averaging/day_binning.hpp"
#include "atclean/config/configuration.hpp"
#include "atclean/core/events.hpp"
#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/chi_square_limits.hpp"
#include "atclean/cuts/control_consistency.hpp"
#include "atclean/cuts/cut_list.hpp"
#include "atclean/cuts/uncertainty.hpp"
#include "atclean/io/sninfo.hpp"

#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace atclean::pipeline {

using json = nlohmann::json;

struct CleanResult {
    std::optional<averaging::AveragedSupernova> averaged;
    std::optional<cuts::UncertEstResult> uncert_est;
    std::optional<cuts::ControlCutReport> controls;
    std::vector<cuts::LimCutsRow> limcuts;
    std::string limcuts_text;
    json summary = json::object();  // percentages per cut
};

struct ObjectResult {
    std::string tnsname;
    std::string filter;
    bool success = false;
    std::string status;
    std::string error;
    json summary = json::object();
};

// Applies the configured cuts in their declared order. Cuts of one light
// curve run strictly in sequence; objects run in parallel.
class CleaningPipeline {
public:
    CleaningPipeline(const config::Config& cfg, core::EventEmitter& emitter, std::string run_id,
                     std::ostream& log);

    const cuts::CutList& cut_list() const { return cut_list_; }

    // In memory; throws AlignmentError if the controls cannot be aligned
    CleanResult clean(core::Supernova& sn) const;

    // Load, clean and save one object in one filter. Failures are reported
    // in the result, never thrown.
    ObjectResult run_object(const std::string& tnsname, const std::string& filter,
                            const std::optional<io::SnInfo>& info) const;

    std::vector<ObjectResult> run(const std::vector<std::string>& tnsnames,
                                  io::SnInfoTable& sninfo) const;

private:
    Phase phase_of(const std::string& cut_name) const;

    const config::Config& cfg_;
    core::EventEmitter& emitter_;
    std::string run_id_;
    std::ostream& log_;
    cuts::CutList cut_list_;
    stats::SigmaClipOptions clip_options_;
};

// run_manifest.json: run id, configuration hash and per-object status
void write_manifest(const fs::path& path, const std::string& run_id, const std::string& command,
                    const std::string& config_sha256, const std::vector<ObjectResult>& results);

} // namespace atclean::pipeline
