#include "atclean/config/configuration.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <cmath>
#include <fstream>
#include <set>
#include <sstream>

namespace atclean::config {

// Flags are written in hex ("0x800000") or as plain integers
static Mask read_flag(const YAML::Node& n, const std::string& key) {
    auto parsed = core::parse_mask(n.as<std::string>());
    if (!parsed) {
        throw ConfigError("invalid flag value for " + key + ": " + n.as<std::string>());
    }
    return *parsed;
}

static std::optional<double> read_sigma_sim(const YAML::Node& n) {
    if (n.IsNull()) return std::nullopt;
    const std::string s = core::to_lower(n.as<std::string>());
    if (s == "template" || s == "erup" || s == "null" || s == "none") return std::nullopt;
    return n.as<double>();
}

static std::optional<double> read_optional_double(const YAML::Node& n) {
    if (!n || n.IsNull()) return std::nullopt;
    return n.as<double>();
}

Config Config::load(const fs::path& path) {
    if (!fs::exists(path)) {
        throw ConfigError("Config file not found: " + path.string());
    }

    YAML::Node node;
    try {
        node = YAML::LoadFile(path.string());
    } catch (const YAML::Exception& e) {
        throw ConfigError("Cannot parse " + path.string() + ": " + e.what());
    }
    return from_yaml(node);
}

Config Config::from_yaml(const YAML::Node& node) {
    Config cfg;

    if (node["pipeline"]) {
        auto p = node["pipeline"];
        if (p["mode"]) cfg.pipeline.mode = p["mode"].as<std::string>();
        if (p["abort_on_fail"]) cfg.pipeline.abort_on_fail = p["abort_on_fail"].as<bool>();
    }

    if (node["input"]) {
        auto in = node["input"];
        if (in["lc_dir"]) cfg.input.lc_dir = in["lc_dir"].as<std::string>();
        if (in["output_dir"]) cfg.input.output_dir = in["output_dir"].as<std::string>();
        if (in["sninfo_file"]) cfg.input.sninfo_file = in["sninfo_file"].as<std::string>();
        if (in["filters"]) cfg.input.filters = in["filters"].as<std::vector<std::string>>();
        if (in["num_controls"]) cfg.input.num_controls = in["num_controls"].as<int>();
        if (in["max_missing_controls"]) cfg.input.max_missing_controls = in["max_missing_controls"].as<int>();
        if (in["overwrite"]) cfg.input.overwrite = in["overwrite"].as<bool>();
    }

    if (node["sigma_clip"]) {
        auto sc = node["sigma_clip"];
        if (sc["nsigma"]) cfg.sigma_clip.nsigma = sc["nsigma"].as<double>();
        if (sc["max_iterations"]) cfg.sigma_clip.max_iterations = sc["max_iterations"].as<int>();
        if (sc["median_first_iteration"]) cfg.sigma_clip.median_first_iteration = sc["median_first_iteration"].as<bool>();
    }

    if (node["cuts"]) {
        auto c = node["cuts"];

        if (c["uncert_est"]) {
            auto u = c["uncert_est"];
            if (u["enabled"]) cfg.cuts.uncert_est.enabled = u["enabled"].as<bool>();
            if (u["temp_x2_max_value"]) cfg.cuts.uncert_est.temp_x2_max_value = u["temp_x2_max_value"].as<double>();
            if (u["apply_min_sigma_extra"]) cfg.cuts.uncert_est.apply_min_sigma_extra = u["apply_min_sigma_extra"].as<double>();
        }

        if (c["uncert_cut"]) {
            auto u = c["uncert_cut"];
            if (u["enabled"]) cfg.cuts.uncert_cut.enabled = u["enabled"].as<bool>();
            if (u["max_value"]) cfg.cuts.uncert_cut.max_value = u["max_value"].as<double>();
            if (u["flag"]) cfg.cuts.uncert_cut.flag = read_flag(u["flag"], "cuts.uncert_cut.flag");
        }

        if (c["x2_cut"]) {
            auto x = c["x2_cut"];
            if (x["enabled"]) cfg.cuts.x2_cut.enabled = x["enabled"].as<bool>();
            if (x["max_value"]) cfg.cuts.x2_cut.max_value = x["max_value"].as<double>();
            if (x["flag"]) cfg.cuts.x2_cut.flag = read_flag(x["flag"], "cuts.x2_cut.flag");
            if (x["limcuts"]) {
                auto l = x["limcuts"];
                if (l["stn_bound"]) cfg.cuts.x2_cut.limcuts.stn_bound = l["stn_bound"].as<double>();
                if (l["cut_start"]) cfg.cuts.x2_cut.limcuts.cut_start = l["cut_start"].as<int>();
                if (l["cut_stop"]) cfg.cuts.x2_cut.limcuts.cut_stop = l["cut_stop"].as<int>();
                if (l["cut_step"]) cfg.cuts.x2_cut.limcuts.cut_step = l["cut_step"].as<int>();
            }
        }

        if (c["controls_cut"]) {
            auto cc = c["controls_cut"];
            auto& o = cfg.cuts.controls_cut;
            if (cc["enabled"]) o.enabled = cc["enabled"].as<bool>();
            if (cc["flag"]) o.flag = read_flag(cc["flag"], "cuts.controls_cut.flag");
            if (cc["questionable_flag"]) o.questionable_flag = read_flag(cc["questionable_flag"], "cuts.controls_cut.questionable_flag");
            if (cc["x2_flag"]) o.x2_flag = read_flag(cc["x2_flag"], "cuts.controls_cut.x2_flag");
            if (cc["stn_flag"]) o.stn_flag = read_flag(cc["stn_flag"], "cuts.controls_cut.stn_flag");
            if (cc["Nclip_flag"]) o.Nclip_flag = read_flag(cc["Nclip_flag"], "cuts.controls_cut.Nclip_flag");
            if (cc["Ngood_flag"]) o.Ngood_flag = read_flag(cc["Ngood_flag"], "cuts.controls_cut.Ngood_flag");
            if (cc["x2_max"]) o.x2_max = cc["x2_max"].as<double>();
            if (cc["stn_max"]) o.stn_max = cc["stn_max"].as<double>();
            if (cc["Nclip_max"]) o.Nclip_max = cc["Nclip_max"].as<int>();
            if (cc["Ngood_min"]) o.Ngood_min = cc["Ngood_min"].as<int>();
        }

        if (c["averaging"]) {
            auto a = c["averaging"];
            auto& o = cfg.cuts.averaging;
            if (a["enabled"]) o.enabled = a["enabled"].as<bool>();
            if (a["flag"]) o.flag = read_flag(a["flag"], "cuts.averaging.flag");
            if (a["ixclip_flag"]) o.ixclip_flag = read_flag(a["ixclip_flag"], "cuts.averaging.ixclip_flag");
            if (a["smallnum_flag"]) o.smallnum_flag = read_flag(a["smallnum_flag"], "cuts.averaging.smallnum_flag");
            if (a["nodata_flag"]) o.nodata_flag = read_flag(a["nodata_flag"], "cuts.averaging.nodata_flag");
            if (a["mjd_bin_size"]) o.mjd_bin_size = a["mjd_bin_size"].as<double>();
            if (a["x2_max"]) o.x2_max = a["x2_max"].as<double>();
            if (a["Nclip_max"]) o.Nclip_max = a["Nclip_max"].as<int>();
            if (a["Ngood_min"]) o.Ngood_min = a["Ngood_min"].as<int>();
            if (a["flux2mag_sigmalimit"]) o.flux2mag_sigmalimit = a["flux2mag_sigmalimit"].as<double>();
            if (a["empty_bin_policy"]) o.empty_bin_policy = string_to_empty_bin_policy(a["empty_bin_policy"].as<std::string>());
        }

        if (c["custom"] && c["custom"].IsSequence()) {
            for (const auto& item : c["custom"]) {
                CustomCutConfig cut;
                if (item["name"]) cut.name = item["name"].as<std::string>();
                if (item["column"]) cut.column = item["column"].as<std::string>();
                cut.min_value = read_optional_double(item["min_value"]);
                cut.max_value = read_optional_double(item["max_value"]);
                if (item["flag"]) cut.flag = read_flag(item["flag"], "cuts.custom.flag");
                if (item["precedes"]) cut.precedes = item["precedes"].as<std::string>();
                cfg.cuts.custom.push_back(cut);
            }
        }

        if (c["order"] && c["order"].IsSequence()) {
            for (const auto& edge : c["order"]) {
                if (!edge.IsSequence() || edge.size() != 2) {
                    throw ConfigError("cuts.order entries must be [before, after] pairs");
                }
                cfg.cuts.order.push_back({edge[0].as<std::string>(), edge[1].as<std::string>()});
            }
        }
    }

    if (node["simulation"]) {
        auto s = node["simulation"];
        auto& o = cfg.simulation;
        if (s["sigma_kerns"]) o.sigma_kerns = s["sigma_kerns"].as<std::vector<double>>();
        if (s["sigma_sims"]) {
            o.sigma_sims.clear();
            for (const auto& list : s["sigma_sims"]) {
                std::vector<std::optional<double>> sims;
                for (const auto& v : list) sims.push_back(read_sigma_sim(v));
                o.sigma_sims.push_back(sims);
            }
        }
        if (s["peak_mag_min"]) o.peak_mag_min = s["peak_mag_min"].as<double>();
        if (s["peak_mag_max"]) o.peak_mag_max = s["peak_mag_max"].as<double>();
        if (s["n_peaks"]) o.n_peaks = s["n_peaks"].as<int>();
        if (s["iterations"]) o.iterations = s["iterations"].as<int>();
        if (s["skip_controls"]) o.skip_controls = s["skip_controls"].as<std::vector<int>>();
        if (s["seasons"] && s["seasons"].IsSequence()) {
            o.seasons.clear();
            for (const auto& season : s["seasons"]) {
                if (!season.IsSequence() || season.size() != 2) {
                    throw ConfigError("simulation.seasons entries must be [start, end] pairs");
                }
                o.seasons.push_back({season[0].as<double>(), season[1].as<double>()});
            }
        }
        if (s["flags"]) o.flags = read_flag(s["flags"], "simulation.flags");
        if (s["max_redraws"]) o.max_redraws = s["max_redraws"].as<int>();
        if (s["seed"]) o.seed = s["seed"].as<uint64_t>();
        if (s["template"]) {
            auto t = s["template"];
            if (t["filename"]) o.template_model.filename = t["filename"].as<std::string>();
            if (t["sigma"]) o.template_model.sigma = t["sigma"].as<double>();
        }
        if (s["gaussian"]) {
            auto g = s["gaussian"];
            if (g["rise_scale"]) o.gaussian.rise_scale = g["rise_scale"].as<double>();
            if (g["decline_scale"]) o.gaussian.decline_scale = g["decline_scale"].as<double>();
        }
    }

    if (node["efficiency"]) {
        auto e = node["efficiency"];
        if (e["fom_limits"]) cfg.efficiency.fom_limits = e["fom_limits"].as<std::vector<std::vector<double>>>();
        if (e["restrict_to_seasons"]) cfg.efficiency.restrict_to_seasons = e["restrict_to_seasons"].as<bool>();
    }

    if (node["runtime"]) {
        auto r = node["runtime"];
        if (r["parallel_workers"]) cfg.runtime.parallel_workers = r["parallel_workers"].as<int>();
    }

    return cfg;
}

void Config::save(const fs::path& path) const {
    YAML::Node node = to_yaml();
    std::ofstream out(path);
    if (!out) {
        throw ConfigError("Cannot write config file: " + path.string());
    }
    out << node;
}

YAML::Node Config::to_yaml() const {
    YAML::Node node;

    node["pipeline"]["mode"] = pipeline.mode;
    node["pipeline"]["abort_on_fail"] = pipeline.abort_on_fail;

    node["input"]["lc_dir"] = input.lc_dir;
    node["input"]["output_dir"] = input.output_dir;
    node["input"]["sninfo_file"] = input.sninfo_file;
    node["input"]["filters"] = input.filters;
    node["input"]["num_controls"] = input.num_controls;
    node["input"]["max_missing_controls"] = input.max_missing_controls;
    node["input"]["overwrite"] = input.overwrite;

    node["sigma_clip"]["nsigma"] = sigma_clip.nsigma;
    node["sigma_clip"]["max_iterations"] = sigma_clip.max_iterations;
    node["sigma_clip"]["median_first_iteration"] = sigma_clip.median_first_iteration;

    auto c = node["cuts"];
    c["uncert_est"]["enabled"] = cuts.uncert_est.enabled;
    c["uncert_est"]["temp_x2_max_value"] = cuts.uncert_est.temp_x2_max_value;
    c["uncert_est"]["apply_min_sigma_extra"] = cuts.uncert_est.apply_min_sigma_extra;

    c["uncert_cut"]["enabled"] = cuts.uncert_cut.enabled;
    c["uncert_cut"]["max_value"] = cuts.uncert_cut.max_value;
    c["uncert_cut"]["flag"] = core::format_hex(cuts.uncert_cut.flag);

    c["x2_cut"]["enabled"] = cuts.x2_cut.enabled;
    c["x2_cut"]["max_value"] = cuts.x2_cut.max_value;
    c["x2_cut"]["flag"] = core::format_hex(cuts.x2_cut.flag);
    c["x2_cut"]["limcuts"]["stn_bound"] = cuts.x2_cut.limcuts.stn_bound;
    c["x2_cut"]["limcuts"]["cut_start"] = cuts.x2_cut.limcuts.cut_start;
    c["x2_cut"]["limcuts"]["cut_stop"] = cuts.x2_cut.limcuts.cut_stop;
    c["x2_cut"]["limcuts"]["cut_step"] = cuts.x2_cut.limcuts.cut_step;

    const auto& cc = cuts.controls_cut;
    c["controls_cut"]["enabled"] = cc.enabled;
    c["controls_cut"]["flag"] = core::format_hex(cc.flag);
    c["controls_cut"]["questionable_flag"] = core::format_hex(cc.questionable_flag);
    c["controls_cut"]["x2_flag"] = core::format_hex(cc.x2_flag);
    c["controls_cut"]["stn_flag"] = core::format_hex(cc.stn_flag);
    c["controls_cut"]["Nclip_flag"] = core::format_hex(cc.Nclip_flag);
    c["controls_cut"]["Ngood_flag"] = core::format_hex(cc.Ngood_flag);
    c["controls_cut"]["x2_max"] = cc.x2_max;
    c["controls_cut"]["stn_max"] = cc.stn_max;
    c["controls_cut"]["Nclip_max"] = cc.Nclip_max;
    c["controls_cut"]["Ngood_min"] = cc.Ngood_min;

    const auto& av = cuts.averaging;
    c["averaging"]["enabled"] = av.enabled;
    c["averaging"]["flag"] = core::format_hex(av.flag);
    c["averaging"]["ixclip_flag"] = core::format_hex(av.ixclip_flag);
    c["averaging"]["smallnum_flag"] = core::format_hex(av.smallnum_flag);
    c["averaging"]["nodata_flag"] = core::format_hex(av.nodata_flag);
    c["averaging"]["mjd_bin_size"] = av.mjd_bin_size;
    c["averaging"]["x2_max"] = av.x2_max;
    c["averaging"]["Nclip_max"] = av.Nclip_max;
    c["averaging"]["Ngood_min"] = av.Ngood_min;
    c["averaging"]["flux2mag_sigmalimit"] = av.flux2mag_sigmalimit;
    c["averaging"]["empty_bin_policy"] = empty_bin_policy_to_string(av.empty_bin_policy);

    for (const auto& cut : cuts.custom) {
        YAML::Node item;
        item["name"] = cut.name;
        item["column"] = cut.column;
        if (cut.min_value) item["min_value"] = *cut.min_value;
        if (cut.max_value) item["max_value"] = *cut.max_value;
        item["flag"] = core::format_hex(cut.flag);
        item["precedes"] = cut.precedes;
        c["custom"].push_back(item);
    }
    for (const auto& edge : cuts.order) {
        YAML::Node pair;
        pair.push_back(edge[0]);
        pair.push_back(edge[1]);
        c["order"].push_back(pair);
    }

    auto s = node["simulation"];
    s["sigma_kerns"] = simulation.sigma_kerns;
    for (const auto& list : simulation.sigma_sims) {
        YAML::Node sims;
        for (const auto& v : list) {
            if (v) {
                sims.push_back(*v);
            } else {
                sims.push_back("template");
            }
        }
        s["sigma_sims"].push_back(sims);
    }
    s["peak_mag_min"] = simulation.peak_mag_min;
    s["peak_mag_max"] = simulation.peak_mag_max;
    s["n_peaks"] = simulation.n_peaks;
    s["iterations"] = simulation.iterations;
    s["skip_controls"] = simulation.skip_controls;
    for (const auto& season : simulation.seasons) {
        YAML::Node pair;
        pair.push_back(season.start);
        pair.push_back(season.end);
        s["seasons"].push_back(pair);
    }
    s["flags"] = core::format_hex(simulation.flags);
    s["max_redraws"] = simulation.max_redraws;
    s["seed"] = simulation.seed;
    s["template"]["filename"] = simulation.template_model.filename;
    s["template"]["sigma"] = simulation.template_model.sigma;
    s["gaussian"]["rise_scale"] = simulation.gaussian.rise_scale;
    s["gaussian"]["decline_scale"] = simulation.gaussian.decline_scale;

    node["efficiency"]["fom_limits"] = efficiency.fom_limits;
    node["efficiency"]["restrict_to_seasons"] = efficiency.restrict_to_seasons;

    node["runtime"]["parallel_workers"] = runtime.parallel_workers;

    return node;
}

void Config::validate() const {
    if (pipeline.mode != "production" && pipeline.mode != "test") {
        throw ValidationError("pipeline.mode must be 'production' or 'test'");
    }

    if (input.filters.empty()) {
        throw ValidationError("input.filters must not be empty");
    }
    for (const auto& f : input.filters) {
        if (f != "o" && f != "c") {
            throw ValidationError("input.filters entries must be 'o' or 'c'");
        }
    }
    if (input.num_controls < 0) {
        throw ValidationError("input.num_controls must be >= 0");
    }
    if (input.max_missing_controls < 0) {
        throw ValidationError("input.max_missing_controls must be >= 0");
    }

    if (!(sigma_clip.nsigma > 0.0)) {
        throw ValidationError("sigma_clip.nsigma must be > 0");
    }
    if (sigma_clip.max_iterations < 1) {
        throw ValidationError("sigma_clip.max_iterations must be >= 1");
    }

    if (!(cuts.uncert_est.temp_x2_max_value > 0.0)) {
        throw ValidationError("cuts.uncert_est.temp_x2_max_value must be > 0");
    }
    if (!(cuts.uncert_cut.max_value > 0.0)) {
        throw ValidationError("cuts.uncert_cut.max_value must be > 0");
    }
    if (!(cuts.x2_cut.max_value > 0.0)) {
        throw ValidationError("cuts.x2_cut.max_value must be > 0");
    }
    const auto& lim = cuts.x2_cut.limcuts;
    if (lim.cut_step < 1 || lim.cut_stop < lim.cut_start) {
        throw ValidationError("cuts.x2_cut.limcuts must satisfy cut_step >= 1 and cut_stop >= cut_start");
    }
    if (cuts.controls_cut.Ngood_min < 0 || cuts.controls_cut.Nclip_max < 0) {
        throw ValidationError("cuts.controls_cut.Ngood_min/Nclip_max must be >= 0");
    }
    if (!(cuts.averaging.mjd_bin_size > 0.0)) {
        throw ValidationError("cuts.averaging.mjd_bin_size must be > 0");
    }
    if (cuts.averaging.Ngood_min < 0 || cuts.averaging.Nclip_max < 0) {
        throw ValidationError("cuts.averaging.Ngood_min/Nclip_max must be >= 0");
    }

    std::set<std::string> names;
    for (const auto& cut : cuts.custom) {
        if (cut.name.empty()) {
            throw ValidationError("cuts.custom entries must have a name");
        }
        if (!names.insert(cut.name).second) {
            throw ValidationError("cuts.custom name '" + cut.name + "' is used twice");
        }
    }

    if (simulation.sigma_kerns.size() != simulation.sigma_sims.size()) {
        throw ConfigError("each entry in simulation.sigma_kerns must have a matching list in simulation.sigma_sims");
    }
    for (double k : simulation.sigma_kerns) {
        if (!(k > 0.0)) throw ValidationError("simulation.sigma_kerns entries must be > 0");
    }
    bool uses_template = false;
    for (const auto& list : simulation.sigma_sims) {
        for (const auto& v : list) {
            if (!v) {
                uses_template = true;
            } else if (!(*v > 0.0)) {
                throw ValidationError("simulation.sigma_sims entries must be > 0");
            }
        }
    }
    if (uses_template && simulation.template_model.filename.empty()) {
        throw ConfigError("simulation.sigma_sims selects the template but simulation.template.filename is empty");
    }
    if (simulation.n_peaks < 1) {
        throw ValidationError("simulation.n_peaks must be >= 1");
    }
    if (simulation.iterations < 1) {
        throw ValidationError("simulation.iterations must be >= 1");
    }
    if (simulation.max_redraws < 1) {
        throw ValidationError("simulation.max_redraws must be >= 1");
    }
    for (const auto& season : simulation.seasons) {
        if (season.end < season.start) {
            throw ValidationError("simulation.seasons entries must satisfy start <= end");
        }
    }

    if (!efficiency.fom_limits.empty() &&
        efficiency.fom_limits.size() != simulation.sigma_kerns.size()) {
        throw ConfigError("each entry in simulation.sigma_kerns must have a matching list in efficiency.fom_limits");
    }

    if (runtime.parallel_workers < 1) {
        throw ValidationError("runtime.parallel_workers must be >= 1");
    }
}

} // namespace atclean::config
