#include "atclean/simulation/efficiency.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/text_table.hpp"

#include <algorithm>
#include <cmath>
#include <iostream>

namespace atclean::simulation {

namespace {

const char* kPctPrefix = "pct_detec_";

bool same_limit(double a, double b) {
    return core::round_to(a, 2) == core::round_to(b, 2);
}

std::string opt_text(const std::optional<double>& v) {
    return v ? core::format_double(*v) : "NaN";
}

} // namespace

std::optional<double> efficiency(const std::vector<SimDetecRecord>& records, double fom_limit,
                                 std::optional<double> width, bool template_width,
                                 const std::vector<Season>& seasons) {
    size_t total = 0;
    size_t detected = 0;
    for (const auto& r : records) {
        if (width) {
            const auto& w = template_width ? r.sim_erup_sigma : r.sigma_sim;
            if (!w || *w != *width) continue;
        }
        if (!seasons.empty() && !in_any_season(seasons, r.peak_mjd)) continue;
        ++total;
        if (r.max_fom >= fom_limit) ++detected;
    }
    if (total == 0) return std::nullopt;
    return static_cast<double>(detected) / static_cast<double>(total);
}

std::string pct_detec_column(double fom_limit) {
    return kPctPrefix + core::format_fixed(fom_limit, 2);
}

EfficiencyTable::EfficiencyTable(const std::vector<double>& sigma_kerns,
                                 const std::vector<std::vector<std::optional<double>>>& sigma_sims,
                                 const PeakGrid& peaks, std::optional<double> template_sigma)
    : sigma_kerns_(sigma_kerns) {
    if (sigma_kerns.size() != sigma_sims.size()) {
        throw ConfigError("each entry in sigma_kerns needs a matching list in sigma_sims");
    }
    if (peaks.appmags.size() != peaks.fluxes.size()) {
        throw ConfigError("peak magnitudes and fluxes differ in length");
    }
    for (size_t k = 0; k < sigma_kerns.size(); ++k) {
        for (size_t p = 0; p < peaks.appmags.size(); ++p) {
            for (const auto& s : sigma_sims[k]) {
                EfficiencyRow row;
                row.sigma_kern = sigma_kerns[k];
                row.peak_appmag = peaks.appmags[p];
                row.peak_flux = peaks.fluxes[p];
                if (s) {
                    row.sigma_sim = s;
                } else {
                    if (!template_sigma) {
                        throw ConfigError("template width requested but no template sigma given");
                    }
                    row.sim_erup_sigma = template_sigma;
                }
                rows_.push_back(row);
            }
        }
    }
}

void EfficiencyTable::add_limit_column(double limit) {
    for (double l : limit_columns_) {
        if (same_limit(l, limit)) return;
    }
    limit_columns_.push_back(limit);
}

void EfficiencyTable::set_fom_limits(const std::vector<std::vector<double>>& fom_limits) {
    if (fom_limits.size() != sigma_kerns_.size()) {
        throw ConfigError("each entry in sigma_kerns needs a matching list in fom_limits");
    }
    fom_limits_.clear();
    limit_columns_.clear();
    for (size_t k = 0; k < sigma_kerns_.size(); ++k) {
        fom_limits_[sigma_kerns_[k]] = fom_limits[k];
        for (double l : fom_limits[k]) add_limit_column(l);
    }
    for (auto& row : rows_) row.pct_detec.clear();
}

const std::vector<double>& EfficiencyTable::fom_limits(double sigma_kern) const {
    auto it = fom_limits_.find(sigma_kern);
    if (it == fom_limits_.end()) {
        throw ConfigError("no FOM limits for kernel " + core::format_double(sigma_kern));
    }
    return it->second;
}

void EfficiencyTable::compute(const SimDetecArena& arena, const std::vector<Season>& seasons) {
    if (fom_limits_.empty()) {
        throw ConfigError("FOM limits are not set");
    }
    for (auto& row : rows_) {
        const SimDetecTable& t = arena.get({row.sigma_kern, row.peak_appmag});
        if (!t.complete) {
            core::LogLine(std::cout) << "[EFFICIENCY] WARNING: " << t.key().to_string()
                                     << " is incomplete: " << t.incomplete_reason;
        }
        const bool erup = row.is_template();
        const std::optional<double> width = erup ? row.sim_erup_sigma : row.sigma_sim;
        for (double limit : fom_limits(row.sigma_kern)) {
            const auto e = efficiency(t.records, limit, width, erup, seasons);
            row.pct_detec[core::round_to(limit, 2)] = e ? 100.0 * *e : kNaN;
        }
    }
}

EfficiencyTable EfficiencyTable::subset(std::optional<double> sigma_kern,
                                        std::optional<double> fom_limit,
                                        std::optional<double> sigma_sim, bool erup) const {
    EfficiencyTable out;
    out.sigma_kerns_ = sigma_kerns_;
    out.fom_limits_ = fom_limits_;
    if (fom_limit) {
        bool known = false;
        for (double l : limit_columns_) known = known || same_limit(l, *fom_limit);
        if (!known) {
            throw ConfigError("no FOM limit " + core::format_fixed(*fom_limit, 2) + " in table");
        }
        out.limit_columns_ = {*fom_limit};
    } else {
        out.limit_columns_ = limit_columns_;
    }

    for (const auto& row : rows_) {
        if (sigma_kern && row.sigma_kern != *sigma_kern) continue;
        if (sigma_sim) {
            const auto& w = erup ? row.sim_erup_sigma : row.sigma_sim;
            if (!w || *w != *sigma_sim) continue;
        }
        EfficiencyRow r = row;
        if (fom_limit) {
            r.pct_detec.clear();
            auto it = row.pct_detec.find(core::round_to(*fom_limit, 2));
            if (it != row.pct_detec.end()) r.pct_detec.insert(*it);
        }
        out.rows_.push_back(std::move(r));
    }
    return out;
}

void EfficiencyTable::merge(const EfficiencyTable& other) {
    for (double k : other.sigma_kerns_) {
        if (std::find(sigma_kerns_.begin(), sigma_kerns_.end(), k) == sigma_kerns_.end()) {
            sigma_kerns_.push_back(k);
        }
    }
    for (const auto& [k, limits] : other.fom_limits_) fom_limits_[k] = limits;
    for (double l : other.limit_columns_) add_limit_column(l);
    rows_.insert(rows_.end(), other.rows_.begin(), other.rows_.end());
}

void EfficiencyTable::save(const fs::path& path, bool overwrite) const {
    core::LogLine(std::cout) << "[EFFICIENCY] Saving efficiency table " << path.string();
    io::TextTable t;
    t.header = {"sigma_kern", "peak_appmag", "peak_flux", "sigma_sim", "sim_erup_sigma"};
    for (double l : limit_columns_) t.header.push_back(pct_detec_column(l));
    for (const auto& row : rows_) {
        std::vector<std::string> cells{core::format_double(row.sigma_kern),
                                       core::format_fixed(row.peak_appmag, 2),
                                       core::format_double(row.peak_flux), opt_text(row.sigma_sim),
                                       opt_text(row.sim_erup_sigma)};
        for (double l : limit_columns_) {
            auto it = row.pct_detec.find(core::round_to(l, 2));
            cells.push_back(it == row.pct_detec.end() ? "NaN" : core::format_double(it->second));
        }
        t.rows.push_back(std::move(cells));
    }
    io::write_table(path, t, overwrite);
}

EfficiencyTable EfficiencyTable::load(const fs::path& path) {
    core::LogLine(std::cout) << "[EFFICIENCY] Loading efficiency table " << path.string();
    const io::TextTable t = io::read_table(path);
    const std::vector<std::string> fixed{"sigma_kern", "peak_appmag", "peak_flux", "sigma_sim",
                                         "sim_erup_sigma"};
    std::vector<int> idx;
    for (const auto& name : fixed) {
        const int c = t.column_index(name);
        if (c < 0) throw IOError(path.string() + ": missing column '" + name + "'");
        idx.push_back(c);
    }

    EfficiencyTable table;
    std::vector<std::pair<int, double>> pct_cols;
    for (size_t c = 0; c < t.header.size(); ++c) {
        if (!core::starts_with(t.header[c], kPctPrefix)) continue;
        auto limit = core::parse_double(t.header[c].substr(std::string(kPctPrefix).size()));
        if (!limit) throw IOError(path.string() + ": bad column '" + t.header[c] + "'");
        pct_cols.emplace_back(static_cast<int>(c), *limit);
        table.add_limit_column(*limit);
    }

    auto value = [&](const std::vector<std::string>& row, int c) {
        auto v = core::parse_double(row[static_cast<size_t>(c)]);
        if (!v) throw IOError(path.string() + ": cannot parse '" + row[static_cast<size_t>(c)] + "'");
        return *v;
    };
    auto optional_value = [&](const std::vector<std::string>& row, int c) {
        const double v = value(row, c);
        return std::isnan(v) ? std::nullopt : std::optional<double>(v);
    };

    for (const auto& cells : t.rows) {
        EfficiencyRow row;
        row.sigma_kern = value(cells, idx[0]);
        row.peak_appmag = value(cells, idx[1]);
        row.peak_flux = value(cells, idx[2]);
        row.sigma_sim = optional_value(cells, idx[3]);
        row.sim_erup_sigma = optional_value(cells, idx[4]);
        for (const auto& [c, limit] : pct_cols) {
            const double v = value(cells, c);
            row.pct_detec[core::round_to(limit, 2)] = v;
        }
        if (std::find(table.sigma_kerns_.begin(), table.sigma_kerns_.end(), row.sigma_kern) ==
            table.sigma_kerns_.end()) {
            table.sigma_kerns_.push_back(row.sigma_kern);
        }
        table.rows_.push_back(std::move(row));
    }
    return table;
}

} // namespace atclean::simulation
