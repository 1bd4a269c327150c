#include "atclean/simulation/sim_tables.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/text_table.hpp"

#include <cmath>
#include <iostream>

namespace atclean::simulation {

namespace {

const std::vector<std::string>& simdetec_columns() {
    static const std::vector<std::string> cols{"sigma_kern", "peak_appmag", "peak_flux",
                                               "peak_mjd",   "sigma_sim",   "sim_erup_sigma",
                                               "max_fom",    "max_fom_mjd"};
    return cols;
}

std::string opt_text(const std::optional<double>& v) {
    return v ? core::format_double(*v) : "NaN";
}

double cell_value(const std::vector<std::string>& row, int c, const std::string& source) {
    auto v = core::parse_double(row[static_cast<size_t>(c)]);
    if (!v) {
        throw IOError(source + ": cannot parse '" + row[static_cast<size_t>(c)] + "'");
    }
    return *v;
}

std::optional<double> opt_value(double v) {
    return std::isnan(v) ? std::nullopt : std::optional<double>(v);
}

} // namespace

void save_simdetec_table(const SimDetecTable& table, const fs::path& dir) {
    core::LogLine(std::cout) << "[SIMDETEC] Saving simulation detection table " << table.filename();
    io::TextTable t;
    t.header = simdetec_columns();
    for (const auto& r : table.records) {
        t.rows.push_back({core::format_double(table.sigma_kern),
                          core::format_fixed(table.peak_appmag, 2),
                          core::format_double(table.peak_flux), core::format_double(r.peak_mjd),
                          opt_text(r.sigma_sim), opt_text(r.sim_erup_sigma),
                          core::format_double(r.max_fom), core::format_double(r.max_fom_mjd)});
    }
    io::write_table(dir / table.filename(), t, true);
}

SimDetecTable load_simdetec_table(const fs::path& dir, double sigma_kern, double peak_appmag) {
    SimDetecTable table;
    table.sigma_kern = sigma_kern;
    table.peak_appmag = peak_appmag;
    table.peak_flux = core::mag_to_flux(peak_appmag);

    const fs::path path = dir / table.filename();
    core::LogLine(std::cout) << "[SIMDETEC] Loading simulation detection table "
                             << table.filename();
    const io::TextTable t = io::read_table(path);
    std::vector<int> idx;
    for (const auto& name : simdetec_columns()) {
        const int c = t.column_index(name);
        if (c < 0) {
            throw IOError(path.string() + ": missing column '" + name + "'");
        }
        idx.push_back(c);
    }

    const std::string source = path.string();
    for (size_t i = 0; i < t.rows.size(); ++i) {
        const auto& row = t.rows[i];
        if (i == 0) table.peak_flux = cell_value(row, idx[2], source);
        SimDetecRecord r;
        r.peak_mjd = cell_value(row, idx[3], source);
        r.sigma_sim = opt_value(cell_value(row, idx[4], source));
        r.sim_erup_sigma = opt_value(cell_value(row, idx[5], source));
        r.max_fom = cell_value(row, idx[6], source);
        r.max_fom_mjd = cell_value(row, idx[7], source);
        table.records.push_back(r);
    }
    return table;
}

void save_simdetec_arena(const SimDetecArena& arena, const fs::path& dir) {
    for (const auto& [key, table] : arena.tables()) {
        save_simdetec_table(table, dir);
    }
}

SimDetecArena load_simdetec_arena(const fs::path& dir, const std::vector<double>& sigma_kerns,
                                  const std::vector<double>& peak_appmags) {
    SimDetecArena arena;
    for (double kern : sigma_kerns) {
        for (double mag : peak_appmags) {
            arena.add(load_simdetec_table(dir, kern, mag));
        }
    }
    return arena;
}

} // namespace atclean::simulation
