#include "atclean/io/lc_table.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/text_table.hpp"

#include <cstdio>
#include <iostream>

namespace atclean::io {

fs::path lc_filename(const fs::path& dir, const LcId& id) {
    fs::path p = dir / id.tnsname;
    std::string name = id.tnsname;
    if (id.control_index != 0) {
        p /= "controls";
        char buf[16];
        std::snprintf(buf, sizeof(buf), "_i%03d", id.control_index);
        name += buf;
    }
    name += "." + id.filter;
    if (id.bin_size) name += "." + core::format_fixed(*id.bin_size, 2) + "days";
    if (id.cleaned) name += ".clean";
    name += ".lc.txt";
    return p / name;
}

core::LightCurve load_lc(const fs::path& path, int control_index, const std::string& filter,
                         std::optional<double> bin_size) {
    const TextTable table = read_table(path);
    const std::vector<std::string> required =
        bin_size ? std::vector<std::string>{col::MJDBIN, col::FLUX, col::DFLUX, col::MASK}
                 : std::vector<std::string>{col::MJD, col::FLUX, col::DFLUX};
    for (const auto& name : required) {
        if (!table.has_column(name)) {
            throw IOError(path.string() + ": missing required column '" + name + "'");
        }
    }

    core::LightCurve lc(control_index, filter);
    const auto n = static_cast<Eigen::Index>(table.rows.size());
    for (const auto& name : table.header) {
        std::vector<std::string> cells = table.column(name);
        if (name == col::MASK) {
            std::vector<Mask> mask(cells.size());
            for (size_t i = 0; i < cells.size(); ++i) {
                auto m = core::parse_mask(cells[i]);
                if (!m) {
                    throw IOError(path.string() + ": invalid Mask value '" + cells[i] + "'");
                }
                mask[i] = *m;
            }
            lc.set_mask(std::move(mask), std::move(cells));
            continue;
        }
        VectorXd values(n);
        for (Eigen::Index i = 0; i < n; ++i) {
            auto v = core::parse_double(cells[static_cast<size_t>(i)]);
            values[i] = v ? *v : kNaN;
        }
        lc.set_raw_column(name, std::move(values), std::move(cells));
    }
    lc.ensure_mask();
    if (bin_size) lc.set_binned(*bin_size);
    return lc;
}

core::LightCurve load_lc(const fs::path& dir, const LcId& id) {
    return load_lc(lc_filename(dir, id), id.control_index, id.filter, id.bin_size);
}

void save_lc(const core::LightCurve& lc, const fs::path& path, bool overwrite,
             const IndexList* rows) {
    TextTable table;
    table.header = lc.columns();
    const IndexList all = rows ? IndexList() : core::index_range(lc.size());
    const IndexList& ix = rows ? *rows : all;
    table.rows.reserve(ix.size());
    for (size_t i : ix) {
        if (i >= lc.size()) {
            throw ValidationError("row " + std::to_string(i) + " out of range");
        }
        std::vector<std::string> cells;
        cells.reserve(table.header.size());
        for (const auto& name : table.header) cells.push_back(lc.cell_text(name, i));
        table.rows.push_back(std::move(cells));
    }
    write_table(path, table, overwrite);
}

void save_lc(const core::LightCurve& lc, const fs::path& dir, const LcId& id, bool overwrite,
             const IndexList* rows) {
    save_lc(lc, lc_filename(dir, id), overwrite, rows);
}

core::Supernova load_supernova(const fs::path& dir, const std::string& tnsname,
                               const LoadOptions& options) {
    core::Supernova sn(tnsname, options.filter);
    LcId id{tnsname, options.filter, 0, options.bin_size, options.cleaned};
    sn.add(load_lc(dir, id));

    int loaded = 0;
    int missing = 0;
    for (int idx = 1; loaded < options.num_controls; ++idx) {
        id.control_index = idx;
        const fs::path path = lc_filename(dir, id);
        if (!fs::exists(path)) {
            core::LogLine(std::cout) << "[LOAD] Could not load control light curve " << idx
                                     << "; skipping";
            if (++missing > options.max_missing_controls) {
                core::LogLine(std::cout) << "[LOAD] Giving up after " << missing
                                         << " missing control light curves";
                break;
            }
            continue;
        }
        sn.add(load_lc(path, idx, options.filter, options.bin_size));
        ++loaded;
    }

    core::LogLine(std::cout) << "[LOAD] " << tnsname << ": loaded transient and " << loaded
                             << " control light curves";
    return sn;
}

void save_supernova(const core::Supernova& sn, const fs::path& dir, bool overwrite,
                    bool cleaned, std::optional<double> bin_size) {
    for (const auto& [idx, lc] : sn.lcs()) {
        LcId id{sn.name(), sn.filter(), idx, bin_size, cleaned};
        save_lc(lc, dir, id, overwrite);
    }
}

} // namespace atclean::io
