#include "atclean/io/sninfo.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"
#include "atclean/io/text_table.hpp"

#include <cmath>
#include <iostream>

namespace atclean::io {

namespace {

std::string value_or_empty(const std::string& cell) {
    return core::to_lower(cell) == "nan" ? std::string() : cell;
}

} // namespace

SnInfoTable SnInfoTable::load(const fs::path& path) {
    SnInfoTable table;
    if (!fs::exists(path)) {
        core::LogLine(std::cout) << "[LOAD] No SN info table at " << path.string()
                                 << "; starting empty";
        return table;
    }

    const TextTable t = read_table(path);
    if (!t.has_column("tnsname")) {
        throw IOError(path.string() + ": SN info table needs a 'tnsname' column");
    }
    const int ra = t.column_index("ra");
    const int dec = t.column_index("dec");
    const int mjd0 = t.column_index("mjd0");
    const int name = t.column_index("tnsname");

    for (const auto& row : t.rows) {
        SnInfo info;
        info.tnsname = row[static_cast<size_t>(name)];
        if (ra >= 0) info.coords.ra = value_or_empty(row[static_cast<size_t>(ra)]);
        if (dec >= 0) info.coords.dec = value_or_empty(row[static_cast<size_t>(dec)]);
        if (mjd0 >= 0) {
            const std::string& cell = row[static_cast<size_t>(mjd0)];
            auto v = core::parse_double(cell);
            if (!v) {
                throw IOError(path.string() + ": invalid mjd0 '" + cell + "' for " + info.tnsname);
            }
            if (!std::isnan(*v)) info.mjd0 = *v;
        }
        table.rows_.push_back(std::move(info));
    }
    return table;
}

void SnInfoTable::save(const fs::path& path) const {
    TextTable t;
    t.header = {"tnsname", "ra", "dec", "mjd0"};
    for (const auto& r : rows_) {
        t.rows.push_back({r.tnsname, r.coords.ra.empty() ? "NaN" : r.coords.ra,
                          r.coords.dec.empty() ? "NaN" : r.coords.dec,
                          r.mjd0 ? core::format_double(*r.mjd0) : "NaN"});
    }
    write_table(path, t, true);
}

std::optional<SnInfo> SnInfoTable::get(const std::string& tnsname) {
    std::vector<size_t> matches;
    for (size_t i = 0; i < rows_.size(); ++i) {
        if (rows_[i].tnsname == tnsname) matches.push_back(i);
    }
    if (matches.empty()) return std::nullopt;
    if (matches.size() > 1) {
        core::LogLine(std::cout) << "[LOAD] WARNING: SN info table has " << matches.size()
                                 << " rows for " << tnsname << "; dropping duplicates";
        for (size_t j = matches.size() - 1; j >= 1; --j) {
            rows_.erase(rows_.begin() + static_cast<std::ptrdiff_t>(matches[j]));
        }
    }
    return rows_[matches[0]];
}

void SnInfoTable::update(const SnInfo& info) {
    for (auto& r : rows_) {
        if (r.tnsname != info.tnsname) continue;
        if (!info.coords.ra.empty()) r.coords.ra = info.coords.ra;
        if (!info.coords.dec.empty()) r.coords.dec = info.coords.dec;
        if (info.mjd0) r.mjd0 = info.mjd0;
        return;
    }
    rows_.push_back(info);
}

void apply_sninfo(core::Supernova& sn, SnInfoTable& table) {
    auto info = table.get(sn.name());
    if (!info) return;
    if (!info->coords.is_empty()) sn.set_coords(info->coords);
    sn.set_mjd0(info->mjd0);
}

} // namespace atclean::io
