#pragma once

#include "atclean/core/lightcurve.hpp"

#include <optional>
#include <string>
#include <vector>

namespace atclean::io {

struct SnInfo {
    std::string tnsname;
    core::Coordinates coords;     // empty strings when unknown
    std::optional<double> mjd0;
};

// Table of tnsname, ra, dec and mjd0 per object; "NaN" marks unknown values
class SnInfoTable {
public:
    SnInfoTable() = default;

    // A missing file gives an empty table
    static SnInfoTable load(const fs::path& path);
    void save(const fs::path& path) const;

    // Duplicate rows for `tnsname` are reported and collapsed into the first
    std::optional<SnInfo> get(const std::string& tnsname);
    // Adds a row or replaces the known values of an existing one
    void update(const SnInfo& info);

    size_t size() const { return rows_.size(); }
    const std::vector<SnInfo>& rows() const { return rows_; }

private:
    std::vector<SnInfo> rows_;
};

// Fills coordinates and reference epoch from the table if present
void apply_sninfo(core::Supernova& sn, SnInfoTable& table);

} // namespace atclean::io
