#include "atclean/cuts/cut_engine.hpp"
#include "atclean/core/errors.hpp"

#include <cmath>

namespace atclean::cuts {

void update_mask(core::Cuttable& table, Mask flag, const IndexList& rows, bool remove_old) {
    auto& mask = table.mask();
    if (mask.size() != table.size()) {
        throw ValidationError("mask has " + std::to_string(mask.size()) + " rows, table has " +
                              std::to_string(table.size()));
    }
    if (remove_old) {
        for (auto& m : mask) m &= ~flag;
    }
    for (size_t i : rows) mask[i] |= flag;
}

double apply_cut(const Cut& cut, core::Cuttable& table) {
    if (!cut.can_apply_directly()) {
        throw ConfigError("cannot directly apply cut: " + cut.to_string());
    }
    if (table.size() == 0) return 0.0;

    const VectorXd& v = table.column(cut.column);
    IndexList cut_ix;
    for (size_t i = 0; i < table.size(); ++i) {
        const double x = v[static_cast<Eigen::Index>(i)];
        const bool kept = !std::isnan(x) && (!cut.min_value || x >= *cut.min_value) &&
                          (!cut.max_value || x <= *cut.max_value);
        if (!kept) cut_ix.push_back(i);
    }

    update_mask(table, cut.flag, cut_ix, true);
    return 100.0 * static_cast<double>(cut_ix.size()) / static_cast<double>(table.size());
}

double apply_cut(const Cut& cut, core::Supernova& sn) {
    if (!cut.can_apply_directly()) {
        throw ConfigError("cannot directly apply cut: " + cut.to_string());
    }
    double sn_percent = 0.0;
    for (auto& [idx, lc] : sn.lcs()) {
        const double percent = apply_cut(cut, lc);
        if (idx == 0) sn_percent = percent;
    }
    return sn_percent;
}

double percent_flagged(const core::Cuttable& table, Mask flags) {
    if (table.size() == 0) return 0.0;
    size_t n = 0;
    for (Mask m : table.mask()) {
        if (m & flags) ++n;
    }
    return 100.0 * static_cast<double>(n) / static_cast<double>(table.size());
}

} // namespace atclean::cuts
