#include "atclean/cuts/chi_square_limits.hpp"
#include "atclean/core/errors.hpp"
#include "atclean/core/utils.hpp"

#include <iostream>
#include <sstream>

namespace atclean::cuts {

namespace {

double pct(size_t num, size_t den) {
    if (den == 0) return kNaN;
    return 100.0 * static_cast<double>(num) / static_cast<double>(den);
}

} // namespace

double LimCutsRow::p_good_kept() const { return pct(n_good_kept, n); }
double LimCutsRow::p_good_cut() const { return pct(n_good_cut, n); }
double LimCutsRow::p_bad_kept() const { return pct(n_bad_kept, n); }
double LimCutsRow::p_bad_cut() const { return pct(n_bad_cut, n); }
double LimCutsRow::p_good_kept_of_good() const { return pct(n_good_kept, n_good); }
double LimCutsRow::p_loss() const { return pct(n_good_cut, n_good); }
double LimCutsRow::p_contamination() const { return pct(n_bad_kept, n_kept); }

LimCutsTable::LimCutsTable(const core::LightCurve& lc, double stn_bound, IndexList rows)
    : lc_(lc), indices_(std::move(rows)) {
    if (!lc_.has_column(col::SNR) || !lc_.has_column(col::CHI_N)) {
        throw ValidationError("chi-square limits need the 'uJy/duJy' and 'chi/N' columns");
    }
    good_ix_ = lc_.ix_inrange(col::SNR, -stn_bound, stn_bound, &indices_);
    bad_ix_ = core::index_not(indices_, good_ix_);
}

LimCutsRow LimCutsTable::calculate_row(double x2_max) const {
    const IndexList kept_ix = lc_.ix_inrange(col::CHI_N, std::nullopt, x2_max, &indices_);
    const IndexList cut_ix = core::index_not(indices_, kept_ix);

    LimCutsRow row;
    row.x2_max = x2_max;
    row.n = indices_.size();
    row.n_good = good_ix_.size();
    row.n_bad = bad_ix_.size();
    row.n_kept = kept_ix.size();
    row.n_cut = cut_ix.size();
    row.n_good_kept = core::index_and(good_ix_, kept_ix).size();
    row.n_good_cut = core::index_and(good_ix_, cut_ix).size();
    row.n_bad_kept = core::index_and(bad_ix_, kept_ix).size();
    row.n_bad_cut = core::index_and(bad_ix_, cut_ix).size();
    return row;
}

void LimCutsTable::calculate_table(int cut_start, int cut_stop, int cut_step) {
    if (cut_step <= 0) {
        throw ConfigError("chi-square limits step must be positive");
    }
    core::LogLine(std::cout) << "[X2_CUT] Calculating loss and contamination for chi-square cuts from "
                             << cut_start << " to " << cut_stop;

    table_.clear();
    if (indices_.empty()) return;
    for (int cut = cut_start; cut <= cut_stop; cut += cut_step) {
        LimCutsRow row = calculate_row(static_cast<double>(cut));
        if (pct(row.n_kept, row.n) < 10.0) continue;
        table_.push_back(row);
    }
}

std::string LimCutsTable::to_text() const {
    std::ostringstream oss;
    oss << "PSF_Chi-Square_Cut N Ngood Nbad Nkept Ncut Ngood,kept Ngood,cut Nbad,kept Nbad,cut"
           " Pgood,kept Pgood,cut Pbad,kept Pbad,cut Ngood,kept/Ngood Ploss Pcontamination\n";
    for (const auto& r : table_) {
        oss << core::format_double(r.x2_max) << ' ' << r.n << ' ' << r.n_good << ' ' << r.n_bad
            << ' ' << r.n_kept << ' ' << r.n_cut << ' ' << r.n_good_kept << ' ' << r.n_good_cut
            << ' ' << r.n_bad_kept << ' ' << r.n_bad_cut << ' '
            << core::format_fixed(r.p_good_kept(), 2) << ' ' << core::format_fixed(r.p_good_cut(), 2)
            << ' ' << core::format_fixed(r.p_bad_kept(), 2) << ' '
            << core::format_fixed(r.p_bad_cut(), 2) << ' '
            << core::format_fixed(r.p_good_kept_of_good(), 2) << ' '
            << core::format_fixed(r.p_loss(), 2) << ' ' << core::format_fixed(r.p_contamination(), 2)
            << '\n';
    }
    return oss.str();
}

} // namespace atclean::cuts
