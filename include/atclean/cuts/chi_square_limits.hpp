#pragma once

#include "atclean/core/lightcurve.hpp"

#include <string>
#include <vector>

namespace atclean::cuts {

// Loss and contamination of one chi-square cut. Rows are "good" when
// |uJy/duJy| <= stn_bound and "kept" when chi/N <= x2_max.
struct LimCutsRow {
    double x2_max = 0.0;
    size_t n = 0;
    size_t n_good = 0;
    size_t n_bad = 0;
    size_t n_kept = 0;
    size_t n_cut = 0;
    size_t n_good_kept = 0;
    size_t n_good_cut = 0;
    size_t n_bad_kept = 0;
    size_t n_bad_cut = 0;

    double p_good_kept() const;
    double p_good_cut() const;
    double p_bad_kept() const;
    double p_bad_cut() const;
    double p_good_kept_of_good() const;
    double p_loss() const;
    double p_contamination() const;
};

class LimCutsTable {
public:
    // `rows` restricts the table to a subset, typically the rows not flagged
    // by the uncertainty cut
    LimCutsTable(const core::LightCurve& lc, double stn_bound, IndexList rows);

    LimCutsRow calculate_row(double x2_max) const;
    // Cuts keeping fewer than 10% of the rows are skipped
    void calculate_table(int cut_start, int cut_stop, int cut_step);

    const std::vector<LimCutsRow>& rows() const { return table_; }
    const IndexList& good_ix() const { return good_ix_; }
    const IndexList& bad_ix() const { return bad_ix_; }

    // Whitespace separated text table with a header line
    std::string to_text() const;

private:
    const core::LightCurve& lc_;
    IndexList indices_;
    IndexList good_ix_;
    IndexList bad_ix_;
    std::vector<LimCutsRow> table_;
};

} // namespace atclean::cuts
