#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_list.hpp"

namespace atclean::cuts {

// Sets `flag` on `rows`. With remove_old the bit is first cleared everywhere.
void update_mask(core::Cuttable& table, Mask flag, const IndexList& rows, bool remove_old = true);

// Flags the rows outside [min_value, max_value] and returns the flagged
// percentage. Rows with a missing value are flagged. Idempotent.
double apply_cut(const Cut& cut, core::Cuttable& table);

// Applies the cut to every light curve; returns the transient's percentage
double apply_cut(const Cut& cut, core::Supernova& sn);

// Percentage of rows carrying any of `flags`
double percent_flagged(const core::Cuttable& table, Mask flags);

} // namespace atclean::cuts
