#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_list.hpp"
#include "atclean/stats/sigma_clip.hpp"

namespace atclean::averaging {

struct DayBinningOptions {
    double mjd_bin_size = 1.0;
    double x2_max = 4.0;
    int Nclip_max = 1;
    int Ngood_min = 2;
    double flux2mag_sigmalimit = 3.0;
    EmptyBinPolicy empty_bin_policy = EmptyBinPolicy::NO_VALUE;
};

// Magnitudes from uJy. Fluxes below sigmalimit * dflux become upper limits
// (dm missing).
void flux_to_mag_columns(core::LightCurve& lc, double sigmalimit);

class DayBinningAverager {
public:
    DayBinningAverager(const cuts::Cut& cut, DayBinningOptions options,
                       stats::SigmaClipOptions clip_options = {});

    // Bins `lc` into half-open bins starting at floor(min MJD). Flags the
    // clipped, small-number and bad rows of `lc` and returns the binned
    // light curve.
    core::LightCurve average(core::Averageable& lc, Mask previous_flags) const;

    // Bits this averager sets
    Mask all_flags() const { return flag_ | ixclip_flag_ | smallnum_flag_ | nodata_flag_; }
    const DayBinningOptions& options() const { return options_; }

private:
    Mask flag_;
    Mask ixclip_flag_;
    Mask smallnum_flag_;
    Mask nodata_flag_;
    DayBinningOptions options_;
    stats::SigmaClipOptions clip_options_;
};

struct AveragedSupernova {
    core::Supernova sn;     // binned light curves
    double percent = 0.0;   // transient bins flagged by the averaging or earlier cuts
};

AveragedSupernova average_supernova(core::Supernova& sn, const DayBinningAverager& averager,
                                    Mask previous_flags);

} // namespace atclean::averaging
