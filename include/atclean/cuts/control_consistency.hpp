#pragma once

#include "atclean/core/lightcurve.hpp"
#include "atclean/cuts/cut_list.hpp"
#include "atclean/stats/sigma_clip.hpp"

namespace atclean::cuts {

// Per-epoch statistics of the controls, written to the transient as c2_* columns
namespace c2 {
constexpr const char* MEAN = "c2_mean";
constexpr const char* MEAN_ERR = "c2_mean_err";
constexpr const char* STDEV = "c2_stdev";
constexpr const char* X2NORM = "c2_X2norm";
constexpr const char* NGOOD = "c2_Ngood";
constexpr const char* NCLIP = "c2_Nclip";
constexpr const char* NMASK = "c2_Nmask";
constexpr const char* NNAN = "c2_Nnan";
constexpr const char* ABS_STN = "c2_abs_stn";
} // namespace c2

struct ControlCutReport {
    double x2_percent = 0.0;
    double stn_percent = 0.0;
    double Nclip_percent = 0.0;
    double Ngood_percent = 0.0;
    double questionable_percent = 0.0;
    double percent = 0.0;  // umbrella flag
};

class ControlConsistencyAnalyzer {
public:
    ControlConsistencyAnalyzer(const Cut& cut, stats::SigmaClipOptions options = {});

    // Computes the control statistics, flags the transient and copies the
    // resulting flags onto every control. Needs aligned controls.
    ControlCutReport apply(core::Supernova& sn, Mask previous_flags) const;

    // Only the c2_* columns of the transient
    void calculate_control_stats(core::Supernova& sn, Mask previous_flags) const;

    // All flag bits this cut may set
    Mask all_flags() const;

private:
    void flag_by_control_stats(core::LightCurve& lc) const;

    Mask flag_;
    Mask questionable_flag_;
    Mask x2_flag_;
    Mask stn_flag_;
    Mask Nclip_flag_;
    Mask Ngood_flag_;
    double x2_max_;
    double stn_max_;
    double Nclip_max_;
    double Ngood_min_;
    stats::SigmaClipOptions options_;
};

} // namespace atclean::cuts
